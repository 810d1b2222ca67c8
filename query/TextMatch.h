// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_QUERY_TEXTMATCH_H
#define FSINDEX_QUERY_TEXTMATCH_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace FsIndex {
    // ASCII-only lowercasing; bytes >= 0x80 pass through unchanged.
    [[nodiscard]] std::string asciiLower(std::string_view value);

    enum class TextSegmentMatchKind {
        Substr,
        Prefix,
        Suffix,
        Exact
    };

    // Matches one path component. Segments containing '*' or '?' are globbed and ignore the kind.
    class TextSegmentMatcher {
    public:
        TextSegmentMatcher(TextSegmentMatchKind kind, std::string_view value);

        [[nodiscard]] bool matches(std::string_view candidate) const;

        [[nodiscard]] TextSegmentMatchKind kind() const noexcept { return m_kind; }
        [[nodiscard]] const std::string& value() const noexcept { return m_value; }

    private:
        TextSegmentMatchKind m_kind;
        std::string m_value;
        bool m_hasWildcards;
    };

    struct TextQuerySegment {
        enum class Kind {
            Concrete,
            Star,     // exactly one component
            GlobStar  // zero or more components
        };

        Kind kind = Kind::Concrete;
        std::optional<TextSegmentMatcher> matcher;
    };

    /**
     * Splits a text term on '/' (and '\') into path segment matchers.
     *
     * A leading '/' anchors the first segment at a component start, a trailing '/' anchors
     * the last one at a component end. A single segment therefore becomes a substring, prefix,
     * suffix or exact matcher. In multi-segment patterns inner segments are exact.
     *
     * @return Empty if the term has no segments or contains an empty one ("a//b").
     */
    [[nodiscard]] std::vector<TextQuerySegment> segmentQueryText(std::string_view raw);

    /**
     * Matches a segmented pattern against the components of a path.
     * Consecutive concrete segments must match consecutive components; "*" consumes exactly
     * one component and "**" any number of them.
     */
    [[nodiscard]] bool pathQueryMatches(const std::vector<TextQuerySegment>& pattern,
                                        const std::vector<std::string>& candidateSegments);

    /**
     * Glob match of the whole candidate: '*' is any run of characters, '?' exactly one.
     * Characters are UTF-8 code points; invalid UTF-8 falls back to bytes.
     */
    [[nodiscard]] bool wildcardMatches(std::string_view pattern, std::string_view candidate);

    /**
     * Matches a free-text term against one entry.
     *
     * @param value Query text, already lowercased for case-insensitive searches.
     * @param name Entry name, lowercased the same way.
     * @param path Full path, lowercased the same way.
     * @param pathSegments Components of the normalized path.
     */
    [[nodiscard]] bool textMatches(std::string_view value, std::string_view name, std::string_view path,
                                   const std::vector<std::string>& pathSegments);

    // True for plain words the name index can prefilter on (no separators, no wildcards).
    [[nodiscard]] bool isNamePrefilterTerm(std::string_view raw);
}

#endif //FSINDEX_QUERY_TEXTMATCH_H
