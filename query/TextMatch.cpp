// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "TextMatch.h"

#include <utf8.h>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <utility>

namespace FsIndex {
    namespace {
        bool hasWildcards(std::string_view value) {
            return value.find_first_of("*?") != std::string_view::npos;
        }

        // Two-pointer glob with a single remembered star position.
        template<typename Char>
        bool globMatch(const Char* pattern, std::size_t patternLen, const Char* candidate, std::size_t candidateLen) {
            std::size_t p = 0;
            std::size_t c = 0;
            std::optional<std::size_t> star;
            std::size_t starCandidate = 0;

            while (c < candidateLen) {
                if (p < patternLen && (pattern[p] == Char('?') || pattern[p] == candidate[c])) {
                    ++p;
                    ++c;
                    continue;
                }
                if (p < patternLen && pattern[p] == Char('*')) {
                    star = p++;
                    starCandidate = c;
                    continue;
                }
                if (star) {
                    p = *star + 1;
                    c = ++starCandidate;
                    continue;
                }
                return false;
            }

            while (p < patternLen && pattern[p] == Char('*')) ++p;
            return p == patternLen;
        }

        // Keeps the first occurrence of each in-range index, in input order.
        class IndexSet {
        public:
            explicit IndexSet(std::size_t pathLen) : m_seen(pathLen, false) {}

            void add(std::size_t index) {
                if (index >= m_seen.size() || m_seen[index]) return;
                m_seen[index] = true;
                m_items.push_back(index);
            }

            std::vector<std::size_t> take() { return std::move(m_items); }

        private:
            std::vector<bool> m_seen;
            std::vector<std::size_t> m_items;
        };

        std::vector<std::size_t> allIndices(std::size_t pathLen) {
            std::vector<std::size_t> out(pathLen);
            for (std::size_t i = 0; i < pathLen; ++i) out[i] = i;
            return out;
        }

        std::vector<std::size_t> directChildren(const std::vector<std::size_t>& parents, std::size_t pathLen) {
            IndexSet set(pathLen);
            for (const std::size_t index : parents) set.add(index + 1);
            return set.take();
        }

        std::vector<std::size_t> allDescendants(const std::vector<std::size_t>& parents, std::size_t pathLen) {
            IndexSet set(pathLen);
            for (const std::size_t index : parents) {
                for (std::size_t next = index + 1; next < pathLen; ++next) set.add(next);
            }
            return set.take();
        }

        std::vector<std::size_t> filterMatching(std::vector<std::size_t> indices,
                                                const std::vector<std::string>& path,
                                                const TextSegmentMatcher& matcher) {
            indices.erase(std::remove_if(indices.begin(), indices.end(), [&](std::size_t index) {
                return !matcher.matches(path[index]);
            }), indices.end());
            return indices;
        }
    }

    std::string asciiLower(std::string_view value) {
        std::string out(value);
        for (char& c : out) {
            if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        }
        return out;
    }

    TextSegmentMatcher::TextSegmentMatcher(TextSegmentMatchKind kind, std::string_view value)
        : m_kind(kind), m_value(value), m_hasWildcards(hasWildcards(value)) {
    }

    bool TextSegmentMatcher::matches(std::string_view candidate) const {
        if (m_hasWildcards) return wildcardMatches(m_value, candidate);

        switch (m_kind) {
            case TextSegmentMatchKind::Substr: return candidate.find(m_value) != std::string_view::npos;
            case TextSegmentMatchKind::Prefix: return candidate.starts_with(m_value);
            case TextSegmentMatchKind::Suffix: return candidate.ends_with(m_value);
            case TextSegmentMatchKind::Exact: return candidate == m_value;
        }
        return false;
    }

    std::vector<TextQuerySegment> segmentQueryText(std::string_view raw) {
        std::string normalized(raw);
        std::replace(normalized.begin(), normalized.end(), '\\', '/');

        const bool leftClose = !normalized.empty() && normalized.front() == '/';
        const bool rightClose = !normalized.empty() && normalized.back() == '/';

        std::string_view trimmed = normalized;
        while (!trimmed.empty() && trimmed.front() == '/') trimmed.remove_prefix(1);
        while (!trimmed.empty() && trimmed.back() == '/') trimmed.remove_suffix(1);
        if (trimmed.empty()) return {};

        std::vector<std::string_view> parts;
        std::size_t start = 0;
        while (true) {
            const std::size_t slash = trimmed.find('/', start);
            const std::string_view part = trimmed.substr(start, slash == std::string_view::npos ? std::string_view::npos : slash - start);
            if (part.empty()) return {};
            parts.push_back(part);
            if (slash == std::string_view::npos) break;
            start = slash + 1;
        }

        std::vector<TextSegmentMatchKind> kinds(parts.size(), TextSegmentMatchKind::Exact);
        if (parts.size() == 1) {
            if (!leftClose && !rightClose) kinds[0] = TextSegmentMatchKind::Substr;
            else if (!leftClose) kinds[0] = TextSegmentMatchKind::Suffix;
            else if (!rightClose) kinds[0] = TextSegmentMatchKind::Prefix;
        } else {
            if (!leftClose) kinds.front() = TextSegmentMatchKind::Suffix;
            if (!rightClose) kinds.back() = TextSegmentMatchKind::Prefix;
        }

        std::vector<TextQuerySegment> out;
        out.reserve(parts.size());
        for (std::size_t i = 0; i < parts.size(); ++i) {
            if (parts[i] == "**") {
                out.push_back(TextQuerySegment{TextQuerySegment::Kind::GlobStar, std::nullopt});
            } else if (parts[i] == "*") {
                out.push_back(TextQuerySegment{TextQuerySegment::Kind::Star, std::nullopt});
            } else {
                out.push_back(TextQuerySegment{TextQuerySegment::Kind::Concrete, TextSegmentMatcher(kinds[i], parts[i])});
            }
        }
        return out;
    }

    bool pathQueryMatches(const std::vector<TextQuerySegment>& pattern,
                          const std::vector<std::string>& candidateSegments) {
        if (pattern.empty() || candidateSegments.empty()) return false;

        const std::size_t pathLen = candidateSegments.size();
        std::optional<std::vector<std::size_t>> current;
        bool pendingGlobStar = false;
        bool sawMatcher = false;

        for (const TextQuerySegment& segment : pattern) {
            if (segment.kind == TextQuerySegment::Kind::GlobStar) {
                pendingGlobStar = true;
                continue;
            }

            sawMatcher = true;
            std::vector<std::size_t> next;
            if (!current) {
                next = allIndices(pathLen);
            } else if (pendingGlobStar) {
                next = allDescendants(*current, pathLen);
            } else {
                next = directChildren(*current, pathLen);
            }

            if (segment.kind == TextQuerySegment::Kind::Concrete) {
                next = filterMatching(std::move(next), candidateSegments, *segment.matcher);
            }
            current = std::move(next);
            pendingGlobStar = false;
        }

        if (pendingGlobStar) {
            if (!current) return true;
            return !allDescendants(*current, pathLen).empty();
        }
        if (!sawMatcher) return true;
        return current && !current->empty();
    }

    bool wildcardMatches(std::string_view pattern, std::string_view candidate) {
        if (utf8::is_valid(pattern.begin(), pattern.end()) && utf8::is_valid(candidate.begin(), candidate.end())) {
            std::u32string p;
            std::u32string c;
            utf8::utf8to32(pattern.begin(), pattern.end(), std::back_inserter(p));
            utf8::utf8to32(candidate.begin(), candidate.end(), std::back_inserter(c));
            return globMatch(p.data(), p.size(), c.data(), c.size());
        }
        return globMatch(pattern.data(), pattern.size(), candidate.data(), candidate.size());
    }

    bool textMatches(std::string_view value, std::string_view name, std::string_view path,
                     const std::vector<std::string>& pathSegments) {
        if (value.empty()) return true;

        const std::vector<TextQuerySegment> segments = segmentQueryText(value);
        if (!segments.empty()) return pathQueryMatches(segments, pathSegments);

        if (value.find_first_of("/\\") != std::string_view::npos) return false;
        return name.find(value) != std::string_view::npos || path.find(value) != std::string_view::npos;
    }

    bool isNamePrefilterTerm(std::string_view raw) {
        while (!raw.empty() && (raw.front() == ' ' || raw.front() == '\t')) raw.remove_prefix(1);
        while (!raw.empty() && (raw.back() == ' ' || raw.back() == '\t')) raw.remove_suffix(1);
        return !raw.empty() && raw.find_first_of("/\\*?") == std::string_view::npos;
    }
}
