// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_QUERY_TYPEFILTER_H
#define FSINDEX_QUERY_TYPEFILTER_H

#include <optional>
#include <span>
#include <string_view>

namespace FsIndex {
    // What a type: filter or a type macro (audio:, video:, doc:, exe:) selects.
    struct TypeFilterTarget {
        enum class Kind {
            File,
            Directory,
            Extensions
        };

        Kind kind = Kind::File;
        // Lowercase extensions without the dot. Only set for Kind::Extensions; points at static tables.
        std::span<const std::string_view> extensions;

        [[nodiscard]] bool containsExtension(std::string_view extension) const;

        bool operator==(const TypeFilterTarget& other) const noexcept {
            return kind == other.kind && extensions.data() == other.extensions.data()
                   && extensions.size() == other.extensions.size();
        }
    };

    /**
     * Maps a category name to its target.
     * Accepts singular and plural forms and common synonyms ("image", "music", "slides", ...).
     *
     * @param name Lowercase category name.
     * @return std::nullopt if the category is unknown.
     */
    [[nodiscard]] std::optional<TypeFilterTarget> lookupTypeFilterTarget(std::string_view name);
}

#endif //FSINDEX_QUERY_TYPEFILTER_H
