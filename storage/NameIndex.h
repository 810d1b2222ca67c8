// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_STORAGE_NAMEINDEX_H
#define FSINDEX_STORAGE_NAMEINDEX_H

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "SlabIndex.h"

namespace FsIndex {
    /**
     * Interned name -> every node carrying that name, ordered by full path.
     *
     * Keys are NamePool views, so they stay valid after the nodes referring to them are gone.
     * A bucket is dropped as soon as its last index is removed.
     */
    class NameIndex {
    public:
        using Map = std::map<std::string_view, SortedSlabIndices, std::less<>>;
        using PathFn = std::function<std::optional<std::string>(SlabIndex)>;

        /**
         * Bulk-construction insert. Appends without any ordering check.
         * Only valid while nodes are visited in ascending full-path order.
         */
        void addIndexOrdered(std::string_view name, SlabIndex index);

        /**
         * Incremental insert, keeping the bucket sorted by full path.
         *
         * @param name Interned node name.
         * @param index Node to add.
         * @param pathOf Resolves indices to full paths for the binary search.
         */
        void addIndexSorted(std::string_view name, SlabIndex index, const PathFn& pathOf);

        // @return true if the index was present under that name.
        bool removeIndex(std::string_view name, SlabIndex index);

        [[nodiscard]] const SortedSlabIndices* get(std::string_view name) const;

        [[nodiscard]] std::size_t nameCount() const noexcept { return m_map.size(); }
        [[nodiscard]] std::size_t entryCount() const noexcept;
        [[nodiscard]] bool empty() const noexcept { return m_map.empty(); }

        [[nodiscard]] Map::const_iterator begin() const noexcept { return m_map.begin(); }
        [[nodiscard]] Map::const_iterator end() const noexcept { return m_map.end(); }

    private:
        Map m_map;
    };
}

#endif //FSINDEX_STORAGE_NAMEINDEX_H
