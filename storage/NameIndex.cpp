// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "NameIndex.h"

namespace FsIndex {
    void NameIndex::addIndexOrdered(std::string_view name, SlabIndex index) {
        auto it = m_map.find(name);
        if (it == m_map.end()) {
            m_map.emplace(name, SortedSlabIndices::withSingle(index));
            return;
        }
        it->second.pushOrdered(index);
    }

    void NameIndex::addIndexSorted(std::string_view name, SlabIndex index, const PathFn& pathOf) {
        auto it = m_map.find(name);
        if (it == m_map.end()) {
            m_map.emplace(name, SortedSlabIndices::withSingle(index));
            return;
        }
        it->second.insertSorted(index, pathOf);
    }

    bool NameIndex::removeIndex(std::string_view name, SlabIndex index) {
        auto it = m_map.find(name);
        if (it == m_map.end()) return false;

        const bool removed = it->second.remove(index);
        if (it->second.empty()) {
            m_map.erase(it);
        }
        return removed;
    }

    const SortedSlabIndices* NameIndex::get(std::string_view name) const {
        auto it = m_map.find(name);
        if (it == m_map.end()) return nullptr;
        return &it->second;
    }

    std::size_t NameIndex::entryCount() const noexcept {
        std::size_t total = 0;
        for (const auto& kv : m_map) total += kv.second.size();
        return total;
    }
}
