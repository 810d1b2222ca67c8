// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "NamePool.h"

namespace FsIndex {
    NamePool& NamePool::global() {
        static NamePool pool;
        return pool;
    }

    std::string_view NamePool::intern(std::string_view name) {
        std::lock_guard lock(m_mutex);
        auto it = m_names.find(name);
        if (it == m_names.end()) {
            it = m_names.emplace(name).first;
        }
        // std::set nodes never move, so the view outlives any later insertion.
        return std::string_view(*it);
    }

    bool NamePool::contains(std::string_view name) const {
        std::lock_guard lock(m_mutex);
        return m_names.find(name) != m_names.end();
    }

    std::size_t NamePool::size() const {
        std::lock_guard lock(m_mutex);
        return m_names.size();
    }
}
