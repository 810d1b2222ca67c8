// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_STORAGE_NAMEPOOL_H
#define FSINDEX_STORAGE_NAMEPOOL_H

#include <cstddef>
#include <mutex>
#include <set>
#include <string>
#include <string_view>

namespace FsIndex {
    /**
     * Append-only interned string table for file and directory names.
     *
     * intern() returns a view that stays valid for the lifetime of the pool; the global()
     * pool lives for the whole process. Strings are never freed, even when every node
     * referring to them has been removed.
     */
    class NamePool {
    public:
        NamePool() = default;
        NamePool(const NamePool&) = delete;
        NamePool& operator=(const NamePool&) = delete;

        [[nodiscard]] static NamePool& global();

        std::string_view intern(std::string_view name);

        [[nodiscard]] bool contains(std::string_view name) const;
        [[nodiscard]] std::size_t size() const;

    private:
        mutable std::mutex m_mutex;
        std::set<std::string, std::less<>> m_names;
    };
}

#endif //FSINDEX_STORAGE_NAMEPOOL_H
