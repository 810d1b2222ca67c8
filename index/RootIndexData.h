// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_INDEX_ROOTINDEXDATA_H
#define FSINDEX_INDEX_ROOTINDEXDATA_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "Construction.h"
#include "FileNodes.h"
#include "../storage/NameIndex.h"
#include "../storage/NamePool.h"

namespace FsIndex {
    // Totals from the walk that produced an index.
    struct RootIndexCounters {
        std::uint64_t scannedFiles = 0;
        std::uint64_t scannedDirs = 0;
        std::uint64_t errors = 0;
    };

    /**
     * Live snapshot for one watched root: node slab, name index and walk counters.
     *
     * Not internally synchronized. Exactly one thread (the index owner) mutates it; readers
     * must hold whatever lock the owner publishes (see IndexWorker::read).
     */
    class RootIndexData {
    public:
        using Counters = RootIndexCounters;

        RootIndexData() = default;
        RootIndexData(ConstructedIndex constructed, std::string rootPath, Counters counters = {});

        RootIndexData(const RootIndexData&) = delete;
        RootIndexData& operator=(const RootIndexData&) = delete;
        RootIndexData(RootIndexData&&) noexcept = default;
        RootIndexData& operator=(RootIndexData&&) noexcept = default;

        [[nodiscard]] const FileNodes& fileNodes() const noexcept { return m_fileNodes; }
        [[nodiscard]] const NameIndex& nameIndex() const noexcept { return m_nameIndex; }
        [[nodiscard]] const std::string& rootPath() const noexcept { return m_rootPath; }

        [[nodiscard]] const Counters& counters() const noexcept { return m_counters; }
        [[nodiscard]] std::uint64_t errors() const noexcept { return m_counters.errors; }
        void addErrors(std::uint64_t n) noexcept { m_counters.errors += n; }

        [[nodiscard]] bool empty() const noexcept { return m_fileNodes.empty(); }
        [[nodiscard]] std::size_t entryCount() const noexcept { return m_fileNodes.size(); }
        [[nodiscard]] const SlabNode* getNode(SlabIndex index) const noexcept { return m_fileNodes.get(index); }

        // Visits every live node in slab order.
        template<typename Fn>
        void forEachNode(Fn&& fn) const { m_fileNodes.slab().forEach(std::forward<Fn>(fn)); }

        /**
         * Resolves an absolute path to its node.
         *
         * @param path Absolute path, '/'-separated.
         * @param caseSensitive When false, components are compared ASCII case-insensitively
         *                      and the first match in depth-first order wins.
         */
        [[nodiscard]] std::optional<SlabIndex> nodeIdForPath(std::string_view path, bool caseSensitive) const;

        // All regular files / all directories, in ascending slab order.
        [[nodiscard]] std::vector<SlabIndex> fileIds() const;
        [[nodiscard]] std::vector<SlabIndex> directoryIds() const;

        // Regular files whose lowercased extension equals extension, in ascending slab order.
        [[nodiscard]] std::vector<SlabIndex> indicesForExtension(std::string_view extension) const;

        /**
         * Inserts or refreshes the single entry at path (children are not walked).
         * A stale node for the same path, with its subtree, is dropped first.
         *
         * @return The new node, or std::nullopt if the parent is not indexed or the path
         *         cannot be stat'ed (the latter counts as an error).
         */
        std::optional<SlabIndex> upsertEntry(const std::string& path, NamePool& pool);

        // Removes the node at path with all descendants. @return false if nothing was indexed there.
        bool removeEntry(std::string_view path);

        // Removes a node and its subtree, unlinking it from its parent and the name index.
        void removeNode(SlabIndex index);

    private:
        void eraseSingle(SlabIndex index);

        FileNodes m_fileNodes;
        NameIndex m_nameIndex;
        std::string m_rootPath;
        Counters m_counters;
    };
}

#endif //FSINDEX_INDEX_ROOTINDEXDATA_H
