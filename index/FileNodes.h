// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_INDEX_FILENODES_H
#define FSINDEX_INDEX_FILENODES_H

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../storage/SlabNode.h"
#include "../storage/ThinSlab.h"

namespace FsIndex {
    /**
     * The slab together with the index of its top node (the "/" node).
     * Provides path <-> index resolution for callers outside the index.
     */
    class FileNodes {
    public:
        FileNodes() = default;
        FileNodes(ThinSlab<SlabNode> slab, SlabIndex root);

        [[nodiscard]] const ThinSlab<SlabNode>& slab() const noexcept { return m_slab; }
        [[nodiscard]] ThinSlab<SlabNode>& slab() noexcept { return m_slab; }

        [[nodiscard]] std::optional<SlabIndex> root() const noexcept { return m_root; }
        [[nodiscard]] bool empty() const noexcept { return !m_root || m_slab.empty(); }
        [[nodiscard]] std::size_t size() const noexcept { return m_slab.size(); }

        [[nodiscard]] const SlabNode* get(SlabIndex index) const noexcept { return m_slab.get(index); }

        [[nodiscard]] std::optional<std::string> nodePath(SlabIndex index) const;

        /**
         * Resolves an absolute path by descending from the top node, matching child names exactly.
         * @return std::nullopt if any component is missing.
         */
        [[nodiscard]] std::optional<SlabIndex> nodeIndexForPath(std::string_view path) const;

        // Every node underneath index (not including index itself), in depth-first order.
        [[nodiscard]] std::vector<SlabIndex> allSubnodes(SlabIndex index) const;

    private:
        ThinSlab<SlabNode> m_slab;
        std::optional<SlabIndex> m_root;
    };
}

#endif //FSINDEX_INDEX_FILENODES_H
