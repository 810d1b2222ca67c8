// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_INDEX_NODEVIEW_H
#define FSINDEX_INDEX_NODEVIEW_H

#include <cstddef>
#include <optional>
#include <string>

#include "../storage/SlabNode.h"
#include "../storage/ThinSlab.h"

namespace FsIndex {
    /**
     * Read-only view of one slab node that derives path facts by walking parent links.
     * Nothing is cached; every call walks the chain again.
     */
    class NodeView {
    public:
        NodeView(const ThinSlab<SlabNode>& slab, SlabIndex index) : m_slab(slab), m_index(index) {}

        [[nodiscard]] const SlabNode* node() const { return m_slab.get(m_index); }

        /**
         * Joins names from the top of the tree down to this node.
         * The synthetic "/" node contributes nothing, so the result is always absolute.
         *
         * @return std::nullopt if this node or any ancestor is vacant.
         */
        [[nodiscard]] std::optional<std::string> computePath() const;

        // Number of parent hops to the top of the tree.
        [[nodiscard]] std::optional<std::size_t> computeDepth() const;

        /**
         * Whether this node, or any of its first maxHops ancestors, has a dot-name.
         * maxHops == 0 checks only the node itself.
         */
        [[nodiscard]] std::optional<bool> isHiddenWithinDepth(std::size_t maxHops) const;

    private:
        const ThinSlab<SlabNode>& m_slab;
        SlabIndex m_index;
    };
}

#endif //FSINDEX_INDEX_NODEVIEW_H
