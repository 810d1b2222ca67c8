// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "Construction.h"

namespace FsIndex {
    static SlabIndex constructNode(const Node& node, OptionSlabIndex parent,
                                   ThinSlab<SlabNode>& slab, NameIndex& nameIndex, NamePool& pool) {
        const std::string_view name = pool.intern(node.name);

        // Insert before recursing so the children know their parent index.
        const SlabIndex index = slab.insert(SlabNode(name, parent, node.metadata));
        nameIndex.addIndexOrdered(name, index);

        ThinVector<SlabIndex> children;
        children.reserve(node.children.size());
        for (const Node& child : node.children) {
            children.push_back(constructNode(child, OptionSlabIndex(index), slab, nameIndex, pool));
        }

        if (SlabNode* self = slab.getMut(index)) {
            self->setChildren(std::move(children));
        }
        return index;
    }

    ConstructedIndex construct(const Node& tree, NamePool& pool) {
        ConstructedIndex out;
        out.root = constructNode(tree, OptionSlabIndex::none(), out.slab, out.nameIndex, pool);
        return out;
    }
}
