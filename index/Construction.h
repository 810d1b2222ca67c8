// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_INDEX_CONSTRUCTION_H
#define FSINDEX_INDEX_CONSTRUCTION_H

#include "Walker.h"
#include "../storage/NameIndex.h"
#include "../storage/NamePool.h"
#include "../storage/SlabNode.h"
#include "../storage/ThinSlab.h"

namespace FsIndex {
    struct ConstructedIndex {
        SlabIndex root;
        ThinSlab<SlabNode> slab;
        NameIndex nameIndex;
    };

    /**
     * Turns a walk result into fresh slab and name-index structures in one preorder pass.
     *
     * Children come out of the walker sorted by name, so preorder visits full paths in
     * ascending order and every name-index bucket can be filled with the unchecked append.
     */
    [[nodiscard]] ConstructedIndex construct(const Node& tree, NamePool& pool = NamePool::global());
}

#endif //FSINDEX_INDEX_CONSTRUCTION_H
