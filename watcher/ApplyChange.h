// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_WATCHER_APPLYCHANGE_H
#define FSINDEX_WATCHER_APPLYCHANGE_H

#include <cstddef>
#include <string>
#include <vector>

#include "../index/RootIndexData.h"
#include "../storage/NamePool.h"

namespace FsIndex {
    // What an incremental update needs to know about the watched root.
    struct ApplyContext {
        std::string root;
        bool rootIsDir = true;
        std::vector<std::string> ignoredPaths;
        NamePool* pool = &NamePool::global();
    };

    enum class ApplyOutcome {
        Applied,
        OutOfScope,
        RescanRequired
    };

    struct BatchOutcome {
        std::size_t applied = 0;
        std::size_t skipped = 0;
        bool rescanRequired = false;
    };

    /**
     * Brings the index in line with the current on-disk state of one path.
     *
     * Ignored paths are removed. A path that still exists is dropped and re-inserted together
     * with whatever is underneath it on disk; a path that is gone is removed with its subtree.
     * A change to the root itself cannot be applied incrementally and reports RescanRequired.
     */
    ApplyOutcome applyPathChange(RootIndexData& data, const ApplyContext& context, const std::string& path);

    /**
     * Coalesces the batch, then applies it. If any coalesced path needs a rescan the whole
     * batch is discarded before anything is touched.
     */
    BatchOutcome applyPathChanges(RootIndexData& data, const ApplyContext& context, std::vector<std::string> paths);
}

#endif //FSINDEX_WATCHER_APPLYCHANGE_H
