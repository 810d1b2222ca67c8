// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_WATCHER_PATHSCOPE_H
#define FSINDEX_WATCHER_PATHSCOPE_H

#include <string>
#include <string_view>
#include <vector>

namespace FsIndex {
    // A directory root covers itself and everything below it; a file root covers only itself.
    [[nodiscard]] bool pathInScope(std::string_view root, bool rootIsDir, std::string_view path);

    [[nodiscard]] bool pathIsIgnored(std::string_view path, const std::vector<std::string>& ignoredPaths);

    /**
     * Reduces a batch of changed paths to the smallest set in which no path is an ancestor
     * of another. Every input path is equal to, or underneath, some output path.
     *
     * Paths are ordered by (component depth, path) and deduplicated; each candidate is then
     * accepted only if none of its ancestors was already accepted.
     */
    [[nodiscard]] std::vector<std::string> coalesceEventPaths(std::vector<std::string> paths);
}

#endif //FSINDEX_WATCHER_PATHSCOPE_H
