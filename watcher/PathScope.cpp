// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "PathScope.h"
#include "../index/FsPath.h"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace FsIndex {
    bool pathInScope(std::string_view root, bool rootIsDir, std::string_view path) {
        if (!rootIsDir) return path == root;
        return FsPath::isSameOrDescendant(path, root);
    }

    bool pathIsIgnored(std::string_view path, const std::vector<std::string>& ignoredPaths) {
        return std::any_of(ignoredPaths.begin(), ignoredPaths.end(), [&](const std::string& ignored) {
            return FsPath::isSameOrDescendant(path, ignored);
        });
    }

    std::vector<std::string> coalesceEventPaths(std::vector<std::string> paths) {
        std::vector<std::pair<std::size_t, std::string>> ordered;
        ordered.reserve(paths.size());
        for (auto& p : paths) {
            std::string cleaned = FsPath::clean(p);
            const std::size_t depth = FsPath::componentDepth(cleaned);
            ordered.emplace_back(depth, std::move(cleaned));
        }

        std::sort(ordered.begin(), ordered.end());
        ordered.erase(std::unique(ordered.begin(), ordered.end()), ordered.end());

        std::vector<std::string> out;
        out.reserve(ordered.size());
        std::unordered_set<std::string_view> selected;
        selected.reserve(ordered.size());

        for (const auto& [depth, path] : ordered) {
            bool covered = false;
            std::string_view ancestor = FsPath::parent(path);
            while (!ancestor.empty()) {
                if (selected.count(ancestor)) {
                    covered = true;
                    break;
                }
                ancestor = FsPath::parent(ancestor);
            }
            if (covered) continue;

            // Views point into `ordered`, which is not modified from here on.
            selected.insert(path);
            out.push_back(path);
        }
        return out;
    }
}
