// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "ApplyChange.h"
#include "PathScope.h"
#include "../index/FsPath.h"
#include "../index/Walker.h"

#include <sys/stat.h>

#include <utility>

namespace FsIndex {
    static bool pathExists(const std::string& path) {
        struct stat st {};
        return ::lstat(path.c_str(), &st) == 0;
    }

    static void upsertRecursive(RootIndexData& data, const ApplyContext& context, const std::string& path) {
        const auto index = data.upsertEntry(path, *context.pool);
        if (!index) return;

        const SlabNode* node = data.getNode(*index);
        if (!node || !node->isDir()) return;

        std::vector<std::string> names;
        if (!listDirectory(path, names)) {
            data.addErrors(1);
            return;
        }
        for (const auto& name : names) {
            const std::string childPath = FsPath::join(path, name);
            if (pathIsIgnored(childPath, context.ignoredPaths)) continue;
            upsertRecursive(data, context, childPath);
        }
    }

    ApplyOutcome applyPathChange(RootIndexData& data, const ApplyContext& context, const std::string& path) {
        const std::string cleaned = FsPath::clean(path);

        if (!pathInScope(context.root, context.rootIsDir, cleaned)) {
            return ApplyOutcome::OutOfScope;
        }
        if (pathIsIgnored(cleaned, context.ignoredPaths)) {
            data.removeEntry(cleaned);
            return ApplyOutcome::Applied;
        }
        if (cleaned == context.root) {
            return ApplyOutcome::RescanRequired;
        }

        if (pathExists(cleaned)) {
            data.removeEntry(cleaned);
            upsertRecursive(data, context, cleaned);
        } else {
            data.removeEntry(cleaned);
        }
        return ApplyOutcome::Applied;
    }

    BatchOutcome applyPathChanges(RootIndexData& data, const ApplyContext& context, std::vector<std::string> paths) {
        BatchOutcome outcome;

        // Drop foreign paths first so an out-of-scope ancestor cannot swallow in-scope ones.
        std::vector<std::string> inScope;
        inScope.reserve(paths.size());
        for (auto& path : paths) {
            if (pathInScope(context.root, context.rootIsDir, FsPath::clean(path))) {
                inScope.push_back(std::move(path));
            } else {
                ++outcome.skipped;
            }
        }

        const std::vector<std::string> coalesced = coalesceEventPaths(std::move(inScope));
        for (const auto& path : coalesced) {
            if (path == context.root) {
                outcome.rescanRequired = true;
                return outcome;
            }
        }

        for (const auto& path : coalesced) {
            switch (applyPathChange(data, context, path)) {
                case ApplyOutcome::Applied:
                    ++outcome.applied;
                    break;
                case ApplyOutcome::OutOfScope:
                    ++outcome.skipped;
                    break;
                case ApplyOutcome::RescanRequired:
                    outcome.rescanRequired = true;
                    return outcome;
            }
        }
        return outcome;
    }
}
