// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_INDEX_INDEXSTATUS_H
#define FSINDEX_INDEX_INDEXSTATUS_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace FsIndex {
    enum class IndexState : std::uint8_t {
        Building,
        Ready,
        Error
    };

    [[nodiscard]] inline std::string_view indexStateName(IndexState state) {
        switch (state) {
            case IndexState::Building: return "building";
            case IndexState::Ready: return "ready";
            case IndexState::Error: return "error";
        }
        return "error";
    }

    // Point-in-time snapshot of an index. Timestamps are unix milliseconds.
    struct IndexStatus {
        IndexState state = IndexState::Building;
        std::string root;
        std::vector<std::string> ignoredPaths;

        std::uint64_t indexedEntries = 0;
        std::uint64_t scannedFiles = 0;
        std::uint64_t scannedDirs = 0;

        std::optional<std::int64_t> startedAt;
        std::optional<std::int64_t> lastUpdateAt;
        std::optional<std::int64_t> finishedAt;

        std::uint64_t errors = 0;
        bool watcherEnabled = false;
        std::string cachePath;
        std::uint64_t rescanCount = 0;
        std::optional<std::string> lastError;

        // Resume token bookkeeping (only meaningful for backends with event ids).
        std::uint64_t lastEventId = 0;
        bool historyDone = false;
    };
}

#endif //FSINDEX_INDEX_INDEXSTATUS_H
