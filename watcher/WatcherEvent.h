// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_WATCHER_WATCHEREVENT_H
#define FSINDEX_WATCHER_WATCHEREVENT_H

#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace FsIndex {
    /**
     * Messages from a notification backend to the index owner. Backends convert every OS
     * payload into one of these owned values immediately and never touch index memory.
     */
    struct PathsChanged {
        std::vector<std::string> paths;
        std::uint64_t eventId = 0; // highest backend event id in the batch; 0 if the backend has none
    };

    struct RescanRequired {
        std::string reason;
        std::uint64_t eventId = 0;
    };

    // Resumed history replay has caught up with the present.
    struct HistoryDone {};

    struct WatcherError {
        std::string message;
    };

    using WatcherEvent = std::variant<PathsChanged, RescanRequired, HistoryDone, WatcherError>;

    // Thread-safe callback a backend pushes its events into.
    using WatcherSink = std::function<void(WatcherEvent)>;
}

#endif //FSINDEX_WATCHER_WATCHEREVENT_H
