// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_WATCHER_INDEXWORKER_H
#define FSINDEX_WATCHER_INDEXWORKER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include "ApplyChange.h"
#include "EventChannel.h"
#include "WatcherEvent.h"
#include "../Cancellation.h"
#include "../index/IndexStatus.h"
#include "../index/RootIndexData.h"
#include "../index/Walker.h"

namespace FsIndex {
    struct IndexWorkerConfig {
        std::string root;
        std::vector<std::string> ignoredPaths;
        std::string cachePath;

        // Pending paths beyond this are coalesced in place while a build runs.
        std::size_t pendingCoalesceThreshold = 4096;
    };

    /**
     * Sole owner and writer of one RootIndexData.
     *
     * A single owner thread blocks on a channel and handles, in FIFO order, watcher events,
     * completed builds and barriers. Walks (initial build and rescans) run on a separate
     * builder thread and hand fresh structures back through the same channel, so only the
     * owner ever swaps or mutates the index.
     *
     * Readers go through read(), which holds a shared lock for the duration of the callback.
     */
    class IndexWorker {
    public:
        explicit IndexWorker(IndexWorkerConfig config, NamePool& pool = NamePool::global());
        ~IndexWorker();

        IndexWorker(const IndexWorker&) = delete;
        IndexWorker& operator=(const IndexWorker&) = delete;

        // Starts the owner thread and the initial build.
        void start();
        // Cancels any build, drains nothing further and joins all threads.
        void stop();

        // Thread-safe. Events posted after stop() are dropped.
        void post(WatcherEvent event);
        [[nodiscard]] WatcherSink sink();

        void requestRescan(std::string reason);

        /**
         * Blocks until every message posted before this call has been handled.
         * @return false on timeout or if the worker is not running.
         */
        bool sync(std::chrono::milliseconds timeout = std::chrono::seconds(30));

        // Blocks until the current build (if any) has finished. @return false on timeout.
        bool waitUntilReady(std::chrono::milliseconds timeout);

        [[nodiscard]] IndexStatus status() const;

        void setWatcherEnabled(bool enabled) noexcept { m_watcherEnabled.store(enabled); }

        [[nodiscard]] const std::string& rootPath() const noexcept { return m_config.root; }
        [[nodiscard]] const std::vector<std::string>& ignoredPaths() const noexcept { return m_config.ignoredPaths; }

        template<typename Fn>
        decltype(auto) read(Fn&& fn) const {
            std::shared_lock lock(m_dataMutex);
            return fn(static_cast<const RootIndexData&>(*m_data));
        }

    private:
        struct BuildCompleted {
            std::uint64_t generation = 0;
            std::unique_ptr<RootIndexData> data;
            std::optional<std::string> error;
            bool rootIsDir = true;
            std::int64_t elapsedMs = 0;
        };

        struct Barrier {
            std::shared_ptr<std::promise<void>> done;
        };

        struct Shutdown {};

        using Message = std::variant<WatcherEvent, BuildCompleted, Barrier, Shutdown>;

        void run();
        void handleWatcherEvent(WatcherEvent& event);
        void handleBuildCompleted(BuildCompleted& completed);

        void startBuild(const std::string& reason);
        void joinBuilder();

        void enqueuePending(std::vector<std::string> paths);
        void drainPending();
        void applyBatch(std::vector<std::string> paths);

        void setState(IndexState state);
        void setLastError(std::string message);
        void noteEventId(std::uint64_t eventId);

        IndexWorkerConfig m_config;
        NamePool& m_pool;
        ApplyContext m_applyContext;

        EventChannel<Message> m_channel;
        std::thread m_owner;
        std::thread m_builder;
        bool m_running = false;

        mutable std::shared_mutex m_dataMutex;
        std::unique_ptr<RootIndexData> m_data;

        // Owner-thread state.
        std::uint64_t m_generation = 0;
        std::vector<std::string> m_pending;
        SearchVersionTracker m_buildVersions;

        std::atomic<IndexState> m_state{IndexState::Building};
        std::atomic<bool> m_building{true};
        std::atomic<bool> m_watcherEnabled{false};
        std::atomic<bool> m_historyDone{false};
        std::atomic<std::uint64_t> m_rescanCount{0};
        std::atomic<std::uint64_t> m_lastEventId{0};
        std::atomic<std::uint64_t> m_watcherErrors{0};
        std::atomic<std::int64_t> m_startedAt{0};
        std::atomic<std::int64_t> m_lastUpdateAt{0};
        std::atomic<std::int64_t> m_finishedAt{0};

        mutable std::mutex m_statusMutex;
        std::condition_variable m_readyCv;
        std::optional<std::string> m_lastError;
        std::shared_ptr<WalkData> m_activeWalk;
    };
}

#endif //FSINDEX_WATCHER_INDEXWORKER_H
