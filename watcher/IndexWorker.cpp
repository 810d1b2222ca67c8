// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "IndexWorker.h"
#include "PathScope.h"
#include "../index/Construction.h"
#include "../index/FsPath.h"

#include <QDateTime>
#include <QDebug>
#include <QString>

#include <cerrno>
#include <cstring>

namespace FsIndex {
    static std::int64_t nowMs() {
        return QDateTime::currentMSecsSinceEpoch();
    }

    static std::optional<std::int64_t> timestampOrNone(std::int64_t value) {
        if (value == 0) return std::nullopt;
        return value;
    }

    IndexWorker::IndexWorker(IndexWorkerConfig config, NamePool& pool)
        : m_config(std::move(config)), m_pool(pool), m_data(std::make_unique<RootIndexData>()) {
        m_config.root = FsPath::clean(m_config.root);
        for (auto& ignored : m_config.ignoredPaths) {
            ignored = FsPath::clean(ignored);
        }

        m_applyContext.root = m_config.root;
        m_applyContext.ignoredPaths = m_config.ignoredPaths;
        m_applyContext.pool = &m_pool;
    }

    IndexWorker::~IndexWorker() {
        stop();
    }

    void IndexWorker::start() {
        if (m_running) return;
        m_running = true;
        m_owner = std::thread([this]() { run(); });
    }

    void IndexWorker::stop() {
        if (!m_running) return;

        m_channel.send(Shutdown{});
        if (m_owner.joinable()) m_owner.join();
        m_channel.close();
        m_running = false;
    }

    void IndexWorker::post(WatcherEvent event) {
        m_channel.send(Message(std::in_place_type<WatcherEvent>, std::move(event)));
    }

    WatcherSink IndexWorker::sink() {
        return [this](WatcherEvent event) { post(std::move(event)); };
    }

    void IndexWorker::requestRescan(std::string reason) {
        post(RescanRequired{std::move(reason), 0});
    }

    bool IndexWorker::sync(std::chrono::milliseconds timeout) {
        if (!m_running) return false;

        auto done = std::make_shared<std::promise<void>>();
        auto future = done->get_future();
        if (!m_channel.send(Barrier{done})) return false;
        return future.wait_for(timeout) == std::future_status::ready;
    }

    bool IndexWorker::waitUntilReady(std::chrono::milliseconds timeout) {
        std::unique_lock lock(m_statusMutex);
        return m_readyCv.wait_for(lock, timeout, [this]() {
            return m_state.load() != IndexState::Building;
        });
    }

    IndexStatus IndexWorker::status() const {
        IndexStatus s;
        s.state = m_state.load();
        s.root = m_config.root;
        s.ignoredPaths = m_config.ignoredPaths;

        {
            std::shared_lock lock(m_dataMutex);
            s.indexedEntries = m_data->entryCount();
            s.scannedFiles = m_data->counters().scannedFiles;
            s.scannedDirs = m_data->counters().scannedDirs;
            s.errors = m_data->errors();
        }

        {
            std::lock_guard lock(m_statusMutex);
            if (m_activeWalk) {
                // Live progress of the walk in flight.
                s.scannedFiles = m_activeWalk->numFiles.load();
                s.scannedDirs = m_activeWalk->numDirs.load();
                s.errors = m_activeWalk->numErrors.load();
            }
            s.lastError = m_lastError;
        }

        s.errors += m_watcherErrors.load();
        s.startedAt = timestampOrNone(m_startedAt.load());
        s.lastUpdateAt = timestampOrNone(m_lastUpdateAt.load());
        s.finishedAt = timestampOrNone(m_finishedAt.load());
        s.watcherEnabled = m_watcherEnabled.load();
        s.cachePath = m_config.cachePath;
        s.rescanCount = m_rescanCount.load();
        s.lastEventId = m_lastEventId.load();
        s.historyDone = m_historyDone.load();
        return s;
    }

    void IndexWorker::run() {
        startBuild("initial build");

        while (auto message = m_channel.receive()) {
            if (std::holds_alternative<Shutdown>(*message)) break;

            if (auto* event = std::get_if<WatcherEvent>(&*message)) {
                handleWatcherEvent(*event);
            } else if (auto* completed = std::get_if<BuildCompleted>(&*message)) {
                handleBuildCompleted(*completed);
            } else if (auto* barrier = std::get_if<Barrier>(&*message)) {
                barrier->done->set_value();
            }
        }

        m_buildVersions.nextVersion();
        joinBuilder();
    }

    void IndexWorker::handleWatcherEvent(WatcherEvent& event) {
        if (auto* changed = std::get_if<PathsChanged>(&event)) {
            noteEventId(changed->eventId);
            if (m_building.load()) {
                enqueuePending(std::move(changed->paths));
            } else {
                applyBatch(std::move(changed->paths));
            }
            return;
        }

        if (auto* rescan = std::get_if<RescanRequired>(&event)) {
            noteEventId(rescan->eventId);
            m_rescanCount.fetch_add(1);
            // The rebuild observes everything the queued paths would have told us.
            m_pending.clear();
            startBuild(rescan->reason.empty() ? std::string("rescan requested") : rescan->reason);
            return;
        }

        if (std::holds_alternative<HistoryDone>(event)) {
            m_historyDone.store(true);
            qInfo().noquote() << QStringLiteral("[index] root=%1 event history replay complete (last id %2)")
                                 .arg(QString::fromStdString(m_config.root))
                                 .arg(m_lastEventId.load());
            return;
        }

        if (auto* error = std::get_if<WatcherError>(&event)) {
            m_watcherErrors.fetch_add(1);
            setLastError(error->message);
            qWarning().noquote() << QStringLiteral("[index] root=%1 watcher error: %2")
                                    .arg(QString::fromStdString(m_config.root),
                                         QString::fromStdString(error->message));
        }
    }

    void IndexWorker::startBuild(const std::string& reason) {
        // Cancels the walk in flight, if any; its result will carry a stale generation.
        const CancellationToken token = m_buildVersions.nextToken();
        joinBuilder();

        const std::uint64_t generation = ++m_generation;
        auto walk = std::make_shared<WalkData>(m_config.root, m_config.ignoredPaths, token);

        {
            std::lock_guard lock(m_statusMutex);
            m_activeWalk = walk;
        }
        m_building.store(true);
        m_startedAt.store(nowMs());
        m_finishedAt.store(0);
        setState(IndexState::Building);

        qInfo().noquote() << QStringLiteral("[index] root=%1 build #%2 started (%3)")
                             .arg(QString::fromStdString(m_config.root))
                             .arg(generation)
                             .arg(QString::fromStdString(reason));

        m_builder = std::thread([this, walk, generation]() {
            const auto started = std::chrono::steady_clock::now();

            BuildCompleted done;
            done.generation = generation;

            const auto rootMetadata = statPath(walk->rootPath());
            if (!rootMetadata) {
                const int err = errno;
                done.error = "cannot access root " + walk->rootPath() + ": " + std::strerror(err);
            } else {
                done.rootIsDir = rootMetadata->fileType() == NodeFileType::Dir;
                if (auto tree = walkIt(*walk)) {
                    RootIndexData::Counters counters;
                    counters.scannedFiles = walk->numFiles.load();
                    counters.scannedDirs = walk->numDirs.load();
                    counters.errors = walk->numErrors.load();
                    done.data = std::make_unique<RootIndexData>(construct(*tree, m_pool), walk->rootPath(), counters);
                }
            }

            done.elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started).count();
            m_channel.send(Message(std::in_place_type<BuildCompleted>, std::move(done)));
        });
    }

    void IndexWorker::joinBuilder() {
        if (m_builder.joinable()) m_builder.join();
    }

    void IndexWorker::handleBuildCompleted(BuildCompleted& completed) {
        if (completed.generation != m_generation) return; // superseded by a newer build
        joinBuilder();

        const QString root = QString::fromStdString(m_config.root);

        if (completed.error) {
            qWarning().noquote() << QStringLiteral("[index] root=%1 build failed: %2")
                                    .arg(root, QString::fromStdString(*completed.error));
            setLastError(*completed.error);
            m_pending.clear();
            m_building.store(false);
            {
                std::lock_guard lock(m_statusMutex);
                m_activeWalk.reset();
            }
            m_finishedAt.store(nowMs());
            setState(IndexState::Error);
            return;
        }

        // Cancelled without a successor: only happens while shutting down.
        if (!completed.data) return;

        {
            std::unique_lock lock(m_dataMutex);
            m_data = std::move(completed.data);
        }
        m_applyContext.rootIsDir = completed.rootIsDir;
        m_building.store(false);
        {
            std::lock_guard lock(m_statusMutex);
            m_activeWalk.reset();
            m_lastError.reset();
        }

        const std::size_t pendingCount = m_pending.size();
        drainPending();
        if (m_building.load()) return; // draining hit a root change and restarted the build

        const std::int64_t now = nowMs();
        m_finishedAt.store(now);
        m_lastUpdateAt.store(now);
        setState(IndexState::Ready);

        const IndexStatus s = status();
        qInfo().noquote() << QStringLiteral("[index] root=%1 build #%2 finished: entries=%3 dirs=%4 files=%5 errors=%6 pending=%7 (%8 ms)")
                             .arg(root)
                             .arg(completed.generation)
                             .arg(s.indexedEntries)
                             .arg(s.scannedDirs)
                             .arg(s.scannedFiles)
                             .arg(s.errors)
                             .arg(pendingCount)
                             .arg(completed.elapsedMs);
    }

    void IndexWorker::enqueuePending(std::vector<std::string> paths) {
        if (paths.empty()) {
            m_pending.push_back(m_config.root);
        } else {
            m_pending.insert(m_pending.end(),
                             std::make_move_iterator(paths.begin()),
                             std::make_move_iterator(paths.end()));
        }

        if (m_pending.size() > m_config.pendingCoalesceThreshold) {
            const std::size_t before = m_pending.size();
            m_pending = coalesceEventPaths(std::move(m_pending));
            qInfo().noquote() << QStringLiteral("[index] root=%1 pending queue coalesced %2 -> %3 paths")
                                 .arg(QString::fromStdString(m_config.root))
                                 .arg(before)
                                 .arg(m_pending.size());
        }
    }

    void IndexWorker::drainPending() {
        // Single pass: nothing can queue more paths while the owner thread is applying.
        if (m_pending.empty()) return;
        std::vector<std::string> batch;
        batch.swap(m_pending);
        applyBatch(std::move(batch));
    }

    void IndexWorker::applyBatch(std::vector<std::string> paths) {
        BatchOutcome outcome;
        {
            std::unique_lock lock(m_dataMutex);
            outcome = applyPathChanges(*m_data, m_applyContext, std::move(paths));
        }

        if (outcome.rescanRequired) {
            m_rescanCount.fetch_add(1);
            startBuild("change to the watched root");
            return;
        }
        if (outcome.applied > 0) {
            m_lastUpdateAt.store(nowMs());
        }
    }

    void IndexWorker::setState(IndexState state) {
        {
            std::lock_guard lock(m_statusMutex);
            m_state.store(state);
        }
        m_readyCv.notify_all();
    }

    void IndexWorker::setLastError(std::string message) {
        std::lock_guard lock(m_statusMutex);
        m_lastError = std::move(message);
    }

    void IndexWorker::noteEventId(std::uint64_t eventId) {
        std::uint64_t current = m_lastEventId.load();
        while (eventId > current && !m_lastEventId.compare_exchange_weak(current, eventId)) {
        }
    }
}
