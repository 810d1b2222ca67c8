// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_WATCHER_INOTIFYWATCHER_H
#define FSINDEX_WATCHER_INOTIFYWATCHER_H

#include <QObject>
#include <QString>
#include <QThread>

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "WatcherEvent.h"

class QSocketNotifier;

namespace FsIndex {
    /**
     * Linux notification backend.
     *
     * Keeps one inotify watch per directory under the root and reads the descriptor from a
     * QSocketNotifier living on a private QThread. Each readable burst is normalized into
     * WatcherEvents and handed to the sink; the index itself is never touched from here.
     */
    class InotifyWatcher final : public QObject {
        Q_OBJECT
    public:
        struct Status {
            QString state; // "watching" | "stopped" | "error"
            QString error; // empty if OK
        };

        InotifyWatcher(std::string root, std::vector<std::string> ignoredPaths, WatcherSink sink,
                       QObject* parent = nullptr);
        ~InotifyWatcher() override;

        /**
         * Creates the inotify instance, arms every directory under the root and starts the
         * reader thread. Watches are in place when this returns.
         *
         * @return false if the root could not be watched; status() carries the reason.
         */
        bool start();
        void stop();

        [[nodiscard]] Status status() const;
        [[nodiscard]] std::size_t watchCount() const;

    signals:
        // Emitted from the reader thread.
        void statusChanged(const QString& state, const QString& error);

    private:
        bool addWatch(const std::string& dir, QString* errorOut);
        void addWatchesRecursive(const std::string& dir);
        void dropWatchesUnder(const std::string& dir);
        void onInotifyReadable();
        void setStatus(const QString& state, const QString& error);

        std::string m_root;
        std::vector<std::string> m_ignoredPaths;
        WatcherSink m_sink;

        int m_fd = -1;
        int m_rootWd = -1;

        QThread m_thread;
        // Lives on m_thread and owns the notifier.
        std::unique_ptr<QObject> m_context;
        QSocketNotifier* m_notifier = nullptr;

        // Only touched by start() before the thread runs, then by the reader thread.
        std::unordered_map<int, std::string> m_wdPaths;
        std::size_t m_armFailures = 0;

        mutable std::mutex m_statusMutex;
        Status m_status{QStringLiteral("stopped"), QString()};
        std::size_t m_watchCount = 0;
    };
}

#endif //FSINDEX_WATCHER_INOTIFYWATCHER_H
