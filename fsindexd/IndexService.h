// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_FSINDEXD_INDEXSERVICE_H
#define FSINDEX_FSINDEXD_INDEXSERVICE_H

#include <QObject>
#include <QString>
#include <QTimer>
#include <QVariantMap>

#include <QtDBus/QDBusContext>
#include <QtDBus/QDBusError>

#include <functional>
#include <optional>

#include "DbusConversions.h"
#include "../Cancellation.h"
#include "../index/IndexStatus.h"
#include "../search/SearchTypes.h"
#include "../watcher/IndexWorker.h"

namespace FsIndex {
    class IndexService final : public QObject, protected QDBusContext {
        Q_OBJECT
        Q_CLASSINFO("D-Bus Interface", "net.reikooters.FsIndex1.Index")

    public:
        /**
         * @param worker Index owner; must outlive the service.
         * @param searchDefaults Applied to every Search() call before its options.
         */
        IndexService(IndexWorker& worker, SearchRequest searchDefaults, QObject* parent = nullptr);
        ~IndexService() override;

        // Called on the main thread whenever the worker's resume event id moves forward.
        void setEventIdObserver(std::function<void(quint64)> observer) { m_eventIdObserver = std::move(observer); }

        /**
         * Runs one search against the current index.
         *
         * @return std::nullopt if the search was superseded by a newer search version.
         * @throws QueryParseError for an invalid query or option.
         */
        [[nodiscard]] std::optional<SearchResult> runSearch(const SearchCall& call);

        // Polls the worker once; emits IndexStateChanged on a change. The timer calls this too.
        void pollWorker();

    public slots:
        /**
         * Provides version information about the service and its API.
         *
         * @param versionOut Populated with the daemon version string.
         * @param apiVersionOut Populated with the API version integer.
         */
        void Ping(QString& versionOut, quint32& apiVersionOut) const;

        // Index status as a{sv}; see statusToVariantMap() for the keys.
        QVariantMap Status() const;

        /**
         * Searches the index.
         *
         * @param query Query text in the filter language (words, "phrases", ext:, size:, ...).
         * @param options kind ("all" | "files" | "directories"), includeHidden, caseSensitive,
         *                maxResults, maxDepth, searchVersion. Missing keys use the configured defaults.
         *                Passing a searchVersion older than the latest NextSearchVersion() cancels the call.
         * @return The result as a{sv}: query, root, entries (array of a{sv}), count, truncated,
         *         scanned, errors, highlightTerms, cancelled, and the index* status fields.
         */
        QVariantMap Search(const QString& query, const QVariantMap& options);

        // Reserves a new search version; every search running under an older one is cancelled.
        quint64 NextSearchVersion();

        // Discards the index and walks the root again. Returns the status right after the request.
        QVariantMap Rescan();

    signals:
        void IndexStateChanged(const QString& state, quint64 indexedEntries);

    private:
        void replyError(QDBusError::ErrorType type, const QString& message) const;

        IndexWorker& m_worker;
        SearchRequest m_searchDefaults;
        SearchVersionTracker m_searchVersions;

        QTimer m_pollTimer;
        std::optional<IndexState> m_lastState;
        quint64 m_lastEntries = 0;
        quint64 m_lastEventId = 0;
        std::function<void(quint64)> m_eventIdObserver;

        static constexpr int kPollIntervalMs = 500;
    };
}

#endif //FSINDEX_FSINDEXD_INDEXSERVICE_H
