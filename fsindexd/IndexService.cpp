// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "IndexService.h"
#include "../Version.h"
#include "../query/QueryError.h"
#include "../search/SearchEngine.h"

#include <QDebug>
#include <QElapsedTimer>

namespace FsIndex {
    IndexService::IndexService(IndexWorker& worker, SearchRequest searchDefaults, QObject* parent)
        : QObject(parent), m_worker(worker), m_searchDefaults(std::move(searchDefaults)) {
        m_lastEventId = m_worker.status().lastEventId;

        m_pollTimer.setInterval(kPollIntervalMs);
        connect(&m_pollTimer, &QTimer::timeout, this, &IndexService::pollWorker);
        m_pollTimer.start();
    }

    IndexService::~IndexService() {
        m_pollTimer.stop();
        // Nothing should keep running against the worker once the service is gone.
        m_searchVersions.nextVersion();
    }

    void IndexService::replyError(QDBusError::ErrorType type, const QString& message) const {
        qWarning().noquote() << QStringLiteral("[dbus] %1").arg(message);
        if (calledFromDBus()) {
            sendErrorReply(type, message);
        }
    }

    void IndexService::pollWorker() {
        const IndexStatus status = m_worker.status();

        if (!m_lastState || *m_lastState != status.state || m_lastEntries != status.indexedEntries) {
            m_lastState = status.state;
            m_lastEntries = status.indexedEntries;
            const std::string_view name = indexStateName(status.state);
            Q_EMIT IndexStateChanged(QString::fromLatin1(name.data(), static_cast<qsizetype>(name.size())),
                                     m_lastEntries);
        }

        if (status.lastEventId > m_lastEventId) {
            m_lastEventId = status.lastEventId;
            if (m_eventIdObserver) m_eventIdObserver(m_lastEventId);
        }
    }

    void IndexService::Ping(QString& versionOut, quint32& apiVersionOut) const {
        versionOut = QStringLiteral("fsindexd %1").arg(QString::fromUtf8(Version::VERSION.data(),
                                                                         static_cast<qsizetype>(Version::VERSION.size())));
        apiVersionOut = Version::API_VERSION;
    }

    QVariantMap IndexService::Status() const {
        return statusToVariantMap(m_worker.status());
    }

    std::optional<SearchResult> IndexService::runSearch(const SearchCall& call) {
        const CancellationToken token = call.searchVersion
                                            ? m_searchVersions.tokenForVersion(*call.searchVersion)
                                            : m_searchVersions.nextToken();

        const IndexStatus status = m_worker.status();
        const std::string& root = m_worker.rootPath();

        auto result = m_worker.read([&](const RootIndexData& data) {
            return searchIndexData(root, data, call.request, token);
        });
        if (!result) return std::nullopt;

        result->applyIndexStatus(status);
        return result;
    }

    QVariantMap IndexService::Search(const QString& query, const QVariantMap& options) {
        const IndexStatus status = m_worker.status();
        if (status.state == IndexState::Error) {
            replyError(QDBusError::Failed,
                       QStringLiteral("Index is in error state: %1")
                           .arg(QString::fromStdString(status.lastError.value_or(std::string("unknown error")))));
            return {};
        }

        QElapsedTimer timer;
        timer.start();

        try {
            const SearchCall call = searchCallFromOptions(query, options, m_searchDefaults);
            const auto result = runSearch(call);

            if (!result) {
                QVariantMap cancelled;
                cancelled.insert(QStringLiteral("query"), query);
                cancelled.insert(QStringLiteral("cancelled"), true);
                return cancelled;
            }

            if (timer.elapsed() > 1000) {
                qInfo().noquote() << QStringLiteral("[search] slow query \"%1\": %2 ms, %3 scanned, %4 matched")
                    .arg(query)
                    .arg(timer.elapsed())
                    .arg(static_cast<qulonglong>(result->scanned))
                    .arg(static_cast<qulonglong>(result->count));
            }

            QVariantMap out = searchResultToVariantMap(*result);
            out.insert(QStringLiteral("cancelled"), false);
            return out;
        } catch (const QueryParseError& e) {
            replyError(QDBusError::InvalidArgs, QString::fromUtf8(e.what()));
            return {};
        }
    }

    quint64 IndexService::NextSearchVersion() {
        return m_searchVersions.nextVersion();
    }

    QVariantMap IndexService::Rescan() {
        qInfo().noquote() << QStringLiteral("[dbus] rescan requested");
        m_worker.requestRescan("requested over D-Bus");
        return statusToVariantMap(m_worker.status());
    }
}
