// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "DbusConversions.h"
#include "../query/QueryError.h"

#include <QStringList>
#include <QVariantList>
#include <QtDBus/QDBusVariant>

namespace FsIndex {
    namespace {
        QStringList toStringList(const std::vector<std::string>& values) {
            QStringList out;
            out.reserve(static_cast<qsizetype>(values.size()));
            for (const auto& v : values) out.push_back(QString::fromStdString(v));
            return out;
        }

        QString latin1(std::string_view text) {
            return QString::fromLatin1(text.data(), static_cast<qsizetype>(text.size()));
        }

        void insertOptionalTime(QVariantMap& m, const QString& key, const std::optional<std::int64_t>& value) {
            if (value) m.insert(key, static_cast<qint64>(*value));
        }
    }

    QVariant unwrapDbusVariant(const QVariant& v) {
        if (v.canConvert<QDBusVariant>()) {
            return qvariant_cast<QDBusVariant>(v).variant();
        }
        return v;
    }

    SearchCall searchCallFromOptions(const QString& query, const QVariantMap& options,
                                     const SearchRequest& defaults) {
        SearchCall call;
        call.request = defaults;
        call.request.query = query.toStdString();

        auto option = [&](const char* key) -> std::optional<QVariant> {
            auto it = options.constFind(QString::fromLatin1(key));
            if (it == options.constEnd()) return std::nullopt;
            return unwrapDbusVariant(it.value());
        };

        if (auto v = option("kind")) {
            const QString raw = v->toString();
            const auto kind = parseKindFilter(raw.toStdString());
            if (!kind) {
                throw QueryParseError("unknown kind: " + raw.toStdString());
            }
            call.request.kind = *kind;
        }
        if (auto v = option("includeHidden")) call.request.includeHidden = v->toBool();
        if (auto v = option("caseSensitive")) call.request.caseSensitive = v->toBool();
        if (auto v = option("maxResults")) call.request.maxResults = static_cast<std::size_t>(v->toULongLong());
        if (auto v = option("maxDepth")) call.request.maxDepth = static_cast<std::size_t>(v->toULongLong());
        if (auto v = option("searchVersion")) call.searchVersion = v->toULongLong();

        return call;
    }

    QVariantMap statusToVariantMap(const IndexStatus& status) {
        QVariantMap m;
        m.insert(QStringLiteral("state"), latin1(indexStateName(status.state)));
        m.insert(QStringLiteral("root"), QString::fromStdString(status.root));
        m.insert(QStringLiteral("ignoredPaths"), toStringList(status.ignoredPaths));
        m.insert(QStringLiteral("indexedEntries"), static_cast<quint64>(status.indexedEntries));
        m.insert(QStringLiteral("scannedFiles"), static_cast<quint64>(status.scannedFiles));
        m.insert(QStringLiteral("scannedDirs"), static_cast<quint64>(status.scannedDirs));
        insertOptionalTime(m, QStringLiteral("startedAt"), status.startedAt);
        insertOptionalTime(m, QStringLiteral("lastUpdateAt"), status.lastUpdateAt);
        insertOptionalTime(m, QStringLiteral("finishedAt"), status.finishedAt);
        m.insert(QStringLiteral("errors"), static_cast<quint64>(status.errors));
        m.insert(QStringLiteral("watcherEnabled"), status.watcherEnabled);
        m.insert(QStringLiteral("cachePath"), QString::fromStdString(status.cachePath));
        m.insert(QStringLiteral("rescanCount"), static_cast<quint64>(status.rescanCount));
        if (status.lastError) {
            m.insert(QStringLiteral("lastError"), QString::fromStdString(*status.lastError));
        }
        m.insert(QStringLiteral("lastEventId"), static_cast<quint64>(status.lastEventId));
        m.insert(QStringLiteral("historyDone"), status.historyDone);
        return m;
    }

    QVariantMap searchResultToVariantMap(const SearchResult& result) {
        QVariantList entries;
        entries.reserve(static_cast<qsizetype>(result.entries.size()));
        for (const FileEntry& e : result.entries) {
            QVariantMap row;
            row.insert(QStringLiteral("path"), QString::fromStdString(e.path));
            row.insert(QStringLiteral("name"), QString::fromStdString(e.name));
            row.insert(QStringLiteral("type"), latin1(fileTypeName(e.type)));
            if (e.size) row.insert(QStringLiteral("size"), static_cast<quint64>(*e.size));
            if (e.modifiedAt) row.insert(QStringLiteral("modifiedAt"), static_cast<quint32>(*e.modifiedAt));
            if (e.icon) row.insert(QStringLiteral("icon"), QString::fromStdString(*e.icon));
            entries.push_back(row);
        }

        QVariantMap m;
        m.insert(QStringLiteral("query"), QString::fromStdString(result.query));
        m.insert(QStringLiteral("root"), QString::fromStdString(result.root));
        m.insert(QStringLiteral("entries"), entries);
        m.insert(QStringLiteral("count"), static_cast<quint64>(result.count));
        m.insert(QStringLiteral("truncated"), result.truncated);
        m.insert(QStringLiteral("scanned"), static_cast<quint64>(result.scanned));
        m.insert(QStringLiteral("errors"), static_cast<quint64>(result.errors));
        m.insert(QStringLiteral("highlightTerms"), toStringList(result.highlightTerms));
        m.insert(QStringLiteral("indexState"), latin1(indexStateName(result.indexState)));
        m.insert(QStringLiteral("indexScannedFiles"), static_cast<quint64>(result.indexScannedFiles));
        m.insert(QStringLiteral("indexScannedDirs"), static_cast<quint64>(result.indexScannedDirs));
        insertOptionalTime(m, QStringLiteral("indexStartedAt"), result.indexStartedAt);
        insertOptionalTime(m, QStringLiteral("indexLastUpdateAt"), result.indexLastUpdateAt);
        insertOptionalTime(m, QStringLiteral("indexFinishedAt"), result.indexFinishedAt);
        return m;
    }
}
