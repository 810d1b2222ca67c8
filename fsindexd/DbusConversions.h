// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_FSINDEXD_DBUSCONVERSIONS_H
#define FSINDEX_FSINDEXD_DBUSCONVERSIONS_H

#include <QString>
#include <QVariant>
#include <QVariantMap>

#include <optional>

#include "../index/IndexStatus.h"
#include "../search/SearchTypes.h"

namespace FsIndex {
    // Strips one level of QDBusVariant wrapping, as delivered inside a{sv} arguments.
    [[nodiscard]] QVariant unwrapDbusVariant(const QVariant& v);

    struct SearchCall {
        SearchRequest request;
        std::optional<quint64> searchVersion;
    };

    /**
     * Builds a request from the Search() arguments.
     *
     * Recognized keys: kind, includeHidden, caseSensitive, maxResults, maxDepth, searchVersion.
     * Keys that are absent keep the value from defaults; unknown keys are ignored.
     *
     * @throws QueryParseError if kind is not a known kind filter.
     */
    [[nodiscard]] SearchCall searchCallFromOptions(const QString& query, const QVariantMap& options,
                                                   const SearchRequest& defaults);

    [[nodiscard]] QVariantMap statusToVariantMap(const IndexStatus& status);

    // Unknown sizes and timestamps are left out of the entry maps rather than sent as 0.
    [[nodiscard]] QVariantMap searchResultToVariantMap(const SearchResult& result);
}

#endif //FSINDEX_FSINDEXD_DBUSCONVERSIONS_H
