// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_SEARCH_SEARCHENGINE_H
#define FSINDEX_SEARCH_SEARCHENGINE_H

#include <optional>
#include <string>

#include "SearchTypes.h"
#include "../Cancellation.h"
#include "../index/RootIndexData.h"

namespace FsIndex {
    /**
     * Runs one query against an index snapshot.
     *
     * The caller must keep data stable for the duration of the call (see IndexWorker::read).
     * The index fields of the result are left at their defaults; fill them with
     * SearchResult::applyIndexStatus().
     *
     * @param root The indexed root; ancestors above it are never returned.
     * @param token Checked between phases and sparsely inside every loop.
     * @return The result, or std::nullopt if the token was cancelled.
     * @throws QueryParseError if the query does not parse.
     */
    [[nodiscard]] std::optional<SearchResult> searchIndexData(const std::string& root, const RootIndexData& data,
                                                              const SearchRequest& request,
                                                              const CancellationToken& token);
}

#endif //FSINDEX_SEARCH_SEARCHENGINE_H
