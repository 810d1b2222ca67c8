// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_QUERY_HIGHLIGHT_H
#define FSINDEX_QUERY_HIGHLIGHT_H

#include <string>
#include <vector>

#include "QueryExpression.h"

namespace FsIndex {
    /**
     * Literal substrings a client should emphasize in result names.
     *
     * Text is split on '*' and '?' into literal chunks; extension, tag and content values
     * and the optional arguments of file:, folder: and type macros contribute as well,
     * scope filters only their last path component. Type, size and date filters add nothing.
     *
     * @return Lowercased, deduplicated and sorted terms.
     */
    [[nodiscard]] std::vector<std::string> deriveHighlightTerms(const QueryExpression& expression);
}

#endif //FSINDEX_QUERY_HIGHLIGHT_H
