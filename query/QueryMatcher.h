// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_QUERY_QUERYMATCHER_H
#define FSINDEX_QUERY_QUERYMATCHER_H

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "QueryExpression.h"
#include "../storage/SlabNode.h"

namespace FsIndex {
    // A parsed, normalized and optimized query, ready to be evaluated against index nodes.
    class QueryMatcher {
    public:
        /**
         * Parses the query, lowercases it unless caseSensitive, then optimizes it.
         * @throws QueryParseError
         */
        [[nodiscard]] static QueryMatcher compile(std::string_view rawQuery, bool caseSensitive);

        [[nodiscard]] const QueryExpression& expression() const noexcept { return m_expression; }
        [[nodiscard]] bool caseSensitive() const noexcept { return m_caseSensitive; }

        /**
         * Plain words every match must contain in its name. Words under a negation are
         * ignored and an Or only keeps the words all of its branches require.
         */
        [[nodiscard]] std::vector<std::string> requiredNameTerms() const;

        [[nodiscard]] std::vector<std::string> highlightTerms() const;

        [[nodiscard]] bool matchesNodeTerm(const QueryTerm& term, const SlabNode& node, const std::string& path) const;

    private:
        QueryMatcher(QueryExpression expression, bool caseSensitive)
            : m_expression(std::move(expression)), m_caseSensitive(caseSensitive) {}

        QueryExpression m_expression;
        bool m_caseSensitive;
    };
}

#endif //FSINDEX_QUERY_QUERYMATCHER_H
