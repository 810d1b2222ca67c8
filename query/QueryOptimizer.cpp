// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "QueryOptimizer.h"

#include <algorithm>
#include <utility>
#include <vector>

namespace FsIndex {
    // Lower runs first.
    static int evaluationRank(const QueryExpression& expression) {
        if (expression.kind != QueryExpression::Kind::Term || !expression.term) return 1;

        const QueryFilter* filter = expression.term->asFilter();
        if (!filter) return 1;
        if (std::holds_alternative<InFolderFilter>(*filter) || std::holds_alternative<ParentFilter>(*filter)) return 0;
        if (std::holds_alternative<TagFilter>(*filter)) return 3;
        return 2;
    }

    static std::vector<QueryExpression> flatten(std::vector<QueryExpression> parts, QueryExpression::Kind kind) {
        std::vector<QueryExpression> flattened;
        flattened.reserve(parts.size());
        for (auto& part : parts) {
            QueryExpression optimized = optimizeQueryExpression(std::move(part));
            if (optimized.kind == kind) {
                for (auto& nested : optimized.children) flattened.push_back(std::move(nested));
            } else {
                flattened.push_back(std::move(optimized));
            }
        }
        return flattened;
    }

    QueryExpression optimizeQueryExpression(QueryExpression expression) {
        switch (expression.kind) {
            case QueryExpression::Kind::Term:
                return expression;

            case QueryExpression::Kind::Not: {
                for (auto& child : expression.children) child = optimizeQueryExpression(std::move(child));
                return expression;
            }

            case QueryExpression::Kind::And: {
                auto parts = flatten(std::move(expression.children), QueryExpression::Kind::And);
                if (parts.size() == 1) return std::move(parts.front());
                std::stable_sort(parts.begin(), parts.end(), [](const QueryExpression& a, const QueryExpression& b) {
                    return evaluationRank(a) < evaluationRank(b);
                });
                return QueryExpression::makeAnd(std::move(parts));
            }

            case QueryExpression::Kind::Or: {
                auto parts = flatten(std::move(expression.children), QueryExpression::Kind::Or);
                if (parts.size() == 1) return std::move(parts.front());
                return QueryExpression::makeOr(std::move(parts));
            }
        }
        return expression;
    }
}
