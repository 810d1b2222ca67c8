// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "QueryMatcher.h"
#include "Highlight.h"
#include "NodeQueryContext.h"
#include "QueryOptimizer.h"
#include "QueryParser.h"
#include "TextMatch.h"

#include <algorithm>
#include <iterator>
#include <set>
#include <utility>

namespace FsIndex {
    static std::set<std::string> requiredTerms(const QueryExpression& expression) {
        switch (expression.kind) {
            case QueryExpression::Kind::Term: {
                const std::string* text = expression.term ? expression.term->asText() : nullptr;
                if (text && isNamePrefilterTerm(*text)) return {*text};
                return {};
            }
            case QueryExpression::Kind::Not:
                return {};
            case QueryExpression::Kind::And: {
                std::set<std::string> out;
                for (const auto& part : expression.children) out.merge(requiredTerms(part));
                return out;
            }
            case QueryExpression::Kind::Or: {
                if (expression.children.empty()) return {};
                std::set<std::string> out = requiredTerms(expression.children.front());
                for (std::size_t i = 1; i < expression.children.size() && !out.empty(); ++i) {
                    const std::set<std::string> other = requiredTerms(expression.children[i]);
                    std::set<std::string> both;
                    std::set_intersection(out.begin(), out.end(), other.begin(), other.end(),
                                          std::inserter(both, both.end()));
                    out = std::move(both);
                }
                return out;
            }
        }
        return {};
    }

    QueryMatcher QueryMatcher::compile(std::string_view rawQuery, bool caseSensitive) {
        QueryExpression parsed = QueryParser::parse(rawQuery);
        if (!caseSensitive) parsed = lowercaseQueryExpression(std::move(parsed));
        return QueryMatcher(optimizeQueryExpression(std::move(parsed)), caseSensitive);
    }

    std::vector<std::string> QueryMatcher::requiredNameTerms() const {
        const std::set<std::string> terms = requiredTerms(m_expression);
        return {terms.begin(), terms.end()};
    }

    std::vector<std::string> QueryMatcher::highlightTerms() const {
        return deriveHighlightTerms(m_expression);
    }

    bool QueryMatcher::matchesNodeTerm(const QueryTerm& term, const SlabNode& node, const std::string& path) const {
        const NodeQueryContext context(node, path, m_caseSensitive);
        return evaluateNodeQueryTerm(term, context);
    }
}
