// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "QueryExpression.h"
#include "TextMatch.h"

#include <algorithm>
#include <type_traits>
#include <utility>

namespace FsIndex {
    QueryExpression QueryExpression::makeTerm(QueryTerm term) {
        QueryExpression e;
        e.kind = Kind::Term;
        e.term = std::move(term);
        return e;
    }

    QueryExpression QueryExpression::makeNot(QueryExpression inner) {
        QueryExpression e;
        e.kind = Kind::Not;
        e.children.push_back(std::move(inner));
        return e;
    }

    QueryExpression QueryExpression::makeAnd(std::vector<QueryExpression> parts) {
        QueryExpression e;
        e.kind = Kind::And;
        e.children = std::move(parts);
        return e;
    }

    QueryExpression QueryExpression::makeOr(std::vector<QueryExpression> parts) {
        QueryExpression e;
        e.kind = Kind::Or;
        e.children = std::move(parts);
        return e;
    }

    bool queryExpressionHasTerms(const QueryExpression& expression) {
        if (expression.kind == QueryExpression::Kind::Term) return true;
        return std::any_of(expression.children.begin(), expression.children.end(), queryExpressionHasTerms);
    }

    static void lowercaseOptional(std::optional<std::string>& value) {
        if (value) *value = asciiLower(*value);
    }

    static void lowercaseFilter(QueryFilter& filter) {
        std::visit([](auto& f) {
            using T = std::decay_t<decltype(f)>;
            if constexpr (std::is_same_v<T, TypeMacroFilter> || std::is_same_v<T, FileFilter>
                          || std::is_same_v<T, FolderFilter>) {
                lowercaseOptional(f.argument);
            } else if constexpr (std::is_same_v<T, ParentFilter> || std::is_same_v<T, InFolderFilter>
                                 || std::is_same_v<T, NoSubfoldersFilter>) {
                f.path = asciiLower(f.path);
            } else if constexpr (std::is_same_v<T, ContentFilter>) {
                f.needle = asciiLower(f.needle);
            } else if constexpr (std::is_same_v<T, TagFilter>) {
                for (auto& tag : f.tags) tag = asciiLower(tag);
            }
        }, filter);
    }

    QueryExpression lowercaseQueryExpression(QueryExpression expression) {
        if (expression.term) {
            if (auto* text = std::get_if<std::string>(&expression.term->value)) {
                *text = asciiLower(*text);
            } else if (auto* filter = std::get_if<QueryFilter>(&expression.term->value)) {
                lowercaseFilter(*filter);
            }
        }
        for (auto& child : expression.children) {
            child = lowercaseQueryExpression(std::move(child));
        }
        return expression;
    }
}
