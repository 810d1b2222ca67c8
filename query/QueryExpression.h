// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_QUERY_QUERYEXPRESSION_H
#define FSINDEX_QUERY_QUERYEXPRESSION_H

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "DatePredicate.h"
#include "SizePredicate.h"
#include "TypeFilter.h"

namespace FsIndex {
    // ext:a;b. Values are lowercase and dot-less.
    struct ExtensionFilter {
        std::vector<std::string> extensions;
        bool operator==(const ExtensionFilter&) const = default;
    };

    struct TypeFilter {
        TypeFilterTarget target;
        bool operator==(const TypeFilter&) const = default;
    };

    // audio:, video:, doc:, exe: with an optional text argument.
    struct TypeMacroFilter {
        TypeFilterTarget target;
        std::optional<std::string> argument;
        bool operator==(const TypeMacroFilter&) const = default;
    };

    struct FileFilter {
        std::optional<std::string> argument;
        bool operator==(const FileFilter&) const = default;
    };

    struct FolderFilter {
        std::optional<std::string> argument;
        bool operator==(const FolderFilter&) const = default;
    };

    // Direct children of path.
    struct ParentFilter {
        std::string path;
        bool operator==(const ParentFilter&) const = default;
    };

    // Everything underneath path.
    struct InFolderFilter {
        std::string path;
        bool operator==(const InFolderFilter&) const = default;
    };

    // The folder itself plus the files directly inside it.
    struct NoSubfoldersFilter {
        std::string path;
        bool operator==(const NoSubfoldersFilter&) const = default;
    };

    struct SizeFilter {
        SizePredicate predicate;
        bool operator==(const SizeFilter&) const = default;
    };

    struct ContentFilter {
        std::string needle;
        bool operator==(const ContentFilter&) const = default;
    };

    // Matches files carrying any of the tags.
    struct TagFilter {
        std::vector<std::string> tags;
        bool operator==(const TagFilter&) const = default;
    };

    struct DateModifiedFilter {
        DatePredicate predicate;
        bool operator==(const DateModifiedFilter&) const = default;
    };

    struct DateCreatedFilter {
        DatePredicate predicate;
        bool operator==(const DateCreatedFilter&) const = default;
    };

    using QueryFilter = std::variant<ExtensionFilter, TypeFilter, TypeMacroFilter, FileFilter, FolderFilter,
                                     ParentFilter, InFolderFilter, NoSubfoldersFilter, SizeFilter,
                                     ContentFilter, TagFilter, DateModifiedFilter, DateCreatedFilter>;

    // Leaf of the query tree: free text or a typed filter.
    struct QueryTerm {
        std::variant<std::string, QueryFilter> value;

        [[nodiscard]] static QueryTerm text(std::string value) { return QueryTerm{std::move(value)}; }
        [[nodiscard]] static QueryTerm filter(QueryFilter value) { return QueryTerm{std::move(value)}; }

        [[nodiscard]] bool isText() const noexcept { return std::holds_alternative<std::string>(value); }
        [[nodiscard]] const std::string* asText() const noexcept { return std::get_if<std::string>(&value); }
        [[nodiscard]] const QueryFilter* asFilter() const noexcept { return std::get_if<QueryFilter>(&value); }

        bool operator==(const QueryTerm&) const = default;
    };

    /**
     * Boolean query tree.
     * Term holds a leaf, Not exactly one child, And/Or any number of children.
     * An empty And matches everything.
     */
    struct QueryExpression {
        enum class Kind {
            Term,
            Not,
            And,
            Or
        };

        Kind kind = Kind::And;
        std::optional<QueryTerm> term;
        std::vector<QueryExpression> children;

        [[nodiscard]] static QueryExpression makeTerm(QueryTerm term);
        [[nodiscard]] static QueryExpression makeNot(QueryExpression inner);
        [[nodiscard]] static QueryExpression makeAnd(std::vector<QueryExpression> parts);
        [[nodiscard]] static QueryExpression makeOr(std::vector<QueryExpression> parts);

        bool operator==(const QueryExpression&) const = default;
    };

    // True if the tree holds at least one leaf.
    [[nodiscard]] bool queryExpressionHasTerms(const QueryExpression& expression);

    // ASCII-lowercases every text term and every text-bearing filter argument.
    [[nodiscard]] QueryExpression lowercaseQueryExpression(QueryExpression expression);
}

#endif //FSINDEX_QUERY_QUERYEXPRESSION_H
