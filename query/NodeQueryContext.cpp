// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "NodeQueryContext.h"
#include "QueryPath.h"
#include "TextMatch.h"
#include "../index/FsPath.h"

#include <algorithm>
#include <type_traits>
#include <utility>

namespace FsIndex {
    NodeQueryContext::NodeQueryContext(const SlabNode& node, std::string path, bool caseSensitive)
        : m_name(caseSensitive ? std::string(node.name()) : asciiLower(node.name())),
          m_path(caseSensitive ? std::move(path) : asciiLower(path)),
          m_comparablePath(normalizePathForCompare(m_path)),
          m_pathSegments(splitPathSegments(m_comparablePath)),
          m_extension(FsPath::extensionOf(node.name())),
          m_fileType(node.fileType()),
          m_size(node.size()),
          m_modifiedAt(node.modifiedAt()),
          m_createdAt(node.createdAt()) {
    }

    static bool matchesText(std::string_view value, const NodeQueryContext& context) {
        return textMatches(value, context.name(), context.path(), context.pathSegments());
    }

    static bool matchesOptionalText(const std::optional<std::string>& argument, const NodeQueryContext& context) {
        return !argument || matchesText(*argument, context);
    }

    static bool matchesTypeTarget(const TypeFilterTarget& target, const NodeQueryContext& context) {
        switch (target.kind) {
            case TypeFilterTarget::Kind::File: return context.isFile();
            case TypeFilterTarget::Kind::Directory: return context.isDir();
            case TypeFilterTarget::Kind::Extensions:
                return context.isFile() && context.extension() && target.containsExtension(*context.extension());
        }
        return false;
    }

    static bool evaluateFilter(const QueryFilter& filter, const NodeQueryContext& context) {
        return std::visit([&context](const auto& f) -> bool {
            using T = std::decay_t<decltype(f)>;
            if constexpr (std::is_same_v<T, ExtensionFilter>) {
                if (!context.isFile() || !context.extension()) return false;
                return std::find(f.extensions.begin(), f.extensions.end(), *context.extension()) != f.extensions.end();
            } else if constexpr (std::is_same_v<T, TypeFilter>) {
                return matchesTypeTarget(f.target, context);
            } else if constexpr (std::is_same_v<T, TypeMacroFilter>) {
                return matchesTypeTarget(f.target, context) && matchesOptionalText(f.argument, context);
            } else if constexpr (std::is_same_v<T, FileFilter>) {
                return context.isFile() && matchesOptionalText(f.argument, context);
            } else if constexpr (std::is_same_v<T, FolderFilter>) {
                return context.isDir() && matchesOptionalText(f.argument, context);
            } else if constexpr (std::is_same_v<T, ParentFilter>) {
                return isDirectChildPath(context.comparablePath(), f.path);
            } else if constexpr (std::is_same_v<T, InFolderFilter>) {
                return isDescendantPath(context.comparablePath(), f.path);
            } else if constexpr (std::is_same_v<T, NoSubfoldersFilter>) {
                return context.comparablePath() == f.path
                       || (context.isFile() && isDirectChildPath(context.comparablePath(), f.path));
            } else if constexpr (std::is_same_v<T, SizeFilter>) {
                return context.isFile() && context.size() && f.predicate.matches(*context.size());
            } else if constexpr (std::is_same_v<T, DateModifiedFilter>) {
                return context.modifiedAt() && f.predicate.matches(*context.modifiedAt());
            } else if constexpr (std::is_same_v<T, DateCreatedFilter>) {
                return context.createdAt() && f.predicate.matches(*context.createdAt());
            } else {
                // ContentFilter and TagFilter
                return false;
            }
        }, filter);
    }

    bool evaluateNodeQueryTerm(const QueryTerm& term, const NodeQueryContext& context) {
        if (const std::string* text = term.asText()) return matchesText(*text, context);
        return evaluateFilter(*term.asFilter(), context);
    }
}
