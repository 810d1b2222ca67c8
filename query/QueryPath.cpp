// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "QueryPath.h"
#include "QueryError.h"
#include "../index/FsPath.h"

#include <algorithm>
#include <cstdlib>

namespace FsIndex {
    std::string normalizePathForCompare(std::string_view raw) {
        std::string normalized(raw);
        std::replace(normalized.begin(), normalized.end(), '\\', '/');
        while (normalized.size() > 1 && normalized.back() == '/') normalized.pop_back();
        if (normalized.empty()) return "/";
        return normalized;
    }

    std::vector<std::string> splitPathSegments(std::string_view path) {
        std::vector<std::string> out;
        std::size_t start = 0;
        while (start <= path.size()) {
            std::size_t slash = path.find('/', start);
            if (slash == std::string_view::npos) slash = path.size();
            if (slash > start) out.emplace_back(path.substr(start, slash - start));
            start = slash + 1;
        }
        return out;
    }

    bool isDirectChildPath(std::string_view candidate, std::string_view parent) {
        if (candidate == parent) return false;
        const std::string_view candidateParent = FsPath::parent(candidate);
        if (candidateParent.empty()) return false;
        return normalizePathForCompare(candidateParent) == parent;
    }

    bool isDescendantPath(std::string_view candidate, std::string_view parent) {
        if (candidate == parent) return false;
        if (parent == "/") return candidate.size() > 1 && candidate.front() == '/';
        if (candidate.size() <= parent.size() + 1) return false;
        return candidate.starts_with(parent) && candidate[parent.size()] == '/';
    }

    std::string normalizeScopeFilterPath(std::string_view raw, std::string_view filterName) {
        while (!raw.empty() && (raw.front() == ' ' || raw.front() == '\t')) raw.remove_prefix(1);
        while (!raw.empty() && (raw.back() == ' ' || raw.back() == '\t')) raw.remove_suffix(1);
        if (raw.empty()) throw QueryParseError(std::string(filterName) + ": requires a folder path");

        if (raw == "~" || raw.starts_with("~/") || raw.starts_with("~\\")) {
            const char* home = std::getenv("HOME");
            if (!home || !*home) throw QueryParseError("HOME is not set");
            if (raw == "~") return normalizePathForCompare(home);
            return normalizePathForCompare(FsPath::join(home, raw.substr(2)));
        }
        return normalizePathForCompare(raw);
    }
}
