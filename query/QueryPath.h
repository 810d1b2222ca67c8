// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_QUERY_QUERYPATH_H
#define FSINDEX_QUERY_QUERYPATH_H

#include <string>
#include <string_view>
#include <vector>

namespace FsIndex {
    // '\' becomes '/', trailing slashes are dropped (a lone "/" stays), empty becomes "/".
    [[nodiscard]] std::string normalizePathForCompare(std::string_view raw);

    // Non-empty components of a '/'-separated path.
    [[nodiscard]] std::vector<std::string> splitPathSegments(std::string_view path);

    // Both arguments are expected in normalizePathForCompare() form.
    [[nodiscard]] bool isDirectChildPath(std::string_view candidate, std::string_view parent);
    [[nodiscard]] bool isDescendantPath(std::string_view candidate, std::string_view parent);

    /**
     * Normalizes the folder argument of parent:, infolder: and nosubfolders:.
     * "~" and "~/..." expand against $HOME.
     *
     * @param filterName Used in error messages.
     * @throws QueryParseError if the value is empty or $HOME is needed but unset.
     */
    [[nodiscard]] std::string normalizeScopeFilterPath(std::string_view raw, std::string_view filterName);
}

#endif //FSINDEX_QUERY_QUERYPATH_H
