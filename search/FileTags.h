// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_SEARCH_FILETAGS_H
#define FSINDEX_SEARCH_FILETAGS_H

#include <string>
#include <vector>

namespace FsIndex {
    // Extended attribute holding the comma-separated tag list (freedesktop convention).
    inline constexpr const char* kTagsXattrName = "user.xdg.tags";

    // Tags stored on path, trimmed, in attribute order. Empty if the attribute is missing or unreadable.
    [[nodiscard]] std::vector<std::string> readFileTags(const std::string& path);

    /**
     * @param wanted Tags to look for; lowercase when caseInsensitive is set.
     * @return true if path carries at least one of them. Symlinks are not followed.
     */
    [[nodiscard]] bool fileHasAnyTag(const std::string& path, const std::vector<std::string>& wanted, bool caseInsensitive);
}

#endif //FSINDEX_SEARCH_FILETAGS_H
