// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_INDEX_FSPATH_H
#define FSINDEX_INDEX_FSPATH_H

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

// Helpers for absolute, '/'-separated filesystem paths as stored by the index.
namespace FsIndex::FsPath {
    [[nodiscard]] std::string join(std::string_view dir, std::string_view name);

    // "/a/b" -> "/a", "/a" -> "/", "/" -> "" (no parent).
    [[nodiscard]] std::string_view parent(std::string_view path);

    // "/a/b" -> "b", "/" -> "/".
    [[nodiscard]] std::string_view fileName(std::string_view path);

    // True if path equals ancestor or lies underneath it (component-wise, not string prefix).
    [[nodiscard]] bool isSameOrDescendant(std::string_view path, std::string_view ancestor);

    // Number of non-empty components: "/" -> 0, "/a/b" -> 2.
    [[nodiscard]] std::size_t componentDepth(std::string_view path);

    /**
     * Lowercased text after the last '.' of a file name, used for extension filtering.
     * Dot-files count: ".bashrc" -> "bashrc". A trailing dot yields none.
     */
    [[nodiscard]] std::optional<std::string> extensionOf(std::string_view name);

    // Drops trailing slashes (keeping a lone "/") and collapses an empty path to "/".
    [[nodiscard]] std::string clean(std::string_view path);
}

#endif //FSINDEX_INDEX_FSPATH_H
