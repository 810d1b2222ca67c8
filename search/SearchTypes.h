// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_SEARCH_SEARCHTYPES_H
#define FSINDEX_SEARCH_SEARCHTYPES_H

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../index/IndexStatus.h"

namespace FsIndex {
    enum class FileType : std::uint8_t {
        File,
        Directory,
        Symlink,
        Other
    };

    [[nodiscard]] inline std::string_view fileTypeName(FileType type) {
        switch (type) {
            case FileType::File: return "file";
            case FileType::Directory: return "directory";
            case FileType::Symlink: return "symlink";
            case FileType::Other: return "other";
        }
        return "other";
    }

    enum class KindFilter : std::uint8_t {
        All,
        Files,
        Directories
    };

    // "all", "files"/"file", "directories"/"directory"/"folders"/"folder". Unknown values give nullopt.
    [[nodiscard]] std::optional<KindFilter> parseKindFilter(std::string_view value);

    [[nodiscard]] inline bool kindFilterMatches(KindFilter kind, FileType type) {
        switch (kind) {
            case KindFilter::All: return true;
            case KindFilter::Files: return type == FileType::File;
            case KindFilter::Directories: return type == FileType::Directory;
        }
        return false;
    }

    struct SearchRequest {
        std::string query;
        KindFilter kind = KindFilter::All;
        bool includeHidden = false;
        bool caseSensitive = false;
        std::size_t maxResults = 200;
        // Levels below the root; 0 keeps only the root itself.
        std::size_t maxDepth = std::numeric_limits<std::size_t>::max();
    };

    struct FileEntry {
        std::string path;
        std::string name;
        FileType type = FileType::Other;
        std::optional<std::uint64_t> size;
        std::optional<std::uint32_t> modifiedAt;  // unix seconds
        std::optional<std::string> icon;
    };

    struct SearchResult {
        std::string query;
        std::string root;
        std::vector<FileEntry> entries;
        std::size_t count = 0;
        bool truncated = false;
        std::size_t scanned = 0;
        std::uint64_t errors = 0;
        std::vector<std::string> highlightTerms;

        // Copied from the index status at the time of the search.
        IndexState indexState = IndexState::Building;
        std::uint64_t indexScannedFiles = 0;
        std::uint64_t indexScannedDirs = 0;
        std::optional<std::int64_t> indexStartedAt;
        std::optional<std::int64_t> indexLastUpdateAt;
        std::optional<std::int64_t> indexFinishedAt;

        void applyIndexStatus(const IndexStatus& status);
    };
}

#endif //FSINDEX_SEARCH_SEARCHTYPES_H
