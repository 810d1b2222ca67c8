// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_INDEX_WALKER_H
#define FSINDEX_INDEX_WALKER_H

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../Cancellation.h"
#include "../storage/SlabNode.h"

namespace FsIndex {
    // Transient walk result. Children are sorted by name.
    struct Node {
        std::string name;
        SlabNodeMetadata metadata;
        std::vector<Node> children;
    };

    /**
     * Input and live progress of one directory walk.
     * The counters may be read from other threads while the walk runs.
     */
    class WalkData {
    public:
        WalkData(std::string rootPath, std::vector<std::string> ignoreDirectories,
                 CancellationToken cancel = CancellationToken::noop());

        [[nodiscard]] const std::string& rootPath() const noexcept { return m_rootPath; }
        [[nodiscard]] const std::vector<std::string>& ignoreDirectories() const noexcept { return m_ignore; }

        [[nodiscard]] bool shouldIgnore(std::string_view path) const;
        [[nodiscard]] bool isCancelled() const noexcept { return m_cancel.isCancelled(); }

        std::atomic<std::uint64_t> numFiles{0};
        std::atomic<std::uint64_t> numDirs{0};
        std::atomic<std::uint64_t> numErrors{0};

    private:
        std::string m_rootPath;
        std::vector<std::string> m_ignore;
        CancellationToken m_cancel;
    };

    // lstat() the path. std::nullopt if it cannot be stat'ed.
    [[nodiscard]] std::optional<SlabNodeMetadata> statPath(const std::string& path);

    /**
     * Lists a directory's entry names (without "." and ".."), sorted bytewise.
     * @return false if the directory could not be opened.
     */
    bool listDirectory(const std::string& path, std::vector<std::string>& namesOut);

    /**
     * Walks one subtree. Symlinks are recorded but never followed.
     * Unreadable entries are counted in numErrors and kept without children.
     *
     * @return The subtree, or std::nullopt if the walk was cancelled.
     */
    [[nodiscard]] std::optional<Node> walk(const std::string& path, std::string name, WalkData& data);

    /**
     * Walks data.rootPath() and wraps the result in one node per ancestor up to "/", so the
     * returned tree always starts at the filesystem root.
     */
    [[nodiscard]] std::optional<Node> walkIt(WalkData& data);
}

#endif //FSINDEX_INDEX_WALKER_H
