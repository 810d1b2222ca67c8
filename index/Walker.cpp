// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "Walker.h"
#include "FsPath.h"

#include <algorithm>
#include <limits>
#include <utility>

#include <dirent.h>
#include <sys/stat.h>

namespace FsIndex {
    static std::uint32_t clampSeconds(time_t t) {
        if (t <= 0) return 0;
        if (static_cast<std::uint64_t>(t) > std::numeric_limits<std::uint32_t>::max()) {
            return std::numeric_limits<std::uint32_t>::max();
        }
        return static_cast<std::uint32_t>(t);
    }

    static NodeFileType fileTypeFromMode(mode_t mode) {
        if (S_ISREG(mode)) return NodeFileType::File;
        if (S_ISDIR(mode)) return NodeFileType::Dir;
        if (S_ISLNK(mode)) return NodeFileType::Symlink;
        return NodeFileType::Unknown;
    }

    WalkData::WalkData(std::string rootPath, std::vector<std::string> ignoreDirectories, CancellationToken cancel)
        : m_rootPath(FsPath::clean(rootPath)), m_cancel(std::move(cancel)) {
        m_ignore.reserve(ignoreDirectories.size());
        for (const auto& dir : ignoreDirectories) {
            m_ignore.push_back(FsPath::clean(dir));
        }
    }

    bool WalkData::shouldIgnore(std::string_view path) const {
        return std::any_of(m_ignore.begin(), m_ignore.end(), [&](const std::string& ignored) {
            return FsPath::isSameOrDescendant(path, ignored);
        });
    }

    std::optional<SlabNodeMetadata> statPath(const std::string& path) {
        struct stat st {};
        if (::lstat(path.c_str(), &st) != 0) return std::nullopt;

        const NodeFileType type = fileTypeFromMode(st.st_mode);
        const std::uint64_t size = type == NodeFileType::Dir ? 0 : static_cast<std::uint64_t>(st.st_size);
        return SlabNodeMetadata::some(type, size, clampSeconds(st.st_ctime), clampSeconds(st.st_mtime));
    }

    bool listDirectory(const std::string& path, std::vector<std::string>& namesOut) {
        namesOut.clear();

        DIR* dir = ::opendir(path.c_str());
        if (!dir) return false;

        while (const dirent* entry = ::readdir(dir)) {
            const std::string_view name(entry->d_name);
            if (name == "." || name == "..") continue;
            namesOut.emplace_back(name);
        }
        ::closedir(dir);

        std::sort(namesOut.begin(), namesOut.end());
        return true;
    }

    std::optional<Node> walk(const std::string& path, std::string name, WalkData& data) {
        if (data.isCancelled()) return std::nullopt;

        Node node{std::move(name), SlabNodeMetadata::none(), {}};

        const auto metadata = statPath(path);
        if (!metadata) {
            data.numErrors.fetch_add(1, std::memory_order_relaxed);
            node.metadata = SlabNodeMetadata::unaccessible();
            return node;
        }
        node.metadata = *metadata;

        if (metadata->fileType() != NodeFileType::Dir) {
            data.numFiles.fetch_add(1, std::memory_order_relaxed);
            return node;
        }
        data.numDirs.fetch_add(1, std::memory_order_relaxed);

        std::vector<std::string> names;
        if (!listDirectory(path, names)) {
            data.numErrors.fetch_add(1, std::memory_order_relaxed);
            return node;
        }

        node.children.reserve(names.size());
        for (auto& childName : names) {
            const std::string childPath = FsPath::join(path, childName);
            if (data.shouldIgnore(childPath)) continue;

            auto child = walk(childPath, std::move(childName), data);
            if (!child) return std::nullopt;
            node.children.push_back(std::move(*child));
        }
        return node;
    }

    std::optional<Node> walkIt(WalkData& data) {
        const std::string& root = data.rootPath();

        auto tree = walk(root, std::string(FsPath::fileName(root)), data);
        if (!tree) return std::nullopt;

        Node node = std::move(*tree);
        std::string_view current = root;
        while (true) {
            const std::string_view parent = FsPath::parent(current);
            if (parent.empty()) break;

            Node wrapper;
            wrapper.name = std::string(FsPath::fileName(parent));
            wrapper.metadata = statPath(std::string(parent)).value_or(SlabNodeMetadata::none());
            wrapper.children.push_back(std::move(node));
            node = std::move(wrapper);
            current = parent;
        }
        return node;
    }
}
