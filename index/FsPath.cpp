// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "FsPath.h"

namespace FsIndex::FsPath {
    std::string join(std::string_view dir, std::string_view name) {
        std::string out;
        out.reserve(dir.size() + name.size() + 1);
        out.append(dir);
        if (out.empty() || out.back() != '/') out.push_back('/');
        out.append(name);
        return out;
    }

    std::string_view parent(std::string_view path) {
        if (path.empty() || path == "/") return {};
        const std::size_t slash = path.rfind('/');
        if (slash == std::string_view::npos) return {};
        if (slash == 0) return path.substr(0, 1);
        return path.substr(0, slash);
    }

    std::string_view fileName(std::string_view path) {
        if (path == "/") return path;
        const std::size_t slash = path.rfind('/');
        if (slash == std::string_view::npos) return path;
        return path.substr(slash + 1);
    }

    bool isSameOrDescendant(std::string_view path, std::string_view ancestor) {
        if (ancestor == "/") return !path.empty() && path.front() == '/';
        if (path.size() < ancestor.size()) return false;
        if (path.compare(0, ancestor.size(), ancestor) != 0) return false;
        return path.size() == ancestor.size() || path[ancestor.size()] == '/';
    }

    std::size_t componentDepth(std::string_view path) {
        std::size_t depth = 0;
        bool inComponent = false;
        for (const char c : path) {
            if (c == '/') {
                inComponent = false;
            } else if (!inComponent) {
                inComponent = true;
                ++depth;
            }
        }
        return depth;
    }

    std::optional<std::string> extensionOf(std::string_view name) {
        const std::size_t dot = name.rfind('.');
        if (dot == std::string_view::npos || dot + 1 >= name.size()) return std::nullopt;

        std::string out(name.substr(dot + 1));
        for (char& c : out) {
            if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        }
        return out;
    }

    std::string clean(std::string_view path) {
        while (path.size() > 1 && path.back() == '/') path.remove_suffix(1);
        if (path.empty()) return "/";
        return std::string(path);
    }
}
