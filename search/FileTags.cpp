// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "FileTags.h"
#include "../query/TextMatch.h"

#include <algorithm>
#include <string_view>
#include <sys/types.h>
#include <sys/xattr.h>

namespace FsIndex {
    static ssize_t readTagAttribute(const std::string& path, char* buffer, std::size_t size) {
#ifdef __APPLE__
        return ::getxattr(path.c_str(), kTagsXattrName, buffer, size, 0, XATTR_NOFOLLOW);
#else
        return ::lgetxattr(path.c_str(), kTagsXattrName, buffer, size);
#endif
    }

    std::vector<std::string> readFileTags(const std::string& path) {
        const ssize_t needed = readTagAttribute(path, nullptr, 0);
        if (needed <= 0) return {};

        std::string raw(static_cast<std::size_t>(needed), '\0');
        const ssize_t got = readTagAttribute(path, raw.data(), raw.size());
        if (got <= 0) return {};
        raw.resize(static_cast<std::size_t>(got));

        std::vector<std::string> tags;
        std::string_view rest = raw;
        while (!rest.empty()) {
            const std::size_t comma = rest.find(',');
            std::string_view tag = rest.substr(0, comma);
            while (!tag.empty() && (tag.front() == ' ' || tag.front() == '\0')) tag.remove_prefix(1);
            while (!tag.empty() && (tag.back() == ' ' || tag.back() == '\0')) tag.remove_suffix(1);
            if (!tag.empty()) tags.emplace_back(tag);
            if (comma == std::string_view::npos) break;
            rest.remove_prefix(comma + 1);
        }
        return tags;
    }

    bool fileHasAnyTag(const std::string& path, const std::vector<std::string>& wanted, bool caseInsensitive) {
        if (wanted.empty()) return false;

        for (const std::string& tag : readFileTags(path)) {
            const std::string candidate = caseInsensitive ? asciiLower(tag) : tag;
            if (std::find(wanted.begin(), wanted.end(), candidate) != wanted.end()) return true;
        }
        return false;
    }
}
