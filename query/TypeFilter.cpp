// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "TypeFilter.h"

#include <algorithm>
#include <initializer_list>

namespace FsIndex {
    namespace {
        constexpr std::string_view kPictureExtensions[] = {
            "jpg", "jpeg", "png", "gif", "bmp", "tif", "tiff", "webp", "ico", "svg", "heic", "heif",
            "raw", "arw", "cr2", "orf", "raf", "psd", "ai"
        };

        constexpr std::string_view kVideoExtensions[] = {
            "mp4", "m4v", "mov", "avi", "mkv", "wmv", "webm", "flv", "mpg", "mpeg", "3gp", "3g2",
            "ts", "mts", "m2ts"
        };

        constexpr std::string_view kAudioExtensions[] = {
            "mp3", "wav", "flac", "aac", "ogg", "oga", "opus", "wma", "m4a", "alac", "aiff"
        };

        constexpr std::string_view kDocumentExtensions[] = {
            "txt", "md", "rst", "doc", "docx", "rtf", "odt", "pdf", "pages", "rtfd"
        };

        constexpr std::string_view kPresentationExtensions[] = {"ppt", "pptx", "key", "odp"};

        constexpr std::string_view kSpreadsheetExtensions[] = {"xls", "xlsx", "csv", "numbers", "ods"};

        constexpr std::string_view kPdfExtensions[] = {"pdf"};

        constexpr std::string_view kArchiveExtensions[] = {
            "zip", "rar", "7z", "tar", "gz", "tgz", "bz2", "xz", "zst", "cab", "iso", "dmg"
        };

        constexpr std::string_view kCodeExtensions[] = {
            "rs", "ts", "tsx", "js", "jsx", "c", "cc", "cpp", "cxx", "h", "hpp", "hh", "java", "cs",
            "py", "go", "rb", "swift", "kt", "kts", "php", "html", "css", "scss", "sass", "less",
            "json", "yaml", "yml", "toml", "ini", "cfg", "sh", "zsh", "fish", "ps1", "psm1", "sql",
            "lua", "pl", "pm", "r", "m", "mm", "dart", "scala", "ex", "exs"
        };

        constexpr std::string_view kExecutableExtensions[] = {
            "exe", "msi", "bat", "cmd", "com", "ps1", "psm1", "app", "apk", "ipa", "jar", "bin",
            "run", "pkg"
        };

        bool isOneOf(std::string_view name, std::initializer_list<std::string_view> options) {
            return std::find(options.begin(), options.end(), name) != options.end();
        }

        TypeFilterTarget extensionsTarget(std::span<const std::string_view> table) {
            return TypeFilterTarget{TypeFilterTarget::Kind::Extensions, table};
        }
    }

    bool TypeFilterTarget::containsExtension(std::string_view extension) const {
        return std::find(extensions.begin(), extensions.end(), extension) != extensions.end();
    }

    std::optional<TypeFilterTarget> lookupTypeFilterTarget(std::string_view name) {
        if (isOneOf(name, {"file", "files"}))
            return TypeFilterTarget{TypeFilterTarget::Kind::File, {}};
        if (isOneOf(name, {"folder", "folders", "dir", "directory"}))
            return TypeFilterTarget{TypeFilterTarget::Kind::Directory, {}};
        if (isOneOf(name, {"picture", "pictures", "image", "images", "photo", "photos"}))
            return extensionsTarget(kPictureExtensions);
        if (isOneOf(name, {"video", "videos", "movie", "movies"}))
            return extensionsTarget(kVideoExtensions);
        if (isOneOf(name, {"audio", "audios", "music", "song", "songs"}))
            return extensionsTarget(kAudioExtensions);
        if (isOneOf(name, {"doc", "docs", "document", "documents", "text", "office"}))
            return extensionsTarget(kDocumentExtensions);
        if (isOneOf(name, {"presentation", "presentations", "ppt", "slides"}))
            return extensionsTarget(kPresentationExtensions);
        if (isOneOf(name, {"spreadsheet", "spreadsheets", "xls", "excel", "sheet", "sheets"}))
            return extensionsTarget(kSpreadsheetExtensions);
        if (name == "pdf")
            return extensionsTarget(kPdfExtensions);
        if (isOneOf(name, {"archive", "archives", "compressed", "zip"}))
            return extensionsTarget(kArchiveExtensions);
        if (isOneOf(name, {"code", "source", "dev"}))
            return extensionsTarget(kCodeExtensions);
        if (isOneOf(name, {"exe", "exec", "executable", "executables", "program", "programs", "app", "apps"}))
            return extensionsTarget(kExecutableExtensions);
        return std::nullopt;
    }
}
