// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "Highlight.h"
#include "TextMatch.h"
#include "../index/FsPath.h"

#include <set>
#include <string_view>
#include <type_traits>
#include <utility>

namespace FsIndex {
    namespace {
        std::string_view trim(std::string_view s) {
            while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
            while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
            return s;
        }

        class HighlightCollector {
        public:
            void collect(const QueryExpression& expression) {
                if (expression.term) {
                    if (const std::string* text = expression.term->asText()) collectText(*text);
                    else if (const QueryFilter* filter = expression.term->asFilter()) collectFilter(*filter);
                }
                for (const auto& child : expression.children) collect(child);
            }

            std::vector<std::string> terms() const { return {m_terms.begin(), m_terms.end()}; }

        private:
            void collectFilter(const QueryFilter& filter) {
                std::visit([this](const auto& f) {
                    using T = std::decay_t<decltype(f)>;
                    if constexpr (std::is_same_v<T, ExtensionFilter>) {
                        for (const auto& ext : f.extensions) push(ext);
                    } else if constexpr (std::is_same_v<T, TagFilter>) {
                        for (const auto& tag : f.tags) push(tag);
                    } else if constexpr (std::is_same_v<T, TypeMacroFilter> || std::is_same_v<T, FileFilter>
                                         || std::is_same_v<T, FolderFilter>) {
                        if (f.argument) collectText(*f.argument);
                    } else if constexpr (std::is_same_v<T, ParentFilter> || std::is_same_v<T, InFolderFilter>
                                         || std::is_same_v<T, NoSubfoldersFilter>) {
                        const std::string_view name = FsPath::fileName(f.path);
                        if (name != "/") collectText(name);
                    } else if constexpr (std::is_same_v<T, ContentFilter>) {
                        collectText(f.needle);
                    }
                }, filter);
            }

            // Literal chunks between wildcards; an all-wildcard value contributes nothing.
            void collectText(std::string_view value) {
                const std::string_view trimmed = trim(value);
                std::size_t start = 0;
                while (start <= trimmed.size()) {
                    std::size_t wildcard = trimmed.find_first_of("*?", start);
                    if (wildcard == std::string_view::npos) wildcard = trimmed.size();
                    const std::string_view chunk = trim(trimmed.substr(start, wildcard - start));
                    if (!chunk.empty()) push(chunk);
                    start = wildcard + 1;
                }
            }

            void push(std::string_view candidate) {
                std::string lowered = asciiLower(candidate);
                if (!lowered.empty()) m_terms.insert(std::move(lowered));
            }

            std::set<std::string> m_terms;
        };
    }

    std::vector<std::string> deriveHighlightTerms(const QueryExpression& expression) {
        HighlightCollector collector;
        collector.collect(expression);
        return collector.terms();
    }
}
