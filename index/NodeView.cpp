// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "NodeView.h"

#include <string_view>
#include <vector>

namespace FsIndex {
    std::optional<std::string> NodeView::computePath() const {
        std::vector<std::string_view> names;
        std::size_t total = 0;

        std::optional<SlabIndex> current = m_index;
        while (current) {
            const SlabNode* n = m_slab.get(*current);
            if (!n) return std::nullopt;
            if (n->name() != "/") {
                names.push_back(n->name());
                total += n->name().size() + 1;
            }
            current = n->parent().toOption();
        }

        if (names.empty()) return std::string("/");

        std::string path;
        path.reserve(total);
        for (auto it = names.rbegin(); it != names.rend(); ++it) {
            path.push_back('/');
            path.append(*it);
        }
        return path;
    }

    std::optional<std::size_t> NodeView::computeDepth() const {
        const SlabNode* n = m_slab.get(m_index);
        if (!n) return std::nullopt;

        std::size_t depth = 0;
        std::optional<SlabIndex> parent = n->parent().toOption();
        while (parent) {
            n = m_slab.get(*parent);
            if (!n) return std::nullopt;
            ++depth;
            parent = n->parent().toOption();
        }
        return depth;
    }

    std::optional<bool> NodeView::isHiddenWithinDepth(std::size_t maxHops) const {
        const SlabNode* n = m_slab.get(m_index);
        if (!n) return std::nullopt;

        for (std::size_t hop = 0;; ++hop) {
            if (n->isHidden()) return true;
            if (hop == maxHops) return false;

            const auto parent = n->parent().toOption();
            if (!parent) return false;
            n = m_slab.get(*parent);
            if (!n) return std::nullopt;
        }
    }
}
