// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "FileNodes.h"
#include "NodeView.h"

#include <utility>

namespace FsIndex {
    FileNodes::FileNodes(ThinSlab<SlabNode> slab, SlabIndex root)
        : m_slab(std::move(slab)), m_root(root) {}

    std::optional<std::string> FileNodes::nodePath(SlabIndex index) const {
        return NodeView(m_slab, index).computePath();
    }

    std::optional<SlabIndex> FileNodes::nodeIndexForPath(std::string_view path) const {
        if (!m_root) return std::nullopt;

        while (!path.empty() && path.front() == '/') path.remove_prefix(1);

        SlabIndex current = *m_root;
        while (!path.empty()) {
            const std::size_t slash = path.find('/');
            const std::string_view component = path.substr(0, slash);
            path = slash == std::string_view::npos ? std::string_view() : path.substr(slash + 1);
            if (component.empty()) continue;

            const SlabNode* node = m_slab.get(current);
            if (!node) return std::nullopt;

            std::optional<SlabIndex> next;
            for (const SlabIndex child : node->children()) {
                const SlabNode* c = m_slab.get(child);
                if (c && c->name() == component) {
                    next = child;
                    break;
                }
            }
            if (!next) return std::nullopt;
            current = *next;
        }
        return current;
    }

    std::vector<SlabIndex> FileNodes::allSubnodes(SlabIndex index) const {
        std::vector<SlabIndex> out;
        std::vector<SlabIndex> stack{index};
        while (!stack.empty()) {
            const SlabIndex current = stack.back();
            stack.pop_back();

            const SlabNode* node = m_slab.get(current);
            if (!node) continue;
            for (const SlabIndex child : node->children()) {
                out.push_back(child);
                stack.push_back(child);
            }
        }
        return out;
    }
}
