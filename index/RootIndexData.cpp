// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "RootIndexData.h"
#include "FsPath.h"
#include "Walker.h"

#include <utility>

namespace FsIndex {
    static bool equalsIgnoreAsciiCase(std::string_view a, std::string_view b) {
        if (a.size() != b.size()) return false;
        for (std::size_t i = 0; i < a.size(); ++i) {
            char ca = a[i];
            char cb = b[i];
            if (ca >= 'A' && ca <= 'Z') ca = static_cast<char>(ca - 'A' + 'a');
            if (cb >= 'A' && cb <= 'Z') cb = static_cast<char>(cb - 'A' + 'a');
            if (ca != cb) return false;
        }
        return true;
    }

    static std::vector<std::string_view> splitComponents(std::string_view path) {
        std::vector<std::string_view> out;
        while (!path.empty()) {
            const std::size_t slash = path.find('/');
            const std::string_view component = path.substr(0, slash);
            if (!component.empty()) out.push_back(component);
            if (slash == std::string_view::npos) break;
            path.remove_prefix(slash + 1);
        }
        return out;
    }

    RootIndexData::RootIndexData(ConstructedIndex constructed, std::string rootPath, Counters counters)
        : m_fileNodes(std::move(constructed.slab), constructed.root),
          m_nameIndex(std::move(constructed.nameIndex)),
          m_rootPath(std::move(rootPath)),
          m_counters(counters) {}

    std::optional<SlabIndex> RootIndexData::nodeIdForPath(std::string_view path, bool caseSensitive) const {
        if (caseSensitive) return m_fileNodes.nodeIndexForPath(path);

        const auto top = m_fileNodes.root();
        if (!top) return std::nullopt;

        const std::vector<std::string_view> components = splitComponents(path);

        // Several siblings can differ only by case, so explore every matching branch.
        std::vector<std::pair<SlabIndex, std::size_t>> stack{{*top, 0}};
        while (!stack.empty()) {
            const auto [current, depth] = stack.back();
            stack.pop_back();
            if (depth == components.size()) return current;

            const SlabNode* node = m_fileNodes.get(current);
            if (!node) continue;

            const auto& children = node->children();
            for (std::size_t i = children.size(); i-- > 0;) {
                const SlabNode* child = m_fileNodes.get(children[i]);
                if (child && equalsIgnoreAsciiCase(child->name(), components[depth])) {
                    stack.emplace_back(children[i], depth + 1);
                }
            }
        }
        return std::nullopt;
    }

    std::vector<SlabIndex> RootIndexData::fileIds() const {
        std::vector<SlabIndex> out;
        forEachNode([&](SlabIndex index, const SlabNode& node) {
            if (node.isFile()) out.push_back(index);
        });
        return out;
    }

    std::vector<SlabIndex> RootIndexData::directoryIds() const {
        std::vector<SlabIndex> out;
        forEachNode([&](SlabIndex index, const SlabNode& node) {
            if (node.isDir()) out.push_back(index);
        });
        return out;
    }

    std::vector<SlabIndex> RootIndexData::indicesForExtension(std::string_view extension) const {
        const auto wanted = FsPath::extensionOf(std::string(".") + std::string(extension));
        std::vector<SlabIndex> out;
        if (!wanted) return out;

        forEachNode([&](SlabIndex index, const SlabNode& node) {
            if (!node.isFile()) return;
            const auto ext = FsPath::extensionOf(node.name());
            if (ext && *ext == *wanted) out.push_back(index);
        });
        return out;
    }

    std::optional<SlabIndex> RootIndexData::upsertEntry(const std::string& path, NamePool& pool) {
        removeEntry(path);

        const std::string_view parentPath = FsPath::parent(path);
        if (parentPath.empty()) return std::nullopt;

        const auto parentIndex = m_fileNodes.nodeIndexForPath(parentPath);
        if (!parentIndex) return std::nullopt;

        const auto metadata = statPath(path);
        if (!metadata) {
            ++m_counters.errors;
            return std::nullopt;
        }

        const std::string_view name = pool.intern(FsPath::fileName(path));
        const SlabIndex index = m_fileNodes.slab().insert(SlabNode(name, OptionSlabIndex(*parentIndex), *metadata));

        if (SlabNode* parent = m_fileNodes.slab().getMut(*parentIndex)) {
            parent->addChild(index);
        }

        m_nameIndex.addIndexSorted(name, index, [this](SlabIndex i) {
            return m_fileNodes.nodePath(i);
        });
        return index;
    }

    bool RootIndexData::removeEntry(std::string_view path) {
        const auto index = m_fileNodes.nodeIndexForPath(path);
        if (!index) return false;

        // The top node anchors the whole tree; only a rebuild may replace it.
        if (index == m_fileNodes.root()) return false;

        removeNode(*index);
        return true;
    }

    void RootIndexData::removeNode(SlabIndex index) {
        const SlabNode* node = m_fileNodes.get(index);
        if (!node) return;

        if (const auto parent = node->parent().toOption()) {
            if (SlabNode* p = m_fileNodes.slab().getMut(*parent)) {
                p->removeChild(index);
            }
        }

        for (const SlabIndex sub : m_fileNodes.allSubnodes(index)) {
            eraseSingle(sub);
        }
        eraseSingle(index);
    }

    void RootIndexData::eraseSingle(SlabIndex index) {
        const SlabNode* node = m_fileNodes.get(index);
        if (!node) return;
        m_nameIndex.removeIndex(node->name(), index);
        m_fileNodes.slab().tryRemove(index);
    }
}
