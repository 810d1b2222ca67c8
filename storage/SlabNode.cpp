// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "SlabNode.h"

#include <algorithm>

namespace FsIndex {
    SlabNodeMetadata SlabNodeMetadata::unaccessible() {
        SlabNodeMetadata out;
        out.m_stateTypeSize = (static_cast<std::uint64_t>(MetadataState::Unaccessible) << 62) |
                              (static_cast<std::uint64_t>(NodeFileType::Unknown) << 60);
        return out;
    }

    SlabNodeMetadata SlabNodeMetadata::some(NodeFileType type, std::uint64_t size,
                                            std::uint32_t ctime, std::uint32_t mtime) {
        SlabNodeMetadata out;
        out.m_stateTypeSize = (static_cast<std::uint64_t>(MetadataState::Some) << 62) |
                              (static_cast<std::uint64_t>(type) << 60) |
                              std::min(size, kSizeMask);
        out.m_ctime = ctime;
        out.m_mtime = mtime;
        return out;
    }

    SlabNode::SlabNode(std::string_view name, OptionSlabIndex parent, SlabNodeMetadata metadata)
        : m_name(name), m_parent(parent), m_metadata(metadata) {}

    bool SlabNode::addChild(SlabIndex child) {
        if (std::find(m_children.begin(), m_children.end(), child) != m_children.end()) {
            return false;
        }
        m_children.push_back(child);
        return true;
    }

    bool SlabNode::removeChild(SlabIndex child) {
        for (std::size_t i = 0; i < m_children.size(); ++i) {
            if (m_children[i] == child) {
                m_children.erase(i);
                return true;
            }
        }
        return false;
    }

    NodeFileType SlabNode::fileType() const noexcept {
        // Synthetic ancestors (no metadata) are always directories.
        if (m_metadata.state() == MetadataState::None) return NodeFileType::Dir;
        return m_metadata.fileType();
    }

    std::optional<std::uint64_t> SlabNode::size() const noexcept {
        if (m_metadata.state() != MetadataState::Some) return std::nullopt;
        if (m_metadata.fileType() == NodeFileType::Dir) return std::nullopt;
        return m_metadata.rawSize();
    }

    std::optional<std::uint32_t> SlabNode::modifiedAt() const noexcept {
        if (m_metadata.state() != MetadataState::Some || m_metadata.mtime() == 0) return std::nullopt;
        return m_metadata.mtime();
    }

    std::optional<std::uint32_t> SlabNode::createdAt() const noexcept {
        if (m_metadata.state() != MetadataState::Some || m_metadata.ctime() == 0) return std::nullopt;
        return m_metadata.ctime();
    }
}
