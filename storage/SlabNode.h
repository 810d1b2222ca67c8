// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_STORAGE_SLABNODE_H
#define FSINDEX_STORAGE_SLABNODE_H

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

#include "SlabIndex.h"
#include "ThinVector.h"

namespace FsIndex {
    enum class NodeFileType : std::uint8_t {
        File = 0,
        Dir = 1,
        Symlink = 2,
        Unknown = 3
    };

    enum class MetadataState : std::uint8_t {
        None = 0,        // never stat'ed (synthetic ancestors)
        Some = 1,
        Unaccessible = 2 // stat failed
    };

    /**
     * Per-node metadata packed into 16 bytes.
     *
     * The first word holds state (bits 62-63), file type (bits 60-61) and size (bits 0-59,
     * saturating at 2^60-1). Timestamps are unix seconds; 0 means unknown.
     */
    class SlabNodeMetadata {
    public:
        static constexpr std::uint64_t kSizeMask = (std::uint64_t{1} << 60) - 1;

        SlabNodeMetadata() = default;

        [[nodiscard]] static SlabNodeMetadata none() { return {}; }
        [[nodiscard]] static SlabNodeMetadata unaccessible();
        [[nodiscard]] static SlabNodeMetadata some(NodeFileType type, std::uint64_t size,
                                                   std::uint32_t ctime, std::uint32_t mtime);

        [[nodiscard]] MetadataState state() const noexcept {
            return static_cast<MetadataState>((m_stateTypeSize >> 62) & 0x3);
        }
        [[nodiscard]] NodeFileType fileType() const noexcept {
            return static_cast<NodeFileType>((m_stateTypeSize >> 60) & 0x3);
        }
        [[nodiscard]] std::uint64_t rawSize() const noexcept { return m_stateTypeSize & kSizeMask; }
        [[nodiscard]] std::uint32_t ctime() const noexcept { return m_ctime; }
        [[nodiscard]] std::uint32_t mtime() const noexcept { return m_mtime; }

        bool operator==(const SlabNodeMetadata&) const = default;

    private:
        std::uint64_t m_stateTypeSize = 0;
        std::uint32_t m_ctime = 0;
        std::uint32_t m_mtime = 0;
    };

    /**
     * One filesystem entry in the slab.
     *
     * The name is a view into the NamePool. The children list holds slab indices whose
     * nodes point back here through their parent field.
     */
    class SlabNode {
    public:
        SlabNode(std::string_view name, OptionSlabIndex parent, SlabNodeMetadata metadata);

        [[nodiscard]] std::string_view name() const noexcept { return m_name; }
        [[nodiscard]] OptionSlabIndex parent() const noexcept { return m_parent; }
        void setParent(OptionSlabIndex parent) noexcept { m_parent = parent; }

        [[nodiscard]] const ThinVector<SlabIndex>& children() const noexcept { return m_children; }
        void setChildren(ThinVector<SlabIndex> children) { m_children = std::move(children); }

        // @return false if the child was already listed.
        bool addChild(SlabIndex child);
        // @return false if the child was not listed.
        bool removeChild(SlabIndex child);

        [[nodiscard]] const SlabNodeMetadata& metadata() const noexcept { return m_metadata; }
        void setMetadata(SlabNodeMetadata metadata) noexcept { m_metadata = metadata; }

        [[nodiscard]] NodeFileType fileType() const noexcept;
        [[nodiscard]] bool isFile() const noexcept { return fileType() == NodeFileType::File; }
        [[nodiscard]] bool isDir() const noexcept { return fileType() == NodeFileType::Dir; }
        [[nodiscard]] bool isHidden() const noexcept { return !m_name.empty() && m_name.front() == '.'; }

        // Directories and nodes without metadata have no size.
        [[nodiscard]] std::optional<std::uint64_t> size() const noexcept;
        [[nodiscard]] std::optional<std::uint32_t> modifiedAt() const noexcept;
        [[nodiscard]] std::optional<std::uint32_t> createdAt() const noexcept;

    private:
        std::string_view m_name;
        OptionSlabIndex m_parent;
        ThinVector<SlabIndex> m_children;
        SlabNodeMetadata m_metadata;
    };
}

#endif //FSINDEX_STORAGE_SLABNODE_H
