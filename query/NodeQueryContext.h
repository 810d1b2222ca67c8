// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_QUERY_NODEQUERYCONTEXT_H
#define FSINDEX_QUERY_NODEQUERYCONTEXT_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "QueryExpression.h"
#include "../storage/SlabNode.h"

namespace FsIndex {
    // Everything a per-node predicate looks at, computed once per candidate.
    class NodeQueryContext {
    public:
        /**
         * @param node The candidate node.
         * @param path Its full path.
         * @param caseSensitive When false, name and path are lowercased (ASCII) to match the
         *                      lowercased query.
         */
        NodeQueryContext(const SlabNode& node, std::string path, bool caseSensitive);

        [[nodiscard]] const std::string& name() const noexcept { return m_name; }
        [[nodiscard]] const std::string& path() const noexcept { return m_path; }
        [[nodiscard]] const std::string& comparablePath() const noexcept { return m_comparablePath; }
        [[nodiscard]] const std::vector<std::string>& pathSegments() const noexcept { return m_pathSegments; }
        [[nodiscard]] const std::optional<std::string>& extension() const noexcept { return m_extension; }

        [[nodiscard]] NodeFileType fileType() const noexcept { return m_fileType; }
        [[nodiscard]] bool isFile() const noexcept { return m_fileType == NodeFileType::File; }
        [[nodiscard]] bool isDir() const noexcept { return m_fileType == NodeFileType::Dir; }

        [[nodiscard]] std::optional<std::uint64_t> size() const noexcept { return m_size; }
        [[nodiscard]] std::optional<std::uint32_t> modifiedAt() const noexcept { return m_modifiedAt; }
        [[nodiscard]] std::optional<std::uint32_t> createdAt() const noexcept { return m_createdAt; }

    private:
        std::string m_name;
        std::string m_path;
        std::string m_comparablePath;
        std::vector<std::string> m_pathSegments;
        std::optional<std::string> m_extension;
        NodeFileType m_fileType;
        std::optional<std::uint64_t> m_size;
        std::optional<std::uint32_t> m_modifiedAt;
        std::optional<std::uint32_t> m_createdAt;
    };

    /**
     * Evaluates one leaf against one node.
     * content: and tag: need file I/O and always yield false here; the search engine
     * evaluates them in bulk.
     */
    [[nodiscard]] bool evaluateNodeQueryTerm(const QueryTerm& term, const NodeQueryContext& context);
}

#endif //FSINDEX_QUERY_NODEQUERYCONTEXT_H
