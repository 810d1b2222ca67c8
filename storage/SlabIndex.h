// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_STORAGE_SLABINDEX_H
#define FSINDEX_STORAGE_SLABINDEX_H

#include <algorithm>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include "ThinVector.h"

namespace FsIndex {
    /**
     * A u32 slot id into a ThinSlab. UINT32_MAX is reserved as the "no index" sentinel
     * and can never be a valid slot.
     */
    class SlabIndex {
    public:
        static constexpr std::uint32_t INVALID = std::numeric_limits<std::uint32_t>::max();

        constexpr SlabIndex() = default;

        /**
         * @param value Raw slot number.
         * @throws std::length_error if value would collide with the sentinel.
         */
        explicit SlabIndex(std::size_t value);

        [[nodiscard]] constexpr std::uint32_t get() const noexcept { return m_value; }

        constexpr auto operator<=>(const SlabIndex&) const = default;

    private:
        std::uint32_t m_value = 0;
    };

    /**
     * Optional slab index packed into 4 bytes, using SlabIndex::INVALID for "none".
     */
    class OptionSlabIndex {
    public:
        constexpr OptionSlabIndex() = default;
        constexpr explicit OptionSlabIndex(SlabIndex index) : m_raw(index.get()) {}

        [[nodiscard]] static OptionSlabIndex none() { return {}; }
        [[nodiscard]] static OptionSlabIndex fromOption(std::optional<SlabIndex> index) {
            return index ? OptionSlabIndex(*index) : OptionSlabIndex();
        }

        [[nodiscard]] constexpr bool isSome() const noexcept { return m_raw != SlabIndex::INVALID; }
        [[nodiscard]] constexpr bool isNone() const noexcept { return m_raw == SlabIndex::INVALID; }

        [[nodiscard]] std::optional<SlabIndex> toOption() const {
            if (isNone()) return std::nullopt;
            return SlabIndex(static_cast<std::size_t>(m_raw));
        }

        constexpr bool operator==(const OptionSlabIndex&) const = default;

    private:
        std::uint32_t m_raw = SlabIndex::INVALID;
    };

    /**
     * Orders paths component by component, with '/' below every other byte. This is the
     * order a preorder walk over name-sorted children produces ("/r/a/x" < "/r/a-c/x").
     */
    [[nodiscard]] inline std::strong_ordering comparePathsByComponent(std::string_view a, std::string_view b) noexcept {
        const std::size_t n = std::min(a.size(), b.size());
        for (std::size_t i = 0; i < n; ++i) {
            if (a[i] == b[i]) continue;
            if (a[i] == '/') return std::strong_ordering::less;
            if (b[i] == '/') return std::strong_ordering::greater;
            return static_cast<unsigned char>(a[i]) <=> static_cast<unsigned char>(b[i]);
        }
        return a.size() <=> b.size();
    }

    /**
     * Name-index bucket: slab indices of every node sharing one name, kept sorted by the
     * node's full path. Empty buckets cost a single null pointer.
     */
    class SortedSlabIndices {
    public:
        SortedSlabIndices() = default;

        [[nodiscard]] static SortedSlabIndices withSingle(SlabIndex index) {
            SortedSlabIndices out;
            out.m_indices.push_back(index);
            return out;
        }

        /**
         * Checked insertion: binary search for the slot by full path, compared with
         * comparePathsByComponent().
         *
         * @param index The node to insert.
         * @param pathOf Resolves a slab index to its full path; std::nullopt if unresolvable.
         *
         * Nothing is inserted if the new node's own path cannot be resolved, or if an entry
         * with the same path is already present.
         */
        template<typename PathFn>
        void insertSorted(SlabIndex index, PathFn&& pathOf) {
            const std::optional<std::string> target = pathOf(index);
            if (!target) return;

            std::size_t lo = 0;
            std::size_t hi = m_indices.size();
            while (lo < hi) {
                const std::size_t mid = lo + (hi - lo) / 2;
                const std::optional<std::string> midPath = pathOf(m_indices[mid]);
                // Unresolvable entries sort first; they are stale and will be removed.
                const auto order = midPath ? comparePathsByComponent(*midPath, *target)
                                           : std::strong_ordering::less;
                if (order < 0) {
                    lo = mid + 1;
                } else if (order == 0) {
                    return;
                } else {
                    hi = mid;
                }
            }
            m_indices.insert(lo, index);
        }

        /**
         * Unchecked O(1) append. The caller guarantees ascending full-path order, which only
         * bulk construction (preorder over name-sorted children) can.
         */
        void pushOrdered(SlabIndex index) { m_indices.push_back(index); }

        // @return true if the index was present.
        bool remove(SlabIndex index) {
            for (std::size_t i = 0; i < m_indices.size(); ++i) {
                if (m_indices[i] == index) {
                    m_indices.erase(i);
                    return true;
                }
            }
            return false;
        }

        [[nodiscard]] bool contains(SlabIndex index) const {
            return std::find(m_indices.begin(), m_indices.end(), index) != m_indices.end();
        }

        [[nodiscard]] std::size_t size() const noexcept { return m_indices.size(); }
        [[nodiscard]] bool empty() const noexcept { return m_indices.empty(); }

        [[nodiscard]] const SlabIndex* begin() const noexcept { return m_indices.begin(); }
        [[nodiscard]] const SlabIndex* end() const noexcept { return m_indices.end(); }
        const SlabIndex& operator[](std::size_t i) const noexcept { return m_indices[i]; }

    private:
        ThinVector<SlabIndex> m_indices;
    };
}

template<>
struct std::hash<FsIndex::SlabIndex> {
    std::size_t operator()(const FsIndex::SlabIndex& index) const noexcept {
        return std::hash<std::uint32_t>{}(index.get());
    }
};

#endif //FSINDEX_STORAGE_SLABINDEX_H
