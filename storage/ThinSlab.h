// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_STORAGE_THINSLAB_H
#define FSINDEX_STORAGE_THINSLAB_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "SlabIndex.h"

namespace FsIndex {
    /**
     * Dense arena addressed by SlabIndex.
     *
     * Removed slots are recycled through a free list, so indices of live entries never move.
     * Lookups of vacant or out-of-range slots return nullptr rather than throwing.
     */
    template<typename T>
    class ThinSlab {
    public:
        ThinSlab() = default;

        ThinSlab(const ThinSlab&) = delete;
        ThinSlab& operator=(const ThinSlab&) = delete;
        ThinSlab(ThinSlab&&) noexcept = default;
        ThinSlab& operator=(ThinSlab&&) noexcept = default;

        SlabIndex insert(T value) {
            if (!m_free.empty()) {
                const std::uint32_t slot = m_free.back();
                m_free.pop_back();
                m_slots[slot].emplace(std::move(value));
                ++m_len;
                return SlabIndex(static_cast<std::size_t>(slot));
            }

            const SlabIndex index(m_slots.size());
            m_slots.emplace_back(std::in_place, std::move(value));
            ++m_len;
            return index;
        }

        [[nodiscard]] const T* get(SlabIndex index) const noexcept {
            const std::size_t slot = index.get();
            if (slot >= m_slots.size() || !m_slots[slot]) return nullptr;
            return &*m_slots[slot];
        }

        [[nodiscard]] T* getMut(SlabIndex index) noexcept {
            const std::size_t slot = index.get();
            if (slot >= m_slots.size() || !m_slots[slot]) return nullptr;
            return &*m_slots[slot];
        }

        // @throws std::out_of_range for vacant slots.
        const T& operator[](SlabIndex index) const {
            const T* value = get(index);
            if (!value) throw std::out_of_range("vacant slab slot");
            return *value;
        }

        std::optional<T> tryRemove(SlabIndex index) {
            const std::size_t slot = index.get();
            if (slot >= m_slots.size() || !m_slots[slot]) return std::nullopt;

            std::optional<T> out(std::move(m_slots[slot]));
            m_slots[slot].reset();
            m_free.push_back(static_cast<std::uint32_t>(slot));
            --m_len;
            return out;
        }

        [[nodiscard]] std::size_t size() const noexcept { return m_len; }
        [[nodiscard]] bool empty() const noexcept { return m_len == 0; }

        // Number of slots, occupied or not. Valid raw indices are [0, slotCount()).
        [[nodiscard]] std::size_t slotCount() const noexcept { return m_slots.size(); }

        void reserve(std::size_t n) { m_slots.reserve(n); }

        // Visits occupied slots in index order.
        template<typename Fn>
        void forEach(Fn&& fn) const {
            for (std::size_t slot = 0; slot < m_slots.size(); ++slot) {
                if (m_slots[slot]) fn(SlabIndex(slot), *m_slots[slot]);
            }
        }

    private:
        std::vector<std::optional<T>> m_slots;
        std::vector<std::uint32_t> m_free;
        std::size_t m_len = 0;
    };
}

#endif //FSINDEX_STORAGE_THINSLAB_H
