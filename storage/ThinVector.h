// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_STORAGE_THINVECTOR_H
#define FSINDEX_STORAGE_THINVECTOR_H

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <new>
#include <stdexcept>
#include <type_traits>

namespace FsIndex {
    /**
     * A vector that is a single pointer wide.
     *
     * Length and capacity live in a small header in front of the element storage, so an
     * empty ThinVector costs 8 bytes and no allocation. Used for per-node child lists and
     * name-index buckets, where millions of mostly tiny lists exist at once.
     *
     * Only trivially copyable element types are supported (elements are moved with memmove).
     */
    template<typename T>
    class ThinVector {
        static_assert(std::is_trivially_copyable_v<T>, "ThinVector requires trivially copyable elements");

        struct Header {
            std::uint32_t len;
            std::uint32_t cap;
        };

        static constexpr std::size_t kDataOffset =
            (sizeof(Header) + alignof(T) - 1) / alignof(T) * alignof(T);

    public:
        using value_type = T;
        using iterator = T*;
        using const_iterator = const T*;

        ThinVector() = default;

        ThinVector(const ThinVector& other) {
            if (other.empty()) return;
            reserve(other.size());
            std::memcpy(data(), other.data(), other.size() * sizeof(T));
            header()->len = other.header()->len;
        }

        ThinVector(ThinVector&& other) noexcept : m_ptr(other.m_ptr) { other.m_ptr = nullptr; }

        ThinVector& operator=(const ThinVector& other) {
            if (this != &other) {
                ThinVector copy(other);
                swap(copy);
            }
            return *this;
        }

        ThinVector& operator=(ThinVector&& other) noexcept {
            if (this != &other) {
                std::free(m_ptr);
                m_ptr = other.m_ptr;
                other.m_ptr = nullptr;
            }
            return *this;
        }

        ~ThinVector() { std::free(m_ptr); }

        void swap(ThinVector& other) noexcept {
            void* tmp = m_ptr;
            m_ptr = other.m_ptr;
            other.m_ptr = tmp;
        }

        [[nodiscard]] std::size_t size() const noexcept { return m_ptr ? header()->len : 0; }
        [[nodiscard]] std::size_t capacity() const noexcept { return m_ptr ? header()->cap : 0; }
        [[nodiscard]] bool empty() const noexcept { return size() == 0; }

        [[nodiscard]] T* data() noexcept {
            return m_ptr ? reinterpret_cast<T*>(static_cast<char*>(m_ptr) + kDataOffset) : nullptr;
        }
        [[nodiscard]] const T* data() const noexcept {
            return m_ptr ? reinterpret_cast<const T*>(static_cast<const char*>(m_ptr) + kDataOffset) : nullptr;
        }

        iterator begin() noexcept { return data(); }
        iterator end() noexcept { return data() + size(); }
        const_iterator begin() const noexcept { return data(); }
        const_iterator end() const noexcept { return data() + size(); }

        T& operator[](std::size_t i) noexcept { return data()[i]; }
        const T& operator[](std::size_t i) const noexcept { return data()[i]; }

        void reserve(std::size_t wanted) {
            if (wanted <= capacity()) return;
            if (wanted > UINT32_MAX) throw std::length_error("ThinVector capacity overflow");

            const std::size_t bytes = kDataOffset + wanted * sizeof(T);
            const std::uint32_t oldLen = static_cast<std::uint32_t>(size());
            void* grown = std::realloc(m_ptr, bytes);
            if (!grown) throw std::bad_alloc();
            m_ptr = grown;
            header()->len = oldLen;
            header()->cap = static_cast<std::uint32_t>(wanted);
        }

        void push_back(const T& value) {
            growForOneMore();
            data()[header()->len] = value;
            ++header()->len;
        }

        // Inserts before position pos (0 <= pos <= size()).
        void insert(std::size_t pos, const T& value) {
            if (pos > size()) throw std::out_of_range("ThinVector::insert position out of range");
            growForOneMore();
            T* d = data();
            const std::size_t n = header()->len;
            if (pos < n) std::memmove(d + pos + 1, d + pos, (n - pos) * sizeof(T));
            d[pos] = value;
            ++header()->len;
        }

        void erase(std::size_t pos) {
            const std::size_t n = size();
            if (pos >= n) throw std::out_of_range("ThinVector::erase position out of range");
            T* d = data();
            if (pos + 1 < n) std::memmove(d + pos, d + pos + 1, (n - pos - 1) * sizeof(T));
            --header()->len;
        }

        void clear() noexcept {
            if (m_ptr) header()->len = 0;
        }

        bool operator==(const ThinVector& other) const {
            if (size() != other.size()) return false;
            for (std::size_t i = 0; i < size(); ++i) {
                if (!((*this)[i] == other[i])) return false;
            }
            return true;
        }

    private:
        Header* header() noexcept { return static_cast<Header*>(m_ptr); }
        const Header* header() const noexcept { return static_cast<const Header*>(m_ptr); }

        void growForOneMore() {
            const std::size_t cap = capacity();
            if (size() < cap) return;
            // Lists are usually tiny; start at 1 and double.
            reserve(cap == 0 ? 1 : cap * 2);
        }

        void* m_ptr = nullptr;
    };
}

#endif //FSINDEX_STORAGE_THINVECTOR_H
