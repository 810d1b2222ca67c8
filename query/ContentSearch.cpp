// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "ContentSearch.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <vector>

namespace FsIndex {
    static constexpr std::uint32_t kBase = 2;

    RabinKarpFinder::RabinKarpFinder(std::string_view needle) : m_needle(needle) {
        for (std::size_t i = 0; i < m_needle.size(); ++i) {
            m_hash = m_hash * kBase + static_cast<unsigned char>(m_needle[i]);
            if (i > 0) m_highPower *= kBase;
        }
    }

    std::optional<std::size_t> RabinKarpFinder::find(std::string_view haystack) const {
        const std::size_t n = m_needle.size();
        if (n == 0) return std::size_t{0};
        if (haystack.size() < n) return std::nullopt;

        std::uint32_t hash = 0;
        for (std::size_t i = 0; i < n; ++i) {
            hash = hash * kBase + static_cast<unsigned char>(haystack[i]);
        }

        for (std::size_t start = 0;; ++start) {
            if (hash == m_hash && std::memcmp(haystack.data() + start, m_needle.data(), n) == 0) return start;
            if (start + n >= haystack.size()) return std::nullopt;

            hash -= m_highPower * static_cast<unsigned char>(haystack[start]);
            hash = hash * kBase + static_cast<unsigned char>(haystack[start + n]);
        }
    }

    namespace {
        // Closes the descriptor on every return path.
        class FdGuard {
        public:
            explicit FdGuard(int fd) : m_fd(fd) {}
            ~FdGuard() { if (m_fd >= 0) ::close(m_fd); }
            FdGuard(const FdGuard&) = delete;
            FdGuard& operator=(const FdGuard&) = delete;
            [[nodiscard]] int get() const noexcept { return m_fd; }

        private:
            int m_fd;
        };

        // read(2) retried on EINTR. -1 on error, 0 at end of file.
        ssize_t readSome(int fd, char* buffer, std::size_t size) {
            while (true) {
                const ssize_t n = ::read(fd, buffer, size);
                if (n < 0 && errno == EINTR) continue;
                return n;
            }
        }

        char toLowerAscii(char c) {
            return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
        }

        std::optional<bool> searchSingleByte(int fd, char needle, bool caseInsensitive, const CancellationToken& token) {
            std::vector<char> buffer(kContentBufferBytes);
            const char lower = toLowerAscii(needle);
            const char upper = (lower >= 'a' && lower <= 'z') ? static_cast<char>(lower - 'a' + 'A') : lower;

            while (true) {
                if (token.isCancelled()) return std::nullopt;

                const ssize_t n = readSome(fd, buffer.data(), buffer.size());
                if (n < 0) return false;
                if (n == 0) break;

                const char* begin = buffer.data();
                const std::size_t count = static_cast<std::size_t>(n);
                if (caseInsensitive) {
                    if (std::memchr(begin, lower, count) || std::memchr(begin, upper, count)) return true;
                } else if (std::memchr(begin, needle, count)) {
                    return true;
                }
            }
            return false;
        }

        std::optional<bool> searchMultiByte(int fd, std::string_view needle, bool caseInsensitive,
                                            const CancellationToken& token) {
            const std::size_t overlap = needle.size() - 1;
            const RabinKarpFinder finder(needle);

            // Carried tail of the previous chunk followed by the new read.
            std::vector<char> buffer(kContentBufferBytes + overlap);
            std::size_t carry = 0;

            while (true) {
                if (token.isCancelled()) return std::nullopt;

                const ssize_t n = readSome(fd, buffer.data() + carry, kContentBufferBytes);
                if (n < 0) return false;
                if (n == 0) break;

                const std::size_t chunkLen = carry + static_cast<std::size_t>(n);
                // Carried bytes were lowercased when they were first read.
                if (caseInsensitive) {
                    for (std::size_t i = carry; i < chunkLen; ++i) buffer[i] = toLowerAscii(buffer[i]);
                }

                if (finder.find(std::string_view(buffer.data(), chunkLen))) return true;

                const std::size_t keep = std::min(overlap, chunkLen);
                if (keep > 0) std::memmove(buffer.data(), buffer.data() + chunkLen - keep, keep);
                carry = keep;
            }
            return false;
        }
    }

    std::optional<bool> fileContentMatches(const std::string& path, std::string_view needle,
                                           bool caseInsensitive, const CancellationToken& token) {
        if (token.isCancelled()) return std::nullopt;

        const FdGuard fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
        if (fd.get() < 0) return false;
        if (needle.empty()) return false;

        if (needle.size() == 1) return searchSingleByte(fd.get(), needle.front(), caseInsensitive, token);
        return searchMultiByte(fd.get(), needle, caseInsensitive, token);
    }
}
