// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_QUERY_CONTENTSEARCH_H
#define FSINDEX_QUERY_CONTENTSEARCH_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "../Cancellation.h"

namespace FsIndex {
    // Bytes read from disk per chunk.
    inline constexpr std::size_t kContentBufferBytes = 64 * 1024;

    // Rolling-hash substring finder over raw bytes.
    class RabinKarpFinder {
    public:
        explicit RabinKarpFinder(std::string_view needle);

        // Offset of the first occurrence in haystack, if any.
        [[nodiscard]] std::optional<std::size_t> find(std::string_view haystack) const;

    private:
        std::string m_needle;
        std::uint32_t m_hash = 0;
        std::uint32_t m_highPower = 1;  // kBase^(len-1), the weight of the byte leaving the window
    };

    /**
     * Streams a file looking for a byte sequence.
     *
     * Matches spanning two chunks are found by carrying the last needle.size()-1 bytes of
     * each chunk into the next one. The token is checked once per chunk.
     *
     * @param needle Bytes to find. Must already be lowercase when caseInsensitive is set.
     * @param caseInsensitive Compare ASCII letters without regard to case.
     * @return true/false, or std::nullopt if the token was cancelled. Unreadable files and an
     *         empty needle give false.
     */
    [[nodiscard]] std::optional<bool> fileContentMatches(const std::string& path, std::string_view needle,
                                                         bool caseInsensitive, const CancellationToken& token);
}

#endif //FSINDEX_QUERY_CONTENTSEARCH_H
