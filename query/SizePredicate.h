// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_QUERY_SIZEPREDICATE_H
#define FSINDEX_QUERY_SIZEPREDICATE_H

#include <cstdint>
#include <optional>
#include <string_view>

namespace FsIndex {
    /**
     * Parsed argument of a size: filter.
     *
     * Accepted forms:
     *  - comparison: "<10k", "<=1mb", ">2g", ">=0", "=512", "!=0"
     *  - range: "10kb..1mb", "..4k", "1g.." (bounds inclusive)
     *  - bare literal: "4096" (same as "=4096")
     *  - keyword: empty, tiny, small, medium, large, huge, gigantic/giant
     *
     * Units b/k/m/g/t/p (and kb, kib, kilobyte, ...) are powers of 1024, case-insensitive.
     * Fractional literals are rounded to the nearest byte.
     */
    class SizePredicate {
    public:
        enum class Op {
            Lt,
            Lte,
            Gt,
            Gte,
            Eq,
            Ne
        };

        // Throws QueryParseError.
        [[nodiscard]] static SizePredicate parse(std::string_view raw);

        [[nodiscard]] bool matches(std::uint64_t size) const noexcept;

        bool operator==(const SizePredicate&) const = default;

    private:
        enum class Kind {
            Comparison,
            Range
        };

        Kind m_kind = Kind::Range;
        Op m_op = Op::Eq;
        std::uint64_t m_value = 0;
        std::optional<std::uint64_t> m_min;
        std::optional<std::uint64_t> m_max;
    };
}

#endif //FSINDEX_QUERY_SIZEPREDICATE_H
