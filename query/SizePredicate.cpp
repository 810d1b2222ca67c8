// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "SizePredicate.h"
#include "QueryError.h"
#include "TextMatch.h"

#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>
#include <utility>

namespace FsIndex {
    namespace {
        constexpr std::uint64_t KB = 1024;
        constexpr std::uint64_t MB = 1024 * KB;

        struct SizeBounds {
            std::optional<std::uint64_t> min;
            std::optional<std::uint64_t> max;
        };

        std::string_view trim(std::string_view s) {
            while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
            while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
            return s;
        }

        std::optional<std::pair<SizePredicate::Op, std::string_view>> parseComparison(std::string_view raw) {
            static constexpr std::pair<std::string_view, SizePredicate::Op> kOperators[] = {
                {"<=", SizePredicate::Op::Lte},
                {">=", SizePredicate::Op::Gte},
                {"!=", SizePredicate::Op::Ne},
                {"<", SizePredicate::Op::Lt},
                {">", SizePredicate::Op::Gt},
                {"=", SizePredicate::Op::Eq},
            };

            for (const auto& [token, op] : kOperators) {
                if (!raw.starts_with(token)) continue;
                const std::string_view value = trim(raw.substr(token.size()));
                if (value.empty()) return std::nullopt;
                return std::make_pair(op, value);
            }
            return std::nullopt;
        }

        std::optional<std::pair<std::string_view, std::string_view>> parseRange(std::string_view raw) {
            const std::size_t split = raw.find("..");
            if (split == std::string_view::npos) return std::nullopt;

            const std::string_view start = trim(raw.substr(0, split));
            const std::string_view end = trim(raw.substr(split + 2));
            if (start.empty() && end.empty()) return std::nullopt;
            return std::make_pair(start, end);
        }

        std::optional<SizeBounds> sizeKeyword(std::string_view raw) {
            const std::string keyword = asciiLower(trim(raw));
            if (keyword == "empty") return SizeBounds{0, 0};
            if (keyword == "tiny") return SizeBounds{1, 10 * KB};
            if (keyword == "small") return SizeBounds{10 * KB + 1, 100 * KB};
            if (keyword == "medium") return SizeBounds{100 * KB + 1, MB};
            if (keyword == "large") return SizeBounds{MB + 1, 16 * MB};
            if (keyword == "huge") return SizeBounds{16 * MB + 1, 128 * MB};
            if (keyword == "gigantic" || keyword == "giant") return SizeBounds{128 * MB + 1, std::nullopt};
            return std::nullopt;
        }

        std::uint64_t unitMultiplier(std::string_view unit) {
            const std::string u = asciiLower(trim(unit));
            if (u.empty() || u == "b" || u == "byte" || u == "bytes") return 1;
            if (u == "k" || u == "kb" || u == "kib" || u == "kilobyte" || u == "kilobytes") return KB;
            if (u == "m" || u == "mb" || u == "mib" || u == "megabyte" || u == "megabytes") return MB;
            if (u == "g" || u == "gb" || u == "gib" || u == "gigabyte" || u == "gigabytes") return MB * KB;
            if (u == "t" || u == "tb" || u == "tib" || u == "terabyte" || u == "terabytes") return MB * MB;
            if (u == "p" || u == "pb" || u == "pib" || u == "petabyte" || u == "petabytes") return MB * MB * KB;
            throw QueryParseError("unknown size unit: " + std::string(unit));
        }

        std::uint64_t parseLiteral(std::string_view raw) {
            const std::string_view trimmed = trim(raw);
            if (trimmed.empty()) throw QueryParseError("size: expected a number");

            std::size_t split = 0;
            while (split < trimmed.size() && ((trimmed[split] >= '0' && trimmed[split] <= '9') || trimmed[split] == '.'))
                ++split;

            const std::string number(trimmed.substr(0, split));
            if (number.empty())
                throw QueryParseError("size: expected a numeric value in \"" + std::string(raw) + "\"");

            char* end = nullptr;
            const double value = std::strtod(number.c_str(), &end);
            if (end != number.c_str() + number.size())
                throw QueryParseError("size: failed to parse number in \"" + std::string(raw) + "\"");

            const std::uint64_t multiplier = unitMultiplier(trimmed.substr(split));
            const double bytes = std::round(value * static_cast<double>(multiplier));
            if (!std::isfinite(bytes) || bytes < 0.0)
                throw QueryParseError("size: value \"" + std::string(raw) + "\" is out of range");

            if (bytes >= static_cast<double>(std::numeric_limits<std::uint64_t>::max()))
                return std::numeric_limits<std::uint64_t>::max();
            return static_cast<std::uint64_t>(bytes);
        }
    }

    SizePredicate SizePredicate::parse(std::string_view raw) {
        const std::string_view trimmed = trim(raw);
        if (trimmed.empty()) throw QueryParseError("size: requires a value");

        SizePredicate predicate;

        if (auto comparison = parseComparison(trimmed)) {
            if (sizeKeyword(comparison->second))
                throw QueryParseError("size keywords cannot be used with comparison operators");
            predicate.m_kind = Kind::Comparison;
            predicate.m_op = comparison->first;
            predicate.m_value = parseLiteral(comparison->second);
            return predicate;
        }

        if (auto range = parseRange(trimmed)) {
            if (!range->first.empty()) predicate.m_min = parseLiteral(range->first);
            if (!range->second.empty()) predicate.m_max = parseLiteral(range->second);
            if (predicate.m_min && predicate.m_max && *predicate.m_min > *predicate.m_max)
                throw QueryParseError("size range start must be less than or equal to end");
            predicate.m_kind = Kind::Range;
            return predicate;
        }

        if (auto bounds = sizeKeyword(trimmed)) {
            predicate.m_kind = Kind::Range;
            predicate.m_min = bounds->min;
            predicate.m_max = bounds->max;
            return predicate;
        }

        predicate.m_kind = Kind::Comparison;
        predicate.m_op = Op::Eq;
        predicate.m_value = parseLiteral(trimmed);
        return predicate;
    }

    bool SizePredicate::matches(std::uint64_t size) const noexcept {
        if (m_kind == Kind::Range) {
            if (m_min && size < *m_min) return false;
            if (m_max && size > *m_max) return false;
            return true;
        }

        switch (m_op) {
            case Op::Lt: return size < m_value;
            case Op::Lte: return size <= m_value;
            case Op::Gt: return size > m_value;
            case Op::Gte: return size >= m_value;
            case Op::Eq: return size == m_value;
            case Op::Ne: return size != m_value;
        }
        return false;
    }
}
