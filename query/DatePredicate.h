// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_QUERY_DATEPREDICATE_H
#define FSINDEX_QUERY_DATEPREDICATE_H

#include <QDate>

#include <cstdint>
#include <optional>
#include <string_view>

namespace FsIndex {
    /**
     * Parsed argument of a dm:/dc: filter, resolved to Unix-second bounds in local time.
     *
     * Values are keywords (today, yesterday, thisweek, lastweek, thismonth, lastmonth,
     * thisyear, lastyear, pastweek, pastmonth, pastyear) or absolute dates such as
     * 2024-01-31, 31/01/2024 or 31.01.2024. A date covers its whole day, 00:00:00 to 23:59:59.
     * Values combine with < <= > >= = != or form a range "a..b" with either side optional.
     */
    class DatePredicate {
    public:
        // Throws QueryParseError. Keywords are resolved against today's local date.
        [[nodiscard]] static DatePredicate parse(std::string_view raw);
        [[nodiscard]] static DatePredicate parse(std::string_view raw, const QDate& today);

        [[nodiscard]] bool matches(std::int64_t timestamp) const noexcept;

        bool operator==(const DatePredicate&) const = default;

    private:
        static DatePredicate range(std::optional<std::int64_t> start, std::optional<std::int64_t> end);

        bool m_notEqual = false;
        std::optional<std::int64_t> m_start;
        std::optional<std::int64_t> m_end;
    };
}

#endif //FSINDEX_QUERY_DATEPREDICATE_H
