// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "DatePredicate.h"
#include "QueryError.h"
#include "TextMatch.h"

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QTime>

#include <limits>
#include <string>
#include <utility>

namespace FsIndex {
    namespace {
        // Inclusive [start, end] in Unix seconds.
        struct DateValue {
            std::int64_t start = 0;
            std::int64_t end = 0;
        };

        enum class DateOp {
            Lt,
            Lte,
            Gt,
            Gte,
            Eq,
            Ne
        };

        std::string_view trim(std::string_view s) {
            while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
            while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
            return s;
        }

        DateValue dayBounds(const QDate& date) {
            const QDateTime start(date, QTime(0, 0, 0));
            const QDateTime end(date, QTime(23, 59, 59));
            return DateValue{
                start.isValid() ? start.toSecsSinceEpoch() : 0,
                end.isValid() ? end.toSecsSinceEpoch() : std::numeric_limits<std::int64_t>::max()
            };
        }

        DateValue rangeFromDates(const QDate& start, const QDate& end) {
            return DateValue{dayBounds(start).start, dayBounds(end).end};
        }

        DateValue monthRange(int year, int month) {
            const QDate first(year, month, 1);
            return rangeFromDates(first, first.addMonths(1).addDays(-1));
        }

        DateValue yearRange(int year) {
            return rangeFromDates(QDate(year, 1, 1), QDate(year, 12, 31));
        }

        // Last `days` days, today included.
        DateValue trailingRange(const QDate& today, int days) {
            return rangeFromDates(today.addDays(-(days - 1)), today);
        }

        std::optional<DateValue> keywordRange(std::string_view raw, const QDate& today) {
            const std::string keyword = asciiLower(raw);
            if (keyword == "today") return dayBounds(today);
            if (keyword == "yesterday") return dayBounds(today.addDays(-1));

            // Weeks start on Monday.
            const QDate monday = today.addDays(-(today.dayOfWeek() - 1));
            if (keyword == "thisweek") return rangeFromDates(monday, monday.addDays(6));
            if (keyword == "lastweek") return rangeFromDates(monday.addDays(-7), monday.addDays(-1));

            if (keyword == "thismonth") return monthRange(today.year(), today.month());
            if (keyword == "lastmonth") {
                const QDate previous = today.addMonths(-1);
                return monthRange(previous.year(), previous.month());
            }
            if (keyword == "thisyear") return yearRange(today.year());
            if (keyword == "lastyear") return yearRange(today.year() - 1);

            if (keyword == "pastweek") return trailingRange(today, 7);
            if (keyword == "pastmonth") return trailingRange(today, 30);
            if (keyword == "pastyear") return trailingRange(today, 365);
            return std::nullopt;
        }

        std::optional<QDate> parseAbsoluteDate(std::string_view raw) {
            const std::size_t sepAt = raw.find_first_of("-/.");
            if (sepAt == std::string_view::npos) return std::nullopt;
            const char sep = raw[sepAt];

            bool yearFirst = raw.size() >= 4;
            for (std::size_t i = 0; yearFirst && i < 4; ++i) {
                if (raw[i] < '0' || raw[i] > '9') yearFirst = false;
            }

            const QString s(sep);
            QStringList formats;
            if (yearFirst) {
                formats << QStringLiteral("yyyy%1M%1d").arg(s);
            } else if (sep == '/') {
                formats << QStringLiteral("M%1d%1yyyy").arg(s)
                        << QStringLiteral("d%1M%1yyyy").arg(s)
                        << QStringLiteral("yyyy%1M%1d").arg(s);
            } else {
                formats << QStringLiteral("d%1M%1yyyy").arg(s)
                        << QStringLiteral("M%1d%1yyyy").arg(s)
                        << QStringLiteral("yyyy%1M%1d").arg(s);
            }

            const QString text = QString::fromUtf8(raw.data(), static_cast<qsizetype>(raw.size()));
            for (const QString& format : formats) {
                const QDate date = QDate::fromString(text, format);
                if (date.isValid()) return date;
            }
            return std::nullopt;
        }

        DateValue parseDateValue(std::string_view raw, const QDate& today) {
            const std::string_view trimmed = trim(raw);
            if (auto value = keywordRange(trimmed, today)) return *value;
            if (auto date = parseAbsoluteDate(trimmed)) return dayBounds(*date);
            throw QueryParseError("unrecognized date value: \"" + std::string(raw) + "\"");
        }

        std::optional<std::pair<DateOp, std::string_view>> parseComparison(std::string_view raw) {
            static constexpr std::pair<std::string_view, DateOp> kOperators[] = {
                {"<=", DateOp::Lte},
                {">=", DateOp::Gte},
                {"!=", DateOp::Ne},
                {"<", DateOp::Lt},
                {">", DateOp::Gt},
                {"=", DateOp::Eq},
            };

            for (const auto& [token, op] : kOperators) {
                if (!raw.starts_with(token)) continue;
                const std::string_view value = trim(raw.substr(token.size()));
                if (value.empty()) return std::nullopt;
                return std::make_pair(op, value);
            }
            return std::nullopt;
        }
    }

    DatePredicate DatePredicate::parse(std::string_view raw) {
        return parse(raw, QDate::currentDate());
    }

    DatePredicate DatePredicate::parse(std::string_view raw, const QDate& today) {
        const std::string_view trimmed = trim(raw);
        if (trimmed.empty()) throw QueryParseError("date filter requires a value");

        if (auto comparison = parseComparison(trimmed)) {
            const DateValue value = parseDateValue(comparison->second, today);
            switch (comparison->first) {
                case DateOp::Lt: return range(std::nullopt, value.start - 1);
                case DateOp::Lte: return range(std::nullopt, value.end);
                case DateOp::Gt:
                    if (value.end == std::numeric_limits<std::int64_t>::max()) return range(value.end, value.end - 1);
                    return range(value.end + 1, std::nullopt);
                case DateOp::Gte: return range(value.start, std::nullopt);
                case DateOp::Eq: return range(value.start, value.end);
                case DateOp::Ne: {
                    DatePredicate predicate = range(value.start, value.end);
                    predicate.m_notEqual = true;
                    return predicate;
                }
            }
        }

        const std::size_t split = trimmed.find("..");
        if (split != std::string_view::npos) {
            const std::string_view startRaw = trim(trimmed.substr(0, split));
            const std::string_view endRaw = trim(trimmed.substr(split + 2));
            if (!startRaw.empty() || !endRaw.empty()) {
                std::optional<std::int64_t> start;
                std::optional<std::int64_t> end;
                if (!startRaw.empty()) start = parseDateValue(startRaw, today).start;
                if (!endRaw.empty()) end = parseDateValue(endRaw, today).end;
                if (start && end && *start > *end)
                    throw QueryParseError("date range start must be before or equal to end");
                return range(start, end);
            }
        }

        const DateValue value = parseDateValue(trimmed, today);
        return range(value.start, value.end);
    }

    DatePredicate DatePredicate::range(std::optional<std::int64_t> start, std::optional<std::int64_t> end) {
        DatePredicate predicate;
        predicate.m_start = start;
        predicate.m_end = end;
        return predicate;
    }

    bool DatePredicate::matches(std::int64_t timestamp) const noexcept {
        if (m_notEqual) return timestamp < *m_start || timestamp > *m_end;
        if (m_start && timestamp < *m_start) return false;
        if (m_end && timestamp > *m_end) return false;
        return true;
    }
}
