/**
 * @file CalendarDate.hpp
 * @brief Civil calendar date (YYYY-MM-DD) used by transactions and obligations.
 */

#pragma once
#include <optional>
#include <string>

namespace ledgerwise::domain {

/**
 * @struct CalendarDate
 * @brief A proleptic Gregorian date without time zone.
 */
struct CalendarDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    /** @brief Parses "YYYY-MM-DD". Returns nullopt on malformed or out-of-range input. */
    static std::optional<CalendarDate> Parse(const std::string& text);

    /** @brief The local date of the running process. */
    static CalendarDate Today();

    /** @brief Days since 1970-01-01 (negative before). */
    long toDays() const;

    std::string toString() const;

    bool operator==(const CalendarDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator<(const CalendarDate& other) const { return toDays() < other.toDays(); }
};

/** @brief Absolute number of days between two dates. */
long DaysBetween(const CalendarDate& a, const CalendarDate& b);

} // namespace ledgerwise::domain
