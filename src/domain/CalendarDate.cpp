/**
 * @file CalendarDate.cpp
 * @brief Implementation of CalendarDate.
 */

#include "domain/CalendarDate.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <cstdlib>

namespace ledgerwise::domain {

namespace {

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

bool IsLeap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int DaysInMonth(int y, int m) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && IsLeap(y)) return 29;
    return kDays[m - 1];
}

} // namespace

std::optional<CalendarDate> CalendarDate::Parse(const std::string& text) {
    // Accept a trailing time part ("2025-11-14 08:30:00") but read only the date.
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (text[i] < '0' || text[i] > '9') return std::nullopt;
    }

    CalendarDate date;
    date.year = std::atoi(text.substr(0, 4).c_str());
    date.month = std::atoi(text.substr(5, 2).c_str());
    date.day = std::atoi(text.substr(8, 2).c_str());

    if (date.month < 1 || date.month > 12) return std::nullopt;
    if (date.day < 1 || date.day > DaysInMonth(date.year, date.month)) return std::nullopt;
    return date;
}

CalendarDate CalendarDate::Today() {
    auto now = std::chrono::system_clock::now();
    std::tm tm = ToLocalTime(std::chrono::system_clock::to_time_t(now));
    return CalendarDate{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

long CalendarDate::toDays() const {
    // Days-from-civil (H. Hinnant).
    long y = year - (month <= 2 ? 1 : 0);
    long era = (y >= 0 ? y : y - 399) / 400;
    long yoe = y - era * 400;
    long mp = (month + 9) % 12;
    long doy = (153 * mp + 2) / 5 + day - 1;
    long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

std::string CalendarDate::toString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

long DaysBetween(const CalendarDate& a, const CalendarDate& b) {
    long diff = a.toDays() - b.toDays();
    return diff < 0 ? -diff : diff;
}

} // namespace ledgerwise::domain
