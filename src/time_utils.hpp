#pragma once

#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <utility>

// Malformed date or end < start.
struct InvalidRangeError : std::invalid_argument {
    explicit InvalidRangeError(const std::string& msg) : std::invalid_argument(msg) {}
};

// ---------------------------------------------------------------------------
// Calendar dates as YYYYMMDD integers, parsed from ISO "YYYY-MM-DD" strings
// ---------------------------------------------------------------------------
namespace time_utils {

inline bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

inline int days_in_month(int year, int month) {
    static const int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) return 29;
    return DAYS[month - 1];
}

inline int date_year(int date)  { return date / 10000; }
inline int date_month(int date) { return (date / 100) % 100; }
inline int date_day(int date)   { return date % 100; }

inline bool is_valid_date(int date) {
    int y = date_year(date);
    int m = date_month(date);
    int d = date_day(date);
    if (y < 1900 || y > 2999) return false;
    if (m < 1 || m > 12) return false;
    return d >= 1 && d <= days_in_month(y, m);
}

// Parse "YYYY-MM-DD" into YYYYMMDD. Throws InvalidRangeError on malformed input.
inline int parse_iso_date(const std::string& iso) {
    if (iso.size() != 10 || iso[4] != '-' || iso[7] != '-') {
        throw InvalidRangeError("malformed date '" + iso + "' (expected YYYY-MM-DD)");
    }
    int value = 0;
    for (size_t i = 0; i < iso.size(); ++i) {
        if (i == 4 || i == 7) continue;
        char c = iso[i];
        if (c < '0' || c > '9') {
            throw InvalidRangeError("malformed date '" + iso + "' (non-digit)");
        }
        value = value * 10 + (c - '0');
    }
    if (!is_valid_date(value)) {
        throw InvalidRangeError("invalid calendar date '" + iso + "'");
    }
    return value;
}

inline std::string format_iso_date(int date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d",
                  date_year(date), date_month(date), date_day(date));
    return std::string(buf);
}

// Days since 1970-01-01 (proleptic Gregorian).
inline int64_t days_from_civil(int date) {
    int64_t y = date_year(date);
    int64_t m = date_month(date);
    int64_t d = date_day(date);
    y -= m <= 2 ? 1 : 0;
    int64_t era = (y >= 0 ? y : y - 399) / 400;
    int64_t yoe = y - era * 400;
    int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

inline int64_t days_between(int start_date, int end_date) {
    return days_from_civil(end_date) - days_from_civil(start_date);
}

// Parse both ends of a range and reject end < start.
inline std::pair<int, int> parse_date_range(const std::string& start, const std::string& end) {
    int s = parse_iso_date(start);
    int e = parse_iso_date(end);
    if (e < s) {
        throw InvalidRangeError("end date " + end + " precedes start date " + start);
    }
    return {s, e};
}

}  // namespace time_utils
