#pragma once

#include <cstdint>
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Time constants and utilities for UTC nanosecond timestamps
// ---------------------------------------------------------------------------
namespace time_utils {

constexpr uint64_t NS_PER_SEC = 1'000'000'000ULL;
constexpr uint64_t NS_PER_HOUR = 3600ULL * NS_PER_SEC;
constexpr uint64_t NS_PER_DAY = 24ULL * NS_PER_HOUR;

// Whole days elapsed from `earlier` to `later` (floor). Requires earlier <= later.
inline int whole_days_between(uint64_t earlier, uint64_t later) {
    return static_cast<int>((later - earlier) / NS_PER_DAY);
}

// YYYYMMDD -> midnight UTC in nanoseconds.
inline uint64_t date_to_midnight_ns(int date) {
    int y = date / 10000, m = (date / 100) % 100, d = date % 100;
    if (y < 1970 || m < 1 || m > 12 || d < 1 || d > 31) {
        throw std::invalid_argument("Invalid date: " + std::to_string(date));
    }
    struct tm date_tm = {};
    date_tm.tm_year = y - 1900;
    date_tm.tm_mon = m - 1;
    date_tm.tm_mday = d;
    time_t date_t = timegm(&date_tm);

    // timegm normalizes overflow (Feb 31 -> Mar 2); reject instead.
    struct tm check = {};
    gmtime_r(&date_t, &check);
    if (check.tm_year != y - 1900 || check.tm_mon != m - 1 || check.tm_mday != d) {
        throw std::invalid_argument("Invalid date: " + std::to_string(date));
    }
    return static_cast<uint64_t>(date_t) * NS_PER_SEC;
}

// "YYYY-MM-DD" -> midnight UTC in nanoseconds.
inline uint64_t parse_iso_date_ns(const std::string& s) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') {
        throw std::invalid_argument("Expected YYYY-MM-DD, got '" + s + "'");
    }
    for (size_t i = 0; i < s.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (s[i] < '0' || s[i] > '9') {
            throw std::invalid_argument("Expected YYYY-MM-DD, got '" + s + "'");
        }
    }
    int y = std::stoi(s.substr(0, 4));
    int m = std::stoi(s.substr(5, 2));
    int d = std::stoi(s.substr(8, 2));
    return date_to_midnight_ns(y * 10000 + m * 100 + d);
}

// Nanosecond timestamp -> "YYYY-MM-DD" (UTC).
inline std::string format_date(uint64_t ts) {
    time_t secs = static_cast<time_t>(ts / NS_PER_SEC);
    struct tm out = {};
    gmtime_r(&secs, &out);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d",
                  out.tm_year + 1900, out.tm_mon + 1, out.tm_mday);
    return buf;
}

}  // namespace time_utils
