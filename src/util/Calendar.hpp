#pragma once

#include <cstdint>
#include <string>

namespace gitpulse::calendar {

constexpr int64_t SECONDS_PER_DAY = 86400;

/// Broken-down UTC time
struct CivilTime {
    int year{1970};
    int month{1};   // 1..12
    int day{1};     // 1..31
    int hour{0};
    int minute{0};
    int second{0};
    int weekday{4}; // 0 = Sunday
};

CivilTime toCivil(int64_t unixSeconds);

/// 0 = Sunday .. 6 = Saturday, in UTC
int dayOfWeek(int64_t unixSeconds);

/// 0..23, in UTC
int hourOfDay(int64_t unixSeconds);

/// Unix timestamp of the Sunday 00:00 UTC that starts the week containing @p unixSeconds
int64_t weekStart(int64_t unixSeconds);

/// Whole days elapsed from @p fromSeconds to @p toSeconds (floored)
int64_t daysBetween(int64_t fromSeconds, int64_t toSeconds);

/// "2024-01-01"
std::string toIsoDate(int64_t unixSeconds);

/// "2024-01-01T09:30:00.000Z"
std::string toIsoTimestamp(int64_t unixSeconds);

}
