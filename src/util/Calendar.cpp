#include "util/Calendar.hpp"

#include <cstdio>

namespace gitpulse::calendar {

namespace {

int64_t floorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

// Days since 1970-01-01 to proleptic Gregorian y/m/d (H. Hinnant's civil_from_days)
void civilFromDays(int64_t z, int& year, int& month, int& day) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    const int64_t d = doy - (153 * mp + 2) / 5 + 1;
    const int64_t m = mp < 10 ? mp + 3 : mp - 9;
    const int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);
    year = static_cast<int>(y);
    month = static_cast<int>(m);
    day = static_cast<int>(d);
}

}

CivilTime toCivil(int64_t unixSeconds) {
    const int64_t days = floorDiv(unixSeconds, SECONDS_PER_DAY);
    const int64_t secs = unixSeconds - days * SECONDS_PER_DAY;

    CivilTime t;
    civilFromDays(days, t.year, t.month, t.day);
    t.hour = static_cast<int>(secs / 3600);
    t.minute = static_cast<int>((secs % 3600) / 60);
    t.second = static_cast<int>(secs % 60);
    // 1970-01-01 was a Thursday
    t.weekday = static_cast<int>(((days % 7) + 11) % 7);
    return t;
}

int dayOfWeek(int64_t unixSeconds) {
    return toCivil(unixSeconds).weekday;
}

int hourOfDay(int64_t unixSeconds) {
    return toCivil(unixSeconds).hour;
}

int64_t weekStart(int64_t unixSeconds) {
    const int64_t days = floorDiv(unixSeconds, SECONDS_PER_DAY);
    const int64_t weekday = ((days % 7) + 11) % 7;
    return (days - weekday) * SECONDS_PER_DAY;
}

int64_t daysBetween(int64_t fromSeconds, int64_t toSeconds) {
    return floorDiv(toSeconds - fromSeconds, SECONDS_PER_DAY);
}

std::string toIsoDate(int64_t unixSeconds) {
    CivilTime t = toCivil(unixSeconds);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", t.year, t.month, t.day);
    return buf;
}

std::string toIsoTimestamp(int64_t unixSeconds) {
    CivilTime t = toCivil(unixSeconds);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.000Z",
                  t.year, t.month, t.day, t.hour, t.minute, t.second);
    return buf;
}

}
