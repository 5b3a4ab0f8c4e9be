#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace kraken {

// Ledger instants are UTC with nanosecond resolution.
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

struct CivilDate {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;
};

// Parses "YYYY-MM-DD HH:MM:SS[.fraction]" ('T' separator, trailing 'Z' or
// "+00:00" also accepted). Years must lie in 1678-2261, the range of a
// nanosecond count. Throws std::invalid_argument on anything else.
Timestamp parse_timestamp(const std::string& text);

// "YYYY-MM-DDTHH:MM:SS[.fraction]+00:00"; the fraction is omitted when zero
// and printed without trailing zeros otherwise.
std::string format_timestamp(Timestamp time);

Timestamp make_timestamp(int year, unsigned month, unsigned day,
                         unsigned hour = 0, unsigned minute = 0, unsigned second = 0);

CivilDate civil_date(Timestamp time);

int utc_year(Timestamp time);

// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t days_from_civil(int year, unsigned month, unsigned day);

CivilDate civil_from_days(int64_t days);

} // namespace kraken
