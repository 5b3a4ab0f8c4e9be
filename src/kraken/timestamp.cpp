#include "kraken/timestamp.hpp"

#include "kraken/util.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace kraken {
namespace {

constexpr int64_t kSecondsPerDay = 86400;

// Whole years representable by an int64 nanosecond count since the epoch.
constexpr int kMinYear = 1678;
constexpr int kMaxYear = 2261;

unsigned parse_fixed_digits(const std::string& text, std::size_t pos, std::size_t count) {
    if (pos + count > text.size()) {
        throw std::invalid_argument("Timestamp too short: " + text);
    }
    unsigned value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(c)) {
            throw std::invalid_argument("Unsupported timestamp format: " + text);
        }
        value = value * 10 + static_cast<unsigned>(c - '0');
    }
    return value;
}

void expect_char(const std::string& text, std::size_t pos, const char* allowed) {
    if (pos >= text.size() || std::string(allowed).find(text[pos]) == std::string::npos) {
        throw std::invalid_argument("Unsupported timestamp format: " + text);
    }
}

unsigned days_in_month(int year, unsigned month) {
    static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return month == 2 && leap ? 29 : kDays[month - 1];
}

} // namespace

int64_t days_from_civil(int year, unsigned month, unsigned day) {
    const int64_t y = static_cast<int64_t>(year) - (month <= 2 ? 1 : 0);
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned mp = month > 2 ? month - 3 : month + 9;
    const unsigned doy = (153 * mp + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

CivilDate civil_from_days(int64_t days) {
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const auto doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    CivilDate date;
    date.day = doy - (153 * mp + 2) / 5 + 1;
    date.month = mp < 10 ? mp + 3 : mp - 9;
    date.year = static_cast<int>(static_cast<int64_t>(yoe) + era * 400 + (date.month <= 2 ? 1 : 0));
    return date;
}

Timestamp make_timestamp(int year, unsigned month, unsigned day,
                         unsigned hour, unsigned minute, unsigned second) {
    const int64_t seconds = days_from_civil(year, month, day) * kSecondsPerDay +
                            static_cast<int64_t>(hour) * 3600 +
                            static_cast<int64_t>(minute) * 60 + second;
    return Timestamp{std::chrono::seconds(seconds)};
}

Timestamp parse_timestamp(const std::string& raw) {
    const std::string text = trim(raw);
    if (text.size() < 19) {
        throw std::invalid_argument("Unsupported timestamp format: " + text);
    }

    const int year = static_cast<int>(parse_fixed_digits(text, 0, 4));
    if (year < kMinYear || year > kMaxYear) {
        throw std::invalid_argument("Timestamp year outside " + std::to_string(kMinYear) + "-" +
                                    std::to_string(kMaxYear) + ": " + text);
    }
    expect_char(text, 4, "-");
    const unsigned month = parse_fixed_digits(text, 5, 2);
    expect_char(text, 7, "-");
    const unsigned day = parse_fixed_digits(text, 8, 2);
    expect_char(text, 10, " T");
    const unsigned hour = parse_fixed_digits(text, 11, 2);
    expect_char(text, 13, ":");
    const unsigned minute = parse_fixed_digits(text, 14, 2);
    expect_char(text, 16, ":");
    const unsigned second = parse_fixed_digits(text, 17, 2);

    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) ||
        hour > 23 || minute > 59 || second > 59) {
        throw std::invalid_argument("Timestamp out of range: " + text);
    }

    std::size_t pos = 19;
    int64_t nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 9) {
                nanos = nanos * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            throw std::invalid_argument("Unsupported timestamp format: " + text);
        }
        for (int i = std::min(digits, 9); i < 9; ++i) {
            nanos *= 10;
        }
    }

    const std::string zone = text.substr(pos);
    if (!zone.empty() && zone != "Z" && zone != "+00:00" && zone != "+0000") {
        throw std::invalid_argument("Only UTC timestamps are supported: " + text);
    }

    return make_timestamp(year, month, day, hour, minute, second) + std::chrono::nanoseconds(nanos);
}

std::string format_timestamp(Timestamp time) {
    const int64_t total_ns = time.time_since_epoch().count();
    int64_t seconds = total_ns / 1000000000;
    int64_t nanos = total_ns % 1000000000;
    if (nanos < 0) {
        nanos += 1000000000;
        --seconds;
    }
    int64_t days = seconds / kSecondsPerDay;
    int64_t second_of_day = seconds % kSecondsPerDay;
    if (second_of_day < 0) {
        second_of_day += kSecondsPerDay;
        --days;
    }
    const CivilDate date = civil_from_days(days);

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << date.year << '-'
        << std::setw(2) << date.month << '-'
        << std::setw(2) << date.day << 'T'
        << std::setw(2) << second_of_day / 3600 << ':'
        << std::setw(2) << (second_of_day % 3600) / 60 << ':'
        << std::setw(2) << second_of_day % 60;
    if (nanos != 0) {
        std::ostringstream frac;
        frac << std::setfill('0') << std::setw(9) << nanos;
        auto digits = frac.str();
        digits.erase(digits.find_last_not_of('0') + 1);
        oss << '.' << digits;
    }
    oss << "+00:00";
    return oss.str();
}

CivilDate civil_date(Timestamp time) {
    const auto seconds = std::chrono::floor<std::chrono::seconds>(time).time_since_epoch().count();
    int64_t days = seconds / kSecondsPerDay;
    if (seconds % kSecondsPerDay < 0) {
        --days;
    }
    return civil_from_days(days);
}

int utc_year(Timestamp time) {
    return civil_date(time).year;
}

} // namespace kraken
