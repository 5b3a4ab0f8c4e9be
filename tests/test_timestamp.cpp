#include "kraken/timestamp.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using kraken::format_timestamp;
using kraken::parse_timestamp;

TEST_CASE("parse_timestamp reads Kraken ledger times with fractions") {
    const auto t = parse_timestamp("2025-01-04 00:05:16.8462");
    CHECK(kraken::utc_year(t) == 2025);
    CHECK(kraken::civil_date(t).month == 1u);
    CHECK(kraken::civil_date(t).day == 4u);
    CHECK(format_timestamp(t) == "2025-01-04T00:05:16.8462+00:00");
}

TEST_CASE("parse_timestamp accepts ISO separators and UTC suffixes") {
    const auto plain = parse_timestamp("2024-02-29 23:59:59");
    CHECK(parse_timestamp("2024-02-29T23:59:59Z") == plain);
    CHECK(parse_timestamp("2024-02-29T23:59:59+00:00") == plain);
    CHECK(format_timestamp(plain) == "2024-02-29T23:59:59+00:00");
}

TEST_CASE("parse_timestamp rejects malformed and non-UTC input") {
    CHECK_THROWS_AS(parse_timestamp(""), std::invalid_argument);
    CHECK_THROWS_AS(parse_timestamp("2025/01/01 00:00:00"), std::invalid_argument);
    CHECK_THROWS_AS(parse_timestamp("2025-02-30 00:00:00"), std::invalid_argument);
    CHECK_THROWS_AS(parse_timestamp("2025-01-01 24:00:00"), std::invalid_argument);
    CHECK_THROWS_AS(parse_timestamp("2025-01-01 10:00:00+02:00"), std::invalid_argument);
    CHECK_THROWS_AS(parse_timestamp("2025-01-01 10:00:00."), std::invalid_argument);
}

TEST_CASE("parse_timestamp rejects years a nanosecond clock cannot hold") {
    CHECK_THROWS_AS(parse_timestamp("2300-06-01 00:00:00"), std::invalid_argument);
    CHECK_THROWS_AS(parse_timestamp("1600-01-01 00:00:00"), std::invalid_argument);
    CHECK_THROWS_AS(parse_timestamp("2262-01-01 00:00:00"), std::invalid_argument);

    const auto last = parse_timestamp("2261-12-31 23:59:59");
    CHECK(kraken::utc_year(last) == 2261);
    CHECK(format_timestamp(last) == "2261-12-31T23:59:59+00:00");
    const auto first = parse_timestamp("1678-01-01 00:00:00");
    CHECK(kraken::utc_year(first) == 1678);
    CHECK(format_timestamp(first) == "1678-01-01T00:00:00+00:00");
}

TEST_CASE("civil date conversion round trips across the epoch") {
    CHECK(kraken::days_from_civil(1970, 1, 1) == 0);
    CHECK(kraken::days_from_civil(2000, 3, 1) == 11017);
    const auto date = kraken::civil_from_days(-1);
    CHECK(date.year == 1969);
    CHECK(date.month == 12u);
    CHECK(date.day == 31u);
}

TEST_CASE("year boundary belongs to the new year in UTC") {
    CHECK(kraken::utc_year(parse_timestamp("2024-12-31 23:59:59.999")) == 2024);
    CHECK(kraken::utc_year(parse_timestamp("2025-01-01 00:00:00")) == 2025);
}
