#include "kraken/csv.hpp"
#include "kraken/util.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>

TEST_CASE("trim strips surrounding whitespace only") {
    using kraken::trim;
    CHECK(trim("  BTC \t") == "BTC");
    CHECK(trim("\r\n") == "");
    CHECK(trim("a b") == "a b");
}

TEST_CASE("case helpers convert ascii") {
    CHECK(kraken::to_upper_copy("xbtCad") == "XBTCAD");
    CHECK(kraken::to_lower_copy("TradeSpot") == "tradespot");
}

TEST_CASE("normalize_column_name drops BOM and case") {
    CHECK(kraken::normalize_column_name("\xEF\xBB\xBFtxid") == "txid");
    CHECK(kraken::normalize_column_name(" Amount ") == "amount");
}

TEST_CASE("join preserves order") {
    CHECK(kraken::join({"a", "b", "c"}, "; ") == "a; b; c");
    CHECK(kraken::join({}, ",") == "");
}

TEST_CASE("CsvReader handles quoting and line endings") {
    std::istringstream input("\"txid\",\"notes\"\r\n\"L1\",\"a, \"\"quoted\"\"\nline\"\r\nL2,plain\n");
    kraken::CsvReader reader(input);
    kraken::CsvRow row;

    REQUIRE(reader.read_row(row));
    CHECK(row == kraken::CsvRow{"txid", "notes"});

    REQUIRE(reader.read_row(row));
    REQUIRE(row.size() == 2);
    CHECK(row[0] == "L1");
    CHECK(row[1] == "a, \"quoted\"\nline");

    REQUIRE(reader.read_row(row));
    CHECK(row == kraken::CsvRow{"L2", "plain"});

    CHECK_FALSE(reader.read_row(row));
    CHECK(reader.records_read() == 3);
}

TEST_CASE("CsvReader skips a UTF-8 byte order mark before a quoted header") {
    std::istringstream input("\xEF\xBB\xBF\"txid\",\"refid\"\n");
    kraken::CsvReader reader(input);
    kraken::CsvRow row;
    REQUIRE(reader.read_row(row));
    CHECK(row == kraken::CsvRow{"txid", "refid"});
}

TEST_CASE("CsvReader rejects an unterminated quote") {
    std::istringstream input("a,\"open\n");
    kraken::CsvReader reader(input);
    kraken::CsvRow row;
    CHECK_THROWS_AS(reader.read_row(row), kraken::CsvError);
}

TEST_CASE("CsvHeader looks columns up case-insensitively") {
    const kraken::CsvHeader header({"TxID", "refid", " Time "});
    CHECK(header.index_of("txid") == 0u);
    CHECK(header.index_of("TIME") == 2u);
    CHECK_FALSE(header.contains("fee"));
}

TEST_CASE("write_csv_row escapes only when needed") {
    std::ostringstream out;
    kraken::write_csv_row(out, {"plain", "with,comma", "say \"hi\"", ""});
    CHECK(out.str() == "plain,\"with,comma\",\"say \"\"hi\"\"\",\n");
}
