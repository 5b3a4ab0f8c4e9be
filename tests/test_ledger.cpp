#include "kraken/ledger.hpp"

#include "ledger_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>

using fixtures::dec;
using fixtures::LedgerBuilder;

namespace {

const char* kHeader =
    "\"txid\",\"refid\",\"time\",\"type\",\"subtype\",\"aclass\",\"asset\",\"wallet\",\"amount\",\"fee\",\"balance\"\n";

std::vector<kraken::LedgerEntry> parse(const std::string& text) {
    std::istringstream input(text);
    return kraken::parse_ledger(input);
}

} // namespace

TEST_CASE("parse_ledger reads a Kraken export and ignores extra columns") {
    const auto entries = parse(std::string(kHeader) +
        "\"L1\",\"R1\",\"2025-01-04 00:05:16.8462\",\"Trade\",\"TradeSpot\",\"currency\",\"btc\",\"spot / main\",\"0.5\",\"0.001\",\"0.499\"\n"
        "\"L2\",\"R1\",\"2025-01-04 00:05:16.8462\",\"trade\",\"tradespot\",\"currency\",\"CAD\",\"spot / main\",\"-25000\",\"\",\"0\"\n"
        "\"L3\",\"R2\",\"2025-02-01 00:00:00\",\"staking\",\"\",\"currency\",\"DOT\",\"spot / main\",\"1\",\"0\",\"1\"\n");

    REQUIRE(entries.size() == 3);
    const auto& first = entries[0];
    CHECK(first.row == 1u);
    CHECK(first.txid == "L1");
    CHECK(first.refid == "R1");
    CHECK(first.type == "trade");
    CHECK(first.subtype == "tradespot");
    CHECK(first.asset == "BTC");
    CHECK(first.amount == dec("0.5"));
    CHECK(first.fee == dec("0.001"));
    CHECK(first.net_delta() == dec("0.499"));
    CHECK(first.kind == kraken::EntryType::Trade);

    CHECK(entries[1].fee.is_zero());
    CHECK(entries[2].kind == kraken::EntryType::Other);
}

TEST_CASE("parse_ledger works without optional columns") {
    const auto entries = parse("time,type,asset,amount\n2025-01-01 00:00:00,deposit,ETH,2\n\n");
    REQUIRE(entries.size() == 1);
    CHECK(entries[0].refid.empty());
    CHECK(entries[0].fee.is_zero());
    CHECK(entries[0].kind == kraken::EntryType::Deposit);
}

TEST_CASE("parse_ledger reports missing required columns") {
    try {
        parse("txid,refid,time,type,asset,fee\n");
        FAIL("expected MalformedRow");
    } catch (const kraken::MalformedRow& ex) {
        CHECK(ex.column() == "amount");
        CHECK(ex.row() == 0u);
    }
}

TEST_CASE("parse_ledger reports unparsable required values with their row") {
    const std::string header = "txid,refid,time,type,subtype,asset,amount,fee\n";
    const std::string good = "L1,R1,2025-01-01 00:00:00,deposit,,ETH,1,0\n";

    try {
        parse(header + good + "L2,R2,2025-01-02 00:00:00,deposit,,ETH,one,0\n");
        FAIL("expected MalformedRow");
    } catch (const kraken::MalformedRow& ex) {
        CHECK(ex.row() == 2u);
        CHECK(ex.column() == "amount");
    }

    CHECK_THROWS_AS(parse(header + "L1,R1,yesterday,deposit,,ETH,1,0\n"), kraken::MalformedRow);

    try {
        parse("time,type,asset,amount\n2300-06-01 00:00:00,deposit,ETH,1\n");
        FAIL("expected MalformedRow");
    } catch (const kraken::MalformedRow& ex) {
        CHECK(ex.row() == 1u);
        CHECK(ex.column() == "time");
    }

    CHECK_THROWS_AS(parse(header + "L1,R1,2025-01-01 00:00:00,,,ETH,1,0\n"), kraken::MalformedRow);
    CHECK_THROWS_AS(parse(header + "L1,R1,2025-01-01 00:00:00,deposit,,,1,0\n"), kraken::MalformedRow);
    CHECK_THROWS_AS(parse(header + "L1,R1,2025-01-01 00:00:00,deposit,,ETH,1,-0.1\n"), kraken::MalformedRow);
}

TEST_CASE("classify_entry_type maps the closed set of ledger types") {
    using kraken::classify_entry_type;
    using kraken::EntryType;
    CHECK(classify_entry_type("trade", "tradespot") == EntryType::Trade);
    CHECK(classify_entry_type("trade", "") == EntryType::Trade);
    CHECK(classify_entry_type("trade", "margin") == EntryType::Other);
    CHECK(classify_entry_type("earn", "reward") == EntryType::EarnReward);
    CHECK(classify_entry_type("earn", "autoallocation") == EntryType::EarnAllocation);
    CHECK(classify_entry_type("earn", "allocation") == EntryType::EarnAllocation);
    CHECK(classify_entry_type("earn", "deallocation") == EntryType::EarnAllocation);
    CHECK(classify_entry_type("earn", "migration") == EntryType::Other);
    CHECK(classify_entry_type("deposit", "") == EntryType::Deposit);
    CHECK(classify_entry_type("withdrawal", "") == EntryType::Withdrawal);
    CHECK(classify_entry_type("transfer", "spottostaking") == EntryType::Other);
}

TEST_CASE("sort_chronologically orders by time, then refid, then file row") {
    LedgerBuilder ledger;
    ledger.deposit("2025-03-01 00:00:00", "RB", "ETH", "1")
          .deposit("2025-01-01 00:00:00", "RZ", "ETH", "2")
          .deposit("2025-03-01 00:00:00", "RA", "ETH", "3")
          .deposit("2025-03-01 00:00:00", "RA", "BTC", "4");

    const auto sorted = ledger.sorted();
    REQUIRE(sorted.size() == 4);
    CHECK(sorted[0].row == 2u);
    CHECK(sorted[1].row == 3u);
    CHECK(sorted[2].row == 4u);
    CHECK(sorted[3].row == 1u);
}

TEST_CASE("group_trades resolves fee-adjusted legs") {
    LedgerBuilder ledger;
    ledger.add("2025-01-01 12:00:00", "R1", "trade", "tradespot", "CAD", "-1000", "2.6")
          .add("2025-01-01 12:00:00", "R1", "trade", "tradespot", "BTC", "0.02", "0.0001")
          .deposit("2025-01-01 12:30:00", "R2", "ETH", "1");

    const auto groups = kraken::group_trades(ledger.sorted());
    REQUIRE(groups.size() == 1);
    const auto& group = groups[0];
    CHECK(group.refid == "R1");
    CHECK(group.txid == "L1");
    CHECK(group.first_row == 1u);
    CHECK(group.entries.size() == 2);
    CHECK(group.outflow.asset == "CAD");
    CHECK(group.outflow.units == dec("1002.6"));
    CHECK(group.outflow.gross_units == dec("1000"));
    CHECK(group.inflow.asset == "BTC");
    CHECK(group.inflow.units == dec("0.0199"));
    CHECK(group.inflow.gross_units == dec("0.02"));
}

TEST_CASE("group_trades folds separate fee legs into the matching leg") {
    LedgerBuilder ledger;
    ledger.trade("2025-01-01 12:00:00", "R1", "USD", "700", "BTC", "0.01")
          .add("2025-01-01 12:00:00", "R1", "trade", "tradespot", "USD", "0", "1.4");

    const auto groups = kraken::group_trades(ledger.sorted());
    REQUIRE(groups.size() == 1);
    CHECK(groups[0].outflow.units == dec("701.4"));
    CHECK(groups[0].inflow.units == dec("0.01"));
}

TEST_CASE("group_trades rejects groups without a clean two-leg structure") {
    SECTION("single leg") {
        LedgerBuilder ledger;
        ledger.add("2025-01-01 00:00:00", "R1", "trade", "tradespot", "USD", "-100", "1");
        try {
            kraken::group_trades(ledger.sorted());
            FAIL("expected TradeGroupError");
        } catch (const kraken::TradeGroupError& ex) {
            CHECK(ex.refid() == "R1");
        }
    }
    SECTION("three legs") {
        LedgerBuilder ledger;
        ledger.trade("2025-01-01 00:00:00", "R1", "CAD", "100", "BTC", "0.001")
              .add("2025-01-01 00:00:00", "R1", "trade", "tradespot", "ETH", "0.1");
        CHECK_THROWS_AS(kraken::group_trades(ledger.sorted()), kraken::TradeGroupError);
    }
    SECTION("both legs outflows") {
        LedgerBuilder ledger;
        ledger.add("2025-01-01 00:00:00", "R1", "trade", "tradespot", "CAD", "-100")
              .add("2025-01-01 00:00:00", "R1", "trade", "tradespot", "BTC", "-0.001");
        CHECK_THROWS_AS(kraken::group_trades(ledger.sorted()), kraken::TradeGroupError);
    }
    SECTION("mismatched times") {
        LedgerBuilder ledger;
        ledger.add("2025-01-01 00:00:00", "R1", "trade", "tradespot", "CAD", "-100")
              .add("2025-01-01 00:00:01", "R1", "trade", "tradespot", "BTC", "0.001");
        CHECK_THROWS_AS(kraken::group_trades(ledger.sorted()), kraken::TradeGroupError);
    }
    SECTION("fee leg in a third asset") {
        LedgerBuilder ledger;
        ledger.trade("2025-01-01 00:00:00", "R1", "CAD", "100", "BTC", "0.001")
              .add("2025-01-01 00:00:00", "R1", "trade", "tradespot", "KFEE", "0", "50");
        CHECK_THROWS_AS(kraken::group_trades(ledger.sorted()), kraken::TradeGroupError);
    }
    SECTION("fees larger than the inflow") {
        LedgerBuilder ledger;
        ledger.add("2025-01-01 00:00:00", "R1", "trade", "tradespot", "CAD", "-100")
              .add("2025-01-01 00:00:00", "R1", "trade", "tradespot", "BTC", "0.001", "0.001");
        CHECK_THROWS_AS(kraken::group_trades(ledger.sorted()), kraken::TradeGroupError);
    }
}
