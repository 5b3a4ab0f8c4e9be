#pragma once

#include "acb/decimal.hpp"
#include "kraken/timestamp.hpp"

#include <cstddef>
#include <filesystem>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

namespace kraken {

enum class EntryType {
    Trade,           // trade / tradespot
    EarnReward,      // earn / reward
    EarnAllocation,  // earn / autoallocation, allocation, deallocation
    Deposit,
    Withdrawal,
    Other
};

struct LedgerEntry {
    std::size_t row = 0;   // 1-based data row in the source file
    Timestamp time{};
    std::string txid;
    std::string refid;
    std::string type;      // lower-cased
    std::string subtype;   // lower-cased
    std::string asset;     // upper-cased
    acb::Decimal amount;   // signed; + is an inflow
    acb::Decimal fee;      // non-negative, same asset as amount
    EntryType kind = EntryType::Other;

    acb::Decimal net_delta() const { return amount - fee; }
};

struct TradeLeg {
    std::string asset;
    acb::Decimal units;        // fee-adjusted, always positive
    acb::Decimal gross_units;  // |amount| of the leg, used for implied prices
    std::string txid;
};

// All rows of one trade refid, reduced to one outflow and one inflow leg.
struct TradeGroup {
    std::string refid;
    std::string txid;
    Timestamp time{};
    std::size_t first_row = 0;
    std::vector<LedgerEntry> entries;
    TradeLeg outflow;
    TradeLeg inflow;
};

class MalformedRow : public std::runtime_error {
public:
    MalformedRow(std::size_t row, std::string column, const std::string& message)
        : std::runtime_error("Malformed ledger row " + std::to_string(row) + " (" + column + "): " + message),
          row_(row),
          column_(std::move(column)) {}

    [[nodiscard]] std::size_t row() const noexcept { return row_; }
    [[nodiscard]] const std::string& column() const noexcept { return column_; }

private:
    std::size_t row_;
    std::string column_;
};

class TradeGroupError : public std::runtime_error {
public:
    TradeGroupError(std::string refid, const std::string& message)
        : std::runtime_error("Trade refid " + refid + ": " + message),
          refid_(std::move(refid)) {}

    [[nodiscard]] const std::string& refid() const noexcept { return refid_; }

private:
    std::string refid_;
};

EntryType classify_entry_type(const std::string& type, const std::string& subtype);

const char* entry_type_name(EntryType type);

// Reads a ledger export with a header row. Throws MalformedRow on a missing
// required column or an unparsable required value.
std::vector<LedgerEntry> parse_ledger(std::istream& input);

std::vector<LedgerEntry> load_ledger(const std::filesystem::path& path);

// Stable sort by (time, refid); file order breaks the remaining ties.
void sort_chronologically(std::vector<LedgerEntry>& entries);

// Groups trade rows by refid, in order of each group's first row in the
// (already sorted) entry sequence. Throws TradeGroupError.
std::vector<TradeGroup> group_trades(const std::vector<LedgerEntry>& entries);

} // namespace kraken
