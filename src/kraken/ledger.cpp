#include "kraken/ledger.hpp"

#include "kraken/csv.hpp"
#include "kraken/util.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <optional>
#include <unordered_map>

namespace kraken {
namespace {

struct ColumnMap {
    std::optional<std::size_t> txid;
    std::optional<std::size_t> refid;
    std::optional<std::size_t> time;
    std::optional<std::size_t> type;
    std::optional<std::size_t> subtype;
    std::optional<std::size_t> asset;
    std::optional<std::size_t> amount;
    std::optional<std::size_t> fee;
};

std::string field_or_empty(const CsvRow& row, const std::optional<std::size_t>& index) {
    if (!index || *index >= row.size()) {
        return {};
    }
    return trim(row[*index]);
}

std::string required_field(const CsvRow& row,
                           const std::optional<std::size_t>& index,
                           std::size_t row_number,
                           const char* column) {
    auto value = field_or_empty(row, index);
    if (value.empty()) {
        throw MalformedRow(row_number, column, "required value is missing");
    }
    return value;
}

acb::Decimal parse_amount(const std::string& text, std::size_t row_number, const char* column) {
    try {
        return acb::Decimal::from_string(text);
    } catch (const std::exception& ex) {
        throw MalformedRow(row_number, column, ex.what());
    }
}

bool is_blank(const CsvRow& row) {
    return std::all_of(row.begin(), row.end(), [](const std::string& field) {
        return trim(field).empty();
    });
}

} // namespace

EntryType classify_entry_type(const std::string& type, const std::string& subtype) {
    if (type == "trade" && (subtype == "tradespot" || subtype.empty())) {
        return EntryType::Trade;
    }
    if (type == "earn") {
        if (subtype == "reward") {
            return EntryType::EarnReward;
        }
        if (subtype == "autoallocation" || subtype == "allocation" || subtype == "deallocation") {
            return EntryType::EarnAllocation;
        }
        return EntryType::Other;
    }
    if (type == "deposit") {
        return EntryType::Deposit;
    }
    if (type == "withdrawal") {
        return EntryType::Withdrawal;
    }
    return EntryType::Other;
}

const char* entry_type_name(EntryType type) {
    switch (type) {
        case EntryType::Trade: return "trade";
        case EntryType::EarnReward: return "earn_reward";
        case EntryType::EarnAllocation: return "earn_allocation";
        case EntryType::Deposit: return "deposit";
        case EntryType::Withdrawal: return "withdrawal";
        case EntryType::Other: return "other";
    }
    return "other";
}

std::vector<LedgerEntry> parse_ledger(std::istream& input) {
    CsvReader reader(input);
    CsvRow row;
    if (!reader.read_row(row)) {
        throw MalformedRow(0, "header", "ledger file is empty");
    }

    const CsvHeader header(row);
    ColumnMap columns;
    columns.txid = header.index_of("txid");
    columns.refid = header.index_of("refid");
    columns.time = header.index_of("time");
    columns.type = header.index_of("type");
    columns.subtype = header.index_of("subtype");
    columns.asset = header.index_of("asset");
    columns.amount = header.index_of("amount");
    columns.fee = header.index_of("fee");

    for (const char* required : {"time", "type", "asset", "amount"}) {
        if (!header.contains(required)) {
            throw MalformedRow(0, required, "required column is absent from the header");
        }
    }

    std::vector<LedgerEntry> entries;
    std::size_t row_number = 0;
    while (true) {
        try {
            if (!reader.read_row(row)) {
                break;
            }
        } catch (const CsvError& ex) {
            throw MalformedRow(row_number + 1, "record", ex.what());
        }
        ++row_number;
        if (is_blank(row)) {
            continue;
        }

        LedgerEntry entry;
        entry.row = row_number;
        entry.txid = field_or_empty(row, columns.txid);
        entry.refid = field_or_empty(row, columns.refid);
        entry.type = to_lower_copy(required_field(row, columns.type, row_number, "type"));
        entry.subtype = to_lower_copy(field_or_empty(row, columns.subtype));
        entry.asset = to_upper_copy(required_field(row, columns.asset, row_number, "asset"));

        const auto time_text = required_field(row, columns.time, row_number, "time");
        try {
            entry.time = parse_timestamp(time_text);
        } catch (const std::invalid_argument& ex) {
            throw MalformedRow(row_number, "time", ex.what());
        }

        entry.amount = parse_amount(required_field(row, columns.amount, row_number, "amount"),
                                    row_number, "amount");
        const auto fee_text = field_or_empty(row, columns.fee);
        if (!fee_text.empty()) {
            entry.fee = parse_amount(fee_text, row_number, "fee");
            if (entry.fee.is_negative()) {
                throw MalformedRow(row_number, "fee", "fee must not be negative");
            }
        }

        entry.kind = classify_entry_type(entry.type, entry.subtype);
        entries.push_back(std::move(entry));
    }

    return entries;
}

std::vector<LedgerEntry> load_ledger(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("Ledger file not found: " + path.string());
    }
    auto entries = parse_ledger(input);
    std::cout << "[Ledger] Loaded " << entries.size() << " rows from " << path.string() << std::endl;
    return entries;
}

void sort_chronologically(std::vector<LedgerEntry>& entries) {
    std::stable_sort(entries.begin(), entries.end(), [](const LedgerEntry& a, const LedgerEntry& b) {
        if (a.time != b.time) {
            return a.time < b.time;
        }
        if (a.refid != b.refid) {
            return a.refid < b.refid;
        }
        return a.row < b.row;
    });
}

std::vector<TradeGroup> group_trades(const std::vector<LedgerEntry>& entries) {
    std::vector<TradeGroup> groups;
    std::unordered_map<std::string, std::size_t> index_by_refid;

    for (const auto& entry : entries) {
        if (entry.kind != EntryType::Trade) {
            continue;
        }
        if (entry.refid.empty()) {
            throw TradeGroupError("<empty>", "trade row " + std::to_string(entry.row) + " has no refid");
        }
        const auto [it, inserted] = index_by_refid.emplace(entry.refid, groups.size());
        if (inserted) {
            TradeGroup group;
            group.refid = entry.refid;
            group.txid = entry.txid;
            group.time = entry.time;
            group.first_row = entry.row;
            groups.push_back(std::move(group));
        }
        groups[it->second].entries.push_back(entry);
    }

    for (auto& group : groups) {
        std::vector<const LedgerEntry*> legs;
        std::vector<const LedgerEntry*> fee_legs;
        for (const auto& entry : group.entries) {
            if (entry.time != group.time) {
                throw TradeGroupError(group.refid, "rows have mismatched times");
            }
            if (!entry.amount.is_zero()) {
                legs.push_back(&entry);
            } else if (entry.fee.is_positive()) {
                fee_legs.push_back(&entry);
            } else {
                throw TradeGroupError(group.refid, "row " + std::to_string(entry.row) + " moves nothing");
            }
        }

        if (legs.size() != 2) {
            throw TradeGroupError(group.refid, "expected 2 non-fee legs, got " + std::to_string(legs.size()));
        }

        const LedgerEntry* out = nullptr;
        const LedgerEntry* in = nullptr;
        if (legs[0]->amount.is_negative() && legs[1]->amount.is_positive()) {
            out = legs[0];
            in = legs[1];
        } else if (legs[1]->amount.is_negative() && legs[0]->amount.is_positive()) {
            out = legs[1];
            in = legs[0];
        } else {
            throw TradeGroupError(group.refid, "not reducible to one outflow and one inflow");
        }
        if (out->asset == in->asset) {
            throw TradeGroupError(group.refid, "both legs are in " + out->asset);
        }

        group.outflow = TradeLeg{out->asset, -out->net_delta(), out->amount.abs(), out->txid};
        group.inflow = TradeLeg{in->asset, in->net_delta(), in->amount.abs(), in->txid};

        for (const auto* fee_leg : fee_legs) {
            if (fee_leg->asset == group.outflow.asset) {
                group.outflow.units += fee_leg->fee;
            } else if (fee_leg->asset == group.inflow.asset) {
                group.inflow.units -= fee_leg->fee;
            } else {
                throw TradeGroupError(group.refid, "fee leg in " + fee_leg->asset + " matches neither trade leg");
            }
        }

        if (!group.inflow.units.is_positive()) {
            throw TradeGroupError(group.refid, "fees consume the whole inflow leg");
        }
    }

    return groups;
}

} // namespace kraken
