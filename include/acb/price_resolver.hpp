#pragma once

#include "acb/decimal.hpp"
#include "kraken/ledger.hpp"
#include "kraken/timestamp.hpp"

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace acb {

using kraken::Timestamp;

inline const std::string kBaseCurrency = "CAD";
inline const std::string kUsd = "USD";

struct AssetPair {
    std::string base;
    std::string quote;

    std::string to_string() const { return base + "/" + quote; }

    friend bool operator<(const AssetPair& a, const AssetPair& b) {
        return a.base != b.base ? a.base < b.base : a.quote < b.quote;
    }
    friend bool operator==(const AssetPair& a, const AssetPair& b) {
        return a.base == b.base && a.quote == b.quote;
    }
};

struct PriceSample {
    Timestamp time{};
    Decimal rate;  // quote units per 1 base unit
};

// Append-only, time-ordered samples for one pair.
class PriceSeries {
public:
    // Throws std::invalid_argument when `time` precedes the last sample.
    void append(Timestamp time, Decimal rate);

    // Latest sample with sample.time <= time; the last of equal instants wins.
    std::optional<Decimal> at(Timestamp time) const;

    const std::vector<PriceSample>& samples() const { return samples_; }
    std::size_t size() const { return samples_.size(); }

private:
    std::vector<PriceSample> samples_;
};

class NoPriorPrice : public std::runtime_error {
public:
    NoPriorPrice(AssetPair pair, Timestamp time)
        : std::runtime_error("No price for " + pair.to_string() + " at or before " +
                             kraken::format_timestamp(time)),
          pair_(std::move(pair)),
          time_(time) {}

    [[nodiscard]] const AssetPair& pair() const noexcept { return pair_; }
    [[nodiscard]] Timestamp time() const noexcept { return time_; }

private:
    AssetPair pair_;
    Timestamp time_;
};

struct Valuation {
    Decimal rate;                   // CAD per unit
    std::string source;             // e.g. "CAD", "USD/CAD", "BTC/CAD", "ETH/USD*USD/CAD"
    bool used_fallback_fx = false;
};

class PriceResolver {
public:
    explicit PriceResolver(Decimal fallback_usd_cad);

    // Builds the implied series from every group pairing an asset with CAD or
    // USD, or USD with CAD. Groups must be in chronological order.
    static PriceResolver build(const std::vector<kraken::TradeGroup>& groups, Decimal fallback_usd_cad);

    // Records the implied rate of one trade group if it prices a tracked pair.
    void observe(const kraken::TradeGroup& group);

    void add_sample(const AssetPair& pair, Timestamp time, Decimal rate);

    // Throws NoPriorPrice.
    Decimal price_at(const AssetPair& pair, Timestamp time) const;

    // USD->CAD at `time`, or the fallback constant when no sample precedes it.
    Valuation usd_cad_at(Timestamp time) const;

    // CAD per unit of `asset` at `time`. Throws NoPriorPrice.
    Valuation cad_rate(const std::string& asset, Timestamp time) const;

    std::optional<Valuation> try_cad_rate(const std::string& asset, Timestamp time) const;

    const PriceSeries* series(const AssetPair& pair) const;
    const std::map<AssetPair, PriceSeries>& all_series() const { return series_; }
    Decimal fallback_usd_cad() const { return fallback_usd_cad_; }

private:
    std::map<AssetPair, PriceSeries> series_;
    Decimal fallback_usd_cad_;
};

} // namespace acb
