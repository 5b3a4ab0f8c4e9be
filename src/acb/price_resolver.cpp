#include "acb/price_resolver.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>

namespace acb {

void PriceSeries::append(Timestamp time, Decimal rate) {
    if (!samples_.empty() && time < samples_.back().time) {
        throw std::invalid_argument("Price sample at " + kraken::format_timestamp(time) +
                                    " is older than the series tail");
    }
    samples_.push_back(PriceSample{time, rate});
}

std::optional<Decimal> PriceSeries::at(Timestamp time) const {
    const auto it = std::upper_bound(samples_.begin(), samples_.end(), time,
                                     [](Timestamp t, const PriceSample& sample) {
                                         return t < sample.time;
                                     });
    if (it == samples_.begin()) {
        return std::nullopt;
    }
    return std::prev(it)->rate;
}

PriceResolver::PriceResolver(Decimal fallback_usd_cad)
    : fallback_usd_cad_(fallback_usd_cad) {
    if (!fallback_usd_cad_.is_positive()) {
        throw std::invalid_argument("Fallback USD/CAD rate must be positive");
    }
}

PriceResolver PriceResolver::build(const std::vector<kraken::TradeGroup>& groups, Decimal fallback_usd_cad) {
    PriceResolver resolver(fallback_usd_cad);
    for (const auto& group : groups) {
        resolver.observe(group);
    }

    std::size_t samples = 0;
    for (const auto& [pair, series] : resolver.series_) {
        samples += series.size();
    }
    std::cout << "[Prices] Built " << resolver.series_.size() << " implied series ("
              << samples << " samples) from " << groups.size() << " trades" << std::endl;
    return resolver;
}

void PriceResolver::observe(const kraken::TradeGroup& group) {
    const auto& out = group.outflow;
    const auto& in = group.inflow;
    if (!out.gross_units.is_positive() || !in.gross_units.is_positive()) {
        return;
    }

    // Quote preference: CAD over USD, so USD/CAD trades price USD.
    const auto quote_of = [](const std::string& asset) {
        if (asset == kBaseCurrency) return 2;
        if (asset == kUsd) return 1;
        return 0;
    };
    const int out_rank = quote_of(out.asset);
    const int in_rank = quote_of(in.asset);
    if (out_rank == 0 && in_rank == 0) {
        return;
    }

    const auto& quote = out_rank > in_rank ? out : in;
    const auto& base = out_rank > in_rank ? in : out;
    add_sample(AssetPair{base.asset, quote.asset}, group.time, quote.gross_units / base.gross_units);
}

void PriceResolver::add_sample(const AssetPair& pair, Timestamp time, Decimal rate) {
    series_[pair].append(time, rate);
}

Decimal PriceResolver::price_at(const AssetPair& pair, Timestamp time) const {
    const auto it = series_.find(pair);
    if (it != series_.end()) {
        if (auto rate = it->second.at(time)) {
            return *rate;
        }
    }
    throw NoPriorPrice(pair, time);
}

Valuation PriceResolver::usd_cad_at(Timestamp time) const {
    const AssetPair pair{kUsd, kBaseCurrency};
    const auto it = series_.find(pair);
    if (it != series_.end()) {
        if (auto rate = it->second.at(time)) {
            return Valuation{*rate, pair.to_string(), false};
        }
    }
    return Valuation{fallback_usd_cad_, "fallback USD/CAD", true};
}

Valuation PriceResolver::cad_rate(const std::string& asset, Timestamp time) const {
    if (auto valuation = try_cad_rate(asset, time)) {
        return *valuation;
    }
    throw NoPriorPrice(AssetPair{asset, kBaseCurrency}, time);
}

std::optional<Valuation> PriceResolver::try_cad_rate(const std::string& asset, Timestamp time) const {
    if (asset == kBaseCurrency) {
        return Valuation{Decimal::from_integer(1), kBaseCurrency, false};
    }
    if (asset == kUsd) {
        return usd_cad_at(time);
    }

    const AssetPair direct{asset, kBaseCurrency};
    if (const auto* cad_series = series(direct)) {
        if (auto rate = cad_series->at(time)) {
            return Valuation{*rate, direct.to_string(), false};
        }
    }

    const AssetPair via_usd{asset, kUsd};
    if (const auto* usd_series = series(via_usd)) {
        if (auto rate = usd_series->at(time)) {
            const auto fx = usd_cad_at(time);
            return Valuation{*rate * fx.rate, via_usd.to_string() + "*" + fx.source, fx.used_fallback_fx};
        }
    }

    return std::nullopt;
}

const PriceSeries* PriceResolver::series(const AssetPair& pair) const {
    const auto it = series_.find(pair);
    return it == series_.end() ? nullptr : &it->second;
}

} // namespace acb
