#pragma once

#include "acb/classifier.hpp"
#include "acb/decimal.hpp"

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace acb {

struct AssetPool {
    Decimal units;          // never negative
    Decimal total_acb_cad;  // never negative

    Decimal average_cost() const;
};

struct EventOutcome {
    Decimal units_in;
    Decimal units_out;
    Decimal proceeds_cad;
    Decimal disposed_cost_cad;
    Decimal gain_cad;
    Decimal income_cad;
    Decimal acb_added_cad;
    Decimal pool_units_after;
    Decimal pool_acb_cad_after;
};

// A classified event together with what replaying it did to its pool.
struct ReplayRecord {
    ClassifiedEvent event;
    EventOutcome outcome;
};

class NegativePoolError : public std::runtime_error {
public:
    NegativePoolError(std::string asset, Decimal requested, Decimal available, const std::string& context)
        : std::runtime_error("Insufficient " + asset + " in pool for " + context + ": remove=" +
                             requested.to_string() + ", pool=" + available.to_string()),
          asset_(std::move(asset)),
          requested_(requested),
          available_(available) {}

    [[nodiscard]] const std::string& asset() const noexcept { return asset_; }
    [[nodiscard]] Decimal requested() const noexcept { return requested_; }
    [[nodiscard]] Decimal available() const noexcept { return available_; }

private:
    std::string asset_;
    Decimal requested_;
    Decimal available_;
};

// Replays classified events in time order against one pooled cost base per
// asset. Pools are created on first inflow and never removed.
class PoolEngine {
public:
    ReplayRecord apply(const ClassifiedEvent& event);

    std::vector<ReplayRecord> replay(const std::vector<ClassifiedEvent>& events);

    const AssetPool* pool(const std::string& asset) const;
    const std::map<std::string, AssetPool>& pools() const { return pools_; }

private:
    AssetPool& pool_for(const std::string& asset);
    AssetPool& existing_pool(const ClassifiedEvent& event);
    Decimal remove_at_average_cost(AssetPool& pool, const ClassifiedEvent& event);
    void snapshot(const std::string& asset, EventOutcome& outcome) const;

    std::map<std::string, AssetPool> pools_;
    std::optional<Timestamp> clock_;
};

} // namespace acb
