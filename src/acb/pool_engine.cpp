#include "acb/pool_engine.hpp"

#include <iostream>

namespace acb {
namespace {

std::string describe(const ClassifiedEvent& event) {
    return std::string(event_kind_name(event.kind)) + " refid " + event.refid;
}

} // namespace

Decimal AssetPool::average_cost() const {
    if (units.is_zero()) {
        return Decimal{};
    }
    return total_acb_cad / units;
}

ReplayRecord PoolEngine::apply(const ClassifiedEvent& event) {
    if (clock_ && event.time < *clock_) {
        throw std::invalid_argument("Event " + describe(event) + " at " + kraken::format_timestamp(event.time) +
                                    " precedes replay clock " + kraken::format_timestamp(*clock_));
    }
    if (event.quantity.is_negative()) {
        throw std::invalid_argument("Event " + describe(event) + " has a negative quantity");
    }
    clock_ = event.time;

    ReplayRecord record{event, EventOutcome{}};
    auto& outcome = record.outcome;

    switch (event.kind) {
        case EventKind::TradeAcquisition:
        case EventKind::DepositTransferIn: {
            auto& pool = pool_for(event.asset);
            const Decimal acb_added = event.unpriced ? Decimal{} : event.cad_value;
            pool.units += event.quantity;
            pool.total_acb_cad += acb_added;
            outcome.units_in = event.quantity;
            outcome.acb_added_cad = acb_added;
            if (event.unpriced) {
                std::cerr << "[Replay] Warning: " << event.asset << " deposit of " << event.quantity
                          << " (refid " << event.refid << ") has no prior price; assuming 0 CAD ACB" << std::endl;
            }
            break;
        }

        case EventKind::RewardIncome: {
            outcome.units_in = event.quantity;
            outcome.income_cad = event.cad_value;
            if (event.asset != kBaseCurrency) {
                auto& pool = pool_for(event.asset);
                pool.units += event.quantity;
                pool.total_acb_cad += event.cad_value;
                outcome.acb_added_cad = event.cad_value;
            }
            break;
        }

        case EventKind::TradeDisposition:
        case EventKind::WithdrawalFeeDisposition: {
            auto& pool = existing_pool(event);
            const Decimal disposed_cost = remove_at_average_cost(pool, event);
            outcome.units_out = event.quantity;
            outcome.proceeds_cad = event.cad_value;
            outcome.disposed_cost_cad = disposed_cost;
            outcome.gain_cad = event.cad_value - disposed_cost;
            break;
        }

        case EventKind::WithdrawalTransferOut: {
            auto& pool = existing_pool(event);
            remove_at_average_cost(pool, event);
            outcome.units_out = event.quantity;
            break;
        }

        case EventKind::InternalTransfer:
            // Allocation between earn and spot wallets stays inside one pool.
            break;
    }

    snapshot(event.asset, outcome);
    return record;
}

std::vector<ReplayRecord> PoolEngine::replay(const std::vector<ClassifiedEvent>& events) {
    std::vector<ReplayRecord> records;
    records.reserve(events.size());
    for (const auto& event : events) {
        records.push_back(apply(event));
    }
    std::cout << "[Replay] Replayed " << records.size() << " events across " << pools_.size()
              << " pools" << std::endl;
    return records;
}

const AssetPool* PoolEngine::pool(const std::string& asset) const {
    const auto it = pools_.find(asset);
    return it == pools_.end() ? nullptr : &it->second;
}

AssetPool& PoolEngine::pool_for(const std::string& asset) {
    return pools_[asset];
}

AssetPool& PoolEngine::existing_pool(const ClassifiedEvent& event) {
    const auto it = pools_.find(event.asset);
    if (it == pools_.end()) {
        throw NegativePoolError(event.asset, event.quantity, Decimal{}, describe(event));
    }
    return it->second;
}

Decimal PoolEngine::remove_at_average_cost(AssetPool& pool, const ClassifiedEvent& event) {
    if (event.quantity.is_zero()) {
        return Decimal{};
    }
    if (!pool.units.is_positive() || event.quantity > pool.units) {
        throw NegativePoolError(event.asset, event.quantity, pool.units, describe(event));
    }

    Decimal cost;
    if (event.quantity == pool.units) {
        cost = pool.total_acb_cad;
    } else {
        cost = pool.average_cost() * event.quantity;
        if (cost > pool.total_acb_cad) {
            cost = pool.total_acb_cad;
        }
    }

    pool.units -= event.quantity;
    pool.total_acb_cad -= cost;
    if (pool.units.is_zero()) {
        pool.total_acb_cad = Decimal{};
    }
    return cost;
}

void PoolEngine::snapshot(const std::string& asset, EventOutcome& outcome) const {
    if (const auto* current = pool(asset)) {
        outcome.pool_units_after = current->units;
        outcome.pool_acb_cad_after = current->total_acb_cad;
    }
}

} // namespace acb
