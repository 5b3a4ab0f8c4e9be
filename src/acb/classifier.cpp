#include "acb/classifier.hpp"

#include <unordered_map>

namespace acb {
namespace {

struct TradeValue {
    Decimal cad;
    std::string source;
    bool used_fallback_fx = false;
};

// One CAD value shared by both sides of a trade, taken from the leg that is
// cheapest to price: a CAD leg, then a USD leg, then either crypto leg.
TradeValue value_trade(const PriceResolver& prices, const kraken::TradeGroup& group) {
    const auto& out = group.outflow;
    const auto& in = group.inflow;

    if (out.asset == kBaseCurrency) {
        return TradeValue{out.units, kBaseCurrency, false};
    }
    if (out.asset == kUsd) {
        const auto fx = prices.usd_cad_at(group.time);
        return TradeValue{out.units * fx.rate, fx.source, fx.used_fallback_fx};
    }
    if (in.asset == kBaseCurrency) {
        return TradeValue{in.units, kBaseCurrency, false};
    }
    if (in.asset == kUsd) {
        const auto fx = prices.usd_cad_at(group.time);
        return TradeValue{in.units * fx.rate, fx.source, fx.used_fallback_fx};
    }
    if (auto rate = prices.try_cad_rate(out.asset, group.time)) {
        return TradeValue{out.units * rate->rate, rate->source, rate->used_fallback_fx};
    }
    if (auto rate = prices.try_cad_rate(in.asset, group.time)) {
        return TradeValue{in.units * rate->rate, rate->source, rate->used_fallback_fx};
    }
    throw NoPriorPrice(AssetPair{out.asset, kBaseCurrency}, group.time);
}

ClassifiedEvent make_event(EventKind kind, const kraken::LedgerEntry& entry, Decimal quantity) {
    ClassifiedEvent event;
    event.kind = kind;
    event.time = entry.time;
    event.refid = entry.refid;
    event.txid = entry.txid;
    event.origin_row = entry.row;
    event.asset = entry.asset;
    event.quantity = quantity;
    return event;
}

} // namespace

const char* event_kind_name(EventKind kind) {
    switch (kind) {
        case EventKind::TradeDisposition: return "trade_disposition";
        case EventKind::TradeAcquisition: return "trade_acquisition";
        case EventKind::RewardIncome: return "earn_reward_income";
        case EventKind::InternalTransfer: return "internal_transfer";
        case EventKind::DepositTransferIn: return "deposit_transfer_in";
        case EventKind::WithdrawalTransferOut: return "withdrawal_transfer_out";
        case EventKind::WithdrawalFeeDisposition: return "withdrawal_fee_disposition";
    }
    return "unknown";
}

bool is_taxable(EventKind kind) {
    switch (kind) {
        case EventKind::TradeDisposition:
        case EventKind::RewardIncome:
        case EventKind::WithdrawalFeeDisposition:
            return true;
        case EventKind::TradeAcquisition:
        case EventKind::InternalTransfer:
        case EventKind::DepositTransferIn:
        case EventKind::WithdrawalTransferOut:
            return false;
    }
    return false;
}

EventClassifier::EventClassifier(const PriceResolver& prices)
    : prices_(prices) {}

std::vector<ClassifiedEvent> EventClassifier::classify(const std::vector<kraken::LedgerEntry>& entries,
                                                       const std::vector<kraken::TradeGroup>& groups) const {
    std::unordered_map<std::string, const kraken::TradeGroup*> group_by_refid;
    for (const auto& group : groups) {
        group_by_refid.emplace(group.refid, &group);
    }

    std::vector<ClassifiedEvent> events;
    events.reserve(entries.size());
    for (const auto& entry : entries) {
        if (entry.kind == kraken::EntryType::Trade) {
            const auto it = group_by_refid.find(entry.refid);
            if (it == group_by_refid.end()) {
                throw kraken::TradeGroupError(entry.refid, "no trade group for row " + std::to_string(entry.row));
            }
            if (it->second == nullptr) {
                continue;  // already emitted at its first row
            }
            classify_trade(*it->second, events);
            it->second = nullptr;
        } else {
            classify_entry(entry, events);
        }
    }

    for (std::size_t i = 0; i < events.size(); ++i) {
        events[i].sequence = i;
    }
    return events;
}

void EventClassifier::classify_trade(const kraken::TradeGroup& group, std::vector<ClassifiedEvent>& out) const {
    const auto value = value_trade(prices_, group);

    const auto make_leg_event = [&](EventKind kind, const kraken::TradeLeg& leg) {
        ClassifiedEvent event;
        event.kind = kind;
        event.time = group.time;
        event.refid = group.refid;
        event.txid = group.txid;
        event.origin_row = group.first_row;
        event.asset = leg.asset;
        event.quantity = leg.units;
        event.cad_value = value.cad;
        event.valuation_source = value.source;
        event.used_fallback_fx = value.used_fallback_fx;
        return event;
    };

    if (group.outflow.asset != kBaseCurrency) {
        out.push_back(make_leg_event(EventKind::TradeDisposition, group.outflow));
    }
    if (group.inflow.asset != kBaseCurrency) {
        out.push_back(make_leg_event(EventKind::TradeAcquisition, group.inflow));
    }
}

void EventClassifier::classify_entry(const kraken::LedgerEntry& entry, std::vector<ClassifiedEvent>& out) const {
    const bool base_currency = entry.asset == kBaseCurrency;

    switch (entry.kind) {
        case kraken::EntryType::Trade:
            throw kraken::TradeGroupError(entry.refid, "trade rows must be classified as a group");

        case kraken::EntryType::EarnReward: {
            const Decimal net = entry.net_delta();
            if (!net.is_positive()) {
                throw kraken::MalformedRow(entry.row, "amount", "earn reward must have a positive net amount");
            }
            // Income is taxable, so an unpriceable reward is fatal.
            const auto valuation = prices_.cad_rate(entry.asset, entry.time);
            auto event = make_event(EventKind::RewardIncome, entry, net);
            event.cad_value = net * valuation.rate;
            event.valuation_source = valuation.source;
            event.used_fallback_fx = valuation.used_fallback_fx;
            out.push_back(std::move(event));
            break;
        }

        case kraken::EntryType::EarnAllocation:
            if (!base_currency) {
                out.push_back(make_event(EventKind::InternalTransfer, entry, entry.net_delta().abs()));
            }
            break;

        case kraken::EntryType::Deposit: {
            const Decimal net = entry.net_delta();
            if (!net.is_positive()) {
                throw kraken::MalformedRow(entry.row, "amount", "deposit must have a positive net amount");
            }
            if (base_currency) {
                break;
            }
            auto event = make_event(EventKind::DepositTransferIn, entry, net);
            if (auto valuation = prices_.try_cad_rate(entry.asset, entry.time)) {
                event.cad_value = net * valuation->rate;
                event.valuation_source = valuation->source;
                event.used_fallback_fx = valuation->used_fallback_fx;
            } else {
                event.unpriced = true;
            }
            out.push_back(std::move(event));
            break;
        }

        case kraken::EntryType::Withdrawal: {
            if (!entry.amount.is_negative()) {
                throw kraken::MalformedRow(entry.row, "amount", "withdrawal amount must be negative");
            }
            if (base_currency) {
                break;
            }
            const Decimal principal = entry.amount.abs();
            auto transfer = make_event(EventKind::WithdrawalTransferOut, entry, principal);
            if (auto valuation = prices_.try_cad_rate(entry.asset, entry.time)) {
                transfer.cad_value = principal * valuation->rate;
                transfer.valuation_source = valuation->source;
                transfer.used_fallback_fx = valuation->used_fallback_fx;
            }
            out.push_back(std::move(transfer));

            if (entry.fee.is_positive()) {
                const auto valuation = prices_.cad_rate(entry.asset, entry.time);
                auto fee = make_event(EventKind::WithdrawalFeeDisposition, entry, entry.fee);
                fee.cad_value = entry.fee * valuation.rate;
                fee.valuation_source = valuation.source;
                fee.used_fallback_fx = valuation.used_fallback_fx;
                out.push_back(std::move(fee));
            }
            break;
        }

        case kraken::EntryType::Other:
            break;
    }
}

} // namespace acb
