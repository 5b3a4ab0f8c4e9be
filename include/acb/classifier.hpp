#pragma once

#include "acb/decimal.hpp"
#include "acb/price_resolver.hpp"
#include "kraken/ledger.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace acb {

// Closed set of replayable events. Every switch over EventKind lists all
// enumerators without a default so a new kind fails to compile (-Werror=switch).
enum class EventKind {
    TradeDisposition,
    TradeAcquisition,
    RewardIncome,
    InternalTransfer,
    DepositTransferIn,
    WithdrawalTransferOut,
    WithdrawalFeeDisposition
};

const char* event_kind_name(EventKind kind);

bool is_taxable(EventKind kind);

struct ClassifiedEvent {
    EventKind kind = EventKind::InternalTransfer;
    std::size_t sequence = 0;     // replay order among events of one instant
    Timestamp time{};
    std::string refid;
    std::string txid;
    std::size_t origin_row = 0;   // first ledger row the event came from
    std::string asset;
    Decimal quantity;             // always non-negative
    Decimal cad_value;            // CAD value of `quantity` at `time`
    std::string valuation_source;
    bool used_fallback_fx = false;
    bool unpriced = false;        // deposit whose value could not be resolved
};

class EventClassifier {
public:
    explicit EventClassifier(const PriceResolver& prices);

    // Maps sorted entries and their trade groups to events in replay order.
    // Throws NoPriorPrice for unpriceable taxable events and MalformedRow for
    // entries whose sign contradicts their type.
    std::vector<ClassifiedEvent> classify(const std::vector<kraken::LedgerEntry>& entries,
                                          const std::vector<kraken::TradeGroup>& groups) const;

    void classify_trade(const kraken::TradeGroup& group, std::vector<ClassifiedEvent>& out) const;
    void classify_entry(const kraken::LedgerEntry& entry, std::vector<ClassifiedEvent>& out) const;

private:
    const PriceResolver& prices_;
};

} // namespace acb
