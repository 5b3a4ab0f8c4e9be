#pragma once

#include "acb/config.hpp"
#include "acb/decimal.hpp"
#include "acb/pool_engine.hpp"
#include "acb/report.hpp"
#include "kraken/ledger.hpp"

#include <map>
#include <string>
#include <vector>

namespace acb {

struct TaxRunOptions {
    int tax_year = 0;
    Decimal fallback_usd_cad;
};

struct TaxRun {
    TaxReport report;
    std::vector<ReplayRecord> history;  // every replayed event, all years
    std::map<std::string, AssetPool> pools;
};

// Sorts the entries, groups trades, builds implied price series, classifies
// and replays the whole history, then projects the target year. Throws on
// any fatal ledger error before anything is written.
TaxRun compute_tax_report(std::vector<kraken::LedgerEntry> entries, const TaxRunOptions& options);

// Writes the report CSV and any configured summary JSON and audit journal.
// Every file is staged first; none is moved into place unless all succeed.
void write_tax_outputs(const RunConfig& config, const TaxRun& run);

// Loads the configured ledger, computes the report and writes its outputs.
// A fatal ledger error propagates before any output file exists.
TaxRun run_tax_job(const RunConfig& config);

} // namespace acb
