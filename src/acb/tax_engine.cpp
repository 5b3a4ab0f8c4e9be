#include "acb/tax_engine.hpp"

#include "acb/classifier.hpp"
#include "acb/price_resolver.hpp"

#include <iostream>

namespace acb {

TaxRun compute_tax_report(std::vector<kraken::LedgerEntry> entries, const TaxRunOptions& options) {
    kraken::sort_chronologically(entries);
    const auto groups = kraken::group_trades(entries);

    // First pass: implied prices over the full history.
    const auto prices = PriceResolver::build(groups, options.fallback_usd_cad);

    // Second pass: classify and replay against those prices.
    const EventClassifier classifier(prices);
    const auto events = classifier.classify(entries, groups);

    PoolEngine engine;
    TaxRun run;
    run.history = engine.replay(events);
    run.pools = engine.pools();
    run.report = project_report(run.history, run.pools, options.tax_year, options.fallback_usd_cad);
    return run;
}

void write_tax_outputs(const RunConfig& config, const TaxRun& run) {
    StagedOutputs outputs;
    outputs.stage(config.output_path, [&](std::ostream& output) { write_report_csv(output, run.report.rows); });
    if (config.summary_json_path) {
        outputs.stage(*config.summary_json_path,
                      [&](std::ostream& output) { write_summary_json(output, run.report.summary); });
    }
    if (config.audit_jsonl_path) {
        outputs.stage(*config.audit_jsonl_path,
                      [&](std::ostream& output) { write_audit_journal(output, run.history); });
    }
    outputs.commit();

    std::cout << "[Report] Wrote " << run.report.rows.size() << " rows to " << config.output_path.string() << std::endl;
    if (config.summary_json_path) {
        std::cout << "[Report] Wrote summary to " << config.summary_json_path->string() << std::endl;
    }
    if (config.audit_jsonl_path) {
        std::cout << "[Report] Wrote " << run.history.size() << " audit records to "
                  << config.audit_jsonl_path->string() << std::endl;
    }
}

TaxRun run_tax_job(const RunConfig& config) {
    auto run = compute_tax_report(kraken::load_ledger(config.ledger_path),
                                  TaxRunOptions{config.tax_year, config.fallback_usd_cad});
    write_tax_outputs(config, run);
    return run;
}

} // namespace acb
