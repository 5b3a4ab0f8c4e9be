#include "acb/report.hpp"

#include "kraken/csv.hpp"
#include "kraken/util.hpp"

#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <system_error>

namespace acb {
namespace {

std::string cad(const Decimal& value) {
    return value.to_fixed(kCadPrecision);
}

std::string units(const Decimal& value) {
    return value.round(kUnitPrecision).to_string();
}

std::string notes_for(const ClassifiedEvent& event) {
    std::vector<std::string> notes;
    if (event.unpriced) {
        notes.emplace_back("Deposit treated as transfer-in with unknown ACB; assumed 0 CAD basis");
    }
    if (event.kind == EventKind::WithdrawalFeeDisposition) {
        notes.emplace_back("Withdrawal fee paid in kind; valued at " + event.valuation_source);
    }
    if (event.used_fallback_fx) {
        notes.emplace_back("USD/CAD fallback rate used");
    }
    return kraken::join(notes, "; ");
}

nlohmann::json pool_to_json(const AssetPool& pool) {
    nlohmann::json json;
    json["units"] = units(pool.units);
    json["acb_cad"] = cad(pool.total_acb_cad);
    json["avg_cost_cad"] = cad(pool.average_cost());
    return json;
}

} // namespace

StagedOutputs::~StagedOutputs() {
    for (const auto& file : staged_) {
        std::error_code ec;
        std::filesystem::remove(file.temporary, ec);
    }
}

void StagedOutputs::stage(const std::filesystem::path& path, const std::function<void(std::ostream&)>& writer) {
    const auto parent = path.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }

    auto temporary = path;
    temporary += ".tmp";
    staged_.push_back(StagedFile{path, temporary});

    std::ofstream output(temporary, std::ios::trunc);
    if (!output.good()) {
        throw std::runtime_error("Failed to open " + temporary.string() + " for writing");
    }
    writer(output);
    output.flush();
    if (!output.good()) {
        throw std::runtime_error("Failed to write " + temporary.string());
    }
}

void StagedOutputs::commit() {
    for (const auto& file : staged_) {
        std::filesystem::rename(file.temporary, file.target);
    }
    staged_.clear();
}

const std::vector<std::string>& report_columns() {
    static const std::vector<std::string> columns = {
        "time", "refid", "txid", "event_type", "asset",
        "units_in", "units_out", "proceeds_cad", "acb_disposed_cad", "gain_cad",
        "income_cad", "acb_added_cad", "pool_units_after", "pool_acb_cad_after", "notes"
    };
    return columns;
}

std::optional<std::string> report_event_type(const ClassifiedEvent& event) {
    switch (event.kind) {
        case EventKind::TradeDisposition:
            return std::string("trade_disposition");
        case EventKind::TradeAcquisition:
            return std::string("trade_acquisition");
        case EventKind::RewardIncome:
            return std::string("earn_reward_income");
        case EventKind::WithdrawalFeeDisposition:
            return std::string("withdrawal_fee_disposition");
        case EventKind::DepositTransferIn:
            if (event.unpriced) {
                return std::string("warning_unpriced_transfer_in");
            }
            return std::nullopt;
        case EventKind::InternalTransfer:
        case EventKind::WithdrawalTransferOut:
            return std::nullopt;
    }
    return std::nullopt;
}

ReportRow make_report_row(const ReplayRecord& record) {
    const auto& event = record.event;
    const auto& outcome = record.outcome;

    ReportRow row;
    row.time = kraken::format_timestamp(event.time);
    row.refid = event.refid;
    row.txid = event.txid;
    row.event_type = report_event_type(event).value_or(event_kind_name(event.kind));
    row.asset = event.asset;
    row.notes = notes_for(event);

    const bool pooled = event.asset != kBaseCurrency;
    if (pooled) {
        row.pool_units_after = units(outcome.pool_units_after);
        row.pool_acb_cad_after = cad(outcome.pool_acb_cad_after);
    }

    switch (event.kind) {
        case EventKind::TradeDisposition:
        case EventKind::WithdrawalFeeDisposition:
            row.units_out = units(outcome.units_out);
            row.proceeds_cad = cad(outcome.proceeds_cad);
            row.acb_disposed_cad = cad(outcome.disposed_cost_cad);
            row.gain_cad = cad(outcome.gain_cad);
            break;
        case EventKind::TradeAcquisition:
        case EventKind::DepositTransferIn:
            row.units_in = units(outcome.units_in);
            row.acb_added_cad = cad(outcome.acb_added_cad);
            break;
        case EventKind::RewardIncome:
            row.units_in = units(outcome.units_in);
            row.income_cad = cad(outcome.income_cad);
            if (pooled) {
                row.acb_added_cad = cad(outcome.acb_added_cad);
            }
            break;
        case EventKind::WithdrawalTransferOut:
            row.units_out = units(outcome.units_out);
            break;
        case EventKind::InternalTransfer:
            break;
    }
    return row;
}

TaxReport project_report(const std::vector<ReplayRecord>& records,
                         const std::map<std::string, AssetPool>& ending_pools,
                         int tax_year,
                         Decimal fallback_usd_cad) {
    TaxReport report;
    auto& summary = report.summary;
    summary.tax_year = tax_year;
    summary.fallback_usd_cad = fallback_usd_cad;
    summary.ending_pools = ending_pools;

    for (const auto& record : records) {
        const auto& event = record.event;
        if (kraken::utc_year(event.time) != tax_year) {
            continue;
        }

        switch (event.kind) {
            case EventKind::TradeDisposition:
            case EventKind::WithdrawalFeeDisposition:
                summary.total_proceeds_cad += record.outcome.proceeds_cad;
                summary.total_acb_disposed_cad += record.outcome.disposed_cost_cad;
                summary.net_gain_cad += record.outcome.gain_cad;
                break;
            case EventKind::RewardIncome:
                summary.total_reward_income_cad += record.outcome.income_cad;
                break;
            case EventKind::DepositTransferIn:
                if (event.unpriced) {
                    ++summary.warning_count;
                }
                break;
            case EventKind::TradeAcquisition:
            case EventKind::InternalTransfer:
            case EventKind::WithdrawalTransferOut:
                break;
        }

        if (report_event_type(event)) {
            report.rows.push_back(make_report_row(record));
        }
    }

    summary.row_count = report.rows.size();
    return report;
}

void write_report_csv(std::ostream& output, const std::vector<ReportRow>& rows) {
    kraken::write_csv_row(output, report_columns());
    for (const auto& row : rows) {
        kraken::write_csv_row(output, {
            row.time, row.refid, row.txid, row.event_type, row.asset,
            row.units_in, row.units_out, row.proceeds_cad, row.acb_disposed_cad, row.gain_cad,
            row.income_cad, row.acb_added_cad, row.pool_units_after, row.pool_acb_cad_after, row.notes
        });
    }
}

void print_summary(std::ostream& output, const TaxSummary& summary) {
    output << "\n=== CANADIAN CRYPTO TAX SUMMARY (LEDGER / ACB) ===\n";
    output << "Tax year: " << summary.tax_year << '\n';
    output << "Fallback USD/CAD FX: " << summary.fallback_usd_cad << '\n';
    output << "Total proceeds (CAD): " << cad(summary.total_proceeds_cad) << '\n';
    output << "Total ACB disposed (CAD): " << cad(summary.total_acb_disposed_cad) << '\n';
    output << "Net capital gain/loss (CAD): " << cad(summary.net_gain_cad) << '\n';
    output << "Total reward income (CAD): " << cad(summary.total_reward_income_cad) << '\n';
    output << "Warnings (transfer-in assumed 0 ACB): " << summary.warning_count << '\n';

    output << "\n=== ENDING POOLS (units + ACB) ===\n";
    output << std::left << std::setw(10) << "asset"
           << std::right << std::setw(22) << "units"
           << std::setw(18) << "ACB (CAD)"
           << std::setw(18) << "avg cost (CAD)" << '\n';
    for (const auto& [asset, pool] : summary.ending_pools) {
        output << std::left << std::setw(10) << asset
               << std::right << std::setw(22) << units(pool.units)
               << std::setw(18) << cad(pool.total_acb_cad)
               << std::setw(18) << cad(pool.average_cost()) << '\n';
    }
    output << std::flush;
}

nlohmann::json summary_to_json(const TaxSummary& summary) {
    nlohmann::json json;
    json["tax_year"] = summary.tax_year;
    json["fallback_usd_cad"] = summary.fallback_usd_cad.to_string();
    json["total_proceeds_cad"] = cad(summary.total_proceeds_cad);
    json["total_acb_disposed_cad"] = cad(summary.total_acb_disposed_cad);
    json["net_gain_cad"] = cad(summary.net_gain_cad);
    json["total_reward_income_cad"] = cad(summary.total_reward_income_cad);
    json["warning_count"] = summary.warning_count;
    json["row_count"] = summary.row_count;

    nlohmann::json pools = nlohmann::json::object();
    for (const auto& [asset, pool] : summary.ending_pools) {
        pools[asset] = pool_to_json(pool);
    }
    json["ending_pools"] = std::move(pools);
    return json;
}

void write_summary_json(std::ostream& output, const TaxSummary& summary) {
    output << summary_to_json(summary).dump(2) << '\n';
}

nlohmann::json record_to_json(const ReplayRecord& record) {
    const auto& event = record.event;
    const auto& outcome = record.outcome;

    nlohmann::json json;
    json["seq"] = event.sequence;
    json["time"] = kraken::format_timestamp(event.time);
    json["refid"] = event.refid;
    json["txid"] = event.txid;
    json["row"] = event.origin_row;
    json["kind"] = event_kind_name(event.kind);
    json["taxable"] = is_taxable(event.kind);
    json["asset"] = event.asset;
    json["quantity"] = event.quantity.to_string();
    json["cadValue"] = event.cad_value.to_string();
    json["valuation"] = event.valuation_source;
    json["fallbackFx"] = event.used_fallback_fx;
    json["unpriced"] = event.unpriced;
    json["proceeds"] = outcome.proceeds_cad.to_string();
    json["disposedCost"] = outcome.disposed_cost_cad.to_string();
    json["gain"] = outcome.gain_cad.to_string();
    json["income"] = outcome.income_cad.to_string();
    json["acbAdded"] = outcome.acb_added_cad.to_string();
    json["poolUnits"] = outcome.pool_units_after.to_string();
    json["poolAcb"] = outcome.pool_acb_cad_after.to_string();
    return json;
}

void write_audit_journal(std::ostream& output, const std::vector<ReplayRecord>& records) {
    for (const auto& record : records) {
        output << record_to_json(record).dump() << '\n';
    }
}

} // namespace acb
