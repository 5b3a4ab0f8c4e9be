#pragma once

#include "acb/pool_engine.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace acb {

constexpr int kCadPrecision = 2;
constexpr int kUnitPrecision = 8;

struct ReportRow {
    std::string time;
    std::string refid;
    std::string txid;
    std::string event_type;
    std::string asset;
    std::string units_in;
    std::string units_out;
    std::string proceeds_cad;
    std::string acb_disposed_cad;
    std::string gain_cad;
    std::string income_cad;
    std::string acb_added_cad;
    std::string pool_units_after;
    std::string pool_acb_cad_after;
    std::string notes;
};

struct TaxSummary {
    int tax_year = 0;
    Decimal fallback_usd_cad;
    Decimal total_proceeds_cad;
    Decimal total_acb_disposed_cad;
    Decimal net_gain_cad;
    Decimal total_reward_income_cad;
    std::size_t warning_count = 0;
    std::size_t row_count = 0;
    std::map<std::string, AssetPool> ending_pools;  // end of history, not end of year
};

struct TaxReport {
    std::vector<ReportRow> rows;
    TaxSummary summary;
};

// Output files written to temporary siblings and moved into place together
// by commit(). Temporaries left on destruction are removed, so a failed run
// leaves no partial output behind.
class StagedOutputs {
public:
    StagedOutputs() = default;
    StagedOutputs(const StagedOutputs&) = delete;
    StagedOutputs& operator=(const StagedOutputs&) = delete;
    ~StagedOutputs();

    void stage(const std::filesystem::path& path, const std::function<void(std::ostream&)>& writer);
    void commit();

    std::size_t size() const { return staged_.size(); }

private:
    struct StagedFile {
        std::filesystem::path target;
        std::filesystem::path temporary;
    };

    std::vector<StagedFile> staged_;
};

const std::vector<std::string>& report_columns();

// Report event type of a replayed event, or nullopt for events that change a
// pool without producing a row (priced transfers, internal transfers).
std::optional<std::string> report_event_type(const ClassifiedEvent& event);

ReportRow make_report_row(const ReplayRecord& record);

// Keeps the records dated inside `tax_year` and aggregates them. Pool columns
// carry the full-history running state.
TaxReport project_report(const std::vector<ReplayRecord>& records,
                         const std::map<std::string, AssetPool>& ending_pools,
                         int tax_year,
                         Decimal fallback_usd_cad);

void write_report_csv(std::ostream& output, const std::vector<ReportRow>& rows);

void print_summary(std::ostream& output, const TaxSummary& summary);

nlohmann::json summary_to_json(const TaxSummary& summary);

void write_summary_json(std::ostream& output, const TaxSummary& summary);

nlohmann::json record_to_json(const ReplayRecord& record);

// One JSON object per replayed event over the whole history.
void write_audit_journal(std::ostream& output, const std::vector<ReplayRecord>& records);

} // namespace acb
