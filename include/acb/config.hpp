#pragma once

#include "acb/decimal.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace acb {

struct RunConfig {
    std::filesystem::path ledger_path = "kraken_ledgers.csv";
    int tax_year = 0;
    std::filesystem::path output_path;
    Decimal fallback_usd_cad = Decimal::from_string("1.3978");
    std::optional<std::filesystem::path> summary_json_path;
    std::optional<std::filesystem::path> audit_jsonl_path;
    std::filesystem::path env_file = ".env";
    bool show_help = false;
};

// KEY=VALUE lines into the process environment; '#' comments and blank
// lines are skipped, surrounding double quotes stripped. Missing file is not
// an error. Returns the number of variables set.
std::size_t load_env_file(const std::filesystem::path& path);

// Current UTC year minus one.
int default_tax_year();

int parse_tax_year(const std::string& text);

Decimal parse_fx_rate(const std::string& text);

// Positional: [ledger.csv] [tax_year] [output.csv] [fallback_usd_cad].
// Flags: --summary-json PATH, --audit-jsonl PATH, --env FILE, --help.
// Environment (ACB_LEDGER, ACB_TAX_YEAR, ACB_OUTPUT, ACB_FALLBACK_USD_CAD,
// ACB_SUMMARY_JSON, ACB_AUDIT_JSONL) supplies defaults. Throws
// std::invalid_argument on bad input.
RunConfig parse_run_config(const std::vector<std::string>& args);

std::string usage(const std::string& program);

} // namespace acb
