#include "acb/config.hpp"

#include "kraken/timestamp.hpp"
#include "kraken/util.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace acb {
namespace {

std::optional<std::string> env_value(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::string flag_value(const std::vector<std::string>& args, std::size_t& i) {
    if (i + 1 >= args.size()) {
        throw std::invalid_argument("Missing value for " + args[i]);
    }
    return args[++i];
}

} // namespace

std::size_t load_env_file(const std::filesystem::path& path) {
    std::ifstream env_file(path);
    if (!env_file.is_open()) {
        return 0;
    }

    std::size_t count = 0;
    std::string line;
    while (std::getline(env_file, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }

        const auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        auto key = kraken::trim(line.substr(0, pos));
        auto value = kraken::trim(line.substr(pos + 1));

        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (!key.empty()) {
            setenv(key.c_str(), value.c_str(), 1);
            ++count;
        }
    }
    return count;
}

int default_tax_year() {
    const kraken::Timestamp now = std::chrono::time_point_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now());
    return kraken::utc_year(now) - 1;
}

int parse_tax_year(const std::string& text) {
    const auto trimmed = kraken::trim(text);
    std::size_t consumed = 0;
    int year = 0;
    try {
        year = std::stoi(trimmed, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid tax year: '" + text + "'");
    }
    if (consumed != trimmed.size() || year < 1970 || year > 9999) {
        throw std::invalid_argument("Invalid tax year: '" + text + "'");
    }
    return year;
}

Decimal parse_fx_rate(const std::string& text) {
    Decimal rate;
    try {
        rate = Decimal::from_string(text);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid fallback USD/CAD rate: '" + text + "'");
    }
    if (!rate.is_positive()) {
        throw std::invalid_argument("Fallback USD/CAD rate must be positive: '" + text + "'");
    }
    return rate;
}

RunConfig parse_run_config(const std::vector<std::string>& args) {
    RunConfig config;
    std::vector<std::string> positional;
    std::optional<std::string> summary_flag;
    std::optional<std::string> audit_flag;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        } else if (arg == "--summary-json") {
            summary_flag = flag_value(args, i);
        } else if (arg == "--audit-jsonl") {
            audit_flag = flag_value(args, i);
        } else if (arg == "--env") {
            config.env_file = flag_value(args, i);
        } else if (kraken::starts_with(arg, "--")) {
            throw std::invalid_argument("Unknown option " + arg);
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() > 4) {
        throw std::invalid_argument("Too many arguments");
    }

    if (const auto loaded = load_env_file(config.env_file); loaded > 0) {
        std::cout << "[Config] Loaded " << loaded << " variables from " << config.env_file.string() << std::endl;
    }

    std::optional<std::string> ledger = env_value("ACB_LEDGER");
    std::optional<std::string> year = env_value("ACB_TAX_YEAR");
    std::optional<std::string> output = env_value("ACB_OUTPUT");
    std::optional<std::string> fx = env_value("ACB_FALLBACK_USD_CAD");
    std::optional<std::string> summary = env_value("ACB_SUMMARY_JSON");
    std::optional<std::string> audit = env_value("ACB_AUDIT_JSONL");

    if (positional.size() > 0) ledger = positional[0];
    if (positional.size() > 1) year = positional[1];
    if (positional.size() > 2) output = positional[2];
    if (positional.size() > 3) fx = positional[3];
    if (summary_flag) summary = summary_flag;
    if (audit_flag) audit = audit_flag;

    if (ledger) {
        config.ledger_path = *ledger;
    }
    config.tax_year = year ? parse_tax_year(*year) : default_tax_year();
    config.output_path = output ? std::filesystem::path(*output)
                                : std::filesystem::path("kraken_tax_report_" + std::to_string(config.tax_year) + ".csv");
    if (fx) {
        config.fallback_usd_cad = parse_fx_rate(*fx);
    }
    if (summary) {
        config.summary_json_path = *summary;
    }
    if (audit) {
        config.audit_jsonl_path = *audit;
    }
    return config;
}

std::string usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [ledger.csv] [tax_year] [output.csv] [fallback_usd_cad]\n"
        << "       [--summary-json PATH] [--audit-jsonl PATH] [--env FILE]\n\n"
        << "Rebuilds pooled CAD cost bases from a Kraken ledger export and writes the\n"
        << "taxable events of one year.\n\n"
        << "Defaults: ledger kraken_ledgers.csv, tax year = last calendar year,\n"
        << "output kraken_tax_report_<year>.csv, fallback USD/CAD 1.3978.\n"
        << "Environment: ACB_LEDGER, ACB_TAX_YEAR, ACB_OUTPUT, ACB_FALLBACK_USD_CAD,\n"
        << "             ACB_SUMMARY_JSON, ACB_AUDIT_JSONL (also read from .env).\n";
    return oss.str();
}

} // namespace acb
