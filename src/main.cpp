#include "acb/config.hpp"
#include "acb/price_resolver.hpp"
#include "acb/report.hpp"
#include "acb/tax_engine.hpp"
#include "kraken/ledger.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? std::filesystem::path(argv[0]).filename().string() : "kraken_acb";
    const std::vector<std::string> args(argv + 1, argv + argc);

    acb::RunConfig config;
    try {
        config = acb::parse_run_config(args);
    } catch (const std::invalid_argument& ex) {
        std::cerr << "[Config] " << ex.what() << "\n\n" << acb::usage(program);
        return 2;
    }
    if (config.show_help) {
        std::cout << acb::usage(program);
        return 0;
    }

    try {
        const auto run = acb::run_tax_job(config);
        acb::print_summary(std::cout, run.report.summary);
        std::cout << "\nWrote tax report: " << config.output_path.string() << std::endl;
    } catch (const kraken::MalformedRow& ex) {
        std::cerr << "[Ledger] " << ex.what() << std::endl;
        return 1;
    } catch (const kraken::TradeGroupError& ex) {
        std::cerr << "[Ledger] " << ex.what() << std::endl;
        return 1;
    } catch (const acb::NoPriorPrice& ex) {
        std::cerr << "[Prices] " << ex.what() << std::endl;
        return 1;
    } catch (const acb::NegativePoolError& ex) {
        std::cerr << "[Replay] " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "[Report] Unexpected error: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
