// main.cpp
#include "configs/system_config.hpp"
#include "trader/config_loader/config_loader.hpp"
#include "trader/coordinators/backtest_coordinator.hpp"
#include "trader/market_data/market_bars_loader.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/startup_logs.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using RegimeTrader::Config::SystemConfig;
using namespace RegimeTrader;

// =============================================================================
// CONSTANTS
// =============================================================================
namespace {
    const std::string DEFAULT_CONFIG_PATH = "config/strategy_config.csv";

    void print_usage(const char* program_name) {
        std::cerr << "Usage: " << program_name << " [config.csv] [bars.csv]" << std::endl;
    }
}

// =============================================================================
// MAIN APPLICATION ENTRY POINT
// =============================================================================

int main(int argc, char* argv[]) {
    if (argc > 3) {
        print_usage(argv[0]);
        return 1;
    }

    Logging::LoggingContext logging_context;
    Logging::set_logging_context(logging_context);

    int exit_code = 0;
    try {
        std::string config_path = argc > 1 ? argv[1] : DEFAULT_CONFIG_PATH;

        SystemConfig system_config;
        if (load_system_config(system_config, config_path) != 0) {
            Logging::clear_logging_context();
            return 1;
        }
        if (argc > 2) {
            system_config.backtest.bars_file = argv[2];
        }

        Logging::initialize_application_foundation(system_config);
        if (system_config.logging.enable_csv_bars_log) {
            Logging::initialize_csv_bars_logger(system_config.logging.log_file);
        }
        if (system_config.logging.enable_csv_trade_log) {
            Logging::initialize_csv_trade_logger(system_config.logging.log_file);
        }

        Logging::StartupLogs::log_application_header(config_path, system_config.backtest.bars_file);
        Logging::StartupLogs::log_configuration(system_config);
        Logging::StartupLogs::log_run_folder(logging_context.run_folder);

        Core::MarketBarsLoader bars_loader(system_config.backtest.bars_file);
        std::vector<Core::Bar> input_bars = bars_loader.load_bars();

        Core::BacktestCoordinator backtest_coordinator(system_config);
        Core::BacktestResult backtest_result = backtest_coordinator.run(input_bars);

        std::string report_path = logging_context.run_folder + "/" + std::filesystem::path(system_config.backtest.report_file).filename().string();
        Core::BacktestCoordinator::write_run_report(Core::BacktestCoordinator::build_run_report(system_config, backtest_result), report_path);
        Logging::log_message("Run report written to " + report_path, "");
    } catch (const Config::ConfigurationError& configuration_error) {
        Logging::StartupLogs::log_configuration_error(configuration_error.what());
        exit_code = 1;
    } catch (const std::exception& exception_error) {
        Logging::log_message(std::string("Fatal error: ") + exception_error.what(), "");
        exit_code = 1;
    }

    Logging::shutdown_application_foundation();
    Logging::clear_logging_context();
    return exit_code;
}
