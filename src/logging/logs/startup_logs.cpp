#include "startup_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include <iomanip>
#include <sstream>

namespace RegimeTrader {
namespace Logging {

namespace {
    std::string format_number(double number_value, int precision_digits) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(precision_digits) << number_value;
        return oss.str();
    }

    std::string format_flag(bool flag_value) {
        return flag_value ? "on" : "off";
    }
}

void StartupLogs::log_application_header(const std::string& config_path, const std::string& bars_path) {
    LOG_RUN_HEADER("REGIME TRADER");
    LOG_STARTUP_SECTION_HEADER("INPUTS");
    LOG_STARTUP_CONTENT("Config file: " + config_path);
    LOG_STARTUP_CONTENT("Bars file:   " + bars_path);
    LOG_STARTUP_SEPARATOR();
}

void StartupLogs::log_configuration(const Config::SystemConfig& config) {
    const Config::StrategyConfig& strategy = config.strategy;
    const Config::IndicatorConfig& indicators = config.indicators;

    LOG_STARTUP_SECTION_HEADER("STRATEGY");
    LOG_STARTUP_CONTENT("Symbol: " + strategy.symbol + "   Channel: " + Config::ChannelTypeParser::type_to_string(strategy.channel_type));
    LOG_STARTUP_CONTENT("Thresholds: low " + format_number(strategy.low_threshold, 2) + " / high " + format_number(strategy.high_threshold, 2) +
                        "   Between factor: " + format_number(strategy.between_factor, 5));
    LOG_STARTUP_CONTENT("Max orders per leg: " + std::to_string(strategy.max_orders) + "   Entry allocation: " + format_number(strategy.entry_allocation, 2));
    LOG_STARTUP_CONTENT("Legs: reversion short " + format_flag(strategy.enable_reversion_short) +
                        ", reversion long " + format_flag(strategy.enable_reversion_long) +
                        ", breakout long " + format_flag(strategy.enable_breakout_long) +
                        ", breakout short " + format_flag(strategy.enable_breakout_short));
    LOG_STARTUP_SEPARATOR();

    LOG_STARTUP_SECTION_HEADER("INDICATORS");
    if (strategy.channel_type == Config::ChannelType::LINEAR_REGRESSION) {
        LOG_STARTUP_CONTENT("Regression channel: count " + std::to_string(indicators.linear_regression.count) +
                            ", deviations +" + format_number(indicators.linear_regression.upper_deviation, 2) +
                            "/-" + format_number(indicators.linear_regression.lower_deviation, 2));
    } else {
        LOG_STARTUP_CONTENT("Bollinger bands: length " + std::to_string(indicators.bollinger.length) +
                            ", multiplier " + format_number(indicators.bollinger.multiplier, 2));
    }
    LOG_STARTUP_CONTENT("Trend quality: fast " + std::to_string(indicators.trend_quality.fast_length) +
                        ", slow " + std::to_string(indicators.trend_quality.slow_length) +
                        ", trend " + std::to_string(indicators.trend_quality.trend_length) +
                        ", noise " + std::to_string(indicators.trend_quality.noise_length) +
                        " x" + format_number(indicators.trend_quality.correction_factor, 2) +
                        " (" + Config::NoiseModeParser::mode_to_string(indicators.trend_quality.noise_mode) + ")");
    LOG_STARTUP_SEPARATOR();

    LOG_STARTUP_SECTION_HEADER("BACKTEST");
    LOG_STARTUP_CONTENT("Initial cash: $" + format_number(config.backtest.initial_cash, 2) +
                        "   Consolidation: " + std::to_string(config.backtest.consolidation_minutes) + " min");
    LOG_STARTUP_SEPARATOR();
}

void StartupLogs::log_run_folder(const std::string& run_folder) {
    LOG_STARTUP_CONTENT("Run folder: " + run_folder);
}

void StartupLogs::log_configuration_error(const std::string& error_message) {
    log_message("ERROR: Configuration validation failed: " + error_message, "");
}

} // namespace Logging
} // namespace RegimeTrader
