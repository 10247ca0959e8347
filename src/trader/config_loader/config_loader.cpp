#include "config_loader.hpp"
#include "configs/system_config.hpp"
#include "logging/logger/logging_macros.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>

using RegimeTrader::Logging::log_message;

namespace {
    inline std::string trim(const std::string& input_string) {
        const char* whitespace_chars = " \t\r\n";
        auto begin_position = input_string.find_first_not_of(whitespace_chars);
        auto end_position = input_string.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return input_string.substr(begin_position, end_position - begin_position + 1);
    }

    inline bool to_bool(const std::string& input_value) {
        std::string normalized_value = input_value;
        std::transform(normalized_value.begin(), normalized_value.end(), normalized_value.begin(), ::tolower);
        if (normalized_value == "1" || normalized_value == "true" || normalized_value == "yes") return true;
        if (normalized_value == "0" || normalized_value == "false" || normalized_value == "no") return false;
        throw std::runtime_error("Invalid boolean value: '" + input_value + "'");
    }

    // std::stoi accepts "12abc"; config values must be consumed entirely
    inline int to_int(const std::string& input_value) {
        size_t parsed_length = 0;
        int parsed_value = std::stoi(input_value, &parsed_length);
        if (parsed_length != input_value.size()) {
            throw std::runtime_error("Invalid integer value: '" + input_value + "'");
        }
        return parsed_value;
    }

    inline double to_double(const std::string& input_value) {
        size_t parsed_length = 0;
        double parsed_value = std::stod(input_value, &parsed_length);
        if (parsed_length != input_value.size()) {
            throw std::runtime_error("Invalid numeric value: '" + input_value + "'");
        }
        return parsed_value;
    }
}

bool load_config_from_csv(RegimeTrader::Config::SystemConfig& cfg, const std::string& csv_path) {
    std::ifstream config_file_stream(csv_path);
    if (!config_file_stream.is_open()) {
        log_message("ERROR: Cannot open config file: " + csv_path, "");
        return false;
    }

    std::string config_line_string;
    int config_line_number = 0;
    while (std::getline(config_file_stream, config_line_string)) {
        config_line_number++;
        config_line_string = trim(config_line_string);
        if (config_line_string.empty() || config_line_string[0] == '#') continue;

        std::stringstream config_line_stream(config_line_string);
        std::string config_key_string, config_value_string;
        if (!std::getline(config_line_stream, config_key_string, ',')) continue;
        if (!std::getline(config_line_stream, config_value_string)) continue;
        config_key_string = trim(config_key_string);
        config_value_string = trim(config_value_string);

        try {
            // Strategy
            if (config_key_string == "strategy.symbol") cfg.strategy.symbol = config_value_string;
            else if (config_key_string == "strategy.channel_type") cfg.strategy.channel_type = RegimeTrader::Config::ChannelTypeParser::parse_type(config_value_string);
            else if (config_key_string == "strategy.low_threshold") cfg.strategy.low_threshold = to_double(config_value_string);
            else if (config_key_string == "strategy.high_threshold") cfg.strategy.high_threshold = to_double(config_value_string);
            else if (config_key_string == "strategy.between_factor") cfg.strategy.between_factor = to_double(config_value_string);
            else if (config_key_string == "strategy.max_orders") cfg.strategy.max_orders = to_int(config_value_string);
            else if (config_key_string == "strategy.entry_allocation") cfg.strategy.entry_allocation = to_double(config_value_string);
            else if (config_key_string == "strategy.enable_reversion_short") cfg.strategy.enable_reversion_short = to_bool(config_value_string);
            else if (config_key_string == "strategy.enable_reversion_long") cfg.strategy.enable_reversion_long = to_bool(config_value_string);
            else if (config_key_string == "strategy.enable_breakout_long") cfg.strategy.enable_breakout_long = to_bool(config_value_string);
            else if (config_key_string == "strategy.enable_breakout_short") cfg.strategy.enable_breakout_short = to_bool(config_value_string);

            // Regression channel
            else if (config_key_string == "linreg.count") cfg.indicators.linear_regression.count = to_int(config_value_string);
            else if (config_key_string == "linreg.upper_deviation") cfg.indicators.linear_regression.upper_deviation = to_double(config_value_string);
            else if (config_key_string == "linreg.lower_deviation") cfg.indicators.linear_regression.lower_deviation = to_double(config_value_string);

            // Bollinger bands
            else if (config_key_string == "bollinger.length") cfg.indicators.bollinger.length = to_int(config_value_string);
            else if (config_key_string == "bollinger.multiplier") cfg.indicators.bollinger.multiplier = to_double(config_value_string);

            // Trend quality
            else if (config_key_string == "trend_quality.fast_length") cfg.indicators.trend_quality.fast_length = to_int(config_value_string);
            else if (config_key_string == "trend_quality.slow_length") cfg.indicators.trend_quality.slow_length = to_int(config_value_string);
            else if (config_key_string == "trend_quality.trend_length") cfg.indicators.trend_quality.trend_length = to_int(config_value_string);
            else if (config_key_string == "trend_quality.noise_length") cfg.indicators.trend_quality.noise_length = to_int(config_value_string);
            else if (config_key_string == "trend_quality.correction_factor") cfg.indicators.trend_quality.correction_factor = to_double(config_value_string);
            else if (config_key_string == "trend_quality.noise_type") cfg.indicators.trend_quality.noise_mode = RegimeTrader::Config::NoiseModeParser::parse_mode(config_value_string);

            // Backtest
            else if (config_key_string == "backtest.bars_file") cfg.backtest.bars_file = config_value_string;
            else if (config_key_string == "backtest.report_file") cfg.backtest.report_file = config_value_string;
            else if (config_key_string == "backtest.initial_cash") cfg.backtest.initial_cash = to_double(config_value_string);
            else if (config_key_string == "backtest.consolidation_minutes") cfg.backtest.consolidation_minutes = to_int(config_value_string);

            // Logging
            else if (config_key_string == "logging.log_file") cfg.logging.log_file = config_value_string;
            else if (config_key_string == "logging.log_directory") cfg.logging.log_directory = config_value_string;
            else if (config_key_string == "logging.console_output") cfg.logging.console_output = to_bool(config_value_string);
            else if (config_key_string == "logging.log_every_bar") cfg.logging.log_every_bar = to_bool(config_value_string);
            else if (config_key_string == "logging.enable_csv_trade_log") cfg.logging.enable_csv_trade_log = to_bool(config_value_string);
            else if (config_key_string == "logging.enable_csv_bars_log") cfg.logging.enable_csv_bars_log = to_bool(config_value_string);

            else {
                log_message("WARNING: Unknown config key '" + config_key_string + "' in " + csv_path + ":" + std::to_string(config_line_number), "");
            }
        } catch (const std::exception& parse_exception_error) {
            log_message("ERROR: Invalid value for '" + config_key_string + "' in " + csv_path + ":" + std::to_string(config_line_number) +
                        " - " + parse_exception_error.what(), "");
            return false;
        }
    }

    return true;
}

bool validate_config(const RegimeTrader::Config::SystemConfig& config, std::string& error_message) {
    const RegimeTrader::Config::StrategyConfig& strategy = config.strategy;
    const RegimeTrader::Config::IndicatorConfig& indicators = config.indicators;

    if (strategy.symbol.empty()) {
        error_message = "strategy.symbol is required";
        return false;
    }
    if (!(strategy.low_threshold < strategy.high_threshold)) {
        error_message = "strategy.low_threshold must be below strategy.high_threshold";
        return false;
    }
    if (strategy.between_factor < 0.0) {
        error_message = "strategy.between_factor must be >= 0";
        return false;
    }
    if (strategy.max_orders < 1) {
        error_message = "strategy.max_orders must be >= 1";
        return false;
    }
    if (strategy.entry_allocation <= 0.0 || strategy.entry_allocation > 1.0) {
        error_message = "strategy.entry_allocation must be in (0, 1]";
        return false;
    }

    if (indicators.linear_regression.count < 2) {
        error_message = "linreg.count must be >= 2";
        return false;
    }
    if (indicators.bollinger.length < 1) {
        error_message = "bollinger.length must be >= 1";
        return false;
    }
    if (indicators.trend_quality.fast_length < 1 || indicators.trend_quality.slow_length < 1) {
        error_message = "trend_quality.fast_length and trend_quality.slow_length must be >= 1";
        return false;
    }
    if (indicators.trend_quality.trend_length < 1) {
        error_message = "trend_quality.trend_length must be >= 1";
        return false;
    }
    if (indicators.trend_quality.noise_length < 1) {
        error_message = "trend_quality.noise_length must be >= 1";
        return false;
    }
    if (indicators.trend_quality.correction_factor <= 0.0) {
        error_message = "trend_quality.correction_factor must be > 0";
        return false;
    }

    if (config.backtest.initial_cash <= 0.0) {
        error_message = "backtest.initial_cash must be > 0";
        return false;
    }
    if (config.backtest.consolidation_minutes < 1) {
        error_message = "backtest.consolidation_minutes must be >= 1";
        return false;
    }

    return true;
}

int load_system_config(RegimeTrader::Config::SystemConfig& config, const std::string& csv_path) {
    if (!load_config_from_csv(config, csv_path)) {
        log_message("ERROR: Failed to load config CSV from " + csv_path, "");
        return 1;
    }

    std::string validation_error;
    if (!validate_config(config, validation_error)) {
        log_message("ERROR: Configuration validation failed: " + validation_error, "");
        return 1;
    }

    return 0;
}
