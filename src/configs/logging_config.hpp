// LoggingConfig.hpp
#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

namespace RegimeTrader {
namespace Config {

struct LoggingConfig {
    std::string log_file = "regime_trader.log";
    std::string log_directory = "runtime_logs";
    bool console_output = true;
    bool log_every_bar = false;                      // Signal table for bars that produced no order
    bool enable_csv_trade_log = true;
    bool enable_csv_bars_log = true;
};

} // namespace Config
} // namespace RegimeTrader

#endif // LOGGING_CONFIG_HPP
