#ifndef BACKTEST_CONFIG_HPP
#define BACKTEST_CONFIG_HPP

#include <string>

namespace RegimeTrader {
namespace Config {

struct BacktestConfig {
    std::string bars_file = "data/bars.csv";         // timestamp,open,high,low,close,volume
    std::string report_file = "run_report.json";     // Written inside the run folder
    double initial_cash = 100000.0;                  // Starting paper account equity
    int consolidation_minutes = 5;                   // Input bars are merged into bars of this length
};

} // namespace Config
} // namespace RegimeTrader

#endif // BACKTEST_CONFIG_HPP
