#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include "strategy_config.hpp"
#include "indicator_config.hpp"
#include "backtest_config.hpp"
#include "logging_config.hpp"

namespace RegimeTrader {
namespace Config {

/**
 * Main trading system configuration.
 * Strategy config holds thresholds, pyramiding and leg switches; indicator config
 * holds the channel and trend quality parameters.
 */
struct SystemConfig {
    SystemConfig() {}

    StrategyConfig strategy;           // Regime thresholds, sizing, leg enablement
    IndicatorConfig indicators;        // Regression channel, Bollinger bands, trend quality
    BacktestConfig backtest;           // Bar replay and paper account
    LoggingConfig logging;             // Logging configuration
};

} // namespace Config
} // namespace RegimeTrader

#endif // SYSTEM_CONFIG_HPP
