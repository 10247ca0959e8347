#ifndef TRADING_LOGS_HPP
#define TRADING_LOGS_HPP

#include "configs/system_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include <string>
#include <vector>

using RegimeTrader::Config::SystemConfig;

namespace RegimeTrader {
namespace Logging {

/**
 * Per-bar trading output: signal inputs, orders and ledger state.
 */
class TradingLogs {
public:
    // Formatting helpers
    static std::string format_currency(double amount);
    static std::string format_price(double price);
    static std::string format_quantity(double quantity);
    static std::string format_ratio(double ratio);

    // Per-bar analysis
    static void log_signal_table(const std::string& symbol, const std::string& bar_timestamp,
                                 const Core::SignalInputs& signal_inputs, const Config::StrategyConfig& strategy_config);
    static void log_indicators_warming_up(const std::string& bar_timestamp, size_t bars_processed, int warm_up_bars);

    // Orders and ledger
    static void log_order_actions(const std::vector<Core::OrderAction>& order_actions, const Core::PositionLedger& position_ledger);
    static void log_ledger_summary(const Core::PositionLedger& position_ledger);
    static void log_entry_skipped(Core::PositionLeg position_leg, const std::string& reason);
    static void log_partial_close(Core::PositionLeg position_leg, double requested_quantity, double filled_quantity);

    // Run lifecycle
    static void log_replay_started(const std::string& symbol, size_t input_bar_count, int consolidation_minutes);
    static void log_run_summary(size_t bars_processed, size_t orders_placed, double initial_equity,
                                double final_equity, double final_position);
};

} // namespace Logging
} // namespace RegimeTrader

#endif // TRADING_LOGS_HPP
