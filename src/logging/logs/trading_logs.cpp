#include "trading_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include <iomanip>
#include <sstream>
#include <cmath>
#include <string>

namespace RegimeTrader {
namespace Logging {

using RegimeTrader::Core::OrderAction;
using RegimeTrader::Core::PositionLedger;
using RegimeTrader::Core::PositionLeg;
using RegimeTrader::Core::SignalInputs;

std::string TradingLogs::format_currency(double amount) {
    std::ostringstream oss;
    oss << "$" << std::fixed << std::setprecision(2) << amount;
    return oss.str();
}

std::string TradingLogs::format_price(double price) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4) << price;
    return oss.str();
}

std::string TradingLogs::format_quantity(double quantity) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(0) << quantity;
    return oss.str();
}

std::string TradingLogs::format_ratio(double ratio) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << ratio;
    return oss.str();
}

void TradingLogs::log_signal_table(const std::string& symbol, const std::string& bar_timestamp,
                                   const SignalInputs& signal_inputs, const Config::StrategyConfig& strategy_config) {
    LOG_SIGNAL_ANALYSIS_HEADER(symbol);
    TABLE_HEADER_30("Bar", bar_timestamp);
    TABLE_ROW_30("Close", format_price(signal_inputs.close_price));
    TABLE_ROW_30("Upper bound", format_price(signal_inputs.upper_bound));
    TABLE_ROW_30("Lower bound", format_price(signal_inputs.lower_bound));
    TABLE_SEPARATOR_30();
    TABLE_ROW_30("Trend quality", format_ratio(signal_inputs.trend_quality));
    TABLE_ROW_30("Band", "[" + format_ratio(strategy_config.low_threshold) + ", " + format_ratio(strategy_config.high_threshold) + "]");

    std::string regime_label = "RANGING";
    if (signal_inputs.trend_quality > strategy_config.high_threshold) {
        regime_label = "STRONG UPTREND";
    } else if (signal_inputs.trend_quality < strategy_config.low_threshold) {
        regime_label = "STRONG DOWNTREND";
    }
    TABLE_ROW_30("Regime", regime_label);
    TABLE_FOOTER_30();
}

void TradingLogs::log_indicators_warming_up(const std::string& bar_timestamp, size_t bars_processed, int warm_up_bars) {
    LOG_CONTENT("Indicators warming up at " + bar_timestamp + " (" + std::to_string(bars_processed) + "/" + std::to_string(warm_up_bars) + " bars)");
}

void TradingLogs::log_order_actions(const std::vector<OrderAction>& order_actions, const PositionLedger& position_ledger) {
    if (order_actions.empty()) {
        return;
    }

    LOG_ORDER_EXECUTION_HEADER();
    for (const OrderAction& order_action : order_actions) {
        std::ostringstream order_stream;
        order_stream << Core::order_intent_to_string(order_action.order_intent) << " "
                     << Core::position_leg_to_string(order_action.position_leg)
                     << " | " << order_action.order_tag
                     << " | qty " << format_quantity(order_action.requested_quantity)
                     << " filled " << format_quantity(order_action.filled_quantity)
                     << " @ " << format_price(order_action.reference_price);
        LOG_ORDER_RESULT(order_stream.str());
    }
    log_ledger_summary(position_ledger);
}

void TradingLogs::log_ledger_summary(const PositionLedger& position_ledger) {
    LOG_POSITION_LEDGER_HEADER();
    const PositionLeg ledger_legs[] = {PositionLeg::REVERSION_SHORT, PositionLeg::REVERSION_LONG, PositionLeg::BREAKOUT_LONG, PositionLeg::BREAKOUT_SHORT};
    for (PositionLeg position_leg : ledger_legs) {
        const Core::LegState& leg_state = position_ledger.get_leg(position_leg);
        LOG_CONTENT(Core::position_leg_to_string(position_leg) + ": " + format_quantity(leg_state.shares) + " shares, " + std::to_string(leg_state.order_count) + " orders");
    }
    LOG_CONTENT("NET: " + format_quantity(position_ledger.net_position()));
    LOG_SECTION_FOOTER();
}

void TradingLogs::log_entry_skipped(PositionLeg position_leg, const std::string& reason) {
    log_message("WARNING: " + Core::position_leg_to_string(position_leg) + " entry skipped - " + reason, "");
}

void TradingLogs::log_partial_close(PositionLeg position_leg, double requested_quantity, double filled_quantity) {
    log_message("WARNING: " + Core::position_leg_to_string(position_leg) + " close filled " + format_quantity(filled_quantity) +
                " of " + format_quantity(requested_quantity) + " - leg reset regardless", "");
}

void TradingLogs::log_replay_started(const std::string& symbol, size_t input_bar_count, int consolidation_minutes) {
    LOG_RUN_HEADER("BACKTEST REPLAY - " + symbol);
    log_message("Input bars: " + std::to_string(input_bar_count) + ", consolidated to " + std::to_string(consolidation_minutes) + "-minute bars", "");
}

void TradingLogs::log_run_summary(size_t bars_processed, size_t orders_placed, double initial_equity,
                                  double final_equity, double final_position) {
    LOG_SECTION_HEADER("RUN SUMMARY");
    LOG_CONTENT("Bars processed: " + std::to_string(bars_processed));
    LOG_CONTENT("Orders placed: " + std::to_string(orders_placed));
    LOG_CONTENT("Initial equity: " + format_currency(initial_equity));
    LOG_CONTENT("Final equity: " + format_currency(final_equity));
    if (initial_equity > 0.0) {
        LOG_CONTENT("Return: " + format_ratio((final_equity / initial_equity - 1.0) * 100.0) + "%");
    }
    LOG_CONTENT("Final position: " + format_quantity(final_position));
    LOG_SECTION_FOOTER();
}

} // namespace Logging
} // namespace RegimeTrader
