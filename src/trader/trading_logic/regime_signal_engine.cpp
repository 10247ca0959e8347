#include "regime_signal_engine.hpp"
#include "logging/logs/trading_logs.hpp"
#include <cmath>

namespace RegimeTrader {
namespace Core {

using RegimeTrader::Config::ConfigurationError;
using RegimeTrader::Logging::TradingLogs;

namespace {
    const Config::StrategyConfig& validated_strategy_config(const Config::StrategyConfig& strategy_config) {
        if (strategy_config.max_orders < 1) {
            throw ConfigurationError("strategy.max_orders must be >= 1");
        }
        if (!(strategy_config.low_threshold < strategy_config.high_threshold)) {
            throw ConfigurationError("strategy.low_threshold must be below strategy.high_threshold");
        }
        if (strategy_config.between_factor < 0.0) {
            throw ConfigurationError("strategy.between_factor must be >= 0");
        }
        if (strategy_config.entry_allocation <= 0.0 || strategy_config.entry_allocation > 1.0) {
            throw ConfigurationError("strategy.entry_allocation must be in (0, 1]");
        }
        return strategy_config;
    }
}

RegimeSignalEngine::RegimeSignalEngine(const Config::StrategyConfig& strategy_config_param)
    : strategy_config(validated_strategy_config(strategy_config_param)) {}

std::vector<OrderAction> RegimeSignalEngine::evaluate(const SignalInputs& signal_inputs, PositionLedger& position_ledger, OrderGateway& order_gateway) const {
    std::vector<OrderAction> emitted_actions;
    SignalEvaluationContext evaluation_context(signal_inputs, position_ledger, order_gateway, emitted_actions);

    // ========================================================================
    // ENTRIES
    // ========================================================================
    evaluate_reversion_short_entry(evaluation_context);
    evaluate_reversion_long_entry(evaluation_context);
    evaluate_breakout_long_entry(evaluation_context);
    evaluate_breakout_short_entry(evaluation_context);

    // ========================================================================
    // EXITS
    // ========================================================================
    evaluate_reversion_short_exit(evaluation_context);
    evaluate_reversion_long_exit(evaluation_context);
    evaluate_breakout_long_exit(evaluation_context);
    evaluate_breakout_short_exit(evaluation_context);

    return emitted_actions;
}

bool RegimeSignalEngine::is_trend_quality_inside_band(double trend_quality) const {
    return strategy_config.low_threshold < trend_quality && trend_quality < strategy_config.high_threshold;
}

bool RegimeSignalEngine::is_trend_quality_outside_band(double trend_quality) const {
    return trend_quality < strategy_config.low_threshold || trend_quality > strategy_config.high_threshold;
}

double RegimeSignalEngine::upper_exit_level(const SignalInputs& signal_inputs) const {
    return signal_inputs.upper_bound - signal_inputs.close_price * strategy_config.between_factor;
}

double RegimeSignalEngine::lower_exit_level(const SignalInputs& signal_inputs) const {
    return signal_inputs.lower_bound + signal_inputs.close_price * strategy_config.between_factor;
}

// ========================================================================
// ENTRY CHECKS
// ========================================================================

void RegimeSignalEngine::evaluate_reversion_short_entry(SignalEvaluationContext& evaluation_context) const {
    const SignalInputs& inputs = evaluation_context.signal_inputs;
    if (!strategy_config.enable_reversion_short) return;
    if (inputs.close_price > inputs.upper_bound && inputs.trend_quality < strategy_config.high_threshold) {
        if (evaluation_context.position_ledger.reversion_short.order_count < strategy_config.max_orders) {
            open_leg_position(evaluation_context, PositionLeg::REVERSION_SHORT, "Reversion Short");
        }
    }
}

void RegimeSignalEngine::evaluate_reversion_long_entry(SignalEvaluationContext& evaluation_context) const {
    const SignalInputs& inputs = evaluation_context.signal_inputs;
    if (!strategy_config.enable_reversion_long) return;
    if (inputs.close_price < inputs.lower_bound && inputs.trend_quality > strategy_config.low_threshold) {
        if (evaluation_context.position_ledger.reversion_long.order_count < strategy_config.max_orders) {
            open_leg_position(evaluation_context, PositionLeg::REVERSION_LONG, "Reversion Long");
        }
    }
}

void RegimeSignalEngine::evaluate_breakout_long_entry(SignalEvaluationContext& evaluation_context) const {
    const SignalInputs& inputs = evaluation_context.signal_inputs;
    if (!strategy_config.enable_breakout_long) return;
    if (inputs.close_price > inputs.upper_bound && inputs.trend_quality > strategy_config.high_threshold) {
        flatten_opposing_exposure(evaluation_context, PositionLeg::BREAKOUT_LONG);
        if (evaluation_context.position_ledger.breakout_long.order_count < strategy_config.max_orders) {
            open_leg_position(evaluation_context, PositionLeg::BREAKOUT_LONG, "Breakout Long");
        }
    }
}

void RegimeSignalEngine::evaluate_breakout_short_entry(SignalEvaluationContext& evaluation_context) const {
    const SignalInputs& inputs = evaluation_context.signal_inputs;
    if (!strategy_config.enable_breakout_short) return;
    if (inputs.close_price < inputs.lower_bound && inputs.trend_quality < strategy_config.low_threshold) {
        flatten_opposing_exposure(evaluation_context, PositionLeg::BREAKOUT_SHORT);
        if (evaluation_context.position_ledger.breakout_short.order_count < strategy_config.max_orders) {
            open_leg_position(evaluation_context, PositionLeg::BREAKOUT_SHORT, "Breakout Short");
        }
    }
}

// ========================================================================
// EXIT CHECKS
// ========================================================================

void RegimeSignalEngine::evaluate_reversion_short_exit(SignalEvaluationContext& evaluation_context) const {
    const SignalInputs& inputs = evaluation_context.signal_inputs;
    if (!evaluation_context.position_ledger.reversion_short.is_open()) return;

    bool price_back_inside = inputs.close_price < upper_exit_level(inputs);
    if (price_back_inside || is_trend_quality_outside_band(inputs.trend_quality)) {
        close_leg_position(evaluation_context, PositionLeg::REVERSION_SHORT, "Close Reversion Short");
    }
}

void RegimeSignalEngine::evaluate_reversion_long_exit(SignalEvaluationContext& evaluation_context) const {
    const SignalInputs& inputs = evaluation_context.signal_inputs;
    if (!evaluation_context.position_ledger.reversion_long.is_open()) return;

    bool price_back_inside = inputs.close_price > lower_exit_level(inputs);
    if (price_back_inside || is_trend_quality_outside_band(inputs.trend_quality)) {
        close_leg_position(evaluation_context, PositionLeg::REVERSION_LONG, "Close Reversion Long");
    }
}

void RegimeSignalEngine::evaluate_breakout_long_exit(SignalEvaluationContext& evaluation_context) const {
    const SignalInputs& inputs = evaluation_context.signal_inputs;
    if (!evaluation_context.position_ledger.breakout_long.is_open()) return;

    // Breakouts are held until the trend fades back inside the band
    bool price_back_inside = inputs.close_price < upper_exit_level(inputs);
    if (price_back_inside && is_trend_quality_inside_band(inputs.trend_quality)) {
        close_leg_position(evaluation_context, PositionLeg::BREAKOUT_LONG, "Close Breakout Long");
    }
}

void RegimeSignalEngine::evaluate_breakout_short_exit(SignalEvaluationContext& evaluation_context) const {
    const SignalInputs& inputs = evaluation_context.signal_inputs;
    if (!evaluation_context.position_ledger.breakout_short.is_open()) return;

    bool price_back_inside = inputs.close_price > lower_exit_level(inputs);
    if (price_back_inside && is_trend_quality_inside_band(inputs.trend_quality)) {
        close_leg_position(evaluation_context, PositionLeg::BREAKOUT_SHORT, "Close Breakout Short");
    }
}

// ========================================================================
// ORDER PLACEMENT
// ========================================================================

void RegimeSignalEngine::open_leg_position(SignalEvaluationContext& evaluation_context, PositionLeg position_leg, const std::string& order_tag) const {
    const double direction_sign = is_long_leg(position_leg) ? 1.0 : -1.0;
    const double sized_quantity = evaluation_context.order_gateway.size_order(direction_sign * strategy_config.entry_allocation);
    const double requested_quantity = direction_sign * std::fabs(sized_quantity);

    if (requested_quantity == 0.0) {
        TradingLogs::log_entry_skipped(position_leg, "sized quantity is zero");
        return;
    }

    const double filled_quantity = evaluation_context.order_gateway.place_order(requested_quantity, order_tag);

    LegState& leg_state = evaluation_context.position_ledger.get_leg(position_leg);
    leg_state.shares += std::fabs(filled_quantity);
    leg_state.order_count += 1;

    record_action(evaluation_context, position_leg, OrderIntent::ENTRY, requested_quantity, filled_quantity, order_tag);
}

void RegimeSignalEngine::close_leg_position(SignalEvaluationContext& evaluation_context, PositionLeg position_leg, const std::string& order_tag) const {
    LegState& leg_state = evaluation_context.position_ledger.get_leg(position_leg);
    const double direction_sign = is_long_leg(position_leg) ? -1.0 : 1.0;
    const double requested_quantity = direction_sign * leg_state.shares;

    const double filled_quantity = evaluation_context.order_gateway.place_order(requested_quantity, order_tag);
    if (std::fabs(filled_quantity) != std::fabs(requested_quantity)) {
        TradingLogs::log_partial_close(position_leg, requested_quantity, filled_quantity);
    }
    leg_state.clear();

    record_action(evaluation_context, position_leg, OrderIntent::EXIT, requested_quantity, filled_quantity, order_tag);
}

void RegimeSignalEngine::flatten_opposing_exposure(SignalEvaluationContext& evaluation_context, PositionLeg breakout_leg) const {
    PositionLedger& position_ledger = evaluation_context.position_ledger;
    const bool flatten_shorts = is_long_leg(breakout_leg);

    const double opposing_shares = flatten_shorts ? position_ledger.total_short_shares() : position_ledger.total_long_shares();
    if (opposing_shares <= 0.0) return;

    const double requested_quantity = flatten_shorts ? opposing_shares : -opposing_shares;
    const std::string order_tag = flatten_shorts ? "Close open short trade" : "Close open long trade";

    const double filled_quantity = evaluation_context.order_gateway.place_order(requested_quantity, order_tag);
    if (std::fabs(filled_quantity) != std::fabs(requested_quantity)) {
        TradingLogs::log_partial_close(breakout_leg, requested_quantity, filled_quantity);
    }

    if (flatten_shorts) {
        position_ledger.reversion_short.clear();
        position_ledger.breakout_short.clear();
    } else {
        position_ledger.reversion_long.clear();
        position_ledger.breakout_long.clear();
    }

    record_action(evaluation_context, breakout_leg, OrderIntent::FLATTEN, requested_quantity, filled_quantity, order_tag);
}

void RegimeSignalEngine::record_action(SignalEvaluationContext& evaluation_context, PositionLeg position_leg, OrderIntent order_intent,
                                       double requested_quantity, double filled_quantity, const std::string& order_tag) const {
    OrderAction order_action;
    order_action.position_leg = position_leg;
    order_action.order_intent = order_intent;
    order_action.requested_quantity = requested_quantity;
    order_action.filled_quantity = filled_quantity;
    order_action.order_tag = order_tag;
    order_action.reference_price = evaluation_context.signal_inputs.close_price;
    evaluation_context.emitted_actions.push_back(order_action);
}

} // namespace Core
} // namespace RegimeTrader
