#ifndef REGIME_SIGNAL_ENGINE_HPP
#define REGIME_SIGNAL_ENGINE_HPP

#include "configs/strategy_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "order_gateway.hpp"
#include <string>
#include <vector>

namespace RegimeTrader {
namespace Core {

// Everything one bar evaluation touches.
struct SignalEvaluationContext {
    const SignalInputs& signal_inputs;
    PositionLedger& position_ledger;
    OrderGateway& order_gateway;
    std::vector<OrderAction>& emitted_actions;

    SignalEvaluationContext(const SignalInputs& inputs_param, PositionLedger& ledger_param,
                            OrderGateway& gateway_param, std::vector<OrderAction>& actions_param)
        : signal_inputs(inputs_param), position_ledger(ledger_param),
          order_gateway(gateway_param), emitted_actions(actions_param) {}
};

/**
 * Regime adaptive entry/exit state machine over four position legs.
 *
 * Reversion legs fade a close outside the channel while trend quality is
 * weak; breakout legs follow it while trend quality is strong. Every bar runs
 * all four entry checks (reversion short, reversion long, breakout long,
 * breakout short) and then all four exit checks in the same order. Checks are
 * independent, so one bar can both open a leg and close another.
 *
 * The ledger is owned by the caller and passed in on every evaluation.
 */
class RegimeSignalEngine {
public:
    explicit RegimeSignalEngine(const Config::StrategyConfig& strategy_config_param);

    std::vector<OrderAction> evaluate(const SignalInputs& signal_inputs, PositionLedger& position_ledger, OrderGateway& order_gateway) const;

    const Config::StrategyConfig& get_strategy_config() const { return strategy_config; }

    // Regime classification helpers
    bool is_trend_quality_inside_band(double trend_quality) const;
    bool is_trend_quality_outside_band(double trend_quality) const;
    double upper_exit_level(const SignalInputs& signal_inputs) const;
    double lower_exit_level(const SignalInputs& signal_inputs) const;

private:
    Config::StrategyConfig strategy_config;

    void evaluate_reversion_short_entry(SignalEvaluationContext& evaluation_context) const;
    void evaluate_reversion_long_entry(SignalEvaluationContext& evaluation_context) const;
    void evaluate_breakout_long_entry(SignalEvaluationContext& evaluation_context) const;
    void evaluate_breakout_short_entry(SignalEvaluationContext& evaluation_context) const;

    void evaluate_reversion_short_exit(SignalEvaluationContext& evaluation_context) const;
    void evaluate_reversion_long_exit(SignalEvaluationContext& evaluation_context) const;
    void evaluate_breakout_long_exit(SignalEvaluationContext& evaluation_context) const;
    void evaluate_breakout_short_exit(SignalEvaluationContext& evaluation_context) const;

    void open_leg_position(SignalEvaluationContext& evaluation_context, PositionLeg position_leg, const std::string& order_tag) const;
    void close_leg_position(SignalEvaluationContext& evaluation_context, PositionLeg position_leg, const std::string& order_tag) const;
    void flatten_opposing_exposure(SignalEvaluationContext& evaluation_context, PositionLeg breakout_leg) const;

    void record_action(SignalEvaluationContext& evaluation_context, PositionLeg position_leg, OrderIntent order_intent,
                       double requested_quantity, double filled_quantity, const std::string& order_tag) const;
};

} // namespace Core
} // namespace RegimeTrader

#endif // REGIME_SIGNAL_ENGINE_HPP
