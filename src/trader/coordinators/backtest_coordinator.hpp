#ifndef BACKTEST_COORDINATOR_HPP
#define BACKTEST_COORDINATOR_HPP

#include "configs/system_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace RegimeTrader {
namespace Core {

struct ExecutedOrder {
    long long bar_timestamp;
    OrderAction order_action;

    ExecutedOrder() : bar_timestamp(0), order_action() {}
    ExecutedOrder(long long timestamp_param, const OrderAction& action_param)
        : bar_timestamp(timestamp_param), order_action(action_param) {}
};

struct BacktestResult {
    size_t input_bars;
    size_t bars_processed;          // Consolidated bars fed to the strategy
    size_t warm_bars;               // Bars on which the engine ran
    std::vector<ExecutedOrder> executed_orders;
    PositionLedger final_ledger;
    double initial_cash;
    double final_cash;
    double final_equity;
    double final_position;          // Account position, equals the ledger net position

    BacktestResult() : input_bars(0), bars_processed(0), warm_bars(0), executed_orders(), final_ledger(),
                       initial_cash(0.0), final_cash(0.0), final_equity(0.0), final_position(0.0) {}
};

/**
 * Replays historical one-minute bars through consolidation, the indicators
 * and the regime engine against a paper account.
 */
class BacktestCoordinator {
public:
    explicit BacktestCoordinator(const Config::SystemConfig& system_config_param);

    BacktestResult run(const std::vector<Bar>& input_bars) const;

    static nlohmann::json build_run_report(const Config::SystemConfig& config, const BacktestResult& backtest_result);
    static void write_run_report(const nlohmann::json& run_report, const std::string& report_path);

private:
    const Config::SystemConfig& config;
};

} // namespace Core
} // namespace RegimeTrader

#endif // BACKTEST_COORDINATOR_HPP
