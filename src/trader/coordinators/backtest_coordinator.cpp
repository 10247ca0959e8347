#include "backtest_coordinator.hpp"
#include "trader/account_management/paper_account.hpp"
#include "trader/market_data/bar_accumulator.hpp"
#include "trader/trading_logic/trading_logic.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/trading_logs.hpp"
#include "utils/time_utils.hpp"
#include <fstream>
#include <optional>
#include <stdexcept>

namespace RegimeTrader {
namespace Core {

using json = nlohmann::json;
using RegimeTrader::Logging::TradingLogs;

namespace {
    json leg_to_json(const LegState& leg_state) {
        json leg_json;
        leg_json["shares"] = leg_state.shares;
        leg_json["order_count"] = leg_state.order_count;
        return leg_json;
    }
}

BacktestCoordinator::BacktestCoordinator(const Config::SystemConfig& system_config_param)
    : config(system_config_param) {}

BacktestResult BacktestCoordinator::run(const std::vector<Bar>& input_bars) const {
    BacktestResult backtest_result;
    backtest_result.input_bars = input_bars.size();
    backtest_result.initial_cash = config.backtest.initial_cash;

    PaperAccount paper_account(config.backtest.initial_cash);
    TradingLogic trading_logic(TradingLogicConstructionParams(config, paper_account));
    BarAccumulator bar_accumulator(config.backtest.consolidation_minutes);

    TradingLogs::log_replay_started(config.strategy.symbol, input_bars.size(), config.backtest.consolidation_minutes);

    auto process_consolidated_bar = [&](const Bar& consolidated_bar) {
        paper_account.mark_price(consolidated_bar.close_price);
        BarProcessingResult processing_result = trading_logic.process_bar(consolidated_bar);
        if (processing_result.indicators_ready) {
            backtest_result.warm_bars++;
        }
        for (const OrderAction& order_action : processing_result.order_actions) {
            backtest_result.executed_orders.emplace_back(consolidated_bar.timestamp, order_action);
        }
    };

    for (const Bar& input_bar : input_bars) {
        std::optional<Bar> completed_bar = bar_accumulator.add_bar(input_bar);
        if (completed_bar) {
            process_consolidated_bar(*completed_bar);
        }
    }
    std::optional<Bar> trailing_bar = bar_accumulator.flush();
    if (trailing_bar) {
        process_consolidated_bar(*trailing_bar);
    }

    Logging::LoggingContext* logging_context = Logging::find_logging_context();
    if (logging_context) {
        if (logging_context->csv_bars_logger) logging_context->csv_bars_logger->flush();
        if (logging_context->csv_trade_logger) logging_context->csv_trade_logger->flush();
    }

    backtest_result.bars_processed = trading_logic.get_bars_processed();
    backtest_result.final_ledger = trading_logic.get_position_ledger();
    backtest_result.final_cash = paper_account.get_cash();
    backtest_result.final_equity = paper_account.get_equity();
    backtest_result.final_position = paper_account.get_position();

    TradingLogs::log_ledger_summary(backtest_result.final_ledger);
    TradingLogs::log_run_summary(backtest_result.bars_processed, backtest_result.executed_orders.size(),
                                 backtest_result.initial_cash, backtest_result.final_equity, backtest_result.final_position);
    return backtest_result;
}

json BacktestCoordinator::build_run_report(const Config::SystemConfig& config, const BacktestResult& backtest_result) {
    json run_report;
    run_report["symbol"] = config.strategy.symbol;
    run_report["channel_type"] = Config::ChannelTypeParser::type_to_string(config.strategy.channel_type);
    run_report["consolidation_minutes"] = config.backtest.consolidation_minutes;

    json configuration_json;
    configuration_json["low_threshold"] = config.strategy.low_threshold;
    configuration_json["high_threshold"] = config.strategy.high_threshold;
    configuration_json["between_factor"] = config.strategy.between_factor;
    configuration_json["max_orders"] = config.strategy.max_orders;
    configuration_json["entry_allocation"] = config.strategy.entry_allocation;
    configuration_json["linreg_count"] = config.indicators.linear_regression.count;
    configuration_json["linreg_upper_deviation"] = config.indicators.linear_regression.upper_deviation;
    configuration_json["linreg_lower_deviation"] = config.indicators.linear_regression.lower_deviation;
    configuration_json["bollinger_length"] = config.indicators.bollinger.length;
    configuration_json["bollinger_multiplier"] = config.indicators.bollinger.multiplier;
    configuration_json["tq_fast_length"] = config.indicators.trend_quality.fast_length;
    configuration_json["tq_slow_length"] = config.indicators.trend_quality.slow_length;
    configuration_json["tq_trend_length"] = config.indicators.trend_quality.trend_length;
    configuration_json["tq_noise_length"] = config.indicators.trend_quality.noise_length;
    configuration_json["tq_correction_factor"] = config.indicators.trend_quality.correction_factor;
    configuration_json["tq_noise_type"] = Config::NoiseModeParser::mode_to_string(config.indicators.trend_quality.noise_mode);
    run_report["configuration"] = configuration_json;

    run_report["input_bars"] = backtest_result.input_bars;
    run_report["bars_processed"] = backtest_result.bars_processed;
    run_report["warm_bars"] = backtest_result.warm_bars;

    run_report["account"] = json::object();
    run_report["account"]["initial_cash"] = backtest_result.initial_cash;
    run_report["account"]["final_cash"] = backtest_result.final_cash;
    run_report["account"]["final_equity"] = backtest_result.final_equity;
    run_report["account"]["final_position"] = backtest_result.final_position;

    run_report["ledger"] = json::object();
    run_report["ledger"]["reversion_short"] = leg_to_json(backtest_result.final_ledger.reversion_short);
    run_report["ledger"]["reversion_long"] = leg_to_json(backtest_result.final_ledger.reversion_long);
    run_report["ledger"]["breakout_long"] = leg_to_json(backtest_result.final_ledger.breakout_long);
    run_report["ledger"]["breakout_short"] = leg_to_json(backtest_result.final_ledger.breakout_short);
    run_report["ledger"]["net_position"] = backtest_result.final_ledger.net_position();

    json orders_json = json::array();
    for (const ExecutedOrder& executed_order : backtest_result.executed_orders) {
        json order_json;
        order_json["timestamp"] = TimeUtils::format_epoch_seconds_iso(executed_order.bar_timestamp);
        order_json["leg"] = position_leg_to_string(executed_order.order_action.position_leg);
        order_json["intent"] = order_intent_to_string(executed_order.order_action.order_intent);
        order_json["tag"] = executed_order.order_action.order_tag;
        order_json["requested_quantity"] = executed_order.order_action.requested_quantity;
        order_json["filled_quantity"] = executed_order.order_action.filled_quantity;
        order_json["price"] = executed_order.order_action.reference_price;
        orders_json.push_back(order_json);
    }
    run_report["orders"] = orders_json;
    return run_report;
}

void BacktestCoordinator::write_run_report(const json& run_report, const std::string& report_path) {
    std::ofstream report_stream(report_path);
    if (!report_stream.is_open()) {
        throw std::runtime_error("Cannot open run report file: " + report_path);
    }
    report_stream << run_report.dump(2) << std::endl;
}

} // namespace Core
} // namespace RegimeTrader
