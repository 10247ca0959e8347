#include "trading_logic.hpp"
#include "trader/strategy_analysis/indicators.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/csv_bars_logger.hpp"
#include "logging/logger/csv_trade_logger.hpp"
#include "logging/logs/trading_logs.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>

namespace RegimeTrader {
namespace Core {

using RegimeTrader::Logging::TradingLogs;

TradingLogic::TradingLogic(const TradingLogicConstructionParams& construction_params)
    : config(construction_params.system_config),
      order_gateway(construction_params.order_gateway_ref),
      channel_indicator(create_channel_indicator(construction_params.system_config)),
      trend_quality_indicator(construction_params.system_config.indicators.trend_quality),
      signal_engine(construction_params.system_config.strategy),
      position_ledger(),
      bars_processed(0) {}

int TradingLogic::get_warm_up_bars() const {
    return std::max(channel_indicator->warm_up_period(), trend_quality_indicator.warm_up_period());
}

BarProcessingResult TradingLogic::process_bar(const Bar& consolidated_bar) {
    BarProcessingResult processing_result;
    bars_processed++;

    // Both indicators see every bar, warm or not
    channel_indicator->update(consolidated_bar.close_price);
    trend_quality_indicator.update(consolidated_bar.close_price);

    std::string bar_timestamp = TimeUtils::format_epoch_seconds_iso(consolidated_bar.timestamp);

    processing_result.indicators_ready = channel_indicator->is_ready() && trend_quality_indicator.is_ready();
    if (!processing_result.indicators_ready) {
        if (config.logging.log_every_bar) {
            TradingLogs::log_indicators_warming_up(bar_timestamp, bars_processed, get_warm_up_bars());
        }
        write_csv_rows(consolidated_bar, processing_result);
        return processing_result;
    }

    processing_result.middle_band = channel_indicator->middle_band();
    processing_result.signal_inputs = SignalInputs(consolidated_bar.close_price,
                                                   channel_indicator->upper_band(),
                                                   channel_indicator->lower_band(),
                                                   trend_quality_indicator.value());

    processing_result.order_actions = signal_engine.evaluate(processing_result.signal_inputs, position_ledger, order_gateway);

    if (config.logging.log_every_bar || !processing_result.order_actions.empty()) {
        TradingLogs::log_signal_table(config.strategy.symbol, bar_timestamp, processing_result.signal_inputs, config.strategy);
    }
    if (!processing_result.order_actions.empty()) {
        TradingLogs::log_order_actions(processing_result.order_actions, position_ledger);
    }

    write_csv_rows(consolidated_bar, processing_result);
    return processing_result;
}

void TradingLogic::write_csv_rows(const Bar& consolidated_bar, const BarProcessingResult& processing_result) const {
    Logging::LoggingContext* logging_context = Logging::find_logging_context();
    if (!logging_context) {
        return;
    }

    std::string bar_timestamp = TimeUtils::format_epoch_seconds_iso(consolidated_bar.timestamp);

    if (logging_context->csv_bars_logger) {
        Logging::BarIndicatorSnapshot indicator_snapshot;
        indicator_snapshot.indicators_ready = processing_result.indicators_ready;
        indicator_snapshot.middle_band = processing_result.middle_band;
        indicator_snapshot.upper_band = processing_result.signal_inputs.upper_bound;
        indicator_snapshot.lower_band = processing_result.signal_inputs.lower_bound;
        indicator_snapshot.trend_quality = processing_result.signal_inputs.trend_quality;
        logging_context->csv_bars_logger->log_bar(bar_timestamp, config.strategy.symbol, consolidated_bar, indicator_snapshot);
    }

    if (logging_context->csv_trade_logger) {
        for (const OrderAction& order_action : processing_result.order_actions) {
            logging_context->csv_trade_logger->log_order(bar_timestamp, config.strategy.symbol, order_action,
                                                         position_ledger.get_leg(order_action.position_leg).shares,
                                                         position_ledger.net_position());
        }
    }
}

void TradingLogic::reset() {
    channel_indicator->reset();
    trend_quality_indicator.reset();
    position_ledger.clear();
    bars_processed = 0;
}

} // namespace Core
} // namespace RegimeTrader
