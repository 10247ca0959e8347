#ifndef TRADING_LOGIC_HPP
#define TRADING_LOGIC_HPP

#include "configs/system_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "trader/strategy_analysis/indicator_interface.hpp"
#include "trader/strategy_analysis/trend_quality.hpp"
#include "regime_signal_engine.hpp"
#include "trading_logic_structures.hpp"
#include <cstddef>

namespace RegimeTrader {
namespace Core {

/**
 * Per-bar pipeline: feeds the close into the channel and trend quality
 * indicators, and once both are warm hands the signal inputs to the
 * regime engine. Owns the position ledger for the traded symbol.
 */
class TradingLogic {
public:
    explicit TradingLogic(const TradingLogicConstructionParams& construction_params);

    BarProcessingResult process_bar(const Bar& consolidated_bar);

    const PositionLedger& get_position_ledger() const { return position_ledger; }
    const ChannelIndicator& get_channel_indicator() const { return *channel_indicator; }
    const TrendQualityIndicator& get_trend_quality_indicator() const { return trend_quality_indicator; }
    const RegimeSignalEngine& get_signal_engine() const { return signal_engine; }
    size_t get_bars_processed() const { return bars_processed; }
    int get_warm_up_bars() const;

    // Clears indicators and the ledger (the gateway is not touched)
    void reset();

private:
    const Config::SystemConfig& config;
    OrderGateway& order_gateway;
    ChannelIndicatorPtr channel_indicator;
    TrendQualityIndicator trend_quality_indicator;
    RegimeSignalEngine signal_engine;
    PositionLedger position_ledger;
    size_t bars_processed;

    void write_csv_rows(const Bar& consolidated_bar, const BarProcessingResult& processing_result) const;
};

} // namespace Core
} // namespace RegimeTrader

#endif // TRADING_LOGIC_HPP
