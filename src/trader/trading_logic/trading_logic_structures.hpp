#ifndef TRADING_LOGIC_STRUCTURES_HPP
#define TRADING_LOGIC_STRUCTURES_HPP

#include "configs/system_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "order_gateway.hpp"
#include <vector>

namespace RegimeTrader {
namespace Core {

struct TradingLogicConstructionParams {
    const Config::SystemConfig& system_config;
    OrderGateway& order_gateway_ref;

    TradingLogicConstructionParams(const Config::SystemConfig& config, OrderGateway& order_gateway)
        : system_config(config), order_gateway_ref(order_gateway) {}
};

// Outcome of one consolidated bar
struct BarProcessingResult {
    bool indicators_ready;
    SignalInputs signal_inputs;
    double middle_band;
    std::vector<OrderAction> order_actions;

    BarProcessingResult() : indicators_ready(false), signal_inputs(), middle_band(0.0), order_actions() {}
};

} // namespace Core
} // namespace RegimeTrader

#endif // TRADING_LOGIC_STRUCTURES_HPP
