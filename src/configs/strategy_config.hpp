#ifndef STRATEGY_CONFIG_HPP
#define STRATEGY_CONFIG_HPP

#include "configuration_error.hpp"
#include <string>

namespace RegimeTrader {
namespace Config {

enum class ChannelType {
    LINEAR_REGRESSION,
    BOLLINGER
};

struct ChannelTypeParser {
    static ChannelType parse_type(const std::string& type_str) {
        if (type_str == "linreg" || type_str == "LINREG") {
            return ChannelType::LINEAR_REGRESSION;
        } else if (type_str == "bollinger" || type_str == "BOLLINGER") {
            return ChannelType::BOLLINGER;
        } else {
            throw ConfigurationError("Invalid channel type: " + type_str + ". Must be 'LINREG' or 'BOLLINGER'");
        }
    }

    static std::string type_to_string(ChannelType type) {
        switch (type) {
            case ChannelType::LINEAR_REGRESSION:
                return "LINREG";
            case ChannelType::BOLLINGER:
                return "BOLLINGER";
            default:
                throw ConfigurationError("Unknown channel type");
        }
    }
};

struct StrategyConfig {
    // ========================================================================
    // TARGET
    // ========================================================================

    std::string symbol = "QQQ";                      // Single instrument traded by this engine
    ChannelType channel_type = ChannelType::LINEAR_REGRESSION; // Source of the upper/lower bounds

    // ========================================================================
    // REGIME THRESHOLDS
    // ========================================================================

    double low_threshold = -4.0;                     // Trend quality below this is a strong downtrend
    double high_threshold = 2.5;                     // Trend quality above this is a strong uptrend
    double between_factor = 0.0005;                  // Exit bound tightening, as a fraction of price

    // ========================================================================
    // POSITION SIZING AND PYRAMIDING
    // ========================================================================

    int max_orders = 3;                              // Maximum entries per leg before it is flattened
    double entry_allocation = 0.5;                   // Target portfolio fraction per entry order

    // Leg enablement
    bool enable_reversion_short = true;              // Fade closes above the upper bound
    bool enable_reversion_long = true;               // Fade closes below the lower bound
    bool enable_breakout_long = true;                // Follow closes above the upper bound
    bool enable_breakout_short = true;               // Follow closes below the lower bound
};

} // namespace Config
} // namespace RegimeTrader

#endif // STRATEGY_CONFIG_HPP
