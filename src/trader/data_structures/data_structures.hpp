#ifndef DATA_STRUCTURES_HPP
#define DATA_STRUCTURES_HPP

#include <string>
#include <stdexcept>
#include "configs/configuration_error.hpp"

namespace RegimeTrader {
namespace Core {

using RegimeTrader::Config::ConfigurationError;

struct Bar {
    long long timestamp;             // Epoch seconds, bar open time
    double open_price;
    double high_price;
    double low_price;
    double close_price;
    double volume;

    Bar() : timestamp(0), open_price(0.0), high_price(0.0), low_price(0.0), close_price(0.0), volume(0.0) {}
};

// ========================================================================
// POSITION BOOKKEEPING
// ========================================================================

enum class PositionLeg {
    REVERSION_SHORT,
    REVERSION_LONG,
    BREAKOUT_LONG,
    BREAKOUT_SHORT
};

inline std::string position_leg_to_string(PositionLeg position_leg) {
    switch (position_leg) {
        case PositionLeg::REVERSION_SHORT:
            return "REVERSION_SHORT";
        case PositionLeg::REVERSION_LONG:
            return "REVERSION_LONG";
        case PositionLeg::BREAKOUT_LONG:
            return "BREAKOUT_LONG";
        case PositionLeg::BREAKOUT_SHORT:
            return "BREAKOUT_SHORT";
        default:
            throw std::runtime_error("Unknown position leg");
    }
}

inline bool is_long_leg(PositionLeg position_leg) {
    return position_leg == PositionLeg::REVERSION_LONG || position_leg == PositionLeg::BREAKOUT_LONG;
}

// Shares are held as a non-negative magnitude; direction comes from the leg.
struct LegState {
    double shares;
    int order_count;

    LegState() : shares(0.0), order_count(0) {}

    bool is_open() const { return shares > 0.0; }
    void clear() {
        shares = 0.0;
        order_count = 0;
    }
};

struct PositionLedger {
    LegState reversion_short;
    LegState reversion_long;
    LegState breakout_long;
    LegState breakout_short;

    LegState& get_leg(PositionLeg position_leg) {
        switch (position_leg) {
            case PositionLeg::REVERSION_SHORT:
                return reversion_short;
            case PositionLeg::REVERSION_LONG:
                return reversion_long;
            case PositionLeg::BREAKOUT_LONG:
                return breakout_long;
            case PositionLeg::BREAKOUT_SHORT:
                return breakout_short;
            default:
                throw std::runtime_error("Unknown position leg");
        }
    }

    const LegState& get_leg(PositionLeg position_leg) const {
        return const_cast<PositionLedger*>(this)->get_leg(position_leg);
    }

    double total_long_shares() const { return reversion_long.shares + breakout_long.shares; }
    double total_short_shares() const { return reversion_short.shares + breakout_short.shares; }

    // Signed net exposure implied by the four legs
    double net_position() const { return total_long_shares() - total_short_shares(); }

    void clear() {
        reversion_short.clear();
        reversion_long.clear();
        breakout_long.clear();
        breakout_short.clear();
    }
};

// ========================================================================
// SIGNAL ENGINE INPUT / OUTPUT
// ========================================================================

struct SignalInputs {
    double close_price;
    double upper_bound;
    double lower_bound;
    double trend_quality;

    SignalInputs() : close_price(0.0), upper_bound(0.0), lower_bound(0.0), trend_quality(0.0) {}
    SignalInputs(double close_param, double upper_param, double lower_param, double trend_quality_param)
        : close_price(close_param), upper_bound(upper_param), lower_bound(lower_param), trend_quality(trend_quality_param) {}
};

enum class OrderIntent {
    ENTRY,
    FLATTEN,
    EXIT
};

inline std::string order_intent_to_string(OrderIntent order_intent) {
    switch (order_intent) {
        case OrderIntent::ENTRY:
            return "ENTRY";
        case OrderIntent::FLATTEN:
            return "FLATTEN";
        case OrderIntent::EXIT:
            return "EXIT";
        default:
            throw std::runtime_error("Unknown order intent");
    }
}

// One order sent to the gateway during a bar evaluation.
struct OrderAction {
    PositionLeg position_leg;        // Leg the order opens or closes (FLATTEN: the leg that triggered it)
    OrderIntent order_intent;
    double requested_quantity;       // Signed, positive buys
    double filled_quantity;          // Signed, as reported by the gateway
    std::string order_tag;
    double reference_price;          // Close of the bar that produced the order

    OrderAction()
        : position_leg(PositionLeg::REVERSION_SHORT), order_intent(OrderIntent::ENTRY),
          requested_quantity(0.0), filled_quantity(0.0), order_tag(""), reference_price(0.0) {}
};

} // namespace Core
} // namespace RegimeTrader

#endif // DATA_STRUCTURES_HPP
