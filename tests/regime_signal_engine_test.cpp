// regime_signal_engine_test.cpp - four leg entry/exit state machine

#include <gtest/gtest.h>

#include "trader/trading_logic/regime_signal_engine.hpp"

#include <cmath>
#include <string>
#include <vector>

using namespace RegimeTrader::Core;
using RegimeTrader::Config::ConfigurationError;
using RegimeTrader::Config::StrategyConfig;

namespace {

struct RecordedOrder {
    double quantity;
    std::string tag;
};

// Fills every order completely; sizes a fixed number of shares per entry.
class FakeOrderGateway : public OrderGateway {
public:
    explicit FakeOrderGateway(double shares_per_entry_param = 10.0) : shares_per_entry(shares_per_entry_param) {}

    double place_order(double signed_quantity, const std::string& order_tag) override {
        placed_orders.push_back(RecordedOrder{signed_quantity, order_tag});
        return fill_ratio * signed_quantity;
    }

    double size_order(double target_allocation) const override {
        return target_allocation < 0.0 ? -shares_per_entry : shares_per_entry;
    }

    double shares_per_entry;
    double fill_ratio = 1.0;
    std::vector<RecordedOrder> placed_orders;
};

const double kUpper = 100.0;
const double kLower = 95.0;

SignalInputs inputs(double close_price, double trend_quality) {
    return SignalInputs(close_price, kUpper, kLower, trend_quality);
}

} // namespace

class RegimeSignalEngineTest : public ::testing::Test {
protected:
    StrategyConfig config;
    PositionLedger ledger;
    FakeOrderGateway gateway;
};

TEST_F(RegimeSignalEngineTest, ReversionShortOnWeakTrendAboveChannel) {
    RegimeSignalEngine engine(config);
    std::vector<OrderAction> actions = engine.evaluate(inputs(105.0, 1.0), ledger, gateway);

    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0].position_leg, PositionLeg::REVERSION_SHORT);
    EXPECT_EQ(actions[0].order_intent, OrderIntent::ENTRY);
    EXPECT_EQ(actions[0].order_tag, "Reversion Short");
    EXPECT_DOUBLE_EQ(actions[0].requested_quantity, -10.0);
    EXPECT_DOUBLE_EQ(actions[0].reference_price, 105.0);

    ASSERT_EQ(gateway.placed_orders.size(), 1u);
    EXPECT_DOUBLE_EQ(gateway.placed_orders[0].quantity, -10.0);
    EXPECT_DOUBLE_EQ(ledger.reversion_short.shares, 10.0);
    EXPECT_EQ(ledger.reversion_short.order_count, 1);
    EXPECT_DOUBLE_EQ(ledger.net_position(), -10.0);
}

TEST_F(RegimeSignalEngineTest, BreakoutLongFlattensShortsFirst) {
    ledger.reversion_short.shares = 10.0;
    ledger.reversion_short.order_count = 1;
    RegimeSignalEngine engine(config);

    std::vector<OrderAction> actions = engine.evaluate(inputs(105.0, 5.0), ledger, gateway);

    ASSERT_EQ(actions.size(), 2u);
    EXPECT_EQ(actions[0].order_intent, OrderIntent::FLATTEN);
    EXPECT_EQ(actions[0].order_tag, "Close open short trade");
    EXPECT_DOUBLE_EQ(actions[0].requested_quantity, 10.0);
    EXPECT_EQ(actions[1].order_intent, OrderIntent::ENTRY);
    EXPECT_EQ(actions[1].position_leg, PositionLeg::BREAKOUT_LONG);
    EXPECT_EQ(actions[1].order_tag, "Breakout Long");

    ASSERT_EQ(gateway.placed_orders.size(), 2u);
    EXPECT_DOUBLE_EQ(gateway.placed_orders[0].quantity, 10.0);
    EXPECT_DOUBLE_EQ(gateway.placed_orders[1].quantity, 10.0);

    EXPECT_FALSE(ledger.reversion_short.is_open());
    EXPECT_EQ(ledger.reversion_short.order_count, 0);
    EXPECT_DOUBLE_EQ(ledger.breakout_long.shares, 10.0);
    EXPECT_EQ(ledger.breakout_long.order_count, 1);
}

TEST_F(RegimeSignalEngineTest, FlattenCombinesBothShortLegs) {
    ledger.reversion_short.shares = 10.0;
    ledger.reversion_short.order_count = 1;
    ledger.breakout_short.shares = 7.0;
    ledger.breakout_short.order_count = 2;
    RegimeSignalEngine engine(config);

    engine.evaluate(inputs(105.0, 5.0), ledger, gateway);

    ASSERT_GE(gateway.placed_orders.size(), 1u);
    EXPECT_DOUBLE_EQ(gateway.placed_orders[0].quantity, 17.0);
    EXPECT_DOUBLE_EQ(ledger.total_short_shares(), 0.0);
    EXPECT_EQ(ledger.breakout_short.order_count, 0);
}

TEST_F(RegimeSignalEngineTest, ReversionLongHeldInsideChannelUntilTrendTurns) {
    ledger.reversion_long.shares = 10.0;
    ledger.reversion_long.order_count = 1;
    RegimeSignalEngine engine(config);

    // 95.02 is above the lower bound but below lower + close * between_factor
    std::vector<OrderAction> held_actions = engine.evaluate(inputs(95.02, 0.0), ledger, gateway);
    EXPECT_TRUE(held_actions.empty());
    EXPECT_DOUBLE_EQ(ledger.reversion_long.shares, 10.0);

    std::vector<OrderAction> exit_actions = engine.evaluate(inputs(95.02, -5.0), ledger, gateway);
    ASSERT_EQ(exit_actions.size(), 1u);
    EXPECT_EQ(exit_actions[0].order_intent, OrderIntent::EXIT);
    EXPECT_EQ(exit_actions[0].order_tag, "Close Reversion Long");
    EXPECT_DOUBLE_EQ(exit_actions[0].requested_quantity, -10.0);
    EXPECT_FALSE(ledger.reversion_long.is_open());
    EXPECT_EQ(ledger.reversion_long.order_count, 0);
}

TEST_F(RegimeSignalEngineTest, ReversionShortExitsWhenPriceReturns) {
    ledger.reversion_short.shares = 10.0;
    ledger.reversion_short.order_count = 1;
    RegimeSignalEngine engine(config);

    std::vector<OrderAction> actions = engine.evaluate(inputs(99.0, 0.0), ledger, gateway);
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0].order_tag, "Close Reversion Short");
    EXPECT_DOUBLE_EQ(actions[0].requested_quantity, 10.0);
    EXPECT_FALSE(ledger.reversion_short.is_open());
}

TEST_F(RegimeSignalEngineTest, EntriesStopAtMaxOrders) {
    config.max_orders = 2;
    RegimeSignalEngine engine(config);

    for (int bar = 0; bar < 5; ++bar) {
        engine.evaluate(inputs(105.0, 1.0), ledger, gateway);
    }
    EXPECT_EQ(ledger.reversion_short.order_count, 2);
    EXPECT_DOUBLE_EQ(ledger.reversion_short.shares, 20.0);
    EXPECT_EQ(gateway.placed_orders.size(), 2u);
}

TEST_F(RegimeSignalEngineTest, FlattenStillFiresWhenBreakoutCapped) {
    config.max_orders = 1;
    ledger.breakout_long.shares = 10.0;
    ledger.breakout_long.order_count = 1;
    ledger.reversion_short.shares = 4.0;
    ledger.reversion_short.order_count = 1;
    RegimeSignalEngine engine(config);

    std::vector<OrderAction> actions = engine.evaluate(inputs(105.0, 5.0), ledger, gateway);
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0].order_intent, OrderIntent::FLATTEN);
    EXPECT_DOUBLE_EQ(ledger.breakout_long.shares, 10.0);
    EXPECT_EQ(ledger.breakout_long.order_count, 1);
}

TEST_F(RegimeSignalEngineTest, BreakoutShortFlattensLongs) {
    ledger.reversion_long.shares = 6.0;
    ledger.reversion_long.order_count = 1;
    RegimeSignalEngine engine(config);

    std::vector<OrderAction> actions = engine.evaluate(inputs(90.0, -6.0), ledger, gateway);
    ASSERT_EQ(actions.size(), 2u);
    EXPECT_EQ(actions[0].order_tag, "Close open long trade");
    EXPECT_DOUBLE_EQ(actions[0].requested_quantity, -6.0);
    EXPECT_EQ(actions[1].order_tag, "Breakout Short");
    EXPECT_DOUBLE_EQ(actions[1].requested_quantity, -10.0);
    EXPECT_DOUBLE_EQ(ledger.reversion_long.shares, 0.0);
    EXPECT_DOUBLE_EQ(ledger.breakout_short.shares, 10.0);
}

TEST_F(RegimeSignalEngineTest, BreakoutLongHeldWhileTrendStrong) {
    ledger.breakout_long.shares = 10.0;
    ledger.breakout_long.order_count = 1;
    config.max_orders = 1;
    RegimeSignalEngine engine(config);

    // Price back inside but trend quality still above the band
    EXPECT_TRUE(engine.evaluate(inputs(98.0, 4.0), ledger, gateway).empty());

    std::vector<OrderAction> actions = engine.evaluate(inputs(98.0, 1.0), ledger, gateway);
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0].order_tag, "Close Breakout Long");
    EXPECT_DOUBLE_EQ(actions[0].requested_quantity, -10.0);
    EXPECT_FALSE(ledger.breakout_long.is_open());
}

TEST_F(RegimeSignalEngineTest, EntryAndExitOnSameBar) {
    // Reversion long open, price breaks above the channel on a weak trend:
    // a reversion short opens and the reversion long closes on the same bar.
    ledger.reversion_long.shares = 10.0;
    ledger.reversion_long.order_count = 1;
    RegimeSignalEngine engine(config);

    std::vector<OrderAction> actions = engine.evaluate(inputs(105.0, 1.0), ledger, gateway);
    ASSERT_EQ(actions.size(), 2u);
    EXPECT_EQ(actions[0].order_tag, "Reversion Short");
    EXPECT_EQ(actions[1].order_tag, "Close Reversion Long");
    EXPECT_DOUBLE_EQ(ledger.reversion_short.shares, 10.0);
    EXPECT_DOUBLE_EQ(ledger.reversion_long.shares, 0.0);
}

TEST_F(RegimeSignalEngineTest, ZeroSizedEntryIsSkipped) {
    gateway.shares_per_entry = 0.0;
    RegimeSignalEngine engine(config);

    std::vector<OrderAction> actions = engine.evaluate(inputs(105.0, 1.0), ledger, gateway);
    EXPECT_TRUE(actions.empty());
    EXPECT_TRUE(gateway.placed_orders.empty());
    EXPECT_EQ(ledger.reversion_short.order_count, 0);
}

TEST_F(RegimeSignalEngineTest, DisabledLegDoesNotEnter) {
    config.enable_reversion_short = false;
    RegimeSignalEngine engine(config);

    EXPECT_TRUE(engine.evaluate(inputs(105.0, 1.0), ledger, gateway).empty());
    EXPECT_EQ(ledger.reversion_short.order_count, 0);
}

TEST_F(RegimeSignalEngineTest, DisabledLegStillExits) {
    config.enable_reversion_short = false;
    ledger.reversion_short.shares = 10.0;
    ledger.reversion_short.order_count = 1;
    RegimeSignalEngine engine(config);

    std::vector<OrderAction> actions = engine.evaluate(inputs(99.0, 0.0), ledger, gateway);
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0].order_intent, OrderIntent::EXIT);
}

TEST_F(RegimeSignalEngineTest, PartialCloseStillClearsLeg) {
    ledger.reversion_long.shares = 10.0;
    ledger.reversion_long.order_count = 1;
    gateway.fill_ratio = 0.5;
    RegimeSignalEngine engine(config);

    std::vector<OrderAction> actions = engine.evaluate(inputs(97.0, 0.0), ledger, gateway);
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_DOUBLE_EQ(actions[0].filled_quantity, -5.0);
    EXPECT_FALSE(ledger.reversion_long.is_open());
}

TEST_F(RegimeSignalEngineTest, ExitLevelsUseBetweenFactor) {
    RegimeSignalEngine engine(config);
    SignalInputs signal_inputs = inputs(100.0, 0.0);
    EXPECT_NEAR(engine.upper_exit_level(signal_inputs), 100.0 - 100.0 * 0.0005, 1e-12);
    EXPECT_NEAR(engine.lower_exit_level(signal_inputs), 95.0 + 100.0 * 0.0005, 1e-12);
    EXPECT_TRUE(engine.is_trend_quality_inside_band(0.0));
    EXPECT_FALSE(engine.is_trend_quality_inside_band(2.5));
    EXPECT_FALSE(engine.is_trend_quality_outside_band(-4.0));
    EXPECT_TRUE(engine.is_trend_quality_outside_band(-4.5));
}

TEST_F(RegimeSignalEngineTest, RejectsInconsistentConfiguration) {
    StrategyConfig inverted = config;
    inverted.low_threshold = 3.0;
    inverted.high_threshold = 1.0;
    EXPECT_THROW(RegimeSignalEngine{inverted}, ConfigurationError);

    StrategyConfig no_orders = config;
    no_orders.max_orders = 0;
    EXPECT_THROW(RegimeSignalEngine{no_orders}, ConfigurationError);

    StrategyConfig oversized = config;
    oversized.entry_allocation = 1.5;
    EXPECT_THROW(RegimeSignalEngine{oversized}, ConfigurationError);
}
