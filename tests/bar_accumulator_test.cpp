// bar_accumulator_test.cpp - clock aligned N-minute consolidation

#include <gtest/gtest.h>

#include "trader/market_data/bar_accumulator.hpp"

#include <optional>
#include <stdexcept>

using namespace RegimeTrader::Core;

namespace {

const long long kSessionOpen = 1704187800;  // 2024-01-02T09:30:00Z

Bar minute_bar(int minute_offset, double open_price, double high_price, double low_price, double close_price, double volume) {
    Bar bar;
    bar.timestamp = kSessionOpen + 60LL * minute_offset;
    bar.open_price = open_price;
    bar.high_price = high_price;
    bar.low_price = low_price;
    bar.close_price = close_price;
    bar.volume = volume;
    return bar;
}

} // namespace

TEST(BarAccumulatorTest, RejectsNonPositivePeriod) {
    EXPECT_THROW(BarAccumulator(0), std::runtime_error);
}

TEST(BarAccumulatorTest, MergesWindowIntoOneBar) {
    BarAccumulator accumulator(5);
    EXPECT_EQ(accumulator.get_window_seconds(), 300);

    EXPECT_FALSE(accumulator.add_bar(minute_bar(0, 10.0, 10.5, 9.8, 10.2, 100.0)).has_value());
    EXPECT_FALSE(accumulator.add_bar(minute_bar(1, 10.2, 11.0, 10.1, 10.9, 150.0)).has_value());
    EXPECT_FALSE(accumulator.add_bar(minute_bar(4, 10.9, 10.95, 9.5, 9.7, 50.0)).has_value());
    EXPECT_EQ(accumulator.get_pending_bar_count(), 3);

    std::optional<Bar> completed = accumulator.add_bar(minute_bar(5, 9.7, 9.9, 9.6, 9.8, 10.0));
    ASSERT_TRUE(completed.has_value());
    EXPECT_EQ(completed->timestamp, kSessionOpen);
    EXPECT_DOUBLE_EQ(completed->open_price, 10.0);
    EXPECT_DOUBLE_EQ(completed->high_price, 11.0);
    EXPECT_DOUBLE_EQ(completed->low_price, 9.5);
    EXPECT_DOUBLE_EQ(completed->close_price, 9.7);
    EXPECT_DOUBLE_EQ(completed->volume, 300.0);
    EXPECT_EQ(accumulator.get_pending_bar_count(), 1);
}

TEST(BarAccumulatorTest, AlignsToClockNotFirstBar) {
    BarAccumulator accumulator(5);
    // 09:32 starts the 09:30 window
    accumulator.add_bar(minute_bar(2, 10.0, 10.0, 10.0, 10.0, 1.0));
    std::optional<Bar> completed = accumulator.add_bar(minute_bar(5, 11.0, 11.0, 11.0, 11.0, 1.0));
    ASSERT_TRUE(completed.has_value());
    EXPECT_EQ(completed->timestamp, kSessionOpen);
    EXPECT_EQ(completed->volume, 1.0);
}

TEST(BarAccumulatorTest, GapSkipsEmptyWindows) {
    BarAccumulator accumulator(5);
    accumulator.add_bar(minute_bar(0, 10.0, 10.0, 10.0, 10.0, 1.0));
    std::optional<Bar> completed = accumulator.add_bar(minute_bar(17, 12.0, 12.0, 12.0, 12.0, 1.0));
    ASSERT_TRUE(completed.has_value());
    EXPECT_EQ(completed->timestamp, kSessionOpen);

    std::optional<Bar> trailing = accumulator.flush();
    ASSERT_TRUE(trailing.has_value());
    EXPECT_EQ(trailing->timestamp, kSessionOpen + 15 * 60);
}

TEST(BarAccumulatorTest, FlushEmitsPartialWindowOnce) {
    BarAccumulator accumulator(5);
    EXPECT_FALSE(accumulator.flush().has_value());
    accumulator.add_bar(minute_bar(0, 10.0, 10.0, 10.0, 10.0, 1.0));
    EXPECT_TRUE(accumulator.flush().has_value());
    EXPECT_FALSE(accumulator.flush().has_value());
    EXPECT_FALSE(accumulator.has_pending_bar());
}

TEST(BarAccumulatorTest, RejectsOutOfOrderBars) {
    BarAccumulator accumulator(5);
    accumulator.add_bar(minute_bar(3, 10.0, 10.0, 10.0, 10.0, 1.0));
    EXPECT_THROW(accumulator.add_bar(minute_bar(3, 10.0, 10.0, 10.0, 10.0, 1.0)), std::runtime_error);
    EXPECT_THROW(accumulator.add_bar(minute_bar(1, 10.0, 10.0, 10.0, 10.0, 1.0)), std::runtime_error);

    // Still rejected after a flush
    accumulator.flush();
    EXPECT_THROW(accumulator.add_bar(minute_bar(2, 10.0, 10.0, 10.0, 10.0, 1.0)), std::runtime_error);
}

TEST(BarAccumulatorTest, OneMinutePeriodPassesBarsThrough) {
    BarAccumulator accumulator(1);
    accumulator.add_bar(minute_bar(0, 10.0, 10.5, 9.5, 10.1, 5.0));
    std::optional<Bar> completed = accumulator.add_bar(minute_bar(1, 10.1, 10.2, 10.0, 10.0, 6.0));
    ASSERT_TRUE(completed.has_value());
    EXPECT_DOUBLE_EQ(completed->close_price, 10.1);
    EXPECT_DOUBLE_EQ(completed->volume, 5.0);
}
