// rolling_window_test.cpp - fixed capacity FIFO window

#include <gtest/gtest.h>

#include "trader/strategy_analysis/rolling_window.hpp"

#include <stdexcept>

using RegimeTrader::Config::ConfigurationError;
using RegimeTrader::Core::RollingWindow;

TEST(RollingWindowTest, RejectsCapacityBelowOne) {
    EXPECT_THROW(RollingWindow<double>(0), ConfigurationError);
    EXPECT_THROW(RollingWindow<double>(-3), ConfigurationError);
}

TEST(RollingWindowTest, FillsUpToCapacity) {
    RollingWindow<double> window(3);
    EXPECT_TRUE(window.empty());
    EXPECT_EQ(window.capacity(), 3u);

    window.push(1.0);
    window.push(2.0);
    EXPECT_FALSE(window.is_full());
    EXPECT_EQ(window.size(), 2u);

    window.push(3.0);
    EXPECT_TRUE(window.is_full());
    EXPECT_EQ(window.size(), 3u);
}

TEST(RollingWindowTest, EvictsOldestWhenFull) {
    RollingWindow<double> window(3);
    for (double sample : {1.0, 2.0, 3.0, 4.0, 5.0}) {
        window.push(sample);
    }

    ASSERT_EQ(window.size(), 3u);
    EXPECT_DOUBLE_EQ(window.oldest(), 3.0);
    EXPECT_DOUBLE_EQ(window.newest(), 5.0);
    EXPECT_DOUBLE_EQ(window[0], 3.0);
    EXPECT_DOUBLE_EQ(window[1], 4.0);
    EXPECT_DOUBLE_EQ(window[2], 5.0);
}

TEST(RollingWindowTest, ValuesAreOldestFirst) {
    RollingWindow<int> window(4);
    for (int sample = 0; sample < 6; ++sample) {
        window.push(sample);
    }
    const std::deque<int>& values = window.values();
    ASSERT_EQ(values.size(), 4u);
    EXPECT_EQ(values.front(), 2);
    EXPECT_EQ(values.back(), 5);
}

TEST(RollingWindowTest, IndexOutOfRangeThrows) {
    RollingWindow<double> window(2);
    EXPECT_THROW(window.newest(), std::out_of_range);
    window.push(7.0);
    EXPECT_THROW(window[1], std::out_of_range);
}

TEST(RollingWindowTest, ClearEmptiesWindow) {
    RollingWindow<double> window(2);
    window.push(1.0);
    window.push(2.0);
    window.clear();
    EXPECT_TRUE(window.empty());
    EXPECT_FALSE(window.is_full());
    EXPECT_EQ(window.capacity(), 2u);
}
