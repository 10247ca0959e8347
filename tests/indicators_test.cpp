// indicators_test.cpp - moving averages, sample deviation, Bollinger channel

#include <gtest/gtest.h>

#include "trader/strategy_analysis/indicators.hpp"
#include "trader/strategy_analysis/linear_regression.hpp"

#include <cmath>
#include <vector>

using namespace RegimeTrader::Core;
using RegimeTrader::Config::BollingerConfig;
using RegimeTrader::Config::ChannelType;
using RegimeTrader::Config::ConfigurationError;
using RegimeTrader::Config::SystemConfig;

TEST(SimpleMovingAverageTest, AveragesLastPeriodSamples) {
    SimpleMovingAverage average(3);
    EXPECT_FALSE(average.update(1.0));
    EXPECT_FALSE(average.update(2.0));
    EXPECT_TRUE(average.update(3.0));
    EXPECT_DOUBLE_EQ(average.value(), 2.0);
    EXPECT_TRUE(average.update(6.0));
    EXPECT_DOUBLE_EQ(average.value(), 11.0 / 3.0);
}

TEST(ExponentialMovingAverageTest, SeededWithSimpleAverage) {
    ExponentialMovingAverage average(3);
    EXPECT_DOUBLE_EQ(average.get_smoothing_factor(), 0.5);
    EXPECT_FALSE(average.update(2.0));
    EXPECT_FALSE(average.update(4.0));
    EXPECT_TRUE(average.update(6.0));
    EXPECT_DOUBLE_EQ(average.value(), 4.0);

    EXPECT_TRUE(average.update(10.0));
    EXPECT_DOUBLE_EQ(average.value(), 7.0);
}

TEST(ExponentialMovingAverageTest, PeriodOneTracksInput) {
    ExponentialMovingAverage average(1);
    EXPECT_TRUE(average.update(5.0));
    EXPECT_DOUBLE_EQ(average.value(), 5.0);
    average.update(8.0);
    EXPECT_DOUBLE_EQ(average.value(), 8.0);
}

TEST(ExponentialMovingAverageTest, RejectsNonPositivePeriod) {
    EXPECT_THROW(ExponentialMovingAverage(0), ConfigurationError);
    EXPECT_THROW(SimpleMovingAverage(-1), ConfigurationError);
}

TEST(SampleStdDevIndicatorTest, UsesSampleDenominator) {
    SampleStdDevIndicator deviation(4);
    for (double sample : {2.0, 4.0, 4.0, 6.0}) {
        deviation.update(sample);
    }
    ASSERT_TRUE(deviation.is_ready());
    // mean 4, squared deviations 4+0+0+4 = 8, 8 / 3
    EXPECT_NEAR(deviation.value(), std::sqrt(8.0 / 3.0), 1e-12);
}

TEST(SampleStdDevIndicatorTest, PeriodOneReportsZero) {
    SampleStdDevIndicator deviation(1);
    EXPECT_TRUE(deviation.update(12.5));
    EXPECT_DOUBLE_EQ(deviation.value(), 0.0);
}

TEST(SampleStdDevIndicatorTest, ConstantInputHasZeroDeviation) {
    SampleStdDevIndicator deviation(5);
    for (int i = 0; i < 8; ++i) {
        deviation.update(100.0);
    }
    EXPECT_DOUBLE_EQ(deviation.value(), 0.0);
}

TEST(BollingerBandsChannelTest, BandsAroundSimpleAverage) {
    BollingerConfig config;
    config.length = 4;
    config.multiplier = 2.0;
    BollingerBandsChannel channel(config);

    for (double sample : {2.0, 4.0, 4.0, 6.0}) {
        channel.update(sample);
    }
    ASSERT_TRUE(channel.is_ready());
    double sigma = std::sqrt(8.0 / 3.0);
    EXPECT_DOUBLE_EQ(channel.middle_band(), 4.0);
    EXPECT_NEAR(channel.upper_band(), 4.0 + 2.0 * sigma, 1e-12);
    EXPECT_NEAR(channel.lower_band(), 4.0 - 2.0 * sigma, 1e-12);
    EXPECT_NEAR(channel.get_std_dev(), sigma, 1e-12);
    EXPECT_EQ(channel.get_name(), "BB(4,2)");
}

TEST(BollingerBandsChannelTest, ResetAndReplayReproducesOutputs) {
    BollingerConfig config;
    config.length = 3;
    config.multiplier = 1.5;
    BollingerBandsChannel channel(config);
    const std::vector<double> prices = {10.0, 10.4, 9.8, 10.9, 11.3, 10.7, 11.8};

    std::vector<double> first_pass;
    for (double price : prices) {
        if (channel.update(price)) first_pass.push_back(channel.lower_band());
    }
    channel.reset();
    EXPECT_FALSE(channel.is_ready());

    std::vector<double> second_pass;
    for (double price : prices) {
        if (channel.update(price)) second_pass.push_back(channel.lower_band());
    }
    EXPECT_EQ(first_pass, second_pass);
}

TEST(ChannelFactoryTest, BuildsConfiguredChannel) {
    SystemConfig config;
    config.strategy.channel_type = ChannelType::LINEAR_REGRESSION;
    config.indicators.linear_regression.count = 50;
    ChannelIndicatorPtr regression_channel = create_channel_indicator(config);
    ASSERT_NE(regression_channel, nullptr);
    EXPECT_NE(dynamic_cast<LinearRegressionChannel*>(regression_channel.get()), nullptr);
    EXPECT_EQ(regression_channel->warm_up_period(), 50);

    config.strategy.channel_type = ChannelType::BOLLINGER;
    config.indicators.bollinger.length = 20;
    ChannelIndicatorPtr bollinger_channel = create_channel_indicator(config);
    EXPECT_NE(dynamic_cast<BollingerBandsChannel*>(bollinger_channel.get()), nullptr);
    EXPECT_EQ(bollinger_channel->warm_up_period(), 20);
}
