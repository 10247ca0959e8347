#ifndef INDICATORS_HPP
#define INDICATORS_HPP

#include <string>
#include "configs/system_config.hpp"
#include "indicator_interface.hpp"
#include "rolling_window.hpp"

namespace RegimeTrader {
namespace Core {

class SimpleMovingAverage : public Indicator {
public:
    explicit SimpleMovingAverage(int period_length);

    bool update(double input_value) override;
    bool is_ready() const override { return price_window.is_full(); }
    void reset() override;
    double value() const override { return current_average_value; }
    std::string get_name() const override { return "SMA(" + std::to_string(period_length_value) + ")"; }
    int warm_up_period() const override { return period_length_value; }

private:
    int period_length_value;
    RollingWindow<double> price_window;
    double current_average_value;
};

/**
 * Exponential moving average, alpha = 2 / (period + 1).
 * The first value is the simple average of the first `period` samples; it is
 * ready from that sample on.
 */
class ExponentialMovingAverage : public Indicator {
public:
    explicit ExponentialMovingAverage(int period_length);

    bool update(double input_value) override;
    bool is_ready() const override { return samples_seen >= period_length_value; }
    void reset() override;
    double value() const override { return current_average_value; }
    std::string get_name() const override { return "EMA(" + std::to_string(period_length_value) + ")"; }
    int warm_up_period() const override { return period_length_value; }

    double get_smoothing_factor() const { return smoothing_factor; }

private:
    int period_length_value;
    double smoothing_factor;
    int samples_seen;
    double seed_sum;
    double current_average_value;
};

// Rolling standard deviation of raw closes with the n - 1 denominator.
class SampleStdDevIndicator : public Indicator {
public:
    explicit SampleStdDevIndicator(int period_length);

    bool update(double input_value) override;
    bool is_ready() const override { return price_window.is_full(); }
    void reset() override;
    double value() const override { return current_std_dev_value; }
    std::string get_name() const override { return "STDDEV(" + std::to_string(period_length_value) + ")"; }
    int warm_up_period() const override { return period_length_value; }

    static double compute_sample_std_dev(const std::deque<double>& sample_values);

private:
    int period_length_value;
    RollingWindow<double> price_window;
    double current_std_dev_value;
};

// SMA +/- multiplier * sample standard deviation over the same window.
class BollingerBandsChannel : public ChannelIndicator {
public:
    explicit BollingerBandsChannel(const Config::BollingerConfig& bollinger_config);

    bool update(double input_value) override;
    bool is_ready() const override { return moving_average.is_ready() && standard_deviation.is_ready(); }
    void reset() override;
    double value() const override { return middle_band(); }
    std::string get_name() const override;
    int warm_up_period() const override { return band_length; }

    double upper_band() const override { return upper_band_value; }
    double lower_band() const override { return lower_band_value; }
    double middle_band() const override { return moving_average.value(); }
    double get_std_dev() const { return standard_deviation.value(); }

private:
    int band_length;
    double band_multiplier;
    SimpleMovingAverage moving_average;
    SampleStdDevIndicator standard_deviation;
    double upper_band_value;
    double lower_band_value;
};

// Builds the channel selected by strategy.channel_type.
ChannelIndicatorPtr create_channel_indicator(const Config::SystemConfig& config);

} // namespace Core
} // namespace RegimeTrader

#endif // INDICATORS_HPP
