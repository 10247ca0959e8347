#include "indicators.hpp"
#include "linear_regression.hpp"
#include <cmath>
#include <sstream>

namespace RegimeTrader {
namespace Core {

using RegimeTrader::Config::ConfigurationError;

namespace {
    int require_positive_length(int length_value, const std::string& length_name) {
        if (length_value < 1) {
            throw ConfigurationError(length_name + " must be >= 1, got " + std::to_string(length_value));
        }
        return length_value;
    }
}

// ========================================================================
// SIMPLE MOVING AVERAGE
// ========================================================================

SimpleMovingAverage::SimpleMovingAverage(int period_length)
    : period_length_value(require_positive_length(period_length, "SMA period")),
      price_window(period_length),
      current_average_value(0.0) {}

bool SimpleMovingAverage::update(double input_value) {
    price_window.push(input_value);
    if (!price_window.is_full()) {
        return false;
    }

    double price_sum = 0.0;
    for (double window_price : price_window.values()) {
        price_sum += window_price;
    }
    current_average_value = price_sum / static_cast<double>(price_window.size());
    return true;
}

void SimpleMovingAverage::reset() {
    price_window.clear();
    current_average_value = 0.0;
}

// ========================================================================
// EXPONENTIAL MOVING AVERAGE
// ========================================================================

ExponentialMovingAverage::ExponentialMovingAverage(int period_length)
    : period_length_value(require_positive_length(period_length, "EMA period")),
      smoothing_factor(2.0 / (static_cast<double>(period_length) + 1.0)),
      samples_seen(0),
      seed_sum(0.0),
      current_average_value(0.0) {}

bool ExponentialMovingAverage::update(double input_value) {
    samples_seen++;
    if (samples_seen < period_length_value) {
        seed_sum += input_value;
        return false;
    }
    if (samples_seen == period_length_value) {
        seed_sum += input_value;
        current_average_value = seed_sum / static_cast<double>(period_length_value);
        return true;
    }

    current_average_value = input_value * smoothing_factor + current_average_value * (1.0 - smoothing_factor);
    return true;
}

void ExponentialMovingAverage::reset() {
    samples_seen = 0;
    seed_sum = 0.0;
    current_average_value = 0.0;
}

// ========================================================================
// SAMPLE STANDARD DEVIATION
// ========================================================================

SampleStdDevIndicator::SampleStdDevIndicator(int period_length)
    : period_length_value(require_positive_length(period_length, "Standard deviation period")),
      price_window(period_length),
      current_std_dev_value(0.0) {}

double SampleStdDevIndicator::compute_sample_std_dev(const std::deque<double>& sample_values) {
    if (sample_values.size() < 2) {
        return 0.0;
    }

    double sample_count = static_cast<double>(sample_values.size());
    double sample_sum = 0.0;
    for (double sample_value : sample_values) {
        sample_sum += sample_value;
    }
    double sample_mean = sample_sum / sample_count;

    double squared_deviation_sum = 0.0;
    for (double sample_value : sample_values) {
        double deviation_value = sample_value - sample_mean;
        squared_deviation_sum += deviation_value * deviation_value;
    }

    double sample_variance = squared_deviation_sum / (sample_count - 1.0);
    return sample_variance > 0.0 ? std::sqrt(sample_variance) : 0.0;
}

bool SampleStdDevIndicator::update(double input_value) {
    price_window.push(input_value);
    if (!price_window.is_full()) {
        return false;
    }
    current_std_dev_value = compute_sample_std_dev(price_window.values());
    return true;
}

void SampleStdDevIndicator::reset() {
    price_window.clear();
    current_std_dev_value = 0.0;
}

// ========================================================================
// BOLLINGER BANDS
// ========================================================================

BollingerBandsChannel::BollingerBandsChannel(const Config::BollingerConfig& bollinger_config)
    : band_length(require_positive_length(bollinger_config.length, "Bollinger length")),
      band_multiplier(bollinger_config.multiplier),
      moving_average(bollinger_config.length),
      standard_deviation(bollinger_config.length),
      upper_band_value(0.0),
      lower_band_value(0.0) {}

bool BollingerBandsChannel::update(double input_value) {
    moving_average.update(input_value);
    standard_deviation.update(input_value);
    if (!is_ready()) {
        return false;
    }

    double band_width = band_multiplier * standard_deviation.value();
    upper_band_value = moving_average.value() + band_width;
    lower_band_value = moving_average.value() - band_width;
    return true;
}

void BollingerBandsChannel::reset() {
    moving_average.reset();
    standard_deviation.reset();
    upper_band_value = 0.0;
    lower_band_value = 0.0;
}

std::string BollingerBandsChannel::get_name() const {
    std::ostringstream name_stream;
    name_stream << "BB(" << band_length << "," << band_multiplier << ")";
    return name_stream.str();
}

ChannelIndicatorPtr create_channel_indicator(const Config::SystemConfig& config) {
    switch (config.strategy.channel_type) {
        case Config::ChannelType::LINEAR_REGRESSION:
            return ChannelIndicatorPtr(new LinearRegressionChannel(config.indicators.linear_regression));
        case Config::ChannelType::BOLLINGER:
            return ChannelIndicatorPtr(new BollingerBandsChannel(config.indicators.bollinger));
        default:
            throw ConfigurationError("Unknown channel type");
    }
}

} // namespace Core
} // namespace RegimeTrader
