#include "trend_quality.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace RegimeTrader {
namespace Core {

using RegimeTrader::Config::ConfigurationError;
using RegimeTrader::Config::NoiseMode;

namespace {
    const Config::TrendQualityConfig& validated_trend_quality_config(const Config::TrendQualityConfig& trend_quality_config) {
        if (trend_quality_config.fast_length < 1) {
            throw ConfigurationError("Trend quality fast_length must be >= 1");
        }
        if (trend_quality_config.slow_length < 1) {
            throw ConfigurationError("Trend quality slow_length must be >= 1");
        }
        if (trend_quality_config.trend_length < 1) {
            throw ConfigurationError("Trend quality trend_length must be >= 1");
        }
        if (trend_quality_config.noise_length < 1) {
            throw ConfigurationError("Trend quality noise_length must be >= 1");
        }
        return trend_quality_config;
    }

    int regime_sign_of(double fast_value, double slow_value) {
        if (fast_value > slow_value) return 1;
        if (fast_value < slow_value) return -1;
        return 0;
    }
}

TrendQualityIndicator::TrendQualityIndicator(const Config::TrendQualityConfig& trend_quality_config)
    : indicator_config(validated_trend_quality_config(trend_quality_config)),
      smoothing_factor(2.0 / (1.0 + static_cast<double>(trend_quality_config.trend_length))),
      fast_ema(trend_quality_config.fast_length),
      slow_ema(trend_quality_config.slow_length),
      cumulative_price_change(0.0),
      smoothed_trend(0.0),
      previous_close(),
      previous_regime_sign(),
      noise_window(trend_quality_config.noise_length),
      current_noise_value(0.0),
      trend_quality_value(0.0) {}

double TrendQualityIndicator::compute_noise(const RollingWindow<double>& deviation_window, NoiseMode noise_mode, double correction_factor) {
    if (deviation_window.empty()) {
        return 0.0;
    }
    const double window_length = static_cast<double>(deviation_window.size());

    switch (noise_mode) {
        case NoiseMode::LINEAR: {
            double deviation_sum = 0.0;
            for (double deviation_value : deviation_window.values()) {
                deviation_sum += deviation_value;
            }
            return correction_factor * deviation_sum / window_length;
        }
        case NoiseMode::SQUARED: {
            double squared_deviation_sum = 0.0;
            for (double deviation_value : deviation_window.values()) {
                squared_deviation_sum += deviation_value * deviation_value;
            }
            return correction_factor * std::sqrt(squared_deviation_sum / window_length);
        }
        default:
            throw ConfigurationError("Noise type must be LINEAR or SQUARED");
    }
}

bool TrendQualityIndicator::update(double input_value) {
    fast_ema.update(input_value);
    slow_ema.update(input_value);

    if (!fast_ema.is_ready() || !slow_ema.is_ready()) {
        previous_close = input_value;
        return false;
    }

    const int regime_sign = regime_sign_of(fast_ema.value(), slow_ema.value());

    if (previous_close.has_value()) {
        if (!previous_regime_sign.has_value() || previous_regime_sign.value() != regime_sign) {
            cumulative_price_change = 0.0;
            smoothed_trend = 0.0;
        } else {
            cumulative_price_change += input_value - previous_close.value();
            smoothed_trend = smoothed_trend * (1.0 - smoothing_factor) + cumulative_price_change * smoothing_factor;
        }
    }

    noise_window.push(std::abs(cumulative_price_change - smoothed_trend));

    previous_close = input_value;
    previous_regime_sign = regime_sign;

    if (!noise_window.is_full()) {
        return false;
    }

    current_noise_value = compute_noise(noise_window, indicator_config.noise_mode, indicator_config.correction_factor);
    trend_quality_value = current_noise_value != 0.0 ? smoothed_trend / current_noise_value : 0.0;
    return true;
}

void TrendQualityIndicator::reset() {
    fast_ema.reset();
    slow_ema.reset();
    cumulative_price_change = 0.0;
    smoothed_trend = 0.0;
    previous_close.reset();
    previous_regime_sign.reset();
    noise_window.clear();
    current_noise_value = 0.0;
    trend_quality_value = 0.0;
}

std::string TrendQualityIndicator::get_name() const {
    std::ostringstream name_stream;
    name_stream << "TQ(" << indicator_config.fast_length << "," << indicator_config.slow_length << ","
                << indicator_config.trend_length << "," << indicator_config.noise_length << ","
                << Config::NoiseModeParser::mode_to_string(indicator_config.noise_mode) << ")";
    return name_stream.str();
}

int TrendQualityIndicator::warm_up_period() const {
    return std::max(indicator_config.fast_length, indicator_config.slow_length) + indicator_config.noise_length;
}

} // namespace Core
} // namespace RegimeTrader
