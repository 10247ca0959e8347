#ifndef TREND_QUALITY_HPP
#define TREND_QUALITY_HPP

#include <optional>
#include <string>
#include "configs/indicator_config.hpp"
#include "indicator_interface.hpp"
#include "indicators.hpp"
#include "rolling_window.hpp"

namespace RegimeTrader {
namespace Core {

/**
 * Trend quality oscillator: smoothed cumulative price change divided by noise.
 *
 * The fast/slow EMA crossover defines the regime. Cumulative price change and
 * its smoothed trend restart from zero on every regime change, so the value
 * only measures movement inside the current regime. Noise is the mean absolute
 * (LINEAR) or root mean square (SQUARED) distance between the two, over the
 * last noise_length warm bars, scaled by the correction factor.
 *
 * Large positive values mark a clean uptrend, large negative values a clean
 * downtrend, values near zero a ranging market.
 */
class TrendQualityIndicator : public Indicator {
public:
    explicit TrendQualityIndicator(const Config::TrendQualityConfig& trend_quality_config);

    bool update(double input_value) override;
    bool is_ready() const override { return noise_window.is_full(); }
    void reset() override;
    double value() const override { return trend_quality_value; }
    std::string get_name() const override;
    int warm_up_period() const override;

    double get_cumulative_price_change() const { return cumulative_price_change; }
    double get_smoothed_trend() const { return smoothed_trend; }
    double get_noise() const { return current_noise_value; }
    double get_smoothing_factor() const { return smoothing_factor; }
    std::optional<int> get_regime_sign() const { return previous_regime_sign; }
    const ExponentialMovingAverage& get_fast_ema() const { return fast_ema; }
    const ExponentialMovingAverage& get_slow_ema() const { return slow_ema; }

    static double compute_noise(const RollingWindow<double>& deviation_window, Config::NoiseMode noise_mode, double correction_factor);

private:
    Config::TrendQualityConfig indicator_config;
    double smoothing_factor;
    ExponentialMovingAverage fast_ema;
    ExponentialMovingAverage slow_ema;

    double cumulative_price_change;
    double smoothed_trend;
    std::optional<double> previous_close;
    std::optional<int> previous_regime_sign;
    RollingWindow<double> noise_window;
    double current_noise_value;
    double trend_quality_value;
};

} // namespace Core
} // namespace RegimeTrader

#endif // TREND_QUALITY_HPP
