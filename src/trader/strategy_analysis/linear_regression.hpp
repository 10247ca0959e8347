#ifndef LINEAR_REGRESSION_HPP
#define LINEAR_REGRESSION_HPP

#include <deque>
#include <string>
#include "configs/indicator_config.hpp"
#include "indicator_interface.hpp"
#include "rolling_window.hpp"

namespace RegimeTrader {
namespace Core {

// Least squares fit of (i, price_i), i = 0 for the oldest sample.
struct RegressionFit {
    double slope;
    double intercept;
    double center_value;             // Fitted value at the newest sample, x = n - 1
    double residual_std_dev;         // Sample std dev of the residuals

    RegressionFit() : slope(0.0), intercept(0.0), center_value(0.0), residual_std_dev(0.0) {}
};

/**
 * Rolling regression over the last `window_count` prices.
 * The fit is solved from scratch on every full-window update using the
 * closed form index sums, so it carries no state between bars besides the window.
 */
class LinearRegressionEngine {
public:
    explicit LinearRegressionEngine(int window_count);

    bool update(double price_value);
    bool is_ready() const { return fit_ready; }
    void reset();

    const RegressionFit& get_fit() const { return current_fit; }
    int get_window_count() const { return window_count_value; }
    const RollingWindow<double>& get_window() const { return price_window; }

    // Returns false when the normal equations are degenerate (fewer than two points).
    static bool solve_regression(const std::deque<double>& price_values, RegressionFit& fit_result);

private:
    int window_count_value;
    RollingWindow<double> price_window;
    RegressionFit current_fit;
    bool fit_ready;
};

class LinearRegressionChannel : public ChannelIndicator {
public:
    explicit LinearRegressionChannel(const Config::LinearRegressionConfig& regression_config);

    bool update(double input_value) override;
    bool is_ready() const override { return regression_engine.is_ready(); }
    void reset() override;
    double value() const override { return center_value; }
    std::string get_name() const override;
    int warm_up_period() const override { return regression_engine.get_window_count(); }

    double upper_band() const override { return upper_band_value; }
    double lower_band() const override { return lower_band_value; }
    double middle_band() const override { return center_value; }

    double get_slope() const { return slope_value; }
    double get_intercept() const { return intercept_value; }
    double get_residual_std_dev() const { return residual_std_dev_value; }

private:
    double upper_deviation;
    double lower_deviation;
    LinearRegressionEngine regression_engine;

    double center_value;
    double slope_value;
    double intercept_value;
    double residual_std_dev_value;
    double upper_band_value;
    double lower_band_value;
};

// Regression line value at the newest bar, without bands.
class LinearRegressionValue : public Indicator {
public:
    explicit LinearRegressionValue(int window_count);

    bool update(double input_value) override;
    bool is_ready() const override { return regression_engine.is_ready(); }
    void reset() override;
    double value() const override { return regression_engine.get_fit().center_value; }
    std::string get_name() const override { return "LINREG(" + std::to_string(regression_engine.get_window_count()) + ")"; }
    int warm_up_period() const override { return regression_engine.get_window_count(); }

    double get_slope() const { return regression_engine.get_fit().slope; }

private:
    LinearRegressionEngine regression_engine;
};

} // namespace Core
} // namespace RegimeTrader

#endif // LINEAR_REGRESSION_HPP
