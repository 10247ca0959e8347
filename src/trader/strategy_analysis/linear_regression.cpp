#include "linear_regression.hpp"
#include <cmath>
#include <sstream>
#include <vector>

namespace RegimeTrader {
namespace Core {

// ========================================================================
// REGRESSION ENGINE
// ========================================================================

LinearRegressionEngine::LinearRegressionEngine(int window_count)
    : window_count_value(window_count),
      price_window(window_count),
      current_fit(),
      fit_ready(false) {}

bool LinearRegressionEngine::solve_regression(const std::deque<double>& price_values, RegressionFit& fit_result) {
    const double point_count = static_cast<double>(price_values.size());

    const double sum_x = point_count * (point_count - 1.0) / 2.0;
    const double sum_x_squared = (point_count - 1.0) * point_count * (2.0 * point_count - 1.0) / 6.0;
    double sum_y = 0.0;
    double sum_xy = 0.0;
    for (size_t point_index = 0; point_index < price_values.size(); ++point_index) {
        sum_y += price_values[point_index];
        sum_xy += static_cast<double>(point_index) * price_values[point_index];
    }

    const double denominator = point_count * sum_x_squared - sum_x * sum_x;
    if (denominator == 0.0) {
        return false;
    }

    const double slope = (point_count * sum_xy - sum_x * sum_y) / denominator;
    const double intercept = (sum_y - slope * sum_x) / point_count;

    std::vector<double> residual_values;
    residual_values.reserve(price_values.size());
    double residual_sum = 0.0;
    for (size_t point_index = 0; point_index < price_values.size(); ++point_index) {
        double predicted_value = slope * static_cast<double>(point_index) + intercept;
        double residual_value = price_values[point_index] - predicted_value;
        residual_values.push_back(residual_value);
        residual_sum += residual_value;
    }

    double residual_variance = 0.0;
    if (price_values.size() > 1) {
        double residual_mean = residual_sum / point_count;
        double squared_deviation_sum = 0.0;
        for (double residual_value : residual_values) {
            squared_deviation_sum += (residual_value - residual_mean) * (residual_value - residual_mean);
        }
        residual_variance = squared_deviation_sum / (point_count - 1.0);
    }

    fit_result.slope = slope;
    fit_result.intercept = intercept;
    fit_result.center_value = slope * (point_count - 1.0) + intercept;
    // Float noise can leave a tiny negative variance on collinear input
    fit_result.residual_std_dev = residual_variance > 0.0 ? std::sqrt(residual_variance) : 0.0;
    return true;
}

bool LinearRegressionEngine::update(double price_value) {
    price_window.push(price_value);
    if (!price_window.is_full()) {
        fit_ready = false;
        return false;
    }

    RegressionFit solved_fit;
    fit_ready = solve_regression(price_window.values(), solved_fit);
    if (fit_ready) {
        current_fit = solved_fit;
    }
    return fit_ready;
}

void LinearRegressionEngine::reset() {
    price_window.clear();
    current_fit = RegressionFit();
    fit_ready = false;
}

// ========================================================================
// REGRESSION CHANNEL
// ========================================================================

LinearRegressionChannel::LinearRegressionChannel(const Config::LinearRegressionConfig& regression_config)
    : upper_deviation(regression_config.upper_deviation),
      lower_deviation(regression_config.lower_deviation),
      regression_engine(regression_config.count),
      center_value(0.0),
      slope_value(0.0),
      intercept_value(0.0),
      residual_std_dev_value(0.0),
      upper_band_value(0.0),
      lower_band_value(0.0) {}

bool LinearRegressionChannel::update(double input_value) {
    if (!regression_engine.update(input_value)) {
        return false;
    }

    const RegressionFit& regression_fit = regression_engine.get_fit();
    center_value = regression_fit.center_value;
    slope_value = regression_fit.slope;
    intercept_value = regression_fit.intercept;
    residual_std_dev_value = regression_fit.residual_std_dev;
    upper_band_value = center_value + upper_deviation * residual_std_dev_value;
    lower_band_value = center_value - lower_deviation * residual_std_dev_value;
    return true;
}

void LinearRegressionChannel::reset() {
    regression_engine.reset();
    center_value = 0.0;
    slope_value = 0.0;
    intercept_value = 0.0;
    residual_std_dev_value = 0.0;
    upper_band_value = 0.0;
    lower_band_value = 0.0;
}

std::string LinearRegressionChannel::get_name() const {
    std::ostringstream name_stream;
    name_stream << "LRC(" << regression_engine.get_window_count() << "," << upper_deviation << "," << lower_deviation << ")";
    return name_stream.str();
}

// ========================================================================
// REGRESSION VALUE
// ========================================================================

LinearRegressionValue::LinearRegressionValue(int window_count) : regression_engine(window_count) {}

bool LinearRegressionValue::update(double input_value) {
    return regression_engine.update(input_value);
}

void LinearRegressionValue::reset() {
    regression_engine.reset();
}

} // namespace Core
} // namespace RegimeTrader
