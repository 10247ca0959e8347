#ifndef INDICATOR_CONFIG_HPP
#define INDICATOR_CONFIG_HPP

#include "configuration_error.hpp"
#include <string>

namespace RegimeTrader {
namespace Config {

enum class NoiseMode {
    LINEAR,
    SQUARED
};

struct NoiseModeParser {
    static NoiseMode parse_mode(const std::string& mode_str) {
        if (mode_str == "linear" || mode_str == "LINEAR") {
            return NoiseMode::LINEAR;
        } else if (mode_str == "squared" || mode_str == "SQUARED") {
            return NoiseMode::SQUARED;
        } else {
            throw ConfigurationError("Invalid noise type: " + mode_str + ". Must be 'LINEAR' or 'SQUARED'");
        }
    }

    static std::string mode_to_string(NoiseMode mode) {
        switch (mode) {
            case NoiseMode::LINEAR:
                return "LINEAR";
            case NoiseMode::SQUARED:
                return "SQUARED";
            default:
                throw ConfigurationError("Unknown noise type");
        }
    }
};

struct LinearRegressionConfig {
    int count = 100;                                 // Bars in the regression window
    double upper_deviation = 2.0;                    // Residual std devs above the center line
    double lower_deviation = 2.0;                    // Residual std devs below the center line
};

struct BollingerConfig {
    int length = 20;                                 // SMA / std dev window
    double multiplier = 2.0;                         // Sample std devs either side of the SMA
};

struct TrendQualityConfig {
    int fast_length = 7;                             // Fast EMA period
    int slow_length = 15;                            // Slow EMA period
    int trend_length = 4;                            // Smoothing length for cumulative price change
    int noise_length = 250;                          // Noise window length
    double correction_factor = 2.0;                  // Noise scaling
    NoiseMode noise_mode = NoiseMode::LINEAR;        // Mean absolute or root mean square deviation
};

struct IndicatorConfig {
    LinearRegressionConfig linear_regression;
    BollingerConfig bollinger;
    TrendQualityConfig trend_quality;
};

} // namespace Config
} // namespace RegimeTrader

#endif // INDICATOR_CONFIG_HPP
