#include "market_bars_loader.hpp"
#include "logging/logger/logging_macros.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace RegimeTrader {
namespace Core {

using RegimeTrader::Logging::log_message;

namespace {
    std::string trim_field(const std::string& field_text) {
        const char* whitespace_chars = " \t\r\n";
        auto begin_position = field_text.find_first_not_of(whitespace_chars);
        auto end_position = field_text.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return field_text.substr(begin_position, end_position - begin_position + 1);
    }

    double parse_price_field(const std::string& field_text, const std::string& field_name, int line_number) {
        size_t parsed_length = 0;
        double parsed_value = 0.0;
        try {
            parsed_value = std::stod(field_text, &parsed_length);
        } catch (const std::exception&) {
            throw std::runtime_error("Line " + std::to_string(line_number) + ": invalid " + field_name + " '" + field_text + "'");
        }
        if (parsed_length != field_text.size() || !std::isfinite(parsed_value)) {
            throw std::runtime_error("Line " + std::to_string(line_number) + ": invalid " + field_name + " '" + field_text + "'");
        }
        return parsed_value;
    }
}

MarketBarsLoader::MarketBarsLoader(const std::string& bars_file_path) : file_path(bars_file_path) {}

bool MarketBarsLoader::is_header_line(const std::string& bar_line) {
    std::string lowered_line = bar_line;
    std::transform(lowered_line.begin(), lowered_line.end(), lowered_line.begin(), ::tolower);
    return lowered_line.find("timestamp") != std::string::npos || lowered_line.find("close") != std::string::npos;
}

Bar MarketBarsLoader::parse_bar_line(const std::string& bar_line, int line_number) {
    std::vector<std::string> bar_fields;
    std::stringstream bar_line_stream(bar_line);
    std::string bar_field;
    while (std::getline(bar_line_stream, bar_field, ',')) {
        bar_fields.push_back(trim_field(bar_field));
    }
    if (bar_fields.size() != 6) {
        throw std::runtime_error("Line " + std::to_string(line_number) + ": expected 6 fields, got " + std::to_string(bar_fields.size()));
    }

    Bar parsed_bar;
    try {
        parsed_bar.timestamp = TimeUtils::parse_timestamp_to_epoch_seconds(bar_fields[0]);
    } catch (const std::exception& timestamp_exception_error) {
        throw std::runtime_error("Line " + std::to_string(line_number) + ": " + timestamp_exception_error.what());
    }
    parsed_bar.open_price = parse_price_field(bar_fields[1], "open", line_number);
    parsed_bar.high_price = parse_price_field(bar_fields[2], "high", line_number);
    parsed_bar.low_price = parse_price_field(bar_fields[3], "low", line_number);
    parsed_bar.close_price = parse_price_field(bar_fields[4], "close", line_number);
    parsed_bar.volume = parse_price_field(bar_fields[5], "volume", line_number);

    if (parsed_bar.open_price <= 0.0 || parsed_bar.high_price <= 0.0 || parsed_bar.low_price <= 0.0 || parsed_bar.close_price <= 0.0) {
        throw std::runtime_error("Line " + std::to_string(line_number) + ": prices must be positive");
    }
    if (parsed_bar.high_price < parsed_bar.low_price) {
        throw std::runtime_error("Line " + std::to_string(line_number) + ": high below low");
    }
    return parsed_bar;
}

std::vector<Bar> MarketBarsLoader::load_bars() const {
    std::ifstream bars_file_stream(file_path);
    if (!bars_file_stream.is_open()) {
        throw std::runtime_error("Cannot open bars file: " + file_path);
    }

    std::vector<Bar> loaded_bars;
    std::string bar_line;
    int line_number = 0;
    bool header_checked = false;
    while (std::getline(bars_file_stream, bar_line)) {
        line_number++;
        bar_line = trim_field(bar_line);
        if (bar_line.empty() || bar_line[0] == '#') continue;

        if (!header_checked) {
            header_checked = true;
            if (is_header_line(bar_line)) continue;
        }

        Bar parsed_bar = parse_bar_line(bar_line, line_number);
        if (!loaded_bars.empty() && parsed_bar.timestamp <= loaded_bars.back().timestamp) {
            throw std::runtime_error("Line " + std::to_string(line_number) + ": timestamps must be strictly increasing");
        }
        loaded_bars.push_back(parsed_bar);
    }

    log_message("Loaded " + std::to_string(loaded_bars.size()) + " bars from " + file_path, "");
    return loaded_bars;
}

} // namespace Core
} // namespace RegimeTrader
