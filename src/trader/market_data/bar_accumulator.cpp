#include "bar_accumulator.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace RegimeTrader {
namespace Core {

BarAccumulator::BarAccumulator(int consolidation_minutes)
    : window_length_seconds(static_cast<long long>(consolidation_minutes) * TimeUtils::SECONDS_PER_MINUTE),
      accumulating_bar(),
      pending_bar_count(0),
      current_window_start(0),
      last_input_timestamp(0),
      has_previous_input(false)
{
    if (consolidation_minutes <= 0) {
        throw std::runtime_error("Consolidation period must be greater than 0 minutes");
    }
}

void BarAccumulator::start_window(const Bar& incoming_bar, long long window_start_timestamp) {
    current_window_start = window_start_timestamp;
    accumulating_bar = incoming_bar;
    accumulating_bar.timestamp = window_start_timestamp;
    pending_bar_count = 1;
}

std::optional<Bar> BarAccumulator::add_bar(const Bar& incoming_bar) {
    if (has_previous_input && incoming_bar.timestamp <= last_input_timestamp) {
        throw std::runtime_error("Bar timestamps must be strictly increasing (got " + std::to_string(incoming_bar.timestamp) +
                                 " after " + std::to_string(last_input_timestamp) + ")");
    }
    last_input_timestamp = incoming_bar.timestamp;
    has_previous_input = true;

    long long incoming_window_start = TimeUtils::floor_to_interval(incoming_bar.timestamp, window_length_seconds);

    if (pending_bar_count == 0) {
        start_window(incoming_bar, incoming_window_start);
        return std::nullopt;
    }

    if (incoming_window_start != current_window_start) {
        Bar completed_bar = accumulating_bar;
        start_window(incoming_bar, incoming_window_start);
        return completed_bar;
    }

    accumulating_bar.high_price = std::max(accumulating_bar.high_price, incoming_bar.high_price);
    accumulating_bar.low_price = std::min(accumulating_bar.low_price, incoming_bar.low_price);
    accumulating_bar.close_price = incoming_bar.close_price;
    accumulating_bar.volume += incoming_bar.volume;
    pending_bar_count++;
    return std::nullopt;
}

std::optional<Bar> BarAccumulator::flush() {
    if (pending_bar_count == 0) {
        return std::nullopt;
    }
    Bar completed_bar = accumulating_bar;
    pending_bar_count = 0;
    accumulating_bar = Bar{};
    current_window_start = 0;
    return completed_bar;
}

void BarAccumulator::clear() {
    accumulating_bar = Bar{};
    pending_bar_count = 0;
    current_window_start = 0;
    last_input_timestamp = 0;
    has_previous_input = false;
}

} // namespace Core
} // namespace RegimeTrader
