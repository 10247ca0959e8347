#ifndef ROLLING_WINDOW_HPP
#define ROLLING_WINDOW_HPP

#include <deque>
#include <string>
#include <stdexcept>
#include <cstddef>
#include "configs/configuration_error.hpp"

namespace RegimeTrader {
namespace Core {

/**
 * Fixed capacity FIFO of samples.
 * Index 0 is the oldest sample; pushing into a full window evicts it.
 */
template <typename ValueType>
class RollingWindow {
public:
    explicit RollingWindow(int window_capacity_param) {
        if (window_capacity_param < 1) {
            throw Config::ConfigurationError("Rolling window capacity must be >= 1, got " + std::to_string(window_capacity_param));
        }
        window_capacity = static_cast<size_t>(window_capacity_param);
    }

    void push(const ValueType& sample_value) {
        if (window_values.size() == window_capacity) {
            window_values.pop_front();
        }
        window_values.push_back(sample_value);
    }

    bool is_full() const { return window_values.size() == window_capacity; }
    bool empty() const { return window_values.empty(); }
    size_t size() const { return window_values.size(); }
    size_t capacity() const { return window_capacity; }

    const std::deque<ValueType>& values() const { return window_values; }

    const ValueType& operator[](size_t sample_index) const {
        if (sample_index >= window_values.size()) {
            throw std::out_of_range("Rolling window index " + std::to_string(sample_index) + " out of range (size " + std::to_string(window_values.size()) + ")");
        }
        return window_values[sample_index];
    }

    const ValueType& oldest() const { return (*this)[0]; }
    const ValueType& newest() const {
        if (window_values.empty()) {
            throw std::out_of_range("Rolling window is empty");
        }
        return window_values.back();
    }

    void clear() { window_values.clear(); }

private:
    size_t window_capacity;
    std::deque<ValueType> window_values;
};

} // namespace Core
} // namespace RegimeTrader

#endif // ROLLING_WINDOW_HPP
