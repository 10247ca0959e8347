#ifndef BAR_ACCUMULATOR_HPP
#define BAR_ACCUMULATOR_HPP

#include "trader/data_structures/data_structures.hpp"
#include <optional>

namespace RegimeTrader {
namespace Core {

/**
 * Consolidates fine bars into fixed N-minute bars aligned to the clock
 * (09:30, 09:35, ... for 5 minutes). A window is emitted when the first bar
 * of a later window arrives, or on flush(). The emitted timestamp is the
 * window start.
 */
class BarAccumulator {
public:
    explicit BarAccumulator(int consolidation_minutes);

    // Returns the completed window when the incoming bar starts a new one
    std::optional<Bar> add_bar(const Bar& incoming_bar);

    // Emits the partially filled window, if any
    std::optional<Bar> flush();

    bool has_pending_bar() const { return pending_bar_count > 0; }
    int get_pending_bar_count() const { return pending_bar_count; }
    long long get_window_seconds() const { return window_length_seconds; }
    void clear();

private:
    long long window_length_seconds;
    Bar accumulating_bar;
    int pending_bar_count;
    long long current_window_start;
    long long last_input_timestamp;
    bool has_previous_input;

    void start_window(const Bar& incoming_bar, long long window_start_timestamp);
};

} // namespace Core
} // namespace RegimeTrader

#endif // BAR_ACCUMULATOR_HPP
