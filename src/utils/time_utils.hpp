#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>

namespace TimeUtils {

constexpr long long SECONDS_PER_MINUTE = 60;

// strftime patterns
constexpr const char* ISO_8601_UTC = "%Y-%m-%dT%H:%M:%SZ";
constexpr const char* ISO_8601_NO_ZONE = "%Y-%m-%dT%H:%M:%S";
constexpr const char* HUMAN_READABLE = "%Y-%m-%d %H:%M:%S";
constexpr const char* LOG_FILENAME = "%d-%H-%M";

// Local wall clock, HUMAN_READABLE
std::string get_current_human_readable_time();

// Bar timestamps are epoch seconds, UTC
std::string format_epoch_seconds_iso(long long epoch_seconds);

// Accepts integer epoch seconds or ISO-8601 ("T" or space separator, optional trailing Z)
long long parse_timestamp_to_epoch_seconds(const std::string& timestamp_text);

// Start of the interval containing epoch_seconds; intervals are aligned to the epoch
long long floor_to_interval(long long epoch_seconds, long long interval_seconds);

} // namespace TimeUtils

#endif // TIME_UTILS_HPP
