#include "time_utils.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace TimeUtils {

namespace {
    std::string format_time_parts(const std::tm& time_parts, const char* pattern) {
        std::ostringstream formatted_stream;
        formatted_stream << std::put_time(&time_parts, pattern);
        return formatted_stream.str();
    }

    bool is_integer_text(const std::string& candidate_text) {
        size_t first_digit_index = (candidate_text[0] == '-') ? 1 : 0;
        if (first_digit_index >= candidate_text.size()) {
            return false;
        }
        for (size_t character_index = first_digit_index; character_index < candidate_text.size(); ++character_index) {
            if (!std::isdigit(static_cast<unsigned char>(candidate_text[character_index]))) {
                return false;
            }
        }
        return true;
    }
}

std::string get_current_human_readable_time() {
    std::time_t now_seconds = std::time(nullptr);
    std::tm local_parts;
    localtime_r(&now_seconds, &local_parts);
    return format_time_parts(local_parts, HUMAN_READABLE);
}

std::string format_epoch_seconds_iso(long long epoch_seconds) {
    std::time_t epoch_time_value = static_cast<std::time_t>(epoch_seconds);
    std::tm utc_parts;
    gmtime_r(&epoch_time_value, &utc_parts);
    return format_time_parts(utc_parts, ISO_8601_UTC);
}

long long parse_timestamp_to_epoch_seconds(const std::string& timestamp_text) {
    if (timestamp_text.empty()) {
        throw std::runtime_error("Empty timestamp");
    }
    if (is_integer_text(timestamp_text)) {
        return std::stoll(timestamp_text);
    }

    std::string iso_text = timestamp_text;
    if (iso_text.back() == 'Z') {
        iso_text.pop_back();
    }
    if (iso_text.size() > 10 && iso_text[10] == ' ') {
        iso_text[10] = 'T';
    }

    std::tm parsed_parts = {};
    std::istringstream iso_stream(iso_text);
    iso_stream >> std::get_time(&parsed_parts, ISO_8601_NO_ZONE);
    if (iso_stream.fail()) {
        throw std::runtime_error("Unparseable timestamp: " + timestamp_text);
    }
    return static_cast<long long>(timegm(&parsed_parts));
}

long long floor_to_interval(long long epoch_seconds, long long interval_seconds) {
    if (interval_seconds <= 0) {
        throw std::runtime_error("Interval must be greater than 0");
    }
    long long offset_seconds = epoch_seconds % interval_seconds;
    if (offset_seconds < 0) {
        offset_seconds += interval_seconds;
    }
    return epoch_seconds - offset_seconds;
}

} // namespace TimeUtils
