#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>

namespace TimeUtils {

// Time conversion constants
constexpr long long MILLISECONDS_PER_SECOND = 1000;

// Time format constants
constexpr const char* HUMAN_READABLE = "%Y-%m-%d %H:%M:%S";

// Local time, second resolution: "yyyy-MM-dd HH:mm:ss"
std::string get_current_human_readable_time();

// Local time, millisecond resolution: "yyyy-MM-dd HH:mm:ss.mmm"
std::string format_time_with_milliseconds(std::chrono::system_clock::time_point time_point);

// Rounds a duration in (possibly fractional) seconds up to whole milliseconds.
// Throws std::out_of_range for negative, non-finite or unrepresentable durations.
long long seconds_to_milliseconds_ceil(double seconds);

} // namespace TimeUtils

#endif // TIME_UTILS_HPP
