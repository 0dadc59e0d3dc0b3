#include "time_utils.hpp"
#include <cmath>
#include <ctime>
#include <limits>
#include <stdexcept>

namespace TimeUtils {

std::string get_current_human_readable_time() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;

    // Use thread-safe localtime_r instead of localtime
    struct tm timeinfo;
    localtime_r(&in_time_t, &timeinfo);
    ss << std::put_time(&timeinfo, HUMAN_READABLE);
    return ss.str();
}

std::string format_time_with_milliseconds(std::chrono::system_clock::time_point time_point) {
    auto in_time_t = std::chrono::system_clock::to_time_t(time_point);
    auto since_epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(time_point.time_since_epoch()).count();
    long long millisecond_part = since_epoch_ms % MILLISECONDS_PER_SECOND;

    struct tm timeinfo;
    localtime_r(&in_time_t, &timeinfo);

    std::stringstream ss;
    ss << std::put_time(&timeinfo, HUMAN_READABLE)
       << '.' << std::setw(3) << std::setfill('0') << millisecond_part;
    return ss.str();
}

long long seconds_to_milliseconds_ceil(double seconds) {
    double milliseconds = std::ceil(seconds * static_cast<double>(MILLISECONDS_PER_SECOND));
    // 2^63 is exactly representable; anything at or above it does not fit in long long
    if (!std::isfinite(milliseconds) || milliseconds < 0.0 ||
        milliseconds >= static_cast<double>(std::numeric_limits<long long>::max())) {
        throw std::out_of_range("Duration not representable in milliseconds: " + std::to_string(seconds) + "s");
    }
    return static_cast<long long>(milliseconds);
}

} // namespace TimeUtils
