/**
 * @file time_utils.cpp
 * @brief Wall-clock formatting helpers implementation
 */

#include "registry/utils/time_utils.h"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <stdexcept>

namespace registry {
namespace utils {

std::string formatIso8601(const std::chrono::system_clock::time_point& tp,
                          bool includeMicroseconds) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);

    struct tm tmTime;
    if (!gmtime_r(&seconds, &tmTime)) {
        return "";
    }

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << (tmTime.tm_year + 1900) << '-'
        << std::setw(2) << (tmTime.tm_mon + 1) << '-'
        << std::setw(2) << tmTime.tm_mday << 'T'
        << std::setw(2) << tmTime.tm_hour << ':'
        << std::setw(2) << tmTime.tm_min << ':'
        << std::setw(2) << tmTime.tm_sec;

    if (includeMicroseconds) {
        auto sinceSecond = tp - std::chrono::system_clock::from_time_t(seconds);
        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(sinceSecond).count();
        if (micros < 0) micros = 0;
        oss << '.' << std::setw(6) << micros;
    }

    oss << 'Z';
    return oss.str();
}

std::string nowIso8601() {
    return formatIso8601(std::chrono::system_clock::now(), true);
}

uint64_t unixNanos(const std::chrono::system_clock::time_point& tp) {
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
    if (nanos < 0) {
        throw std::runtime_error("system clock reports a time before the Unix epoch");
    }
    return static_cast<uint64_t>(nanos);
}

} // namespace utils
} // namespace registry
