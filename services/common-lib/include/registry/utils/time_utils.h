/**
 * @file time_utils.h
 * @brief Wall-clock formatting helpers
 */

#pragma once

#include <string>
#include <chrono>
#include <cstdint>

namespace registry {
namespace utils {

/**
 * @brief Format time_point as ISO 8601 UTC
 *
 * @param tp std::chrono time_point
 * @param includeMicroseconds Append ".ffffff" before the 'Z'
 * @return e.g. "2026-02-02T12:34:56Z" or "2026-02-02T12:34:56.123456Z"
 */
std::string formatIso8601(
    const std::chrono::system_clock::time_point& tp,
    bool includeMicroseconds = false
);

/**
 * @brief Current UTC time with microseconds, as stored in timestamptz columns
 */
std::string nowIso8601();

/**
 * @brief Nanoseconds since the Unix epoch
 * @throws std::runtime_error if tp precedes the epoch
 */
uint64_t unixNanos(const std::chrono::system_clock::time_point& tp);

} // namespace utils
} // namespace registry
