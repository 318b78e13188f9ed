/**
 * @file time.hpp
 * @brief Cross-platform time conversion and ISO-8601 timestamp helpers
 *
 * POSIX provides gmtime_r(time_t*, tm*) while Windows provides
 * gmtime_s(tm*, time_t*). Both are thread-safe.
 */

#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

namespace equipdb::compat {

/**
 * @brief Cross-platform thread-safe UTC time conversion
 *
 * @param time Pointer to the time_t value to convert
 * @param result Pointer to the tm structure to store the result
 * @return Pointer to the tm structure (result) on success, nullptr on failure
 */
inline std::tm* gmtime_safe(const std::time_t* time, std::tm* result) {
#if defined(_WIN32) || defined(_WIN64)
    return gmtime_s(result, time) == 0 ? result : nullptr;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Format a time point as UTC ISO-8601 with milliseconds
 *
 * Produces e.g. "2025-01-05T10:00:00.123Z".
 */
inline auto format_iso8601_utc(std::chrono::system_clock::time_point tp)
    -> std::string {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  tp.time_since_epoch()) %
              1000;

    std::tm tm_val{};
    if (gmtime_safe(&time_t_val, &tm_val) == nullptr) {
        return {};
    }

    char buffer[32];
    auto len = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm_val);

    char millis[8];
    std::snprintf(millis, sizeof(millis), ".%03dZ", static_cast<int>(ms.count()));
    return std::string(buffer, len) + millis;
}

/**
 * @brief Current UTC time as ISO-8601 with milliseconds
 */
inline auto now_iso8601_utc() -> std::string {
    return format_iso8601_utc(std::chrono::system_clock::now());
}

}  // namespace equipdb::compat
