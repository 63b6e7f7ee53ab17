/**
 * @file time.hpp
 * @brief Cross-platform time helpers
 *
 * Wraps the POSIX / Windows differences in thread-safe time conversion and
 * provides the timestamp format used for role metadata records.
 *
 * Usage:
 *   #include <rbac/compat/time.hpp>
 *   auto stamp = rbac::compat::utc_http_date(std::chrono::system_clock::now());
 */

#pragma once

#include <chrono>
#include <ctime>
#include <string>

namespace rbac::compat {

/**
 * @brief Cross-platform thread-safe UTC time conversion
 *
 * Uses gmtime_r on POSIX systems and gmtime_s on Windows.
 *
 * @param time Pointer to the time_t value to convert
 * @param result Pointer to the tm structure to store the result
 * @return Pointer to the tm structure (result) on success, nullptr on failure
 */
inline std::tm* gmtime_safe(const std::time_t* time, std::tm* result) {
#if defined(_WIN32) || defined(_WIN64)
    // Windows: gmtime_s returns errno_t (0 on success)
    return gmtime_s(result, time) == 0 ? result : nullptr;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Format a time point as an RFC 7231 date in UTC
 *
 * Produces strings such as "Mon, 19 Oct 2026 12:00:00 GMT".
 *
 * @param tp Time point to format
 * @return Formatted date, or an empty string if conversion fails
 */
inline std::string utc_http_date(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (gmtime_safe(&time, &tm) == nullptr) {
        return {};
    }
    char buf[40];
    auto len = std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tm);
    return std::string(buf, len);
}

}  // namespace rbac::compat
