/**
 * @file time.hpp
 * @brief Compatibility header for cross-platform time functions
 *
 * POSIX uses gmtime_r(time_t*, tm*) and timegm(tm*); Windows uses
 * gmtime_s(tm*, time_t*) and _mkgmtime(tm*).
 */

#pragma once

#include <ctime>

namespace gamevault::compat {

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
 * @brief Inverse of gmtime_safe (broken-down UTC time to time_t)
 */
inline std::time_t timegm_safe(std::tm* tm) {
#if defined(_WIN32) || defined(_WIN64)
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

}  // namespace gamevault::compat
