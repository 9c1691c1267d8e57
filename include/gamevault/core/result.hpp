/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for the game library
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for gamevault, integrating with common_system's Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace gamevault {

/**
 * @brief Result type alias for library operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief gamevault-specific error codes
 *
 * Error code range: -1000 to -1099
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int gamevault_base = -1000;

    // Transition rejections (-1000 to -1019)
    constexpr int already_advanced = gamevault_base - 0;
    constexpr int game_not_found = gamevault_base - 1;
    constexpr int concurrent_modification = gamevault_base - 2;
    constexpr int invalid_argument = gamevault_base - 3;
    constexpr int entry_not_found = gamevault_base - 4;
    constexpr int invalid_category = gamevault_base - 5;

    // Storage errors (-1020 to -1039)
    constexpr int storage_error = gamevault_base - 20;
    constexpr int database_open_error = gamevault_base - 21;
    constexpr int database_migration_error = gamevault_base - 22;
    constexpr int database_query_error = gamevault_base - 23;
    constexpr int database_transaction_error = gamevault_base - 24;
    constexpr int database_integrity_error = gamevault_base - 25;
}  // namespace error_codes

using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create a gamevault error result with module context
 * @tparam T The result value type
 * @param code Error code from gamevault::error_codes
 * @param message Error message
 * @param module Component that raised the error
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> gamevault_error(int code, const std::string& message,
                                 const std::string& module,
                                 const std::string& details = "") {
    if (details.empty()) {
        return Result<T>(error_info{code, message, module});
    }
    return Result<T>(error_info{code, message, module, details});
}

/**
 * @brief Create a gamevault void error result
 */
inline VoidResult gamevault_void_error(int code, const std::string& message,
                                       const std::string& module,
                                       const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, module});
    }
    return VoidResult(error_info{code, message, module, details});
}

/**
 * @brief Check whether an error may be resolved by retrying the request
 */
[[nodiscard]] inline auto is_retryable(const error_info& error) noexcept -> bool {
    return error.code == error_codes::concurrent_modification;
}

}  // namespace gamevault

