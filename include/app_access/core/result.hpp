/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for the access engine
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for app_access, integrating with common_system's Result
 * pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace app_access {

/**
 * @brief Result type alias for access engine operations
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
 * @brief app_access error codes
 *
 * Error code range: -1000 to -1099
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int access_base = -1000;

    // Model errors (-1000 to -1019)
    constexpr int duplicate_element = access_base - 0;
    constexpr int not_found = access_base - 1;
    constexpr int invalid_reference = access_base - 2;
    constexpr int self_reference = access_base - 3;
    constexpr int circular_reference = access_base - 4;
    constexpr int invalid_name = access_base - 5;
} // namespace error_codes

/// Module name attached to every error raised by the engine
inline constexpr const char* error_module = "app_access";

using kcenon::common::ok;

/**
 * @brief Create an access engine error result
 * @tparam T The result value type
 * @param code Error code from app_access::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> access_error(int code, const std::string& message,
                              const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, error_module);
    }
    return kcenon::common::make_error<T>(code, message, error_module, details);
}

/**
 * @brief Create an access engine void error result
 */
inline VoidResult access_void_error(int code, const std::string& message,
                                    const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, error_module});
    }
    return VoidResult(error_info{code, message, error_module, details});
}

} // namespace app_access
