/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for the load generator
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for loadgen, integrating with common_system's Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace loadgen {

/**
 * @brief Result type alias for loadgen operations
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
 * @brief loadgen-specific error codes
 *
 * Error code range: -900 to -999
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int loadgen_base = -900;

    // Configuration errors (-900 to -919)
    constexpr int config_error = loadgen_base - 0;
    constexpr int config_missing_key = loadgen_base - 1;
    constexpr int config_invalid_value = loadgen_base - 2;
    constexpr int config_file_not_found = loadgen_base - 3;
    constexpr int config_stop_condition = loadgen_base - 4;

    // Catalog errors (-920 to -939)
    constexpr int catalog_error = loadgen_base - 20;
    constexpr int catalog_root_not_found = loadgen_base - 21;
    constexpr int catalog_empty = loadgen_base - 22;
    constexpr int insufficient_data = loadgen_base - 23;
    constexpr int invalid_dicom_file = loadgen_base - 24;
    constexpr int file_read_error = loadgen_base - 25;

    // Metrics errors (-940 to -949)
    constexpr int run_id_mismatch = loadgen_base - 40;

    // Dispatch errors (-950 to -969)
    constexpr int dispatch_failed = loadgen_base - 50;
    constexpr int invalid_argument = loadgen_base - 51;
    constexpr int pool_unavailable = loadgen_base - 52;

    // Driver errors (-970 to -989)
    constexpr int target_unreachable = loadgen_base - 70;
    constexpr int invalid_driver_state = loadgen_base - 71;
} // namespace error_codes

// Re-export common utility functions
using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create a loadgen error result with module context
 * @tparam T The result value type
 * @param code Error code from loadgen::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> loadgen_error(int code, const std::string& message,
                               const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "loadgen");
    }
    return kcenon::common::make_error<T>(code, message, "loadgen", details);
}

/**
 * @brief Create a loadgen void error result
 * @param code Error code from loadgen::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return VoidResult containing the error
 */
inline VoidResult loadgen_void_error(int code, const std::string& message,
                                     const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "loadgen"});
    }
    return VoidResult(error_info{code, message, "loadgen", details});
}

} // namespace loadgen

