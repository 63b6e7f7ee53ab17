/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for the RBAC engine
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for the RBAC engine, integrating with common_system's
 * Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace rbac {

/**
 * @brief Result type alias for RBAC operations
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
 * @brief RBAC-specific error codes
 *
 * Error code range: -700 to -799
 */
namespace error_codes {
    // Import common error codes
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int rbac_base = -700;

    // Tuple and filter validation (-700 to -719)
    constexpr int invalid_policy_tuple = rbac_base - 0;
    constexpr int invalid_grouping_tuple = rbac_base - 1;
    constexpr int invalid_filter = rbac_base - 2;
    constexpr int filter_field_out_of_range = rbac_base - 3;
    constexpr int filter_not_contiguous = rbac_base - 4;
    constexpr int invalid_entity_ref = rbac_base - 5;

    // Role lifecycle (-720 to -739)
    constexpr int role_metadata_not_found = rbac_base - 20;
    constexpr int role_metadata_exists = rbac_base - 21;
    constexpr int role_mismatch = rbac_base - 22;
    constexpr int role_update_precondition = rbac_base - 23;

    // Role graph (-740 to -759)
    constexpr int role_graph_error = rbac_base - 40;

    // Storage (-780 to -799)
    constexpr int database_open_error = rbac_base - 80;
    constexpr int database_query_error = rbac_base - 81;
    constexpr int database_transaction_error = rbac_base - 82;
    constexpr int database_migration_error = rbac_base - 83;
    constexpr int transaction_not_active = rbac_base - 84;
    constexpr int config_error = rbac_base - 90;
} // namespace error_codes

// Re-export common utility functions
using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create an RBAC error result with module context
 * @tparam T The result value type
 * @param code Error code from rbac::error_codes
 * @param message Error message
 * @param module Originating module name
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> rbac_error(int code, const std::string& message,
                            const std::string& module = "rbac") {
    return kcenon::common::make_error<T>(code, message, module);
}

/**
 * @brief Create an RBAC void error result
 * @param code Error code from rbac::error_codes
 * @param message Error message
 * @param module Originating module name
 * @return VoidResult containing the error
 */
inline VoidResult rbac_void_error(int code, const std::string& message,
                                  const std::string& module = "rbac") {
    return VoidResult(error_info{code, message, module});
}

} // namespace rbac
