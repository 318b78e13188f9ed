/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for equipdb
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for equipdb, integrating with common_system's Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>

#include <string>

namespace equipdb {

/**
 * @brief Result type alias for equipdb operations
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
 * @brief equipdb-specific error codes
 *
 * Error code range: -900 to -999
 */
namespace error_codes {
    constexpr int equipdb_base = -900;

    // Database errors (-900 to -909)
    constexpr int database_open_error = equipdb_base - 0;
    constexpr int database_query_error = equipdb_base - 1;
    constexpr int database_closed = equipdb_base - 2;
    constexpr int database_copy_error = equipdb_base - 3;

    // Migration errors (-920 to -939)
    constexpr int invalid_target_version = equipdb_base - 20;
    constexpr int schema_version_read_failed = equipdb_base - 21;
    constexpr int schema_version_write_failed = equipdb_base - 22;
    constexpr int backup_creation_failed = equipdb_base - 23;
    constexpr int migration_step_failed = equipdb_base - 24;
    constexpr int rollback_failed = equipdb_base - 25;

    // Registry/executor errors (-940 to -959)
    constexpr int unknown_operation = equipdb_base - 40;
    constexpr int validation_failed = equipdb_base - 41;
    constexpr int execution_failed = equipdb_base - 42;
    constexpr int unique_violation = equipdb_base - 43;
    constexpr int foreign_key_violation = equipdb_base - 44;
    constexpr int constraint_violation = equipdb_base - 45;
    constexpr int statement_error = equipdb_base - 46;
    constexpr int connection_error = equipdb_base - 47;
    constexpr int result_shape_mismatch = equipdb_base - 48;

    // Document errors (-960 to -969)
    constexpr int document_import_failed = equipdb_base - 60;
    constexpr int document_hash_failed = equipdb_base - 61;
} // namespace error_codes

// Re-export common utility functions
using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create an equipdb error result with module context
 * @tparam T The result value type
 * @param code Error code from equipdb::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> equipdb_error(int code, const std::string& message,
                               const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "equipdb");
    }
    return kcenon::common::make_error<T>(code, message, "equipdb", details);
}

/**
 * @brief Create an equipdb void error result
 * @param code Error code from equipdb::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return VoidResult containing the error
 */
inline VoidResult equipdb_void_error(int code, const std::string& message,
                                     const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "equipdb"});
    }
    return VoidResult(error_info{code, message, "equipdb", details});
}

} // namespace equipdb

