/**
 * @file operation_executor.hpp
 * @brief Validates, binds and runs registered operations
 *
 * The executor is the only path from the user interface to the database:
 * callers name an operation and pass arguments, never SQL.
 */

#pragma once

#include "operation_registry.hpp"
#include "operation_types.hpp"

#include <equipdb/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace equipdb::storage {
class database_connection;
}  // namespace equipdb::storage

namespace equipdb::operations {

/**
 * @brief Category of a database-level execution failure
 */
enum class execution_failure_kind {
    unique_violation,       ///< UNIQUE or PRIMARY KEY constraint
    foreign_key_violation,  ///< FOREIGN KEY constraint
    constraint_violation,   ///< CHECK, NOT NULL or other constraint
    statement_error,        ///< Statement could not be prepared or bound
    connection_error,       ///< Closed, locked, busy or unreadable database
    other                   ///< Anything else
};

/**
 * @brief Classify an SQLite extended result code
 */
[[nodiscard]] auto classify_sqlite_error(int extended_code) noexcept
    -> execution_failure_kind;

/**
 * @brief error_codes value reported for a failure kind
 */
[[nodiscard]] auto to_error_code(execution_failure_kind kind) noexcept -> int;

[[nodiscard]] auto to_string(execution_failure_kind kind) -> std::string_view;

/**
 * @brief Executes catalog operations against one database connection
 *
 * Every call runs, in order: lookup (unknown_operation), argument
 * validation (validation_failed), positional binding in the declared
 * parameter order with missing names bound as NULL, and result shaping
 * according to the operation's result_shape. Rejected calls never reach
 * the database.
 *
 * Thread Safety: This class is NOT thread-safe. Calls are issued
 * sequentially on the single process-wide connection.
 *
 * @example
 * @code
 * operation_executor executor(*db, operation_registry::instance(),
 *                             {.managed_documents_dir = documents_root});
 *
 * auto created = executor.write("equipment", "create",
 *                               {{"equipmentId", "CR-001"s},
 *                                {"type", "Crane"s},
 *                                {"manufacturer", "Acme"s},
 *                                {"status", "active"s}});
 * if (created.is_ok()) {
 *     auto id = created.value().inserted_id;
 * }
 * @endcode
 */
class operation_executor {
public:
    operation_executor(storage::database_connection& db,
                       const operation_registry& registry,
                       validation_context context = {});

    /// Executor over the application catalog
    explicit operation_executor(storage::database_connection& db,
                                validation_context context = {});

    /**
     * @brief Run @p domain.@p name with @p args
     *
     * @return The shaped result, or one of unknown_operation,
     *         validation_failed, unique_violation, foreign_key_violation,
     *         constraint_violation, statement_error, connection_error and
     *         execution_failed. Error messages name the operation.
     */
    [[nodiscard]] auto execute(std::string_view domain, std::string_view name,
                               const call_arguments& args = {}) const
        -> Result<operation_result>;

    // ========================================================================
    // Typed Access
    // ========================================================================
    //
    // Each wrapper fails with result_shape_mismatch, without touching the
    // database, when the operation is declared with another shape.

    [[nodiscard]] auto query_many(std::string_view domain, std::string_view name,
                                  const call_arguments& args = {}) const
        -> Result<row_list>;

    [[nodiscard]] auto query_one(std::string_view domain, std::string_view name,
                                 const call_arguments& args = {}) const
        -> Result<std::optional<row>>;

    [[nodiscard]] auto query_scalar(std::string_view domain, std::string_view name,
                                    const call_arguments& args = {}) const
        -> Result<std::optional<db_value>>;

    [[nodiscard]] auto write(std::string_view domain, std::string_view name,
                             const call_arguments& args = {}) const
        -> Result<write_result>;

    [[nodiscard]] auto registry() const noexcept -> const operation_registry&;

    [[nodiscard]] auto context() const noexcept -> const validation_context&;

private:
    template <typename T>
    [[nodiscard]] auto execute_as(std::string_view domain, std::string_view name,
                                  const call_arguments& args,
                                  result_shape expected) const -> Result<T>;

    [[nodiscard]] auto run(const operation_spec& spec,
                           const call_arguments& args) const
        -> Result<operation_result>;

    storage::database_connection& db_;
    const operation_registry& registry_;
    validation_context context_;
};

}  // namespace equipdb::operations
