/**
 * @file operation_executor.cpp
 * @brief Implementation of the operation executor
 */

#include <equipdb/operations/operation_executor.hpp>

#include <equipdb/compat/format.hpp>
#include <equipdb/integration/logger_adapter.hpp>
#include <equipdb/operations/argument_checks.hpp>
#include <equipdb/storage/database_connection.hpp>

#include <sqlite3.h>

#include <memory>
#include <type_traits>
#include <utility>

namespace equipdb::operations {

using integration::logger_adapter;
using integration::security_event_type;

namespace {

struct statement_deleter {
    void operator()(sqlite3_stmt* stmt) const noexcept { sqlite3_finalize(stmt); }
};

using statement_ptr = std::unique_ptr<sqlite3_stmt, statement_deleter>;

[[nodiscard]] auto read_column(sqlite3_stmt* stmt, int index) -> db_value {
    switch (sqlite3_column_type(stmt, index)) {
        case SQLITE_INTEGER:
            return static_cast<std::int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const auto* text =
                reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            auto bytes = static_cast<std::size_t>(sqlite3_column_bytes(stmt, index));
            return std::string(text ? text : "", text ? bytes : 0);
        }
        case SQLITE_BLOB: {
            const auto* data =
                static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt, index));
            auto bytes = static_cast<std::size_t>(sqlite3_column_bytes(stmt, index));
            return data ? blob(data, data + bytes) : blob{};
        }
        case SQLITE_NULL:
        default:
            return std::monostate{};
    }
}

[[nodiscard]] auto read_row(sqlite3_stmt* stmt) -> row {
    row result;
    auto count = sqlite3_column_count(stmt);
    result.columns.reserve(static_cast<std::size_t>(count));
    result.values.reserve(static_cast<std::size_t>(count));

    for (int i = 0; i < count; ++i) {
        const auto* name = sqlite3_column_name(stmt, i);
        result.columns.emplace_back(name ? name : "");
        result.values.push_back(read_column(stmt, i));
    }
    return result;
}

[[nodiscard]] auto bind_value(sqlite3_stmt* stmt, int index, const db_value& value)
    -> int {
    return std::visit(
        [stmt, index](const auto& v) -> int {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, std::monostate>) {
                return sqlite3_bind_null(stmt, index);
            } else if constexpr (std::is_same_v<V, std::int64_t>) {
                return sqlite3_bind_int64(stmt, index, v);
            } else if constexpr (std::is_same_v<V, double>) {
                return sqlite3_bind_double(stmt, index, v);
            } else if constexpr (std::is_same_v<V, std::string>) {
                return sqlite3_bind_text(stmt, index, v.data(),
                                         static_cast<int>(v.size()), SQLITE_TRANSIENT);
            } else {
                if (v.empty()) {
                    return sqlite3_bind_zeroblob(stmt, index, 0);
                }
                return sqlite3_bind_blob(stmt, index, v.data(),
                                         static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        },
        value);
}

// filePath arguments that fail the path policy are reported separately
[[nodiscard]] auto rejected_path(const call_arguments& args,
                                 const validation_context& context) -> bool {
    return checks::get_text(args, "filePath").has_value() &&
           !checks::has_safe_path(args, "filePath", context);
}

}  // namespace

// ============================================================================
// Failure Classification
// ============================================================================

auto classify_sqlite_error(int extended_code) noexcept -> execution_failure_kind {
    switch (extended_code) {
        case SQLITE_CONSTRAINT_UNIQUE:
        case SQLITE_CONSTRAINT_PRIMARYKEY:
            return execution_failure_kind::unique_violation;
        case SQLITE_CONSTRAINT_FOREIGNKEY:
            return execution_failure_kind::foreign_key_violation;
        default:
            break;
    }

    switch (extended_code & 0xff) {
        case SQLITE_CONSTRAINT:
            return execution_failure_kind::constraint_violation;
        case SQLITE_ERROR:
        case SQLITE_RANGE:
        case SQLITE_MISMATCH:
            return execution_failure_kind::statement_error;
        case SQLITE_CANTOPEN:
        case SQLITE_IOERR:
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        case SQLITE_READONLY:
        case SQLITE_NOTADB:
        case SQLITE_MISUSE:
            return execution_failure_kind::connection_error;
        default:
            return execution_failure_kind::other;
    }
}

auto to_error_code(execution_failure_kind kind) noexcept -> int {
    switch (kind) {
        case execution_failure_kind::unique_violation:
            return error_codes::unique_violation;
        case execution_failure_kind::foreign_key_violation:
            return error_codes::foreign_key_violation;
        case execution_failure_kind::constraint_violation:
            return error_codes::constraint_violation;
        case execution_failure_kind::statement_error:
            return error_codes::statement_error;
        case execution_failure_kind::connection_error:
            return error_codes::connection_error;
        case execution_failure_kind::other:
        default:
            return error_codes::execution_failed;
    }
}

auto to_string(execution_failure_kind kind) -> std::string_view {
    switch (kind) {
        case execution_failure_kind::unique_violation:
            return "unique_violation";
        case execution_failure_kind::foreign_key_violation:
            return "foreign_key_violation";
        case execution_failure_kind::constraint_violation:
            return "constraint_violation";
        case execution_failure_kind::statement_error:
            return "statement_error";
        case execution_failure_kind::connection_error:
            return "connection_error";
        case execution_failure_kind::other:
        default:
            return "execution_failed";
    }
}

// ============================================================================
// Construction
// ============================================================================

operation_executor::operation_executor(storage::database_connection& db,
                                       const operation_registry& registry,
                                       validation_context context)
    : db_(db), registry_(registry), context_(std::move(context)) {}

operation_executor::operation_executor(storage::database_connection& db,
                                       validation_context context)
    : operation_executor(db, operation_registry::instance(), std::move(context)) {}

auto operation_executor::registry() const noexcept -> const operation_registry& {
    return registry_;
}

auto operation_executor::context() const noexcept -> const validation_context& {
    return context_;
}

// ============================================================================
// Execution
// ============================================================================

auto operation_executor::execute(std::string_view domain, std::string_view name,
                                 const call_arguments& args) const
    -> Result<operation_result> {
    const auto* spec = registry_.find(domain, name);
    if (spec == nullptr) {
        auto key = equipdb::compat::format("{}.{}", domain, name);
        logger_adapter::log_security_event(security_event_type::unknown_operation,
                                           "Rejected call to unregistered operation",
                                           key);
        return equipdb_error<operation_result>(
            error_codes::unknown_operation,
            equipdb::compat::format("Unknown operation: {}", key));
    }

    if (!spec->validate(args, context_)) {
        auto bag = to_display_string(args);
        auto event = rejected_path(args, context_)
                         ? security_event_type::unsafe_path_rejected
                         : security_event_type::validation_rejected;
        logger_adapter::log_security_event(
            event, equipdb::compat::format("Arguments rejected: {}", bag), spec->key());
        return equipdb_error<operation_result>(
            error_codes::validation_failed,
            equipdb::compat::format("Validation failed for {}: {}", spec->key(), bag),
            bag);
    }

    return run(*spec, args);
}

auto operation_executor::run(const operation_spec& spec,
                             const call_arguments& args) const
    -> Result<operation_result> {
    auto* db = db_.native_handle();
    if (db == nullptr) {
        return equipdb_error<operation_result>(
            error_codes::connection_error,
            equipdb::compat::format("{} failed: database is closed", spec.key()));
    }

    auto fail = [&spec, db](int rc) -> Result<operation_result> {
        auto extended = sqlite3_extended_errcode(db);
        auto kind = classify_sqlite_error(extended != SQLITE_OK ? extended : rc);
        auto message = equipdb::compat::format("{} failed ({}): {}", spec.key(),
                                               to_string(kind), sqlite3_errmsg(db));
        logger_adapter::error("{}", message);
        return equipdb_error<operation_result>(
            to_error_code(kind), message,
            equipdb::compat::format("sqlite extended code {}", extended));
    };

    sqlite3_stmt* raw = nullptr;
    auto rc = sqlite3_prepare_v2(db, spec.statement.c_str(),
                                 static_cast<int>(spec.statement.size()), &raw, nullptr);
    statement_ptr stmt(raw);
    if (rc != SQLITE_OK) {
        return fail(rc);
    }

    // Positional binding in declared order; a name may appear twice
    for (std::size_t i = 0; i < spec.parameters.size(); ++i) {
        auto it = args.find(spec.parameters[i]);
        const db_value null_value;
        const auto& value = it != args.end() ? it->second : null_value;

        rc = bind_value(stmt.get(), static_cast<int>(i + 1), value);
        if (rc != SQLITE_OK) {
            return fail(rc);
        }
    }

    logger_adapter::debug("Executing {}", spec.key());

    switch (spec.shape) {
        case result_shape::many: {
            row_list rows;
            while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
                rows.push_back(read_row(stmt.get()));
            }
            if (rc != SQLITE_DONE) {
                return fail(rc);
            }
            return operation_result{std::move(rows)};
        }

        case result_shape::one:
        case result_shape::scalar: {
            rc = sqlite3_step(stmt.get());
            if (rc == SQLITE_DONE) {
                return spec.shape == result_shape::one
                           ? operation_result{std::optional<row>{}}
                           : operation_result{std::optional<db_value>{}};
            }
            if (rc != SQLITE_ROW) {
                return fail(rc);
            }
            if (spec.shape == result_shape::one) {
                return operation_result{std::optional<row>{read_row(stmt.get())}};
            }
            if (sqlite3_column_count(stmt.get()) == 0) {
                return operation_result{std::optional<db_value>{}};
            }
            return operation_result{
                std::optional<db_value>{read_column(stmt.get(), 0)}};
        }

        case result_shape::write:
        default: {
            while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            }
            if (rc != SQLITE_DONE) {
                return fail(rc);
            }
            write_result written;
            written.inserted_id = sqlite3_last_insert_rowid(db);
            written.rows_affected = sqlite3_changes(db);
            return operation_result{written};
        }
    }
}

// ============================================================================
// Typed Access
// ============================================================================

template <typename T>
auto operation_executor::execute_as(std::string_view domain, std::string_view name,
                                    const call_arguments& args,
                                    result_shape expected) const -> Result<T> {
    const auto* spec = registry_.find(domain, name);
    if (spec != nullptr && spec->shape != expected) {
        return equipdb_error<T>(
            error_codes::result_shape_mismatch,
            equipdb::compat::format("{} returns {}, not {}", spec->key(),
                                    to_string(spec->shape), to_string(expected)));
    }

    auto result = execute(domain, name, args);
    if (result.is_err()) {
        return equipdb_error<T>(result.error().code, result.error().message);
    }

    auto* value = std::get_if<T>(&result.value());
    if (value == nullptr) {
        return equipdb_error<T>(
            error_codes::result_shape_mismatch,
            equipdb::compat::format("{}.{} returned an unexpected shape", domain, name));
    }
    return std::move(*value);
}

auto operation_executor::query_many(std::string_view domain, std::string_view name,
                                    const call_arguments& args) const
    -> Result<row_list> {
    return execute_as<row_list>(domain, name, args, result_shape::many);
}

auto operation_executor::query_one(std::string_view domain, std::string_view name,
                                   const call_arguments& args) const
    -> Result<std::optional<row>> {
    return execute_as<std::optional<row>>(domain, name, args, result_shape::one);
}

auto operation_executor::query_scalar(std::string_view domain, std::string_view name,
                                      const call_arguments& args) const
    -> Result<std::optional<db_value>> {
    return execute_as<std::optional<db_value>>(domain, name, args, result_shape::scalar);
}

auto operation_executor::write(std::string_view domain, std::string_view name,
                               const call_arguments& args) const
    -> Result<write_result> {
    return execute_as<write_result>(domain, name, args, result_shape::write);
}

}  // namespace equipdb::operations
