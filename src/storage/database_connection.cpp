/**
 * @file database_connection.cpp
 * @brief Implementation of the SQLite connection wrapper
 */

#include <equipdb/storage/database_connection.hpp>

#include <equipdb/compat/format.hpp>

#include <sqlite3.h>

namespace equipdb::storage {

using kcenon::common::ok;

namespace {

constexpr const char* memory_path = ":memory:";

}  // namespace

// ============================================================================
// Construction
// ============================================================================

auto database_connection::open(const database_config& config)
    -> Result<std::unique_ptr<database_connection>> {
    auto handle = open_handle(config);
    if (handle.is_err()) {
        return equipdb_error<std::unique_ptr<database_connection>>(
            handle.error().code, handle.error().message);
    }

    return std::unique_ptr<database_connection>(
        new database_connection(handle.value(), config));
}

database_connection::database_connection(sqlite3* db, database_config config)
    : db_(db), config_(std::move(config)) {}

database_connection::~database_connection() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

auto database_connection::open_handle(const database_config& config)
    -> Result<sqlite3*> {
    sqlite3* db = nullptr;
    auto path = config.path.string();

    auto flags = config.read_only ? SQLITE_OPEN_READONLY
                                  : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    auto rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error_msg =
            db ? sqlite3_errmsg(db) : "Failed to allocate memory";
        if (db) {
            sqlite3_close(db);
        }
        return equipdb_error<sqlite3*>(
            error_codes::database_open_error,
            equipdb::compat::format("Failed to open database {}: {}", path, error_msg));
    }

    sqlite3_extended_result_codes(db, 1);
    sqlite3_busy_timeout(db, config.busy_timeout_ms);

    if (config.foreign_keys) {
        rc = sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr,
                          nullptr);
        if (rc != SQLITE_OK) {
            sqlite3_close(db);
            return equipdb_error<sqlite3*>(error_codes::database_open_error,
                                           "Failed to enable foreign keys");
        }
    }

    if (config.wal_mode && !config.read_only && path != memory_path) {
        rc = sqlite3_exec(db, "PRAGMA journal_mode = WAL;", nullptr, nullptr,
                          nullptr);
        if (rc != SQLITE_OK) {
            sqlite3_close(db);
            return equipdb_error<sqlite3*>(error_codes::database_open_error,
                                           "Failed to enable WAL mode");
        }
    }

    return db;
}

// ============================================================================
// Lifecycle
// ============================================================================

auto database_connection::close() -> VoidResult {
    if (!db_) {
        return ok();
    }

    auto rc = sqlite3_close(db_);
    if (rc != SQLITE_OK) {
        return equipdb_void_error(
            error_codes::database_query_error,
            equipdb::compat::format("Failed to close database: {}",
                                    sqlite3_errmsg(db_)));
    }

    db_ = nullptr;
    return ok();
}

auto database_connection::reopen() -> VoidResult {
    auto closed = close();
    if (closed.is_err()) {
        return closed;
    }

    auto handle = open_handle(config_);
    if (handle.is_err()) {
        return equipdb_void_error(handle.error().code, handle.error().message);
    }

    db_ = handle.value();
    return ok();
}

auto database_connection::is_open() const noexcept -> bool {
    return db_ != nullptr;
}

auto database_connection::is_in_memory() const -> bool {
    return config_.path.empty() || config_.path == memory_path;
}

auto database_connection::native_handle() const noexcept -> sqlite3* {
    return db_;
}

auto database_connection::path() const noexcept -> const std::filesystem::path& {
    return config_.path;
}

auto database_connection::config() const noexcept -> const database_config& {
    return config_;
}

// ============================================================================
// Statements
// ============================================================================

auto database_connection::execute(std::string_view sql) -> VoidResult {
    if (!db_) {
        return equipdb_void_error(error_codes::database_closed,
                                  "Database connection is closed");
    }
    return execute_sql(db_, sql);
}

auto database_connection::checkpoint() -> VoidResult {
    if (!db_ || !config_.wal_mode || is_in_memory()) {
        return ok();
    }

    auto rc = sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_TRUNCATE,
                                        nullptr, nullptr);
    if (rc != SQLITE_OK) {
        return equipdb_void_error(
            error_codes::database_query_error,
            equipdb::compat::format("Checkpoint failed: {}", sqlite3_errmsg(db_)));
    }
    return ok();
}

auto execute_sql(sqlite3* db, std::string_view sql) -> VoidResult {
    char* errmsg = nullptr;
    std::string statement(sql);
    auto rc = sqlite3_exec(db, statement.c_str(), nullptr, nullptr, &errmsg);

    if (rc != SQLITE_OK) {
        auto error_str = errmsg ? std::string(errmsg) : std::string(sqlite3_errstr(rc));
        sqlite3_free(errmsg);

        return equipdb_void_error(
            error_codes::database_query_error,
            equipdb::compat::format("SQL execution failed: {}", error_str),
            std::to_string(rc));
    }

    return ok();
}

}  // namespace equipdb::storage
