/**
 * @file migration_manager.cpp
 * @brief Implementation of schema evolution with backup and rollback
 */

#include <equipdb/storage/migration_manager.hpp>

#include <equipdb/compat/format.hpp>
#include <equipdb/compat/time.hpp>
#include <equipdb/storage/database_connection.hpp>

#include <sqlite3.h>

#include <algorithm>
#include <fstream>
#include <system_error>

namespace equipdb::storage {

using kcenon::common::ok;
using integration::log_level;
using integration::logger_adapter;

namespace {

constexpr const char* backup_prefix = "database-backup-";
constexpr const char* backup_suffix = ".db";

[[nodiscard]] auto is_backup_name(const std::string& name) -> bool {
    std::string_view view(name);
    std::string_view prefix(backup_prefix);
    std::string_view suffix(backup_suffix);
    return view.size() > prefix.size() + suffix.size() &&
           view.substr(0, prefix.size()) == prefix &&
           view.substr(view.size() - suffix.size()) == suffix;
}

[[nodiscard]] auto file_has_content(const std::filesystem::path& path) -> bool {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }
    auto size = std::filesystem::file_size(path, ec);
    return !ec && size > 0;
}

}  // namespace

// ============================================================================
// Configuration
// ============================================================================

auto migration_config::for_database(const std::filesystem::path& db_path)
    -> migration_config {
    auto dir = db_path.has_parent_path() ? db_path.parent_path()
                                         : std::filesystem::path(".");
    migration_config config;
    config.backup_directory = dir / "backups";
    config.log_path = dir / "migration.log";
    return config;
}

migration_manager::migration_manager(migration_config config)
    : config_(std::move(config)) {}

auto migration_manager::config() const noexcept -> const migration_config& {
    return config_;
}

// ============================================================================
// Migration Operations
// ============================================================================

auto migration_manager::run_migrations(database_connection& db,
                                       const migration_set& migrations,
                                       int target_version)
    -> Result<migration_report> {
    if (!db.is_open()) {
        return equipdb_error<migration_report>(error_codes::database_closed,
                                               "Database connection is closed");
    }
    if (target_version < 0) {
        return equipdb_error<migration_report>(
            error_codes::invalid_target_version,
            equipdb::compat::format("Invalid target version {}", target_version));
    }

    auto current = get_current_version(db.native_handle());
    if (current.is_err()) {
        return equipdb_error<migration_report>(current.error().code,
                                               current.error().message);
    }

    migration_report report;
    report.from_version = current.value();
    report.to_version = current.value();

    log(log_level::info,
        equipdb::compat::format("Current schema version: {}, Target version: {}",
                                report.from_version, target_version));

    if (report.from_version >= target_version) {
        auto ensured = ensure_schema_version_table(db.native_handle());
        if (ensured.is_err()) {
            return equipdb_error<migration_report>(ensured.error().code,
                                                   ensured.error().message);
        }
        log(log_level::info, "Database is already up to date");
        return report;
    }

    // The snapshot precedes every write of this cycle, including the ledger
    // table itself, so a restore reproduces the file exactly.
    auto backup = create_backup(db);
    if (backup.is_err()) {
        log(log_level::error, backup.error().message);
        return equipdb_error<migration_report>(backup.error().code,
                                               backup.error().message);
    }
    report.backup_path = backup.value();
    auto discard_fresh = !report.backup_path && !db.is_in_memory();

    auto ensured = ensure_schema_version_table(db.native_handle());
    if (ensured.is_err()) {
        auto rolled_back = rollback(db, report.backup_path, discard_fresh,
                                    report.from_version + 1, ensured.error().message);
        if (rolled_back.is_err()) {
            return equipdb_error<migration_report>(rolled_back.error().code,
                                                   rolled_back.error().message);
        }
        return equipdb_error<migration_report>(
            error_codes::schema_version_write_failed, ensured.error().message);
    }

    for (int version = report.from_version + 1; version <= target_version; ++version) {
        const auto* step = migrations.find(version);

        VoidResult outcome = ok();
        if (step == nullptr) {
            log(log_level::info,
                equipdb::compat::format("No migration registered for version {}, skipping",
                                        version));
            outcome = record_version(db.native_handle(), version, "");
        } else {
            log(log_level::info,
                equipdb::compat::format("Starting migration {}", version));
            outcome = apply_step(db.native_handle(), *step);
        }

        if (outcome.is_err()) {
            auto cause = outcome.error().message;
            log(log_level::error,
                equipdb::compat::format("Migration {} failed, initiating rollback",
                                        version));

            auto rolled_back = rollback(db, report.backup_path, discard_fresh,
                                        version, cause);
            if (rolled_back.is_err()) {
                return equipdb_error<migration_report>(rolled_back.error().code,
                                                       rolled_back.error().message);
            }

            auto message = equipdb::compat::format("Migration failed at version {}: {}",
                                                   version, cause);
            log(log_level::error, message);
            return equipdb_error<migration_report>(error_codes::migration_step_failed,
                                                   message);
        }

        if (step != nullptr) {
            log(log_level::info,
                equipdb::compat::format("Migration {} completed successfully", version));
            report.applied_versions.push_back(version);
        }
        log(log_level::info,
            equipdb::compat::format("Schema version updated to {}", version));
        report.to_version = version;
    }

    log(log_level::info, "All migrations completed successfully");
    return report;
}

auto migration_manager::rollback(database_connection& db,
                                 const std::optional<std::filesystem::path>& backup,
                                 bool discard_fresh, int failed_version,
                                 const std::string& cause) -> VoidResult {
    VoidResult restored = ok();
    if (backup) {
        restored = restore_backup(db, *backup);
    } else if (discard_fresh) {
        restored = discard_database(db);
    } else {
        // In-memory database: the failed step's transaction was rolled back,
        // earlier steps of the cycle remain.
        return ok();
    }

    if (restored.is_err()) {
        auto message = equipdb::compat::format(
            "Rollback failed after migration {} failed ({}): {}", failed_version,
            cause, restored.error().message);
        log(log_level::fatal, message);
        return equipdb_void_error(error_codes::rollback_failed, message);
    }
    return ok();
}

auto migration_manager::discard_database(database_connection& db) -> VoidResult {
    auto closed = db.close();
    if (closed.is_err()) {
        return closed;
    }

    std::error_code ec;
    std::filesystem::remove(db.path(), ec);
    if (ec) {
        return equipdb_void_error(
            error_codes::rollback_failed,
            equipdb::compat::format("Failed to discard {}: {}", db.path().string(),
                                    ec.message()));
    }
    remove_side_files(db.path());

    auto reopened = db.reopen();
    if (reopened.is_err()) {
        return reopened;
    }

    log(log_level::info, "Rollback completed");
    return ok();
}

// ============================================================================
// Backup Operations
// ============================================================================

auto migration_manager::create_backup(database_connection& db)
    -> Result<std::optional<std::filesystem::path>> {
    using backup_result = std::optional<std::filesystem::path>;

    if (db.is_in_memory()) {
        log(log_level::info, "In-memory database, skipping backup");
        return backup_result{};
    }

    auto checkpointed = db.checkpoint();
    if (checkpointed.is_err()) {
        return equipdb_error<backup_result>(
            error_codes::backup_creation_failed,
            equipdb::compat::format("Failed to create backup: {}",
                                    checkpointed.error().message));
    }

    if (!file_has_content(db.path())) {
        log(log_level::info, "No existing database found, skipping backup");
        return backup_result{};
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.backup_directory, ec);
    if (ec) {
        return equipdb_error<backup_result>(
            error_codes::backup_creation_failed,
            equipdb::compat::format("Failed to create backup directory {}: {}",
                                    config_.backup_directory.string(), ec.message()));
    }

    auto name = make_backup_name(std::chrono::system_clock::now());
    auto target = config_.backup_directory / name;
    for (int suffix = 1; std::filesystem::exists(target, ec); ++suffix) {
        auto stem = name.substr(0, name.size() - std::string_view(backup_suffix).size());
        target = config_.backup_directory /
                 equipdb::compat::format("{}-{}{}", stem, suffix, backup_suffix);
    }

    std::filesystem::copy_file(db.path(), target,
                               std::filesystem::copy_options::none, ec);
    if (ec) {
        return equipdb_error<backup_result>(
            error_codes::backup_creation_failed,
            equipdb::compat::format("Failed to create backup: {}", ec.message()));
    }

    log(log_level::info,
        equipdb::compat::format("Database backup created: {}", target.string()));
    return backup_result{target};
}

auto migration_manager::restore_backup(database_connection& db,
                                       const std::filesystem::path& backup_path)
    -> VoidResult {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(backup_path, ec)) {
        return equipdb_void_error(
            error_codes::rollback_failed,
            equipdb::compat::format("Backup not found: {}", backup_path.string()));
    }
    if (db.is_in_memory()) {
        return equipdb_void_error(error_codes::rollback_failed,
                                  "Cannot restore into an in-memory database");
    }

    auto closed = db.close();
    if (closed.is_err()) {
        return equipdb_void_error(error_codes::rollback_failed,
                                  closed.error().message);
    }

    std::filesystem::copy_file(backup_path, db.path(),
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return equipdb_void_error(
            error_codes::rollback_failed,
            equipdb::compat::format("Failed to restore {}: {}", backup_path.string(),
                                    ec.message()));
    }
    remove_side_files(db.path());

    auto reopened = db.reopen();
    if (reopened.is_err()) {
        return equipdb_void_error(
            error_codes::rollback_failed,
            equipdb::compat::format("Database restored but could not be reopened: {}",
                                    reopened.error().message));
    }

    log(log_level::info, "Rollback completed");
    return ok();
}

auto migration_manager::cleanup_old_backups(std::size_t max_backups) -> std::size_t {
    auto backups = get_backup_info();
    std::size_t deleted = 0;

    for (std::size_t i = max_backups; i < backups.size(); ++i) {
        std::error_code ec;
        std::filesystem::remove(backups[i].path, ec);
        if (ec) {
            log(log_level::error,
                equipdb::compat::format("Failed to delete backup {}: {}",
                                        backups[i].name, ec.message()));
            continue;
        }
        ++deleted;
        log(log_level::info,
            equipdb::compat::format("Deleted old backup: {}", backups[i].name));
    }

    return deleted;
}

auto migration_manager::cleanup_old_backups() -> std::size_t {
    return cleanup_old_backups(config_.max_backups);
}

auto migration_manager::get_backup_info() const -> std::vector<backup_record> {
    std::vector<backup_record> backups;

    std::error_code ec;
    std::filesystem::directory_iterator it(config_.backup_directory, ec);
    if (ec) {
        return backups;
    }

    for (const auto& entry : it) {
        auto name = entry.path().filename().string();
        if (!is_backup_name(name) || !entry.is_regular_file(ec)) {
            continue;
        }

        backup_record record;
        record.name = name;
        record.path = entry.path();
        record.size = entry.file_size(ec);
        record.created = entry.last_write_time(ec);
        backups.push_back(std::move(record));
    }

    std::sort(backups.begin(), backups.end(),
              [](const backup_record& a, const backup_record& b) {
                  if (a.created != b.created) {
                      return a.created > b.created;
                  }
                  return a.name > b.name;
              });
    return backups;
}

auto migration_manager::make_backup_name(std::chrono::system_clock::time_point when)
    -> std::string {
    auto stamp = compat::format_iso8601_utc(when);
    std::replace(stamp.begin(), stamp.end(), ':', '-');
    std::replace(stamp.begin(), stamp.end(), '.', '-');
    return std::string(backup_prefix) + stamp + backup_suffix;
}

// ============================================================================
// Version Information
// ============================================================================

auto migration_manager::get_current_version(sqlite3* db) -> Result<int> {
    const char* check_sql =
        "SELECT name FROM sqlite_master WHERE type='table' AND name='schema_version';";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, check_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return equipdb_error<int>(
            error_codes::schema_version_read_failed,
            equipdb::compat::format("Failed to read schema version: {}",
                                    sqlite3_errmsg(db)));
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc == SQLITE_DONE) {
        return 0;
    }
    if (rc != SQLITE_ROW) {
        return equipdb_error<int>(
            error_codes::schema_version_read_failed,
            equipdb::compat::format("Failed to read schema version: {}",
                                    sqlite3_errmsg(db)));
    }

    const char* version_sql = "SELECT MAX(version) FROM schema_version;";
    rc = sqlite3_prepare_v2(db, version_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return equipdb_error<int>(
            error_codes::schema_version_read_failed,
            equipdb::compat::format("Failed to read schema version: {}",
                                    sqlite3_errmsg(db)));
    }

    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        // sqlite3_column_int returns 0 for NULL (empty table)
        version = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);

    return version;
}

auto migration_manager::get_history(sqlite3* db)
    -> Result<std::vector<migration_record>> {
    std::vector<migration_record> history;

    auto current = get_current_version(db);
    if (current.is_err()) {
        return equipdb_error<std::vector<migration_record>>(current.error().code,
                                                            current.error().message);
    }
    if (current.value() == 0) {
        return history;
    }

    const char* sql =
        "SELECT version, description, applied_at FROM schema_version ORDER BY version;";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return equipdb_error<std::vector<migration_record>>(
            error_codes::schema_version_read_failed,
            equipdb::compat::format("Failed to read migration history: {}",
                                    sqlite3_errmsg(db)));
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        migration_record record;
        record.version = sqlite3_column_int(stmt, 0);

        const auto* desc = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        record.description = desc ? desc : "";

        const auto* applied = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
        record.applied_at = applied ? applied : "";

        history.push_back(std::move(record));
    }

    sqlite3_finalize(stmt);
    return history;
}

// ============================================================================
// Internal Implementation
// ============================================================================

void migration_manager::log(log_level level, const std::string& message) {
    logger_adapter::log(level, message);

    if (config_.log_path.empty()) {
        return;
    }

    std::error_code ec;
    if (config_.log_path.has_parent_path()) {
        std::filesystem::create_directories(config_.log_path.parent_path(), ec);
    }

    std::ofstream file(config_.log_path, std::ios::app);
    if (!file) {
        logger_adapter::warn("Cannot append to migration log {}",
                             config_.log_path.string());
        return;
    }
    file << '[' << compat::now_iso8601_utc() << "] " << message << '\n';
}

auto migration_manager::ensure_schema_version_table(sqlite3* db) -> VoidResult {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS schema_version (
            version     INTEGER PRIMARY KEY,
            description TEXT NOT NULL DEFAULT '',
            applied_at  TEXT NOT NULL DEFAULT (datetime('now'))
        );
    )";

    auto result = execute_sql(db, sql);
    if (result.is_err()) {
        return equipdb_void_error(
            error_codes::schema_version_write_failed,
            equipdb::compat::format("Failed to create schema_version table: {}",
                                    result.error().message));
    }
    return ok();
}

auto migration_manager::apply_step(sqlite3* db, const migration_step& step)
    -> VoidResult {
    auto begin_result = execute_sql(db, "BEGIN TRANSACTION;");
    if (begin_result.is_err()) {
        return begin_result;
    }

    auto migration_result = step.apply(db);
    if (migration_result.is_err()) {
        (void)execute_sql(db, "ROLLBACK;");
        return migration_result;
    }

    auto record_result = record_version(db, step.version, step.description);
    if (record_result.is_err()) {
        (void)execute_sql(db, "ROLLBACK;");
        return record_result;
    }

    auto commit_result = execute_sql(db, "COMMIT;");
    if (commit_result.is_err()) {
        (void)execute_sql(db, "ROLLBACK;");
        return commit_result;
    }

    return ok();
}

auto migration_manager::record_version(sqlite3* db, int version,
                                       const std::string& description)
    -> VoidResult {
    const char* sql =
        "INSERT OR REPLACE INTO schema_version (version, description) VALUES (?, ?);";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return equipdb_void_error(
            error_codes::schema_version_write_failed,
            equipdb::compat::format("Failed to prepare statement: {}",
                                    sqlite3_errmsg(db)));
    }

    sqlite3_bind_int(stmt, 1, version);
    sqlite3_bind_text(stmt, 2, description.c_str(),
                      static_cast<int>(description.size()), SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return equipdb_void_error(
            error_codes::schema_version_write_failed,
            equipdb::compat::format("Failed to record schema version {}: {}",
                                    version, sqlite3_errmsg(db)));
    }

    return ok();
}

void migration_manager::remove_side_files(const std::filesystem::path& db_path) {
    for (const char* suffix : {"-wal", "-shm", "-journal"}) {
        std::error_code ec;
        std::filesystem::remove(std::filesystem::path(db_path.string() + suffix), ec);
    }
}

}  // namespace equipdb::storage
