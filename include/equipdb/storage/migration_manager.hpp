/**
 * @file migration_manager.hpp
 * @brief Schema evolution with snapshot backup, rollback and retention
 *
 * The migration_manager runs once at process startup, before the
 * operation executor is handed out. It owns the backup directory and
 * the append-only migration journal.
 */

#pragma once

#include "backup_record.hpp"
#include "migration_record.hpp"
#include "migration_set.hpp"

#include <equipdb/core/result.hpp>
#include <equipdb/integration/logger_adapter.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Forward declaration of SQLite handle
struct sqlite3;

namespace equipdb::storage {

class database_connection;

/**
 * @brief Paths and limits used by the migration manager
 */
struct migration_config {
    /// Directory holding database-backup-*.db snapshots
    std::filesystem::path backup_directory;

    /// Append-only journal, one "[ISO-8601] message" line per event
    std::filesystem::path log_path;

    /// Number of backups kept by cleanup_old_backups()
    std::size_t max_backups{10};

    /**
     * @brief Default layout next to the database file
     *
     * "<dir>/equipment.db" yields "<dir>/backups" and "<dir>/migration.log".
     */
    [[nodiscard]] static auto for_database(const std::filesystem::path& db_path)
        -> migration_config;
};

/**
 * @brief Outcome of a successful run_migrations() call
 */
struct migration_report {
    /// Ledger version before the call
    int from_version{0};

    /// Ledger version after the call
    int to_version{0};

    /// Snapshot taken before the first pending step, if any
    std::optional<std::filesystem::path> backup_path;

    /// Versions whose procedures were executed, in execution order
    std::vector<int> applied_versions;

    [[nodiscard]] auto migrated() const noexcept -> bool {
        return to_version != from_version;
    }
};

/**
 * @brief Applies pending migrations with whole-file rollback
 *
 * The migration_manager is responsible for:
 * - Tracking the current schema version via the schema_version table
 * - Taking one file snapshot per startup cycle before the first pending step
 * - Applying pending steps in ascending order, each in its own transaction
 * - Restoring the snapshot when any step fails
 * - Pruning old snapshots
 *
 * A failure at step k undoes steps 1..k-1 of the same cycle as well: the
 * snapshot is taken once, before the cycle.
 *
 * Thread Safety: This class is NOT thread-safe. Only one process may write
 * the database while migrations run.
 *
 * @example
 * @code
 * auto db = database_connection::open({.path = db_path});
 * migration_manager manager(migration_config::for_database(db_path));
 *
 * auto result = manager.run_migrations(*db.value(), application_migrations(),
 *                                      application_schema_version);
 * if (result.is_err()) {
 *     // Abort startup
 * }
 * manager.cleanup_old_backups();
 * @endcode
 */
class migration_manager {
public:
    explicit migration_manager(migration_config config);

    ~migration_manager() = default;

    migration_manager(const migration_manager&) = delete;
    auto operator=(const migration_manager&) -> migration_manager& = delete;
    migration_manager(migration_manager&&) = default;
    auto operator=(migration_manager&&) -> migration_manager& = default;

    // ========================================================================
    // Migration Operations
    // ========================================================================

    /**
     * @brief Bring the schema up to @p target_version
     *
     * Does nothing (and takes no backup) when the ledger is already at or
     * beyond the target; the schema is never migrated backward. Versions
     * without a registered step are recorded in the ledger and skipped.
     *
     * On a failed step the connection is closed, the snapshot is copied back
     * over the database file and the connection is reopened. A database that
     * had no content before the cycle is discarded instead.
     *
     * @param db Open connection owned by the caller
     * @param migrations Steps to draw from
     * @param target_version Desired schema version (>= 0)
     * @return Report on success; backup_creation_failed,
     *         migration_step_failed or rollback_failed on failure
     */
    [[nodiscard]] auto run_migrations(database_connection& db,
                                      const migration_set& migrations,
                                      int target_version)
        -> Result<migration_report>;

    // ========================================================================
    // Backup Operations
    // ========================================================================

    /**
     * @brief Snapshot the database file into the backup directory
     *
     * @return The backup path, or std::nullopt for an in-memory database or
     *         one with no content yet
     */
    [[nodiscard]] auto create_backup(database_connection& db)
        -> Result<std::optional<std::filesystem::path>>;

    /**
     * @brief Replace the database file with @p backup_path and reopen it
     *
     * @return VoidResult Success or rollback_failed
     */
    [[nodiscard]] auto restore_backup(database_connection& db,
                                      const std::filesystem::path& backup_path)
        -> VoidResult;

    /**
     * @brief Delete all but the @p max_backups newest backups
     *
     * Best-effort: a file that cannot be deleted is logged and skipped.
     *
     * @return Number of files deleted
     */
    auto cleanup_old_backups(std::size_t max_backups) -> std::size_t;

    /// cleanup_old_backups() with the configured maximum
    auto cleanup_old_backups() -> std::size_t;

    /**
     * @brief List backups, newest first
     */
    [[nodiscard]] auto get_backup_info() const -> std::vector<backup_record>;

    // ========================================================================
    // Version Information
    // ========================================================================

    /**
     * @brief Read the highest version in the schema_version table
     *
     * @return 0 when the table does not exist
     */
    [[nodiscard]] static auto get_current_version(sqlite3* db) -> Result<int>;

    /**
     * @brief Ledger rows ordered by version
     */
    [[nodiscard]] static auto get_history(sqlite3* db)
        -> Result<std::vector<migration_record>>;

    /**
     * @brief Backup file name for a point in time
     *
     * "database-backup-" + ISO-8601 UTC with ':' and '.' replaced by '-'
     * + ".db", so names sort chronologically.
     */
    [[nodiscard]] static auto make_backup_name(
        std::chrono::system_clock::time_point when) -> std::string;

    [[nodiscard]] auto config() const noexcept -> const migration_config&;

private:
    void log(integration::log_level level, const std::string& message);

    [[nodiscard]] auto rollback(database_connection& db,
                                const std::optional<std::filesystem::path>& backup,
                                bool discard_fresh, int failed_version,
                                const std::string& cause) -> VoidResult;

    [[nodiscard]] auto discard_database(database_connection& db) -> VoidResult;

    [[nodiscard]] static auto ensure_schema_version_table(sqlite3* db)
        -> VoidResult;

    [[nodiscard]] static auto apply_step(sqlite3* db, const migration_step& step)
        -> VoidResult;

    [[nodiscard]] static auto record_version(sqlite3* db, int version,
                                             const std::string& description)
        -> VoidResult;

    static void remove_side_files(const std::filesystem::path& db_path);

    migration_config config_;
};

}  // namespace equipdb::storage
