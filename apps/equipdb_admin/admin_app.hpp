/**
 * @file admin_app.hpp
 * @brief equipdb_admin application class
 */

#ifndef EQUIPDB_ADMIN_ADMIN_APP_HPP
#define EQUIPDB_ADMIN_ADMIN_APP_HPP

#include "config.hpp"

#include <equipdb/core/database_session.hpp>
#include <equipdb/core/result.hpp>
#include <equipdb/operations/operation_types.hpp>

#include <filesystem>
#include <iosfwd>

namespace equipdb::admin {

/**
 * @brief Runs one equipdb_admin command
 *
 * Commands that serve operations (migrate, exec, import-document) go
 * through database_session, so they always see a fully migrated schema.
 * Maintenance commands (status, backups, cleanup, backup-now, restore)
 * work on the database file directly.
 *
 * @example Usage
 * @code
 * auto config = admin_config::parse_args(argc, argv);
 * admin_app app{*config};
 * return app.run();
 * @endcode
 */
class admin_app {
public:
    explicit admin_app(admin_config config);
    ~admin_app();

    admin_app(const admin_app&) = delete;
    auto operator=(const admin_app&) -> admin_app& = delete;

    /**
     * @brief Initialize logging and dispatch the configured command
     * @return Process exit code
     */
    auto run() -> int;

    /**
     * @brief Copy the live database to @p destination ("Backup now")
     */
    [[nodiscard]] auto export_database(const std::filesystem::path& destination)
        -> VoidResult;

    /**
     * @brief Replace the live database with @p source ("Restore from file")
     *
     * The source must be an equipdb database no newer than the application
     * schema; it is checked read-only before anything is replaced. The
     * current file is snapshotted into the backup directory first, and the
     * restored database is migrated to the current schema version. If that
     * migration fails the snapshot is put back.
     */
    [[nodiscard]] auto import_database(const std::filesystem::path& source)
        -> VoidResult;

private:
    auto run_migrate() -> int;
    auto run_status() -> int;
    auto run_backups() -> int;
    auto run_cleanup() -> int;
    auto run_backup_now() -> int;
    auto run_restore() -> int;
    auto run_import_document() -> int;
    auto run_exec() -> int;
    auto run_operations() -> int;

    [[nodiscard]] static auto check_restore_source(const std::filesystem::path& source)
        -> VoidResult;

    [[nodiscard]] auto session_settings() const -> core::session_config;
    [[nodiscard]] auto database_path() const -> std::filesystem::path;

    static void print_result(std::ostream& out, const operations::operation_result& result);

    admin_config config_;
    bool logging_started_{false};
};

}  // namespace equipdb::admin

#endif  // EQUIPDB_ADMIN_ADMIN_APP_HPP
