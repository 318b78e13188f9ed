/**
 * @file database_session.hpp
 * @brief Startup sequence: open, migrate, clean up, then serve operations
 */

#pragma once

#include <equipdb/core/result.hpp>
#include <equipdb/operations/operation_executor.hpp>
#include <equipdb/storage/database_connection.hpp>
#include <equipdb/storage/document_store.hpp>
#include <equipdb/storage/migration_manager.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>

namespace equipdb::core {

/**
 * @brief Locations and options of one application data directory
 */
struct session_config {
    /// Application data directory
    std::filesystem::path data_dir;

    /// Database file; defaults to "<data_dir>/database.db"
    std::optional<std::filesystem::path> database_path;

    /// Managed documents; defaults to "<data_dir>/documents"
    std::optional<std::filesystem::path> documents_dir;

    /// Reject document paths outside the managed documents directory
    bool require_managed_documents{false};

    bool wal_mode{false};

    std::size_t max_backups{10};

    [[nodiscard]] auto resolved_database_path() const -> std::filesystem::path;
    [[nodiscard]] auto resolved_documents_dir() const -> std::filesystem::path;
};

/**
 * @brief An open, fully migrated database and its collaborators
 *
 * A session only exists after every pending migration succeeded, so the
 * executor it exposes never runs against a partially migrated schema.
 *
 * @example
 * @code
 * auto session = database_session::open({.data_dir = "/var/lib/equipdb"});
 * if (session.is_err()) {
 *     return 1;
 * }
 * auto count = session.value()->executor().query_scalar("equipment", "getCount");
 * @endcode
 */
class database_session {
public:
    /**
     * @brief Run the startup sequence
     *
     * 1. Open the connection.
     * 2. Migrate to application_schema_version (snapshot + rollback).
     * 3. Prune old backups.
     *
     * @return The session, or the first error encountered
     */
    [[nodiscard]] static auto open(const session_config& config)
        -> Result<std::unique_ptr<database_session>>;

    ~database_session() = default;

    database_session(const database_session&) = delete;
    auto operator=(const database_session&) -> database_session& = delete;
    database_session(database_session&&) = delete;
    auto operator=(database_session&&) -> database_session& = delete;

    [[nodiscard]] auto executor() const noexcept -> const operations::operation_executor&;

    [[nodiscard]] auto connection() noexcept -> storage::database_connection&;

    [[nodiscard]] auto migrations() noexcept -> storage::migration_manager&;

    [[nodiscard]] auto documents() const noexcept -> const storage::document_store&;

    /// Outcome of the migration run performed by open()
    [[nodiscard]] auto startup_report() const noexcept -> const storage::migration_report&;

private:
    database_session(std::unique_ptr<storage::database_connection> connection,
                     storage::migration_manager manager,
                     storage::migration_report report,
                     const session_config& config);

    std::unique_ptr<storage::database_connection> connection_;
    storage::migration_manager manager_;
    storage::migration_report report_;
    storage::document_store documents_;
    operations::operation_executor executor_;
};

}  // namespace equipdb::core
