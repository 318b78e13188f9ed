/**
 * @file database_session.cpp
 * @brief Implementation of the startup sequence
 */

#include <equipdb/core/database_session.hpp>

#include <equipdb/integration/logger_adapter.hpp>
#include <equipdb/storage/schema_migrations.hpp>

#include <system_error>
#include <utility>

namespace equipdb::core {

using integration::logger_adapter;

// ============================================================================
// Configuration
// ============================================================================

auto session_config::resolved_database_path() const -> std::filesystem::path {
    return database_path.value_or(data_dir / "database.db");
}

auto session_config::resolved_documents_dir() const -> std::filesystem::path {
    return documents_dir.value_or(data_dir / "documents");
}

// ============================================================================
// Startup
// ============================================================================

auto database_session::open(const session_config& config)
    -> Result<std::unique_ptr<database_session>> {
    auto db_path = config.resolved_database_path();

    if (db_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path.parent_path(), ec);
        if (ec) {
            return equipdb_error<std::unique_ptr<database_session>>(
                error_codes::database_open_error,
                "Failed to create data directory " + db_path.parent_path().string(),
                ec.message());
        }
    }

    storage::database_config db_config;
    db_config.path = db_path;
    db_config.wal_mode = config.wal_mode;

    auto connection = storage::database_connection::open(db_config);
    if (connection.is_err()) {
        return equipdb_error<std::unique_ptr<database_session>>(
            connection.error().code, connection.error().message);
    }

    auto migration_cfg = storage::migration_config::for_database(db_path);
    migration_cfg.max_backups = config.max_backups;
    storage::migration_manager manager(std::move(migration_cfg));

    auto report = manager.run_migrations(*connection.value(),
                                         storage::application_migrations(),
                                         storage::application_schema_version);
    if (report.is_err()) {
        logger_adapter::error("Startup aborted: {}", report.error().message);
        return equipdb_error<std::unique_ptr<database_session>>(
            report.error().code, report.error().message);
    }

    manager.cleanup_old_backups();

    logger_adapter::info("Database ready at {} (schema version {})", db_path.string(),
                         report.value().to_version);

    return std::unique_ptr<database_session>(
        new database_session(std::move(connection.value()), std::move(manager),
                             std::move(report.value()), config));
}

database_session::database_session(
    std::unique_ptr<storage::database_connection> connection,
    storage::migration_manager manager,
    storage::migration_report report,
    const session_config& config)
    : connection_(std::move(connection)),
      manager_(std::move(manager)),
      report_(std::move(report)),
      documents_(storage::document_store_config{config.resolved_documents_dir()}),
      executor_(*connection_, operations::operation_registry::instance(),
                operations::validation_context{config.resolved_documents_dir(),
                                               config.require_managed_documents}) {}

// ============================================================================
// Accessors
// ============================================================================

auto database_session::executor() const noexcept
    -> const operations::operation_executor& {
    return executor_;
}

auto database_session::connection() noexcept -> storage::database_connection& {
    return *connection_;
}

auto database_session::migrations() noexcept -> storage::migration_manager& {
    return manager_;
}

auto database_session::documents() const noexcept -> const storage::document_store& {
    return documents_;
}

auto database_session::startup_report() const noexcept
    -> const storage::migration_report& {
    return report_;
}

}  // namespace equipdb::core
