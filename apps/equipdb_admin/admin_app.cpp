/**
 * @file admin_app.cpp
 * @brief Implementation of the equipdb_admin commands
 */

#include "admin_app.hpp"

#include <equipdb/compat/format.hpp>
#include <equipdb/integration/logger_adapter.hpp>
#include <equipdb/operations/operation_registry.hpp>
#include <equipdb/storage/database_connection.hpp>
#include <equipdb/storage/migration_manager.hpp>
#include <equipdb/storage/schema_migrations.hpp>

#include <iomanip>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace equipdb::admin {

using integration::logger_adapter;
using integration::security_event_type;

namespace {

void print_error(const char* what, const error_info& error) {
    std::cerr << "Error: " << what << ": " << error.message << " (code " << error.code
              << ")\n";
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

admin_app::admin_app(admin_config config) : config_(std::move(config)) {}

admin_app::~admin_app() {
    if (logging_started_) {
        logger_adapter::shutdown();
    }
}

auto admin_app::database_path() const -> std::filesystem::path {
    return config_.db_path.value_or(config_.data_dir / "database.db");
}

auto admin_app::session_settings() const -> core::session_config {
    core::session_config settings;
    settings.data_dir = config_.data_dir;
    settings.database_path = database_path();
    settings.wal_mode = config_.wal_mode;
    settings.max_backups = config_.max_backups;
    return settings;
}

// ============================================================================
// Dispatch
// ============================================================================

auto admin_app::run() -> int {
    integration::logger_config log_config;
    log_config.log_directory = config_.log_dir.value_or(config_.data_dir / "logs");
    log_config.min_level = logger_adapter::parse_level(config_.log_level);
    log_config.async_mode = false;
    logger_adapter::initialize(log_config);
    logging_started_ = true;

    const auto& command = config_.command;
    if (command == "migrate") return run_migrate();
    if (command == "status") return run_status();
    if (command == "backups") return run_backups();
    if (command == "cleanup") return run_cleanup();
    if (command == "backup-now") return run_backup_now();
    if (command == "restore") return run_restore();
    if (command == "import-document") return run_import_document();
    if (command == "exec") return run_exec();
    if (command == "operations") return run_operations();

    std::cerr << "Error: Unknown command '" << command << "'\n";
    std::cerr << "Use --help for usage information\n";
    return 2;
}

// ============================================================================
// Commands
// ============================================================================

auto admin_app::run_migrate() -> int {
    auto session = core::database_session::open(session_settings());
    if (session.is_err()) {
        print_error("Migration failed", session.error());
        return 1;
    }

    const auto& report = session.value()->startup_report();
    if (!report.migrated()) {
        std::cout << "Schema is up to date (version " << report.to_version << ")\n";
        return 0;
    }

    std::cout << "Migrated schema from version " << report.from_version << " to "
              << report.to_version << "\n";
    for (auto version : report.applied_versions) {
        std::cout << "  applied " << version << "\n";
    }
    if (report.backup_path) {
        std::cout << "Backup: " << report.backup_path->string() << "\n";
    }
    return 0;
}

auto admin_app::run_status() -> int {
    auto path = database_path();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        std::cout << "Database " << path.string() << " does not exist\n";
        std::cout << "Pending migrations: " << storage::application_schema_version << "\n";
        return 0;
    }

    storage::database_config db_config;
    db_config.path = path;
    auto db = storage::database_connection::open(db_config);
    if (db.is_err()) {
        print_error("Cannot open database", db.error());
        return 1;
    }

    auto* handle = db.value()->native_handle();
    auto version = storage::migration_manager::get_current_version(handle);
    if (version.is_err()) {
        print_error("Cannot read schema version", version.error());
        return 1;
    }

    std::cout << "Database:        " << path.string() << "\n";
    std::cout << "Schema version:  " << version.value() << "\n";
    std::cout << "Latest version:  " << storage::application_schema_version << "\n";

    auto history = storage::migration_manager::get_history(handle);
    if (history.is_ok() && !history.value().empty()) {
        std::cout << "\nHistory:\n";
        for (const auto& record : history.value()) {
            std::cout << "  " << std::setw(3) << record.version << "  "
                      << record.applied_at << "  " << record.description << "\n";
        }
    }
    return 0;
}

auto admin_app::run_backups() -> int {
    auto migration_cfg = storage::migration_config::for_database(database_path());
    storage::migration_manager manager(std::move(migration_cfg));

    auto backups = manager.get_backup_info();
    if (backups.empty()) {
        std::cout << "No backups in " << manager.config().backup_directory.string()
                  << "\n";
        return 0;
    }

    for (const auto& backup : backups) {
        std::cout << std::setw(12) << backup.size << "  " << backup.name << "\n";
    }
    return 0;
}

auto admin_app::run_cleanup() -> int {
    auto keep = config_.max_backups;
    if (!config_.command_args.empty()) {
        try {
            keep = static_cast<std::size_t>(std::stoul(config_.command_args[0]));
        } catch (const std::exception&) {
            std::cerr << "Error: Invalid backup count '" << config_.command_args[0]
                      << "'\n";
            return 2;
        }
    }

    storage::migration_manager manager(
        storage::migration_config::for_database(database_path()));
    auto deleted = manager.cleanup_old_backups(keep);
    std::cout << "Deleted " << deleted << " backup(s)\n";
    return 0;
}

auto admin_app::run_backup_now() -> int {
    if (config_.command_args.size() != 1) {
        std::cerr << "Usage: equipdb_admin backup-now <dest>\n";
        return 2;
    }

    auto result = export_database(config_.command_args[0]);
    if (result.is_err()) {
        print_error("Backup failed", result.error());
        return 1;
    }
    std::cout << "Database copied to " << config_.command_args[0] << "\n";
    return 0;
}

auto admin_app::run_restore() -> int {
    if (config_.command_args.size() != 1) {
        std::cerr << "Usage: equipdb_admin restore <src>\n";
        return 2;
    }

    auto result = import_database(config_.command_args[0]);
    if (result.is_err()) {
        print_error("Restore failed", result.error());
        return 1;
    }
    std::cout << "Database restored from " << config_.command_args[0] << "\n";
    return 0;
}

auto admin_app::run_import_document() -> int {
    if (config_.command_args.size() != 2) {
        std::cerr << "Usage: equipdb_admin import-document <equipment-key> <file>\n";
        return 2;
    }

    auto session = core::database_session::open(session_settings());
    if (session.is_err()) {
        print_error("Cannot open database", session.error());
        return 1;
    }

    auto document = session.value()->documents().import_document(
        config_.command_args[0], config_.command_args[1]);
    if (document.is_err()) {
        print_error("Import failed", document.error());
        return 1;
    }

    const auto& stored = document.value();
    std::cout << "filePath:=" << stored.stored_path.string() << "\n";
    std::cout << "fileName:=" << stored.file_name << "\n";
    std::cout << "hash:=" << stored.sha256 << "\n";
    std::cout << "size=" << stored.size << "\n";
    return 0;
}

auto admin_app::run_exec() -> int {
    if (config_.command_args.size() < 2) {
        std::cerr << "Usage: equipdb_admin exec <domain> <operation> [key=value ...]\n";
        return 2;
    }

    std::vector<std::string> tokens(config_.command_args.begin() + 2,
                                    config_.command_args.end());
    auto args = parse_call_arguments(tokens);
    if (!args) {
        return 2;
    }

    auto session = core::database_session::open(session_settings());
    if (session.is_err()) {
        print_error("Cannot open database", session.error());
        return 1;
    }

    auto result = session.value()->executor().execute(config_.command_args[0],
                                                      config_.command_args[1], *args);
    if (result.is_err()) {
        print_error("Operation failed", result.error());
        return 1;
    }

    print_result(std::cout, result.value());
    return 0;
}

auto admin_app::run_operations() -> int {
    const auto& registry = operations::operation_registry::instance();

    auto print_domain = [&registry](const std::string& domain) {
        std::cout << domain << "\n";
        for (const auto* spec : registry.operations_in(domain)) {
            std::cout << "  " << std::left << std::setw(32) << spec->name
                      << std::right << operations::to_string(spec->shape);
            for (const auto& parameter : spec->parameters) {
                std::cout << " " << parameter;
            }
            std::cout << "\n";
        }
    };

    if (!config_.command_args.empty()) {
        if (registry.operations_in(config_.command_args[0]).empty()) {
            std::cerr << "Error: Unknown domain '" << config_.command_args[0] << "'\n";
            return 1;
        }
        print_domain(config_.command_args[0]);
        return 0;
    }

    for (const auto& domain : registry.domains()) {
        print_domain(domain);
    }
    return 0;
}

// ============================================================================
// Database File Transfer
// ============================================================================

auto admin_app::export_database(const std::filesystem::path& destination)
    -> VoidResult {
    auto source = database_path();

    std::error_code ec;
    if (std::filesystem::equivalent(source, destination, ec)) {
        return equipdb_void_error(error_codes::database_copy_error,
                                  "Destination is the live database");
    }

    storage::database_config db_config;
    db_config.path = source;
    db_config.wal_mode = config_.wal_mode;
    auto db = storage::database_connection::open(db_config);
    if (db.is_err()) {
        return equipdb_void_error(db.error().code, db.error().message);
    }

    auto flushed = db.value()->checkpoint();
    if (flushed.is_err()) {
        return flushed;
    }

    std::filesystem::copy_file(source, destination,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return equipdb_void_error(error_codes::database_copy_error,
                                  "Failed to copy database to " + destination.string(),
                                  ec.message());
    }

    logger_adapter::log_security_event(security_event_type::data_export,
                                       "Database exported", destination.string());
    return kcenon::common::ok();
}

auto admin_app::check_restore_source(const std::filesystem::path& source)
    -> VoidResult {
    storage::database_config source_config;
    source_config.path = source;
    source_config.read_only = true;
    source_config.foreign_keys = false;
    auto opened = storage::database_connection::open(source_config);
    if (opened.is_err()) {
        return equipdb_void_error(error_codes::database_copy_error,
                                  "Cannot open restore source", opened.error().message);
    }

    // Reading the ledger touches the file header, so non-databases fail here
    auto version =
        storage::migration_manager::get_current_version(opened.value()->native_handle());
    if (version.is_err()) {
        return equipdb_void_error(error_codes::database_copy_error,
                                  "Restore source is not an equipdb database",
                                  version.error().message);
    }
    if (version.value() > storage::application_schema_version) {
        return equipdb_void_error(
            error_codes::database_copy_error,
            equipdb::compat::format("Restore source has schema version {}, newer than {}",
                                    version.value(),
                                    storage::application_schema_version));
    }
    return kcenon::common::ok();
}

auto admin_app::import_database(const std::filesystem::path& source) -> VoidResult {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        return equipdb_void_error(error_codes::database_copy_error,
                                  "Restore source is not a file", source.string());
    }

    auto target = database_path();
    if (std::filesystem::equivalent(source, target, ec)) {
        return equipdb_void_error(error_codes::database_copy_error,
                                  "Restore source is the live database");
    }

    auto checked = check_restore_source(source);
    if (checked.is_err()) {
        return checked;
    }

    storage::database_config db_config;
    db_config.path = target;
    db_config.wal_mode = config_.wal_mode;
    auto db = storage::database_connection::open(db_config);
    if (db.is_err()) {
        return equipdb_void_error(db.error().code, db.error().message);
    }

    auto migration_cfg = storage::migration_config::for_database(target);
    migration_cfg.max_backups = config_.max_backups;
    storage::migration_manager manager(std::move(migration_cfg));

    // Keep the replaced database recoverable
    auto snapshot = manager.create_backup(*db.value());
    if (snapshot.is_err()) {
        return equipdb_void_error(snapshot.error().code, snapshot.error().message);
    }

    auto restored = manager.restore_backup(*db.value(), source);
    if (restored.is_err()) {
        return restored;
    }

    auto migrated = manager.run_migrations(*db.value(), storage::application_migrations(),
                                           storage::application_schema_version);
    if (migrated.is_err()) {
        logger_adapter::error("Restored database failed to migrate: {}",
                              migrated.error().message);
        if (snapshot.value()) {
            auto reverted = manager.restore_backup(*db.value(), *snapshot.value());
            if (reverted.is_err()) {
                return equipdb_void_error(
                    error_codes::rollback_failed,
                    equipdb::compat::format("Restore failed and the previous database "
                                            "could not be put back from {}",
                                            snapshot.value()->string()),
                    reverted.error().message);
            }
            logger_adapter::info("Previous database put back from {}",
                                 snapshot.value()->string());
        }
        return equipdb_void_error(migrated.error().code, migrated.error().message);
    }

    logger_adapter::log_security_event(security_event_type::database_restored,
                                       "Database replaced from file", source.string());
    return kcenon::common::ok();
}

// ============================================================================
// Output
// ============================================================================

void admin_app::print_result(std::ostream& out,
                             const operations::operation_result& result) {
    using namespace operations;

    auto print_row = [&out](const row& r) {
        for (std::size_t i = 0; i < r.size(); ++i) {
            out << (i == 0 ? "" : "  ") << r.columns[i] << "="
                << to_display_string(r.values[i]);
        }
        out << "\n";
    };

    if (const auto* rows = std::get_if<row_list>(&result)) {
        for (const auto& r : *rows) {
            print_row(r);
        }
        out << "(" << rows->size() << " row" << (rows->size() == 1 ? "" : "s") << ")\n";
    } else if (const auto* one = std::get_if<std::optional<row>>(&result)) {
        if (*one) {
            print_row(**one);
        } else {
            out << "(no row)\n";
        }
    } else if (const auto* scalar = std::get_if<std::optional<db_value>>(&result)) {
        out << (*scalar ? to_display_string(**scalar) : std::string("(no value)")) << "\n";
    } else if (const auto* written = std::get_if<write_result>(&result)) {
        out << "inserted_id=" << written->inserted_id
            << "  rows_affected=" << written->rows_affected << "\n";
    }
}

}  // namespace equipdb::admin
