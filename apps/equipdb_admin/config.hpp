/**
 * @file config.hpp
 * @brief Command line configuration of the equipdb_admin tool
 */

#ifndef EQUIPDB_ADMIN_CONFIG_HPP
#define EQUIPDB_ADMIN_CONFIG_HPP

#include <equipdb/operations/operation_types.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace equipdb::admin {

/**
 * @brief Complete equipdb_admin configuration
 */
struct admin_config {
    /// Application data directory
    std::filesystem::path data_dir{"./equipdb-data"};

    /// Database file (default: <data_dir>/database.db)
    std::optional<std::filesystem::path> db_path;

    /// Log directory (default: <data_dir>/logs)
    std::optional<std::filesystem::path> log_dir;

    /// Log level: "trace", "debug", "info", "warn", "error", "fatal", "off"
    std::string log_level{"info"};

    /// Backups kept after a migration run
    std::size_t max_backups{10};

    /// Enable WAL (Write-Ahead Logging) mode
    bool wal_mode{false};

    /// Command to run; "migrate" when none is given
    std::string command{"migrate"};

    /// Positional arguments following the command
    std::vector<std::string> command_args;

    /**
     * @brief Parse configuration from command line arguments
     *
     * Supported options:
     *   --data-dir <path>      Data directory (default: ./equipdb-data)
     *   --db-path <path>       Database file (default: <data-dir>/database.db)
     *   --log-dir <path>       Log directory (default: <data-dir>/logs)
     *   --log-level <level>    Log level (default: info)
     *   --max-backups <n>      Backups to keep (default: 10)
     *   --wal                  Enable WAL mode
     *   --help                 Show help message
     *
     * @return Configuration or nullopt if --help was requested or error
     */
    static auto parse_args(int argc, char* argv[]) -> std::optional<admin_config>;

    /**
     * @brief Print help message to stdout
     */
    static void print_help();
};

/**
 * @brief Parse "key=value" tokens of the exec command
 *
 * Values that parse completely as an integer or decimal are typed as
 * such, "null" binds NULL, and "key:=value" always keeps the text.
 *
 * @return The argument bag, or nullopt if a token has no '='
 */
auto parse_call_arguments(const std::vector<std::string>& tokens)
    -> std::optional<operations::call_arguments>;

/// Type a single exec value
auto parse_call_value(std::string_view text) -> operations::db_value;

}  // namespace equipdb::admin

#endif  // EQUIPDB_ADMIN_CONFIG_HPP
