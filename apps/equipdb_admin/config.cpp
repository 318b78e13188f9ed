/**
 * @file config.cpp
 * @brief Command line parsing of the equipdb_admin tool
 */

#include "config.hpp"

#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <string>

namespace equipdb::admin {

void admin_config::print_help() {
    std::cout << R"(
equipdb_admin - Equipment inspection database administration

Usage: equipdb_admin [OPTIONS] [COMMAND [ARGS...]]

Options:
  --data-dir <path>       Application data directory (default: ./equipdb-data)
  --db-path <path>        Database file (default: <data-dir>/database.db)
  --log-dir <path>        Log directory (default: <data-dir>/logs)
  --log-level <level>     Log level: trace, debug, info, warn, error, fatal, off
                          (default: info)
  --max-backups <n>       Backups kept after migrating (default: 10)
  --wal                   Enable WAL journal mode
  --help, -h              Show this help message

Commands:
  migrate                         Bring the schema up to date (default)
  status                          Show schema version and migration history
  backups                         List migration backups, newest first
  cleanup [n]                     Keep only the n newest backups
  backup-now <dest>               Copy the database to <dest>
  restore <src>                   Replace the database with <src>
  import-document <key> <file>    Copy a file into the managed documents
                                  directory and print its hash
  exec <domain> <op> [k=v ...]    Run a registered operation
  operations [domain]             List registered operations

Examples:
  # Create or upgrade the database
  equipdb_admin --data-dir /var/lib/equipdb

  # Register a crane
  equipdb_admin exec equipment create equipmentId:=CR-001 type=Crane \
      manufacturer=Acme status=active

  # Inspections between two dates
  equipdb_admin exec inspections getByDateRange startDate=2025-01-01 \
      endDate=2025-12-31

)";
}

auto admin_config::parse_args(int argc, char* argv[]) -> std::optional<admin_config> {
    admin_config config;
    bool command_seen = false;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (command_seen) {
            config.command_args.emplace_back(arg);
            continue;
        }

        if (arg == "--help" || arg == "-h") {
            print_help();
            return std::nullopt;
        }

        if (arg == "--data-dir") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --data-dir requires a value\n";
                return std::nullopt;
            }
            config.data_dir = argv[++i];
            continue;
        }

        if (arg == "--db-path") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --db-path requires a value\n";
                return std::nullopt;
            }
            config.db_path = std::filesystem::path(argv[++i]);
            continue;
        }

        if (arg == "--log-dir") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --log-dir requires a value\n";
                return std::nullopt;
            }
            config.log_dir = std::filesystem::path(argv[++i]);
            continue;
        }

        if (arg == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --log-level requires a value\n";
                return std::nullopt;
            }
            config.log_level = argv[++i];
            continue;
        }

        if (arg == "--max-backups") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --max-backups requires a value\n";
                return std::nullopt;
            }
            try {
                config.max_backups = static_cast<std::size_t>(std::stoul(argv[++i]));
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid backup count\n";
                return std::nullopt;
            }
            continue;
        }

        if (arg == "--wal") {
            config.wal_mode = true;
            continue;
        }

        if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: Unknown option " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return std::nullopt;
        }

        config.command = std::string(arg);
        command_seen = true;
    }

    return config;
}

auto parse_call_value(std::string_view text) -> operations::db_value {
    if (text == "null") {
        return std::monostate{};
    }

    if (!text.empty()) {
        std::int64_t integer = 0;
        auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), integer);
        if (ec == std::errc{} && end == text.data() + text.size()) {
            return integer;
        }

        std::string copy(text);
        char* parse_end = nullptr;
        errno = 0;
        double number = std::strtod(copy.c_str(), &parse_end);
        bool numeric_start = copy[0] == '-' || copy[0] == '+' || copy[0] == '.' ||
                             (copy[0] >= '0' && copy[0] <= '9');
        // strtod also accepts hexadecimal floats
        numeric_start = numeric_start && copy.find_first_of("xX") == std::string::npos;
        if (numeric_start && errno == 0 && parse_end == copy.c_str() + copy.size()) {
            return number;
        }
    }

    return std::string(text);
}

auto parse_call_arguments(const std::vector<std::string>& tokens)
    -> std::optional<operations::call_arguments> {
    operations::call_arguments args;

    for (const auto& token : tokens) {
        auto eq = token.find('=');
        if (eq == std::string::npos || eq == 0) {
            std::cerr << "Error: Expected key=value, got '" << token << "'\n";
            return std::nullopt;
        }

        if (token[eq - 1] == ':') {
            if (eq == 1) {
                std::cerr << "Error: Expected key:=value, got '" << token << "'\n";
                return std::nullopt;
            }
            args[token.substr(0, eq - 1)] = token.substr(eq + 1);
            continue;
        }

        args[token.substr(0, eq)] =
            parse_call_value(std::string_view(token).substr(eq + 1));
    }

    return args;
}

}  // namespace equipdb::admin
