/**
 * @file main.cpp
 * @brief Entry point of the equipdb_admin tool
 *
 * Usage:
 *   equipdb_admin [OPTIONS] [COMMAND [ARGS...]]
 *
 * Options:
 *   --data-dir <path>      Data directory (default: ./equipdb-data)
 *   --db-path <path>       Database file (default: <data-dir>/database.db)
 *   --log-dir <path>       Log directory (default: <data-dir>/logs)
 *   --log-level <level>    Log level (default: info)
 *   --max-backups <n>      Backups to keep (default: 10)
 *   --wal                  Enable WAL mode
 *   --help                 Show help message
 */

#include "admin_app.hpp"
#include "config.hpp"

#include <utility>

int main(int argc, char* argv[]) {
    auto config = equipdb::admin::admin_config::parse_args(argc, argv);
    if (!config) {
        return 1;
    }

    equipdb::admin::admin_app app(std::move(config.value()));
    return app.run();
}
