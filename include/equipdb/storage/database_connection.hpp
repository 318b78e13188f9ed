/**
 * @file database_connection.hpp
 * @brief Owning wrapper around the single SQLite handle of the process
 *
 * The host opens exactly one database_connection at startup. The migration
 * manager and the operation executor both operate on it.
 */

#pragma once

#include <equipdb/core/result.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

// Forward declaration of SQLite handle
struct sqlite3;

namespace equipdb::storage {

/**
 * @brief Connection options
 */
struct database_config {
    /// Database file, or ":memory:" for a private in-memory database
    std::filesystem::path path;

    /// Use write-ahead logging (ignored for in-memory databases)
    bool wal_mode{false};

    /// Milliseconds to wait on a locked database before failing
    int busy_timeout_ms{5000};

    /// Enforce FOREIGN KEY constraints
    bool foreign_keys{true};

    /// Open an existing file without write access; never creates the file
    bool read_only{false};
};

/**
 * @brief RAII owner of a sqlite3 handle
 *
 * Thread Safety: This class is NOT thread-safe. The process issues
 * database calls sequentially.
 *
 * @example
 * @code
 * auto conn = database_connection::open({.path = "/data/equipment.db"});
 * if (conn.is_err()) {
 *     // Handle error
 * }
 * auto& db = *conn.value();
 * @endcode
 */
class database_connection {
public:
    /**
     * @brief Open (or create) a database and apply connection PRAGMAs
     *
     * @param config Connection options
     * @return The open connection or database_open_error
     */
    [[nodiscard]] static auto open(const database_config& config)
        -> Result<std::unique_ptr<database_connection>>;

    ~database_connection();

    database_connection(const database_connection&) = delete;
    auto operator=(const database_connection&) -> database_connection& = delete;
    database_connection(database_connection&&) = delete;
    auto operator=(database_connection&&) -> database_connection& = delete;

    /**
     * @brief Close the handle; closing an already closed connection succeeds
     */
    [[nodiscard]] auto close() -> VoidResult;

    /**
     * @brief Re-open the same file with the original options
     *
     * Used after the database file has been replaced on disk.
     */
    [[nodiscard]] auto reopen() -> VoidResult;

    [[nodiscard]] auto is_open() const noexcept -> bool;

    /// True for ":memory:" databases, which never have a file on disk
    [[nodiscard]] auto is_in_memory() const -> bool;

    /// Raw handle; nullptr while closed
    [[nodiscard]] auto native_handle() const noexcept -> sqlite3*;

    [[nodiscard]] auto path() const noexcept -> const std::filesystem::path&;

    [[nodiscard]] auto config() const noexcept -> const database_config&;

    /**
     * @brief Execute one or more SQL statements without results
     */
    [[nodiscard]] auto execute(std::string_view sql) -> VoidResult;

    /**
     * @brief Fold the WAL back into the main file
     *
     * No-op unless WAL mode is enabled. Must be called before the database
     * file is copied, otherwise the copy misses committed pages.
     */
    [[nodiscard]] auto checkpoint() -> VoidResult;

private:
    explicit database_connection(sqlite3* db, database_config config);

    [[nodiscard]] static auto open_handle(const database_config& config)
        -> Result<sqlite3*>;

    sqlite3* db_{nullptr};
    database_config config_;
};

/**
 * @brief Execute SQL on a raw handle
 *
 * Shared by migration procedures, which receive the raw handle.
 *
 * @param db The SQLite database handle
 * @param sql One or more SQL statements
 * @return VoidResult Success or database_query_error
 */
[[nodiscard]] auto execute_sql(sqlite3* db, std::string_view sql) -> VoidResult;

}  // namespace equipdb::storage
