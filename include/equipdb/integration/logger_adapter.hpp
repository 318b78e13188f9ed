/**
 * @file logger_adapter.hpp
 * @brief Adapter for logger_system with a security audit trail
 *
 * This file provides the logger_adapter class, a static facade over
 * kcenon::logger used by the migration manager, the operation executor
 * and the admin tool. Rejected operations are additionally written to a
 * JSON-lines audit file.
 *
 * @see logger_system/include/kcenon/logger/core/logger.h
 */

#pragma once

#include <equipdb/compat/format.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace equipdb::integration {

/**
 * @brief Log levels matching logger_system
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @brief Security event categories written to the audit trail
 */
enum class security_event_type {
    unknown_operation,     ///< Call to a name missing from the registry
    validation_rejected,   ///< Arguments refused by the operation's validator
    unsafe_path_rejected,  ///< filePath argument failed the path policy
    database_restored,     ///< Live database replaced from a file
    data_export            ///< Database copied out of the data directory
};

[[nodiscard]] auto to_string(security_event_type type) -> std::string_view;

/**
 * @brief Whether the event records a refused request
 *
 * Rejections are logged as warnings with outcome "rejected"; the other
 * events are informational with outcome "success".
 */
[[nodiscard]] constexpr auto is_rejection(security_event_type type) noexcept -> bool {
    return type == security_event_type::unknown_operation ||
           type == security_event_type::validation_rejected ||
           type == security_event_type::unsafe_path_rejected;
}

/**
 * @brief Configuration for logger_adapter
 */
struct logger_config {
    /// Directory for equipdb.log and audit.json
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    bool enable_console{true};

    /// Rotating equipdb.log in log_directory
    bool enable_file{true};

    /// JSON-lines security trail (audit.json)
    bool enable_audit_log{true};

    std::size_t max_file_size_mb{10};

    /// Rotated log files kept besides the active one
    std::size_t max_files{5};

    bool async_mode{true};

    /// Queue size for async logging
    std::size_t buffer_size{8192};
};

/**
 * @brief Static logging facade
 *
 * Calls made before initialize() (or after shutdown()) are silently
 * dropped, so library code can log unconditionally.
 *
 * @example
 * @code
 * logger_config config;
 * config.log_directory = "/var/lib/equipdb/logs";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Schema version updated to {}", 3);
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    /**
     * @brief Start the logger and open the audit trail
     *
     * Creates the log directory if needed. Calling it again while
     * initialized has no effect.
     */
    static void initialize(const logger_config& config);

    /// Flush pending messages, close the audit trail and stop the logger
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    template <typename... Args>
    static void trace(equipdb::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::trace)) {
            log(log_level::trace, equipdb::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void debug(equipdb::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::debug)) {
            log(log_level::debug, equipdb::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void info(equipdb::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, equipdb::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(equipdb::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, equipdb::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(equipdb::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, equipdb::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(equipdb::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, equipdb::compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a preformatted message at the given level
     */
    static void log(log_level level, const std::string& message);

    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    /// Flush the logger writers and the audit trail
    static void flush();

    /**
     * @brief Record a security-relevant event
     *
     * Writes a line to the main log and appends one JSON object to
     * audit.json:
     * {"timestamp":...,"event_type":"SECURITY","outcome":...,
     *  "security_event":...,"subject":...,"description":...}
     * The subject field is omitted when empty.
     *
     * @param type Event category
     * @param description Human-readable description
     * @param subject Operation key or path the event refers to
     */
    static void log_security_event(security_event_type type,
                                   const std::string& description,
                                   const std::string& subject = "");

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

    /**
     * @brief Parse a level name ("trace", "debug", "info", "warn",
     *        "error", "fatal", "off")
     * @return The level, or log_level::info for unrecognized names
     */
    [[nodiscard]] static auto parse_level(const std::string& name) -> log_level;

private:
    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace equipdb::integration
