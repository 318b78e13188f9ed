/**
 * @file logger_adapter.cpp
 * @brief Implementation of the logging facade and audit trail
 */

#include <equipdb/integration/logger_adapter.hpp>

#include <equipdb/compat/time.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <array>
#include <atomic>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <system_error>

namespace equipdb::integration {

namespace {

constexpr std::array<kcenon::logger::log_level, 7> backend_levels = {
    kcenon::logger::log_level::trace, kcenon::logger::log_level::debug,
    kcenon::logger::log_level::info,  kcenon::logger::log_level::warn,
    kcenon::logger::log_level::error, kcenon::logger::log_level::fatal,
    kcenon::logger::log_level::off};

[[nodiscard]] auto to_backend(log_level level) -> kcenon::logger::log_level {
    auto index = static_cast<std::size_t>(level);
    return index < backend_levels.size() ? backend_levels[index]
                                         : kcenon::logger::log_level::off;
}

/// Append @p text to @p out as the body of a JSON string
void append_json_escaped(std::string& out, std::string_view text) {
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char escaped[8];
                    std::snprintf(escaped, sizeof(escaped), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += escaped;
                } else {
                    out += c;
                }
                break;
        }
    }
}

void append_field(std::string& out, std::string_view key, std::string_view value) {
    if (out.size() > 1) {
        out += ',';
    }
    out += '"';
    out += key;
    out += "\":\"";
    append_json_escaped(out, value);
    out += '"';
}

/**
 * @brief One line of audit.json
 */
struct audit_entry {
    std::string timestamp;
    security_event_type type{security_event_type::unknown_operation};
    std::string subject;
    std::string description;

    [[nodiscard]] auto to_json() const -> std::string {
        std::string json = "{";
        append_field(json, "timestamp", timestamp);
        append_field(json, "event_type", "SECURITY");
        append_field(json, "outcome", is_rejection(type) ? "rejected" : "success");
        append_field(json, "security_event", to_string(type));
        if (!subject.empty()) {
            append_field(json, "subject", subject);
        }
        append_field(json, "description", description);
        json += "}\n";
        return json;
    }
};

}  // namespace

auto to_string(security_event_type type) -> std::string_view {
    switch (type) {
        case security_event_type::unknown_operation:
            return "unknown_operation";
        case security_event_type::validation_rejected:
            return "validation_rejected";
        case security_event_type::unsafe_path_rejected:
            return "unsafe_path_rejected";
        case security_event_type::database_restored:
            return "database_restored";
        case security_event_type::data_export:
            return "data_export";
    }
    return "unknown";
}

// =============================================================================
// Implementation Class
// =============================================================================

class logger_adapter::impl {
public:
    impl() = default;
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard lock(mutex_);
        if (initialized_) {
            return;
        }

        config_ = config;
        min_level_.store(config.min_level);

        if (config.enable_file || config.enable_audit_log) {
            std::error_code ec;
            std::filesystem::create_directories(config.log_directory, ec);
        }

        logger_ = std::make_unique<kcenon::logger::logger>(config.async_mode,
                                                           config.buffer_size);
        logger_->set_min_level(to_backend(config.min_level));

        if (config.enable_console) {
            logger_->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }
        if (config.enable_file) {
            logger_->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
                (config.log_directory / "equipdb.log").string(),
                config.max_file_size_mb * 1024 * 1024, config.max_files));
        }
        logger_->start();

        if (config.enable_audit_log) {
            std::lock_guard audit_lock(audit_mutex_);
            audit_.open(config.log_directory / "audit.json", std::ios::app);
        }

        initialized_ = true;
    }

    void shutdown() {
        std::lock_guard lock(mutex_);
        if (!initialized_) {
            return;
        }

        {
            std::lock_guard audit_lock(audit_mutex_);
            if (audit_.is_open()) {
                audit_.close();
            }
        }

        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const noexcept -> bool { return initialized_.load(); }

    void log(log_level level, const std::string& message) {
        if (initialized_ && logger_ && is_level_enabled(level)) {
            logger_->log(to_backend(level), message);
        }
    }

    [[nodiscard]] auto is_level_enabled(log_level level) const noexcept -> bool {
        return level != log_level::off &&
               static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void flush() {
        if (logger_) {
            logger_->flush();
        }
        std::lock_guard audit_lock(audit_mutex_);
        if (audit_.is_open()) {
            audit_.flush();
        }
    }

    void set_min_level(log_level level) {
        min_level_.store(level);
        if (logger_) {
            logger_->set_min_level(to_backend(level));
        }
    }

    [[nodiscard]] auto get_min_level() const noexcept -> log_level { return min_level_.load(); }

    [[nodiscard]] auto get_config() const -> const logger_config& { return config_; }

    void audit(const audit_entry& entry) {
        if (!initialized_) {
            return;
        }
        std::lock_guard audit_lock(audit_mutex_);
        if (audit_.is_open()) {
            // One flushed line per event
            audit_ << entry.to_json() << std::flush;
        }
    }

private:
    std::mutex mutex_;
    std::mutex audit_mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> logger_;
    std::ofstream audit_;
};

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

// =============================================================================
// Facade
// =============================================================================

void logger_adapter::initialize(const logger_config& config) { pimpl_->initialize(config); }

void logger_adapter::shutdown() { pimpl_->shutdown(); }

auto logger_adapter::is_initialized() noexcept -> bool { return pimpl_->is_initialized(); }

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->is_level_enabled(level);
}

void logger_adapter::flush() { pimpl_->flush(); }

void logger_adapter::log_security_event(security_event_type type,
                                        const std::string& description,
                                        const std::string& subject) {
    auto level = is_rejection(type) ? log_level::warn : log_level::info;
    if (subject.empty()) {
        log(level, equipdb::compat::format("Security event {}: {}", to_string(type),
                                           description));
    } else {
        log(level, equipdb::compat::format("Security event {} [{}]: {}", to_string(type),
                                           subject, description));
    }

    pimpl_->audit(audit_entry{compat::now_iso8601_utc(), type, subject, description});
}

void logger_adapter::set_min_level(log_level level) { pimpl_->set_min_level(level); }

auto logger_adapter::get_min_level() noexcept -> log_level { return pimpl_->get_min_level(); }

auto logger_adapter::get_config() -> const logger_config& { return pimpl_->get_config(); }

auto logger_adapter::parse_level(const std::string& name) -> log_level {
    constexpr std::array<std::pair<std::string_view, log_level>, 8> names = {{
        {"trace", log_level::trace},
        {"debug", log_level::debug},
        {"info", log_level::info},
        {"warn", log_level::warn},
        {"warning", log_level::warn},
        {"error", log_level::error},
        {"fatal", log_level::fatal},
        {"off", log_level::off},
    }};

    for (const auto& [candidate, level] : names) {
        if (candidate == name) {
            return level;
        }
    }
    return log_level::info;
}

}  // namespace equipdb::integration
