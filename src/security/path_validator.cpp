/**
 * @file path_validator.cpp
 * @brief Implementation of file-path safety checks
 */

#include <equipdb/security/path_validator.hpp>

#include <algorithm>
#include <cctype>
#include <utility>

namespace equipdb::security {

namespace {

[[nodiscard]] auto to_lower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

/// Lowercase with backslashes folded to '/'
[[nodiscard]] auto comparable_form(std::string value) -> std::string {
    value = to_lower(std::move(value));
    std::replace(value.begin(), value.end(), '\\', '/');
    return value;
}

[[nodiscard]] auto has_traversal_token(std::string_view path) -> bool {
    return path.find("..") != std::string_view::npos ||
           path.find('~') != std::string_view::npos;
}

/// Drive-letter paths ("C:\..." or "C:/...") count as absolute on every host.
[[nodiscard]] auto is_drive_absolute(std::string_view path) -> bool {
    return path.size() >= 3 &&
           std::isalpha(static_cast<unsigned char>(path[0])) != 0 &&
           path[1] == ':' && (path[2] == '\\' || path[2] == '/');
}

}  // namespace

auto default_denied_prefixes() -> std::vector<std::string> {
    return {
        "/etc/",
        "/bin/",
        "/sbin/",
        "/usr/bin/",
        "/usr/sbin/",
        "/boot/",
        "/dev/",
        "/proc/",
        "/sys/",
        "C:\\Windows\\",
        "C:\\System32\\",
        "C:\\Program Files\\",
    };
}

auto is_within_directory(const std::filesystem::path& path,
                         const std::filesystem::path& directory) -> bool {
    auto relative = path.lexically_normal().lexically_relative(
        directory.lexically_normal());
    if (relative.empty() || relative.is_absolute()) {
        return false;
    }
    return *relative.begin() != "..";
}

auto is_safe_file_path(std::string_view path, const path_policy& policy)
    -> bool {
    if (path.empty() || has_traversal_token(path)) {
        return false;
    }

    auto normalized = std::filesystem::path(std::string(path)).lexically_normal();
    auto normalized_str = normalized.string();
    if (has_traversal_token(normalized_str)) {
        return false;
    }

    if (!normalized.is_absolute() && !is_drive_absolute(normalized_str)) {
        return false;
    }

    if (policy.managed_root) {
        if (is_within_directory(normalized, *policy.managed_root)) {
            return true;
        }
        if (policy.require_managed_root) {
            return false;
        }
    }

    // "/etc" must match "/etc/" as well as "/etc/passwd"
    auto lower_dir = comparable_form(normalized_str);
    if (!lower_dir.empty() && lower_dir.back() != '/') {
        lower_dir += '/';
    }

    for (const auto& prefix : policy.denied_prefixes) {
        auto lower_prefix = comparable_form(prefix);
        if (lower_dir.compare(0, lower_prefix.size(), lower_prefix) == 0) {
            return false;
        }
    }

    return true;
}

}  // namespace equipdb::security
