/**
 * @file path_validator.hpp
 * @brief File-path safety checks for operations that store filesystem paths
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace equipdb::security {

/**
 * @brief Operating-system directories no stored path may point into
 *
 * Matched case-insensitively as prefixes of the normalized path.
 */
[[nodiscard]] auto default_denied_prefixes() -> std::vector<std::string>;

/**
 * @brief Rules applied by is_safe_file_path()
 */
struct path_policy {
    /// Prefixes that make a path unsafe
    std::vector<std::string> denied_prefixes{default_denied_prefixes()};

    /// Managed documents directory; paths inside it are always accepted
    std::optional<std::filesystem::path> managed_root;

    /// Reject every path outside managed_root
    bool require_managed_root{false};
};

/**
 * @brief Check whether a path string is safe to store
 *
 * A path is rejected when it:
 * - is empty
 * - contains a ".." or "~" token, before or after lexical normalization
 * - is not absolute (POSIX root or drive-letter form)
 * - falls under one of the denied prefixes
 * - lies outside the managed root while require_managed_root is set
 *
 * The check is purely lexical; the file does not have to exist.
 *
 * @param path Path string supplied by the caller
 * @param policy Denylist and managed-root rules
 * @return true if the path is acceptable
 */
[[nodiscard]] auto is_safe_file_path(std::string_view path,
                                     const path_policy& policy = {}) -> bool;

/**
 * @brief Lexically test whether @p path is @p directory or lies below it
 */
[[nodiscard]] auto is_within_directory(const std::filesystem::path& path,
                                       const std::filesystem::path& directory)
    -> bool;

}  // namespace equipdb::security
