/**
 * @file value_validators.hpp
 * @brief Pure predicates for argument values (dates, identifiers, enums)
 */

#pragma once

#include <initializer_list>
#include <string_view>

namespace equipdb::security {

/**
 * @brief Check for a real calendar date in "YYYY-MM-DD" form
 *
 * "2025-02-29" is rejected, "2024-02-29" is accepted.
 */
[[nodiscard]] auto is_valid_date(std::string_view value) -> bool;

/// True if the value contains at least one non-whitespace character
[[nodiscard]] auto is_non_empty(std::string_view value) noexcept -> bool;

/**
 * @brief Check a short identifier used as a directory or key name
 *
 * Accepts 1-64 characters from [A-Za-z0-9._-], excluding "." and "..".
 */
[[nodiscard]] auto is_valid_identifier(std::string_view value) noexcept -> bool;

/// Exact, case-sensitive membership test
[[nodiscard]] constexpr auto is_one_of(
    std::string_view value, std::initializer_list<std::string_view> allowed) noexcept
    -> bool {
    for (auto candidate : allowed) {
        if (candidate == value) {
            return true;
        }
    }
    return false;
}

}  // namespace equipdb::security
