/**
 * @file argument_checks.hpp
 * @brief Typed reads and checks over a call_arguments bag
 *
 * Validators in the operation catalog are composed from these helpers.
 * Every check fails for a missing key.
 */

#pragma once

#include "operation_types.hpp"

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string_view>

namespace equipdb::operations::checks {

/// Validator for operations without arguments or argument rules
[[nodiscard]] inline auto accept_all(const call_arguments& /*args*/,
                                     const validation_context& /*context*/) -> bool {
    return true;
}

/// Integer argument; doubles with an integral value are accepted
[[nodiscard]] auto get_int(const call_arguments& args, std::string_view key)
    -> std::optional<std::int64_t>;

/// Numeric argument (integer or real)
[[nodiscard]] auto get_number(const call_arguments& args, std::string_view key)
    -> std::optional<double>;

/// Text argument; the view points into @p args
[[nodiscard]] auto get_text(const call_arguments& args, std::string_view key)
    -> std::optional<std::string_view>;

/// Integer greater than zero
[[nodiscard]] auto has_positive_id(const call_arguments& args, std::string_view key)
    -> bool;

/// Text with at least one non-whitespace character
[[nodiscard]] auto has_text(const call_arguments& args, std::string_view key) -> bool;

/// Text holding a real "YYYY-MM-DD" date
[[nodiscard]] auto has_date(const call_arguments& args, std::string_view key) -> bool;

/// Integer or real value
[[nodiscard]] auto has_number(const call_arguments& args, std::string_view key)
    -> bool;

/// Text equal to one of @p allowed
[[nodiscard]] auto has_enum(const call_arguments& args, std::string_view key,
                            std::initializer_list<std::string_view> allowed) -> bool;

/**
 * @brief Present and not empty: non-NULL, non-zero number, non-empty text
 *        or blob
 */
[[nodiscard]] auto is_present(const call_arguments& args, std::string_view key)
    -> bool;

/// Text that passes security::is_safe_file_path() under @p context
[[nodiscard]] auto has_safe_path(const call_arguments& args, std::string_view key,
                                 const validation_context& context) -> bool;

}  // namespace equipdb::operations::checks
