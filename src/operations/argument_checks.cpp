/**
 * @file argument_checks.cpp
 * @brief Implementation of argument bag checks
 */

#include <equipdb/operations/argument_checks.hpp>

#include <equipdb/security/path_validator.hpp>
#include <equipdb/security/value_validators.hpp>

#include <cmath>
#include <type_traits>
#include <variant>

namespace equipdb::operations::checks {

namespace {

[[nodiscard]] auto lookup(const call_arguments& args, std::string_view key)
    -> const db_value* {
    auto it = args.find(key);
    return it == args.end() ? nullptr : &it->second;
}

}  // namespace

auto get_int(const call_arguments& args, std::string_view key)
    -> std::optional<std::int64_t> {
    const auto* value = lookup(args, key);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (const auto* i = std::get_if<std::int64_t>(value)) {
        return *i;
    }
    if (const auto* d = std::get_if<double>(value)) {
        // [-2^63, 2^63) is the range a double converts to int64 exactly
        if (std::isfinite(*d) && std::trunc(*d) == *d &&
            *d >= -9223372036854775808.0 && *d < 9223372036854775808.0) {
            return static_cast<std::int64_t>(*d);
        }
    }
    return std::nullopt;
}

auto get_number(const call_arguments& args, std::string_view key)
    -> std::optional<double> {
    const auto* value = lookup(args, key);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (const auto* i = std::get_if<std::int64_t>(value)) {
        return static_cast<double>(*i);
    }
    if (const auto* d = std::get_if<double>(value)) {
        return *d;
    }
    return std::nullopt;
}

auto get_text(const call_arguments& args, std::string_view key)
    -> std::optional<std::string_view> {
    const auto* value = lookup(args, key);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(value)) {
        return std::string_view(*s);
    }
    return std::nullopt;
}

auto has_positive_id(const call_arguments& args, std::string_view key) -> bool {
    auto id = get_int(args, key);
    return id && *id > 0;
}

auto has_text(const call_arguments& args, std::string_view key) -> bool {
    auto text = get_text(args, key);
    return text && security::is_non_empty(*text);
}

auto has_date(const call_arguments& args, std::string_view key) -> bool {
    auto text = get_text(args, key);
    return text && security::is_valid_date(*text);
}

auto has_number(const call_arguments& args, std::string_view key) -> bool {
    return get_number(args, key).has_value();
}

auto has_enum(const call_arguments& args, std::string_view key,
              std::initializer_list<std::string_view> allowed) -> bool {
    auto text = get_text(args, key);
    return text && security::is_one_of(*text, allowed);
}

auto is_present(const call_arguments& args, std::string_view key) -> bool {
    const auto* value = lookup(args, key);
    if (value == nullptr) {
        return false;
    }
    return std::visit(
        [](const auto& v) -> bool {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return false;
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return v != 0;
            } else if constexpr (std::is_same_v<T, double>) {
                return v != 0.0 && !std::isnan(v);
            } else {
                return !v.empty();
            }
        },
        *value);
}

auto has_safe_path(const call_arguments& args, std::string_view key,
                   const validation_context& context) -> bool {
    auto text = get_text(args, key);
    if (!text) {
        return false;
    }

    security::path_policy policy;
    policy.managed_root = context.managed_documents_dir;
    policy.require_managed_root =
        context.require_managed_path && context.managed_documents_dir.has_value();
    return security::is_safe_file_path(*text, policy);
}

}  // namespace equipdb::operations::checks
