/**
 * @file operation_types.cpp
 * @brief Implementation of value rendering and row accessors
 */

#include <equipdb/operations/operation_types.hpp>

#include <equipdb/compat/format.hpp>

#include <type_traits>

namespace equipdb::operations {

auto to_display_string(const db_value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "null";
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return std::to_string(v);
            } else if constexpr (std::is_same_v<T, double>) {
                return equipdb::compat::format("{}", v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return "\"" + v + "\"";
            } else {
                return equipdb::compat::format("<{} bytes>", v.size());
            }
        },
        value);
}

auto to_display_string(const call_arguments& args) -> std::string {
    std::string out = "{";
    bool first = true;
    for (const auto& [key, value] : args) {
        if (!first) {
            out += ", ";
        }
        first = false;
        out += key;
        out += '=';
        out += to_display_string(value);
    }
    out += '}';
    return out;
}

auto to_string(result_shape shape) -> std::string_view {
    switch (shape) {
        case result_shape::many:
            return "many";
        case result_shape::one:
            return "one";
        case result_shape::scalar:
            return "scalar";
        case result_shape::write:
            return "write";
    }
    return "unknown";
}

auto row::find(std::string_view column) const -> const db_value* {
    for (std::size_t i = 0; i < columns.size() && i < values.size(); ++i) {
        if (columns[i] == column) {
            return &values[i];
        }
    }
    return nullptr;
}

auto row::get_int(std::string_view column) const -> std::optional<std::int64_t> {
    const auto* value = find(column);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (const auto* i = std::get_if<std::int64_t>(value)) {
        return *i;
    }
    return std::nullopt;
}

auto row::get_text(std::string_view column) const -> std::optional<std::string> {
    const auto* value = find(column);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(value)) {
        return *s;
    }
    return std::nullopt;
}

}  // namespace equipdb::operations
