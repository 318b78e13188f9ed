/**
 * @file operation_types.hpp
 * @brief Values, rows and catalog entries of the secure operation registry
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace equipdb::operations {

// ─────────────────────────────────────────────────────
// Values
// ─────────────────────────────────────────────────────

/// Raw bytes of a BLOB value
using blob = std::vector<std::uint8_t>;

/**
 * @brief A single SQL value
 *
 * std::monostate is SQL NULL.
 */
using db_value = std::variant<std::monostate, std::int64_t, double, std::string, blob>;

[[nodiscard]] inline auto is_null(const db_value& value) noexcept -> bool {
    return std::holds_alternative<std::monostate>(value);
}

/**
 * @brief Render a value for logs and error details
 *
 * NULL renders as "null", text is quoted, blobs render as "<N bytes>".
 */
[[nodiscard]] auto to_display_string(const db_value& value) -> std::string;

/**
 * @brief Named arguments supplied by a caller for one invocation
 *
 * Parameters missing from the map bind as NULL.
 */
using call_arguments = std::map<std::string, db_value, std::less<>>;

/// Render an argument bag as "{key=value, ...}"
[[nodiscard]] auto to_display_string(const call_arguments& args) -> std::string;

// ─────────────────────────────────────────────────────
// Results
// ─────────────────────────────────────────────────────

/**
 * @brief One result row with its column names
 */
struct row {
    std::vector<std::string> columns;
    std::vector<db_value> values;

    /// Value of @p column, or nullptr if the row has no such column
    [[nodiscard]] auto find(std::string_view column) const -> const db_value*;

    /// Integer value of @p column; nullopt for NULL, missing or non-integer
    [[nodiscard]] auto get_int(std::string_view column) const
        -> std::optional<std::int64_t>;

    /// Text value of @p column; nullopt for NULL, missing or non-text
    [[nodiscard]] auto get_text(std::string_view column) const
        -> std::optional<std::string>;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return values.size(); }
};

/**
 * @brief Declared cardinality of an operation's result
 */
enum class result_shape {
    many,    ///< All matching rows
    one,     ///< First row or absent
    scalar,  ///< First column of first row or absent
    write    ///< Inserted row id and affected row count
};

[[nodiscard]] auto to_string(result_shape shape) -> std::string_view;

/**
 * @brief Acknowledgment of a data-modifying statement
 */
struct write_result {
    /// sqlite3_last_insert_rowid() after the statement
    std::int64_t inserted_id{0};

    /// sqlite3_changes() for the statement
    std::int64_t rows_affected{0};
};

using row_list = std::vector<row>;

/**
 * @brief Shaped result of operation_executor::execute()
 *
 * The alternative held always matches the operation's result_shape:
 * row_list for many, std::optional<row> for one, std::optional<db_value>
 * for scalar and write_result for write.
 */
using operation_result =
    std::variant<row_list, std::optional<row>, std::optional<db_value>, write_result>;

// ─────────────────────────────────────────────────────
// Catalog Entries
// ─────────────────────────────────────────────────────

/**
 * @brief Runtime context available to validators
 */
struct validation_context {
    /// Managed documents directory; stored paths inside it are always safe
    std::optional<std::filesystem::path> managed_documents_dir;

    /// Reject stored paths outside managed_documents_dir
    bool require_managed_path{false};
};

/// Predicate approving an argument bag before execution
using validator_fn =
    std::function<bool(const call_arguments& args, const validation_context& context)>;

/**
 * @brief Immutable catalog entry
 *
 * parameters.size() equals the number of positional placeholders in
 * statement; operation_registry refuses entries that break this.
 */
struct operation_spec {
    std::string domain;
    std::string name;
    std::string statement;
    std::vector<std::string> parameters;
    result_shape shape{result_shape::many};
    validator_fn validate;

    /// "domain.name"
    [[nodiscard]] auto key() const -> std::string { return domain + "." + name; }
};

/**
 * @brief Count positional '?' placeholders in a SQL statement
 *
 * Question marks inside string literals, quoted identifiers and comments
 * are not placeholders.
 */
[[nodiscard]] constexpr auto count_placeholders(std::string_view sql) noexcept
    -> std::size_t {
    std::size_t count = 0;
    std::size_t i = 0;
    while (i < sql.size()) {
        char c = sql[i];
        if (c == '\'' || c == '"' || c == '`') {
            // Quoted section; a doubled quote is an escaped quote
            ++i;
            while (i < sql.size()) {
                if (sql[i] == c) {
                    if (i + 1 < sql.size() && sql[i + 1] == c) {
                        i += 2;
                        continue;
                    }
                    break;
                }
                ++i;
            }
            ++i;
        } else if (c == '-' && i + 1 < sql.size() && sql[i + 1] == '-') {
            while (i < sql.size() && sql[i] != '\n') {
                ++i;
            }
        } else if (c == '/' && i + 1 < sql.size() && sql[i + 1] == '*') {
            i += 2;
            while (i + 1 < sql.size() && !(sql[i] == '*' && sql[i + 1] == '/')) {
                ++i;
            }
            i += 2;
        } else {
            if (c == '?') {
                ++count;
            }
            ++i;
        }
    }
    return count;
}

}  // namespace equipdb::operations
