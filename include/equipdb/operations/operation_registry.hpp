/**
 * @file operation_registry.hpp
 * @brief Closed, immutable catalog of named database operations
 */

#pragma once

#include "operation_types.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace equipdb::operations {

/**
 * @brief Lookup table from "domain.operation" to its catalog entry
 *
 * Constructed once and never modified, so concurrent lookups need no
 * synchronization.
 *
 * @example
 * @code
 * const auto& registry = operation_registry::instance();
 * if (const auto* spec = registry.find("equipment", "create")) {
 *     // spec->statement, spec->parameters ...
 * }
 * @endcode
 */
class operation_registry {
public:
    /**
     * @brief Build a registry from catalog entries
     *
     * @throws std::logic_error on a duplicate key, an entry without a
     *         domain, name or validator, or a placeholder/parameter count
     *         mismatch
     */
    explicit operation_registry(std::vector<operation_spec> specs);

    /**
     * @brief Registry of the application catalog
     *
     * Built on first use, before any other thread can observe it.
     */
    [[nodiscard]] static auto instance() -> const operation_registry&;

    /// Entry for @p domain / @p name, or nullptr if none exists
    [[nodiscard]] auto find(std::string_view domain, std::string_view name) const
        -> const operation_spec*;

    [[nodiscard]] auto all() const noexcept -> const std::vector<operation_spec>&;

    [[nodiscard]] auto size() const noexcept -> std::size_t;

    /// Distinct domain names in alphabetical order
    [[nodiscard]] auto domains() const -> std::vector<std::string>;

    /// Entries of one domain in catalog order
    [[nodiscard]] auto operations_in(std::string_view domain) const
        -> std::vector<const operation_spec*>;

private:
    std::vector<operation_spec> specs_;
    std::map<std::string, std::size_t, std::less<>> index_;
};

}  // namespace equipdb::operations
