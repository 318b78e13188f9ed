/**
 * @file migration_set.hpp
 * @brief Ordered, immutable collection of schema migration steps
 */

#pragma once

#include <equipdb/core/result.hpp>

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <map>
#include <string>
#include <vector>

// Forward declaration of SQLite handle
struct sqlite3;

namespace equipdb::storage {

/**
 * @brief Function type for migration implementations
 *
 * Each migration function receives the database handle and executes the
 * SQL that upgrades the schema to its version. It runs inside a transaction
 * opened by the migration manager and must not issue BEGIN/COMMIT itself.
 *
 * @param db The SQLite database handle
 * @return VoidResult Success or error information
 */
using migration_function = std::function<VoidResult(sqlite3* db)>;

/**
 * @brief One versioned, one-way schema change
 */
struct migration_step {
    int version{0};
    std::string description;
    migration_function apply;
};

/**
 * @brief Version-ordered set of migration steps
 *
 * Versions must be positive and unique; they need not be contiguous.
 * A version without a step is a reserved gap.
 *
 * @throws std::invalid_argument from the constructors on a duplicate or
 *         non-positive version, or a step without a procedure
 */
class migration_set {
public:
    migration_set() = default;
    migration_set(std::initializer_list<migration_step> steps);
    explicit migration_set(std::vector<migration_step> steps);

    /// Step registered for @p version, or nullptr for a gap
    [[nodiscard]] auto find(int version) const -> const migration_step*;

    /// Highest registered version, 0 for an empty set
    [[nodiscard]] auto latest_version() const noexcept -> int;

    [[nodiscard]] auto size() const noexcept -> std::size_t;
    [[nodiscard]] auto empty() const noexcept -> bool;

    /// Registered versions in ascending order
    [[nodiscard]] auto versions() const -> std::vector<int>;

private:
    void add(migration_step step);

    std::map<int, migration_step> steps_;
};

}  // namespace equipdb::storage
