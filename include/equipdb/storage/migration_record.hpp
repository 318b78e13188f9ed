/**
 * @file migration_record.hpp
 * @brief Applied-migration row of the schema_version ledger
 */

#pragma once

#include <string>

namespace equipdb::storage {

/**
 * @brief One row of the schema_version table
 */
struct migration_record {
    /// Schema version the row records
    int version{0};

    /// Description of the migration step (empty for reserved versions)
    std::string description;

    /// SQLite datetime('now') at the time the row was written
    std::string applied_at;
};

}  // namespace equipdb::storage
