/**
 * @file backup_record.hpp
 * @brief Description of one pre-migration database snapshot
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace equipdb::storage {

/**
 * @brief A backup file in the backup directory
 */
struct backup_record {
    /// File name, e.g. "database-backup-2025-01-05T10-00-00-000Z.db"
    std::string name;

    /// Full path of the backup file
    std::filesystem::path path;

    /// Size in bytes
    std::uintmax_t size{0};

    /// Last modification time (the moment the snapshot was written)
    std::filesystem::file_time_type created{};
};

}  // namespace equipdb::storage
