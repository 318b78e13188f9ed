/**
 * @file schema_migrations.hpp
 * @brief Schema history of the equipment inspection database
 *
 * Version 1: equipment, inspections, documents, scheduling, compliance,
 *            templates
 * Version 2: inspection items, deficiencies, signatures; document hash/size
 * Version 3: work orders, preventive maintenance, meter readings
 * Version 4: load tests, calibrations, credentials, template items
 * Version 5: users, audit log, certificates
 *
 * Released steps are never edited; schema changes add a new version.
 */

#pragma once

#include "migration_set.hpp"

namespace equipdb::storage {

/// Schema version the application expects (increment when adding migrations)
inline constexpr int application_schema_version = 5;

/**
 * @brief The application's migration steps
 *
 * Built once on first use.
 */
[[nodiscard]] auto application_migrations() -> const migration_set&;

}  // namespace equipdb::storage
