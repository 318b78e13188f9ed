/**
 * @file operation_catalog.hpp
 * @brief Catalog entries of the equipment inspection application
 *
 * Entries are grouped by functional area; application_catalog() returns
 * all of them in a fixed order.
 */

#pragma once

#include "operation_types.hpp"

#include <vector>

namespace equipdb::operations::catalog {

/// equipment
[[nodiscard]] auto equipment_operations() -> std::vector<operation_spec>;

/// inspections, scheduledInspections, inspectionItems, templates, templateItems
[[nodiscard]] auto inspection_operations() -> std::vector<operation_spec>;

/// documents
[[nodiscard]] auto document_operations() -> std::vector<operation_spec>;

/// compliance, deficiencies, signatures, certificates
[[nodiscard]] auto compliance_operations() -> std::vector<operation_spec>;

/// workOrders, pmTemplates, pmSchedules, meterReadings
[[nodiscard]] auto maintenance_operations() -> std::vector<operation_spec>;

/// loadTests, calibrations, credentials
[[nodiscard]] auto qualification_operations() -> std::vector<operation_spec>;

/// users, auditLog
[[nodiscard]] auto administration_operations() -> std::vector<operation_spec>;

/// Every entry above
[[nodiscard]] auto application_catalog() -> std::vector<operation_spec>;

}  // namespace equipdb::operations::catalog
