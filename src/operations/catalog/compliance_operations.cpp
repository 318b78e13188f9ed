/**
 * @file compliance_operations.cpp
 * @brief Catalog entries of standards, deficiencies, signatures and
 *        certificates
 */

#include <equipdb/operations/operation_catalog.hpp>

#include <equipdb/operations/argument_checks.hpp>

namespace equipdb::operations::catalog {

namespace {

using namespace checks;

[[nodiscard]] auto has_severity(const call_arguments& args) -> bool {
    return has_enum(args, "severity", {"critical", "major", "minor"});
}

[[nodiscard]] auto has_deficiency_status(const call_arguments& args) -> bool {
    return has_enum(args, "status", {"open", "in_progress", "verified", "closed"});
}

[[nodiscard]] auto has_signed_entity(const call_arguments& args) -> bool {
    return has_enum(args, "entityType", {"inspection", "deficiency", "work_order"}) &&
           has_positive_id(args, "entityId");
}

[[nodiscard]] auto has_type_assignment(const call_arguments& args) -> bool {
    return has_text(args, "equipmentType") && has_positive_id(args, "standardId");
}

constexpr const char* deficiency_listing_sql =
    R"(SELECT d.*, e.equipment_id AS equipment_identifier
       FROM deficiencies d
       JOIN equipment e ON d.equipment_id = e.id)";

}  // namespace

auto compliance_operations() -> std::vector<operation_spec> {
    return {
        // ─────────────────────────────────────────────────────
        // compliance
        // ─────────────────────────────────────────────────────
        {"compliance", "getAllStandards",
         "SELECT * FROM compliance_standards ORDER BY name",
         {}, result_shape::many, accept_all},

        {"compliance", "createStandard",
         "INSERT INTO compliance_standards (name, description, authority) VALUES (?, ?, ?)",
         {"name", "description", "authority"}, result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_text(args, "name") && has_text(args, "description") &&
                    has_text(args, "authority");
         }},

        {"compliance", "deleteStandard",
         "DELETE FROM compliance_standards WHERE id = ?",
         {"id"}, result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "id");
         }},

        {"compliance", "getAssignedStandards",
         R"(SELECT cs.id, cs.name FROM compliance_standards cs
            JOIN equipment_type_compliance etc ON cs.id = etc.standard_id
            WHERE etc.equipment_type = ?)",
         {"equipmentType"}, result_shape::many,
         [](const call_arguments& args, const validation_context&) {
             return has_text(args, "equipmentType");
         }},

        // Assigning twice is a no-op
        {"compliance", "assignStandard",
         R"(INSERT OR IGNORE INTO equipment_type_compliance (equipment_type, standard_id)
            VALUES (?, ?))",
         {"equipmentType", "standardId"}, result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_type_assignment(args);
         }},

        {"compliance", "unassignStandard",
         "DELETE FROM equipment_type_compliance WHERE equipment_type = ? AND standard_id = ?",
         {"equipmentType", "standardId"}, result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_type_assignment(args);
         }},

        {"compliance", "getComplianceReport",
         R"(SELECT etc.equipment_type, cs.name AS standard_name, cs.id AS standard_id
            FROM equipment_type_compliance etc
            JOIN compliance_standards cs ON etc.standard_id = cs.id
            ORDER BY etc.equipment_type, cs.name)",
         {}, result_shape::many, accept_all},

        // ─────────────────────────────────────────────────────
        // deficiencies
        // ─────────────────────────────────────────────────────
        {"deficiencies", "getAll",
         std::string(deficiency_listing_sql) + " ORDER BY d.created_at DESC",
         {}, result_shape::many, accept_all},

        {"deficiencies", "getByEquipmentId",
         "SELECT * FROM deficiencies WHERE equipment_id = ? ORDER BY created_at DESC",
         {"equipmentId"}, result_shape::many,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "equipmentId");
         }},

        {"deficiencies", "getByStatus",
         std::string(deficiency_listing_sql) +
             " WHERE d.status = ? ORDER BY d.created_at DESC",
         {"status"}, result_shape::many,
         [](const call_arguments& args, const validation_context&) {
             return has_deficiency_status(args);
         }},

        {"deficiencies", "create",
         R"(INSERT INTO deficiencies (equipment_id, inspection_item_id, severity,
                                      remove_from_service, description, component,
                                      corrective_action, due_date, status)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?))",
         {"equipmentId", "inspectionItemId", "severity", "removeFromService",
          "description", "component", "correctiveAction", "dueDate", "status"},
         result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "equipmentId") && has_severity(args) &&
                    has_text(args, "description") && has_deficiency_status(args);
         }},

        {"deficiencies", "update",
         R"(UPDATE deficiencies
            SET severity = ?, remove_from_service = ?, description = ?, component = ?,
                corrective_action = ?, due_date = ?, status = ?,
                updated_at = CURRENT_TIMESTAMP
            WHERE id = ?)",
         {"severity", "removeFromService", "description", "component",
          "correctiveAction", "dueDate", "status", "id"},
         result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "id") && has_severity(args) &&
                    has_text(args, "description") && has_deficiency_status(args);
         }},

        {"deficiencies", "close",
         R"(UPDATE deficiencies
            SET status = 'closed', closed_at = CURRENT_TIMESTAMP,
                verification_signature = ?, verification_timestamp = CURRENT_TIMESTAMP,
                updated_at = CURRENT_TIMESTAMP
            WHERE id = ?)",
         {"verificationSignature", "id"}, result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "id");
         }},

        {"deficiencies", "getOpenCritical",
         std::string(deficiency_listing_sql) +
             R"( WHERE d.severity = 'critical' AND d.status IN ('open', 'in_progress')
                 ORDER BY d.created_at DESC)",
         {}, result_shape::many, accept_all},

        {"deficiencies", "getOverdue",
         std::string(deficiency_listing_sql) +
             R"( WHERE d.due_date < date('now') AND d.status IN ('open', 'in_progress')
                 ORDER BY d.due_date ASC)",
         {}, result_shape::many, accept_all},

        // Status is always 'open' for deficiencies raised from a failed item
        {"deficiencies", "createFromInspectionItem",
         R"(INSERT INTO deficiencies (equipment_id, inspection_item_id, severity,
                                      remove_from_service, description, component,
                                      corrective_action, due_date, status)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, 'open'))",
         {"equipmentId", "inspectionItemId", "severity", "removeFromService",
          "description", "component", "correctiveAction", "dueDate"},
         result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "equipmentId") &&
                    has_positive_id(args, "inspectionItemId") && has_severity(args) &&
                    has_text(args, "description");
         }},

        {"deficiencies", "linkToWorkOrder",
         R"(UPDATE deficiencies SET work_order_id = ?, updated_at = CURRENT_TIMESTAMP
            WHERE id = ?)",
         {"workOrderId", "id"}, result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "id") && has_positive_id(args, "workOrderId");
         }},

        // ─────────────────────────────────────────────────────
        // signatures
        // ─────────────────────────────────────────────────────
        {"signatures", "getByEntity",
         R"(SELECT * FROM signatures WHERE entity_type = ? AND entity_id = ?
            ORDER BY timestamp DESC)",
         {"entityType", "entityId"}, result_shape::many,
         [](const call_arguments& args, const validation_context&) {
             return has_signed_entity(args);
         }},

        {"signatures", "create",
         R"(INSERT INTO signatures (entity_type, entity_id, signature_type, signatory_name,
                                    signature_data)
            VALUES (?, ?, ?, ?, ?))",
         {"entityType", "entityId", "signatureType", "signatoryName", "signatureData"},
         result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_signed_entity(args) &&
                    has_enum(args, "signatureType",
                             {"inspector", "supervisor", "verification"}) &&
                    has_text(args, "signatoryName") && is_present(args, "signatureData");
         }},

        {"signatures", "delete",
         "DELETE FROM signatures WHERE id = ?",
         {"id"}, result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "id");
         }},

        // ─────────────────────────────────────────────────────
        // certificates
        // ─────────────────────────────────────────────────────
        {"certificates", "getByEquipmentId",
         "SELECT * FROM certificates WHERE equipment_id = ? ORDER BY issue_date DESC",
         {"equipmentId"}, result_shape::many,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "equipmentId");
         }},

        {"certificates", "getByCertificateNumber",
         "SELECT * FROM certificates WHERE certificate_number = ?",
         {"certificateNumber"}, result_shape::one,
         [](const call_arguments& args, const validation_context&) {
             return has_text(args, "certificateNumber");
         }},

        {"certificates", "getExpiring",
         R"(SELECT c.*, e.equipment_id AS equipment_identifier
            FROM certificates c
            JOIN equipment e ON c.equipment_id = e.id
            WHERE c.expiration_date <= ? AND c.status = 'active'
            ORDER BY c.expiration_date)",
         {"expirationDate"}, result_shape::many,
         [](const call_arguments& args, const validation_context&) {
             return has_date(args, "expirationDate");
         }},

        {"certificates", "create",
         R"(INSERT INTO certificates (certificate_number, certificate_type, equipment_id,
                                      entity_id, issue_date, expiration_date, issued_by,
                                      qr_code_data, certificate_hash)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?))",
         {"certificateNumber", "certificateType", "equipmentId", "entityId", "issueDate",
          "expirationDate", "issuedBy", "qrCodeData", "certificateHash"},
         result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_text(args, "certificateNumber") &&
                    has_enum(args, "certificateType",
                             {"inspection", "load_test", "calibration"}) &&
                    has_positive_id(args, "equipmentId") &&
                    has_positive_id(args, "entityId") && has_date(args, "issueDate") &&
                    has_text(args, "issuedBy");
         }},

        {"certificates", "updateStatus",
         "UPDATE certificates SET status = ? WHERE id = ?",
         {"status", "id"}, result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "id") &&
                    has_enum(args, "status", {"active", "expired", "revoked"});
         }},

        {"certificates", "getTotal",
         "SELECT COUNT(*) AS count FROM certificates",
         {}, result_shape::scalar, accept_all},
    };
}

}  // namespace equipdb::operations::catalog
