/**
 * @file qualification_operations.cpp
 * @brief Catalog entries of load tests, calibrations and personnel
 *        credentials
 */

#include <equipdb/operations/operation_catalog.hpp>

#include <equipdb/operations/argument_checks.hpp>

namespace equipdb::operations::catalog {

namespace {

using namespace checks;

[[nodiscard]] auto validate_by_equipment(const call_arguments& args,
                                         const validation_context& /*context*/) -> bool {
    return has_positive_id(args, "equipmentId");
}

[[nodiscard]] auto validate_due_date(const call_arguments& args,
                                     const validation_context& /*context*/) -> bool {
    return has_date(args, "dueDate");
}

}  // namespace

auto qualification_operations() -> std::vector<operation_spec> {
    return {
        // ─────────────────────────────────────────────────────
        // loadTests
        // ─────────────────────────────────────────────────────
        {"loadTests", "getByEquipmentId",
         "SELECT * FROM load_tests WHERE equipment_id = ? ORDER BY test_date DESC",
         {"equipmentId"}, result_shape::many, validate_by_equipment},

        // Only passed tests carry a meaningful next due date
        {"loadTests", "getDue",
         R"(SELECT lt.*, e.equipment_id AS equipment_identifier
            FROM load_tests lt
            JOIN equipment e ON lt.equipment_id = e.id
            WHERE lt.next_test_due <= ? AND lt.test_results = 'pass'
            ORDER BY lt.next_test_due)",
         {"dueDate"}, result_shape::many, validate_due_date},

        {"loadTests", "create",
         R"(INSERT INTO load_tests (equipment_id, test_date, test_type, test_load_percentage,
                                    rated_capacity, test_load, test_duration, inspector,
                                    test_results, deficiencies_found, corrective_actions,
                                    next_test_due, certificate_number, notes)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?))",
         {"equipmentId", "testDate", "testType", "testLoadPercentage", "ratedCapacity",
          "testLoad", "testDuration", "inspector", "testResults", "deficienciesFound",
          "correctiveActions", "nextTestDue", "certificateNumber", "notes"},
         result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "equipmentId") && has_date(args, "testDate") &&
                    has_enum(args, "testType",
                             {"annual", "periodic", "initial", "after_repair"}) &&
                    has_enum(args, "testResults", {"pass", "fail"}) &&
                    has_text(args, "inspector");
         }},

        {"loadTests", "getLastByEquipment",
         R"(SELECT equipment_id, MAX(test_date) AS last_test_date, test_results
            FROM load_tests
            GROUP BY equipment_id)",
         {}, result_shape::many, accept_all},

        {"loadTests", "getTotal",
         "SELECT COUNT(*) AS count FROM load_tests",
         {}, result_shape::scalar, accept_all},

        {"loadTests", "getOverdue",
         R"(SELECT lt.*, e.equipment_id AS equipment_identifier
            FROM load_tests lt
            JOIN equipment e ON lt.equipment_id = e.id
            WHERE lt.next_test_due < date('now') AND lt.test_results = 'pass'
            ORDER BY lt.next_test_due ASC)",
         {}, result_shape::many, accept_all},

        // ─────────────────────────────────────────────────────
        // calibrations
        // ─────────────────────────────────────────────────────
        {"calibrations", "getByEquipmentId",
         "SELECT * FROM calibrations WHERE equipment_id = ? ORDER BY calibration_date DESC",
         {"equipmentId"}, result_shape::many, validate_by_equipment},

        {"calibrations", "getDue",
         R"(SELECT c.*, e.equipment_id AS equipment_identifier
            FROM calibrations c
            JOIN equipment e ON c.equipment_id = e.id
            WHERE c.calibration_due_date <= ?
            ORDER BY c.calibration_due_date)",
         {"dueDate"}, result_shape::many, validate_due_date},

        {"calibrations", "create",
         R"(INSERT INTO calibrations (equipment_id, instrument_type, calibration_date,
                                      calibration_due_date, calibrated_by,
                                      calibration_agency, certificate_number,
                                      calibration_results, accuracy_tolerance,
                                      actual_accuracy, adjustments_made, notes)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?))",
         {"equipmentId", "instrumentType", "calibrationDate", "calibrationDueDate",
          "calibratedBy", "calibrationAgency", "certificateNumber", "calibrationResults",
          "accuracyTolerance", "actualAccuracy", "adjustmentsMade", "notes"},
         result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "equipmentId") &&
                    has_text(args, "instrumentType") &&
                    has_date(args, "calibrationDate") &&
                    has_date(args, "calibrationDueDate") &&
                    has_text(args, "calibratedBy") &&
                    has_enum(args, "calibrationResults", {"pass", "fail", "limited"});
         }},

        {"calibrations", "getTotal",
         "SELECT COUNT(*) AS count FROM calibrations",
         {}, result_shape::scalar, accept_all},

        {"calibrations", "getOverdue",
         R"(SELECT c.*, e.equipment_id AS equipment_identifier
            FROM calibrations c
            JOIN equipment e ON c.equipment_id = e.id
            WHERE c.calibration_due_date < date('now')
            ORDER BY c.calibration_due_date ASC)",
         {}, result_shape::many, accept_all},

        // ─────────────────────────────────────────────────────
        // credentials
        // ─────────────────────────────────────────────────────
        {"credentials", "getAll",
         "SELECT * FROM credentials ORDER BY person_name, credential_type",
         {}, result_shape::many, accept_all},

        {"credentials", "getByPerson",
         "SELECT * FROM credentials WHERE person_name = ? ORDER BY credential_type",
         {"personName"}, result_shape::many,
         [](const call_arguments& args, const validation_context&) {
             return has_text(args, "personName");
         }},

        {"credentials", "getExpiring",
         R"(SELECT * FROM credentials
            WHERE expiration_date <= ? AND status = 'active'
            ORDER BY expiration_date)",
         {"expirationDate"}, result_shape::many,
         [](const call_arguments& args, const validation_context&) {
             return has_date(args, "expirationDate");
         }},

        {"credentials", "create",
         R"(INSERT INTO credentials (person_name, credential_type, equipment_types,
                                     certification_body, certificate_number, issue_date,
                                     expiration_date, renewal_required, notes)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?))",
         {"personName", "credentialType", "equipmentTypes", "certificationBody",
          "certificateNumber", "issueDate", "expirationDate", "renewalRequired", "notes"},
         result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_text(args, "personName") && has_text(args, "credentialType") &&
                    has_date(args, "issueDate") && has_date(args, "expirationDate");
         }},

        {"credentials", "updateStatus",
         "UPDATE credentials SET status = ?, updated_at = CURRENT_TIMESTAMP WHERE id = ?",
         {"status", "id"}, result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "id") &&
                    has_enum(args, "status", {"active", "expired", "suspended", "revoked"});
         }},

        {"credentials", "getTotal",
         "SELECT COUNT(*) AS count FROM credentials",
         {}, result_shape::scalar, accept_all},
    };
}

}  // namespace equipdb::operations::catalog
