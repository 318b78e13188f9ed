/**
 * @file inspection_operations.cpp
 * @brief Catalog entries of inspections, schedules, checklist items and
 *        templates
 */

#include <equipdb/operations/operation_catalog.hpp>

#include <equipdb/operations/argument_checks.hpp>

namespace equipdb::operations::catalog {

namespace {

using namespace checks;

[[nodiscard]] auto validate_id(const call_arguments& args,
                               const validation_context& /*context*/) -> bool {
    return has_positive_id(args, "id");
}

[[nodiscard]] auto validate_inspection(const call_arguments& args,
                                       const validation_context& /*context*/) -> bool {
    return has_positive_id(args, "equipmentId") && has_text(args, "inspector") &&
           has_date(args, "inspectionDate");
}

[[nodiscard]] auto has_item_result(const call_arguments& args) -> bool {
    return has_enum(args, "result", {"pass", "fail", "na"});
}

[[nodiscard]] auto has_schedule_status(const call_arguments& args) -> bool {
    return has_enum(args, "status", {"scheduled", "in_progress", "completed"});
}

constexpr const char* insert_inspection_sql =
    R"(INSERT INTO inspections (equipment_id, inspector, inspection_date, findings,
                                corrective_actions, summary_comments, signature,
                                scheduled_inspection_id, inspection_date_date)
       VALUES (?, ?, ?, ?, ?, ?, ?, ?, date(?)))";

}  // namespace

auto inspection_operations() -> std::vector<operation_spec> {
    return {
        // ─────────────────────────────────────────────────────
        // inspections
        // ─────────────────────────────────────────────────────
        {"inspections", "getAll",
         "SELECT * FROM inspections ORDER BY inspection_date DESC",
         {}, result_shape::many, accept_all},

        {"inspections", "getByEquipmentId",
         "SELECT * FROM inspections WHERE equipment_id = ? ORDER BY inspection_date DESC",
         {"equipmentId"}, result_shape::many,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "equipmentId");
         }},

        // inspectionDate fills both the raw column and the date() column
        {"inspections", "create", insert_inspection_sql,
         {"equipmentId", "inspector", "inspectionDate", "findings", "correctiveActions",
          "summaryComments", "signature", "scheduledInspectionId", "inspectionDate"},
         result_shape::write, validate_inspection},

        {"inspections", "createFromScheduled", insert_inspection_sql,
         {"equipmentId", "inspector", "inspectionDate", "findings", "correctiveActions",
          "summaryComments", "signature", "scheduledInspectionId", "inspectionDate"},
         result_shape::write,
         [](const call_arguments& args, const validation_context& context) {
             return validate_inspection(args, context) &&
                    has_positive_id(args, "scheduledInspectionId");
         }},

        {"inspections", "getByScheduledId",
         "SELECT * FROM inspections WHERE scheduled_inspection_id = ?",
         {"scheduledInspectionId"}, result_shape::one,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "scheduledInspectionId");
         }},

        {"inspections", "getByDateRange",
         R"(SELECT * FROM inspections
            WHERE inspection_date_date BETWEEN ? AND ?
            ORDER BY inspection_date_date DESC)",
         {"startDate", "endDate"}, result_shape::many,
         [](const call_arguments& args, const validation_context&) {
             return has_date(args, "startDate") && has_date(args, "endDate");
         }},

        {"inspections", "getCount",
         "SELECT COUNT(*) AS count FROM inspections",
         {}, result_shape::scalar, accept_all},

        {"inspections", "getPerMonth",
         R"(SELECT strftime('%Y-%m', inspection_date_date) AS month, COUNT(*) AS count
            FROM inspections
            WHERE inspection_date_date IS NOT NULL
            GROUP BY strftime('%Y-%m', inspection_date_date)
            ORDER BY month DESC)",
         {}, result_shape::many, accept_all},

        {"inspections", "getLastInspectionByEquipment",
         R"(SELECT equipment_id, MAX(inspection_date_date) AS last_inspection_date
            FROM inspections
            WHERE inspection_date_date IS NOT NULL
            GROUP BY equipment_id)",
         {}, result_shape::many, accept_all},

        {"inspections", "getRecentFailures",
         R"(SELECT e.equipment_id, i.inspection_date_date
            FROM inspections i
            JOIN equipment e ON i.equipment_id = e.id
            WHERE i.findings LIKE '%fail%' OR i.findings LIKE '%defect%'
            ORDER BY i.inspection_date_date DESC
            LIMIT 10)",
         {}, result_shape::many, accept_all},

        {"inspections", "getComplianceStatus",
         R"(SELECT e.id AS equipment_id,
                   e.equipment_id AS equipment_identifier,
                   e.type,
                   MAX(i.inspection_date_date) AS last_inspection_date,
                   COUNT(CASE WHEN ii.critical = 1 AND ii.result = 'fail' THEN 1 END)
                       AS critical_failures,
                   COUNT(CASE WHEN d.severity = 'critical'
                              AND d.status IN ('open', 'in_progress') THEN 1 END)
                       AS open_critical_deficiencies
            FROM equipment e
            LEFT JOIN inspections i ON e.id = i.equipment_id
            LEFT JOIN inspection_items ii ON i.id = ii.inspection_id
            LEFT JOIN deficiencies d ON e.id = d.equipment_id
            GROUP BY e.id, e.equipment_id, e.type
            ORDER BY e.equipment_id)",
         {}, result_shape::many, accept_all},

        {"inspections", "getOverdue",
         R"(SELECT i.*, e.equipment_id AS equipment_identifier
            FROM inspections i
            JOIN equipment e ON i.equipment_id = e.id
            WHERE i.inspection_date_date < date('now', '-1 year')
              AND i.id IN (SELECT MAX(id) FROM inspections GROUP BY equipment_id)
            ORDER BY i.inspection_date_date ASC)",
         {}, result_shape::many, accept_all},

        // ─────────────────────────────────────────────────────
        // scheduledInspections
        // ─────────────────────────────────────────────────────
        {"scheduledInspections", "getAll",
         R"(SELECT si.*, e.equipment_id AS equipmentIdentifier
            FROM scheduled_inspections si
            JOIN equipment e ON si.equipment_id = e.id
            ORDER BY si.scheduled_date)",
         {}, result_shape::many, accept_all},

        {"scheduledInspections", "getUpcoming",
         R"(SELECT e.equipment_id, s.scheduled_date
            FROM scheduled_inspections s
            JOIN equipment e ON s.equipment_id = e.id
            WHERE s.scheduled_date >= ? AND s.status != 'completed'
            ORDER BY s.scheduled_date
            LIMIT 10)",
         {"fromDate"}, result_shape::many,
         [](const call_arguments& args, const validation_context&) {
             return has_date(args, "fromDate");
         }},

        {"scheduledInspections", "getTodayAndLater",
         "SELECT * FROM scheduled_inspections WHERE scheduled_date >= ?",
         {"today"}, result_shape::many,
         [](const call_arguments& args, const validation_context&) {
             return has_date(args, "today");
         }},

        {"scheduledInspections", "create",
         R"(INSERT INTO scheduled_inspections (equipment_id, scheduled_date,
                                               assigned_inspector, status)
            VALUES (?, ?, ?, ?))",
         {"equipmentId", "scheduledDate", "assignedInspector", "status"},
         result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "equipmentId") &&
                    has_date(args, "scheduledDate") &&
                    has_text(args, "assignedInspector") &&
                    (!args.contains("status") || has_schedule_status(args));
         }},

        {"scheduledInspections", "update",
         R"(UPDATE scheduled_inspections
            SET equipment_id = ?, scheduled_date = ?, assigned_inspector = ?
            WHERE id = ?)",
         {"equipmentId", "scheduledDate", "assignedInspector", "id"},
         result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "equipmentId") &&
                    has_date(args, "scheduledDate") &&
                    has_text(args, "assignedInspector") && has_positive_id(args, "id");
         }},

        {"scheduledInspections", "updateStatus",
         "UPDATE scheduled_inspections SET status = ? WHERE id = ?",
         {"status", "id"}, result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_schedule_status(args) && has_positive_id(args, "id");
         }},

        {"scheduledInspections", "delete",
         "DELETE FROM scheduled_inspections WHERE id = ?",
         {"id"}, result_shape::write, validate_id},

        // ─────────────────────────────────────────────────────
        // inspectionItems
        // ─────────────────────────────────────────────────────
        {"inspectionItems", "getByInspectionId",
         "SELECT * FROM inspection_items WHERE inspection_id = ? ORDER BY id",
         {"inspectionId"}, result_shape::many,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "inspectionId");
         }},

        {"inspectionItems", "create",
         R"(INSERT INTO inspection_items (inspection_id, standard_ref, item_text, critical,
                                          result, notes, photos, component, priority)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?))",
         {"inspectionId", "standardRef", "itemText", "critical", "result", "notes",
          "photos", "component", "priority"},
         result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "inspectionId") && has_text(args, "itemText") &&
                    has_item_result(args);
         }},

        {"inspectionItems", "update",
         R"(UPDATE inspection_items
            SET standard_ref = ?, item_text = ?, critical = ?, result = ?, notes = ?,
                photos = ?, component = ?, priority = ?
            WHERE id = ?)",
         {"standardRef", "itemText", "critical", "result", "notes", "photos",
          "component", "priority", "id"},
         result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "id") && has_text(args, "itemText") &&
                    has_item_result(args);
         }},

        {"inspectionItems", "delete",
         "DELETE FROM inspection_items WHERE id = ?",
         {"id"}, result_shape::write, validate_id},

        {"inspectionItems", "getCriticalFailures",
         R"(SELECT ii.*, i.equipment_id, e.equipment_id AS equipment_identifier
            FROM inspection_items ii
            JOIN inspections i ON ii.inspection_id = i.id
            JOIN equipment e ON i.equipment_id = e.id
            WHERE ii.critical = 1 AND ii.result = 'fail'
            ORDER BY i.inspection_date DESC)",
         {}, result_shape::many, accept_all},

        // ─────────────────────────────────────────────────────
        // templates
        // ─────────────────────────────────────────────────────
        {"templates", "getAll",
         "SELECT id, name, fields FROM inspection_templates ORDER BY name",
         {}, result_shape::many, accept_all},

        {"templates", "save",
         R"(INSERT INTO inspection_templates (name, fields) VALUES (?, ?)
            ON CONFLICT(name) DO UPDATE SET fields = excluded.fields)",
         {"name", "fields"}, result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_text(args, "name") && has_text(args, "fields");
         }},

        {"templates", "delete",
         "DELETE FROM inspection_templates WHERE id = ?",
         {"id"}, result_shape::write, validate_id},

        // ─────────────────────────────────────────────────────
        // templateItems
        // ─────────────────────────────────────────────────────
        {"templateItems", "getByTemplateId",
         "SELECT * FROM template_items WHERE template_id = ? ORDER BY item_order",
         {"templateId"}, result_shape::many,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "templateId");
         }},

        {"templateItems", "create",
         R"(INSERT INTO template_items (template_id, standard_id, item_order, standard_ref,
                                        item_text, critical, component, inspection_method,
                                        acceptance_criteria, notes)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?))",
         {"templateId", "standardId", "itemOrder", "standardRef", "itemText", "critical",
          "component", "inspectionMethod", "acceptanceCriteria", "notes"},
         result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "templateId") &&
                    has_positive_id(args, "itemOrder") && has_text(args, "itemText");
         }},

        {"templateItems", "update",
         R"(UPDATE template_items
            SET standard_id = ?, item_order = ?, standard_ref = ?, item_text = ?,
                critical = ?, component = ?, inspection_method = ?,
                acceptance_criteria = ?, notes = ?
            WHERE id = ?)",
         {"standardId", "itemOrder", "standardRef", "itemText", "critical", "component",
          "inspectionMethod", "acceptanceCriteria", "notes", "id"},
         result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "id") && has_positive_id(args, "itemOrder") &&
                    has_text(args, "itemText");
         }},

        {"templateItems", "delete",
         "DELETE FROM template_items WHERE id = ?",
         {"id"}, result_shape::write, validate_id},
    };
}

}  // namespace equipdb::operations::catalog
