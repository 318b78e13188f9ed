/**
 * @file maintenance_operations.cpp
 * @brief Catalog entries of work orders, preventive maintenance and meters
 */

#include <equipdb/operations/operation_catalog.hpp>

#include <equipdb/operations/argument_checks.hpp>

namespace equipdb::operations::catalog {

namespace {

using namespace checks;

[[nodiscard]] auto has_work_order_status(const call_arguments& args) -> bool {
    return has_enum(args, "status", {"draft", "approved", "assigned", "in_progress",
                                     "completed", "closed", "cancelled"});
}

[[nodiscard]] auto has_work_classification(const call_arguments& args) -> bool {
    return has_enum(args, "workType", {"preventive", "corrective", "emergency", "project"}) &&
           has_enum(args, "priority", {"low", "medium", "high", "critical"});
}

[[nodiscard]] auto validate_pm_template(const call_arguments& args) -> bool {
    return has_text(args, "name") && has_text(args, "equipmentType") &&
           has_enum(args, "frequencyType", {"calendar", "usage", "condition"}) &&
           has_positive_id(args, "frequencyValue");
}

constexpr const char* work_order_listing_sql =
    R"(SELECT wo.*, e.equipment_id AS equipment_identifier
       FROM work_orders wo
       JOIN equipment e ON wo.equipment_id = e.id)";

constexpr const char* pm_schedule_listing_sql =
    R"(SELECT ps.*, pt.name AS template_name, e.equipment_id AS equipment_identifier
       FROM pm_schedules ps
       JOIN pm_templates pt ON ps.pm_template_id = pt.id
       JOIN equipment e ON ps.equipment_id = e.id)";

}  // namespace

auto maintenance_operations() -> std::vector<operation_spec> {
    return {
        // ─────────────────────────────────────────────────────
        // workOrders
        // ─────────────────────────────────────────────────────
        {"workOrders", "getAll",
         std::string(work_order_listing_sql) + " ORDER BY wo.created_at DESC",
         {}, result_shape::many, accept_all},

        {"workOrders", "getByStatus",
         std::string(work_order_listing_sql) +
             " WHERE wo.status = ? ORDER BY wo.created_at DESC",
         {"status"}, result_shape::many,
         [](const call_arguments& args, const validation_context&) {
             return has_work_order_status(args);
         }},

        {"workOrders", "getByEquipmentId",
         "SELECT * FROM work_orders WHERE equipment_id = ? ORDER BY created_at DESC",
         {"equipmentId"}, result_shape::many,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "equipmentId");
         }},

        {"workOrders", "create",
         R"(INSERT INTO work_orders (equipment_id, wo_number, title, description, work_type,
                                     priority, assigned_to, estimated_hours, created_by,
                                     scheduled_date, deficiency_id)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?))",
         {"equipmentId", "woNumber", "title", "description", "workType", "priority",
          "assignedTo", "estimatedHours", "createdBy", "scheduledDate", "deficiencyId"},
         result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "equipmentId") && has_text(args, "woNumber") &&
                    has_text(args, "title") && has_work_classification(args) &&
                    has_text(args, "createdBy");
         }},

        {"workOrders", "update",
         R"(UPDATE work_orders
            SET title = ?, description = ?, work_type = ?, priority = ?, assigned_to = ?,
                estimated_hours = ?, scheduled_date = ?
            WHERE id = ?)",
         {"title", "description", "workType", "priority", "assignedTo", "estimatedHours",
          "scheduledDate", "id"},
         result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "id") && has_text(args, "title") &&
                    has_work_classification(args);
         }},

        {"workOrders", "updateStatus",
         R"(UPDATE work_orders
            SET status = ?, started_at = ?, completed_at = ?, closed_at = ?
            WHERE id = ?)",
         {"status", "startedAt", "completedAt", "closedAt", "id"}, result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "id") && has_work_order_status(args);
         }},

        {"workOrders", "complete",
         R"(UPDATE work_orders
            SET status = 'completed', completed_at = CURRENT_TIMESTAMP, actual_hours = ?,
                parts_cost = ?, labor_cost = ?, completion_notes = ?
            WHERE id = ?)",
         {"actualHours", "partsCost", "laborCost", "completionNotes", "id"},
         result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "id");
         }},

        {"workOrders", "getDueToday",
         std::string(work_order_listing_sql) +
             R"( WHERE wo.scheduled_date = date('now')
                   AND wo.status IN ('approved', 'assigned')
                 ORDER BY wo.priority DESC)",
         {}, result_shape::many, accept_all},

        {"workOrders", "getOverdue",
         std::string(work_order_listing_sql) +
             R"( WHERE wo.scheduled_date < date('now')
                   AND wo.status IN ('approved', 'assigned', 'in_progress')
                 ORDER BY wo.scheduled_date ASC)",
         {}, result_shape::many, accept_all},

        // ─────────────────────────────────────────────────────
        // pmTemplates
        // ─────────────────────────────────────────────────────
        {"pmTemplates", "getAll",
         "SELECT * FROM pm_templates WHERE active = 1 ORDER BY name",
         {}, result_shape::many, accept_all},

        {"pmTemplates", "getByEquipmentType",
         "SELECT * FROM pm_templates WHERE equipment_type = ? AND active = 1 ORDER BY name",
         {"equipmentType"}, result_shape::many,
         [](const call_arguments& args, const validation_context&) {
             return has_text(args, "equipmentType");
         }},

        {"pmTemplates", "create",
         R"(INSERT INTO pm_templates (name, equipment_type, description, frequency_type,
                                      frequency_value, frequency_unit, estimated_duration,
                                      instructions, required_skills, required_parts,
                                      safety_notes)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?))",
         {"name", "equipmentType", "description", "frequencyType", "frequencyValue",
          "frequencyUnit", "estimatedDuration", "instructions", "requiredSkills",
          "requiredParts", "safetyNotes"},
         result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return validate_pm_template(args);
         }},

        {"pmTemplates", "update",
         R"(UPDATE pm_templates
            SET name = ?, equipment_type = ?, description = ?, frequency_type = ?,
                frequency_value = ?, frequency_unit = ?, estimated_duration = ?,
                instructions = ?, required_skills = ?, required_parts = ?,
                safety_notes = ?, updated_at = CURRENT_TIMESTAMP
            WHERE id = ?)",
         {"name", "equipmentType", "description", "frequencyType", "frequencyValue",
          "frequencyUnit", "estimatedDuration", "instructions", "requiredSkills",
          "requiredParts", "safetyNotes", "id"},
         result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "id") && validate_pm_template(args);
         }},

        // Templates are never deleted; schedules keep referring to them
        {"pmTemplates", "deactivate",
         "UPDATE pm_templates SET active = 0, updated_at = CURRENT_TIMESTAMP WHERE id = ?",
         {"id"}, result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "id");
         }},

        // ─────────────────────────────────────────────────────
        // pmSchedules
        // ─────────────────────────────────────────────────────
        {"pmSchedules", "getByEquipmentId",
         R"(SELECT ps.*, pt.name AS template_name, pt.frequency_type, pt.frequency_value,
                   pt.frequency_unit
            FROM pm_schedules ps
            JOIN pm_templates pt ON ps.pm_template_id = pt.id
            WHERE ps.equipment_id = ? AND ps.active = 1
            ORDER BY ps.next_due_date)",
         {"equipmentId"}, result_shape::many,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "equipmentId");
         }},

        {"pmSchedules", "getDue",
         std::string(pm_schedule_listing_sql) +
             " WHERE ps.next_due_date <= ? AND ps.active = 1 ORDER BY ps.next_due_date",
         {"dueDate"}, result_shape::many,
         [](const call_arguments& args, const validation_context&) {
             return has_date(args, "dueDate");
         }},

        {"pmSchedules", "create",
         R"(INSERT INTO pm_schedules (equipment_id, pm_template_id, next_due_date,
                                      next_due_usage)
            VALUES (?, ?, ?, ?))",
         {"equipmentId", "pmTemplateId", "nextDueDate", "nextDueUsage"},
         result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "equipmentId") &&
                    has_positive_id(args, "pmTemplateId");
         }},

        {"pmSchedules", "updateDue",
         R"(UPDATE pm_schedules
            SET next_due_date = ?, next_due_usage = ?, last_completed_date = ?,
                last_completed_usage = ?
            WHERE id = ?)",
         {"nextDueDate", "nextDueUsage", "lastCompletedDate", "lastCompletedUsage", "id"},
         result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "id");
         }},

        {"pmSchedules", "getTotal",
         "SELECT COUNT(*) AS count FROM pm_schedules WHERE active = 1",
         {}, result_shape::scalar, accept_all},

        {"pmSchedules", "getOverdue",
         std::string(pm_schedule_listing_sql) +
             R"( WHERE ps.next_due_date < date('now') AND ps.active = 1
                 ORDER BY ps.next_due_date ASC)",
         {}, result_shape::many, accept_all},

        // ─────────────────────────────────────────────────────
        // meterReadings
        // ─────────────────────────────────────────────────────
        {"meterReadings", "getByEquipmentId",
         "SELECT * FROM meter_readings WHERE equipment_id = ? ORDER BY reading_date DESC",
         {"equipmentId"}, result_shape::many,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "equipmentId");
         }},

        {"meterReadings", "getLatestByEquipment",
         R"(SELECT equipment_id, meter_type, MAX(reading_value) AS latest_reading,
                   MAX(reading_date) AS latest_date
            FROM meter_readings
            GROUP BY equipment_id, meter_type)",
         {}, result_shape::many, accept_all},

        {"meterReadings", "create",
         R"(INSERT INTO meter_readings (equipment_id, meter_type, reading_value,
                                        reading_date, recorded_by, notes)
            VALUES (?, ?, ?, ?, ?, ?))",
         {"equipmentId", "meterType", "readingValue", "readingDate", "recordedBy", "notes"},
         result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "equipmentId") && has_text(args, "meterType") &&
                    has_number(args, "readingValue") && has_date(args, "readingDate") &&
                    has_text(args, "recordedBy");
         }},
    };
}

}  // namespace equipdb::operations::catalog
