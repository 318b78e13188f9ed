/**
 * @file equipment_operations.cpp
 * @brief Catalog entries of the equipment domain
 */

#include <equipdb/operations/operation_catalog.hpp>

#include <equipdb/operations/argument_checks.hpp>
#include <equipdb/security/value_validators.hpp>

#include <optional>
#include <string_view>

namespace equipdb::operations::catalog {

namespace {

using namespace checks;

/**
 * @brief Fields of an equipment record checked before a write
 */
struct equipment_fields {
    std::string_view equipment_id;
    std::string_view type;
    std::string_view manufacturer;
    std::string_view status;
};

[[nodiscard]] auto is_equipment_status(std::string_view status) -> bool {
    return security::is_one_of(status, {"active", "out of service", "under maintenance"});
}

[[nodiscard]] auto read_new_equipment(const call_arguments& args)
    -> std::optional<equipment_fields> {
    auto equipment_id = get_text(args, "equipmentId");
    auto type = get_text(args, "type");
    auto manufacturer = get_text(args, "manufacturer");
    auto status = get_text(args, "status");
    if (!equipment_id || !type || !manufacturer || !status) {
        return std::nullopt;
    }
    return equipment_fields{*equipment_id, *type, *manufacturer, *status};
}

[[nodiscard]] auto validate_create(const call_arguments& args,
                                   const validation_context& /*context*/) -> bool {
    auto fields = read_new_equipment(args);
    return fields && security::is_non_empty(fields->equipment_id) &&
           security::is_non_empty(fields->type) &&
           security::is_non_empty(fields->manufacturer) &&
           is_equipment_status(fields->status);
}

[[nodiscard]] auto validate_update(const call_arguments& args,
                                   const validation_context& /*context*/) -> bool {
    auto status = get_text(args, "status");
    return has_positive_id(args, "id") && status && is_equipment_status(*status);
}

[[nodiscard]] auto validate_id(const call_arguments& args,
                               const validation_context& /*context*/) -> bool {
    return has_positive_id(args, "id");
}

}  // namespace

auto equipment_operations() -> std::vector<operation_spec> {
    return {
        {"equipment", "getAll",
         "SELECT * FROM equipment ORDER BY equipment_id",
         {}, result_shape::many, accept_all},

        {"equipment", "getById",
         "SELECT * FROM equipment WHERE id = ?",
         {"id"}, result_shape::one, validate_id},

        {"equipment", "getByEquipmentId",
         "SELECT * FROM equipment WHERE equipment_id = ?",
         {"equipmentId"}, result_shape::one,
         [](const call_arguments& args, const validation_context&) {
             return has_text(args, "equipmentId");
         }},

        {"equipment", "create",
         R"(INSERT INTO equipment (equipment_id, type, manufacturer, model, serial_number,
                                   capacity, installation_date, location, status, qr_code_data)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?))",
         {"equipmentId", "type", "manufacturer", "model", "serialNumber", "capacity",
          "installationDate", "location", "status", "qrCodeData"},
         result_shape::write, validate_create},

        {"equipment", "update",
         R"(UPDATE equipment SET manufacturer = ?, model = ?, serial_number = ?,
                   capacity = ?, installation_date = ?, location = ?, status = ?
            WHERE id = ?)",
         {"manufacturer", "model", "serialNumber", "capacity", "installationDate",
          "location", "status", "id"},
         result_shape::write, validate_update},

        {"equipment", "delete",
         "DELETE FROM equipment WHERE id = ?",
         {"id"}, result_shape::write, validate_id},

        {"equipment", "getDistinctTypes",
         "SELECT DISTINCT type FROM equipment WHERE type IS NOT NULL ORDER BY type",
         {}, result_shape::many, accept_all},

        {"equipment", "getStatusCounts",
         "SELECT status, COUNT(*) AS count FROM equipment GROUP BY status",
         {}, result_shape::many, accept_all},

        {"equipment", "getCount",
         "SELECT COUNT(*) AS count FROM equipment",
         {}, result_shape::scalar, accept_all},
    };
}

}  // namespace equipdb::operations::catalog
