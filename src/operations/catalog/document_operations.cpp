/**
 * @file document_operations.cpp
 * @brief Catalog entries of the documents domain
 */

#include <equipdb/operations/operation_catalog.hpp>

#include <equipdb/operations/argument_checks.hpp>
#include <equipdb/security/value_validators.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace equipdb::operations::catalog {

namespace {

using namespace checks;

/**
 * @brief A document reference about to be stored
 */
struct document_fields {
    std::int64_t equipment_id{0};
    std::string_view file_name;
    std::string_view file_path;
    std::string_view hash;
    std::int64_t size{0};
};

[[nodiscard]] auto read_document(const call_arguments& args)
    -> std::optional<document_fields> {
    auto equipment_id = get_int(args, "equipmentId");
    auto file_name = get_text(args, "fileName");
    auto file_path = get_text(args, "filePath");
    auto hash = get_text(args, "hash");
    auto size = get_int(args, "size");
    if (!equipment_id || !file_name || !file_path || !hash || !size) {
        return std::nullopt;
    }
    return document_fields{*equipment_id, *file_name, *file_path, *hash, *size};
}

[[nodiscard]] auto validate_create(const call_arguments& args,
                                   const validation_context& context) -> bool {
    auto doc = read_document(args);
    return doc && doc->equipment_id > 0 && doc->size > 0 &&
           security::is_non_empty(doc->file_name) &&
           security::is_non_empty(doc->hash) &&
           has_safe_path(args, "filePath", context);
}

}  // namespace

auto document_operations() -> std::vector<operation_spec> {
    return {
        {"documents", "getByEquipmentId",
         "SELECT * FROM documents WHERE equipment_id = ? ORDER BY file_name",
         {"equipmentId"}, result_shape::many,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "equipmentId");
         }},

        {"documents", "create",
         R"(INSERT INTO documents (equipment_id, file_name, file_path, hash, size)
            VALUES (?, ?, ?, ?, ?))",
         {"equipmentId", "fileName", "filePath", "hash", "size"},
         result_shape::write, validate_create},

        {"documents", "checkExisting",
         "SELECT id FROM documents WHERE equipment_id = ? AND file_name = ?",
         {"equipmentId", "fileName"}, result_shape::one,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "equipmentId") && has_text(args, "fileName");
         }},
    };
}

}  // namespace equipdb::operations::catalog
