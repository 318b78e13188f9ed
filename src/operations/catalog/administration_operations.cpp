/**
 * @file administration_operations.cpp
 * @brief Catalog entries of user accounts and the application audit log
 */

#include <equipdb/operations/operation_catalog.hpp>

#include <equipdb/operations/argument_checks.hpp>

namespace equipdb::operations::catalog {

namespace {

using namespace checks;

[[nodiscard]] auto has_entity(const call_arguments& args) -> bool {
    return has_text(args, "entityType") && has_positive_id(args, "entityId");
}

}  // namespace

auto administration_operations() -> std::vector<operation_spec> {
    return {
        // users
        {"users", "getAll",
         "SELECT * FROM users WHERE active = 1 ORDER BY full_name",
         {}, result_shape::many, accept_all},

        {"users", "getByUsername",
         "SELECT * FROM users WHERE username = ? AND active = 1",
         {"username"}, result_shape::one,
         [](const call_arguments& args, const validation_context&) {
             return has_text(args, "username");
         }},

        {"users", "create",
         "INSERT INTO users (username, full_name, email, role) VALUES (?, ?, ?, ?)",
         {"username", "fullName", "email", "role"}, result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_text(args, "username") && has_text(args, "fullName") &&
                    has_enum(args, "role", {"admin", "inspector", "reviewer", "viewer"});
         }},

        {"users", "updateLastLogin",
         "UPDATE users SET last_login = CURRENT_TIMESTAMP WHERE id = ?",
         {"id"}, result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "id");
         }},

        // auditLog
        {"auditLog", "create",
         R"(INSERT INTO audit_log (user_id, username, action, entity_type, entity_id,
                                   old_values, new_values, ip_address, user_agent)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?))",
         {"userId", "username", "action", "entityType", "entityId", "oldValues",
          "newValues", "ipAddress", "userAgent"},
         result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_text(args, "username") && has_text(args, "action") &&
                    has_entity(args);
         }},

        {"auditLog", "getByEntity",
         R"(SELECT * FROM audit_log
            WHERE entity_type = ? AND entity_id = ?
            ORDER BY timestamp DESC)",
         {"entityType", "entityId"}, result_shape::many,
         [](const call_arguments& args, const validation_context&) {
             return has_entity(args);
         }},

        {"auditLog", "getRecent",
         "SELECT * FROM audit_log ORDER BY timestamp DESC LIMIT ?",
         {"limit"}, result_shape::many,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "limit");
         }},
    };
}

}  // namespace equipdb::operations::catalog
