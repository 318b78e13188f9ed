/**
 * @file operation_registry_test.cpp
 * @brief Unit tests for operation_registry and the application catalog
 */

#include <catch2/catch_test_macros.hpp>

#include <equipdb/operations/argument_checks.hpp>
#include <equipdb/operations/operation_registry.hpp>

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace equipdb::operations;

namespace {

auto make_spec(std::string domain, std::string name, std::string statement,
               std::vector<std::string> parameters) -> operation_spec {
    return {std::move(domain), std::move(name), std::move(statement),
            std::move(parameters), result_shape::many, checks::accept_all};
}

/// Every operation the application catalog must expose, per domain
auto expected_catalog() -> std::map<std::string, std::vector<std::string>> {
    return {
        {"equipment", {"getAll", "getById", "getByEquipmentId", "create", "update", "delete",
                       "getDistinctTypes", "getStatusCounts", "getCount"}},
        {"inspections", {"getAll", "getByEquipmentId", "create", "createFromScheduled",
                         "getByScheduledId", "getByDateRange", "getCount", "getPerMonth",
                         "getLastInspectionByEquipment", "getRecentFailures",
                         "getComplianceStatus", "getOverdue"}},
        {"documents", {"getByEquipmentId", "create", "checkExisting"}},
        {"scheduledInspections", {"getAll", "getUpcoming", "getTodayAndLater", "create",
                                  "update", "updateStatus", "delete"}},
        {"compliance", {"getAllStandards", "createStandard", "deleteStandard",
                        "getAssignedStandards", "assignStandard", "unassignStandard",
                        "getComplianceReport"}},
        {"templates", {"getAll", "save", "delete"}},
        {"inspectionItems", {"getByInspectionId", "create", "update", "delete",
                             "getCriticalFailures"}},
        {"deficiencies", {"getAll", "getByEquipmentId", "getByStatus", "create", "update",
                          "close", "getOpenCritical", "getOverdue",
                          "createFromInspectionItem", "linkToWorkOrder"}},
        {"signatures", {"getByEntity", "create", "delete"}},
        {"workOrders", {"getAll", "getByStatus", "getByEquipmentId", "create", "update",
                        "updateStatus", "complete", "getDueToday", "getOverdue"}},
        {"pmTemplates", {"getAll", "getByEquipmentType", "create", "update", "deactivate"}},
        {"pmSchedules", {"getByEquipmentId", "getDue", "create", "updateDue", "getTotal",
                         "getOverdue"}},
        {"loadTests", {"getByEquipmentId", "getDue", "create", "getLastByEquipment",
                       "getTotal", "getOverdue"}},
        {"calibrations", {"getByEquipmentId", "getDue", "create", "getTotal", "getOverdue"}},
        {"credentials", {"getAll", "getByPerson", "getExpiring", "create", "updateStatus",
                         "getTotal"}},
        {"users", {"getAll", "getByUsername", "create", "updateLastLogin"}},
        {"auditLog", {"create", "getByEntity", "getRecent"}},
        {"certificates", {"getByEquipmentId", "getByCertificateNumber", "getExpiring",
                          "create", "updateStatus", "getTotal"}},
        {"meterReadings", {"getByEquipmentId", "getLatestByEquipment", "create"}},
        {"templateItems", {"getByTemplateId", "create", "update", "delete"}},
    };
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("operation_registry indexes its entries", "[operations][registry]") {
    operation_registry registry({
        make_spec("equipment", "getAll", "SELECT * FROM equipment", {}),
        make_spec("equipment", "getById", "SELECT * FROM equipment WHERE id = ?", {"id"}),
        make_spec("documents", "getByEquipmentId",
                  "SELECT * FROM documents WHERE equipment_id = ?", {"equipmentId"}),
    });

    CHECK(registry.size() == 3);
    CHECK(registry.domains() == std::vector<std::string>{"documents", "equipment"});

    const auto* spec = registry.find("equipment", "getById");
    REQUIRE(spec != nullptr);
    CHECK(spec->parameters == std::vector<std::string>{"id"});

    CHECK(registry.find("equipment", "drop") == nullptr);
    CHECK(registry.find("equipment.getById", "") == nullptr);
    CHECK(registry.find("EQUIPMENT", "getAll") == nullptr);

    auto in_equipment = registry.operations_in("equipment");
    REQUIRE(in_equipment.size() == 2);
    CHECK(in_equipment[0]->name == "getAll");
    CHECK(in_equipment[1]->name == "getById");
    CHECK(registry.operations_in("nothing").empty());
}

TEST_CASE("operation_registry refuses malformed catalogs", "[operations][registry]") {
    SECTION("duplicate key") {
        CHECK_THROWS_AS(operation_registry({
                            make_spec("equipment", "getAll", "SELECT 1", {}),
                            make_spec("equipment", "getAll", "SELECT 2", {}),
                        }),
                        std::logic_error);
    }

    SECTION("fewer parameters than placeholders") {
        CHECK_THROWS_AS(operation_registry({make_spec(
                            "equipment", "getById", "SELECT * FROM equipment WHERE id = ?", {})}),
                        std::logic_error);
    }

    SECTION("more parameters than placeholders") {
        CHECK_THROWS_AS(operation_registry({make_spec("equipment", "getAll",
                                                      "SELECT * FROM equipment", {"id"})}),
                        std::logic_error);
    }

    SECTION("missing validator") {
        auto spec = make_spec("equipment", "getAll", "SELECT * FROM equipment", {});
        spec.validate = nullptr;
        CHECK_THROWS_AS(operation_registry({spec}), std::logic_error);
    }

    SECTION("empty domain or name") {
        CHECK_THROWS_AS(operation_registry({make_spec("", "getAll", "SELECT 1", {})}),
                        std::logic_error);
        CHECK_THROWS_AS(operation_registry({make_spec("equipment", "", "SELECT 1", {})}),
                        std::logic_error);
    }
}

// ============================================================================
// Application Catalog
// ============================================================================

TEST_CASE("the application catalog exposes every operation", "[operations][registry][catalog]") {
    const auto& registry = operation_registry::instance();
    auto expected = expected_catalog();

    std::size_t expected_count = 0;
    std::vector<std::string> expected_domains;
    for (const auto& [domain, names] : expected) {
        expected_domains.push_back(domain);
        expected_count += names.size();
        for (const auto& name : names) {
            INFO(domain << "." << name);
            CHECK(registry.find(domain, name) != nullptr);
        }
    }

    CHECK(registry.domains() == expected_domains);
    CHECK(registry.size() == expected_count);
}

TEST_CASE("application catalog entries are well formed", "[operations][registry][catalog]") {
    const auto& registry = operation_registry::instance();

    for (const auto& spec : registry.all()) {
        INFO(spec.key());
        CHECK(count_placeholders(spec.statement) == spec.parameters.size());
        CHECK(static_cast<bool>(spec.validate));
        CHECK_FALSE(spec.statement.empty());
    }
}

TEST_CASE("catalog result shapes follow the statement kind", "[operations][registry][catalog]") {
    const auto& registry = operation_registry::instance();

    CHECK(registry.find("equipment", "getAll")->shape == result_shape::many);
    CHECK(registry.find("equipment", "getById")->shape == result_shape::one);
    CHECK(registry.find("equipment", "getCount")->shape == result_shape::scalar);
    CHECK(registry.find("equipment", "create")->shape == result_shape::write);
    CHECK(registry.find("documents", "checkExisting")->shape == result_shape::one);

    for (const auto& spec : registry.all()) {
        INFO(spec.key());
        auto first_word = spec.statement.substr(0, spec.statement.find_first_of(" \n"));
        if (first_word == "SELECT") {
            CHECK(spec.shape != result_shape::write);
        } else {
            CHECK(spec.shape == result_shape::write);
        }
    }
}

TEST_CASE("catalog validators reject empty argument bags where input is required",
          "[operations][registry][catalog]") {
    const auto& registry = operation_registry::instance();
    validation_context context;

    for (const auto& spec : registry.all()) {
        if (spec.parameters.empty()) {
            INFO(spec.key());
            CHECK(spec.validate({}, context));
        }
    }

    for (const auto* key : {"create", "update", "delete"}) {
        for (const auto* spec : registry.operations_in("equipment")) {
            if (spec->name == key) {
                INFO(spec->key());
                CHECK_FALSE(spec->validate({}, context));
            }
        }
    }
}
