/**
 * @file catalog_operations_test.cpp
 * @brief Application catalog operations against a fully migrated database
 */

#include <catch2/catch_test_macros.hpp>

#include <equipdb/operations/operation_executor.hpp>
#include <equipdb/operations/operation_registry.hpp>
#include <equipdb/storage/database_connection.hpp>
#include <equipdb/storage/migration_manager.hpp>
#include <equipdb/storage/schema_migrations.hpp>

#include "support/test_helpers.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>

using namespace equipdb;
using namespace equipdb::operations;
using namespace std::string_literals;
using equipdb::storage::database_connection;
using equipdb::test::query_int;

namespace {

class migrated_database {
public:
    migrated_database() {
        auto opened = database_connection::open({.path = ":memory:"});
        REQUIRE(opened.is_ok());
        db_ = std::move(opened.value());

        storage::migration_manager manager(storage::migration_config{});
        REQUIRE(manager
                    .run_migrations(*db_, storage::application_migrations(),
                                    storage::application_schema_version)
                    .is_ok());
    }

    [[nodiscard]] auto connection() -> database_connection& { return *db_; }

private:
    std::unique_ptr<database_connection> db_;
};

auto crane(std::string equipment_id) -> call_arguments {
    return {{"equipmentId", std::move(equipment_id)},
            {"type", "Overhead Crane"s},
            {"manufacturer", "Konecranes"s},
            {"model", "CXT"s},
            {"capacity", 10.0},
            {"location", "Bay 3"s},
            {"status", "active"s}};
}

auto create_equipment(const operation_executor& executor, std::string equipment_id)
    -> std::int64_t {
    auto created = executor.write("equipment", "create", crane(std::move(equipment_id)));
    REQUIRE(created.is_ok());
    return created.value().inserted_id;
}

}  // namespace

TEST_CASE("every catalog statement prepares against the migrated schema",
          "[operations][catalog][schema]") {
    migrated_database fixture;
    auto* handle = fixture.connection().native_handle();
    const auto& registry = operation_registry::instance();
    REQUIRE(registry.size() > 0);

    for (const auto& spec : registry.all()) {
        INFO(spec.key());
        sqlite3_stmt* stmt = nullptr;
        auto rc = sqlite3_prepare_v2(handle, spec.statement.c_str(), -1, &stmt, nullptr);
        INFO(sqlite3_errmsg(handle));
        CHECK(rc == SQLITE_OK);
        CHECK(stmt != nullptr);
        CHECK(sqlite3_bind_parameter_count(stmt) ==
              static_cast<int>(spec.parameters.size()));
        sqlite3_finalize(stmt);
    }
}

TEST_CASE("equipment lifecycle", "[operations][catalog]") {
    migrated_database fixture;
    operation_executor executor(fixture.connection());

    auto id = create_equipment(executor, "CR-001");
    CHECK(id > 0);

    auto by_id = executor.query_one("equipment", "getById", {{"id", id}});
    REQUIRE(by_id.is_ok());
    REQUIRE(by_id.value().has_value());
    CHECK(by_id.value()->get_text("equipment_id") == "CR-001"s);
    CHECK(std::get<double>(*by_id.value()->find("capacity")) == 10.0);

    auto by_key = executor.query_one("equipment", "getByEquipmentId",
                                     {{"equipmentId", "CR-001"s}});
    REQUIRE(by_key.is_ok());
    REQUIRE(by_key.value().has_value());
    CHECK(by_key.value()->get_int("id") == id);

    SECTION("update and status counts") {
        create_equipment(executor, "CR-002");

        auto updated = executor.write("equipment", "update",
                                      {{"id", id},
                                       {"manufacturer", "Demag"s},
                                       {"status", "under maintenance"s}});
        REQUIRE(updated.is_ok());
        CHECK(updated.value().rows_affected == 1);

        auto counts = executor.query_many("equipment", "getStatusCounts");
        REQUIRE(counts.is_ok());
        std::map<std::string, std::int64_t> by_status;
        for (const auto& r : counts.value()) {
            by_status[r.get_text("status").value_or("")] = r.get_int("count").value_or(0);
        }
        CHECK(by_status == std::map<std::string, std::int64_t>{{"active", 1},
                                                                {"under maintenance", 1}});

        auto count = executor.query_scalar("equipment", "getCount");
        REQUIRE(count.is_ok());
        CHECK(std::get<std::int64_t>(*count.value()) == 2);
    }

    SECTION("invalid status is rejected") {
        auto* handle = fixture.connection().native_handle();
        auto before = query_int(handle, "SELECT COUNT(*) FROM equipment;");

        auto args = crane("CR-003");
        args["status"] = "retired"s;
        auto result = executor.write("equipment", "create", args);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::validation_failed);

        CHECK(query_int(handle, "SELECT COUNT(*) FROM equipment;") == before);
        CHECK(query_int(handle,
                        "SELECT COUNT(*) FROM equipment WHERE equipment_id = 'CR-003';") == 0);
    }

    SECTION("duplicate equipment identifier") {
        auto result = executor.write("equipment", "create", crane("CR-001"));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::unique_violation);
    }

    SECTION("delete") {
        auto deleted = executor.write("equipment", "delete", {{"id", id}});
        REQUIRE(deleted.is_ok());
        CHECK(deleted.value().rows_affected == 1);

        auto gone = executor.query_one("equipment", "getById", {{"id", id}});
        REQUIRE(gone.is_ok());
        CHECK_FALSE(gone.value().has_value());
    }
}

TEST_CASE("inspections by date range", "[operations][catalog]") {
    migrated_database fixture;
    operation_executor executor(fixture.connection());
    auto equipment = create_equipment(executor, "CR-010");

    for (const char* date : {"2024-01-15", "2024-03-02", "2024-07-30"}) {
        auto created = executor.write("inspections", "create",
                                      {{"equipmentId", equipment},
                                       {"inspector", "J. Smith"s},
                                       {"inspectionDate", std::string(date)},
                                       {"findings", "No defects"s}});
        REQUIRE(created.is_ok());
    }

    auto in_range = executor.query_many("inspections", "getByDateRange",
                                        {{"startDate", "2024-02-01"s},
                                         {"endDate", "2024-06-30"s}});
    REQUIRE(in_range.is_ok());
    REQUIRE(in_range.value().size() == 1);
    CHECK(in_range.value()[0].get_text("inspection_date_date") == "2024-03-02"s);

    auto count = executor.query_scalar("inspections", "getCount");
    REQUIRE(count.is_ok());
    CHECK(std::get<std::int64_t>(*count.value()) == 3);

    SECTION("an impossible date never reaches the table") {
        auto result = executor.write("inspections", "create",
                                     {{"equipmentId", equipment},
                                      {"inspector", "J. Smith"s},
                                      {"inspectionDate", "2024-02-30"s}});
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::validation_failed);
    }

    SECTION("unknown equipment") {
        auto result = executor.write("inspections", "create",
                                     {{"equipmentId", std::int64_t{9999}},
                                      {"inspector", "J. Smith"s},
                                      {"inspectionDate", "2024-02-01"s}});
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::foreign_key_violation);
    }
}

TEST_CASE("document references", "[operations][catalog]") {
    migrated_database fixture;
    validation_context context;
    context.managed_documents_dir = std::filesystem::path("/srv/equipdb/documents");
    context.require_managed_path = true;
    operation_executor executor(fixture.connection(), context);

    auto equipment = create_equipment(executor, "CR-020");
    call_arguments doc{{"equipmentId", equipment},
                       {"fileName", "load-test.pdf"s},
                       {"filePath", "/srv/equipdb/documents/CR-020/load-test.pdf"s},
                       {"hash", "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"s},
                       {"size", std::int64_t{2048}}};

    REQUIRE(executor.write("documents", "create", doc).is_ok());

    auto existing = executor.query_one("documents", "checkExisting",
                                       {{"equipmentId", equipment},
                                        {"fileName", "load-test.pdf"s}});
    REQUIRE(existing.is_ok());
    CHECK(existing.value().has_value());

    auto listed = executor.query_many("documents", "getByEquipmentId",
                                      {{"equipmentId", equipment}});
    REQUIRE(listed.is_ok());
    REQUIRE(listed.value().size() == 1);
    CHECK(listed.value()[0].get_int("size") == std::int64_t{2048});

    SECTION("paths outside the managed directory") {
        auto outside = doc;
        outside["filePath"] = "/home/user/load-test.pdf"s;
        auto result = executor.write("documents", "create", outside);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::validation_failed);
    }

    SECTION("zero size") {
        auto empty = doc;
        empty["size"] = std::int64_t{0};
        CHECK(executor.write("documents", "create", empty).is_err());
    }
}

TEST_CASE("document paths under the default policy", "[operations][catalog][security]") {
    migrated_database fixture;
    operation_executor executor(fixture.connection());
    auto* handle = fixture.connection().native_handle();

    auto equipment = create_equipment(executor, "CR-021");
    auto document = [&](std::string path) -> call_arguments {
        return {{"equipmentId", equipment},
                {"fileName", "certificate.pdf"s},
                {"filePath", std::move(path)},
                {"hash", "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"s},
                {"size", std::int64_t{512}}};
    };

    SECTION("traversal is rejected before the database is touched") {
        auto result = executor.write("documents", "create", document("../../etc/passwd"));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::validation_failed);
        CHECK(query_int(handle, "SELECT COUNT(*) FROM documents;") == 0);
    }

    SECTION("system directories are rejected") {
        for (const auto* path : {"/etc/passwd", "C:/Windows/System32/config/SAM"}) {
            INFO(path);
            auto result = executor.write("documents", "create", document(path));
            REQUIRE(result.is_err());
            CHECK(result.error().code == error_codes::validation_failed);
        }
        CHECK(query_int(handle, "SELECT COUNT(*) FROM documents;") == 0);
    }

    SECTION("an ordinary absolute path is stored") {
        auto result = executor.write("documents", "create", document("/abs/safe/path.pdf"));
        REQUIRE(result.is_ok());
        CHECK(result.value().rows_affected == 1);
        CHECK(query_int(handle, "SELECT COUNT(*) FROM documents "
                                "WHERE file_path = '/abs/safe/path.pdf';") == 1);
    }
}

TEST_CASE("open critical deficiencies", "[operations][catalog]") {
    migrated_database fixture;
    operation_executor executor(fixture.connection());
    auto equipment = create_equipment(executor, "CR-030");

    auto raise = [&](const char* severity, const char* status) {
        return executor.write("deficiencies", "create",
                              {{"equipmentId", equipment},
                               {"severity", std::string(severity)},
                               {"removeFromService", std::int64_t{0}},
                               {"description", "Worn hoist rope"s},
                               {"status", std::string(status)}});
    };

    REQUIRE(raise("critical", "open").is_ok());
    REQUIRE(raise("critical", "closed").is_ok());
    REQUIRE(raise("minor", "open").is_ok());

    auto critical = executor.query_many("deficiencies", "getOpenCritical");
    REQUIRE(critical.is_ok());
    REQUIRE(critical.value().size() == 1);
    CHECK(critical.value()[0].get_text("equipment_identifier") == "CR-030"s);

    auto invalid = raise("catastrophic", "open");
    REQUIRE(invalid.is_err());
    CHECK(invalid.error().code == error_codes::validation_failed);
}

TEST_CASE("users and the audit log", "[operations][catalog]") {
    migrated_database fixture;
    operation_executor executor(fixture.connection());

    auto user = executor.write("users", "create",
                               {{"username", "jsmith"s},
                                {"fullName", "Jane Smith"s},
                                {"role", "inspector"s}});
    REQUIRE(user.is_ok());

    CHECK(executor
              .write("users", "create",
                     {{"username", "root"s}, {"fullName", "Root"s}, {"role", "superuser"s}})
              .error()
              .code == error_codes::validation_failed);

    CHECK(executor
              .write("users", "create",
                     {{"username", "jsmith"s}, {"fullName", "Other"s}, {"role", "viewer"s}})
              .error()
              .code == error_codes::unique_violation);

    auto found = executor.query_one("users", "getByUsername", {{"username", "jsmith"s}});
    REQUIRE(found.is_ok());
    REQUIRE(found.value().has_value());
    CHECK(found.value()->get_text("role") == "inspector"s);

    for (std::int64_t entity = 1; entity <= 3; ++entity) {
        REQUIRE(executor
                    .write("auditLog", "create",
                           {{"userId", user.value().inserted_id},
                            {"username", "jsmith"s},
                            {"action", "update"s},
                            {"entityType", "equipment"s},
                            {"entityId", entity}})
                    .is_ok());
    }

    auto recent = executor.query_many("auditLog", "getRecent", {{"limit", std::int64_t{2}}});
    REQUIRE(recent.is_ok());
    CHECK(recent.value().size() == 2);

    CHECK(executor.query_many("auditLog", "getRecent", {{"limit", std::int64_t{0}}})
              .error()
              .code == error_codes::validation_failed);
}
