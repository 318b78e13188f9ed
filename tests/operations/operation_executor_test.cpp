/**
 * @file operation_executor_test.cpp
 * @brief Unit tests for operation_executor
 */

#include <catch2/catch_test_macros.hpp>

#include <equipdb/integration/logger_adapter.hpp>
#include <equipdb/operations/argument_checks.hpp>
#include <equipdb/operations/operation_executor.hpp>
#include <equipdb/storage/database_connection.hpp>

#include "support/test_helpers.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace equipdb;
using namespace equipdb::operations;
using namespace std::string_literals;
using equipdb::integration::logger_adapter;
using equipdb::integration::logger_config;
using equipdb::storage::database_connection;
using equipdb::test::query_int;
using equipdb::test::read_text;
using equipdb::test::temp_directory;

// ============================================================================
// Test Utilities
// ============================================================================

namespace {

auto parts_catalog() -> std::vector<operation_spec> {
    using namespace checks;
    return {
        {"parts", "getAll", "SELECT * FROM parts ORDER BY id", {}, result_shape::many,
         accept_all},
        {"parts", "getById", "SELECT * FROM parts WHERE id = ?", {"id"}, result_shape::one,
         [](const call_arguments& args, const validation_context&) {
             return has_positive_id(args, "id");
         }},
        {"parts", "getCount", "SELECT COUNT(*) AS count FROM parts", {},
         result_shape::scalar, accept_all},
        {"parts", "getCodeById", "SELECT code FROM parts WHERE id = ?", {"id"},
         result_shape::scalar, accept_all},
        {"parts", "create",
         "INSERT INTO parts (code, qty, weight, note, data, kind_id) VALUES (?, ?, ?, ?, ?, ?)",
         {"code", "qty", "weight", "note", "data", "kindId"}, result_shape::write,
         [](const call_arguments& args, const validation_context&) {
             return has_text(args, "code");
         }},
        {"parts", "rename", "UPDATE parts SET code = ? WHERE id = ?", {"code", "id"},
         result_shape::write, accept_all},
        {"parts", "deleteAll", "DELETE FROM parts", {}, result_shape::write, accept_all},
        {"parts", "echoTwice", "SELECT ? AS first, ? AS second", {"value", "value"},
         result_shape::one, accept_all},
        {"parts", "broken", "SELECT * FROM no_such_table", {}, result_shape::many,
         accept_all},
        {"kinds", "create", "INSERT INTO kinds (id, name) VALUES (?, ?)", {"id", "name"},
         result_shape::write, accept_all},
        {"files", "create", "INSERT INTO files (file_path) VALUES (?)", {"filePath"},
         result_shape::write,
         [](const call_arguments& args, const validation_context& context) {
             return has_safe_path(args, "filePath", context);
         }},
    };
}

auto parts_registry() -> const operation_registry& {
    static const operation_registry registry(parts_catalog());
    return registry;
}

/// In-memory database with the parts schema
class parts_database {
public:
    parts_database() {
        auto opened = database_connection::open({.path = ":memory:"});
        REQUIRE(opened.is_ok());
        db_ = std::move(opened.value());
        REQUIRE(db_->execute(R"(
            CREATE TABLE kinds (id INTEGER PRIMARY KEY, name TEXT);
            CREATE TABLE parts (
                id      INTEGER PRIMARY KEY AUTOINCREMENT,
                code    TEXT NOT NULL UNIQUE,
                qty     INTEGER CHECK (qty IS NULL OR qty >= 0),
                weight  REAL,
                note    TEXT,
                data    BLOB,
                kind_id INTEGER REFERENCES kinds(id)
            );
            CREATE TABLE files (id INTEGER PRIMARY KEY, file_path TEXT);
        )").is_ok());
    }

    [[nodiscard]] auto connection() -> database_connection& { return *db_; }
    [[nodiscard]] auto handle() const -> sqlite3* { return db_->native_handle(); }

private:
    std::unique_ptr<database_connection> db_;
};

}  // namespace

// ============================================================================
// Failure Classification
// ============================================================================

TEST_CASE("classify_sqlite_error maps extended codes", "[operations][executor]") {
    CHECK(classify_sqlite_error(SQLITE_CONSTRAINT_UNIQUE) ==
          execution_failure_kind::unique_violation);
    CHECK(classify_sqlite_error(SQLITE_CONSTRAINT_PRIMARYKEY) ==
          execution_failure_kind::unique_violation);
    CHECK(classify_sqlite_error(SQLITE_CONSTRAINT_FOREIGNKEY) ==
          execution_failure_kind::foreign_key_violation);
    CHECK(classify_sqlite_error(SQLITE_CONSTRAINT_NOTNULL) ==
          execution_failure_kind::constraint_violation);
    CHECK(classify_sqlite_error(SQLITE_CONSTRAINT_CHECK) ==
          execution_failure_kind::constraint_violation);
    CHECK(classify_sqlite_error(SQLITE_ERROR) == execution_failure_kind::statement_error);
    CHECK(classify_sqlite_error(SQLITE_RANGE) == execution_failure_kind::statement_error);
    CHECK(classify_sqlite_error(SQLITE_BUSY) == execution_failure_kind::connection_error);
    CHECK(classify_sqlite_error(SQLITE_IOERR_READ) == execution_failure_kind::connection_error);
    CHECK(classify_sqlite_error(SQLITE_READONLY) == execution_failure_kind::connection_error);
    CHECK(classify_sqlite_error(SQLITE_FULL) == execution_failure_kind::other);

    CHECK(to_error_code(execution_failure_kind::unique_violation) ==
          error_codes::unique_violation);
    CHECK(to_error_code(execution_failure_kind::other) == error_codes::execution_failed);
    CHECK(to_string(execution_failure_kind::foreign_key_violation) == "foreign_key_violation");
}

// ============================================================================
// Gatekeeping
// ============================================================================

TEST_CASE("unknown operations are refused", "[operations][executor]") {
    parts_database fixture;
    operation_executor executor(fixture.connection(), parts_registry());

    auto result = executor.execute("parts", "dropTable");
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::unknown_operation);
    CHECK(result.error().message == "Unknown operation: parts.dropTable");

    auto typed = executor.query_many("nothing", "getAll");
    REQUIRE(typed.is_err());
    CHECK(typed.error().code == error_codes::unknown_operation);
}

TEST_CASE("rejected arguments never reach the database", "[operations][executor]") {
    parts_database fixture;
    operation_executor executor(fixture.connection(), parts_registry());

    SECTION("missing required text") {
        auto result = executor.execute("parts", "create", {{"qty", std::int64_t{1}}});
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::validation_failed);
        CHECK(result.error().message.find("Validation failed for parts.create") !=
              std::string::npos);
        CHECK(result.error().message.find("qty=1") != std::string::npos);
    }

    SECTION("wrong argument type") {
        auto result = executor.execute("parts", "getById", {{"id", "1"s}});
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::validation_failed);
    }

    CHECK(query_int(fixture.handle(), "SELECT COUNT(*) FROM parts;") == 0);
}

TEST_CASE("unsafe file paths are rejected before execution", "[operations][executor]") {
    parts_database fixture;

    SECTION("default policy") {
        operation_executor executor(fixture.connection(), parts_registry());

        auto traversal = executor.execute("files", "create", {{"filePath", "../../etc/passwd"s}});
        REQUIRE(traversal.is_err());
        CHECK(traversal.error().code == error_codes::validation_failed);

        auto system = executor.execute("files", "create", {{"filePath", "/etc/shadow"s}});
        REQUIRE(system.is_err());
        CHECK(system.error().code == error_codes::validation_failed);

        auto safe = executor.write("files", "create", {{"filePath", "/abs/safe/path.pdf"s}});
        REQUIRE(safe.is_ok());
        CHECK(safe.value().rows_affected == 1);
        CHECK(query_int(fixture.handle(), "SELECT COUNT(*) FROM files;") == 1);
    }

    SECTION("managed documents directory required") {
        validation_context context;
        context.managed_documents_dir = std::filesystem::path("/srv/equipdb/documents");
        context.require_managed_path = true;
        operation_executor executor(fixture.connection(), parts_registry(), context);

        CHECK(executor.context().require_managed_path);
        CHECK(executor.execute("files", "create", {{"filePath", "/abs/safe/path.pdf"s}})
                  .is_err());
        CHECK(executor
                  .execute("files", "create",
                           {{"filePath", "/srv/equipdb/documents/CR-1/cert.pdf"s}})
                  .is_ok());
        CHECK(query_int(fixture.handle(), "SELECT COUNT(*) FROM files;") == 1);
    }
}

// ============================================================================
// Result Shapes
// ============================================================================

TEST_CASE("execute returns the declared shape", "[operations][executor]") {
    parts_database fixture;
    operation_executor executor(fixture.connection(), parts_registry());

    auto created = executor.execute(
        "parts", "create",
        {{"code", "A-1"s}, {"qty", std::int64_t{4}}, {"weight", 2.5}, {"note", "spare"s},
         {"data", blob{0x01, 0x02, 0x03}}});
    REQUIRE(created.is_ok());
    REQUIRE(std::holds_alternative<write_result>(created.value()));
    auto written = std::get<write_result>(created.value());
    CHECK(written.inserted_id == 1);
    CHECK(written.rows_affected == 1);

    REQUIRE(executor.write("parts", "create", {{"code", "B-2"s}}).is_ok());

    SECTION("many") {
        auto rows = executor.query_many("parts", "getAll");
        REQUIRE(rows.is_ok());
        REQUIRE(rows.value().size() == 2);
        CHECK(rows.value()[0].get_text("code") == "A-1"s);
        CHECK(rows.value()[1].get_text("code") == "B-2"s);
    }

    SECTION("one, with every value type") {
        auto found = executor.query_one("parts", "getById", {{"id", std::int64_t{1}}});
        REQUIRE(found.is_ok());
        REQUIRE(found.value().has_value());

        const auto& r = *found.value();
        CHECK(r.get_int("id") == std::int64_t{1});
        CHECK(r.get_int("qty") == std::int64_t{4});
        CHECK(std::get<double>(*r.find("weight")) == 2.5);
        CHECK(r.get_text("note") == "spare"s);
        CHECK(std::get<blob>(*r.find("data")) == blob{0x01, 0x02, 0x03});
        CHECK(is_null(*r.find("kind_id")));
    }

    SECTION("one, absent") {
        auto missing = executor.query_one("parts", "getById", {{"id", std::int64_t{99}}});
        REQUIRE(missing.is_ok());
        CHECK_FALSE(missing.value().has_value());
    }

    SECTION("scalar") {
        auto count = executor.query_scalar("parts", "getCount");
        REQUIRE(count.is_ok());
        REQUIRE(count.value().has_value());
        CHECK(std::get<std::int64_t>(*count.value()) == 2);

        auto none = executor.query_scalar("parts", "getCodeById", {{"id", std::int64_t{42}}});
        REQUIRE(none.is_ok());
        CHECK_FALSE(none.value().has_value());
    }

    SECTION("write reports affected rows") {
        auto deleted = executor.write("parts", "deleteAll");
        REQUIRE(deleted.is_ok());
        CHECK(deleted.value().rows_affected == 2);
    }
}

TEST_CASE("missing arguments bind as NULL", "[operations][executor]") {
    parts_database fixture;
    operation_executor executor(fixture.connection(), parts_registry());

    REQUIRE(executor.write("parts", "create", {{"code", "C-3"s}}).is_ok());

    auto found = executor.query_one("parts", "getById", {{"id", std::int64_t{1}}});
    REQUIRE(found.is_ok());
    REQUIRE(found.value().has_value());
    for (const char* column : {"qty", "weight", "note", "data", "kind_id"}) {
        INFO(column);
        REQUIRE(found.value()->find(column) != nullptr);
        CHECK(is_null(*found.value()->find(column)));
    }

    SECTION("a parameter name used twice binds the same value") {
        auto echoed = executor.query_one("parts", "echoTwice", {{"value", std::int64_t{7}}});
        REQUIRE(echoed.is_ok());
        REQUIRE(echoed.value().has_value());
        CHECK(echoed.value()->get_int("first") == std::int64_t{7});
        CHECK(echoed.value()->get_int("second") == std::int64_t{7});
    }

    SECTION("an empty blob is stored as a zero-length blob") {
        REQUIRE(executor.write("parts", "create", {{"code", "D-4"s}, {"data", blob{}}}).is_ok());
        CHECK(query_int(fixture.handle(),
                        "SELECT COUNT(*) FROM parts WHERE code = 'D-4' AND data IS NOT NULL "
                        "AND length(data) = 0;") == 1);
    }
}

TEST_CASE("typed access refuses a different shape", "[operations][executor]") {
    parts_database fixture;
    operation_executor executor(fixture.connection(), parts_registry());

    auto as_rows = executor.query_many("parts", "create", {{"code", "E-5"s}});
    REQUIRE(as_rows.is_err());
    CHECK(as_rows.error().code == error_codes::result_shape_mismatch);
    // The statement did not run
    CHECK(query_int(fixture.handle(), "SELECT COUNT(*) FROM parts;") == 0);

    CHECK(executor.write("parts", "getAll").error().code == error_codes::result_shape_mismatch);
    CHECK(executor.query_one("parts", "getCount").error().code ==
          error_codes::result_shape_mismatch);
    CHECK(executor.query_scalar("parts", "getAll").error().code ==
          error_codes::result_shape_mismatch);
}

// ============================================================================
// Execution Failures
// ============================================================================

TEST_CASE("execution failures are classified", "[operations][executor]") {
    parts_database fixture;
    operation_executor executor(fixture.connection(), parts_registry());

    REQUIRE(executor.write("kinds", "create", {{"id", std::int64_t{1}}, {"name", "bolt"s}})
                .is_ok());
    REQUIRE(executor.write("parts", "create", {{"code", "A-1"s}, {"kindId", std::int64_t{1}}})
                .is_ok());

    SECTION("unique constraint") {
        auto result = executor.write("parts", "create", {{"code", "A-1"s}});
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::unique_violation);
        CHECK(result.error().message.find("parts.create failed (unique_violation)") !=
              std::string::npos);
    }

    SECTION("primary key") {
        auto result = executor.write("kinds", "create", {{"id", std::int64_t{1}}, {"name", "nut"s}});
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::unique_violation);
    }

    SECTION("foreign key") {
        auto result =
            executor.write("parts", "create", {{"code", "B-2"s}, {"kindId", std::int64_t{99}}});
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::foreign_key_violation);
    }

    SECTION("check constraint") {
        auto result =
            executor.write("parts", "create", {{"code", "C-3"s}, {"qty", std::int64_t{-1}}});
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::constraint_violation);
    }

    SECTION("not null constraint through a missing argument") {
        auto result = executor.write("parts", "rename", {{"id", std::int64_t{1}}});
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::constraint_violation);
    }

    SECTION("statement that cannot be prepared") {
        auto result = executor.query_many("parts", "broken");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::statement_error);
    }

    SECTION("closed connection") {
        REQUIRE(fixture.connection().close().is_ok());
        auto result = executor.query_many("parts", "getAll");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::connection_error);
    }

    // Failed writes leave the table as it was
    if (fixture.connection().is_open()) {
        CHECK(query_int(fixture.handle(), "SELECT COUNT(*) FROM parts;") == 1);
    }
}

// ============================================================================
// Audit Trail
// ============================================================================

TEST_CASE("rejections are recorded in the audit trail", "[operations][executor][audit]") {
    temp_directory logs("equipdb_executor_audit");
    logger_config config;
    config.log_directory = logs.path();
    config.enable_console = false;
    config.async_mode = false;
    logger_adapter::initialize(config);

    {
        parts_database fixture;
        operation_executor executor(fixture.connection(), parts_registry());

        (void)executor.execute("parts", "dropTable");
        (void)executor.execute("parts", "create", {});
        (void)executor.execute("files", "create", {{"filePath", "../../etc/passwd"s}});
    }

    logger_adapter::flush();
    logger_adapter::shutdown();

    auto audit = read_text(logs.path() / "audit.json");
    CHECK(audit.find("\"security_event\":\"unknown_operation\"") != std::string::npos);
    CHECK(audit.find("\"subject\":\"parts.dropTable\"") != std::string::npos);
    CHECK(audit.find("\"security_event\":\"validation_rejected\"") != std::string::npos);
    CHECK(audit.find("\"security_event\":\"unsafe_path_rejected\"") != std::string::npos);
    CHECK(audit.find("\"outcome\":\"rejected\"") != std::string::npos);
}

// ============================================================================
// Application Catalog
// ============================================================================

TEST_CASE("the default executor serves the application catalog", "[operations][executor]") {
    parts_database fixture;
    operation_executor executor(fixture.connection());

    CHECK(&executor.registry() == &operation_registry::instance());
    CHECK(executor.registry().find("equipment", "create") != nullptr);
    CHECK(executor.execute("parts", "getAll").error().code == error_codes::unknown_operation);
}
