/**
 * @file database_session_test.cpp
 * @brief Tests of the startup sequence
 */

#include <catch2/catch_test_macros.hpp>

#include <equipdb/core/database_session.hpp>
#include <equipdb/storage/schema_migrations.hpp>

#include "support/test_helpers.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

using namespace equipdb;
using namespace equipdb::core;
using namespace std::string_literals;
using equipdb::test::query_int;
using equipdb::test::temp_directory;
using equipdb::test::write_text;

TEST_CASE("session_config resolves default locations", "[core][session]") {
    session_config config{.data_dir = "/var/lib/equipdb"};
    CHECK(config.resolved_database_path() == std::filesystem::path("/var/lib/equipdb/database.db"));
    CHECK(config.resolved_documents_dir() == std::filesystem::path("/var/lib/equipdb/documents"));

    config.database_path = "/data/custom.db";
    config.documents_dir = "/data/files";
    CHECK(config.resolved_database_path() == std::filesystem::path("/data/custom.db"));
    CHECK(config.resolved_documents_dir() == std::filesystem::path("/data/files"));
}

TEST_CASE("opening a session migrates a new database", "[core][session]") {
    temp_directory dir;
    session_config config{.data_dir = dir / "data"};

    auto opened = database_session::open(config);
    REQUIRE(opened.is_ok());
    auto& session = *opened.value();

    CHECK(std::filesystem::exists(dir / "data" / "database.db"));

    const auto& report = session.startup_report();
    CHECK(report.from_version == 0);
    CHECK(report.to_version == storage::application_schema_version);
    CHECK(report.migrated());
    CHECK(report.applied_versions == std::vector<int>{1, 2, 3, 4, 5});

    CHECK(storage::migration_manager::get_current_version(
              session.connection().native_handle()) == storage::application_schema_version);
    CHECK(session.documents().root() == dir / "data" / "documents");

    SECTION("the executor runs catalog operations") {
        auto created = session.executor().write("equipment", "create",
                                                {{"equipmentId", "HOIST-7"s},
                                                 {"type", "Hoist"s},
                                                 {"manufacturer", "Yale"s},
                                                 {"status", "active"s}});
        REQUIRE(created.is_ok());

        auto count = session.executor().query_scalar("equipment", "getCount");
        REQUIRE(count.is_ok());
        CHECK(std::get<std::int64_t>(*count.value()) == 1);
    }

    SECTION("document paths are confined to the managed directory") {
        CHECK(session.executor().context().managed_documents_dir ==
              std::filesystem::path(dir / "data" / "documents"));
    }
}

TEST_CASE("reopening a current database applies nothing", "[core][session]") {
    temp_directory dir;
    session_config config{.data_dir = dir.path()};

    {
        auto first = database_session::open(config);
        REQUIRE(first.is_ok());
        REQUIRE(first.value()
                    ->executor()
                    .write("users", "create",
                           {{"username", "admin"s}, {"fullName", "Admin"s}, {"role", "admin"s}})
                    .is_ok());
    }

    auto second = database_session::open(config);
    REQUIRE(second.is_ok());

    const auto& report = second.value()->startup_report();
    CHECK_FALSE(report.migrated());
    CHECK(report.from_version == storage::application_schema_version);
    CHECK_FALSE(report.backup_path.has_value());

    CHECK(query_int(second.value()->connection().native_handle(),
                    "SELECT COUNT(*) FROM users;") == 1);
}

TEST_CASE("startup prunes old backups", "[core][session]") {
    temp_directory dir;
    auto backups = dir / "backups";
    std::filesystem::create_directories(backups);
    for (int i = 0; i < 5; ++i) {
        write_text(backups / ("database-backup-2024-01-0" + std::to_string(i + 1) +
                              "T00-00-00-000Z.db"),
                   "old");
    }

    session_config config{.data_dir = dir.path(), .max_backups = 2};
    auto opened = database_session::open(config);
    REQUIRE(opened.is_ok());

    auto remaining = opened.value()->migrations().get_backup_info();
    CHECK(remaining.size() == 2);
}

TEST_CASE("a database that cannot be opened aborts startup", "[core][session]") {
    temp_directory dir;
    write_text(dir / "not-a-directory", "x");

    session_config config{.data_dir = dir / "not-a-directory"};
    auto opened = database_session::open(config);
    REQUIRE(opened.is_err());
    CHECK(opened.error().code == error_codes::database_open_error);
}
