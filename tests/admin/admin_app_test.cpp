/**
 * @file admin_app_test.cpp
 * @brief Database file transfer of equipdb_admin
 */

#include <catch2/catch_test_macros.hpp>

#include "admin_app.hpp"

#include <equipdb/storage/database_connection.hpp>
#include <equipdb/storage/migration_manager.hpp>
#include <equipdb/storage/schema_migrations.hpp>

#include "support/test_helpers.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

using namespace equipdb;
using namespace equipdb::admin;
using equipdb::test::query_int;
using equipdb::test::read_bytes;
using equipdb::test::temp_directory;
using equipdb::test::write_text;

namespace {

auto open_database(const std::filesystem::path& path)
    -> std::unique_ptr<storage::database_connection> {
    auto opened = storage::database_connection::open({.path = path});
    if (opened.is_err()) {
        throw std::runtime_error(opened.error().message);
    }
    return std::move(opened.value());
}

/// Fully migrated database at @p path holding @p equipment_count rows
void make_equipment_database(const std::filesystem::path& path, int equipment_count) {
    auto db = open_database(path);
    storage::migration_manager manager(storage::migration_config::for_database(path));
    REQUIRE(manager
                .run_migrations(*db, storage::application_migrations(),
                                storage::application_schema_version)
                .is_ok());
    for (int i = 0; i < equipment_count; ++i) {
        auto sql = "INSERT INTO equipment (equipment_id, status) VALUES ('CR-" +
                   std::to_string(i) + "', 'active');";
        REQUIRE(db->execute(sql).is_ok());
    }
}

auto equipment_count(const std::filesystem::path& path) -> std::int64_t {
    auto db = open_database(path);
    return query_int(db->native_handle(), "SELECT COUNT(*) FROM equipment;");
}

auto backup_count(const std::filesystem::path& dir) -> std::size_t {
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        return 0;
    }
    std::size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.path().filename().string().rfind("database-backup-", 0) == 0) {
            ++count;
        }
    }
    return count;
}

auto app_for(const temp_directory& dir) -> admin_app {
    admin_config config;
    config.data_dir = dir.path();
    config.command = "restore";
    return admin_app{config};
}

}  // namespace

TEST_CASE("import_database replaces the live database", "[admin][restore]") {
    temp_directory dir;
    auto live = dir / "database.db";
    auto source = dir / "incoming.db";
    make_equipment_database(live, 1);
    make_equipment_database(source, 3);

    auto app = app_for(dir);
    auto result = app.import_database(source);
    REQUIRE(result.is_ok());

    CHECK(equipment_count(live) == 3);
    // The replaced database was snapshotted first
    CHECK(backup_count(dir / "backups") >= 1);
}

TEST_CASE("import_database migrates an older source", "[admin][restore]") {
    temp_directory dir;
    auto live = dir / "database.db";
    auto source = dir / "old.db";
    make_equipment_database(live, 1);
    {
        auto db = open_database(source);
        storage::migration_manager manager(storage::migration_config::for_database(source));
        REQUIRE(manager.run_migrations(*db, storage::application_migrations(), 2).is_ok());
    }

    auto app = app_for(dir);
    REQUIRE(app.import_database(source).is_ok());

    auto db = open_database(live);
    auto version = storage::migration_manager::get_current_version(db->native_handle());
    REQUIRE(version.is_ok());
    CHECK(version.value() == storage::application_schema_version);
    CHECK(query_int(db->native_handle(), "SELECT COUNT(*) FROM equipment;") == 0);
}

TEST_CASE("import_database leaves the live database untouched on a bad source",
          "[admin][restore]") {
    temp_directory dir;
    auto live = dir / "database.db";
    make_equipment_database(live, 2);
    auto before = read_bytes(live);
    auto backups_before = backup_count(dir / "backups");
    auto app = app_for(dir);

    SECTION("a text file") {
        auto source = dir / "notes.txt";
        write_text(source, "This is not a database, just some notes about crane CR-001.\n");

        auto result = app.import_database(source);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::database_copy_error);
    }

    SECTION("a database from a newer release") {
        auto source = dir / "future.db";
        {
            auto db = open_database(source);
            REQUIRE(db->execute("CREATE TABLE schema_version (version INTEGER PRIMARY KEY);"
                                "INSERT INTO schema_version VALUES (99);")
                        .is_ok());
        }

        auto result = app.import_database(source);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::database_copy_error);
    }

    SECTION("a missing file") {
        auto result = app.import_database(dir / "missing.db");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::database_copy_error);
    }

    CHECK(read_bytes(live) == before);
    CHECK(backup_count(dir / "backups") == backups_before);
    CHECK(equipment_count(live) == 2);
}

TEST_CASE("import_database puts the previous database back when migration fails",
          "[admin][restore]") {
    temp_directory dir;
    auto live = dir / "database.db";
    auto source = dir / "partial.db";
    make_equipment_database(live, 2);

    // Version 1 on record but without the tables version 2 alters
    {
        auto db = open_database(source);
        storage::migration_manager manager(storage::migration_config::for_database(source));
        storage::migration_set partial{
            {1, "Equipment only",
             [](sqlite3* handle) {
                 return storage::execute_sql(
                     handle, "CREATE TABLE equipment (id INTEGER PRIMARY KEY);");
             }},
        };
        REQUIRE(manager.run_migrations(*db, partial, 1).is_ok());
    }

    auto app = app_for(dir);
    auto result = app.import_database(source);
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::migration_step_failed);

    CHECK(equipment_count(live) == 2);
    auto db = open_database(live);
    auto version = storage::migration_manager::get_current_version(db->native_handle());
    REQUIRE(version.is_ok());
    CHECK(version.value() == storage::application_schema_version);
}
