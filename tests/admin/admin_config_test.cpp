/**
 * @file admin_config_test.cpp
 * @brief Command line parsing of equipdb_admin
 */

#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdint>
#include <string>
#include <vector>

using namespace equipdb;
using namespace equipdb::admin;
using namespace std::string_literals;

namespace {

/// argv built from string literals, with the program name prepended
class arguments {
public:
    arguments(std::initializer_list<std::string> args) : storage_{"equipdb_admin"} {
        storage_.insert(storage_.end(), args.begin(), args.end());
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }

    [[nodiscard]] auto parse() -> std::optional<admin_config> {
        return admin_config::parse_args(static_cast<int>(storage_.size()), pointers_.data());
    }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

}  // namespace

TEST_CASE("parse_args defaults", "[admin][config]") {
    auto config = arguments{}.parse();
    REQUIRE(config.has_value());

    CHECK(config->data_dir == std::filesystem::path("./equipdb-data"));
    CHECK_FALSE(config->db_path.has_value());
    CHECK_FALSE(config->log_dir.has_value());
    CHECK(config->log_level == "info");
    CHECK(config->max_backups == 10);
    CHECK_FALSE(config->wal_mode);
    CHECK(config->command == "migrate");
    CHECK(config->command_args.empty());
}

TEST_CASE("parse_args options and command", "[admin][config]") {
    auto config = arguments{"--data-dir", "/var/lib/equipdb", "--db-path", "/tmp/e.db",
                            "--log-dir",  "/var/log/equipdb", "--log-level", "debug",
                            "--max-backups", "3", "--wal",
                            "exec", "equipment", "getById", "id=1", "--wal"}
                      .parse();
    REQUIRE(config.has_value());

    CHECK(config->data_dir == std::filesystem::path("/var/lib/equipdb"));
    CHECK(config->db_path == std::filesystem::path("/tmp/e.db"));
    CHECK(config->log_dir == std::filesystem::path("/var/log/equipdb"));
    CHECK(config->log_level == "debug");
    CHECK(config->max_backups == 3);
    CHECK(config->wal_mode);
    CHECK(config->command == "exec");
    // Everything after the command belongs to it
    CHECK(config->command_args ==
          std::vector<std::string>{"equipment", "getById", "id=1", "--wal"});
}

TEST_CASE("parse_args rejects bad input", "[admin][config]") {
    CHECK_FALSE(arguments{"--help"}.parse().has_value());
    CHECK_FALSE(arguments{"-h"}.parse().has_value());
    CHECK_FALSE(arguments{"--data-dir"}.parse().has_value());
    CHECK_FALSE(arguments{"--max-backups", "many"}.parse().has_value());
    CHECK_FALSE(arguments{"--verbose"}.parse().has_value());
}

TEST_CASE("parse_call_value types exec values", "[admin][config]") {
    CHECK(std::holds_alternative<std::monostate>(parse_call_value("null")));
    CHECK(parse_call_value("42") == operations::db_value{std::int64_t{42}});
    CHECK(parse_call_value("-7") == operations::db_value{std::int64_t{-7}});
    CHECK(parse_call_value("10.5") == operations::db_value{10.5});
    CHECK(parse_call_value("CR-001") == operations::db_value{"CR-001"s});
    CHECK(parse_call_value("2025-01-05") == operations::db_value{"2025-01-05"s});
    CHECK(parse_call_value("0x1A") == operations::db_value{"0x1A"s});
    CHECK(parse_call_value("") == operations::db_value{""s});
}

TEST_CASE("parse_call_arguments builds an argument bag", "[admin][config]") {
    auto args = parse_call_arguments(
        {"id=3", "equipmentId:=001", "status=out of service", "note=a=b", "location=null"});
    REQUIRE(args.has_value());

    CHECK(args->at("id") == operations::db_value{std::int64_t{3}});
    CHECK(args->at("equipmentId") == operations::db_value{"001"s});
    CHECK(args->at("status") == operations::db_value{"out of service"s});
    CHECK(args->at("note") == operations::db_value{"a=b"s});
    CHECK(operations::is_null(args->at("location")));

    CHECK(parse_call_arguments({})->empty());

    SECTION("malformed tokens") {
        CHECK_FALSE(parse_call_arguments({"id"}).has_value());
        CHECK_FALSE(parse_call_arguments({"=3"}).has_value());
        CHECK_FALSE(parse_call_arguments({":=3"}).has_value());
    }
}
