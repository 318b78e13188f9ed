/**
 * @file value_validators_test.cpp
 * @brief Unit tests for argument value predicates
 */

#include <catch2/catch_test_macros.hpp>

#include <equipdb/security/value_validators.hpp>

#include <string>

using namespace equipdb::security;

TEST_CASE("is_valid_date", "[security][validators]") {
    SECTION("calendar dates in YYYY-MM-DD form") {
        CHECK(is_valid_date("2024-01-15"));
        CHECK(is_valid_date("2024-02-29"));
        CHECK(is_valid_date("1999-12-31"));
    }

    SECTION("impossible dates") {
        CHECK_FALSE(is_valid_date("2023-02-29"));
        CHECK_FALSE(is_valid_date("2024-13-01"));
        CHECK_FALSE(is_valid_date("2024-04-31"));
        CHECK_FALSE(is_valid_date("2024-00-10"));
    }

    SECTION("wrong shape") {
        CHECK_FALSE(is_valid_date(""));
        CHECK_FALSE(is_valid_date("2024-1-15"));
        CHECK_FALSE(is_valid_date("2024/01/15"));
        CHECK_FALSE(is_valid_date("15-01-2024"));
        CHECK_FALSE(is_valid_date("2024-01-15T10:00:00"));
        CHECK_FALSE(is_valid_date("20x4-01-15"));
    }
}

TEST_CASE("is_non_empty", "[security][validators]") {
    CHECK(is_non_empty("a"));
    CHECK(is_non_empty("  crane  "));
    CHECK_FALSE(is_non_empty(""));
    CHECK_FALSE(is_non_empty("   "));
    CHECK_FALSE(is_non_empty("\t\n"));
}

TEST_CASE("is_valid_identifier", "[security][validators]") {
    CHECK(is_valid_identifier("CR-001"));
    CHECK(is_valid_identifier("hoist_2.v1"));
    CHECK_FALSE(is_valid_identifier(""));
    CHECK_FALSE(is_valid_identifier("."));
    CHECK_FALSE(is_valid_identifier(".."));
    CHECK_FALSE(is_valid_identifier("a/b"));
    CHECK_FALSE(is_valid_identifier("a\\b"));
    CHECK_FALSE(is_valid_identifier("crane 01"));
    CHECK(is_valid_identifier(std::string(64, 'x')));
    CHECK_FALSE(is_valid_identifier(std::string(65, 'x')));
}

TEST_CASE("is_one_of is exact and case-sensitive", "[security][validators]") {
    static_assert(is_one_of("open", {"open", "closed"}));

    CHECK(is_one_of("out of service", {"active", "out of service"}));
    CHECK_FALSE(is_one_of("Active", {"active", "out of service"}));
    CHECK_FALSE(is_one_of("active ", {"active"}));
    CHECK_FALSE(is_one_of("", {"active"}));
}
