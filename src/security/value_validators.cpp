/**
 * @file value_validators.cpp
 * @brief Implementation of argument value predicates
 */

#include <equipdb/security/value_validators.hpp>

#include <cctype>
#include <chrono>

namespace equipdb::security {

namespace {

[[nodiscard]] auto parse_digits(std::string_view text, int& out) -> bool {
    int value = 0;
    for (char c : text) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

}  // namespace

auto is_valid_date(std::string_view value) -> bool {
    if (value.size() != 10 || value[4] != '-' || value[7] != '-') {
        return false;
    }

    int year = 0;
    int month = 0;
    int day = 0;
    if (!parse_digits(value.substr(0, 4), year) ||
        !parse_digits(value.substr(5, 2), month) ||
        !parse_digits(value.substr(8, 2), day)) {
        return false;
    }

    std::chrono::year_month_day date{
        std::chrono::year{year},
        std::chrono::month{static_cast<unsigned>(month)},
        std::chrono::day{static_cast<unsigned>(day)}};
    return date.ok();
}

auto is_non_empty(std::string_view value) noexcept -> bool {
    for (char c : value) {
        if (std::isspace(static_cast<unsigned char>(c)) == 0) {
            return true;
        }
    }
    return false;
}

auto is_valid_identifier(std::string_view value) noexcept -> bool {
    if (value.empty() || value.size() > 64 || value == "." || value == "..") {
        return false;
    }
    for (char c : value) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) == 0 && c != '.' && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

}  // namespace equipdb::security
