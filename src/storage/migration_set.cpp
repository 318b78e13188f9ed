/**
 * @file migration_set.cpp
 * @brief Implementation of the migration step collection
 */

#include <equipdb/storage/migration_set.hpp>

#include <equipdb/compat/format.hpp>

#include <stdexcept>

namespace equipdb::storage {

migration_set::migration_set(std::initializer_list<migration_step> steps) {
    for (const auto& step : steps) {
        add(step);
    }
}

migration_set::migration_set(std::vector<migration_step> steps) {
    for (auto& step : steps) {
        add(std::move(step));
    }
}

void migration_set::add(migration_step step) {
    if (step.version <= 0) {
        throw std::invalid_argument(equipdb::compat::format(
            "Migration version must be positive, got {}", step.version));
    }
    if (!step.apply) {
        throw std::invalid_argument(equipdb::compat::format(
            "Migration {} has no procedure", step.version));
    }

    auto version = step.version;
    auto [it, inserted] = steps_.emplace(version, std::move(step));
    if (!inserted) {
        throw std::invalid_argument(equipdb::compat::format(
            "Duplicate migration version {}", version));
    }
}

auto migration_set::find(int version) const -> const migration_step* {
    auto it = steps_.find(version);
    return it == steps_.end() ? nullptr : &it->second;
}

auto migration_set::latest_version() const noexcept -> int {
    return steps_.empty() ? 0 : steps_.rbegin()->first;
}

auto migration_set::size() const noexcept -> std::size_t { return steps_.size(); }

auto migration_set::empty() const noexcept -> bool { return steps_.empty(); }

auto migration_set::versions() const -> std::vector<int> {
    std::vector<int> result;
    result.reserve(steps_.size());
    for (const auto& [version, step] : steps_) {
        result.push_back(version);
    }
    return result;
}

}  // namespace equipdb::storage
