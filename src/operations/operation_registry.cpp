/**
 * @file operation_registry.cpp
 * @brief Implementation of the immutable operation catalog
 */

#include <equipdb/operations/operation_registry.hpp>

#include <equipdb/compat/format.hpp>
#include <equipdb/operations/operation_catalog.hpp>

#include <iterator>
#include <set>
#include <stdexcept>

namespace equipdb::operations {

// ============================================================================
// Construction
// ============================================================================

operation_registry::operation_registry(std::vector<operation_spec> specs)
    : specs_(std::move(specs)) {
    for (std::size_t i = 0; i < specs_.size(); ++i) {
        const auto& spec = specs_[i];

        if (spec.domain.empty() || spec.name.empty()) {
            throw std::logic_error(equipdb::compat::format(
                "Catalog entry {} has an empty domain or name", i));
        }
        if (!spec.validate) {
            throw std::logic_error(equipdb::compat::format(
                "Operation {} has no validator", spec.key()));
        }

        auto placeholders = count_placeholders(spec.statement);
        if (placeholders != spec.parameters.size()) {
            throw std::logic_error(equipdb::compat::format(
                "Operation {} has {} placeholders but {} parameters", spec.key(),
                placeholders, spec.parameters.size()));
        }

        auto [it, inserted] = index_.emplace(spec.key(), i);
        if (!inserted) {
            throw std::logic_error(
                equipdb::compat::format("Duplicate operation {}", spec.key()));
        }
    }
}

auto operation_registry::instance() -> const operation_registry& {
    static const operation_registry registry(catalog::application_catalog());
    return registry;
}

// ============================================================================
// Lookup
// ============================================================================

auto operation_registry::find(std::string_view domain, std::string_view name) const
    -> const operation_spec* {
    std::string key;
    key.reserve(domain.size() + name.size() + 1);
    key.append(domain).append(".").append(name);

    auto it = index_.find(key);
    return it == index_.end() ? nullptr : &specs_[it->second];
}

auto operation_registry::all() const noexcept -> const std::vector<operation_spec>& {
    return specs_;
}

auto operation_registry::size() const noexcept -> std::size_t {
    return specs_.size();
}

auto operation_registry::domains() const -> std::vector<std::string> {
    std::set<std::string> names;
    for (const auto& spec : specs_) {
        names.insert(spec.domain);
    }
    return {names.begin(), names.end()};
}

auto operation_registry::operations_in(std::string_view domain) const
    -> std::vector<const operation_spec*> {
    std::vector<const operation_spec*> result;
    for (const auto& spec : specs_) {
        if (spec.domain == domain) {
            result.push_back(&spec);
        }
    }
    return result;
}

// ============================================================================
// Application Catalog
// ============================================================================

namespace catalog {

auto application_catalog() -> std::vector<operation_spec> {
    std::vector<operation_spec> all;
    for (auto group : {equipment_operations, inspection_operations,
                       document_operations, compliance_operations,
                       maintenance_operations, qualification_operations,
                       administration_operations}) {
        auto specs = group();
        all.insert(all.end(), std::make_move_iterator(specs.begin()),
                   std::make_move_iterator(specs.end()));
    }
    return all;
}

}  // namespace catalog

}  // namespace equipdb::operations
