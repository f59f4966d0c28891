/**
 * @file registry.cpp
 * @brief Migrator registry
 */

#include "tfmigrate/migrate.hpp"

#include <algorithm>
#include <format>

namespace tfmigrate::migrate {

void Registry::add(std::unique_ptr<ResourceMigrator> migrator)
{
    m_migrators.push_back(std::move(migrator));
}

ResourceMigrator* Registry::find(std::string_view kind) const
{
    for (const auto& migrator : m_migrators) {
        if (migrator->can_handle(kind)) {
            return migrator.get();
        }
    }
    return nullptr;
}

Registry default_registry(const reclass::MergeRules& rules)
{
    Registry registry;
    registry.add(make_device_profile_migrator(rules));
    registry.add(make_split_tunnel_migrator(rules));
    return registry;
}

Result<Registry> default_registry(const reclass::MergeRules& rules, const std::vector<std::string>& kinds)
{
    Registry all = default_registry(rules);
    if (kinds.empty()) {
        return all;
    }
    for (const auto& kind : kinds) {
        if (all.find(kind) == nullptr) {
            return std::unexpected(
                Error::make("InvalidArgument", std::format("No migrator handles resource kind: {}", kind)));
        }
    }

    Registry selected;
    for (auto& migrator : all.take_migrators()) {
        const bool wanted = std::ranges::any_of(
            kinds, [&migrator](const std::string& kind) { return migrator->can_handle(kind); });
        if (wanted) {
            selected.add(std::move(migrator));
        }
    }
    return selected;
}

}  // namespace tfmigrate::migrate
