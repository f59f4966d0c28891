/**
 * @file driver.cpp
 * @brief Dispatch of configuration and state resources to their migrators
 */

#include "tfmigrate/migrate.hpp"

#include <format>
#include <utility>

namespace tfmigrate::migrate {

namespace {

struct Identity
{
    std::string kind;
    std::string name;
};

}  // namespace

VoidResult migrate_config(hcl::File& unit, const Registry& registry, MigrationContext& ctx)
{
    ctx.unit = &unit;

    std::vector<Identity> identities;
    for (const hcl::Block* block : std::as_const(unit).resources()) {
        identities.push_back(Identity{.kind = std::string(block->resource_kind()),
                                      .name = std::string(block->resource_name())});
    }

    for (const auto& identity : identities) {
        hcl::Block* block = unit.find_resource(identity.kind, identity.name);
        if (block == nullptr) {
            continue;  // removed by an earlier migrator
        }
        ResourceMigrator* migrator = registry.find(identity.kind);
        if (migrator == nullptr) {
            continue;
        }
        auto transformed = migrator->transform_config(ctx, *block);
        if (!transformed) {
            return std::unexpected(Error::make(
                transformed.error().code,
                std::format("{}: {}.{}: {}", unit.filename(), identity.kind, identity.name,
                            transformed.error().message)));
        }
    }

    ctx.unit = nullptr;
    return {};
}

VoidResult migrate_state(state::StateDocument& document, const Registry& registry,
                         MigrationContext& ctx)
{
    ctx.document = &document;

    for (const auto& migrator : registry.migrators()) {
        auto prepared = migrator->preprocess_state(ctx, document);
        if (!prepared) {
            return std::unexpected(prepared.error());
        }
    }

    auto resources = state::resources(document);
    if (!resources) {
        return std::unexpected(resources.error());
    }
    for (auto& resource : **resources) {
        const std::string kind = state::string_field(resource, "type");
        ResourceMigrator* migrator = registry.find(kind);
        if (migrator == nullptr) {
            continue;
        }
        auto transformed = migrator->transform_state(ctx, resource);
        if (!transformed) {
            return std::unexpected(Error::make(
                transformed.error().code,
                std::format("{}.{}: {}", kind, state::string_field(resource, "name"),
                            transformed.error().message)));
        }
    }

    ctx.document = nullptr;
    return {};
}

}  // namespace tfmigrate::migrate
