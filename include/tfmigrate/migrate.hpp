#pragma once

/**
 * @file migrate.hpp
 * @brief Per-resource migrators, their registry, and the migration driver
 */

#include "tfmigrate/common.hpp"
#include "tfmigrate/diagnostics.hpp"
#include "tfmigrate/hcl.hpp"
#include "tfmigrate/rules.hpp"
#include "tfmigrate/state.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace tfmigrate::migrate {

/**
 * @brief Shared state of one migration run over a unit or document
 */
struct MigrationContext
{
    hcl::File* unit = nullptr;                  ///< Set during the configuration pass
    state::StateDocument* document = nullptr;   ///< Set during the state pass
    std::vector<reclass::Diagnostic> diagnostics;
    std::size_t resources_migrated = 0;
};

/**
 * @brief Migration of one family of resource kinds
 */
class ResourceMigrator
{
public:
    virtual ~ResourceMigrator() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual bool can_handle(std::string_view kind) const = 0;

    /**
     * Transform one resource block of ctx.unit. The block may be removed from
     * the unit as a side effect and must not be used afterwards.
     */
    [[nodiscard]] virtual VoidResult transform_config(MigrationContext& ctx, hcl::Block& block) = 0;

    /**
     * Transform one entry of the state `resources` array in place.
     */
    [[nodiscard]] virtual VoidResult transform_state(MigrationContext& ctx,
                                                     nlohmann::ordered_json& resource) = 0;

    /**
     * Document-wide hook run before any resource is transformed.
     */
    [[nodiscard]] virtual VoidResult preprocess_state(MigrationContext& ctx,
                                                      state::StateDocument& document)
    {
        (void)ctx;
        (void)document;
        return {};
    }
};

class Registry
{
public:
    void add(std::unique_ptr<ResourceMigrator> migrator);

    /// First migrator that handles the kind, nullptr when none does
    [[nodiscard]] ResourceMigrator* find(std::string_view kind) const;

    [[nodiscard]] const std::vector<std::unique_ptr<ResourceMigrator>>& migrators() const noexcept
    {
        return m_migrators;
    }

    [[nodiscard]] std::vector<std::unique_ptr<ResourceMigrator>> take_migrators() noexcept
    {
        return std::move(m_migrators);
    }

private:
    std::vector<std::unique_ptr<ResourceMigrator>> m_migrators;
};

/**
 * Device profiles: the legacy unified kinds and both successor kinds
 */
[[nodiscard]] std::unique_ptr<ResourceMigrator> make_device_profile_migrator(
    reclass::MergeRules rules);

/**
 * Split tunnels: removed by the cross-resource merge
 */
[[nodiscard]] std::unique_ptr<ResourceMigrator> make_split_tunnel_migrator(
    reclass::MergeRules rules);

[[nodiscard]] Registry default_registry(const reclass::MergeRules& rules);

/**
 * Registry limited to the migrators handling at least one of @p kinds.
 * An empty list selects every migrator; a kind no migrator handles is an
 * InvalidArgument error.
 */
[[nodiscard]] Result<Registry> default_registry(const reclass::MergeRules& rules,
                                                const std::vector<std::string>& kinds);

/**
 * Migrate every resource of a configuration unit.
 *
 * Resource identities are snapshotted first; each one still present when its
 * turn comes is dispatched once.
 */
[[nodiscard]] VoidResult migrate_config(hcl::File& unit, const Registry& registry,
                                        MigrationContext& ctx);

/**
 * Run every preprocessing hook, then migrate each state resource.
 */
[[nodiscard]] VoidResult migrate_state(state::StateDocument& document, const Registry& registry,
                                       MigrationContext& ctx);

}  // namespace tfmigrate::migrate
