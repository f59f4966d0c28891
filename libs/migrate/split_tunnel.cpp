/**
 * @file split_tunnel.cpp
 * @brief Split tunnel migrator
 *
 * Split tunnels have no successor kind. Their entries move into device
 * profiles through the cross-resource merge, which also removes them.
 */

#include "tfmigrate/migrate.hpp"

#include "tfmigrate/orchestrate.hpp"

namespace tfmigrate::migrate {

namespace {

class SplitTunnelMigrator final : public ResourceMigrator
{
public:
    explicit SplitTunnelMigrator(reclass::MergeRules rules)
        : m_rules(std::move(rules))
    {}

    [[nodiscard]] std::string_view name() const noexcept override { return "split_tunnel"; }

    [[nodiscard]] bool can_handle(std::string_view kind) const override
    {
        return kind == m_rules.satellite.kind;
    }

    [[nodiscard]] VoidResult transform_config(MigrationContext& ctx, hcl::Block& block) override
    {
        (void)block;  // removed by the merge below
        if (ctx.unit != nullptr) {
            auto report = reclass::merge_config_unit(*ctx.unit, m_rules);
            ctx.diagnostics.insert(ctx.diagnostics.end(), report.diagnostics.begin(),
                                   report.diagnostics.end());
        }
        return {};
    }

    [[nodiscard]] VoidResult transform_state(MigrationContext& ctx,
                                             nlohmann::ordered_json& resource) override
    {
        (void)ctx;
        (void)resource;
        return {};
    }

    [[nodiscard]] VoidResult preprocess_state(MigrationContext& ctx,
                                              state::StateDocument& document) override
    {
        auto report = reclass::merge_state_document(document, m_rules);
        if (!report) {
            return std::unexpected(report.error());
        }
        ctx.diagnostics.insert(ctx.diagnostics.end(), report->diagnostics.begin(),
                               report->diagnostics.end());
        return {};
    }

private:
    reclass::MergeRules m_rules;
};

}  // namespace

std::unique_ptr<ResourceMigrator> make_split_tunnel_migrator(reclass::MergeRules rules)
{
    return std::make_unique<SplitTunnelMigrator>(std::move(rules));
}

}  // namespace tfmigrate::migrate
