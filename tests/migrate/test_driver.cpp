#include "tfmigrate/hcl.hpp"
#include "tfmigrate/migrate.hpp"
#include "tfmigrate/state.hpp"

#include <memory>
#include <string>
#include <string_view>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace tfmigrate::migrate::test {

namespace {

class FailingMigrator final : public ResourceMigrator
{
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "failing"; }
    [[nodiscard]] bool can_handle(std::string_view kind) const override { return kind == "example_thing"; }

    [[nodiscard]] VoidResult transform_config(MigrationContext& ctx, hcl::Block& block) override
    {
        (void)ctx;
        (void)block;
        return std::unexpected(Error::make("Unsupported", "cannot migrate"));
    }

    [[nodiscard]] VoidResult transform_state(MigrationContext& ctx, nlohmann::ordered_json& resource) override
    {
        (void)ctx;
        (void)resource;
        return std::unexpected(Error::make("Unsupported", "cannot migrate"));
    }
};

}  // namespace

TEST(RegistryTest, FindsMigratorByKind)
{
    Registry registry = default_registry(reclass::split_tunnel_rules());
    ASSERT_EQ(registry.migrators().size(), 2U);

    ResourceMigrator* profiles = registry.find("cloudflare_device_settings_policy");
    ASSERT_NE(profiles, nullptr);
    EXPECT_EQ(profiles->name(), "device_profile");
    EXPECT_EQ(registry.find("cloudflare_zero_trust_device_custom_profile"), profiles);

    ResourceMigrator* tunnels = registry.find("cloudflare_split_tunnel");
    ASSERT_NE(tunnels, nullptr);
    EXPECT_EQ(tunnels->name(), "split_tunnel");

    EXPECT_EQ(registry.find("cloudflare_record"), nullptr);
}

TEST(RegistryTest, ResourceListSelectsMigrators)
{
    const auto rules = reclass::split_tunnel_rules();

    auto all = default_registry(rules, {});
    ASSERT_TRUE(all) << all.error().message;
    EXPECT_EQ(all->migrators().size(), 2U);

    auto profiles_only = default_registry(rules, {"cloudflare_zero_trust_device_profiles"});
    ASSERT_TRUE(profiles_only) << profiles_only.error().message;
    ASSERT_EQ(profiles_only->migrators().size(), 1U);
    EXPECT_NE(profiles_only->find("cloudflare_device_settings_policy"), nullptr);
    EXPECT_EQ(profiles_only->find("cloudflare_split_tunnel"), nullptr);
}

TEST(RegistryTest, UnknownResourceKindIsRejected)
{
    auto registry = default_registry(reclass::split_tunnel_rules(), {"cloudflare_split_tunnel", "cloudflare_record"});
    ASSERT_FALSE(registry);
    EXPECT_EQ(registry.error().code, "InvalidArgument");
    EXPECT_EQ(registry.error().message, "No migrator handles resource kind: cloudflare_record");
}

TEST(DriverTest, SatelliteOnlyUnitIsCleanedUp)
{
    auto unit = hcl::parse(R"(resource "cloudflare_record" "www" {
  name = "www"
}

resource "cloudflare_split_tunnel" "lonely" {
  policy_id = var.policy_id
}
)",
                           "tunnels.tf");
    ASSERT_TRUE(unit) << unit.error().message;

    MigrationContext ctx;
    Registry registry = default_registry(reclass::split_tunnel_rules());
    auto migrated = migrate_config(*unit, registry, ctx);
    ASSERT_TRUE(migrated) << migrated.error().message;

    ASSERT_EQ(ctx.diagnostics.size(), 1U);
    EXPECT_EQ(ctx.diagnostics[0].reason, reclass::DiagnosticReason::kUnparseableReference);
    EXPECT_EQ(ctx.unit, nullptr);

    std::string output = hcl::write(*unit);
    EXPECT_TRUE(output.starts_with("resource \"cloudflare_record\" \"www\" {\n  name = \"www\"\n}\n/** MIGRATION_WARNING:"));
    EXPECT_EQ(unit->resources().size(), 1U);
}

TEST(DriverTest, ConfigErrorsNameTheResource)
{
    auto unit = hcl::parse("resource \"example_thing\" \"one\" {\n}\n", "things.tf");
    ASSERT_TRUE(unit);

    Registry registry;
    registry.add(std::make_unique<FailingMigrator>());
    MigrationContext ctx;
    auto migrated = migrate_config(*unit, registry, ctx);
    ASSERT_FALSE(migrated);
    EXPECT_EQ(migrated.error().code, "Unsupported");
    EXPECT_EQ(migrated.error().message, "things.tf: example_thing.one: cannot migrate");
}

TEST(DriverTest, StateErrorsNameTheResource)
{
    auto document = state::parse_state(R"({"version": 4, "resources": [
      {"type": "example_thing", "name": "one", "instances": [{"attributes": {}}]}
    ]})");
    ASSERT_TRUE(document);

    Registry registry;
    registry.add(std::make_unique<FailingMigrator>());
    MigrationContext ctx;
    auto migrated = migrate_state(*document, registry, ctx);
    ASSERT_FALSE(migrated);
    EXPECT_EQ(migrated.error().message, "example_thing.one: cannot migrate");
}

TEST(DriverTest, StateWithoutResourcesFails)
{
    auto document = state::parse_state(R"({"version": 4})");
    ASSERT_TRUE(document);

    MigrationContext ctx;
    Registry registry = default_registry(reclass::split_tunnel_rules());
    auto migrated = migrate_state(*document, registry, ctx);
    ASSERT_FALSE(migrated);
    EXPECT_EQ(migrated.error().code, "InvalidState");
}

TEST(DriverTest, StateParseErrors)
{
    auto broken = state::parse_state("{ \"version\": ");
    ASSERT_FALSE(broken);
    EXPECT_EQ(broken.error().code, "StateParseError");

    auto array = state::parse_state("[]");
    ASSERT_FALSE(array);
    EXPECT_EQ(array.error().code, "InvalidState");
}

TEST(DriverTest, StateDumpKeepsKeyOrder)
{
    constexpr std::string_view kText = "{\n  \"version\": 4,\n  \"serial\": 3,\n  \"resources\": []\n}\n";
    auto document = state::parse_state(kText);
    ASSERT_TRUE(document);
    EXPECT_EQ(state::dump_state(*document), kText);
}

}  // namespace tfmigrate::migrate::test
