/**
 * @file test_parity.cpp
 * @brief Configuration and state passes agree on equivalent inputs
 */

#include "tfmigrate/hcl.hpp"
#include "tfmigrate/orchestrate.hpp"
#include "tfmigrate/state.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace tfmigrate::reclass::test {

namespace {

constexpr std::string_view kConfig = R"(resource "cloudflare_zero_trust_device_profiles" "base" {
  account_id = "acc"
}

resource "cloudflare_zero_trust_device_profiles" "corp" {
  account_id = "acc"
  match      = "identity.email == \"a@example.com\""
  precedence = 10
}

resource "cloudflare_split_tunnel" "base_exclude" {
  account_id = "acc"
  tunnels {
    address     = "10.0.0.0/8"
    description = "private"
  }
  tunnels {
    description = "spacer"
  }
}

resource "cloudflare_split_tunnel" "corp_include" {
  account_id = "acc"
  policy_id  = cloudflare_zero_trust_device_profiles.corp.id
  mode       = "include"
  tunnels {
    host = "intranet.example.com"
  }
  tunnels {
    address = "192.168.0.0/16"
  }
}

resource "cloudflare_split_tunnel" "base_exclude_more" {
  account_id = "acc"
  mode       = "exclude"
  tunnels {
    address = "10.0.0.0/8"
    description = "private"
  }
  tunnels {
    address = "172.16.0.0/12"
  }
}
)";

constexpr std::string_view kState = R"({
  "version": 4,
  "terraform_version": "1.5.7",
  "resources": [
    {
      "mode": "managed",
      "type": "cloudflare_zero_trust_device_profiles",
      "name": "base",
      "instances": [{ "attributes": { "id": "acc", "account_id": "acc" } }]
    },
    {
      "mode": "managed",
      "type": "cloudflare_zero_trust_device_profiles",
      "name": "corp",
      "instances": [{ "attributes": { "id": "acc/corp", "account_id": "acc",
                                      "match": "identity.email == \"a@example.com\"", "precedence": 10 } }]
    },
    {
      "mode": "managed",
      "type": "cloudflare_split_tunnel",
      "name": "base_exclude",
      "instances": [{ "attributes": { "account_id": "acc", "mode": "exclude", "policy_id": "",
                                      "tunnels": [{ "address": "10.0.0.0/8", "description": "private", "host": "" },
                                                  { "address": "", "description": "spacer", "host": "" }] } }]
    },
    {
      "mode": "managed",
      "type": "cloudflare_split_tunnel",
      "name": "corp_include",
      "instances": [{ "attributes": { "account_id": "acc", "mode": "include", "policy_id": "corp",
                                      "tunnels": [{ "address": "", "description": "", "host": "intranet.example.com" },
                                                  { "address": "192.168.0.0/16", "description": "", "host": "" }] } }]
    },
    {
      "mode": "managed",
      "type": "cloudflare_split_tunnel",
      "name": "base_exclude_more",
      "instances": [{ "attributes": { "account_id": "acc", "mode": "exclude", "policy_id": null,
                                      "tunnels": [{ "address": "10.0.0.0/8", "description": "private", "host": null },
                                                  { "address": "172.16.0.0/12", "description": "", "host": "" }] } }]
    }
  ]
})";

nlohmann::ordered_json config_collection(hcl::File& unit, std::string_view name, std::string_view attribute)
{
    const hcl::Block* block = unit.find_resource("cloudflare_zero_trust_device_profiles", name);
    if (block == nullptr) {
        return nullptr;
    }
    auto value = block->body().attribute_value(attribute);
    return value ? to_json(*value) : nlohmann::ordered_json();
}

nlohmann::ordered_json state_collection(const state::StateDocument& document,
                                        std::size_t index,
                                        const char* attribute)
{
    const auto* attributes = state::instance_attributes(document.json["resources"][index]);
    if (attributes == nullptr || !attributes->contains(attribute)) {
        return nullptr;
    }
    return (*attributes)[attribute];
}

constexpr std::string_view kExplicitDefaultConfig = R"(resource "cloudflare_zero_trust_device_profiles" "base" {
  account_id = "acc"
  default    = true
  match      = "identity.email == \"a@example.com\""
  precedence = 5
}

resource "cloudflare_split_tunnel" "base_include" {
  account_id = "acc"
  mode       = "include"
  tunnels {
    address = "10.1.0.0/16"
  }
}
)";

constexpr std::string_view kExplicitDefaultState = R"({
  "version": 4,
  "resources": [
    {
      "mode": "managed",
      "type": "cloudflare_zero_trust_device_profiles",
      "name": "base",
      "instances": [{ "attributes": { "id": "acc", "account_id": "acc", "default": true,
                                      "match": "identity.email == \"a@example.com\"", "precedence": 5 } }]
    },
    {
      "mode": "managed",
      "type": "cloudflare_split_tunnel",
      "name": "base_include",
      "instances": [{ "attributes": { "account_id": "acc", "mode": "include", "policy_id": null,
                                      "tunnels": [{ "address": "10.1.0.0/16", "description": "", "host": "" }] } }]
    }
  ]
})";

}  // namespace

TEST(ParityTest, BothPassesProduceTheSameCollections)
{
    const MergeRules rules = split_tunnel_rules();

    auto unit = hcl::parse(kConfig, "main.tf");
    ASSERT_TRUE(unit) << unit.error().message;
    MergeReport config_report = merge_config_unit(*unit, rules);

    auto document = state::parse_state(kState);
    ASSERT_TRUE(document) << document.error().message;
    auto state_report = merge_state_document(*document, rules);
    ASSERT_TRUE(state_report) << state_report.error().message;

    EXPECT_TRUE(config_report.diagnostics.empty());
    EXPECT_TRUE(state_report->diagnostics.empty());
    EXPECT_EQ(config_report.entries_merged, state_report->entries_merged);
    EXPECT_EQ(config_report.satellites_removed, state_report->satellites_removed);
    ASSERT_EQ(document->json["resources"].size(), 2U);

    EXPECT_EQ(config_collection(*unit, "base", "exclude"), state_collection(*document, 0, "exclude"));
    EXPECT_EQ(config_collection(*unit, "base", "include"), state_collection(*document, 0, "include"));
    EXPECT_EQ(config_collection(*unit, "corp", "include"), state_collection(*document, 1, "include"));
    EXPECT_EQ(config_collection(*unit, "corp", "exclude"), state_collection(*document, 1, "exclude"));

    EXPECT_EQ(state_collection(*document, 0, "exclude"),
              nlohmann::ordered_json::parse(R"([
                {"address": "10.0.0.0/8", "description": "private"},
                {"address": "172.16.0.0/12"}
              ])"));
    EXPECT_EQ(state_collection(*document, 1, "include"),
              nlohmann::ordered_json::parse(R"([
                {"host": "intranet.example.com"},
                {"address": "192.168.0.0/16"}
              ])"));
}

TEST(ParityTest, ExplicitDefaultWinsOverRoutingFieldsOnBothPasses)
{
    const MergeRules rules = split_tunnel_rules();

    auto unit = hcl::parse(kExplicitDefaultConfig, "main.tf");
    ASSERT_TRUE(unit) << unit.error().message;
    MergeReport config_report = merge_config_unit(*unit, rules);

    auto document = state::parse_state(kExplicitDefaultState);
    ASSERT_TRUE(document) << document.error().message;
    auto state_report = merge_state_document(*document, rules);
    ASSERT_TRUE(state_report) << state_report.error().message;

    EXPECT_TRUE(config_report.diagnostics.empty());
    EXPECT_TRUE(state_report->diagnostics.empty());
    EXPECT_EQ(config_report.primaries_updated, 1U);
    EXPECT_EQ(state_report->primaries_updated, 1U);
    ASSERT_EQ(document->json["resources"].size(), 1U);

    const auto expected = nlohmann::ordered_json::parse(R"([{"address": "10.1.0.0/16"}])");
    EXPECT_EQ(config_collection(*unit, "base", "include"), expected);
    EXPECT_EQ(state_collection(*document, 0, "include"), expected);
}

}  // namespace tfmigrate::reclass::test
