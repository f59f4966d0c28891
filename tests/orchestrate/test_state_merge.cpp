/**
 * @file test_state_merge.cpp
 * @brief Cross-resource merge over state documents
 */

#include "tfmigrate/orchestrate.hpp"
#include "tfmigrate/state.hpp"

#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace tfmigrate::reclass::test {

namespace {

using nlohmann::ordered_json;

ordered_json make_resource(const std::string& type, const std::string& name, ordered_json attributes)
{
    return ordered_json{
        {"mode", "managed"},
        {"type", type},
        {"name", name},
        {"provider", "provider[\"registry.terraform.io/cloudflare/cloudflare\"]"},
        {"instances", ordered_json::array({ordered_json{{"schema_version", 0}, {"attributes", attributes}}})},
    };
}

ordered_json tunnel(const std::string& address, const std::string& description = "")
{
    return ordered_json{{"address", address}, {"description", description}, {"host", ""}};
}

state::StateDocument make_document(ordered_json resources)
{
    return state::StateDocument{
        .json = ordered_json{{"version", 4},
                             {"terraform_version", "1.5.7"},
                             {"serial", 12},
                             {"lineage", "c0ffee"},
                             {"outputs", ordered_json::object()},
                             {"resources", std::move(resources)}},
        .merge_applied = false,
    };
}

const ordered_json& attributes_of(const state::StateDocument& document, std::size_t index)
{
    return document.json["resources"][index]["instances"][0]["attributes"];
}

}  // namespace

TEST(StateMergeTest, DefaultProfileCollectsUnreferencedTunnels)
{
    state::StateDocument document = make_document(ordered_json::array({
        make_resource("cloudflare_zero_trust_device_profiles", "default",
                      ordered_json{{"id", "acc"}, {"account_id", "acc"}, {"default", true}}),
        make_resource("cloudflare_split_tunnel", "inc",
                      ordered_json{{"account_id", "acc"},
                                   {"mode", "include"},
                                   {"policy_id", nullptr},
                                   {"tunnels", ordered_json::array({tunnel("10.0.0.0/8")})}}),
        make_resource("cloudflare_split_tunnel", "exc",
                      ordered_json{{"account_id", "acc"},
                                   {"mode", "exclude"},
                                   {"tunnels", ordered_json::array({tunnel("192.168.0.0/16", "lan")})}}),
    }));

    auto report = merge_state_document(document, split_tunnel_rules());
    ASSERT_TRUE(report) << report.error().message;
    EXPECT_TRUE(report->diagnostics.empty());
    EXPECT_EQ(report->satellites_removed, 2U);
    EXPECT_EQ(report->primaries_updated, 1U);

    ASSERT_EQ(document.json["resources"].size(), 1U);
    const ordered_json& attributes = attributes_of(document, 0);
    EXPECT_EQ(attributes["include"], ordered_json::parse(R"([{"address": "10.0.0.0/8"}])"));
    EXPECT_EQ(attributes["exclude"],
              ordered_json::parse(R"([{"address": "192.168.0.0/16", "description": "lan"}])"));

    EXPECT_EQ(document.json["terraform_version"], "1.5.7");
    EXPECT_EQ(document.json["lineage"], "c0ffee");
    EXPECT_EQ(document.json.begin().key(), "version");
}

TEST(StateMergeTest, PolicyIdSelectsCustomProfile)
{
    state::StateDocument document = make_document(ordered_json::array({
        make_resource("cloudflare_device_settings_policy", "corp",
                      ordered_json{{"id", "acc/pol-1"}, {"match", "any"}, {"precedence", 10}}),
        make_resource("cloudflare_zero_trust_device_custom_profile", "eng",
                      ordered_json{{"id", "acc/x"}, {"policy_id", "pol-2"}, {"match", "any"}, {"precedence", 20}}),
        make_resource("cloudflare_split_tunnel", "corp_exclude",
                      ordered_json{{"policy_id", "pol-1"}, {"mode", "exclude"},
                                   {"tunnels", ordered_json::array({tunnel("10.0.0.0/8")})}}),
        make_resource("cloudflare_split_tunnel", "eng_include",
                      ordered_json{{"policy_id", "pol-2"}, {"mode", "include"},
                                   {"tunnels", ordered_json::array({tunnel("172.16.0.0/12")})}}),
    }));

    auto report = merge_state_document(document, split_tunnel_rules());
    ASSERT_TRUE(report) << report.error().message;
    EXPECT_TRUE(report->diagnostics.empty());
    ASSERT_EQ(document.json["resources"].size(), 2U);

    const ordered_json& corp = attributes_of(document, 0);
    EXPECT_EQ(corp["exclude"], ordered_json::parse(R"([{"address": "10.0.0.0/8"}])"));
    EXPECT_FALSE(corp.contains("include"));

    const ordered_json& eng = attributes_of(document, 1);
    EXPECT_EQ(eng["include"], ordered_json::parse(R"([{"address": "172.16.0.0/12"}])"));
    EXPECT_FALSE(eng.contains("exclude"));
}

TEST(StateMergeTest, KeyIsEverythingAfterTheAccountInId)
{
    state::StateDocument document = make_document(ordered_json::array({
        make_resource("cloudflare_device_settings_policy", "corp",
                      ordered_json{{"id", "acc/pol/3"}, {"match", "any"}, {"precedence", 10}}),
        make_resource("cloudflare_split_tunnel", "corp_exclude",
                      ordered_json{{"policy_id", "pol/3"}, {"mode", "exclude"},
                                   {"tunnels", ordered_json::array({tunnel("10.0.0.0/8")})}}),
    }));

    auto report = merge_state_document(document, split_tunnel_rules());
    ASSERT_TRUE(report) << report.error().message;
    EXPECT_TRUE(report->diagnostics.empty());
    ASSERT_EQ(document.json["resources"].size(), 1U);
    EXPECT_EQ(attributes_of(document, 0)["exclude"], ordered_json::parse(R"([{"address": "10.0.0.0/8"}])"));
}

TEST(StateMergeTest, UnmatchedTunnelsAreRemovedWithDiagnostics)
{
    state::StateDocument document = make_document(ordered_json::array({
        make_resource("cloudflare_zero_trust_device_custom_profile", "corp",
                      ordered_json{{"id", "acc/pol-1"}, {"match", "any"}, {"precedence", 10}}),
        make_resource("cloudflare_split_tunnel", "missing",
                      ordered_json{{"policy_id", "pol-9"},
                                   {"tunnels", ordered_json::array({tunnel("10.0.0.0/8")})}}),
        make_resource("cloudflare_split_tunnel", "odd",
                      ordered_json{{"policy_id", 42}, {"tunnels", ordered_json::array({tunnel("10.0.0.0/8")})}}),
        make_resource("cloudflare_split_tunnel", "no_default",
                      ordered_json{{"tunnels", ordered_json::array({tunnel("10.0.0.0/8")})}}),
    }));

    auto report = merge_state_document(document, split_tunnel_rules());
    ASSERT_TRUE(report) << report.error().message;
    ASSERT_EQ(report->diagnostics.size(), 3U);
    EXPECT_EQ(report->diagnostics[0].reason, DiagnosticReason::kTargetNotFound);
    EXPECT_EQ(report->diagnostics[0].satellite, "missing");
    EXPECT_EQ(report->diagnostics[0].subject, "pol-9");
    EXPECT_EQ(report->diagnostics[1].reason, DiagnosticReason::kUnparseableReference);
    EXPECT_EQ(report->diagnostics[2].reason, DiagnosticReason::kNoDefaultTarget);
    EXPECT_NE(report->diagnostics[2].excerpt.find("\"no_default\""), std::string::npos);

    ASSERT_EQ(document.json["resources"].size(), 1U);
    EXPECT_EQ(document.json["resources"][0]["name"], "corp");
    EXPECT_FALSE(attributes_of(document, 0).contains("exclude"));
}

TEST(StateMergeTest, ExistingCollectionIsExtended)
{
    state::StateDocument document = make_document(ordered_json::array({
        make_resource("cloudflare_zero_trust_device_default_profile", "base",
                      ordered_json{{"exclude", ordered_json::parse(R"([{"address": "100.64.0.0/10"}])")}}),
        make_resource("cloudflare_split_tunnel", "more",
                      ordered_json{{"mode", ""},
                                   {"tunnels", ordered_json::array({tunnel("100.64.0.0/10"), tunnel("10.0.0.0/8")})}}),
    }));

    auto report = merge_state_document(document, split_tunnel_rules());
    ASSERT_TRUE(report) << report.error().message;
    EXPECT_EQ(report->entries_merged, 1U);
    EXPECT_EQ(attributes_of(document, 0)["exclude"],
              ordered_json::parse(R"([{"address": "100.64.0.0/10"}, {"address": "10.0.0.0/8"}])"));
}

TEST(StateMergeTest, SecondRunIsSkipped)
{
    state::StateDocument document = make_document(ordered_json::array({
        make_resource("cloudflare_split_tunnel", "alone", ordered_json{{"mode", "include"}}),
    }));
    const MergeRules rules = split_tunnel_rules();

    auto first = merge_state_document(document, rules);
    ASSERT_TRUE(first);
    EXPECT_FALSE(first->skipped);
    EXPECT_EQ(first->satellites_removed, 1U);

    auto second = merge_state_document(document, rules);
    ASSERT_TRUE(second);
    EXPECT_TRUE(second->skipped);
}

TEST(StateMergeTest, MissingResourcesArrayFails)
{
    state::StateDocument document{.json = ordered_json{{"version", 4}}, .merge_applied = false};
    auto report = merge_state_document(document, split_tunnel_rules());
    ASSERT_FALSE(report);
    EXPECT_EQ(report.error().code, "InvalidState");
}

}  // namespace tfmigrate::reclass::test
