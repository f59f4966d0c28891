/**
 * @file rules.cpp
 * @brief Built-in merge rules and rules file loading
 */

#include "tfmigrate/rules.hpp"

#include "tfmigrate/schema_validate.hpp"
#include "tfmigrate/version.hpp"

#include <algorithm>
#include <format>
#include <set>

namespace tfmigrate::reclass {

namespace {

[[nodiscard]] std::vector<std::string> string_list(const nlohmann::json& json, const char* key)
{
    std::vector<std::string> values;
    auto it = json.find(key);
    if (it == json.end()) {
        return values;
    }
    for (const auto& item : *it) {
        values.push_back(item.get<std::string>());
    }
    return values;
}

[[nodiscard]] std::string string_or(const nlohmann::json& json,
                                    const char* key,
                                    std::string fallback)
{
    auto it = json.find(key);
    return it == json.end() ? fallback : it->get<std::string>();
}

[[nodiscard]] VoidResult check_rules(const MergeRules& rules)
{
    auto fail = [](std::string message) {
        return std::unexpected(Error::make("InvalidRules", std::move(message)));
    };

    if (rules.primary.default_kind == rules.primary.custom_kind) {
        return fail("primary.default_kind and primary.custom_kind must differ");
    }
    if (rules.primary.is_legacy_kind(rules.satellite.kind)
        || rules.satellite.kind == rules.primary.default_kind
        || rules.satellite.kind == rules.primary.custom_kind) {
        return fail(std::format("satellite kind '{}' is also a primary kind", rules.satellite.kind));
    }

    std::set<std::string, std::less<>> modes;
    std::set<std::string, std::less<>> attributes;
    for (const auto& binding : rules.satellite.modes) {
        if (!modes.insert(binding.mode).second) {
            return fail(std::format("duplicate mode '{}'", binding.mode));
        }
        if (!attributes.insert(binding.attribute).second) {
            return fail(std::format("duplicate collection attribute '{}'", binding.attribute));
        }
    }
    if (rules.find_mode(rules.satellite.default_mode) == nullptr) {
        return fail(std::format("default_mode '{}' is not one of the configured modes",
                                rules.satellite.default_mode));
    }

    const auto& fields = rules.satellite.entries.fields;
    for (const auto& key : rules.satellite.entries.key_fields) {
        if (std::ranges::find(fields, key) == fields.end()) {
            return fail(std::format("key field '{}' is not listed in entries.fields", key));
        }
    }
    return {};
}

}  // namespace

std::vector<std::string> MergeRules::reference_kinds() const
{
    std::vector<std::string> kinds{primary.custom_kind, primary.default_kind};
    kinds.insert(kinds.end(), primary.legacy_kinds.begin(), primary.legacy_kinds.end());
    return kinds;
}

bool MergeRules::is_primary_kind(std::string_view kind) const
{
    return kind == primary.default_kind || kind == primary.custom_kind || is_legacy_kind(kind);
}

bool MergeRules::is_legacy_kind(std::string_view kind) const
{
    return std::ranges::find(primary.legacy_kinds, kind) != primary.legacy_kinds.end();
}

const ModeBinding* MergeRules::find_mode(std::string_view mode) const
{
    auto it = std::ranges::find(satellite.modes, mode, &ModeBinding::mode);
    return it == satellite.modes.end() ? nullptr : &*it;
}

MergeRules split_tunnel_rules()
{
    return MergeRules{
        .primary =
            PrimaryRules{
                .default_kind = "cloudflare_zero_trust_device_default_profile",
                .custom_kind = "cloudflare_zero_trust_device_custom_profile",
                .legacy_kinds = {"cloudflare_zero_trust_device_profiles",
                                 "cloudflare_device_settings_policy"},
                .discriminators = Discriminators{.is_default = "default",
                                                 .match = "match",
                                                 .precedence = "precedence"},
                .state_key_attribute = "policy_id",
                .label = "profile",
            },
        .satellite =
            SatelliteRules{
                .kind = "cloudflare_split_tunnel",
                .reference_attribute = "policy_id",
                .scope_attribute = "account_id",
                .mode_attribute = "mode",
                .default_mode = "exclude",
                .modes = {ModeBinding{.mode = "include", .attribute = "include"},
                          ModeBinding{.mode = "exclude", .attribute = "exclude"}},
                .entries = EntryRules{.source = "tunnels",
                                      .fields = {"address", "description", "host"},
                                      .key_fields = {"address", "host"}},
                .label = "Split tunnel",
            },
    };
}

Result<MergeRules> rules_from_json(const nlohmann::json& json)
{
    MergeRules rules;
    try {
        const auto& primary = json.at("primary");
        const auto& discriminators = primary.at("discriminators");
        rules.primary = PrimaryRules{
            .default_kind = primary.at("default_kind").get<std::string>(),
            .custom_kind = primary.at("custom_kind").get<std::string>(),
            .legacy_kinds = string_list(primary, "legacy_kinds"),
            .discriminators =
                Discriminators{
                    .is_default = discriminators.at("is_default").get<std::string>(),
                    .match = discriminators.at("match").get<std::string>(),
                    .precedence = discriminators.at("precedence").get<std::string>(),
                },
            .state_key_attribute = string_or(primary, "state_key_attribute", ""),
            .label = string_or(primary, "label", "profile"),
        };

        const auto& satellite = json.at("satellite");
        const auto& entries = satellite.at("entries");
        rules.satellite.kind = satellite.at("kind").get<std::string>();
        rules.satellite.reference_attribute = satellite.at("reference_attribute").get<std::string>();
        rules.satellite.scope_attribute = string_or(satellite, "scope_attribute", "");
        rules.satellite.mode_attribute = satellite.at("mode_attribute").get<std::string>();
        rules.satellite.default_mode = satellite.at("default_mode").get<std::string>();
        for (const auto& binding : satellite.at("modes")) {
            rules.satellite.modes.push_back(ModeBinding{
                .mode = binding.at("mode").get<std::string>(),
                .attribute = binding.at("attribute").get<std::string>(),
            });
        }
        rules.satellite.entries = EntryRules{
            .source = entries.at("source").get<std::string>(),
            .fields = string_list(entries, "fields"),
            .key_fields = string_list(entries, "key_fields"),
        };
        rules.satellite.label = string_or(satellite, "label", rules.satellite.kind);
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(
            Error::make("InvalidRules", std::format("Malformed rules document: {}", ex.what())));
    }

    if (auto checked = check_rules(rules); !checked) {
        return std::unexpected(checked.error());
    }
    return rules;
}

Result<MergeRules> load_rules(const std::filesystem::path& path,
                              const std::filesystem::path& schema_dir)
{
    auto text = common::read_text_file(path);
    if (!text) {
        return std::unexpected(text.error());
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(*text);
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(Error::make(
            "InvalidRules", std::format("Failed to parse rules file {}: {}", path.string(), ex.what())));
    }

    if (auto valid = common::validate_json(json, common::schema_file(schema_dir, common::kRulesSchema));
        !valid) {
        if (valid.error().code == "SchemaValidationFailed") {
            return std::unexpected(Error::make(
                "InvalidRules",
                std::format("Rules file {} does not match {}: {}", path.string(), kRulesSchemaVersion,
                            valid.error().message)));
        }
        return std::unexpected(valid.error());
    }
    return rules_from_json(json);
}

}  // namespace tfmigrate::reclass
