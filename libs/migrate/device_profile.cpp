/**
 * @file device_profile.cpp
 * @brief Device profile migrator: splits the unified legacy kind into default and custom profiles
 */

#include "tfmigrate/migrate.hpp"

#include "tfmigrate/classify.hpp"
#include "tfmigrate/orchestrate.hpp"

#include <array>
#include <string>

namespace tfmigrate::migrate {

namespace {

constexpr std::array<std::string_view, 2> kCustomRemovedFields = {"default", "enabled"};
constexpr std::array<std::string_view, 6> kDefaultRemovedFields = {
    "name", "description", "match", "precedence", "enabled", "default"};
constexpr std::array<std::string_view, 3> kFloatFields = {"auto_connect", "captive_portal",
                                                           "precedence"};

/// Offset added to custom profile precedence so migrated policies do not collide
constexpr double kPrecedenceOffset = 900.0;

constexpr std::string_view kServiceModeField = "service_mode_v2";
constexpr std::string_view kServiceModeMode = "service_mode_v2_mode";
constexpr std::string_view kServiceModePort = "service_mode_v2_port";
constexpr std::string_view kLegacyDefaultServiceMode = "warp";

[[nodiscard]] bool is_custom(const reclass::Routing& routing)
{
    return routing.variant == reclass::Variant::kCustom;
}

class DeviceProfileMigrator final : public ResourceMigrator
{
public:
    explicit DeviceProfileMigrator(reclass::MergeRules rules)
        : m_rules(std::move(rules))
    {}

    [[nodiscard]] std::string_view name() const noexcept override { return "device_profile"; }

    [[nodiscard]] bool can_handle(std::string_view kind) const override
    {
        return m_rules.is_primary_kind(kind);
    }

    [[nodiscard]] VoidResult transform_config(MigrationContext& ctx, hcl::Block& block) override
    {
        if (ctx.unit != nullptr) {
            auto report = reclass::merge_config_unit(*ctx.unit, m_rules);
            ctx.diagnostics.insert(ctx.diagnostics.end(), report.diagnostics.begin(),
                                   report.diagnostics.end());
        }

        const std::string kind(block.resource_kind());
        hcl::Body& body = block.body();
        const bool legacy = m_rules.is_legacy_kind(kind);
        const auto routing = reclass::route(kind, body.attribute_values(), m_rules.primary);

        if (kind != routing.target_kind) {
            block.set_label(0, routing.target_kind);
        }

        if (is_custom(routing)) {
            if (legacy) {
                bump_precedence(body);
            }
            for (auto field : kCustomRemovedFields) {
                body.remove_attribute(field);
            }
        } else {
            for (auto field : kDefaultRemovedFields) {
                body.remove_attribute(field);
            }
        }

        nest_service_mode(body);

        if (!is_custom(routing)) {
            if (!body.has_attribute("register_interface_ip_with_dns")) {
                body.set_attribute("register_interface_ip_with_dns", "true");
            }
            if (!body.has_attribute("sccm_vpn_boundary_support")) {
                body.set_attribute("sccm_vpn_boundary_support", "false");
            }
        }

        ++ctx.resources_migrated;
        return {};
    }

    [[nodiscard]] VoidResult transform_state(MigrationContext& ctx,
                                             nlohmann::ordered_json& resource) override
    {
        nlohmann::ordered_json* attributes = state::instance_attributes(resource);
        const std::string kind = state::string_field(resource, "type");
        const auto routing = reclass::route(
            kind, attributes != nullptr ? attributes_from_json(*attributes) : AttributeMap{},
            m_rules.primary);
        if (attributes != nullptr) {
            migrate_state_attributes(*attributes, routing);
        }
        resource["type"] = routing.target_kind;

        if (auto instances = resource.find("instances");
            instances != resource.end() && instances->is_array()) {
            for (auto& instance : *instances) {
                if (instance.is_object()) {
                    instance["schema_version"] = 0;
                }
            }
        }

        ++ctx.resources_migrated;
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
    void bump_precedence(hcl::Body& body) const
    {
        const auto& field = m_rules.primary.discriminators.precedence;
        auto value = body.attribute_value(field);
        if (!value) {
            return;
        }
        if (const double* precedence = value->as_number()) {
            body.set_attribute_value(field, Value(kPrecedenceOffset + *precedence));
        }
    }

    /// service_mode_v2_mode / service_mode_v2_port -> service_mode_v2 = { mode, port }
    static void nest_service_mode(hcl::Body& body)
    {
        auto mode = body.attribute_value(kServiceModeMode);
        auto port = body.attribute_value(kServiceModePort);

        if (mode && !port) {
            const auto* text = mode->as_string();
            if (text != nullptr && *text == kLegacyDefaultServiceMode) {
                body.remove_attribute(kServiceModeMode);
                mode.reset();
            }
        }
        if (!mode && !port) {
            return;
        }

        Object nested;
        if (mode) {
            nested.push_back(Member{.key = "mode", .value = std::move(*mode)});
        }
        if (port) {
            nested.push_back(Member{.key = "port", .value = std::move(*port)});
        }
        body.remove_attribute(kServiceModeMode);
        body.remove_attribute(kServiceModePort);
        body.set_attribute_value(kServiceModeField, Value(std::move(nested)));
    }

    void migrate_state_attributes(nlohmann::ordered_json& attributes,
                                  const reclass::Routing& routing) const
    {
        if (is_custom(routing)) {
            for (auto field : kCustomRemovedFields) {
                attributes.erase(std::string(field));
            }
        } else {
            for (auto field : kDefaultRemovedFields) {
                attributes.erase(std::string(field));
            }
        }

        attributes.erase("fallback_domains");
        if (auto exclude = attributes.find("exclude");
            exclude != attributes.end() && exclude->is_array() && exclude->empty()) {
            attributes.erase(exclude);
        }

        for (auto field : kFloatFields) {
            auto it = attributes.find(std::string(field));
            if (it != attributes.end() && it->is_number()) {
                *it = it->get<double>();
            }
        }

        if (is_custom(routing)) {
            std::string id = state::string_field(attributes, "id");
            auto slash = id.find('/');
            if (slash != std::string::npos && slash + 1 < id.size()) {
                attributes[m_rules.primary.state_key_attribute.empty()
                               ? std::string("policy_id")
                               : m_rules.primary.state_key_attribute] = id.substr(slash + 1);
            }
        }

        nest_state_service_mode(attributes);
    }

    static void nest_state_service_mode(nlohmann::ordered_json& attributes)
    {
        const std::string mode_key(kServiceModeMode);
        const std::string port_key(kServiceModePort);
        auto mode = attributes.find(mode_key);
        auto port = attributes.find(port_key);
        const bool has_mode = mode != attributes.end();
        const bool has_port = port != attributes.end() && port->is_number() && port->get<double>() != 0.0;

        if (has_mode && mode->is_string() && mode->get<std::string>() == kLegacyDefaultServiceMode
            && !has_port) {
            attributes.erase(mode_key);
            attributes.erase(port_key);
            return;
        }

        nlohmann::ordered_json nested = nlohmann::ordered_json::object();
        if (has_mode && mode->is_string() && !mode->get<std::string>().empty()) {
            nested["mode"] = mode->get<std::string>();
        }
        if (has_port) {
            nested["port"] = port->get<double>();
        }
        if (nested.empty()) {
            return;
        }
        attributes[std::string(kServiceModeField)] = std::move(nested);
        attributes.erase(mode_key);
        attributes.erase(port_key);
    }

    reclass::MergeRules m_rules;
};

}  // namespace

std::unique_ptr<ResourceMigrator> make_device_profile_migrator(reclass::MergeRules rules)
{
    return std::make_unique<DeviceProfileMigrator>(std::move(rules));
}

}  // namespace tfmigrate::migrate
