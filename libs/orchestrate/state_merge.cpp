/**
 * @file state_merge.cpp
 * @brief Cross-resource merge over a state document
 */

#include "tfmigrate/orchestrate.hpp"

#include "tfmigrate/classify.hpp"
#include "tfmigrate/matcher.hpp"
#include "tfmigrate/merge.hpp"

#include <algorithm>

namespace tfmigrate::reclass {

namespace {

/**
 * Name a state satellite reference is compared against: the configured key
 * attribute, else the part of `id` after the first '/'.
 */
[[nodiscard]] std::string state_key(const AttributeMap& attributes, const PrimaryRules& rules)
{
    if (!rules.state_key_attribute.empty()) {
        if (auto key = string_attribute(attributes, rules.state_key_attribute); key && !key->empty()) {
            return *key;
        }
    }
    auto id = string_attribute(attributes, "id").value_or("");
    auto slash = id.find('/');
    if (slash != std::string::npos && slash + 1 < id.size()) {
        return id.substr(slash + 1);
    }
    return id;
}

struct StateSatellite
{
    std::size_t index;  ///< Position in the resources array
    AttributeMap attributes;
    std::string excerpt;
};

}  // namespace

Result<MergeReport> merge_state_document(state::StateDocument& document, const MergeRules& rules)
{
    MergeReport report;
    if (document.merge_applied) {
        report.skipped = true;
        return report;
    }

    auto resources = state::resources(document);
    if (!resources) {
        return std::unexpected(resources.error());
    }
    nlohmann::ordered_json& resource_list = **resources;

    std::vector<std::size_t> primary_indices;
    std::vector<PrimaryRef> primaries;
    std::vector<StateSatellite> satellite_info;
    std::vector<SatelliteRef> satellites;

    for (std::size_t i = 0; i < resource_list.size(); ++i) {
        const auto& resource = resource_list[i];
        const std::string kind = state::string_field(resource, "type");
        const auto* json_attributes = state::instance_attributes(resource);
        AttributeMap attributes = json_attributes != nullptr ? attributes_from_json(*json_attributes)
                                                             : AttributeMap{};
        const Value* scope = rules.satellite.scope_attribute.empty()
                                 ? nullptr
                                 : find_attribute(attributes, rules.satellite.scope_attribute);

        if (rules.is_primary_kind(kind)) {
            if (json_attributes == nullptr) {
                continue;
            }
            primary_indices.push_back(i);
            primaries.push_back(PrimaryRef{
                .kind = kind,
                .key = state_key(attributes, rules.primary),
                .variant = route(kind, attributes, rules.primary).variant,
                .scope = literal_scope(scope),
            });
        } else if (kind == rules.satellite.kind) {
            satellites.push_back(SatelliteRef{
                .name = state::string_field(resource, "name"),
                .target = state_target(find_attribute(attributes, rules.satellite.reference_attribute)),
                .scope = literal_scope(scope),
            });
            satellite_info.push_back(
                StateSatellite{.index = i, .attributes = std::move(attributes), .excerpt = resource.dump(2)});
        }
    }

    auto add_diagnostic = [&](DiagnosticReason reason, std::size_t satellite, std::string subject,
                              std::string attribute = {}) {
        Diagnostic diagnostic = make_diagnostic(reason, satellites[satellite].name, std::move(subject),
                                                rules, std::move(attribute));
        diagnostic.excerpt = satellite_info[satellite].excerpt;
        report.diagnostics.push_back(std::move(diagnostic));
    };

    MatchResult matched = match_satellites(primaries, satellites);
    for (const auto& unmatched : matched.unmatched) {
        add_diagnostic(to_reason(unmatched.reason), unmatched.satellite, unmatched.target);
    }

    for (std::size_t p = 0; p < primaries.size(); ++p) {
        if (matched.groups[p].empty()) {
            continue;
        }
        std::vector<Contribution> contributions;
        for (std::size_t s : matched.groups[p]) {
            const AttributeMap& attributes = satellite_info[s].attributes;
            ModeResolution mode =
                resolve_mode(find_attribute(attributes, rules.satellite.mode_attribute), rules.satellite);
            if (mode.binding == nullptr) {
                add_diagnostic(DiagnosticReason::kUnsupportedMode, s, mode.mode);
                continue;
            }
            const Value* listed = find_attribute(attributes, rules.satellite.entries.source);
            contributions.push_back(Contribution{
                .satellite = s,
                .binding = mode.binding,
                .entries = listed != nullptr ? entries_from_list(*listed, rules.satellite.entries)
                                             : std::vector<Object>{},
            });
        }

        nlohmann::ordered_json& target = *state::instance_attributes(resource_list[primary_indices[p]]);
        bool updated = false;
        for (const auto& collection : plan_merge(contributions, rules.satellite)) {
            std::optional<Value> existing;
            if (auto it = target.find(collection.attribute); it != target.end()) {
                existing = from_json(*it);
            }
            auto combined = combine_with_existing(existing ? &*existing : nullptr, collection.entries);
            if (!combined) {
                for (std::size_t s : collection.contributors) {
                    add_diagnostic(DiagnosticReason::kTargetNotMergeable, s, primaries[p].key,
                                   collection.attribute);
                }
                continue;
            }
            std::size_t before = existing && existing->as_list() ? existing->as_list()->size() : 0;
            report.entries_merged += combined->size() - before;
            target[collection.attribute] = to_json(Value(std::move(*combined)));
            updated = true;
        }
        if (updated) {
            ++report.primaries_updated;
        }
    }

    for (auto it = satellite_info.rbegin(); it != satellite_info.rend(); ++it) {
        resource_list.erase(it->index);
        ++report.satellites_removed;
    }

    document.merge_applied = true;
    return report;
}

}  // namespace tfmigrate::reclass
