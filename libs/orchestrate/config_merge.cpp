/**
 * @file config_merge.cpp
 * @brief Cross-resource merge over a configuration unit
 */

#include "tfmigrate/orchestrate.hpp"

#include "tfmigrate/classify.hpp"
#include "tfmigrate/matcher.hpp"
#include "tfmigrate/merge.hpp"

#include <algorithm>
#include <variant>

namespace tfmigrate::reclass {

namespace {

struct ConfigSatellite
{
    hcl::Block* block;
    std::string excerpt;
};

/// Entries of a satellite block: nested entry blocks, then a literal list attribute
[[nodiscard]] std::vector<Object> read_entries(const hcl::Block& block, const EntryRules& rules)
{
    std::vector<Object> entries;
    for (const hcl::Block* nested : block.body().blocks_of_type(rules.source)) {
        if (auto entry = normalize_entry(nested->body().attribute_values(), rules)) {
            entries.push_back(std::move(*entry));
        }
    }
    if (auto listed = block.body().attribute_value(rules.source)) {
        auto more = entries_from_list(*listed, rules);
        entries.insert(entries.end(), more.begin(), more.end());
    }
    return entries;
}

/// Annotation left by an earlier invocation among the unit's top-level comments
[[nodiscard]] bool has_annotation(const hcl::File& unit)
{
    return std::ranges::any_of(unit.body().nodes(), [](const hcl::Body::Node& node) {
        const auto* trivia = std::get_if<hcl::Trivia>(&node);
        return trivia != nullptr && contains_marker(trivia->text);
    });
}

}  // namespace

MergeReport merge_config_unit(hcl::File& unit, const MergeRules& rules)
{
    MergeReport report;
    if (unit.merge_applied()) {
        report.skipped = true;
        return report;
    }

    std::vector<hcl::Block*> primary_blocks;
    std::vector<PrimaryRef> primaries;
    std::vector<ConfigSatellite> satellite_blocks;
    std::vector<SatelliteRef> satellites;
    const auto candidate_kinds = rules.reference_kinds();

    for (hcl::Block* block : unit.resources()) {
        const std::string kind(block->resource_kind());
        AttributeMap attributes = block->body().attribute_values();
        const Value* scope = rules.satellite.scope_attribute.empty()
                                 ? nullptr
                                 : find_attribute(attributes, rules.satellite.scope_attribute);

        if (rules.is_primary_kind(kind)) {
            primary_blocks.push_back(block);
            primaries.push_back(PrimaryRef{
                .kind = kind,
                .key = std::string(block->resource_name()),
                .variant = route(kind, attributes, rules.primary).variant,
                .scope = literal_scope(scope),
            });
        } else if (kind == rules.satellite.kind) {
            satellite_blocks.push_back(ConfigSatellite{.block = block, .excerpt = hcl::write_block(*block)});
            satellites.push_back(SatelliteRef{
                .name = std::string(block->resource_name()),
                .target = config_target(find_attribute(attributes, rules.satellite.reference_attribute),
                                        candidate_kinds),
                .scope = literal_scope(scope),
            });
        }
    }

    auto add_diagnostic = [&](DiagnosticReason reason, std::size_t satellite, std::string subject,
                              std::string attribute = {}) {
        Diagnostic diagnostic = make_diagnostic(reason, satellites[satellite].name, std::move(subject),
                                                rules, std::move(attribute));
        diagnostic.excerpt = satellite_blocks[satellite].excerpt;
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
            const hcl::Block& block = *satellite_blocks[s].block;
            auto mode_value = block.body().attribute_value(rules.satellite.mode_attribute);
            ModeResolution mode = resolve_mode(mode_value ? &*mode_value : nullptr, rules.satellite);
            if (mode.binding == nullptr) {
                add_diagnostic(DiagnosticReason::kUnsupportedMode, s, mode.mode);
                continue;
            }
            contributions.push_back(Contribution{
                .satellite = s,
                .binding = mode.binding,
                .entries = read_entries(block, rules.satellite.entries),
            });
        }

        hcl::Body& body = primary_blocks[p]->body();
        bool updated = false;
        for (const auto& collection : plan_merge(contributions, rules.satellite)) {
            auto existing = body.attribute_value(collection.attribute);
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
            body.set_attribute_value(collection.attribute, Value(std::move(*combined)));
            updated = true;
        }
        if (updated) {
            ++report.primaries_updated;
        }
    }

    for (const auto& satellite : satellite_blocks) {
        if (unit.body().remove_block(satellite.block)) {
            ++report.satellites_removed;
        }
    }

    if (!report.diagnostics.empty() && !has_annotation(unit)) {
        for (const auto& diagnostic : report.diagnostics) {
            unit.body().append_trivia(render_annotation(diagnostic));
        }
    }

    unit.set_merge_applied(true);
    return report;
}

}  // namespace tfmigrate::reclass
