/**
 * @file matcher.cpp
 * @brief Satellite matcher
 */

#include "tfmigrate/matcher.hpp"

#include "tfmigrate/hcl.hpp"

namespace tfmigrate::reclass {

namespace {

[[nodiscard]] bool scopes_compatible(const std::optional<std::string>& lhs,
                                     const std::optional<std::string>& rhs)
{
    return !lhs || !rhs || *lhs == *rhs;
}

[[nodiscard]] std::string raw_text(const Value& value)
{
    if (const auto* expression = value.as_expression()) {
        return expression->text;
    }
    return hcl::render_value(value);
}

}  // namespace

TargetRef config_target(const Value* reference, std::span<const std::string> candidate_kinds)
{
    if (reference == nullptr || reference->is_null()) {
        return TargetRef{};
    }
    if (const auto* text = reference->as_string(); text != nullptr && text->empty()) {
        return TargetRef{};
    }

    std::string raw = raw_text(*reference);
    if (const auto* expression = reference->as_expression()) {
        if (auto identity = resolve_reference(expression->text, candidate_kinds)) {
            return TargetRef{.kind = TargetKind::kNamed, .identity = std::move(*identity), .raw = raw};
        }
    }
    return TargetRef{.kind = TargetKind::kUnresolvable, .identity = {}, .raw = std::move(raw)};
}

TargetRef state_target(const Value* reference)
{
    if (reference == nullptr || reference->is_null()) {
        return TargetRef{};
    }
    if (const auto* text = reference->as_string()) {
        if (text->empty()) {
            return TargetRef{};
        }
        return TargetRef{.kind = TargetKind::kNamed,
                         .identity = ResourceIdentity{.kind = {}, .name = *text},
                         .raw = *text};
    }
    return TargetRef{.kind = TargetKind::kUnresolvable, .identity = {}, .raw = raw_text(*reference)};
}

std::optional<std::string> literal_scope(const Value* value)
{
    if (value == nullptr) {
        return std::nullopt;
    }
    if (const auto* text = value->as_string(); text != nullptr && !text->empty()) {
        return *text;
    }
    return std::nullopt;
}

MatchResult match_satellites(std::span<const PrimaryRef> primaries,
                             std::span<const SatelliteRef> satellites)
{
    MatchResult result;
    result.groups.resize(primaries.size());

    for (std::size_t s = 0; s < satellites.size(); ++s) {
        const SatelliteRef& satellite = satellites[s];

        switch (satellite.target.kind) {
            case TargetKind::kUnresolvable:
                result.orphans.push_back(s);
                result.unmatched.push_back(Unmatched{.satellite = s,
                                                     .reason = MatchFailure::kUnparseableReference,
                                                     .target = satellite.target.raw});
                break;

            case TargetKind::kDefault: {
                std::vector<std::size_t> candidates;
                for (std::size_t p = 0; p < primaries.size(); ++p) {
                    if (primaries[p].variant == Variant::kDefault
                        && scopes_compatible(primaries[p].scope, satellite.scope)) {
                        candidates.push_back(p);
                    }
                }
                if (candidates.size() == 1) {
                    result.groups[candidates.front()].push_back(s);
                } else {
                    result.unmatched.push_back(Unmatched{
                        .satellite = s,
                        .reason = candidates.empty() ? MatchFailure::kNoDefaultTarget
                                                     : MatchFailure::kAmbiguousDefaultTarget,
                        .target = {}});
                }
                break;
            }

            case TargetKind::kNamed: {
                const ResourceIdentity& wanted = satellite.target.identity;
                std::optional<std::size_t> found;
                for (std::size_t p = 0; p < primaries.size(); ++p) {
                    if (primaries[p].key != wanted.name) {
                        continue;
                    }
                    if (!found || (primaries[p].kind == wanted.kind && primaries[*found].kind != wanted.kind)) {
                        found = p;
                    }
                }
                if (found) {
                    result.groups[*found].push_back(s);
                } else {
                    result.unmatched_named[wanted.name].push_back(s);
                    result.unmatched.push_back(Unmatched{.satellite = s,
                                                         .reason = MatchFailure::kTargetNotFound,
                                                         .target = wanted.name});
                }
                break;
            }
        }
    }
    return result;
}

}  // namespace tfmigrate::reclass
