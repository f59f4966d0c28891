#pragma once

/**
 * @file matcher.hpp
 * @brief Grouping of satellite resources under the primary resource they belong to
 *
 * The matcher works on plain descriptors built by the configuration and state
 * adapters. It never touches either tree, so both passes share one grouping
 * algorithm.
 */

#include "tfmigrate/classify.hpp"
#include "tfmigrate/reference.hpp"
#include "tfmigrate/value.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace tfmigrate::reclass {

struct PrimaryRef
{
    std::string kind;                  ///< Declared kind
    std::string key;                   ///< Name a satellite reference is compared against
    Variant variant;
    std::optional<std::string> scope;  ///< Literal scope value, nullopt when unknown
};

enum class TargetKind {
    kDefault,        ///< No reference: implicit default target
    kNamed,          ///< Resolved reference
    kUnresolvable,   ///< Reference present but matching no address form
};

struct TargetRef
{
    TargetKind kind = TargetKind::kDefault;
    ResourceIdentity identity;  ///< Set for kNamed; kind may be empty on the state side
    std::string raw;            ///< Original reference text, for diagnostics
};

struct SatelliteRef
{
    std::string name;
    TargetRef target;
    std::optional<std::string> scope;
};

enum class MatchFailure {
    kUnparseableReference,
    kTargetNotFound,
    kNoDefaultTarget,
    kAmbiguousDefaultTarget,
};

struct Unmatched
{
    std::size_t satellite;  ///< Index into the satellite list
    MatchFailure reason;
    std::string target;     ///< Resolved name, or raw reference text
};

struct MatchResult
{
    /// Satellite indices per primary index, in satellite encounter order
    std::vector<std::vector<std::size_t>> groups;
    /// Satellites whose reference could not be parsed
    std::vector<std::size_t> orphans;
    /// Resolved target name -> satellites naming it, for targets absent from the unit
    std::map<std::string, std::vector<std::size_t>> unmatched_named;
    /// Every satellite that was not grouped, in encounter order
    std::vector<Unmatched> unmatched;
};

/**
 * Target of a configuration satellite from its reference attribute value
 * (nullptr when the attribute is absent).
 */
[[nodiscard]] TargetRef config_target(const Value* reference,
                                      std::span<const std::string> candidate_kinds);

/**
 * Target of a state satellite: the reference is a literal identifier.
 * Absent, null or empty -> default target; any other non-string -> unresolvable.
 */
[[nodiscard]] TargetRef state_target(const Value* reference);

/**
 * Literal string value usable as a scope; nullopt for anything else
 */
[[nodiscard]] std::optional<std::string> literal_scope(const Value* value);

/**
 * Group satellites by target primary.
 *
 * Default targets go to the single Default-variant primary whose scope is
 * compatible with the satellite's (equal, or either unknown). Named targets go
 * to the primary whose key equals the resolved name, preferring one whose kind
 * also equals the resolved kind.
 */
[[nodiscard]] MatchResult match_satellites(std::span<const PrimaryRef> primaries,
                                           std::span<const SatelliteRef> satellites);

}  // namespace tfmigrate::reclass
