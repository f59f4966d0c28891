#pragma once

/**
 * @file merge.hpp
 * @brief Representation-agnostic merge planning
 *
 * The configuration and state orchestrators read satellite entries into
 * Values, plan the per-mode collections here, and write the planned lists
 * back through their own tree adapters.
 */

#include "tfmigrate/rules.hpp"
#include "tfmigrate/value.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace tfmigrate::reclass {

/**
 * Convert raw entry fields into a uniform entry object.
 *
 * Fields are copied in rule order. Null values and empty strings are dropped;
 * unresolved expressions are kept verbatim. Returns nullopt when none of the
 * key fields carries a value.
 */
[[nodiscard]] std::optional<Object> normalize_entry(const AttributeMap& fields,
                                                    const EntryRules& rules);
[[nodiscard]] std::optional<Object> normalize_entry(const Object& fields, const EntryRules& rules);

/**
 * Normalized entries of a literal list-of-objects value; non-object items
 * and non-list values contribute nothing.
 */
[[nodiscard]] std::vector<Object> entries_from_list(const Value& value, const EntryRules& rules);

/**
 * @brief Mode lookup outcome for one satellite
 */
struct ModeResolution
{
    const ModeBinding* binding = nullptr;  ///< nullptr when the mode is unsupported
    std::string mode;                      ///< Effective mode text
};

/**
 * Absent, null or empty mode -> default mode. Literal strings naming a
 * configured mode resolve to it; anything else is unsupported.
 */
[[nodiscard]] ModeResolution resolve_mode(const Value* mode, const SatelliteRules& rules);

/**
 * @brief Entries contributed by one matched satellite
 */
struct Contribution
{
    std::size_t satellite;
    const ModeBinding* binding;
    std::vector<Object> entries;
};

/**
 * @brief One planned collection attribute on a primary resource
 */
struct ModeCollection
{
    std::string mode;
    std::string attribute;
    List entries;
    std::vector<std::size_t> contributors;  ///< Satellites with at least one entry here
};

/**
 * Accumulate contributions into per-mode collections.
 *
 * Collections come out in rule mode order and only when non-empty. Entries
 * keep satellite encounter order, then entry order; exact duplicates are kept
 * once.
 */
[[nodiscard]] std::vector<ModeCollection> plan_merge(std::span<const Contribution> contributions,
                                                     const SatelliteRules& rules);

/**
 * Combine a planned collection with the primary's current attribute value.
 * Existing entries stay first; merged entries not already present follow.
 *
 * @return nullopt when the existing value is not a literal list
 */
[[nodiscard]] std::optional<List> combine_with_existing(const Value* existing, const List& merged);

}  // namespace tfmigrate::reclass
