#pragma once

/**
 * @file orchestrate.hpp
 * @brief Cross-resource merge passes over a configuration unit and a state document
 *
 * Both passes collect primaries and satellites through their own adapter,
 * then share the classifier, matcher and merge planner. Satellites are always
 * removed, whether or not they could be merged.
 */

#include "tfmigrate/common.hpp"
#include "tfmigrate/diagnostics.hpp"
#include "tfmigrate/hcl.hpp"
#include "tfmigrate/rules.hpp"
#include "tfmigrate/state.hpp"

#include <cstddef>
#include <vector>

namespace tfmigrate::reclass {

struct MergeReport
{
    bool skipped = false;  ///< Pass had already run on this unit/document
    std::size_t primaries_updated = 0;
    std::size_t entries_merged = 0;
    std::size_t satellites_removed = 0;
    std::vector<Diagnostic> diagnostics;
};

/**
 * Merge satellites of one configuration unit into its primaries.
 *
 * Diagnostics are appended to the end of the unit as annotations unless the
 * unit already carries one. The unit is flagged as processed; later calls on
 * the same unit return a skipped report.
 */
MergeReport merge_config_unit(hcl::File& unit, const MergeRules& rules);

/**
 * Merge satellites of a state document into its primaries.
 *
 * Diagnostics are returned to the caller. Fails only when the document has
 * no resources array.
 */
[[nodiscard]] Result<MergeReport> merge_state_document(state::StateDocument& document,
                                                       const MergeRules& rules);

}  // namespace tfmigrate::reclass
