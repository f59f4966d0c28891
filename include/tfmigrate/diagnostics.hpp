#pragma once

/**
 * @file diagnostics.hpp
 * @brief Migration warnings for satellites that could not be merged
 */

#include "tfmigrate/matcher.hpp"
#include "tfmigrate/rules.hpp"

#include <string>
#include <string_view>

namespace tfmigrate::reclass {

/// Opening token of every rendered annotation; its presence marks a processed unit
constexpr std::string_view kDiagnosticMarker = "/** MIGRATION_WARNING:";

enum class DiagnosticReason {
    kUnparseableReference,
    kTargetNotFound,
    kNoDefaultTarget,
    kAmbiguousDefaultTarget,
    kUnsupportedMode,
    kTargetNotMergeable,
};

[[nodiscard]] std::string_view to_string(DiagnosticReason reason) noexcept;
[[nodiscard]] DiagnosticReason to_reason(MatchFailure failure) noexcept;

struct Diagnostic
{
    DiagnosticReason reason;
    std::string satellite;  ///< Local name of the removed satellite
    std::string subject;    ///< Target name, raw reference or mode, depending on reason
    std::string attribute;  ///< Collection attribute (kTargetNotMergeable only)
    std::string message;
    std::string excerpt;    ///< Original text of the removed satellite
};

/**
 * Build a diagnostic with its operator-facing message.
 */
[[nodiscard]] Diagnostic make_diagnostic(DiagnosticReason reason,
                                         std::string satellite,
                                         std::string subject,
                                         const MergeRules& rules,
                                         std::string attribute = {});

/**
 * Render as a comment annotation:
 *
 *     / ** MIGRATION_WARNING: <message>
 *     *  <excerpt line>
 *     * /
 *
 * followed by a blank line. A comment terminator inside the excerpt is broken
 * up so the annotation stays a single comment.
 */
[[nodiscard]] std::string render_annotation(const Diagnostic& diagnostic);

[[nodiscard]] bool contains_marker(std::string_view text) noexcept;

}  // namespace tfmigrate::reclass
