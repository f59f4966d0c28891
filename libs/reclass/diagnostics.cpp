/**
 * @file diagnostics.cpp
 * @brief Diagnostic messages and annotation rendering
 */

#include "tfmigrate/diagnostics.hpp"

#include "tfmigrate/common.hpp"

#include <format>

namespace tfmigrate::reclass {

namespace {

[[nodiscard]] std::string escape_comment_end(std::string_view line)
{
    std::string out;
    out.reserve(line.size());
    for (std::size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '*' && i + 1 < line.size() && line[i + 1] == '/') {
            out += "* ";
            continue;
        }
        out.push_back(line[i]);
    }
    return out;
}

}  // namespace

std::string_view to_string(DiagnosticReason reason) noexcept
{
    switch (reason) {
        case DiagnosticReason::kUnparseableReference:
            return "unparseable_reference";
        case DiagnosticReason::kTargetNotFound:
            return "target_not_found";
        case DiagnosticReason::kNoDefaultTarget:
            return "no_default_target";
        case DiagnosticReason::kAmbiguousDefaultTarget:
            return "ambiguous_default_target";
        case DiagnosticReason::kUnsupportedMode:
            return "unsupported_mode";
        case DiagnosticReason::kTargetNotMergeable:
            return "target_not_mergeable";
    }
    return "unknown";
}

DiagnosticReason to_reason(MatchFailure failure) noexcept
{
    switch (failure) {
        case MatchFailure::kUnparseableReference:
            return DiagnosticReason::kUnparseableReference;
        case MatchFailure::kTargetNotFound:
            return DiagnosticReason::kTargetNotFound;
        case MatchFailure::kNoDefaultTarget:
            return DiagnosticReason::kNoDefaultTarget;
        case MatchFailure::kAmbiguousDefaultTarget:
            return DiagnosticReason::kAmbiguousDefaultTarget;
    }
    return DiagnosticReason::kUnparseableReference;
}

Diagnostic make_diagnostic(DiagnosticReason reason,
                           std::string satellite,
                           std::string subject,
                           const MergeRules& rules,
                           std::string attribute)
{
    const std::string& label = rules.satellite.label;
    std::string message;
    switch (reason) {
        case DiagnosticReason::kUnparseableReference:
            message = std::format("{} \"{}\" has unparseable {} reference - manual migration required",
                                  label, satellite, rules.satellite.reference_attribute);
            break;
        case DiagnosticReason::kTargetNotFound:
            message = std::format(
                "{} \"{}\" references {} \"{}\" which was not found - manual migration required",
                label, satellite, rules.primary.label, subject);
            break;
        case DiagnosticReason::kNoDefaultTarget:
            message = std::format("{} \"{}\" has no default device {} to merge into - create {} "
                                  "resource first",
                                  label, satellite, rules.primary.label, rules.primary.default_kind);
            break;
        case DiagnosticReason::kAmbiguousDefaultTarget:
            message = std::format(
                "{} \"{}\" matches more than one default device {} - manual migration required",
                label, satellite, rules.primary.label);
            break;
        case DiagnosticReason::kUnsupportedMode:
            message = std::format("{} \"{}\" has unsupported mode \"{}\" - manual migration required",
                                  label, satellite, subject);
            break;
        case DiagnosticReason::kTargetNotMergeable:
            message = std::format("{} \"{}\" could not be merged into \"{}\" because its {} attribute "
                                  "is not a literal list - manual migration required",
                                  label, satellite, subject, attribute);
            break;
    }
    return Diagnostic{
        .reason = reason,
        .satellite = std::move(satellite),
        .subject = std::move(subject),
        .attribute = std::move(attribute),
        .message = std::move(message),
        .excerpt = {},
    };
}

std::string render_annotation(const Diagnostic& diagnostic)
{
    std::string out = std::format("{} {}\n", kDiagnosticMarker, diagnostic.message);
    for (std::string_view line : common::split_lines(common::trim(diagnostic.excerpt))) {
        out += "*  ";
        out += escape_comment_end(line);
        out += '\n';
    }
    out += "*/\n\n";
    return out;
}

bool contains_marker(std::string_view text) noexcept
{
    return text.find(kDiagnosticMarker) != std::string_view::npos;
}

}  // namespace tfmigrate::reclass
