#pragma once

/**
 * @file reference.hpp
 * @brief Syntactic resolution of cross-resource references
 */

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace tfmigrate::reclass {

/**
 * @brief Address of a resource inside one configuration unit or state document
 */
struct ResourceIdentity
{
    std::string kind;
    std::string name;

    bool operator==(const ResourceIdentity&) const = default;
};

/**
 * Resolve an expression that addresses another resource's attribute.
 *
 * Accepted forms, for each candidate kind in order:
 *   - `<kind>.<name>.<field>...`
 *   - `<kind>["<name>"].<field>...`
 * An expression that is exactly one interpolation (`"${...}"`) is unwrapped
 * first. Variables, locals, module outputs, conditionals, function calls and
 * partial templates are never resolved.
 *
 * @return Identity of the addressed resource, nullopt when the text matches no form
 */
[[nodiscard]] std::optional<ResourceIdentity> resolve_reference(
    std::string_view expression, std::span<const std::string> candidate_kinds);

}  // namespace tfmigrate::reclass
