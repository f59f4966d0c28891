#pragma once

/**
 * @file classify.hpp
 * @brief Primary resource classification into successor variants
 */

#include "tfmigrate/rules.hpp"
#include "tfmigrate/value.hpp"

#include <string>
#include <string_view>

namespace tfmigrate::reclass {

enum class Variant {
    kDefault,
    kCustom,
};

[[nodiscard]] std::string_view to_string(Variant variant) noexcept;

/**
 * Decide the successor variant of a primary resource from its own attributes.
 *
 * First match wins:
 *   1. is_default is literally true   -> Default (routing fields are ignored)
 *   2. match and precedence present   -> Custom
 *   3. otherwise                      -> Default
 *
 * Attributes set to null count as absent.
 */
[[nodiscard]] Variant classify(const AttributeMap& attributes, const Discriminators& discriminators);

/**
 * @brief Routing decision for one primary resource
 */
struct Routing
{
    Variant variant;
    std::string target_kind;  ///< Successor resource kind
};

/**
 * Route a primary resource of any recognised kind. Resources already of a
 * successor kind keep their variant; legacy kinds are classified.
 */
[[nodiscard]] Routing route(std::string_view kind,
                            const AttributeMap& attributes,
                            const PrimaryRules& rules);

}  // namespace tfmigrate::reclass
