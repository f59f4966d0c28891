/**
 * @file classify.cpp
 * @brief Resource classifier
 */

#include "tfmigrate/classify.hpp"

namespace tfmigrate::reclass {

std::string_view to_string(Variant variant) noexcept
{
    switch (variant) {
        case Variant::kDefault:
            return "default";
        case Variant::kCustom:
            return "custom";
    }
    return "default";
}

Variant classify(const AttributeMap& attributes, const Discriminators& discriminators)
{
    if (const Value* flag = find_attribute(attributes, discriminators.is_default)) {
        if (const bool* is_default = flag->as_bool(); is_default != nullptr && *is_default) {
            return Variant::kDefault;
        }
    }
    if (is_present(attributes, discriminators.match) && is_present(attributes, discriminators.precedence)) {
        return Variant::kCustom;
    }
    return Variant::kDefault;
}

Routing route(std::string_view kind, const AttributeMap& attributes, const PrimaryRules& rules)
{
    Variant variant = Variant::kDefault;
    if (kind == rules.custom_kind) {
        variant = Variant::kCustom;
    } else if (kind != rules.default_kind) {
        variant = classify(attributes, rules.discriminators);
    }
    return Routing{
        .variant = variant,
        .target_kind = variant == Variant::kCustom ? rules.custom_kind : rules.default_kind,
    };
}

}  // namespace tfmigrate::reclass
