/**
 * @file merge.cpp
 * @brief Merge planning shared by the configuration and state passes
 */

#include "tfmigrate/merge.hpp"

#include <algorithm>

namespace tfmigrate::reclass {

namespace {

[[nodiscard]] bool carries_value(const Value& value)
{
    if (value.is_null()) {
        return false;
    }
    if (const auto* text = value.as_string()) {
        return !text->empty();
    }
    return true;
}

void append_unique(List& list, const Value& value)
{
    if (std::ranges::find(list, value) == list.end()) {
        list.push_back(value);
    }
}

}  // namespace

std::optional<Object> normalize_entry(const AttributeMap& fields, const EntryRules& rules)
{
    Object entry;
    for (const auto& field : rules.fields) {
        const Value* value = find_attribute(fields, field);
        if (value != nullptr && carries_value(*value)) {
            entry.push_back(Member{.key = field, .value = *value});
        }
    }
    bool has_key = std::ranges::any_of(rules.key_fields, [&entry](const std::string& key) {
        return find_member(entry, key) != nullptr;
    });
    if (!has_key) {
        return std::nullopt;
    }
    return entry;
}

std::optional<Object> normalize_entry(const Object& fields, const EntryRules& rules)
{
    AttributeMap map;
    for (const auto& member : fields) {
        map.insert_or_assign(member.key, member.value);
    }
    return normalize_entry(map, rules);
}

std::vector<Object> entries_from_list(const Value& value, const EntryRules& rules)
{
    std::vector<Object> entries;
    const List* list = value.as_list();
    if (list == nullptr) {
        return entries;
    }
    for (const auto& item : *list) {
        if (const Object* object = item.as_object()) {
            if (auto entry = normalize_entry(*object, rules)) {
                entries.push_back(std::move(*entry));
            }
        }
    }
    return entries;
}

ModeResolution resolve_mode(const Value* mode, const SatelliteRules& rules)
{
    auto lookup = [&rules](std::string text) {
        auto it = std::ranges::find(rules.modes, text, &ModeBinding::mode);
        return ModeResolution{.binding = it == rules.modes.end() ? nullptr : &*it, .mode = std::move(text)};
    };

    if (mode == nullptr || mode->is_null()) {
        return lookup(rules.default_mode);
    }
    if (const auto* text = mode->as_string()) {
        return lookup(text->empty() ? rules.default_mode : *text);
    }
    if (const auto* expression = mode->as_expression()) {
        return ModeResolution{.binding = nullptr, .mode = expression->text};
    }
    return ModeResolution{.binding = nullptr, .mode = "<non-string>"};
}

std::vector<ModeCollection> plan_merge(std::span<const Contribution> contributions,
                                       const SatelliteRules& rules)
{
    std::vector<ModeCollection> collections;
    for (const auto& binding : rules.modes) {
        ModeCollection collection{
            .mode = binding.mode, .attribute = binding.attribute, .entries = {}, .contributors = {}};
        for (const auto& contribution : contributions) {
            if (contribution.binding == nullptr || contribution.binding->mode != binding.mode
                || contribution.entries.empty()) {
                continue;
            }
            for (const auto& entry : contribution.entries) {
                append_unique(collection.entries, Value(entry));
            }
            collection.contributors.push_back(contribution.satellite);
        }
        if (!collection.entries.empty()) {
            collections.push_back(std::move(collection));
        }
    }
    return collections;
}

std::optional<List> combine_with_existing(const Value* existing, const List& merged)
{
    List combined;
    if (existing != nullptr && !existing->is_null()) {
        const List* current = existing->as_list();
        if (current == nullptr) {
            return std::nullopt;
        }
        combined = *current;
    }
    for (const auto& entry : merged) {
        append_unique(combined, entry);
    }
    return combined;
}

}  // namespace tfmigrate::reclass
