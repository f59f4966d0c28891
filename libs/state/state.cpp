/**
 * @file state.cpp
 * @brief State document parsing, validation and path helpers
 */

#include "tfmigrate/state.hpp"

#include "tfmigrate/schema_validate.hpp"

#include <format>

namespace tfmigrate::state {

Result<StateDocument> parse_state(std::string_view text)
{
    StateDocument document;
    try {
        document.json = nlohmann::ordered_json::parse(text);
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(
            Error::make("StateParseError", std::format("Failed to parse state: {}", ex.what())));
    }
    if (!document.json.is_object()) {
        return std::unexpected(Error::make("InvalidState", "State document must be a JSON object"));
    }
    return document;
}

VoidResult validate_state(const StateDocument& document, const std::filesystem::path& schema_dir)
{
    return common::validate_json(document.json, common::schema_file(schema_dir, common::kStateSchema));
}

std::string dump_state(const StateDocument& document)
{
    return document.json.dump(2) + "\n";
}

Result<nlohmann::ordered_json*> resources(StateDocument& document)
{
    auto it = document.json.find("resources");
    if (it == document.json.end() || !it->is_array()) {
        return std::unexpected(
            Error::make("InvalidState", "State document has no 'resources' array"));
    }
    return &*it;
}

namespace {

template <typename Json>
[[nodiscard]] Json* find_instance_attributes(Json& resource)
{
    if (!resource.is_object()) {
        return nullptr;
    }
    auto instances = resource.find("instances");
    if (instances == resource.end() || !instances->is_array() || instances->empty()) {
        return nullptr;
    }
    auto& first = instances->front();
    if (!first.is_object()) {
        return nullptr;
    }
    auto attributes = first.find("attributes");
    if (attributes == first.end() || !attributes->is_object()) {
        return nullptr;
    }
    return &*attributes;
}

}  // namespace

nlohmann::ordered_json* instance_attributes(nlohmann::ordered_json& resource)
{
    return find_instance_attributes(resource);
}

const nlohmann::ordered_json* instance_attributes(const nlohmann::ordered_json& resource)
{
    return find_instance_attributes(resource);
}

std::string string_field(const nlohmann::ordered_json& object, std::string_view key)
{
    if (!object.is_object()) {
        return {};
    }
    auto it = object.find(std::string(key));
    if (it == object.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

}  // namespace tfmigrate::state
