#pragma once

/**
 * @file state.hpp
 * @brief Terraform state document wrapper
 */

#include "tfmigrate/common.hpp"
#include "tfmigrate/value.hpp"

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace tfmigrate::state {

/**
 * @brief Parsed state document
 *
 * Keeps key insertion order so untouched metadata round-trips unchanged.
 */
struct StateDocument
{
    nlohmann::ordered_json json;
    bool merge_applied = false;  ///< Cross-resource merge already ran in this process
};

[[nodiscard]] Result<StateDocument> parse_state(std::string_view text);

/**
 * Validate against <schema_dir>/terraform_state.v4.schema.json
 */
[[nodiscard]] VoidResult validate_state(const StateDocument& document,
                                        const std::filesystem::path& schema_dir);

/**
 * Serialize with two-space indentation and a trailing newline
 */
[[nodiscard]] std::string dump_state(const StateDocument& document);

/**
 * The `resources` array; InvalidState when missing or not an array
 */
[[nodiscard]] Result<nlohmann::ordered_json*> resources(StateDocument& document);

/**
 * `instances[0].attributes` of a resource entry, nullptr when absent
 */
[[nodiscard]] nlohmann::ordered_json* instance_attributes(nlohmann::ordered_json& resource);
[[nodiscard]] const nlohmann::ordered_json* instance_attributes(
    const nlohmann::ordered_json& resource);

/**
 * String member of a JSON object, empty when absent or not a string
 */
[[nodiscard]] std::string string_field(const nlohmann::ordered_json& object, std::string_view key);

}  // namespace tfmigrate::state
