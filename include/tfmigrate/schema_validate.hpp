#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation utilities
 */

#include "tfmigrate/common.hpp"

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace tfmigrate::common {

/// Schema names shipped in the schemas/ directory
constexpr std::string_view kStateSchema = "terraform_state.v4";
constexpr std::string_view kRulesSchema = "merge_rules.v1";

/**
 * Validate JSON against a JSON Schema file.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path);

/**
 * Validate an insertion-ordered JSON document (state files) against a JSON Schema file.
 */
[[nodiscard]] VoidResult validate_json(const nlohmann::ordered_json& j,
                                       const std::string& schema_path);

/**
 * Path of a named schema inside a schema directory: <dir>/<name>.schema.json
 */
[[nodiscard]] std::string schema_file(const std::filesystem::path& schema_dir,
                                      std::string_view schema_name);

}  // namespace tfmigrate::common
