#pragma once

/**
 * @file rules.hpp
 * @brief Merge rules binding the reclassification engine to concrete resource kinds
 *
 * The engine never hard-codes resource kinds or attribute names. Everything it
 * needs to know about primaries, satellites, modes and entries comes from a
 * MergeRules record: either the built-in split tunnel binding or a rules file
 * validated against schemas/merge_rules.v1.schema.json.
 */

#include "tfmigrate/common.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace tfmigrate::reclass {

/**
 * @brief Attribute names consulted by the resource classifier
 */
struct Discriminators
{
    std::string is_default;  ///< Boolean "is default" flag
    std::string match;       ///< Routing match expression
    std::string precedence;  ///< Routing precedence
};

struct PrimaryRules
{
    std::string default_kind;
    std::string custom_kind;
    std::vector<std::string> legacy_kinds;
    Discriminators discriminators;
    std::string state_key_attribute;  ///< State attribute naming a custom primary; may be empty
    std::string label;                ///< Noun used in diagnostics ("profile")
};

/**
 * @brief One satellite mode and the primary collection attribute it feeds
 */
struct ModeBinding
{
    std::string mode;
    std::string attribute;
};

struct EntryRules
{
    std::string source;                   ///< Nested block type / state list attribute
    std::vector<std::string> fields;      ///< Copied fields, in output order
    std::vector<std::string> key_fields;  ///< An entry needs a value in at least one of these
};

struct SatelliteRules
{
    std::string kind;
    std::string reference_attribute;
    std::string scope_attribute;  ///< May be empty: every satellite is scope-compatible
    std::string mode_attribute;
    std::string default_mode;
    std::vector<ModeBinding> modes;  ///< Output order of the primary's collections
    EntryRules entries;
    std::string label;  ///< Noun used in diagnostics ("Split tunnel")
};

struct MergeRules
{
    PrimaryRules primary;
    SatelliteRules satellite;

    /**
     * Kinds a satellite reference may address, in resolution priority order:
     * custom kind, default kind, then legacy kinds.
     */
    [[nodiscard]] std::vector<std::string> reference_kinds() const;

    [[nodiscard]] bool is_primary_kind(std::string_view kind) const;
    [[nodiscard]] bool is_legacy_kind(std::string_view kind) const;
    [[nodiscard]] const ModeBinding* find_mode(std::string_view mode) const;
};

/**
 * Built-in binding: device profiles (primary) and split tunnels (satellite)
 */
[[nodiscard]] MergeRules split_tunnel_rules();

/**
 * Build rules from an already schema-validated JSON document.
 * Cross-field checks the schema cannot express are reported as InvalidRules.
 */
[[nodiscard]] Result<MergeRules> rules_from_json(const nlohmann::json& json);

/**
 * Read, validate and convert a rules file.
 */
[[nodiscard]] Result<MergeRules> load_rules(const std::filesystem::path& path,
                                            const std::filesystem::path& schema_dir);

}  // namespace tfmigrate::reclass
