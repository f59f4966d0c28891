#pragma once

/**
 * @file version.hpp
 * @brief tfmigrate version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

#include <string>

namespace tfmigrate {

/// tfmigrate version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Provider schema generations handled by this build
constexpr const char* kSourceVersion = "v4";
constexpr const char* kTargetVersion = "v5";

/// Version tag of the merge rules file format
constexpr const char* kRulesSchemaVersion = "merge_rules.v1";

struct VersionPair
{
    std::string source;
    std::string target;
};

[[nodiscard]] inline VersionPair default_version_pair()
{
    return VersionPair{.source = kSourceVersion, .target = kTargetVersion};
}

}  // namespace tfmigrate
