#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error type, text helpers, file I/O
 */

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tfmigrate {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

}  // namespace tfmigrate

namespace tfmigrate::common {

// ============================================================================
// Text
// ============================================================================

/**
 * Strip leading and trailing ASCII whitespace
 */
[[nodiscard]] std::string_view trim(std::string_view text);

/**
 * Split text into lines without their terminators.
 * A trailing newline does not produce an empty final line.
 */
[[nodiscard]] std::vector<std::string_view> split_lines(std::string_view text);

/**
 * Check whether text is a bare identifier: [A-Za-z_][A-Za-z0-9_-]*
 */
[[nodiscard]] bool is_identifier(std::string_view text);

// ============================================================================
// File I/O
// ============================================================================

/**
 * Read a whole file as bytes
 */
[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path& path);

/**
 * Write bytes to a file, replacing any previous content
 */
[[nodiscard]] VoidResult write_text_file(const std::filesystem::path& path, std::string_view text);

}  // namespace tfmigrate::common
