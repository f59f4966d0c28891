#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 feature-test checks for tfmigrate
 *
 * Include early in a translation unit (main.cpp does) to get a clear error
 * when the toolchain lacks a library feature tfmigrate depends on.
 */

#include <version>

// =============================================================================
// C++23 Language Standard Check
// =============================================================================

#if !defined(__cplusplus) || __cplusplus < 202'100L
    #error "tfmigrate requires C++23 (-std=c++23)."
#endif

// =============================================================================
// std::expected (__cpp_lib_expected)
// =============================================================================
// Required for: Result<T> / VoidResult error handling

#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "tfmigrate requires std::expected (__cpp_lib_expected >= 202202L)."
#endif

// =============================================================================
// std::format (__cpp_lib_format)
// =============================================================================
// Required for: diagnostic messages and console output

#if !defined(__cpp_lib_format) || __cpp_lib_format < 201'907L
    #error "tfmigrate requires std::format (__cpp_lib_format >= 201907L)."
#endif

// =============================================================================
// std::string::contains (__cpp_lib_string_contains)
// =============================================================================
// Required for: marker and token scanning

#if !defined(__cpp_lib_string_contains) || __cpp_lib_string_contains < 202'011L
    #error "tfmigrate requires std::string::contains (__cpp_lib_string_contains >= 202011L)."
#endif

// =============================================================================
// std::ranges (__cpp_lib_ranges)
// =============================================================================
// Required for: range algorithms over resource lists

#if !defined(__cpp_lib_ranges) || __cpp_lib_ranges < 201'911L
    #error "tfmigrate requires std::ranges (__cpp_lib_ranges >= 201911L)."
#endif

#define TFMIGRATE_CPP23_FEATURES_VERIFIED 1
