/**
 * @file reference.cpp
 * @brief Reference resolver over raw expression text
 */

#include "tfmigrate/reference.hpp"

#include "tfmigrate/common.hpp"

namespace tfmigrate::reclass {

namespace {

[[nodiscard]] bool is_digit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

/// Strip a `"${ ... }"` wrapper around a single interpolation
[[nodiscard]] std::string_view unwrap_interpolation(std::string_view text)
{
    if (text.size() < 5 || !text.starts_with("\"${") || !text.ends_with("}\"")) {
        return text;
    }
    std::string_view inner = text.substr(3, text.size() - 5);
    if (inner.find_first_of("{}\"") != std::string_view::npos) {
        return text;
    }
    return common::trim(inner);
}

/// Length of the identifier at the start of text (0 when none)
[[nodiscard]] std::size_t identifier_length(std::string_view text)
{
    std::size_t length = 0;
    while (length < text.size() && common::is_identifier(text.substr(0, length + 1))) {
        ++length;
    }
    return length;
}

/**
 * Check that the remaining text is one or more traversal steps:
 * `.attr`, `[0]` or `["key"]`.
 */
[[nodiscard]] bool is_traversal(std::string_view text)
{
    if (text.empty()) {
        return false;
    }
    while (!text.empty()) {
        if (text.front() == '.') {
            std::size_t length = identifier_length(text.substr(1));
            if (length == 0) {
                return false;
            }
            text.remove_prefix(1 + length);
            continue;
        }
        if (text.front() != '[') {
            return false;
        }
        auto close = text.find(']');
        if (close == std::string_view::npos || close < 2) {
            return false;
        }
        std::string_view index = text.substr(1, close - 1);
        bool numeric = true;
        for (char c : index) {
            numeric = numeric && is_digit(c);
        }
        bool quoted = index.size() >= 2 && index.front() == '"' && index.back() == '"'
                      && index.substr(1, index.size() - 2).find('"') == std::string_view::npos;
        if (!numeric && !quoted) {
            return false;
        }
        text.remove_prefix(close + 1);
    }
    return true;
}

[[nodiscard]] std::optional<std::string> match_dot_form(std::string_view text, std::string_view kind)
{
    if (!text.starts_with(kind) || text.size() <= kind.size() || text[kind.size()] != '.') {
        return std::nullopt;
    }
    std::string_view rest = text.substr(kind.size() + 1);
    std::size_t length = identifier_length(rest);
    if (length == 0 || !is_traversal(rest.substr(length))) {
        return std::nullopt;
    }
    return std::string(rest.substr(0, length));
}

[[nodiscard]] std::optional<std::string> match_indexed_form(std::string_view text,
                                                            std::string_view kind)
{
    if (!text.starts_with(kind) || !text.substr(kind.size()).starts_with("[\"")) {
        return std::nullopt;
    }
    std::string_view rest = text.substr(kind.size() + 2);
    auto close = rest.find("\"]");
    if (close == std::string_view::npos || close == 0) {
        return std::nullopt;
    }
    std::string_view name = rest.substr(0, close);
    if (name.find_first_of("\"\\$%") != std::string_view::npos) {
        return std::nullopt;
    }
    if (!is_traversal(rest.substr(close + 2))) {
        return std::nullopt;
    }
    return std::string(name);
}

}  // namespace

std::optional<ResourceIdentity> resolve_reference(std::string_view expression,
                                                  std::span<const std::string> candidate_kinds)
{
    std::string_view text = unwrap_interpolation(common::trim(expression));
    for (const auto& kind : candidate_kinds) {
        if (kind.empty()) {
            continue;
        }
        if (auto name = match_dot_form(text, kind)) {
            return ResourceIdentity{.kind = kind, .name = std::move(*name)};
        }
        if (auto name = match_indexed_form(text, kind)) {
            return ResourceIdentity{.kind = kind, .name = std::move(*name)};
        }
    }
    return std::nullopt;
}

}  // namespace tfmigrate::reclass
