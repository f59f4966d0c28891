/**
 * @file text.cpp
 * @brief Text and file helpers
 */

#include "tfmigrate/common.hpp"

#include <cctype>
#include <fstream>
#include <iterator>

namespace tfmigrate::common {

namespace {

[[nodiscard]] bool is_space(char c) noexcept
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

std::string_view trim(std::string_view text)
{
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

std::vector<std::string_view> split_lines(std::string_view text)
{
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

bool is_identifier(std::string_view text)
{
    if (text.empty()) {
        return false;
    }
    const auto first = static_cast<unsigned char>(text.front());
    if (std::isalpha(first) == 0 && first != '_') {
        return false;
    }
    for (char c : text.substr(1)) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) == 0 && uc != '_' && uc != '-') {
            return false;
        }
    }
    return true;
}

Result<std::string> read_text_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(Error::make("IOError", "Failed to open file: " + path.string()));
    }
    return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

VoidResult write_text_file(const std::filesystem::path& path, std::string_view text)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(
            Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!out) {
        return std::unexpected(Error::make("IOError", "Failed to write file: " + path.string()));
    }
    return {};
}

}  // namespace tfmigrate::common
