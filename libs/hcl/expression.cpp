/**
 * @file expression.cpp
 * @brief Literal expression parsing and canonical value rendering
 */

#include "tfmigrate/hcl.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <format>
#include <limits>

namespace tfmigrate::hcl {

namespace {

[[nodiscard]] bool is_digit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

[[nodiscard]] bool is_identifier_start(char c) noexcept
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

[[nodiscard]] bool is_identifier_char(char c) noexcept
{
    return is_identifier_start(c) || is_digit(c) || c == '-';
}

void append_utf8(std::string& out, std::uint32_t code_point)
{
    if (code_point < 0x80) {
        out.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else if (code_point < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
}

/**
 * Recursive-descent reader for literal expressions. Every method returns
 * nullopt as soon as the text stops being a pure literal.
 */
class LiteralReader
{
public:
    explicit LiteralReader(std::string_view text)
        : m_text(text)
    {}

    [[nodiscard]] std::optional<Value> read()
    {
        skip_whitespace();
        auto value = read_value();
        if (!value) {
            return std::nullopt;
        }
        skip_whitespace();
        if (m_pos != m_text.size()) {
            return std::nullopt;
        }
        return value;
    }

private:
    [[nodiscard]] char peek(std::size_t offset = 0) const noexcept
    {
        std::size_t index = m_pos + offset;
        return index < m_text.size() ? m_text[index] : '\0';
    }

    void skip_whitespace()
    {
        while (m_pos < m_text.size()) {
            char c = m_text[m_pos];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
                ++m_pos;
            } else if (c == '#' || (c == '/' && peek(1) == '/')) {
                auto newline = m_text.find('\n', m_pos);
                m_pos = newline == std::string_view::npos ? m_text.size() : newline + 1;
            } else if (c == '/' && peek(1) == '*') {
                auto close = m_text.find("*/", m_pos + 2);
                m_pos = close == std::string_view::npos ? m_text.size() : close + 2;
            } else {
                break;
            }
        }
    }

    [[nodiscard]] std::optional<Value> read_value()
    {
        char c = peek();
        if (c == '"') {
            auto text = read_string();
            if (!text) {
                return std::nullopt;
            }
            return Value(std::move(*text));
        }
        if (c == '[') {
            return read_list();
        }
        if (c == '{') {
            return read_object();
        }
        if (is_digit(c) || (c == '-' && is_digit(peek(1)))) {
            return read_number();
        }
        if (is_identifier_start(c)) {
            std::size_t start = m_pos;
            while (is_identifier_char(peek())) {
                ++m_pos;
            }
            std::string_view word = m_text.substr(start, m_pos - start);
            if (word == "true") {
                return Value(true);
            }
            if (word == "false") {
                return Value(false);
            }
            if (word == "null") {
                return Value();
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<std::string> read_string()
    {
        ++m_pos;  // opening quote
        std::string out;
        while (m_pos < m_text.size()) {
            char c = m_text[m_pos];
            if (c == '"') {
                ++m_pos;
                return out;
            }
            if (c == '\n') {
                return std::nullopt;
            }
            if (c == '\\') {
                if (!read_escape(out)) {
                    return std::nullopt;
                }
                continue;
            }
            if ((c == '$' || c == '%') && peek(1) == c && peek(2) == '{') {
                out.push_back(c);
                out.push_back('{');
                m_pos += 3;
                continue;
            }
            if ((c == '$' || c == '%') && peek(1) == '{') {
                return std::nullopt;  // template interpolation or directive
            }
            out.push_back(c);
            ++m_pos;
        }
        return std::nullopt;
    }

    [[nodiscard]] bool read_escape(std::string& out)
    {
        char escaped = peek(1);
        m_pos += 2;
        switch (escaped) {
            case 'n':
                out.push_back('\n');
                return true;
            case 'r':
                out.push_back('\r');
                return true;
            case 't':
                out.push_back('\t');
                return true;
            case '"':
                out.push_back('"');
                return true;
            case '\\':
                out.push_back('\\');
                return true;
            case 'u':
            case 'U': {
                std::size_t digits = escaped == 'u' ? 4 : 8;
                if (m_pos + digits > m_text.size()) {
                    return false;
                }
                std::uint32_t code_point = 0;
                auto hex = m_text.substr(m_pos, digits);
                auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), code_point, 16);
                if (ec != std::errc{} || ptr != hex.data() + hex.size()) {
                    return false;
                }
                append_utf8(out, code_point);
                m_pos += digits;
                return true;
            }
            default:
                return false;
        }
    }

    [[nodiscard]] std::optional<Value> read_number()
    {
        std::size_t start = m_pos;
        if (peek() == '-') {
            ++m_pos;
        }
        while (is_digit(peek())) {
            ++m_pos;
        }
        if (peek() == '.' && is_digit(peek(1))) {
            ++m_pos;
            while (is_digit(peek())) {
                ++m_pos;
            }
        }
        if (peek() == 'e' || peek() == 'E') {
            ++m_pos;
            if (peek() == '+' || peek() == '-') {
                ++m_pos;
            }
            if (!is_digit(peek())) {
                return std::nullopt;
            }
            while (is_digit(peek())) {
                ++m_pos;
            }
        }
        if (is_identifier_char(peek()) || peek() == '.') {
            return std::nullopt;
        }
        std::string_view digits = m_text.substr(start, m_pos - start);
        double number = 0.0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), number);
        if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
            return std::nullopt;
        }
        return Value(number);
    }

    [[nodiscard]] std::optional<Value> read_list()
    {
        ++m_pos;  // '['
        List items;
        skip_whitespace();
        if (peek() == ']') {
            ++m_pos;
            return Value(std::move(items));
        }
        while (true) {
            skip_whitespace();
            if (peek() == ']') {  // trailing comma
                ++m_pos;
                return Value(std::move(items));
            }
            auto item = read_value();
            if (!item) {
                return std::nullopt;
            }
            items.push_back(std::move(*item));
            skip_whitespace();
            if (peek() == ',') {
                ++m_pos;
                continue;
            }
            if (peek() == ']') {
                ++m_pos;
                return Value(std::move(items));
            }
            return std::nullopt;
        }
    }

    [[nodiscard]] std::optional<std::string> read_key()
    {
        if (peek() == '"') {
            return read_string();
        }
        if (!is_identifier_start(peek())) {
            return std::nullopt;
        }
        std::size_t start = m_pos;
        while (is_identifier_char(peek())) {
            ++m_pos;
        }
        return std::string(m_text.substr(start, m_pos - start));
    }

    [[nodiscard]] std::optional<Value> read_object()
    {
        ++m_pos;  // '{'
        Object members;
        while (true) {
            skip_whitespace();
            if (peek() == '}') {
                ++m_pos;
                return Value(std::move(members));
            }
            auto key = read_key();
            if (!key) {
                return std::nullopt;
            }
            skip_whitespace();
            if (peek() != '=' && peek() != ':') {
                return std::nullopt;
            }
            ++m_pos;
            skip_whitespace();
            auto value = read_value();
            if (!value) {
                return std::nullopt;
            }
            members.push_back(Member{.key = std::move(*key), .value = std::move(*value)});
            skip_whitespace();
            if (peek() == ',') {
                ++m_pos;
            }
        }
    }

    std::string_view m_text;
    std::size_t m_pos = 0;
};

void append_indent(std::string& out, int depth)
{
    out.append(static_cast<std::size_t>(std::max(depth, 0)) * 2, ' ');
}

[[nodiscard]] std::string render_number(double number)
{
    constexpr double kMaxExactInteger = 9007199254740992.0;  // 2^53
    if (std::isfinite(number) && std::trunc(number) == number && std::fabs(number) <= kMaxExactInteger) {
        return std::format("{}", static_cast<long long>(number));
    }
    return std::format("{}", number);
}

[[nodiscard]] std::string render_key(const std::string& key)
{
    return common::is_identifier(key) ? key : quote(key);
}

}  // namespace

Value parse_expression(std::string_view expr)
{
    auto trimmed = common::trim(expr);
    if (auto literal = LiteralReader(trimmed).read()) {
        return std::move(*literal);
    }
    return Value(Expression{.text = std::string(trimmed)});
}

std::string quote(std::string_view text)
{
    std::string out = "\"";
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            case '$':
            case '%':
                out.push_back(c);
                if (i + 1 < text.size() && text[i + 1] == '{') {
                    out.push_back(c);
                }
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += std::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
    return out;
}

std::string render_value(const Value& value, int depth)
{
    if (value.is_null()) {
        return "null";
    }
    if (const auto* flag = value.as_bool()) {
        return *flag ? "true" : "false";
    }
    if (const auto* number = value.as_number()) {
        return render_number(*number);
    }
    if (const auto* text = value.as_string()) {
        return quote(*text);
    }
    if (const auto* expression = value.as_expression()) {
        return expression->text;
    }
    if (const auto* list = value.as_list()) {
        if (list->empty()) {
            return "[]";
        }
        std::string out = "[\n";
        for (const auto& item : *list) {
            append_indent(out, depth + 1);
            out += render_value(item, depth + 1);
            out += ",\n";
        }
        append_indent(out, depth);
        out += "]";
        return out;
    }

    const auto& object = *value.as_object();
    if (object.empty()) {
        return "{}";
    }
    std::size_t width = 0;
    for (const auto& member : object) {
        width = std::max(width, render_key(member.key).size());
    }
    std::string out = "{\n";
    for (const auto& member : object) {
        std::string key = render_key(member.key);
        append_indent(out, depth + 1);
        out += key;
        out.append(width - key.size(), ' ');
        out += " = ";
        out += render_value(member.value, depth + 1);
        out += '\n';
    }
    append_indent(out, depth);
    out += "}";
    return out;
}

}  // namespace tfmigrate::hcl
