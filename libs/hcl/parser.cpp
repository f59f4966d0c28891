/**
 * @file parser.cpp
 * @brief Byte-preserving parser for Terraform configuration files
 *
 * Every input byte ends up in exactly one node: attributes and blocks keep
 * their original text in `source`, everything between them is Trivia.
 * Writing an unmodified tree therefore reproduces the input exactly.
 */

#include "tfmigrate/hcl.hpp"

#include <algorithm>
#include <format>

namespace tfmigrate::hcl {

namespace {

[[nodiscard]] bool is_identifier_char(char c) noexcept
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_'
           || c == '-';
}

[[nodiscard]] bool is_space(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\r';
}

class Parser
{
public:
    Parser(std::string_view text, std::string filename)
        : m_text(text)
        , m_filename(std::move(filename))
    {}

    [[nodiscard]] Result<File> run()
    {
        File file(m_filename);
        auto parsed = parse_body(file.body(), /*top_level=*/true);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        return file;
    }

private:
    [[nodiscard]] bool at_end() const noexcept { return m_pos >= m_text.size(); }

    [[nodiscard]] char peek(std::size_t offset = 0) const noexcept
    {
        std::size_t index = m_pos + offset;
        return index < m_text.size() ? m_text[index] : '\0';
    }

    [[nodiscard]] bool starts_with(std::size_t pos, std::string_view prefix) const noexcept
    {
        return m_text.substr(std::min(pos, m_text.size())).starts_with(prefix);
    }

    [[nodiscard]] Error error_at(std::size_t pos, std::string_view message) const
    {
        std::size_t line = 1;
        std::size_t column = 1;
        for (std::size_t i = 0; i < pos && i < m_text.size(); ++i) {
            if (m_text[i] == '\n') {
                ++line;
                column = 1;
            } else {
                ++column;
            }
        }
        std::string_view name = m_filename.empty() ? std::string_view("<input>") : m_filename;
        return Error::make("HclParseError", std::format("{}:{}:{}: {}", name, line, column, message));
    }

    void skip_spaces() noexcept
    {
        while (!at_end() && is_space(peek())) {
            ++m_pos;
        }
    }

    /// Position just past the next newline (or end of input)
    [[nodiscard]] std::size_t line_end(std::size_t pos) const noexcept
    {
        auto newline = m_text.find('\n', pos);
        return newline == std::string_view::npos ? m_text.size() : newline + 1;
    }

    [[nodiscard]] bool rest_of_line_blank(std::size_t pos) const noexcept
    {
        while (pos < m_text.size() && m_text[pos] != '\n') {
            if (!is_space(m_text[pos])) {
                return false;
            }
            ++pos;
        }
        return true;
    }

    [[nodiscard]] std::string_view read_identifier()
    {
        std::size_t start = m_pos;
        while (!at_end() && is_identifier_char(peek())) {
            ++m_pos;
        }
        return m_text.substr(start, m_pos - start);
    }

    /**
     * Consume a same-line comment (if any) and the end of the current line.
     * Fails when other text remains on the line.
     */
    [[nodiscard]] Result<std::string> finish_line()
    {
        skip_spaces();
        std::string comment;
        if (starts_with(m_pos, "#") || starts_with(m_pos, "//")) {
            std::size_t start = m_pos;
            m_pos = line_end(m_pos);
            comment = std::string(common::trim(m_text.substr(start, m_pos - start)));
            return comment;
        }
        if (starts_with(m_pos, "/*")) {
            auto close = m_text.find("*/", m_pos + 2);
            if (close == std::string_view::npos) {
                return std::unexpected(error_at(m_pos, "unterminated comment"));
            }
            comment = std::string(m_text.substr(m_pos, close + 2 - m_pos));
            m_pos = close + 2;
            skip_spaces();
        }
        if (!at_end() && peek() != '\n') {
            return std::unexpected(error_at(m_pos, "unexpected text at end of line"));
        }
        m_pos = line_end(m_pos);
        return comment;
    }

    // ------------------------------------------------------------------------
    // Expressions
    // ------------------------------------------------------------------------

    /// pos points at '"'; returns the position just past the closing quote
    [[nodiscard]] Result<std::size_t> skip_string(std::size_t pos) const
    {
        std::size_t start = pos;
        ++pos;
        while (pos < m_text.size()) {
            char c = m_text[pos];
            if (c == '\\') {
                pos += 2;
                continue;
            }
            if (c == '"') {
                return pos + 1;
            }
            if (c == '\n') {
                break;
            }
            if ((c == '$' || c == '%') && pos + 1 < m_text.size()) {
                if (m_text[pos + 1] == c && pos + 2 < m_text.size() && m_text[pos + 2] == '{') {
                    pos += 3;
                    continue;
                }
                if (m_text[pos + 1] == '{') {
                    auto end = skip_template(pos + 2);
                    if (!end) {
                        return std::unexpected(end.error());
                    }
                    pos = *end;
                    continue;
                }
            }
            ++pos;
        }
        return std::unexpected(error_at(start, "unterminated string"));
    }

    /// pos is just inside "${"; returns the position past the matching '}'
    [[nodiscard]] Result<std::size_t> skip_template(std::size_t pos) const
    {
        std::size_t start = pos;
        int depth = 1;
        while (pos < m_text.size()) {
            char c = m_text[pos];
            if (c == '"') {
                auto end = skip_string(pos);
                if (!end) {
                    return std::unexpected(end.error());
                }
                pos = *end;
                continue;
            }
            if (c == '{') {
                ++depth;
            } else if (c == '}') {
                if (--depth == 0) {
                    return pos + 1;
                }
            }
            ++pos;
        }
        return std::unexpected(error_at(start, "unterminated template interpolation"));
    }

    /// pos points at "<<"; returns the position just past the terminator word
    [[nodiscard]] Result<std::size_t> skip_heredoc(std::size_t pos) const
    {
        std::size_t start = pos;
        pos += 2;
        if (pos < m_text.size() && m_text[pos] == '-') {
            ++pos;
        }
        std::size_t word_start = pos;
        while (pos < m_text.size() && is_identifier_char(m_text[pos])) {
            ++pos;
        }
        std::string_view word = m_text.substr(word_start, pos - word_start);
        if (word.empty()) {
            return std::unexpected(error_at(start, "invalid heredoc marker"));
        }
        pos = line_end(pos);
        while (pos < m_text.size()) {
            std::size_t next = line_end(pos);
            std::string_view line = m_text.substr(pos, next - pos);
            if (common::trim(line) == word) {
                return pos + line.find(word) + word.size();
            }
            pos = next;
        }
        return std::unexpected(error_at(start, std::format("unterminated heredoc '{}'", word)));
    }

    /**
     * Find the end of an expression starting at m_pos. At nesting depth zero
     * the expression ends at a newline or comment; inside a single-line block
     * it also ends at the block's closing brace.
     */
    [[nodiscard]] Result<std::size_t> scan_expression(bool inline_block) const
    {
        std::size_t pos = m_pos;
        int depth = 0;
        while (pos < m_text.size()) {
            char c = m_text[pos];
            if (c == '"') {
                auto end = skip_string(pos);
                if (!end) {
                    return std::unexpected(end.error());
                }
                pos = *end;
                continue;
            }
            if (c == '<' && starts_with(pos, "<<") && !starts_with(pos, "<<=")) {
                auto end = skip_heredoc(pos);
                if (!end) {
                    return std::unexpected(end.error());
                }
                pos = *end;
                continue;
            }
            if (c == '#' || starts_with(pos, "//")) {
                if (depth == 0) {
                    return pos;
                }
                pos = line_end(pos);
                continue;
            }
            if (starts_with(pos, "/*")) {
                if (depth == 0) {
                    return pos;
                }
                auto close = m_text.find("*/", pos + 2);
                if (close == std::string_view::npos) {
                    return std::unexpected(error_at(pos, "unterminated comment"));
                }
                pos = close + 2;
                continue;
            }
            if (c == '\n' && depth == 0) {
                return pos;
            }
            if (c == '(' || c == '[' || c == '{') {
                ++depth;
            } else if (c == ')' || c == ']' || c == '}') {
                if (depth == 0) {
                    if (inline_block && c == '}') {
                        return pos;
                    }
                    return std::unexpected(error_at(pos, std::format("unexpected '{}'", c)));
                }
                --depth;
            }
            ++pos;
        }
        if (depth != 0) {
            return std::unexpected(error_at(m_pos, "unterminated expression"));
        }
        return pos;
    }

    // ------------------------------------------------------------------------
    // Structure
    // ------------------------------------------------------------------------

    [[nodiscard]] Result<std::string> read_label()
    {
        if (peek() == '"') {
            auto end = skip_string(m_pos);
            if (!end) {
                return std::unexpected(end.error());
            }
            Value label = parse_expression(m_text.substr(m_pos, *end - m_pos));
            m_pos = *end;
            if (const auto* text = label.as_string()) {
                return *text;
            }
            return std::unexpected(error_at(m_pos, "block labels must be string literals"));
        }
        std::string_view ident = read_identifier();
        if (ident.empty()) {
            return std::unexpected(error_at(m_pos, "expected block label or '{'"));
        }
        return std::string(ident);
    }

    [[nodiscard]] VoidResult parse_attribute(Body& body,
                                             std::size_t item_start,
                                             std::string_view name,
                                             bool inline_block)
    {
        ++m_pos;  // '='
        skip_spaces();
        auto end = scan_expression(inline_block);
        if (!end) {
            return std::unexpected(end.error());
        }
        std::string expr(common::trim(m_text.substr(m_pos, *end - m_pos)));
        if (expr.empty()) {
            return std::unexpected(error_at(m_pos, std::format("missing value for '{}'", name)));
        }
        m_pos = *end;

        std::string comment;
        if (!inline_block) {
            auto line_comment = finish_line();
            if (!line_comment) {
                return std::unexpected(line_comment.error());
            }
            comment = std::move(*line_comment);
        }
        body.push_node(Attribute{
            .name = std::string(name),
            .expr = std::move(expr),
            .comment = std::move(comment),
            .source = std::string(m_text.substr(item_start, m_pos - item_start)),
        });
        return {};
    }

    [[nodiscard]] VoidResult parse_block(Body& body, std::size_t item_start, std::string_view type)
    {
        std::vector<std::string> labels;
        while (true) {
            skip_spaces();
            if (at_end() || peek() == '\n') {
                return std::unexpected(error_at(m_pos, "expected '{' after block header"));
            }
            if (peek() == '{') {
                ++m_pos;
                break;
            }
            auto label = read_label();
            if (!label) {
                return std::unexpected(label.error());
            }
            labels.push_back(std::move(*label));
        }

        auto block = std::make_unique<Block>(std::string(type), std::move(labels));
        skip_spaces();
        bool multi_line = at_end() || peek() == '\n' || starts_with(m_pos, "#") || starts_with(m_pos, "//");
        if (multi_line) {
            m_pos = line_end(m_pos);
            auto inner = parse_body(block->body(), /*top_level=*/false);
            if (!inner) {
                return std::unexpected(inner.error());
            }
            skip_spaces();
            ++m_pos;  // '}'
        } else if (peek() == '}') {
            ++m_pos;
        } else {
            std::size_t attribute_start = m_pos;
            std::string_view name = read_identifier();
            skip_spaces();
            if (name.empty() || peek() != '=') {
                return std::unexpected(error_at(m_pos, "expected attribute in single-line block"));
            }
            auto attribute = parse_attribute(block->body(), attribute_start, name, /*inline_block=*/true);
            if (!attribute) {
                return std::unexpected(attribute.error());
            }
            skip_spaces();
            if (peek() != '}') {
                return std::unexpected(error_at(m_pos, "expected '}' closing single-line block"));
            }
            ++m_pos;
        }

        auto rest = finish_line();
        if (!rest) {
            return std::unexpected(rest.error());
        }
        block->set_source(std::string(m_text.substr(item_start, m_pos - item_start)));
        body.push_node(std::move(block));
        return {};
    }

    [[nodiscard]] VoidResult parse_body(Body& body, bool top_level)
    {
        while (true) {
            std::size_t item_start = m_pos;
            skip_spaces();

            if (at_end()) {
                if (!top_level) {
                    return std::unexpected(error_at(m_pos, "unexpected end of file, expected '}'"));
                }
                if (m_pos > item_start) {
                    body.push_node(Trivia{.text = std::string(m_text.substr(item_start))});
                }
                return {};
            }

            if (peek() == '\n' || peek() == '#' || starts_with(m_pos, "//")) {
                m_pos = line_end(m_pos);
                body.push_node(Trivia{.text = std::string(m_text.substr(item_start, m_pos - item_start))});
                continue;
            }

            if (starts_with(m_pos, "/*")) {
                auto close = m_text.find("*/", m_pos + 2);
                if (close == std::string_view::npos) {
                    return std::unexpected(error_at(m_pos, "unterminated comment"));
                }
                m_pos = close + 2;
                if (rest_of_line_blank(m_pos)) {
                    m_pos = line_end(m_pos);
                }
                body.push_node(Trivia{.text = std::string(m_text.substr(item_start, m_pos - item_start))});
                continue;
            }

            if (peek() == '}') {
                if (top_level) {
                    return std::unexpected(error_at(m_pos, "unexpected '}'"));
                }
                m_pos = item_start;
                return {};
            }

            std::string_view name = read_identifier();
            if (name.empty()) {
                return std::unexpected(
                    error_at(m_pos, std::format("unexpected character '{}'", peek())));
            }
            skip_spaces();
            VoidResult item = (peek() == '=' && peek(1) != '=')
                                  ? parse_attribute(body, item_start, name, /*inline_block=*/false)
                                  : parse_block(body, item_start, name);
            if (!item) {
                return std::unexpected(item.error());
            }
        }
    }

    std::string_view m_text;
    std::string m_filename;
    std::size_t m_pos = 0;
};

}  // namespace

Result<File> parse(std::string_view text, std::string filename)
{
    return Parser(text, std::move(filename)).run();
}

}  // namespace tfmigrate::hcl
