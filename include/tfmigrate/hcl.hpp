#pragma once

/**
 * @file hcl.hpp
 * @brief Editable configuration tree for Terraform files
 *
 * The tree keeps every byte of its input: untouched blocks and trivia lines
 * (comments, blank lines) are written back verbatim, modified blocks are
 * re-rendered in canonical layout. Attribute expressions are stored as raw
 * text and exposed to the rest of the program as Values.
 */

#include "tfmigrate/common.hpp"
#include "tfmigrate/value.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tfmigrate::hcl {

class Block;

struct Attribute
{
    std::string name;
    std::string expr;     ///< Raw expression text, trimmed
    std::string comment;  ///< Same-line trailing comment, empty when absent
    std::string source;   ///< Original text including indentation and newline; empty once edited
};

/**
 * @brief Comment or blank line(s) kept verbatim
 */
struct Trivia
{
    std::string text;
};

class Body
{
public:
    using Node = std::variant<Attribute, std::unique_ptr<Block>, Trivia>;

    Body();
    ~Body();
    Body(Body&& other) noexcept;
    Body& operator=(Body&& other) noexcept;
    Body(const Body&) = delete;
    Body& operator=(const Body&) = delete;

    [[nodiscard]] const std::vector<Node>& nodes() const noexcept { return m_nodes; }

    [[nodiscard]] const Attribute* attribute(std::string_view name) const;
    [[nodiscard]] bool has_attribute(std::string_view name) const;

    /**
     * Literal value of an attribute (Expression when not a literal); nullopt when absent
     */
    [[nodiscard]] std::optional<Value> attribute_value(std::string_view name) const;

    /**
     * Values of every attribute in this body (nested blocks excluded)
     */
    [[nodiscard]] AttributeMap attribute_values() const;

    /**
     * Replace the expression of an existing attribute, or append a new one
     * after the last attribute of the body.
     */
    void set_attribute(std::string_view name, std::string expr);
    void set_attribute_value(std::string_view name, const Value& value);

    bool remove_attribute(std::string_view name);

    [[nodiscard]] std::vector<Block*> blocks();
    [[nodiscard]] std::vector<const Block*> blocks() const;
    [[nodiscard]] std::vector<const Block*> blocks_of_type(std::string_view type) const;

    /**
     * Remove a direct child block. A blank line left doubled by the removal is
     * dropped with it.
     */
    bool remove_block(const Block* block);

    /**
     * Append verbatim text; a separating newline is inserted when the body does
     * not already end with one.
     */
    void append_trivia(std::string text);

    /**
     * Parser entry points: add nodes without marking the body modified
     */
    void push_node(Node node);

    [[nodiscard]] bool modified() const;
    void mark_modified() noexcept { m_modified = true; }
    [[nodiscard]] bool self_modified() const noexcept { return m_modified; }

private:
    [[nodiscard]] std::ptrdiff_t find_attribute_index(std::string_view name) const;

    std::vector<Node> m_nodes;
    bool m_modified = false;
};

class Block
{
public:
    Block(std::string type, std::vector<std::string> labels);

    [[nodiscard]] const std::string& type() const noexcept { return m_type; }
    [[nodiscard]] const std::vector<std::string>& labels() const noexcept { return m_labels; }
    void set_label(std::size_t index, std::string value);

    [[nodiscard]] Body& body() noexcept { return m_body; }
    [[nodiscard]] const Body& body() const noexcept { return m_body; }

    /// Original text from the start of the header line through the closing brace line
    [[nodiscard]] const std::string& source() const noexcept { return m_source; }
    void set_source(std::string source) { m_source = std::move(source); }

    [[nodiscard]] bool modified() const { return m_header_modified || m_body.modified(); }

    /// resource "<kind>" "<name>" blocks
    [[nodiscard]] bool is_resource() const noexcept;
    [[nodiscard]] std::string_view resource_kind() const noexcept;
    [[nodiscard]] std::string_view resource_name() const noexcept;

private:
    std::string m_type;
    std::vector<std::string> m_labels;
    Body m_body;
    std::string m_source;
    bool m_header_modified = false;
};

/**
 * @brief One configuration unit (a single .tf file)
 */
class File
{
public:
    explicit File(std::string filename = {});

    [[nodiscard]] const std::string& filename() const noexcept { return m_filename; }
    [[nodiscard]] Body& body() noexcept { return m_body; }
    [[nodiscard]] const Body& body() const noexcept { return m_body; }

    /**
     * Top-level resource blocks in declaration order
     */
    [[nodiscard]] std::vector<Block*> resources();
    [[nodiscard]] std::vector<const Block*> resources() const;
    [[nodiscard]] Block* find_resource(std::string_view kind, std::string_view name);

    /// Set once the cross-resource merge ran on this unit in the current process
    [[nodiscard]] bool merge_applied() const noexcept { return m_merge_applied; }
    void set_merge_applied(bool applied) noexcept { m_merge_applied = applied; }

private:
    std::string m_filename;
    Body m_body;
    bool m_merge_applied = false;
};

// ============================================================================
// Parsing and writing
// ============================================================================

[[nodiscard]] Result<File> parse(std::string_view text, std::string filename = {});

[[nodiscard]] std::string write(const File& file);

/**
 * Text of a single block: its original source when unmodified
 */
[[nodiscard]] std::string write_block(const Block& block, int depth = 0);

// ============================================================================
// Expressions
// ============================================================================

/**
 * Interpret expression text as a literal Value. Anything that is not a pure
 * literal (references, calls, operators, interpolated templates, heredocs)
 * yields an Expression holding the trimmed text.
 */
[[nodiscard]] Value parse_expression(std::string_view expr);

/**
 * Render a Value as expression text. Continuation lines of lists and objects
 * are indented relative to @p depth (two spaces per level).
 */
[[nodiscard]] std::string render_value(const Value& value, int depth = 1);

/**
 * Quote and escape a string literal
 */
[[nodiscard]] std::string quote(std::string_view text);

}  // namespace tfmigrate::hcl
