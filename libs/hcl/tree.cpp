/**
 * @file tree.cpp
 * @brief Body, Block and File editing operations
 */

#include "tfmigrate/hcl.hpp"

#include <algorithm>
#include <iterator>

namespace tfmigrate::hcl {

namespace {

[[nodiscard]] bool is_blank_trivia(const Body::Node& node)
{
    const auto* trivia = std::get_if<Trivia>(&node);
    return trivia != nullptr && common::trim(trivia->text).empty();
}

[[nodiscard]] bool ends_with_newline(const Body::Node& node)
{
    if (const auto* trivia = std::get_if<Trivia>(&node)) {
        return trivia->text.ends_with('\n');
    }
    if (const auto* attribute = std::get_if<Attribute>(&node)) {
        return attribute->source.empty() || attribute->source.ends_with('\n');
    }
    const auto& block = std::get<std::unique_ptr<Block>>(node);
    return block->modified() || block->source().empty() || block->source().ends_with('\n');
}

}  // namespace

// ============================================================================
// Body
// ============================================================================

Body::Body() = default;
Body::~Body() = default;
Body::Body(Body&& other) noexcept = default;
Body& Body::operator=(Body&& other) noexcept = default;

std::ptrdiff_t Body::find_attribute_index(std::string_view name) const
{
    for (std::size_t i = 0; i < m_nodes.size(); ++i) {
        const auto* attribute = std::get_if<Attribute>(&m_nodes[i]);
        if (attribute != nullptr && attribute->name == name) {
            return static_cast<std::ptrdiff_t>(i);
        }
    }
    return -1;
}

const Attribute* Body::attribute(std::string_view name) const
{
    auto index = find_attribute_index(name);
    if (index < 0) {
        return nullptr;
    }
    return &std::get<Attribute>(m_nodes[static_cast<std::size_t>(index)]);
}

bool Body::has_attribute(std::string_view name) const
{
    return find_attribute_index(name) >= 0;
}

std::optional<Value> Body::attribute_value(std::string_view name) const
{
    const Attribute* found = attribute(name);
    if (found == nullptr) {
        return std::nullopt;
    }
    return parse_expression(found->expr);
}

AttributeMap Body::attribute_values() const
{
    AttributeMap values;
    for (const auto& node : m_nodes) {
        if (const auto* attribute = std::get_if<Attribute>(&node)) {
            values.insert_or_assign(attribute->name, parse_expression(attribute->expr));
        }
    }
    return values;
}

void Body::set_attribute(std::string_view name, std::string expr)
{
    m_modified = true;
    auto index = find_attribute_index(name);
    if (index >= 0) {
        auto& existing = std::get<Attribute>(m_nodes[static_cast<std::size_t>(index)]);
        existing.expr = std::move(expr);
        existing.source.clear();
        return;
    }

    Attribute added{.name = std::string(name), .expr = std::move(expr), .comment = {}, .source = {}};
    auto last_attribute = std::find_if(m_nodes.rbegin(), m_nodes.rend(), [](const Node& node) {
        return std::holds_alternative<Attribute>(node);
    });
    if (last_attribute != m_nodes.rend()) {
        m_nodes.insert(last_attribute.base(), std::move(added));
        return;
    }
    auto first_block = std::find_if(m_nodes.begin(), m_nodes.end(), [](const Node& node) {
        return std::holds_alternative<std::unique_ptr<Block>>(node);
    });
    m_nodes.insert(first_block, std::move(added));
}

void Body::set_attribute_value(std::string_view name, const Value& value)
{
    set_attribute(name, render_value(value));
}

bool Body::remove_attribute(std::string_view name)
{
    auto index = find_attribute_index(name);
    if (index < 0) {
        return false;
    }
    m_nodes.erase(m_nodes.begin() + index);
    m_modified = true;
    return true;
}

std::vector<Block*> Body::blocks()
{
    std::vector<Block*> result;
    for (auto& node : m_nodes) {
        if (auto* block = std::get_if<std::unique_ptr<Block>>(&node)) {
            result.push_back(block->get());
        }
    }
    return result;
}

std::vector<const Block*> Body::blocks() const
{
    std::vector<const Block*> result;
    for (const auto& node : m_nodes) {
        if (const auto* block = std::get_if<std::unique_ptr<Block>>(&node)) {
            result.push_back(block->get());
        }
    }
    return result;
}

std::vector<const Block*> Body::blocks_of_type(std::string_view type) const
{
    std::vector<const Block*> result;
    for (const Block* block : blocks()) {
        if (block->type() == type) {
            result.push_back(block);
        }
    }
    return result;
}

bool Body::remove_block(const Block* block)
{
    auto it = std::find_if(m_nodes.begin(), m_nodes.end(), [block](const Node& node) {
        const auto* held = std::get_if<std::unique_ptr<Block>>(&node);
        return held != nullptr && held->get() == block;
    });
    if (it == m_nodes.end()) {
        return false;
    }
    auto index = static_cast<std::size_t>(std::distance(m_nodes.begin(), it));
    m_nodes.erase(it);
    if (index > 0 && is_blank_trivia(m_nodes[index - 1])
        && (index == m_nodes.size() || is_blank_trivia(m_nodes[index]))) {
        m_nodes.erase(m_nodes.begin() + static_cast<std::ptrdiff_t>(index - 1));
    }
    m_modified = true;
    return true;
}

void Body::append_trivia(std::string text)
{
    if (!m_nodes.empty() && !ends_with_newline(m_nodes.back())) {
        text.insert(text.begin(), '\n');
    }
    m_nodes.emplace_back(Trivia{.text = std::move(text)});
    m_modified = true;
}

void Body::push_node(Node node)
{
    m_nodes.push_back(std::move(node));
}

bool Body::modified() const
{
    if (m_modified) {
        return true;
    }
    return std::ranges::any_of(blocks(), [](const Block* block) { return block->modified(); });
}

// ============================================================================
// Block
// ============================================================================

Block::Block(std::string type, std::vector<std::string> labels)
    : m_type(std::move(type))
    , m_labels(std::move(labels))
{}

void Block::set_label(std::size_t index, std::string value)
{
    if (index >= m_labels.size()) {
        m_labels.resize(index + 1);
    }
    m_labels[index] = std::move(value);
    m_header_modified = true;
}

bool Block::is_resource() const noexcept
{
    return m_type == "resource" && m_labels.size() >= 2;
}

std::string_view Block::resource_kind() const noexcept
{
    return is_resource() ? std::string_view(m_labels[0]) : std::string_view{};
}

std::string_view Block::resource_name() const noexcept
{
    return is_resource() ? std::string_view(m_labels[1]) : std::string_view{};
}

// ============================================================================
// File
// ============================================================================

File::File(std::string filename)
    : m_filename(std::move(filename))
{}

std::vector<Block*> File::resources()
{
    std::vector<Block*> result;
    for (Block* block : m_body.blocks()) {
        if (block->is_resource()) {
            result.push_back(block);
        }
    }
    return result;
}

std::vector<const Block*> File::resources() const
{
    std::vector<const Block*> result;
    for (const Block* block : m_body.blocks()) {
        if (block->is_resource()) {
            result.push_back(block);
        }
    }
    return result;
}

Block* File::find_resource(std::string_view kind, std::string_view name)
{
    for (Block* block : resources()) {
        if (block->resource_kind() == kind && block->resource_name() == name) {
            return block;
        }
    }
    return nullptr;
}

}  // namespace tfmigrate::hcl
