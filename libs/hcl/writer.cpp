/**
 * @file writer.cpp
 * @brief Write configuration trees back to text
 */

#include "tfmigrate/hcl.hpp"

#include <algorithm>

namespace tfmigrate::hcl {

namespace {

void append_indent(std::string& out, int depth)
{
    out.append(static_cast<std::size_t>(std::max(depth, 0)) * 2, ' ');
}

void ensure_line_start(std::string& out)
{
    if (!out.empty() && out.back() != '\n') {
        out.push_back('\n');
    }
}

[[nodiscard]] bool is_single_line(const Attribute& attribute)
{
    return !attribute.expr.contains('\n');
}

/**
 * Name column width for each attribute node: attributes in a run of
 * consecutive single-line attributes share the widest name of the run.
 */
[[nodiscard]] std::vector<std::size_t> alignment_widths(const std::vector<Body::Node>& nodes)
{
    std::vector<std::size_t> widths(nodes.size(), 0);
    std::size_t run_start = 0;
    std::size_t run_width = 0;

    auto close_run = [&](std::size_t run_end) {
        for (std::size_t i = run_start; i < run_end; ++i) {
            widths[i] = run_width;
        }
        run_width = 0;
    };

    for (std::size_t i = 0; i < nodes.size(); ++i) {
        const auto* attribute = std::get_if<Attribute>(&nodes[i]);
        if (attribute == nullptr || !is_single_line(*attribute)) {
            close_run(i);
            run_start = i + 1;
            if (attribute != nullptr) {
                widths[i] = attribute->name.size();
            }
            continue;
        }
        run_width = std::max(run_width, attribute->name.size());
    }
    close_run(nodes.size());
    return widths;
}

void render_attribute(const Attribute& attribute, int depth, std::size_t width, std::string& out)
{
    ensure_line_start(out);
    append_indent(out, depth);
    out += attribute.name;
    if (width > attribute.name.size()) {
        out.append(width - attribute.name.size(), ' ');
    }
    out += " = ";
    out += attribute.expr;
    if (!attribute.comment.empty()) {
        out += ' ';
        out += attribute.comment;
    }
    out += '\n';
}

void write_body(const Body& body, int depth, std::string& out);

void render_block(const Block& block, int depth, std::string& out)
{
    ensure_line_start(out);
    append_indent(out, depth);
    out += block.type();
    for (const auto& label : block.labels()) {
        out += ' ';
        out += quote(label);
    }
    out += " {\n";
    write_body(block.body(), depth + 1, out);
    ensure_line_start(out);
    append_indent(out, depth);
    out += "}\n";
}

void write_body(const Body& body, int depth, std::string& out)
{
    const auto& nodes = body.nodes();
    const bool verbatim = !body.self_modified();
    const auto widths = verbatim ? std::vector<std::size_t>{} : alignment_widths(nodes);

    for (std::size_t i = 0; i < nodes.size(); ++i) {
        const auto& node = nodes[i];
        if (const auto* trivia = std::get_if<Trivia>(&node)) {
            out += trivia->text;
        } else if (const auto* attribute = std::get_if<Attribute>(&node)) {
            if (verbatim && !attribute->source.empty()) {
                out += attribute->source;
            } else {
                render_attribute(*attribute,
                                 depth,
                                 widths.empty() ? attribute->name.size() : widths[i],
                                 out);
            }
        } else {
            const Block& block = *std::get<std::unique_ptr<Block>>(node);
            if (!block.modified() && !block.source().empty()) {
                out += block.source();
            } else {
                render_block(block, depth, out);
            }
        }
    }
}

}  // namespace

std::string write(const File& file)
{
    std::string out;
    write_body(file.body(), 0, out);
    return out;
}

std::string write_block(const Block& block, int depth)
{
    if (!block.modified() && !block.source().empty()) {
        return block.source();
    }
    std::string out;
    render_block(block, depth, out);
    return out;
}

}  // namespace tfmigrate::hcl
