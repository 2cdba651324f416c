#include "tagtree/html/writer.h"

#include "tagtree/core/config.h"
#include "tagtree/html/escape.h"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace tagtree::html {

namespace {

constexpr char kModule[] = "render";

} // namespace

std::unordered_set<std::string> default_void_elements() {
    std::unordered_set<std::string> names;
    for (std::string_view name : core::config::kVoidElements) {
        names.emplace(name);
    }
    return names;
}

// ---------------------------------------------------------------------------
// Writer
// ---------------------------------------------------------------------------

Writer::Writer(std::ostream& out, RenderOptions options)
    : out_(out), options_(std::move(options)) {}

void Writer::write(const std::vector<dom::Node>& nodes) {
    for (const auto& node : nodes) {
        write(node);
    }
}

void Writer::write(const dom::Node& node) {
    ++stats_.nodes;
    switch (node.type()) {
        case dom::NodeType::Character: {
            char c = node.character();
            write_text(std::string_view(&c, 1));
            break;
        }
        case dom::NodeType::Text:
            write_text(node.data());
            break;
        case dom::NodeType::Unsafe:
        case dom::NodeType::Sentinel:
            write_raw(node.data());
            break;
        case dom::NodeType::Sequence:
            for (const auto& member : node.members()) {
                write(member);
            }
            break;
        case dom::NodeType::Opaque:
            write_text(node.renderable().to_text());
            break;
        case dom::NodeType::Element:
            write_element(node.element());
            break;
    }
}

void Writer::write_text(std::string_view text) {
    if (!needs_escaping(text)) {
        write_raw(text);
        return;
    }
    write_raw(escape(text));
}

void Writer::write_raw(std::string_view text) {
    out_.write(text.data(), static_cast<std::streamsize>(text.size()));
    stats_.bytes += text.size();
}

void Writer::write_line_break() {
    if (options_.line_breaks) {
        write_raw(options_.newline);
    }
}

bool Writer::is_void(const std::string& lowered_name) const {
    return options_.void_elements.find(lowered_name) != options_.void_elements.end();
}

void Writer::write_element(const dom::Element& element) {
    ++stats_.elements;
    const std::string name = dom::to_lower_ascii(element.name());

    write_open_tag(element, name);
    for (const auto& child : element.children()) {
        write(child);
    }
    if (is_void(name)) {
        return;
    }
    write_raw("</");
    write_raw(name);
    write_raw(">");
    write_line_break();
}

void Writer::write_open_tag(const dom::Element& element, const std::string& name) {
    write_raw("<");
    write_raw(name);
    for (const auto& attr : element.attributes()) {
        write_attribute(attr);
    }
    write_raw(">");
    write_line_break();
}

void Writer::write_attribute(const dom::Attribute& attr) {
    if (!attr.value.present()) {
        return;
    }
    const std::string name = dom::to_lower_ascii(attr.name);
    write_raw(" ");
    write_raw(name);
    write_raw("=\"");
    if (attr.value.is_flag()) {
        write_text(name);
    } else {
        write_attribute_value(attr.value.value());
    }
    write_raw("\"");
}

void Writer::write_attribute_value(const dom::Node& value) {
    switch (value.type()) {
        case dom::NodeType::Sequence:
            for (const auto& member : value.members()) {
                write_attribute_value(member);
            }
            break;
        case dom::NodeType::Element:
        case dom::NodeType::Sentinel: {
            // Markup inside an attribute is rendered first, then quoted as text.
            std::ostringstream nested;
            Writer inner(nested, options_);
            inner.write(value);
            write_text(nested.str());
            break;
        }
        case dom::NodeType::Character: {
            char c = value.character();
            write_text(std::string_view(&c, 1));
            break;
        }
        case dom::NodeType::Text:
            write_text(value.data());
            break;
        case dom::NodeType::Unsafe:
            write_raw(value.data());
            break;
        case dom::NodeType::Opaque:
            write_text(value.renderable().to_text());
            break;
    }
}

// ---------------------------------------------------------------------------
// Entry points
// ---------------------------------------------------------------------------

void render_to_stream(const std::vector<dom::Node>& nodes, std::ostream& out,
                      const RenderOptions& options,
                      core::DiagnosticEmitter* diagnostics) {
    Writer writer(out, options);
    writer.write(nodes);
    out.flush();

    if (!out) {
        if (diagnostics) {
            diagnostics->error(kModule, "flush",
                               "output stream failed after " +
                                   std::to_string(writer.stats().bytes) + " bytes");
        }
        throw std::runtime_error("render_to_stream: output stream failed");
    }

    if (diagnostics) {
        const WriterStats& stats = writer.stats();
        diagnostics->info(kModule, "write",
                          "wrote " + std::to_string(stats.nodes) + " nodes (" +
                              std::to_string(stats.elements) + " elements, " +
                              std::to_string(stats.bytes) + " bytes)");
    }
}

void render_to_stream(const dom::Node& node, std::ostream& out,
                      const RenderOptions& options,
                      core::DiagnosticEmitter* diagnostics) {
    render_to_stream(std::vector<dom::Node>{node}, out, options, diagnostics);
}

std::string render_to_string(const std::vector<dom::Node>& nodes,
                             const RenderOptions& options,
                             core::DiagnosticEmitter* diagnostics) {
    std::ostringstream oss;
    render_to_stream(nodes, oss, options, diagnostics);
    return oss.str();
}

std::string render_to_string(const dom::Node& node,
                             const RenderOptions& options,
                             core::DiagnosticEmitter* diagnostics) {
    return render_to_string(std::vector<dom::Node>{node}, options, diagnostics);
}

} // namespace tagtree::html
