#pragma once

#include "tagtree/core/diagnostics.h"
#include "tagtree/dom/node.h"

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace tagtree::html {

std::unordered_set<std::string> default_void_elements();

struct RenderOptions {
    // Emit `newline` after every open tag and close tag.
    bool line_breaks = true;
    std::string newline = "\n";
    // Lower-case names of elements that never get a closing tag.
    std::unordered_set<std::string> void_elements = default_void_elements();
};

// Tree nodes only; attribute values are not counted.
struct WriterStats {
    std::size_t nodes = 0;
    std::size_t elements = 0;
    std::size_t bytes = 0;
};

// Serializes nodes into a stream, escaping everything except unsafe text and
// sentinel literals.
class Writer {
public:
    explicit Writer(std::ostream& out, RenderOptions options = {});

    void write(const dom::Node& node);
    void write(const std::vector<dom::Node>& nodes);

    const RenderOptions& options() const { return options_; }
    const WriterStats& stats() const { return stats_; }

private:
    void write_text(std::string_view text);
    void write_raw(std::string_view text);
    void write_element(const dom::Element& element);
    void write_open_tag(const dom::Element& element, const std::string& name);
    void write_attribute(const dom::Attribute& attr);
    void write_attribute_value(const dom::Node& value);
    void write_line_break();

    bool is_void(const std::string& lowered_name) const;

    std::ostream& out_;
    RenderOptions options_;
    WriterStats stats_;
};

std::string render_to_string(const std::vector<dom::Node>& nodes,
                             const RenderOptions& options = {},
                             core::DiagnosticEmitter* diagnostics = nullptr);
std::string render_to_string(const dom::Node& node,
                             const RenderOptions& options = {},
                             core::DiagnosticEmitter* diagnostics = nullptr);

// Throws std::runtime_error when `out` fails while rendering.
void render_to_stream(const std::vector<dom::Node>& nodes, std::ostream& out,
                      const RenderOptions& options = {},
                      core::DiagnosticEmitter* diagnostics = nullptr);
void render_to_stream(const dom::Node& node, std::ostream& out,
                      const RenderOptions& options = {},
                      core::DiagnosticEmitter* diagnostics = nullptr);

} // namespace tagtree::html
