#include "tagtree/html/escape.h"

namespace tagtree::html {

std::string_view escape_char(char c) {
    switch (c) {
        case '<': return "&lt;";
        case '>': return "&gt;";
        case '&': return "&amp;";
        case '"': return "&quot;";
        default:  return {};
    }
}

std::string escape(std::string_view text) {
    std::string output;
    output.reserve(text.size());
    escape_to(text, output);
    return output;
}

void escape_to(std::string_view text, std::string& output) {
    for (char c : text) {
        std::string_view replacement = escape_char(c);
        if (replacement.empty()) {
            output.push_back(c);
        } else {
            output.append(replacement);
        }
    }
}

void escape_to(std::string_view text, std::ostream& out) {
    // Copy runs of plain characters in one call.
    std::size_t run_start = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        std::string_view replacement = escape_char(text[i]);
        if (replacement.empty()) continue;
        out.write(text.data() + run_start, static_cast<std::streamsize>(i - run_start));
        out.write(replacement.data(), static_cast<std::streamsize>(replacement.size()));
        run_start = i + 1;
    }
    out.write(text.data() + run_start, static_cast<std::streamsize>(text.size() - run_start));
}

bool needs_escaping(std::string_view text) {
    for (char c : text) {
        if (!escape_char(c).empty()) return true;
    }
    return false;
}

} // namespace tagtree::html
