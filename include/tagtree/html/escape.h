#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace tagtree::html {

// Replacement for a single character: &lt; &gt; &amp; &quot;, or empty when
// the character is written as-is.
std::string_view escape_char(char c);

std::string escape(std::string_view text);
void escape_to(std::string_view text, std::string& output);
void escape_to(std::string_view text, std::ostream& out);

bool needs_escaping(std::string_view text);

} // namespace tagtree::html
