#ifndef TAGTREE_CORE_CONFIG_H
#define TAGTREE_CORE_CONFIG_H

#include <array>
#include <string_view>

namespace tagtree::core::config {

inline constexpr char kDoctypeName[] = "doctype";
inline constexpr char kDoctypeLiteral[] = "<!doctype html>\n";
inline constexpr char kDefaultNewline[] = "\n";

// Elements rendered without a closing tag.
inline constexpr std::array<std::string_view, 14> kVoidElements = {
    "area", "base", "br",   "col",  "embed", "hr",    "img",
    "input","link", "meta", "param","source","track", "wbr",
};

}  // namespace tagtree::core::config

#endif  // TAGTREE_CORE_CONFIG_H
