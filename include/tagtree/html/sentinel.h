#pragma once

#include "tagtree/dom/node.h"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace tagtree::html {

// Maps sentinel names (case-insensitive) to the fixed literal they render as.
class SentinelRegistry {
public:
    SentinelRegistry() = default;

    // Process-wide registry holding the document-type marker. Built once on
    // first use and never modified afterwards.
    static const SentinelRegistry& defaults();

    // Replaces an existing entry of the same name.
    SentinelRegistry& add(std::string_view name, std::string literal);

    bool contains(std::string_view name) const;
    std::optional<dom::Node> lookup(std::string_view name) const;
    std::size_t size() const { return entries_.size(); }

private:
    std::map<std::string, std::string> entries_;
};

// The `<!doctype html>` node from the default registry.
dom::Node doctype();

} // namespace tagtree::html
