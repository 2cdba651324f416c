#include "tagtree/html/sentinel.h"

#include "tagtree/core/config.h"

#include <stdexcept>
#include <utility>

namespace tagtree::html {

const SentinelRegistry& SentinelRegistry::defaults() {
    static const SentinelRegistry registry = [] {
        SentinelRegistry r;
        r.add(core::config::kDoctypeName, core::config::kDoctypeLiteral);
        return r;
    }();
    return registry;
}

SentinelRegistry& SentinelRegistry::add(std::string_view name, std::string literal) {
    if (name.empty()) {
        throw std::invalid_argument("sentinel name must not be empty");
    }
    entries_[dom::to_lower_ascii(name)] = std::move(literal);
    return *this;
}

bool SentinelRegistry::contains(std::string_view name) const {
    return entries_.find(dom::to_lower_ascii(name)) != entries_.end();
}

std::optional<dom::Node> SentinelRegistry::lookup(std::string_view name) const {
    auto it = entries_.find(dom::to_lower_ascii(name));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return dom::Node::sentinel(it->first, it->second);
}

dom::Node doctype() {
    auto node = SentinelRegistry::defaults().lookup(core::config::kDoctypeName);
    if (!node) {
        throw std::logic_error("default sentinel registry has no doctype entry");
    }
    return *node;
}

} // namespace tagtree::html
