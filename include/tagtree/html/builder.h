#pragma once

#include "tagtree/core/diagnostics.h"
#include "tagtree/dom/node.h"
#include "tagtree/html/description.h"
#include "tagtree/html/sentinel.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace tagtree::html {

// Raised when a description cannot be turned into a tree: odd attribute
// lists, bare symbols that are not sentinels, badly shaped attribute names
// or values. No partial tree is produced.
class MalformedDescription : public std::runtime_error {
public:
    MalformedDescription(const std::string& message, std::string context);

    // Enclosing tag path, e.g. "html > body > a". Empty at top level.
    const std::string& context() const { return context_; }

private:
    std::string context_;
};

// Turns descriptions into node trees.
//
// A list headed by a symbol is an element; a list headed by a list that is
// itself headed by a symbol is an element whose head carries a flat
// name/value attribute list. Every other list is plain data and becomes a
// sequence without any tag interpretation. Atoms pass through unescaped.
class Builder {
public:
    explicit Builder(SentinelRegistry sentinels = SentinelRegistry::defaults(),
                     core::DiagnosticEmitter* diagnostics = nullptr);

    // One node per top-level item.
    std::vector<dom::Node> build(const std::vector<Description>& items) const;
    dom::Node build_item(const Description& item) const;

    const SentinelRegistry& sentinels() const { return sentinels_; }

    static bool is_tag_form(const Description& item);

private:
    dom::Node build_item(const Description& item, std::vector<std::string>& path) const;
    dom::Node build_element(const Description& form, std::vector<std::string>& path) const;
    dom::Node build_data(const Description& item, const std::vector<std::string>& path) const;
    std::vector<dom::Attribute> build_attributes(const std::vector<Description>& head,
                                                 const std::vector<std::string>& path) const;
    dom::AttributeValue build_attribute_value(const Description& value,
                                              const std::string& name,
                                              const std::vector<std::string>& path) const;

    MalformedDescription malformed(const std::string& stage, const std::string& message,
                                   const std::vector<std::string>& path) const;

    SentinelRegistry sentinels_;
    core::DiagnosticEmitter* diagnostics_;
};

// Builds with the default sentinel registry and no diagnostics.
std::vector<dom::Node> build(const std::vector<Description>& items);

// Fluent construction of a single element.
//
//   element("a").attr("href", "/").child("home").build()
class ElementBuilder {
public:
    explicit ElementBuilder(std::string name);

    ElementBuilder& attr(std::string name, dom::AttributeValue value);
    ElementBuilder& child(dom::Node node);
    ElementBuilder& children(const std::vector<dom::Node>& nodes);
    ElementBuilder& text(std::string text);
    ElementBuilder& unsafe(std::string text);

    dom::Node build() const;

private:
    std::string name_;
    std::vector<dom::Attribute> attributes_;
    std::vector<dom::Node> children_;
};

ElementBuilder element(std::string name);

} // namespace tagtree::html
