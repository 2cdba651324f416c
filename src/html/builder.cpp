#include "tagtree/html/builder.h"

#include <cstddef>
#include <utility>

namespace tagtree::html {

namespace {

constexpr char kModule[] = "builder";

std::string join_path(const std::vector<std::string>& path) {
    std::string joined;
    for (const auto& name : path) {
        if (!joined.empty()) joined += " > ";
        joined += name;
    }
    return joined;
}

struct TreeCounts {
    std::size_t nodes = 0;
    std::size_t elements = 0;
};

void count_nodes(const dom::Node& node, TreeCounts& counts) {
    ++counts.nodes;
    if (node.is(dom::NodeType::Element)) {
        ++counts.elements;
        for (const auto& child : node.element().children()) {
            count_nodes(child, counts);
        }
    } else if (node.is(dom::NodeType::Sequence)) {
        for (const auto& member : node.members()) {
            count_nodes(member, counts);
        }
    }
}

} // namespace

MalformedDescription::MalformedDescription(const std::string& message, std::string context)
    : std::runtime_error(context.empty() ? message : message + " (in " + context + ")"),
      context_(std::move(context)) {}

// ---------------------------------------------------------------------------
// Builder
// ---------------------------------------------------------------------------

Builder::Builder(SentinelRegistry sentinels, core::DiagnosticEmitter* diagnostics)
    : sentinels_(std::move(sentinels)), diagnostics_(diagnostics) {}

bool Builder::is_tag_form(const Description& item) {
    if (!item.is(Description::Kind::List) || item.items().empty()) {
        return false;
    }
    const Description& head = item.items().front();
    if (head.is(Description::Kind::Symbol)) {
        return true;
    }
    return head.is(Description::Kind::List) && !head.items().empty() &&
           head.items().front().is(Description::Kind::Symbol);
}

std::vector<dom::Node> Builder::build(const std::vector<Description>& items) const {
    std::vector<dom::Node> nodes;
    nodes.reserve(items.size());
    std::vector<std::string> path;
    for (const auto& item : items) {
        nodes.push_back(build_item(item, path));
    }

    if (diagnostics_) {
        TreeCounts counts;
        for (const auto& node : nodes) {
            count_nodes(node, counts);
        }
        diagnostics_->info(kModule, "build",
                           "built " + std::to_string(items.size()) + " items into " +
                               std::to_string(counts.nodes) + " nodes (" +
                               std::to_string(counts.elements) + " elements)");
    }
    return nodes;
}

dom::Node Builder::build_item(const Description& item) const {
    std::vector<std::string> path;
    return build_item(item, path);
}

dom::Node Builder::build_item(const Description& item, std::vector<std::string>& path) const {
    if (is_tag_form(item)) {
        return build_element(item, path);
    }
    return build_data(item, path);
}

dom::Node Builder::build_element(const Description& form, std::vector<std::string>& path) const {
    const std::vector<Description>& items = form.items();
    const Description& head = items.front();

    std::string name;
    std::vector<dom::Attribute> attributes;
    if (head.is(Description::Kind::Symbol)) {
        name = head.symbol();
    } else {
        name = head.items().front().symbol();
    }
    if (name.empty()) {
        throw malformed("tag", "empty tag name", path);
    }

    path.push_back(name);
    if (head.is(Description::Kind::List)) {
        attributes = build_attributes(head.items(), path);
    }

    std::vector<dom::Node> children;
    children.reserve(items.size() - 1);
    for (std::size_t i = 1; i < items.size(); ++i) {
        children.push_back(build_item(items[i], path));
    }
    path.pop_back();

    return dom::Node(dom::Element(std::move(name), std::move(attributes), std::move(children)));
}

dom::Node Builder::build_data(const Description& item, const std::vector<std::string>& path) const {
    switch (item.kind()) {
        case Description::Kind::Atom:
            return item.atom();
        case Description::Kind::Flag:
            return dom::Node(item.flag());
        case Description::Kind::Symbol: {
            auto sentinel = sentinels_.lookup(item.symbol());
            if (!sentinel) {
                throw malformed("symbol",
                                "bare symbol '" + item.symbol() +
                                    "' is neither a tag form nor a registered sentinel",
                                path);
            }
            return *sentinel;
        }
        case Description::Kind::List: {
            std::vector<dom::Node> members;
            members.reserve(item.items().size());
            for (const auto& member : item.items()) {
                members.push_back(build_data(member, path));
            }
            return dom::Node(std::move(members));
        }
    }
    throw malformed("data", "unknown description kind", path);
}

std::vector<dom::Attribute> Builder::build_attributes(const std::vector<Description>& head,
                                                      const std::vector<std::string>& path) const {
    // head[0] is the tag symbol; the rest alternate name, value.
    const std::size_t count = head.size() - 1;
    if (count % 2 != 0) {
        throw malformed("attributes",
                        "odd attribute list: " + std::to_string(count) +
                            " entries, expected name/value pairs",
                        path);
    }

    std::vector<dom::Attribute> attributes;
    attributes.reserve(count / 2);
    for (std::size_t i = 1; i < head.size(); i += 2) {
        const Description& key = head[i];
        std::string name;
        if (key.is(Description::Kind::Symbol)) {
            name = key.symbol();
        } else if (key.is(Description::Kind::Atom) && key.atom().is(dom::NodeType::Text)) {
            name = key.atom().data();
        } else {
            throw malformed("attributes",
                            std::string("attribute name must be a symbol or text, got ") +
                                description_kind_name(key.kind()),
                            path);
        }
        if (name.empty()) {
            throw malformed("attributes", "empty attribute name", path);
        }
        dom::AttributeValue value = build_attribute_value(head[i + 1], name, path);
        attributes.push_back(dom::Attribute{std::move(name), std::move(value)});
    }
    return attributes;
}

dom::AttributeValue Builder::build_attribute_value(const Description& value,
                                                   const std::string& name,
                                                   const std::vector<std::string>& path) const {
    switch (value.kind()) {
        case Description::Kind::Flag:
            return dom::AttributeValue(value.flag());
        case Description::Kind::Atom:
            return dom::AttributeValue(value.atom());
        case Description::Kind::List:
            return dom::AttributeValue(build_data(value, path));
        case Description::Kind::Symbol:
            break;
    }
    throw malformed("attributes",
                    "attribute '" + name + "' has a symbol value '" + value.symbol() + "'",
                    path);
}

MalformedDescription Builder::malformed(const std::string& stage, const std::string& message,
                                        const std::vector<std::string>& path) const {
    std::string context = join_path(path);
    if (diagnostics_) {
        diagnostics_->error(kModule, stage, context.empty() ? message : message + " (in " + context + ")");
    }
    return MalformedDescription(message, std::move(context));
}

std::vector<dom::Node> build(const std::vector<Description>& items) {
    return Builder().build(items);
}

// ---------------------------------------------------------------------------
// ElementBuilder
// ---------------------------------------------------------------------------

ElementBuilder::ElementBuilder(std::string name) : name_(std::move(name)) {}

ElementBuilder& ElementBuilder::attr(std::string name, dom::AttributeValue value) {
    attributes_.push_back(dom::Attribute{std::move(name), std::move(value)});
    return *this;
}

ElementBuilder& ElementBuilder::child(dom::Node node) {
    children_.push_back(std::move(node));
    return *this;
}

ElementBuilder& ElementBuilder::children(const std::vector<dom::Node>& nodes) {
    children_.insert(children_.end(), nodes.begin(), nodes.end());
    return *this;
}

ElementBuilder& ElementBuilder::text(std::string text) {
    return child(dom::Node::text(std::move(text)));
}

ElementBuilder& ElementBuilder::unsafe(std::string text) {
    return child(dom::Node::unsafe(std::move(text)));
}

dom::Node ElementBuilder::build() const {
    return dom::Node(dom::Element(name_, attributes_, children_));
}

ElementBuilder element(std::string name) {
    return ElementBuilder(std::move(name));
}

} // namespace tagtree::html
