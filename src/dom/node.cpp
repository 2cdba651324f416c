#include "tagtree/dom/node.h"

#include <cctype>
#include <stdexcept>
#include <utility>

namespace tagtree::dom {

const char* node_type_name(NodeType type) {
    switch (type) {
        case NodeType::Character: return "character";
        case NodeType::Text:      return "text";
        case NodeType::Unsafe:    return "unsafe";
        case NodeType::Element:   return "element";
        case NodeType::Sequence:  return "sequence";
        case NodeType::Opaque:    return "opaque";
        case NodeType::Sentinel:  return "sentinel";
    }
    return "unknown";
}

Renderable::~Renderable() = default;

std::string to_lower_ascii(std::string_view text) {
    std::string lowered;
    lowered.reserve(text.size());
    for (char c : text) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return lowered;
}

// ---------------------------------------------------------------------------
// Node
// ---------------------------------------------------------------------------

Node::Node(NodeType type) : type_(type) {}

Node::Node() : Node(NodeType::Sequence) {
    members_ = std::make_shared<const std::vector<Node>>();
}

Node::Node(char c) : Node(NodeType::Character) {
    character_ = c;
}

Node::Node(const char* text) : Node(std::string(text ? text : "")) {}

Node::Node(std::string text) : Node(NodeType::Text) {
    data_ = std::move(text);
}

Node::Node(std::string_view text) : Node(std::string(text)) {}

Node::Node(std::vector<Node> members) : Node(NodeType::Sequence) {
    members_ = std::make_shared<const std::vector<Node>>(std::move(members));
}

Node::Node(Element element) : Node(NodeType::Element) {
    element_ = std::make_shared<const Element>(std::move(element));
}

Node Node::text(std::string text) {
    return Node(std::move(text));
}

Node Node::unsafe(std::string text) {
    Node node(NodeType::Unsafe);
    node.data_ = std::move(text);
    return node;
}

Node Node::sequence(std::vector<Node> members) {
    return Node(std::move(members));
}

Node Node::opaque(std::shared_ptr<const Renderable> value) {
    if (!value) {
        throw std::invalid_argument("opaque node needs a renderable value");
    }
    Node node(NodeType::Opaque);
    node.renderable_ = std::move(value);
    return node;
}

Node Node::sentinel(std::string name, std::string literal) {
    Node node(NodeType::Sentinel);
    node.name_ = std::move(name);
    node.data_ = std::move(literal);
    return node;
}

void Node::require(NodeType expected) const {
    if (type_ != expected) {
        throw std::logic_error(std::string("node is ") + node_type_name(type_) +
                               ", not " + node_type_name(expected));
    }
}

char Node::character() const {
    require(NodeType::Character);
    return character_;
}

const std::string& Node::data() const {
    if (type_ != NodeType::Text && type_ != NodeType::Unsafe && type_ != NodeType::Sentinel) {
        throw std::logic_error(std::string("node is ") + node_type_name(type_) +
                               ", which carries no string data");
    }
    return data_;
}

const Element& Node::element() const {
    require(NodeType::Element);
    return *element_;
}

const std::vector<Node>& Node::members() const {
    require(NodeType::Sequence);
    return *members_;
}

const Renderable& Node::renderable() const {
    require(NodeType::Opaque);
    return *renderable_;
}

const std::string& Node::sentinel_name() const {
    require(NodeType::Sentinel);
    return name_;
}

// ---------------------------------------------------------------------------
// AttributeValue
// ---------------------------------------------------------------------------

AttributeValue::AttributeValue(bool flag) : is_flag_(true), flag_(flag) {}

AttributeValue::AttributeValue(char c) : value_(c) {}

AttributeValue::AttributeValue(const char* text) : value_(text) {}

AttributeValue::AttributeValue(std::string text) : value_(std::move(text)) {}

AttributeValue::AttributeValue(std::string_view text) : value_(text) {}

AttributeValue::AttributeValue(Node value) {
    // A printed boolean behaves exactly like a flag.
    if (value.is(NodeType::Opaque)) {
        if (const auto* printed = dynamic_cast<const Printed<bool>*>(&value.renderable())) {
            is_flag_ = true;
            flag_ = printed->value();
            return;
        }
    }
    value_ = std::move(value);
}

// ---------------------------------------------------------------------------
// Element
// ---------------------------------------------------------------------------

Element::Element(std::string name, std::vector<Attribute> attributes, std::vector<Node> children)
    : name_(std::move(name)),
      attributes_(std::move(attributes)),
      children_(std::move(children)) {}

const AttributeValue* Element::get_attribute(std::string_view name) const {
    const std::string wanted = to_lower_ascii(name);
    for (const auto& attr : attributes_) {
        if (to_lower_ascii(attr.name) == wanted) {
            return &attr.value;
        }
    }
    return nullptr;
}

bool Element::has_attribute(std::string_view name) const {
    return get_attribute(name) != nullptr;
}

// ---------------------------------------------------------------------------
// debug_string
// ---------------------------------------------------------------------------

namespace {

void append_debug(const Node& node, std::string& output);

void append_attribute_debug(const Attribute& attr, std::string& output) {
    output += " " + attr.name + "=";
    if (attr.value.is_flag()) {
        output += attr.value.flag() ? "#t" : "#f";
    } else {
        append_debug(attr.value.value(), output);
    }
}

void append_debug(const Node& node, std::string& output) {
    switch (node.type()) {
        case NodeType::Character:
            output += "'";
            output += node.character();
            output += "'";
            break;
        case NodeType::Text:
            output += "\"" + node.data() + "\"";
            break;
        case NodeType::Unsafe:
            output += "unsafe\"" + node.data() + "\"";
            break;
        case NodeType::Opaque:
            output += "opaque(" + node.renderable().to_text() + ")";
            break;
        case NodeType::Sentinel:
            output += "#" + node.sentinel_name();
            break;
        case NodeType::Sequence: {
            output += "(";
            bool first = true;
            for (const auto& member : node.members()) {
                if (!first) output += " ";
                first = false;
                append_debug(member, output);
            }
            output += ")";
            break;
        }
        case NodeType::Element: {
            const Element& element = node.element();
            output += "<" + element.name();
            for (const auto& attr : element.attributes()) {
                append_attribute_debug(attr, output);
            }
            output += ">";
            if (element.child_count() > 0) {
                output += "[";
                bool first = true;
                for (const auto& child : element.children()) {
                    if (!first) output += " ";
                    first = false;
                    append_debug(child, output);
                }
                output += "]";
            }
            break;
        }
    }
}

} // namespace

std::string debug_string(const Node& node) {
    std::string output;
    append_debug(node, output);
    return output;
}

} // namespace tagtree::dom
