#pragma once

#include <cstddef>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace tagtree::dom {

enum class NodeType {
    Character,
    Text,
    Unsafe,
    Element,
    Sequence,
    Opaque,
    Sentinel,
};

const char* node_type_name(NodeType type);

// Capability for values that supply their own text when placed in a tree.
// The text is escaped by the writer like any other text.
class Renderable {
public:
    virtual ~Renderable();
    virtual std::string to_text() const = 0;
};

// Renderable for anything with an operator<<. Booleans print as true/false.
template <typename T>
class Printed : public Renderable {
public:
    explicit Printed(T value) : value_(std::move(value)) {}

    std::string to_text() const override {
        std::ostringstream oss;
        if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool> && sizeof(T) == 1) {
            oss << static_cast<int>(value_);
        } else {
            oss << std::boolalpha << value_;
        }
        return oss.str();
    }

    const T& value() const { return value_; }

private:
    T value_;
};

class Element;

template <typename T>
inline constexpr bool is_printable_number_v =
    std::is_arithmetic_v<T> && !std::is_same_v<T, char>;

// Immutable value node. Element, sequence and opaque payloads are shared, so
// copies are cheap and sub-trees can be reused across trees.
class Node {
public:
    // An empty sequence.
    Node();

    Node(char c);
    Node(const char* text);
    Node(std::string text);
    Node(std::string_view text);
    Node(std::vector<Node> members);
    Node(Element element);

    template <typename T, std::enable_if_t<is_printable_number_v<T>, int> = 0>
    Node(T value) : Node(opaque(std::make_shared<Printed<T>>(value))) {}

    static Node text(std::string text);
    static Node unsafe(std::string text);
    static Node sequence(std::vector<Node> members);
    static Node opaque(std::shared_ptr<const Renderable> value);
    static Node sentinel(std::string name, std::string literal);

    NodeType type() const { return type_; }
    bool is(NodeType type) const { return type_ == type; }

    char character() const;
    // Text and unsafe content, or a sentinel's literal.
    const std::string& data() const;
    const Element& element() const;
    const std::vector<Node>& members() const;
    const Renderable& renderable() const;
    const std::string& sentinel_name() const;

private:
    explicit Node(NodeType type);

    void require(NodeType expected) const;

    NodeType type_;
    char character_ = 0;
    std::string data_;
    std::string name_;
    std::shared_ptr<const Element> element_;
    std::shared_ptr<const std::vector<Node>> members_;
    std::shared_ptr<const Renderable> renderable_;
};

class AttributeValue {
public:
    AttributeValue(bool flag);
    AttributeValue(char c);
    AttributeValue(const char* text);
    AttributeValue(std::string text);
    AttributeValue(std::string_view text);
    AttributeValue(Node value);

    // Keeps arbitrary pointers from decaying to a flag.
    template <typename T>
    AttributeValue(const T*) = delete;

    template <typename T,
              std::enable_if_t<is_printable_number_v<T> && !std::is_same_v<T, bool>, int> = 0>
    AttributeValue(T value) : AttributeValue(Node(value)) {}

    bool is_flag() const { return is_flag_; }
    bool flag() const { return flag_; }
    const Node& value() const { return value_; }

    // False only for a false flag.
    bool present() const { return !is_flag_ || flag_; }

private:
    bool is_flag_ = false;
    bool flag_ = false;
    Node value_;
};

struct Attribute {
    std::string name;
    AttributeValue value;
};

class Element {
public:
    explicit Element(std::string name,
                     std::vector<Attribute> attributes = {},
                     std::vector<Node> children = {});

    const std::string& name() const { return name_; }
    const std::vector<Attribute>& attributes() const { return attributes_; }
    const std::vector<Node>& children() const { return children_; }

    // Case-insensitive; the first match wins when a name repeats.
    const AttributeValue* get_attribute(std::string_view name) const;
    bool has_attribute(std::string_view name) const;

    std::size_t child_count() const { return children_.size(); }

private:
    std::string name_;
    std::vector<Attribute> attributes_;
    std::vector<Node> children_;
};

// Canonical one-line dump of a tree, for deterministic comparison.
std::string debug_string(const Node& node);

std::string to_lower_ascii(std::string_view text);

} // namespace tagtree::dom
