#pragma once

#include "tagtree/dom/node.h"

#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace tagtree::html {

// A tag or attribute identifier inside a description.
struct Symbol {
    std::string name;
};

Symbol tag(std::string name);
Symbol attr(std::string name);

// Nested literal description of markup, consumed by Builder.
//
//   { {tag("a"), attr("href"), "/home"}, "Home" }
//
// A braced list is a List; symbols, booleans and anything convertible to a
// dom::Node are atoms. Note that brace-initializing a Description from
// another Description makes a one-item list, not a copy.
class Description {
public:
    enum class Kind { Symbol, Flag, Atom, List };

    Description(Symbol symbol);
    Description(bool flag);
    Description(char c);
    Description(const char* text);
    Description(std::string text);
    Description(std::string_view text);
    Description(dom::Node atom);
    Description(dom::Element element);
    Description(std::vector<dom::Node> nodes);
    Description(std::initializer_list<Description> items);

    // Pointers other than C strings would otherwise become flags.
    template <typename T>
    Description(const T*) = delete;

    template <typename T,
              std::enable_if_t<dom::is_printable_number_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Description(T value) : Description(dom::Node(value)) {}

    static Description list(std::vector<Description> items);

    Kind kind() const { return kind_; }
    bool is(Kind kind) const { return kind_ == kind; }

    const std::string& symbol() const;
    bool flag() const;
    const dom::Node& atom() const;
    const std::vector<Description>& items() const;

private:
    explicit Description(Kind kind);

    void require(Kind expected) const;

    Kind kind_;
    std::string symbol_;
    bool flag_ = false;
    dom::Node atom_;
    std::vector<Description> items_;
};

const char* description_kind_name(Description::Kind kind);

} // namespace tagtree::html
