#include "tagtree/html/description.h"

#include <stdexcept>
#include <utility>

namespace tagtree::html {

Symbol tag(std::string name) {
    return Symbol{std::move(name)};
}

Symbol attr(std::string name) {
    return Symbol{std::move(name)};
}

const char* description_kind_name(Description::Kind kind) {
    switch (kind) {
        case Description::Kind::Symbol: return "symbol";
        case Description::Kind::Flag:   return "flag";
        case Description::Kind::Atom:   return "atom";
        case Description::Kind::List:   return "list";
    }
    return "unknown";
}

Description::Description(Kind kind) : kind_(kind) {}

Description::Description(Symbol symbol) : Description(Kind::Symbol) {
    symbol_ = std::move(symbol.name);
}

Description::Description(bool flag) : Description(Kind::Flag) {
    flag_ = flag;
}

Description::Description(char c) : Description(dom::Node(c)) {}

Description::Description(const char* text) : Description(dom::Node(text)) {}

Description::Description(std::string text) : Description(dom::Node(std::move(text))) {}

Description::Description(std::string_view text) : Description(dom::Node(text)) {}

Description::Description(dom::Node atom) : Description(Kind::Atom) {
    atom_ = std::move(atom);
}

Description::Description(dom::Element element) : Description(dom::Node(std::move(element))) {}

Description::Description(std::vector<dom::Node> nodes) : Description(dom::Node(std::move(nodes))) {}

Description::Description(std::initializer_list<Description> items) : Description(Kind::List) {
    items_.assign(items.begin(), items.end());
}

Description Description::list(std::vector<Description> items) {
    Description description(Kind::List);
    description.items_ = std::move(items);
    return description;
}

void Description::require(Kind expected) const {
    if (kind_ != expected) {
        throw std::logic_error(std::string("description is a ") + description_kind_name(kind_) +
                               ", not a " + description_kind_name(expected));
    }
}

const std::string& Description::symbol() const {
    require(Kind::Symbol);
    return symbol_;
}

bool Description::flag() const {
    require(Kind::Flag);
    return flag_;
}

const dom::Node& Description::atom() const {
    require(Kind::Atom);
    return atom_;
}

const std::vector<Description>& Description::items() const {
    require(Kind::List);
    return items_;
}

} // namespace tagtree::html
