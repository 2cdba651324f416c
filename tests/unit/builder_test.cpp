#include "tagtree/core/diagnostics.h"
#include "tagtree/dom/node.h"
#include "tagtree/html/builder.h"
#include "tagtree/html/description.h"
#include "tagtree/html/sentinel.h"
#include "tagtree/html/writer.h"

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

using namespace tagtree::html;
using tagtree::core::DiagnosticEmitter;
using tagtree::core::Severity;
using tagtree::dom::Node;
using tagtree::dom::NodeType;

namespace {

RenderOptions compact() {
    RenderOptions options;
    options.line_breaks = false;
    return options;
}

std::string render_compact(const std::vector<Node>& nodes) {
    return render_to_string(nodes, compact());
}

} // namespace

// ---------------------------------------------------------------------------
// 1. Description values
// ---------------------------------------------------------------------------
TEST(DescriptionValue, AtomKinds) {
    EXPECT_EQ(Description(tag("p")).kind(), Description::Kind::Symbol);
    EXPECT_EQ(Description(true).kind(), Description::Kind::Flag);
    EXPECT_EQ(Description("text").kind(), Description::Kind::Atom);
    EXPECT_EQ(Description(std::string("text")).kind(), Description::Kind::Atom);
    EXPECT_EQ(Description('c').kind(), Description::Kind::Atom);
    EXPECT_EQ(Description(7).kind(), Description::Kind::Atom);
    EXPECT_EQ(Description(Node::unsafe("<x>")).kind(), Description::Kind::Atom);
}

TEST(DescriptionValue, BracesMakeLists) {
    Description d = {tag("p"), "a", 1};
    ASSERT_EQ(d.kind(), Description::Kind::List);
    ASSERT_EQ(d.items().size(), 3u);
    EXPECT_EQ(d.items()[0].symbol(), "p");
    EXPECT_EQ(d.items()[1].atom().data(), "a");
    EXPECT_EQ(Description::list({"a", "b"}).items().size(), 2u);
}

TEST(DescriptionValue, PointersAreNotFlags) {
    EXPECT_FALSE((std::is_constructible_v<Description, std::string*>));
    EXPECT_FALSE((std::is_constructible_v<Description, const Node*>));
    EXPECT_TRUE((std::is_constructible_v<Description, const char*>));
    EXPECT_FALSE((std::is_convertible_v<int*, Description>));
}

TEST(DescriptionValue, WrongKindAccessThrows) {
    Description d("text");
    EXPECT_THROW(d.symbol(), std::logic_error);
    EXPECT_THROW(d.flag(), std::logic_error);
    EXPECT_THROW(d.items(), std::logic_error);
    EXPECT_THROW(Description(tag("p")).atom(), std::logic_error);
}

TEST(DescriptionValue, TagFormRecognition) {
    EXPECT_TRUE(Builder::is_tag_form({tag("p")}));
    EXPECT_TRUE(Builder::is_tag_form({tag("p"), "child"}));
    EXPECT_TRUE(Builder::is_tag_form({{tag("a"), attr("href"), "/"}, "x"}));
    EXPECT_FALSE(Builder::is_tag_form({"p", "child"}));
    EXPECT_FALSE(Builder::is_tag_form({{"a", "b"}, "c"}));
    EXPECT_FALSE(Builder::is_tag_form(tag("p")));
    EXPECT_FALSE(Builder::is_tag_form("p"));
}

// ---------------------------------------------------------------------------
// 2. Elements
// ---------------------------------------------------------------------------
TEST(BuildDescription, SpanWithStyleEndToEnd) {
    auto nodes = build({ { {tag("span"), attr("style"), "color:blue"}, "text" } });
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(render_to_string(nodes), "<span style=\"color:blue\">\ntext</span>\n");
}

TEST(BuildDescription, BareTagHasOpenAndClose) {
    auto nodes = build({ {tag("p")} });
    ASSERT_EQ(nodes.size(), 1u);
    ASSERT_EQ(nodes[0].type(), NodeType::Element);
    EXPECT_EQ(nodes[0].element().name(), "p");
    EXPECT_EQ(render_to_string(nodes), "<p>\n</p>\n");
}

TEST(BuildDescription, VoidTag) {
    EXPECT_EQ(render_to_string(build({ {tag("input")} })), "<input>\n");
}

TEST(BuildDescription, TagNamesAreLowerCasedOnOutput) {
    auto nodes = build({ { {tag("DIV"), attr("ID"), "main"} } });
    EXPECT_EQ(nodes[0].element().name(), "DIV");
    EXPECT_EQ(render_compact(nodes), "<div id=\"main\"></div>");
}

TEST(BuildDescription, ChildrenAreBuiltRecursively) {
    auto nodes = build({
        {tag("ul"),
            {tag("li"), "one"},
            {{tag("li"), attr("class"), "last"}, "two"}},
    });
    EXPECT_EQ(render_compact(nodes), "<ul><li>one</li><li class=\"last\">two</li></ul>");
}

TEST(BuildDescription, AtomsAreEscapedOnlyAtRender) {
    auto nodes = build({ {tag("p"), "a < b"} });
    const Node& child = nodes[0].element().children()[0];
    EXPECT_EQ(child.data(), "a < b");
    EXPECT_EQ(render_compact(nodes), "<p>a &lt; b</p>");
}

TEST(BuildDescription, NumbersBooleansAndCharacters) {
    auto nodes = build({ {tag("td"), 42, ' ', 2.5, ' ', true} });
    EXPECT_EQ(render_compact(nodes), "<td>42 2.5 true</td>");
}

TEST(BuildDescription, UnsafeChild) {
    auto nodes = build({ {tag("div"), Node::unsafe("<hr>")} });
    EXPECT_EQ(render_compact(nodes), "<div><hr></div>");
}

// ---------------------------------------------------------------------------
// 3. Attributes
// ---------------------------------------------------------------------------
TEST(BuilderAttributes, Flags) {
    auto nodes = build({ { {tag("input"), attr("checked"), true, attr("disabled"), false} } });
    EXPECT_EQ(render_to_string(nodes), "<input checked=\"checked\">\n");
}

TEST(BuilderAttributes, ValuesAreEscaped) {
    auto nodes = build({ { {tag("a"), attr("title"), "\"quoted\" & <tagged>"} } });
    EXPECT_EQ(render_compact(nodes),
              "<a title=\"&quot;quoted&quot; &amp; &lt;tagged&gt;\"></a>");
}

TEST(BuilderAttributes, NameAsText) {
    auto nodes = build({ { {tag("a"), "HREF", "/x"}, "go" } });
    EXPECT_EQ(render_compact(nodes), "<a href=\"/x\">go</a>");
}

TEST(BuilderAttributes, NumberValue) {
    auto nodes = build({ { {tag("td"), attr("colspan"), 3} } });
    EXPECT_EQ(render_compact(nodes), "<td colspan=\"3\"></td>");
}

TEST(BuilderAttributes, ListValueIsPlainData) {
    auto nodes = build({ { {tag("div"), attr("class"), {"card ", "wide"}} } });
    EXPECT_EQ(render_compact(nodes), "<div class=\"card wide\"></div>");
}

TEST(BuilderAttributes, DuplicatesArePreserved) {
    auto nodes = build({ { {tag("p"), attr("class"), "a", attr("class"), "b"} } });
    ASSERT_EQ(nodes[0].element().attributes().size(), 2u);
    EXPECT_EQ(render_compact(nodes), "<p class=\"a\" class=\"b\"></p>");
}

TEST(BuilderAttributes, EmptyAttributeListInHead) {
    auto nodes = build({ { {tag("p")}, "x" } });
    EXPECT_TRUE(nodes[0].element().attributes().empty());
    EXPECT_EQ(render_compact(nodes), "<p>x</p>");
}

TEST(BuilderAttributes, BooleanNodeAtomIsFlag) {
    auto off = build({ { {tag("input"), attr("checked"), Node(false)} } });
    EXPECT_EQ(render_to_string(off), "<input>\n");
    ASSERT_EQ(off[0].element().attributes().size(), 1u);
    EXPECT_FALSE(off[0].element().attributes()[0].value.present());

    auto on = build({ { {tag("input"), attr("checked"), Node(true)} } });
    EXPECT_EQ(render_to_string(on), "<input checked=\"checked\">\n");
}

// ---------------------------------------------------------------------------
// 4. Fragments, pass-through and plain data
// ---------------------------------------------------------------------------
TEST(BuildDescription, OneNodePerTopLevelItem) {
    auto nodes = build({ "a", 1, true, {tag("p")} });
    ASSERT_EQ(nodes.size(), 4u);
    EXPECT_EQ(nodes[0].type(), NodeType::Text);
    EXPECT_EQ(nodes[1].type(), NodeType::Opaque);
    EXPECT_EQ(nodes[2].type(), NodeType::Opaque);
    EXPECT_EQ(nodes[3].type(), NodeType::Element);
}

TEST(BuildDescription, FragmentEqualsConcatenation) {
    Description a = {tag("h1"), "Title"};
    Description b = "between & after";
    Description c = {{tag("img"), attr("src"), "x.png"}};

    auto together = build({a, b, c});
    ASSERT_EQ(together.size(), 3u);
    EXPECT_EQ(render_to_string(together),
              render_to_string(build({a})) + render_to_string(build({b})) +
                  render_to_string(build({c})));
}

TEST(BuildDescription, PrebuiltNodesPassThrough) {
    Node card = build({ { {tag("div"), attr("class"), "card"}, "hello" } })[0];
    auto page = build({ {tag("body"), card, card} });

    const std::string card_text = render_to_string(card);
    EXPECT_EQ(render_to_string(page), "<body>\n" + card_text + card_text + "</body>\n");
    EXPECT_EQ(&page[0].element().children()[0].element(), &card.element());
}

TEST(BuildDescription, HostLoopsProduceSequences) {
    std::vector<Node> items;
    for (const char* label : {"one", "two", "three"}) {
        items.push_back(build({ {tag("li"), label} })[0]);
    }
    auto nodes = build({ {tag("ul"), items} });
    EXPECT_EQ(render_compact(nodes), "<ul><li>one</li><li>two</li><li>three</li></ul>");
}

TEST(BuildDescription, PlainListBecomesSequence) {
    auto nodes = build({ {"a", "b", 3} });
    ASSERT_EQ(nodes.size(), 1u);
    ASSERT_EQ(nodes[0].type(), NodeType::Sequence);
    EXPECT_EQ(nodes[0].members().size(), 3u);
    EXPECT_EQ(render_compact(nodes), "ab3");
}

TEST(BuildDescription, PlainListIsNotInterpretedAsTags) {
    // Head is text, so the nested list is data too and its symbol is not a tag.
    EXPECT_THROW(build({ {"x", {tag("b"), "y"}} }), MalformedDescription);
}

TEST(BuildDescription, ElementAndNodeVectorAtoms) {
    tagtree::dom::Element em("em", {}, {Node("hi")});
    auto nodes = build({ {tag("p"), em, std::vector<Node>{Node("a"), Node("b")}} });
    EXPECT_EQ(render_compact(nodes), "<p><em>hi</em>ab</p>");
}

// ---------------------------------------------------------------------------
// 5. Sentinels
// ---------------------------------------------------------------------------
TEST(BuilderSentinels, DoctypeSymbol) {
    auto nodes = build({ tag("doctype"), {tag("html"), {tag("body"), "hi"}} });
    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_EQ(nodes[0].type(), NodeType::Sentinel);
    EXPECT_EQ(render_to_string(nodes), "<!doctype html>\n<html>\n<body>\nhi</body>\n</html>\n");
}

TEST(BuilderSentinels, LookupIsCaseInsensitive) {
    auto nodes = build({ tag("DocType") });
    EXPECT_EQ(render_to_string(nodes), "<!doctype html>\n");
}

TEST(BuilderSentinels, CustomRegistry) {
    SentinelRegistry registry;
    registry.add("rule", "<hr>\n");
    Builder builder(registry);

    auto nodes = builder.build({ tag("rule"), {tag("p"), "x"} });
    EXPECT_EQ(render_to_string(nodes), "<hr>\n<p>\nx</p>\n");
    EXPECT_THROW(builder.build({ tag("doctype") }), MalformedDescription);
}

TEST(BuilderSentinels, DefaultRegistry) {
    const SentinelRegistry& defaults = SentinelRegistry::defaults();
    EXPECT_EQ(defaults.size(), 1u);
    EXPECT_TRUE(defaults.contains("doctype"));
    EXPECT_FALSE(defaults.contains("rule"));
    EXPECT_EQ(&defaults, &SentinelRegistry::defaults());
}

TEST(BuilderSentinels, AddReplacesAndRejectsEmptyNames) {
    SentinelRegistry registry;
    registry.add("x", "1").add("X", "2");
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.lookup("x")->data(), "2");
    EXPECT_FALSE(registry.lookup("y").has_value());
    EXPECT_THROW(registry.add("", "z"), std::invalid_argument);
}

// ---------------------------------------------------------------------------
// 6. Malformed descriptions
// ---------------------------------------------------------------------------
TEST(BuilderErrors, OddAttributeList) {
    EXPECT_THROW(build({ { {tag("a"), attr("href")}, "x" } }), MalformedDescription);
    EXPECT_THROW(build({ { {tag("a"), attr("href"), "/", attr("title")} } }), MalformedDescription);
}

TEST(BuilderErrors, ListHeadWithoutAttributesPairsIsOdd) {
    // The head list of a tag form is always (tag name value ...).
    EXPECT_THROW(build({ {tag("ul"), { {tag("li"), "a"}, {tag("li"), "b"} }} }),
                 MalformedDescription);
}

TEST(BuilderErrors, ContextNamesEnclosingTags) {
    try {
        build({ {tag("html"), {tag("body"), { {tag("a"), attr("href")} }}} });
        FAIL() << "expected MalformedDescription";
    } catch (const MalformedDescription& e) {
        EXPECT_EQ(e.context(), "html > body > a");
        EXPECT_NE(std::string(e.what()).find("odd attribute list"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("html > body > a"), std::string::npos);
    }
}

TEST(BuilderErrors, UnknownBareSymbol) {
    EXPECT_THROW(build({ tag("br") }), MalformedDescription);
}

TEST(BuilderErrors, EmptyTagName) {
    EXPECT_THROW(build({ {tag("")} }), MalformedDescription);
}

TEST(BuilderErrors, BadAttributeNames) {
    EXPECT_THROW(build({ { {tag("a"), 1, "x"} } }), MalformedDescription);
    EXPECT_THROW(build({ { {tag("a"), true, "x"} } }), MalformedDescription);
    EXPECT_THROW(build({ { {tag("a"), "", "x"} } }), MalformedDescription);
}

TEST(BuilderErrors, SymbolAttributeValue) {
    EXPECT_THROW(build({ { {tag("a"), attr("rel"), tag("nofollow")} } }), MalformedDescription);
}

TEST(BuilderErrors, ErrorAbortsWholeBuild) {
    std::vector<Node> nodes = {Node("untouched")};
    EXPECT_THROW(nodes = build({ {tag("p"), "fine"}, tag("oops") }), MalformedDescription);
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(nodes[0].data(), "untouched");
}

// ---------------------------------------------------------------------------
// 7. Diagnostics
// ---------------------------------------------------------------------------
TEST(BuilderDiagnostics, SummaryOnSuccess) {
    DiagnosticEmitter diagnostics;
    Builder builder(SentinelRegistry::defaults(), &diagnostics);
    builder.build({ {tag("p"), "x"} });

    ASSERT_EQ(diagnostics.size(), 1u);
    const auto& event = diagnostics.events()[0];
    EXPECT_EQ(event.severity, Severity::Info);
    EXPECT_EQ(event.module, "builder");
    EXPECT_EQ(event.stage, "build");
    EXPECT_EQ(event.message, "built 1 items into 2 nodes (1 elements)");
}

TEST(BuilderDiagnostics, ErrorBeforeThrow) {
    DiagnosticEmitter diagnostics;
    Builder builder(SentinelRegistry::defaults(), &diagnostics);
    EXPECT_THROW(builder.build({ { {tag("a"), attr("href")} } }), MalformedDescription);

    auto errors = diagnostics.events_by_severity(Severity::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].stage, "attributes");
    EXPECT_TRUE(diagnostics.events_by_severity(Severity::Info).empty());
}

// ---------------------------------------------------------------------------
// 8. ElementBuilder
// ---------------------------------------------------------------------------
TEST(FluentElement, MatchesDescription) {
    Node fluent = element("a").attr("href", "/").attr("hidden", false).child("home").build();
    auto described = build({ { {tag("a"), attr("href"), "/", attr("hidden"), false}, "home" } });
    EXPECT_EQ(render_to_string(fluent), render_to_string(described));
    EXPECT_EQ(render_compact({fluent}), "<a href=\"/\">home</a>");
}

TEST(FluentElement, TextUnsafeAndChildren) {
    Node n = element("div")
                 .attr("data-n", 2)
                 .text("a<")
                 .unsafe("<br>")
                 .children({Node('x'), Node(1)})
                 .build();
    EXPECT_EQ(render_compact({n}), "<div data-n=\"2\">a&lt;<br>x1</div>");
}

TEST(FluentElement, BuildIsRepeatable) {
    ElementBuilder b = element("li");
    b.text("one");
    Node first = b.build();
    b.text("two");
    Node second = b.build();
    EXPECT_EQ(render_compact({first}), "<li>one</li>");
    EXPECT_EQ(render_compact({second}), "<li>onetwo</li>");
}
