#include <tinta/dom/document.h>
#include <tinta/dom/stylesheet.h>

#include <gtest/gtest.h>

using namespace tinta::dom;

// ---------------------------------------------------------------------------
// 1. Selector parsing and specificity
// ---------------------------------------------------------------------------
TEST(StyleSheetTest, SpecificityCounts) {
    auto selector = parse_selector("g > rect.a#b[fill]");
    ASSERT_TRUE(selector.has_value());
    ASSERT_EQ(selector->parts.size(), 2u);
    EXPECT_EQ(selector->parts[0].combinator, Combinator::Child);
    Specificity spec = specificity(*selector);
    EXPECT_EQ(spec, (Specificity{1, 2, 2}));
}

// ---------------------------------------------------------------------------
// 2. Unsupported selectors are rejected
// ---------------------------------------------------------------------------
TEST(StyleSheetTest, UnsupportedSelectorsRejected) {
    EXPECT_FALSE(parse_selector("a + b").has_value());
    EXPECT_FALSE(parse_selector("a:hover").has_value());
    EXPECT_FALSE(parse_selector("").has_value());
    EXPECT_TRUE(parse_selector("*").has_value());
}

// ---------------------------------------------------------------------------
// 3. Rule sets with selector lists, comments and at-rules
// ---------------------------------------------------------------------------
TEST(StyleSheetTest, ParseRules) {
    auto sheet = StyleSheet::parse(
        "/* header */ @import url(x.css); @media print { rect { fill: red } }"
        "rect, circle { fill: blue; stroke: green } .x { opacity: 0.5 }");
    ASSERT_EQ(sheet.rules.size(), 3u);
    EXPECT_EQ(sheet.rules[0].declarations.size(), 2u);
    EXPECT_EQ(sheet.rules[1].selector.parts[0].compound.simple[0].name, "circle");
    EXPECT_EQ(sheet.rules[2].source_order, 2u);
}

// ---------------------------------------------------------------------------
// 4. Matching walks ancestors for descendant combinators
// ---------------------------------------------------------------------------
TEST(StyleSheetTest, DescendantAndChildMatching) {
    Document doc;
    Element& root = doc.create_root();
    Element& group = root.append_element(ElementKind::G);
    group.set_attribute("class", "outer");
    Element& inner = group.append_element(ElementKind::G);
    Element& rect = inner.append_element(ElementKind::Rect);

    SelectorMatcher matcher;
    EXPECT_TRUE(matcher.matches(rect, *parse_selector(".outer rect")));
    EXPECT_FALSE(matcher.matches(rect, *parse_selector(".outer > rect")));
    EXPECT_TRUE(matcher.matches(rect, *parse_selector("g > rect")));
    EXPECT_TRUE(matcher.matches(group, *parse_selector("g:first-child")));
}

// ---------------------------------------------------------------------------
// 5. Attribute selectors with and without values
// ---------------------------------------------------------------------------
TEST(StyleSheetTest, AttributeSelectors) {
    Element rect(ElementKind::Rect);
    rect.set_attribute("data-kind", "box");
    SelectorMatcher matcher;
    EXPECT_TRUE(matcher.matches(rect, *parse_selector("[data-kind]")));
    EXPECT_TRUE(matcher.matches(rect, *parse_selector("rect[data-kind='box']")));
    EXPECT_FALSE(matcher.matches(rect, *parse_selector("[data-kind=circle]")));
}

// ---------------------------------------------------------------------------
// 6. Matched declarations sort by specificity, then source order
// ---------------------------------------------------------------------------
TEST(StyleSheetTest, CollectMatchingOrder) {
    auto sheet = StyleSheet::parse("#r { fill: red } rect { fill: blue } .c { fill: green } rect { fill: black }");
    Element rect(ElementKind::Rect);
    rect.set_attribute("id", "r");
    rect.set_attribute("class", "c");

    auto matched = collect_matching(sheet, rect);
    ASSERT_EQ(matched.size(), 4u);
    EXPECT_EQ(matched[0].declaration->value, "blue");
    EXPECT_EQ(matched[1].declaration->value, "black");
    EXPECT_EQ(matched[2].declaration->value, "green");
    EXPECT_EQ(matched[3].declaration->value, "red");
}

// ---------------------------------------------------------------------------
// 7. Document indexes ids and embedded style elements
// ---------------------------------------------------------------------------
TEST(DocumentTest, IndexesIdsAndStyles) {
    Document doc;
    Element& root = doc.create_root();
    Element& first = root.append_element(ElementKind::Rect);
    first.set_attribute("id", "dup");
    Element& second = root.append_element(ElementKind::Circle);
    second.set_attribute("id", "dup");
    Element& style = root.append_element(ElementKind::Style);
    style.append_text("rect { fill: red }");
    doc.add_stylesheet("circle { fill: blue }");
    doc.reindex();

    EXPECT_EQ(doc.get_element_by_id("dup"), &first);
    EXPECT_EQ(doc.get_element_by_id("missing"), nullptr);
    auto sheets = doc.all_stylesheets();
    ASSERT_EQ(sheets.size(), 2u);
    EXPECT_EQ(sheets[0], "rect { fill: red }");

    doc.add_resource("img.png", {1, 2, 3});
    ASSERT_NE(doc.resource("img.png"), nullptr);
    EXPECT_EQ(doc.resource("img.png")->size(), 3u);
    EXPECT_EQ(doc.resource("other.png"), nullptr);
}
