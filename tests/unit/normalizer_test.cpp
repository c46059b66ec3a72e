#include <tinta/core/diagnostics.h>
#include <tinta/dom/document.h>
#include <tinta/normalize/normalizer.h>
#include <tinta/tree/tree.h>

#include <gtest/gtest.h>

#include <initializer_list>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace tinta;

namespace {

using Attrs = std::initializer_list<std::pair<const char*, const char*>>;

dom::Element& add(dom::Element& parent, dom::ElementKind kind, Attrs attrs = {}) {
    dom::Element& child = parent.append_element(kind);
    for (const auto& [name, value] : attrs) child.set_attribute(name, value);
    return child;
}

dom::Element& make_root(dom::Document& doc, Attrs attrs) {
    dom::Element& root = doc.create_root();
    for (const auto& [name, value] : attrs) root.set_attribute(name, value);
    return root;
}

std::optional<tree::Tree> run(const dom::Document& doc, core::DiagnosticEmitter* diagnostics) {
    normalize::Options options;
    options.diagnostics = diagnostics;
    return normalize::normalize(doc, options);
}

paint::Color fill_color(const tree::Node* node) {
    const tree::Path* path = node ? node->as_path() : nullptr;
    if (!path || !path->fill) return paint::Color::transparent();
    const paint::Color* color = std::get_if<paint::Color>(&path->fill->paint);
    return color ? *color : paint::Color::transparent();
}

} // namespace

// ---------------------------------------------------------------------------
// 1. Width, height and viewBox define the size and the root transform
// ---------------------------------------------------------------------------
TEST(NormalizerTest, SizeAndViewBox) {
    dom::Document doc;
    dom::Element& root = make_root(doc, {{"width", "200"}, {"height", "100"}, {"viewBox", "0 0 100 50"}});
    add(root, dom::ElementKind::Rect, {{"id", "r"}, {"width", "10"}, {"height", "10"}});

    auto tree = run(doc, nullptr);
    ASSERT_TRUE(tree.has_value());
    EXPECT_EQ(tree->size, (geom::Size{200, 100}));
    EXPECT_EQ(tree->view_box, (geom::Rect{0, 0, 100, 50}));
    EXPECT_FLOAT_EQ(tree->root.transform.a, 2);

    const tree::Node* rect = tree->node_by_id("r");
    ASSERT_NE(rect, nullptr);
    ASSERT_TRUE(rect->abs_bounding_box().has_value());
    EXPECT_EQ(*rect->abs_bounding_box(), (geom::Rect{0, 0, 20, 20}));
}

// ---------------------------------------------------------------------------
// 2. A missing dimension follows the viewBox aspect ratio
// ---------------------------------------------------------------------------
TEST(NormalizerTest, MissingHeightFromViewBox) {
    dom::Document doc;
    make_root(doc, {{"width", "300"}, {"viewBox", "0 0 100 50"}});
    auto tree = run(doc, nullptr);
    ASSERT_TRUE(tree.has_value());
    EXPECT_EQ(tree->size, (geom::Size{300, 150}));
}

// ---------------------------------------------------------------------------
// 3. Without width, height or viewBox the default size is used
// ---------------------------------------------------------------------------
TEST(NormalizerTest, DefaultSize) {
    dom::Document doc;
    make_root(doc, {});
    normalize::Options options;
    options.default_size = geom::Size{64, 32};
    auto tree = normalize::normalize(doc, options);
    ASSERT_TRUE(tree.has_value());
    EXPECT_EQ(tree->size, (geom::Size{64, 32}));
}

// ---------------------------------------------------------------------------
// 4. Invalid roots are rejected with an error
// ---------------------------------------------------------------------------
TEST(NormalizerTest, RejectsInvalidRoot) {
    core::DiagnosticEmitter diagnostics;
    dom::Document not_svg;
    not_svg.set_root(std::make_unique<dom::Element>(dom::ElementKind::G));
    EXPECT_FALSE(run(not_svg, &diagnostics).has_value());
    EXPECT_TRUE(diagnostics.has_message_containing("not an svg"));

    dom::Document zero;
    make_root(zero, {{"width", "0"}, {"height", "10"}});
    EXPECT_FALSE(run(zero, &diagnostics).has_value());
    EXPECT_TRUE(diagnostics.has_message_containing("not positive"));
    EXPECT_EQ(diagnostics.events_by_severity(core::Severity::Error).size(), 2u);
}

// ---------------------------------------------------------------------------
// 5. Basic shapes become paths with resolved fill and stroke
// ---------------------------------------------------------------------------
TEST(NormalizerTest, ShapeConversion) {
    dom::Document doc;
    dom::Element& root = make_root(doc, {{"width", "100"}, {"height", "100"}});
    add(root, dom::ElementKind::Rect,
        {{"id", "r"}, {"x", "10"}, {"y", "20"}, {"width", "30"}, {"height", "40"}, {"fill", "#ff0000"}});
    add(root, dom::ElementKind::Circle,
        {{"id", "c"}, {"cx", "50"}, {"cy", "50"}, {"r", "5"}, {"fill", "none"}, {"stroke", "blue"},
         {"stroke-width", "2"}});
    add(root, dom::ElementKind::Rect, {{"id", "empty"}, {"width", "0"}, {"height", "10"}});

    auto tree = run(doc, nullptr);
    ASSERT_TRUE(tree.has_value());
    ASSERT_EQ(tree->root.children.size(), 2u);

    const tree::Path* rect = tree->root.children[0].as_path();
    ASSERT_NE(rect, nullptr);
    EXPECT_EQ(rect->id, "r");
    EXPECT_EQ(fill_color(&tree->root.children[0]), (paint::Color{255, 0, 0, 255}));
    EXPECT_FALSE(rect->stroke.has_value());
    EXPECT_EQ(*rect->bounding_box, (geom::Rect{10, 20, 30, 40}));

    const tree::Path* circle = tree->root.children[1].as_path();
    ASSERT_NE(circle, nullptr);
    EXPECT_FALSE(circle->fill.has_value());
    ASSERT_TRUE(circle->stroke.has_value());
    EXPECT_FLOAT_EQ(circle->stroke->style.width, 2);
    EXPECT_NEAR(circle->stroke_bounding_box->width, 12, 0.01f);
}

// ---------------------------------------------------------------------------
// 6. Cascade: attributes, rules, inline style, then !important
// ---------------------------------------------------------------------------
TEST(NormalizerTest, StyleCascade) {
    dom::Document doc;
    dom::Element& root = make_root(doc, {{"width", "100"}, {"height", "100"}});
    dom::Element& style = add(root, dom::ElementKind::Style);
    style.append_text("rect { fill: red } #b { fill: blue !important }");
    add(root, dom::ElementKind::Rect, {{"id", "a"}, {"width", "5"}, {"height", "5"}, {"fill", "green"}});
    add(root, dom::ElementKind::Rect,
        {{"id", "b"}, {"width", "5"}, {"height", "5"}, {"style", "fill: yellow"}});
    add(root, dom::ElementKind::Rect,
        {{"id", "c"}, {"width", "5"}, {"height", "5"}, {"style", "fill: #00ff00"}});

    auto tree = run(doc, nullptr);
    ASSERT_TRUE(tree.has_value());
    EXPECT_EQ(fill_color(tree->node_by_id("a")), (paint::Color{255, 0, 0, 255}));
    EXPECT_EQ(fill_color(tree->node_by_id("b")), (paint::Color{0, 0, 255, 255}));
    EXPECT_EQ(fill_color(tree->node_by_id("c")), (paint::Color{0, 255, 0, 255}));
}

// ---------------------------------------------------------------------------
// 7. Inherited properties flow from groups; plain groups are dropped
// ---------------------------------------------------------------------------
TEST(NormalizerTest, InheritanceAndGroupFlattening) {
    dom::Document doc;
    dom::Element& root = make_root(doc, {{"width", "100"}, {"height", "100"}});
    dom::Element& g = add(root, dom::ElementKind::G, {{"fill", "blue"}, {"stroke", "red"}, {"stroke-width", "3"}});
    add(g, dom::ElementKind::Rect, {{"id", "r"}, {"width", "5"}, {"height", "5"}});
    dom::Element& faded = add(root, dom::ElementKind::G, {{"id", "faded"}, {"opacity", "0.5"}});
    add(faded, dom::ElementKind::Rect, {{"width", "5"}, {"height", "5"}});

    auto tree = run(doc, nullptr);
    ASSERT_TRUE(tree.has_value());
    ASSERT_EQ(tree->root.children.size(), 2u);
    ASSERT_NE(tree->root.children[0].as_path(), nullptr);

    const tree::Path* rect = tree->node_by_id("r")->as_path();
    ASSERT_NE(rect, nullptr);
    EXPECT_EQ(fill_color(tree->node_by_id("r")), (paint::Color{0, 0, 255, 255}));
    ASSERT_TRUE(rect->stroke.has_value());
    EXPECT_FLOAT_EQ(rect->stroke->style.width, 3);

    const tree::Group* group = tree->root.children[1].as_group();
    ASSERT_NE(group, nullptr);
    EXPECT_EQ(group->id, "faded");
    EXPECT_FLOAT_EQ(group->opacity, 0.5f);
    EXPECT_TRUE(group->should_isolate());
}

// ---------------------------------------------------------------------------
// 8. Percentages resolve against the viewBox, absolute units against dpi
// ---------------------------------------------------------------------------
TEST(NormalizerTest, UnitResolution) {
    dom::Document doc;
    dom::Element& root = make_root(doc, {{"width", "400"}, {"height", "200"}, {"viewBox", "0 0 200 100"}});
    add(root, dom::ElementKind::Rect, {{"id", "pct"}, {"width", "50%"}, {"height", "50%"}});
    add(root, dom::ElementKind::Rect, {{"id", "abs"}, {"width", "1in"}, {"height", "0.5in"}});

    auto tree = run(doc, nullptr);
    ASSERT_TRUE(tree.has_value());
    EXPECT_EQ(*tree->node_by_id("pct")->bounding_box(), (geom::Rect{0, 0, 100, 50}));
    EXPECT_EQ(*tree->node_by_id("abs")->bounding_box(), (geom::Rect{0, 0, 96, 48}));
}

// ---------------------------------------------------------------------------
// 9. use instantiates its target with an extra translation
// ---------------------------------------------------------------------------
TEST(NormalizerTest, UseExpansion) {
    dom::Document doc;
    dom::Element& root = make_root(doc, {{"width", "100"}, {"height", "100"}});
    dom::Element& defs = add(root, dom::ElementKind::Defs);
    add(defs, dom::ElementKind::Rect, {{"id", "r"}, {"width", "10"}, {"height", "10"}});
    add(root, dom::ElementKind::Use, {{"href", "#r"}, {"x", "5"}, {"y", "7"}});

    auto tree = run(doc, nullptr);
    ASSERT_TRUE(tree.has_value());
    ASSERT_EQ(tree->root.children.size(), 1u);
    const tree::Group* use = tree->root.children[0].as_group();
    ASSERT_NE(use, nullptr);
    EXPECT_EQ(use->transform, geom::Transform::translate(5, 7));
    ASSERT_EQ(use->children.size(), 1u);
    EXPECT_EQ(use->children[0].id(), "r");
    EXPECT_EQ(*use->children[0].abs_bounding_box(), (geom::Rect{5, 7, 10, 10}));
}

// ---------------------------------------------------------------------------
// 10. use of a symbol maps its viewBox onto the use size
// ---------------------------------------------------------------------------
TEST(NormalizerTest, UseSymbolViewBox) {
    dom::Document doc;
    dom::Element& root = make_root(doc, {{"width", "100"}, {"height", "100"}});
    dom::Element& symbol = add(root, dom::ElementKind::Symbol, {{"id", "s"}, {"viewBox", "0 0 10 10"}});
    add(symbol, dom::ElementKind::Rect, {{"id", "inner"}, {"width", "10"}, {"height", "10"}});
    add(root, dom::ElementKind::Use, {{"xlink:href", "#s"}, {"width", "20"}, {"height", "20"}});

    auto tree = run(doc, nullptr);
    ASSERT_TRUE(tree.has_value());
    const tree::Node* inner = tree->node_by_id("inner");
    ASSERT_NE(inner, nullptr);
    EXPECT_EQ(*inner->abs_bounding_box(), (geom::Rect{0, 0, 20, 20}));
    EXPECT_EQ(tree->clip_paths.size(), 1u);
}

// ---------------------------------------------------------------------------
// 11. use cycles are broken with a warning
// ---------------------------------------------------------------------------
TEST(NormalizerTest, UseCycles) {
    core::DiagnosticEmitter diagnostics;
    dom::Document doc;
    dom::Element& root = make_root(doc, {{"width", "100"}, {"height", "100"}});
    dom::Element& g = add(root, dom::ElementKind::G, {{"id", "loop"}});
    add(g, dom::ElementKind::Use, {{"href", "#loop"}});
    add(root, dom::ElementKind::Use, {{"id", "u1"}, {"href", "#u2"}});
    add(root, dom::ElementKind::Use, {{"id", "u2"}, {"href", "#u1"}});

    auto tree = run(doc, &diagnostics);
    ASSERT_TRUE(tree.has_value());
    EXPECT_TRUE(tree->root.children.empty());
    EXPECT_TRUE(diagnostics.has_message_containing("own ancestor"));
    EXPECT_TRUE(diagnostics.has_message_containing("reference cycle"));
}

// ---------------------------------------------------------------------------
// 12. Missing references are treated as absent
// ---------------------------------------------------------------------------
TEST(NormalizerTest, MissingReferences) {
    core::DiagnosticEmitter diagnostics;
    dom::Document doc;
    dom::Element& root = make_root(doc, {{"width", "100"}, {"height", "100"}});
    add(root, dom::ElementKind::Rect, {{"id", "nofill"}, {"width", "5"}, {"height", "5"}, {"fill", "url(#nope)"}});
    add(root, dom::ElementKind::Rect,
        {{"id", "fallback"}, {"width", "5"}, {"height", "5"}, {"fill", "url(#nope) red"}});
    add(root, dom::ElementKind::Rect,
        {{"id", "unclipped"}, {"width", "5"}, {"height", "5"}, {"clip-path", "url(#missing)"}});
    add(root, dom::ElementKind::Use, {{"href", "#ghost"}});

    auto tree = run(doc, &diagnostics);
    ASSERT_TRUE(tree.has_value());
    EXPECT_EQ(tree->node_by_id("nofill"), nullptr);
    EXPECT_EQ(fill_color(tree->node_by_id("fallback")), (paint::Color{255, 0, 0, 255}));
    const tree::Node* unclipped = tree->node_by_id("unclipped");
    ASSERT_NE(unclipped, nullptr);
    EXPECT_NE(unclipped->as_path(), nullptr);
    EXPECT_TRUE(tree->clip_paths.empty());

    EXPECT_TRUE(diagnostics.has_message_containing("'nope' not found"));
    EXPECT_TRUE(diagnostics.has_message_containing("does not reference a clipPath"));
    EXPECT_TRUE(diagnostics.has_message_containing("missing element"));
}

// ---------------------------------------------------------------------------
// 13. Hidden, undisplayed and degenerate elements produce nothing
// ---------------------------------------------------------------------------
TEST(NormalizerTest, NonRenderedElements) {
    dom::Document doc;
    dom::Element& root = make_root(doc, {{"width", "100"}, {"height", "100"}});
    add(root, dom::ElementKind::Rect, {{"width", "5"}, {"height", "5"}, {"display", "none"}});
    add(root, dom::ElementKind::Rect, {{"width", "5"}, {"height", "5"}, {"visibility", "hidden"}});
    add(root, dom::ElementKind::Rect, {{"width", "5"}, {"height", "5"}, {"transform", "scale(0)"}});
    add(root, dom::ElementKind::G, {{"opacity", "0.5"}});
    dom::Element& defs = add(root, dom::ElementKind::Defs);
    add(defs, dom::ElementKind::Rect, {{"width", "5"}, {"height", "5"}});

    auto tree = run(doc, nullptr);
    ASSERT_TRUE(tree.has_value());
    EXPECT_TRUE(tree->root.children.empty());
}

// ---------------------------------------------------------------------------
// 14. Nested svg elements clip to their viewport unless overflow is visible
// ---------------------------------------------------------------------------
TEST(NormalizerTest, NestedSvgViewport) {
    dom::Document doc;
    dom::Element& root = make_root(doc, {{"width", "100"}, {"height", "100"}});
    dom::Element& clipped = add(root, dom::ElementKind::Svg, {{"x", "10"}, {"y", "10"}, {"width", "50"}, {"height", "50"}});
    add(clipped, dom::ElementKind::Rect, {{"id", "a"}, {"width", "80"}, {"height", "80"}});
    dom::Element& open = add(root, dom::ElementKind::Svg,
                             {{"width", "50"}, {"height", "50"}, {"overflow", "visible"}});
    add(open, dom::ElementKind::Rect, {{"id", "b"}, {"width", "80"}, {"height", "80"}});

    auto tree = run(doc, nullptr);
    ASSERT_TRUE(tree.has_value());
    ASSERT_EQ(tree->clip_paths.size(), 1u);
    ASSERT_EQ(tree->root.children.size(), 2u);
    const tree::Group* first = tree->root.children[0].as_group();
    ASSERT_NE(first, nullptr);
    ASSERT_TRUE(first->clip_path.has_value());
    EXPECT_EQ(*first->clip_path, 0u);
    EXPECT_EQ(*tree->node_by_id("a")->abs_bounding_box(), (geom::Rect{10, 10, 80, 80}));
    EXPECT_EQ(*tree->clip_paths[0].root.bounding_box, (geom::Rect{10, 10, 50, 50}));
}

// ---------------------------------------------------------------------------
// 15. The structural passes are idempotent
// ---------------------------------------------------------------------------
TEST(NormalizerTest, TreeNormalizeIsIdempotent) {
    dom::Document doc;
    dom::Element& root = make_root(doc, {{"width", "120"}, {"height", "80"}, {"viewBox", "0 0 60 40"}});
    dom::Element& defs = add(root, dom::ElementKind::Defs);
    dom::Element& grad = add(defs, dom::ElementKind::LinearGradient, {{"id", "g"}});
    add(grad, dom::ElementKind::Stop, {{"offset", "0"}, {"stop-color", "red"}});
    add(grad, dom::ElementKind::Stop, {{"offset", "1"}, {"stop-color", "blue"}});
    dom::Element& clip = add(defs, dom::ElementKind::ClipPath, {{"id", "c"}});
    add(clip, dom::ElementKind::Circle, {{"cx", "20"}, {"cy", "20"}, {"r", "15"}});
    dom::Element& g = add(root, dom::ElementKind::G, {{"opacity", "0.7"}, {"transform", "translate(3 4)"}});
    add(g, dom::ElementKind::Rect, {{"width", "30"}, {"height", "20"}, {"fill", "url(#g)"}});
    add(g, dom::ElementKind::Path, {{"d", "M0 0 L10 10"}, {"stroke", "black"}, {"clip-path", "url(#c)"}});
    add(root, dom::ElementKind::G);

    auto tree = run(doc, nullptr);
    ASSERT_TRUE(tree.has_value());
    std::string before = tree::dump(*tree);
    tree::normalize(*tree);
    EXPECT_EQ(tree::dump(*tree), before);
    EXPECT_NE(before.find("linear[2 stops]"), std::string::npos);
    EXPECT_NE(before.find("clip=0"), std::string::npos);
}

// ---------------------------------------------------------------------------
// 16. Clip paths that reach themselves drop the cyclic reference
// ---------------------------------------------------------------------------
TEST(NormalizerTest, ClipPathCycles) {
    core::DiagnosticEmitter diagnostics;
    dom::Document doc;
    dom::Element& root = make_root(doc, {{"width", "10"}, {"height", "10"}});
    dom::Element& self = add(root, dom::ElementKind::ClipPath, {{"id", "self"}, {"clip-path", "url(#self)"}});
    add(self, dom::ElementKind::Rect, {{"width", "5"}, {"height", "10"}});
    dom::Element& outer = add(root, dom::ElementKind::ClipPath, {{"id", "outer"}});
    add(outer, dom::ElementKind::Rect, {{"width", "5"}, {"height", "10"}, {"clip-path", "url(#outer)"}});
    add(root, dom::ElementKind::Rect, {{"width", "10"}, {"height", "10"}, {"clip-path", "url(#self)"}});
    add(root, dom::ElementKind::Rect, {{"width", "10"}, {"height", "10"}, {"clip-path", "url(#outer)"}});

    auto tree = run(doc, &diagnostics);
    ASSERT_TRUE(tree.has_value());
    EXPECT_EQ(tree->root.children.size(), 2u);
    ASSERT_EQ(tree->clip_paths.size(), 2u);
    for (const tree::ClipPath& clip : tree->clip_paths) {
        EXPECT_FALSE(clip.clip_path.has_value());
        ASSERT_EQ(clip.root.children.size(), 1u);
        const tree::Group* child = clip.root.children[0].as_group();
        if (child) EXPECT_FALSE(child->clip_path.has_value());
    }
    EXPECT_TRUE(diagnostics.has_message_containing("reference cycle through 'self'"));
    EXPECT_TRUE(diagnostics.has_message_containing("reference cycle through 'outer'"));
}

// ---------------------------------------------------------------------------
// 17. Pattern content painted with its own pattern is left unpainted
// ---------------------------------------------------------------------------
TEST(NormalizerTest, PatternSelfReference) {
    core::DiagnosticEmitter diagnostics;
    dom::Document doc;
    dom::Element& root = make_root(doc, {{"width", "10"}, {"height", "10"}});
    dom::Element& pattern = add(root, dom::ElementKind::Pattern,
                                {{"id", "p"}, {"width", "2"}, {"height", "2"},
                                 {"patternUnits", "userSpaceOnUse"}});
    add(pattern, dom::ElementKind::Rect, {{"width", "1"}, {"height", "1"}});
    add(pattern, dom::ElementKind::Rect, {{"width", "2"}, {"height", "2"}, {"fill", "url(#p)"}});
    add(root, dom::ElementKind::Rect, {{"id", "r"}, {"width", "10"}, {"height", "10"}, {"fill", "url(#p)"}});

    auto tree = run(doc, &diagnostics);
    ASSERT_TRUE(tree.has_value());
    ASSERT_EQ(tree->patterns.size(), 1u);
    EXPECT_EQ(tree->patterns[0].root.children.size(), 1u);
    const tree::Node* rect = tree->node_by_id("r");
    ASSERT_NE(rect, nullptr);
    ASSERT_NE(rect->as_path(), nullptr);
    ASSERT_TRUE(rect->as_path()->fill.has_value());
    EXPECT_NE(std::get_if<paint::PatternRef>(&rect->as_path()->fill->paint), nullptr);
    EXPECT_TRUE(diagnostics.has_message_containing("reference cycle through 'p'"));
}

// ---------------------------------------------------------------------------
// 18. Concurrent conversions of one document neither race nor update it
// ---------------------------------------------------------------------------
TEST(NormalizerTest, ConcurrentNormalizeLeavesDocumentUntouched) {
    dom::Document doc;
    dom::Element& root = make_root(doc, {{"width", "20"}, {"height", "20"}});
    dom::Element& style = add(root, dom::ElementKind::Style);
    style.append_text("rect { fill: blue }");
    dom::Element& clip = add(root, dom::ElementKind::ClipPath, {{"id", "c"}});
    add(clip, dom::ElementKind::Circle, {{"cx", "10"}, {"cy", "10"}, {"r", "8"}});
    add(root, dom::ElementKind::Rect, {{"id", "r"}, {"width", "20"}, {"height", "20"}, {"clip-path", "url(#c)"}});
    const dom::Document& shared = doc;

    auto expected = run(shared, nullptr);
    ASSERT_TRUE(expected.has_value());
    const std::string reference = tree::dump(*expected);
    EXPECT_EQ(fill_color(expected->node_by_id("r")), (paint::Color{0, 0, 255, 255}));

    std::vector<std::string> dumps[2];
    std::vector<std::thread> workers;
    for (auto& out : dumps) {
        workers.emplace_back([&shared, &out] {
            for (int i = 0; i < 20; ++i) {
                auto tree = run(shared, nullptr);
                out.push_back(tree ? tree::dump(*tree) : std::string());
            }
        });
    }
    for (auto& worker : workers) worker.join();
    for (const auto& out : dumps) {
        ASSERT_EQ(out.size(), 20u);
        for (const auto& dump : out) EXPECT_EQ(dump, reference);
    }

    // Elements appended after create_root stay unindexed until reindex().
    EXPECT_EQ(shared.get_element_by_id("r"), nullptr);
    doc.reindex();
    EXPECT_NE(doc.get_element_by_id("r"), nullptr);
}
