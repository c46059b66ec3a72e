#include <tinta/core/diagnostics.h>
#include <tinta/dom/document.h>
#include <tinta/normalize/normalizer.h>
#include <tinta/tree/tree.h>

#include <gtest/gtest.h>

#include <initializer_list>
#include <utility>

using namespace tinta;

namespace {

using Attrs = std::initializer_list<std::pair<const char*, const char*>>;

dom::Element& add(dom::Element& parent, dom::ElementKind kind, Attrs attrs = {}) {
    dom::Element& child = parent.append_element(kind);
    for (const auto& [name, value] : attrs) child.set_attribute(name, value);
    return child;
}

dom::Element& add(dom::Element& parent, const char* tag, Attrs attrs = {}) {
    dom::Element& child = parent.append_element(std::string(tag));
    for (const auto& [name, value] : attrs) child.set_attribute(name, value);
    return child;
}

// Document with a 200x100 svg root and an empty defs section.
struct TestDocument {
    dom::Document doc;
    dom::Element* root = nullptr;
    dom::Element* defs = nullptr;
    core::DiagnosticEmitter diagnostics;

    TestDocument() {
        root = &doc.create_root();
        root->set_attribute("width", "200");
        root->set_attribute("height", "100");
        defs = &add(*root, dom::ElementKind::Defs);
    }

    std::optional<tree::Tree> run() {
        normalize::Options options;
        options.diagnostics = &diagnostics;
        return normalize::normalize(doc, options);
    }
};

void add_stops(dom::Element& gradient) {
    add(gradient, dom::ElementKind::Stop, {{"offset", "0"}, {"stop-color", "red"}});
    add(gradient, dom::ElementKind::Stop, {{"offset", "100%"}, {"stop-color", "blue"}, {"stop-opacity", "0.5"}});
}

void expect_rect_near(const geom::Rect& actual, const geom::Rect& expected) {
    EXPECT_NEAR(actual.x, expected.x, 1e-4f);
    EXPECT_NEAR(actual.y, expected.y, 1e-4f);
    EXPECT_NEAR(actual.width, expected.width, 1e-4f);
    EXPECT_NEAR(actual.height, expected.height, 1e-4f);
}

const tree::Path* path_by_id(const tree::Tree& tree, const char* id) {
    const tree::Node* node = tree.node_by_id(id);
    return node ? node->as_path() : nullptr;
}

} // namespace

// ---------------------------------------------------------------------------
// 1. Bounding-box gradients fold the box into their transform
// ---------------------------------------------------------------------------
TEST(ResourcesTest, LinearGradientBoundingBox) {
    TestDocument t;
    dom::Element& grad = add(*t.defs, dom::ElementKind::LinearGradient, {{"id", "g"}, {"spreadMethod", "reflect"}});
    add_stops(grad);
    add(*t.root, dom::ElementKind::Rect,
        {{"id", "r"}, {"x", "10"}, {"y", "10"}, {"width", "100"}, {"height", "50"}, {"fill", "url(#g)"}});

    auto tree = t.run();
    ASSERT_TRUE(tree.has_value());
    const tree::Path* rect = path_by_id(*tree, "r");
    ASSERT_NE(rect, nullptr);
    const auto* lg = std::get_if<paint::LinearGradient>(&rect->fill->paint);
    ASSERT_NE(lg, nullptr);
    EXPECT_FLOAT_EQ(lg->x1, 0);
    EXPECT_FLOAT_EQ(lg->x2, 1);
    EXPECT_EQ(lg->spread, paint::SpreadMode::Reflect);
    ASSERT_EQ(lg->stops.size(), 2u);
    EXPECT_EQ(lg->stops[1].color.a, 128);
    geom::Point end = lg->transform.apply({1, 1});
    EXPECT_FLOAT_EQ(end.x, 110);
    EXPECT_FLOAT_EQ(end.y, 60);
}

// ---------------------------------------------------------------------------
// 2. href supplies stops while local attributes win
// ---------------------------------------------------------------------------
TEST(ResourcesTest, GradientHrefInheritance) {
    TestDocument t;
    dom::Element& base = add(*t.defs, dom::ElementKind::LinearGradient, {{"id", "base"}});
    add_stops(base);
    add(*t.defs, dom::ElementKind::LinearGradient,
        {{"id", "derived"}, {"href", "#base"}, {"gradientUnits", "userSpaceOnUse"}, {"x2", "200"}});
    add(*t.root, dom::ElementKind::Rect,
        {{"id", "r"}, {"width", "100"}, {"height", "50"}, {"fill", "url(#derived)"}});

    auto tree = t.run();
    ASSERT_TRUE(tree.has_value());
    const auto* lg = std::get_if<paint::LinearGradient>(&path_by_id(*tree, "r")->fill->paint);
    ASSERT_NE(lg, nullptr);
    EXPECT_FLOAT_EQ(lg->x2, 200);
    EXPECT_TRUE(lg->transform.is_identity());
    EXPECT_EQ(lg->stops.size(), 2u);
}

// ---------------------------------------------------------------------------
// 3. Degenerate gradients collapse to solid colors or disappear
// ---------------------------------------------------------------------------
TEST(ResourcesTest, DegenerateGradients) {
    TestDocument t;
    dom::Element& single = add(*t.defs, dom::ElementKind::RadialGradient, {{"id", "single"}});
    add(single, dom::ElementKind::Stop, {{"offset", "0.3"}, {"stop-color", "#00ff00"}});
    dom::Element& obb = add(*t.defs, dom::ElementKind::LinearGradient, {{"id", "obb"}});
    add_stops(obb);
    add(*t.root, dom::ElementKind::Rect, {{"id", "solid"}, {"width", "10"}, {"height", "10"}, {"fill", "url(#single)"}});
    add(*t.root, dom::ElementKind::Line,
        {{"id", "flat"}, {"x2", "50"}, {"fill", "none"}, {"stroke", "url(#obb)"}});

    auto tree = t.run();
    ASSERT_TRUE(tree.has_value());
    const tree::Path* solid = path_by_id(*tree, "solid");
    ASSERT_NE(solid, nullptr);
    EXPECT_EQ(std::get<paint::Color>(solid->fill->paint), (paint::Color{0, 255, 0, 255}));
    EXPECT_EQ(tree->node_by_id("flat"), nullptr);
}

// ---------------------------------------------------------------------------
// 4. Patterns are stored once and referenced by index
// ---------------------------------------------------------------------------
TEST(ResourcesTest, UserSpacePatternShared) {
    TestDocument t;
    dom::Element& pattern = add(*t.defs, dom::ElementKind::Pattern,
                                {{"id", "p"}, {"width", "10"}, {"height", "10"}, {"patternUnits", "userSpaceOnUse"},
                                 {"patternTransform", "rotate(45)"}});
    add(pattern, dom::ElementKind::Rect, {{"width", "5"}, {"height", "5"}});
    add(*t.root, dom::ElementKind::Rect, {{"id", "a"}, {"width", "50"}, {"height", "50"}, {"fill", "url(#p)"}});
    add(*t.root, dom::ElementKind::Rect,
        {{"id", "b"}, {"x", "60"}, {"width", "30"}, {"height", "30"}, {"fill", "url(#p)"}});

    auto tree = t.run();
    ASSERT_TRUE(tree.has_value());
    ASSERT_EQ(tree->patterns.size(), 1u);
    EXPECT_EQ(tree->patterns[0].rect, (geom::Rect{0, 0, 10, 10}));
    EXPECT_EQ(tree->patterns[0].transform, geom::Transform::rotate(45));
    EXPECT_EQ(tree->patterns[0].root.children.size(), 1u);
    EXPECT_EQ(std::get<paint::PatternRef>(path_by_id(*tree, "a")->fill->paint).index, 0u);
    EXPECT_EQ(std::get<paint::PatternRef>(path_by_id(*tree, "b")->fill->paint).index, 0u);
}

// ---------------------------------------------------------------------------
// 5. Bounding-box patterns resolve the tile against the element
// ---------------------------------------------------------------------------
TEST(ResourcesTest, BoundingBoxPattern) {
    TestDocument t;
    dom::Element& pattern = add(*t.defs, dom::ElementKind::Pattern,
                                {{"id", "p"}, {"x", "0.25"}, {"width", "0.5"}, {"height", "50%"},
                                 {"patternContentUnits", "objectBoundingBox"}});
    add(pattern, dom::ElementKind::Rect, {{"width", "0.1"}, {"height", "0.1"}});
    add(*t.root, dom::ElementKind::Rect,
        {{"id", "r"}, {"x", "20"}, {"y", "10"}, {"width", "40"}, {"height", "20"}, {"fill", "url(#p)"}});

    auto tree = t.run();
    ASSERT_TRUE(tree.has_value());
    ASSERT_EQ(tree->patterns.size(), 1u);
    const tree::Pattern& p = tree->patterns[0];
    EXPECT_EQ(p.rect, (geom::Rect{30, 10, 20, 10}));
    EXPECT_EQ(p.root.transform, geom::Transform::scale(40, 20));
}

// ---------------------------------------------------------------------------
// 6. Clip paths: user space, bounding box units and clip-only content
// ---------------------------------------------------------------------------
TEST(ResourcesTest, ClipPaths) {
    TestDocument t;
    dom::Element& user = add(*t.defs, dom::ElementKind::ClipPath, {{"id", "user"}});
    add(user, dom::ElementKind::Circle, {{"cx", "20"}, {"cy", "20"}, {"r", "10"}, {"fill", "none"}});
    dom::Element& ignored = add(user, dom::ElementKind::G);
    add(ignored, dom::ElementKind::Rect, {{"width", "5"}, {"height", "5"}});
    dom::Element& obb = add(*t.defs, dom::ElementKind::ClipPath, {{"id", "obb"}, {"clipPathUnits", "objectBoundingBox"}});
    add(obb, dom::ElementKind::Rect, {{"width", "0.5"}, {"height", "1"}});

    add(*t.root, dom::ElementKind::Rect,
        {{"id", "a"}, {"width", "40"}, {"height", "40"}, {"clip-path", "url(#user)"}});
    add(*t.root, dom::ElementKind::Rect,
        {{"id", "b"}, {"x", "10"}, {"y", "20"}, {"width", "100"}, {"height", "50"}, {"clip-path", "url(#obb)"}});

    auto tree = t.run();
    ASSERT_TRUE(tree.has_value());
    ASSERT_EQ(tree->clip_paths.size(), 2u);

    const tree::Group* a = tree->node_by_id("a")->as_group();
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->clip_path.has_value());
    const tree::ClipPath& user_clip = tree->clip_paths[*a->clip_path];
    EXPECT_EQ(user_clip.id, "user");
    ASSERT_EQ(user_clip.root.children.size(), 1u);
    const tree::Path* circle = user_clip.root.children[0].as_path();
    ASSERT_NE(circle, nullptr);
    ASSERT_TRUE(circle->fill.has_value());
    EXPECT_EQ(std::get<paint::Color>(circle->fill->paint), paint::Color::black());

    const tree::Group* b = tree->node_by_id("b")->as_group();
    ASSERT_NE(b, nullptr);
    const tree::ClipPath& obb_clip = tree->clip_paths[*b->clip_path];
    EXPECT_EQ(obb_clip.transform, (geom::Transform{100, 0, 10, 0, 50, 20}));
}

// ---------------------------------------------------------------------------
// 7. Mask region defaults and mask type
// ---------------------------------------------------------------------------
TEST(ResourcesTest, Masks) {
    TestDocument t;
    dom::Element& mask = add(*t.defs, dom::ElementKind::Mask, {{"id", "m"}, {"mask-type", "alpha"}});
    add(mask, dom::ElementKind::Rect, {{"width", "50"}, {"height", "50"}, {"fill", "white"}});
    add(*t.root, dom::ElementKind::Rect, {{"id", "r"}, {"width", "100"}, {"height", "50"}, {"mask", "url(#m)"}});

    auto tree = t.run();
    ASSERT_TRUE(tree.has_value());
    ASSERT_EQ(tree->masks.size(), 1u);
    const tree::Mask& m = tree->masks[0];
    expect_rect_near(m.rect, {-10, -5, 120, 60});
    EXPECT_EQ(m.kind, tree::MaskType::Alpha);
    EXPECT_EQ(m.root.children.size(), 1u);
    const tree::Group* r = tree->node_by_id("r")->as_group();
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->mask, std::optional<size_t>(0));
}

// ---------------------------------------------------------------------------
// 8. Filter primitives, default subregions and result references
// ---------------------------------------------------------------------------
TEST(ResourcesTest, FilterPrimitives) {
    TestDocument t;
    dom::Element& f = add(*t.defs, dom::ElementKind::Filter, {{"id", "f"}});
    add(f, dom::ElementKind::FeGaussianBlur, {{"stdDeviation", "2 3"}, {"result", "blur"}});
    add(f, dom::ElementKind::FeOffset, {{"in", "blur"}, {"dx", "4"}, {"color-interpolation-filters", "sRGB"}});
    add(f, dom::ElementKind::FeComposite, {{"in", "SourceGraphic"}, {"in2", "nowhere"}, {"operator", "arithmetic"}, {"k2", "1"}});
    add(*t.root, dom::ElementKind::Rect, {{"id", "r"}, {"width", "100"}, {"height", "50"}, {"filter", "url(#f)"}});

    auto tree = t.run();
    ASSERT_TRUE(tree.has_value());
    ASSERT_EQ(tree->filters.size(), 1u);
    const filter::Filter& filter = tree->filters[0];
    expect_rect_near(filter.rect, {-10, -5, 120, 60});
    ASSERT_EQ(filter.primitives.size(), 3u);

    const auto* blur = std::get_if<filter::GaussianBlur>(&filter.primitives[0].kind);
    ASSERT_NE(blur, nullptr);
    EXPECT_FLOAT_EQ(blur->std_dev_x, 2);
    EXPECT_FLOAT_EQ(blur->std_dev_y, 3);
    EXPECT_EQ(blur->input, filter::Input::source_graphic());
    EXPECT_EQ(filter.primitives[0].rect, filter.rect);
    EXPECT_EQ(filter.primitives[0].color_space, paint::ColorSpace::LinearRGB);

    const auto* offset = std::get_if<filter::Offset>(&filter.primitives[1].kind);
    ASSERT_NE(offset, nullptr);
    EXPECT_EQ(offset->input, filter::Input::reference("blur"));
    EXPECT_EQ(filter.primitives[1].color_space, paint::ColorSpace::SRGB);

    const auto* composite = std::get_if<filter::Composite>(&filter.primitives[2].kind);
    ASSERT_NE(composite, nullptr);
    EXPECT_EQ(composite->op, filter::Composite::Operator::Arithmetic);
    EXPECT_EQ(composite->input2, filter::Input::reference(filter.primitives[1].result));
    EXPECT_TRUE(t.diagnostics.has_message_containing("unknown filter input 'nowhere'"));

    const tree::Group* r = tree->node_by_id("r")->as_group();
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(*r->layer_bounding_box, filter.rect);
}

// ---------------------------------------------------------------------------
// 9. Unsupported primitives pass their input through
// ---------------------------------------------------------------------------
TEST(ResourcesTest, UnsupportedPrimitive) {
    TestDocument t;
    dom::Element& f = add(*t.defs, dom::ElementKind::Filter, {{"id", "f"}});
    add(f, "feTurbulence", {{"baseFrequency", "0.05"}});
    add(*t.root, dom::ElementKind::Rect, {{"width", "10"}, {"height", "10"}, {"filter", "url(#f)"}});

    auto tree = t.run();
    ASSERT_TRUE(tree.has_value());
    ASSERT_EQ(tree->filters.size(), 1u);
    EXPECT_NE(std::get_if<filter::PassThrough>(&tree->filters[0].primitives[0].kind), nullptr);
    EXPECT_TRUE(t.diagnostics.has_message_containing("'feTurbulence' is not supported"));
}

// ---------------------------------------------------------------------------
// 10. An empty filter disables rendering; a user-space one paints empty groups
// ---------------------------------------------------------------------------
TEST(ResourcesTest, FilterRenderability) {
    TestDocument t;
    add(*t.defs, dom::ElementKind::Filter, {{"id", "empty"}});
    dom::Element& flood = add(*t.defs, dom::ElementKind::Filter,
                              {{"id", "flood"}, {"filterUnits", "userSpaceOnUse"}, {"x", "0"}, {"y", "0"},
                               {"width", "50"}, {"height", "40"}});
    add(flood, dom::ElementKind::FeFlood, {{"flood-color", "orange"}, {"flood-opacity", "0.5"}});

    add(*t.root, dom::ElementKind::Rect, {{"id", "gone"}, {"width", "10"}, {"height", "10"}, {"filter", "url(#empty)"}});
    add(*t.root, dom::ElementKind::G, {{"id", "painted"}, {"filter", "url(#flood)"}});

    auto tree = t.run();
    ASSERT_TRUE(tree.has_value());
    EXPECT_EQ(tree->node_by_id("gone"), nullptr);
    const tree::Node* painted = tree->node_by_id("painted");
    ASSERT_NE(painted, nullptr);
    const tree::Group* g = painted->as_group();
    ASSERT_NE(g, nullptr);
    EXPECT_TRUE(g->children.empty());
    ASSERT_EQ(g->filters.size(), 1u);
    EXPECT_EQ(*g->layer_bounding_box, (geom::Rect{0, 0, 50, 40}));

    const auto* fl = std::get_if<filter::Flood>(&tree->filters[g->filters[0]].primitives[0].kind);
    ASSERT_NE(fl, nullptr);
    EXPECT_EQ(fl->color, (paint::Color{255, 165, 0, 255}));
    EXPECT_FLOAT_EQ(fl->opacity, 0.5f);
}

// ---------------------------------------------------------------------------
// 11. CSS filter functions are reported and skipped
// ---------------------------------------------------------------------------
TEST(ResourcesTest, FilterFunctionsUnsupported) {
    TestDocument t;
    add(*t.root, dom::ElementKind::Rect, {{"id", "r"}, {"width", "10"}, {"height", "10"}, {"filter", "blur(2px)"}});
    auto tree = t.run();
    ASSERT_TRUE(tree.has_value());
    EXPECT_NE(tree->node_by_id("r"), nullptr);
    EXPECT_TRUE(tree->filters.empty());
    EXPECT_TRUE(t.diagnostics.has_message_containing("filter function 'blur(2px)' is not supported"));
}
