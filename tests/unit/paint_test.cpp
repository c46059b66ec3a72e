#include <tinta/paint/blend_mode.h>
#include <tinta/paint/paint.h>

#include <gtest/gtest.h>

using namespace tinta;
using namespace tinta::paint;

namespace {

Gradient two_stop(Color from, Color to) {
    Gradient g;
    g.stops = {{0, from}, {1, to}};
    return g;
}

} // namespace

// ---------------------------------------------------------------------------
// 1. sRGB transfer tables are monotonic and fix the endpoints
// ---------------------------------------------------------------------------
TEST(ColorTest, TransferTables) {
    const uint8_t* to_linear = srgb_to_linear_table();
    const uint8_t* to_srgb = linear_to_srgb_table();
    EXPECT_EQ(to_linear[0], 0);
    EXPECT_EQ(to_linear[255], 255);
    EXPECT_EQ(to_srgb[255], 255);
    EXPECT_EQ(to_linear[128], 55);
    EXPECT_NEAR(to_srgb[55], 128, 1);
    for (int i = 1; i < 256; i++) {
        EXPECT_GE(to_linear[i], to_linear[i - 1]);
        EXPECT_GE(to_srgb[i], to_srgb[i - 1]);
    }
    EXPECT_NEAR(srgb_to_linear(linear_to_srgb(0.3f)), 0.3f, 1e-5f);
}

// ---------------------------------------------------------------------------
// 2. Premultiplication round-trips and transparent stays zero
// ---------------------------------------------------------------------------
TEST(ColorTest, Premultiply) {
    ColorF c = ColorF::from(Color{255, 0, 0, 255}, 0.5f);
    ColorF p = c.premultiplied();
    EXPECT_FLOAT_EQ(p.r, 0.5f);
    EXPECT_FLOAT_EQ(p.a, 0.5f);
    ColorF back = p.demultiplied();
    EXPECT_FLOAT_EQ(back.r, 1.0f);
    ColorF zero = ColorF{1, 1, 1, 0}.demultiplied();
    EXPECT_FLOAT_EQ(zero.r, 0.0f);
    EXPECT_EQ(to_u8(-1.0f), 0);
    EXPECT_EQ(to_u8(2.0f), 255);
}

// ---------------------------------------------------------------------------
// 3. Stop offsets are clamped, made monotonic and runs reduced
// ---------------------------------------------------------------------------
TEST(GradientTest, NormalizeStops) {
    std::vector<Stop> stops = {
        {0.5f, Color{1, 0, 0, 255}},
        {0.2f, Color{2, 0, 0, 255}},
        {0.5f, Color{3, 0, 0, 255}},
        {0.5f, Color{4, 0, 0, 255}},
        {1.4f, Color{5, 0, 0, 255}},
    };
    normalize_stops(stops);
    ASSERT_EQ(stops.size(), 3u);
    EXPECT_FLOAT_EQ(stops[0].offset, 0.5f);
    EXPECT_EQ(stops[0].color.r, 1);
    EXPECT_FLOAT_EQ(stops[1].offset, 0.5f);
    EXPECT_EQ(stops[1].color.r, 4);
    EXPECT_FLOAT_EQ(stops[2].offset, 1.0f);
}

// ---------------------------------------------------------------------------
// 4. Spread modes
// ---------------------------------------------------------------------------
TEST(GradientTest, SpreadModes) {
    EXPECT_FLOAT_EQ(apply_spread(1.5f, SpreadMode::Pad), 1.0f);
    EXPECT_FLOAT_EQ(apply_spread(-0.5f, SpreadMode::Pad), 0.0f);
    EXPECT_FLOAT_EQ(apply_spread(1.25f, SpreadMode::Repeat), 0.25f);
    EXPECT_FLOAT_EQ(apply_spread(-0.25f, SpreadMode::Repeat), 0.75f);
    EXPECT_FLOAT_EQ(apply_spread(2.0f, SpreadMode::Repeat), 1.0f);
    EXPECT_FLOAT_EQ(apply_spread(1.25f, SpreadMode::Reflect), 0.75f);
    EXPECT_FLOAT_EQ(apply_spread(-0.25f, SpreadMode::Reflect), 0.25f);

    // The bounds themselves and one period beyond each.
    EXPECT_FLOAT_EQ(apply_spread(-1.0f, SpreadMode::Pad), 0.0f);
    EXPECT_FLOAT_EQ(apply_spread(0.0f, SpreadMode::Pad), 0.0f);
    EXPECT_FLOAT_EQ(apply_spread(1.0f, SpreadMode::Pad), 1.0f);
    EXPECT_FLOAT_EQ(apply_spread(2.0f, SpreadMode::Pad), 1.0f);
    EXPECT_FLOAT_EQ(apply_spread(-1.0f, SpreadMode::Repeat), 0.0f);
    EXPECT_FLOAT_EQ(apply_spread(0.0f, SpreadMode::Repeat), 0.0f);
    EXPECT_FLOAT_EQ(apply_spread(1.0f, SpreadMode::Repeat), 1.0f);
    EXPECT_FLOAT_EQ(apply_spread(-1.0f, SpreadMode::Reflect), 1.0f);
    EXPECT_FLOAT_EQ(apply_spread(0.0f, SpreadMode::Reflect), 0.0f);
    EXPECT_FLOAT_EQ(apply_spread(1.0f, SpreadMode::Reflect), 1.0f);
    EXPECT_FLOAT_EQ(apply_spread(2.0f, SpreadMode::Reflect), 0.0f);
    EXPECT_FLOAT_EQ(apply_spread(1.75f, SpreadMode::Reflect), 0.25f);
}

// ---------------------------------------------------------------------------
// 5. Stop sampling in sRGB and linearRGB
// ---------------------------------------------------------------------------
TEST(GradientTest, SampleColorSpaces) {
    Gradient g = two_stop(Color::black(), Color::white());
    ColorF mid = sample_stops(g, 0.5f);
    EXPECT_FLOAT_EQ(mid.r, 0.5f);
    EXPECT_FLOAT_EQ(mid.a, 1.0f);

    g.color_space = ColorSpace::LinearRGB;
    ColorF linear_mid = sample_stops(g, 0.5f);
    EXPECT_NEAR(linear_mid.r, linear_to_srgb(0.5f), 1e-5f);
    EXPECT_GT(linear_mid.r, 0.7f);

    ColorF before = sample_stops(g, -1.0f);
    EXPECT_FLOAT_EQ(before.r, 0.0f);
    EXPECT_FLOAT_EQ(sample_stops(Gradient{}, 0.5f).a, 0.0f);
}

// ---------------------------------------------------------------------------
// 6. Premultiplied alpha interpolation keeps the opaque hue
// ---------------------------------------------------------------------------
TEST(GradientTest, SamplePremultipliedInterpolation) {
    Gradient g = two_stop(Color{255, 0, 0, 255}, Color{0, 0, 255, 0});
    ColorF straight = sample_stops(g, 0.5f);
    EXPECT_FLOAT_EQ(straight.a, 0.5f);
    EXPECT_FLOAT_EQ(straight.b, 0.25f);

    g.alpha_interpolation = AlphaInterpolation::Premultiplied;
    ColorF premul = sample_stops(g, 0.5f);
    EXPECT_FLOAT_EQ(premul.a, 0.5f);
    EXPECT_FLOAT_EQ(premul.r, 0.5f);
    EXPECT_FLOAT_EQ(premul.b, 0.0f);
}

// ---------------------------------------------------------------------------
// 7. Linear and radial gradient parameters
// ---------------------------------------------------------------------------
TEST(GradientTest, GradientParameters) {
    LinearGradient lg;
    lg.x1 = 0;
    lg.x2 = 10;
    EXPECT_FLOAT_EQ(lg.t_at({5, 3}), 0.5f);
    EXPECT_FLOAT_EQ(lg.t_at({-10, 0}), -1.0f);

    RadialGradient rg;
    auto edge = rg.t_at({1.0f, 0.5f});
    ASSERT_TRUE(edge.has_value());
    EXPECT_NEAR(*edge, 1.0f, 1e-5f);
    auto center = rg.t_at({0.5f, 0.5f});
    ASSERT_TRUE(center.has_value());
    EXPECT_NEAR(*center, 0.0f, 1e-5f);
}

// ---------------------------------------------------------------------------
// 8. Bounding-box units
// ---------------------------------------------------------------------------
TEST(GradientTest, BoundingBoxUnits) {
    geom::Rect bbox{10, 20, 100, 50};
    auto ts = resolve_units(geom::Transform::translate(0.1f, 0), Units::ObjectBoundingBox, bbox);
    ASSERT_TRUE(ts.has_value());
    geom::Point p = ts->apply({0, 0});
    EXPECT_FLOAT_EQ(p.x, 20);
    EXPECT_FLOAT_EQ(p.y, 20);
    geom::Point q = ts->apply({0.9f, 1});
    EXPECT_FLOAT_EQ(q.x, 110);
    EXPECT_FLOAT_EQ(q.y, 70);

    EXPECT_FALSE(resolve_units(geom::Transform::identity(), Units::ObjectBoundingBox,
                               geom::Rect{0, 0, 0, 10})
                     .has_value());
    EXPECT_TRUE(resolve_units(geom::Transform::identity(), Units::UserSpaceOnUse,
                              geom::Rect{0, 0, 0, 10})
                    .has_value());
}

// ---------------------------------------------------------------------------
// 9. Blend mode keywords
// ---------------------------------------------------------------------------
TEST(BlendModeTest, Names) {
    EXPECT_EQ(*blend_mode_from_name("color-dodge"), BlendMode::ColorDodge);
    EXPECT_EQ(*blend_mode_from_name("luminosity"), BlendMode::Luminosity);
    EXPECT_FALSE(blend_mode_from_name("plus-lighter").has_value());
    EXPECT_STREQ(blend_mode_name(BlendMode::HardLight), "hard-light");
}
