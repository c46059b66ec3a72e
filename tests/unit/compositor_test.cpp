#include <tinta/render/compositor.h>
#include <tinta/render/rasterizer.h>
#include <tinta/render/shader.h>

#include <gtest/gtest.h>

using namespace tinta;
using namespace tinta::render;
using paint::BlendMode;
using paint::Color;
using paint::ColorF;

namespace {

void expect_color_near(const ColorF& actual, const ColorF& expected) {
    EXPECT_NEAR(actual.r, expected.r, 1e-4f);
    EXPECT_NEAR(actual.g, expected.g, 1e-4f);
    EXPECT_NEAR(actual.b, expected.b, 1e-4f);
    EXPECT_NEAR(actual.a, expected.a, 1e-4f);
}

Pixmap make_pixmap(uint32_t w, uint32_t h) {
    auto pixmap = Pixmap::create(w, h);
    EXPECT_TRUE(pixmap.has_value());
    return std::move(*pixmap);
}

} // namespace

// ---------------------------------------------------------------------------
// 1. Normal blending is source-over on premultiplied colors
// ---------------------------------------------------------------------------
TEST(CompositorTest, SourceOver) {
    ColorF out = blend({0.5f, 0, 0, 0.5f}, {0, 0, 1, 1}, BlendMode::Normal);
    expect_color_near(out, {0.5f, 0, 0.5f, 1});
}

// ---------------------------------------------------------------------------
// 2. Separable blend modes on opaque colors
// ---------------------------------------------------------------------------
TEST(CompositorTest, SeparableModes) {
    expect_color_near(blend({1, 0, 0, 1}, {0.5f, 0.5f, 0.5f, 1}, BlendMode::Multiply),
                      {0.5f, 0, 0, 1});
    expect_color_near(blend({0.5f, 0.5f, 0.5f, 1}, {0.5f, 0.5f, 0.5f, 1}, BlendMode::Screen),
                      {0.75f, 0.75f, 0.75f, 1});
    expect_color_near(blend({1, 1, 1, 1}, {0.25f, 0.5f, 1, 1}, BlendMode::Difference),
                      {0.75f, 0.5f, 0, 1});
    expect_color_near(blend({0.2f, 0.8f, 0.5f, 1}, {0.6f, 0.4f, 0.5f, 1}, BlendMode::Darken),
                      {0.2f, 0.4f, 0.5f, 1});
}

// ---------------------------------------------------------------------------
// 3. Any mode over a transparent backdrop keeps the source
// ---------------------------------------------------------------------------
TEST(CompositorTest, TransparentBackdrop) {
    expect_color_near(blend({0.3f, 0.2f, 0.1f, 0.5f}, {0, 0, 0, 0}, BlendMode::Multiply),
                      {0.3f, 0.2f, 0.1f, 0.5f});
    expect_color_near(blend({0.3f, 0.2f, 0.1f, 0.5f}, {0, 0, 0, 0}, BlendMode::Luminosity),
                      {0.3f, 0.2f, 0.1f, 0.5f});
}

// ---------------------------------------------------------------------------
// 4. Coverage scales the shader color
// ---------------------------------------------------------------------------
TEST(CompositorTest, FillCoverage) {
    Pixmap canvas = make_pixmap(4, 4);
    geom::PathBuilder builder;
    builder.push_rect({0, 0, 2, 2});
    auto coverage = rasterize(*builder.finish(), geom::Transform::identity(),
                              tree::FillRule::NonZero, true, canvas.rect());
    ASSERT_TRUE(coverage.has_value());

    fill_coverage(canvas, *coverage, Shader::solid({255, 0, 0, 255}, 0.5f));
    EXPECT_EQ(canvas.pixel(0, 0), (Color{128, 0, 0, 128}));
    EXPECT_EQ(canvas.pixel(1, 1), (Color{128, 0, 0, 128}));
    EXPECT_EQ(canvas.pixel(2, 2), Color::transparent());
    EXPECT_EQ(canvas.demultiplied_pixel(0, 0), (Color{255, 0, 0, 128}));
}

// ---------------------------------------------------------------------------
// 5. Layers are placed at an offset, cropped and faded by opacity
// ---------------------------------------------------------------------------
TEST(CompositorTest, DrawLayer) {
    Pixmap canvas = make_pixmap(4, 4);
    Pixmap layer = make_pixmap(2, 2);
    layer.fill({0, 255, 0, 255});

    draw_layer(canvas, layer, 1, 1, 0.5f, BlendMode::Normal);
    EXPECT_EQ(canvas.pixel(1, 1), (Color{0, 128, 0, 128}));
    EXPECT_EQ(canvas.pixel(2, 2), (Color{0, 128, 0, 128}));
    EXPECT_EQ(canvas.pixel(0, 0), Color::transparent());
    EXPECT_EQ(canvas.pixel(3, 3), Color::transparent());

    Pixmap partly_outside = make_pixmap(4, 4);
    draw_layer(partly_outside, layer, -1, 3, 1, BlendMode::Normal);
    EXPECT_EQ(partly_outside.pixel(0, 3), (Color{0, 255, 0, 255}));
    EXPECT_EQ(partly_outside.pixel(1, 3), Color::transparent());
}

// ---------------------------------------------------------------------------
// 6. Mask values come from luminance or alpha
// ---------------------------------------------------------------------------
TEST(CompositorTest, MaskValues) {
    Pixmap mask = make_pixmap(3, 1);
    store_pixel(mask.pixel_ptr(0, 0), {1, 1, 1, 1});
    store_pixel(mask.pixel_ptr(1, 0), {0, 0, 0, 1});
    mask.pixel_ptr(2, 0)[0] = 128;
    mask.pixel_ptr(2, 0)[3] = 128;

    auto luminance = mask_values(mask, tree::MaskType::Luminance);
    ASSERT_EQ(luminance.size(), 3u);
    EXPECT_EQ(luminance[0], 255);
    EXPECT_EQ(luminance[1], 0);
    EXPECT_EQ(luminance[2], 27);

    auto alpha = mask_values(mask, tree::MaskType::Alpha);
    EXPECT_EQ(alpha[0], 255);
    EXPECT_EQ(alpha[1], 255);
    EXPECT_EQ(alpha[2], 128);
}

// ---------------------------------------------------------------------------
// 7. Applying mask values scales every premultiplied channel
// ---------------------------------------------------------------------------
TEST(CompositorTest, ApplyMaskValues) {
    Pixmap canvas = make_pixmap(2, 1);
    uint8_t* p = canvas.pixel_ptr(0, 0);
    p[0] = 200;
    p[1] = 100;
    p[3] = 200;
    uint8_t* q = canvas.pixel_ptr(1, 0);
    q[0] = 50;
    q[3] = 50;

    apply_mask_values(canvas, {128, 0});
    EXPECT_EQ(canvas.pixel(0, 0), (Color{100, 50, 0, 100}));
    EXPECT_EQ(canvas.pixel(1, 0), Color::transparent());
}
