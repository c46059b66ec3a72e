#include <tinta/geom/path.h>
#include <tinta/geom/stroke.h>

#include <gtest/gtest.h>

using namespace tinta::geom;

namespace {

Path horizontal_line() {
    PathBuilder b;
    b.move_to(0, 5);
    b.line_to(10, 5);
    return *b.finish();
}

} // namespace

// ---------------------------------------------------------------------------
// 1. Butt caps end exactly at the endpoints
// ---------------------------------------------------------------------------
TEST(StrokeTest, ButtCapBounds) {
    StrokeStyle style;
    style.width = 2;
    auto outline = stroke_to_path(horizontal_line(), style, Transform::identity(), 0.1f);
    ASSERT_TRUE(outline.has_value());
    auto bounds = outline->bounds();
    ASSERT_TRUE(bounds.has_value());
    EXPECT_TRUE(approx_equal(*bounds, Rect{0, 4, 10, 2}));
}

// ---------------------------------------------------------------------------
// 2. Square caps extend by half the width
// ---------------------------------------------------------------------------
TEST(StrokeTest, SquareCapBounds) {
    StrokeStyle style;
    style.width = 2;
    style.cap = LineCap::Square;
    auto outline = stroke_to_path(horizontal_line(), style, Transform::identity(), 0.1f);
    ASSERT_TRUE(outline.has_value());
    EXPECT_TRUE(approx_equal(*outline->bounds(), Rect{-1, 4, 12, 2}));
}

// ---------------------------------------------------------------------------
// 3. Round caps stay within the pen radius
// ---------------------------------------------------------------------------
TEST(StrokeTest, RoundCapBounds) {
    StrokeStyle style;
    style.width = 2;
    style.cap = LineCap::Round;
    auto outline = stroke_to_path(horizontal_line(), style, Transform::identity(), 0.1f);
    ASSERT_TRUE(outline.has_value());
    auto bounds = *outline->bounds();
    EXPECT_NEAR(bounds.x, -1, 1e-3f);
    EXPECT_NEAR(bounds.right(), 11, 1e-3f);
}

// ---------------------------------------------------------------------------
// 4. The outline is mapped into device space
// ---------------------------------------------------------------------------
TEST(StrokeTest, OutlineIsTransformed) {
    StrokeStyle style;
    style.width = 2;
    auto outline = stroke_to_path(horizontal_line(), style, Transform::scale(2, 2), 0.1f);
    ASSERT_TRUE(outline.has_value());
    EXPECT_TRUE(approx_equal(*outline->bounds(), Rect{0, 8, 20, 4}));
}

// ---------------------------------------------------------------------------
// 5. Zero width produces no outline
// ---------------------------------------------------------------------------
TEST(StrokeTest, ZeroWidthIsEmpty) {
    StrokeStyle style;
    style.width = 0;
    EXPECT_FALSE(stroke_to_path(horizontal_line(), style, Transform::identity(), 0.1f).has_value());
}

// ---------------------------------------------------------------------------
// 6. Dashes split a line into on intervals
// ---------------------------------------------------------------------------
TEST(StrokeTest, DashSplitsLine) {
    Polyline line;
    line.points = {{0, 0}, {10, 0}};
    auto dashes = apply_dash({line}, {2, 2}, 0);
    ASSERT_EQ(dashes.size(), 3u);
    EXPECT_EQ(dashes[0].points.front(), (Point{0, 0}));
    EXPECT_EQ(dashes[0].points.back(), (Point{2, 0}));
    EXPECT_EQ(dashes[1].points.front(), (Point{4, 0}));
    EXPECT_EQ(dashes[2].points.back(), (Point{10, 0}));
}

// ---------------------------------------------------------------------------
// 7. Dash offset shifts the pattern
// ---------------------------------------------------------------------------
TEST(StrokeTest, DashOffsetShiftsPattern) {
    Polyline line;
    line.points = {{0, 0}, {10, 0}};
    auto dashes = apply_dash({line}, {2, 2}, 1);
    ASSERT_FALSE(dashes.empty());
    EXPECT_EQ(dashes[0].points.front(), (Point{0, 0}));
    EXPECT_EQ(dashes[0].points.back(), (Point{1, 0}));
    EXPECT_EQ(dashes[1].points.front(), (Point{3, 0}));
}

// ---------------------------------------------------------------------------
// 8. Dashing a closed polyline yields open dashes
// ---------------------------------------------------------------------------
TEST(StrokeTest, DashedClosedPolylineIsOpen) {
    Polyline square;
    square.points = {{0, 0}, {10, 0}, {10, 10}, {0, 10}};
    square.closed = true;
    auto dashes = apply_dash({square}, {5, 5}, 0);
    ASSERT_EQ(dashes.size(), 4u);
    for (const auto& dash : dashes) EXPECT_FALSE(dash.closed);
}

// ---------------------------------------------------------------------------
// 9. Loose stroke bounds account for the miter limit
// ---------------------------------------------------------------------------
TEST(StrokeTest, StrokeBoundsUseMiterLimit) {
    StrokeStyle style;
    style.width = 2;
    style.miter_limit = 4;
    auto bounds = stroke_bounds(horizontal_line(), style);
    ASSERT_TRUE(bounds.has_value());
    EXPECT_TRUE(approx_equal(*bounds, Rect{-4, 1, 18, 8}));

    style.join = LineJoin::Round;
    EXPECT_TRUE(approx_equal(*stroke_bounds(horizontal_line(), style), Rect{-1, 4, 12, 2}));
}

// ---------------------------------------------------------------------------
// 10. Dash boundaries stay exact far along a long line
// ---------------------------------------------------------------------------
TEST(StrokeTest, DashesAlongLongLine) {
    Polyline line;
    line.points = {{0, 0}, {1000, 0}};
    auto dashes = apply_dash({line}, {0.25f, 0.25f}, 0);
    ASSERT_EQ(dashes.size(), 2000u);
    EXPECT_EQ(dashes[1000].points.front(), (Point{500, 0}));
    EXPECT_NEAR(dashes[1999].points.front().x, 999.5f, 1e-3f);
    EXPECT_EQ(dashes[1999].points.back(), (Point{1000, 0}));
}

// ---------------------------------------------------------------------------
// 11. Patterns too fine to dash fall back to a solid stroke
// ---------------------------------------------------------------------------
TEST(StrokeTest, TooManyDashesStrokeSolid) {
    Polyline line;
    line.points = {{0, 0}, {1000, 0}};
    auto dashes = apply_dash({line}, {1e-5f, 1e-5f}, 0);
    ASSERT_EQ(dashes.size(), 1u);
    EXPECT_EQ(dashes[0].points, line.points);

    PathBuilder b;
    b.move_to(0, 0);
    b.line_to(1000, 0);
    StrokeStyle style;
    style.width = 2;
    style.dasharray = {1e-5f, 1e-5f};
    auto outline = stroke_to_path(*b.finish(), style, Transform::identity(), 0.1f);
    ASSERT_TRUE(outline.has_value());
    auto bounds = outline->bounds();
    ASSERT_TRUE(bounds.has_value());
    EXPECT_TRUE(approx_equal(*bounds, Rect{0, -1, 1000, 2}));
}
