#include <tinta/geom/rect.h>
#include <tinta/geom/transform.h>

#include <gtest/gtest.h>

#include <cmath>

using namespace tinta::geom;

// ---------------------------------------------------------------------------
// 1. Concatenation applies the right-hand transform first
// ---------------------------------------------------------------------------
TEST(TransformTest, ConcatenationOrder) {
    Transform ts = Transform::translate(10, 0) * Transform::scale(2, 2);
    Point p = ts.apply({1, 1});
    EXPECT_FLOAT_EQ(p.x, 12);
    EXPECT_FLOAT_EQ(p.y, 2);
}

// ---------------------------------------------------------------------------
// 2. SVG matrix() argument order
// ---------------------------------------------------------------------------
TEST(TransformTest, FromSvgMatrix) {
    Transform ts = Transform::from_svg(1, 2, 3, 4, 5, 6);
    Point p = ts.apply({1, 0});
    EXPECT_FLOAT_EQ(p.x, 6);
    EXPECT_FLOAT_EQ(p.y, 8);
}

// ---------------------------------------------------------------------------
// 3. Inverse round trip
// ---------------------------------------------------------------------------
TEST(TransformTest, InverseRoundTrip) {
    Transform ts = Transform::translate(3, -4) * Transform::rotate(30) * Transform::scale(2, 0.5f);
    auto inv = ts.invert();
    ASSERT_TRUE(inv.has_value());
    EXPECT_TRUE(approx_equal(ts * *inv, Transform::identity()));
}

// ---------------------------------------------------------------------------
// 4. Singular transforms have no inverse
// ---------------------------------------------------------------------------
TEST(TransformTest, SingularHasNoInverse) {
    EXPECT_FALSE(Transform::scale(0, 1).invert().has_value());
    Transform nan = Transform::identity();
    nan.a = NAN;
    EXPECT_FALSE(nan.is_invertible());
}

// ---------------------------------------------------------------------------
// 5. Rotation around a point keeps that point fixed
// ---------------------------------------------------------------------------
TEST(TransformTest, RotateAroundFixedPoint) {
    Transform ts = Transform::rotate_around(90, 5, 5);
    Point p = ts.apply({5, 5});
    EXPECT_NEAR(p.x, 5, 1e-4f);
    EXPECT_NEAR(p.y, 5, 1e-4f);
    Point q = ts.apply({6, 5});
    EXPECT_NEAR(q.x, 5, 1e-4f);
    EXPECT_NEAR(q.y, 6, 1e-4f);
}

// ---------------------------------------------------------------------------
// 6. Axis scales and mean scale
// ---------------------------------------------------------------------------
TEST(TransformTest, ScaleFactors) {
    float sx = 0, sy = 0;
    (Transform::rotate(45) * Transform::scale(3, 2)).get_scale(sx, sy);
    EXPECT_NEAR(sx, 3, 1e-4f);
    EXPECT_NEAR(sy, 2, 1e-4f);
    EXPECT_NEAR(Transform::scale(4, 1).mean_scale(), 2, 1e-5f);
}

// ---------------------------------------------------------------------------
// 7. Vectors ignore translation
// ---------------------------------------------------------------------------
TEST(TransformTest, ApplyVectorIgnoresTranslation) {
    Point v = (Transform::translate(100, 100) * Transform::scale(2, 3)).apply_vector({1, 1});
    EXPECT_FLOAT_EQ(v.x, 2);
    EXPECT_FLOAT_EQ(v.y, 3);
}

// ---------------------------------------------------------------------------
// 8. Rect union and intersection
// ---------------------------------------------------------------------------
TEST(RectTest, UnionAndIntersection) {
    Rect a{0, 0, 10, 10};
    Rect b{5, 5, 10, 10};
    EXPECT_EQ(a.united(b), (Rect{0, 0, 15, 15}));
    auto i = a.intersected(b);
    ASSERT_TRUE(i.has_value());
    EXPECT_EQ(*i, (Rect{5, 5, 5, 5}));
    EXPECT_FALSE(a.intersected(Rect{20, 20, 1, 1}).has_value());
}

// ---------------------------------------------------------------------------
// 9. Transformed rect is the bounding box of its corners
// ---------------------------------------------------------------------------
TEST(RectTest, TransformedBoundingBox) {
    Rect r = Rect{0, 0, 10, 10}.transformed(Transform::rotate(45));
    EXPECT_NEAR(r.width, 14.1421f, 1e-3f);
    EXPECT_NEAR(r.height, 14.1421f, 1e-3f);
    EXPECT_NEAR(r.x, -7.0711f, 1e-3f);
}

// ---------------------------------------------------------------------------
// 10. round_out covers partial pixels and rejects empty rects
// ---------------------------------------------------------------------------
TEST(RectTest, RoundOut) {
    auto r = round_out(Rect{0.5f, 1.2f, 2.0f, 2.0f});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, (IntRect{0, 1, 3, 3}));
    EXPECT_FALSE(round_out(Rect{0, 0, 0, 5}).has_value());
    EXPECT_FALSE(round_out(Rect{0, 0, INFINITY, 5}).has_value());
}

// ---------------------------------------------------------------------------
// 11. extend skips invalid rects
// ---------------------------------------------------------------------------
TEST(RectTest, ExtendAccumulates) {
    std::optional<Rect> acc;
    extend(acc, Rect{0, 0, 1, 1});
    extend(acc, Rect{NAN, 0, 1, 1});
    extend(acc, Rect{4, 4, 1, 1});
    ASSERT_TRUE(acc.has_value());
    EXPECT_EQ(*acc, (Rect{0, 0, 5, 5}));
}
