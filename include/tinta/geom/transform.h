#pragma once
#include <optional>

namespace tinta::geom {

struct Point {
    float x = 0;
    float y = 0;

    bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Point& o) const { return !(*this == o); }
};

inline Point operator+(Point l, Point r) { return {l.x + r.x, l.y + r.y}; }
inline Point operator-(Point l, Point r) { return {l.x - r.x, l.y - r.y}; }
inline Point operator*(float s, Point p) { return {s * p.x, s * p.y}; }

// 2D affine transform matrix: [a b tx; c d ty; 0 0 1]
//   x' = a * x + b * y + tx
//   y' = c * x + d * y + ty
struct Transform {
    float a = 1, b = 0, tx = 0;
    float c = 0, d = 1, ty = 0;

    static Transform identity() { return {1, 0, 0, 0, 1, 0}; }
    static Transform translate(float x, float y) { return {1, 0, x, 0, 1, y}; }
    static Transform scale(float sx, float sy) { return {sx, 0, 0, 0, sy, 0}; }
    static Transform rotate(float degrees);
    static Transform rotate_around(float degrees, float cx, float cy);
    static Transform skew_x(float degrees);
    static Transform skew_y(float degrees);

    // SVG/CSS matrix(a, b, c, d, e, f), column-major order.
    static Transform from_svg(float sa, float sb, float sc, float sd, float se, float sf) {
        return {sa, sc, se, sb, sd, sf};
    }

    Point apply(Point p) const {
        return {a * p.x + b * p.y + tx, c * p.x + d * p.y + ty};
    }

    void apply(float px, float py, float& ox, float& oy) const {
        ox = a * px + b * py + tx;
        oy = c * px + d * py + ty;
    }

    // Applies only the linear part (for direction vectors).
    Point apply_vector(Point v) const {
        return {a * v.x + b * v.y, c * v.x + d * v.y};
    }

    // Concatenate: this * other. `other` is applied first.
    Transform operator*(const Transform& o) const {
        Transform r;
        r.a  = a * o.a  + b * o.c;
        r.b  = a * o.b  + b * o.d;
        r.tx = a * o.tx + b * o.ty + tx;
        r.c  = c * o.a  + d * o.c;
        r.d  = c * o.b  + d * o.d;
        r.ty = c * o.tx + d * o.ty + ty;
        return r;
    }

    bool operator==(const Transform& o) const {
        return a == o.a && b == o.b && tx == o.tx && c == o.c && d == o.d && ty == o.ty;
    }
    bool operator!=(const Transform& o) const { return !(*this == o); }

    // `local` is applied before this transform (child inside this space).
    Transform pre_concat(const Transform& local) const { return *this * local; }
    // `outer` is applied after this transform.
    Transform post_concat(const Transform& outer) const { return outer * *this; }

    Transform pre_translate(float x, float y) const { return *this * translate(x, y); }
    Transform pre_scale(float sx, float sy) const { return *this * scale(sx, sy); }
    Transform post_translate(float x, float y) const { return translate(x, y) * *this; }
    Transform post_scale(float sx, float sy) const { return scale(sx, sy) * *this; }

    float determinant() const { return a * d - b * c; }

    bool is_identity() const {
        return a == 1 && b == 0 && tx == 0 && c == 0 && d == 1 && ty == 0;
    }

    bool is_invertible() const;
    bool is_finite() const;
    bool has_skew_or_rotation() const { return b != 0 || c != 0; }

    std::optional<Transform> invert() const;

    // Length of the transformed unit x and y axes.
    void get_scale(float& sx, float& sy) const;
    // Geometric mean of the axis scales, used to scale tolerances and widths.
    float mean_scale() const;
};

bool approx_equal(const Transform& l, const Transform& r, float eps = 1e-4f);

} // namespace tinta::geom
