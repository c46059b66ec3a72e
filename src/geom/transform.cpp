#include <tinta/geom/transform.h>

#include <cmath>

namespace tinta::geom {

namespace {
constexpr float kPi = 3.14159265358979f;
constexpr float kDegToRad = kPi / 180.0f;
}

Transform Transform::rotate(float degrees) {
    float rad = degrees * kDegToRad;
    float cs = std::cos(rad);
    float sn = std::sin(rad);
    return {cs, -sn, 0, sn, cs, 0};
}

Transform Transform::rotate_around(float degrees, float cx, float cy) {
    return translate(cx, cy) * rotate(degrees) * translate(-cx, -cy);
}

Transform Transform::skew_x(float degrees) {
    return {1, std::tan(degrees * kDegToRad), 0, 0, 1, 0};
}

Transform Transform::skew_y(float degrees) {
    return {1, 0, 0, std::tan(degrees * kDegToRad), 1, 0};
}

bool Transform::is_finite() const {
    return std::isfinite(a) && std::isfinite(b) && std::isfinite(tx) &&
           std::isfinite(c) && std::isfinite(d) && std::isfinite(ty);
}

bool Transform::is_invertible() const {
    float det = determinant();
    return is_finite() && std::isfinite(det) && std::fabs(det) > 1e-12f;
}

std::optional<Transform> Transform::invert() const {
    if (!is_invertible()) return std::nullopt;
    float inv_det = 1.0f / determinant();
    Transform r;
    r.a =  d * inv_det;
    r.b = -b * inv_det;
    r.c = -c * inv_det;
    r.d =  a * inv_det;
    r.tx = -(r.a * tx + r.b * ty);
    r.ty = -(r.c * tx + r.d * ty);
    if (!r.is_finite()) return std::nullopt;
    return r;
}

void Transform::get_scale(float& sx, float& sy) const {
    sx = std::sqrt(a * a + c * c);
    sy = std::sqrt(b * b + d * d);
}

float Transform::mean_scale() const {
    return std::sqrt(std::fabs(determinant()));
}

bool approx_equal(const Transform& l, const Transform& r, float eps) {
    return std::fabs(l.a - r.a) <= eps && std::fabs(l.b - r.b) <= eps &&
           std::fabs(l.c - r.c) <= eps && std::fabs(l.d - r.d) <= eps &&
           std::fabs(l.tx - r.tx) <= eps && std::fabs(l.ty - r.ty) <= eps;
}

} // namespace tinta::geom
