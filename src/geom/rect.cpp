#include <tinta/geom/rect.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace tinta::geom {

bool Rect::is_valid() const {
    return std::isfinite(x) && std::isfinite(y) && std::isfinite(width) &&
           std::isfinite(height) && width >= 0 && height >= 0;
}

Rect Rect::united(const Rect& o) const {
    float l = std::min(left(), o.left());
    float t = std::min(top(), o.top());
    float r = std::max(right(), o.right());
    float b = std::max(bottom(), o.bottom());
    return from_ltrb(l, t, r, b);
}

std::optional<Rect> Rect::intersected(const Rect& o) const {
    float l = std::max(left(), o.left());
    float t = std::max(top(), o.top());
    float r = std::min(right(), o.right());
    float b = std::min(bottom(), o.bottom());
    if (r <= l || b <= t) return std::nullopt;
    return from_ltrb(l, t, r, b);
}

Rect Rect::transformed(const Transform& ts) const {
    if (ts.is_identity()) return *this;
    Point corners[4] = {
        ts.apply({left(), top()}),
        ts.apply({right(), top()}),
        ts.apply({right(), bottom()}),
        ts.apply({left(), bottom()}),
    };
    float l = corners[0].x, r = corners[0].x;
    float t = corners[0].y, b = corners[0].y;
    for (int i = 1; i < 4; i++) {
        l = std::min(l, corners[i].x);
        r = std::max(r, corners[i].x);
        t = std::min(t, corners[i].y);
        b = std::max(b, corners[i].y);
    }
    return from_ltrb(l, t, r, b);
}

bool approx_equal(const Rect& l, const Rect& r, float eps) {
    return std::fabs(l.x - r.x) <= eps && std::fabs(l.y - r.y) <= eps &&
           std::fabs(l.width - r.width) <= eps && std::fabs(l.height - r.height) <= eps;
}

void extend(std::optional<Rect>& acc, const Rect& r) {
    if (!r.is_valid()) return;
    acc = acc ? acc->united(r) : r;
}

std::optional<IntRect> IntRect::intersected(const IntRect& o) const {
    int32_t l = std::max(x, o.x);
    int32_t t = std::max(y, o.y);
    int32_t r = std::min(right(), o.right());
    int32_t b = std::min(bottom(), o.bottom());
    if (r <= l || b <= t) return std::nullopt;
    return IntRect{l, t, r - l, b - t};
}

std::optional<IntRect> round_out(const Rect& r) {
    if (!r.is_valid() || r.is_empty()) return std::nullopt;
    constexpr float kLimit = static_cast<float>(std::numeric_limits<int32_t>::max() / 2);
    float l = std::floor(r.left());
    float t = std::floor(r.top());
    float rr = std::ceil(r.right());
    float b = std::ceil(r.bottom());
    if (std::fabs(l) > kLimit || std::fabs(t) > kLimit ||
        std::fabs(rr) > kLimit || std::fabs(b) > kLimit) {
        return std::nullopt;
    }
    IntRect out{static_cast<int32_t>(l), static_cast<int32_t>(t),
                static_cast<int32_t>(rr - l), static_cast<int32_t>(b - t)};
    if (out.is_empty()) return std::nullopt;
    return out;
}

} // namespace tinta::geom
