#include <tinta/geom/path.h>
#include <tinta/geom/flatten.h>

#include <algorithm>
#include <cmath>

namespace tinta::geom {

namespace {

constexpr float kPi = 3.14159265358979f;

// Roots of a*t^2 + b*t + c in (0, 1).
int unit_quadratic_roots(float a, float b, float c, float roots[2]) {
    int count = 0;
    if (std::fabs(a) < 1e-12f) {
        if (std::fabs(b) > 1e-12f) {
            float t = -c / b;
            if (t > 0 && t < 1) roots[count++] = t;
        }
        return count;
    }
    float disc = b * b - 4 * a * c;
    if (disc < 0) return 0;
    float sq = std::sqrt(disc);
    float t1 = (-b + sq) / (2 * a);
    float t2 = (-b - sq) / (2 * a);
    if (t1 > 0 && t1 < 1) roots[count++] = t1;
    if (t2 > 0 && t2 < 1) roots[count++] = t2;
    return count;
}

Point eval_cubic(Point p0, Point p1, Point p2, Point p3, float t) {
    float mt = 1 - t;
    float a = mt * mt * mt;
    float b = 3 * mt * mt * t;
    float c = 3 * mt * t * t;
    float d = t * t * t;
    return {a * p0.x + b * p1.x + c * p2.x + d * p3.x,
            a * p0.y + b * p1.y + c * p2.y + d * p3.y};
}

Point eval_quad(Point p0, Point p1, Point p2, float t) {
    float mt = 1 - t;
    return {mt * mt * p0.x + 2 * mt * t * p1.x + t * t * p2.x,
            mt * mt * p0.y + 2 * mt * t * p1.y + t * t * p2.y};
}

void include(float& l, float& t, float& r, float& b, Point p) {
    l = std::min(l, p.x);
    t = std::min(t, p.y);
    r = std::max(r, p.x);
    b = std::max(b, p.y);
}

} // namespace

std::vector<Segment> Path::segments() const {
    std::vector<Segment> out;
    out.reserve(verbs_.size());
    size_t pi = 0;
    Point current;
    Point start;
    for (Verb v : verbs_) {
        Segment seg;
        seg.verb = v;
        seg.from = current;
        switch (v) {
            case Verb::MoveTo:
                seg.pts[0] = points_[pi++];
                current = start = seg.pts[0];
                break;
            case Verb::LineTo:
                seg.pts[0] = points_[pi++];
                current = seg.pts[0];
                break;
            case Verb::QuadTo:
                seg.pts[0] = points_[pi++];
                seg.pts[1] = points_[pi++];
                current = seg.pts[1];
                break;
            case Verb::CubicTo:
                seg.pts[0] = points_[pi++];
                seg.pts[1] = points_[pi++];
                seg.pts[2] = points_[pi++];
                current = seg.pts[2];
                break;
            case Verb::Close:
                seg.pts[0] = start;
                current = start;
                break;
        }
        out.push_back(seg);
    }
    return out;
}

std::optional<Rect> Path::control_bounds() const {
    if (points_.empty()) return std::nullopt;
    float l = points_[0].x, r = points_[0].x;
    float t = points_[0].y, b = points_[0].y;
    for (const auto& p : points_) include(l, t, r, b, p);
    return Rect::from_ltrb(l, t, r, b);
}

std::optional<Rect> Path::bounds() const {
    if (points_.empty()) return std::nullopt;
    float l = points_[0].x, r = points_[0].x;
    float t = points_[0].y, b = points_[0].y;
    for (const auto& seg : segments()) {
        switch (seg.verb) {
            case Verb::MoveTo:
            case Verb::LineTo:
                include(l, t, r, b, seg.pts[0]);
                break;
            case Verb::Close:
                break;
            case Verb::QuadTo: {
                Point p0 = seg.from, p1 = seg.pts[0], p2 = seg.pts[1];
                include(l, t, r, b, p2);
                // Derivative is linear: t = (p0 - p1) / (p0 - 2p1 + p2)
                float dx = p0.x - 2 * p1.x + p2.x;
                float dy = p0.y - 2 * p1.y + p2.y;
                if (std::fabs(dx) > 1e-12f) {
                    float tt = (p0.x - p1.x) / dx;
                    if (tt > 0 && tt < 1) include(l, t, r, b, eval_quad(p0, p1, p2, tt));
                }
                if (std::fabs(dy) > 1e-12f) {
                    float tt = (p0.y - p1.y) / dy;
                    if (tt > 0 && tt < 1) include(l, t, r, b, eval_quad(p0, p1, p2, tt));
                }
                break;
            }
            case Verb::CubicTo: {
                Point p0 = seg.from, p1 = seg.pts[0], p2 = seg.pts[1], p3 = seg.pts[2];
                include(l, t, r, b, p3);
                float roots[2];
                // d/dt of cubic: 3(a t^2 + b t + c) with
                // a = -p0 + 3p1 - 3p2 + p3, b = 2(p0 - 2p1 + p2), c = p1 - p0
                int n = unit_quadratic_roots(-p0.x + 3 * p1.x - 3 * p2.x + p3.x,
                                             2 * (p0.x - 2 * p1.x + p2.x),
                                             p1.x - p0.x, roots);
                for (int i = 0; i < n; i++) include(l, t, r, b, eval_cubic(p0, p1, p2, p3, roots[i]));
                n = unit_quadratic_roots(-p0.y + 3 * p1.y - 3 * p2.y + p3.y,
                                         2 * (p0.y - 2 * p1.y + p2.y),
                                         p1.y - p0.y, roots);
                for (int i = 0; i < n; i++) include(l, t, r, b, eval_cubic(p0, p1, p2, p3, roots[i]));
                break;
            }
        }
    }
    return Rect::from_ltrb(l, t, r, b);
}

Path Path::transformed(const Transform& ts) const {
    Path out = *this;
    if (ts.is_identity()) return out;
    for (auto& p : out.points_) p = ts.apply(p);
    return out;
}

float Path::length() const {
    float total = 0;
    for (const auto& poly : flatten(*this, Transform::identity(), 0.05f)) {
        size_t n = poly.points.size();
        for (size_t i = 1; i < n; i++) {
            Point d = poly.points[i] - poly.points[i - 1];
            total += std::sqrt(d.x * d.x + d.y * d.y);
        }
        if (poly.closed && n > 1) {
            Point d = poly.points.front() - poly.points.back();
            total += std::sqrt(d.x * d.x + d.y * d.y);
        }
    }
    return total;
}

bool Path::point_at(float distance, Point& point, float& angle) const {
    if (distance < 0) return false;
    float walked = 0;
    for (const auto& poly : flatten(*this, Transform::identity(), 0.05f)) {
        std::vector<Point> pts = poly.points;
        if (poly.closed && pts.size() > 1) pts.push_back(pts.front());
        for (size_t i = 1; i < pts.size(); i++) {
            Point d = pts[i] - pts[i - 1];
            float len = std::sqrt(d.x * d.x + d.y * d.y);
            if (len <= 0) continue;
            if (walked + len >= distance) {
                float t = (distance - walked) / len;
                point = {pts[i - 1].x + d.x * t, pts[i - 1].y + d.y * t};
                angle = std::atan2(d.y, d.x);
                return true;
            }
            walked += len;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// PathBuilder
// ---------------------------------------------------------------------------

void PathBuilder::move_to(float x, float y) {
    // Consecutive move_to: the later one wins.
    if (!path_.verbs_.empty() && path_.verbs_.back() == Verb::MoveTo) {
        path_.points_.back() = {x, y};
    } else {
        last_move_verb_ = path_.verbs_.size();
        path_.verbs_.push_back(Verb::MoveTo);
        path_.points_.push_back({x, y});
    }
    current_ = start_ = {x, y};
    has_current_ = true;
    needs_move_ = false;
}

void PathBuilder::inject_move_to_if_needed() {
    if (!has_current_) {
        move_to(0, 0);
    } else if (needs_move_) {
        move_to(start_.x, start_.y);
    }
}

void PathBuilder::line_to(float x, float y) {
    inject_move_to_if_needed();
    path_.verbs_.push_back(Verb::LineTo);
    path_.points_.push_back({x, y});
    current_ = {x, y};
}

void PathBuilder::quad_to(float x1, float y1, float x, float y) {
    inject_move_to_if_needed();
    path_.verbs_.push_back(Verb::QuadTo);
    path_.points_.push_back({x1, y1});
    path_.points_.push_back({x, y});
    current_ = {x, y};
}

void PathBuilder::cubic_to(float x1, float y1, float x2, float y2, float x, float y) {
    inject_move_to_if_needed();
    path_.verbs_.push_back(Verb::CubicTo);
    path_.points_.push_back({x1, y1});
    path_.points_.push_back({x2, y2});
    path_.points_.push_back({x, y});
    current_ = {x, y};
}

void PathBuilder::close() {
    if (path_.verbs_.empty()) return;
    Verb last = path_.verbs_.back();
    // A close right after a move or another close draws nothing.
    if (last == Verb::Close || last == Verb::MoveTo) {
        needs_move_ = true;
        current_ = start_;
        return;
    }
    path_.verbs_.push_back(Verb::Close);
    current_ = start_;
    needs_move_ = true;
}

void PathBuilder::arc_to(float rx, float ry, float x_axis_rotation, bool large_arc,
                         bool sweep, float x, float y) {
    inject_move_to_if_needed();
    Point p0 = current_;
    Point p1 = {x, y};
    if (p0 == p1) return;

    rx = std::fabs(rx);
    ry = std::fabs(ry);
    if (rx == 0 || ry == 0) {
        line_to(x, y);
        return;
    }

    float phi = x_axis_rotation * kPi / 180.0f;
    float cos_phi = std::cos(phi);
    float sin_phi = std::sin(phi);

    // Endpoint to center parameterization (SVG implementation notes F.6.5).
    float dx2 = (p0.x - p1.x) / 2;
    float dy2 = (p0.y - p1.y) / 2;
    float x1p = cos_phi * dx2 + sin_phi * dy2;
    float y1p = -sin_phi * dx2 + cos_phi * dy2;

    float lambda = (x1p * x1p) / (rx * rx) + (y1p * y1p) / (ry * ry);
    if (lambda > 1) {
        float s = std::sqrt(lambda);
        rx *= s;
        ry *= s;
    }

    float rx2 = rx * rx, ry2 = ry * ry;
    float num = rx2 * ry2 - rx2 * y1p * y1p - ry2 * x1p * x1p;
    float den = rx2 * y1p * y1p + ry2 * x1p * x1p;
    float coef = den > 0 ? std::sqrt(std::max(0.0f, num / den)) : 0;
    if (large_arc == sweep) coef = -coef;
    float cxp = coef * (rx * y1p / ry);
    float cyp = coef * -(ry * x1p / rx);

    float cx = cos_phi * cxp - sin_phi * cyp + (p0.x + p1.x) / 2;
    float cy = sin_phi * cxp + cos_phi * cyp + (p0.y + p1.y) / 2;

    auto angle = [](float ux, float uy, float vx, float vy) {
        float dot = ux * vx + uy * vy;
        float len = std::sqrt(ux * ux + uy * uy) * std::sqrt(vx * vx + vy * vy);
        float a = std::acos(std::clamp(dot / len, -1.0f, 1.0f));
        if (ux * vy - uy * vx < 0) a = -a;
        return a;
    };

    float theta1 = angle(1, 0, (x1p - cxp) / rx, (y1p - cyp) / ry);
    float dtheta = angle((x1p - cxp) / rx, (y1p - cyp) / ry,
                         (-x1p - cxp) / rx, (-y1p - cyp) / ry);
    if (!sweep && dtheta > 0) dtheta -= 2 * kPi;
    if (sweep && dtheta < 0) dtheta += 2 * kPi;

    int segments = static_cast<int>(std::ceil(std::fabs(dtheta) / (kPi / 2) - 1e-4f));
    if (segments < 1) segments = 1;
    float delta = dtheta / static_cast<float>(segments);
    float k = 4.0f / 3.0f * std::tan(delta / 4);

    float t = theta1;
    for (int i = 0; i < segments; i++) {
        float cos1 = std::cos(t), sin1 = std::sin(t);
        float t2 = t + delta;
        float cos2 = std::cos(t2), sin2 = std::sin(t2);

        // Unit circle control points, then scale/rotate/translate.
        Point e1 = {cos1 - k * sin1, sin1 + k * cos1};
        Point e2 = {cos2 + k * sin2, sin2 - k * cos2};
        Point e3 = {cos2, sin2};
        auto map = [&](Point p) {
            float px = p.x * rx;
            float py = p.y * ry;
            return Point{cos_phi * px - sin_phi * py + cx, sin_phi * px + cos_phi * py + cy};
        };
        Point c1 = map(e1);
        Point c2 = map(e2);
        Point end = (i == segments - 1) ? p1 : map(e3);
        cubic_to(c1.x, c1.y, c2.x, c2.y, end.x, end.y);
        t = t2;
    }
}

void PathBuilder::push_rect(const Rect& r) {
    move_to(r.left(), r.top());
    line_to(r.right(), r.top());
    line_to(r.right(), r.bottom());
    line_to(r.left(), r.bottom());
    close();
}

void PathBuilder::push_rounded_rect(const Rect& r, float rx, float ry) {
    if (rx <= 0 || ry <= 0) {
        push_rect(r);
        return;
    }
    rx = std::min(rx, r.width / 2);
    ry = std::min(ry, r.height / 2);
    float x = r.x, y = r.y, w = r.width, h = r.height;
    move_to(x + rx, y);
    line_to(x + w - rx, y);
    arc_to(rx, ry, 0, false, true, x + w, y + ry);
    line_to(x + w, y + h - ry);
    arc_to(rx, ry, 0, false, true, x + w - rx, y + h);
    line_to(x + rx, y + h);
    arc_to(rx, ry, 0, false, true, x, y + h - ry);
    line_to(x, y + ry);
    arc_to(rx, ry, 0, false, true, x + rx, y);
    close();
}

void PathBuilder::push_ellipse(float cx, float cy, float rx, float ry) {
    move_to(cx + rx, cy);
    arc_to(rx, ry, 0, false, true, cx, cy + ry);
    arc_to(rx, ry, 0, false, true, cx - rx, cy);
    arc_to(rx, ry, 0, false, true, cx, cy - ry);
    arc_to(rx, ry, 0, false, true, cx + rx, cy);
    close();
}

void PathBuilder::push_path(const Path& path) {
    push_path(path, Transform::identity());
}

void PathBuilder::push_path(const Path& path, const Transform& ts) {
    for (const auto& seg : path.segments()) {
        Point p0 = ts.apply(seg.pts[0]);
        switch (seg.verb) {
            case Verb::MoveTo: move_to(p0.x, p0.y); break;
            case Verb::LineTo: line_to(p0.x, p0.y); break;
            case Verb::QuadTo: {
                Point p1 = ts.apply(seg.pts[1]);
                quad_to(p0.x, p0.y, p1.x, p1.y);
                break;
            }
            case Verb::CubicTo: {
                Point p1 = ts.apply(seg.pts[1]);
                Point p2 = ts.apply(seg.pts[2]);
                cubic_to(p0.x, p0.y, p1.x, p1.y, p2.x, p2.y);
                break;
            }
            case Verb::Close: close(); break;
        }
    }
}

std::optional<Path> PathBuilder::finish() {
    // Drop a trailing lone move_to.
    if (!path_.verbs_.empty() && path_.verbs_.back() == Verb::MoveTo) {
        path_.verbs_.pop_back();
        path_.points_.pop_back();
    }
    bool drawable = false;
    for (Verb v : path_.verbs_) {
        if (v != Verb::MoveTo && v != Verb::Close) {
            drawable = true;
            break;
        }
    }
    Path out = std::move(path_);
    path_ = Path();
    has_current_ = false;
    needs_move_ = false;
    if (!drawable) return std::nullopt;
    return out;
}

} // namespace tinta::geom
