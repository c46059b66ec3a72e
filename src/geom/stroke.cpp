#include <tinta/geom/stroke.h>

#include <tinta/core/config.h>

#include <algorithm>
#include <cmath>

namespace tinta::geom {

namespace {

constexpr float kPi = 3.14159265358979f;

Point normalized(Point v) {
    float len = std::sqrt(v.x * v.x + v.y * v.y);
    if (len <= 0) return {0, 0};
    return {v.x / len, v.y / len};
}

float cross(Point a, Point b) { return a.x * b.y - a.y * b.x; }
float dot(Point a, Point b) { return a.x * b.x + a.y * b.y; }

double distance(Point a, Point b) {
    double dx = static_cast<double>(b.x) - a.x;
    double dy = static_cast<double>(b.y) - a.y;
    return std::sqrt(dx * dx + dy * dy);
}

// Left-hand normal of direction `d`.
Point normal(Point d) { return {-d.y, d.x}; }

class Outliner {
public:
    Outliner(const StrokeStyle& style, float tolerance)
        : style_(style), hw_(style.width / 2), tolerance_(tolerance) {}

    void stroke(const Polyline& line) {
        std::vector<Point> pts;
        pts.reserve(line.points.size());
        for (const auto& p : line.points) {
            if (pts.empty() || pts.back() != p) pts.push_back(p);
        }
        if (line.closed && pts.size() > 1 && pts.back() == pts.front()) pts.pop_back();
        if (pts.empty()) return;
        if (pts.size() == 1) {
            degenerate_cap(pts[0]);
            return;
        }
        size_t n = pts.size();
        size_t seg_count = line.closed ? n : n - 1;
        for (size_t i = 0; i < seg_count; i++) {
            quad_segment(pts[i], pts[(i + 1) % n]);
        }
        if (line.closed) {
            for (size_t i = 0; i < n; i++) {
                Point prev = pts[(i + n - 1) % n];
                join(prev, pts[i], pts[(i + 1) % n]);
            }
        } else {
            for (size_t i = 1; i + 1 < n; i++) join(pts[i - 1], pts[i], pts[i + 1]);
            cap(pts[0], normalized(pts[0] - pts[1]));
            cap(pts[n - 1], normalized(pts[n - 1] - pts[n - 2]));
        }
    }

    PathBuilder& builder() { return builder_; }

private:
    // Emits a polygon with positive orientation so all pieces union
    // under the nonzero rule.
    void polygon(std::vector<Point> pts) {
        if (pts.size() < 3) return;
        float area = 0;
        for (size_t i = 0; i < pts.size(); i++) {
            area += cross(pts[i], pts[(i + 1) % pts.size()]);
        }
        if (area == 0) return;
        if (area < 0) std::reverse(pts.begin(), pts.end());
        builder_.move_to(pts[0].x, pts[0].y);
        for (size_t i = 1; i < pts.size(); i++) builder_.line_to(pts[i].x, pts[i].y);
        builder_.close();
    }

    void quad_segment(Point a, Point b) {
        Point d = normalized(b - a);
        Point nn = hw_ * normal(d);
        polygon({a + nn, b + nn, b - nn, a - nn});
    }

    int circle_steps() const {
        if (hw_ <= tolerance_) return 8;
        float step = 2 * std::acos(std::clamp(1 - tolerance_ / hw_, -1.0f, 1.0f));
        int n = static_cast<int>(std::ceil(2 * kPi / std::max(step, 1e-3f)));
        return std::clamp(n, 8, 512);
    }

    void circle(Point c) {
        int n = circle_steps();
        std::vector<Point> pts;
        pts.reserve(static_cast<size_t>(n));
        for (int i = 0; i < n; i++) {
            float t = 2 * kPi * static_cast<float>(i) / static_cast<float>(n);
            pts.push_back({c.x + hw_ * std::cos(t), c.y + hw_ * std::sin(t)});
        }
        polygon(std::move(pts));
    }

    void join(Point prev, Point v, Point next) {
        Point d0 = normalized(v - prev);
        Point d1 = normalized(next - v);
        float turn = cross(d0, d1);
        float along = dot(d0, d1);
        if (std::fabs(turn) < 1e-6f && along > 0) return;

        if (style_.join == LineJoin::Round) {
            circle(v);
            return;
        }

        // Outer side is opposite the turn direction.
        float side = turn > 0 ? -1.0f : 1.0f;
        Point n0 = side * normal(d0);
        Point n1 = side * normal(d1);
        Point a = v + hw_ * n0;
        Point b = v + hw_ * n1;

        if (style_.join == LineJoin::Bevel || std::fabs(turn) < 1e-6f) {
            polygon({v, a, b});
            return;
        }

        Point bis = normalized(n0 + n1);
        float cos_half = dot(n0, bis);
        if (cos_half <= 1e-6f) {
            polygon({v, a, b});
            return;
        }
        float ratio = 1.0f / cos_half;
        if (ratio <= style_.miter_limit) {
            Point tip = v + (hw_ / cos_half) * bis;
            polygon({v, a, tip, b});
            return;
        }
        if (style_.join == LineJoin::MiterClip) {
            float clip = style_.miter_limit * hw_;
            float base = hw_ * cos_half;
            float tip_dist = hw_ / cos_half;
            if (clip > base) {
                float t = (clip - base) / (tip_dist - base);
                Point tip = v + tip_dist * bis;
                Point ca = a + t * (tip - a);
                Point cb = b + t * (tip - b);
                polygon({v, a, ca, cb, b});
                return;
            }
        }
        polygon({v, a, b});
    }

    // `dir` points outward from the line end.
    void cap(Point p, Point dir) {
        switch (style_.cap) {
            case LineCap::Butt:
                break;
            case LineCap::Round:
                circle(p);
                break;
            case LineCap::Square: {
                Point nn = hw_ * normal(dir);
                Point ext = hw_ * dir;
                polygon({p + nn, p + nn + ext, p - nn + ext, p - nn});
                break;
            }
        }
    }

    void degenerate_cap(Point p) {
        switch (style_.cap) {
            case LineCap::Butt:
                break;
            case LineCap::Round:
                circle(p);
                break;
            case LineCap::Square:
                polygon({{p.x - hw_, p.y - hw_}, {p.x + hw_, p.y - hw_},
                         {p.x + hw_, p.y + hw_}, {p.x - hw_, p.y + hw_}});
                break;
        }
    }

    const StrokeStyle& style_;
    float hw_;
    float tolerance_;
    PathBuilder builder_;
};

} // namespace

std::vector<Polyline> apply_dash(const std::vector<Polyline>& lines,
                                 const std::vector<float>& dasharray, float dashoffset) {
    double total = 0;
    for (float v : dasharray) total += v;
    if (dasharray.empty() || !(total > 0) || !std::isfinite(total)) return lines;

    // Too many dashes to be worth emitting: stroke the lines solid instead.
    double length = 0;
    for (const auto& line : lines) {
        const auto& pts = line.points;
        for (size_t i = 1; i < pts.size(); i++) length += distance(pts[i - 1], pts[i]);
        if (line.closed && pts.size() > 1) length += distance(pts.back(), pts.front());
    }
    double periods = std::ceil(length / total) + 1;
    if (!std::isfinite(periods) ||
        periods * static_cast<double>(dasharray.size()) > core::config::kMaxDashCount) {
        return lines;
    }

    std::vector<Polyline> out;
    for (const auto& line : lines) {
        std::vector<Point> pts = line.points;
        if (pts.size() < 2) continue;
        if (line.closed) pts.push_back(pts.front());

        // Locate the starting dash index for the offset.
        double offset = std::fmod(static_cast<double>(dashoffset), total);
        if (offset < 0) offset += total;
        size_t idx = 0;
        for (size_t n = 0; n < dasharray.size() && offset >= dasharray[idx]; n++) {
            offset -= dasharray[idx];
            idx = (idx + 1) % dasharray.size();
        }
        bool on = (idx % 2) == 0;

        // Dash boundaries are absolute distances from the start of the line.
        double next = dasharray[idx] - offset;
        double seg_start = 0;

        Polyline current;
        if (on) current.points.push_back(pts[0]);
        for (size_t i = 1; i < pts.size(); i++) {
            Point a = pts[i - 1];
            Point b = pts[i];
            double len = distance(a, b);
            double seg_end = seg_start + len;
            while (seg_end > next) {
                double t = (next - seg_start) / len;
                current.points.push_back({static_cast<float>(a.x + t * (static_cast<double>(b.x) - a.x)),
                                          static_cast<float>(a.y + t * (static_cast<double>(b.y) - a.y))});
                if (on) {
                    out.push_back(std::move(current));
                    current = Polyline();
                }
                on = !on;
                idx = (idx + 1) % dasharray.size();
                next += dasharray[idx];
            }
            if (on) current.points.push_back(b);
            seg_start = seg_end;
        }
        if (on && current.points.size() > 1) out.push_back(std::move(current));
    }
    return out;
}

std::optional<Path> stroke_to_path(const Path& path, const StrokeStyle& style,
                                   const Transform& ts, float tolerance) {
    if (!(style.width > 0) || !std::isfinite(style.width)) return std::nullopt;
    float scale = ts.mean_scale();
    if (!(scale > 0) || !std::isfinite(scale)) return std::nullopt;
    float user_tol = tolerance / scale;

    std::vector<Polyline> lines = flatten(path, Transform::identity(), user_tol);
    if (!style.dasharray.empty()) lines = apply_dash(lines, style.dasharray, style.dashoffset);

    Outliner outliner(style, user_tol);
    for (const auto& line : lines) outliner.stroke(line);
    auto outline = outliner.builder().finish();
    if (!outline) return std::nullopt;
    return outline->transformed(ts);
}

std::optional<Rect> stroke_bounds(const Path& path, const StrokeStyle& style) {
    auto b = path.bounds();
    if (!b) return std::nullopt;
    float extent = style.width / 2;
    float factor = 1.0f;
    if (style.join == LineJoin::Miter || style.join == LineJoin::MiterClip) {
        factor = std::max(factor, style.miter_limit);
    }
    if (style.cap == LineCap::Square) factor = std::max(factor, 1.41421356f);
    extent *= factor;
    return b->outset(extent, extent);
}

} // namespace tinta::geom
