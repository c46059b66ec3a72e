#include <tinta/geom/flatten.h>
#include <tinta/core/config.h>

#include <algorithm>
#include <cmath>

namespace tinta::geom {

namespace {

void push_point(Polyline& poly, Point p) {
    if (!std::isfinite(p.x) || !std::isfinite(p.y)) return;
    if (!poly.points.empty() && poly.points.back() == p) return;
    poly.points.push_back(p);
}

void flatten_quad(Polyline& poly, Point p0, Point p1, Point p2, float tol, int depth) {
    if (depth >= core::config::kMaxFlattenDepth ||
        distance_to_segment(p1, p0, p2) <= tol) {
        push_point(poly, p2);
        return;
    }
    Point m01 = 0.5f * (p0 + p1);
    Point m12 = 0.5f * (p1 + p2);
    Point mid = 0.5f * (m01 + m12);
    flatten_quad(poly, p0, m01, mid, tol, depth + 1);
    flatten_quad(poly, mid, m12, p2, tol, depth + 1);
}

void flatten_cubic(Polyline& poly, Point p0, Point p1, Point p2, Point p3, float tol,
                   int depth) {
    if (depth >= core::config::kMaxFlattenDepth ||
        (distance_to_segment(p1, p0, p3) <= tol && distance_to_segment(p2, p0, p3) <= tol)) {
        push_point(poly, p3);
        return;
    }
    // de Casteljau split at t = 0.5
    Point m01 = 0.5f * (p0 + p1);
    Point m12 = 0.5f * (p1 + p2);
    Point m23 = 0.5f * (p2 + p3);
    Point m012 = 0.5f * (m01 + m12);
    Point m123 = 0.5f * (m12 + m23);
    Point mid = 0.5f * (m012 + m123);
    flatten_cubic(poly, p0, m01, m012, mid, tol, depth + 1);
    flatten_cubic(poly, mid, m123, m23, p3, tol, depth + 1);
}

void finish(std::vector<Polyline>& out, Polyline& poly) {
    if (poly.points.size() > 1) {
        // A closed polyline never repeats its first point at the end.
        if (poly.closed && poly.points.back() == poly.points.front()) poly.points.pop_back();
        out.push_back(std::move(poly));
    } else if (poly.points.size() == 1) {
        // Keep degenerate subpaths so strokes can still draw caps.
        out.push_back(std::move(poly));
    }
    poly = Polyline();
}

} // namespace

float distance_to_segment(Point p, Point a, Point b) {
    float dx = b.x - a.x;
    float dy = b.y - a.y;
    float len2 = dx * dx + dy * dy;
    float t = 0;
    if (len2 > 0) t = std::clamp(((p.x - a.x) * dx + (p.y - a.y) * dy) / len2, 0.0f, 1.0f);
    float ex = a.x + t * dx - p.x;
    float ey = a.y + t * dy - p.y;
    return std::sqrt(ex * ex + ey * ey);
}

std::vector<Polyline> flatten(const Path& path, const Transform& ts, float tolerance) {
    std::vector<Polyline> out;
    if (!(tolerance > 0)) tolerance = core::config::kFlattenTolerance;
    Polyline poly;
    Point current;
    for (const auto& seg : path.segments()) {
        switch (seg.verb) {
            case Verb::MoveTo:
                finish(out, poly);
                current = ts.apply(seg.pts[0]);
                push_point(poly, current);
                break;
            case Verb::LineTo: {
                Point p = ts.apply(seg.pts[0]);
                push_point(poly, p);
                current = p;
                break;
            }
            case Verb::QuadTo: {
                Point p1 = ts.apply(seg.pts[0]);
                Point p2 = ts.apply(seg.pts[1]);
                flatten_quad(poly, current, p1, p2, tolerance, 0);
                current = p2;
                break;
            }
            case Verb::CubicTo: {
                Point p1 = ts.apply(seg.pts[0]);
                Point p2 = ts.apply(seg.pts[1]);
                Point p3 = ts.apply(seg.pts[2]);
                flatten_cubic(poly, current, p1, p2, p3, tolerance, 0);
                current = p3;
                break;
            }
            case Verb::Close:
                poly.closed = true;
                current = ts.apply(seg.pts[0]);
                finish(out, poly);
                break;
        }
    }
    finish(out, poly);
    return out;
}

} // namespace tinta::geom
