#pragma once
#include <tinta/geom/path.h>

#include <vector>

namespace tinta::geom {

// One flattened subpath.
struct Polyline {
    std::vector<Point> points;
    bool closed = false;
};

// Converts `path` into polylines after applying `ts`. Curves are subdivided
// until their control points lie within `tolerance` of the chord, or the
// depth ceiling is reached. Consecutive duplicate points are dropped.
std::vector<Polyline> flatten(const Path& path, const Transform& ts, float tolerance);

// Distance from `p` to the segment [a, b].
float distance_to_segment(Point p, Point a, Point b);

} // namespace tinta::geom
