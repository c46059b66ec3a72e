#pragma once
#include <tinta/geom/rect.h>
#include <tinta/geom/transform.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace tinta::geom {

enum class Verb : uint8_t { MoveTo, LineTo, QuadTo, CubicTo, Close };

// One decoded path element. `from` is the current point before the verb;
// `pts` holds 1 (line/move), 2 (quad) or 3 (cubic) points.
struct Segment {
    Verb verb = Verb::MoveTo;
    Point from;
    Point pts[3];
};

// An immutable sequence of subpaths in user space. Winding is not part of
// the path: it is chosen by whoever fills it.
class Path {
public:
    Path() = default;

    const std::vector<Verb>& verbs() const { return verbs_; }
    const std::vector<Point>& points() const { return points_; }
    bool is_empty() const { return verbs_.empty(); }

    std::vector<Segment> segments() const;

    // Tight bounds, including curve extrema.
    std::optional<Rect> bounds() const;
    // Bounds of all points, including control points.
    std::optional<Rect> control_bounds() const;

    Path transformed(const Transform& ts) const;

    // Total length of all subpaths (closing edges included).
    float length() const;

    // Point and tangent angle (radians) at `distance` along the path.
    // Returns false past the end or on an empty path.
    bool point_at(float distance, Point& point, float& angle) const;

    bool operator==(const Path& o) const { return verbs_ == o.verbs_ && points_ == o.points_; }
    bool operator!=(const Path& o) const { return !(*this == o); }

private:
    friend class PathBuilder;
    std::vector<Verb> verbs_;
    std::vector<Point> points_;
};

class PathBuilder {
public:
    void move_to(float x, float y);
    void line_to(float x, float y);
    void quad_to(float x1, float y1, float x, float y);
    void cubic_to(float x1, float y1, float x2, float y2, float x, float y);
    // SVG elliptical arc from the current point, converted to cubics.
    void arc_to(float rx, float ry, float x_axis_rotation, bool large_arc, bool sweep,
                float x, float y);
    void close();

    void push_rect(const Rect& r);
    void push_rounded_rect(const Rect& r, float rx, float ry);
    void push_ellipse(float cx, float cy, float rx, float ry);
    void push_path(const Path& path);
    void push_path(const Path& path, const Transform& ts);

    bool has_current_point() const { return has_current_; }
    Point current_point() const { return current_; }
    Point subpath_start() const { return start_; }
    bool empty() const { return path_.verbs_.empty(); }

    // Returns nullopt when the builder holds no drawable segment.
    std::optional<Path> finish();

private:
    void inject_move_to_if_needed();

    Path path_;
    Point current_;
    Point start_;
    bool has_current_ = false;
    bool needs_move_ = false;
    size_t last_move_verb_ = 0;
};

} // namespace tinta::geom
