#pragma once
#include <tinta/geom/flatten.h>
#include <tinta/geom/path.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace tinta::geom {

enum class LineCap : uint8_t { Butt, Round, Square };
enum class LineJoin : uint8_t { Miter, MiterClip, Round, Bevel };

// Geometric stroke parameters, in user units.
struct StrokeStyle {
    float width = 1.0f;
    LineCap cap = LineCap::Butt;
    LineJoin join = LineJoin::Miter;
    float miter_limit = 4.0f;
    // Already validated: empty means solid, otherwise an even number of
    // non-negative values with a positive sum.
    std::vector<float> dasharray;
    float dashoffset = 0.0f;
};

// Splits polylines into dashes. Closed input yields open dashes.
std::vector<Polyline> apply_dash(const std::vector<Polyline>& lines,
                                 const std::vector<float>& dasharray, float dashoffset);

// Expands the stroke of `path` into closed polygons in the space of `ts`,
// to be filled with the nonzero rule. The outline is computed in user
// space so non-uniform transforms distort the pen like SVG requires.
std::optional<Path> stroke_to_path(const Path& path, const StrokeStyle& style,
                                   const Transform& ts, float tolerance);

// Loose stroke bounds: fill bounds outset by the widest possible pen
// extent (half width, scaled by miter limit or square cap diagonal).
std::optional<Rect> stroke_bounds(const Path& path, const StrokeStyle& style);

} // namespace tinta::geom
