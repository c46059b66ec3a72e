#pragma once
#include <tinta/geom/rect.h>
#include <tinta/geom/transform.h>
#include <tinta/paint/color.h>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tinta::paint {

enum class Units : uint8_t { UserSpaceOnUse, ObjectBoundingBox };
enum class SpreadMode : uint8_t { Pad, Reflect, Repeat };
enum class AlphaInterpolation : uint8_t { Unpremultiplied, Premultiplied };
enum class ColorSpace : uint8_t { SRGB, LinearRGB };

struct Stop {
    float offset = 0;
    Color color;  // alpha already multiplied by stop-opacity
};

struct Gradient {
    std::string id;
    // Gradient space to user space, bounding-box mapping folded in.
    geom::Transform transform;
    SpreadMode spread = SpreadMode::Pad;
    AlphaInterpolation alpha_interpolation = AlphaInterpolation::Unpremultiplied;
    ColorSpace color_space = ColorSpace::SRGB;
    std::vector<Stop> stops;
};

struct LinearGradient : Gradient {
    float x1 = 0, y1 = 0, x2 = 1, y2 = 0;

    // Gradient parameter at a point in gradient space, before spreading.
    float t_at(geom::Point p) const;
};

struct RadialGradient : Gradient {
    float cx = 0.5f, cy = 0.5f, r = 0.5f;
    float fx = 0.5f, fy = 0.5f, fr = 0;

    // Largest t whose circle contains `p` (gradient space). Returns nullopt
    // where the cone does not cover the point.
    std::optional<float> t_at(geom::Point p) const;
};

// Index into tree::Tree::patterns.
struct PatternRef {
    size_t index = 0;

    bool operator==(const PatternRef& o) const { return index == o.index; }
};

using Paint = std::variant<Color, LinearGradient, RadialGradient, PatternRef>;

// Clamps offsets to [0, 1], makes them non-decreasing and reduces runs of
// equal offsets to their first and last stop.
void normalize_stops(std::vector<Stop>& stops);

// Maps a raw gradient parameter into [0, 1].
float apply_spread(float t, SpreadMode mode);

// Premultiplied color of `gradient` at spread position `t` in [0, 1].
ColorF sample_stops(const Gradient& gradient, float t);

// Maps the unit square onto `bbox`. Fails for zero-sized boxes.
std::optional<geom::Transform> bbox_transform(const geom::Rect& bbox);

// Folds the bounding-box mapping into a gradient or pattern transform.
std::optional<geom::Transform> resolve_units(const geom::Transform& ts, Units units,
                                             const geom::Rect& bbox);

} // namespace tinta::paint
