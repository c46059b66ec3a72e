#include <tinta/paint/paint.h>

#include <algorithm>
#include <cmath>

namespace tinta::paint {

float LinearGradient::t_at(geom::Point p) const {
    float dx = x2 - x1;
    float dy = y2 - y1;
    float len2 = dx * dx + dy * dy;
    if (len2 <= 0) return 0;
    return ((p.x - x1) * dx + (p.y - y1) * dy) / len2;
}

std::optional<float> RadialGradient::t_at(geom::Point p) const {
    // Two-point conical: circle(t) = lerp(focal, center), radius lerp(fr, r).
    float cdx = cx - fx;
    float cdy = cy - fy;
    float pdx = p.x - fx;
    float pdy = p.y - fy;
    float dr = r - fr;

    float a = cdx * cdx + cdy * cdy - dr * dr;
    float b = pdx * cdx + pdy * cdy + fr * dr;
    float c = pdx * pdx + pdy * pdy - fr * fr;

    if (std::fabs(a) < 1e-9f) {
        if (std::fabs(b) < 1e-9f) return std::nullopt;
        float t = c / (2 * b);
        if (fr + t * dr < 0) return std::nullopt;
        return t;
    }
    float disc = b * b - a * c;
    if (disc < 0) return std::nullopt;
    float sq = std::sqrt(disc);
    float t1 = (b + sq) / a;
    float t2 = (b - sq) / a;
    float hi = std::max(t1, t2);
    float lo = std::min(t1, t2);
    if (fr + hi * dr >= 0) return hi;
    if (fr + lo * dr >= 0) return lo;
    return std::nullopt;
}

void normalize_stops(std::vector<Stop>& stops) {
    float prev = 0;
    for (auto& stop : stops) {
        float offset = std::isfinite(stop.offset) ? stop.offset : 0.0f;
        offset = std::clamp(offset, 0.0f, 1.0f);
        offset = std::max(offset, prev);
        stop.offset = offset;
        prev = offset;
    }

    std::vector<Stop> reduced;
    reduced.reserve(stops.size());
    size_t i = 0;
    while (i < stops.size()) {
        size_t j = i;
        while (j + 1 < stops.size() && stops[j + 1].offset == stops[i].offset) j++;
        reduced.push_back(stops[i]);
        if (j > i) reduced.push_back(stops[j]);
        i = j + 1;
    }
    stops = std::move(reduced);
}

float apply_spread(float t, SpreadMode mode) {
    if (!std::isfinite(t)) return 0;
    switch (mode) {
        case SpreadMode::Pad:
            return std::clamp(t, 0.0f, 1.0f);
        case SpreadMode::Repeat: {
            float f = t - std::floor(t);
            // t = 1 stays at the end stop.
            if (f == 0 && t > 0) return 1;
            return f;
        }
        case SpreadMode::Reflect: {
            float period = std::fmod(std::fabs(t), 2.0f);
            return period > 1 ? 2 - period : period;
        }
    }
    return 0;
}

namespace {

ColorF stop_color(const Gradient& g, const Stop& stop) {
    ColorF c = ColorF::from(stop.color);
    if (g.color_space == ColorSpace::LinearRGB) {
        c.r = srgb_to_linear(c.r);
        c.g = srgb_to_linear(c.g);
        c.b = srgb_to_linear(c.b);
    }
    return c;
}

ColorF finish(const Gradient& g, ColorF straight) {
    if (g.color_space == ColorSpace::LinearRGB) {
        straight.r = linear_to_srgb(straight.r);
        straight.g = linear_to_srgb(straight.g);
        straight.b = linear_to_srgb(straight.b);
    }
    return straight.premultiplied();
}

ColorF lerp(ColorF a, ColorF b, float t) {
    return {a.r + (b.r - a.r) * t, a.g + (b.g - a.g) * t, a.b + (b.b - a.b) * t,
            a.a + (b.a - a.a) * t};
}

} // namespace

ColorF sample_stops(const Gradient& g, float t) {
    if (g.stops.empty()) return {};
    if (t <= g.stops.front().offset) return finish(g, stop_color(g, g.stops.front()));
    if (t >= g.stops.back().offset) return finish(g, stop_color(g, g.stops.back()));

    size_t i = 1;
    while (i < g.stops.size() && g.stops[i].offset < t) i++;
    const Stop& s0 = g.stops[i - 1];
    const Stop& s1 = g.stops[i];
    float span = s1.offset - s0.offset;
    float local = span > 0 ? (t - s0.offset) / span : 1.0f;

    ColorF c0 = stop_color(g, s0);
    ColorF c1 = stop_color(g, s1);
    if (g.alpha_interpolation == AlphaInterpolation::Premultiplied) {
        ColorF p = lerp(c0.premultiplied(), c1.premultiplied(), local);
        return finish(g, p.demultiplied());
    }
    return finish(g, lerp(c0, c1, local));
}

std::optional<geom::Transform> bbox_transform(const geom::Rect& bbox) {
    if (!(bbox.width > 0) || !(bbox.height > 0)) return std::nullopt;
    return geom::Transform{bbox.width, 0, bbox.x, 0, bbox.height, bbox.y};
}

std::optional<geom::Transform> resolve_units(const geom::Transform& ts, Units units,
                                             const geom::Rect& bbox) {
    if (units == Units::UserSpaceOnUse) return ts;
    auto bbox_ts = bbox_transform(bbox);
    if (!bbox_ts) return std::nullopt;
    return *bbox_ts * ts;
}

} // namespace tinta::paint
