#pragma once
#include <tinta/geom/path.h>
#include <tinta/geom/rect.h>
#include <tinta/geom/transform.h>
#include <tinta/paint/color.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tinta::dom {

// Parsers for raw attribute and property strings. All of them reject
// trailing garbage and return nullopt on malformed input, except
// parse_path_data which keeps the segments parsed before the first error.

std::string trim(std::string_view s);
std::string to_lower(std::string_view s);

enum class LengthUnit : uint8_t { None, Px, Em, Ex, In, Cm, Mm, Pt, Pc, Percent };

struct Length {
    float value = 0;
    LengthUnit unit = LengthUnit::None;

    static Length user(float v) { return {v, LengthUnit::None}; }
    static Length percent(float v) { return {v, LengthUnit::Percent}; }

    bool operator==(const Length& o) const { return value == o.value && unit == o.unit; }
};

std::optional<float> parse_number(std::string_view s);
// A number or a percentage (returned as a fraction).
std::optional<float> parse_number_or_percent(std::string_view s);
std::optional<std::vector<float>> parse_number_list(std::string_view s);
std::optional<Length> parse_length(std::string_view s);
std::optional<std::vector<Length>> parse_length_list(std::string_view s);

// Colors: #rgb, #rgba, #rrggbb, #rrggbbaa, rgb(), rgba(), hsl(), hsla()
// and the SVG named colors. `currentColor` is not a color here.
std::optional<paint::Color> parse_color(std::string_view s);

struct ParsedPaint {
    enum class Kind : uint8_t { None, Color, CurrentColor, Url, ContextFill, ContextStroke };
    Kind kind = Kind::None;
    paint::Color color;
    std::string url;
    // Fallback after a url reference, e.g. `url(#g) red`.
    std::optional<Kind> fallback_kind;
    paint::Color fallback_color;
};

std::optional<ParsedPaint> parse_paint(std::string_view s);

// `url(#id)` or `url('#id')` to "id". Returns nullopt for non-local IRIs.
std::optional<std::string> parse_func_iri(std::string_view s);
// `#id` to "id".
std::optional<std::string> parse_iri(std::string_view s);

// Transform lists. An empty string is the identity.
std::optional<geom::Transform> parse_transform(std::string_view s);

// Path data. Returns nullopt when no drawable segment was parsed.
std::optional<geom::Path> parse_path_data(std::string_view s);

// `points` attribute of polyline/polygon.
std::vector<geom::Point> parse_points(std::string_view s);

std::optional<geom::Rect> parse_view_box(std::string_view s);

enum class Align : uint8_t {
    None, XMinYMin, XMidYMin, XMaxYMin, XMinYMid, XMidYMid, XMaxYMid, XMinYMax, XMidYMax, XMaxYMax
};

struct AspectRatio {
    Align align = Align::XMidYMid;
    bool slice = false;

    bool operator==(const AspectRatio& o) const { return align == o.align && slice == o.slice; }
};

std::optional<AspectRatio> parse_aspect_ratio(std::string_view s);

// Maps `view_box` into a viewport of `size`.
geom::Transform view_box_transform(const geom::Rect& view_box, const AspectRatio& ar,
                                   const geom::Size& size);

struct Declaration {
    std::string name;
    std::string value;
    bool important = false;
};

// `a: b; c: d !important` style declaration blocks.
std::vector<Declaration> parse_declarations(std::string_view s);

// Splits a font-family list, dropping quotes.
std::vector<std::string> parse_font_families(std::string_view s);

} // namespace tinta::dom
