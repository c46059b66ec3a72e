#pragma once
#include <tinta/dom/value_parser.h>
#include <tinta/normalize/style.h>

#include <string_view>

namespace tinta::normalize {

enum class Axis { X, Y, Other };

// Converts a length to user units. Percentages resolve against the
// frame's viewport (the diagonal over sqrt(2) for Axis::Other).
float to_user(const dom::Length& length, Axis axis, const Frame& frame, float dpi);

// Length in objectBoundingBox units: percentages become fractions.
float to_bbox_fraction(const dom::Length& length, const Frame& frame, float dpi);

// Parses `value` as a length and converts it, or returns `fallback`.
float parse_user_length(const std::string* value, Axis axis, const Frame& frame, float dpi,
                        float fallback);

// `opacity`-like values: a number or a percentage, clamped to [0, 1].
float parse_opacity(const std::string* value, float fallback = 1.0f);

} // namespace tinta::normalize
