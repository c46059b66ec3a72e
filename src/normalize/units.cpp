#include <tinta/normalize/units.h>

#include <algorithm>
#include <cmath>

namespace tinta::normalize {

float to_user(const dom::Length& length, Axis axis, const Frame& frame, float dpi) {
    float v = length.value;
    switch (length.unit) {
        case dom::LengthUnit::None:
        case dom::LengthUnit::Px: return v;
        case dom::LengthUnit::Em: return v * frame.font_size();
        case dom::LengthUnit::Ex: return v * frame.font_size() / 2;
        case dom::LengthUnit::In: return v * dpi;
        case dom::LengthUnit::Cm: return v * dpi / 2.54f;
        case dom::LengthUnit::Mm: return v * dpi / 25.4f;
        case dom::LengthUnit::Pt: return v * dpi / 72;
        case dom::LengthUnit::Pc: return v * dpi / 6;
        case dom::LengthUnit::Percent: {
            const Viewport& vp = frame.viewport();
            switch (axis) {
                case Axis::X: return vp.width * v / 100;
                case Axis::Y: return vp.height * v / 100;
                case Axis::Other: {
                    float diag = std::sqrt((vp.width * vp.width + vp.height * vp.height) / 2);
                    return diag * v / 100;
                }
            }
        }
    }
    return v;
}

float to_bbox_fraction(const dom::Length& length, const Frame& frame, float dpi) {
    if (length.unit == dom::LengthUnit::Percent) return length.value / 100;
    return to_user(length, Axis::Other, frame, dpi);
}

float parse_user_length(const std::string* value, Axis axis, const Frame& frame, float dpi,
                        float fallback) {
    if (!value) return fallback;
    auto len = dom::parse_length(*value);
    if (!len) return fallback;
    return to_user(*len, axis, frame, dpi);
}

float parse_opacity(const std::string* value, float fallback) {
    if (!value) return fallback;
    auto n = dom::parse_number_or_percent(*value);
    if (!n) return fallback;
    return std::clamp(*n, 0.0f, 1.0f);
}

} // namespace tinta::normalize
