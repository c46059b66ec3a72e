#pragma once
#include <cstdint>

namespace tinta::paint {

// Straight (non-premultiplied) 8-bit sRGB color.
struct Color {
    uint8_t r = 0, g = 0, b = 0, a = 255;

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }

    static Color black() { return {0, 0, 0, 255}; }
    static Color white() { return {255, 255, 255, 255}; }
    static Color transparent() { return {0, 0, 0, 0}; }
};

// Float color in [0, 1], straight or premultiplied depending on context.
struct ColorF {
    float r = 0, g = 0, b = 0, a = 0;

    static ColorF from(Color c) {
        return {c.r / 255.0f, c.g / 255.0f, c.b / 255.0f, c.a / 255.0f};
    }
    // Straight color with an extra opacity factor.
    static ColorF from(Color c, float opacity) {
        ColorF f = from(c);
        f.a *= opacity;
        return f;
    }

    ColorF premultiplied() const { return {r * a, g * a, b * a, a}; }
    ColorF demultiplied() const {
        if (a <= 0) return {0, 0, 0, 0};
        return {r / a, g / a, b / a, a};
    }
};

// sRGB transfer function and its inverse on [0, 1].
float srgb_to_linear(float v);
float linear_to_srgb(float v);

// 8-bit lookup tables used by the rasterizer and filters.
const uint8_t* srgb_to_linear_table();
const uint8_t* linear_to_srgb_table();

inline uint8_t to_u8(float v) {
    if (!(v > 0)) return 0;
    if (v >= 1) return 255;
    return static_cast<uint8_t>(v * 255.0f + 0.5f);
}

} // namespace tinta::paint
