#pragma once
#include <tinta/geom/transform.h>

#include <cstdint>
#include <optional>

namespace tinta::geom {

struct Rect {
    float x = 0, y = 0, width = 0, height = 0;

    static Rect from_ltrb(float l, float t, float r, float b) { return {l, t, r - l, b - t}; }

    float left() const { return x; }
    float top() const { return y; }
    float right() const { return x + width; }
    float bottom() const { return y + height; }

    bool is_empty() const { return !(width > 0) || !(height > 0); }
    bool is_valid() const;

    bool contains(float px, float py) const {
        return px >= x && px < x + width && py >= y && py < y + height;
    }

    Rect united(const Rect& o) const;
    std::optional<Rect> intersected(const Rect& o) const;
    Rect outset(float dx, float dy) const { return {x - dx, y - dy, width + 2 * dx, height + 2 * dy}; }

    // Bounding rect of the four transformed corners.
    Rect transformed(const Transform& ts) const;

    bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    bool operator!=(const Rect& o) const { return !(*this == o); }
};

bool approx_equal(const Rect& l, const Rect& r, float eps = 1e-3f);

// Unions a rect into an optional accumulator.
void extend(std::optional<Rect>& acc, const Rect& r);

struct IntRect {
    int32_t x = 0, y = 0;
    int32_t width = 0, height = 0;

    int32_t right() const { return x + width; }
    int32_t bottom() const { return y + height; }
    bool is_empty() const { return width <= 0 || height <= 0; }

    std::optional<IntRect> intersected(const IntRect& o) const;
    Rect to_rect() const {
        return {static_cast<float>(x), static_cast<float>(y),
                static_cast<float>(width), static_cast<float>(height)};
    }

    bool operator==(const IntRect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
};

// Smallest pixel rect containing `r`. Returns nullopt for empty or
// non-finite input.
std::optional<IntRect> round_out(const Rect& r);

struct Size {
    float width = 0;
    float height = 0;

    bool operator==(const Size& o) const { return width == o.width && height == o.height; }
};

} // namespace tinta::geom
