#pragma once
#include <tinta/geom/rect.h>
#include <tinta/paint/color.h>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <vector>

namespace tinta::render {

// Premultiplied RGBA8 pixels, row-major, without row padding.
class Pixmap {
public:
    Pixmap() = default;

    // Returns nullopt for a zero size or one beyond the configured limits.
    static std::optional<Pixmap> create(uint32_t width, uint32_t height);

    uint32_t width() const { return width_; }
    uint32_t height() const { return height_; }
    bool is_empty() const { return width_ == 0 || height_ == 0; }
    geom::IntRect rect() const {
        return {0, 0, static_cast<int32_t>(width_), static_cast<int32_t>(height_)};
    }

    std::vector<uint8_t>& data() { return data_; }
    const std::vector<uint8_t>& data() const { return data_; }

    uint8_t* pixel_ptr(uint32_t x, uint32_t y) {
        return data_.data() + (static_cast<size_t>(y) * width_ + x) * 4;
    }
    const uint8_t* pixel_ptr(uint32_t x, uint32_t y) const {
        return data_.data() + (static_cast<size_t>(y) * width_ + x) * 4;
    }

    // Premultiplied color at (x, y).
    paint::Color pixel(uint32_t x, uint32_t y) const;
    // Straight color at (x, y).
    paint::Color demultiplied_pixel(uint32_t x, uint32_t y) const;

    // Fills every pixel with a straight color.
    void fill(const paint::Color& color);
    void clear();

    // Straight-alpha RGBA8 copy, the layout image files use.
    std::vector<uint8_t> demultiplied() const;

private:
    uint32_t width_ = 0;
    uint32_t height_ = 0;
    std::vector<uint8_t> data_;
};

inline paint::ColorF load_pixel(const uint8_t* p) {
    return {p[0] / 255.0f, p[1] / 255.0f, p[2] / 255.0f, p[3] / 255.0f};
}

inline void store_pixel(uint8_t* p, const paint::ColorF& c) {
    p[3] = paint::to_u8(c.a);
    // Premultiplied channels never exceed alpha.
    p[0] = std::min(paint::to_u8(c.r), p[3]);
    p[1] = std::min(paint::to_u8(c.g), p[3]);
    p[2] = std::min(paint::to_u8(c.b), p[3]);
}

} // namespace tinta::render
