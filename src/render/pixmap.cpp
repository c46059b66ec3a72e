#include <tinta/render/pixmap.h>

#include <tinta/core/config.h>

#include <algorithm>

namespace tinta::render {

std::optional<Pixmap> Pixmap::create(uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) return std::nullopt;
    if (width > core::config::kMaxPixmapDimension || height > core::config::kMaxPixmapDimension) {
        return std::nullopt;
    }
    uint64_t bytes = static_cast<uint64_t>(width) * height * 4;
    if (bytes > core::config::kMaxPixmapBytes) return std::nullopt;

    Pixmap pixmap;
    pixmap.width_ = width;
    pixmap.height_ = height;
    pixmap.data_.assign(static_cast<size_t>(bytes), 0);
    return pixmap;
}

paint::Color Pixmap::pixel(uint32_t x, uint32_t y) const {
    const uint8_t* p = pixel_ptr(x, y);
    return {p[0], p[1], p[2], p[3]};
}

paint::Color Pixmap::demultiplied_pixel(uint32_t x, uint32_t y) const {
    const uint8_t* p = pixel_ptr(x, y);
    uint8_t a = p[3];
    if (a == 0) return paint::Color::transparent();
    if (a == 255) return {p[0], p[1], p[2], 255};
    auto channel = [a](uint8_t c) {
        return static_cast<uint8_t>(std::min(255, (c * 255 + a / 2) / a));
    };
    return {channel(p[0]), channel(p[1]), channel(p[2]), a};
}

void Pixmap::fill(const paint::Color& color) {
    uint8_t px[4];
    store_pixel(px, paint::ColorF::from(color).premultiplied());
    for (size_t i = 0; i < data_.size(); i += 4) {
        data_[i] = px[0];
        data_[i + 1] = px[1];
        data_[i + 2] = px[2];
        data_[i + 3] = px[3];
    }
}

void Pixmap::clear() {
    std::fill(data_.begin(), data_.end(), 0);
}

std::vector<uint8_t> Pixmap::demultiplied() const {
    std::vector<uint8_t> out(data_.size());
    for (uint32_t y = 0; y < height_; ++y) {
        for (uint32_t x = 0; x < width_; ++x) {
            paint::Color c = demultiplied_pixel(x, y);
            uint8_t* o = out.data() + (static_cast<size_t>(y) * width_ + x) * 4;
            o[0] = c.r;
            o[1] = c.g;
            o[2] = c.b;
            o[3] = c.a;
        }
    }
    return out;
}

} // namespace tinta::render
