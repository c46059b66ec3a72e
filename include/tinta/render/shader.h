#pragma once
#include <tinta/geom/transform.h>
#include <tinta/paint/paint.h>
#include <tinta/render/pixmap.h>
#include <tinta/tree/tree.h>

#include <memory>
#include <optional>

namespace tinta::render {

// Source colors of a paint, evaluated at device pixel centers. Results are
// premultiplied and include the paint opacity.
class Shader {
public:
    static Shader solid(const paint::Color& color, float opacity);
    // `ts` maps user space to device pixels.
    static std::optional<Shader> linear(const paint::LinearGradient& gradient, float opacity,
                                        const geom::Transform& ts);
    static std::optional<Shader> radial(const paint::RadialGradient& gradient, float opacity,
                                        const geom::Transform& ts);
    // Repeats `tile`; `device_to_tile` maps device pixels to tile pixels.
    static Shader pattern(std::shared_ptr<const Pixmap> tile, float opacity,
                          const geom::Transform& device_to_tile);
    // Samples `image` once, transparent outside it.
    static Shader image(std::shared_ptr<const tree::ImageData> image,
                        const geom::Transform& device_to_image, bool smooth);

    bool is_solid() const { return kind_ == Kind::Solid; }

    paint::ColorF shade(int32_t x, int32_t y) const;

private:
    enum class Kind { Solid, Linear, Radial, Texture };

    paint::ColorF sample_texture(float u, float v) const;
    paint::ColorF texel(int64_t x, int64_t y) const;

    Kind kind_ = Kind::Solid;
    float opacity_ = 1;
    paint::ColorF color_;
    std::shared_ptr<const paint::LinearGradient> linear_;
    std::shared_ptr<const paint::RadialGradient> radial_;
    // Device pixels to gradient or texture space.
    geom::Transform inverse_;

    std::shared_ptr<const Pixmap> tile_;
    std::shared_ptr<const tree::ImageData> image_;
    const uint8_t* pixels_ = nullptr;
    int64_t texture_width_ = 0;
    int64_t texture_height_ = 0;
    bool repeat_ = false;
    bool smooth_ = true;
};

} // namespace tinta::render
