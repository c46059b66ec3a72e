#include <tinta/render/shader.h>

#include <algorithm>
#include <cmath>

namespace tinta::render {

Shader Shader::solid(const paint::Color& color, float opacity) {
    Shader s;
    s.kind_ = Kind::Solid;
    s.opacity_ = opacity;
    s.color_ = paint::ColorF::from(color, opacity).premultiplied();
    return s;
}

std::optional<Shader> Shader::linear(const paint::LinearGradient& gradient, float opacity,
                                     const geom::Transform& ts) {
    auto inverse = (ts * gradient.transform).invert();
    if (!inverse) return std::nullopt;
    Shader s;
    s.kind_ = Kind::Linear;
    s.opacity_ = opacity;
    s.linear_ = std::make_shared<paint::LinearGradient>(gradient);
    s.inverse_ = *inverse;
    return s;
}

std::optional<Shader> Shader::radial(const paint::RadialGradient& gradient, float opacity,
                                     const geom::Transform& ts) {
    auto inverse = (ts * gradient.transform).invert();
    if (!inverse) return std::nullopt;
    Shader s;
    s.kind_ = Kind::Radial;
    s.opacity_ = opacity;
    s.radial_ = std::make_shared<paint::RadialGradient>(gradient);
    s.inverse_ = *inverse;
    return s;
}

Shader Shader::pattern(std::shared_ptr<const Pixmap> tile, float opacity,
                       const geom::Transform& device_to_tile) {
    Shader s;
    s.kind_ = Kind::Texture;
    s.opacity_ = opacity;
    s.inverse_ = device_to_tile;
    s.pixels_ = tile->data().data();
    s.texture_width_ = tile->width();
    s.texture_height_ = tile->height();
    s.tile_ = std::move(tile);
    s.repeat_ = true;
    return s;
}

Shader Shader::image(std::shared_ptr<const tree::ImageData> image,
                     const geom::Transform& device_to_image, bool smooth) {
    Shader s;
    s.kind_ = Kind::Texture;
    s.inverse_ = device_to_image;
    s.pixels_ = image->pixels.data();
    s.texture_width_ = image->width;
    s.texture_height_ = image->height;
    s.image_ = std::move(image);
    s.smooth_ = smooth;
    return s;
}

paint::ColorF Shader::shade(int32_t x, int32_t y) const {
    if (kind_ == Kind::Solid) return color_;

    geom::Point p = inverse_.apply({static_cast<float>(x) + 0.5f, static_cast<float>(y) + 0.5f});
    paint::ColorF c;
    switch (kind_) {
        case Kind::Linear: {
            float t = paint::apply_spread(linear_->t_at(p), linear_->spread);
            c = paint::sample_stops(*linear_, t);
            break;
        }
        case Kind::Radial: {
            auto t = radial_->t_at(p);
            if (!t) return {};
            c = paint::sample_stops(*radial_, paint::apply_spread(*t, radial_->spread));
            break;
        }
        case Kind::Texture:
            c = sample_texture(p.x, p.y);
            break;
        case Kind::Solid:
            break;
    }
    return {c.r * opacity_, c.g * opacity_, c.b * opacity_, c.a * opacity_};
}

paint::ColorF Shader::texel(int64_t x, int64_t y) const {
    if (repeat_) {
        x %= texture_width_;
        if (x < 0) x += texture_width_;
        y %= texture_height_;
        if (y < 0) y += texture_height_;
    } else if (x < 0 || y < 0 || x >= texture_width_ || y >= texture_height_) {
        return {};
    }
    return load_pixel(pixels_ + (static_cast<size_t>(y) * static_cast<size_t>(texture_width_) +
                                 static_cast<size_t>(x)) * 4);
}

paint::ColorF Shader::sample_texture(float u, float v) const {
    if (!repeat_ && (u < 0 || v < 0 || u >= static_cast<float>(texture_width_) ||
                     v >= static_cast<float>(texture_height_))) {
        return {};
    }
    if (!smooth_) {
        return texel(static_cast<int64_t>(std::floor(u)), static_cast<int64_t>(std::floor(v)));
    }

    float fx = u - 0.5f;
    float fy = v - 0.5f;
    int64_t x0 = static_cast<int64_t>(std::floor(fx));
    int64_t y0 = static_cast<int64_t>(std::floor(fy));
    float tx = fx - static_cast<float>(x0);
    float ty = fy - static_cast<float>(y0);

    // Images clamp to their edge pixels instead of fading out.
    auto fetch = [&](int64_t x, int64_t y) {
        if (!repeat_) {
            x = std::clamp<int64_t>(x, 0, texture_width_ - 1);
            y = std::clamp<int64_t>(y, 0, texture_height_ - 1);
        }
        return texel(x, y);
    };

    paint::ColorF c00 = fetch(x0, y0);
    paint::ColorF c10 = fetch(x0 + 1, y0);
    paint::ColorF c01 = fetch(x0, y0 + 1);
    paint::ColorF c11 = fetch(x0 + 1, y0 + 1);
    auto mix = [](const paint::ColorF& a, const paint::ColorF& b, float t) {
        return paint::ColorF{a.r + (b.r - a.r) * t, a.g + (b.g - a.g) * t, a.b + (b.b - a.b) * t,
                             a.a + (b.a - a.a) * t};
    };
    return mix(mix(c00, c10, tx), mix(c01, c11, tx), ty);
}

} // namespace tinta::render
