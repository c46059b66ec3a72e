#include <tinta/render/compositor.h>

#include <algorithm>
#include <cmath>

namespace tinta::render {

namespace {

using paint::BlendMode;

float blend_channel(float cb, float cs, BlendMode mode) {
    switch (mode) {
        case BlendMode::Multiply: return cb * cs;
        case BlendMode::Screen: return cb + cs - cb * cs;
        case BlendMode::Overlay:
            return cb <= 0.5f ? cs * 2 * cb : cs + (2 * cb - 1) - cs * (2 * cb - 1);
        case BlendMode::Darken: return std::min(cb, cs);
        case BlendMode::Lighten: return std::max(cb, cs);
        case BlendMode::ColorDodge:
            if (cb == 0) return 0;
            if (cs >= 1) return 1;
            return std::min(1.0f, cb / (1 - cs));
        case BlendMode::ColorBurn:
            if (cb >= 1) return 1;
            if (cs <= 0) return 0;
            return 1 - std::min(1.0f, (1 - cb) / cs);
        case BlendMode::HardLight:
            return cs <= 0.5f ? cb * 2 * cs : cb + (2 * cs - 1) - cb * (2 * cs - 1);
        case BlendMode::SoftLight: {
            if (cs <= 0.5f) return cb - (1 - 2 * cs) * cb * (1 - cb);
            float d = cb <= 0.25f ? ((16 * cb - 12) * cb + 4) * cb : std::sqrt(cb);
            return cb + (2 * cs - 1) * (d - cb);
        }
        case BlendMode::Difference: return std::fabs(cb - cs);
        case BlendMode::Exclusion: return cb + cs - 2 * cb * cs;
        default: return cs;
    }
}

struct Rgb {
    float c[3];
};

float lum(const Rgb& x) {
    return 0.3f * x.c[0] + 0.59f * x.c[1] + 0.11f * x.c[2];
}

Rgb clip_color(Rgb x) {
    float l = lum(x);
    float n = std::min({x.c[0], x.c[1], x.c[2]});
    float m = std::max({x.c[0], x.c[1], x.c[2]});
    for (float& v : x.c) {
        if (n < 0 && l - n != 0) v = l + (v - l) * l / (l - n);
        if (m > 1 && m - l != 0) v = l + (v - l) * (1 - l) / (m - l);
    }
    return x;
}

Rgb set_lum(Rgb x, float l) {
    float d = l - lum(x);
    for (float& v : x.c) v += d;
    return clip_color(x);
}

float sat(const Rgb& x) {
    return std::max({x.c[0], x.c[1], x.c[2]}) - std::min({x.c[0], x.c[1], x.c[2]});
}

Rgb set_sat(Rgb x, float s) {
    int max_i = 0, min_i = 0;
    for (int i = 1; i < 3; ++i) {
        if (x.c[i] > x.c[max_i]) max_i = i;
        if (x.c[i] < x.c[min_i]) min_i = i;
    }
    if (max_i == min_i) return {{0, 0, 0}};
    int mid_i = 3 - max_i - min_i;
    float range = x.c[max_i] - x.c[min_i];
    Rgb out{{0, 0, 0}};
    out.c[mid_i] = (x.c[mid_i] - x.c[min_i]) * s / range;
    out.c[max_i] = s;
    return out;
}

Rgb blend_non_separable(const Rgb& cb, const Rgb& cs, BlendMode mode) {
    switch (mode) {
        case BlendMode::Hue: return set_lum(set_sat(cs, sat(cb)), lum(cb));
        case BlendMode::Saturation: return set_lum(set_sat(cb, sat(cs)), lum(cb));
        case BlendMode::Color: return set_lum(cs, lum(cb));
        case BlendMode::Luminosity: return set_lum(cb, lum(cs));
        default: return cs;
    }
}

bool is_non_separable(BlendMode mode) {
    return mode == BlendMode::Hue || mode == BlendMode::Saturation || mode == BlendMode::Color ||
           mode == BlendMode::Luminosity;
}

} // namespace

paint::ColorF blend(const paint::ColorF& src, const paint::ColorF& dst, BlendMode mode) {
    float as = src.a;
    float ab = dst.a;
    if (mode == BlendMode::Normal || ab <= 0 || as <= 0) {
        return {src.r + dst.r * (1 - as), src.g + dst.g * (1 - as), src.b + dst.b * (1 - as),
                as + ab * (1 - as)};
    }

    Rgb cs{{src.r / as, src.g / as, src.b / as}};
    Rgb cb{{dst.r / ab, dst.g / ab, dst.b / ab}};
    Rgb mixed;
    if (is_non_separable(mode)) {
        mixed = blend_non_separable(cb, cs, mode);
    } else {
        for (int i = 0; i < 3; ++i) mixed.c[i] = blend_channel(cb.c[i], cs.c[i], mode);
    }

    const float s[3] = {src.r, src.g, src.b};
    const float d[3] = {dst.r, dst.g, dst.b};
    float out[3];
    for (int i = 0; i < 3; ++i) {
        out[i] = s[i] * (1 - ab) + d[i] * (1 - as) + as * ab * std::clamp(mixed.c[i], 0.0f, 1.0f);
    }
    return {out[0], out[1], out[2], as + ab - as * ab};
}

void fill_coverage(Pixmap& dst, const Coverage& coverage, const Shader& shader) {
    auto area = coverage.rect.intersected(dst.rect());
    if (!area) return;

    paint::ColorF solid = shader.is_solid() ? shader.shade(0, 0) : paint::ColorF{};
    for (int32_t y = area->y; y < area->bottom(); ++y) {
        for (int32_t x = area->x; x < area->right(); ++x) {
            uint8_t cov = coverage.at(x, y);
            if (cov == 0) continue;
            paint::ColorF s = shader.is_solid() ? solid : shader.shade(x, y);
            float k = cov / 255.0f;
            s = {s.r * k, s.g * k, s.b * k, s.a * k};
            if (s.a <= 0) continue;
            uint8_t* p = dst.pixel_ptr(static_cast<uint32_t>(x), static_cast<uint32_t>(y));
            paint::ColorF d = load_pixel(p);
            store_pixel(p, {s.r + d.r * (1 - s.a), s.g + d.g * (1 - s.a), s.b + d.b * (1 - s.a),
                            s.a + d.a * (1 - s.a)});
        }
    }
}

void draw_layer(Pixmap& dst, const Pixmap& src, int32_t x, int32_t y, float opacity,
                BlendMode mode) {
    geom::IntRect placed{x, y, static_cast<int32_t>(src.width()), static_cast<int32_t>(src.height())};
    auto area = placed.intersected(dst.rect());
    if (!area || opacity <= 0) return;

    for (int32_t py = area->y; py < area->bottom(); ++py) {
        for (int32_t px = area->x; px < area->right(); ++px) {
            const uint8_t* sp = src.pixel_ptr(static_cast<uint32_t>(px - x),
                                              static_cast<uint32_t>(py - y));
            if (sp[3] == 0) continue;
            paint::ColorF s = load_pixel(sp);
            s = {s.r * opacity, s.g * opacity, s.b * opacity, s.a * opacity};
            uint8_t* dp = dst.pixel_ptr(static_cast<uint32_t>(px), static_cast<uint32_t>(py));
            store_pixel(dp, blend(s, load_pixel(dp), mode));
        }
    }
}

std::vector<uint8_t> mask_values(const Pixmap& mask, tree::MaskType kind) {
    const auto& data = mask.data();
    std::vector<uint8_t> values(data.size() / 4);
    for (size_t i = 0; i < values.size(); ++i) {
        const uint8_t* p = data.data() + i * 4;
        if (kind == tree::MaskType::Alpha) {
            values[i] = p[3];
            continue;
        }
        // Premultiplied channels already carry the alpha factor.
        float l = 0.2125f * p[0] + 0.7154f * p[1] + 0.0721f * p[2];
        values[i] = static_cast<uint8_t>(std::clamp(l + 0.5f, 0.0f, 255.0f));
    }
    return values;
}

void apply_mask_values(Pixmap& dst, const std::vector<uint8_t>& values) {
    auto& data = dst.data();
    size_t n = std::min(values.size(), data.size() / 4);
    for (size_t i = 0; i < n; ++i) {
        uint32_t v = values[i];
        if (v == 255) continue;
        uint8_t* p = data.data() + i * 4;
        for (int c = 0; c < 4; ++c) p[c] = static_cast<uint8_t>((p[c] * v + 127) / 255);
    }
}

} // namespace tinta::render
