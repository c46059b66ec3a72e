#include <tinta/filter/pipeline.h>

#include "blur.h"

#include <tinta/render/compositor.h>

#include <algorithm>
#include <cmath>
#include <functional>
#include <memory>
#include <numbers>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace tinta::filter {

namespace {

constexpr const char* kModule = "filter";

using paint::ColorF;
using paint::ColorSpace;
using render::Pixmap;
using render::load_pixel;
using render::store_pixel;

// Producer indices for the two built-in inputs.
constexpr int kSourceGraphic = -1;
constexpr int kSourceAlpha = -2;

// A filter result: pixels over the whole filter region, transparent
// outside `area`.
struct Image {
    std::shared_ptr<const Pixmap> pixmap;
    geom::IntRect area;
    ColorSpace space = ColorSpace::SRGB;
};

Pixmap blank_like(const Pixmap& p) {
    Pixmap out = p;
    out.clear();
    return out;
}

void clear_outside(Pixmap& p, const geom::IntRect& area) {
    for (uint32_t y = 0; y < p.height(); ++y) {
        for (uint32_t x = 0; x < p.width(); ++x) {
            auto ix = static_cast<int32_t>(x);
            auto iy = static_cast<int32_t>(y);
            if (ix >= area.x && ix < area.right() && iy >= area.y && iy < area.bottom()) continue;
            uint8_t* px = p.pixel_ptr(x, y);
            px[0] = px[1] = px[2] = px[3] = 0;
        }
    }
}

Pixmap convert_space(const Pixmap& src, ColorSpace from, ColorSpace to) {
    Pixmap out = src;
    if (from == to) return out;
    const uint8_t* lut = to == ColorSpace::LinearRGB ? paint::srgb_to_linear_table()
                                                      : paint::linear_to_srgb_table();
    auto& data = out.data();
    for (size_t i = 0; i < data.size(); i += 4) {
        uint32_t a = data[i + 3];
        if (a == 0) continue;
        for (size_t c = 0; c < 3; ++c) {
            uint32_t straight = std::min<uint32_t>(255, (data[i + c] * 255 + a / 2) / a);
            data[i + c] = static_cast<uint8_t>((lut[straight] * a + 127) / 255);
        }
    }
    return out;
}

Image in_space(const Image& image, ColorSpace space) {
    if (image.space == space) return image;
    return {std::make_shared<const Pixmap>(convert_space(*image.pixmap, image.space, space)),
            image.area, space};
}

template <typename F>
void for_each_pixel(const geom::IntRect& area, F&& f) {
    for (int32_t y = area.y; y < area.bottom(); ++y) {
        for (int32_t x = area.x; x < area.right(); ++x) {
            f(static_cast<uint32_t>(x), static_cast<uint32_t>(y));
        }
    }
}

ColorF flood_color(const paint::Color& color, float opacity, ColorSpace space) {
    ColorF c = ColorF::from(color, opacity);
    if (space == ColorSpace::LinearRGB) {
        c.r = paint::srgb_to_linear(c.r);
        c.g = paint::srgb_to_linear(c.g);
        c.b = paint::srgb_to_linear(c.b);
    }
    return c.premultiplied();
}

// ---------------------------------------------------------------------------
// Primitives
// ---------------------------------------------------------------------------

struct Scale {
    float x = 1;
    float y = 1;
    geom::Transform ts;
};

Pixmap offset_image(const Pixmap& in, const geom::IntRect& area, int32_t dx, int32_t dy) {
    Pixmap out = blank_like(in);
    geom::IntRect bounds = in.rect();
    for_each_pixel(area, [&](uint32_t x, uint32_t y) {
        int32_t sx = static_cast<int32_t>(x) - dx;
        int32_t sy = static_cast<int32_t>(y) - dy;
        if (sx < 0 || sy < 0 || sx >= bounds.right() || sy >= bounds.bottom()) return;
        std::copy_n(in.pixel_ptr(static_cast<uint32_t>(sx), static_cast<uint32_t>(sy)), 4,
                    out.pixel_ptr(x, y));
    });
    return out;
}

std::pair<int32_t, int32_t> device_offset(const Scale& scale, float dx, float dy) {
    geom::Point d = scale.ts.apply_vector({dx, dy});
    return {static_cast<int32_t>(std::lround(d.x)), static_cast<int32_t>(std::lround(d.y))};
}

Pixmap blur(const Pixmap& in, const GaussianBlur& p, const Scale& scale) {
    Pixmap out = in;
    gaussian_blur(out, p.std_dev_x * scale.x, p.std_dev_y * scale.y);
    return out;
}

std::vector<float> color_matrix_for(const ColorMatrix& p) {
    switch (p.kind) {
        case ColorMatrix::Kind::Matrix:
            if (p.matrix.size() == 20) return p.matrix;
            return ColorMatrix::identity_matrix();
        case ColorMatrix::Kind::Saturate: {
            float s = p.value;
            return {0.213f + 0.787f * s, 0.715f - 0.715f * s, 0.072f - 0.072f * s, 0, 0,
                    0.213f - 0.213f * s, 0.715f + 0.285f * s, 0.072f - 0.072f * s, 0, 0,
                    0.213f - 0.213f * s, 0.715f - 0.715f * s, 0.072f + 0.928f * s, 0, 0,
                    0, 0, 0, 1, 0};
        }
        case ColorMatrix::Kind::HueRotate: {
            float rad = p.value * std::numbers::pi_v<float> / 180.0f;
            float cs = std::cos(rad);
            float sn = std::sin(rad);
            return {0.213f + cs * 0.787f - sn * 0.213f,
                    0.715f - cs * 0.715f - sn * 0.715f,
                    0.072f - cs * 0.072f + sn * 0.928f, 0, 0,
                    0.213f - cs * 0.213f + sn * 0.143f,
                    0.715f + cs * 0.285f + sn * 0.140f,
                    0.072f - cs * 0.072f - sn * 0.283f, 0, 0,
                    0.213f - cs * 0.213f - sn * 0.787f,
                    0.715f - cs * 0.715f + sn * 0.715f,
                    0.072f + cs * 0.928f + sn * 0.072f, 0, 0,
                    0, 0, 0, 1, 0};
        }
        case ColorMatrix::Kind::LuminanceToAlpha:
            return {0, 0, 0, 0, 0,
                    0, 0, 0, 0, 0,
                    0, 0, 0, 0, 0,
                    0.2125f, 0.7154f, 0.0721f, 0, 0};
    }
    return ColorMatrix::identity_matrix();
}

Pixmap color_matrix(const Pixmap& in, const geom::IntRect& area, const ColorMatrix& p) {
    std::vector<float> m = color_matrix_for(p);
    Pixmap out = blank_like(in);
    for_each_pixel(area, [&](uint32_t x, uint32_t y) {
        ColorF c = load_pixel(in.pixel_ptr(x, y)).demultiplied();
        const float v[4] = {c.r, c.g, c.b, c.a};
        float r[4];
        for (int row = 0; row < 4; ++row) {
            const float* k = &m[static_cast<size_t>(row) * 5];
            r[row] = std::clamp(k[0] * v[0] + k[1] * v[1] + k[2] * v[2] + k[3] * v[3] + k[4], 0.0f, 1.0f);
        }
        store_pixel(out.pixel_ptr(x, y), ColorF{r[0], r[1], r[2], r[3]}.premultiplied());
    });
    return out;
}

Pixmap component_transfer(const Pixmap& in, const geom::IntRect& area, const ComponentTransfer& p) {
    Pixmap out = blank_like(in);
    for_each_pixel(area, [&](uint32_t x, uint32_t y) {
        ColorF c = load_pixel(in.pixel_ptr(x, y)).demultiplied();
        ColorF r{p.r.apply(c.r), p.g.apply(c.g), p.b.apply(c.b), p.a.apply(c.a)};
        store_pixel(out.pixel_ptr(x, y), r.premultiplied());
    });
    return out;
}

ColorF composite_pixel(const ColorF& a, const ColorF& b, const Composite& p) {
    auto mix = [](const ColorF& x, float fx, const ColorF& y, float fy) {
        return ColorF{x.r * fx + y.r * fy, x.g * fx + y.g * fy, x.b * fx + y.b * fy,
                      x.a * fx + y.a * fy};
    };
    switch (p.op) {
        case Composite::Operator::Over: return mix(a, 1, b, 1 - a.a);
        case Composite::Operator::In: return mix(a, b.a, b, 0);
        case Composite::Operator::Out: return mix(a, 1 - b.a, b, 0);
        case Composite::Operator::Atop: return mix(a, b.a, b, 1 - a.a);
        case Composite::Operator::Xor: return mix(a, 1 - b.a, b, 1 - a.a);
        case Composite::Operator::Arithmetic: {
            auto f = [&](float i1, float i2) {
                return std::clamp(p.k1 * i1 * i2 + p.k2 * i1 + p.k3 * i2 + p.k4, 0.0f, 1.0f);
            };
            float alpha = f(a.a, b.a);
            return {std::min(f(a.r, b.r), alpha), std::min(f(a.g, b.g), alpha),
                    std::min(f(a.b, b.b), alpha), alpha};
        }
    }
    return a;
}

Pixmap composite(const Pixmap& in1, const Pixmap& in2, const geom::IntRect& area, const Composite& p) {
    Pixmap out = blank_like(in1);
    for_each_pixel(area, [&](uint32_t x, uint32_t y) {
        store_pixel(out.pixel_ptr(x, y),
                    composite_pixel(load_pixel(in1.pixel_ptr(x, y)), load_pixel(in2.pixel_ptr(x, y)), p));
    });
    return out;
}

Pixmap blend(const Pixmap& in1, const Pixmap& in2, const geom::IntRect& area, const Blend& p) {
    Pixmap out = blank_like(in1);
    for_each_pixel(area, [&](uint32_t x, uint32_t y) {
        store_pixel(out.pixel_ptr(x, y),
                    render::blend(load_pixel(in1.pixel_ptr(x, y)), load_pixel(in2.pixel_ptr(x, y)), p.mode));
    });
    return out;
}

Pixmap merge(const Pixmap& first, const std::vector<Image>& inputs, const geom::IntRect& area) {
    Pixmap out = blank_like(first);
    for (const Image& input : inputs) {
        for_each_pixel(area, [&](uint32_t x, uint32_t y) {
            ColorF s = load_pixel(input.pixmap->pixel_ptr(x, y));
            if (s.a <= 0) return;
            uint8_t* d = out.pixel_ptr(x, y);
            store_pixel(d, render::blend(s, load_pixel(d), paint::BlendMode::Normal));
        });
    }
    return out;
}

// Separable min/max over a window of `radius` pixels either way, using the
// van Herk/Gil-Werman running extremum so the cost does not grow with the
// radius. Pixels outside the image count as transparent black.
void morphology_axis(Pixmap& image, bool horizontal, int32_t radius, bool dilate) {
    auto w = static_cast<int32_t>(image.width());
    auto h = static_cast<int32_t>(image.height());
    const int32_t length = horizontal ? w : h;
    const int32_t lines = horizontal ? h : w;
    if (radius <= 0 || length <= 0) return;
    // Past this every window already covers the whole line and some padding.
    radius = std::min(radius, length);

    const size_t window = static_cast<size_t>(2 * radius + 1);
    const size_t padded = static_cast<size_t>(length + 2 * radius);
    auto pick = [dilate](uint8_t a, uint8_t b) { return dilate ? std::max(a, b) : std::min(a, b); };
    std::vector<uint8_t> line(padded * 4), prefix(padded * 4), suffix(padded * 4);

    for (int32_t l = 0; l < lines; ++l) {
        std::fill(line.begin(), line.end(), uint8_t{0});
        for (int32_t i = 0; i < length; ++i) {
            const uint8_t* p = horizontal ? image.pixel_ptr(static_cast<uint32_t>(i), static_cast<uint32_t>(l))
                                          : image.pixel_ptr(static_cast<uint32_t>(l), static_cast<uint32_t>(i));
            std::copy_n(p, 4, &line[static_cast<size_t>(i + radius) * 4]);
        }
        for (size_t i = 0; i < padded; ++i) {
            bool block_start = i % window == 0;
            for (size_t c = 0; c < 4; ++c) {
                prefix[i * 4 + c] = block_start ? line[i * 4 + c] : pick(prefix[(i - 1) * 4 + c], line[i * 4 + c]);
            }
        }
        for (size_t i = padded; i-- > 0;) {
            bool block_end = (i + 1) % window == 0 || i + 1 == padded;
            for (size_t c = 0; c < 4; ++c) {
                suffix[i * 4 + c] = block_end ? line[i * 4 + c] : pick(suffix[(i + 1) * 4 + c], line[i * 4 + c]);
            }
        }
        for (int32_t i = 0; i < length; ++i) {
            auto first = static_cast<size_t>(i);
            size_t last = first + window - 1;
            uint8_t* d = horizontal ? image.pixel_ptr(static_cast<uint32_t>(i), static_cast<uint32_t>(l))
                                    : image.pixel_ptr(static_cast<uint32_t>(l), static_cast<uint32_t>(i));
            for (size_t c = 0; c < 4; ++c) d[c] = pick(suffix[first * 4 + c], prefix[last * 4 + c]);
        }
    }
}

// Device radius, limited to `limit` pixels.
int32_t morphology_radius(float radius, float scale, uint32_t limit) {
    double r = static_cast<double>(radius) * scale;
    if (!(r > 0)) return 0;
    return static_cast<int32_t>(std::min<double>(std::round(r), limit));
}

Pixmap morphology(const Pixmap& in, const Morphology& p, const Scale& scale) {
    Pixmap out = in;
    bool dilate = p.op == Morphology::Operator::Dilate;
    morphology_axis(out, true, morphology_radius(p.radius_x, scale.x, in.width()), dilate);
    morphology_axis(out, false, morphology_radius(p.radius_y, scale.y, in.height()), dilate);
    return out;
}

float channel_value(const ColorF& c, Channel channel) {
    switch (channel) {
        case Channel::R: return c.r;
        case Channel::G: return c.g;
        case Channel::B: return c.b;
        case Channel::A: return c.a;
    }
    return c.a;
}

Pixmap displacement_map(const Pixmap& in, const Pixmap& map, const geom::IntRect& area,
                        const DisplacementMap& p, const Scale& scale) {
    Pixmap out = blank_like(in);
    auto w = static_cast<int32_t>(in.width());
    auto h = static_cast<int32_t>(in.height());
    for_each_pixel(area, [&](uint32_t x, uint32_t y) {
        ColorF m = load_pixel(map.pixel_ptr(x, y)).demultiplied();
        float dx = p.scale * scale.x * (channel_value(m, p.x_channel) - 0.5f);
        float dy = p.scale * scale.y * (channel_value(m, p.y_channel) - 0.5f);
        auto sx = static_cast<int32_t>(std::lround(static_cast<float>(x) + dx));
        auto sy = static_cast<int32_t>(std::lround(static_cast<float>(y) + dy));
        if (sx < 0 || sy < 0 || sx >= w || sy >= h) return;
        std::copy_n(in.pixel_ptr(static_cast<uint32_t>(sx), static_cast<uint32_t>(sy)), 4, out.pixel_ptr(x, y));
    });
    return out;
}

Pixmap flood(const Pixmap& like, const geom::IntRect& area, const Flood& p, ColorSpace space) {
    Pixmap out = blank_like(like);
    ColorF c = flood_color(p.color, p.opacity, space);
    for_each_pixel(area, [&](uint32_t x, uint32_t y) { store_pixel(out.pixel_ptr(x, y), c); });
    return out;
}

Pixmap drop_shadow(const Pixmap& in, const geom::IntRect& area, const DropShadow& p,
                   const Scale& scale, ColorSpace space) {
    ColorF color = flood_color(p.color, p.opacity, space);
    Pixmap shadow = blank_like(in);
    for_each_pixel(in.rect(), [&](uint32_t x, uint32_t y) {
        float a = in.pixel_ptr(x, y)[3] / 255.0f;
        if (a <= 0) return;
        store_pixel(shadow.pixel_ptr(x, y), {color.r * a, color.g * a, color.b * a, color.a * a});
    });
    gaussian_blur(shadow, p.std_dev_x * scale.x, p.std_dev_y * scale.y);
    auto [dx, dy] = device_offset(scale, p.dx, p.dy);
    Pixmap out = offset_image(shadow, area, dx, dy);
    for_each_pixel(area, [&](uint32_t x, uint32_t y) {
        ColorF s = load_pixel(in.pixel_ptr(x, y));
        if (s.a <= 0) return;
        uint8_t* d = out.pixel_ptr(x, y);
        store_pixel(d, render::blend(s, load_pixel(d), paint::BlendMode::Normal));
    });
    return out;
}

Pixmap tile(const Image& input, const geom::IntRect& area) {
    Pixmap out = blank_like(*input.pixmap);
    const geom::IntRect& src = input.area;
    if (src.is_empty()) return out;
    auto wrap = [](int32_t v, int32_t origin, int32_t size) {
        int32_t m = (v - origin) % size;
        return origin + (m < 0 ? m + size : m);
    };
    for_each_pixel(area, [&](uint32_t x, uint32_t y) {
        int32_t sx = wrap(static_cast<int32_t>(x), src.x, src.width);
        int32_t sy = wrap(static_cast<int32_t>(y), src.y, src.height);
        std::copy_n(input.pixmap->pixel_ptr(static_cast<uint32_t>(sx), static_cast<uint32_t>(sy)), 4,
                    out.pixel_ptr(x, y));
    });
    return out;
}

// ---------------------------------------------------------------------------
// Graph
// ---------------------------------------------------------------------------

class Evaluator {
public:
    Evaluator(const Filter& filter, const geom::Transform& ts, Pixmap source,
              core::DiagnosticEmitter* diagnostics)
        : filter_(filter), diagnostics_(diagnostics), results_(filter.primitives.size()) {
        scale_.ts = ts;
        ts.get_scale(scale_.x, scale_.y);
        bounds_ = source.rect();

        Pixmap alpha = source;
        auto& data = alpha.data();
        for (size_t i = 0; i < data.size(); i += 4) data[i] = data[i + 1] = data[i + 2] = 0;
        source_graphic_ = {std::make_shared<const Pixmap>(std::move(source)), bounds_, ColorSpace::SRGB};
        source_alpha_ = {std::make_shared<const Pixmap>(std::move(alpha)), bounds_, ColorSpace::SRGB};

        plan();
    }

    void run(platform::ThreadPool* pool) {
        for (const std::vector<size_t>& level : levels_) {
            if (!pool || level.size() < 2) {
                for (size_t i : level) evaluate(i);
                continue;
            }
            std::vector<std::function<void()>> jobs;
            jobs.reserve(level.size());
            for (size_t i : level) jobs.push_back([this, i]() { evaluate(i); });
            pool->run_all(std::move(jobs));
        }
    }

    // The last result, converted back to sRGB.
    Image output() const {
        if (results_.empty() || !results_.back()) return source_graphic_;
        return in_space(*results_.back(), ColorSpace::SRGB);
    }

private:
    // Resolves input names to producing primitives and groups primitives
    // by dependency depth.
    void plan() {
        const auto& primitives = filter_.primitives;
        producers_.resize(primitives.size());
        std::vector<size_t> depth(primitives.size(), 0);
        for (size_t i = 0; i < primitives.size(); ++i) {
            for (const Input& input : primitive_inputs(primitives[i].kind)) {
                int producer = resolve(input, i);
                producers_[i].push_back(producer);
                if (producer >= 0) depth[i] = std::max(depth[i], depth[static_cast<size_t>(producer)] + 1);
            }
            if (depth[i] >= levels_.size()) levels_.resize(depth[i] + 1);
            levels_[depth[i]].push_back(i);
        }
    }

    int resolve(const Input& input, size_t index) const {
        switch (input.kind) {
            case Input::Kind::SourceGraphic: return kSourceGraphic;
            case Input::Kind::SourceAlpha: return kSourceAlpha;
            case Input::Kind::Reference:
                for (size_t j = index; j-- > 0;) {
                    if (filter_.primitives[j].result == input.name) return static_cast<int>(j);
                }
                break;
        }
        core::warn(diagnostics_, kModule, "input", "unknown filter input '" + input.name + "'");
        return index == 0 ? kSourceGraphic : static_cast<int>(index - 1);
    }

    const Image& input_image(int producer) const {
        if (producer == kSourceGraphic) return source_graphic_;
        if (producer == kSourceAlpha) return source_alpha_;
        return *results_[static_cast<size_t>(producer)];
    }

    geom::IntRect subregion(const Primitive& primitive) const {
        auto device = geom::round_out(primitive.rect.transformed(scale_.ts));
        if (!device) return {};
        return device->intersected(bounds_).value_or(geom::IntRect{});
    }

    void evaluate(size_t index) {
        const Primitive& primitive = filter_.primitives[index];
        ColorSpace space = primitive.color_space;
        geom::IntRect area = subregion(primitive);

        std::vector<Image> inputs;
        inputs.reserve(producers_[index].size());
        for (int producer : producers_[index]) inputs.push_back(in_space(input_image(producer), space));
        const Pixmap& first = inputs.empty() ? *source_graphic_.pixmap : *inputs.front().pixmap;

        Pixmap out = std::visit(
            [&](const auto& p) -> Pixmap {
                using T = std::decay_t<decltype(p)>;
                if constexpr (std::is_same_v<T, GaussianBlur>) {
                    return blur(first, p, scale_);
                } else if constexpr (std::is_same_v<T, ColorMatrix>) {
                    return color_matrix(first, area, p);
                } else if constexpr (std::is_same_v<T, Composite>) {
                    return composite(first, *inputs[1].pixmap, area, p);
                } else if constexpr (std::is_same_v<T, Morphology>) {
                    return morphology(first, p, scale_);
                } else if constexpr (std::is_same_v<T, Offset>) {
                    auto [dx, dy] = device_offset(scale_, p.dx, p.dy);
                    return offset_image(first, area, dx, dy);
                } else if constexpr (std::is_same_v<T, Merge>) {
                    return merge(first, inputs, area);
                } else if constexpr (std::is_same_v<T, DisplacementMap>) {
                    return displacement_map(first, *inputs[1].pixmap, area, p, scale_);
                } else if constexpr (std::is_same_v<T, Flood>) {
                    return flood(first, area, p, space);
                } else if constexpr (std::is_same_v<T, Blend>) {
                    return blend(first, *inputs[1].pixmap, area, p);
                } else if constexpr (std::is_same_v<T, ComponentTransfer>) {
                    return component_transfer(first, area, p);
                } else if constexpr (std::is_same_v<T, DropShadow>) {
                    return drop_shadow(first, area, p, scale_, space);
                } else if constexpr (std::is_same_v<T, Tile>) {
                    return tile(inputs.front(), area);
                } else {
                    return first;
                }
            },
            primitive.kind);

        clear_outside(out, area);
        results_[index] = Image{std::make_shared<const Pixmap>(std::move(out)), area, space};
    }

    const Filter& filter_;
    core::DiagnosticEmitter* diagnostics_;
    Scale scale_;
    geom::IntRect bounds_;
    Image source_graphic_;
    Image source_alpha_;
    std::vector<std::vector<int>> producers_;
    std::vector<std::vector<size_t>> levels_;
    std::vector<std::optional<Image>> results_;
};

} // namespace

void apply(const Filter& filter, const geom::Transform& ts, render::Pixmap& layer,
           platform::ThreadPool* pool, core::DiagnosticEmitter* diagnostics) {
    if (layer.is_empty()) return;
    if (filter.primitives.empty()) {
        layer.clear();
        return;
    }

    auto device = geom::round_out(filter.rect.transformed(ts));
    std::optional<geom::IntRect> region;
    if (device) region = device->intersected(layer.rect());
    if (!region) {
        layer.clear();
        return;
    }

    auto source = Pixmap::create(static_cast<uint32_t>(region->width), static_cast<uint32_t>(region->height));
    if (!source) {
        core::warn(diagnostics, kModule, "region", "filter region too large");
        layer.clear();
        return;
    }
    for (uint32_t y = 0; y < source->height(); ++y) {
        std::copy_n(layer.pixel_ptr(static_cast<uint32_t>(region->x), static_cast<uint32_t>(region->y) + y),
                    static_cast<size_t>(source->width()) * 4, source->pixel_ptr(0, y));
    }

    geom::Transform region_ts =
        geom::Transform::translate(static_cast<float>(-region->x), static_cast<float>(-region->y)) * ts;
    Evaluator evaluator(filter, region_ts, std::move(*source), diagnostics);
    evaluator.run(pool);
    Image result = evaluator.output();

    layer.clear();
    for (uint32_t y = 0; y < result.pixmap->height(); ++y) {
        std::copy_n(result.pixmap->pixel_ptr(0, y), static_cast<size_t>(result.pixmap->width()) * 4,
                    layer.pixel_ptr(static_cast<uint32_t>(region->x), static_cast<uint32_t>(region->y) + y));
    }
}

} // namespace tinta::filter
