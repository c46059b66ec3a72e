#pragma once
#include <tinta/paint/blend_mode.h>
#include <tinta/paint/color.h>
#include <tinta/render/pixmap.h>
#include <tinta/render/rasterizer.h>
#include <tinta/render/shader.h>
#include <tinta/tree/tree.h>

#include <cstdint>
#include <vector>

namespace tinta::render {

// Composites premultiplied `src` over `dst` with a W3C compositing and
// blending mode (separable and non-separable).
paint::ColorF blend(const paint::ColorF& src, const paint::ColorF& dst, paint::BlendMode mode);

// Paints the covered pixels of `dst` with `shader`, source-over.
void fill_coverage(Pixmap& dst, const Coverage& coverage, const Shader& shader);

// Composites `src`, its origin placed at (x, y), onto `dst`.
void draw_layer(Pixmap& dst, const Pixmap& src, int32_t x, int32_t y, float opacity,
                paint::BlendMode mode);

// Per-pixel values of a rendered mask: its alpha, or the luminance of its
// colors times alpha.
std::vector<uint8_t> mask_values(const Pixmap& mask, tree::MaskType kind);

// Multiplies every pixel of `dst` by the matching value (destination-in).
void apply_mask_values(Pixmap& dst, const std::vector<uint8_t>& values);

} // namespace tinta::render
