#pragma once
#include <tinta/core/config.h>
#include <tinta/core/diagnostics.h>
#include <tinta/geom/rect.h>
#include <tinta/render/image_decoder.h>
#include <tinta/text/font_shaper.h>
#include <tinta/tree/tree.h>

#include <optional>
#include <string>

namespace tinta::normalize {

struct Options {
    // Resolution used for absolute units (in, cm, mm, pt, pc).
    float dpi = core::config::kDefaultDpi;
    float font_size = core::config::kDefaultFontSize;
    std::string font_family = core::config::kDefaultFontFamily;
    tree::ShapeRendering shape_rendering = tree::ShapeRendering::GeometricPrecision;
    tree::ImageRendering image_rendering = tree::ImageRendering::OptimizeQuality;
    // Size used when the root element has no usable width/height.
    std::optional<geom::Size> default_size;

    // Not owned. Without a shaper text is skipped; without a decoder the
    // stb_image based one is used.
    const text::FontShaper* shaper = nullptr;
    const render::ImageDecoder* image_decoder = nullptr;
    core::DiagnosticEmitter* diagnostics = nullptr;
};

} // namespace tinta::normalize
