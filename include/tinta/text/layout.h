#pragma once
#include <tinta/core/diagnostics.h>
#include <tinta/text/font_shaper.h>
#include <tinta/tree/tree.h>

#include <optional>
#include <string>
#include <vector>

namespace tinta::text {

enum class TextAnchor : uint8_t { Start, Middle, End };

struct Decoration {
    std::optional<tree::Fill> fill;
    std::optional<tree::Stroke> stroke;
};

struct TextSpan {
    std::string text;
    FontSelector font;
    float font_size = 12;
    std::optional<tree::Fill> fill;
    std::optional<tree::Stroke> stroke;
    tree::PaintOrder paint_order = tree::PaintOrder::FillAndStroke;
    tree::ShapeRendering rendering_mode = tree::ShapeRendering::GeometricPrecision;
    float letter_spacing = 0;
    float word_spacing = 0;
    // Positive values move the span down.
    float baseline_shift = 0;
    bool visible = true;
    std::optional<Decoration> underline;
    std::optional<Decoration> overline;
    std::optional<Decoration> line_through;
};

// A run of spans sharing one absolute start position.
struct TextChunk {
    std::optional<float> x;
    std::optional<float> y;
    TextAnchor anchor = TextAnchor::Start;
    Direction direction = Direction::Ltr;
    std::vector<TextSpan> spans;
    // Set for text on a path; glyphs follow it starting at start_offset.
    std::optional<geom::Path> path;
    float start_offset = 0;
};

// Positions glyph outlines and returns them as a group of Path nodes
// (color glyphs as nested groups, bitmap glyphs as Image nodes).
tree::Group layout_text(const std::vector<TextChunk>& chunks, const FontShaper& shaper,
                        core::DiagnosticEmitter* diagnostics);

} // namespace tinta::text
