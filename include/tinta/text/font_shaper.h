#pragma once
#include <tinta/geom/path.h>
#include <tinta/geom/rect.h>
#include <tinta/paint/color.h>
#include <tinta/tree/tree.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tinta::text {

enum class Direction : uint8_t { Ltr, Rtl };
enum class FontStyle : uint8_t { Normal, Italic, Oblique };

struct FontSelector {
    std::vector<std::string> families;
    uint16_t weight = 400;
    FontStyle style = FontStyle::Normal;
    // Percentage of normal width (font-stretch).
    uint16_t stretch = 100;
};

// One shaped glyph. Advances and offsets are in user units at the
// requested size; records come in visual (left to right) order.
struct GlyphRecord {
    uint32_t glyph_id = 0;
    float advance = 0;
    float x_offset = 0;
    float y_offset = 0;
    // Byte offset of the first character this glyph belongs to.
    size_t cluster = 0;
};

// Font-wide metrics in user units at the requested size. Positions are
// measured downwards from the baseline (SVG y axis).
struct FontMetrics {
    float ascent = 0;
    float descent = 0;
    float underline_position = 0;
    float underline_thickness = 0;
    float strikeout_position = 0;
    float strikeout_thickness = 0;
};

struct ColorLayer {
    geom::Path path;
    paint::Color color;
};

// Embedded color glyph: either layered outlines or a bitmap placed at
// `bitmap_rect` in glyph space.
struct ColorGlyph {
    std::vector<ColorLayer> layers;
    std::shared_ptr<const tree::ImageData> bitmap;
    geom::Rect bitmap_rect;
};

// Font engine used for text. Outlines are in user units at the requested
// size, relative to the glyph origin on the baseline, y pointing down.
class FontShaper {
public:
    virtual ~FontShaper() = default;

    virtual std::vector<GlyphRecord> shape(std::string_view text, const FontSelector& font,
                                           float size, Direction direction) const = 0;
    virtual std::optional<geom::Path> load_outline(const FontSelector& font, uint32_t glyph_id,
                                                   float size) const = 0;
    virtual std::optional<ColorGlyph> color_glyph(const FontSelector& font, uint32_t glyph_id,
                                                  float size) const {
        (void)font;
        (void)glyph_id;
        (void)size;
        return std::nullopt;
    }
    virtual std::optional<FontMetrics> metrics(const FontSelector& font, float size) const = 0;
};

// Metrics used when the shaper reports none.
FontMetrics fallback_metrics(float size);

} // namespace tinta::text
