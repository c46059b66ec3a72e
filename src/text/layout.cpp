#include <tinta/text/layout.h>

#include <cmath>

namespace tinta::text {

FontMetrics fallback_metrics(float size) {
    FontMetrics m;
    m.ascent = size * 0.8f;
    m.descent = size * 0.2f;
    m.underline_position = size * 0.1f;
    m.underline_thickness = size / 14.0f;
    m.strikeout_position = -size * 0.3f;
    m.strikeout_thickness = size / 14.0f;
    return m;
}

namespace {

constexpr float kRadToDeg = 57.2957795f;

struct PlacedSpan {
    const TextSpan* span = nullptr;
    std::vector<GlyphRecord> glyphs;
    float width = 0;
};

bool is_space_cluster(const std::string& text, size_t cluster) {
    return cluster < text.size() && text[cluster] == ' ';
}

float glyph_advance(const TextSpan& span, const GlyphRecord& g) {
    float adv = g.advance + span.letter_spacing;
    if (is_space_cluster(span.text, g.cluster)) adv += span.word_spacing;
    return adv;
}

tree::Path make_path(const TextSpan& span, geom::Path data) {
    tree::Path path;
    path.fill = span.fill;
    path.stroke = span.stroke;
    path.paint_order = span.paint_order;
    path.rendering_mode = span.rendering_mode;
    path.visible = span.visible;
    path.data = std::move(data);
    return path;
}

void add_decoration(tree::Group& out, const Decoration& deco, const TextSpan& span, float x,
                    float y, float width, float thickness) {
    if (!(width > 0) || !(thickness > 0)) return;
    geom::PathBuilder builder;
    builder.push_rect({x, y, width, thickness});
    auto data = builder.finish();
    if (!data) return;
    tree::Path path;
    path.fill = deco.fill;
    path.stroke = deco.stroke;
    path.rendering_mode = span.rendering_mode;
    path.visible = span.visible;
    path.data = std::move(*data);
    out.children.emplace_back(std::move(path));
}

// Emits one glyph. `ts` maps glyph space to text space.
void emit_glyph(tree::Group& out, geom::PathBuilder& span_outline, const TextSpan& span,
                const FontShaper& shaper, const GlyphRecord& g, const geom::Transform& ts) {
    if (auto color = shaper.color_glyph(span.font, g.glyph_id, span.font_size)) {
        if (color->bitmap && color->bitmap->width > 0 && color->bitmap->height > 0) {
            tree::Image image;
            image.data = color->bitmap;
            const geom::Rect& r = color->bitmap_rect;
            geom::Transform fit{r.width / static_cast<float>(color->bitmap->width), 0, r.x, 0,
                                r.height / static_cast<float>(color->bitmap->height), r.y};
            image.view_transform = ts * fit;
            image.clip = r.transformed(ts);
            image.visible = span.visible;
            out.children.emplace_back(std::move(image));
            return;
        }
        if (!color->layers.empty()) {
            tree::Group layers;
            for (const auto& layer : color->layers) {
                tree::Path path;
                path.fill = tree::Fill{layer.color, 1.0f, tree::FillRule::NonZero};
                if (span.fill) path.fill->opacity = span.fill->opacity;
                path.rendering_mode = span.rendering_mode;
                path.visible = span.visible;
                path.data = layer.path.transformed(ts);
                layers.children.emplace_back(std::move(path));
            }
            out.children.emplace_back(std::move(layers));
            return;
        }
    }
    if (auto outline = shaper.load_outline(span.font, g.glyph_id, span.font_size)) {
        span_outline.push_path(*outline, ts);
    }
}

void flush_span(tree::Group& out, geom::PathBuilder& builder, const TextSpan& span) {
    if (auto data = builder.finish()) out.children.emplace_back(make_path(span, std::move(*data)));
}

} // namespace

tree::Group layout_text(const std::vector<TextChunk>& chunks, const FontShaper& shaper,
                        core::DiagnosticEmitter* diagnostics) {
    tree::Group out;
    geom::Point pen{0, 0};

    for (const auto& chunk : chunks) {
        if (chunk.x) pen.x = *chunk.x;
        if (chunk.y) pen.y = *chunk.y;

        std::vector<PlacedSpan> placed;
        float chunk_width = 0;
        for (const auto& span : chunk.spans) {
            PlacedSpan ps;
            ps.span = &span;
            ps.glyphs = shaper.shape(span.text, span.font, span.font_size, chunk.direction);
            if (ps.glyphs.empty() && !span.text.empty()) {
                core::warn(diagnostics, "text", "shape",
                           "no glyphs for text run \"" + span.text + "\"");
            }
            for (const auto& g : ps.glyphs) ps.width += glyph_advance(span, g);
            chunk_width += ps.width;
            placed.push_back(std::move(ps));
        }

        float shift = 0;
        bool rtl = chunk.direction == Direction::Rtl;
        switch (chunk.anchor) {
            case TextAnchor::Start: shift = rtl ? -chunk_width : 0; break;
            case TextAnchor::Middle: shift = -chunk_width / 2; break;
            case TextAnchor::End: shift = rtl ? 0 : -chunk_width; break;
        }

        if (chunk.path) {
            float path_length = chunk.path->length();
            float dist = chunk.start_offset + shift;
            for (const auto& ps : placed) {
                const TextSpan& span = *ps.span;
                geom::PathBuilder builder;
                for (const auto& g : ps.glyphs) {
                    float adv = glyph_advance(span, g);
                    float mid = dist + g.advance / 2;
                    dist += adv;
                    if (mid < 0 || mid > path_length) continue;
                    geom::Point at;
                    float angle = 0;
                    if (!chunk.path->point_at(mid, at, angle)) continue;
                    geom::Transform ts = geom::Transform::translate(at.x, at.y) *
                                         geom::Transform::rotate(angle * kRadToDeg) *
                                         geom::Transform::translate(-g.advance / 2 + g.x_offset,
                                                                    g.y_offset + span.baseline_shift);
                    emit_glyph(out, builder, span, shaper, g, ts);
                }
                flush_span(out, builder, span);
            }
            continue;
        }

        float x = pen.x + shift;
        for (const auto& ps : placed) {
            const TextSpan& span = *ps.span;
            float span_start = x;
            float baseline = pen.y + span.baseline_shift;
            geom::PathBuilder builder;
            for (const auto& g : ps.glyphs) {
                geom::Transform ts = geom::Transform::translate(x + g.x_offset, baseline + g.y_offset);
                emit_glyph(out, builder, span, shaper, g, ts);
                x += glyph_advance(span, g);
            }

            FontMetrics m = fallback_metrics(span.font_size);
            if (auto reported = shaper.metrics(span.font, span.font_size)) m = *reported;
            // Underline and overline go below the glyphs, line-through above.
            if (span.underline) {
                add_decoration(out, *span.underline, span, span_start,
                               baseline + m.underline_position - m.underline_thickness / 2,
                               ps.width, m.underline_thickness);
            }
            if (span.overline) {
                add_decoration(out, *span.overline, span, span_start,
                               baseline - m.ascent - m.underline_thickness / 2, ps.width,
                               m.underline_thickness);
            }
            flush_span(out, builder, span);
            if (span.line_through) {
                add_decoration(out, *span.line_through, span, span_start,
                               baseline + m.strikeout_position - m.strikeout_thickness / 2,
                               ps.width, m.strikeout_thickness);
            }
        }
        // The next chunk continues after the placed text (before it for rtl).
        pen.x = rtl ? x - chunk_width : x;
    }
    return out;
}

} // namespace tinta::text
