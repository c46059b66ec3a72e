#include "converter.h"

#include <tinta/text/layout.h>

#include <algorithm>
#include <deque>
#include <sstream>

namespace tinta::normalize {

namespace {

struct DecorationSources {
    const Frame* underline = nullptr;
    const Frame* overline = nullptr;
    const Frame* line_through = nullptr;
};

struct SpanSource {
    const Frame* frame = nullptr;
    DecorationSources decorations;
};

uint16_t font_weight(const Frame& frame) {
    const std::string* value = frame.find("font-weight");
    if (!value) return 400;
    std::string s = dom::trim(*value);
    if (s == "normal") return 400;
    if (s == "bold" || s == "bolder") return 700;
    if (s == "lighter") return 300;
    auto n = dom::parse_number(s);
    if (!n) return 400;
    return static_cast<uint16_t>(std::clamp(*n, 1.0f, 1000.0f));
}

text::FontStyle font_style(const Frame& frame) {
    const std::string* value = frame.find("font-style");
    if (!value) return text::FontStyle::Normal;
    std::string s = dom::trim(*value);
    if (s == "italic") return text::FontStyle::Italic;
    if (s == "oblique") return text::FontStyle::Oblique;
    return text::FontStyle::Normal;
}

uint16_t font_stretch(const Frame& frame) {
    const std::string* value = frame.find("font-stretch");
    if (!value) return 100;
    std::string s = dom::trim(*value);
    if (s == "ultra-condensed") return 50;
    if (s == "extra-condensed") return 62;
    if (s == "condensed") return 75;
    if (s == "semi-condensed") return 87;
    if (s == "semi-expanded") return 112;
    if (s == "expanded") return 125;
    if (s == "extra-expanded") return 150;
    if (s == "ultra-expanded") return 200;
    if (auto n = dom::parse_number_or_percent(s); n && s.back() == '%') {
        return static_cast<uint16_t>(std::clamp(*n * 100, 50.0f, 200.0f));
    }
    return 100;
}

// Collapses white space the way `white-space: normal` does. Runs spanning
// several text nodes collapse too, tracked through `last_was_space`.
std::string collapse_whitespace(std::string_view data, bool preserve, bool& last_was_space) {
    std::string out;
    out.reserve(data.size());
    for (char c : data) {
        if (c == '\n' || c == '\r' || c == '\t') c = ' ';
        if (!preserve && c == ' ') {
            if (last_was_space) continue;
            last_was_space = true;
        } else {
            last_was_space = false;
        }
        out.push_back(c);
    }
    return out;
}

class TextCollector {
public:
    TextCollector(Converter& converter, const Options& options)
        : converter_(converter), options_(options) {}

    void collect_root(const Frame& frame) {
        start_chunk(frame, nullptr);
        collect(frame, {}, preserves_space(frame.element(), false));

        // Trailing white space of the whole text is dropped.
        for (auto chunk = chunks_.rbegin(); chunk != chunks_.rend(); ++chunk) {
            if (chunk->spans.empty()) continue;
            std::string& last = chunk->spans.back().text;
            if (!last.empty() && last.back() == ' ') last.pop_back();
            break;
        }
        for (size_t i = 0; i < chunks_.size(); ++i) {
            auto& spans = chunks_[i].spans;
            auto& sources = sources_[i];
            for (size_t j = spans.size(); j-- > 0;) {
                if (spans[j].text.empty()) {
                    spans.erase(spans.begin() + static_cast<std::ptrdiff_t>(j));
                    sources.erase(sources.begin() + static_cast<std::ptrdiff_t>(j));
                }
            }
        }
    }

    // Chunks with paints resolved against `bbox`; without a bbox every
    // glyph is filled black so the geometry can be measured.
    std::vector<text::TextChunk> chunks(const std::optional<geom::Rect>& bbox, const Context& ctx,
                                        bool measure) {
        std::vector<text::TextChunk> out = chunks_;
        for (size_t i = 0; i < out.size(); ++i) {
            for (size_t j = 0; j < out[i].spans.size(); ++j) {
                text::TextSpan& span = out[i].spans[j];
                const SpanSource& src = sources_[i][j];
                if (measure) {
                    span.fill = tree::Fill{};
                    span.stroke.reset();
                    span.visible = true;
                    continue;
                }
                span.fill = converter_.resolve_fill(*src.frame, bbox, ctx);
                span.stroke = converter_.resolve_stroke(*src.frame, bbox, ctx);
                auto decoration = [&](const Frame* f) -> std::optional<text::Decoration> {
                    if (!f) return std::nullopt;
                    text::Decoration d;
                    d.fill = converter_.resolve_fill(*f, bbox, ctx);
                    d.stroke = converter_.resolve_stroke(*f, bbox, ctx);
                    return d;
                };
                span.underline = decoration(src.decorations.underline);
                span.overline = decoration(src.decorations.overline);
                span.line_through = decoration(src.decorations.line_through);
            }
        }
        return out;
    }

    std::string content() const {
        std::string s;
        for (const auto& chunk : chunks_) {
            for (const auto& span : chunk.spans) s += span.text;
        }
        return s;
    }

private:
    static bool preserves_space(const dom::Element& element, bool inherited) {
        const std::string* value = element.find_attribute("xml:space");
        if (!value) return inherited;
        return dom::trim(*value) == "preserve";
    }

    std::optional<float> first_length(const Frame& frame, std::string_view name, Axis axis) {
        const std::string* value = frame.attribute(name);
        if (!value) return std::nullopt;
        auto list = dom::parse_length_list(*value);
        if (!list || list->empty()) return std::nullopt;
        return to_user(list->front(), axis, frame, options_.dpi);
    }

    void start_chunk(const Frame& frame, const geom::Path* path, float start_offset = 0) {
        if (chunks_.empty() || !chunks_.back().spans.empty()) {
            chunks_.emplace_back();
            sources_.emplace_back();
        }
        text::TextChunk& chunk = chunks_.back();
        chunk.x = first_length(frame, "x", Axis::X);
        chunk.y = first_length(frame, "y", Axis::Y);

        const std::string* anchor = frame.find("text-anchor");
        std::string a = anchor ? dom::trim(*anchor) : "start";
        chunk.anchor = a == "middle" ? text::TextAnchor::Middle
                       : a == "end"  ? text::TextAnchor::End
                                     : text::TextAnchor::Start;
        const std::string* direction = frame.find("direction");
        chunk.direction = direction && dom::trim(*direction) == "rtl" ? text::Direction::Rtl
                                                                      : text::Direction::Ltr;
        if (path) {
            chunk.path = *path;
            chunk.start_offset = start_offset;
        } else {
            chunk.path.reset();
            chunk.start_offset = 0;
        }
    }

    void collect(const Frame& frame, DecorationSources decorations, bool preserve) {
        auto it = frame.props().find("text-decoration");
        if (it != frame.props().end()) {
            std::istringstream in(it->second);
            std::string token;
            while (in >> token) {
                if (token == "underline") decorations.underline = &frame;
                else if (token == "overline") decorations.overline = &frame;
                else if (token == "line-through") decorations.line_through = &frame;
            }
        }

        for (const auto& node : frame.element().children()) {
            if (node->is_text()) {
                const auto& data = static_cast<const dom::Text&>(*node).data();
                std::string text = collapse_whitespace(data, preserve, last_was_space_);
                if (text.empty()) continue;
                text::TextSpan span = make_span(frame);
                span.text = std::move(text);
                chunks_.back().spans.push_back(std::move(span));
                sources_.back().push_back({&frame, decorations});
                continue;
            }

            const auto& child = static_cast<const dom::Element&>(*node);
            if (child.kind() != dom::ElementKind::TSpan && child.kind() != dom::ElementKind::TextPath) {
                continue;
            }
            const Frame& child_frame = frames_.emplace_back(converter_.make_frame(child, &frame));
            const std::string* display = child_frame.find("display");
            if (display && dom::trim(*display) == "none") continue;
            bool child_preserve = preserves_space(child, preserve);

            if (child.kind() == dom::ElementKind::TSpan) {
                if (child.has_attribute("x") || child.has_attribute("y")) {
                    start_chunk(child_frame, nullptr);
                }
                collect(child_frame, decorations, child_preserve);
                continue;
            }

            std::optional<geom::Path> path = text_path(child);
            if (!path) {
                converter_.warn("text", "textPath does not reference a path");
                continue;
            }
            float offset = 0;
            if (const std::string* value = child.find_attribute("startOffset")) {
                if (auto len = dom::parse_length(*value)) {
                    offset = len->unit == dom::LengthUnit::Percent
                                 ? path->length() * len->value / 100
                                 : to_user(*len, Axis::Other, child_frame, options_.dpi);
                }
            }
            start_chunk(child_frame, &*path, offset);
            collect(child_frame, decorations, child_preserve);
            start_chunk(frame, nullptr);
            chunks_.back().x.reset();
            chunks_.back().y.reset();
        }
    }

    std::optional<geom::Path> text_path(const dom::Element& element) {
        const dom::Element* target = converter_.href_target(element);
        if (!target || target->kind() != dom::ElementKind::Path) return std::nullopt;
        const std::string* d = target->find_attribute("d");
        if (!d) return std::nullopt;
        auto path = dom::parse_path_data(*d);
        if (!path) return std::nullopt;
        if (const std::string* ts = target->find_attribute("transform")) {
            if (auto t = dom::parse_transform(*ts)) return path->transformed(*t);
        }
        return path;
    }

    text::TextSpan make_span(const Frame& frame) {
        text::TextSpan span;
        if (const std::string* families = frame.find("font-family")) {
            span.font.families = dom::parse_font_families(*families);
        }
        if (span.font.families.empty()) span.font.families.push_back(options_.font_family);
        span.font.weight = font_weight(frame);
        span.font.style = font_style(frame);
        span.font.stretch = font_stretch(frame);
        span.font_size = frame.font_size();

        auto spacing = [&](std::string_view name) {
            const std::string* value = frame.find(name);
            if (!value || dom::trim(*value) == "normal") return 0.0f;
            return parse_user_length(value, Axis::X, frame, options_.dpi, 0);
        };
        span.letter_spacing = spacing("letter-spacing");
        span.word_spacing = spacing("word-spacing");

        auto shift = frame.props().find("baseline-shift");
        if (shift != frame.props().end()) {
            std::string s = dom::trim(shift->second);
            if (s == "sub") {
                span.baseline_shift = span.font_size * 0.2f;
            } else if (s == "super") {
                span.baseline_shift = -span.font_size * 0.4f;
            } else if (auto len = dom::parse_length(s)) {
                float v = len->unit == dom::LengthUnit::Percent
                              ? span.font_size * len->value / 100
                              : to_user(*len, Axis::Y, frame, options_.dpi);
                span.baseline_shift = -v;
            }
        }

        const std::string* visibility = frame.find("visibility");
        span.visible = !visibility || dom::trim(*visibility) == "visible";

        const std::string* order = frame.find("paint-order");
        if (order) {
            std::istringstream in(*order);
            std::string token;
            while (in >> token) {
                if (token == "fill") break;
                if (token == "stroke") {
                    span.paint_order = tree::PaintOrder::StrokeAndFill;
                    break;
                }
            }
        }

        const std::string* rendering = frame.find("text-rendering");
        if (rendering && dom::trim(*rendering) == "optimizeSpeed") {
            span.rendering_mode = tree::ShapeRendering::OptimizeSpeed;
        } else if (rendering && dom::trim(*rendering) != "auto") {
            span.rendering_mode = tree::ShapeRendering::GeometricPrecision;
        } else {
            span.rendering_mode = converter_.shape_rendering(frame);
        }
        return span;
    }

    Converter& converter_;
    const Options& options_;
    std::vector<text::TextChunk> chunks_;
    std::vector<std::vector<SpanSource>> sources_;
    std::deque<Frame> frames_;
    bool last_was_space_ = true;
};

} // namespace

void Converter::convert_text(const Frame& frame, const Context& ctx, tree::Group& out) {
    if (!options_.shaper) {
        warn("text", "no font shaper configured, text skipped");
        return;
    }

    TextCollector collector(*this, options_);
    collector.collect_root(frame);

    tree::Group measured = text::layout_text(collector.chunks(std::nullopt, ctx, true),
                                             *options_.shaper, options_.diagnostics);
    if (measured.children.empty()) return;
    tree::calculate_bounding_boxes(measured, tree_);

    tree::Text node;
    node.content = collector.content();
    node.flattened = text::layout_text(collector.chunks(measured.bounding_box, ctx, false),
                                       *options_.shaper, options_.diagnostics);
    if (node.flattened.children.empty()) return;
    out.children.emplace_back(std::move(node));
}

} // namespace tinta::normalize
