#include "converter.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace tinta::normalize {

namespace {

tree::FillRule fill_rule(const std::string* value) {
    return value && dom::trim(*value) == "evenodd" ? tree::FillRule::EvenOdd
                                                   : tree::FillRule::NonZero;
}

tree::PaintOrder paint_order(const std::string* value) {
    if (!value) return tree::PaintOrder::FillAndStroke;
    std::istringstream in(*value);
    std::string token;
    while (in >> token) {
        if (token == "fill") return tree::PaintOrder::FillAndStroke;
        if (token == "stroke") return tree::PaintOrder::StrokeAndFill;
    }
    return tree::PaintOrder::FillAndStroke;
}

bool is_hidden(const Frame& frame) {
    const std::string* v = frame.find("visibility");
    if (!v) return false;
    std::string s = dom::trim(*v);
    return s == "hidden" || s == "collapse";
}

} // namespace

std::optional<geom::Path> Converter::shape_to_path(const Frame& frame) {
    geom::PathBuilder builder;

    switch (frame.element().kind()) {
        case dom::ElementKind::Rect: {
            float x = length_attr(frame, "x", Axis::X, 0);
            float y = length_attr(frame, "y", Axis::Y, 0);
            float w = length_attr(frame, "width", Axis::X, 0);
            float h = length_attr(frame, "height", Axis::Y, 0);
            if (!(w > 0) || !(h > 0)) return std::nullopt;

            float rx = length_attr(frame, "rx", Axis::X, -1);
            float ry = length_attr(frame, "ry", Axis::Y, -1);
            if (rx < 0 && ry < 0) {
                rx = ry = 0;
            } else if (rx < 0) {
                rx = ry;
            } else if (ry < 0) {
                ry = rx;
            }
            rx = std::min(rx, w / 2);
            ry = std::min(ry, h / 2);

            if (rx > 0 && ry > 0) {
                builder.push_rounded_rect({x, y, w, h}, rx, ry);
            } else {
                builder.push_rect({x, y, w, h});
            }
            break;
        }
        case dom::ElementKind::Circle: {
            float r = length_attr(frame, "r", Axis::Other, 0);
            if (!(r > 0)) return std::nullopt;
            builder.push_ellipse(length_attr(frame, "cx", Axis::X, 0),
                                 length_attr(frame, "cy", Axis::Y, 0), r, r);
            break;
        }
        case dom::ElementKind::Ellipse: {
            float rx = length_attr(frame, "rx", Axis::X, -1);
            float ry = length_attr(frame, "ry", Axis::Y, -1);
            if (rx < 0) rx = ry;
            if (ry < 0) ry = rx;
            if (!(rx > 0) || !(ry > 0)) return std::nullopt;
            builder.push_ellipse(length_attr(frame, "cx", Axis::X, 0),
                                 length_attr(frame, "cy", Axis::Y, 0), rx, ry);
            break;
        }
        case dom::ElementKind::Line:
            builder.move_to(length_attr(frame, "x1", Axis::X, 0), length_attr(frame, "y1", Axis::Y, 0));
            builder.line_to(length_attr(frame, "x2", Axis::X, 0), length_attr(frame, "y2", Axis::Y, 0));
            break;
        case dom::ElementKind::Polyline:
        case dom::ElementKind::Polygon: {
            const std::string* value = frame.attribute("points");
            if (!value) return std::nullopt;
            std::vector<geom::Point> points = dom::parse_points(*value);
            if (points.size() < 2) return std::nullopt;
            builder.move_to(points[0].x, points[0].y);
            for (size_t i = 1; i < points.size(); ++i) builder.line_to(points[i].x, points[i].y);
            if (frame.element().kind() == dom::ElementKind::Polygon) builder.close();
            break;
        }
        case dom::ElementKind::Path: {
            const std::string* d = frame.attribute("d");
            if (!d) return std::nullopt;
            return dom::parse_path_data(*d);
        }
        default:
            return std::nullopt;
    }

    return builder.finish();
}

void Converter::convert_shape(const Frame& frame, const Context& ctx, tree::Group& out) {
    if (is_hidden(frame)) return;
    std::optional<geom::Path> data = shape_to_path(frame);
    if (!data) return;

    std::optional<geom::Rect> bbox = data->bounds();

    tree::Path path;
    path.fill = resolve_fill(frame, bbox, ctx);
    if (!ctx.in_clip) path.stroke = resolve_stroke(frame, bbox, ctx);
    if (!path.fill && !path.stroke) return;

    path.paint_order = paint_order(frame.find("paint-order"));
    path.rendering_mode = shape_rendering(frame);
    path.data = std::move(*data);
    out.children.emplace_back(std::move(path));
}

std::optional<tree::Fill> Converter::resolve_fill(const Frame& frame,
                                                  const std::optional<geom::Rect>& bbox,
                                                  const Context& ctx) {
    tree::Fill fill;
    if (ctx.in_clip) {
        fill.rule = fill_rule(frame.find("clip-rule"));
        return fill;
    }

    dom::ParsedPaint parsed;
    parsed.kind = dom::ParsedPaint::Kind::Color;
    parsed.color = paint::Color::black();
    if (const std::string* value = frame.find("fill")) {
        if (auto p = dom::parse_paint(*value)) {
            parsed = *p;
        } else {
            warn("paint", "invalid fill '" + *value + "'");
        }
    }

    std::optional<ResolvedPaint> resolved = resolve_paint(frame, parsed, bbox);
    if (!resolved) return std::nullopt;

    fill.paint = std::move(resolved->paint);
    fill.opacity = parse_opacity(frame.find("fill-opacity")) * resolved->opacity;
    fill.rule = fill_rule(frame.find("fill-rule"));
    return fill;
}

std::optional<tree::Stroke> Converter::resolve_stroke(const Frame& frame,
                                                      const std::optional<geom::Rect>& bbox,
                                                      const Context& ctx) {
    if (ctx.in_clip) return std::nullopt;
    const std::string* value = frame.find("stroke");
    if (!value) return std::nullopt;

    auto parsed = dom::parse_paint(*value);
    if (!parsed) {
        warn("paint", "invalid stroke '" + *value + "'");
        return std::nullopt;
    }

    geom::StrokeStyle style;
    style.width = parse_user_length(frame.find("stroke-width"), Axis::Other, frame, options_.dpi, 1);
    if (!(style.width > 0)) return std::nullopt;

    std::optional<ResolvedPaint> resolved = resolve_paint(frame, *parsed, bbox);
    if (!resolved) return std::nullopt;

    if (const std::string* cap = frame.find("stroke-linecap")) {
        std::string s = dom::trim(*cap);
        if (s == "round") style.cap = geom::LineCap::Round;
        else if (s == "square") style.cap = geom::LineCap::Square;
    }
    if (const std::string* join = frame.find("stroke-linejoin")) {
        std::string s = dom::trim(*join);
        if (s == "round") style.join = geom::LineJoin::Round;
        else if (s == "bevel") style.join = geom::LineJoin::Bevel;
        else if (s == "miter-clip") style.join = geom::LineJoin::MiterClip;
    }
    if (const std::string* limit = frame.find("stroke-miterlimit")) {
        auto n = dom::parse_number(*limit);
        if (n && *n >= 1) style.miter_limit = *n;
    }

    if (const std::string* dashes = frame.find("stroke-dasharray")) {
        if (dom::trim(*dashes) != "none") {
            auto lengths = dom::parse_length_list(*dashes);
            std::vector<float> values;
            bool valid = lengths.has_value() && !lengths->empty();
            float sum = 0;
            if (valid) {
                for (const dom::Length& l : *lengths) {
                    float v = to_user(l, Axis::Other, frame, options_.dpi);
                    if (v < 0 || !std::isfinite(v)) {
                        valid = false;
                        break;
                    }
                    sum += v;
                    values.push_back(v);
                }
            }
            if (valid && sum > 0) {
                if (values.size() % 2 == 1) values.insert(values.end(), values.begin(), values.end());
                style.dasharray = std::move(values);
                style.dashoffset = parse_user_length(frame.find("stroke-dashoffset"), Axis::Other,
                                                     frame, options_.dpi, 0);
            }
        }
    }

    tree::Stroke stroke;
    stroke.paint = std::move(resolved->paint);
    stroke.opacity = parse_opacity(frame.find("stroke-opacity")) * resolved->opacity;
    stroke.style = std::move(style);
    return stroke;
}

tree::ShapeRendering Converter::shape_rendering(const Frame& frame) const {
    const std::string* value = frame.find("shape-rendering");
    if (!value) return options_.shape_rendering;
    std::string s = dom::trim(*value);
    if (s == "optimizeSpeed") return tree::ShapeRendering::OptimizeSpeed;
    if (s == "crispEdges") return tree::ShapeRendering::CrispEdges;
    if (s == "geometricPrecision") return tree::ShapeRendering::GeometricPrecision;
    return options_.shape_rendering;
}

} // namespace tinta::normalize
