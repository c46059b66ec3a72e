#include "converter.h"

#include <cmath>

namespace tinta::normalize {

namespace {

bool is_gradient(dom::ElementKind kind) {
    return kind == dom::ElementKind::LinearGradient || kind == dom::ElementKind::RadialGradient;
}

paint::Color current_color(const Frame& frame) {
    if (const std::string* value = frame.find("color")) {
        if (auto c = dom::parse_color(*value)) return *c;
    }
    return paint::Color::black();
}

// First value of `name` along an href chain, looking only at elements
// accepted by `accept`.
template<typename Accept>
const std::string* chain_attribute(const std::vector<const dom::Element*>& chain,
                                   std::string_view name, Accept&& accept) {
    for (const dom::Element* e : chain) {
        if (!accept(e->kind())) continue;
        if (const std::string* v = e->find_attribute(name)) return v;
    }
    return nullptr;
}

bool has_element_children(const dom::Element& element) {
    bool found = false;
    element.for_each_element_child([&](const dom::Element&) { found = true; });
    return found;
}

} // namespace

std::optional<ResolvedPaint> Converter::resolve_paint(const Frame& frame,
                                                      const dom::ParsedPaint& parsed,
                                                      const std::optional<geom::Rect>& bbox) {
    using Kind = dom::ParsedPaint::Kind;
    switch (parsed.kind) {
        case Kind::None:
        case Kind::ContextFill:
        case Kind::ContextStroke:
            return std::nullopt;
        case Kind::Color:
            return ResolvedPaint{parsed.color};
        case Kind::CurrentColor:
            return ResolvedPaint{current_color(frame)};
        case Kind::Url:
            break;
    }

    const dom::Element* server = index_.get_element_by_id(parsed.url);
    if (server) {
        dom::ElementKind kind = server->kind();
        if (is_gradient(kind)) return resolve_gradient(*server, frame, bbox);
        if (kind == dom::ElementKind::Pattern) return resolve_pattern(*server, frame, bbox);
        warn("paint", "'" + parsed.url + "' is not a paint server");
    } else {
        warn("paint", "paint server '" + parsed.url + "' not found");
    }

    if (!parsed.fallback_kind) return std::nullopt;
    switch (*parsed.fallback_kind) {
        case Kind::Color: return ResolvedPaint{parsed.fallback_color};
        case Kind::CurrentColor: return ResolvedPaint{current_color(frame)};
        default: return std::nullopt;
    }
}

std::optional<ResolvedPaint> Converter::resolve_gradient(const dom::Element& element,
                                                         const Frame& frame,
                                                         const std::optional<geom::Rect>& bbox) {
    std::vector<const dom::Element*> chain = href_chain(element);
    auto any_gradient = [](dom::ElementKind k) { return is_gradient(k); };
    auto same_kind = [&](dom::ElementKind k) { return k == element.kind(); };

    const dom::Element* stops_source = nullptr;
    for (const dom::Element* e : chain) {
        if (!is_gradient(e->kind())) continue;
        bool has_stop = false;
        e->for_each_element_child([&](const dom::Element& c) {
            if (c.kind() == dom::ElementKind::Stop) has_stop = true;
        });
        if (has_stop) {
            stops_source = e;
            break;
        }
    }
    if (!stops_source) return std::nullopt;

    std::vector<paint::Stop> stops;
    stops_source->for_each_element_child([&](const dom::Element& stop) {
        if (stop.kind() != dom::ElementKind::Stop) return;
        auto frames = dom_chain(stop);
        const Frame& sf = frames->back();

        paint::Stop s;
        if (const std::string* offset = stop.find_attribute("offset")) {
            s.offset = dom::parse_number_or_percent(*offset).value_or(0);
        }
        s.color = paint::Color::black();
        if (const std::string* value = sf.find("stop-color")) {
            std::string v = dom::trim(*value);
            if (v == "currentColor") {
                s.color = current_color(sf);
            } else if (auto c = dom::parse_color(v)) {
                s.color = *c;
            }
        }
        float opacity = parse_opacity(sf.find("stop-opacity"));
        s.color.a = static_cast<uint8_t>(std::lround(s.color.a * opacity));
        stops.push_back(s);
    });

    paint::normalize_stops(stops);
    if (stops.empty()) return std::nullopt;
    if (stops.size() == 1) return ResolvedPaint{stops.front().color};

    const std::string* units_value = chain_attribute(chain, "gradientUnits", any_gradient);
    paint::Units units = units_value && dom::trim(*units_value) == "userSpaceOnUse"
                             ? paint::Units::UserSpaceOnUse
                             : paint::Units::ObjectBoundingBox;
    if (units == paint::Units::ObjectBoundingBox && (!bbox || bbox->is_empty())) {
        return std::nullopt;
    }

    auto coord = [&](std::string_view name, Axis axis, dom::Length fallback) {
        dom::Length l = fallback;
        if (const std::string* v = chain_attribute(chain, name, same_kind)) {
            l = dom::parse_length(*v).value_or(fallback);
        }
        return units == paint::Units::ObjectBoundingBox ? to_bbox_fraction(l, frame, options_.dpi)
                                                        : to_user(l, axis, frame, options_.dpi);
    };

    geom::Transform ts;
    if (const std::string* v = chain_attribute(chain, "gradientTransform", any_gradient)) {
        ts = dom::parse_transform(*v).value_or(geom::Transform{});
    }
    auto resolved_ts = paint::resolve_units(ts, units, bbox.value_or(geom::Rect{}));
    if (!resolved_ts || !resolved_ts->is_invertible()) return std::nullopt;

    auto fill_common = [&](paint::Gradient& g) {
        g.id = element.id();
        g.transform = *resolved_ts;
        g.stops = stops;
        if (const std::string* v = chain_attribute(chain, "spreadMethod", any_gradient)) {
            std::string s = dom::trim(*v);
            if (s == "reflect") g.spread = paint::SpreadMode::Reflect;
            else if (s == "repeat") g.spread = paint::SpreadMode::Repeat;
        }
        if (const std::string* v = chain_attribute(chain, "alpha-interpolation", any_gradient)) {
            if (dom::trim(*v) == "premultiplied") {
                g.alpha_interpolation = paint::AlphaInterpolation::Premultiplied;
            }
        }
        auto frames = dom_chain(element);
        const std::string* cs = frames->back().find("color-interpolation");
        if (cs && dom::trim(*cs) == "linearRGB") g.color_space = paint::ColorSpace::LinearRGB;
    };

    if (element.kind() == dom::ElementKind::LinearGradient) {
        paint::LinearGradient g;
        g.x1 = coord("x1", Axis::X, dom::Length::percent(0));
        g.y1 = coord("y1", Axis::Y, dom::Length::percent(0));
        g.x2 = coord("x2", Axis::X, dom::Length::percent(100));
        g.y2 = coord("y2", Axis::Y, dom::Length::percent(0));
        if (g.x1 == g.x2 && g.y1 == g.y2) return ResolvedPaint{stops.back().color};
        fill_common(g);
        return ResolvedPaint{std::move(g)};
    }

    paint::RadialGradient g;
    g.cx = coord("cx", Axis::X, dom::Length::percent(50));
    g.cy = coord("cy", Axis::Y, dom::Length::percent(50));
    g.r = coord("r", Axis::Other, dom::Length::percent(50));
    if (!(g.r > 0)) return ResolvedPaint{stops.back().color};
    g.fx = chain_attribute(chain, "fx", same_kind) ? coord("fx", Axis::X, {}) : g.cx;
    g.fy = chain_attribute(chain, "fy", same_kind) ? coord("fy", Axis::Y, {}) : g.cy;
    g.fr = coord("fr", Axis::Other, dom::Length::percent(0));
    fill_common(g);
    return ResolvedPaint{std::move(g)};
}

std::optional<ResolvedPaint> Converter::resolve_pattern(const dom::Element& element,
                                                        const Frame& frame,
                                                        const std::optional<geom::Rect>& bbox) {
    std::vector<const dom::Element*> chain = href_chain(element);
    auto is_pattern = [](dom::ElementKind k) { return k == dom::ElementKind::Pattern; };

    const dom::Element* content = nullptr;
    for (const dom::Element* e : chain) {
        if (is_pattern(e->kind()) && has_element_children(*e)) {
            content = e;
            break;
        }
    }
    if (!content) return std::nullopt;

    auto keyword = [&](std::string_view name) {
        const std::string* v = chain_attribute(chain, name, is_pattern);
        return v ? dom::trim(*v) : std::string();
    };
    bool obb_units = keyword("patternUnits") != "userSpaceOnUse";
    bool obb_content = keyword("patternContentUnits") == "objectBoundingBox";

    std::optional<geom::Rect> view_box;
    if (const std::string* v = chain_attribute(chain, "viewBox", is_pattern)) {
        view_box = dom::parse_view_box(*v);
    }
    bool needs_bbox = obb_units || (obb_content && !view_box);
    if (needs_bbox && (!bbox || bbox->is_empty())) return std::nullopt;

    auto coord = [&](std::string_view name, Axis axis) {
        dom::Length l;
        if (const std::string* v = chain_attribute(chain, name, is_pattern)) {
            l = dom::parse_length(*v).value_or(dom::Length{});
        }
        if (!obb_units) return to_user(l, axis, frame, options_.dpi);
        float f = to_bbox_fraction(l, frame, options_.dpi);
        if (name == "x") return bbox->x + f * bbox->width;
        if (name == "y") return bbox->y + f * bbox->height;
        return f * (axis == Axis::X ? bbox->width : bbox->height);
    };

    geom::Rect rect{coord("x", Axis::X), coord("y", Axis::Y), coord("width", Axis::X),
                    coord("height", Axis::Y)};
    if (rect.is_empty() || !rect.is_valid()) return std::nullopt;

    geom::Transform ts;
    if (const std::string* v = chain_attribute(chain, "patternTransform", is_pattern)) {
        ts = dom::parse_transform(*v).value_or(geom::Transform{});
    }
    if (!ts.is_invertible()) return std::nullopt;

    ResourceKey key = make_key(&element, needs_bbox ? bbox : std::nullopt);
    if (auto it = pattern_cache_.find(key); it != pattern_cache_.end()) {
        return ResolvedPaint{paint::PatternRef{it->second}};
    }
    if (!begin_resolving(element)) return std::nullopt;

    tree::Pattern pattern;
    pattern.id = element.id();
    pattern.transform = ts;
    pattern.rect = rect;

    auto frames = dom_chain(*content);
    Frame content_frame = frames->back();
    if (view_box) {
        dom::AspectRatio ar;
        if (const std::string* v = chain_attribute(chain, "preserveAspectRatio", is_pattern)) {
            ar = dom::parse_aspect_ratio(*v).value_or(dom::AspectRatio{});
        }
        pattern.root.transform = dom::view_box_transform(*view_box, ar, {rect.width, rect.height});
        content_frame.set_viewport({view_box->width, view_box->height});
    } else if (obb_content) {
        pattern.root.transform = geom::Transform::scale(bbox->width, bbox->height);
    }

    convert_children(*content, content_frame, Context{}, pattern.root);
    end_resolving(element);

    if (pattern.root.children.empty()) return std::nullopt;

    tree_.patterns.push_back(std::move(pattern));
    size_t index = tree_.patterns.size() - 1;
    pattern_cache_.emplace(key, index);
    return ResolvedPaint{paint::PatternRef{index}};
}

} // namespace tinta::normalize
