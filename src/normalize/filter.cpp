#include "converter.h"

#include <cmath>
#include <unordered_set>

namespace tinta::normalize {

namespace {

bool is_obb(const std::string* units, bool default_obb) {
    if (!units) return default_obb;
    return dom::trim(*units) == "objectBoundingBox";
}

std::vector<float> number_list(const dom::Element& element, std::string_view name) {
    const std::string* value = element.find_attribute(name);
    if (!value) return {};
    return dom::parse_number_list(*value).value_or(std::vector<float>{});
}

float number(const dom::Element& element, std::string_view name, float fallback) {
    const std::string* value = element.find_attribute(name);
    if (!value) return fallback;
    return dom::parse_number(*value).value_or(fallback);
}

filter::Channel channel(const dom::Element& element, std::string_view name) {
    const std::string* value = element.find_attribute(name);
    std::string s = value ? dom::trim(*value) : "A";
    if (s == "R") return filter::Channel::R;
    if (s == "G") return filter::Channel::G;
    if (s == "B") return filter::Channel::B;
    return filter::Channel::A;
}

filter::TransferFunction transfer_function(const dom::Element& element) {
    filter::TransferFunction fn;
    const std::string* type = element.find_attribute("type");
    std::string t = type ? dom::trim(*type) : "";
    if (t == "table" || t == "discrete") {
        fn.table = number_list(element, "tableValues");
        if (!fn.table.empty()) {
            fn.kind = t == "table" ? filter::TransferFunction::Kind::Table
                                   : filter::TransferFunction::Kind::Discrete;
        }
    } else if (t == "linear") {
        fn.kind = filter::TransferFunction::Kind::Linear;
        fn.slope = number(element, "slope", 1);
        fn.intercept = number(element, "intercept", 0);
    } else if (t == "gamma") {
        fn.kind = filter::TransferFunction::Kind::Gamma;
        fn.amplitude = number(element, "amplitude", 1);
        fn.exponent = number(element, "exponent", 1);
        fn.offset = number(element, "offset", 0);
    }
    return fn;
}

void flood_paint(const Frame& frame, paint::Color& color, float& opacity) {
    color = paint::Color::black();
    if (const std::string* value = frame.find("flood-color")) {
        std::string v = dom::trim(*value);
        if (v == "currentColor") {
            const std::string* current = frame.find("color");
            if (current) color = dom::parse_color(*current).value_or(paint::Color::black());
        } else if (auto c = dom::parse_color(v)) {
            color = *c;
        }
    }
    opacity = parse_opacity(frame.find("flood-opacity"));
}

} // namespace

std::vector<ResourceRef> Converter::resolve_filters(const Frame& frame,
                                                    const std::optional<geom::Rect>& bbox) {
    std::vector<ResourceRef> refs;
    const std::string* value = frame.find("filter");
    if (!value) return refs;

    std::string_view rest = *value;
    while (true) {
        size_t start = rest.find("url(");
        size_t end = start == std::string_view::npos ? start : rest.find(')', start);
        std::string_view before = rest.substr(0, start);
        if (dom::trim(before).size() > 0) {
            warn("filter", "filter function '" + dom::trim(before) + "' is not supported");
        }
        if (end == std::string_view::npos) break;

        auto id = dom::parse_func_iri(rest.substr(start, end - start + 1));
        const dom::Element* element = id ? index_.get_element_by_id(*id) : nullptr;
        if (element && element->kind() == dom::ElementKind::Filter) {
            refs.push_back(convert_filter_element(*element, bbox));
        } else {
            warn("filter", "filter '" + std::string(rest.substr(start, end - start + 1)) +
                               "' does not reference a filter");
        }
        rest = rest.substr(end + 1);
    }
    return refs;
}

ResourceRef Converter::convert_filter_element(const dom::Element& element,
                                              const std::optional<geom::Rect>& bbox) {
    std::vector<const dom::Element*> chain = href_chain(element);
    auto chain_attr = [&](std::string_view name) -> const std::string* {
        for (const dom::Element* e : chain) {
            if (e->kind() != dom::ElementKind::Filter) continue;
            if (const std::string* v = e->find_attribute(name)) return v;
        }
        return nullptr;
    };

    bool obb_units = is_obb(chain_attr("filterUnits"), true);
    bool obb_primitives = is_obb(chain_attr("primitiveUnits"), false);
    bool needs_bbox = obb_units || obb_primitives;
    if (needs_bbox && (!bbox || bbox->is_empty())) return ResourceRef::unrenderable();

    auto frames = dom_chain(element);
    const Frame& frame = frames->back();

    auto region_coord = [&](const std::string* value, std::string_view name, Axis axis,
                            dom::Length fallback, bool obb) {
        dom::Length l = fallback;
        if (value) l = dom::parse_length(*value).value_or(fallback);
        if (!obb) return to_user(l, axis, frame, options_.dpi);
        float f = to_bbox_fraction(l, frame, options_.dpi);
        if (name == "x") return bbox->x + f * bbox->width;
        if (name == "y") return bbox->y + f * bbox->height;
        return f * (axis == Axis::X ? bbox->width : bbox->height);
    };

    geom::Rect region{
        region_coord(chain_attr("x"), "x", Axis::X, dom::Length::percent(-10), obb_units),
        region_coord(chain_attr("y"), "y", Axis::Y, dom::Length::percent(-10), obb_units),
        region_coord(chain_attr("width"), "width", Axis::X, dom::Length::percent(120), obb_units),
        region_coord(chain_attr("height"), "height", Axis::Y, dom::Length::percent(120), obb_units)};
    if (region.is_empty() || !region.is_valid()) return ResourceRef::unrenderable();

    ResourceKey key = make_key(&element, needs_bbox ? bbox : std::nullopt);
    if (auto it = filter_cache_.find(key); it != filter_cache_.end()) {
        return ResourceRef::found(it->second);
    }

    const dom::Element* source = nullptr;
    for (const dom::Element* e : chain) {
        if (e->kind() != dom::ElementKind::Filter) continue;
        bool has_children = false;
        e->for_each_element_child([&](const dom::Element&) { has_children = true; });
        if (has_children) {
            source = e;
            break;
        }
    }
    if (!source) return ResourceRef::unrenderable();

    float sx = obb_primitives ? bbox->width : 1;
    float sy = obb_primitives ? bbox->height : 1;

    filter::Filter result;
    result.id = element.id();
    result.rect = region;

    std::unordered_set<std::string> names;
    std::string previous;
    size_t counter = 0;

    source->for_each_element_child([&](const dom::Element& child) {
        bool primitive = dom::is_filter_primitive(child.kind()) ||
                         (child.kind() == dom::ElementKind::Unknown &&
                          child.tag_name().rfind("fe", 0) == 0);
        if (!primitive || child.kind() == dom::ElementKind::FeMergeNode) return;

        auto child_frames = dom_chain(child);
        const Frame& pf = child_frames->back();

        auto input = [&](const dom::Element& e, std::string_view attr) {
            const std::string* value = e.find_attribute(attr);
            std::string v = value ? dom::trim(*value) : "";
            if (v == "SourceGraphic") return filter::Input::source_graphic();
            if (v == "SourceAlpha") return filter::Input::source_alpha();
            if (!v.empty() && names.count(v)) return filter::Input::reference(v);
            if (!v.empty()) warn("filter", "unknown filter input '" + v + "'");
            return previous.empty() ? filter::Input::source_graphic()
                                    : filter::Input::reference(previous);
        };

        filter::Primitive p;
        p.rect = {
            region_coord(child.find_attribute("x"), "x", Axis::X, {}, obb_primitives),
            region_coord(child.find_attribute("y"), "y", Axis::Y, {}, obb_primitives),
            region_coord(child.find_attribute("width"), "width", Axis::X, {}, obb_primitives),
            region_coord(child.find_attribute("height"), "height", Axis::Y, {}, obb_primitives)};
        if (!child.has_attribute("x")) p.rect.x = region.x;
        if (!child.has_attribute("y")) p.rect.y = region.y;
        if (!child.has_attribute("width")) p.rect.width = region.width;
        if (!child.has_attribute("height")) p.rect.height = region.height;

        const std::string* cs = pf.find("color-interpolation-filters");
        if (cs && dom::trim(*cs) == "sRGB") p.color_space = paint::ColorSpace::SRGB;

        const std::string* result_name = child.find_attribute("result");
        p.result = result_name && !dom::trim(*result_name).empty()
                       ? dom::trim(*result_name)
                       : "__result" + std::to_string(counter);
        ++counter;

        switch (child.kind()) {
            case dom::ElementKind::FeGaussianBlur: {
                filter::GaussianBlur blur;
                blur.input = input(child, "in");
                std::vector<float> sd = number_list(child, "stdDeviation");
                if (sd.size() == 1) sd.push_back(sd[0]);
                if (sd.size() == 2 && sd[0] >= 0 && sd[1] >= 0) {
                    blur.std_dev_x = sd[0] * sx;
                    blur.std_dev_y = sd[1] * sy;
                }
                p.kind = blur;
                break;
            }
            case dom::ElementKind::FeOffset: {
                filter::Offset offset;
                offset.input = input(child, "in");
                offset.dx = number(child, "dx", 0) * sx;
                offset.dy = number(child, "dy", 0) * sy;
                p.kind = offset;
                break;
            }
            case dom::ElementKind::FeFlood: {
                filter::Flood flood;
                flood_paint(pf, flood.color, flood.opacity);
                p.kind = flood;
                break;
            }
            case dom::ElementKind::FeBlend: {
                filter::Blend blend;
                blend.input1 = input(child, "in");
                blend.input2 = input(child, "in2");
                if (const std::string* mode = child.find_attribute("mode")) {
                    blend.mode = paint::blend_mode_from_name(dom::trim(*mode))
                                     .value_or(paint::BlendMode::Normal);
                }
                p.kind = blend;
                break;
            }
            case dom::ElementKind::FeComposite: {
                filter::Composite composite;
                composite.input1 = input(child, "in");
                composite.input2 = input(child, "in2");
                const std::string* op = child.find_attribute("operator");
                std::string o = op ? dom::trim(*op) : "over";
                using Op = filter::Composite::Operator;
                if (o == "in") composite.op = Op::In;
                else if (o == "out") composite.op = Op::Out;
                else if (o == "atop") composite.op = Op::Atop;
                else if (o == "xor") composite.op = Op::Xor;
                else if (o == "arithmetic") composite.op = Op::Arithmetic;
                composite.k1 = number(child, "k1", 0);
                composite.k2 = number(child, "k2", 0);
                composite.k3 = number(child, "k3", 0);
                composite.k4 = number(child, "k4", 0);
                p.kind = composite;
                break;
            }
            case dom::ElementKind::FeMerge: {
                filter::Merge merge;
                child.for_each_element_child([&](const dom::Element& node) {
                    if (node.kind() == dom::ElementKind::FeMergeNode) {
                        merge.inputs.push_back(input(node, "in"));
                    }
                });
                p.kind = merge;
                break;
            }
            case dom::ElementKind::FeColorMatrix: {
                filter::ColorMatrix matrix;
                matrix.input = input(child, "in");
                const std::string* type = child.find_attribute("type");
                std::string t = type ? dom::trim(*type) : "matrix";
                std::vector<float> values = number_list(child, "values");
                using K = filter::ColorMatrix::Kind;
                if (t == "saturate") {
                    matrix.kind = K::Saturate;
                    matrix.value = values.size() == 1 ? values[0] : 1;
                } else if (t == "hueRotate") {
                    matrix.kind = K::HueRotate;
                    matrix.value = values.size() == 1 ? values[0] : 0;
                } else if (t == "luminanceToAlpha") {
                    matrix.kind = K::LuminanceToAlpha;
                } else {
                    matrix.kind = K::Matrix;
                    matrix.matrix = values.size() == 20 ? values : filter::ColorMatrix::identity_matrix();
                }
                p.kind = matrix;
                break;
            }
            case dom::ElementKind::FeMorphology: {
                filter::Morphology morphology;
                morphology.input = input(child, "in");
                const std::string* op = child.find_attribute("operator");
                if (op && dom::trim(*op) == "dilate") {
                    morphology.op = filter::Morphology::Operator::Dilate;
                }
                std::vector<float> radius = number_list(child, "radius");
                if (radius.size() == 1) radius.push_back(radius[0]);
                if (radius.size() == 2) {
                    morphology.radius_x = radius[0] * sx;
                    morphology.radius_y = radius[1] * sy;
                }
                p.kind = morphology;
                break;
            }
            case dom::ElementKind::FeDisplacementMap: {
                filter::DisplacementMap map;
                map.input1 = input(child, "in");
                map.input2 = input(child, "in2");
                map.scale = number(child, "scale", 0) * std::sqrt(sx * sy);
                map.x_channel = channel(child, "xChannelSelector");
                map.y_channel = channel(child, "yChannelSelector");
                p.kind = map;
                break;
            }
            case dom::ElementKind::FeComponentTransfer: {
                filter::ComponentTransfer transfer;
                transfer.input = input(child, "in");
                child.for_each_element_child([&](const dom::Element& fn) {
                    switch (fn.kind()) {
                        case dom::ElementKind::FeFuncR: transfer.r = transfer_function(fn); break;
                        case dom::ElementKind::FeFuncG: transfer.g = transfer_function(fn); break;
                        case dom::ElementKind::FeFuncB: transfer.b = transfer_function(fn); break;
                        case dom::ElementKind::FeFuncA: transfer.a = transfer_function(fn); break;
                        default: break;
                    }
                });
                p.kind = transfer;
                break;
            }
            case dom::ElementKind::FeDropShadow: {
                filter::DropShadow shadow;
                shadow.input = input(child, "in");
                shadow.dx = number(child, "dx", 2) * sx;
                shadow.dy = number(child, "dy", 2) * sy;
                std::vector<float> sd = number_list(child, "stdDeviation");
                if (sd.size() == 1) sd.push_back(sd[0]);
                if (sd.size() == 2 && sd[0] >= 0 && sd[1] >= 0) {
                    shadow.std_dev_x = sd[0] * sx;
                    shadow.std_dev_y = sd[1] * sy;
                }
                flood_paint(pf, shadow.color, shadow.opacity);
                p.kind = shadow;
                break;
            }
            case dom::ElementKind::FeTile: {
                p.kind = filter::Tile{input(child, "in")};
                break;
            }
            default: {
                warn("filter", "filter primitive '" + child.tag_name() + "' is not supported");
                p.kind = filter::PassThrough{input(child, "in")};
                break;
            }
        }

        names.insert(p.result);
        previous = p.result;
        result.primitives.push_back(std::move(p));
    });

    if (result.primitives.empty()) return ResourceRef::unrenderable();

    tree_.filters.push_back(std::move(result));
    size_t index = tree_.filters.size() - 1;
    filter_cache_.emplace(key, index);
    return ResourceRef::found(index);
}

} // namespace tinta::normalize
