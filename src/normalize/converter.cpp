#include "converter.h"

#include <tinta/core/config.h>

#include <algorithm>
#include <cmath>

namespace tinta::normalize {

namespace {

constexpr const char* kModule = "normalize";

bool is_keyword(const std::string* value, std::string_view keyword) {
    return value && dom::trim(*value) == keyword;
}

geom::Transform element_transform(const Frame& frame) {
    auto it = frame.props().find("transform");
    const std::string* value = it != frame.props().end() ? &it->second : frame.attribute("transform");
    if (!value) return {};
    auto ts = dom::parse_transform(*value);
    return ts ? *ts : geom::Transform{};
}

bool renders_content(dom::ElementKind kind) {
    using K = dom::ElementKind;
    return kind == K::G || kind == K::Svg || kind == K::Use || kind == K::Image ||
           kind == K::Text || dom::is_shape(kind);
}

bool is_plain(const tree::Group& g) {
    return g.transform.is_identity() && g.opacity == 1 &&
           g.blend_mode == paint::BlendMode::Normal && !g.isolate && !g.clip_path && !g.mask &&
           g.filters.empty();
}

// Moves `g` into `out`, dropping the wrapper when it carries nothing.
void emit_group(tree::Group&& g, tree::Group& out) {
    if (is_plain(g)) {
        if (g.id.empty()) {
            for (auto& child : g.children) out.children.push_back(std::move(child));
            return;
        }
        if (g.children.size() == 1) {
            tree::Node& only = g.children.front();
            std::string* leaf_id = nullptr;
            if (auto* p = std::get_if<tree::Path>(&only.kind)) leaf_id = &p->id;
            else if (auto* i = std::get_if<tree::Image>(&only.kind)) leaf_id = &i->id;
            else if (auto* t = std::get_if<tree::Text>(&only.kind)) leaf_id = &t->id;
            if (leaf_id && leaf_id->empty()) {
                *leaf_id = g.id;
                out.children.push_back(std::move(only));
                return;
            }
        }
    }
    out.children.emplace_back(std::move(g));
}

} // namespace

Converter::Converter(const dom::Document& document, const Options& options)
    : document_(document),
      index_(document.build_index()),
      options_(options),
      cascade_(document_, index_) {}

std::optional<tree::Tree> Converter::run() {
    const dom::Element* root = document_.root();
    if (!root || root->kind() != dom::ElementKind::Svg) {
        if (options_.diagnostics) {
            options_.diagnostics->error(kModule, "root", "document root is not an svg element");
        }
        return std::nullopt;
    }

    Frame frame = make_frame(*root, nullptr);

    std::optional<geom::Rect> view_box;
    if (const std::string* vb = frame.attribute("viewBox")) view_box = dom::parse_view_box(*vb);

    geom::Size fallback = options_.default_size.value_or(
        geom::Size{core::config::kDefaultDocumentWidth, core::config::kDefaultDocumentHeight});
    if (view_box) fallback = {view_box->width, view_box->height};

    auto dimension = [&](std::string_view name, Axis axis, float base) -> std::optional<float> {
        const std::string* value = frame.attribute(name);
        if (!value) return std::nullopt;
        auto len = dom::parse_length(*value);
        if (!len) return std::nullopt;
        if (len->unit == dom::LengthUnit::Percent) return base * len->value / 100;
        return to_user(*len, axis, frame, options_.dpi);
    };

    std::optional<float> width = dimension("width", Axis::X, fallback.width);
    std::optional<float> height = dimension("height", Axis::Y, fallback.height);
    if (view_box && width && !height) height = *width * view_box->height / view_box->width;
    if (view_box && height && !width) width = *height * view_box->width / view_box->height;
    geom::Size size{width.value_or(fallback.width), height.value_or(fallback.height)};

    if (!(size.width > 0) || !(size.height > 0) || !std::isfinite(size.width) ||
        !std::isfinite(size.height)) {
        if (options_.diagnostics) {
            options_.diagnostics->error(kModule, "root", "document size is not positive");
        }
        return std::nullopt;
    }

    tree_.size = size;
    tree_.view_box = view_box.value_or(geom::Rect{0, 0, size.width, size.height});
    if (view_box) {
        dom::AspectRatio ar;
        if (const std::string* par = frame.attribute("preserveAspectRatio")) {
            ar = dom::parse_aspect_ratio(*par).value_or(dom::AspectRatio{});
        }
        tree_.root.transform = dom::view_box_transform(*view_box, ar, size);
    }
    root_viewport_ = {tree_.view_box.width, tree_.view_box.height};
    frame.set_viewport(root_viewport_);

    Context ctx;
    tree::Group body;
    apply_group_style(frame, ctx, body);
    convert_children(*root, frame, ctx, body);
    if (finish_group(frame, ctx, body)) emit_group(std::move(body), tree_.root);

    tree::normalize(tree_);
    return std::move(tree_);
}

Frame Converter::make_frame(const dom::Element& element, const Frame* parent) {
    return Frame(element, cascade_.declared(element), parent, options_.font_size, options_.dpi);
}

std::unique_ptr<FrameChain> Converter::dom_chain(const dom::Element& element) {
    std::vector<const dom::Element*> path;
    for (const dom::Element* e = &element; e; e = e->parent()) path.push_back(e);

    auto chain = std::make_unique<FrameChain>();
    for (auto it = path.rbegin(); it != path.rend(); ++it) {
        const Frame* parent = chain->frames.empty() ? nullptr : &chain->frames.back();
        chain->frames.push_back(make_frame(**it, parent));
        if (!parent) chain->frames.back().set_viewport(root_viewport_);
    }
    return chain;
}

void Converter::convert_children(const dom::Element& parent, const Frame& frame,
                                 const Context& ctx, tree::Group& out) {
    parent.for_each_element_child(
        [&](const dom::Element& child) { convert_element(child, frame, ctx, out); });
}

void Converter::apply_group_style(const Frame& frame, const Context& ctx, tree::Group& g) {
    g.id = frame.element().id();
    if (ctx.in_clip) return;
    g.opacity = parse_opacity(frame.find("opacity"));
    if (const std::string* mode = frame.find("mix-blend-mode")) {
        if (auto blend = paint::blend_mode_from_name(dom::trim(*mode))) {
            g.blend_mode = *blend;
        } else {
            warn("style", "unknown mix-blend-mode '" + *mode + "'");
        }
    }
    g.isolate = is_keyword(frame.find("isolation"), "isolate");
}

bool Converter::finish_group(const Frame& frame, const Context& ctx, tree::Group& g) {
    const std::string* clip_value = frame.find("clip-path");
    bool wants_clip = clip_value && !is_keyword(clip_value, "none");
    bool wants_mask = !ctx.in_clip && frame.find("mask") && !is_keyword(frame.find("mask"), "none");
    bool wants_filter =
        !ctx.in_clip && frame.find("filter") && !is_keyword(frame.find("filter"), "none");

    std::optional<geom::Rect> bbox;
    if (wants_clip || wants_mask || wants_filter) {
        tree::calculate_bounding_boxes(g, tree_);
        bbox = g.bounding_box;
    }

    if (wants_filter) {
        for (const ResourceRef& ref : resolve_filters(frame, bbox)) {
            if (ref.status == ResourceRef::Status::Unrenderable) return false;
            if (ref.status == ResourceRef::Status::Found) g.filters.push_back(ref.index);
        }
    }

    if (g.children.empty() && g.filters.empty()) return false;

    if (wants_clip) {
        ResourceRef ref = resolve_clip_path(frame, bbox);
        if (ref.status == ResourceRef::Status::Unrenderable) return false;
        if (ref.status == ResourceRef::Status::Found) g.clip_path = ref.index;
    }
    if (wants_mask) {
        ResourceRef ref = resolve_mask(frame, bbox);
        if (ref.status == ResourceRef::Status::Unrenderable) return false;
        if (ref.status == ResourceRef::Status::Found) g.mask = ref.index;
    }
    return true;
}

void Converter::convert_element(const dom::Element& element, const Frame& parent,
                                const Context& ctx, tree::Group& out) {
    dom::ElementKind kind = element.kind();
    if (dom::is_non_rendering(kind) || !renders_content(kind)) return;
    if (ctx.in_clip && !(dom::is_shape(kind) || kind == dom::ElementKind::Text ||
                         kind == dom::ElementKind::Use)) {
        return;
    }

    Frame frame = make_frame(element, &parent);
    if (is_keyword(frame.find("display"), "none")) return;

    geom::Transform ts = element_transform(frame);
    if (!ts.is_invertible()) return;

    tree::Group g;
    apply_group_style(frame, ctx, g);
    g.transform = ts;

    switch (kind) {
        case dom::ElementKind::G: convert_children(element, frame, ctx, g); break;
        case dom::ElementKind::Svg: convert_nested_svg(frame, ctx, g); break;
        case dom::ElementKind::Use: convert_use(frame, ctx, g); break;
        case dom::ElementKind::Image:
            if (!ctx.in_clip) convert_image(frame, g);
            break;
        case dom::ElementKind::Text: convert_text(frame, ctx, g); break;
        default: convert_shape(frame, ctx, g); break;
    }

    if (finish_group(frame, ctx, g)) emit_group(std::move(g), out);
}

const dom::Element* Converter::href_target(const dom::Element& element) const {
    const std::string* href = element.find_attribute("href");
    if (!href) href = element.find_attribute("xlink:href");
    if (!href) return nullptr;
    auto id = dom::parse_iri(*href);
    if (!id) return nullptr;
    return index_.get_element_by_id(*id);
}

std::vector<const dom::Element*> Converter::href_chain(const dom::Element& element) {
    std::vector<const dom::Element*> chain{&element};
    while (chain.size() < static_cast<size_t>(core::config::kMaxHrefChain)) {
        const dom::Element* next = href_target(*chain.back());
        if (!next) break;
        if (std::find(chain.begin(), chain.end(), next) != chain.end()) {
            warn("reference", "href cycle through '" + next->id() + "'");
            break;
        }
        chain.push_back(next);
    }
    return chain;
}

float Converter::length_attr(const Frame& frame, std::string_view name, Axis axis,
                             float fallback) const {
    return parse_user_length(frame.attribute(name), axis, frame, options_.dpi, fallback);
}

void Converter::warn(const std::string& stage, const std::string& message) {
    core::warn(options_.diagnostics, kModule, stage, message);
}

size_t Converter::add_rect_clip(const geom::Rect& rect) {
    geom::PathBuilder builder;
    builder.push_rect(rect);

    tree::ClipPath clip;
    if (auto data = builder.finish()) {
        tree::Path path;
        path.fill = tree::Fill{};
        path.data = std::move(*data);
        clip.root.children.emplace_back(std::move(path));
    }
    tree_.clip_paths.push_back(std::move(clip));
    return tree_.clip_paths.size() - 1;
}

Converter::ResourceKey Converter::make_key(const dom::Element* element,
                                           const std::optional<geom::Rect>& bbox) {
    if (!bbox) return {element, false, 0, 0, 0, 0};
    return {element, true, bbox->x, bbox->y, bbox->width, bbox->height};
}

bool Converter::begin_resolving(const dom::Element& element) {
    ResolveState& state = states_[&element];
    if (state == ResolveState::Resolving) {
        warn("reference", "reference cycle through '" + element.id() + "'");
        return false;
    }
    state = ResolveState::Resolving;
    return true;
}

void Converter::end_resolving(const dom::Element& element) {
    states_[&element] = ResolveState::Resolved;
}

} // namespace tinta::normalize
