#include <tinta/tree/tree.h>
#include <tinta/core/config.h>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace tinta::tree {

// ---------------------------------------------------------------------------
// Node accessors
// ---------------------------------------------------------------------------

bool Group::should_isolate() const {
    return isolate || opacity != 1.0f || clip_path.has_value() || mask.has_value() ||
           !filters.empty() || blend_mode != paint::BlendMode::Normal;
}

const std::string& Node::id() const {
    return std::visit([](const auto& n) -> const std::string& { return n.id; }, kind);
}

const geom::Transform& Node::abs_transform() const {
    return std::visit([](const auto& n) -> const geom::Transform& { return n.abs_transform; },
                      kind);
}

geom::Transform Node::transform() const {
    if (const Group* g = as_group()) return g->transform;
    return geom::Transform::identity();
}

std::optional<geom::Rect> Node::bounding_box() const {
    return std::visit([](const auto& n) { return n.bounding_box; }, kind);
}

std::optional<geom::Rect> Node::abs_bounding_box() const {
    return std::visit([](const auto& n) { return n.abs_bounding_box; }, kind);
}

std::optional<geom::Rect> Node::stroke_bounding_box() const {
    return std::visit(
        [](const auto& n) -> std::optional<geom::Rect> {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, Image>) {
                return n.bounding_box;
            } else {
                return n.stroke_bounding_box;
            }
        },
        kind);
}

std::optional<geom::Rect> Node::abs_stroke_bounding_box() const {
    return std::visit(
        [](const auto& n) -> std::optional<geom::Rect> {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, Image>) {
                return n.abs_bounding_box;
            } else {
                return n.abs_stroke_bounding_box;
            }
        },
        kind);
}

// ---------------------------------------------------------------------------
// Lookup
// ---------------------------------------------------------------------------

namespace {

const Node* find_in(const Group& group, std::string_view id) {
    for (const auto& child : group.children) {
        if (child.id() == id) return &child;
        if (const Group* g = child.as_group()) {
            if (const Node* found = find_in(*g, id)) return found;
        }
    }
    return nullptr;
}

} // namespace

const Node* Tree::node_by_id(std::string_view id) const {
    if (id.empty()) return nullptr;
    if (const Node* n = find_in(root, id)) return n;
    for (const auto& clip : clip_paths) {
        if (const Node* n = find_in(clip.root, id)) return n;
    }
    for (const auto& mask : masks) {
        if (const Node* n = find_in(mask.root, id)) return n;
    }
    for (const auto& pattern : patterns) {
        if (const Node* n = find_in(pattern.root, id)) return n;
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// Transforms and bounding boxes
// ---------------------------------------------------------------------------

void calculate_abs_transforms(Group& group, const geom::Transform& parent_abs) {
    group.abs_transform = parent_abs * group.transform;
    for (auto& child : group.children) {
        std::visit(
            [&group](auto& n) {
                using T = std::decay_t<decltype(n)>;
                if constexpr (std::is_same_v<T, Group>) {
                    calculate_abs_transforms(n, group.abs_transform);
                } else if constexpr (std::is_same_v<T, Text>) {
                    n.abs_transform = group.abs_transform;
                    calculate_abs_transforms(n.flattened, group.abs_transform);
                } else {
                    n.abs_transform = group.abs_transform;
                }
            },
            child.kind);
    }
}

namespace {

std::optional<geom::Rect> transformed(const std::optional<geom::Rect>& r,
                                      const geom::Transform& ts) {
    if (!r) return std::nullopt;
    return r->transformed(ts);
}

void extend_opt(std::optional<geom::Rect>& acc, const std::optional<geom::Rect>& r) {
    if (r) geom::extend(acc, *r);
}

std::optional<geom::Rect> stroked_bounds(const geom::Path& data, const Stroke& stroke,
                                         const geom::Transform& ts) {
    auto outline = geom::stroke_to_path(data, stroke.style, ts, core::config::kFlattenTolerance);
    if (!outline) return std::nullopt;
    return outline->bounds();
}

void calculate_path(Path& path) {
    path.bounding_box = path.data.bounds();
    path.abs_bounding_box = path.data.transformed(path.abs_transform).bounds();
    path.stroke_bounding_box = path.bounding_box;
    path.abs_stroke_bounding_box = path.abs_bounding_box;
    if (path.stroke) {
        extend_opt(path.stroke_bounding_box,
                   stroked_bounds(path.data, *path.stroke, geom::Transform::identity()));
        extend_opt(path.abs_stroke_bounding_box,
                   stroked_bounds(path.data, *path.stroke, path.abs_transform));
    }
}

void calculate_image(Image& image) {
    if (!image.data) {
        image.bounding_box.reset();
        image.abs_bounding_box.reset();
        return;
    }
    geom::Rect pixels{0, 0, static_cast<float>(image.data->width),
                      static_cast<float>(image.data->height)};
    geom::Rect drawn = pixels.transformed(image.view_transform);
    auto clipped = drawn.intersected(image.clip);
    image.bounding_box = clipped;
    image.abs_bounding_box = transformed(clipped, image.abs_transform);
}

} // namespace

void calculate_bounding_boxes(Group& group, const Tree& tree) {
    group.bounding_box.reset();
    group.stroke_bounding_box.reset();
    group.layer_bounding_box.reset();
    group.abs_bounding_box.reset();
    group.abs_stroke_bounding_box.reset();
    group.abs_layer_bounding_box.reset();

    std::optional<geom::Rect> layer;
    for (auto& child : group.children) {
        if (Group* g = child.as_group()) {
            calculate_bounding_boxes(*g, tree);
            extend_opt(group.bounding_box, transformed(g->bounding_box, g->transform));
            extend_opt(group.stroke_bounding_box, transformed(g->stroke_bounding_box, g->transform));
            extend_opt(layer, transformed(g->layer_bounding_box, g->transform));
            extend_opt(group.abs_bounding_box, g->abs_bounding_box);
            extend_opt(group.abs_stroke_bounding_box, g->abs_stroke_bounding_box);
        } else if (Path* p = child.as_path()) {
            calculate_path(*p);
            extend_opt(group.bounding_box, p->bounding_box);
            extend_opt(group.stroke_bounding_box, p->stroke_bounding_box);
            extend_opt(layer, p->stroke_bounding_box);
            extend_opt(group.abs_bounding_box, p->abs_bounding_box);
            extend_opt(group.abs_stroke_bounding_box, p->abs_stroke_bounding_box);
        } else if (auto* image = std::get_if<Image>(&child.kind)) {
            calculate_image(*image);
            extend_opt(group.bounding_box, image->bounding_box);
            extend_opt(group.stroke_bounding_box, image->bounding_box);
            extend_opt(layer, image->bounding_box);
            extend_opt(group.abs_bounding_box, image->abs_bounding_box);
            extend_opt(group.abs_stroke_bounding_box, image->abs_bounding_box);
        } else if (auto* text = std::get_if<Text>(&child.kind)) {
            calculate_bounding_boxes(text->flattened, tree);
            text->bounding_box = transformed(text->flattened.bounding_box, text->flattened.transform);
            text->stroke_bounding_box =
                transformed(text->flattened.stroke_bounding_box, text->flattened.transform);
            text->abs_bounding_box = text->flattened.abs_bounding_box;
            text->abs_stroke_bounding_box = text->flattened.abs_stroke_bounding_box;
            extend_opt(group.bounding_box, text->bounding_box);
            extend_opt(group.stroke_bounding_box, text->stroke_bounding_box);
            extend_opt(layer, transformed(text->flattened.layer_bounding_box,
                                          text->flattened.transform));
            extend_opt(group.abs_bounding_box, text->abs_bounding_box);
            extend_opt(group.abs_stroke_bounding_box, text->abs_stroke_bounding_box);
        }
    }

    if (!group.filters.empty()) {
        // A filter paints its whole region, even with no children.
        layer.reset();
        for (size_t index : group.filters) {
            if (index < tree.filters.size()) geom::extend(layer, tree.filters[index].rect);
        }
    }
    group.layer_bounding_box = layer;
    group.abs_layer_bounding_box = transformed(layer, group.abs_transform);
}

// ---------------------------------------------------------------------------
// Normalization passes
// ---------------------------------------------------------------------------

namespace {

void remove_empty_groups(Group& group) {
    for (auto& child : group.children) {
        if (Group* g = child.as_group()) remove_empty_groups(*g);
    }
    group.children.erase(
        std::remove_if(group.children.begin(), group.children.end(),
                       [](const Node& n) {
                           const Group* g = n.as_group();
                           return g && g->children.empty() && g->filters.empty();
                       }),
        group.children.end());
}

} // namespace

void normalize(Tree& tree) {
    remove_empty_groups(tree.root);
    calculate_abs_transforms(tree.root, geom::Transform::identity());
    calculate_bounding_boxes(tree.root, tree);

    for (auto& clip : tree.clip_paths) {
        remove_empty_groups(clip.root);
        calculate_abs_transforms(clip.root, geom::Transform::identity());
        calculate_bounding_boxes(clip.root, tree);
    }
    for (auto& mask : tree.masks) {
        remove_empty_groups(mask.root);
        calculate_abs_transforms(mask.root, geom::Transform::identity());
        calculate_bounding_boxes(mask.root, tree);
    }
    for (auto& pattern : tree.patterns) {
        remove_empty_groups(pattern.root);
        calculate_abs_transforms(pattern.root, geom::Transform::identity());
        calculate_bounding_boxes(pattern.root, tree);
    }
}

// ---------------------------------------------------------------------------
// Debug dump
// ---------------------------------------------------------------------------

namespace {

void write_ts(std::ostream& out, const geom::Transform& ts) {
    out << "(" << ts.a << " " << ts.b << " " << ts.tx << " " << ts.c << " " << ts.d << " "
        << ts.ty << ")";
}

void write_rect(std::ostream& out, const std::optional<geom::Rect>& r) {
    if (!r) {
        out << "none";
        return;
    }
    out << "(" << r->x << " " << r->y << " " << r->width << " " << r->height << ")";
}

void write_paint(std::ostream& out, const paint::Paint& p) {
    std::visit(
        [&out](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, paint::Color>) {
                out << "rgba(" << int(v.r) << "," << int(v.g) << "," << int(v.b) << ","
                    << int(v.a) << ")";
            } else if constexpr (std::is_same_v<T, paint::PatternRef>) {
                out << "pattern#" << v.index;
            } else {
                out << (std::is_same_v<T, paint::LinearGradient> ? "linear" : "radial") << "["
                    << v.stops.size() << " stops] ";
                write_ts(out, v.transform);
            }
        },
        p);
}

void write_group(std::ostream& out, const Group& group, int depth);

void write_node(std::ostream& out, const Node& node, int depth) {
    std::string indent(static_cast<size_t>(depth) * 2, ' ');
    if (const Group* g = node.as_group()) {
        write_group(out, *g, depth);
    } else if (const Path* p = node.as_path()) {
        out << indent << "path id=" << p->id << " verbs=" << p->data.verbs().size();
        if (p->fill) {
            out << " fill=";
            write_paint(out, p->fill->paint);
            out << " fill-opacity=" << p->fill->opacity
                << (p->fill->rule == FillRule::EvenOdd ? " evenodd" : " nonzero");
        }
        if (p->stroke) {
            out << " stroke=";
            write_paint(out, p->stroke->paint);
            out << " width=" << p->stroke->style.width;
        }
        if (!p->visible) out << " hidden";
        out << " bbox=";
        write_rect(out, p->bounding_box);
        out << " abs=";
        write_rect(out, p->abs_bounding_box);
        out << "\n";
    } else if (const Image* image = node.as_image()) {
        out << indent << "image id=" << image->id << " size="
            << (image->data ? image->data->width : 0) << "x"
            << (image->data ? image->data->height : 0) << " bbox=";
        write_rect(out, image->bounding_box);
        out << "\n";
    } else if (const Text* text = node.as_text()) {
        out << indent << "text id=" << text->id << " \"" << text->content << "\" bbox=";
        write_rect(out, text->bounding_box);
        out << "\n";
        write_group(out, text->flattened, depth + 1);
    }
}

void write_group(std::ostream& out, const Group& group, int depth) {
    std::string indent(static_cast<size_t>(depth) * 2, ' ');
    out << indent << "group id=" << group.id << " ts=";
    write_ts(out, group.transform);
    out << " opacity=" << group.opacity << " blend=" << paint::blend_mode_name(group.blend_mode);
    if (group.isolate) out << " isolate";
    if (group.clip_path) out << " clip=" << *group.clip_path;
    if (group.mask) out << " mask=" << *group.mask;
    for (size_t f : group.filters) out << " filter=" << f;
    out << " bbox=";
    write_rect(out, group.bounding_box);
    out << " layer=";
    write_rect(out, group.layer_bounding_box);
    out << "\n";
    for (const auto& child : group.children) write_node(out, child, depth + 1);
}

} // namespace

std::string dump(const Tree& tree) {
    std::ostringstream out;
    out << std::setprecision(6);
    out << "tree size=" << tree.size.width << "x" << tree.size.height << " view_box=";
    write_rect(out, tree.view_box);
    out << "\n";
    write_group(out, tree.root, 0);
    for (size_t i = 0; i < tree.clip_paths.size(); i++) {
        out << "clip " << i << " id=" << tree.clip_paths[i].id << " ts=";
        write_ts(out, tree.clip_paths[i].transform);
        out << "\n";
        write_group(out, tree.clip_paths[i].root, 1);
    }
    for (size_t i = 0; i < tree.masks.size(); i++) {
        out << "mask " << i << " id=" << tree.masks[i].id << " rect=";
        write_rect(out, tree.masks[i].rect);
        out << "\n";
        write_group(out, tree.masks[i].root, 1);
    }
    for (size_t i = 0; i < tree.patterns.size(); i++) {
        out << "pattern " << i << " id=" << tree.patterns[i].id << " rect=";
        write_rect(out, tree.patterns[i].rect);
        out << "\n";
        write_group(out, tree.patterns[i].root, 1);
    }
    for (size_t i = 0; i < tree.filters.size(); i++) {
        out << "filter " << i << " id=" << tree.filters[i].id << " primitives="
            << tree.filters[i].primitives.size() << " rect=";
        write_rect(out, tree.filters[i].rect);
        out << "\n";
    }
    return out.str();
}

} // namespace tinta::tree
