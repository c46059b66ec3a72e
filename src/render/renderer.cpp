#include <tinta/render/renderer.h>

#include <tinta/core/config.h>
#include <tinta/filter/pipeline.h>
#include <tinta/geom/stroke.h>
#include <tinta/render/compositor.h>
#include <tinta/render/rasterizer.h>
#include <tinta/render/render_cache.h>
#include <tinta/render/shader.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <functional>
#include <string>
#include <variant>

namespace tinta::render {

namespace {

constexpr const char* kModule = "render";
constexpr uint32_t kMaxTileSize = 4096;

struct Layer {
    Pixmap pixmap;
    int32_t x = 0;
    int32_t y = 0;
};

struct Context {
    Context(const tree::Tree& t, const RenderOptions& o) : tree(t), options(o) {}

    const tree::Tree& tree;
    const RenderOptions& options;
    RenderCache cache;
};

void render_group(Context& ctx, const tree::Group& group, const geom::Transform& ts, Pixmap& canvas);
void render_nodes(Context& ctx, const std::vector<tree::Node>& nodes, const geom::Transform& ts,
                  Pixmap& canvas);

// ---------------------------------------------------------------------------
// Paint
// ---------------------------------------------------------------------------

std::optional<Shader> pattern_shader(Context& ctx, const paint::PatternRef& ref, float opacity,
                                     const geom::Transform& ts) {
    if (ref.index >= ctx.tree.patterns.size()) return std::nullopt;
    const tree::Pattern& pattern = ctx.tree.patterns[ref.index];
    const geom::Rect& rect = pattern.rect;

    geom::Transform full = ts * pattern.transform;
    float sx = 0, sy = 0;
    full.get_scale(sx, sy);
    float fw = rect.width * sx;
    float fh = rect.height * sy;
    if (!(fw > 0) || !(fh > 0) || !std::isfinite(fw) || !std::isfinite(fh)) return std::nullopt;

    auto tw = static_cast<uint32_t>(std::clamp(std::ceil(fw), 1.0f, static_cast<float>(kMaxTileSize)));
    auto th = static_cast<uint32_t>(std::clamp(std::ceil(fh), 1.0f, static_cast<float>(kMaxTileSize)));

    RenderCache::Key key{ref.index, tw, th};
    std::shared_ptr<const Pixmap> tile = ctx.cache.find(key);
    if (!tile) {
        auto pixmap = Pixmap::create(tw, th);
        if (!pixmap) return std::nullopt;
        geom::Transform tile_ts = geom::Transform::scale(static_cast<float>(tw) / rect.width,
                                                         static_cast<float>(th) / rect.height);
        render_group(ctx, pattern.root, tile_ts, *pixmap);
        tile = ctx.cache.insert(key, std::make_shared<const Pixmap>(std::move(*pixmap)));
    }

    geom::Transform tile_to_device = full * geom::Transform::translate(rect.x, rect.y) *
                                     geom::Transform::scale(rect.width / static_cast<float>(tw),
                                                            rect.height / static_cast<float>(th));
    auto inverse = tile_to_device.invert();
    if (!inverse) return std::nullopt;
    return Shader::pattern(std::move(tile), opacity, *inverse);
}

std::optional<Shader> make_shader(Context& ctx, const paint::Paint& paint, float opacity,
                                  const geom::Transform& ts) {
    if (const auto* color = std::get_if<paint::Color>(&paint)) return Shader::solid(*color, opacity);
    if (const auto* linear = std::get_if<paint::LinearGradient>(&paint)) {
        return Shader::linear(*linear, opacity, ts);
    }
    if (const auto* radial = std::get_if<paint::RadialGradient>(&paint)) {
        return Shader::radial(*radial, opacity, ts);
    }
    return pattern_shader(ctx, std::get<paint::PatternRef>(paint), opacity, ts);
}

// ---------------------------------------------------------------------------
// Leaves
// ---------------------------------------------------------------------------

void render_path(Context& ctx, const tree::Path& path, const geom::Transform& ts, Pixmap& canvas) {
    if (!path.visible) return;
    bool anti_alias = path.anti_alias();

    auto fill = [&]() {
        if (!path.fill) return;
        auto coverage = rasterize(path.data, ts, path.fill->rule, anti_alias, canvas.rect());
        if (!coverage) return;
        auto shader = make_shader(ctx, path.fill->paint, path.fill->opacity, ts);
        if (shader) fill_coverage(canvas, *coverage, *shader);
    };

    auto stroke = [&]() {
        if (!path.stroke) return;
        auto outline = geom::stroke_to_path(path.data, path.stroke->style, ts,
                                            core::config::kFlattenTolerance);
        if (!outline) return;
        auto coverage = rasterize(*outline, geom::Transform::identity(), tree::FillRule::NonZero,
                                  anti_alias, canvas.rect());
        if (!coverage) return;
        auto shader = make_shader(ctx, path.stroke->paint, path.stroke->opacity, ts);
        if (shader) fill_coverage(canvas, *coverage, *shader);
    };

    if (path.paint_order == tree::PaintOrder::FillAndStroke) {
        fill();
        stroke();
    } else {
        stroke();
        fill();
    }
}

void render_image(const tree::Image& image, const geom::Transform& ts, Pixmap& canvas) {
    if (!image.visible || !image.data) return;

    geom::PathBuilder builder;
    builder.push_rect(image.clip);
    auto clip = builder.finish();
    if (!clip) return;
    auto coverage = rasterize(*clip, ts, tree::FillRule::NonZero, true, canvas.rect());
    if (!coverage) return;

    auto inverse = (ts * image.view_transform).invert();
    if (!inverse) return;
    Shader shader = Shader::image(image.data, *inverse,
                                  image.rendering_mode == tree::ImageRendering::OptimizeQuality);
    fill_coverage(canvas, *coverage, shader);
}

// ---------------------------------------------------------------------------
// Clipping and masking
// ---------------------------------------------------------------------------

void apply_clip(Context& ctx, size_t index, const geom::Transform& ts, Pixmap& layer, int depth) {
    if (index >= ctx.tree.clip_paths.size()) return;
    if (depth > core::config::kMaxNestedClipDepth) {
        core::warn(ctx.options.diagnostics, kModule, "clip", "clip-path nesting too deep");
        return;
    }
    const tree::ClipPath& clip = ctx.tree.clip_paths[index];

    auto mask = Pixmap::create(layer.width(), layer.height());
    if (!mask) return;
    render_group(ctx, clip.root, ts * clip.transform, *mask);
    if (clip.clip_path) apply_clip(ctx, *clip.clip_path, ts, *mask, depth + 1);
    apply_mask_values(layer, mask_values(*mask, tree::MaskType::Alpha));
}

void apply_mask(Context& ctx, size_t index, const geom::Transform& ts, Pixmap& layer, int depth) {
    if (index >= ctx.tree.masks.size()) return;
    if (depth > core::config::kMaxNestedClipDepth) {
        core::warn(ctx.options.diagnostics, kModule, "mask", "mask nesting too deep");
        return;
    }
    const tree::Mask& mask = ctx.tree.masks[index];

    auto content = Pixmap::create(layer.width(), layer.height());
    if (!content) return;
    render_group(ctx, mask.root, ts, *content);

    std::vector<uint8_t> region(static_cast<size_t>(layer.width()) * layer.height(), 0);
    geom::PathBuilder builder;
    builder.push_rect(mask.rect);
    if (auto rect = builder.finish()) {
        if (auto coverage = rasterize(*rect, ts, tree::FillRule::NonZero, true, content->rect())) {
            for (int32_t y = coverage->rect.y; y < coverage->rect.bottom(); ++y) {
                for (int32_t x = coverage->rect.x; x < coverage->rect.right(); ++x) {
                    region[static_cast<size_t>(y) * layer.width() + static_cast<size_t>(x)] =
                        coverage->at(x, y);
                }
            }
        }
    }
    apply_mask_values(*content, region);

    if (mask.mask) apply_mask(ctx, *mask.mask, ts, *content, depth + 1);
    apply_mask_values(layer, mask_values(*content, mask.kind));
}

// ---------------------------------------------------------------------------
// Groups
// ---------------------------------------------------------------------------

// Renders an isolated group into its own layer, with filters, clip-path
// and mask applied, ready to be composited.
std::optional<Layer> prepare_layer(Context& ctx, const tree::Group& group, const geom::Transform& ts,
                                   const geom::IntRect& canvas_rect) {
    if (!group.layer_bounding_box) return std::nullopt;
    geom::Transform inner = ts * group.transform;
    auto device = geom::round_out(group.layer_bounding_box->transformed(inner));
    if (!device) return std::nullopt;

    geom::IntRect limit = canvas_rect;
    if (!group.filters.empty()) {
        // Filters may pull in content from outside the visible area.
        limit = {canvas_rect.x - 2 * canvas_rect.width, canvas_rect.y - 2 * canvas_rect.height,
                 5 * canvas_rect.width, 5 * canvas_rect.height};
    }
    auto area = device->intersected(limit);
    if (!area) return std::nullopt;

    auto pixmap = Pixmap::create(static_cast<uint32_t>(area->width), static_cast<uint32_t>(area->height));
    if (!pixmap) {
        core::warn(ctx.options.diagnostics, kModule, "layer",
                   "layer of " + std::to_string(area->width) + "x" + std::to_string(area->height) +
                       " pixels skipped");
        return std::nullopt;
    }

    geom::Transform layer_ts = geom::Transform::translate(static_cast<float>(-area->x),
                                                          static_cast<float>(-area->y)) * inner;
    render_nodes(ctx, group.children, layer_ts, *pixmap);

    for (size_t index : group.filters) {
        if (index >= ctx.tree.filters.size()) continue;
        filter::apply(ctx.tree.filters[index], layer_ts, *pixmap, ctx.options.pool,
                      ctx.options.diagnostics);
    }
    if (group.clip_path) apply_clip(ctx, *group.clip_path, layer_ts, *pixmap, 0);
    if (group.mask) apply_mask(ctx, *group.mask, layer_ts, *pixmap, 0);

    return Layer{std::move(*pixmap), area->x, area->y};
}

void render_group(Context& ctx, const tree::Group& group, const geom::Transform& ts, Pixmap& canvas) {
    if (!group.should_isolate()) {
        render_nodes(ctx, group.children, ts * group.transform, canvas);
        return;
    }
    auto layer = prepare_layer(ctx, group, ts, canvas.rect());
    if (layer) draw_layer(canvas, layer->pixmap, layer->x, layer->y, group.opacity, group.blend_mode);
}

void render_node(Context& ctx, const tree::Node& node, const geom::Transform& ts, Pixmap& canvas) {
    if (const tree::Group* group = node.as_group()) {
        render_group(ctx, *group, ts, canvas);
    } else if (const tree::Path* path = node.as_path()) {
        render_path(ctx, *path, ts, canvas);
    } else if (const tree::Image* image = node.as_image()) {
        render_image(*image, ts, canvas);
    } else if (const tree::Text* text = node.as_text()) {
        render_group(ctx, text->flattened, ts, canvas);
    }
}

bool is_isolated_group(const tree::Node& node) {
    const tree::Group* group = node.as_group();
    return group && group->should_isolate();
}

void render_nodes(Context& ctx, const std::vector<tree::Node>& nodes, const geom::Transform& ts,
                  Pixmap& canvas) {
    size_t i = 0;
    while (i < nodes.size()) {
        size_t run_end = i;
        if (ctx.options.pool) {
            while (run_end < nodes.size() && is_isolated_group(nodes[run_end])) ++run_end;
        }
        if (run_end - i < 2) {
            render_node(ctx, nodes[i], ts, canvas);
            ++i;
            continue;
        }

        // Sibling layers are independent until composited, in order.
        geom::IntRect bounds = canvas.rect();
        std::vector<std::optional<Layer>> layers(run_end - i);
        std::vector<std::function<void()>> jobs;
        for (size_t k = i; k < run_end; ++k) {
            jobs.push_back([&ctx, &nodes, &layers, &ts, bounds, i, k]() {
                layers[k - i] = prepare_layer(ctx, *nodes[k].as_group(), ts, bounds);
            });
        }
        ctx.options.pool->run_all(std::move(jobs));

        for (size_t k = i; k < run_end; ++k) {
            const tree::Group& group = *nodes[k].as_group();
            if (const auto& layer = layers[k - i]) {
                draw_layer(canvas, layer->pixmap, layer->x, layer->y, group.opacity, group.blend_mode);
            }
        }
        i = run_end;
    }
}

} // namespace

void render(const tree::Tree& tree, const geom::Transform& ts, Pixmap& pixmap,
            const RenderOptions& options) {
    if (pixmap.is_empty()) return;
    Context ctx(tree, options);
    render_group(ctx, tree.root, ts, pixmap);
}

RenderResult render(const tree::Tree& tree, uint32_t width, uint32_t height,
                    const paint::Color& background, const RenderOptions& options) {
    RenderResult result;
    auto pixmap = Pixmap::create(width, height);
    if (!pixmap) {
        result.error = "cannot allocate a " + std::to_string(width) + "x" + std::to_string(height) +
                       " pixmap";
        if (options.diagnostics) options.diagnostics->error(kModule, "target", result.error);
        return result;
    }
    if (!(tree.size.width > 0) || !(tree.size.height > 0)) {
        result.error = "tree has an empty size";
        if (options.diagnostics) options.diagnostics->error(kModule, "target", result.error);
        return result;
    }
    pixmap->fill(background);

    geom::Transform ts = geom::Transform::scale(static_cast<float>(width) / tree.size.width,
                                                static_cast<float>(height) / tree.size.height);
    try {
        render(tree, ts, *pixmap, options);
    } catch (const std::exception& e) {
        result.error = e.what();
        if (options.diagnostics) options.diagnostics->error(kModule, "render", result.error);
        return result;
    }

    result.pixmap = std::move(*pixmap);
    result.success = true;
    return result;
}

std::optional<Pixmap> render_node(const tree::Tree& tree, std::string_view id,
                                  const geom::Transform& ts, const RenderOptions& options) {
    const tree::Node* node = tree.node_by_id(id);
    if (!node) return std::nullopt;

    auto own = node->transform().invert();
    if (!own) return std::nullopt;
    geom::Transform parent_abs = node->abs_transform() * *own;

    std::optional<geom::Rect> bbox;
    if (const tree::Group* group = node->as_group()) {
        bbox = group->abs_layer_bounding_box;
    } else {
        bbox = node->abs_stroke_bounding_box();
    }
    if (!bbox) return std::nullopt;
    auto device = geom::round_out(bbox->transformed(ts));
    if (!device) return std::nullopt;

    auto pixmap = Pixmap::create(static_cast<uint32_t>(device->width),
                                 static_cast<uint32_t>(device->height));
    if (!pixmap) return std::nullopt;

    geom::Transform node_ts = geom::Transform::translate(static_cast<float>(-device->x),
                                                         static_cast<float>(-device->y)) *
                              ts * parent_abs;
    Context ctx(tree, options);
    render_node(ctx, *node, node_ts, *pixmap);
    return pixmap;
}

} // namespace tinta::render
