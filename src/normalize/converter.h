#pragma once
#include <tinta/dom/document.h>
#include <tinta/dom/value_parser.h>
#include <tinta/normalize/options.h>
#include <tinta/normalize/style.h>
#include <tinta/normalize/units.h>
#include <tinta/tree/tree.h>

#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace tinta::normalize {

// Per-definition walk state. A definition revisited while Resolving is
// part of a reference cycle and is treated as missing.
enum class ResolveState { Pending, Resolving, Resolved };

struct Context {
    // Inside a clipPath: only geometry matters, paint is solid black.
    bool in_clip = false;
    int use_depth = 0;
};

// Outcome of resolving a clip-path, mask or filter reference.
struct ResourceRef {
    enum class Status { Absent, Found, Unrenderable };
    Status status = Status::Absent;
    size_t index = 0;

    static ResourceRef absent() { return {}; }
    static ResourceRef found(size_t i) { return {Status::Found, i}; }
    static ResourceRef unrenderable() { return {Status::Unrenderable, 0}; }
};

struct ResolvedPaint {
    paint::Paint paint;
    // Extra opacity, e.g. the stop-opacity of a single-stop gradient.
    float opacity = 1;
};

// Frames for an element and all its document ancestors, used when a
// definition is converted in its own (not the referencing) context.
struct FrameChain {
    std::deque<Frame> frames;

    const Frame& back() const { return frames.back(); }
};

class Converter {
public:
    Converter(const dom::Document& document, const Options& options);

    std::optional<tree::Tree> run();

    // converter.cpp
    Frame make_frame(const dom::Element& element, const Frame* parent);
    std::unique_ptr<FrameChain> dom_chain(const dom::Element& element);
    void convert_children(const dom::Element& parent, const Frame& frame, const Context& ctx,
                          tree::Group& out);
    void convert_element(const dom::Element& element, const Frame& parent, const Context& ctx,
                         tree::Group& out);
    // Opacity, blend mode and isolation of a new element group.
    void apply_group_style(const Frame& frame, const Context& ctx, tree::Group& g);
    // Attaches clip-path, mask and filters once the content is known.
    // Returns false when the element must not render.
    bool finish_group(const Frame& frame, const Context& ctx, tree::Group& g);
    const dom::Element* href_target(const dom::Element& element) const;
    std::vector<const dom::Element*> href_chain(const dom::Element& element);
    float length_attr(const Frame& frame, std::string_view name, Axis axis, float fallback) const;
    void warn(const std::string& stage, const std::string& message);
    size_t add_rect_clip(const geom::Rect& rect);
    // Enters a definition. Returns false on a reference cycle.
    bool begin_resolving(const dom::Element& element);
    void end_resolving(const dom::Element& element);

    // structure.cpp: use, symbol and nested svg
    void convert_use(const Frame& frame, const Context& ctx, tree::Group& out);
    void convert_nested_svg(const Frame& frame, const Context& ctx, tree::Group& out);
    // Content of a nested svg or symbol: viewBox mapping and viewport clip.
    // `use_frame` supplies width/height overrides when reached through use.
    void convert_viewport(const Frame& frame, const Frame* use_frame, const Context& ctx,
                          tree::Group& out);

    // shapes.cpp
    std::optional<geom::Path> shape_to_path(const Frame& frame);
    void convert_shape(const Frame& frame, const Context& ctx, tree::Group& out);
    std::optional<tree::Stroke> resolve_stroke(const Frame& frame,
                                               const std::optional<geom::Rect>& bbox,
                                               const Context& ctx);
    std::optional<tree::Fill> resolve_fill(const Frame& frame,
                                           const std::optional<geom::Rect>& bbox,
                                           const Context& ctx);
    tree::ShapeRendering shape_rendering(const Frame& frame) const;

    // paint_server.cpp
    std::optional<ResolvedPaint> resolve_paint(const Frame& frame, const dom::ParsedPaint& parsed,
                                               const std::optional<geom::Rect>& bbox);
    std::optional<ResolvedPaint> resolve_gradient(const dom::Element& element, const Frame& frame,
                                                  const std::optional<geom::Rect>& bbox);
    std::optional<ResolvedPaint> resolve_pattern(const dom::Element& element, const Frame& frame,
                                                 const std::optional<geom::Rect>& bbox);

    // clip_mask.cpp
    ResourceRef resolve_clip_path(const Frame& frame, const std::optional<geom::Rect>& bbox);
    ResourceRef resolve_mask(const Frame& frame, const std::optional<geom::Rect>& bbox);
    ResourceRef convert_clip_element(const dom::Element& element,
                                     const std::optional<geom::Rect>& bbox);
    ResourceRef convert_mask_element(const dom::Element& element,
                                     const std::optional<geom::Rect>& bbox);

    // filter.cpp
    std::vector<ResourceRef> resolve_filters(const Frame& frame,
                                             const std::optional<geom::Rect>& bbox);
    ResourceRef convert_filter_element(const dom::Element& element,
                                       const std::optional<geom::Rect>& bbox);

    // text.cpp
    void convert_text(const Frame& frame, const Context& ctx, tree::Group& out);

    // image.cpp
    void convert_image(const Frame& frame, tree::Group& out);

private:
    using ResourceKey = std::tuple<const dom::Element*, bool, float, float, float, float>;
    static ResourceKey make_key(const dom::Element* element, const std::optional<geom::Rect>& bbox);

    const dom::Document& document_;
    // Private to this conversion; the input document is never written.
    dom::DocumentIndex index_;
    Options options_;
    StyleCascade cascade_;
    tree::Tree tree_;
    Viewport root_viewport_;
    render::StbImageDecoder default_decoder_;

    std::unordered_map<const dom::Element*, ResolveState> states_;
    std::map<ResourceKey, size_t> clip_cache_;
    std::map<ResourceKey, size_t> mask_cache_;
    std::map<ResourceKey, size_t> filter_cache_;
    std::map<ResourceKey, size_t> pattern_cache_;
    std::unordered_map<std::string, std::shared_ptr<const tree::ImageData>> image_cache_;
};

} // namespace tinta::normalize
