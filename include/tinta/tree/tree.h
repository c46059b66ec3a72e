#pragma once
#include <tinta/filter/types.h>
#include <tinta/geom/path.h>
#include <tinta/geom/rect.h>
#include <tinta/geom/stroke.h>
#include <tinta/geom/transform.h>
#include <tinta/paint/blend_mode.h>
#include <tinta/paint/paint.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tinta::tree {

enum class FillRule : uint8_t { NonZero, EvenOdd };
enum class PaintOrder : uint8_t { FillAndStroke, StrokeAndFill };
enum class ShapeRendering : uint8_t { OptimizeSpeed, CrispEdges, GeometricPrecision };
enum class ImageRendering : uint8_t { OptimizeQuality, OptimizeSpeed };
enum class MaskType : uint8_t { Luminance, Alpha };

struct Fill {
    paint::Paint paint = paint::Color::black();
    float opacity = 1;
    FillRule rule = FillRule::NonZero;
};

struct Stroke {
    paint::Paint paint = paint::Color::black();
    float opacity = 1;
    geom::StrokeStyle style;
};

// Decoded raster image, premultiplied RGBA8, row-major.
struct ImageData {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> pixels;
};

struct Node;

struct Group {
    std::string id;
    geom::Transform transform;
    geom::Transform abs_transform;
    float opacity = 1;
    paint::BlendMode blend_mode = paint::BlendMode::Normal;
    bool isolate = false;
    std::optional<size_t> clip_path;
    std::optional<size_t> mask;
    std::vector<size_t> filters;

    // In the group's own coordinates: children are mapped through their
    // transforms, this group's transform is not applied.
    std::optional<geom::Rect> bounding_box;
    std::optional<geom::Rect> stroke_bounding_box;
    // Area the group's layer covers: stroke bounds, or the filter region.
    std::optional<geom::Rect> layer_bounding_box;
    std::optional<geom::Rect> abs_bounding_box;
    std::optional<geom::Rect> abs_stroke_bounding_box;
    std::optional<geom::Rect> abs_layer_bounding_box;

    std::vector<Node> children;

    // True when the group must be rendered into its own layer.
    bool should_isolate() const;
};

struct Path {
    std::string id;
    bool visible = true;
    std::optional<Fill> fill;
    std::optional<Stroke> stroke;
    PaintOrder paint_order = PaintOrder::FillAndStroke;
    ShapeRendering rendering_mode = ShapeRendering::GeometricPrecision;
    geom::Path data;
    geom::Transform abs_transform;

    std::optional<geom::Rect> bounding_box;
    std::optional<geom::Rect> stroke_bounding_box;
    std::optional<geom::Rect> abs_bounding_box;
    std::optional<geom::Rect> abs_stroke_bounding_box;

    bool anti_alias() const { return rendering_mode == ShapeRendering::GeometricPrecision; }
};

struct Image {
    std::string id;
    bool visible = true;
    ImageRendering rendering_mode = ImageRendering::OptimizeQuality;
    std::shared_ptr<const ImageData> data;
    // Image pixel space to user space.
    geom::Transform view_transform;
    // Viewport in user space; pixels outside are clipped.
    geom::Rect clip;
    geom::Transform abs_transform;

    std::optional<geom::Rect> bounding_box;
    std::optional<geom::Rect> abs_bounding_box;
};

// A text run after layout. Only `flattened` is rendered.
struct Text {
    std::string id;
    std::string content;
    geom::Transform abs_transform;
    Group flattened;

    std::optional<geom::Rect> bounding_box;
    std::optional<geom::Rect> abs_bounding_box;
    std::optional<geom::Rect> stroke_bounding_box;
    std::optional<geom::Rect> abs_stroke_bounding_box;
};

struct Node {
    std::variant<Group, Path, Image, Text> kind;

    Node() = default;
    Node(Group g) : kind(std::move(g)) {}
    Node(Path p) : kind(std::move(p)) {}
    Node(Image i) : kind(std::move(i)) {}
    Node(Text t) : kind(std::move(t)) {}

    const Group* as_group() const { return std::get_if<Group>(&kind); }
    Group* as_group() { return std::get_if<Group>(&kind); }
    const Path* as_path() const { return std::get_if<Path>(&kind); }
    Path* as_path() { return std::get_if<Path>(&kind); }
    const Image* as_image() const { return std::get_if<Image>(&kind); }
    const Text* as_text() const { return std::get_if<Text>(&kind); }

    const std::string& id() const;
    const geom::Transform& abs_transform() const;
    // Group transform, identity for other nodes.
    geom::Transform transform() const;
    std::optional<geom::Rect> bounding_box() const;
    std::optional<geom::Rect> stroke_bounding_box() const;
    std::optional<geom::Rect> abs_bounding_box() const;
    std::optional<geom::Rect> abs_stroke_bounding_box() const;
};

struct ClipPath {
    std::string id;
    // Units and the clipPath's own transform, folded together.
    geom::Transform transform;
    std::optional<size_t> clip_path;
    Group root;
};

struct Mask {
    std::string id;
    // Mask region in the masked element's user space.
    geom::Rect rect;
    MaskType kind = MaskType::Luminance;
    std::optional<size_t> mask;
    Group root;
};

struct Pattern {
    std::string id;
    // patternTransform: pattern space to user space.
    geom::Transform transform;
    // Tile rectangle in pattern space, bounding-box units resolved.
    geom::Rect rect;
    // Content of one tile, relative to the tile origin. The root transform
    // carries the viewBox or the bounding-box content units.
    Group root;
};

class Tree {
public:
    geom::Size size;
    geom::Rect view_box;
    // Root group; its transform maps the view box onto `size`.
    Group root;

    std::vector<ClipPath> clip_paths;
    std::vector<Mask> masks;
    std::vector<Pattern> patterns;
    std::vector<filter::Filter> filters;

    // First node in document order with this id, including nodes inside
    // resource roots.
    const Node* node_by_id(std::string_view id) const;
};

// Recomputes abs_transform below `group`, given its parent's absolute
// transform.
void calculate_abs_transforms(Group& group, const geom::Transform& parent_abs);

// Recomputes all bounding boxes of `group` bottom-up. Filter regions come
// from `tree` for layer bounds.
void calculate_bounding_boxes(Group& group, const Tree& tree);

// Re-runs the structural passes the normalizer ends with: empty groups
// are dropped, transforms and bounding boxes recomputed. Running it on
// its own output changes nothing.
void normalize(Tree& tree);

// Deterministic text dump for debugging and tests.
std::string dump(const Tree& tree);

} // namespace tinta::tree
