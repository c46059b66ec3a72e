#include "converter.h"

namespace tinta::normalize {

namespace {

const dom::Element* referenced(const dom::DocumentIndex& index, const std::string* value) {
    if (!value) return nullptr;
    auto id = dom::parse_func_iri(*value);
    if (!id) return nullptr;
    return index.get_element_by_id(*id);
}

bool is_obb(const std::string* units, bool default_obb) {
    if (!units) return default_obb;
    return dom::trim(*units) == "objectBoundingBox";
}

} // namespace

ResourceRef Converter::resolve_clip_path(const Frame& frame,
                                         const std::optional<geom::Rect>& bbox) {
    const std::string* value = frame.find("clip-path");
    const dom::Element* element = referenced(index_, value);
    if (!element || element->kind() != dom::ElementKind::ClipPath) {
        warn("clip", "clip-path '" + (value ? *value : std::string()) + "' does not reference a clipPath");
        return ResourceRef::absent();
    }
    return convert_clip_element(*element, bbox);
}

ResourceRef Converter::convert_clip_element(const dom::Element& element,
                                            const std::optional<geom::Rect>& bbox) {
    bool obb = is_obb(element.find_attribute("clipPathUnits"), false);
    if (obb && (!bbox || bbox->is_empty())) return ResourceRef::unrenderable();

    ResourceKey key = make_key(&element, obb ? bbox : std::nullopt);
    if (auto it = clip_cache_.find(key); it != clip_cache_.end()) return ResourceRef::found(it->second);
    if (!begin_resolving(element)) return ResourceRef::absent();

    auto frames = dom_chain(element);
    const Frame& frame = frames->back();

    tree::ClipPath clip;
    clip.id = element.id();
    if (const std::string* ts = element.find_attribute("transform")) {
        clip.transform = dom::parse_transform(*ts).value_or(geom::Transform{});
    }
    if (obb) {
        auto bbox_ts = paint::bbox_transform(*bbox);
        if (!bbox_ts) {
            end_resolving(element);
            return ResourceRef::unrenderable();
        }
        clip.transform = clip.transform * *bbox_ts;
    }
    if (!clip.transform.is_invertible()) {
        end_resolving(element);
        return ResourceRef::unrenderable();
    }

    const std::string* nested = frame.find("clip-path");
    if (nested && dom::trim(*nested) != "none") {
        ResourceRef ref = resolve_clip_path(frame, bbox);
        if (ref.status == ResourceRef::Status::Unrenderable) {
            end_resolving(element);
            return ref;
        }
        if (ref.status == ResourceRef::Status::Found) clip.clip_path = ref.index;
    }

    Context ctx;
    ctx.in_clip = true;
    convert_children(element, frame, ctx, clip.root);
    end_resolving(element);

    tree_.clip_paths.push_back(std::move(clip));
    size_t index = tree_.clip_paths.size() - 1;
    clip_cache_.emplace(key, index);
    return ResourceRef::found(index);
}

ResourceRef Converter::resolve_mask(const Frame& frame, const std::optional<geom::Rect>& bbox) {
    const std::string* value = frame.find("mask");
    const dom::Element* element = referenced(index_, value);
    if (!element || element->kind() != dom::ElementKind::Mask) {
        warn("mask", "mask '" + (value ? *value : std::string()) + "' does not reference a mask");
        return ResourceRef::absent();
    }
    return convert_mask_element(*element, bbox);
}

ResourceRef Converter::convert_mask_element(const dom::Element& element,
                                            const std::optional<geom::Rect>& bbox) {
    bool obb_units = is_obb(element.find_attribute("maskUnits"), true);
    bool obb_content = is_obb(element.find_attribute("maskContentUnits"), false);
    bool needs_bbox = obb_units || obb_content;
    if (needs_bbox && (!bbox || bbox->is_empty())) return ResourceRef::unrenderable();

    auto frames = dom_chain(element);
    const Frame& frame = frames->back();

    auto coord = [&](std::string_view name, Axis axis, dom::Length fallback) {
        dom::Length l = fallback;
        if (const std::string* v = element.find_attribute(name)) {
            l = dom::parse_length(*v).value_or(fallback);
        }
        if (!obb_units) return to_user(l, axis, frame, options_.dpi);
        float f = to_bbox_fraction(l, frame, options_.dpi);
        if (name == "x") return bbox->x + f * bbox->width;
        if (name == "y") return bbox->y + f * bbox->height;
        return f * (axis == Axis::X ? bbox->width : bbox->height);
    };

    geom::Rect rect{coord("x", Axis::X, dom::Length::percent(-10)),
                    coord("y", Axis::Y, dom::Length::percent(-10)),
                    coord("width", Axis::X, dom::Length::percent(120)),
                    coord("height", Axis::Y, dom::Length::percent(120))};
    if (rect.is_empty() || !rect.is_valid()) return ResourceRef::unrenderable();

    ResourceKey key = make_key(&element, needs_bbox ? bbox : std::nullopt);
    if (auto it = mask_cache_.find(key); it != mask_cache_.end()) return ResourceRef::found(it->second);
    if (!begin_resolving(element)) return ResourceRef::absent();

    tree::Mask mask;
    mask.id = element.id();
    mask.rect = rect;
    const std::string* type = frame.find("mask-type");
    if (type && dom::trim(*type) == "alpha") mask.kind = tree::MaskType::Alpha;

    if (obb_content) {
        if (auto ts = paint::bbox_transform(*bbox)) mask.root.transform = *ts;
    }

    const std::string* nested = frame.find("mask");
    if (nested && dom::trim(*nested) != "none") {
        ResourceRef ref = resolve_mask(frame, bbox);
        if (ref.status == ResourceRef::Status::Unrenderable) {
            end_resolving(element);
            return ref;
        }
        if (ref.status == ResourceRef::Status::Found) mask.mask = ref.index;
    }

    convert_children(element, frame, Context{}, mask.root);
    end_resolving(element);

    tree_.masks.push_back(std::move(mask));
    size_t index = tree_.masks.size() - 1;
    mask_cache_.emplace(key, index);
    return ResourceRef::found(index);
}

} // namespace tinta::normalize
