#include "converter.h"

#include <tinta/core/config.h>

namespace tinta::normalize {

void Converter::convert_use(const Frame& frame, const Context& ctx, tree::Group& out) {
    const dom::Element& use = frame.element();
    const dom::Element* target = href_target(use);
    if (!target) {
        warn("use", "use '" + use.id() + "' references a missing element");
        return;
    }
    if (ctx.use_depth >= core::config::kMaxUseDepth) {
        warn("use", "use nesting exceeds " + std::to_string(core::config::kMaxUseDepth) + " levels");
        return;
    }
    for (const dom::Element* e = &use; e; e = e->parent()) {
        if (e == target) {
            warn("use", "use '" + use.id() + "' references its own ancestor");
            return;
        }
    }
    if (!begin_resolving(*target)) return;

    Context inner = ctx;
    ++inner.use_depth;

    float x = length_attr(frame, "x", Axis::X, 0);
    float y = length_attr(frame, "y", Axis::Y, 0);
    out.transform = out.transform * geom::Transform::translate(x, y);

    dom::ElementKind kind = target->kind();
    if (kind == dom::ElementKind::Symbol || kind == dom::ElementKind::Svg) {
        Frame target_frame = make_frame(*target, &frame);
        const std::string* display = target_frame.find("display");
        if (!display || dom::trim(*display) != "none") {
            convert_viewport(target_frame, &frame, inner, out);
        }
    } else {
        convert_element(*target, frame, inner, out);
    }

    end_resolving(*target);
}

void Converter::convert_nested_svg(const Frame& frame, const Context& ctx, tree::Group& out) {
    convert_viewport(frame, nullptr, ctx, out);
}

void Converter::convert_viewport(const Frame& frame, const Frame* use_frame, const Context& ctx,
                                 tree::Group& out) {
    const dom::Element& element = frame.element();
    bool is_svg = element.kind() == dom::ElementKind::Svg;

    float x = is_svg ? length_attr(frame, "x", Axis::X, 0) : 0;
    float y = is_svg ? length_attr(frame, "y", Axis::Y, 0) : 0;

    auto dimension = [&](std::string_view name, Axis axis) {
        const Frame& source = use_frame && use_frame->attribute(name) ? *use_frame : frame;
        dom::Length whole = dom::Length::percent(100);
        if (const std::string* value = source.attribute(name)) {
            whole = dom::parse_length(*value).value_or(whole);
        }
        return to_user(whole, axis, frame, options_.dpi);
    };
    float width = dimension("width", Axis::X);
    float height = dimension("height", Axis::Y);
    if (!(width > 0) || !(height > 0)) return;

    std::optional<geom::Rect> view_box;
    if (const std::string* vb = frame.attribute("viewBox")) view_box = dom::parse_view_box(*vb);
    dom::AspectRatio ar;
    if (const std::string* par = frame.attribute("preserveAspectRatio")) {
        ar = dom::parse_aspect_ratio(*par).value_or(dom::AspectRatio{});
    }

    tree::Group content;
    content.transform = geom::Transform::translate(x, y);
    Frame content_frame = frame;
    if (view_box) {
        content.transform = content.transform * dom::view_box_transform(*view_box, ar, {width, height});
        content_frame.set_viewport({view_box->width, view_box->height});
    } else {
        content_frame.set_viewport({width, height});
    }

    convert_children(element, content_frame, ctx, content);
    if (content.children.empty()) return;

    const std::string* overflow = frame.find("overflow");
    std::string mode = overflow ? dom::trim(*overflow) : "hidden";
    if (mode == "visible" || mode == "auto") {
        out.children.emplace_back(std::move(content));
        return;
    }

    tree::Group clipped;
    clipped.clip_path = add_rect_clip({x, y, width, height});
    clipped.children.emplace_back(std::move(content));
    out.children.emplace_back(std::move(clipped));
}

} // namespace tinta::normalize
