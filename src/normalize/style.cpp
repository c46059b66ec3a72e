#include <tinta/normalize/style.h>
#include <tinta/dom/value_parser.h>

#include <algorithm>
#include <array>

namespace tinta::normalize {

namespace {

constexpr std::array<std::string_view, 43> kPresentationAttributes = {
    "alpha-interpolation", "baseline-shift", "clip-path", "clip-rule", "color",
    "color-interpolation", "color-interpolation-filters", "direction", "display",
    "fill", "fill-opacity", "fill-rule", "filter", "flood-color", "flood-opacity",
    "font-family", "font-size", "font-stretch", "font-style", "font-weight",
    "image-rendering", "isolation", "letter-spacing", "mask", "mask-type",
    "mix-blend-mode", "opacity", "overflow", "paint-order", "shape-rendering",
    "stop-color", "stop-opacity", "stroke", "stroke-dasharray", "stroke-dashoffset",
    "stroke-linecap", "stroke-linejoin", "stroke-miterlimit", "stroke-opacity",
    "stroke-width", "text-anchor", "text-decoration", "visibility",
};

constexpr std::array<std::string_view, 30> kInheritedProperties = {
    "clip-rule", "color", "color-interpolation", "color-interpolation-filters",
    "direction", "fill", "fill-opacity", "fill-rule", "font-family", "font-size",
    "font-stretch", "font-style", "font-weight", "image-rendering", "letter-spacing",
    "paint-order", "shape-rendering", "stroke", "stroke-dasharray", "stroke-dashoffset",
    "stroke-linecap", "stroke-linejoin", "stroke-miterlimit", "stroke-opacity",
    "stroke-width", "text-anchor", "text-rendering", "visibility", "word-spacing",
    "writing-mode",
};

bool is_css_only_property(std::string_view name) {
    return name == "word-spacing" || name == "text-rendering" || name == "writing-mode" ||
           name == "transform";
}

float resolve_font_size(const std::string* value, float parent_size, float default_size,
                        float dpi) {
    if (!value) return parent_size;
    std::string v = dom::to_lower(dom::trim(*value));
    if (v == "medium") return default_size;
    if (v == "larger") return parent_size * 1.2f;
    if (v == "smaller") return parent_size / 1.2f;
    if (v == "small") return default_size / 1.2f;
    if (v == "large") return default_size * 1.2f;
    if (v == "x-small") return default_size / 1.44f;
    if (v == "x-large") return default_size * 1.44f;
    if (v == "xx-small") return default_size / 1.728f;
    if (v == "xx-large") return default_size * 1.728f;
    auto len = dom::parse_length(v);
    if (!len) return parent_size;
    switch (len->unit) {
        case dom::LengthUnit::Em: return len->value * parent_size;
        case dom::LengthUnit::Ex: return len->value * parent_size / 2;
        case dom::LengthUnit::Percent: return len->value * parent_size / 100;
        case dom::LengthUnit::In: return len->value * dpi;
        case dom::LengthUnit::Cm: return len->value * dpi / 2.54f;
        case dom::LengthUnit::Mm: return len->value * dpi / 25.4f;
        case dom::LengthUnit::Pt: return len->value * dpi / 72;
        case dom::LengthUnit::Pc: return len->value * dpi / 6;
        default: return len->value;
    }
}

} // namespace

bool is_presentation_attribute(std::string_view name) {
    return std::find(kPresentationAttributes.begin(), kPresentationAttributes.end(), name) !=
           kPresentationAttributes.end();
}

bool is_inherited_property(std::string_view name) {
    return std::find(kInheritedProperties.begin(), kInheritedProperties.end(), name) !=
           kInheritedProperties.end();
}

StyleCascade::StyleCascade(const dom::Document& document, const dom::DocumentIndex& index) {
    for (const auto& css : document.all_stylesheets(index)) sheet_.append(dom::StyleSheet::parse(css));
}

const PropertyMap& StyleCascade::declared(const dom::Element& element) {
    auto it = cache_.find(&element);
    if (it != cache_.end()) return it->second;

    PropertyMap props;
    for (const auto& attr : element.attributes()) {
        if (is_presentation_attribute(attr.name)) props[attr.name] = attr.value;
    }

    auto accepts = [](const std::string& name) {
        return is_presentation_attribute(name) || is_css_only_property(name);
    };

    auto matched = dom::collect_matching(sheet_, element);
    for (const auto& m : matched) {
        if (!m.declaration->important && accepts(m.declaration->name)) {
            props[m.declaration->name] = m.declaration->value;
        }
    }

    std::vector<dom::Declaration> inline_decls;
    if (const std::string* style = element.find_attribute("style")) {
        inline_decls = dom::parse_declarations(*style);
    }
    for (const auto& d : inline_decls) {
        if (!d.important && accepts(d.name)) props[d.name] = d.value;
    }
    for (const auto& m : matched) {
        if (m.declaration->important && accepts(m.declaration->name)) {
            props[m.declaration->name] = m.declaration->value;
        }
    }
    for (const auto& d : inline_decls) {
        if (d.important && accepts(d.name)) props[d.name] = d.value;
    }

    return cache_.emplace(&element, std::move(props)).first->second;
}

Frame::Frame(const dom::Element& element, const PropertyMap& props, const Frame* parent,
             float default_font_size, float dpi)
    : element_(&element), props_(&props), parent_(parent) {
    float parent_size = parent ? parent->font_size_ : default_font_size;
    auto it = props.find("font-size");
    const std::string* value = it != props.end() ? &it->second : nullptr;
    if (value && *value == "inherit") value = nullptr;
    font_size_ = resolve_font_size(value, parent_size, default_font_size, dpi);
    if (parent) viewport_ = parent->viewport_;
}

const std::string* Frame::find(std::string_view name) const {
    bool inherited = is_inherited_property(name);
    const Frame* f = this;
    while (f) {
        auto it = f->props_->find(std::string(name));
        if (it != f->props_->end()) {
            if (it->second != "inherit") return &it->second;
        } else if (!inherited) {
            return nullptr;
        }
        f = f->parent_;
    }
    return nullptr;
}

const std::string* Frame::attribute(std::string_view name) const {
    return element_->find_attribute(name);
}

} // namespace tinta::normalize
