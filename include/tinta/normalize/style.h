#pragma once
#include <tinta/dom/document.h>
#include <tinta/dom/stylesheet.h>

#include <string>
#include <string_view>
#include <unordered_map>

namespace tinta::normalize {

using PropertyMap = std::unordered_map<std::string, std::string>;

bool is_presentation_attribute(std::string_view name);
bool is_inherited_property(std::string_view name);

// Specified property values per element: presentation attributes, then
// style sheet rules by specificity, then the `style` attribute, then
// `!important` rules (inline ones last).
class StyleCascade {
public:
    StyleCascade(const dom::Document& document, const dom::DocumentIndex& index);

    const PropertyMap& declared(const dom::Element& element);
    const dom::StyleSheet& stylesheet() const { return sheet_; }

private:
    dom::StyleSheet sheet_;
    std::unordered_map<const dom::Element*, PropertyMap> cache_;
};

struct Viewport {
    float width = 0;
    float height = 0;
};

// One element on the current conversion path. Frames are stack allocated
// by the converter; inheritance follows the conversion path, which for
// `use` expansions differs from the document tree.
class Frame {
public:
    Frame(const dom::Element& element, const PropertyMap& props, const Frame* parent,
          float default_font_size, float dpi);

    const dom::Element& element() const { return *element_; }
    const Frame* parent() const { return parent_; }
    const PropertyMap& props() const { return *props_; }

    // Cascaded value, honoring inheritance and the `inherit` keyword.
    const std::string* find(std::string_view name) const;
    // Element attribute (not a property).
    const std::string* attribute(std::string_view name) const;

    float font_size() const { return font_size_; }
    const Viewport& viewport() const { return viewport_; }
    void set_viewport(Viewport vp) { viewport_ = vp; }

private:
    const dom::Element* element_;
    const PropertyMap* props_;
    const Frame* parent_;
    float font_size_;
    Viewport viewport_;
};

} // namespace tinta::normalize
