#include <tinta/dom/node.h>

#include <algorithm>
#include <sstream>
#include <utility>

namespace tinta::dom {

namespace {

struct KindName {
    ElementKind kind;
    const char* name;
};

constexpr KindName kKindNames[] = {
    {ElementKind::Svg, "svg"},
    {ElementKind::G, "g"},
    {ElementKind::Defs, "defs"},
    {ElementKind::Path, "path"},
    {ElementKind::Rect, "rect"},
    {ElementKind::Circle, "circle"},
    {ElementKind::Ellipse, "ellipse"},
    {ElementKind::Line, "line"},
    {ElementKind::Polyline, "polyline"},
    {ElementKind::Polygon, "polygon"},
    {ElementKind::Image, "image"},
    {ElementKind::Text, "text"},
    {ElementKind::TSpan, "tspan"},
    {ElementKind::TextPath, "textPath"},
    {ElementKind::LinearGradient, "linearGradient"},
    {ElementKind::RadialGradient, "radialGradient"},
    {ElementKind::Stop, "stop"},
    {ElementKind::Pattern, "pattern"},
    {ElementKind::ClipPath, "clipPath"},
    {ElementKind::Mask, "mask"},
    {ElementKind::Filter, "filter"},
    {ElementKind::FeBlend, "feBlend"},
    {ElementKind::FeColorMatrix, "feColorMatrix"},
    {ElementKind::FeComponentTransfer, "feComponentTransfer"},
    {ElementKind::FeComposite, "feComposite"},
    {ElementKind::FeDisplacementMap, "feDisplacementMap"},
    {ElementKind::FeDropShadow, "feDropShadow"},
    {ElementKind::FeFlood, "feFlood"},
    {ElementKind::FeGaussianBlur, "feGaussianBlur"},
    {ElementKind::FeMerge, "feMerge"},
    {ElementKind::FeMergeNode, "feMergeNode"},
    {ElementKind::FeMorphology, "feMorphology"},
    {ElementKind::FeOffset, "feOffset"},
    {ElementKind::FeTile, "feTile"},
    {ElementKind::FeFuncR, "feFuncR"},
    {ElementKind::FeFuncG, "feFuncG"},
    {ElementKind::FeFuncB, "feFuncB"},
    {ElementKind::FeFuncA, "feFuncA"},
    {ElementKind::Use, "use"},
    {ElementKind::Symbol, "symbol"},
    {ElementKind::Style, "style"},
};

} // namespace

ElementKind element_kind_from_name(std::string_view tag) {
    // Tolerate a namespace prefix such as "svg:rect".
    auto colon = tag.find(':');
    if (colon != std::string_view::npos) tag = tag.substr(colon + 1);
    for (const auto& entry : kKindNames) {
        if (tag == entry.name) return entry.kind;
    }
    return ElementKind::Unknown;
}

const char* element_name(ElementKind kind) {
    for (const auto& entry : kKindNames) {
        if (entry.kind == kind) return entry.name;
    }
    return "unknown";
}

bool is_shape(ElementKind kind) {
    switch (kind) {
        case ElementKind::Path:
        case ElementKind::Rect:
        case ElementKind::Circle:
        case ElementKind::Ellipse:
        case ElementKind::Line:
        case ElementKind::Polyline:
        case ElementKind::Polygon:
            return true;
        default:
            return false;
    }
}

bool is_filter_primitive(ElementKind kind) {
    switch (kind) {
        case ElementKind::FeBlend:
        case ElementKind::FeColorMatrix:
        case ElementKind::FeComponentTransfer:
        case ElementKind::FeComposite:
        case ElementKind::FeDisplacementMap:
        case ElementKind::FeDropShadow:
        case ElementKind::FeFlood:
        case ElementKind::FeGaussianBlur:
        case ElementKind::FeMerge:
        case ElementKind::FeMorphology:
        case ElementKind::FeOffset:
        case ElementKind::FeTile:
            return true;
        default:
            return false;
    }
}

bool is_non_rendering(ElementKind kind) {
    switch (kind) {
        case ElementKind::Defs:
        case ElementKind::LinearGradient:
        case ElementKind::RadialGradient:
        case ElementKind::Stop:
        case ElementKind::Pattern:
        case ElementKind::ClipPath:
        case ElementKind::Mask:
        case ElementKind::Filter:
        case ElementKind::Symbol:
        case ElementKind::Style:
        case ElementKind::Unknown:
            return true;
        default:
            return is_filter_primitive(kind) || kind == ElementKind::FeMergeNode ||
                   kind == ElementKind::FeFuncR || kind == ElementKind::FeFuncG ||
                   kind == ElementKind::FeFuncB || kind == ElementKind::FeFuncA;
    }
}

// ---------------------------------------------------------------------------
// Node
// ---------------------------------------------------------------------------

Node::Node(Type type) : type_(type) {}

Node::~Node() = default;

Node& Node::append_child(std::unique_ptr<Node> child) {
    Node* new_child = child.get();
    // Only elements can be parents; Text never holds children.
    new_child->parent_ = is_element() ? static_cast<Element*>(this) : nullptr;
    children_.push_back(std::move(child));
    return *new_child;
}

std::string Node::text_content() const {
    std::string result;
    for (auto& child : children_) result += child->text_content();
    return result;
}

// ---------------------------------------------------------------------------
// Element
// ---------------------------------------------------------------------------

Element::Element(const std::string& tag_name)
    : Node(Type::Element), kind_(element_kind_from_name(tag_name)), tag_name_(tag_name) {}

Element::Element(ElementKind kind)
    : Node(Type::Element), kind_(kind), tag_name_(element_name(kind)) {}

std::optional<std::string> Element::get_attribute(std::string_view name) const {
    const std::string* value = find_attribute(name);
    if (!value) return std::nullopt;
    return *value;
}

const std::string* Element::find_attribute(std::string_view name) const {
    for (const auto& attr : attributes_) {
        if (attr.name == name) return &attr.value;
    }
    return nullptr;
}

void Element::set_attribute(const std::string& name, const std::string& value) {
    auto it = std::find_if(attributes_.begin(), attributes_.end(),
                           [&name](const Attribute& a) { return a.name == name; });
    if (it != attributes_.end()) {
        it->value = value;
    } else {
        attributes_.push_back({name, value});
    }
    on_attribute_changed(name, value);
}

void Element::remove_attribute(const std::string& name) {
    attributes_.erase(std::remove_if(attributes_.begin(), attributes_.end(),
                                     [&name](const Attribute& a) { return a.name == name; }),
                      attributes_.end());
    on_attribute_changed(name, "");
}

bool Element::has_attribute(std::string_view name) const {
    return find_attribute(name) != nullptr;
}

bool Element::has_class(std::string_view cls) const {
    return std::find(classes_.begin(), classes_.end(), cls) != classes_.end();
}

Element& Element::append_element(ElementKind kind) {
    return static_cast<Element&>(append_child(std::make_unique<Element>(kind)));
}

Element& Element::append_element(const std::string& tag_name) {
    return static_cast<Element&>(append_child(std::make_unique<Element>(tag_name)));
}

Text& Element::append_text(std::string data) {
    return static_cast<Text&>(append_child(std::make_unique<Text>(std::move(data))));
}

void Element::on_attribute_changed(const std::string& name, const std::string& value) {
    if (name == "id") {
        id_ = value;
    } else if (name == "class") {
        classes_.clear();
        std::istringstream stream(value);
        std::string cls;
        while (stream >> cls) classes_.push_back(cls);
    }
}

} // namespace tinta::dom
