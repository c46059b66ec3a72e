#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tinta::dom {

enum class ElementKind : uint8_t {
    Svg, G, Defs, Path, Rect, Circle, Ellipse, Line, Polyline, Polygon,
    Image, Text, TSpan, TextPath,
    LinearGradient, RadialGradient, Stop, Pattern,
    ClipPath, Mask, Filter,
    FeBlend, FeColorMatrix, FeComponentTransfer, FeComposite,
    FeDisplacementMap, FeDropShadow, FeFlood, FeGaussianBlur,
    FeMerge, FeMergeNode, FeMorphology, FeOffset, FeTile,
    FeFuncR, FeFuncG, FeFuncB, FeFuncA,
    Use, Symbol, Style, Unknown
};

ElementKind element_kind_from_name(std::string_view tag);
const char* element_name(ElementKind kind);

bool is_shape(ElementKind kind);
bool is_filter_primitive(ElementKind kind);
// Elements that never render on their own (definitions, resources).
bool is_non_rendering(ElementKind kind);

struct Attribute {
    std::string name;
    std::string value;
};

class Element;

// A node of the input document: either an element or character data.
class Node {
public:
    enum class Type { Element, Text };

    explicit Node(Type type);
    virtual ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    Type node_type() const { return type_; }
    bool is_element() const { return type_ == Type::Element; }
    bool is_text() const { return type_ == Type::Text; }

    Element* parent() const { return parent_; }
    Node& append_child(std::unique_ptr<Node> child);
    size_t child_count() const { return children_.size(); }
    const std::vector<std::unique_ptr<Node>>& children() const { return children_; }

    template<typename Fn>
    void for_each_child(Fn&& fn) const {
        for (auto& child : children_) fn(*child);
    }

    // Concatenated character data of this subtree.
    virtual std::string text_content() const;

protected:
    Type type_;
    Element* parent_ = nullptr;
    std::vector<std::unique_ptr<Node>> children_;
};

class Text : public Node {
public:
    explicit Text(std::string data) : Node(Type::Text), data_(std::move(data)) {}

    const std::string& data() const { return data_; }
    std::string text_content() const override { return data_; }

private:
    std::string data_;
};

class Element : public Node {
public:
    explicit Element(const std::string& tag_name);
    explicit Element(ElementKind kind);

    ElementKind kind() const { return kind_; }
    const std::string& tag_name() const { return tag_name_; }

    std::optional<std::string> get_attribute(std::string_view name) const;
    const std::string* find_attribute(std::string_view name) const;
    void set_attribute(const std::string& name, const std::string& value);
    void remove_attribute(const std::string& name);
    bool has_attribute(std::string_view name) const;
    const std::vector<Attribute>& attributes() const { return attributes_; }

    const std::string& id() const { return id_; }
    const std::vector<std::string>& class_list() const { return classes_; }
    bool has_class(std::string_view cls) const;

    // Convenience builders used by parsers and tests.
    Element& append_element(ElementKind kind);
    Element& append_element(const std::string& tag_name);
    Text& append_text(std::string data);

    template<typename Fn>
    void for_each_element_child(Fn&& fn) const {
        for (auto& child : children_) {
            if (child->is_element()) fn(static_cast<const Element&>(*child));
        }
    }

private:
    void on_attribute_changed(const std::string& name, const std::string& value);

    ElementKind kind_;
    std::string tag_name_;
    std::vector<Attribute> attributes_;
    std::string id_;
    std::vector<std::string> classes_;
};

} // namespace tinta::dom
