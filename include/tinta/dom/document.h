#pragma once
#include <tinta/dom/node.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tinta::dom {

// Id lookup and embedded style text of one document tree, built in a single
// walk. Readers that must not touch the document build their own copy.
class DocumentIndex {
public:
    DocumentIndex() = default;
    explicit DocumentIndex(const Element* root);

    // Returns the first element in document order with this id.
    const Element* get_element_by_id(std::string_view id) const;
    // Text of `style` elements with a CSS type, in document order.
    const std::vector<std::string>& embedded_styles() const { return embedded_styles_; }

private:
    void index_subtree(const Element& element);

    std::unordered_map<std::string, const Element*> id_map_;
    std::vector<std::string> embedded_styles_;
};

// Parsed input document. Owns the element tree, the `id` index, the
// in-memory resources referenced by `href` and the style sheet text.
class Document {
public:
    Document();

    Element* root() const { return root_.get(); }
    Element& set_root(std::unique_ptr<Element> root);
    // Creates an `svg` root element.
    Element& create_root();

    // Returns the first element in document order with this id.
    const Element* get_element_by_id(std::string_view id) const;
    // Rebuilds the id index and embedded style list after the tree was
    // mutated.
    void reindex();
    // A fresh index of the current tree. Leaves the document untouched, so
    // concurrent readers may call it.
    DocumentIndex build_index() const { return DocumentIndex(root_.get()); }

    void add_resource(const std::string& href, std::vector<uint8_t> bytes);
    const std::vector<uint8_t>* resource(std::string_view href) const;

    // Style sheet text is collected from `style` elements by reindex()
    // and can also be supplied by the caller.
    void add_stylesheet(std::string css) { stylesheets_.push_back(std::move(css)); }
    const std::vector<std::string>& stylesheets() const { return stylesheets_; }
    std::vector<std::string> all_stylesheets() const;
    // Embedded styles from `index` followed by the caller's sheets.
    std::vector<std::string> all_stylesheets(const DocumentIndex& index) const;

private:
    std::unique_ptr<Element> root_;
    DocumentIndex index_;
    std::unordered_map<std::string, std::vector<uint8_t>> resources_;
    std::vector<std::string> stylesheets_;
};

} // namespace tinta::dom
