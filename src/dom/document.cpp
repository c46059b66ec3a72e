#include <tinta/dom/document.h>

namespace tinta::dom {

Document::Document() = default;

Element& Document::set_root(std::unique_ptr<Element> root) {
    root_ = std::move(root);
    reindex();
    return *root_;
}

Element& Document::create_root() {
    return set_root(std::make_unique<Element>(ElementKind::Svg));
}

const Element* Document::get_element_by_id(std::string_view id) const {
    return index_.get_element_by_id(id);
}

void Document::reindex() {
    index_ = build_index();
}

DocumentIndex::DocumentIndex(const Element* root) {
    if (root) index_subtree(*root);
}

const Element* DocumentIndex::get_element_by_id(std::string_view id) const {
    if (id.empty()) return nullptr;
    auto it = id_map_.find(std::string(id));
    return it != id_map_.end() ? it->second : nullptr;
}

void DocumentIndex::index_subtree(const Element& element) {
    // First element wins on duplicate ids.
    if (!element.id().empty()) id_map_.emplace(element.id(), &element);
    if (element.kind() == ElementKind::Style) {
        auto type = element.get_attribute("type");
        if (!type || type->empty() || *type == "text/css") {
            embedded_styles_.push_back(element.text_content());
        }
    }
    element.for_each_element_child([this](const Element& child) { index_subtree(child); });
}

void Document::add_resource(const std::string& href, std::vector<uint8_t> bytes) {
    resources_[href] = std::move(bytes);
}

const std::vector<uint8_t>* Document::resource(std::string_view href) const {
    auto it = resources_.find(std::string(href));
    return it != resources_.end() ? &it->second : nullptr;
}

std::vector<std::string> Document::all_stylesheets() const {
    return all_stylesheets(index_);
}

std::vector<std::string> Document::all_stylesheets(const DocumentIndex& index) const {
    std::vector<std::string> all = index.embedded_styles();
    all.insert(all.end(), stylesheets_.begin(), stylesheets_.end());
    return all;
}

} // namespace tinta::dom
