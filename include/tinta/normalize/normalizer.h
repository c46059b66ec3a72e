#pragma once
#include <tinta/dom/document.h>
#include <tinta/normalize/options.h>
#include <tinta/tree/tree.h>

#include <optional>

namespace tinta::normalize {

// Builds the render tree for `document`. References, the cascade, units
// and `use` expansion are resolved; broken references are reported as
// warnings and treated as absent. Returns nullopt when the document has
// no `svg` root element or its size is not positive.
std::optional<tree::Tree> normalize(const dom::Document& document, const Options& options);

} // namespace tinta::normalize
