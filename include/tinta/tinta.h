#pragma once
#include <tinta/dom/document.h>
#include <tinta/normalize/normalizer.h>
#include <tinta/normalize/options.h>
#include <tinta/render/png.h>
#include <tinta/render/renderer.h>
#include <tinta/tree/tree.h>

#include <optional>

namespace tinta {

inline std::optional<tree::Tree> build_tree(const dom::Document& document,
                                            const normalize::Options& options = {}) {
    return normalize::normalize(document, options);
}

// Normalizes `document` and renders it at its own size times `zoom`.
render::RenderResult render_document(const dom::Document& document, float zoom = 1.0f,
                                     const normalize::Options& normalize_options = {},
                                     const render::RenderOptions& render_options = {});

} // namespace tinta
