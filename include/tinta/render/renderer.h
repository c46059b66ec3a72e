#pragma once
#include <tinta/core/diagnostics.h>
#include <tinta/geom/transform.h>
#include <tinta/paint/color.h>
#include <tinta/platform/thread_pool.h>
#include <tinta/render/pixmap.h>
#include <tinta/tree/tree.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tinta::render {

struct RenderOptions {
    // Renders sibling layers and filter primitives concurrently when set.
    platform::ThreadPool* pool = nullptr;
    core::DiagnosticEmitter* diagnostics = nullptr;
};

struct RenderResult {
    Pixmap pixmap;
    bool success = false;
    std::string error;
};

// Draws `tree` onto `pixmap`. `ts` maps tree units (its size) to pixels.
void render(const tree::Tree& tree, const geom::Transform& ts, Pixmap& pixmap,
            const RenderOptions& options = {});

// Renders `tree` scaled to width x height pixels over `background`.
RenderResult render(const tree::Tree& tree, uint32_t width, uint32_t height,
                    const paint::Color& background = paint::Color::transparent(),
                    const RenderOptions& options = {});

// Renders only the node with `id`, cropped to its layer bounds after
// mapping them through `ts`. Returns nullopt for unknown ids and nodes
// with empty bounds.
std::optional<Pixmap> render_node(const tree::Tree& tree, std::string_view id,
                                  const geom::Transform& ts, const RenderOptions& options = {});

} // namespace tinta::render
