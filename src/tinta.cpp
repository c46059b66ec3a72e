#include <tinta/tinta.h>

#include <cmath>

namespace tinta {

render::RenderResult render_document(const dom::Document& document, float zoom,
                                     const normalize::Options& normalize_options,
                                     const render::RenderOptions& render_options) {
    render::RenderResult result;
    auto tree = normalize::normalize(document, normalize_options);
    if (!tree) {
        result.error = "document has no renderable root";
        return result;
    }
    if (!(zoom > 0) || !std::isfinite(zoom)) {
        result.error = "invalid zoom factor";
        return result;
    }
    auto width = static_cast<uint32_t>(std::ceil(tree->size.width * zoom));
    auto height = static_cast<uint32_t>(std::ceil(tree->size.height * zoom));
    return render::render(*tree, width, height, paint::Color::transparent(), render_options);
}

} // namespace tinta
