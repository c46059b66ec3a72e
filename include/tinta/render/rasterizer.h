#pragma once
#include <tinta/geom/path.h>
#include <tinta/geom/rect.h>
#include <tinta/geom/transform.h>
#include <tinta/tree/tree.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace tinta::render {

// 8-bit coverage over a rectangle of device pixels.
struct Coverage {
    geom::IntRect rect;
    std::vector<uint8_t> alpha;

    // Zero outside `rect`.
    uint8_t at(int32_t x, int32_t y) const {
        if (x < rect.x || y < rect.y || x >= rect.right() || y >= rect.bottom()) return 0;
        return alpha[static_cast<size_t>(y - rect.y) * static_cast<size_t>(rect.width) +
                     static_cast<size_t>(x - rect.x)];
    }
};

// Scan converts `path` mapped by `ts`, every subpath implicitly closed.
// With anti-aliasing each pixel row is sampled on config::kSubScanlines
// sub-scanlines with exact horizontal coverage; without it a pixel is
// either fully covered (its center is inside) or not. The result is
// clipped to `clip`; nullopt when nothing is covered.
std::optional<Coverage> rasterize(const geom::Path& path, const geom::Transform& ts,
                                  tree::FillRule rule, bool anti_alias,
                                  const geom::IntRect& clip);

} // namespace tinta::render
