#pragma once
#include <tinta/core/config.h>
#include <tinta/render/pixmap.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tinta::render {

// Encodes `pixmap` as an 8-bit RGBA PNG with straight alpha. A pHYs chunk
// records `dpi`. Returns nullopt for an empty pixmap or an encoder failure.
std::optional<std::vector<uint8_t>> encode_png(const Pixmap& pixmap,
                                               uint32_t dpi = core::config::kDefaultPngDpi);

bool save_png(const Pixmap& pixmap, const std::string& filename,
              uint32_t dpi = core::config::kDefaultPngDpi);

} // namespace tinta::render
