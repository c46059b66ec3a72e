#ifndef TINTA_CORE_CONFIG_H
#define TINTA_CORE_CONFIG_H

#include <cstdint>

namespace tinta::core::config {

inline constexpr float kDefaultDpi = 96.0f;
inline constexpr float kDefaultFontSize = 12.0f;
inline constexpr const char kDefaultFontFamily[] = "Times New Roman";

// Size used when the root element has neither width/height nor a viewBox.
inline constexpr float kDefaultDocumentWidth = 100.0f;
inline constexpr float kDefaultDocumentHeight = 100.0f;

// Maximum distance (device pixels) between a curve and its polyline.
inline constexpr float kFlattenTolerance = 0.1f;
inline constexpr int kMaxFlattenDepth = 16;

// Strokes that would split into more dashes than this are drawn solid.
inline constexpr std::uint32_t kMaxDashCount = 1000000;

// Sub-scanlines sampled per pixel row by the anti-aliased rasterizer.
inline constexpr int kSubScanlines = 16;

inline constexpr int kMaxUseDepth = 32;
inline constexpr int kMaxHrefChain = 32;
inline constexpr int kMaxNestedClipDepth = 16;

inline constexpr std::uint32_t kMaxPixmapDimension = 32768;
inline constexpr std::uint64_t kMaxPixmapBytes = 1ull << 31;

inline constexpr std::uint32_t kDefaultPngDpi = 96;

}  // namespace tinta::core::config

#endif  // TINTA_CORE_CONFIG_H
