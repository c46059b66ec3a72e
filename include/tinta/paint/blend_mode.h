#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

namespace tinta::paint {

enum class BlendMode : uint8_t {
    Normal, Multiply, Screen, Overlay, Darken, Lighten, ColorDodge, ColorBurn,
    HardLight, SoftLight, Difference, Exclusion, Hue, Saturation, Color, Luminosity
};

// CSS keyword (`multiply`, `color-dodge`, ...) to blend mode.
std::optional<BlendMode> blend_mode_from_name(std::string_view name);
const char* blend_mode_name(BlendMode mode);

} // namespace tinta::paint
