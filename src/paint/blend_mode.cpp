#include <tinta/paint/blend_mode.h>

namespace tinta::paint {

namespace {

struct BlendName {
    BlendMode mode;
    const char* name;
};

constexpr BlendName kBlendNames[] = {
    {BlendMode::Normal, "normal"},          {BlendMode::Multiply, "multiply"},
    {BlendMode::Screen, "screen"},          {BlendMode::Overlay, "overlay"},
    {BlendMode::Darken, "darken"},          {BlendMode::Lighten, "lighten"},
    {BlendMode::ColorDodge, "color-dodge"}, {BlendMode::ColorBurn, "color-burn"},
    {BlendMode::HardLight, "hard-light"},   {BlendMode::SoftLight, "soft-light"},
    {BlendMode::Difference, "difference"},  {BlendMode::Exclusion, "exclusion"},
    {BlendMode::Hue, "hue"},                {BlendMode::Saturation, "saturation"},
    {BlendMode::Color, "color"},            {BlendMode::Luminosity, "luminosity"},
};

} // namespace

std::optional<BlendMode> blend_mode_from_name(std::string_view name) {
    for (const auto& entry : kBlendNames) {
        if (name == entry.name) return entry.mode;
    }
    return std::nullopt;
}

const char* blend_mode_name(BlendMode mode) {
    for (const auto& entry : kBlendNames) {
        if (entry.mode == mode) return entry.name;
    }
    return "normal";
}

} // namespace tinta::paint
