#include <tinta/paint/color.h>

#include <array>
#include <cmath>

namespace tinta::paint {

float srgb_to_linear(float v) {
    if (v <= 0.04045f) return v / 12.92f;
    return std::pow((v + 0.055f) / 1.055f, 2.4f);
}

float linear_to_srgb(float v) {
    if (v <= 0.0031308f) return v * 12.92f;
    return 1.055f * std::pow(v, 1.0f / 2.4f) - 0.055f;
}

namespace {

std::array<uint8_t, 256> build_table(float (*fn)(float)) {
    std::array<uint8_t, 256> table{};
    for (int i = 0; i < 256; i++) table[i] = to_u8(fn(static_cast<float>(i) / 255.0f));
    return table;
}

} // namespace

const uint8_t* srgb_to_linear_table() {
    static const std::array<uint8_t, 256> table = build_table(srgb_to_linear);
    return table.data();
}

const uint8_t* linear_to_srgb_table() {
    static const std::array<uint8_t, 256> table = build_table(linear_to_srgb);
    return table.data();
}

} // namespace tinta::paint
