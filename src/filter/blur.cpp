#include "blur.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <numbers>
#include <vector>

namespace tinta::filter {

namespace {

constexpr float kBoxBlurThreshold = 2.0f;

// Box filter over one line of RGBA pixels, window [i - left, i + right].
void box_line(const std::vector<uint8_t>& src, std::vector<uint8_t>& dst, int32_t count,
              int32_t left, int32_t right) {
    const int32_t size = left + right + 1;
    for (int c = 0; c < 4; ++c) {
        int32_t sum = 0;
        for (int32_t k = 0; k <= std::min(right, count - 1); ++k) sum += src[k * 4 + c];
        for (int32_t i = 0; i < count; ++i) {
            dst[i * 4 + c] = static_cast<uint8_t>((sum + size / 2) / size);
            int32_t add = i + right + 1;
            int32_t sub = i - left;
            if (add < count) sum += src[add * 4 + c];
            if (sub >= 0) sum -= src[sub * 4 + c];
        }
    }
}

void box_blur_line(std::vector<uint8_t>& line, std::vector<uint8_t>& scratch, int32_t count,
                   float sigma) {
    auto d = static_cast<int32_t>(std::floor(sigma * 3.0f * std::sqrt(2.0f * std::numbers::pi_v<float>) / 4.0f + 0.5f));
    if (d <= 1) return;
    int32_t half = d / 2;
    if (d % 2 == 1) {
        box_line(line, scratch, count, half, half);
        box_line(scratch, line, count, half, half);
        box_line(line, scratch, count, half, half);
    } else {
        // Two boxes of size d offset by half a pixel either way, then one of d + 1.
        box_line(line, scratch, count, half, half - 1);
        box_line(scratch, line, count, half - 1, half);
        box_line(line, scratch, count, half, half);
    }
    line.swap(scratch);
}

std::vector<float> gaussian_kernel(float sigma, int32_t& radius) {
    radius = static_cast<int32_t>(std::ceil(sigma * 3.0f));
    std::vector<float> kernel(static_cast<size_t>(radius) * 2 + 1);
    float sum = 0;
    for (int32_t i = -radius; i <= radius; ++i) {
        float w = std::exp(-static_cast<float>(i * i) / (2.0f * sigma * sigma));
        kernel[static_cast<size_t>(i + radius)] = w;
        sum += w;
    }
    for (float& w : kernel) w /= sum;
    return kernel;
}

void exact_blur_line(std::vector<uint8_t>& line, std::vector<uint8_t>& scratch, int32_t count,
                     const std::vector<float>& kernel, int32_t radius) {
    for (int32_t i = 0; i < count; ++i) {
        float acc[4] = {0, 0, 0, 0};
        int32_t from = std::max(0, i - radius);
        int32_t to = std::min(count - 1, i + radius);
        for (int32_t k = from; k <= to; ++k) {
            float w = kernel[static_cast<size_t>(k - i + radius)];
            for (int c = 0; c < 4; ++c) acc[c] += w * line[k * 4 + c];
        }
        uint8_t a = static_cast<uint8_t>(std::clamp(acc[3] + 0.5f, 0.0f, 255.0f));
        scratch[i * 4 + 3] = a;
        for (int c = 0; c < 3; ++c) {
            scratch[i * 4 + c] = std::min(a, static_cast<uint8_t>(std::clamp(acc[c] + 0.5f, 0.0f, 255.0f)));
        }
    }
    line.swap(scratch);
}

void blur_axis(render::Pixmap& image, bool horizontal, float sigma) {
    if (!(sigma > 0)) return;
    auto w = static_cast<int32_t>(image.width());
    auto h = static_cast<int32_t>(image.height());
    int32_t lines = horizontal ? h : w;
    int32_t count = horizontal ? w : h;
    size_t step = horizontal ? 4 : static_cast<size_t>(w) * 4;

    std::vector<uint8_t> line(static_cast<size_t>(count) * 4);
    std::vector<uint8_t> scratch(line.size());
    int32_t radius = 0;
    std::vector<float> kernel;
    if (sigma < kBoxBlurThreshold) kernel = gaussian_kernel(sigma, radius);

    uint8_t* data = image.data().data();
    for (int32_t l = 0; l < lines; ++l) {
        uint8_t* base = horizontal ? data + static_cast<size_t>(l) * w * 4 : data + static_cast<size_t>(l) * 4;
        for (int32_t i = 0; i < count; ++i) {
            std::copy_n(base + static_cast<size_t>(i) * step, 4, line.begin() + i * 4);
        }
        if (sigma < kBoxBlurThreshold) {
            exact_blur_line(line, scratch, count, kernel, radius);
        } else {
            box_blur_line(line, scratch, count, sigma);
        }
        for (int32_t i = 0; i < count; ++i) {
            std::copy_n(line.begin() + i * 4, 4, base + static_cast<size_t>(i) * step);
        }
    }
}

} // namespace

void gaussian_blur(render::Pixmap& image, float std_dev_x, float std_dev_y) {
    if (image.is_empty()) return;
    blur_axis(image, true, std_dev_x);
    blur_axis(image, false, std_dev_y);
}

} // namespace tinta::filter
