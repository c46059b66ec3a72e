#include <tinta/render/png.h>

#include <stb_image_write.h>
#include <zlib.h>

#include <cmath>
#include <fstream>

namespace tinta::render {

namespace {

// Signature (8) plus the IHDR chunk (4 + 4 + 13 + 4).
constexpr size_t kIhdrEnd = 33;

void append_be32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v >> 24));
    out.push_back(static_cast<uint8_t>(v >> 16));
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v));
}

std::vector<uint8_t> phys_chunk(uint32_t dpi) {
    // Pixels per meter, unit specifier 1.
    auto ppm = static_cast<uint32_t>(std::lround(dpi / 0.0254));
    std::vector<uint8_t> chunk;
    append_be32(chunk, 9);
    const uint8_t type[] = {'p', 'H', 'Y', 's'};
    chunk.insert(chunk.end(), type, type + 4);
    append_be32(chunk, ppm);
    append_be32(chunk, ppm);
    chunk.push_back(1);

    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, chunk.data() + 4, static_cast<uInt>(chunk.size() - 4));
    append_be32(chunk, static_cast<uint32_t>(crc));
    return chunk;
}

void write_to_vector(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<uint8_t>*>(context);
    const auto* bytes = static_cast<const uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

} // namespace

std::optional<std::vector<uint8_t>> encode_png(const Pixmap& pixmap, uint32_t dpi) {
    if (pixmap.is_empty()) return std::nullopt;

    std::vector<uint8_t> pixels = pixmap.demultiplied();
    std::vector<uint8_t> png;
    int w = static_cast<int>(pixmap.width());
    int h = static_cast<int>(pixmap.height());
    if (stbi_write_png_to_func(write_to_vector, &png, w, h, 4, pixels.data(), w * 4) == 0) {
        return std::nullopt;
    }
    if (png.size() < kIhdrEnd) return std::nullopt;

    std::vector<uint8_t> phys = phys_chunk(dpi);
    png.insert(png.begin() + kIhdrEnd, phys.begin(), phys.end());
    return png;
}

bool save_png(const Pixmap& pixmap, const std::string& filename, uint32_t dpi) {
    auto png = encode_png(pixmap, dpi);
    if (!png) return false;
    std::ofstream file(filename, std::ios::binary);
    if (!file) return false;
    file.write(reinterpret_cast<const char*>(png->data()), static_cast<std::streamsize>(png->size()));
    return static_cast<bool>(file);
}

} // namespace tinta::render
