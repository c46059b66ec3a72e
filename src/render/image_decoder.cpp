#include <tinta/render/image_decoder.h>

#include <stb_image.h>

namespace tinta::render {

std::shared_ptr<const tree::ImageData> StbImageDecoder::decode(const std::vector<uint8_t>& bytes) const {
    if (bytes.empty()) return nullptr;

    int w = 0, h = 0, channels = 0;
    unsigned char* data = stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()),
                                                &w, &h, &channels, 4);
    if (!data) return nullptr;

    auto image = std::make_shared<tree::ImageData>();
    image->width = static_cast<uint32_t>(w);
    image->height = static_cast<uint32_t>(h);
    image->pixels.assign(data, data + static_cast<size_t>(w) * static_cast<size_t>(h) * 4);
    stbi_image_free(data);

    // stb_image returns straight alpha.
    for (size_t i = 0; i < image->pixels.size(); i += 4) {
        uint32_t a = image->pixels[i + 3];
        if (a == 255) continue;
        for (size_t c = 0; c < 3; ++c) {
            image->pixels[i + c] = static_cast<uint8_t>((image->pixels[i + c] * a + 127) / 255);
        }
    }
    return image;
}

} // namespace tinta::render
