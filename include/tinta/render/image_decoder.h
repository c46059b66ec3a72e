#pragma once
#include <tinta/tree/tree.h>

#include <cstdint>
#include <memory>
#include <vector>

namespace tinta::render {

// Turns encoded image bytes into premultiplied RGBA8 pixels.
class ImageDecoder {
public:
    virtual ~ImageDecoder() = default;
    // Returns nullptr when the bytes cannot be decoded.
    virtual std::shared_ptr<const tree::ImageData> decode(const std::vector<uint8_t>& bytes) const = 0;
};

// PNG, JPEG, GIF, BMP and the other formats stb_image reads.
class StbImageDecoder : public ImageDecoder {
public:
    std::shared_ptr<const tree::ImageData> decode(const std::vector<uint8_t>& bytes) const override;
};

} // namespace tinta::render
