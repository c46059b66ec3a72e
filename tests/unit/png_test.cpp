#include <tinta/render/image_decoder.h>
#include <tinta/render/png.h>

#include <gtest/gtest.h>

#include <cstring>
#include <filesystem>

using namespace tinta;
using namespace tinta::render;

namespace {

uint32_t read_be32(const std::vector<uint8_t>& bytes, size_t offset) {
    return (static_cast<uint32_t>(bytes[offset]) << 24) | (static_cast<uint32_t>(bytes[offset + 1]) << 16) |
           (static_cast<uint32_t>(bytes[offset + 2]) << 8) | bytes[offset + 3];
}

Pixmap two_pixels() {
    auto pixmap = Pixmap::create(2, 1);
    EXPECT_TRUE(pixmap.has_value());
    uint8_t* opaque = pixmap->pixel_ptr(0, 0);
    opaque[0] = 255;
    opaque[3] = 255;
    uint8_t* half = pixmap->pixel_ptr(1, 0);
    half[0] = 128;
    half[3] = 128;
    return std::move(*pixmap);
}

} // namespace

// ---------------------------------------------------------------------------
// 1. Output starts with the PNG signature and a pHYs chunk after IHDR
// ---------------------------------------------------------------------------
TEST(PngTest, SignatureAndResolution) {
    auto png = encode_png(two_pixels());
    ASSERT_TRUE(png.has_value());
    ASSERT_GT(png->size(), 50u);

    const uint8_t signature[] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'};
    EXPECT_EQ(std::memcmp(png->data(), signature, sizeof(signature)), 0);
    EXPECT_EQ(std::memcmp(png->data() + 12, "IHDR", 4), 0);

    EXPECT_EQ(read_be32(*png, 33), 9u);
    EXPECT_EQ(std::memcmp(png->data() + 37, "pHYs", 4), 0);
    EXPECT_EQ(read_be32(*png, 41), 3780u);
    EXPECT_EQ(read_be32(*png, 45), 3780u);
    EXPECT_EQ((*png)[49], 1);
}

// ---------------------------------------------------------------------------
// 2. The resolution follows the requested DPI
// ---------------------------------------------------------------------------
TEST(PngTest, CustomDpi) {
    auto png = encode_png(two_pixels(), 300);
    ASSERT_TRUE(png.has_value());
    EXPECT_EQ(read_be32(*png, 41), 11811u);
}

// ---------------------------------------------------------------------------
// 3. Pixels are stored with straight alpha and decode back
// ---------------------------------------------------------------------------
TEST(PngTest, DecodesBack) {
    auto png = encode_png(two_pixels());
    ASSERT_TRUE(png.has_value());

    StbImageDecoder decoder;
    auto image = decoder.decode(*png);
    ASSERT_NE(image, nullptr);
    ASSERT_EQ(image->width, 2u);
    ASSERT_EQ(image->height, 1u);
    EXPECT_EQ(image->pixels[0], 255);
    EXPECT_EQ(image->pixels[3], 255);
    EXPECT_EQ(image->pixels[4], 128);
    EXPECT_EQ(image->pixels[7], 128);
}

// ---------------------------------------------------------------------------
// 4. Empty pixmaps and unwritable paths fail
// ---------------------------------------------------------------------------
TEST(PngTest, Failures) {
    EXPECT_FALSE(encode_png(Pixmap{}).has_value());
    EXPECT_FALSE(save_png(Pixmap{}, "unused.png"));
    EXPECT_FALSE(save_png(two_pixels(), "/nonexistent-dir/out.png"));
    EXPECT_EQ(StbImageDecoder{}.decode({}), nullptr);
}

// ---------------------------------------------------------------------------
// 5. save_png writes the encoded bytes to disk
// ---------------------------------------------------------------------------
TEST(PngTest, SaveToFile) {
    auto path = std::filesystem::temp_directory_path() / "tinta_png_test.png";
    ASSERT_TRUE(save_png(two_pixels(), path.string()));
    auto png = encode_png(two_pixels());
    ASSERT_TRUE(png.has_value());
    EXPECT_EQ(std::filesystem::file_size(path), png->size());
    std::filesystem::remove(path);
}
