/**
 * @file test_image_codec.cpp
 * @brief PNG, resize and base64 helpers
 */

#include <gtest/gtest.h>

#include "deestudio/image_codec.h"
#include "test_helpers.h"

using namespace deestudio;
using namespace deestudio::testing_support;

TEST(Base64, KnownVectors) {
    const std::string text = "foobar";
    const std::vector<uint8_t> bytes(text.begin(), text.end());

    EXPECT_EQ(base64_encode(bytes.data(), 0), "");
    EXPECT_EQ(base64_encode(bytes.data(), 1), "Zg==");
    EXPECT_EQ(base64_encode(bytes.data(), 2), "Zm8=");
    EXPECT_EQ(base64_encode(bytes.data(), 3), "Zm9v");
    EXPECT_EQ(base64_encode(bytes), "Zm9vYmFy");

    EXPECT_EQ(base64_decode("Zm9vYmFy"), bytes);
    EXPECT_EQ(base64_decode("Zg=="), (std::vector<uint8_t>{'f'}));
}

TEST(Base64, DecodeSkipsWhitespace) {
    EXPECT_EQ(base64_decode("Zm9v\nYmFy"), (std::vector<uint8_t>{'f', 'o', 'o', 'b', 'a', 'r'}));
}

TEST(DataUrl, PrefixIsOptional) {
    std::vector<uint8_t> bytes = {1, 2, 3, 250};
    std::string url = to_data_url(bytes);
    EXPECT_EQ(url.rfind("data:image/png;base64,", 0), 0u);
    EXPECT_EQ(decode_data_url(url), bytes);
    EXPECT_EQ(decode_data_url(base64_encode(bytes)), bytes);
    EXPECT_EQ(to_data_url(bytes, "image/jpeg").rfind("data:image/jpeg;base64,", 0), 0u);
}

TEST(Png, EncodeDecodePreservesPixels) {
    Image image;
    image.width = 3;
    image.height = 2;
    image.channels = 3;
    image.pixels = {
        255, 0, 0,   0, 255, 0,   0, 0, 255,
        10, 20, 30,  40, 50, 60,  70, 80, 90
    };

    std::vector<uint8_t> png = encode_png(image);
    ASSERT_GT(png.size(), 8u);
    EXPECT_EQ(png[1], 'P');
    EXPECT_EQ(png[2], 'N');
    EXPECT_EQ(png[3], 'G');

    auto decoded = decode_image(png);
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value().pixels, image.pixels);
}

TEST(Png, RgbaInputDecodesAsRgb) {
    Image image;
    image.width = 1;
    image.height = 1;
    image.channels = 4;
    image.pixels = {9, 8, 7, 255};

    auto decoded = decode_image(encode_png(image));
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value().channels, 3);
    EXPECT_EQ(decoded.value().pixels, (std::vector<uint8_t>{9, 8, 7}));
}

TEST(Png, InvalidInputs) {
    EXPECT_TRUE(encode_png(Image()).empty());

    Image short_buffer = solid_image(4, 4, 0);
    short_buffer.pixels.resize(10);
    EXPECT_TRUE(encode_png(short_buffer).empty());

    std::vector<uint8_t> garbage = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'g'};
    auto decoded = decode_image(garbage);
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().kind, ErrorKind::ValidationError);

    EXPECT_FALSE(decode_image(std::vector<uint8_t>()));
}

TEST(Resize, SameSizeIsCopy) {
    Image image = solid_image(4, 4, 33);
    Image out = resize_bilinear(image, 4, 4);
    EXPECT_EQ(out.pixels, image.pixels);
}

TEST(Resize, SolidColorStaysSolid) {
    Image image = solid_image(7, 5, 123);
    Image out = resize_bilinear(image, 32, 16);
    EXPECT_EQ(out.width, 32);
    EXPECT_EQ(out.height, 16);
    ASSERT_EQ(out.pixels.size(), 32u * 16u * 3u);
    for (uint8_t v : out.pixels) {
        EXPECT_EQ(v, 123);
    }
}

TEST(Resize, InterpolatesBetweenNeighbours) {
    Image image;
    image.width = 2;
    image.height = 1;
    image.channels = 1;
    image.pixels = {0, 200};

    Image out = resize_bilinear(image, 4, 1);
    ASSERT_EQ(out.pixels.size(), 4u);
    EXPECT_EQ(out.pixels[0], 0);
    EXPECT_EQ(out.pixels[1], 50);
    EXPECT_EQ(out.pixels[2], 150);
    EXPECT_EQ(out.pixels[3], 200);
}

TEST(Resize, EmptyInputGivesEmptyOutput) {
    EXPECT_TRUE(resize_bilinear(Image(), 8, 8).empty());
    EXPECT_TRUE(resize_bilinear(solid_image(2, 2, 1), 0, 8).empty());
}
