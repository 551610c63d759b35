/**
 * @file image_codec.h
 * @brief PNG encode/decode, resize and base64 helpers (stb)
 */

#pragma once

#include "model_types.h"
#include "outcome.h"
#include <cstdint>
#include <string>
#include <vector>

namespace deestudio {

/**
 * @brief Encode an RGB/RGBA image as PNG
 * @return PNG bytes, empty on failure
 */
std::vector<uint8_t> encode_png(const Image& image);

/**
 * @brief Decode PNG/JPEG/BMP/... bytes into an RGB image
 */
Outcome<Image> decode_image(const uint8_t* data, size_t size);

inline Outcome<Image> decode_image(const std::vector<uint8_t>& bytes) {
    return decode_image(bytes.data(), bytes.size());
}

/**
 * @brief Bilinear resize; returns a copy when the size already matches
 */
Image resize_bilinear(const Image& image, int width, int height);

std::string base64_encode(const uint8_t* data, size_t len);

inline std::string base64_encode(const std::vector<uint8_t>& bytes) {
    return base64_encode(bytes.data(), bytes.size());
}

/**
 * @brief Decode standard base64; stops at padding or the first invalid character
 */
std::vector<uint8_t> base64_decode(const std::string& encoded);

/**
 * @brief "data:<mime>;base64,<payload>"
 */
std::string to_data_url(const std::vector<uint8_t>& bytes, const std::string& mime = "image/png");

/**
 * @brief Strip an optional "data:...;base64," prefix and decode the payload
 */
std::vector<uint8_t> decode_data_url(const std::string& data_url);

} // namespace deestudio
