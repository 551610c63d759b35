/**
 * @file image_codec.cpp
 * @brief stb-backed image codec
 */

#include "deestudio/image_codec.h"
#include <algorithm>
#include <cctype>
#include <cmath>

#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_STATIC
#include "stb_image.h"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#define STB_IMAGE_WRITE_STATIC
#include "stb_image_write.h"

namespace deestudio {

static void append_png_bytes(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<uint8_t>*>(context);
    const auto* bytes = static_cast<const uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

std::vector<uint8_t> encode_png(const Image& image) {
    std::vector<uint8_t> png;
    if (image.empty() || image.channels < 1 || image.channels > 4) {
        return png;
    }
    if (image.pixels.size() < static_cast<size_t>(image.width) * image.height * image.channels) {
        return png;
    }

    int ok = stbi_write_png_to_func(append_png_bytes, &png,
                                    image.width, image.height, image.channels,
                                    image.pixels.data(), image.width * image.channels);
    if (!ok) {
        png.clear();
    }
    return png;
}

Outcome<Image> decode_image(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        return Outcome<Image>::fail(ErrorKind::ValidationError, "Empty image payload");
    }

    int width = 0, height = 0, channels = 0;
    unsigned char* rgb_data = stbi_load_from_memory(
        data, static_cast<int>(size), &width, &height, &channels, 3  // Force RGB
    );
    if (!rgb_data) {
        const char* reason = stbi_failure_reason();
        return Outcome<Image>::fail(ErrorKind::ValidationError,
            std::string("Failed to decode image format: ") + (reason ? reason : "unknown"));
    }

    Image image;
    image.width = width;
    image.height = height;
    image.channels = 3;
    image.pixels.assign(rgb_data, rgb_data + static_cast<size_t>(width) * height * 3);
    stbi_image_free(rgb_data);

    return Outcome<Image>::ok(std::move(image));
}

Image resize_bilinear(const Image& image, int width, int height) {
    if (image.empty() || width <= 0 || height <= 0) {
        return Image();
    }
    if (image.width == width && image.height == height) {
        return image;
    }

    const int c = image.channels;
    Image out;
    out.width = width;
    out.height = height;
    out.channels = c;
    out.pixels.resize(static_cast<size_t>(width) * height * c);

    // Pixel-center alignment
    const float sx = static_cast<float>(image.width) / width;
    const float sy = static_cast<float>(image.height) / height;

    for (int y = 0; y < height; ++y) {
        float fy = std::max(0.0f, (y + 0.5f) * sy - 0.5f);
        int y0 = std::min(static_cast<int>(fy), image.height - 1);
        int y1 = std::min(y0 + 1, image.height - 1);
        float wy = fy - y0;

        for (int x = 0; x < width; ++x) {
            float fx = std::max(0.0f, (x + 0.5f) * sx - 0.5f);
            int x0 = std::min(static_cast<int>(fx), image.width - 1);
            int x1 = std::min(x0 + 1, image.width - 1);
            float wx = fx - x0;

            const uint8_t* p00 = &image.pixels[(static_cast<size_t>(y0) * image.width + x0) * c];
            const uint8_t* p01 = &image.pixels[(static_cast<size_t>(y0) * image.width + x1) * c];
            const uint8_t* p10 = &image.pixels[(static_cast<size_t>(y1) * image.width + x0) * c];
            const uint8_t* p11 = &image.pixels[(static_cast<size_t>(y1) * image.width + x1) * c];
            uint8_t* dst = &out.pixels[(static_cast<size_t>(y) * width + x) * c];

            for (int k = 0; k < c; ++k) {
                float top = p00[k] + (p01[k] - p00[k]) * wx;
                float bottom = p10[k] + (p11[k] - p10[k]) * wx;
                float v = top + (bottom - top) * wy;
                dst[k] = static_cast<uint8_t>(std::clamp(std::lround(v), 0L, 255L));
            }
        }
    }
    return out;
}

std::string base64_encode(const uint8_t* data, size_t len) {
    static const char* chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string result;
    result.reserve((len + 2) / 3 * 4);

    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 16);
        if (i + 1 < len) n |= (static_cast<uint32_t>(data[i + 1]) << 8);
        if (i + 2 < len) n |= data[i + 2];

        result += chars[(n >> 18) & 0x3F];
        result += chars[(n >> 12) & 0x3F];
        result += (i + 1 < len) ? chars[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < len) ? chars[n & 0x3F] : '=';
    }
    return result;
}

static int base64_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    std::vector<uint8_t> result;
    result.reserve(encoded.size() / 4 * 3);

    uint32_t buffer = 0;
    int bits = 0;
    for (char c : encoded) {
        if (c == '=') break;
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        int value = base64_value(c);
        if (value < 0) break;

        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFF));
        }
    }
    return result;
}

std::string to_data_url(const std::vector<uint8_t>& bytes, const std::string& mime) {
    return "data:" + mime + ";base64," + base64_encode(bytes);
}

std::vector<uint8_t> decode_data_url(const std::string& data_url) {
    size_t comma = data_url.find(',');
    if (data_url.compare(0, 5, "data:") == 0 && comma != std::string::npos) {
        return base64_decode(data_url.substr(comma + 1));
    }
    return base64_decode(data_url);
}

} // namespace deestudio
