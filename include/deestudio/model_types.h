/**
 * @file model_types.h
 * @brief Model family and request/result type definitions for DeeStudio
 *
 * Supports two interchangeable image-generation families:
 * - SDXL (Stable Diffusion XL, classifier-free guidance)
 * - FLUX (FLUX.1-dev, distilled guidance, CPU offload)
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <optional>

namespace deestudio {

/**
 * @enum ModelFamily
 * @brief Interchangeable generative-model pipeline types
 */
enum class ModelFamily {
    SDXL,               // Stable Diffusion XL base 1.0
    FLUX                // FLUX.1-dev
};

/**
 * @enum GuidanceKind
 * @brief How the guidance parameter is fed to the sampler
 */
enum class GuidanceKind {
    CFG,                // Classifier-free guidance scale (txt_cfg)
    DISTILLED           // Embedded guidance, CFG fixed at 1.0
};

/**
 * @enum GenerationMode
 * @brief Text-to-image or image-to-image
 */
enum class GenerationMode {
    TEXT_TO_IMAGE,
    IMAGE_TO_IMAGE
};

/**
 * @struct ImageSize
 * @brief Image dimensions
 */
struct ImageSize {
    int width = 1024;
    int height = 1024;

    size_t pixels() const { return static_cast<size_t>(width) * height; }

    bool operator==(const ImageSize& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const ImageSize& other) const { return !(*this == other); }
};

/**
 * @struct FamilyTraits
 * @brief Static parameter constraints of a model family
 */
struct FamilyTraits {
    ModelFamily family;
    const char* id;                  // "sdxl", "flux"
    const char* display_name;
    const char* description;

    int size_multiple;               // width/height divisibility
    int min_size;
    int max_size;
    ImageSize default_size;

    int min_steps;
    int max_steps;
    int default_steps;

    float min_guidance;
    float max_guidance;
    float default_guidance;
    float guidance_step;             // UI slider increment
    GuidanceKind guidance_kind;

    bool uses_negative_prompt;
    bool default_offload;            // Keep weights in host memory by default
};

// Batch size limits shared by all families
constexpr int kMinImageCount = 1;
constexpr int kMaxImageCount = 4;

// Upper bound (exclusive) for seeds drawn when the caller supplies none
constexpr int64_t kRandomSeedBound = 1000000000;

/**
 * @brief Get the traits table entry for a family
 */
const FamilyTraits& family_traits(ModelFamily family);

/**
 * @brief All known families, in listing order
 */
const std::vector<ModelFamily>& all_families();

/**
 * @brief Get string id of family ("sdxl", "flux")
 */
std::string family_to_string(ModelFamily family);

/**
 * @brief Parse family id (case-insensitive)
 * @return Family or nullopt if unknown
 */
std::optional<ModelFamily> parse_family(const std::string& id);

/**
 * @brief Get string representation of mode ("txt2img", "img2img")
 */
std::string mode_to_string(GenerationMode mode);

/**
 * @struct Image
 * @brief Interleaved 8-bit pixel buffer
 */
struct Image {
    int width = 0;
    int height = 0;
    int channels = 3;
    std::vector<uint8_t> pixels;

    bool empty() const { return pixels.empty() || width <= 0 || height <= 0; }
    ImageSize size() const { return {width, height}; }
};

/**
 * @struct GenerationRequest
 * @brief One generation call as submitted by the route layer
 */
struct GenerationRequest {
    ModelFamily family = ModelFamily::SDXL;
    GenerationMode mode = GenerationMode::TEXT_TO_IMAGE;

    std::string prompt;
    std::optional<std::string> negative_prompt;
    ImageSize size = {1024, 1024};
    int num_images = 1;
    int steps = 20;
    float guidance = 7.5f;           // CFG scale (SDXL) or embedded guidance (FLUX)
    std::optional<int64_t> seed;     // Drawn once per request when absent

    std::optional<Image> input_image;    // Image-to-image only
    float denoising_strength = 0.75f;    // Image-to-image only
    bool tiled = false;
};

/**
 * @struct ImageJob
 * @brief Fully resolved parameters of a single-image pipeline call
 */
struct ImageJob {
    std::string prompt;
    std::string negative_prompt;     // Empty when not applicable
    ImageSize size;
    int steps = 20;
    float guidance = 7.5f;
    int64_t seed = 0;
    const Image* init_image = nullptr;
    float strength = 0.75f;
    bool tiled = false;
};

/**
 * @struct Artifact
 * @brief A persisted generated image
 */
struct Artifact {
    std::string id;                  // UUID v4 text form
    std::string filename;
    std::string path;                // On-disk location
    std::string url;                 // Public retrieval path
    std::string data_url;            // data:image/png;base64,...
    std::vector<uint8_t> png;        // Encoded payload
    ImageSize size;
    int64_t seed = 0;
};

/**
 * @struct GenerationResult
 * @brief Ordered artifacts of a successful request
 */
struct GenerationResult {
    ModelFamily family = ModelFamily::SDXL;
    GenerationMode mode = GenerationMode::TEXT_TO_IMAGE;
    std::vector<Artifact> artifacts;
    int64_t seed = 0;                // Resolved base seed
    std::vector<int64_t> seeds;      // Per-image seeds, result order
    double generation_time_s = 0.0;
    bool cache_hit = false;
};

} // namespace deestudio
