/**
 * @file model_types.cpp
 * @brief Family traits table and string conversions
 */

#include "deestudio/model_types.h"
#include <algorithm>
#include <cctype>

namespace deestudio {

static const FamilyTraits kSdxlTraits = {
    ModelFamily::SDXL,
    "sdxl",
    "Stable Diffusion XL",
    "High-quality image generation, 7GB VRAM",
    8, 512, 2048, {1024, 1024},
    10, 50, 20,
    1.0f, 15.0f, 7.5f, 0.5f,
    GuidanceKind::CFG,
    true,
    false
};

static const FamilyTraits kFluxTraits = {
    ModelFamily::FLUX,
    "flux",
    "FLUX.1-dev",
    "State-of-the-art quality, 24GB VRAM (or 8GB with offload)",
    16, 512, 2048, {1024, 1024},
    10, 50, 28,
    1.0f, 5.0f, 3.5f, 0.1f,
    GuidanceKind::DISTILLED,
    false,
    true
};

const FamilyTraits& family_traits(ModelFamily family) {
    switch (family) {
        case ModelFamily::FLUX: return kFluxTraits;
        case ModelFamily::SDXL:
        default: return kSdxlTraits;
    }
}

const std::vector<ModelFamily>& all_families() {
    static const std::vector<ModelFamily> families = {ModelFamily::SDXL, ModelFamily::FLUX};
    return families;
}

std::string family_to_string(ModelFamily family) {
    return family_traits(family).id;
}

std::optional<ModelFamily> parse_family(const std::string& id) {
    std::string lower = id;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (ModelFamily family : all_families()) {
        if (lower == family_traits(family).id) {
            return family;
        }
    }
    return std::nullopt;
}

std::string mode_to_string(GenerationMode mode) {
    switch (mode) {
        case GenerationMode::IMAGE_TO_IMAGE: return "img2img";
        case GenerationMode::TEXT_TO_IMAGE:
        default: return "txt2img";
    }
}

} // namespace deestudio
