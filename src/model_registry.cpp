/**
 * @file model_registry.cpp
 * @brief Weight manifest construction from the models directory
 */

#include "deestudio/model_registry.h"
#include <system_error>

namespace deestudio {

std::string role_to_string(ComponentRole role) {
    switch (role) {
        case ComponentRole::CHECKPOINT: return "checkpoint";
        case ComponentRole::DENOISER: return "denoiser";
        case ComponentRole::VAE: return "vae";
        case ComponentRole::CLIP_L: return "clip_l";
        case ComponentRole::CLIP_G: return "clip_g";
        case ComponentRole::T5XXL: return "t5xxl";
    }
    return "unknown";
}

bool WeightComponent::present() const {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

const WeightComponent* WeightManifest::find(ComponentRole role) const {
    for (const auto& component : components) {
        if (component.role == role) {
            return &component;
        }
    }
    return nullptr;
}

std::vector<WeightComponent> WeightManifest::missing() const {
    std::vector<WeightComponent> result;
    for (const auto& component : components) {
        if (component.required && !component.present()) {
            result.push_back(component);
        }
    }
    return result;
}

uint64_t WeightManifest::total_bytes() const {
    uint64_t total = 0;
    for (const auto& component : components) {
        std::error_code ec;
        auto size = fs::file_size(component.path, ec);
        if (!ec) {
            total += size;
        }
    }
    return total;
}

ModelRegistry::ModelRegistry(RegistryConfig config)
    : config_(std::move(config))
{
}

fs::path ModelRegistry::resolve(const fs::path& relative) const {
    if (relative.is_absolute()) {
        return relative;
    }
    return config_.models_root / relative;
}

WeightManifest ModelRegistry::manifest_for(ModelFamily family) const {
    WeightManifest manifest;
    manifest.family = family;

    switch (family) {
        case ModelFamily::SDXL:
            manifest.components = {
                {ComponentRole::CHECKPOINT, resolve("stable_diffusion_xl/sd_xl_base_1.0.safetensors"), true},
            };
            break;

        case ModelFamily::FLUX: {
            const fs::path base = resolve("FLUX/FLUX.1-dev");
            manifest.components = {
                {ComponentRole::CLIP_L, base / "text_encoder" / "model.safetensors", true},
                {ComponentRole::T5XXL, base / "text_encoder_2" / "t5xxl.safetensors", true},
                {ComponentRole::VAE, base / "ae.safetensors", true},
                {ComponentRole::DENOISER, base / "flux1-dev.safetensors", true},
            };
            break;
        }
    }

    manifest.overlay = overlay_for(family);
    return manifest;
}

std::optional<OverlaySpec> ModelRegistry::overlay_for(ModelFamily family) const {
    if (!config_.overlay_family || *config_.overlay_family != family || config_.overlay_path.empty()) {
        return std::nullopt;
    }

    OverlaySpec overlay;
    overlay.path = resolve(config_.overlay_path);
    overlay.strength = config_.overlay_strength;

    std::error_code ec;
    if (!fs::is_regular_file(overlay.path, ec)) {
        return std::nullopt;
    }
    return overlay;
}

} // namespace deestudio
