/**
 * @file model_registry.h
 * @brief Weight manifests and the on-disk model layout
 *
 * Directory Structure (under models_root):
 * ├── stable_diffusion_xl/
 * │   └── sd_xl_base_1.0.safetensors          <- SDXL single-file checkpoint
 * ├── FLUX/FLUX.1-dev/
 * │   ├── flux1-dev.safetensors               <- denoiser
 * │   ├── ae.safetensors                      <- latent encoder/decoder
 * │   ├── text_encoder/model.safetensors      <- CLIP-L
 * │   └── text_encoder_2/t5xxl.safetensors    <- T5-XXL
 * └── lora/flux/overlay.safetensors           <- optional overlay weights
 */

#pragma once

#include "model_types.h"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace deestudio {

namespace fs = std::filesystem;

/**
 * @enum ComponentRole
 * @brief Role of a weight file inside a pipeline
 */
enum class ComponentRole {
    CHECKPOINT,         // All-in-one checkpoint (SDXL)
    DENOISER,           // Diffusion transformer / UNet
    VAE,                // Latent encoder/decoder
    CLIP_L,             // CLIP-L text encoder
    CLIP_G,             // CLIP-G text encoder
    T5XXL               // T5-XXL text encoder
};

std::string role_to_string(ComponentRole role);

/**
 * @struct WeightComponent
 * @brief One named weight file reference
 */
struct WeightComponent {
    ComponentRole role;
    fs::path path;
    bool required = true;

    bool present() const;
};

/**
 * @struct OverlaySpec
 * @brief Overlay (LoRA) weights applied on top of a base pipeline
 */
struct OverlaySpec {
    fs::path path;
    float strength = 1.0f;

    /// Name used in the prompt tag (file stem)
    std::string name() const { return path.stem().string(); }
};

/**
 * @struct WeightManifest
 * @brief Ordered weight components needed to construct one family
 */
struct WeightManifest {
    ModelFamily family = ModelFamily::SDXL;
    std::vector<WeightComponent> components;
    std::optional<OverlaySpec> overlay;

    const WeightComponent* find(ComponentRole role) const;

    /// Required components whose files are missing
    std::vector<WeightComponent> missing() const;

    bool complete() const { return missing().empty(); }

    /// Sum of present component sizes (estimate of host/device footprint)
    uint64_t total_bytes() const;
};

/**
 * @brief Source of weight manifests per family
 */
class ManifestProvider {
public:
    virtual ~ManifestProvider() = default;

    virtual WeightManifest manifest_for(ModelFamily family) const = 0;

    /**
     * @brief Read-only availability query (all required files present)
     */
    virtual bool is_available(ModelFamily family) const {
        return manifest_for(family).complete();
    }
};

/**
 * @struct RegistryConfig
 * @brief Filesystem layout configuration
 */
struct RegistryConfig {
    fs::path models_root = "models";
    fs::path overlay_path = "lora/flux/overlay.safetensors";   ///< Relative to models_root unless absolute
    std::optional<ModelFamily> overlay_family = ModelFamily::FLUX;
    float overlay_strength = 1.0f;
};

/**
 * @class ModelRegistry
 * @brief Filesystem location convention per family
 */
class ModelRegistry : public ManifestProvider {
public:
    explicit ModelRegistry(RegistryConfig config);

    WeightManifest manifest_for(ModelFamily family) const override;

    const RegistryConfig& config() const { return config_; }

    /**
     * @brief Overlay file for a family, only if configured and present on disk
     */
    std::optional<OverlaySpec> overlay_for(ModelFamily family) const;

private:
    RegistryConfig config_;

    fs::path resolve(const fs::path& relative) const;
};

} // namespace deestudio
