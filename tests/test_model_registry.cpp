/**
 * @file test_model_registry.cpp
 * @brief On-disk layout and manifest completeness
 */

#include <gtest/gtest.h>

#include "deestudio/model_registry.h"
#include "test_helpers.h"

using namespace deestudio;
using namespace deestudio::testing_support;

namespace {

class ModelRegistryTest : public TempDirTest {
protected:
    RegistryConfig config() const {
        RegistryConfig cfg;
        cfg.models_root = root_;
        return cfg;
    }

    void install_flux() {
        touch("FLUX/FLUX.1-dev/flux1-dev.safetensors", "denoiser");
        touch("FLUX/FLUX.1-dev/ae.safetensors", "vae");
        touch("FLUX/FLUX.1-dev/text_encoder/model.safetensors", "clip");
        touch("FLUX/FLUX.1-dev/text_encoder_2/t5xxl.safetensors", "t5");
    }
};

}  // namespace

TEST_F(ModelRegistryTest, EmptyRootHasNothingAvailable) {
    ModelRegistry registry(config());
    EXPECT_FALSE(registry.is_available(ModelFamily::SDXL));
    EXPECT_FALSE(registry.is_available(ModelFamily::FLUX));
    EXPECT_EQ(registry.manifest_for(ModelFamily::FLUX).missing().size(), 4u);
}

TEST_F(ModelRegistryTest, SdxlIsASingleCheckpoint) {
    touch("stable_diffusion_xl/sd_xl_base_1.0.safetensors", "0123456789");
    ModelRegistry registry(config());

    WeightManifest manifest = registry.manifest_for(ModelFamily::SDXL);
    ASSERT_EQ(manifest.components.size(), 1u);
    EXPECT_EQ(manifest.components[0].role, ComponentRole::CHECKPOINT);
    EXPECT_TRUE(manifest.complete());
    EXPECT_EQ(manifest.total_bytes(), 10u);
    EXPECT_TRUE(registry.is_available(ModelFamily::SDXL));
    EXPECT_FALSE(manifest.overlay.has_value());
}

TEST_F(ModelRegistryTest, FluxNeedsAllFourComponents) {
    install_flux();
    fs::remove(root_ / "FLUX/FLUX.1-dev/text_encoder_2/t5xxl.safetensors");
    ModelRegistry registry(config());

    WeightManifest manifest = registry.manifest_for(ModelFamily::FLUX);
    auto missing = manifest.missing();
    ASSERT_EQ(missing.size(), 1u);
    EXPECT_EQ(missing[0].role, ComponentRole::T5XXL);
    EXPECT_FALSE(registry.is_available(ModelFamily::FLUX));

    touch("FLUX/FLUX.1-dev/text_encoder_2/t5xxl.safetensors", "t5");
    EXPECT_TRUE(registry.is_available(ModelFamily::FLUX));
    ASSERT_NE(manifest.find(ComponentRole::DENOISER), nullptr);
    EXPECT_EQ(manifest.find(ComponentRole::CLIP_G), nullptr);
}

TEST_F(ModelRegistryTest, OverlayAppliedOnlyWhenPresent) {
    install_flux();
    RegistryConfig cfg = config();
    cfg.overlay_strength = 0.8f;
    ModelRegistry registry(cfg);

    EXPECT_FALSE(registry.manifest_for(ModelFamily::FLUX).overlay.has_value());

    touch("lora/flux/overlay.safetensors", "overlay");
    WeightManifest manifest = registry.manifest_for(ModelFamily::FLUX);
    ASSERT_TRUE(manifest.overlay.has_value());
    EXPECT_EQ(manifest.overlay->name(), "overlay");
    EXPECT_FLOAT_EQ(manifest.overlay->strength, 0.8f);

    // Overlay never attaches to the other family
    EXPECT_FALSE(registry.manifest_for(ModelFamily::SDXL).overlay.has_value());
}

TEST_F(ModelRegistryTest, AbsoluteOverlayPathIsNotRebased) {
    fs::path overlay = touch("elsewhere/style.safetensors", "overlay");
    RegistryConfig cfg = config();
    cfg.models_root = root_ / "models";
    cfg.overlay_path = overlay;
    ModelRegistry registry(cfg);

    auto spec = registry.overlay_for(ModelFamily::FLUX);
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->path, overlay);
    EXPECT_EQ(spec->name(), "style");
}

TEST(ComponentRole, Names) {
    EXPECT_EQ(role_to_string(ComponentRole::DENOISER), "denoiser");
    EXPECT_EQ(role_to_string(ComponentRole::T5XXL), "t5xxl");
    EXPECT_EQ(role_to_string(ComponentRole::CHECKPOINT), "checkpoint");
}
