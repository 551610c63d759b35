/**
 * @file sd_pipeline_loader.h
 * @brief stable-diffusion.cpp backed pipelines
 *
 * One sd_ctx_t per pipeline. The context is freed in the destructor, so
 * dropping the unique_ptr held by the cache slot releases all device memory
 * the backend allocated for that family.
 */

#pragma once

#include "pipeline.h"
#include <string>

// sd_ctx_t is an opaque C struct; sd_image_t is a typedef and stays in the .cpp
struct sd_ctx_t;

namespace deestudio {

/**
 * @struct SdLoaderConfig
 * @brief Backend tuning shared by all families
 */
struct SdLoaderConfig {
    int n_threads = -1;                 ///< -1 = physical core count
    bool flash_attn = true;
    std::string min_log_level = "info"; ///< debug, info, warn, error
};

/**
 * @class SdPipeline
 * @brief RAII owner of one stable-diffusion.cpp context
 */
class SdPipeline : public Pipeline {
public:
    SdPipeline(ModelFamily family, sd_ctx_t* ctx, bool offload,
               std::optional<OverlaySpec> overlay);
    ~SdPipeline() override;

    SdPipeline(const SdPipeline&) = delete;
    SdPipeline& operator=(const SdPipeline&) = delete;

    ModelFamily family() const override { return family_; }
    bool offload_enabled() const override { return offload_; }
    bool overlay_applied() const override { return overlay_.has_value(); }

    Outcome<Image> generate(const ImageJob& job) override;

private:
    ModelFamily family_;
    sd_ctx_t* ctx_;
    bool offload_;
    std::optional<OverlaySpec> overlay_;
};

/**
 * @class SdPipelineLoader
 * @brief Builds SdPipeline objects from weight manifests
 */
class SdPipelineLoader : public PipelineLoader {
public:
    explicit SdPipelineLoader(SdLoaderConfig config = {});

    Outcome<std::unique_ptr<Pipeline>> load(
        const WeightManifest& manifest,
        bool offload,
        const std::optional<OverlaySpec>& overlay) override;

    /**
     * @brief Backend build/system description
     */
    static std::string system_info();

private:
    SdLoaderConfig config_;
};

} // namespace deestudio
