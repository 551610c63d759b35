/**
 * @file sd_pipeline_loader.cpp
 * @brief stable-diffusion.cpp integration for SDXL and FLUX pipelines
 */

#include "deestudio/sd_pipeline_loader.h"
#include "deestudio/safetensors_inspector.h"
#include "stable-diffusion.h"
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <sstream>

namespace deestudio {

static std::atomic<int> g_min_log_level{SD_LOG_INFO};

static int parse_log_level(const std::string& level) {
    if (level == "debug") return SD_LOG_DEBUG;
    if (level == "warn") return SD_LOG_WARN;
    if (level == "error") return SD_LOG_ERROR;
    return SD_LOG_INFO;
}

// Route backend output into the tagged console stream
static void sd_log_bridge(sd_log_level_t level, const char* text, void* data) {
    (void)data;
    if (static_cast<int>(level) < g_min_log_level.load() || !text) {
        return;
    }

    std::string line(text);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
    if (line.empty()) {
        return;
    }

    switch (level) {
        case SD_LOG_DEBUG: std::cout << "[SD DEBUG] " << line << std::endl; break;
        case SD_LOG_INFO:  std::cout << "[SD INFO] " << line << std::endl; break;
        case SD_LOG_WARN:  std::cerr << "[SD WARN] " << line << std::endl; break;
        case SD_LOG_ERROR: std::cerr << "[SD ERROR] " << line << std::endl; break;
        default:           std::cout << "[SD] " << line << std::endl; break;
    }
}

//=============================================================================
// SdPipeline
//=============================================================================

SdPipeline::SdPipeline(ModelFamily family, sd_ctx_t* ctx, bool offload,
                       std::optional<OverlaySpec> overlay)
    : family_(family)
    , ctx_(ctx)
    , offload_(offload)
    , overlay_(std::move(overlay))
{
}

SdPipeline::~SdPipeline() {
    if (ctx_) {
        free_sd_ctx(ctx_);
        ctx_ = nullptr;
        std::cout << "[SdPipeline] Released " << family_to_string(family_) << " context" << std::endl;
    }
}

Outcome<Image> SdPipeline::generate(const ImageJob& job) {
    const FamilyTraits& traits = family_traits(family_);

    std::string prompt = job.prompt;
    if (overlay_) {
        std::ostringstream tag;
        tag << " <lora:" << overlay_->name() << ":" << overlay_->strength << ">";
        prompt += tag.str();
    }

    sd_img_gen_params_t gen_params;
    sd_img_gen_params_init(&gen_params);

    gen_params.prompt = prompt.c_str();
    gen_params.negative_prompt = job.negative_prompt.c_str();
    gen_params.width = job.size.width;
    gen_params.height = job.size.height;
    gen_params.sample_params.sample_steps = job.steps;
    gen_params.seed = job.seed;
    gen_params.batch_count = 1;
    gen_params.vae_tiling_params.enabled = job.tiled;

    if (traits.guidance_kind == GuidanceKind::DISTILLED) {
        gen_params.sample_params.guidance.txt_cfg = 1.0f;
        gen_params.sample_params.guidance.distilled_guidance = job.guidance;
        gen_params.sample_params.sample_method = EULER_SAMPLE_METHOD;
    } else {
        gen_params.sample_params.guidance.txt_cfg = job.guidance;
        gen_params.sample_params.sample_method = EULER_A_SAMPLE_METHOD;
    }

    // Backend takes a mutable pointer; hand it a private copy
    std::vector<uint8_t> init_pixels;
    if (job.init_image && !job.init_image->empty()) {
        init_pixels = job.init_image->pixels;
        gen_params.init_image.width = static_cast<uint32_t>(job.init_image->width);
        gen_params.init_image.height = static_cast<uint32_t>(job.init_image->height);
        gen_params.init_image.channel = static_cast<uint32_t>(job.init_image->channels);
        gen_params.init_image.data = init_pixels.data();
        gen_params.strength = job.strength;
    }

    std::cout << "[SdPipeline] " << family_to_string(family_) << " "
              << job.size.width << "x" << job.size.height
              << ", steps=" << job.steps << ", guidance=" << job.guidance
              << ", seed=" << job.seed << (job.init_image ? ", img2img" : "") << std::endl;

    auto start_time = std::chrono::high_resolution_clock::now();
    sd_image_t* images = ::generate_image(ctx_, &gen_params);
    auto end_time = std::chrono::high_resolution_clock::now();
    double elapsed_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    if (!images) {
        return Outcome<Image>::fail(ErrorKind::GenerationFailure,
            "Image generation failed (seed " + std::to_string(job.seed) + ")");
    }

    Image image;
    sd_image_t& out = images[0];
    if (out.data) {
        image.width = static_cast<int>(out.width);
        image.height = static_cast<int>(out.height);
        image.channels = static_cast<int>(out.channel);
        size_t data_size = static_cast<size_t>(out.width) * out.height * out.channel;
        image.pixels.assign(out.data, out.data + data_size);
        free(out.data);
    }
    free(images);

    if (image.empty()) {
        return Outcome<Image>::fail(ErrorKind::GenerationFailure,
            "Backend returned an empty image (seed " + std::to_string(job.seed) + ")");
    }

    std::cout << "[SdPipeline] Image done in " << elapsed_ms << " ms" << std::endl;
    return Outcome<Image>::ok(std::move(image));
}

//=============================================================================
// SdPipelineLoader
//=============================================================================

SdPipelineLoader::SdPipelineLoader(SdLoaderConfig config)
    : config_(std::move(config))
{
    g_min_log_level.store(parse_log_level(config_.min_log_level));
    sd_set_log_callback(sd_log_bridge, nullptr);
}

std::string SdPipelineLoader::system_info() {
    const char* info = sd_get_system_info();
    return info ? std::string(info) : std::string();
}

Outcome<std::unique_ptr<Pipeline>> SdPipelineLoader::load(
    const WeightManifest& manifest,
    bool offload,
    const std::optional<OverlaySpec>& overlay
) {
    using Result = Outcome<std::unique_ptr<Pipeline>>;
    const std::string family_id = family_to_string(manifest.family);

    auto missing = manifest.missing();
    if (!missing.empty()) {
        std::string detail;
        for (const auto& component : missing) {
            if (!detail.empty()) detail += ", ";
            detail += role_to_string(component.role) + " (" + component.path.string() + ")";
        }
        std::cerr << "[SdPipelineLoader] " << family_id << " missing: " << detail << std::endl;
        return Result::fail(ErrorKind::FamilyUnavailable,
            "Model weights for " + family_id + " not found: " + detail);
    }

    if (overlay) {
        auto header = read_safetensors_header(overlay->path);
        if (!header) {
            return Result::fail(header.error());
        }
        Status compatible = check_overlay_compatibility(header.value(), manifest.family);
        if (!compatible) {
            std::cerr << "[SdPipelineLoader] Overlay rejected: " << compatible.error().message << std::endl;
            return Result::fail(compatible.error());
        }
        std::cout << "[SdPipelineLoader] Overlay '" << overlay->name() << "' targets "
                  << count_family_tensors(header.value(), manifest.family) << " "
                  << family_id << " tensors" << std::endl;
    }

    std::cout << "[SdPipelineLoader] Loading " << family_id
              << " (offload=" << (offload ? "on" : "off")
              << ", overlay=" << (overlay ? overlay->name() : std::string("none")) << ")" << std::endl;

    // Paths must outlive new_sd_ctx()
    auto path_of = [&manifest](ComponentRole role) -> std::string {
        const WeightComponent* component = manifest.find(role);
        return component ? component->path.string() : std::string();
    };
    const std::string checkpoint = path_of(ComponentRole::CHECKPOINT);
    const std::string denoiser = path_of(ComponentRole::DENOISER);
    const std::string vae = path_of(ComponentRole::VAE);
    const std::string clip_l = path_of(ComponentRole::CLIP_L);
    const std::string clip_g = path_of(ComponentRole::CLIP_G);
    const std::string t5xxl = path_of(ComponentRole::T5XXL);
    const std::string lora_dir = overlay ? overlay->path.parent_path().string() : std::string();

    sd_ctx_params_t ctx_params;
    sd_ctx_params_init(&ctx_params);

    if (!checkpoint.empty()) ctx_params.model_path = checkpoint.c_str();
    if (!denoiser.empty()) ctx_params.diffusion_model_path = denoiser.c_str();
    if (!vae.empty()) ctx_params.vae_path = vae.c_str();
    if (!clip_l.empty()) ctx_params.clip_l_path = clip_l.c_str();
    if (!clip_g.empty()) ctx_params.clip_g_path = clip_g.c_str();
    if (!t5xxl.empty()) ctx_params.t5xxl_path = t5xxl.c_str();
    if (!lora_dir.empty()) ctx_params.lora_model_dir = lora_dir.c_str();

    ctx_params.n_threads = config_.n_threads > 0 ? config_.n_threads : get_num_physical_cores();
    ctx_params.diffusion_flash_attn = config_.flash_attn;

    if (manifest.family == ModelFamily::FLUX) {
        ctx_params.prediction = FLUX_FLOW_PRED;
    }

    // Offload: weights stay in host memory, text encoders and VAE never move
    ctx_params.offload_params_to_cpu = offload;
    ctx_params.keep_clip_on_cpu = offload;
    ctx_params.keep_vae_on_cpu = offload;

    auto start_time = std::chrono::high_resolution_clock::now();
    sd_ctx_t* ctx = new_sd_ctx(&ctx_params);
    auto end_time = std::chrono::high_resolution_clock::now();

    if (!ctx) {
        std::cerr << "[SdPipelineLoader] Error: Failed to create context for " << family_id << std::endl;
        return Result::fail(ErrorKind::LoadFailure,
            "Failed to construct " + family_id + " pipeline");
    }

    double elapsed_s = std::chrono::duration<double>(end_time - start_time).count();
    std::cout << "[SdPipelineLoader] " << family_id << " loaded in " << elapsed_s << " s" << std::endl;

    std::unique_ptr<Pipeline> pipeline =
        std::make_unique<SdPipeline>(manifest.family, ctx, offload, overlay);
    return Result::ok(std::move(pipeline));
}

} // namespace deestudio
