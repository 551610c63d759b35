/**
 * @file generation_orchestrator.cpp
 * @brief GenerationOrchestrator implementation
 */

#include "deestudio/generation_orchestrator.h"
#include "deestudio/image_codec.h"
#include <chrono>
#include <cctype>
#include <cmath>
#include <iostream>
#include <limits>
#include <random>
#include <sstream>

namespace deestudio {

const char* const kDefaultNegativePrompt =
    "nsfw, lowres, bad anatomy, bad hands, text, error, missing fingers, extra digit, "
    "fewer digits, cropped, worst quality, low quality, normal quality, jpeg artifacts, "
    "signature, watermark, username, blurry";

GenerationOrchestrator::GenerationOrchestrator(std::shared_ptr<PipelineCache> cache,
                                               std::shared_ptr<ArtifactStore> store,
                                               std::shared_ptr<ManifestProvider> manifests,
                                               OrchestratorOptions options)
    : cache_(std::move(cache))
    , store_(std::move(store))
    , manifests_(std::move(manifests))
    , options_(std::move(options))
{
}

static bool is_blank(const std::string& text) {
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

Status GenerationOrchestrator::validate(const GenerationRequest& request) {
    const FamilyTraits& traits = family_traits(request.family);
    auto invalid = [](const std::string& message) {
        return Status::fail(ErrorKind::ValidationError, message);
    };

    if (is_blank(request.prompt)) {
        return invalid("Prompt must not be empty");
    }

    const int dims[2] = {request.size.width, request.size.height};
    const char* names[2] = {"width", "height"};
    for (int i = 0; i < 2; ++i) {
        if (dims[i] < traits.min_size || dims[i] > traits.max_size) {
            return invalid(std::string(names[i]) + " must be between " + std::to_string(traits.min_size) +
                           " and " + std::to_string(traits.max_size) + ", got " + std::to_string(dims[i]));
        }
        if (dims[i] % traits.size_multiple != 0) {
            return invalid(std::string(names[i]) + " must be divisible by " + std::to_string(traits.size_multiple) +
                           " for " + traits.display_name + ", got " + std::to_string(dims[i]));
        }
    }

    if (request.num_images < kMinImageCount || request.num_images > kMaxImageCount) {
        return invalid("num_images must be between " + std::to_string(kMinImageCount) + " and " +
                       std::to_string(kMaxImageCount));
    }

    if (request.steps < traits.min_steps || request.steps > traits.max_steps) {
        return invalid("steps must be between " + std::to_string(traits.min_steps) + " and " +
                       std::to_string(traits.max_steps));
    }

    if (!std::isfinite(request.guidance) ||
        request.guidance < traits.min_guidance || request.guidance > traits.max_guidance) {
        std::ostringstream oss;
        oss << "guidance must be between " << traits.min_guidance << " and " << traits.max_guidance
            << " for " << traits.display_name;
        return invalid(oss.str());
    }

    if (request.seed && (*request.seed < 0 ||
                         *request.seed > std::numeric_limits<int64_t>::max() - kMaxImageCount)) {
        return invalid("seed must be a non-negative integer");
    }

    if (request.mode == GenerationMode::IMAGE_TO_IMAGE) {
        if (!request.input_image || request.input_image->empty()) {
            return invalid("Image-to-image requires an input image");
        }
        if (!std::isfinite(request.denoising_strength) ||
            request.denoising_strength < 0.0f || request.denoising_strength > 1.0f) {
            return invalid("denoising_strength must be between 0.0 and 1.0");
        }
    } else if (request.input_image) {
        return invalid("Text-to-image does not take an input image");
    }

    return Status::ok();
}

std::string GenerationOrchestrator::effective_negative_prompt(const GenerationRequest& request) const {
    const FamilyTraits& traits = family_traits(request.family);
    if (!traits.uses_negative_prompt || traits.guidance_kind != GuidanceKind::CFG) {
        return std::string();
    }
    if (request.guidance <= 1.0f) {
        return std::string();
    }
    if (request.negative_prompt) {
        return *request.negative_prompt;
    }
    return options_.default_negative_prompt;
}

int64_t GenerationOrchestrator::draw_seed() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<int64_t> dist(0, kRandomSeedBound - 1);
    return dist(gen);
}

Outcome<GenerationResult> GenerationOrchestrator::run(const GenerationRequest& request,
                                                      const CancellationToken& cancel) {
    using Result = Outcome<GenerationResult>;
    const std::string family_id = family_to_string(request.family);

    Status valid = validate(request);
    if (!valid) {
        std::cerr << "[Orchestrator] Rejected " << family_id << " request: "
                  << valid.error().message << std::endl;
        return Result::fail(valid.error());
    }

    auto start_time = std::chrono::steady_clock::now();

    auto acquired = cache_->acquire(request.family, cancel);
    if (!acquired) {
        return Result::fail(acquired.error());
    }
    PipelineLease lease = acquired.take();

    GenerationResult result;
    result.family = request.family;
    result.mode = request.mode;
    result.seed = request.seed ? *request.seed : draw_seed();
    result.cache_hit = lease.cache_hit();

    ImageJob job;
    job.prompt = request.prompt;
    job.negative_prompt = effective_negative_prompt(request);
    job.size = request.size;
    job.steps = request.steps;
    job.guidance = request.guidance;
    job.strength = request.denoising_strength;
    job.tiled = request.tiled;

    Image init_image;
    if (request.mode == GenerationMode::IMAGE_TO_IMAGE) {
        init_image = resize_bilinear(*request.input_image, request.size.width, request.size.height);
        job.init_image = &init_image;
    }

    std::cout << "[Orchestrator] " << family_id << " " << mode_to_string(request.mode)
              << ": " << request.num_images << " image(s), base seed " << result.seed
              << (lease.cache_hit() ? " (cached pipeline)" : " (fresh pipeline)") << std::endl;

    for (int i = 0; i < request.num_images; ++i) {
        if (cancel.is_cancelled()) {
            std::cout << "[Orchestrator] Cancelled after " << i << " image(s)" << std::endl;
            Error error = Error::make(ErrorKind::Cancelled,
                "Request cancelled after " + std::to_string(i) + " of " +
                std::to_string(request.num_images) + " images");
            error.images_completed = static_cast<size_t>(i);
            return Result::fail(std::move(error));
        }

        job.seed = result.seed + i;

        auto generated = lease.pipeline().generate(job);
        if (!generated) {
            Error error = Error::make(ErrorKind::GenerationFailure,
                "Image " + std::to_string(i + 1) + " of " + std::to_string(request.num_images) +
                " failed: " + generated.error().message);
            error.images_completed = static_cast<size_t>(i);
            std::cerr << "[Orchestrator] " << error.message << std::endl;
            return Result::fail(std::move(error));
        }

        auto saved = store_->save(generated.value(), request.family, request.mode);
        if (!saved) {
            Error error = Error::make(ErrorKind::GenerationFailure,
                "Image " + std::to_string(i + 1) + " could not be saved: " + saved.error().message);
            error.images_completed = static_cast<size_t>(i);
            std::cerr << "[Orchestrator] " << error.message << std::endl;
            return Result::fail(std::move(error));
        }

        Artifact artifact = saved.take();
        artifact.seed = job.seed;
        result.seeds.push_back(job.seed);
        result.artifacts.push_back(std::move(artifact));
    }

    auto end_time = std::chrono::steady_clock::now();
    result.generation_time_s = std::chrono::duration<double>(end_time - start_time).count();

    std::cout << "[Orchestrator] " << family_id << " done: " << result.artifacts.size()
              << " image(s) in " << result.generation_time_s << " s" << std::endl;

    return Result::ok(std::move(result));
}

std::vector<FamilyCapability> GenerationOrchestrator::capabilities() const {
    std::vector<FamilyCapability> list;
    for (ModelFamily family : all_families()) {
        FamilyCapability capability;
        capability.traits = &family_traits(family);
        capability.available = manifests_->is_available(family);

        WeightManifest manifest = manifests_->manifest_for(family);
        capability.overlay_available = manifest.overlay.has_value();
        if (capability.traits->uses_negative_prompt) {
            capability.default_negative_prompt = options_.default_negative_prompt;
        }

        capability.features = {"text-to-image", "image-to-image"};
        if (capability.traits->uses_negative_prompt) {
            capability.features.push_back("negative-prompt");
        }
        if (capability.traits->guidance_kind == GuidanceKind::DISTILLED) {
            capability.features.push_back("distilled-guidance");
        }
        if (capability.traits->default_offload) {
            capability.features.push_back("cpu-offload");
        }
        if (capability.overlay_available) {
            capability.features.push_back("lora");
        }
        capability.features.push_back("tiled-vae");
        list.push_back(std::move(capability));
    }
    return list;
}

} // namespace deestudio
