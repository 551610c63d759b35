/**
 * @file generation_orchestrator.h
 * @brief Request validation, seed resolution and the per-image generation loop
 *
 * Flow of one request:
 *   validate -> normalize -> PipelineCache::acquire -> resolve base seed ->
 *   for i in [0, count): pipeline.generate(seed + i) -> ArtifactStore::save
 *
 * The batch loop is strictly sequential and observes cancellation between
 * images. The lease keeps the accelerator exclusive until the batch ends.
 */

#pragma once

#include "artifact_store.h"
#include "cancellation.h"
#include "model_registry.h"
#include "outcome.h"
#include "pipeline_cache.h"
#include <memory>
#include <string>
#include <vector>

namespace deestudio {

/// Negative prompt applied to SDXL requests that do not supply one
extern const char* const kDefaultNegativePrompt;

/**
 * @struct OrchestratorOptions
 */
struct OrchestratorOptions {
    std::string default_negative_prompt = kDefaultNegativePrompt;
};

/**
 * @struct FamilyCapability
 * @brief Availability and parameter ranges of one family
 */
struct FamilyCapability {
    const FamilyTraits* traits = nullptr;
    bool available = false;
    bool overlay_available = false;
    std::string default_negative_prompt;  ///< Empty when the family takes none
    std::vector<std::string> features;
};

/**
 * @class GenerationOrchestrator
 * @brief Drives generation requests against the pipeline cache
 */
class GenerationOrchestrator {
public:
    GenerationOrchestrator(std::shared_ptr<PipelineCache> cache,
                           std::shared_ptr<ArtifactStore> store,
                           std::shared_ptr<ManifestProvider> manifests,
                           OrchestratorOptions options = {});

    /**
     * @brief Run one request to completion
     *
     * Errors: ValidationError (nothing touched), any PipelineCache error,
     * GenerationFailure or Cancelled carrying images_completed.
     */
    Outcome<GenerationResult> run(const GenerationRequest& request,
                                  const CancellationToken& cancel = CancellationToken());

    /**
     * @brief Pure pre-flight checks against the family's constraints
     */
    static Status validate(const GenerationRequest& request);

    /**
     * @brief Negative prompt actually sent to the pipeline ("" = none)
     *
     * Applied only for classifier-free guidance with a scale above 1.0.
     */
    std::string effective_negative_prompt(const GenerationRequest& request) const;

    /**
     * @brief Per-family availability listing (read-only)
     */
    std::vector<FamilyCapability> capabilities() const;

    PipelineCache& cache() { return *cache_; }

private:
    std::shared_ptr<PipelineCache> cache_;
    std::shared_ptr<ArtifactStore> store_;
    std::shared_ptr<ManifestProvider> manifests_;
    OrchestratorOptions options_;

    static int64_t draw_seed();
};

} // namespace deestudio
