/**
 * @file pipeline.h
 * @brief Loaded generation pipeline and the loader seam
 *
 * The cache only ever talks to these two interfaces, so the inference
 * backend can be swapped (stable-diffusion.cpp in production, an in-memory
 * fake in unit tests).
 */

#pragma once

#include "model_registry.h"
#include "model_types.h"
#include "outcome.h"
#include <memory>
#include <optional>

namespace deestudio {

/**
 * @class Pipeline
 * @brief One fully constructed, device-resident generation pipeline
 *
 * Destroying the object must release every device allocation it owns.
 */
class Pipeline {
public:
    virtual ~Pipeline() = default;

    virtual ModelFamily family() const = 0;
    virtual bool offload_enabled() const = 0;
    virtual bool overlay_applied() const = 0;

    /**
     * @brief Produce exactly one image
     */
    virtual Outcome<Image> generate(const ImageJob& job) = 0;
};

/**
 * @class PipelineLoader
 * @brief Builds pipelines from weight manifests
 *
 * Errors:
 * - FamilyUnavailable when a required component is missing
 * - OverlayLoadFailure when the overlay cannot be applied
 * - LoadFailure for any other construction failure
 * A failed load must not leave partially allocated device memory behind.
 */
class PipelineLoader {
public:
    virtual ~PipelineLoader() = default;

    virtual Outcome<std::unique_ptr<Pipeline>> load(
        const WeightManifest& manifest,
        bool offload,
        const std::optional<OverlaySpec>& overlay) = 0;
};

} // namespace deestudio
