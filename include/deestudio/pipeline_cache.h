/**
 * @file pipeline_cache.h
 * @brief Single-slot pipeline residency with family-switch eviction
 *
 * At most one pipeline is resident in the whole process. Requesting the
 * resident family is a hit; requesting another family drains the slot
 * (drop handle, reclaim, admission check) and loads the new one.
 *
 * Slot state machine:
 *
 *   Empty -> Loading -> Resident -> Draining -> Empty
 *               |
 *               +-> Error -> Empty
 *
 * The slot and the accelerator form one critical section. acquire() enters
 * it and hands back a PipelineLease; the section is left when the lease is
 * destroyed. Waiting to enter is bounded by CacheOptions::queue_timeout and
 * observes the caller's cancellation token. At most CacheOptions::max_waiters
 * callers may wait at once; further callers get Busy immediately.
 */

#pragma once

#include "cancellation.h"
#include "model_registry.h"
#include "outcome.h"
#include "pipeline.h"
#include "resource_guard.h"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace deestudio {

/**
 * @enum SlotState
 * @brief Cache slot lifecycle
 */
enum class SlotState {
    Empty,
    Loading,
    Resident,
    Draining,
    Error
};

std::string slot_state_to_string(SlotState state);

/**
 * @struct CacheStats
 * @brief Slot event counters
 */
struct CacheStats {
    uint64_t loads = 0;
    uint64_t load_failures = 0;
    uint64_t evictions = 0;          ///< Drains caused by a family switch
    uint64_t unloads = 0;            ///< Drains requested through release()
    uint64_t hits = 0;
    uint64_t admissions_denied = 0;
};

/**
 * @struct SlotStatus
 * @brief Point-in-time snapshot for health output
 */
struct SlotStatus {
    SlotState state = SlotState::Empty;
    std::optional<ModelFamily> family;
    uint64_t generation = 0;
    size_t waiting = 0;              ///< Callers blocked in acquire()/release()
    bool offload_enabled = false;
    bool overlay_applied = false;
    CacheStats stats;
};

/**
 * @struct CacheOptions
 * @brief Queueing and per-family offload policy
 */
struct CacheOptions {
    std::chrono::milliseconds queue_timeout{300000};
    size_t max_waiters = 64;
    bool offload_sdxl = false;
    bool offload_flux = true;

    bool offload_for(ModelFamily family) const {
        return family == ModelFamily::FLUX ? offload_flux : offload_sdxl;
    }
};

class PipelineCache;

/**
 * @class PipelineLease
 * @brief Exclusive, move-only access to the resident pipeline
 *
 * Holds the cache's critical section for its lifetime. The pipeline
 * reference is non-owning and only valid while the lease is alive.
 */
class PipelineLease {
public:
    PipelineLease(PipelineLease&& other) noexcept;
    PipelineLease& operator=(PipelineLease&& other) noexcept;
    ~PipelineLease();

    PipelineLease(const PipelineLease&) = delete;
    PipelineLease& operator=(const PipelineLease&) = delete;

    Pipeline& pipeline() const { return *pipeline_; }
    ModelFamily family() const { return pipeline_->family(); }

    /// Slot generation the pipeline was taken at
    uint64_t generation() const { return generation_; }

    /// True when no load was needed
    bool cache_hit() const { return cache_hit_; }

private:
    friend class PipelineCache;

    PipelineLease(PipelineCache* cache, Pipeline* pipeline, uint64_t generation, bool cache_hit);
    void reset();

    PipelineCache* cache_ = nullptr;
    Pipeline* pipeline_ = nullptr;
    uint64_t generation_ = 0;
    bool cache_hit_ = false;
};

/**
 * @class PipelineCache
 * @brief Owns at most one resident pipeline
 *
 * Leases must not outlive the cache.
 */
class PipelineCache {
public:
    using TransitionObserver =
        std::function<void(SlotState from, SlotState to, std::optional<ModelFamily> family)>;

    PipelineCache(std::shared_ptr<PipelineLoader> loader,
                  std::shared_ptr<ResourceGuard> guard,
                  std::shared_ptr<ManifestProvider> manifests,
                  CacheOptions options = {});
    ~PipelineCache();

    PipelineCache(const PipelineCache&) = delete;
    PipelineCache& operator=(const PipelineCache&) = delete;

    /**
     * @brief Get the resident pipeline for a family, loading it if needed
     *
     * Errors: Busy, Cancelled, FamilyUnavailable, ResourceExhausted,
     * LoadFailure, OverlayLoadFailure. Every failure leaves the slot Empty
     * (or untouched for Busy/Cancelled).
     */
    Outcome<PipelineLease> acquire(ModelFamily family,
                                   const CancellationToken& cancel = CancellationToken());

    /**
     * @brief Drain the slot to Empty (explicit unload)
     * @return ok, or ResourceExhausted if memory is still held afterwards
     */
    Status release(const CancellationToken& cancel = CancellationToken());

    SlotStatus status() const;

    /**
     * @brief Whether a generation number still refers to the resident pipeline
     */
    bool is_current(uint64_t generation) const;

    void set_transition_observer(TransitionObserver observer);

    const CacheOptions& options() const { return options_; }

private:
    friend class PipelineLease;

    Status enter(const CancellationToken& cancel);
    void leave();

    void transition(SlotState to, std::optional<ModelFamily> family);

    /**
     * @brief Drop the resident pipeline and re-run admission (critical section held)
     */
    Status drain(bool eviction);

    std::shared_ptr<PipelineLoader> loader_;
    std::shared_ptr<ResourceGuard> guard_;
    std::shared_ptr<ManifestProvider> manifests_;
    CacheOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable gate_cv_;
    bool busy_ = false;
    size_t waiters_ = 0;

    SlotState state_ = SlotState::Empty;
    std::optional<ModelFamily> family_;
    std::unique_ptr<Pipeline> pipeline_;
    uint64_t generation_ = 0;
    CacheStats stats_;

    std::mutex observer_mutex_;
    TransitionObserver observer_;
};

} // namespace deestudio
