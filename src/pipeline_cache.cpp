/**
 * @file pipeline_cache.cpp
 * @brief PipelineCache implementation
 */

#include "deestudio/pipeline_cache.h"
#include <algorithm>
#include <iostream>

namespace deestudio {

std::string slot_state_to_string(SlotState state) {
    switch (state) {
        case SlotState::Empty: return "empty";
        case SlotState::Loading: return "loading";
        case SlotState::Resident: return "resident";
        case SlotState::Draining: return "draining";
        case SlotState::Error: return "error";
    }
    return "unknown";
}

//=============================================================================
// PipelineLease
//=============================================================================

PipelineLease::PipelineLease(PipelineCache* cache, Pipeline* pipeline,
                             uint64_t generation, bool cache_hit)
    : cache_(cache)
    , pipeline_(pipeline)
    , generation_(generation)
    , cache_hit_(cache_hit)
{
}

PipelineLease::PipelineLease(PipelineLease&& other) noexcept
    : cache_(other.cache_)
    , pipeline_(other.pipeline_)
    , generation_(other.generation_)
    , cache_hit_(other.cache_hit_)
{
    other.cache_ = nullptr;
    other.pipeline_ = nullptr;
}

PipelineLease& PipelineLease::operator=(PipelineLease&& other) noexcept {
    if (this != &other) {
        reset();
        cache_ = other.cache_;
        pipeline_ = other.pipeline_;
        generation_ = other.generation_;
        cache_hit_ = other.cache_hit_;
        other.cache_ = nullptr;
        other.pipeline_ = nullptr;
    }
    return *this;
}

PipelineLease::~PipelineLease() {
    reset();
}

void PipelineLease::reset() {
    if (cache_) {
        cache_->leave();
        cache_ = nullptr;
    }
    pipeline_ = nullptr;
}

//=============================================================================
// PipelineCache
//=============================================================================

PipelineCache::PipelineCache(std::shared_ptr<PipelineLoader> loader,
                             std::shared_ptr<ResourceGuard> guard,
                             std::shared_ptr<ManifestProvider> manifests,
                             CacheOptions options)
    : loader_(std::move(loader))
    , guard_(std::move(guard))
    , manifests_(std::move(manifests))
    , options_(options)
{
    std::cout << "[PipelineCache] Initialized (queue timeout "
              << options_.queue_timeout.count() << " ms, max waiters "
              << options_.max_waiters << ", offload sdxl="
              << (options_.offload_sdxl ? "on" : "off") << " flux="
              << (options_.offload_flux ? "on" : "off") << ")" << std::endl;
}

PipelineCache::~PipelineCache() {
    std::unique_ptr<Pipeline> resident;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        resident = std::move(pipeline_);
    }
    if (resident) {
        std::cout << "[PipelineCache] Shutdown: releasing "
                  << family_to_string(resident->family()) << std::endl;
    }
}

Status PipelineCache::enter(const CancellationToken& cancel) {
    // Poll so a disconnected client stops waiting promptly
    constexpr auto kPollInterval = std::chrono::milliseconds(100);
    const auto deadline = std::chrono::steady_clock::now() + options_.queue_timeout;

    std::unique_lock<std::mutex> lock(mutex_);
    if (cancel.is_cancelled()) {
        return Status::fail(ErrorKind::Cancelled, "Request cancelled while waiting for the accelerator");
    }
    if (!busy_) {
        busy_ = true;
        return Status::ok();
    }
    if (waiters_ >= options_.max_waiters) {
        return Status::fail(ErrorKind::Busy,
            "Server busy - " + std::to_string(waiters_) + " request(s) already queued. Please retry.");
    }

    waiters_++;
    Status outcome = Status::ok();
    while (true) {
        if (cancel.is_cancelled()) {
            outcome = Status::fail(ErrorKind::Cancelled, "Request cancelled while waiting for the accelerator");
            break;
        }
        if (!busy_) {
            busy_ = true;
            break;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            outcome = Status::fail(ErrorKind::Busy,
                "Server busy - another generation is running. Please retry.");
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        gate_cv_.wait_for(lock, std::min<std::chrono::milliseconds>(kPollInterval, remaining));
    }
    waiters_--;
    return outcome;
}

void PipelineCache::leave() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        busy_ = false;
    }
    gate_cv_.notify_one();
}

void PipelineCache::transition(SlotState to, std::optional<ModelFamily> family) {
    SlotState from;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        from = state_;
        state_ = to;
        family_ = family;
    }

    std::cout << "[PipelineCache] " << slot_state_to_string(from) << " -> "
              << slot_state_to_string(to);
    if (family) {
        std::cout << " (" << family_to_string(*family) << ")";
    }
    std::cout << std::endl;

    TransitionObserver observer;
    {
        std::lock_guard<std::mutex> lock(observer_mutex_);
        observer = observer_;
    }
    if (observer) {
        observer(from, to, family);
    }
}

Status PipelineCache::drain(bool eviction) {
    std::unique_ptr<Pipeline> old;
    std::optional<ModelFamily> old_family;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        old_family = family_;
    }

    transition(SlotState::Draining, old_family);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        old = std::move(pipeline_);
        generation_++;
        if (eviction) {
            stats_.evictions++;
        } else {
            stats_.unloads++;
        }
    }

    // Destroying the pipeline frees its device allocations
    old.reset();

    Status admitted = guard_->admit();
    transition(SlotState::Empty, std::nullopt);

    if (!admitted) {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.admissions_denied++;
    }
    return admitted;
}

Outcome<PipelineLease> PipelineCache::acquire(ModelFamily family, const CancellationToken& cancel) {
    using Result = Outcome<PipelineLease>;
    const std::string family_id = family_to_string(family);

    Status entered = enter(cancel);
    if (!entered) {
        return Result::fail(entered.error());
    }

    // From here on every failure path must leave the critical section
    Pipeline* resident = nullptr;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SlotState::Resident && pipeline_ && pipeline_->family() == family) {
            stats_.hits++;
            resident = pipeline_.get();
            generation = generation_;
        }
    }
    if (resident) {
        std::cout << "[PipelineCache] Hit: " << family_id << " (generation " << generation << ")" << std::endl;
        return Result::ok(PipelineLease(this, resident, generation, true));
    }

    WeightManifest manifest = manifests_->manifest_for(family);
    auto missing = manifest.missing();
    if (!missing.empty()) {
        leave();
        std::string detail;
        for (const auto& component : missing) {
            if (!detail.empty()) detail += ", ";
            detail += component.path.string();
        }
        std::cerr << "[PipelineCache] " << family_id << " unavailable: " << detail << std::endl;
        return Result::fail(ErrorKind::FamilyUnavailable,
            "Model weights for " + family_id + " not found: " + detail);
    }

    bool has_resident = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        has_resident = pipeline_ != nullptr;
    }

    if (has_resident) {
        std::cout << "[PipelineCache] Switching to " << family_id << ", evicting resident pipeline" << std::endl;
        Status drained = drain(true);
        if (!drained) {
            leave();
            return Result::fail(drained.error());
        }
    } else {
        Status admitted = guard_->admit();
        if (!admitted) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                stats_.admissions_denied++;
            }
            leave();
            return Result::fail(admitted.error());
        }
    }

    transition(SlotState::Loading, family);

    auto loaded = loader_->load(manifest, options_.offload_for(family), manifest.overlay);
    if (!loaded) {
        std::cerr << "[PipelineCache] Load failed: " << loaded.error().to_string() << std::endl;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.load_failures++;
        }
        transition(SlotState::Error, family);
        transition(SlotState::Empty, std::nullopt);
        leave();
        return Result::fail(loaded.error());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        pipeline_ = loaded.take();
        generation_++;
        stats_.loads++;
        resident = pipeline_.get();
        generation = generation_;
    }
    transition(SlotState::Resident, family);

    return Result::ok(PipelineLease(this, resident, generation, false));
}

Status PipelineCache::release(const CancellationToken& cancel) {
    Status entered = enter(cancel);
    if (!entered) {
        return entered;
    }

    bool has_resident = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        has_resident = pipeline_ != nullptr;
    }

    Status result = Status::ok();
    if (has_resident) {
        result = drain(false);
    }
    leave();
    return result;
}

SlotStatus PipelineCache::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SlotStatus status;
    status.state = state_;
    status.family = family_;
    status.generation = generation_;
    status.waiting = waiters_;
    if (pipeline_) {
        status.offload_enabled = pipeline_->offload_enabled();
        status.overlay_applied = pipeline_->overlay_applied();
    }
    status.stats = stats_;
    return status;
}

bool PipelineCache::is_current(uint64_t generation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == SlotState::Resident && generation_ == generation;
}

void PipelineCache::set_transition_observer(TransitionObserver observer) {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observer_ = std::move(observer);
}

} // namespace deestudio
