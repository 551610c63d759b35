/**
 * @file resource_guard.h
 * @brief Accelerator-memory admission control
 *
 * Before a pipeline is constructed the guard forces a reclaim (device
 * barrier + allocator cache release) and measures what is still held. If the
 * residual exceeds a small fixed headroom the load is refused outright: the
 * guard never loops waiting for memory to come back.
 */

#pragma once

#include "device_memory.h"
#include "outcome.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace deestudio {

/// Default headroom for bookkeeping structures (1 GiB)
constexpr uint64_t kDefaultAdmissionThresholdBytes = 1ULL * 1024 * 1024 * 1024;

/**
 * @struct AdmissionResult
 * @brief Allowed, or Denied with the exact residual size
 */
struct AdmissionResult {
    bool allowed = false;
    uint64_t bytes_still_held = 0;
    uint64_t threshold_bytes = 0;

    static AdmissionResult allow(uint64_t held, uint64_t threshold) {
        return {true, held, threshold};
    }

    static AdmissionResult deny(uint64_t held, uint64_t threshold) {
        return {false, held, threshold};
    }
};

/**
 * @struct GuardStats
 * @brief Counters for health output
 */
struct GuardStats {
    uint64_t reclaims = 0;
    uint64_t admissions = 0;
    uint64_t denials = 0;
    uint64_t last_measured_bytes = 0;
};

/**
 * @class ResourceGuard
 * @brief Enforces accelerator-memory admission before pipeline construction
 */
class ResourceGuard {
public:
    explicit ResourceGuard(std::shared_ptr<DeviceMemory> memory,
                           uint64_t threshold_bytes = kDefaultAdmissionThresholdBytes);

    /**
     * @brief Best-effort release: device barrier, cache clear, re-measure
     * @return Bytes still held after the release
     */
    uint64_t force_reclaim();

    /**
     * @brief Compare the current residual against the threshold
     */
    AdmissionResult check_admission();

    /**
     * @brief force_reclaim() followed by check_admission()
     * @return ok, or ResourceExhausted carrying the residual byte count
     */
    Status admit();

    uint64_t threshold_bytes() const { return threshold_bytes_; }
    GuardStats stats() const;
    const DeviceMemory& memory() const { return *memory_; }

private:
    std::shared_ptr<DeviceMemory> memory_;
    uint64_t threshold_bytes_;

    mutable std::mutex stats_mutex_;
    GuardStats stats_;
};

/**
 * @brief Format a byte count as "1.23 GB"
 */
std::string format_gb(uint64_t bytes);

} // namespace deestudio
