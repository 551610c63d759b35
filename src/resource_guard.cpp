/**
 * @file resource_guard.cpp
 * @brief ResourceGuard implementation
 */

#include "deestudio/resource_guard.h"
#include <iostream>
#include <iomanip>
#include <sstream>

namespace deestudio {

std::string format_gb(uint64_t bytes) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << (static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0)) << " GB";
    return oss.str();
}

ResourceGuard::ResourceGuard(std::shared_ptr<DeviceMemory> memory, uint64_t threshold_bytes)
    : memory_(std::move(memory))
    , threshold_bytes_(threshold_bytes)
{
    if (!memory_) {
        memory_ = std::make_shared<HostDeviceMemory>();
    }
}

uint64_t ResourceGuard::force_reclaim() {
    uint64_t before = memory_->allocated_bytes();

    memory_->synchronize();
    memory_->release_cached();
    memory_->synchronize();

    uint64_t after = memory_->allocated_bytes();

    std::cout << "[ResourceGuard] Reclaim on " << memory_->describe()
              << ": before=" << format_gb(before)
              << ", after=" << format_gb(after) << std::endl;

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.reclaims++;
    stats_.last_measured_bytes = after;
    return after;
}

AdmissionResult ResourceGuard::check_admission() {
    uint64_t held = memory_->allocated_bytes();

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.last_measured_bytes = held;
    if (held > threshold_bytes_) {
        stats_.denials++;
        return AdmissionResult::deny(held, threshold_bytes_);
    }
    stats_.admissions++;
    return AdmissionResult::allow(held, threshold_bytes_);
}

Status ResourceGuard::admit() {
    force_reclaim();
    AdmissionResult admission = check_admission();
    if (admission.allowed) {
        return Status::ok();
    }

    std::cerr << "[ResourceGuard] Admission denied: " << format_gb(admission.bytes_still_held)
              << " still allocated (threshold " << format_gb(admission.threshold_bytes) << ")"
              << std::endl;

    Error error = Error::make(ErrorKind::ResourceExhausted,
        "GPU memory not freed. " + format_gb(admission.bytes_still_held) +
        " still allocated. Please restart the server.");
    error.bytes_still_held = admission.bytes_still_held;
    return Status::fail(std::move(error));
}

GuardStats ResourceGuard::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

} // namespace deestudio
