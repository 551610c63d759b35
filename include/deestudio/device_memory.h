/**
 * @file device_memory.h
 * @brief Interface to the accelerator memory allocator
 *
 * The guard only needs three things from the device: how many bytes are
 * still held, a synchronous barrier, and a request to hand cached allocator
 * blocks back to the driver.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace deestudio {

/**
 * @brief Accelerator memory probe
 *
 * Contract:
 * - allocated_bytes() reports memory held by this process on the device
 * - synchronize() blocks until all queued device work has finished
 * - release_cached() is best-effort and never throws
 */
class DeviceMemory {
public:
    virtual ~DeviceMemory() = default;

    virtual uint64_t allocated_bytes() const = 0;
    virtual uint64_t total_bytes() const = 0;
    virtual void synchronize() = 0;
    virtual void release_cached() = 0;

    /**
     * @brief Short device description for health output ("CUDA:0 NVIDIA ...", "CPU")
     */
    virtual std::string describe() const = 0;
    virtual bool is_accelerator() const = 0;
};

/**
 * @brief CPU-only builds: nothing is ever held on a device
 */
class HostDeviceMemory : public DeviceMemory {
public:
    uint64_t allocated_bytes() const override { return 0; }
    uint64_t total_bytes() const override { return 0; }
    void synchronize() override {}
    void release_cached() override {}
    std::string describe() const override { return "CPU"; }
    bool is_accelerator() const override { return false; }
};

#ifdef DEESTUDIO_USE_CUDA
/**
 * @brief CUDA runtime probe
 *
 * Held bytes are measured as the drop in free device memory against the
 * baseline captured at construction, so driver/context overhead that existed
 * before any pipeline was built is not counted.
 */
class CudaDeviceMemory : public DeviceMemory {
public:
    explicit CudaDeviceMemory(int device = 0);

    uint64_t allocated_bytes() const override;
    uint64_t total_bytes() const override;
    void synchronize() override;
    void release_cached() override;
    std::string describe() const override;
    bool is_accelerator() const override { return available_; }

private:
    int device_;
    bool available_ = false;
    uint64_t baseline_used_ = 0;
    uint64_t total_ = 0;
    std::string name_;

    uint64_t used_now() const;
};
#endif

/**
 * @brief Create the probe matching this build (CUDA if compiled in and a device exists)
 */
std::shared_ptr<DeviceMemory> create_device_memory(int device = 0);

} // namespace deestudio
