/**
 * @file device_memory.cpp
 * @brief CUDA and host implementations of DeviceMemory
 */

#include "deestudio/device_memory.h"
#include <iostream>

#ifdef DEESTUDIO_USE_CUDA
#include <cuda_runtime.h>
#endif

namespace deestudio {

#ifdef DEESTUDIO_USE_CUDA

CudaDeviceMemory::CudaDeviceMemory(int device)
    : device_(device)
{
    int device_count = 0;
    if (cudaGetDeviceCount(&device_count) != cudaSuccess || device_count <= device) {
        std::cout << "[DeviceMemory] CUDA device " << device << " not available" << std::endl;
        return;
    }
    if (cudaSetDevice(device_) != cudaSuccess) {
        std::cerr << "[DeviceMemory] cudaSetDevice(" << device_ << ") failed" << std::endl;
        return;
    }

    cudaDeviceProp prop{};
    if (cudaGetDeviceProperties(&prop, device_) == cudaSuccess) {
        name_ = prop.name;
    }

    size_t free_mem = 0, total_mem = 0;
    if (cudaMemGetInfo(&free_mem, &total_mem) != cudaSuccess) {
        std::cerr << "[DeviceMemory] cudaMemGetInfo failed" << std::endl;
        return;
    }

    available_ = true;
    total_ = total_mem;
    baseline_used_ = total_mem - free_mem;

    std::cout << "[DeviceMemory] CUDA:" << device_ << " " << name_
              << " total=" << (total_ / (1024 * 1024)) << " MB"
              << " baseline=" << (baseline_used_ / (1024 * 1024)) << " MB" << std::endl;
}

uint64_t CudaDeviceMemory::used_now() const {
    size_t free_mem = 0, total_mem = 0;
    if (cudaMemGetInfo(&free_mem, &total_mem) != cudaSuccess) {
        return baseline_used_;
    }
    return total_mem - free_mem;
}

uint64_t CudaDeviceMemory::allocated_bytes() const {
    if (!available_) return 0;
    uint64_t used = used_now();
    return used > baseline_used_ ? used - baseline_used_ : 0;
}

uint64_t CudaDeviceMemory::total_bytes() const {
    return total_;
}

void CudaDeviceMemory::synchronize() {
    if (!available_) return;
    cudaError_t err = cudaDeviceSynchronize();
    if (err != cudaSuccess) {
        std::cerr << "[DeviceMemory] cudaDeviceSynchronize: " << cudaGetErrorString(err) << std::endl;
    }
}

void CudaDeviceMemory::release_cached() {
    if (!available_) return;

    // Stream-ordered allocations keep freed blocks in the default pool
    cudaMemPool_t pool = nullptr;
    if (cudaDeviceGetDefaultMemPool(&pool, device_) == cudaSuccess && pool) {
        cudaError_t err = cudaMemPoolTrimTo(pool, 0);
        if (err != cudaSuccess) {
            std::cerr << "[DeviceMemory] cudaMemPoolTrimTo: " << cudaGetErrorString(err) << std::endl;
        }
    }
}

std::string CudaDeviceMemory::describe() const {
    if (!available_) return "CUDA (unavailable)";
    return "CUDA:" + std::to_string(device_) + " " + name_;
}

#endif

std::shared_ptr<DeviceMemory> create_device_memory(int device) {
#ifdef DEESTUDIO_USE_CUDA
    auto cuda = std::make_shared<CudaDeviceMemory>(device);
    if (cuda->is_accelerator()) {
        return cuda;
    }
    std::cout << "[DeviceMemory] Falling back to host memory accounting" << std::endl;
#else
    (void)device;
    std::cout << "[DeviceMemory] Built without CUDA support, host memory accounting" << std::endl;
#endif
    return std::make_shared<HostDeviceMemory>();
}

} // namespace deestudio
