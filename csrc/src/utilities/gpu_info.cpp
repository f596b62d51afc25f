// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "gpu_info.h"

#include <cuda_runtime.h>

int SystemInfo::get_cuda_runtime_version() {
    int version = 0;
    if (cudaRuntimeGetVersion(&version) != cudaSuccess) {
        return 0;
    }
    return version;
}

/**
 * @brief Enumerate the CUDA devices visible to this process.
 *
 * Probing is best-effort: a missing driver or a host without devices yields an
 * empty list instead of an error, and the CUDA error state is cleared afterwards.
 *
 * @return One entry per device, in device-id order.
 */
std::vector<GPUInfo> SystemInfo::get_gpu_info() {
    std::vector<GPUInfo> result;
    int count = 0;
    if (cudaGetDeviceCount(&count) != cudaSuccess) {
        [[maybe_unused]] cudaError_t clear_error = cudaGetLastError();
        return result;
    }

    for (int i = 0; i < count; ++i) {
        cudaDeviceProp prop{};
        if (cudaGetDeviceProperties(&prop, i) != cudaSuccess) {
            [[maybe_unused]] cudaError_t clear_error = cudaGetLastError();
            continue;
        }
        result.push_back(GPUInfo{
            .device_id = i,
            .name = prop.name,
            .total_memory = prop.totalGlobalMem,
            .compute_capability_major = prop.major,
            .compute_capability_minor = prop.minor
        });
    }
    return result;
}
