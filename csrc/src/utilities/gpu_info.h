// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FORGECACHE_SRC_UTILITIES_GPU_INFO_H
#define FORGECACHE_SRC_UTILITIES_GPU_INFO_H

#include <cstddef>
#include <string>
#include <vector>

struct GPUInfo {
    int device_id;
    std::string name;
    std::size_t total_memory;
    int compute_capability_major;
    int compute_capability_minor;
};

class SystemInfo {
public:
    //! Runtime version as reported by cudaRuntimeGetVersion (e.g. 12080), or 0 if unavailable.
    static int get_cuda_runtime_version();
    //! All visible devices. Empty if the CUDA runtime cannot be initialized.
    static std::vector<GPUInfo> get_gpu_info();
};

#endif //FORGECACHE_SRC_UTILITIES_GPU_INFO_H
