// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "hardware/hardware_probe.h"

#include "utilities/gpu_info.h"

namespace forgecache::hardware {

ArchitectureDescriptor CudaHardwareProbe::probe() {
    auto gpus = SystemInfo::get_gpu_info();
    if (gpus.empty()) {
        return unknown_architecture();
    }

    const GPUInfo& gpu = gpus.front();
    if (gpu.compute_capability_major > 0) {
        return make_architecture(gpu.compute_capability_major, gpu.compute_capability_minor, gpu.name);
    }
    return architecture_from_device_name(gpu.name);
}

std::unique_ptr<IHardwareProbe> IHardwareProbe::create(const std::string& override_code) {
    if (!override_code.empty()) {
        return std::make_unique<FixedHardwareProbe>(parse_architecture(override_code, "override"));
    }
    return std::make_unique<CudaHardwareProbe>();
}

}  // namespace forgecache::hardware
