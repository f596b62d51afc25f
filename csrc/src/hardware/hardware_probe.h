// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FORGECACHE_SRC_HARDWARE_HARDWARE_PROBE_H
#define FORGECACHE_SRC_HARDWARE_HARDWARE_PROBE_H

#include <memory>
#include <string>
#include <utility>

#include "hardware/architecture.h"

namespace forgecache::hardware {

/**
 * @brief Reports the architecture of the accelerator present on the host.
 *
 * Probing is best-effort: implementations return an unknown descriptor
 * instead of failing when no device can be queried.
 */
class IHardwareProbe {
public:
    IHardwareProbe() = default;
    virtual ~IHardwareProbe() = default;

    [[nodiscard]] virtual ArchitectureDescriptor probe() = 0;

    /**
     * @brief Create the probe used by the command line tool.
     *
     * @param override_code If non-empty, an explicit architecture code (e.g. "sm89")
     *        that replaces device detection.
     * @throws forgecache::ConfigurationError if @p override_code is not a valid code.
     */
    static std::unique_ptr<IHardwareProbe> create(const std::string& override_code = {});
};

/// Queries device 0 through the CUDA runtime, falling back to the device name table.
class CudaHardwareProbe : public IHardwareProbe {
public:
    [[nodiscard]] ArchitectureDescriptor probe() override;
};

/// Always reports the same descriptor.
class FixedHardwareProbe : public IHardwareProbe {
public:
    explicit FixedHardwareProbe(ArchitectureDescriptor descriptor) : mDescriptor(std::move(descriptor)) {}

    [[nodiscard]] ArchitectureDescriptor probe() override { return mDescriptor; }

private:
    ArchitectureDescriptor mDescriptor;
};

}  // namespace forgecache::hardware

#endif //FORGECACHE_SRC_HARDWARE_HARDWARE_PROBE_H
