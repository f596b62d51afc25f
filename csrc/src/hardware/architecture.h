// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FORGECACHE_SRC_HARDWARE_ARCHITECTURE_H
#define FORGECACHE_SRC_HARDWARE_ARCHITECTURE_H

#include <string>
#include <string_view>

namespace forgecache::hardware {

enum class ArchitectureFamily : int {
    Unknown = 0,
    Volta,
    Turing,
    Ampere,
    Ada,
    Hopper,
    Blackwell
};

/// Lowest numeric architecture code with native FP8 tensor-core support (Ada, SM89).
inline constexpr int kFp8NativeThreshold = 89;

/**
 * @brief Compute generation of the accelerator on this host.
 *
 * Code is the canonical `sm<NN>` tag used in artifact metadata and engine labels;
 * it is empty when the architecture could not be detected.
 */
struct ArchitectureDescriptor {
    std::string Code;
    int Numeric = 0;
    ArchitectureFamily Family = ArchitectureFamily::Unknown;
    bool SupportsFp8 = false;
    std::string DeviceName;

    [[nodiscard]] bool known() const { return Numeric > 0; }
};

ArchitectureFamily family_from_numeric(int numeric);
const char* to_string(ArchitectureFamily family);

/// Descriptor for a numeric code such as 89 (SM 8.9) or 100 (SM 10.0).
ArchitectureDescriptor make_architecture(int numeric, std::string device_name = {});
ArchitectureDescriptor make_architecture(int major, int minor, std::string device_name);
ArchitectureDescriptor unknown_architecture(std::string device_name = {});

/**
 * @brief Parse an architecture code in any of the forms `sm89`, `sm_89`, `SM89`, `8.9`, `89`, `sm90a`.
 *
 * @throws forgecache::ConfigurationError if @p text does not name an architecture.
 */
ArchitectureDescriptor parse_architecture(std::string_view text, std::string device_name = {});

/**
 * @brief Best-effort mapping of a marketing device name (e.g. "NVIDIA H100 80GB HBM3") to an architecture.
 *
 * Only used when the runtime cannot report a compute capability.
 * Returns an unknown descriptor if no table entry matches.
 */
ArchitectureDescriptor architecture_from_device_name(std::string_view device_name);

}  // namespace forgecache::hardware

#endif //FORGECACHE_SRC_HARDWARE_ARCHITECTURE_H
