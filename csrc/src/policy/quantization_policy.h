// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FORGECACHE_SRC_POLICY_QUANTIZATION_POLICY_H
#define FORGECACHE_SRC_POLICY_QUANTIZATION_POLICY_H

#include <string>
#include <string_view>
#include <vector>

#include "hardware/architecture.h"

namespace forgecache::policy {

/// User-facing quality/speed tier.
enum class PrecisionMode {
    Compact,    ///< 4-bit weights, smallest footprint
    Base        ///< near-full precision
};

enum class WeightFormat {
    Int4Awq,
    Fp8,
    Int8SmoothQuant,    ///< only reached through pre-quantized TensorRT-LLM exports
    Gptq,               ///< only reached through pre-quantized Hugging Face models
    FullPrecision
};

enum class AttentionBackend {
    FlashInfer,
    XFormers
};

/// KV cache dtype value meaning "keep the model's native dtype".
inline constexpr std::string_view kNativeKvCache = "none";

struct BatchLimits {
    int MaxBatchedTokensChat = 0;
    int MaxBatchedTokensTool = 0;
    int MaxNumSeqs = 0;

    bool operator==(const BatchLimits&) const = default;
};

/**
 * @brief Concrete quantization and runtime knobs for one architecture and precision mode.
 */
struct QuantizationPolicy {
    WeightFormat Format = WeightFormat::FullPrecision;
    std::string KvCacheDType{kNativeKvCache};
    AttentionBackend Attention = AttentionBackend::XFormers;
    BatchLimits Limits;

    bool operator==(const QuantizationPolicy&) const = default;
};

/// @throws forgecache::ConfigurationError for anything other than "compact" or "base" (case-insensitive).
PrecisionMode precision_mode_from_str(std::string_view mode);
const char* to_string(PrecisionMode mode);
const char* to_string(WeightFormat format);
const char* to_string(AttentionBackend backend);

std::vector<std::string> available_precision_modes();

/**
 * @brief Resolve the quantization policy for @p architecture and @p mode.
 *
 * Pure table lookup: compact always yields INT4-AWQ weights with an INT8 KV cache,
 * base yields FP8 weights and KV cache on FP8-capable hardware and full precision
 * with the native KV dtype otherwise. Unknown architectures get full precision
 * (in base mode) and the most conservative runtime limits.
 */
QuantizationPolicy resolve(const hardware::ArchitectureDescriptor& architecture, PrecisionMode mode);

/**
 * @brief Policy for weights whose format is already fixed, e.g. a pre-quantized
 * model or a deployment that serves the model unquantized.
 *
 * The KV cache dtype follows the weight format; runtime knobs come from the
 * same architecture table as resolve().
 */
QuantizationPolicy resolve_for_format(const hardware::ArchitectureDescriptor& architecture, WeightFormat format);

}  // namespace forgecache::policy

#endif //FORGECACHE_SRC_POLICY_QUANTIZATION_POLICY_H
