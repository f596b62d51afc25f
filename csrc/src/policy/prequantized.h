// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FORGECACHE_SRC_POLICY_PREQUANTIZED_H
#define FORGECACHE_SRC_POLICY_PREQUANTIZED_H

#include <optional>
#include <string_view>

#include "policy/quantization_policy.h"

namespace forgecache::policy {

/**
 * @brief Weight format of a published TensorRT-LLM checkpoint, judged by its model id.
 *
 * The id must contain "trt"; the format markers are then tried in order:
 * "awq" -> int4_awq, "fp8" -> fp8, "int8"/"int-8" -> int8_sq, "8bit"/"8-bit" -> fp8.
 * Matching is case-insensitive.
 *
 * @return nullopt if @p model_id does not name a pre-quantized TensorRT-LLM checkpoint.
 */
std::optional<WeightFormat> trt_prequantized_format(std::string_view model_id);

/**
 * @brief Weight format of an already quantized Hugging Face model, judged by its model id.
 *
 * "awq" or a 4-bit weight-only hint ("w4a16", "nvfp4", "compressed-tensors",
 * "autoround") -> int4_awq; "gptq" -> gptq. Case-insensitive.
 */
std::optional<WeightFormat> prequantized_format(std::string_view model_id);

}  // namespace forgecache::policy

#endif //FORGECACHE_SRC_POLICY_PREQUANTIZED_H
