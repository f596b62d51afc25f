// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FORGECACHE_SRC_PIPELINE_LAYOUT_H
#define FORGECACHE_SRC_PIPELINE_LAYOUT_H

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "policy/quantization_policy.h"

namespace forgecache::pipeline {

/// Inference runtime the artifacts are built for.
enum class EngineKind {
    Trt,    ///< TensorRT-LLM: quantized checkpoint compiled into a per-GPU engine
    Vllm    ///< vLLM: serves Hugging Face weights, quantized or not, without compilation
};

/// @throws forgecache::ConfigurationError for anything other than "trt" or "vllm" (case-insensitive).
EngineKind engine_kind_from_str(std::string_view kind);
const char* to_string(EngineKind kind);

/// Where the checkpoint and the engine of one precision mode live.
struct ArtifactLayout {
    std::filesystem::path CheckpointDir;
    std::filesystem::path EngineDir;
};

/// Last path component of a model id such as `org/model-name`.
std::string model_basename(std::string_view model_id);

/**
 * @brief Default directories below @p models_dir for @p model_id in @p mode.
 *
 * trt compact: `<name>-trtllm-ckpt-int4-awq` and `<name>-trt-awq`;
 * trt base: `<name>-trtllm-ckpt-8bit` and `<name>-trt-8bit`.
 * vllm has no engine directory; its quantized checkpoint is `<name>-awq` or `<name>-8bit`.
 */
ArtifactLayout default_layout(const std::filesystem::path& models_dir, std::string_view model_id, policy::PrecisionMode mode,
                              EngineKind engine = EngineKind::Trt);

/// Everything removed when the inference engine kind changes.
std::vector<std::filesystem::path> mode_switch_wipe_paths(const std::filesystem::path& work_root,
                                                          const std::filesystem::path& models_dir,
                                                          const std::filesystem::path& record_path);

}  // namespace forgecache::pipeline

#endif //FORGECACHE_SRC_PIPELINE_LAYOUT_H
