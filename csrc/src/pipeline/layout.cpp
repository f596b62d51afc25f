// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "pipeline/layout.h"

#include <fmt/core.h>

#include "utilities/errors.h"
#include "utilities/utils.h"

namespace forgecache::pipeline {

EngineKind engine_kind_from_str(std::string_view kind) {
    if (iequals(kind, "trt")) return EngineKind::Trt;
    if (iequals(kind, "vllm")) return EngineKind::Vllm;
    throw ConfigurationError(fmt::format("inference_engine: unknown engine kind '{}'. Available: trt, vllm", kind));
}

const char* to_string(EngineKind kind) {
    switch (kind) {
        case EngineKind::Trt:  return "trt";
        case EngineKind::Vllm: return "vllm";
    }
    return "unknown";
}

std::string model_basename(std::string_view model_id) {
    while (!model_id.empty() && model_id.back() == '/') model_id.remove_suffix(1);
    auto slash = model_id.rfind('/');
    if (slash != std::string_view::npos) model_id.remove_prefix(slash + 1);
    return std::string(model_id);
}

ArtifactLayout default_layout(const std::filesystem::path& models_dir, std::string_view model_id, policy::PrecisionMode mode,
                              EngineKind engine) {
    const std::string name = model_basename(model_id);
    if (engine == EngineKind::Vllm) {
        const char* suffix = mode == policy::PrecisionMode::Compact ? "awq" : "8bit";
        return {models_dir / fmt::format("{}-{}", name, suffix), {}};
    }
    if (mode == policy::PrecisionMode::Compact) {
        return {models_dir / fmt::format("{}-trtllm-ckpt-int4-awq", name), models_dir / fmt::format("{}-trt-awq", name)};
    }
    return {models_dir / fmt::format("{}-trtllm-ckpt-8bit", name), models_dir / fmt::format("{}-trt-8bit", name)};
}

std::vector<std::filesystem::path> mode_switch_wipe_paths(const std::filesystem::path& work_root,
                                                          const std::filesystem::path& models_dir,
                                                          const std::filesystem::path& record_path) {
    return {
        work_root / ".venv",
        work_root / ".venv-trt",
        work_root / ".venv-vllm",
        work_root / ".awq",
        work_root / ".trtllm-repo",
        models_dir,
        record_path,
    };
}

}  // namespace forgecache::pipeline
