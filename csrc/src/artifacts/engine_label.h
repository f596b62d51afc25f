// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FORGECACHE_SRC_ARTIFACTS_ENGINE_LABEL_H
#define FORGECACHE_SRC_ARTIFACTS_ENGINE_LABEL_H

#include <optional>
#include <string>
#include <string_view>

namespace forgecache::artifacts {

/// `<sm_arch>_trt-llm-<version>_cuda<version>`, e.g. `sm89_trt-llm-1.0.0_cuda12.9`.
std::string make_engine_label(std::string_view sm_arch, std::string_view trtllm_version, std::string_view cuda_version);

bool is_valid_engine_label(std::string_view label);

/// Leading `sm<digits>` of a name such as `sm90_trt-llm-...`, if any.
std::optional<std::string> architecture_prefix(std::string_view name);

}  // namespace forgecache::artifacts

#endif //FORGECACHE_SRC_ARTIFACTS_ENGINE_LABEL_H
