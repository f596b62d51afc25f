// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "artifacts/engine_label.h"

#include <regex>

#include <fmt/core.h>

namespace forgecache::artifacts {

std::string make_engine_label(std::string_view sm_arch, std::string_view trtllm_version, std::string_view cuda_version) {
    return fmt::format("{}_trt-llm-{}_cuda{}", sm_arch, trtllm_version, cuda_version);
}

bool is_valid_engine_label(std::string_view label) {
    static const std::regex pattern(R"(^sm[0-9]+_trt-llm-[0-9]+\.[0-9]+.*_cuda[0-9]+\.[0-9]+$)");
    return std::regex_match(label.begin(), label.end(), pattern);
}

std::optional<std::string> architecture_prefix(std::string_view name) {
    static const std::regex pattern(R"(^(sm[0-9]+)_)");
    std::match_results<std::string_view::const_iterator> match;
    if (std::regex_search(name.begin(), name.end(), match, pattern)) {
        return match[1].str();
    }
    return std::nullopt;
}

}  // namespace forgecache::artifacts
