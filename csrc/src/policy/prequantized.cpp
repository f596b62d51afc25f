// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "policy/prequantized.h"

#include <array>
#include <string>

#include "utilities/utils.h"

namespace forgecache::policy {

namespace {

struct NameMarker {
    std::string_view Marker;
    WeightFormat Format;
};

// first match wins
constexpr std::array<NameMarker, 6> kTrtMarkers{{
    {"awq",   WeightFormat::Int4Awq},
    {"fp8",   WeightFormat::Fp8},
    {"int8",  WeightFormat::Int8SmoothQuant},
    {"int-8", WeightFormat::Int8SmoothQuant},
    {"8bit",  WeightFormat::Fp8},
    {"8-bit", WeightFormat::Fp8},
}};

constexpr std::array<NameMarker, 6> kHfMarkers{{
    {"awq",                WeightFormat::Int4Awq},
    {"w4a16",              WeightFormat::Int4Awq},
    {"nvfp4",              WeightFormat::Int4Awq},
    {"compressed-tensors", WeightFormat::Int4Awq},
    {"autoround",          WeightFormat::Int4Awq},
    {"gptq",               WeightFormat::Gptq},
}};

template<std::size_t N>
std::optional<WeightFormat> first_marker(const std::string& lowered, const std::array<NameMarker, N>& markers) {
    for (const auto& m : markers) {
        if (lowered.find(m.Marker) != std::string::npos) {
            return m.Format;
        }
    }
    return std::nullopt;
}

}  // namespace

std::optional<WeightFormat> trt_prequantized_format(std::string_view model_id) {
    const std::string lowered = to_lower(model_id);
    if (lowered.find("trt") == std::string::npos) {
        return std::nullopt;
    }
    return first_marker(lowered, kTrtMarkers);
}

std::optional<WeightFormat> prequantized_format(std::string_view model_id) {
    return first_marker(to_lower(model_id), kHfMarkers);
}

}  // namespace forgecache::policy
