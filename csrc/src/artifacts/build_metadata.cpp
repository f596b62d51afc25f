// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "artifacts/build_metadata.h"

#include <array>
#include <fstream>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "utilities/utils.h"

namespace forgecache::artifacts {

namespace {

std::string get_string(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return {};
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number()) return it->dump();
    return {};
}

int get_int(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return 0;
    if (it->is_number_integer() || it->is_number_unsigned()) return it->get<int>();
    if (it->is_number_float()) return static_cast<int>(it->get<double>());
    if (it->is_string()) {
        try {
            return std::stoi(it->get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

struct PathHint {
    std::string_view Needle;
    std::string_view Label;
};

constexpr std::array<PathHint, 14> kPathHints{{
    {"full-prec", "full-prec"},
    {"full_prec", "full-prec"},
    {"fullprec", "full-prec"},
    {"w4a8-awq", "w4a8-awq"},
    {"w4a8_awq", "w4a8-awq"},
    {"awq", "int4-awq"},
    {"int8-wo", "int8-wo"},
    {"int8_wo", "int8-wo"},
    {"int8-sq", "int8-wo"},
    {"int8_sq", "int8-wo"},
    {"8bit", "8bit"},
    {"fp16", "fp16"},
    {"float16", "fp16"},
    {"fp8", "fp8"},
}};

}  // namespace

std::optional<BuildMetadata> read_build_metadata(const std::filesystem::path& directory) {
    auto path = directory / kBuildMetadataFile;
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open build metadata {}", path.string()));
    }

    nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw std::runtime_error(fmt::format("build metadata {} is not a JSON object", path.string()));
    }

    BuildMetadata meta;
    meta.ModelId = get_string(j, "model_id");
    meta.DType = get_string(j, "dtype");
    meta.QuantMethod = get_string(j, "quant_method");
    meta.MaxBatchSize = get_int(j, "max_batch_size");
    meta.MaxInputLen = get_int(j, "max_input_len");
    meta.MaxOutputLen = get_int(j, "max_output_len");
    meta.TensorrtLlmVersion = get_string(j, "tensorrt_llm_version");
    meta.CudaToolkit = get_string(j, "cuda_toolkit");
    meta.SmArch = get_string(j, "sm_arch");
    meta.GpuName = get_string(j, "gpu_name");
    meta.KvCacheDType = get_string(j, "kv_cache_dtype");
    meta.AwqBlockSize = get_int(j, "awq_block_size");
    meta.CalibSize = get_int(j, "calib_size");
    meta.BuiltAt = get_string(j, "built_at");
    meta.PrecisionMode = get_string(j, "precision_mode");

    // older engines only carry the nested quantization block
    if (auto q = j.find("quantization"); q != j.end() && q->is_object()) {
        if (meta.QuantMethod.empty()) meta.QuantMethod = get_string(*q, "weights");
        if (meta.KvCacheDType.empty()) meta.KvCacheDType = get_string(*q, "kv_cache");
    }
    return meta;
}

void write_build_metadata(const std::filesystem::path& directory, const BuildMetadata& metadata) {
    nlohmann::json j;
    j["model_id"] = metadata.ModelId;
    j["dtype"] = metadata.DType;
    j["quant_method"] = metadata.QuantMethod;
    j["max_batch_size"] = metadata.MaxBatchSize;
    j["max_input_len"] = metadata.MaxInputLen;
    j["max_output_len"] = metadata.MaxOutputLen;
    j["tensorrt_llm_version"] = metadata.TensorrtLlmVersion;
    j["cuda_toolkit"] = metadata.CudaToolkit;
    j["sm_arch"] = metadata.SmArch;
    j["gpu_name"] = metadata.GpuName;
    j["kv_cache_dtype"] = metadata.KvCacheDType;
    j["awq_block_size"] = metadata.AwqBlockSize;
    j["calib_size"] = metadata.CalibSize;
    j["built_at"] = metadata.BuiltAt;
    j["precision_mode"] = metadata.PrecisionMode;
    j["quantization"] = {{"weights", metadata.QuantMethod}, {"kv_cache", metadata.KvCacheDType}};

    std::filesystem::create_directories(directory);
    auto path = directory / kBuildMetadataFile;
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open {} for writing", path.string()));
    }
    file << j.dump(2) << "\n";
    if (!file) {
        throw std::runtime_error(fmt::format("could not write build metadata {}", path.string()));
    }
}

std::string summarize_quantization(const std::optional<BuildMetadata>& metadata, const std::filesystem::path& path) {
    if (metadata) {
        std::string weights = to_lower(metadata->QuantMethod);
        std::string mode = to_lower(metadata->PrecisionMode);
        if (weights == "fp8") return "fp8";
        if (weights == "none" || weights == "full_prec") return "full-prec";
        if (weights == "w4a8_awq") return "w4a8-awq";
        if (weights == "int8_wo" || weights == "int8_sq") return "int8-wo";
        if (mode == "base" && !weights.empty()) return "base-" + weights;
        if (weights == "int4_awq") return "int4-awq";
        if (!weights.empty()) return weights;
        if (!metadata->DType.empty()) return to_lower(metadata->DType);
    }

    std::string p = to_lower(path.string());
    for (const auto& hint : kPathHints) {
        if (p.find(hint.Needle) != std::string::npos) {
            return std::string(hint.Label);
        }
    }
    return "unknown";
}

}  // namespace forgecache::artifacts
