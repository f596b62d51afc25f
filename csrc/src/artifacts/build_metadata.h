// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FORGECACHE_SRC_ARTIFACTS_BUILD_METADATA_H
#define FORGECACHE_SRC_ARTIFACTS_BUILD_METADATA_H

#include <filesystem>
#include <optional>
#include <string>

namespace forgecache::artifacts {

inline constexpr const char* kBuildMetadataFile = "build_metadata.json";

/**
 * @brief Contents of `build_metadata.json`, written next to a compiled engine.
 */
struct BuildMetadata {
    std::string ModelId;
    std::string DType;
    std::string QuantMethod;
    int MaxBatchSize = 0;
    int MaxInputLen = 0;
    int MaxOutputLen = 0;
    std::string TensorrtLlmVersion;
    std::string CudaToolkit;
    std::string SmArch;
    std::string GpuName;
    std::string KvCacheDType;
    int AwqBlockSize = 0;
    int CalibSize = 0;
    std::string BuiltAt;
    std::string PrecisionMode;
};

/**
 * @brief Read `build_metadata.json` from @p directory.
 *
 * @return nullopt if the file does not exist.
 * @throws std::runtime_error if the file exists but is not a JSON object.
 */
std::optional<BuildMetadata> read_build_metadata(const std::filesystem::path& directory);

/// @throws std::runtime_error if the file cannot be written.
void write_build_metadata(const std::filesystem::path& directory, const BuildMetadata& metadata);

/**
 * @brief Short quantization label for logs, e.g. "fp8", "int4-awq", "full-prec".
 *
 * Uses the metadata when present and falls back to substrings of @p path.
 */
std::string summarize_quantization(const std::optional<BuildMetadata>& metadata, const std::filesystem::path& path);

}  // namespace forgecache::artifacts

#endif //FORGECACHE_SRC_ARTIFACTS_BUILD_METADATA_H
