// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FORGECACHE_SRC_ARTIFACTS_ARTIFACT_H
#define FORGECACHE_SRC_ARTIFACTS_ARTIFACT_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "artifacts/build_metadata.h"

namespace forgecache::artifacts {

enum class ArtifactKind {
    Checkpoint,     ///< portable quantized weights, not yet compiled
    Engine          ///< compiled for one GPU architecture
};

const char* to_string(ArtifactKind kind);

inline constexpr const char* kEnginePrimaryFile = "rank0.engine";
inline constexpr const char* kManifestFile = "config.json";
inline constexpr const char* kCheckpointShardPattern = "rank*.safetensors";
inline constexpr const char* kHfShardPattern = "*.safetensors";
inline constexpr std::uintmax_t kMinEngineBytes = 1'000'000;

/**
 * @brief A candidate artifact directory and what a valid one must contain.
 *
 * RequiredFiles entries may contain a single `*` wildcard, in which case at
 * least one file in the directory must match.
 */
struct ArtifactDescriptor {
    ArtifactKind Kind = ArtifactKind::Engine;
    std::filesystem::path Directory;
    std::vector<std::string> RequiredFiles;
    /// File whose size is checked against MinPrimaryBytes; empty to skip the check.
    std::string PrimaryFile;
    std::uintmax_t MinPrimaryBytes = 0;
    /// Embedded metadata; read from the directory by the validator when unset.
    std::optional<BuildMetadata> Metadata;
    /// Remote label the artifact was downloaded under, used by the naming heuristic.
    std::string Label;
};

ArtifactDescriptor engine_artifact(const std::filesystem::path& directory, std::string label = {});
ArtifactDescriptor checkpoint_artifact(const std::filesystem::path& directory);
/// Quantized weights in Hugging Face layout, loaded directly by vLLM.
ArtifactDescriptor hf_checkpoint_artifact(const std::filesystem::path& directory);

}  // namespace forgecache::artifacts

#endif //FORGECACHE_SRC_ARTIFACTS_ARTIFACT_H
