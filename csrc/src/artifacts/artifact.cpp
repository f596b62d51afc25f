// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "artifacts/artifact.h"

#include <utility>

namespace forgecache::artifacts {

const char* to_string(ArtifactKind kind) {
    switch (kind) {
        case ArtifactKind::Checkpoint: return "checkpoint";
        case ArtifactKind::Engine:     return "engine";
    }
    return "unknown";
}

ArtifactDescriptor engine_artifact(const std::filesystem::path& directory, std::string label) {
    return ArtifactDescriptor{
        .Kind = ArtifactKind::Engine,
        .Directory = directory,
        .RequiredFiles = {kEnginePrimaryFile, kManifestFile},
        .PrimaryFile = kEnginePrimaryFile,
        .MinPrimaryBytes = kMinEngineBytes,
        .Metadata = std::nullopt,
        .Label = std::move(label)
    };
}

ArtifactDescriptor checkpoint_artifact(const std::filesystem::path& directory) {
    return ArtifactDescriptor{
        .Kind = ArtifactKind::Checkpoint,
        .Directory = directory,
        .RequiredFiles = {kManifestFile, kCheckpointShardPattern},
        .PrimaryFile = {},
        .MinPrimaryBytes = 0,
        .Metadata = std::nullopt,
        .Label = {}
    };
}

ArtifactDescriptor hf_checkpoint_artifact(const std::filesystem::path& directory) {
    auto artifact = checkpoint_artifact(directory);
    artifact.RequiredFiles = {kManifestFile, kHfShardPattern};
    return artifact;
}

}  // namespace forgecache::artifacts
