// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "artifacts/artifact_validator.h"

#include <system_error>

#include <fmt/core.h>

#include "artifacts/engine_label.h"
#include "utilities/errors.h"
#include "utilities/utils.h"

namespace forgecache::artifacts {

namespace {

bool directory_has_match(const std::filesystem::path& directory, std::string_view pattern) {
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
        if (entry.is_regular_file(ec) && matches_wildcard(entry.path().filename().string(), pattern)) {
            return true;
        }
    }
    return false;
}

std::string artifact_name(const ArtifactDescriptor& artifact) {
    if (!artifact.Label.empty()) return artifact.Label;
    auto dir = artifact.Directory.lexically_normal();
    if (!dir.has_filename()) dir = dir.parent_path();
    return dir.filename().string();
}

}  // namespace

void ValidationResult::throw_if_failed() const {
    if (Status != ValidationStatus::Failed) return;
    if (Failure == ValidationFailure::Incompatible) {
        throw ArtifactIncompatibleError(Error);
    }
    throw ArtifactMissingError(Error);
}

ValidationResult validate(const ArtifactDescriptor& artifact, const hardware::ArchitectureDescriptor& architecture,
                          const ValidatorOptions& options) {
    ValidationResult result;
    const std::string kind = to_string(artifact.Kind);
    const std::string dir = artifact.Directory.string();

    auto fail = [&](ValidationFailure failure, std::string message) {
        result.Status = ValidationStatus::Failed;
        result.Failure = failure;
        result.Error = std::move(message);
        return result;
    };
    auto warn = [&](std::string message) {
        if (result.Status == ValidationStatus::Ok) result.Status = ValidationStatus::Warning;
        result.Warnings.push_back(std::move(message));
    };

    std::error_code ec;
    if (!std::filesystem::is_directory(artifact.Directory, ec)) {
        return fail(ValidationFailure::Missing, fmt::format("{} directory {} does not exist", kind, dir));
    }

    for (const auto& required : artifact.RequiredFiles) {
        if (required.find('*') != std::string::npos) {
            if (!directory_has_match(artifact.Directory, required)) {
                return fail(ValidationFailure::Missing,
                            fmt::format("{} {}: no file matching {}", kind, dir, required));
            }
        } else if (!std::filesystem::is_regular_file(artifact.Directory / required, ec)) {
            return fail(ValidationFailure::Missing,
                        fmt::format("{} {}: required file {} is missing", kind, dir, required));
        }
    }

    if (!artifact.PrimaryFile.empty() && artifact.MinPrimaryBytes > 0) {
        auto primary = artifact.Directory / artifact.PrimaryFile;
        auto size = std::filesystem::file_size(primary, ec);
        if (!ec && size < artifact.MinPrimaryBytes) {
            warn(fmt::format("{} is only {} bytes (expected at least {}); the build may be truncated",
                             primary.string(), size, artifact.MinPrimaryBytes));
        }
    }

    if (artifact.Kind == ArtifactKind::Checkpoint) {
        return result;
    }

    auto mismatch = [&](std::string message) {
        if (options.StrictArchMatch) {
            return fail(ValidationFailure::Incompatible, std::move(message));
        }
        warn(message + " (strict architecture matching disabled)");
        return result;
    };

    if (!architecture.known()) {
        result.HeuristicOnly = true;
        warn(fmt::format("GPU architecture unknown; cannot verify that engine {} matches this host", dir));
        return result;
    }

    std::optional<BuildMetadata> metadata = artifact.Metadata;
    if (!metadata) {
        try {
            metadata = read_build_metadata(artifact.Directory);
        } catch (const std::runtime_error& e) {
            return fail(ValidationFailure::Incompatible, e.what());
        }
    }

    if (metadata && !metadata->SmArch.empty()) {
        hardware::ArchitectureDescriptor built;
        try {
            built = hardware::parse_architecture(metadata->SmArch);
        } catch (const ConfigurationError&) {
            return fail(ValidationFailure::Incompatible,
                        fmt::format("engine {}: unrecognized sm_arch '{}' in {}", dir, metadata->SmArch, kBuildMetadataFile));
        }
        if (built.Numeric != architecture.Numeric) {
            return mismatch(fmt::format("engine {} was built for {} but this GPU is {} ({})",
                                        dir, built.Code, architecture.Code, architecture.DeviceName));
        }
        return result;
    }

    result.HeuristicOnly = true;
    std::string name = artifact_name(artifact);
    if (auto prefix = architecture_prefix(name); prefix && *prefix != architecture.Code) {
        return mismatch(fmt::format("engine {} has no {} and is named for {}, but this GPU is {}",
                                    dir, kBuildMetadataFile, *prefix, architecture.Code));
    }
    return result;
}

}  // namespace forgecache::artifacts
