// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FORGECACHE_SRC_REMOTE_REMOTE_RESOLVER_H
#define FORGECACHE_SRC_REMOTE_REMOTE_RESOLVER_H

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "artifacts/artifact.h"
#include "artifacts/artifact_validator.h"
#include "hardware/architecture.h"
#include "remote/artifact_store.h"
#include "remote/retry.h"

namespace forgecache::pipeline {
class BuildRunLogger;
}

namespace forgecache::remote {

enum class RemotePreference {
    Engines,        ///< only consider compiled engines
    Checkpoints,    ///< only consider quantized checkpoints
    Auto            ///< engines first, then checkpoints
};

/// @throws forgecache::ConfigurationError for anything other than engines, checkpoints or auto.
RemotePreference remote_preference_from_str(std::string_view s);
const char* to_string(RemotePreference preference);

struct RemoteResolverOptions {
    /// Explicitly requested engine label; tried first when present remotely.
    std::string EngineLabel;
    /// Local directories the downloaded artifacts are placed in.
    std::filesystem::path EngineDestination;
    std::filesystem::path CheckpointDestination;
    artifacts::ValidatorOptions Validator;
    RetryPolicy Retry;
    SleepFn Sleep = sleep_for;
};

/**
 * @brief Pick the engine label to download from @p labels.
 *
 * In order: @p preferred if it is available; the only label if there is exactly
 * one; the only label prefixed with the architecture code of @p architecture.
 * Anything else is ambiguous and yields nullopt.
 */
std::optional<std::string> select_engine_label(const std::vector<std::string>& labels, std::string_view preferred,
                                               const hardware::ArchitectureDescriptor& architecture);

/**
 * @brief Finds a prebuilt engine or checkpoint in a remote store.
 */
class RemoteResolver {
public:
    RemoteResolver(IArtifactStore& store, RemoteResolverOptions options, pipeline::BuildRunLogger& logger);

    /**
     * @brief Download and validate the best remote artifact for @p architecture.
     *
     * An engine result means quantization and compilation can be skipped; a
     * checkpoint result means only quantization can be skipped. Returns nullopt
     * when nothing usable exists or the store is unavailable after retries.
     * An engine that cannot be fetched is discarded and the checkpoint is still tried.
     */
    std::optional<artifacts::ArtifactDescriptor> resolve_remote(const hardware::ArchitectureDescriptor& architecture,
                                                                RemotePreference preference);

    /// Engine labels present in the store (directories directly below the engines prefix).
    std::vector<std::string> engine_labels();

private:
    std::optional<artifacts::ArtifactDescriptor> try_engine(const hardware::ArchitectureDescriptor& architecture);
    std::optional<artifacts::ArtifactDescriptor> try_checkpoint(const hardware::ArchitectureDescriptor& architecture);
    std::vector<std::string> list_with_retries(const std::string& prefix);
    void download_with_retries(const std::string& prefix, const std::filesystem::path& destination);

    IArtifactStore& mStore;
    RemoteResolverOptions mOptions;
    pipeline::BuildRunLogger& mLogger;
};

}  // namespace forgecache::remote

#endif //FORGECACHE_SRC_REMOTE_REMOTE_RESOLVER_H
