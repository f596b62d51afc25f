// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "remote/remote_resolver.h"

#include <algorithm>
#include <set>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "artifacts/engine_label.h"
#include "pipeline/logging.h"
#include "utilities/errors.h"
#include "utilities/utils.h"

namespace forgecache::remote {

RemotePreference remote_preference_from_str(std::string_view s) {
    if (iequals(s, "engines")) return RemotePreference::Engines;
    if (iequals(s, "checkpoints")) return RemotePreference::Checkpoints;
    if (iequals(s, "auto")) return RemotePreference::Auto;
    throw ConfigurationError(fmt::format("remote_preference: unknown value '{}'. Available: engines, checkpoints, auto", s));
}

const char* to_string(RemotePreference preference) {
    switch (preference) {
        case RemotePreference::Engines:     return "engines";
        case RemotePreference::Checkpoints: return "checkpoints";
        case RemotePreference::Auto:        return "auto";
    }
    return "unknown";
}

std::optional<std::string> select_engine_label(const std::vector<std::string>& labels, std::string_view preferred,
                                               const hardware::ArchitectureDescriptor& architecture) {
    if (!preferred.empty() && std::ranges::find(labels, preferred) != labels.end()) {
        return std::string(preferred);
    }
    if (labels.size() == 1) {
        return labels.front();
    }
    if (!architecture.known()) {
        return std::nullopt;
    }

    std::string prefix = architecture.Code + "_";
    std::optional<std::string> match;
    for (const auto& label : labels) {
        if (label.starts_with(prefix)) {
            if (match) return std::nullopt;
            match = label;
        }
    }
    return match;
}

RemoteResolver::RemoteResolver(IArtifactStore& store, RemoteResolverOptions options, pipeline::BuildRunLogger& logger) :
    mStore(store), mOptions(std::move(options)), mLogger(logger) {
}

std::vector<std::string> RemoteResolver::list_with_retries(const std::string& prefix) {
    return with_retries([&] { return mStore.list(prefix); }, mOptions.Retry, fmt::format("listing {}", prefix),
        mOptions.Sleep, [&](int attempt, std::chrono::milliseconds delay, const TransientNetworkError& e) {
            mLogger.log_warning(fmt::format("listing {} failed (attempt {}): {}; retrying in {} ms", prefix, attempt, e.what(), delay.count()));
        });
}

void RemoteResolver::download_with_retries(const std::string& prefix, const std::filesystem::path& destination) {
    with_retries([&] { mStore.download(prefix, destination); }, mOptions.Retry, fmt::format("downloading {}", prefix),
        mOptions.Sleep, [&](int attempt, std::chrono::milliseconds delay, const TransientNetworkError& e) {
            mLogger.log_warning(fmt::format("downloading {} failed (attempt {}): {}; retrying in {} ms", prefix, attempt, e.what(), delay.count()));
        });
}

std::vector<std::string> RemoteResolver::engine_labels() {
    const std::string root = std::string(kEnginesPrefix) + "/";
    std::set<std::string> labels;
    for (const auto& file : list_with_retries(kEnginesPrefix)) {
        if (!file.starts_with(root)) continue;
        std::string_view rest = std::string_view(file).substr(root.size());
        auto slash = rest.find('/');
        if (slash == std::string_view::npos || slash == 0) continue;
        labels.emplace(rest.substr(0, slash));
    }
    return {labels.begin(), labels.end()};
}

std::optional<artifacts::ArtifactDescriptor> RemoteResolver::try_engine(const hardware::ArchitectureDescriptor& architecture) {
    auto labels = engine_labels();
    if (labels.empty()) {
        mLogger.log_message("[Remote] no prebuilt engines available");
        return std::nullopt;
    }
    for (const auto& label : labels) {
        if (!artifacts::is_valid_engine_label(label)) {
            mLogger.log_warning(fmt::format("remote engine label '{}' does not follow <sm>_trt-llm-<ver>_cuda<ver>", label));
        }
    }

    auto label = select_engine_label(labels, mOptions.EngineLabel, architecture);
    if (!label) {
        mLogger.log_message(fmt::format("[Remote] {} engine labels, none selectable for {}",
                                        labels.size(), architecture.known() ? architecture.Code : "an unknown GPU"));
        return std::nullopt;
    }

    std::error_code ec;
    std::filesystem::remove_all(mOptions.EngineDestination, ec);
    mLogger.log_message(fmt::format("[Remote] downloading engine {}", *label));
    download_with_retries(fmt::format("{}/{}", kEnginesPrefix, *label), mOptions.EngineDestination);

    auto engine = artifacts::engine_artifact(mOptions.EngineDestination, *label);
    auto result = artifacts::validate(engine, architecture, mOptions.Validator);
    mLogger.log_validation(fmt::format("remote engine {}", *label), result);
    if (result.usable()) {
        return engine;
    }

    mLogger.log_warning(fmt::format("remote engine {} rejected: {}", *label, result.Error));
    std::filesystem::remove_all(mOptions.EngineDestination, ec);
    return std::nullopt;
}

std::optional<artifacts::ArtifactDescriptor> RemoteResolver::try_checkpoint(const hardware::ArchitectureDescriptor& architecture) {
    if (list_with_retries(kCheckpointsPrefix).empty()) {
        mLogger.log_message("[Remote] no prebuilt checkpoint available");
        return std::nullopt;
    }

    std::error_code ec;
    std::filesystem::remove_all(mOptions.CheckpointDestination, ec);
    mLogger.log_message("[Remote] downloading checkpoint");
    download_with_retries(kCheckpointsPrefix, mOptions.CheckpointDestination);

    auto checkpoint = artifacts::checkpoint_artifact(mOptions.CheckpointDestination);
    auto result = artifacts::validate(checkpoint, architecture, mOptions.Validator);
    mLogger.log_validation("remote checkpoint", result);
    if (result.usable()) {
        return checkpoint;
    }

    mLogger.log_warning(fmt::format("remote checkpoint rejected: {}", result.Error));
    std::filesystem::remove_all(mOptions.CheckpointDestination, ec);
    return std::nullopt;
}

std::optional<artifacts::ArtifactDescriptor> RemoteResolver::resolve_remote(const hardware::ArchitectureDescriptor& architecture,
                                                                            RemotePreference preference) {
    std::error_code ec;
    if (preference != RemotePreference::Checkpoints) {
        try {
            if (auto engine = try_engine(architecture)) {
                return engine;
            }
        } catch (const RemoteUnavailableError& e) {
            std::filesystem::remove_all(mOptions.EngineDestination, ec);
            mLogger.log_warning(fmt::format("remote engine unavailable: {}", e.what()));
        }
    }
    if (preference != RemotePreference::Engines) {
        try {
            if (auto checkpoint = try_checkpoint(architecture)) {
                return checkpoint;
            }
        } catch (const RemoteUnavailableError& e) {
            std::filesystem::remove_all(mOptions.CheckpointDestination, ec);
            mLogger.log_warning(fmt::format("remote checkpoint unavailable, building locally: {}", e.what()));
        }
    }
    return std::nullopt;
}

}  // namespace forgecache::remote
