// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FORGECACHE_SRC_PIPELINE_ORCHESTRATOR_H
#define FORGECACHE_SRC_PIPELINE_ORCHESTRATOR_H

#include <filesystem>
#include <optional>
#include <vector>

#include "artifacts/artifact.h"
#include "artifacts/artifact_validator.h"
#include "cache/rebuild_decision.h"
#include "config/build_options.h"
#include "hardware/hardware_probe.h"
#include "pipeline/layout.h"
#include "pipeline/logging.h"
#include "pipeline/toolchain.h"
#include "policy/quantization_policy.h"
#include "remote/artifact_store.h"
#include "remote/retry.h"

namespace forgecache::pipeline {

enum class PipelineState {
    Start,
    Wipe,
    RemoteResolve,
    Quantize,
    FetchCheckpoint,
    Compile,
    Validate,
    PersistRecord,
    Push,
    Done
};

const char* to_string(PipelineState state);

/// How the served weights come into being.
enum class WeightSource {
    Quantize,       ///< quantized locally (or resolved remotely) from the model source
    Prequantized,   ///< the model id already names quantized weights
    Unquantized     ///< served as published, e.g. in tool-only deployments
};

const char* to_string(WeightSource source);

/// Where the artifact served at the end of a run came from.
enum class ArtifactOrigin {
    Cache,
    RemoteEngine,
    RemoteCheckpoint,   ///< checkpoint downloaded, engine compiled locally
    Local,
    ModelSource         ///< nothing built; the runtime loads the model as published
};

const char* to_string(ArtifactOrigin origin);

/// Everything decided before acting; also the output of `forgecache plan`.
struct BuildPlan {
    hardware::ArchitectureDescriptor Architecture;
    EngineKind Engine = EngineKind::Trt;
    policy::PrecisionMode Mode = policy::PrecisionMode::Compact;
    WeightSource Source = WeightSource::Quantize;
    policy::QuantizationPolicy Policy;
    ArtifactLayout Layout;
    cache::ConfigurationSnapshot Snapshot;
    cache::ModeSwitch Switch;
    cache::RebuildDecision Decision;
    bool Forced = false;

    [[nodiscard]] bool rebuild() const { return Forced || Switch.ForcedFullWipe || Decision.Rebuild; }
    /// Only TensorRT-LLM compiles, and only when there are weights of our own to compile.
    [[nodiscard]] bool builds_engine() const { return Engine == EngineKind::Trt && Source != WeightSource::Unquantized; }
};

/**
 * @brief The artifact a successful run leaves for the runtime: the engine for
 * trt, the quantized checkpoint for vllm, nothing when the model is served as published.
 */
std::optional<artifacts::ArtifactDescriptor> served_artifact(const BuildPlan& plan);

struct PipelineResult {
    BuildPlan Plan;
    std::vector<PipelineState> Trace;
    ArtifactOrigin Origin = ArtifactOrigin::Local;
    artifacts::ValidationResult Validation;
    bool Pushed = false;
};

/**
 * @brief Sequences mode-switch handling, cache checks, remote resolution,
 * quantization, compilation, validation and record persistence.
 *
 * START -> [WIPE] -> REMOTE_RESOLVE -> QUANTIZE | FETCH_CHECKPOINT -> COMPILE -> VALIDATE -> PERSIST_RECORD -> [PUSH] -> DONE,
 * with a direct START -> DONE edge for a valid cache hit and skip edges for
 * remotely resolved engines and checkpoints. vllm never compiles and never
 * talks to the remote store; pre-quantized and tool-only builds skip QUANTIZE.
 */
class PipelineOrchestrator {
public:
    /**
     * @param store Remote store, or nullptr when no remote is configured.
     */
    PipelineOrchestrator(config::BuildOptions options, hardware::IHardwareProbe& probe, IToolchain& toolchain,
                         remote::IArtifactStore* store, BuildRunLogger& logger);

    /// Replaces the sleep used between remote retries.
    void set_sleep(remote::SleepFn sleep) { mSleep = std::move(sleep); }

    /**
     * @brief Resolve hardware, policy and the rebuild decision without side effects.
     * @throws forgecache::ConfigurationError for invalid options.
     */
    [[nodiscard]] BuildPlan plan();

    /**
     * @brief Run the pipeline under the build lock.
     *
     * @throws forgecache::ConfigurationError before any work for invalid options.
     * @throws forgecache::BuildLockedError if another build holds the lock.
     * @throws forgecache::ExternalToolFailure if the quantizer, downloader or compiler fails.
     * @throws forgecache::ArtifactError if a locally built artifact does not validate.
     */
    PipelineResult run();

    /// Validate the served artifact of the configured layout against the local GPU.
    [[nodiscard]] artifacts::ValidationResult check();

private:
    [[nodiscard]] BuildPlan build_plan(const std::optional<cache::PersistedBuildRecord>& record);
    void enter(PipelineResult& result, PipelineState state);
    void wipe_for_mode_switch();
    void remove_stale_artifacts(const BuildPlan& plan, const std::optional<cache::PersistedBuildRecord>& record);
    void require_tools(bool quantize, bool fetch, bool compile) const;
    [[nodiscard]] bool model_is_local() const;
    void run_quantize(const BuildPlan& plan);
    [[nodiscard]] std::filesystem::path fetch_checkpoint(const BuildPlan& plan);
    void run_compile(const BuildPlan& plan, const std::filesystem::path& checkpoint_dir);
    void write_engine_metadata(const BuildPlan& plan);
    void push_artifacts(PipelineResult& result);
    [[nodiscard]] artifacts::ValidatorOptions validator_options() const;
    [[nodiscard]] remote::RetryPolicy retry_policy() const;
    void remove_path(const std::filesystem::path& path);

    config::BuildOptions mOptions;
    hardware::IHardwareProbe& mProbe;
    IToolchain& mToolchain;
    remote::IArtifactStore* mStore;
    BuildRunLogger& mLogger;
    remote::SleepFn mSleep = remote::sleep_for;
};

}  // namespace forgecache::pipeline

#endif //FORGECACHE_SRC_PIPELINE_ORCHESTRATOR_H
