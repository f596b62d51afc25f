// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "pipeline/orchestrator.h"

#include <chrono>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "artifacts/artifact.h"
#include "artifacts/build_metadata.h"
#include "artifacts/engine_label.h"
#include "cache/build_record.h"
#include "cache/signature.h"
#include "policy/prequantized.h"
#include "remote/remote_resolver.h"
#include "utilities/errors.h"
#include "utilities/file_lock.h"
#include "utilities/utils.h"

namespace forgecache::pipeline {

namespace {

long elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
}

// TensorRT-LLM exports are recognized by a "trt" marker; vLLM loads any quantized HF model.
std::optional<policy::WeightFormat> published_format(EngineKind engine, std::string_view model_id) {
    if (engine == EngineKind::Trt) {
        return policy::trt_prequantized_format(model_id);
    }
    return policy::prequantized_format(model_id);
}

}  // namespace

const char* to_string(PipelineState state) {
    switch (state) {
        case PipelineState::Start:         return "START";
        case PipelineState::Wipe:          return "WIPE";
        case PipelineState::RemoteResolve: return "REMOTE_RESOLVE";
        case PipelineState::Quantize:      return "QUANTIZE";
        case PipelineState::FetchCheckpoint: return "FETCH_CHECKPOINT";
        case PipelineState::Compile:       return "COMPILE";
        case PipelineState::Validate:      return "VALIDATE";
        case PipelineState::PersistRecord: return "PERSIST_RECORD";
        case PipelineState::Push:          return "PUSH";
        case PipelineState::Done:          return "DONE";
    }
    return "UNKNOWN";
}

const char* to_string(WeightSource source) {
    switch (source) {
        case WeightSource::Quantize:     return "quantize";
        case WeightSource::Prequantized: return "prequantized";
        case WeightSource::Unquantized:  return "unquantized";
    }
    return "unknown";
}

std::optional<artifacts::ArtifactDescriptor> served_artifact(const BuildPlan& plan) {
    if (plan.builds_engine()) {
        return artifacts::engine_artifact(plan.Layout.EngineDir);
    }
    if (plan.Source == WeightSource::Quantize) {
        return artifacts::hf_checkpoint_artifact(plan.Layout.CheckpointDir);
    }
    return std::nullopt;
}

const char* to_string(ArtifactOrigin origin) {
    switch (origin) {
        case ArtifactOrigin::Cache:            return "cache";
        case ArtifactOrigin::RemoteEngine:     return "remote-engine";
        case ArtifactOrigin::RemoteCheckpoint: return "remote-checkpoint";
        case ArtifactOrigin::Local:            return "local";
        case ArtifactOrigin::ModelSource:      return "model-source";
    }
    return "unknown";
}

PipelineOrchestrator::PipelineOrchestrator(config::BuildOptions options, hardware::IHardwareProbe& probe,
                                           IToolchain& toolchain, remote::IArtifactStore* store, BuildRunLogger& logger) :
    mOptions(std::move(options)), mProbe(probe), mToolchain(toolchain), mStore(store), mLogger(logger) {
}

artifacts::ValidatorOptions PipelineOrchestrator::validator_options() const {
    return artifacts::ValidatorOptions{.StrictArchMatch = mOptions.StrictArchMatch};
}

remote::RetryPolicy PipelineOrchestrator::retry_policy() const {
    remote::RetryPolicy policy;
    policy.MaxAttempts = mOptions.RetryAttempts;
    policy.InitialDelay = std::chrono::milliseconds(mOptions.RetryDelayMs);
    return policy;
}

BuildPlan PipelineOrchestrator::build_plan(const std::optional<cache::PersistedBuildRecord>& record) {
    BuildPlan plan;
    plan.Architecture = mProbe.probe();
    plan.Engine = mOptions.engine_kind();
    plan.Mode = policy::precision_mode_from_str(mOptions.PrecisionMode);
    if (mOptions.tool_only()) {
        plan.Source = WeightSource::Unquantized;
        plan.Policy = policy::resolve_for_format(plan.Architecture, policy::WeightFormat::FullPrecision);
    } else if (auto format = published_format(plan.Engine, mOptions.ModelId)) {
        plan.Source = WeightSource::Prequantized;
        plan.Policy = policy::resolve_for_format(plan.Architecture, *format);
    } else {
        plan.Policy = policy::resolve(plan.Architecture, plan.Mode);
        // vLLM serves full-precision weights straight from the model source
        const bool as_published = plan.Engine == EngineKind::Vllm && plan.Policy.Format == policy::WeightFormat::FullPrecision;
        plan.Source = as_published ? WeightSource::Unquantized : WeightSource::Quantize;
    }
    if (!mOptions.KvCacheDType.empty()) {
        plan.Policy.KvCacheDType = mOptions.KvCacheDType;
    }
    plan.Layout = mOptions.layout();
    plan.Snapshot = config::capture(mOptions);
    plan.Switch = cache::detect_mode_switch(plan.Snapshot, record);
    plan.Decision = cache::needs_rebuild(plan.Snapshot, record);
    plan.Forced = mOptions.Force;
    return plan;
}

BuildPlan PipelineOrchestrator::plan() {
    mOptions.validate();
    return build_plan(cache::load_record(mOptions.record_path()));
}

void PipelineOrchestrator::enter(PipelineResult& result, PipelineState state) {
    result.Trace.push_back(state);
    mLogger.log_state(to_string(state));
}

void PipelineOrchestrator::remove_path(const std::filesystem::path& path) {
    if (path.empty()) return;
    std::error_code ec;
    auto removed = std::filesystem::remove_all(path, ec);
    if (ec) {
        throw std::runtime_error(fmt::format("could not remove {}: {}", path.string(), ec.message()));
    }
    if (removed > 0) {
        mLogger.log_message(fmt::format("[Cache] removed {}", path.string()));
    }
}

void PipelineOrchestrator::wipe_for_mode_switch() {
    for (const auto& path : mode_switch_wipe_paths(mOptions.WorkRoot, mOptions.models_dir(), mOptions.record_path())) {
        remove_path(path);
    }
}

/**
 * @brief Delete the artifacts a rebuild will replace.
 *
 * Removes the checkpoint and engine directories of the current layout and,
 * when the record names different directories (e.g. after a precision mode
 * change), those as well. Recorded directories outside the models directory
 * are left alone, since the record is not a trusted source of paths to delete.
 */
void PipelineOrchestrator::remove_stale_artifacts(const BuildPlan& plan, const std::optional<cache::PersistedBuildRecord>& record) {
    remove_path(plan.Layout.CheckpointDir);
    remove_path(plan.Layout.EngineDir);
    if (!record) return;

    for (auto name : {cache::param::CheckpointDir, cache::param::EngineDir}) {
        const std::string& previous = record->value(name);
        if (previous.empty()) continue;
        std::filesystem::path path(previous);
        if (path == plan.Layout.CheckpointDir || path == plan.Layout.EngineDir) continue;
        if (!is_within(path, mOptions.models_dir())) {
            mLogger.log_warning(fmt::format("leaving previous {} {} in place: outside {}", name, previous, mOptions.models_dir().string()));
            continue;
        }
        remove_path(path);
    }
}

void PipelineOrchestrator::require_tools(bool quantize, bool fetch, bool compile) const {
    if (quantize) mToolchain.check_configured(Tool::Quantize);
    if (fetch && !model_is_local()) mToolchain.check_configured(Tool::Fetch);
    if (compile) mToolchain.check_configured(Tool::Compile);
}

bool PipelineOrchestrator::model_is_local() const {
    std::error_code ec;
    return std::filesystem::is_directory(mOptions.ModelId, ec);
}

void PipelineOrchestrator::run_quantize(const BuildPlan& plan) {
    QuantizeRequest request{
        .ModelSource = mOptions.ModelId,
        .OutputDir = plan.Layout.CheckpointDir,
        .Policy = plan.Policy,
        .ModelDType = mOptions.ModelDType,
        .AwqBlockSize = mOptions.AwqBlockSize,
        .CalibSize = mOptions.CalibSize,
        .TpSize = mOptions.TpSize
    };

    {
        auto section = mLogger.log_section_start(fmt::format("Quantizing {} ({})", mOptions.ModelId, policy::to_string(plan.Policy.Format)));
        auto start = std::chrono::steady_clock::now();
        CommandResult result = mToolchain.quantize(request);
        mLogger.log_tool("quantize", result, elapsed_ms(start));
        if (!result.ok()) {
            throw ExternalToolFailure("quantize", result.ExitCode, result.Output,
                fmt::format("quantizer exited with code {} for {} (format {}, output {}):\n{}",
                            result.ExitCode, mOptions.ModelId, policy::to_string(plan.Policy.Format),
                            plan.Layout.CheckpointDir.string(), result.Output));
        }
    }

    auto checkpoint = plan.Engine == EngineKind::Vllm ? artifacts::hf_checkpoint_artifact(plan.Layout.CheckpointDir)
                                                      : artifacts::checkpoint_artifact(plan.Layout.CheckpointDir);
    auto validation = artifacts::validate(checkpoint, plan.Architecture, validator_options());
    mLogger.log_validation(plan.Layout.CheckpointDir.string(), validation);
    validation.throw_if_failed();
}

/**
 * @brief Locate the checkpoint of a pre-quantized TensorRT-LLM model.
 *
 * A local model directory is used in place; otherwise the downloader fills the
 * checkpoint directory of the layout. Exported repositories keep the checkpoint
 * under `trt-llm/checkpoints/`, which is preferred when present.
 */
std::filesystem::path PipelineOrchestrator::fetch_checkpoint(const BuildPlan& plan) {
    std::filesystem::path dir = mOptions.ModelId;
    if (model_is_local()) {
        mLogger.log_message(fmt::format("[Model] using pre-quantized checkpoint {} in place", dir.string()));
    } else {
        dir = plan.Layout.CheckpointDir;
        auto section = mLogger.log_section_start(fmt::format("Downloading pre-quantized checkpoint {}", mOptions.ModelId));
        auto start = std::chrono::steady_clock::now();
        CommandResult result = mToolchain.fetch(FetchRequest{.ModelSource = mOptions.ModelId, .OutputDir = dir});
        mLogger.log_tool("fetch", result, elapsed_ms(start));
        if (!result.ok()) {
            remove_path(dir);
            throw ExternalToolFailure("fetch", result.ExitCode, result.Output,
                fmt::format("checkpoint download exited with code {} for {} (output {}):\n{}",
                            result.ExitCode, mOptions.ModelId, dir.string(), result.Output));
        }
    }

    std::error_code ec;
    auto exported = dir / "trt-llm" / "checkpoints";
    if (std::filesystem::is_regular_file(exported / artifacts::kManifestFile, ec)) {
        dir = exported;
    }

    auto validation = artifacts::validate(artifacts::checkpoint_artifact(dir), plan.Architecture, validator_options());
    mLogger.log_validation(dir.string(), validation);
    validation.throw_if_failed();
    return dir;
}

void PipelineOrchestrator::run_compile(const BuildPlan& plan, const std::filesystem::path& checkpoint_dir) {
    CompileRequest request{
        .CheckpointDir = checkpoint_dir,
        .OutputDir = plan.Layout.EngineDir,
        .Policy = plan.Policy,
        .MaxBatchSize = mOptions.MaxBatchSize,
        .MaxInputLen = mOptions.MaxInputLen,
        .MaxOutputLen = mOptions.MaxOutputLen
    };

    auto section = mLogger.log_section_start(fmt::format("Compiling engine {}", plan.Layout.EngineDir.string()));
    auto start = std::chrono::steady_clock::now();
    CommandResult result = mToolchain.compile(request);
    mLogger.log_tool("compile", result, elapsed_ms(start));
    if (!result.ok()) {
        throw ExternalToolFailure("compile", result.ExitCode, result.Output,
            fmt::format("engine compiler exited with code {} for checkpoint {} (output {}):\n{}",
                        result.ExitCode, checkpoint_dir.string(), plan.Layout.EngineDir.string(), result.Output));
    }
}

void PipelineOrchestrator::write_engine_metadata(const BuildPlan& plan) {
    // block and calibration sizes only describe our own AWQ runs
    const bool awq = plan.Source == WeightSource::Quantize && plan.Policy.Format == policy::WeightFormat::Int4Awq;
    artifacts::BuildMetadata meta{
        .ModelId = mOptions.ModelId,
        .DType = mOptions.ModelDType,
        .QuantMethod = policy::to_string(plan.Policy.Format),
        .MaxBatchSize = mOptions.MaxBatchSize,
        .MaxInputLen = mOptions.MaxInputLen,
        .MaxOutputLen = mOptions.MaxOutputLen,
        .TensorrtLlmVersion = mOptions.TrtLlmVersion,
        .CudaToolkit = mOptions.CudaVersion,
        .SmArch = plan.Architecture.Code,
        .GpuName = plan.Architecture.DeviceName,
        .KvCacheDType = plan.Policy.KvCacheDType,
        .AwqBlockSize = awq ? mOptions.AwqBlockSize : 0,
        .CalibSize = awq ? mOptions.CalibSize : 0,
        .BuiltAt = iso8601_utc(std::chrono::system_clock::now()),
        .PrecisionMode = policy::to_string(plan.Mode)
    };
    artifacts::write_build_metadata(plan.Layout.EngineDir, meta);
}

void PipelineOrchestrator::push_artifacts(PipelineResult& result) {
    const BuildPlan& plan = result.Plan;
    if (!plan.Architecture.known() || mOptions.TrtLlmVersion.empty() || mOptions.CudaVersion.empty()) {
        mLogger.log_warning("not pushing: the engine label needs a detected GPU architecture, --trtllm-version and --cuda-version");
        return;
    }

    std::string label = artifacts::make_engine_label(plan.Architecture.Code, mOptions.TrtLlmVersion, mOptions.CudaVersion);
    auto policy = retry_policy();
    auto observer = [&](int attempt, std::chrono::milliseconds delay, const TransientNetworkError& e) {
        mLogger.log_warning(fmt::format("upload failed (attempt {}): {}; retrying in {} ms", attempt, e.what(), delay.count()));
    };

    try {
        auto section = mLogger.log_section_start(fmt::format("Uploading engine {}", label));
        std::string engine_prefix = fmt::format("{}/{}", remote::kEnginesPrefix, label);
        remote::with_retries([&] { mStore->upload(plan.Layout.EngineDir, engine_prefix); },
                             policy, "uploading engine", mSleep, observer);
        if (result.Origin == ArtifactOrigin::Local && plan.Source == WeightSource::Quantize) {
            remote::with_retries([&] { mStore->upload(plan.Layout.CheckpointDir, remote::kCheckpointsPrefix); },
                                 policy, "uploading checkpoint", mSleep, observer);
        }
        result.Pushed = true;
    } catch (const RemoteUnavailableError& e) {
        mLogger.log_warning(fmt::format("push failed, local build is unaffected: {}", e.what()));
    }
}

PipelineResult PipelineOrchestrator::run() {
    mOptions.validate();
    BuildLock lock(mOptions.lock_path());

    PipelineResult result;
    enter(result, PipelineState::Start);

    auto record = cache::load_record(mOptions.record_path());
    result.Plan = build_plan(record);
    BuildPlan& plan = result.Plan;
    mLogger.log_gpu(plan.Architecture);
    mLogger.log_policy(plan.Mode, plan.Policy);
    if (plan.Source != WeightSource::Quantize) {
        mLogger.log_message(fmt::format("[Policy] {} weights are {} ({}); skipping quantization",
                                        mOptions.ModelId, to_string(plan.Source), policy::to_string(plan.Policy.Format)));
    }
    mLogger.log_mode_switch(plan.Switch);

    if (plan.Switch.ForcedFullWipe) {
        enter(result, PipelineState::Wipe);
        wipe_for_mode_switch();
        record.reset();
        plan.Decision = cache::needs_rebuild(plan.Snapshot, record);
    }
    mLogger.log_decision(plan.Decision, plan.Forced);

    const auto served = served_artifact(plan);
    if (!plan.rebuild()) {
        if (!served) {
            result.Origin = ArtifactOrigin::Cache;
            mLogger.log_message("[Cache] configuration unchanged and nothing to build");
            enter(result, PipelineState::Done);
            return result;
        }
        result.Validation = artifacts::validate(*served, plan.Architecture, validator_options());
        mLogger.log_validation(served->Directory.string(), result.Validation);
        if (result.Validation.usable()) {
            result.Origin = ArtifactOrigin::Cache;
            mLogger.log_message(fmt::format("[Cache] {} {} is up to date", artifacts::to_string(served->Kind), served->Directory.string()));
            enter(result, PipelineState::Done);
            return result;
        }
        mLogger.log_warning(fmt::format("build record matches but the cached {} is unusable, rebuilding: {}",
                                        artifacts::to_string(served->Kind), result.Validation.Error));
    }

    bool need_quantize = plan.Source == WeightSource::Quantize;
    bool need_fetch = plan.Engine == EngineKind::Trt && plan.Source == WeightSource::Prequantized;
    bool need_compile = plan.builds_engine();
    // remote labels describe TensorRT-LLM engines and checkpoints only
    const bool use_remote = mStore != nullptr && plan.builds_engine();

    if (!use_remote) {
        require_tools(need_quantize, need_fetch, need_compile);
    }

    remove_stale_artifacts(plan, record);
    remove_path(mOptions.record_path());

    std::optional<artifacts::ArtifactDescriptor> remote_engine;
    std::filesystem::path checkpoint_dir = plan.Layout.CheckpointDir;
    result.Origin = served ? ArtifactOrigin::Local : ArtifactOrigin::ModelSource;

    if (use_remote) {
        enter(result, PipelineState::RemoteResolve);
        remote::RemoteResolverOptions remote_options{
            .EngineLabel = mOptions.EngineLabel,
            .EngineDestination = plan.Layout.EngineDir,
            .CheckpointDestination = plan.Layout.CheckpointDir,
            .Validator = validator_options(),
            .Retry = retry_policy(),
            .Sleep = mSleep
        };
        remote::RemoteResolver resolver(*mStore, std::move(remote_options), mLogger);
        auto artifact = resolver.resolve_remote(plan.Architecture, remote::remote_preference_from_str(mOptions.RemotePreference));
        if (artifact && artifact->Kind == artifacts::ArtifactKind::Engine) {
            need_quantize = false;
            need_fetch = false;
            need_compile = false;
            remote_engine = std::move(artifact);
            result.Origin = ArtifactOrigin::RemoteEngine;
        } else if (artifact) {
            need_quantize = false;
            need_fetch = false;
            result.Origin = ArtifactOrigin::RemoteCheckpoint;
        }
        require_tools(need_quantize, need_fetch, need_compile);
    }

    if (need_quantize) {
        enter(result, PipelineState::Quantize);
        run_quantize(plan);
    }
    if (need_fetch) {
        enter(result, PipelineState::FetchCheckpoint);
        checkpoint_dir = fetch_checkpoint(plan);
    }
    if (need_compile) {
        enter(result, PipelineState::Compile);
        run_compile(plan, checkpoint_dir);
        write_engine_metadata(plan);
    }

    if (remote_engine || served) {
        enter(result, PipelineState::Validate);
        const auto& artifact = remote_engine ? *remote_engine : *served;
        result.Validation = artifacts::validate(artifact, plan.Architecture, validator_options());
        mLogger.log_validation(artifact.Directory.string(), result.Validation);
        result.Validation.throw_if_failed();
    }

    enter(result, PipelineState::PersistRecord);
    cache::persist(plan.Snapshot, cache::sign(plan.Snapshot), mOptions.record_path());
    mLogger.log_message(fmt::format("[Cache] build record written to {}", mOptions.record_path().string()));

    if (mOptions.Push && mStore != nullptr) {
        if (!plan.builds_engine()) {
            mLogger.log_message("[Remote] no engine is built for this configuration; nothing to push");
        } else if (result.Origin == ArtifactOrigin::RemoteEngine) {
            mLogger.log_message("[Remote] engine came from the remote store; nothing to push");
        } else {
            enter(result, PipelineState::Push);
            push_artifacts(result);
        }
    }

    enter(result, PipelineState::Done);
    return result;
}

artifacts::ValidationResult PipelineOrchestrator::check() {
    mOptions.validate();
    BuildPlan plan = build_plan(cache::load_record(mOptions.record_path()));
    mLogger.log_gpu(plan.Architecture);

    auto served = served_artifact(plan);
    if (!served) {
        mLogger.log_message(fmt::format("[Check] {} is served as published; nothing to validate", mOptions.ModelId));
        return {};
    }
    auto result = artifacts::validate(*served, plan.Architecture, validator_options());
    mLogger.log_validation(served->Directory.string(), result);
    return result;
}

}  // namespace forgecache::pipeline
