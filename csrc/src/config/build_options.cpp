// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "config/build_options.h"

#include <cstdint>
#include <fstream>
#include <optional>
#include <stdexcept>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "policy/quantization_policy.h"
#include "remote/remote_resolver.h"
#include "utilities/errors.h"
#include "utilities/utils.h"

namespace forgecache::config {

namespace {

std::optional<int> as_int(const nlohmann::json& value) {
    if (value.is_number_integer()) return value.get<int>();
    if (value.is_number_unsigned()) return static_cast<int>(value.get<std::uint64_t>());
    if (value.is_number_float()) return static_cast<int>(value.get<double>());
    if (value.is_string()) {
        try {
            return std::stoi(value.get<std::string>());
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<bool> as_bool(const nlohmann::json& value) {
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number_integer()) return value.get<int>() != 0;
    if (value.is_string()) {
        const std::string v = value.get<std::string>();
        if (iequals(v, "true") || v == "1") return true;
        if (iequals(v, "false") || v == "0") return false;
    }
    return std::nullopt;
}

template<typename T>
std::optional<T> get_opt(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;
    if constexpr (std::is_same_v<T, int>) {
        return as_int(*it);
    } else if constexpr (std::is_same_v<T, bool>) {
        return as_bool(*it);
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (it->is_string()) return it->get<std::string>();
        if (it->is_number()) return it->dump();
    }
    return std::nullopt;
}

template<typename T>
void overlay(const nlohmann::json& obj, const char* key, T& target) {
    if (auto v = get_opt<T>(obj, key)) {
        target = *v;
    }
}

void require_positive(int value, const char* name) {
    if (value <= 0) {
        throw ConfigurationError(fmt::format("{}: must be positive, got {}", name, value));
    }
}

}  // namespace

std::filesystem::path BuildOptions::models_dir() const {
    if (!ModelsDir.empty()) return ModelsDir;
    return std::filesystem::path(WorkRoot) / "models";
}

std::filesystem::path BuildOptions::record_path() const {
    if (!RecordPath.empty()) return RecordPath;
    return std::filesystem::path(WorkRoot) / ".run" / "build_config.env";
}

std::filesystem::path BuildOptions::lock_path() const {
    return std::filesystem::path(WorkRoot) / ".run" / "build.lock";
}

pipeline::EngineKind BuildOptions::engine_kind() const {
    return pipeline::engine_kind_from_str(InferenceEngine);
}

bool BuildOptions::tool_only() const {
    return iequals(DeployMode, "tool");
}

pipeline::ArtifactLayout BuildOptions::layout() const {
    const auto engine = engine_kind();
    auto result = pipeline::default_layout(models_dir(), ModelId, policy::precision_mode_from_str(PrecisionMode), engine);
    if (!CheckpointDir.empty()) result.CheckpointDir = CheckpointDir;
    if (!EngineDir.empty() && engine == pipeline::EngineKind::Trt) result.EngineDir = EngineDir;
    return result;
}

pipeline::BuildRunLogger::EVerbosity BuildOptions::verbosity() const {
    if (Verbose) return pipeline::BuildRunLogger::VERBOSE;
    if (Quiet) return pipeline::BuildRunLogger::QUIET;
    return pipeline::BuildRunLogger::DEFAULT;
}

void BuildOptions::validate() const {
    if (trim(ModelId).empty()) {
        throw ConfigurationError("model_id: no model configured (--model-id / FORGECACHE_MODEL_ID)");
    }
    engine_kind();
    policy::precision_mode_from_str(PrecisionMode);
    remote::remote_preference_from_str(RemotePreference);
    require_positive(MaxBatchSize, "max_batch_size");
    require_positive(MaxInputLen, "max_input_len");
    require_positive(MaxOutputLen, "max_output_len");
    require_positive(AwqBlockSize, "awq_block_size");
    require_positive(CalibSize, "calib_size");
    require_positive(TpSize, "tp_size");
    require_positive(RetryAttempts, "retry_attempts");
    if (is_within(WorkRoot, models_dir())) {
        throw ConfigurationError(fmt::format(
            "models_dir: {} is or contains the work root {}; an engine switch would delete the deployment",
            models_dir().string(), WorkRoot));
    }
    if (Push && RemoteRef.empty()) {
        throw ConfigurationError("remote: --push needs a remote artifact store (--remote / FORGECACHE_REMOTE)");
    }
}

void register_options(CLI::App& app, BuildOptions& o) {
    app.add_option("--work-root", o.WorkRoot, "Deployment root holding .run/ and models/")->envname("FORGECACHE_WORK_ROOT");
    app.add_option("--models-dir", o.ModelsDir, "Artifact directory (default: <work-root>/models)")->envname("FORGECACHE_MODELS_DIR");
    app.add_option("--record", o.RecordPath, "Build record file (default: <work-root>/.run/build_config.env)")->envname("FORGECACHE_RECORD");
    app.add_option("--log-file", o.LogFile, "Where to save the JSON run log")->envname("FORGECACHE_LOG_FILE");

    app.add_option("--engine", o.InferenceEngine, "Inference engine kind; changing it wipes all cached state")
        ->envname("FORGECACHE_ENGINE")
        ->check(CLI::IsMember({"trt", "vllm"}, CLI::ignore_case));
    app.add_option("--precision-mode", o.PrecisionMode, "Precision mode: compact (4-bit) or base (fp8 / full precision)")
        ->envname("FORGECACHE_PRECISION_MODE")
        ->check(CLI::IsMember(policy::available_precision_modes(), CLI::ignore_case));
    app.add_option("--model-id", o.ModelId, "Hugging Face model id or local model directory")->envname("FORGECACHE_MODEL_ID");
    app.add_option("--checkpoint-dir", o.CheckpointDir, "Override the quantized checkpoint directory")->envname("FORGECACHE_CHECKPOINT_DIR");
    app.add_option("--engine-dir", o.EngineDir, "Override the compiled engine directory")->envname("FORGECACHE_ENGINE_DIR");
    app.add_option("--deploy-mode", o.DeployMode, "Which models are deployed")
        ->envname("FORGECACHE_DEPLOY_MODE")
        ->check(CLI::IsMember({"chat", "tool", "both"}, CLI::ignore_case));
    app.add_option("--model-dtype", o.ModelDType, "Native dtype of the model weights")->envname("FORGECACHE_MODEL_DTYPE");
    app.add_option("--kv-cache-dtype", o.KvCacheDType, "Override the KV cache dtype chosen by the policy")->envname("FORGECACHE_KV_CACHE_DTYPE");
    app.add_option("--max-batch-size", o.MaxBatchSize, "Engine max batch size")->envname("FORGECACHE_MAX_BATCH_SIZE")->check(CLI::PositiveNumber);
    app.add_option("--max-input-len", o.MaxInputLen, "Engine max input length")->envname("FORGECACHE_MAX_INPUT_LEN")->check(CLI::PositiveNumber);
    app.add_option("--max-output-len", o.MaxOutputLen, "Engine max output length")->envname("FORGECACHE_MAX_OUTPUT_LEN")->check(CLI::PositiveNumber);
    app.add_option("--awq-block-size", o.AwqBlockSize, "AWQ group size (compact mode)")
        ->envname("FORGECACHE_AWQ_BLOCK_SIZE")
        ->check(CLI::IsMember({64, 128}));
    app.add_option("--calib-size", o.CalibSize, "Number of calibration samples (compact mode)")->envname("FORGECACHE_CALIB_SIZE")->check(CLI::PositiveNumber);
    app.add_option("--tp-size", o.TpSize, "Tensor parallel size")->envname("FORGECACHE_TP_SIZE")->check(CLI::PositiveNumber);

    app.add_option("--gpu-arch", o.GpuArch, "Architecture code replacing GPU detection, e.g. sm89")->envname("FORGECACHE_GPU_SM_ARCH");

    app.add_option("--remote", o.RemoteRef, "Remote artifact store")->envname("FORGECACHE_REMOTE");
    app.add_option("--remote-cmd", o.RemoteCommand, "External store client (list/download/upload)")->envname("FORGECACHE_REMOTE_CMD");
    app.add_option("--remote-preference", o.RemotePreference, "Which remote artifacts to use: engines, checkpoints or auto")
        ->envname("FORGECACHE_REMOTE_PREFERENCE")
        ->check(CLI::IsMember({"engines", "checkpoints", "auto"}, CLI::ignore_case));
    app.add_option("--engine-label", o.EngineLabel, "Preferred remote engine label")->envname("FORGECACHE_ENGINE_LABEL");
    app.add_option("--retry-attempts", o.RetryAttempts, "Attempts per remote call before giving up")->envname("FORGECACHE_RETRY_ATTEMPTS")->check(CLI::PositiveNumber);
    app.add_option("--retry-delay-ms", o.RetryDelayMs, "Initial retry delay; doubles per attempt")->envname("FORGECACHE_RETRY_DELAY_MS")->check(CLI::NonNegativeNumber);

    app.add_option("--trtllm-version", o.TrtLlmVersion, "TensorRT-LLM version recorded in engine metadata")->envname("FORGECACHE_TRTLLM_VERSION");
    app.add_option("--cuda-version", o.CudaVersion, "CUDA toolkit version recorded in engine metadata (defaults to the CUDA runtime version)")->envname("FORGECACHE_CUDA_VERSION");
    app.add_option("--quantize-cmd", o.QuantizeCommand, "Quantizer command line")->envname("FORGECACHE_QUANTIZE_CMD");
    app.add_option("--compile-cmd", o.CompileCommand, "Engine compiler command line")->envname("FORGECACHE_COMPILE_CMD");
    app.add_option("--fetch-cmd", o.FetchCommand, "Downloader for pre-quantized TensorRT-LLM checkpoints")->envname("FORGECACHE_FETCH_CMD");

    app.add_flag("--force", o.Force, "Rebuild even if the cache is valid")->envname("FORGECACHE_FORCE");
    app.add_flag("--push", o.Push, "Upload freshly built artifacts to the remote store")->envname("FORGECACHE_PUSH");
    app.add_flag("--strict-arch-match,!--no-strict-arch-match", o.StrictArchMatch,
                 "Reject engines built for another GPU architecture")->envname("FORGECACHE_STRICT_ARCH_MATCH");
    auto quiet = app.add_flag("-q,--quiet", o.Quiet, "Only print warnings and errors");
    app.add_flag("-v,--verbose", o.Verbose, "Print options, state transitions and tool output")->excludes(quiet);
}

void load_config_file(const std::filesystem::path& path, BuildOptions& o) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open config file {}", path.string()));
    }

    nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw std::runtime_error(fmt::format("config file {} is not a JSON object", path.string()));
    }

    overlay(j, "work_root", o.WorkRoot);
    overlay(j, "models_dir", o.ModelsDir);
    overlay(j, "record", o.RecordPath);
    overlay(j, "log_file", o.LogFile);
    overlay(j, "engine", o.InferenceEngine);
    overlay(j, "precision_mode", o.PrecisionMode);
    overlay(j, "model_id", o.ModelId);
    overlay(j, "checkpoint_dir", o.CheckpointDir);
    overlay(j, "engine_dir", o.EngineDir);
    overlay(j, "deploy_mode", o.DeployMode);
    overlay(j, "model_dtype", o.ModelDType);
    overlay(j, "kv_cache_dtype", o.KvCacheDType);
    overlay(j, "max_batch_size", o.MaxBatchSize);
    overlay(j, "max_input_len", o.MaxInputLen);
    overlay(j, "max_output_len", o.MaxOutputLen);
    overlay(j, "awq_block_size", o.AwqBlockSize);
    overlay(j, "calib_size", o.CalibSize);
    overlay(j, "tp_size", o.TpSize);
    overlay(j, "gpu_arch", o.GpuArch);
    overlay(j, "remote", o.RemoteRef);
    overlay(j, "remote_cmd", o.RemoteCommand);
    overlay(j, "remote_preference", o.RemotePreference);
    overlay(j, "engine_label", o.EngineLabel);
    overlay(j, "retry_attempts", o.RetryAttempts);
    overlay(j, "retry_delay_ms", o.RetryDelayMs);
    overlay(j, "trtllm_version", o.TrtLlmVersion);
    overlay(j, "cuda_version", o.CudaVersion);
    overlay(j, "quantize_cmd", o.QuantizeCommand);
    overlay(j, "compile_cmd", o.CompileCommand);
    overlay(j, "fetch_cmd", o.FetchCommand);
    overlay(j, "push", o.Push);
    overlay(j, "strict_arch_match", o.StrictArchMatch);
}

cache::ConfigurationSnapshot capture(const BuildOptions& o) {
    auto dirs = o.layout();
    return cache::ConfigurationSnapshot::from_parameters({
        {std::string(cache::param::InferenceEngine), to_lower(o.InferenceEngine)},
        {std::string(cache::param::PrecisionMode), to_lower(o.PrecisionMode)},
        {std::string(cache::param::ModelId), o.ModelId},
        {std::string(cache::param::CheckpointDir), dirs.CheckpointDir.string()},
        {std::string(cache::param::EngineDir), dirs.EngineDir.string()},
        {std::string(cache::param::DeployMode), to_lower(o.DeployMode)},
        {std::string(cache::param::ModelDType), o.ModelDType},
        {std::string(cache::param::KvCacheDType), o.KvCacheDType},
        {std::string(cache::param::MaxBatchSize), std::to_string(o.MaxBatchSize)},
        {std::string(cache::param::MaxInputLen), std::to_string(o.MaxInputLen)},
        {std::string(cache::param::MaxOutputLen), std::to_string(o.MaxOutputLen)},
        {std::string(cache::param::AwqBlockSize), std::to_string(o.AwqBlockSize)},
        {std::string(cache::param::CalibSize), std::to_string(o.CalibSize)},
        {std::string(cache::param::TpSize), std::to_string(o.TpSize)},
    });
}

std::vector<std::pair<std::string_view, pipeline::BuildRunLogger::OptionValue>> describe(const BuildOptions& o) {
    using V = pipeline::BuildRunLogger::OptionValue;
    return {
        {"work_root", V{o.WorkRoot}},
        {"models_dir", V{o.models_dir().string()}},
        {"record", V{o.record_path().string()}},
        {"engine", V{o.InferenceEngine}},
        {"precision_mode", V{o.PrecisionMode}},
        {"model_id", V{o.ModelId}},
        {"deploy_mode", V{o.DeployMode}},
        {"model_dtype", V{o.ModelDType}},
        {"kv_cache_dtype", V{o.KvCacheDType}},
        {"max_batch_size", V{static_cast<std::int64_t>(o.MaxBatchSize)}},
        {"max_input_len", V{static_cast<std::int64_t>(o.MaxInputLen)}},
        {"max_output_len", V{static_cast<std::int64_t>(o.MaxOutputLen)}},
        {"awq_block_size", V{static_cast<std::int64_t>(o.AwqBlockSize)}},
        {"calib_size", V{static_cast<std::int64_t>(o.CalibSize)}},
        {"tp_size", V{static_cast<std::int64_t>(o.TpSize)}},
        {"gpu_arch", V{o.GpuArch}},
        {"remote", V{o.RemoteRef}},
        {"remote_preference", V{o.RemotePreference}},
        {"engine_label", V{o.EngineLabel}},
        {"force", V{o.Force}},
        {"push", V{o.Push}},
        {"strict_arch_match", V{o.StrictArchMatch}},
    };
}

}  // namespace forgecache::config
