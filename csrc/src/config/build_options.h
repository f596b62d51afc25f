// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FORGECACHE_SRC_CONFIG_BUILD_OPTIONS_H
#define FORGECACHE_SRC_CONFIG_BUILD_OPTIONS_H

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cache/tracked_parameters.h"
#include "pipeline/layout.h"
#include "pipeline/logging.h"

namespace CLI {
class App;
}

namespace forgecache::config {

/**
 * @brief Every setting of a build invocation.
 *
 * Fields are public so CLI11 can bind them directly. Values are layered:
 * built-in defaults, then the JSON config file, then environment variables,
 * then the command line.
 */
struct BuildOptions {
    /// Root of the deployment tree; holds `.run/` and, by default, `models/`.
    std::string WorkRoot = ".";
    /// Artifact directory (defaults to `<work-root>/models`).
    std::string ModelsDir;
    /// Build record path (defaults to `<work-root>/.run/build_config.env`).
    std::string RecordPath;
    /// JSON run log; empty disables it.
    std::string LogFile;

    /// Compiler/runtime family targeted; a change wipes all cached state.
    std::string InferenceEngine = "trt";
    std::string PrecisionMode = "compact";
    /// Hugging Face model id or local model directory.
    std::string ModelId;
    /// Override for the checkpoint directory of the current mode.
    std::string CheckpointDir;
    /// Override for the engine directory of the current mode.
    std::string EngineDir;
    std::string DeployMode = "both";
    std::string ModelDType = "float16";
    /// KV cache dtype override; empty uses the resolved policy.
    std::string KvCacheDType;
    int MaxBatchSize = 16;
    int MaxInputLen = 8192;
    int MaxOutputLen = 2048;
    int AwqBlockSize = 128;
    int CalibSize = 256;
    int TpSize = 1;

    /// Explicit architecture code replacing GPU detection (e.g. "sm89").
    std::string GpuArch;

    /// Remote artifact store (directory or reference understood by RemoteCommand).
    std::string RemoteRef;
    /// External store client; empty means RemoteRef is a directory.
    std::string RemoteCommand;
    std::string RemotePreference = "auto";
    std::string EngineLabel;
    int RetryAttempts = 4;
    int RetryDelayMs = 500;

    /// Recorded in build metadata and engine labels.
    std::string TrtLlmVersion;
    std::string CudaVersion;

    std::string QuantizeCommand;
    std::string CompileCommand;
    /// Downloads a pre-quantized TensorRT-LLM checkpoint (`--model_id <id> --output_dir <dir>`).
    std::string FetchCommand;

    bool Force = false;
    bool Push = false;
    bool StrictArchMatch = true;
    bool Quiet = false;
    bool Verbose = false;

    [[nodiscard]] std::filesystem::path models_dir() const;
    [[nodiscard]] std::filesystem::path record_path() const;
    [[nodiscard]] std::filesystem::path lock_path() const;
    /// @throws forgecache::ConfigurationError for an unknown inference engine.
    [[nodiscard]] pipeline::EngineKind engine_kind() const;
    /// Only the tool classifier is deployed; the chat model is neither quantized nor compiled.
    [[nodiscard]] bool tool_only() const;
    /// Checkpoint and engine directories of the current precision mode, overrides applied.
    [[nodiscard]] pipeline::ArtifactLayout layout() const;
    [[nodiscard]] pipeline::BuildRunLogger::EVerbosity verbosity() const;

    /// @throws forgecache::ConfigurationError naming the first invalid or missing option.
    void validate() const;
};

/// Bind every option (with its FORGECACHE_* environment variable) to @p options.
void register_options(CLI::App& app, BuildOptions& options);

/**
 * @brief Overlay the values of a JSON config file onto @p options.
 *
 * Keys use the long option names with underscores (e.g. `"model_id"`,
 * `"max_batch_size"`). Unknown keys are ignored.
 *
 * @throws std::runtime_error if the file cannot be opened or parsed.
 */
void load_config_file(const std::filesystem::path& path, BuildOptions& options);

/// Snapshot of the tracked parameters as configured by @p options.
cache::ConfigurationSnapshot capture(const BuildOptions& options);

/// (name, value) pairs for BuildRunLogger::log_options.
std::vector<std::pair<std::string_view, pipeline::BuildRunLogger::OptionValue>> describe(const BuildOptions& options);

}  // namespace forgecache::config

#endif //FORGECACHE_SRC_CONFIG_BUILD_OPTIONS_H
