// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

#include <CLI/CLI.hpp>
#include <fmt/core.h>

#include "artifacts/build_metadata.h"
#include "config/build_options.h"
#include "hardware/hardware_probe.h"
#include "pipeline/logging.h"
#include "pipeline/orchestrator.h"
#include "pipeline/toolchain.h"
#include "remote/artifact_store.h"
#include "utilities/gpu_info.h"
#include "utilities/utils.h"

using namespace forgecache;

/**
 * @brief Command-line front end: parses options and runs one of the
 * `build`, `plan` or `check` commands.
 */
class BuildRunner {
public:
    /**
     * @brief Parse command-line options (CLI11), layered over an optional JSON config file.
     * @param argc Argument count.
     * @param argv Argument vector.
     */
    void load_build_config(int argc, const char** argv);

    /// Execute the selected command and return the process exit code.
    int launch(int argc, const char** argv);

private:
    int run_build(pipeline::PipelineOrchestrator& orchestrator, pipeline::BuildRunLogger& logger);
    int run_plan(pipeline::PipelineOrchestrator& orchestrator);
    int run_check(pipeline::PipelineOrchestrator& orchestrator);

    config::BuildOptions Options;
    std::string ConfigFile;
    std::string Command = "build";
};

void BuildRunner::load_build_config(int argc, const char** argv) {
    // the config file has to be applied before the real parse, so that
    // command line and environment values win over it.
    {
        CLI::App pre;
        pre.set_help_flag();
        pre.allow_extras();
        pre.add_option("--config", ConfigFile);
        try {
            pre.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            std::exit(pre.exit(e));
        }
        if (!ConfigFile.empty()) {
            config::load_config_file(ConfigFile, Options);
        }
    }

    CLI::App app{"forgecache: cached quantization and engine builds for GPU model serving"};
    app.fallthrough();
    app.add_option("--config", ConfigFile, "JSON file with option defaults (keys use underscores, e.g. model_id)")
        ->envname("FORGECACHE_CONFIG");
    config::register_options(app, Options);

    auto build = app.add_subcommand("build", "Build or reuse the engine for the current configuration (default)");
    auto plan = app.add_subcommand("plan", "Print the resolved policy and rebuild decision without building");
    auto check = app.add_subcommand("check", "Validate the engine of the current layout against the local GPU");
    app.require_subcommand(0, 1);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    if (plan->parsed()) {
        Command = "plan";
    } else if (check->parsed()) {
        Command = "check";
    } else if (build->parsed()) {
        Command = "build";
    }
}

int BuildRunner::launch(int argc, const char** argv) {
    // engine labels and build metadata fall back to the linked CUDA runtime
    if (Options.CudaVersion.empty()) {
        if (int version = SystemInfo::get_cuda_runtime_version(); version > 0) {
            Options.CudaVersion = fmt::format("{}.{}", version / 1000, (version % 1000) / 10);
        }
    }

    pipeline::BuildRunLogger logger(Options.LogFile, Options.verbosity());
    logger.log_cmd(argc, argv);
    logger.log_options(config::describe(Options));

    auto probe = hardware::IHardwareProbe::create(Options.GpuArch);
    pipeline::CommandToolchain toolchain(split_command(Options.QuantizeCommand), split_command(Options.CompileCommand),
                                         split_command(Options.FetchCommand));

    std::unique_ptr<remote::IArtifactStore> store;
    if (!Options.RemoteRef.empty()) {
        store = remote::IArtifactStore::create(Options.RemoteRef, Options.RemoteCommand);
    }

    pipeline::PipelineOrchestrator orchestrator(Options, *probe, toolchain, store.get(), logger);
    if (Command == "plan") {
        return run_plan(orchestrator);
    }
    if (Command == "check") {
        return run_check(orchestrator);
    }
    return run_build(orchestrator, logger);
}

int BuildRunner::run_build(pipeline::PipelineOrchestrator& orchestrator, pipeline::BuildRunLogger& logger) {
    pipeline::PipelineResult result = orchestrator.run();
    const auto& layout = result.Plan.Layout;
    if (!result.Plan.builds_engine()) {
        auto served = pipeline::served_artifact(result.Plan);
        logger.log_message(fmt::format("[Done] {} serves {} ({}, {})",
                                       pipeline::to_string(result.Plan.Engine),
                                       served ? served->Directory.string() : Options.ModelId,
                                       pipeline::to_string(result.Origin),
                                       policy::to_string(result.Plan.Policy.Format)));
        return EXIT_SUCCESS;
    }
    logger.log_message(fmt::format("[Done] engine {} ({}, {}{})",
                                   layout.EngineDir.string(),
                                   pipeline::to_string(result.Origin),
                                   artifacts::summarize_quantization(artifacts::read_build_metadata(layout.EngineDir), layout.EngineDir),
                                   result.Pushed ? ", pushed" : ""));
    return EXIT_SUCCESS;
}

int BuildRunner::run_plan(pipeline::PipelineOrchestrator& orchestrator) {
    pipeline::BuildPlan plan = orchestrator.plan();
    const auto& policy = plan.Policy;

    fmt::print("gpu:            {} ({})\n", plan.Architecture.known() ? plan.Architecture.Code : "unknown",
               plan.Architecture.DeviceName.empty() ? hardware::to_string(plan.Architecture.Family) : plan.Architecture.DeviceName);
    fmt::print("runtime:        {}\n", pipeline::to_string(plan.Engine));
    fmt::print("precision mode: {}\n", policy::to_string(plan.Mode));
    fmt::print("weights:        {} ({})\n", policy::to_string(policy.Format), pipeline::to_string(plan.Source));
    fmt::print("kv cache:       {}\n", policy.KvCacheDType);
    fmt::print("attention:      {}\n", policy::to_string(policy.Attention));
    fmt::print("batch limits:   chat {} / tool {} tokens, {} sequences\n",
               policy.Limits.MaxBatchedTokensChat, policy.Limits.MaxBatchedTokensTool, policy.Limits.MaxNumSeqs);
    fmt::print("checkpoint:     {}\n", plan.Layout.CheckpointDir.string());
    if (plan.builds_engine()) {
        fmt::print("engine:         {}\n", plan.Layout.EngineDir.string());
    }
    if (plan.Switch.ForcedFullWipe) {
        fmt::print("mode switch:    {} -> {} (full wipe)\n", plan.Switch.Previous, plan.Switch.Current);
    }

    std::string reason;
    if (plan.Forced) {
        reason = "forced";
    } else if (plan.Decision.FirstRun) {
        reason = "no build record";
    } else if (!plan.Decision.ChangedKeys.empty()) {
        reason = "changed: ";
        for (std::size_t i = 0; i < plan.Decision.ChangedKeys.size(); ++i) {
            if (i != 0) reason += ", ";
            reason += plan.Decision.ChangedKeys[i];
        }
    } else if (plan.Decision.SignatureMismatch) {
        reason = "signature mismatch";
    }
    fmt::print("rebuild:        {}{}\n", plan.rebuild() ? "yes" : "no", reason.empty() ? "" : fmt::format(" ({})", reason));
    return EXIT_SUCCESS;
}

int BuildRunner::run_check(pipeline::PipelineOrchestrator& orchestrator) {
    artifacts::ValidationResult result = orchestrator.check();
    if (!result.usable()) {
        ::fprintf(stderr, "ERROR: %s\n", result.Error.c_str());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

int main(int argc, const char** argv) {
    try {
        BuildRunner runner;
        runner.load_build_config(argc, argv);
        return runner.launch(argc, argv);
    } catch (const std::exception& e) {
        ::fprintf(stderr, "ERROR: %s\n", e.what());
        fflush(stderr);
        return EXIT_FAILURE;
    }
}
