// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "pipeline/toolchain.h"

#include <stdexcept>
#include <utility>

#include "utilities/errors.h"

namespace forgecache::pipeline {

const char* to_string(Tool tool) {
    switch (tool) {
        case Tool::Quantize: return "quantize";
        case Tool::Fetch:    return "fetch";
        case Tool::Compile:  return "compile";
    }
    return "unknown";
}

std::vector<std::string> quantize_arguments(const QuantizeRequest& request) {
    std::vector<std::string> args{
        "--model_dir", request.ModelSource,
        "--output_dir", request.OutputDir.string(),
        "--dtype", request.ModelDType,
        "--qformat", policy::to_string(request.Policy.Format),
        "--kv_cache_dtype", request.Policy.KvCacheDType,
        "--tp_size", std::to_string(request.TpSize),
    };
    if (request.Policy.Format == policy::WeightFormat::Int4Awq) {
        args.insert(args.end(), {
            "--awq_block_size", std::to_string(request.AwqBlockSize),
            "--calib_size", std::to_string(request.CalibSize),
        });
    }
    return args;
}

std::vector<std::string> fetch_arguments(const FetchRequest& request) {
    return {
        "--model_id", request.ModelSource,
        "--output_dir", request.OutputDir.string(),
    };
}

std::vector<std::string> compile_arguments(const CompileRequest& request) {
    return {
        "--checkpoint_dir", request.CheckpointDir.string(),
        "--output_dir", request.OutputDir.string(),
        "--max_batch_size", std::to_string(request.MaxBatchSize),
        "--max_input_len", std::to_string(request.MaxInputLen),
        "--max_seq_len", std::to_string(request.MaxInputLen + request.MaxOutputLen),
        "--max_num_tokens", std::to_string(request.Policy.Limits.MaxBatchedTokensChat),
    };
}

CommandToolchain::CommandToolchain(std::vector<std::string> quantize_command, std::vector<std::string> compile_command,
                                   std::vector<std::string> fetch_command) :
    mQuantizeCommand(std::move(quantize_command)), mCompileCommand(std::move(compile_command)),
    mFetchCommand(std::move(fetch_command)) {
}

const std::vector<std::string>& CommandToolchain::command(Tool tool) const {
    switch (tool) {
        case Tool::Quantize: return mQuantizeCommand;
        case Tool::Fetch:    return mFetchCommand;
        case Tool::Compile:  return mCompileCommand;
    }
    throw std::logic_error("unknown tool");
}

void CommandToolchain::check_configured(Tool tool) const {
    if (!command(tool).empty()) return;
    switch (tool) {
        case Tool::Quantize:
            throw ConfigurationError("quantize_cmd: no quantizer command configured (--quantize-cmd / FORGECACHE_QUANTIZE_CMD)");
        case Tool::Fetch:
            throw ConfigurationError("fetch_cmd: no downloader for pre-quantized checkpoints configured (--fetch-cmd / FORGECACHE_FETCH_CMD)");
        case Tool::Compile:
            throw ConfigurationError("compile_cmd: no engine compiler command configured (--compile-cmd / FORGECACHE_COMPILE_CMD)");
    }
}

CommandResult CommandToolchain::run(Tool tool, const std::vector<std::string>& args) const {
    check_configured(tool);
    std::vector<std::string> argv = command(tool);
    argv.insert(argv.end(), args.begin(), args.end());
    return run_command(argv);
}

CommandResult CommandToolchain::quantize(const QuantizeRequest& request) {
    return run(Tool::Quantize, quantize_arguments(request));
}

CommandResult CommandToolchain::fetch(const FetchRequest& request) {
    return run(Tool::Fetch, fetch_arguments(request));
}

CommandResult CommandToolchain::compile(const CompileRequest& request) {
    return run(Tool::Compile, compile_arguments(request));
}

}  // namespace forgecache::pipeline
