// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FORGECACHE_SRC_PIPELINE_TOOLCHAIN_H
#define FORGECACHE_SRC_PIPELINE_TOOLCHAIN_H

#include <filesystem>
#include <string>
#include <vector>

#include "policy/quantization_policy.h"
#include "utilities/subprocess.h"

namespace forgecache::pipeline {

enum class Tool {
    Quantize,
    Fetch,
    Compile
};

const char* to_string(Tool tool);

struct QuantizeRequest {
    std::string ModelSource;
    std::filesystem::path OutputDir;
    policy::QuantizationPolicy Policy;
    std::string ModelDType;
    int AwqBlockSize = 0;
    int CalibSize = 0;
    int TpSize = 1;
};

struct CompileRequest {
    std::filesystem::path CheckpointDir;
    std::filesystem::path OutputDir;
    policy::QuantizationPolicy Policy;
    int MaxBatchSize = 0;
    int MaxInputLen = 0;
    int MaxOutputLen = 0;
};

/// Download of a pre-quantized checkpoint published under a model id.
struct FetchRequest {
    std::string ModelSource;
    std::filesystem::path OutputDir;
};

/// Argument vectors passed to the external tools, after the configured command.
std::vector<std::string> quantize_arguments(const QuantizeRequest& request);
std::vector<std::string> fetch_arguments(const FetchRequest& request);
std::vector<std::string> compile_arguments(const CompileRequest& request);

/**
 * @brief The external quantizer, checkpoint downloader and engine compiler.
 *
 * Contract: a zero exit code and the expected files in the output directory,
 * or a non-zero exit code with diagnostic output.
 */
class IToolchain {
public:
    IToolchain() = default;
    virtual ~IToolchain() = default;

    /// @throws forgecache::ConfigurationError if @p tool cannot be invoked at all.
    virtual void check_configured(Tool tool) const = 0;

    [[nodiscard]] virtual CommandResult quantize(const QuantizeRequest& request) = 0;
    [[nodiscard]] virtual CommandResult fetch(const FetchRequest& request) = 0;
    [[nodiscard]] virtual CommandResult compile(const CompileRequest& request) = 0;
};

/// Runs configured command lines, appending the request as `--flag value` arguments.
class CommandToolchain : public IToolchain {
public:
    CommandToolchain(std::vector<std::string> quantize_command, std::vector<std::string> compile_command,
                     std::vector<std::string> fetch_command = {});

    void check_configured(Tool tool) const override;
    [[nodiscard]] CommandResult quantize(const QuantizeRequest& request) override;
    [[nodiscard]] CommandResult fetch(const FetchRequest& request) override;
    [[nodiscard]] CommandResult compile(const CompileRequest& request) override;

private:
    [[nodiscard]] const std::vector<std::string>& command(Tool tool) const;
    [[nodiscard]] CommandResult run(Tool tool, const std::vector<std::string>& args) const;

    std::vector<std::string> mQuantizeCommand;
    std::vector<std::string> mCompileCommand;
    std::vector<std::string> mFetchCommand;
};

}  // namespace forgecache::pipeline

#endif //FORGECACHE_SRC_PIPELINE_TOOLCHAIN_H
