// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "logging.h"

#include <cstdio>
#include <filesystem>
#include <type_traits>

#include <fmt/core.h>
#include <fmt/chrono.h>
#include <nlohmann/json.hpp>

#include "utilities/subprocess.h"

namespace forgecache::pipeline {

namespace {

//! JSON string literal (quoted and escaped) for embedding into a log line.
std::string quote(std::string_view s) {
    return nlohmann::json(std::string(s)).dump();
}

std::string quote_list(const std::vector<std::string>& items) {
    std::string out = "[";
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i != 0) out += ", ";
        out += quote(items[i]);
    }
    out += "]";
    return out;
}

//! Last @p max_chars characters of tool output, for the JSON log.
std::string_view output_tail(std::string_view output, std::size_t max_chars = 4096) {
    if (output.size() <= max_chars) return output;
    return output.substr(output.size() - max_chars);
}

}  // namespace

/**
 * @brief Create a logger that writes a JSON array to @p file_name.
 *
 * Ensures the parent directory exists, opens the file for output,
 * and initializes it as a JSON array (writes "[ ... ]").
 *
 * @param file_name Output path for the JSON log; empty to log to stdout only.
 * @param verbosity Verbosity level controlling stdout printing.
 */
BuildRunLogger::BuildRunLogger(const std::string& file_name, EVerbosity verbosity) :
    mFileName(file_name), mVerbosity(verbosity)
{
    if (!mFileName.empty()) {
        auto log_path = std::filesystem::path(mFileName).parent_path();
        if (!log_path.empty()) {
            std::filesystem::create_directories(log_path);
        }
        mLogFile.open(mFileName, std::fstream::out);
        if (!mLogFile.is_open()) {
            throw std::runtime_error(fmt::format("could not open log file {}", mFileName));
        }
        mLogFile << "[\n";
        mLogFile << "\n]" << std::endl;
    }
}

BuildRunLogger::~BuildRunLogger()
{
    if(mLogFile.is_open()) mLogFile.close();
}

void BuildRunLogger::set_callback(std::function<void(std::string_view)> cb) {
    mCallback = std::move(cb);
}

void BuildRunLogger::log_cmd(int argc, const char** argv)
{
    std::string cmd = fmt::format(R"(  {{"log": "cmd", "time": "{}", "cmd": [)", std::chrono::system_clock::now());
    for (int i = 0; i < argc; i++)
    {
        if (i != 0) cmd += ", ";
        cmd += quote(argv[i]);
    }
    cmd += "]}";
    log_line(cmd);
}

/**
 * @brief Log resolved configuration options.
 *
 * Each option is written as a JSON log line; at VERBOSE level they are also printed.
 *
 * @param options Vector of (name, value) pairs; value may be bool, int64 or std::string.
 */
void BuildRunLogger::log_options(const std::vector<std::pair<std::string_view, OptionValue>>& options) {
    if (mVerbosity >= VERBOSE) {
        printf("[Options]\n");
    }
    for(auto& [name, value]: options) {
        auto log = [&](auto&& v){
            if constexpr (std::is_same_v<std::remove_cvref_t<decltype(v)>, std::string>) {
                log_line(fmt::format(R"(  {{"log": "option", "time": "{}", "name": "{}", "value": {}}})",
                                     std::chrono::system_clock::now(), name, quote(v)));
            } else {
                log_line(fmt::format(R"(  {{"log": "option", "time": "{}", "name": "{}", "value": {}}})",
                                     std::chrono::system_clock::now(), name, v));
            }
            if (mVerbosity >= VERBOSE) {
                printf("  %-20s: %s\n", std::string(name).c_str(), fmt::format("{}", v).c_str());
            }
        };
        std::visit(log, value);
    }
}

void BuildRunLogger::log_gpu(const hardware::ArchitectureDescriptor& arch) {
    log_line(fmt::format(R"(  {{"log": "gpu", "time": "{}", "arch": "{}", "family": "{}", "fp8": {}, "name": {}}})",
                         std::chrono::system_clock::now(), arch.Code, hardware::to_string(arch.Family),
                         arch.SupportsFp8, quote(arch.DeviceName)));
    if (mVerbosity >= DEFAULT) {
        if (arch.known()) {
            printf("[GPU] %s: %s (%s, fp8 %s)\n", arch.DeviceName.empty() ? "device 0" : arch.DeviceName.c_str(),
                   arch.Code.c_str(), hardware::to_string(arch.Family), arch.SupportsFp8 ? "yes" : "no");
        } else {
            printf("[GPU] architecture could not be detected%s%s\n",
                   arch.DeviceName.empty() ? "" : ": ", arch.DeviceName.c_str());
        }
    }
}

void BuildRunLogger::log_policy(policy::PrecisionMode mode, const policy::QuantizationPolicy& p) {
    log_line(fmt::format(R"(  {{"log": "policy", "time": "{}", "mode": "{}", "format": "{}", "kv_cache_dtype": "{}", "attention": "{}", "max_batched_tokens_chat": {}, "max_batched_tokens_tool": {}, "max_num_seqs": {}}})",
                         std::chrono::system_clock::now(), policy::to_string(mode), policy::to_string(p.Format), p.KvCacheDType,
                         policy::to_string(p.Attention), p.Limits.MaxBatchedTokensChat, p.Limits.MaxBatchedTokensTool,
                         p.Limits.MaxNumSeqs));
    if (mVerbosity >= DEFAULT) {
        printf("[Policy] %s: weights %s, kv cache %s, attention %s, batched tokens %d/%d\n",
               policy::to_string(mode), policy::to_string(p.Format), p.KvCacheDType.c_str(),
               policy::to_string(p.Attention), p.Limits.MaxBatchedTokensChat, p.Limits.MaxBatchedTokensTool);
    }
}

void BuildRunLogger::log_mode_switch(const cache::ModeSwitch& mode_switch) {
    log_line(fmt::format(R"(  {{"log": "mode_switch", "time": "{}", "previous": {}, "current": {}, "wipe": {}}})",
                         std::chrono::system_clock::now(), quote(mode_switch.Previous), quote(mode_switch.Current),
                         mode_switch.ForcedFullWipe));
    if (mode_switch.ForcedFullWipe && mVerbosity >= QUIET) {
        printf("[Cache] inference engine changed from %s to %s; wiping all cached state\n",
               mode_switch.Previous.c_str(), mode_switch.Current.c_str());
    }
}

void BuildRunLogger::log_decision(const cache::RebuildDecision& decision, bool forced) {
    log_line(fmt::format(R"(  {{"log": "decision", "time": "{}", "rebuild": {}, "forced": {}, "first_run": {}, "signature_mismatch": {}, "changed": {}}})",
                         std::chrono::system_clock::now(), decision.Rebuild || forced, forced, decision.FirstRun,
                         decision.SignatureMismatch, quote_list(decision.ChangedKeys)));
    if (mVerbosity < DEFAULT) return;

    if (forced) {
        printf("[Cache] rebuild forced\n");
    } else if (decision.FirstRun) {
        printf("[Cache] no previous build record; building\n");
    } else if (!decision.ChangedKeys.empty()) {
        printf("[Cache] configuration changed:");
        for (const auto& key : decision.ChangedKeys) {
            printf(" %s", key.c_str());
        }
        printf("\n");
    } else if (decision.SignatureMismatch) {
        printf("[Cache] build record signature does not match; rebuilding\n");
    } else {
        printf("[Cache] configuration unchanged\n");
    }
}

void BuildRunLogger::log_validation(const std::string& what, const artifacts::ValidationResult& result) {
    const char* status = result.Status == artifacts::ValidationStatus::Ok ? "ok"
                       : result.Status == artifacts::ValidationStatus::Warning ? "warning" : "failed";
    log_line(fmt::format(R"(  {{"log": "validation", "time": "{}", "artifact": {}, "status": "{}", "heuristic_only": {}, "warnings": {}, "error": {}}})",
                         std::chrono::system_clock::now(), quote(what), status, result.HeuristicOnly,
                         quote_list(result.Warnings), quote(result.Error)));
    for (const auto& w : result.Warnings) {
        if (mVerbosity > SILENT) {
            fprintf(stderr, "WARNING: %s\n", w.c_str());
        }
    }
    if (mVerbosity >= DEFAULT && result.HeuristicOnly) {
        printf("[Validate] %s: architecture compatibility checked by name only\n", what.c_str());
    }
}

void BuildRunLogger::log_tool(const std::string& tool, const CommandResult& result, long duration_ms) {
    log_line(fmt::format(R"(  {{"log": "tool", "time": "{}", "tool": {}, "exit_code": {}, "duration_ms": {}, "output": {}}})",
                         std::chrono::system_clock::now(), quote(tool), result.ExitCode, duration_ms,
                         quote(output_tail(result.Output))));
    if (mVerbosity >= VERBOSE && !result.Output.empty()) {
        printf("%s", result.Output.c_str());
    }
}

void BuildRunLogger::log_state(const char* state) {
    log_line(fmt::format(R"(  {{"log": "state", "time": "{}", "state": "{}"}})", std::chrono::system_clock::now(), state));
    if (mVerbosity >= VERBOSE) {
        printf("-> %s\n", state);
    }
}

void BuildRunLogger::log_line(std::string_view line) {
    if(mCallback)
        mCallback(line);

    if(!mLogFile.is_open())
        return;

    mLogFile.seekp(-3, std::ios::end);  // overwrite the array closing part
    if (!mFirst)
    {
        mLogFile << ",\n";
    }
    mLogFile << line << "\n]" << std::endl;
    mFirst = false;
}

/**
 * @brief Log an informational message.
 *
 * Prints to stdout (verbosity-dependent) and writes a JSON "info" record.
 *
 * @param msg Message text.
 */
void BuildRunLogger::log_message(const std::string& msg) {
    if(mVerbosity >= DEFAULT) {
        fprintf(stdout, "%s\n", msg.c_str());
    }
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "message": {}}})",
                         std::chrono::system_clock::now(), quote(msg)));
}

void BuildRunLogger::log_warning(const std::string& msg) {
    if(mVerbosity > SILENT) {
        fprintf(stderr, "WARNING: %s\n", msg.c_str());
    }
    log_line(fmt::format(R"(  {{"log": "warning", "time": "{}", "message": {}}})",
                         std::chrono::system_clock::now(), quote(msg)));
}

/**
 * @brief Begin a timed logging section.
 *
 * @param info Human-readable description printed to stdout and stored in JSON.
 * @return RAII_Section handle that calls log_section_end() on destruction.
 */
BuildRunLogger::RAII_Section BuildRunLogger::log_section_start(const std::string& info) {
    mSectionInfo = info;
    mSectionStart = std::chrono::steady_clock::now();
    if(mVerbosity >= DEFAULT) {
        printf("%s ...\n", info.data());
    }
    return RAII_Section{this};
}

void BuildRunLogger::log_section_end() {
    auto duration = std::chrono::steady_clock::now() - mSectionStart;
    long milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "message": {}, "duration_ms": {}}})",
                         std::chrono::system_clock::now(), quote(mSectionInfo), milliseconds ));

    if(mVerbosity >= DEFAULT) {
        if(milliseconds < 2000) {
            printf("  done in %ld ms\n\n", milliseconds);
        } else {
            printf("  done in %ld s\n\n", milliseconds / 1000);
        }
    }
}

}  // namespace forgecache::pipeline
