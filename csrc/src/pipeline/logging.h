// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FORGECACHE_SRC_PIPELINE_LOGGING_H
#define FORGECACHE_SRC_PIPELINE_LOGGING_H

#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "artifacts/artifact_validator.h"
#include "cache/rebuild_decision.h"
#include "hardware/architecture.h"
#include "policy/quantization_policy.h"

struct CommandResult;

namespace forgecache::pipeline {

/**
 * @brief Run log of one build invocation.
 *
 * Writes a JSON array (one object per line, kept well-formed after every
 * write) to @p file_name and mirrors readable lines to stdout.
 */
class BuildRunLogger
{
public:
    enum EVerbosity {
        SILENT = -2,
        QUIET = -1,
        DEFAULT = 0,
        VERBOSE = 1
    };

    using OptionValue = std::variant<bool, std::int64_t, std::string>;

    /// An empty @p file_name disables the JSON file.
    BuildRunLogger(const std::string& file_name, EVerbosity verbosity);
    ~BuildRunLogger();

    void set_callback(std::function<void(std::string_view)> cb);

    void log_cmd(int argc, const char** argv);
    void log_options(const std::vector<std::pair<std::string_view, OptionValue>>& options);
    void log_gpu(const hardware::ArchitectureDescriptor& arch);
    void log_policy(policy::PrecisionMode mode, const policy::QuantizationPolicy& policy);
    void log_mode_switch(const cache::ModeSwitch& mode_switch);
    void log_decision(const cache::RebuildDecision& decision, bool forced);
    void log_validation(const std::string& what, const artifacts::ValidationResult& result);
    void log_tool(const std::string& tool, const CommandResult& result, long duration_ms);
    void log_state(const char* state);

    // call at the beginning and end of a section of processing.
    // will record the time between the two calls
    class RAII_Section {
    public:
        ~RAII_Section() noexcept {
            if(mLogger)
                mLogger->log_section_end();
        };
    private:
        RAII_Section(BuildRunLogger* l) : mLogger(l) {}
        RAII_Section(RAII_Section&&) = default;
        BuildRunLogger* mLogger;

        friend class BuildRunLogger;
    };

    void log_message(const std::string& msg);
    void log_warning(const std::string& msg);
    RAII_Section log_section_start(const std::string& info);
    void log_section_end();

private:
    void log_line(std::string_view line);
    std::string mFileName;
    std::fstream mLogFile;
    bool mFirst = true;

    EVerbosity mVerbosity;

    // arbitrary callback for log lines
    std::function<void(std::string_view)> mCallback;

    std::string mSectionInfo;
    std::chrono::steady_clock::time_point mSectionStart;
};

}  // namespace forgecache::pipeline

#endif //FORGECACHE_SRC_PIPELINE_LOGGING_H
