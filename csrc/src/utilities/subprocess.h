// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FORGECACHE_SRC_UTILITIES_SUBPROCESS_H
#define FORGECACHE_SRC_UTILITIES_SUBPROCESS_H

#include <string>
#include <vector>

/// Outcome of an external command: exit code and combined stdout/stderr.
struct CommandResult {
    int ExitCode = -1;
    std::string Output;

    [[nodiscard]] bool ok() const { return ExitCode == 0; }
};

/**
 * @brief Run @p argv (argv[0] resolved through PATH) and wait for it to finish.
 *
 * Standard output and standard error are captured into CommandResult::Output.
 * A command killed by a signal reports 128 + signal number; a command that
 * cannot be executed reports 127.
 *
 * @throws std::invalid_argument if @p argv is empty.
 * @throws std::runtime_error if the process cannot be spawned.
 */
CommandResult run_command(const std::vector<std::string>& argv);

#endif //FORGECACHE_SRC_UTILITIES_SUBPROCESS_H
