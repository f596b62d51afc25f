// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "subprocess.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

CommandResult run_command(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw std::invalid_argument("run_command: empty command line");
    }

    int pipe_fds[2];
    if (pipe(pipe_fds) != 0) {
        throw std::runtime_error(fmt::format("could not create pipe for {}: {}", argv[0], std::strerror(errno)));
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(pipe_fds[0]);
        close(pipe_fds[1]);
        throw std::runtime_error(fmt::format("could not fork for {}: {}", argv[0], std::strerror(err)));
    }

    if (pid == 0) {
        close(pipe_fds[0]);
        dup2(pipe_fds[1], STDOUT_FILENO);
        dup2(pipe_fds[1], STDERR_FILENO);
        close(pipe_fds[1]);
        execvp(c_argv[0], c_argv.data());
        // only reached if exec failed
        const char* msg = "exec failed: ";
        [[maybe_unused]] auto w1 = write(STDERR_FILENO, msg, std::strlen(msg));
        const char* reason = std::strerror(errno);
        [[maybe_unused]] auto w2 = write(STDERR_FILENO, reason, std::strlen(reason));
        _exit(127);
    }

    close(pipe_fds[1]);
    CommandResult result;
    char buffer[4096];
    while (true) {
        ssize_t n = read(pipe_fds[0], buffer, sizeof(buffer));
        if (n > 0) {
            result.Output.append(buffer, static_cast<std::size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            break;
        }
    }
    close(pipe_fds[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(fmt::format("waitpid failed for {}: {}", argv[0], std::strerror(errno)));
        }
    }

    if (WIFEXITED(status)) {
        result.ExitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.ExitCode = 128 + WTERMSIG(status);
    }
    return result;
}
