// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "file_lock.h"

#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <fmt/core.h>

#include "utilities/errors.h"

BuildLock::BuildLock(const std::filesystem::path& lock_file) : mPath(lock_file) {
    if (mPath.has_parent_path()) {
        std::filesystem::create_directories(mPath.parent_path());
    }

    mFd = open(mPath.c_str(), O_CREAT | O_RDWR, 0644);
    if (mFd < 0) {
        throw std::runtime_error(fmt::format("could not create lock file {}: {}", mPath.string(), std::strerror(errno)));
    }

    if (flock(mFd, LOCK_EX | LOCK_NB) < 0) {
        char buf[32] = {0};
        lseek(mFd, 0, SEEK_SET);
        ssize_t n = read(mFd, buf, sizeof(buf) - 1);
        std::string holder = n > 0 ? std::string(buf, static_cast<std::size_t>(n)) : std::string("unknown");
        close(mFd);
        mFd = -1;
        throw forgecache::BuildLockedError(
            fmt::format("another build is running (lock {} held by PID {})", mPath.string(), holder));
    }

    std::string pid = std::to_string(getpid());
    if (ftruncate(mFd, 0) == 0) {
        [[maybe_unused]] auto written = pwrite(mFd, pid.data(), pid.size(), 0);
    }
}

BuildLock::~BuildLock() {
    if (mFd >= 0) {
        flock(mFd, LOCK_UN);
        close(mFd);
    }
}
