// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FORGECACHE_SRC_UTILITIES_FILE_LOCK_H
#define FORGECACHE_SRC_UTILITIES_FILE_LOCK_H

#include <filesystem>

/**
 * @brief Exclusive advisory lock on a file, held for the lifetime of the object.
 *
 * Uses a non-blocking flock(2); the holder's PID is written into the lock file
 * so that an operator can see who owns it. The lock is released when the
 * descriptor is closed, including when the process dies.
 */
class BuildLock {
public:
    /// @throws forgecache::BuildLockedError if another process holds the lock.
    /// @throws std::runtime_error if the lock file cannot be created.
    explicit BuildLock(const std::filesystem::path& lock_file);
    ~BuildLock();

    BuildLock(const BuildLock&) = delete;
    BuildLock& operator=(const BuildLock&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return mPath; }

private:
    std::filesystem::path mPath;
    int mFd = -1;
};

#endif //FORGECACHE_SRC_UTILITIES_FILE_LOCK_H
