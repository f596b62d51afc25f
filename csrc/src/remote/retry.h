// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FORGECACHE_SRC_REMOTE_RETRY_H
#define FORGECACHE_SRC_REMOTE_RETRY_H

#include <algorithm>
#include <chrono>
#include <functional>
#include <string_view>
#include <thread>

#include <fmt/core.h>

#include "utilities/errors.h"

namespace forgecache::remote {

struct RetryPolicy {
    int MaxAttempts = 4;
    std::chrono::milliseconds InitialDelay{500};
    double Multiplier = 2.0;
    std::chrono::milliseconds MaxDelay{8000};
};

using SleepFn = std::function<void(std::chrono::milliseconds)>;
using RetryObserver = std::function<void(int attempt, std::chrono::milliseconds delay, const TransientNetworkError& error)>;

inline void sleep_for(std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
}

/// Delay before retry number @p attempt (1-based), capped at MaxDelay.
inline std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, int attempt) {
    double delay = static_cast<double>(policy.InitialDelay.count());
    for (int i = 1; i < attempt; ++i) {
        delay *= policy.Multiplier;
    }
    auto ms = std::chrono::milliseconds(static_cast<long long>(delay));
    return std::min(ms, policy.MaxDelay);
}

/**
 * @brief Call @p fn, retrying on TransientNetworkError with exponential backoff.
 *
 * Other exceptions propagate immediately.
 *
 * @param what Description of the operation for error messages.
 * @throws forgecache::RemoteUnavailableError once MaxAttempts attempts have failed.
 */
template<typename Fn>
auto with_retries(Fn&& fn, const RetryPolicy& policy, std::string_view what,
                  const SleepFn& sleep = sleep_for, const RetryObserver& observer = {}) -> decltype(fn()) {
    const int attempts = std::max(1, policy.MaxAttempts);
    for (int attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const TransientNetworkError& e) {
            if (attempt >= attempts) {
                throw RemoteUnavailableError(fmt::format("{} failed after {} attempts: {}", what, attempt, e.what()));
            }
            auto delay = backoff_delay(policy, attempt);
            if (observer) observer(attempt, delay, e);
            if (sleep) sleep(delay);
        }
    }
}

}  // namespace forgecache::remote

#endif //FORGECACHE_SRC_REMOTE_RETRY_H
