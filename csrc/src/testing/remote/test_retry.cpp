// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <stdexcept>
#include <vector>

#include "remote/retry.h"
#include "utilities/errors.h"

using namespace forgecache;
using namespace forgecache::remote;
using namespace std::chrono_literals;

TEST_CASE("backoff_delay: doubles per attempt up to the cap", "[retry]") {
    RetryPolicy policy;
    REQUIRE(backoff_delay(policy, 1) == 500ms);
    REQUIRE(backoff_delay(policy, 2) == 1000ms);
    REQUIRE(backoff_delay(policy, 3) == 2000ms);
    REQUIRE(backoff_delay(policy, 10) == policy.MaxDelay);
}

TEST_CASE("with_retries: transient failures are retried with backoff", "[retry]") {
    std::vector<std::chrono::milliseconds> sleeps;
    int calls = 0;
    int result = with_retries([&] {
        if (++calls < 3) throw TransientNetworkError("timeout");
        return 42;
    }, RetryPolicy{}, "fetch", [&](std::chrono::milliseconds d) { sleeps.push_back(d); });

    REQUIRE(result == 42);
    REQUIRE(calls == 3);
    REQUIRE(sleeps == std::vector<std::chrono::milliseconds>{500ms, 1000ms});
}

TEST_CASE("with_retries: gives up after the configured attempts", "[retry]") {
    int calls = 0;
    int observed = 0;
    RetryPolicy policy;
    policy.MaxAttempts = 3;

    REQUIRE_THROWS_AS(with_retries([&] { ++calls; throw TransientNetworkError("reset"); }, policy, "upload",
                                   [](std::chrono::milliseconds) {},
                                   [&](int, std::chrono::milliseconds, const TransientNetworkError&) { ++observed; }),
                      RemoteUnavailableError);
    REQUIRE(calls == 3);
    REQUIRE(observed == 2);
}

TEST_CASE("with_retries: other errors propagate immediately", "[retry]") {
    int calls = 0;
    REQUIRE_THROWS_AS(with_retries([&] { ++calls; throw std::runtime_error("disk full"); }, RetryPolicy{}, "copy",
                                   [](std::chrono::milliseconds) {}),
                      std::runtime_error);
    REQUIRE(calls == 1);

    calls = 0;
    REQUIRE_THROWS_AS(with_retries([&] { ++calls; throw RemoteUnavailableError("403"); }, RetryPolicy{}, "list",
                                   [](std::chrono::milliseconds) {}),
                      RemoteUnavailableError);
    REQUIRE(calls == 1);
}
