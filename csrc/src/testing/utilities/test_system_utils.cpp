// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <unistd.h>

#include "utilities/errors.h"
#include "utilities/file_lock.h"
#include "utilities/sha256.h"
#include "utilities/subprocess.h"
#include "utilities/utils.h"
#include "testing/utilities/test_utils.h"

using testing_utils::TempWorkRoot;

TEST_CASE("run_command: captures output and exit code", "[utils]") {
    auto ok = run_command({"/bin/sh", "-c", "echo out; echo err >&2"});
    REQUIRE(ok.ok());
    REQUIRE(ok.Output.find("out\n") != std::string::npos);
    REQUIRE(ok.Output.find("err\n") != std::string::npos);

    auto failed = run_command({"/bin/sh", "-c", "exit 3"});
    REQUIRE_FALSE(failed.ok());
    REQUIRE(failed.ExitCode == 3);

    auto killed = run_command({"/bin/sh", "-c", "kill -9 $$"});
    REQUIRE(killed.ExitCode == 128 + 9);
}

TEST_CASE("run_command: a missing program reports exit code 127", "[utils]") {
    auto result = run_command({"/nonexistent/forgecache-tool"});
    REQUIRE(result.ExitCode == 127);
}

TEST_CASE("BuildLock: a second holder is refused", "[utils]") {
    TempWorkRoot root("lock");
    auto path = root / ".run/build.lock";
    {
        BuildLock first(path);
        REQUIRE(testing_utils::read_file(path) == std::to_string(getpid()));
        REQUIRE_THROWS_AS(BuildLock(path), forgecache::BuildLockedError);
    }
    REQUIRE_NOTHROW(BuildLock(path));
}

TEST_CASE("sha256_hex: known digests", "[utils]") {
    REQUIRE(sha256_hex("") == std::optional<std::string>{"e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"});
    REQUIRE(sha256_hex("abc") == std::optional<std::string>{"ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"});
}

TEST_CASE("string helpers", "[utils]") {
    REQUIRE(iequals("Compact", "COMPACT"));
    REQUIRE_FALSE(iequals("base", "based"));
    REQUIRE(to_lower("SM89") == "sm89");
    REQUIRE(trim("  x y \n") == "x y");
    REQUIRE(split_command("  python3 -m quantize   --fast ") == std::vector<std::string>{"python3", "-m", "quantize", "--fast"});
    REQUIRE(split_command("   ").empty());
}

TEST_CASE("matches_wildcard: single star patterns", "[utils]") {
    REQUIRE(matches_wildcard("rank0.safetensors", "rank*.safetensors"));
    REQUIRE(matches_wildcard("rank12.safetensors", "rank*.safetensors"));
    REQUIRE_FALSE(matches_wildcard("rank0.bin", "rank*.safetensors"));
    REQUIRE_FALSE(matches_wildcard("rank.safetensor", "rank*.safetensors"));
    REQUIRE(matches_wildcard("config.json", "config.json"));
}

TEST_CASE("iso8601_utc: second resolution UTC", "[utils]") {
    auto epoch = std::chrono::system_clock::time_point{};
    REQUIRE(iso8601_utc(epoch) == "1970-01-01T00:00:00Z");
    REQUIRE(iso8601_utc(epoch + std::chrono::hours(36) + std::chrono::seconds(5)) == "1970-01-02T12:00:05Z");
}

TEST_CASE("is_within: component-wise containment", "[utils]") {
    TempWorkRoot root("within");
    auto models = root / "models";
    REQUIRE(is_within(models / "a-trt-awq", models));
    REQUIRE(is_within(models, models));
    REQUIRE(is_within(models / "x/../y", models));
    REQUIRE_FALSE(is_within(root / "models-old/a", models));
    REQUIRE_FALSE(is_within(models / "../outside", models));
    REQUIRE_FALSE(is_within("/etc", models));
}
