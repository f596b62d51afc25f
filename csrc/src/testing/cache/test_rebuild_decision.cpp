// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>

#include "cache/build_record.h"
#include "cache/rebuild_decision.h"
#include "cache/signature.h"
#include "cache/tracked_parameters.h"
#include "testing/utilities/test_utils.h"

using namespace forgecache::cache;

namespace {

ConfigurationSnapshot configured(const std::string& engine = "trt", const std::string& mode = "compact") {
    return ConfigurationSnapshot{}
        .with(param::InferenceEngine, engine)
        .with(param::PrecisionMode, mode)
        .with(param::ModelId, "Qwen/Qwen3-8B")
        .with(param::MaxBatchSize, "16")
        .with(param::MaxInputLen, "8192");
}

PersistedBuildRecord record_of(const ConfigurationSnapshot& snapshot) {
    PersistedBuildRecord record;
    for (const auto& [name, value] : snapshot.values()) record.Values.emplace(name, value);
    record.Signature = sign(snapshot);
    return record;
}

} // namespace

TEST_CASE("needs_rebuild: no record means first run", "[decision]") {
    auto decision = needs_rebuild(configured(), std::optional<PersistedBuildRecord>{});
    REQUIRE(decision.Rebuild);
    REQUIRE(decision.FirstRun);
    REQUIRE(decision.ChangedKeys.empty());
}

TEST_CASE("needs_rebuild: unchanged configuration reuses the build", "[decision]") {
    auto snapshot = configured();
    auto decision = needs_rebuild(snapshot, record_of(snapshot));
    REQUIRE_FALSE(decision.Rebuild);
    REQUIRE_FALSE(decision.FirstRun);
    REQUIRE_FALSE(decision.SignatureMismatch);
    REQUIRE(decision.ChangedKeys.empty());
}

TEST_CASE("needs_rebuild: a single changed value is reported by name", "[decision]") {
    auto before = configured();
    auto after = before.with(param::MaxInputLen, "16384");

    auto decision = needs_rebuild(after, record_of(before));
    REQUIRE(decision.Rebuild);
    REQUIRE(decision.ChangedKeys == std::vector<std::string>{"max_input_len"});
    REQUIRE(decision.SignatureMismatch);
}

TEST_CASE("needs_rebuild: equal values with a foreign signature still rebuild", "[decision]") {
    auto snapshot = configured();
    auto record = record_of(snapshot);
    record.Signature = BuildSignature{"0000"};

    auto decision = needs_rebuild(snapshot, record);
    REQUIRE(decision.Rebuild);
    REQUIRE(decision.ChangedKeys.empty());
    REQUIRE(decision.SignatureMismatch);
}

TEST_CASE("needs_rebuild: a sentinel signature forces a rebuild", "[decision]") {
    auto snapshot = configured();
    auto record = record_of(snapshot);
    record.Signature = BuildSignature::sentinel();
    REQUIRE(needs_rebuild(snapshot, record).Rebuild);
}

TEST_CASE("needs_rebuild: reads the record from disk", "[decision]") {
    testing_utils::TempWorkRoot root("decision-disk");
    auto path = root / "build_config.env";
    auto snapshot = configured();

    REQUIRE(needs_rebuild(snapshot, path).FirstRun);
    persist(snapshot, sign(snapshot), path);
    REQUIRE_FALSE(needs_rebuild(snapshot, path).Rebuild);

    testing_utils::write_file(path, "garbage without separator\n");
    REQUIRE(needs_rebuild(snapshot, path).FirstRun);
}

TEST_CASE("detect_mode_switch: engine kind change forces a full wipe", "[decision]") {
    auto previous = record_of(configured("trt"));
    auto result = detect_mode_switch(configured("vllm"), previous);
    REQUIRE(result.ForcedFullWipe);
    REQUIRE(result.Previous == "trt");
    REQUIRE(result.Current == "vllm");
}

TEST_CASE("detect_mode_switch: case and missing history do not count as a switch", "[decision]") {
    REQUIRE_FALSE(detect_mode_switch(configured("TRT"), record_of(configured("trt"))).ForcedFullWipe);
    REQUIRE_FALSE(detect_mode_switch(configured("trt"), std::optional<PersistedBuildRecord>{}).ForcedFullWipe);
    REQUIRE_FALSE(detect_mode_switch(configured("trt"), record_of(configured(""))).ForcedFullWipe);
}

TEST_CASE("detect_mode_switch: a precision mode change is not an engine switch", "[decision]") {
    auto result = detect_mode_switch(configured("trt", "base"), record_of(configured("trt", "compact")));
    REQUIRE_FALSE(result.ForcedFullWipe);
}
