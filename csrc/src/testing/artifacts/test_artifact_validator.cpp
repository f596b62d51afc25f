// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>

#include "artifacts/artifact.h"
#include "artifacts/artifact_validator.h"
#include "hardware/architecture.h"
#include "utilities/errors.h"
#include "testing/utilities/test_utils.h"

using namespace forgecache;
using namespace forgecache::artifacts;
using hardware::make_architecture;
using testing_utils::TempWorkRoot;

TEST_CASE("validate: complete engine with matching metadata", "[validator]") {
    TempWorkRoot root("validator-ok");
    auto dir = root / "engine";
    testing_utils::make_engine_dir(dir, "sm89");

    auto result = validate(engine_artifact(dir), make_architecture(89));
    REQUIRE(result.Status == ValidationStatus::Ok);
    REQUIRE(result.usable());
    REQUIRE_FALSE(result.HeuristicOnly);
    REQUIRE_NOTHROW(result.throw_if_failed());
}

TEST_CASE("validate: missing directory or primary file", "[validator]") {
    TempWorkRoot root("validator-missing");

    auto absent = validate(engine_artifact(root / "nope"), make_architecture(89));
    REQUIRE(absent.Status == ValidationStatus::Failed);
    REQUIRE(absent.Failure == ValidationFailure::Missing);

    auto dir = root / "engine";
    testing_utils::make_engine_dir(dir, "sm89");
    std::filesystem::remove(dir / kEnginePrimaryFile);
    auto result = validate(engine_artifact(dir), make_architecture(89));
    REQUIRE(result.Failure == ValidationFailure::Missing);
    REQUIRE(result.Error.find(kEnginePrimaryFile) != std::string::npos);
    REQUIRE_THROWS_AS(result.throw_if_failed(), ArtifactMissingError);
}

TEST_CASE("validate: metadata for another architecture is incompatible", "[validator]") {
    TempWorkRoot root("validator-mismatch");
    auto dir = root / "engine";
    testing_utils::make_engine_dir(dir, "sm90");

    auto result = validate(engine_artifact(dir), make_architecture(89));
    REQUIRE(result.Status == ValidationStatus::Failed);
    REQUIRE(result.Failure == ValidationFailure::Incompatible);
    REQUIRE_THROWS_AS(result.throw_if_failed(), ArtifactIncompatibleError);
}

TEST_CASE("validate: a mismatch is only a warning when strict matching is off", "[validator]") {
    TempWorkRoot root("validator-lenient");
    auto dir = root / "engine";
    testing_utils::make_engine_dir(dir, "sm90");

    auto result = validate(engine_artifact(dir), make_architecture(89), ValidatorOptions{.StrictArchMatch = false});
    REQUIRE(result.Status == ValidationStatus::Warning);
    REQUIRE(result.usable());
    REQUIRE(result.Warnings.size() == 1);
}

TEST_CASE("validate: metadata sm_arch spellings are compared numerically", "[validator]") {
    TempWorkRoot root("validator-spelling");
    auto dir = root / "engine";
    testing_utils::make_engine_dir(dir, "8.9");
    REQUIRE(validate(engine_artifact(dir), make_architecture(89)).Status == ValidationStatus::Ok);
}

TEST_CASE("validate: without metadata the directory name prefix decides", "[validator]") {
    TempWorkRoot root("validator-heuristic");

    auto matching = root / "sm89_trt-llm-0.20.0_cuda12.8";
    testing_utils::make_engine_dir(matching);
    auto ok = validate(engine_artifact(matching), make_architecture(89));
    REQUIRE(ok.usable());
    REQUIRE(ok.HeuristicOnly);

    auto other = root / "sm80_trt-llm-0.20.0_cuda12.8";
    testing_utils::make_engine_dir(other);
    auto bad = validate(engine_artifact(other), make_architecture(89));
    REQUIRE(bad.Failure == ValidationFailure::Incompatible);

    auto unnamed = root / "Qwen3-8B-trt-awq";
    testing_utils::make_engine_dir(unnamed);
    auto plain = validate(engine_artifact(unnamed), make_architecture(89));
    REQUIRE(plain.usable());
    REQUIRE(plain.HeuristicOnly);
}

TEST_CASE("validate: the label takes precedence over the directory name", "[validator]") {
    TempWorkRoot root("validator-label");
    auto dir = root / "engine";
    testing_utils::make_engine_dir(dir);

    auto result = validate(engine_artifact(dir, "sm90_trt-llm-0.20.0_cuda12.8"), make_architecture(89));
    REQUIRE(result.Failure == ValidationFailure::Incompatible);
}

TEST_CASE("validate: unknown local GPU passes with a warning", "[validator]") {
    TempWorkRoot root("validator-unknown");
    auto dir = root / "engine";
    testing_utils::make_engine_dir(dir, "sm90");

    auto result = validate(engine_artifact(dir), hardware::unknown_architecture());
    REQUIRE(result.Status == ValidationStatus::Warning);
    REQUIRE(result.HeuristicOnly);
}

TEST_CASE("validate: a small engine file is suspicious but usable", "[validator]") {
    TempWorkRoot root("validator-small");
    auto dir = root / "engine";
    testing_utils::make_engine_dir(dir, "sm89", 1024);

    auto result = validate(engine_artifact(dir), make_architecture(89));
    REQUIRE(result.Status == ValidationStatus::Warning);
    REQUIRE(result.Warnings.size() == 1);
    REQUIRE(result.usable());
}

TEST_CASE("validate: malformed metadata is incompatible", "[validator]") {
    TempWorkRoot root("validator-badmeta");
    auto dir = root / "engine";
    testing_utils::make_engine_dir(dir);
    testing_utils::write_file(dir / kBuildMetadataFile, "{ not json");

    auto result = validate(engine_artifact(dir), make_architecture(89));
    REQUIRE(result.Failure == ValidationFailure::Incompatible);
}

TEST_CASE("validate: checkpoints need a manifest and at least one shard", "[validator]") {
    TempWorkRoot root("validator-checkpoint");
    auto dir = root / "ckpt";
    testing_utils::write_file(dir / kManifestFile, "{}");

    auto without_shards = validate(checkpoint_artifact(dir), make_architecture(89));
    REQUIRE(without_shards.Failure == ValidationFailure::Missing);

    testing_utils::write_file(dir / "rank3.safetensors", "x");
    auto with_shard = validate(checkpoint_artifact(dir), make_architecture(89));
    REQUIRE(with_shard.Status == ValidationStatus::Ok);
    REQUIRE_FALSE(with_shard.HeuristicOnly);
}
