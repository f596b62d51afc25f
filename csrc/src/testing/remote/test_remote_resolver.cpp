// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "artifacts/artifact.h"
#include "hardware/architecture.h"
#include "pipeline/logging.h"
#include "remote/remote_resolver.h"
#include "utilities/errors.h"
#include "testing/utilities/test_utils.h"

using namespace forgecache;
using namespace forgecache::remote;
using hardware::make_architecture;
using testing_utils::FlakyStore;
using testing_utils::TempWorkRoot;

namespace {

const std::string kSm89Label = "sm89_trt-llm-0.20.0_cuda12.8";
const std::string kSm90Label = "sm90_trt-llm-0.20.0_cuda12.8";

void publish_engine(const std::filesystem::path& remote, const std::string& label, const std::string& sm_arch) {
    testing_utils::make_engine_dir(remote / kEnginesPrefix / label, sm_arch);
}

void publish_checkpoint(const std::filesystem::path& remote) {
    testing_utils::make_checkpoint_dir(remote / kCheckpointsPrefix);
}

// Engine downloads write a partial file and then time out; everything else works.
class EngineDownloadFailingStore : public FlakyStore {
public:
    using FlakyStore::FlakyStore;

    void download(const std::string& prefix, const std::filesystem::path& destination) override {
        if (prefix.starts_with(kEnginesPrefix)) {
            ++EngineAttempts;
            testing_utils::write_file(destination / "rank0.engine", "partial");
            throw TransientNetworkError("download: read timed out");
        }
        FlakyStore::download(prefix, destination);
    }

    int EngineAttempts = 0;
};

struct ResolverFixture {
    ResolverFixture() : root("resolver"), logger("", pipeline::BuildRunLogger::SILENT) {
        std::filesystem::create_directories(remote());
    }

    [[nodiscard]] std::filesystem::path remote() const { return root / "remote"; }

    RemoteResolverOptions options() {
        RemoteResolverOptions o;
        o.EngineDestination = root / "models/engine";
        o.CheckpointDestination = root / "models/ckpt";
        o.Sleep = [this](std::chrono::milliseconds d) { sleeps.push_back(d); };
        return o;
    }

    TempWorkRoot root;
    pipeline::BuildRunLogger logger;
    std::vector<std::chrono::milliseconds> sleeps;
};

} // namespace

TEST_CASE("select_engine_label: preferred, single, then architecture prefix", "[remote]") {
    auto ada = make_architecture(89);
    std::vector<std::string> labels{kSm89Label, kSm90Label};

    REQUIRE(select_engine_label(labels, kSm90Label, ada) == kSm90Label);
    REQUIRE(select_engine_label(labels, "sm75_missing", ada) == kSm89Label);
    REQUIRE(select_engine_label(labels, "", ada) == kSm89Label);
    REQUIRE(select_engine_label({kSm90Label}, "", ada) == kSm90Label);
    REQUIRE_FALSE(select_engine_label(labels, "", make_architecture(80)));
    REQUIRE_FALSE(select_engine_label(labels, "", hardware::unknown_architecture()));
    REQUIRE_FALSE(select_engine_label({kSm89Label, "sm89_trt-llm-0.21.0_cuda12.9"}, "", ada));
    REQUIRE_FALSE(select_engine_label({}, "", ada));
}

TEST_CASE("resolve_remote: downloads the engine matching this GPU", "[remote]") {
    ResolverFixture fx;
    publish_engine(fx.remote(), kSm89Label, "sm89");
    publish_engine(fx.remote(), kSm90Label, "sm90");
    FlakyStore store(fx.remote());

    RemoteResolver resolver(store, fx.options(), fx.logger);
    REQUIRE(resolver.engine_labels() == std::vector<std::string>{kSm89Label, kSm90Label});

    auto artifact = resolver.resolve_remote(make_architecture(89), RemotePreference::Auto);
    REQUIRE(artifact);
    REQUIRE(artifact->Kind == artifacts::ArtifactKind::Engine);
    REQUIRE(artifact->Label == kSm89Label);
    REQUIRE(std::filesystem::is_regular_file(fx.root / "models/engine/rank0.engine"));
    REQUIRE(store.Downloads == 1);
}

TEST_CASE("resolve_remote: falls back to the checkpoint when no engine fits", "[remote]") {
    ResolverFixture fx;
    publish_engine(fx.remote(), kSm90Label, "sm90");
    publish_checkpoint(fx.remote());
    FlakyStore store(fx.remote());

    RemoteResolver resolver(store, fx.options(), fx.logger);
    auto artifact = resolver.resolve_remote(make_architecture(89), RemotePreference::Auto);
    REQUIRE(artifact);
    REQUIRE(artifact->Kind == artifacts::ArtifactKind::Checkpoint);
    REQUIRE(std::filesystem::is_regular_file(fx.root / "models/ckpt/rank0.safetensors"));
    // the rejected sm90 engine does not stay behind
    REQUIRE_FALSE(std::filesystem::exists(fx.root / "models/engine"));
}

TEST_CASE("resolve_remote: honours the remote preference", "[remote]") {
    ResolverFixture fx;
    publish_engine(fx.remote(), kSm89Label, "sm89");
    publish_checkpoint(fx.remote());
    FlakyStore store(fx.remote());
    RemoteResolver resolver(store, fx.options(), fx.logger);

    auto checkpoint = resolver.resolve_remote(make_architecture(89), RemotePreference::Checkpoints);
    REQUIRE(checkpoint);
    REQUIRE(checkpoint->Kind == artifacts::ArtifactKind::Checkpoint);

    std::filesystem::remove_all(fx.remote() / kEnginesPrefix);
    REQUIRE_FALSE(resolver.resolve_remote(make_architecture(89), RemotePreference::Engines));
}

TEST_CASE("resolve_remote: transient failures are retried", "[remote]") {
    ResolverFixture fx;
    publish_engine(fx.remote(), kSm89Label, "sm89");
    FlakyStore store(fx.remote(), 2);

    RemoteResolver resolver(store, fx.options(), fx.logger);
    auto artifact = resolver.resolve_remote(make_architecture(89), RemotePreference::Engines);
    REQUIRE(artifact);
    REQUIRE(fx.sleeps.size() == 2);
    REQUIRE(fx.sleeps[1] > fx.sleeps[0]);
}

TEST_CASE("resolve_remote: an unreachable store degrades to a local build", "[remote]") {
    ResolverFixture fx;
    publish_engine(fx.remote(), kSm89Label, "sm89");
    FlakyStore store(fx.remote(), -1);

    auto options = fx.options();
    options.Retry.MaxAttempts = 3;
    RemoteResolver resolver(store, options, fx.logger);

    REQUIRE_NOTHROW(resolver.resolve_remote(make_architecture(89), RemotePreference::Auto));
    REQUIRE_FALSE(resolver.resolve_remote(make_architecture(89), RemotePreference::Auto));
    // engine listing and checkpoint listing each retry twice, for both calls
    REQUIRE(fx.sleeps.size() == 8);
}

TEST_CASE("resolve_remote: a failing engine download still tries the checkpoint", "[remote]") {
    ResolverFixture fx;
    publish_engine(fx.remote(), kSm89Label, "sm89");
    publish_checkpoint(fx.remote());
    EngineDownloadFailingStore store(fx.remote());

    auto options = fx.options();
    options.Retry.MaxAttempts = 2;
    RemoteResolver resolver(store, options, fx.logger);

    auto artifact = resolver.resolve_remote(make_architecture(89), RemotePreference::Auto);
    REQUIRE(store.EngineAttempts == 2);
    REQUIRE(artifact);
    REQUIRE(artifact->Kind == artifacts::ArtifactKind::Checkpoint);
    REQUIRE(std::filesystem::is_regular_file(fx.root / "models/ckpt/config.json"));
    REQUIRE_FALSE(std::filesystem::exists(fx.root / "models/engine"));
}

TEST_CASE("remote_preference_from_str: names and errors", "[remote]") {
    REQUIRE(remote_preference_from_str("Engines") == RemotePreference::Engines);
    REQUIRE(remote_preference_from_str("auto") == RemotePreference::Auto);
    REQUIRE_THROWS_AS(remote_preference_from_str("everything"), ConfigurationError);
}
