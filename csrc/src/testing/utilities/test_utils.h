// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

#include <fmt/core.h>

#include "artifacts/artifact.h"
#include "artifacts/build_metadata.h"
#include "pipeline/toolchain.h"
#include "remote/artifact_store.h"
#include "utilities/errors.h"
#include "utilities/subprocess.h"

#include "test_config.h"

namespace testing_utils {

namespace fs = std::filesystem;

// Scratch directory, removed when it goes out of scope.
class TempWorkRoot {
public:
    explicit TempWorkRoot(const std::string& name) {
        static std::atomic<int> counter{0};
        mPath = testing_config::temp_root() / fmt::format("forgecache-{}-{}-{}", name, getpid(), counter++);
        fs::remove_all(mPath);
        fs::create_directories(mPath);
    }

    ~TempWorkRoot() {
        if (testing_config::get_test_config().KeepTempDirs) return;
        std::error_code ec;
        fs::remove_all(mPath, ec);
    }

    TempWorkRoot(const TempWorkRoot&) = delete;
    TempWorkRoot& operator=(const TempWorkRoot&) = delete;

    [[nodiscard]] const fs::path& path() const { return mPath; }
    [[nodiscard]] fs::path operator/(const std::string& rel) const { return mPath / rel; }

private:
    fs::path mPath;
};

inline void write_file(const fs::path& path, const std::string& contents) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) throw std::runtime_error("could not open " + path.string());
    f << contents;
}

inline void write_sized_file(const fs::path& path, std::uintmax_t bytes) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) throw std::runtime_error("could not open " + path.string());
    std::string chunk(64 * 1024, '\0');
    while (bytes > 0) {
        auto n = std::min<std::uintmax_t>(bytes, chunk.size());
        f.write(chunk.data(), static_cast<std::streamsize>(n));
        bytes -= n;
    }
}

inline std::string read_file(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
}

// Complete engine directory; sm_arch set writes build_metadata.json.
inline void make_engine_dir(const fs::path& dir, std::optional<std::string> sm_arch = std::nullopt,
                            std::uintmax_t engine_bytes = forgecache::artifacts::kMinEngineBytes) {
    write_sized_file(dir / forgecache::artifacts::kEnginePrimaryFile, engine_bytes);
    write_file(dir / forgecache::artifacts::kManifestFile, "{}");
    if (sm_arch) {
        forgecache::artifacts::BuildMetadata meta;
        meta.SmArch = *sm_arch;
        meta.QuantMethod = "fp8";
        forgecache::artifacts::write_build_metadata(dir, meta);
    }
}

inline void make_checkpoint_dir(const fs::path& dir) {
    write_file(dir / forgecache::artifacts::kManifestFile, "{}");
    write_file(dir / "rank0.safetensors", "shard");
}

// Toolchain that writes plausible artifacts instead of running the real tools.
class FakeToolchain : public forgecache::pipeline::IToolchain {
public:
    void check_configured(forgecache::pipeline::Tool tool) const override {
        if (!Configured) {
            throw forgecache::ConfigurationError(fmt::format("toolchain: no {} command configured", forgecache::pipeline::to_string(tool)));
        }
    }

    [[nodiscard]] CommandResult quantize(const forgecache::pipeline::QuantizeRequest& request) override {
        Quantized.push_back(request);
        if (QuantizeExitCode == 0) make_checkpoint_dir(request.OutputDir);
        return CommandResult{QuantizeExitCode, QuantizeExitCode == 0 ? "quantized\n" : "CUDA out of memory\n"};
    }

    // publishes the checkpoint below trt-llm/checkpoints, as exported repositories do
    [[nodiscard]] CommandResult fetch(const forgecache::pipeline::FetchRequest& request) override {
        Fetched.push_back(request);
        if (FetchExitCode == 0) {
            make_checkpoint_dir(request.OutputDir / "trt-llm" / "checkpoints");
        } else {
            write_file(request.OutputDir / "partial.safetensors", "");
        }
        return CommandResult{FetchExitCode, FetchExitCode == 0 ? "downloaded\n" : "404 Not Found\n"};
    }

    [[nodiscard]] CommandResult compile(const forgecache::pipeline::CompileRequest& request) override {
        Compiled.push_back(request);
        if (CompileExitCode == 0) make_engine_dir(request.OutputDir, std::nullopt, EngineBytes);
        return CommandResult{CompileExitCode, CompileExitCode == 0 ? "engine built\n" : "build failed\n"};
    }

    bool Configured = true;
    int QuantizeExitCode = 0;
    int CompileExitCode = 0;
    int FetchExitCode = 0;
    std::uintmax_t EngineBytes = forgecache::artifacts::kMinEngineBytes;
    std::vector<forgecache::pipeline::QuantizeRequest> Quantized;
    std::vector<forgecache::pipeline::FetchRequest> Fetched;
    std::vector<forgecache::pipeline::CompileRequest> Compiled;
};

// Directory-backed store that fails the first FailuresLeft calls with a transient error.
class FlakyStore : public forgecache::remote::IArtifactStore {
public:
    explicit FlakyStore(fs::path root, int failures = 0) : FailuresLeft(failures), mInner(std::move(root)) {}

    [[nodiscard]] std::vector<std::string> list(const std::string& prefix) override {
        maybe_fail("list");
        return mInner.list(prefix);
    }

    void download(const std::string& prefix, const fs::path& destination) override {
        maybe_fail("download");
        ++Downloads;
        mInner.download(prefix, destination);
    }

    void upload(const fs::path& source, const std::string& prefix) override {
        maybe_fail("upload");
        Uploads.push_back(prefix);
        mInner.upload(source, prefix);
    }

    int FailuresLeft = 0;
    int Calls = 0;
    int Downloads = 0;
    std::vector<std::string> Uploads;

private:
    void maybe_fail(const char* what) {
        ++Calls;
        if (FailuresLeft != 0) {
            if (FailuresLeft > 0) --FailuresLeft;
            throw forgecache::TransientNetworkError(fmt::format("{}: connection reset", what));
        }
    }

    forgecache::remote::FilesystemArtifactStore mInner;
};

} // namespace testing_utils
