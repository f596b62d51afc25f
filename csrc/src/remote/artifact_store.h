// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FORGECACHE_SRC_REMOTE_ARTIFACT_STORE_H
#define FORGECACHE_SRC_REMOTE_ARTIFACT_STORE_H

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace forgecache::remote {

/// Remote layout: `<root>/trt-llm/engines/<label>/...` and `<root>/trt-llm/checkpoints/...`.
inline constexpr const char* kEnginesPrefix = "trt-llm/engines";
inline constexpr const char* kCheckpointsPrefix = "trt-llm/checkpoints";

/**
 * @brief Minimal contract of a remote artifact store, keyed by '/'-separated path strings.
 *
 * No transactional guarantees are assumed. Implementations throw
 * forgecache::TransientNetworkError for failures worth retrying and
 * forgecache::RemoteUnavailableError for permanent ones.
 */
class IArtifactStore {
public:
    IArtifactStore() = default;
    virtual ~IArtifactStore() = default;

    /// Paths of all files below @p prefix, relative to the store root.
    [[nodiscard]] virtual std::vector<std::string> list(const std::string& prefix) = 0;

    /// Copy every file below @p prefix into @p destination, keeping paths relative to @p prefix.
    virtual void download(const std::string& prefix, const std::filesystem::path& destination) = 0;

    /// Copy the contents of @p source to @p prefix.
    virtual void upload(const std::filesystem::path& source, const std::string& prefix) = 0;

    /**
     * @brief Create the store for @p remote_ref.
     *
     * With an empty @p command, @p remote_ref is a directory (optionally `file://`).
     * Otherwise @p command is an external CLI invoked as
     * `<command> list|download|upload ...` against @p remote_ref.
     */
    static std::unique_ptr<IArtifactStore> create(const std::string& remote_ref, const std::string& command);
};

/// A local (or network-mounted) directory tree acting as the store.
class FilesystemArtifactStore : public IArtifactStore {
public:
    explicit FilesystemArtifactStore(std::filesystem::path root);

    [[nodiscard]] std::vector<std::string> list(const std::string& prefix) override;
    void download(const std::string& prefix, const std::filesystem::path& destination) override;
    void upload(const std::filesystem::path& source, const std::string& prefix) override;

private:
    std::filesystem::path mRoot;
};

/**
 * @brief Delegates to an external command line client.
 *
 * Invocations:
 *  - `<cmd...> list <remote>/<prefix>`: one file path per output line, relative to <remote>
 *  - `<cmd...> download <remote>/<prefix> <destination>`
 *  - `<cmd...> upload <source> <remote>/<prefix>`
 *
 * Exit code 75 (EX_TEMPFAIL) is treated as a transient failure.
 */
class CommandArtifactStore : public IArtifactStore {
public:
    static constexpr int kTransientExitCode = 75;

    CommandArtifactStore(std::vector<std::string> command, std::string remote_ref);

    [[nodiscard]] std::vector<std::string> list(const std::string& prefix) override;
    void download(const std::string& prefix, const std::filesystem::path& destination) override;
    void upload(const std::filesystem::path& source, const std::string& prefix) override;

private:
    std::string remote_path(const std::string& prefix) const;
    std::string run(const std::string& verb, const std::vector<std::string>& args);

    std::vector<std::string> mCommand;
    std::string mRemote;
};

}  // namespace forgecache::remote

#endif //FORGECACHE_SRC_REMOTE_ARTIFACT_STORE_H
