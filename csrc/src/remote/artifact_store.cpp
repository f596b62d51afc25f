// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "remote/artifact_store.h"

#include <algorithm>
#include <sstream>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "utilities/errors.h"
#include "utilities/subprocess.h"
#include "utilities/utils.h"

namespace forgecache::remote {

namespace {

void copy_tree(const std::filesystem::path& from, const std::filesystem::path& to, const char* what) {
    std::error_code ec;
    std::filesystem::create_directories(to, ec);
    if (ec) {
        throw TransientNetworkError(fmt::format("{}: could not create {}: {}", what, to.string(), ec.message()));
    }
    std::filesystem::copy(from, to,
                          std::filesystem::copy_options::recursive | std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        throw TransientNetworkError(fmt::format("{}: could not copy {} to {}: {}", what, from.string(), to.string(), ec.message()));
    }
}

}  // namespace

std::unique_ptr<IArtifactStore> IArtifactStore::create(const std::string& remote_ref, const std::string& command) {
    if (remote_ref.empty()) {
        throw ConfigurationError("remote: no remote reference configured");
    }
    if (!command.empty()) {
        return std::make_unique<CommandArtifactStore>(split_command(command), remote_ref);
    }
    std::string_view root = remote_ref;
    if (root.starts_with("file://")) root.remove_prefix(7);
    return std::make_unique<FilesystemArtifactStore>(std::filesystem::path(root));
}

FilesystemArtifactStore::FilesystemArtifactStore(std::filesystem::path root) : mRoot(std::move(root)) {
}

std::vector<std::string> FilesystemArtifactStore::list(const std::string& prefix) {
    std::error_code ec;
    if (!std::filesystem::is_directory(mRoot, ec)) {
        throw TransientNetworkError(fmt::format("artifact store {} is not reachable", mRoot.string()));
    }

    std::vector<std::string> files;
    auto base = mRoot / prefix;
    if (!std::filesystem::is_directory(base, ec)) {
        return files;
    }
    for (auto it = std::filesystem::recursive_directory_iterator(base, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            files.push_back(std::filesystem::relative(it->path(), mRoot).generic_string());
        }
    }
    if (ec) {
        throw TransientNetworkError(fmt::format("listing {} failed: {}", base.string(), ec.message()));
    }
    std::ranges::sort(files);
    return files;
}

void FilesystemArtifactStore::download(const std::string& prefix, const std::filesystem::path& destination) {
    auto source = mRoot / prefix;
    std::error_code ec;
    if (!std::filesystem::is_directory(source, ec)) {
        throw RemoteUnavailableError(fmt::format("nothing to download at {}", source.string()));
    }
    copy_tree(source, destination, "download");
}

void FilesystemArtifactStore::upload(const std::filesystem::path& source, const std::string& prefix) {
    copy_tree(source, mRoot / prefix, "upload");
}

CommandArtifactStore::CommandArtifactStore(std::vector<std::string> command, std::string remote_ref) :
    mCommand(std::move(command)), mRemote(std::move(remote_ref)) {
    if (mCommand.empty()) {
        throw ConfigurationError("remote_command: empty artifact store command");
    }
}

std::string CommandArtifactStore::remote_path(const std::string& prefix) const {
    if (prefix.empty()) return mRemote;
    if (mRemote.ends_with('/')) return mRemote + prefix;
    return mRemote + "/" + prefix;
}

std::string CommandArtifactStore::run(const std::string& verb, const std::vector<std::string>& args) {
    std::vector<std::string> argv = mCommand;
    argv.push_back(verb);
    argv.insert(argv.end(), args.begin(), args.end());

    CommandResult result = run_command(argv);
    if (result.ExitCode == kTransientExitCode) {
        throw TransientNetworkError(fmt::format("{} {} {}: temporary failure: {}", mCommand.front(), verb, mRemote, trim(result.Output)));
    }
    if (!result.ok()) {
        throw RemoteUnavailableError(fmt::format("{} {} {} exited with code {}: {}",
                                                 mCommand.front(), verb, mRemote, result.ExitCode, trim(result.Output)));
    }
    return std::move(result.Output);
}

std::vector<std::string> CommandArtifactStore::list(const std::string& prefix) {
    std::istringstream output(run("list", {remote_path(prefix)}));
    std::vector<std::string> files;
    std::string line;
    while (std::getline(output, line)) {
        std::string path = trim(line);
        if (!path.empty()) files.push_back(std::move(path));
    }
    std::ranges::sort(files);
    return files;
}

void CommandArtifactStore::download(const std::string& prefix, const std::filesystem::path& destination) {
    std::filesystem::create_directories(destination);
    run("download", {remote_path(prefix), destination.string()});
}

void CommandArtifactStore::upload(const std::filesystem::path& source, const std::string& prefix) {
    run("upload", {source.string(), remote_path(prefix)});
}

}  // namespace forgecache::remote
