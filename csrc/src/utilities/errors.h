// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FORGECACHE_SRC_UTILITIES_ERRORS_H
#define FORGECACHE_SRC_UTILITIES_ERRORS_H

#include <stdexcept>
#include <string>
#include <utility>

namespace forgecache {

/// A required tracked parameter or option is unset or malformed.
/// Always raised before any GPU work starts.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Base for artifact validation failures. Recovered as a cache miss when
/// checking a cached or downloaded artifact, fatal after a local build.
class ArtifactError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ArtifactMissingError : public ArtifactError {
public:
    using ArtifactError::ArtifactError;
};

class ArtifactIncompatibleError : public ArtifactError {
public:
    using ArtifactError::ArtifactError;
};

/// An external quantizer/compiler returned a non-zero exit code.
class ExternalToolFailure : public std::runtime_error {
public:
    ExternalToolFailure(std::string tool, int exit_code, std::string output, const std::string& message) :
        std::runtime_error(message), Tool(std::move(tool)), ExitCode(exit_code), Output(std::move(output)) {}

    std::string Tool;
    int ExitCode;
    std::string Output;
};

/// A remote store call failed in a way that may succeed on retry.
class TransientNetworkError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The remote store could not be used (retries exhausted or a permanent failure).
/// Degrades to a local build.
class RemoteUnavailableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Another build already holds the build lock of this working root.
class BuildLockedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace forgecache

#endif //FORGECACHE_SRC_UTILITIES_ERRORS_H
