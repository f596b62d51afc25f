// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FORGECACHE_SRC_ARTIFACTS_ARTIFACT_VALIDATOR_H
#define FORGECACHE_SRC_ARTIFACTS_ARTIFACT_VALIDATOR_H

#include <string>
#include <vector>

#include "artifacts/artifact.h"
#include "hardware/architecture.h"

namespace forgecache::artifacts {

enum class ValidationStatus {
    Ok,
    Warning,    ///< usable, but something looked suspicious and must be logged
    Failed
};

enum class ValidationFailure {
    None,
    Missing,        ///< required file or directory absent
    Incompatible    ///< built for a different architecture, or unreadable metadata
};

struct ValidationResult {
    ValidationStatus Status = ValidationStatus::Ok;
    ValidationFailure Failure = ValidationFailure::None;
    /// Architecture compatibility was inferred from naming only (or could not be checked).
    bool HeuristicOnly = false;
    std::vector<std::string> Warnings;
    std::string Error;

    [[nodiscard]] bool usable() const { return Status != ValidationStatus::Failed; }

    /// @throws forgecache::ArtifactMissingError or forgecache::ArtifactIncompatibleError if failed.
    void throw_if_failed() const;
};

struct ValidatorOptions {
    /// When false, architecture mismatches are reported as warnings instead of failures.
    bool StrictArchMatch = true;
};

/**
 * @brief Check that @p artifact is structurally complete and fits @p architecture.
 *
 * Checks run in order and stop at the first failure:
 *  1. the directory and every required file exist;
 *  2. the primary file is at least MinPrimaryBytes (a warning otherwise);
 *  3. engines only: the architecture in `build_metadata.json` equals @p architecture.
 *     Without metadata, a `sm<NN>_` prefix on the label or directory name is compared
 *     instead; a name with no such prefix passes with HeuristicOnly set.
 */
ValidationResult validate(const ArtifactDescriptor& artifact, const hardware::ArchitectureDescriptor& architecture,
                          const ValidatorOptions& options = {});

}  // namespace forgecache::artifacts

#endif //FORGECACHE_SRC_ARTIFACTS_ARTIFACT_VALIDATOR_H
