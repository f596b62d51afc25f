// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FORGECACHE_SRC_CACHE_REBUILD_DECISION_H
#define FORGECACHE_SRC_CACHE_REBUILD_DECISION_H

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "cache/build_record.h"
#include "cache/tracked_parameters.h"

namespace forgecache::cache {

struct RebuildDecision {
    bool Rebuild = true;
    /// Tracked parameters whose value differs from the record, in tracked-list order.
    std::vector<std::string> ChangedKeys;
    /// The stored signature does not confirm the current snapshot.
    bool SignatureMismatch = false;
    /// No usable record was found.
    bool FirstRun = false;
};

struct ModeSwitch {
    bool ForcedFullWipe = false;
    std::string Previous;
    std::string Current;
};

/**
 * @brief Decide whether the artifacts described by @p record are stale for @p current.
 *
 * A missing record means rebuild with an empty change list. Otherwise every
 * tracked parameter is compared by value and, independently, the signature of
 * @p current is compared against the stored one; either difference forces a rebuild.
 */
RebuildDecision needs_rebuild(const ConfigurationSnapshot& current, const std::optional<PersistedBuildRecord>& record);
RebuildDecision needs_rebuild(const ConfigurationSnapshot& current, const std::filesystem::path& record_path);

/**
 * @brief Compare only the inference engine kind of @p current against the record.
 *
 * Values are compared case-insensitively. A record without a stored engine kind
 * (or no record at all) is not a switch.
 */
ModeSwitch detect_mode_switch(const ConfigurationSnapshot& current, const std::optional<PersistedBuildRecord>& record);
ModeSwitch detect_mode_switch(const ConfigurationSnapshot& current, const std::filesystem::path& record_path);

}  // namespace forgecache::cache

#endif //FORGECACHE_SRC_CACHE_REBUILD_DECISION_H
