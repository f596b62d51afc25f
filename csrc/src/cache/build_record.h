// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FORGECACHE_SRC_CACHE_BUILD_RECORD_H
#define FORGECACHE_SRC_CACHE_BUILD_RECORD_H

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "cache/signature.h"
#include "cache/tracked_parameters.h"

namespace forgecache::cache {

/// Key prefix of tracked parameter lines in the record file.
inline constexpr std::string_view kTrackedKeyPrefix = "tracked.";

/**
 * @brief The last successful build, as stored on disk.
 *
 * The file is line oriented and meant to be read and diffed by operators:
 * @code
 * # forgecache build record
 * tracked.model_id=org/model
 * ...
 * signature=<hex digest>
 * timestamp=2026-03-01T12:00:00Z
 * @endcode
 */
struct PersistedBuildRecord {
    std::map<std::string, std::string, std::less<>> Values;
    BuildSignature Signature;
    std::string Timestamp;

    /// Stored value of @p name, or the empty string if the record predates that parameter.
    [[nodiscard]] const std::string& value(std::string_view name) const;
};

std::string serialize_record(const PersistedBuildRecord& record);

/// nullopt if @p text is not a well-formed record.
std::optional<PersistedBuildRecord> parse_record(std::string_view text);

/// nullopt if the file does not exist or cannot be parsed.
std::optional<PersistedBuildRecord> load_record(const std::filesystem::path& path);

/**
 * @brief Write a record for @p snapshot and @p signature, stamped with the current time.
 *
 * Parent directories are created as needed. The file is written to a temporary
 * sibling and renamed over @p path, so readers see either the old or the new record.
 *
 * @throws std::runtime_error if the file cannot be written.
 */
void persist(const ConfigurationSnapshot& snapshot, const BuildSignature& signature, const std::filesystem::path& path);

void write_record(const PersistedBuildRecord& record, const std::filesystem::path& path);

}  // namespace forgecache::cache

#endif //FORGECACHE_SRC_CACHE_BUILD_RECORD_H
