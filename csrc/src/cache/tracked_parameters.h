// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FORGECACHE_SRC_CACHE_TRACKED_PARAMETERS_H
#define FORGECACHE_SRC_CACHE_TRACKED_PARAMETERS_H

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace forgecache::cache {

/// Names of the parameters whose change invalidates a build.
namespace param {
inline constexpr std::string_view InferenceEngine = "inference_engine";
inline constexpr std::string_view PrecisionMode = "precision_mode";
inline constexpr std::string_view ModelId = "model_id";
inline constexpr std::string_view CheckpointDir = "checkpoint_dir";
inline constexpr std::string_view EngineDir = "engine_dir";
inline constexpr std::string_view DeployMode = "deploy_mode";
inline constexpr std::string_view ModelDType = "model_dtype";
inline constexpr std::string_view KvCacheDType = "kv_cache_dtype";
inline constexpr std::string_view MaxBatchSize = "max_batch_size";
inline constexpr std::string_view MaxInputLen = "max_input_len";
inline constexpr std::string_view MaxOutputLen = "max_output_len";
inline constexpr std::string_view AwqBlockSize = "awq_block_size";
inline constexpr std::string_view CalibSize = "calib_size";
inline constexpr std::string_view TpSize = "tp_size";
}  // namespace param

//! The fixed list of tracked parameter names, in declaration order.
const std::vector<std::string_view>& tracked_parameter_names();
bool is_tracked_parameter(std::string_view name);

//! Escapes `\` and newline so that a value always fits on one `name=value` line.
std::string escape_value(std::string_view value);
//! Inverse of escape_value; nullopt for a dangling or unknown escape.
std::optional<std::string> unescape_value(std::string_view value);

struct TrackedParameter {
    std::string Name;
    std::string Value;
};

/**
 * @brief Value of every tracked parameter at invocation time.
 *
 * Immutable once built. Every tracked name is always present; a parameter
 * that was not supplied holds the empty string.
 */
class ConfigurationSnapshot {
public:
    using ValueMap = std::map<std::string, std::string, std::less<>>;

    /// Snapshot with every tracked parameter set to the empty string.
    ConfigurationSnapshot();

    /**
     * @brief Build a snapshot from (name, value) pairs given in any order.
     *
     * @throws forgecache::ConfigurationError for a name outside the tracked list
     *         or a name given twice.
     */
    static ConfigurationSnapshot from_parameters(const std::vector<TrackedParameter>& parameters);

    /// Copy of this snapshot with one tracked parameter replaced.
    [[nodiscard]] ConfigurationSnapshot with(std::string_view name, std::string value) const;

    /// @throws std::invalid_argument if @p name is not tracked.
    [[nodiscard]] const std::string& value(std::string_view name) const;
    [[nodiscard]] const ValueMap& values() const { return mValues; }

private:
    ValueMap mValues;
};

}  // namespace forgecache::cache

#endif //FORGECACHE_SRC_CACHE_TRACKED_PARAMETERS_H
