// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "cache/tracked_parameters.h"

#include <algorithm>
#include <set>
#include <stdexcept>

#include <fmt/core.h>

#include "utilities/errors.h"

namespace forgecache::cache {

std::string escape_value(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '\\') out += "\\\\";
        else if (c == '\n') out += "\\n";
        else out += c;
    }
    return out;
}

std::optional<std::string> unescape_value(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] != '\\') {
            out += value[i];
            continue;
        }
        if (i + 1 >= value.size()) return std::nullopt;
        char next = value[++i];
        if (next == '\\') out += '\\';
        else if (next == 'n') out += '\n';
        else return std::nullopt;
    }
    return out;
}

const std::vector<std::string_view>& tracked_parameter_names() {
    static const std::vector<std::string_view> names{
        param::InferenceEngine,
        param::PrecisionMode,
        param::ModelId,
        param::CheckpointDir,
        param::EngineDir,
        param::DeployMode,
        param::ModelDType,
        param::KvCacheDType,
        param::MaxBatchSize,
        param::MaxInputLen,
        param::MaxOutputLen,
        param::AwqBlockSize,
        param::CalibSize,
        param::TpSize,
    };
    return names;
}

bool is_tracked_parameter(std::string_view name) {
    const auto& names = tracked_parameter_names();
    return std::ranges::find(names, name) != names.end();
}

ConfigurationSnapshot::ConfigurationSnapshot() {
    for (auto name : tracked_parameter_names()) {
        mValues.emplace(std::string(name), std::string());
    }
}

ConfigurationSnapshot ConfigurationSnapshot::from_parameters(const std::vector<TrackedParameter>& parameters) {
    ConfigurationSnapshot snapshot;
    std::set<std::string, std::less<>> seen;
    for (const auto& p : parameters) {
        if (!is_tracked_parameter(p.Name)) {
            throw ConfigurationError(fmt::format("'{}' is not a tracked build parameter", p.Name));
        }
        if (!seen.insert(p.Name).second) {
            throw ConfigurationError(fmt::format("tracked build parameter '{}' given more than once", p.Name));
        }
        snapshot.mValues[p.Name] = p.Value;
    }
    return snapshot;
}

ConfigurationSnapshot ConfigurationSnapshot::with(std::string_view name, std::string value) const {
    if (!is_tracked_parameter(name)) {
        throw std::invalid_argument(fmt::format("'{}' is not a tracked build parameter", name));
    }
    ConfigurationSnapshot copy = *this;
    copy.mValues.find(name)->second = std::move(value);
    return copy;
}

const std::string& ConfigurationSnapshot::value(std::string_view name) const {
    auto it = mValues.find(name);
    if (it == mValues.end()) {
        throw std::invalid_argument(fmt::format("'{}' is not a tracked build parameter", name));
    }
    return it->second;
}

}  // namespace forgecache::cache
