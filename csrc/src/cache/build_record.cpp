// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "cache/build_record.h"

#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>

#include <unistd.h>

#include <fmt/core.h>

#include "utilities/utils.h"

namespace forgecache::cache {

const std::string& PersistedBuildRecord::value(std::string_view name) const {
    static const std::string empty;
    auto it = Values.find(name);
    return it == Values.end() ? empty : it->second;
}

std::string serialize_record(const PersistedBuildRecord& record) {
    std::string out = "# forgecache build record\n";
    for (const auto& [name, value] : record.Values) {
        out += fmt::format("{}{}={}\n", kTrackedKeyPrefix, name, escape_value(value));
    }
    out += fmt::format("signature={}\n", record.Signature.Digest);
    out += fmt::format("timestamp={}\n", record.Timestamp);
    return out;
}

std::optional<PersistedBuildRecord> parse_record(std::string_view text) {
    PersistedBuildRecord record;
    bool has_signature = false;

    std::istringstream stream{std::string(text)};
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::string stripped = trim(line);
        if (stripped.empty() || stripped.front() == '#') continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) return std::nullopt;
        std::string key = trim(std::string_view(line).substr(0, eq));
        std::string_view raw = std::string_view(line).substr(eq + 1);

        if (key.starts_with(kTrackedKeyPrefix)) {
            auto value = unescape_value(raw);
            if (!value) return std::nullopt;
            record.Values[key.substr(kTrackedKeyPrefix.size())] = std::move(*value);
        } else if (key == "signature") {
            record.Signature.Digest = trim(raw);
            has_signature = true;
        } else if (key == "timestamp") {
            record.Timestamp = trim(raw);
        }
        // other keys are ignored so that newer records stay readable
    }

    if (!has_signature) return std::nullopt;
    return record;
}

std::optional<PersistedBuildRecord> load_record(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_record(buffer.str());
}

void write_record(const PersistedBuildRecord& record, const std::filesystem::path& path) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    auto tmp = path;
    tmp += fmt::format(".tmp.{}", getpid());
    {
        std::ofstream file(tmp, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error(fmt::format("could not open {} for writing", tmp.string()));
        }
        file << serialize_record(record);
        file.flush();
        if (!file) {
            throw std::runtime_error(fmt::format("could not write build record {}", tmp.string()));
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::string reason = ec.message();
        std::filesystem::remove(tmp, ec);
        throw std::runtime_error(fmt::format("could not replace build record {}: {}", path.string(), reason));
    }
}

void persist(const ConfigurationSnapshot& snapshot, const BuildSignature& signature, const std::filesystem::path& path) {
    PersistedBuildRecord record;
    for (const auto& [name, value] : snapshot.values()) {
        record.Values.emplace(name, value);
    }
    record.Signature = signature;
    record.Timestamp = iso8601_utc(std::chrono::system_clock::now());
    write_record(record, path);
}

}  // namespace forgecache::cache
