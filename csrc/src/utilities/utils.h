// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FORGECACHE_SRC_UTILITIES_UTILS_H
#define FORGECACHE_SRC_UTILITIES_UTILS_H

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

bool iequals(std::string_view lhs, std::string_view rhs);
std::string to_lower(std::string_view s);
std::string trim(std::string_view s);

//! Splits a command line on whitespace; no quoting rules are applied.
std::vector<std::string> split_command(std::string_view command);

//! Matches `name` against a pattern with at most one `*` wildcard (e.g. `rank*.safetensors`).
bool matches_wildcard(std::string_view name, std::string_view pattern);

//! UTC timestamp in ISO-8601 form, e.g. `2026-03-01T12:00:00Z`.
std::string iso8601_utc(std::chrono::system_clock::time_point tp);

//! True if `path` is `root` or lies below it, after normalization.
bool is_within(const std::filesystem::path& path, const std::filesystem::path& root);

#endif //FORGECACHE_SRC_UTILITIES_UTILS_H
