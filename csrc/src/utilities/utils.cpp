// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "utils.h"

#include <algorithm>
#include <cctype>
#include <ctime>

#include <fmt/core.h>

/**
 * @brief Case-insensitive ASCII string comparison.
 *
 * @param lhs First string.
 * @param rhs Second string.
 * @return True if both strings are equal ignoring ASCII case.
 */
bool iequals(std::string_view lhs, std::string_view rhs) {
    return std::ranges::equal(
        lhs, rhs, [](unsigned char a, unsigned char b) {
            return std::tolower(a) == std::tolower(b);
    });
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::ranges::transform(result, result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(std::string_view s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return std::string(s);
}

std::vector<std::string> split_command(std::string_view command) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : command) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                parts.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) parts.push_back(std::move(current));
    return parts;
}

bool matches_wildcard(std::string_view name, std::string_view pattern) {
    auto star = pattern.find('*');
    if (star == std::string_view::npos) {
        return name == pattern;
    }
    std::string_view prefix = pattern.substr(0, star);
    std::string_view suffix = pattern.substr(star + 1);
    return name.size() >= prefix.size() + suffix.size() && name.starts_with(prefix) && name.ends_with(suffix);
}

/**
 * @brief Format a time point as an ISO-8601 UTC timestamp with second resolution.
 *
 * @param tp Time point to format.
 * @return String of the form YYYY-MM-DDTHH:MM:SSZ.
 */
std::string iso8601_utc(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);
    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
                       utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec);
}

bool is_within(const std::filesystem::path& path, const std::filesystem::path& root) {
    auto p = std::filesystem::weakly_canonical(std::filesystem::absolute(path));
    auto r = std::filesystem::weakly_canonical(std::filesystem::absolute(root));
    if (!r.has_filename() && r.has_relative_path()) r = r.parent_path();
    auto [root_end, _]= std::mismatch(r.begin(), r.end(), p.begin(), p.end());
    return root_end == r.end();
}
