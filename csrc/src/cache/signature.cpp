// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "cache/signature.h"

#include <algorithm>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "utilities/sha256.h"

namespace forgecache::cache {

std::string canonical_form(const ConfigurationSnapshot& snapshot) {
    std::vector<std::pair<std::string_view, std::string_view>> entries;
    entries.reserve(snapshot.values().size());
    for (const auto& [name, value] : snapshot.values()) {
        entries.emplace_back(name, value);
    }
    std::ranges::sort(entries, {}, &std::pair<std::string_view, std::string_view>::first);

    std::string out;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (i != 0) out += '\n';
        out += fmt::format("{}={}", entries[i].first, escape_value(entries[i].second));
    }
    return out;
}

BuildSignature sign(const ConfigurationSnapshot& snapshot, const Hasher& hasher) {
    std::string canonical = canonical_form(snapshot);
    std::optional<std::string> digest = hasher ? hasher(canonical) : sha256_hex(canonical);
    if (!digest || digest->empty()) {
        return BuildSignature::sentinel();
    }
    return BuildSignature{std::move(*digest)};
}

}  // namespace forgecache::cache
