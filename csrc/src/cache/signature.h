// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FORGECACHE_SRC_CACHE_SIGNATURE_H
#define FORGECACHE_SRC_CACHE_SIGNATURE_H

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "cache/tracked_parameters.h"

namespace forgecache::cache {

/// Digest written when no hash implementation could be used.
inline constexpr std::string_view kNoSignature = "no-signature";

/**
 * @brief Fixed-width digest of a ConfigurationSnapshot.
 *
 * Deliberately has no operator==: use matches(), which never reports a
 * sentinel signature as equal to anything, itself included.
 */
struct BuildSignature {
    std::string Digest;

    [[nodiscard]] bool is_sentinel() const { return Digest.empty() || Digest == kNoSignature; }
    [[nodiscard]] bool matches(const BuildSignature& other) const {
        return !is_sentinel() && !other.is_sentinel() && Digest == other.Digest;
    }

    static BuildSignature sentinel() { return BuildSignature{std::string(kNoSignature)}; }
};

/// Hash function over the canonical form; returns nullopt when hashing is unavailable.
using Hasher = std::function<std::optional<std::string>(std::string_view)>;

/**
 * @brief Canonical serialization: `name=value` lines sorted by name, joined by '\n',
 * with values escaped as in the record file.
 */
std::string canonical_form(const ConfigurationSnapshot& snapshot);

/**
 * @brief Compute the build signature of @p snapshot.
 *
 * Stable across processes and independent of the order in which parameters
 * were captured. Falls back to the sentinel signature if @p hasher fails.
 *
 * @param snapshot Snapshot to sign.
 * @param hasher Digest function; SHA-256 by default.
 */
BuildSignature sign(const ConfigurationSnapshot& snapshot, const Hasher& hasher = {});

}  // namespace forgecache::cache

#endif //FORGECACHE_SRC_CACHE_SIGNATURE_H
