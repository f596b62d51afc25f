// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FORGECACHE_SRC_UTILITIES_SHA256_H
#define FORGECACHE_SRC_UTILITIES_SHA256_H

#include <optional>
#include <string>
#include <string_view>

//! Lower-case hex SHA-256 of @p data, or nullopt if no digest implementation is available.
std::optional<std::string> sha256_hex(std::string_view data);

#endif //FORGECACHE_SRC_UTILITIES_SHA256_H
