// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "hardware/architecture.h"

#include <array>
#include <cctype>
#include <charconv>
#include <optional>
#include <utility>

#include <fmt/core.h>

#include "utilities/errors.h"
#include "utilities/utils.h"

namespace forgecache::hardware {

namespace {

struct DeviceNameEntry {
    std::string_view Needle;
    int Numeric;
};

// First match wins, so longer names precede their prefixes ("a100" before "a10").
constexpr std::array<DeviceNameEntry, 16> kDeviceNameTable{{
    {"gh200", 90},
    {"h200", 90},
    {"h100", 90},
    {"h800", 90},
    {"b200", 100},
    {"b100", 100},
    {"l40s", 89},
    {"l40", 89},
    {"l4", 89},
    {"rtx 40", 89},
    {"a100", 80},
    {"a800", 80},
    {"a30", 80},
    {"a10", 86},
    {"rtx 30", 86},
    {"v100", 70},
}};

std::optional<int> parse_int(std::string_view s) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

}  // namespace

ArchitectureFamily family_from_numeric(int numeric) {
    if (numeric >= 100) return ArchitectureFamily::Blackwell;
    if (numeric >= 90) return ArchitectureFamily::Hopper;
    if (numeric == 89) return ArchitectureFamily::Ada;
    if (numeric >= 80) return ArchitectureFamily::Ampere;
    if (numeric == 75) return ArchitectureFamily::Turing;
    if (numeric >= 70) return ArchitectureFamily::Volta;
    return ArchitectureFamily::Unknown;
}

const char* to_string(ArchitectureFamily family) {
    switch (family) {
        case ArchitectureFamily::Volta:     return "volta";
        case ArchitectureFamily::Turing:    return "turing";
        case ArchitectureFamily::Ampere:    return "ampere";
        case ArchitectureFamily::Ada:       return "ada";
        case ArchitectureFamily::Hopper:    return "hopper";
        case ArchitectureFamily::Blackwell: return "blackwell";
        case ArchitectureFamily::Unknown:   break;
    }
    return "unknown";
}

ArchitectureDescriptor make_architecture(int numeric, std::string device_name) {
    if (numeric <= 0) {
        return unknown_architecture(std::move(device_name));
    }
    return ArchitectureDescriptor{
        .Code = fmt::format("sm{}", numeric),
        .Numeric = numeric,
        .Family = family_from_numeric(numeric),
        .SupportsFp8 = numeric >= kFp8NativeThreshold,
        .DeviceName = std::move(device_name)
    };
}

ArchitectureDescriptor make_architecture(int major, int minor, std::string device_name) {
    return make_architecture(major * 10 + minor, std::move(device_name));
}

ArchitectureDescriptor unknown_architecture(std::string device_name) {
    ArchitectureDescriptor desc;
    desc.DeviceName = std::move(device_name);
    return desc;
}

ArchitectureDescriptor parse_architecture(std::string_view text, std::string device_name) {
    std::string s = to_lower(trim(text));
    std::string_view v = s;
    if (v.starts_with("sm")) v.remove_prefix(2);
    if (v.starts_with("_")) v.remove_prefix(1);
    // arch-specific feature suffixes such as sm90a or sm100f
    while (!v.empty() && std::isalpha(static_cast<unsigned char>(v.back()))) v.remove_suffix(1);

    std::optional<int> numeric;
    if (auto dot = v.find('.'); dot != std::string_view::npos) {
        auto major = parse_int(v.substr(0, dot));
        auto minor = parse_int(v.substr(dot + 1));
        if (major && minor && *minor >= 0 && *minor < 10) {
            numeric = *major * 10 + *minor;
        }
    } else {
        numeric = parse_int(v);
    }

    if (!numeric || *numeric <= 0) {
        throw ConfigurationError(fmt::format("'{}' is not a GPU architecture code (expected e.g. sm89 or 8.9)", text));
    }
    return make_architecture(*numeric, std::move(device_name));
}

ArchitectureDescriptor architecture_from_device_name(std::string_view device_name) {
    std::string name = to_lower(device_name);
    for (const auto& entry : kDeviceNameTable) {
        if (name.find(entry.Needle) != std::string::npos) {
            return make_architecture(entry.Numeric, std::string(device_name));
        }
    }
    return unknown_architecture(std::string(device_name));
}

}  // namespace forgecache::hardware
