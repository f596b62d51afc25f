// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "policy/quantization_policy.h"

#include <array>
#include <optional>

#include <fmt/core.h>

#include "utilities/errors.h"
#include "utilities/utils.h"

namespace forgecache::policy {

using hardware::ArchitectureFamily;

namespace {

struct FormatRule {
    PrecisionMode Mode;
    bool RequiresFp8;
    WeightFormat Format;
    std::string_view KvCacheDType;
};

// Evaluated top to bottom; the first rule whose mode matches and whose
// hardware requirement is met wins.
constexpr std::array<FormatRule, 3> kFormatRules{{
    {PrecisionMode::Compact, false, WeightFormat::Int4Awq,       "int8"},
    {PrecisionMode::Base,    true,  WeightFormat::Fp8,           "fp8"},
    {PrecisionMode::Base,    false, WeightFormat::FullPrecision, kNativeKvCache},
}};

struct RuntimeRule {
    ArchitectureFamily Family;
    std::optional<WeightFormat> Format;     ///< nullopt matches any format
    AttentionBackend Attention;
    BatchLimits Limits;
};

constexpr RuntimeRule kConservativeRuntime{
    ArchitectureFamily::Unknown, std::nullopt, AttentionBackend::XFormers, {128, 96, 8}
};

constexpr std::array<RuntimeRule, 10> kRuntimeRules{{
    {ArchitectureFamily::Blackwell, std::nullopt,                AttentionBackend::FlashInfer, {512, 448, 64}},
    {ArchitectureFamily::Hopper,    WeightFormat::FullPrecision, AttentionBackend::FlashInfer, {384, 320, 48}},
    {ArchitectureFamily::Hopper,    std::nullopt,                AttentionBackend::FlashInfer, {512, 448, 64}},
    {ArchitectureFamily::Ada,       WeightFormat::FullPrecision, AttentionBackend::FlashInfer, {192, 160, 24}},
    {ArchitectureFamily::Ada,       std::nullopt,                AttentionBackend::FlashInfer, {256, 224, 32}},
    {ArchitectureFamily::Ampere,    WeightFormat::FullPrecision, AttentionBackend::FlashInfer, {192, 160, 16}},
    {ArchitectureFamily::Ampere,    std::nullopt,                AttentionBackend::FlashInfer, {256, 224, 32}},
    {ArchitectureFamily::Turing,    std::nullopt,                AttentionBackend::XFormers,   {128, 96, 8}},
    {ArchitectureFamily::Volta,     std::nullopt,                AttentionBackend::XFormers,   {128, 96, 8}},
    kConservativeRuntime,
}};

const FormatRule& find_format_rule(PrecisionMode mode, bool supports_fp8) {
    for (const auto& rule : kFormatRules) {
        if (rule.Mode == mode && (!rule.RequiresFp8 || supports_fp8)) {
            return rule;
        }
    }
    // every mode has a rule without hardware requirements
    throw std::logic_error(fmt::format("no format rule for precision mode {}", to_string(mode)));
}

std::string_view kv_cache_for(WeightFormat format) {
    switch (format) {
        case WeightFormat::Int4Awq:
        case WeightFormat::Int8SmoothQuant:
            return "int8";
        case WeightFormat::Fp8:
            return "fp8";
        case WeightFormat::Gptq:
        case WeightFormat::FullPrecision:
            return kNativeKvCache;
    }
    return kNativeKvCache;
}

const RuntimeRule& find_runtime_rule(ArchitectureFamily family, WeightFormat format) {
    for (const auto& rule : kRuntimeRules) {
        if (rule.Family == family && (!rule.Format || *rule.Format == format)) {
            return rule;
        }
    }
    return kConservativeRuntime;
}

}  // namespace

PrecisionMode precision_mode_from_str(std::string_view mode) {
    if (iequals(mode, "compact")) return PrecisionMode::Compact;
    if (iequals(mode, "base")) return PrecisionMode::Base;
    throw ConfigurationError(fmt::format("precision_mode: unknown precision mode '{}'. Available modes: compact, base", mode));
}

const char* to_string(PrecisionMode mode) {
    switch (mode) {
        case PrecisionMode::Compact: return "compact";
        case PrecisionMode::Base:    return "base";
    }
    return "unknown";
}

const char* to_string(WeightFormat format) {
    switch (format) {
        case WeightFormat::Int4Awq:         return "int4_awq";
        case WeightFormat::Fp8:             return "fp8";
        case WeightFormat::Int8SmoothQuant: return "int8_sq";
        case WeightFormat::Gptq:            return "gptq";
        case WeightFormat::FullPrecision:   return "full_prec";
    }
    return "unknown";
}

const char* to_string(AttentionBackend backend) {
    switch (backend) {
        case AttentionBackend::FlashInfer: return "FLASHINFER";
        case AttentionBackend::XFormers:   return "XFORMERS";
    }
    return "unknown";
}

std::vector<std::string> available_precision_modes() {
    return {"compact", "base"};
}

QuantizationPolicy resolve(const hardware::ArchitectureDescriptor& architecture, PrecisionMode mode) {
    const FormatRule& format = find_format_rule(mode, architecture.known() && architecture.SupportsFp8);
    const RuntimeRule& runtime = find_runtime_rule(architecture.Family, format.Format);
    return QuantizationPolicy{
        .Format = format.Format,
        .KvCacheDType = std::string(format.KvCacheDType),
        .Attention = runtime.Attention,
        .Limits = runtime.Limits
    };
}

QuantizationPolicy resolve_for_format(const hardware::ArchitectureDescriptor& architecture, WeightFormat format) {
    const RuntimeRule& runtime = find_runtime_rule(architecture.Family, format);
    return QuantizationPolicy{
        .Format = format,
        .KvCacheDType = std::string(kv_cache_for(format)),
        .Attention = runtime.Attention,
        .Limits = runtime.Limits
    };
}

}  // namespace forgecache::policy
