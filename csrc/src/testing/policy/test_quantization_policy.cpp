// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <string>

#include "hardware/architecture.h"
#include "policy/quantization_policy.h"
#include "utilities/errors.h"

using namespace forgecache;
using namespace forgecache::policy;
using hardware::make_architecture;
using hardware::unknown_architecture;

TEST_CASE("resolve: compact is 4-bit AWQ with an int8 KV cache on every architecture", "[policy]") {
    for (int numeric : {70, 75, 80, 86, 89, 90, 100}) {
        auto policy = resolve(make_architecture(numeric), PrecisionMode::Compact);
        REQUIRE(policy.Format == WeightFormat::Int4Awq);
        REQUIRE(policy.KvCacheDType == "int8");
    }
    REQUIRE(resolve(unknown_architecture(), PrecisionMode::Compact).Format == WeightFormat::Int4Awq);
}

TEST_CASE("resolve: base uses fp8 exactly when the GPU supports it", "[policy]") {
    auto ada = resolve(make_architecture(89), PrecisionMode::Base);
    REQUIRE(ada.Format == WeightFormat::Fp8);
    REQUIRE(ada.KvCacheDType == "fp8");

    auto hopper = resolve(make_architecture(90), PrecisionMode::Base);
    REQUIRE(hopper.Format == WeightFormat::Fp8);

    auto ampere = resolve(make_architecture(80), PrecisionMode::Base);
    REQUIRE(ampere.Format == WeightFormat::FullPrecision);
    REQUIRE(ampere.KvCacheDType == kNativeKvCache);
}

TEST_CASE("resolve: unknown hardware gets full precision and conservative runtime settings", "[policy]") {
    auto policy = resolve(unknown_architecture(), PrecisionMode::Base);
    REQUIRE(policy.Format == WeightFormat::FullPrecision);
    REQUIRE(policy.KvCacheDType == "none");
    REQUIRE(policy.Attention == AttentionBackend::XFormers);
    REQUIRE(policy.Limits == BatchLimits{128, 96, 8});
}

TEST_CASE("resolve: runtime settings depend on family and weight format", "[policy]") {
    auto hopper_fp8 = resolve(make_architecture(90), PrecisionMode::Base);
    REQUIRE(hopper_fp8.Attention == AttentionBackend::FlashInfer);
    REQUIRE(hopper_fp8.Limits == BatchLimits{512, 448, 64});

    auto ampere_full = resolve(make_architecture(80), PrecisionMode::Base);
    REQUIRE(ampere_full.Limits == BatchLimits{192, 160, 16});

    auto ampere_awq = resolve(make_architecture(86), PrecisionMode::Compact);
    REQUIRE(ampere_awq.Limits == BatchLimits{256, 224, 32});

    auto turing = resolve(make_architecture(75), PrecisionMode::Compact);
    REQUIRE(turing.Attention == AttentionBackend::XFormers);
}

TEST_CASE("resolve: pure function of its inputs", "[policy]") {
    auto arch = make_architecture(89, "NVIDIA L4");
    REQUIRE(resolve(arch, PrecisionMode::Base) == resolve(arch, PrecisionMode::Base));
    REQUIRE(resolve(arch, PrecisionMode::Base) == resolve(make_architecture(89), PrecisionMode::Base));
}

TEST_CASE("precision_mode_from_str: names and errors", "[policy]") {
    REQUIRE(precision_mode_from_str("compact") == PrecisionMode::Compact);
    REQUIRE(precision_mode_from_str("BASE") == PrecisionMode::Base);
    REQUIRE_THROWS_AS(precision_mode_from_str("int4"), ConfigurationError);
    REQUIRE(available_precision_modes().size() == 2);
    REQUIRE(std::string(to_string(WeightFormat::Int4Awq)) == "int4_awq");
    REQUIRE(std::string(to_string(AttentionBackend::FlashInfer)) == "FLASHINFER");
}
