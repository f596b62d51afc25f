// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include "hardware/architecture.h"
#include "policy/prequantized.h"
#include "policy/quantization_policy.h"

using namespace forgecache;
using namespace forgecache::policy;
using hardware::make_architecture;

TEST_CASE("trt_prequantized_format: needs a trt marker, then reads the format", "[policy]") {
    REQUIRE(trt_prequantized_format("yapwithai/qwen3-32b-trt-awq") == WeightFormat::Int4Awq);
    REQUIRE(trt_prequantized_format("org/Model-TRT-FP8") == WeightFormat::Fp8);
    REQUIRE(trt_prequantized_format("org/model-trt-int8") == WeightFormat::Int8SmoothQuant);
    REQUIRE(trt_prequantized_format("org/model-trt-INT-8") == WeightFormat::Int8SmoothQuant);
    REQUIRE(trt_prequantized_format("org/model-trtllm-8bit") == WeightFormat::Fp8);
    REQUIRE(trt_prequantized_format("org/model-trt-8-bit") == WeightFormat::Fp8);

    // awq is tried before the 8-bit markers
    REQUIRE(trt_prequantized_format("org/model-trt-awq-int8-kv") == WeightFormat::Int4Awq);

    REQUIRE_FALSE(trt_prequantized_format("Qwen/Qwen3-8B-AWQ"));
    REQUIRE_FALSE(trt_prequantized_format("org/model-trt"));
    REQUIRE_FALSE(trt_prequantized_format(""));
}

TEST_CASE("prequantized_format: AWQ and 4-bit hints, then GPTQ", "[policy]") {
    REQUIRE(prequantized_format("Qwen/Qwen3-8B-AWQ") == WeightFormat::Int4Awq);
    REQUIRE(prequantized_format("org/model-W4A16") == WeightFormat::Int4Awq);
    REQUIRE(prequantized_format("org/model-nvfp4") == WeightFormat::Int4Awq);
    REQUIRE(prequantized_format("org/model-compressed-tensors") == WeightFormat::Int4Awq);
    REQUIRE(prequantized_format("org/model-AutoRound") == WeightFormat::Int4Awq);
    REQUIRE(prequantized_format("TheBloke/model-GPTQ") == WeightFormat::Gptq);

    REQUIRE_FALSE(prequantized_format("Qwen/Qwen3-8B"));
    REQUIRE_FALSE(prequantized_format("org/model-fp8"));
}

TEST_CASE("resolve_for_format: KV cache follows the fixed weight format", "[policy]") {
    auto ada = make_architecture(89);
    REQUIRE(resolve_for_format(ada, WeightFormat::Int4Awq).KvCacheDType == "int8");
    REQUIRE(resolve_for_format(ada, WeightFormat::Int8SmoothQuant).KvCacheDType == "int8");
    REQUIRE(resolve_for_format(ada, WeightFormat::Fp8).KvCacheDType == "fp8");
    REQUIRE(resolve_for_format(ada, WeightFormat::Gptq).KvCacheDType == kNativeKvCache);

    auto ampere = make_architecture(80);
    REQUIRE(resolve_for_format(ampere, WeightFormat::FullPrecision) == resolve(ampere, PrecisionMode::Base));
    REQUIRE(resolve_for_format(ada, WeightFormat::Int4Awq) == resolve(ada, PrecisionMode::Compact));
}
