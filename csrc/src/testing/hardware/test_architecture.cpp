// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <string>

#include "hardware/architecture.h"
#include "hardware/hardware_probe.h"
#include "utilities/errors.h"

using namespace forgecache;
using namespace forgecache::hardware;

TEST_CASE("parse_architecture: accepts the usual spellings", "[hardware]") {
    for (const char* text : {"sm89", "SM89", "sm_89", "8.9", "89", " sm89 "}) {
        auto arch = parse_architecture(text);
        REQUIRE(arch.Code == "sm89");
        REQUIRE(arch.Numeric == 89);
        REQUIRE(arch.Family == ArchitectureFamily::Ada);
        REQUIRE(arch.SupportsFp8);
    }

    auto hopper = parse_architecture("sm90a", "NVIDIA H100 80GB HBM3");
    REQUIRE(hopper.Code == "sm90");
    REQUIRE(hopper.Family == ArchitectureFamily::Hopper);
    REQUIRE(hopper.DeviceName == "NVIDIA H100 80GB HBM3");
}

TEST_CASE("parse_architecture: rejects garbage", "[hardware]") {
    REQUIRE_THROWS_AS(parse_architecture(""), ConfigurationError);
    REQUIRE_THROWS_AS(parse_architecture("hopper"), ConfigurationError);
    REQUIRE_THROWS_AS(parse_architecture("sm"), ConfigurationError);
    REQUIRE_THROWS_AS(parse_architecture("8.12"), ConfigurationError);
    REQUIRE_THROWS_AS(parse_architecture("0"), ConfigurationError);
}

TEST_CASE("make_architecture: fp8 support starts at sm89", "[hardware]") {
    REQUIRE_FALSE(make_architecture(8, 6, "").SupportsFp8);
    REQUIRE_FALSE(make_architecture(80).SupportsFp8);
    REQUIRE(make_architecture(89).SupportsFp8);
    REQUIRE(make_architecture(90).SupportsFp8);
    REQUIRE(make_architecture(100).Family == ArchitectureFamily::Blackwell);
    REQUIRE(make_architecture(75).Family == ArchitectureFamily::Turing);
    REQUIRE(make_architecture(70).Family == ArchitectureFamily::Volta);
    REQUIRE(make_architecture(86).Family == ArchitectureFamily::Ampere);
}

TEST_CASE("unknown_architecture: is not known and has no fp8", "[hardware]") {
    auto arch = unknown_architecture("Mystery GPU");
    REQUIRE_FALSE(arch.known());
    REQUIRE_FALSE(arch.SupportsFp8);
    REQUIRE(arch.Code.empty());
    REQUIRE(arch.DeviceName == "Mystery GPU");
    REQUIRE_FALSE(make_architecture(0).known());
}

TEST_CASE("architecture_from_device_name: known product names", "[hardware]") {
    REQUIRE(architecture_from_device_name("NVIDIA H100 80GB HBM3").Code == "sm90");
    REQUIRE(architecture_from_device_name("NVIDIA GH200 480GB").Code == "sm90");
    REQUIRE(architecture_from_device_name("NVIDIA L40S").Code == "sm89");
    REQUIRE(architecture_from_device_name("NVIDIA L4").Code == "sm89");
    REQUIRE(architecture_from_device_name("NVIDIA GeForce RTX 4090").Code == "sm89");
    REQUIRE(architecture_from_device_name("NVIDIA A100-SXM4-80GB").Code == "sm80");
    REQUIRE(architecture_from_device_name("NVIDIA A10G").Code == "sm86");
    REQUIRE(architecture_from_device_name("Tesla V100-SXM2-16GB").Code == "sm70");
    REQUIRE(architecture_from_device_name("NVIDIA B200").Code == "sm100");
    REQUIRE_FALSE(architecture_from_device_name("Some Other Accelerator").known());
}

TEST_CASE("IHardwareProbe::create: an override replaces detection", "[hardware]") {
    auto probe = IHardwareProbe::create("sm_80");
    auto arch = probe->probe();
    REQUIRE(arch.Code == "sm80");
    REQUIRE_FALSE(arch.SupportsFp8);

    REQUIRE_THROWS_AS(IHardwareProbe::create("not-an-arch"), ConfigurationError);
}

TEST_CASE("FixedHardwareProbe: returns its descriptor", "[hardware]") {
    FixedHardwareProbe probe(make_architecture(89, "NVIDIA L4"));
    REQUIRE(probe.probe().DeviceName == "NVIDIA L4");
}
