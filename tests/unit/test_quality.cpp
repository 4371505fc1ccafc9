/**
 * @file test_quality.cpp
 * @brief Quality tier table and device scoring
 */

#include <catch2/catch_test_macros.hpp>

#include <layershift/quality.h>

using namespace layershift;

TEST_CASE("Quality tier parameters", "[quality]") {
    QualityParams high = paramsForTier(QualityTier::High);
    REQUIRE(high.dprCap == 2.0f);
    REQUIRE(high.depthMaxDim == 512);
    REQUIRE(high.poissonSamples == 48);
    REQUIRE(high.bilateralRadius == 2);

    QualityParams medium = paramsForTier(QualityTier::Medium);
    REQUIRE(medium.dprCap == 1.5f);
    REQUIRE(medium.poissonSamples == 32);

    QualityParams low = paramsForTier(QualityTier::Low);
    REQUIRE(low.tier == QualityTier::Low);
    REQUIRE(low.dprCap == 1.0f);
    REQUIRE(low.depthMaxDim == 256);
    REQUIRE(low.pomSteps == 8);
    REQUIRE(low.bilateralRadius == 1);
    REQUIRE(low.jfaDivisor == 4);
    REQUIRE(low.poissonSamples == 16);
    REQUIRE(low.dofDivisor == 2);
}

TEST_CASE("Device classification", "[quality]") {
    SECTION("unknown device defaults to high") {
        REQUIRE(classifyDevice({}) == QualityTier::High);
    }

    SECTION("discrete GPU") {
        DeviceCapabilities caps;
        caps.renderer = "NVIDIA GeForce RTX 3080";
        caps.maxTextureSize = 16384;
        caps.hardwareConcurrency = 16;
        caps.deviceMemoryGB = 32.0f;
        REQUIRE(classifyDevice(caps) == QualityTier::High);
    }

    SECTION("software rasterizer") {
        DeviceCapabilities caps;
        caps.renderer = "llvmpipe (LLVM 15.0.7, 256 bits)";
        caps.maxTextureSize = 8192;
        REQUIRE(classifyDevice(caps) == QualityTier::Medium);

        caps.hardwareConcurrency = 2;
        REQUIRE(classifyDevice(caps) == QualityTier::Low);
    }

    SECTION("integrated part with a small texture limit") {
        DeviceCapabilities caps;
        caps.renderer = "Intel(R) UHD Graphics 620";
        caps.maxTextureSize = 4096;
        REQUIRE(classifyDevice(caps) == QualityTier::Low);
    }

    SECTION("weak mobile hardware") {
        DeviceCapabilities caps;
        caps.isMobile = true;
        caps.deviceMemoryGB = 2.0f;
        REQUIRE(classifyDevice(caps) == QualityTier::Medium);

        caps.hardwareConcurrency = 2;
        REQUIRE(classifyDevice(caps) == QualityTier::Low);
    }

    SECTION("renderer matching is case-insensitive") {
        DeviceCapabilities caps;
        caps.renderer = "SWIFTSHADER Device";
        caps.isMobile = true;
        REQUIRE(classifyDevice(caps) == QualityTier::Low);
    }
}

TEST_CASE("Quality resolution", "[quality]") {
    DeviceCapabilities slow;
    slow.renderer = "llvmpipe";
    slow.hardwareConcurrency = 1;

    REQUIRE(resolveQuality(std::nullopt, slow).tier == QualityTier::Low);
    // An explicit tier skips the probe
    REQUIRE(resolveQuality(QualityTier::High, slow).tier == QualityTier::High);

    REQUIRE(parseQualityTier("Medium") == QualityTier::Medium);
    REQUIRE_FALSE(parseQualityTier("auto").has_value());
    REQUIRE_FALSE(parseQualityTier("ultra").has_value());
    REQUIRE(std::string(qualityTierName(QualityTier::Low)) == "low");
}
