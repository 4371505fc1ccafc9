/**
 * @file test_depth_filter.cpp
 * @brief CPU bilateral reference, bilinear resize and depth subsampling
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <layershift/depth_filter.h>

using namespace layershift;
using Catch::Matchers::WithinAbs;

TEST_CASE("Bilateral sigmas", "[filter]") {
    REQUIRE_THAT(bilateralSpatialSigma2(2), WithinAbs(2.25, 1e-6));
    REQUIRE_THAT(bilateralSpatialSigma2(1), WithinAbs(0.5625, 1e-6));
    REQUIRE(BILATERAL_DEPTH_SIGMA2 == 0.01f);
}

TEST_CASE("Bilateral filter", "[filter][bilateral]") {
    SECTION("uniform depth is unchanged") {
        std::vector<uint8_t> depth(6 * 4, 90);
        REQUIRE(bilateralFilterDepth(depth.data(), 6, 4, 2) == depth);
    }

    SECTION("hard edges survive") {
        // Left half near, right half far
        std::vector<uint8_t> depth(8 * 3);
        for (int y = 0; y < 3; ++y) {
            for (int x = 0; x < 8; ++x) depth[y * 8 + x] = x < 4 ? 0 : 255;
        }
        std::vector<uint8_t> out = bilateralFilterDepth(depth.data(), 8, 3, 2);
        REQUIRE(out == depth);
    }

    SECTION("small noise is smoothed toward the neighbourhood") {
        std::vector<uint8_t> depth(5 * 5, 100);
        depth[12] = 105;
        std::vector<uint8_t> out = bilateralFilterDepth(depth.data(), 5, 5, 2);
        REQUIRE(out[12] < 105);
        REQUIRE(out[12] >= 100);
        // Neighbours are pulled up only slightly
        REQUIRE(out[0] == 100);
    }

    SECTION("corner texels only see in-image neighbours") {
        std::vector<uint8_t> depth = {10, 10, 10, 10};
        std::vector<uint8_t> out = bilateralFilterDepth(depth.data(), 2, 2, 1);
        REQUIRE(out == depth);
    }
}

TEST_CASE("Bilinear depth resize", "[filter][resize]") {
    SECTION("same size is an identity") {
        std::vector<float> src = {0.0f, 0.25f, 0.5f, 1.0f};
        std::vector<float> out = resizeDepthBilinear(src.data(), 2, 2, 2, 2);
        for (size_t i = 0; i < src.size(); ++i) {
            REQUIRE_THAT(out[i], WithinAbs(src[i], 1e-6));
        }
    }

    SECTION("upsampling uses pixel centres and clamps at the edges") {
        std::vector<float> src = {0.0f, 1.0f};
        std::vector<float> out = resizeDepthBilinear(src.data(), 2, 1, 4, 1);
        REQUIRE(out.size() == 4);
        // Centres map to -0.25, 0.25, 0.75, 1.25
        REQUIRE_THAT(out[0], WithinAbs(0.0, 1e-6));
        REQUIRE_THAT(out[1], WithinAbs(0.25, 1e-6));
        REQUIRE_THAT(out[2], WithinAbs(0.75, 1e-6));
        REQUIRE_THAT(out[3], WithinAbs(1.0, 1e-6));
    }

    SECTION("downsampling averages neighbours") {
        std::vector<float> src = {0.0f, 1.0f, 0.0f, 1.0f};
        std::vector<float> out = resizeDepthBilinear(src.data(), 4, 1, 2, 1);
        REQUIRE_THAT(out[0], WithinAbs(0.5, 1e-6));
        REQUIRE_THAT(out[1], WithinAbs(0.5, 1e-6));
    }
}

TEST_CASE("Depth dimension clamping", "[filter][subsample]") {
    DepthDimensions fits = clampDepthDimensions(320, 200, 512);
    REQUIRE(fits.width == 320);
    REQUIRE(fits.height == 200);

    DepthDimensions wide = clampDepthDimensions(1920, 1080, 512);
    REQUIRE(wide.width == 512);
    REQUIRE(wide.height == 288);

    DepthDimensions tall = clampDepthDimensions(10, 4000, 256);
    REQUIRE(tall.width == 1);
    REQUIRE(tall.height == 256);
}

TEST_CASE("Depth subsampler", "[filter][subsample]") {
    DepthSubsampler subsampler;

    SECTION("sources that fit pass through") {
        std::vector<uint8_t> depth(16, 7);
        REQUIRE(subsampler.apply(depth.data(), 4, 4, 512) == depth.data());
        REQUIRE(subsampler.width() == 4);
        REQUIRE(subsampler.allocationCount() == 0);
    }

    SECTION("large sources are sampled into a reused buffer") {
        std::vector<uint8_t> depth(8 * 4);
        for (int y = 0; y < 4; ++y) {
            for (int x = 0; x < 8; ++x) depth[y * 8 + x] = static_cast<uint8_t>(y * 8 + x);
        }

        const uint8_t* first = subsampler.apply(depth.data(), 8, 4, 4);
        REQUIRE(subsampler.width() == 4);
        REQUIRE(subsampler.height() == 2);
        REQUIRE(first[0] == 0);
        REQUIRE(first[1] == 2);
        REQUIRE(first[4] == 16);

        for (int i = 0; i < 5; ++i) {
            REQUIRE(subsampler.apply(depth.data(), 8, 4, 4) == first);
        }
        REQUIRE(subsampler.allocationCount() == 1);

        subsampler.apply(depth.data(), 8, 4, 2);
        REQUIRE(subsampler.allocationCount() == 2);
    }
}
