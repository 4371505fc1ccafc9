/**
 * @file test_depth_analysis.cpp
 * @brief Depth histogram statistics and derived effect parameters
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <layershift/depth_analysis.h>

using namespace layershift;
using Catch::Matchers::WithinAbs;

namespace {

// Two rows of 0..255
std::vector<uint8_t> rampFrame() {
    std::vector<uint8_t> frame;
    for (int row = 0; row < 2; ++row) {
        for (int v = 0; v < 256; ++v) frame.push_back(static_cast<uint8_t>(v));
    }
    return frame;
}

// Triangular clusters around two depths, 25 pixels each
std::vector<uint8_t> twoClusterFrame(int a, int b) {
    std::vector<uint8_t> frame;
    for (int center : {a, b}) {
        for (int k = -4; k <= 4; ++k) {
            for (int n = 0; n < 5 - (k < 0 ? -k : k); ++n) {
                frame.push_back(static_cast<uint8_t>(center + k));
            }
        }
    }
    return frame;
}

} // namespace

TEST_CASE("Depth profile of a flat frame", "[analysis]") {
    std::vector<std::vector<uint8_t>> frames = {std::vector<uint8_t>(64, 128)};
    DepthProfile profile = analyzeDepthFrames(frames, 8, 8);

    REQUIRE_THAT(profile.median, WithinAbs(128.0 / 255.0, 1e-6));
    REQUIRE_THAT(profile.p5, WithinAbs(128.0 / 255.0, 1e-6));
    REQUIRE_THAT(profile.stdDev, WithinAbs(0.0, 1e-6));
    REQUIRE(profile.effectiveRange == 0.0f);
    REQUIRE(profile.bimodality == 0.0f);

    SECTION("derived params fall back to defaults") {
        DerivedParallaxParams parallax = deriveParallaxParams(profile);
        REQUIRE(parallax.parallaxStrength == DerivedParallaxParams{}.parallaxStrength);
        REQUIRE(parallax.overscanPadding == DerivedParallaxParams{}.overscanPadding);

        DerivedFocusParams focus = deriveFocusParams(profile);
        REQUIRE(focus.autoFocusDepth == 0.5f);
        REQUIRE(focus.depthScale == 50.0f);
    }
}

TEST_CASE("Depth profile percentiles of a uniform ramp", "[analysis]") {
    std::vector<std::vector<uint8_t>> frames = {rampFrame()};
    DepthProfile profile = analyzeDepthFrames(frames, 256, 2);

    // First bin whose cdf reaches the target: cdf(i) = (i + 1) / 256
    REQUIRE_THAT(profile.p5, WithinAbs(12.0 / 255.0, 1e-6));
    REQUIRE_THAT(profile.p25, WithinAbs(63.0 / 255.0, 1e-6));
    REQUIRE_THAT(profile.median, WithinAbs(127.0 / 255.0, 1e-6));
    REQUIRE_THAT(profile.p75, WithinAbs(191.0 / 255.0, 1e-6));
    REQUIRE_THAT(profile.p95, WithinAbs(243.0 / 255.0, 1e-6));
    REQUIRE_THAT(profile.effectiveRange, WithinAbs(231.0 / 255.0, 1e-6));
    REQUIRE_THAT(profile.iqr, WithinAbs(128.0 / 255.0, 1e-6));
    REQUIRE_THAT(profile.mean, WithinAbs(0.5, 1e-6));
    REQUIRE_THAT(profile.verticalBias, WithinAbs(0.0, 1e-6));
    REQUIRE(profile.bimodality == 0.0f);

    SECTION("parallax derivation") {
        DerivedParallaxParams p = deriveParallaxParams(profile);
        // 0.05 - 0.406*0.03 - 0.4*0.01 = 0.0338 clamps up
        REQUIRE_THAT(p.parallaxStrength, WithinAbs(0.035, 1e-6));
        REQUIRE_THAT(p.contrastLow, WithinAbs(12.0 / 255.0 - 0.03, 1e-6));
        REQUIRE_THAT(p.contrastHigh, WithinAbs(243.0 / 255.0 + 0.03, 1e-6));
        REQUIRE_THAT(p.verticalReduction, WithinAbs(0.575, 1e-5));
        const float tRange = 231.0f / 255.0f - 0.5f;
        REQUIRE_THAT(p.dofStart, WithinAbs(0.6 - tRange * 0.2, 1e-5));
        REQUIRE_THAT(p.dofStrength, WithinAbs(0.4 + tRange * 0.2, 1e-5));
        REQUIRE(p.pomSteps == 16);
        REQUIRE_THAT(p.overscanPadding, WithinAbs(0.065, 1e-6));
    }

    SECTION("focus derivation") {
        DerivedFocusParams f = deriveFocusParams(profile);
        REQUIRE_THAT(f.autoFocusDepth, WithinAbs(127.0 / 255.0, 1e-6));
        REQUIRE_THAT(f.focusRange, WithinAbs(0.10, 1e-6));    // iqr * 0.25 = 0.125 clamps
        REQUIRE_THAT(f.depthScale, WithinAbs(30.0, 1e-6));    // 25 / 0.906 = 27.6 clamps
    }
}

TEST_CASE("Vertical bias compares top and bottom halves", "[analysis]") {
    std::vector<uint8_t> frame = {200, 200, 100, 100};
    DepthProfile profile = analyzeDepthFrame(frame.data(), 2, 2);
    REQUIRE_THAT(profile.verticalBias, WithinAbs(100.0 / 255.0, 1e-6));
}

TEST_CASE("Frame sampling picks quarter points", "[analysis]") {
    // Sampled indices for 9 frames: 0, 2, 4, 6, 8
    std::vector<std::vector<uint8_t>> frames;
    for (int i = 0; i < 9; ++i) {
        frames.push_back(std::vector<uint8_t>(4, i % 2 == 0 ? 0 : 255));
    }
    DepthProfile profile = analyzeDepthFrames(frames, 2, 2);
    REQUIRE(profile.mean == 0.0f);
    REQUIRE(profile.p95 == 0.0f);
}

TEST_CASE("Empty input gives a zero profile", "[analysis]") {
    DepthProfile profile = analyzeDepthFrames({}, 4, 4);
    REQUIRE(profile.mean == 0.0f);
    REQUIRE(profile.effectiveRange == 0.0f);
    REQUIRE(analyzeDepthFrame(nullptr, 4, 4).median == 0.0f);
}

TEST_CASE("Bimodality score", "[analysis][bimodality]") {
    SECTION("two separated clusters score 1") {
        std::vector<uint8_t> frame = twoClusterFrame(50, 200);
        DepthProfile profile = analyzeDepthFrame(frame.data(), static_cast<int>(frame.size()), 1);
        REQUIRE_THAT(profile.bimodality, WithinAbs(1.0, 1e-6));
    }

    SECTION("clusters closer than 25 bins count as one") {
        std::vector<uint8_t> frame = twoClusterFrame(100, 115);
        DepthProfile profile = analyzeDepthFrame(frame.data(), static_cast<int>(frame.size()), 1);
        REQUIRE(profile.bimodality == 0.0f);
    }

    SECTION("single cluster") {
        std::array<float, 256> histogram{};
        histogram[100] = 0.5f;
        histogram[99] = 0.25f;
        histogram[101] = 0.25f;
        REQUIRE(computeBimodality(histogram) == 0.0f);
    }

    SECTION("filled valley lowers the score") {
        std::array<float, 256> histogram{};
        for (int i = 0; i < 256; ++i) histogram[static_cast<size_t>(i)] = 0.001f;
        for (int k = -4; k <= 4; ++k) {
            const float w = static_cast<float>(5 - (k < 0 ? -k : k)) * 0.02f;
            histogram[static_cast<size_t>(60 + k)] += w;
            histogram[static_cast<size_t>(190 + k)] += w;
        }
        const float score = computeBimodality(histogram);
        REQUIRE(score > 0.8f);
        REQUIRE(score < 1.0f);
    }
}
