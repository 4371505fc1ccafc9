/**
 * @file test_jump_flood.cpp
 * @brief Jump-flood schedule and distance field against a brute-force reference
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <layershift/jump_flood.h>
#include <algorithm>
#include <cmath>
#include <limits>

using namespace layershift;
using Catch::Matchers::WithinAbs;

namespace {

std::vector<uint8_t> ellipseMask(int width, int height) {
    std::vector<uint8_t> mask(static_cast<size_t>(width) * height, 0);
    const double cx = width * 0.5, cy = height * 0.5;
    const double rx = width * 0.35, ry = height * 0.35;
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            const double nx = (x + 0.5 - cx) / rx;
            const double ny = (y + 0.5 - cy) / ry;
            if (nx * nx + ny * ny <= 1.0) mask[static_cast<size_t>(y * width + x)] = 255;
        }
    }
    return mask;
}

float bruteForceDistance(const std::vector<JumpFloodField::Seed>& seeds, int width, int x, int y) {
    float best = std::numeric_limits<float>::max();
    for (size_t i = 0; i < seeds.size(); ++i) {
        if (!seeds[i].valid()) continue;
        const float sx = static_cast<float>(i % static_cast<size_t>(width));
        const float sy = static_cast<float>(i / static_cast<size_t>(width));
        best = std::min(best, std::hypot(sx - x, sy - y));
    }
    return best;
}

} // namespace

TEST_CASE("Jump flood step schedule", "[jfa]") {
    REQUIRE(jumpFloodSteps(512, 512) == std::vector<int>{256, 128, 64, 32, 16, 8, 4, 2, 1});
    REQUIRE(jumpFloodSteps(37, 23) == std::vector<int>{32, 16, 8, 4, 2, 1});
    REQUIRE(jumpFloodSteps(2, 1) == std::vector<int>{1});
    REQUIRE(jumpFloodSteps(1, 1).empty());

    SECTION("pass count is ceil(log2(maxDim))") {
        const int dim = GENERATE(3, 17, 100, 257, 1000);
        const auto steps = jumpFloodSteps(dim, 1);
        REQUIRE(static_cast<int>(steps.size()) == static_cast<int>(std::ceil(std::log2(dim))));
        // Total reach covers the grid
        int reach = 0;
        for (int s : steps) reach += s;
        REQUIRE(reach >= dim - 1);
    }
}

TEST_CASE("Jump flood resolution", "[jfa]") {
    REQUIRE(jumpFloodResolution(1920, 4) == 480);
    REQUIRE(jumpFloodResolution(1000, 3) == 333);
    REQUIRE(jumpFloodResolution(3, 8) == 1);
    REQUIRE(jumpFloodResolution(200, 0) == 200);
}

TEST_CASE("Seed extraction marks the silhouette", "[jfa]") {
    // 5x5 with a 3x3 inside block
    std::vector<uint8_t> mask(25, 0);
    for (int y = 1; y <= 3; ++y) {
        for (int x = 1; x <= 3; ++x) mask[y * 5 + x] = 255;
    }
    auto seeds = JumpFloodField::extractSeeds(mask.data(), 5, 5);

    REQUIRE(seeds[1 * 5 + 1].valid());      // inside, on the boundary
    REQUIRE_FALSE(seeds[2 * 5 + 2].valid()); // interior
    REQUIRE(seeds[0 * 5 + 1].valid());      // outside, touching the block
    REQUIRE_FALSE(seeds[0].valid());        // diagonal neighbours do not count
}

TEST_CASE("Jump flood matches brute force on non-power-of-two grids", "[jfa]") {
    const auto dims = GENERATE(std::make_pair(37, 23), std::make_pair(13, 40), std::make_pair(64, 64));
    const int width = dims.first;
    const int height = dims.second;

    std::vector<uint8_t> mask = ellipseMask(width, height);
    const auto initialSeeds = JumpFloodField::extractSeeds(mask.data(), width, height);

    JumpFloodField field;
    field.compute(mask.data(), width, height);

    float worst = 0.0f;
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            const float expected = bruteForceDistance(initialSeeds, width, x, y);
            const float actual = field.distanceAt(x, y);
            REQUIRE(actual >= 0.0f);
            // Every stored seed is a real seed, so the flood can only overshoot
            REQUIRE(actual >= expected - 1e-4f);
            worst = std::max(worst, actual - expected);
        }
    }
    // Plain JFA can pick a near-optimal seed, never one a texel or more worse
    REQUIRE(worst <= 1.0f);
}

TEST_CASE("Filled square matches the analytic edge distance", "[jfa]") {
    // Square covers [4, 28] on a 33x33 grid
    constexpr int size = 33;
    constexpr int lo = 4;
    constexpr int hi = 28;
    constexpr float range = 0.5f;

    std::vector<uint8_t> mask(size * size, 0);
    for (int y = lo; y <= hi; ++y) {
        for (int x = lo; x <= hi; ++x) mask[y * size + x] = 255;
    }
    JumpFloodField field;
    field.compute(mask.data(), size, size);
    const std::vector<float> dist = field.normalizedDistance(range);

    for (int y = lo; y <= hi; ++y) {
        for (int x = lo; x <= hi; ++x) {
            const float analytic = static_cast<float>(std::min({x - lo, hi - x, y - lo, hi - y}));
            REQUIRE(std::abs(field.distanceAt(x, y) - analytic) <= 1.0f);

            const float expected = std::clamp(analytic / size / range, 0.0f, 1.0f);
            const float oneTexel = 1.0f / size / range;
            REQUIRE(std::abs(dist[y * size + x] - expected) <= oneTexel + 1e-5f);
        }
    }
    // Outside texels read zero
    REQUIRE(dist[0] == 0.0f);
    REQUIRE(dist[(hi + 1) * size + hi + 1] == 0.0f);
}

TEST_CASE("Normalized distance image", "[jfa]") {
    std::vector<uint8_t> mask(9 * 9, 0);
    for (int y = 1; y <= 7; ++y) {
        for (int x = 1; x <= 7; ++x) mask[y * 9 + x] = 255;
    }
    JumpFloodField field;
    field.compute(mask.data(), 9, 9);
    std::vector<float> dist = field.normalizedDistance(0.5f);

    REQUIRE(dist[0] == 0.0f);                            // outside
    REQUIRE(dist[1 * 9 + 1] == 0.0f);                    // on the silhouette
    // Centre is 3 texels from the boundary ring: (3 / 9) / 0.5
    REQUIRE_THAT(dist[4 * 9 + 4], WithinAbs(3.0 / 9.0 / 0.5, 1e-5));

    SECTION("solid mask without seeds reads as fully inside") {
        std::vector<uint8_t> solid(16, 255);
        JumpFloodField full;
        full.compute(solid.data(), 4, 4);
        for (float v : full.normalizedDistance(0.1f)) REQUIRE(v == 1.0f);
    }
}
