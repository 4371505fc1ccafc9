/**
 * @file test_poisson_disk.cpp
 * @brief Blur kernel generation
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <layershift/poisson_disk.h>

using namespace layershift;

TEST_CASE("Poisson disk kernels", "[poisson]") {
    const int count = GENERATE(8, 16, 32, 64);
    std::vector<glm::vec2> points = generatePoissonDisk(count, 7u);

    REQUIRE(static_cast<int>(points.size()) == count);
    REQUIRE(points[0] == glm::vec2(0.0f, 0.0f));

    for (const glm::vec2& p : points) {
        REQUIRE(glm::dot(p, p) <= 1.0f);
    }

    SECTION("no two points coincide") {
        for (size_t i = 0; i < points.size(); ++i) {
            for (size_t j = i + 1; j < points.size(); ++j) {
                glm::vec2 d = points[i] - points[j];
                REQUIRE(glm::dot(d, d) > 0.0f);
            }
        }
    }

    SECTION("same seed, same kernel") {
        REQUIRE(generatePoissonDisk(count, 7u) == points);
    }
}

TEST_CASE("Poisson disk seeds and clamping", "[poisson]") {
    REQUIRE(generatePoissonDisk(16, 1u) != generatePoissonDisk(16, 2u));
    REQUIRE(generatePoissonDisk(0).size() == 1);
    REQUIRE(generatePoissonDisk(500).size() == static_cast<size_t>(MAX_POISSON_SAMPLES));
}
