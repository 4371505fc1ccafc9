// Layershift - Poisson disk kernels

#include <layershift/poisson_disk.h>
#include <algorithm>
#include <cmath>
#include <random>

namespace layershift {

std::vector<glm::vec2> generatePoissonDisk(int count, uint32_t seed) {
    count = std::clamp(count, 1, MAX_POISSON_SAMPLES);

    std::vector<glm::vec2> points;
    points.reserve(count);
    points.emplace_back(0.0f, 0.0f);

    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> unit(-1.0f, 1.0f);

    float minDist = 0.75f / std::sqrt(static_cast<float>(count));
    constexpr int CANDIDATES_PER_RELAX = 256;

    while (static_cast<int>(points.size()) < count) {
        bool placed = false;
        for (int attempt = 0; attempt < CANDIDATES_PER_RELAX; ++attempt) {
            glm::vec2 candidate(unit(rng), unit(rng));
            if (glm::dot(candidate, candidate) > 1.0f) continue;

            const float min2 = minDist * minDist;
            bool clear = std::all_of(points.begin(), points.end(), [&](const glm::vec2& p) {
                glm::vec2 d = p - candidate;
                return glm::dot(d, d) >= min2;
            });
            if (clear) {
                points.push_back(candidate);
                placed = true;
                break;
            }
        }
        if (!placed) minDist *= 0.9f;
    }
    return points;
}

} // namespace layershift
