#pragma once

/**
 * @file poisson_disk.h
 * @brief Deterministic blur kernels for the rack focus pass
 */

#include <glm/glm.hpp>
#include <cstdint>
#include <vector>

namespace layershift {

/// Upper bound of the blur kernel uploaded to the GPU
constexpr int MAX_POISSON_SAMPLES = 64;

/**
 * @brief Dart-throwing Poisson disk inside the unit circle
 *
 * The same (count, seed) always yields the same points. The first point is
 * the center. The minimum spacing starts at 0.75 / sqrt(count) and relaxes
 * by 10% whenever a candidate budget runs out, so the call always returns
 * exactly count points. count is clamped to [1, MAX_POISSON_SAMPLES].
 */
std::vector<glm::vec2> generatePoissonDisk(int count, uint32_t seed = 1u);

} // namespace layershift
