#pragma once

/**
 * @file jump_flood.h
 * @brief Jump-flood distance field (CPU reference for the portal passes)
 *
 * Works in texel space: seeds hold integer texel coordinates and distances
 * are Euclidean in texels, so non-square grids stay isotropic. The GPU
 * passes in both backends run the same three stages (seed, flood, distance)
 * with the same step schedule.
 */

#include <cstdint>
#include <vector>

namespace layershift {

/**
 * @brief Flood step sizes, largest first
 *
 * Starts at half the next power of two of max(width, height) and halves
 * down to 1: exactly ceil(log2(maxDim)) passes, whose total reach
 * (2^k - 1) covers every texel distance on the grid.
 */
std::vector<int> jumpFloodSteps(int width, int height);

/// @brief Distance field resolution for a canvas size and tier divisor
int jumpFloodResolution(int canvasSize, int divisor);

class JumpFloodField {
public:
    struct Seed {
        float x = -1.0f;
        float y = -1.0f;
        bool valid() const { return x >= 0.0f; }
    };

    /**
     * @brief Run seed extraction and the full flood schedule
     * @param mask Binary mask, values >= 128 are inside
     */
    void compute(const uint8_t* mask, int width, int height);

    /// @brief Texels on the silhouette boundary (inside differs from a 4-neighbour)
    static std::vector<Seed> extractSeeds(const uint8_t* mask, int width, int height);

    /// @brief One flood pass at the given step
    static void floodPass(const std::vector<Seed>& src, std::vector<Seed>& dst,
                          int width, int height, int step);

    const std::vector<Seed>& seeds() const { return m_seeds; }
    int width() const { return m_width; }
    int height() const { return m_height; }

    /// @brief Texel distance to the stored seed, negative when none
    float distanceAt(int x, int y) const;

    /**
     * @brief Normalised distance image as written by the distance pass
     *
     * Outside the mask = 0, inside without a seed = 1, otherwise
     * clamp((distance / maxDim) / max(range, 0.001), 0, 1).
     */
    std::vector<float> normalizedDistance(float range) const;

private:
    std::vector<uint8_t> m_mask;
    std::vector<Seed> m_seeds;
    int m_width = 0;
    int m_height = 0;
};

} // namespace layershift
