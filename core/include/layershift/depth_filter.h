#pragma once

/**
 * @file depth_filter.h
 * @brief CPU depth kernels: bilateral smoothing, resampling and subsampling
 *
 * The bilateral kernel here is the reference for the GPU filter pass; both
 * backends embed the same constants in their shaders.
 */

#include <cstdint>
#include <vector>

namespace layershift {

constexpr float BILATERAL_DEPTH_SIGMA2 = 0.01f;

/// @brief Spatial sigma squared for a kernel radius (2.25 at radius 2, 0.5625 at radius 1)
inline float bilateralSpatialSigma2(int radius) {
    float sigma = static_cast<float>(radius) * 0.75f;
    return sigma * sigma;
}

/**
 * @brief Edge-preserving smoothing of a byte depth map
 *
 * Each output texel is a normalised weighted mean of its (2r+1)^2
 * neighbourhood with weight exp(-d^2/sigmaS^2 - delta^2/sigmaD^2), depth in
 * [0,1]. Neighbours outside the image are skipped rather than clamped.
 */
std::vector<uint8_t> bilateralFilterDepth(const uint8_t* depth, int width, int height, int radius);

/// @brief Bilinear resample with pixel-centre alignment and clamped neighbours
std::vector<float> resizeDepthBilinear(const float* src, int srcW, int srcH, int dstW, int dstH);

struct DepthDimensions {
    int width = 0;
    int height = 0;
};

/// @brief Fit (w, h) inside maxDim preserving aspect; unchanged when it already fits
DepthDimensions clampDepthDimensions(int width, int height, int maxDim);

/**
 * @brief Nearest-neighbour downsampler with a persistent scratch buffer
 *
 * The buffer is allocated when the source or target size changes and reused
 * on every later call, so steady-state depth updates do not allocate.
 */
class DepthSubsampler {
public:
    /**
     * @brief Downsample when the source exceeds maxDim
     * @return Pointer to either the source (already fits) or the scratch buffer
     */
    const uint8_t* apply(const uint8_t* src, int srcW, int srcH, int maxDim);

    int width() const { return m_width; }
    int height() const { return m_height; }

    /// @brief Number of times the scratch buffer has been (re)allocated
    int allocationCount() const { return m_allocations; }

private:
    std::vector<uint8_t> m_scratch;
    int m_width = 0;
    int m_height = 0;
    int m_allocations = 0;
};

} // namespace layershift
