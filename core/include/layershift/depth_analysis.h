#pragma once

/**
 * @file depth_analysis.h
 * @brief Depth statistics and the effect defaults derived from them
 *
 * A single scan over a handful of sampled frames produces a DepthProfile.
 * The derive* functions turn that profile into parameter suggestions that
 * sit between explicit configuration and the built-in defaults.
 */

#include <array>
#include <cstdint>
#include <vector>

namespace layershift {

struct DepthProfile {
    float mean = 0.0f;
    float stdDev = 0.0f;
    float p5 = 0.0f;
    float p25 = 0.0f;
    float median = 0.0f;
    float p75 = 0.0f;
    float p95 = 0.0f;
    float effectiveRange = 0.0f;  ///< p95 - p5
    float iqr = 0.0f;             ///< p75 - p25
    float bimodality = 0.0f;      ///< 0 = unimodal, 1 = two well-separated peaks
    float verticalBias = 0.0f;    ///< mean(top half) - mean(bottom half)
    std::array<float, 256> histogram{};
};

struct DerivedParallaxParams {
    float parallaxStrength = 0.05f;
    float contrastLow = 0.05f;
    float contrastHigh = 0.95f;
    float verticalReduction = 0.5f;
    float dofStart = 0.6f;
    float dofStrength = 0.4f;
    int pomSteps = 16;
    float overscanPadding = 0.08f;
};

struct DerivedFocusParams {
    float autoFocusDepth = 0.5f;
    float focusRange = 0.05f;
    float depthScale = 50.0f;
};

/**
 * @brief Histogram statistics over up to five evenly spaced frames
 *
 * Frames 0, n/4, n/2, 3n/4 and n-1 are sampled (duplicates removed).
 * An empty input yields an all-zero profile.
 */
DepthProfile analyzeDepthFrames(const std::vector<std::vector<uint8_t>>& frames, int width, int height);

/// @brief Same analysis for a single frame (estimated depth)
DepthProfile analyzeDepthFrame(const uint8_t* frame, int width, int height);

/// @brief Calibrated defaults for flat or low-variance depth, else a fit to the profile
DerivedParallaxParams deriveParallaxParams(const DepthProfile& profile);

DerivedFocusParams deriveFocusParams(const DepthProfile& profile);

/// @brief Smoothed-histogram peak analysis; exposed for tests
float computeBimodality(const std::array<float, 256>& histogram);

} // namespace layershift
