#pragma once

/**
 * @file quality.h
 * @brief Runtime performance tiers and the per-tier render parameters
 *
 * Every effect pipeline reads sample counts and buffer resolutions from a
 * QualityParams instance. The tier is either forced by configuration or
 * scored from a DeviceCapabilities probe.
 */

#include <cstdint>
#include <optional>
#include <string>

namespace layershift {

enum class QualityTier {
    High,
    Medium,
    Low
};

/// @brief Per-tier render parameters (immutable once resolved)
struct QualityParams {
    QualityTier tier = QualityTier::High;
    float dprCap = 2.0f;          ///< Max device pixel ratio for drawing buffers
    int depthMaxDim = 512;        ///< Max depth texture side
    int pomSteps = 16;            ///< Parallax occlusion march steps
    int bilateralRadius = 2;      ///< Depth filter kernel radius (texels)
    int jfaDivisor = 2;           ///< Distance field resolution divisor
    int poissonSamples = 48;      ///< Rack focus blur taps
    int dofDivisor = 1;           ///< Rack focus blur resolution divisor
};

/// @brief Inputs gathered from the GPU adapter and the host machine
struct DeviceCapabilities {
    std::string renderer;        ///< Adapter/renderer description (any case)
    int maxTextureSize = 0;      ///< 0 when unknown
    int hardwareConcurrency = 0; ///< 0 when unknown
    float deviceMemoryGB = 0.0f; ///< 0 when unknown
    bool isMobile = false;
};

QualityParams paramsForTier(QualityTier tier);

/**
 * @brief Score a device into a tier
 *
 * Known low-end renderers (software rasterizers, older integrated parts) are
 * penalised, known discrete/modern parts rewarded, and the texture limit,
 * core count and memory nudge the score either way.
 */
QualityTier classifyDevice(const DeviceCapabilities& caps);

/// @brief Resolve the effective params; an explicit tier skips probing entirely
QualityParams resolveQuality(const std::optional<QualityTier>& explicitTier,
                             const DeviceCapabilities& caps);

/// @brief Parse "high" / "medium" / "low"; "auto" and unknown strings yield nullopt
std::optional<QualityTier> parseQualityTier(const std::string& name);

const char* qualityTierName(QualityTier tier);

} // namespace layershift
