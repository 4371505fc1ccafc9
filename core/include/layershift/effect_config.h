#pragma once

/**
 * @file effect_config.h
 * @brief User-facing effect configuration and parameter resolution
 *
 * Every value resolves as explicit config, then the value derived from
 * depth analysis (where the effect derives one), then the built-in default.
 * Explicit values are std::optional so "not set" stays distinct from
 * "set to the default".
 *
 * @par JSON layout
 * @code
 * {
 *   "effect": "portal",            // "parallax" | "rack-focus" | "portal"
 *   "quality": "auto",             // "auto" | "high" | "medium" | "low"
 *   "backend": "auto",             // "auto" | "webgpu" | "opengl" ("webgl2" accepted)
 *   "autoplay": true, "loop": true,
 *   "parallax":  { "parallaxX": 0.4, "parallaxMax": 30, ... },
 *   "rackFocus": { "focusMode": "pointer", "aperture": 1.2, ... },
 *   "portal":    { "rimColor": "#ffffff", "lightDirection": [-0.5, 0.7, -0.3], ... }
 * }
 * @endcode
 */

#include <layershift/depth_analysis.h>
#include <layershift/focus_controller.h>
#include <layershift/quality.h>
#include <glm/glm.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace layershift {

enum class EffectKind {
    Parallax,
    RackFocus,
    Portal
};

enum class BackendPreference {
    Auto,
    WebGPU,
    OpenGL
};

std::optional<EffectKind> parseEffectKind(const std::string& name);
const char* effectKindName(EffectKind kind);

/// @brief "webgl2" is accepted as an alias for "opengl"
std::optional<BackendPreference> parseBackendPreference(const std::string& name);
const char* backendPreferenceName(BackendPreference pref);

/// @brief "#rgb" or "#rrggbb" (the '#' is optional); anything else is black
glm::vec3 parseHexColor(const std::string& text);

/// @brief First non-empty of explicit, derived; otherwise the fallback
template<typename T>
T resolveParam(const std::optional<T>& explicitValue, const std::optional<T>& derived, const T& fallback) {
    if (explicitValue) return *explicitValue;
    if (derived) return *derived;
    return fallback;
}

// -----------------------------------------------------------------------------
// Parallax
// -----------------------------------------------------------------------------

struct ParallaxOptions {
    std::optional<float> parallaxX;     ///< horizontal input multiplier
    std::optional<float> parallaxY;     ///< vertical input multiplier
    std::optional<float> parallaxMax;   ///< max displacement in source pixels
    std::optional<float> overscan;
    std::optional<bool> pomEnabled;
    std::optional<int> pomSteps;
    std::optional<float> motionLerp;
};

struct ParallaxSettings {
    float parallaxX = 0.4f;
    float parallaxY = 1.0f;
    float strength = 0.05f;             ///< displacement in UV units
    float overscan = 0.08f;
    bool pomEnabled = true;
    int pomSteps = 16;
    float contrastLow = 0.05f;
    float contrastHigh = 0.95f;
    float verticalReduction = 0.5f;
    float dofStart = 0.6f;
    float dofStrength = 0.4f;
    float motionLerp = 0.1f;
};

/**
 * @brief Combine options with depth-derived values
 * @param sourceWidth Used to turn parallaxMax pixels into UV strength
 */
ParallaxSettings resolveParallaxSettings(const ParallaxOptions& options,
                                         const DerivedParallaxParams& derived,
                                         int sourceWidth);

// -----------------------------------------------------------------------------
// Rack focus
// -----------------------------------------------------------------------------

struct RackFocusOptions {
    std::optional<FocusMode> focusMode;
    std::optional<float> focusDepth;
    std::optional<float> focusRange;
    std::optional<float> transitionSpeed;
    std::optional<float> aperture;
    std::optional<float> maxBlur;
    std::optional<float> depthScale;
    std::optional<bool> highlightBloom;
    std::optional<float> highlightThreshold;
    std::optional<float> highlightBoost;
    std::optional<float> focusBreathing;
    std::optional<float> vignette;
};

struct RackFocusSettings {
    FocusMode focusMode = FocusMode::Auto;
    float autoFocusDepth = 0.5f;
    float focusRange = 0.05f;
    float transitionSpeed = 300.0f;
    float aperture = 1.0f;
    float maxBlur = 24.0f;
    float depthScale = 50.0f;
    bool highlightBloom = true;
    float highlightThreshold = 0.85f;
    float highlightBoost = 2.0f;
    float focusBreathing = 0.015f;
    float vignette = 0.15f;
};

RackFocusSettings resolveRackFocusSettings(const RackFocusOptions& options,
                                           const DerivedFocusParams& derived);

/// @brief Controller configuration for resolved settings
FocusInputConfig focusInputConfig(const RackFocusSettings& settings);

// -----------------------------------------------------------------------------
// Portal
// -----------------------------------------------------------------------------

/// Portal values have no derived tier, so the struct carries the defaults directly
struct PortalSettings {
    float parallaxX = 0.4f;
    float parallaxY = 0.8f;
    float parallaxMax = 30.0f;
    float overscan = 0.06f;
    int pomSteps = 16;

    // Boundary rim
    float rimIntensity = 0.6f;
    glm::vec3 rimColor{1.0f, 1.0f, 1.0f};
    float rimWidth = 0.025f;
    float refractionStrength = 0.015f;
    float chromaticStrength = 0.008f;
    float occlusionIntensity = 0.4f;

    // Lens transform
    float depthPower = 0.7f;
    float depthScale = 1.2f;
    float depthBias = -0.05f;

    // Interior mood
    float fogDensity = 0.15f;
    glm::vec3 fogColor = parseHexColor("#1a1a2e");
    float colorShift = 0.6f;
    float brightnessBias = 0.05f;

    // Depth adaptive
    float contrastLow = 0.02f;
    float contrastHigh = 0.98f;
    float verticalReduction = 0.5f;
    float dofStart = 0.5f;
    float dofStrength = 0.5f;

    // Bevel
    float bevelIntensity = 0.5f;
    float bevelWidth = 0.04f;
    float bevelDarkening = 0.2f;
    float bevelDesaturation = 0.12f;
    float bevelLightAngle = 135.0f;

    // Edge wall
    float edgeThickness = 0.01f;
    float edgeSpecular = 0.35f;
    glm::vec3 edgeColor = parseHexColor("#a0a0a0");

    // Chamfer
    float chamferWidth = 0.025f;
    float chamferAngle = 45.0f;
    glm::vec3 chamferColor = parseHexColor("#262630");
    float chamferAmbient = 0.12f;
    float chamferSpecular = 0.3f;
    float chamferShininess = 24.0f;

    // Emissive interior edge occlusion
    float edgeOcclusionWidth = 0.03f;
    float edgeOcclusionStrength = 0.2f;

    glm::vec3 lightDirection{-0.5f, 0.7f, -0.3f};

    float motionLerp = 0.1f;

    /// @brief parallaxMax pixels as UV strength for a source width
    float strengthFor(int sourceWidth) const;

    /// @brief Distance range the jump-flood field normalizes against
    float distanceFieldRange() const;
};

// -----------------------------------------------------------------------------
// Whole configuration
// -----------------------------------------------------------------------------

struct EffectConfig {
    EffectKind effect = EffectKind::Parallax;
    std::optional<QualityTier> quality;         ///< nullopt = detect
    BackendPreference backend = BackendPreference::Auto;
    bool autoplay = true;
    bool loop = true;

    ParallaxOptions parallax;
    RackFocusOptions rackFocus;
    PortalSettings portal;
};

/**
 * @brief Parse a configuration document
 *
 * Missing keys keep their defaults. Present keys must have the right type.
 *
 * @throws std::invalid_argument on malformed JSON, wrong value types or
 *         unknown enum names
 */
EffectConfig parseEffectConfig(const std::string& jsonText);

/// @brief Read and parse a configuration file
EffectConfig loadEffectConfigFile(const std::filesystem::path& path);

} // namespace layershift
