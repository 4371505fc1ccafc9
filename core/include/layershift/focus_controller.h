#pragma once

/**
 * @file focus_controller.h
 * @brief Rack focus input: pointer, click, scroll and API control of the focal plane
 *
 * Input events only move the spring's target. The focal depth itself
 * changes solely in update(), which the display loop calls once per tick,
 * so renderers always see one consistent FocusState per frame.
 *
 * @par Modes
 * - Auto: pointer tracks depth under the cursor, leaving reverts to autoFocusDepth
 * - Pointer: like Auto, but the last depth holds on leave
 * - Scroll: the element's vertical position in the viewport drives the depth
 * - Programmatic: input events are ignored, only the API moves focus
 */

#include <glm/glm.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace layershift {

enum class FocusMode {
    Auto,
    Pointer,
    Scroll,
    Programmatic
};

/// @brief Parse "auto" | "pointer" | "scroll" | "programmatic"
std::optional<FocusMode> parseFocusMode(const std::string& name);
const char* focusModeName(FocusMode mode);

struct FocusState {
    float focalDepth = 0.5f;
    bool transitioning = false;
    float transitionProgress = 0.0f;    ///< 0 when settled, rises toward 1 near the target
    float breathScale = 1.0f;           ///< UV scale applied while racking
    glm::vec2 breathOffset{0.0f};       ///< keeps the breathing scale centered
};

/// Per-frame focus source for the rack focus renderers
using FocusStateProvider = std::function<FocusState()>;

/// Pointer movement smaller than this keeps the current target
constexpr float FOCUS_POINTER_HYSTERESIS = 0.03f;
/// A lock can't be released sooner than this after it was taken
constexpr double FOCUS_LOCK_MIN_DURATION_MS = 400.0;
/// Clicking within this depth of the locked depth releases the lock
constexpr float FOCUS_UNLOCK_TOLERANCE = 0.08f;
/// Floor for the transition back to autoFocusDepth when the pointer leaves
constexpr float FOCUS_EXIT_MIN_DURATION_MS = 300.0f;

/**
 * @brief Critically damped spring on [0, 1]
 *
 * omega = 4000 / durationMs, so t = 4 / omega lands on durationMs. Each
 * tick advances the exact solution rather than an Euler step, so short
 * durations never overshoot. Steps are capped at 33 ms so a hitch doesn't
 * jump the focus.
 */
class CriticallyDampedSpring {
public:
    static constexpr float SETTLE_THRESHOLD = 0.001f;
    static constexpr float MAX_STEP_SECONDS = 0.033f;

    explicit CriticallyDampedSpring(float initial = 0.5f);

    float value() const { return m_position; }
    float target() const { return m_target; }
    float velocity() const { return m_velocity; }

    bool settled() const;

    /// @brief 0 when settled, otherwise 1 - min(1, |position - target| * 5)
    float progress() const;

    void setTarget(float target);
    void tick(float dtSeconds, float durationMs);
    void snapTo(float value);

private:
    float m_position;
    float m_velocity = 0.0f;
    float m_target;
};

/// @brief clamp(baseMs * max(|to - from|, 0.2), 60, 500)
float computeTransitionDuration(float fromDepth, float toDepth, float baseMs);

/**
 * @brief Mean of the 3x3 neighbourhood around a UV, normalized to [0, 1]
 *
 * The UV is pulled in to [0.05, 0.95] first so edge artifacts in the depth
 * map don't drive focus.
 */
float sampleDepthAtUV(const uint8_t* depth, int width, int height, float u, float v);

struct FocusInputConfig {
    FocusMode mode = FocusMode::Auto;
    float transitionSpeed = 300.0f;     ///< ms for a full near-to-far rack
    float breathAmount = 0.015f;
    float autoFocusDepth = 0.5f;
};

/// Emitted whenever the focus target changes
struct FocusChange {
    float targetDepth = 0.0f;
    float transitionDurationMs = 0.0f;
    std::string source;                 ///< "pointer", "click", "touch", "scroll", "leave", "api" or "reset"
};

class FocusController {
public:
    using ChangeCallback = std::function<void(const FocusChange&)>;
    using SettledCallback = std::function<void(float focalDepth)>;

    explicit FocusController(const FocusInputConfig& config);

    /**
     * @brief Point the controller at the depth map input events sample
     *
     * Non-owning; the buffer must stay valid until the next call. The
     * renderer refreshes it on every depth update.
     */
    void setDepthData(const uint8_t* data, int width, int height);

    /// @brief Advance the spring to nowMs and report the state
    FocusState update(double nowMs);

    /// @name API control
    /// @{
    void setFocusDepth(float depth, std::optional<float> durationMs = std::nullopt);
    void setFocusDepthInstant(float depth);
    void resetFocus();
    /// @}

    /// @name Host input
    /// Coordinates are relative to the effect's viewport, in pixels.
    /// @{
    void pointerMove(float x, float y, float viewWidth, float viewHeight);
    void pointerLeave();
    void click(float x, float y, float viewWidth, float viewHeight, double nowMs);
    void touchStart(float x, float y, float viewWidth, float viewHeight);
    void touchMove(float x, float y, float viewWidth, float viewHeight);
    /// @param elementCenterY Element center relative to the top of the viewport
    void scroll(float elementCenterY, float viewportHeight);
    /// @}

    void onFocusChange(ChangeCallback cb) { m_onChange = std::move(cb); }
    void onFocusSettled(SettledCallback cb) { m_onSettled = std::move(cb); }

    float currentFocalDepth() const { return m_spring.value(); }
    float targetDepth() const { return m_spring.target(); }
    bool isTransitioning() const { return !m_spring.settled(); }
    bool locked() const { return m_locked; }
    const FocusInputConfig& config() const { return m_config; }
    float transitionDurationMs() const { return m_transitionDuration; }

private:
    std::optional<float> sampleAt(float x, float y, float viewWidth, float viewHeight) const;
    bool acceptsPointer() const;
    void retarget(float depth, float durationMs, const char* source);

    FocusInputConfig m_config;
    CriticallyDampedSpring m_spring;
    float m_transitionDuration;

    const uint8_t* m_depth = nullptr;
    int m_depthWidth = 0;
    int m_depthHeight = 0;

    std::optional<double> m_lastTimeMs;
    bool m_locked = false;
    double m_lockedAtMs = 0.0;
    float m_lastPointerTarget = -1.0f;
    bool m_wasSettled = true;

    ChangeCallback m_onChange;
    SettledCallback m_onSettled;
};

} // namespace layershift
