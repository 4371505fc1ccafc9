#pragma once

/**
 * @file parallax_input.h
 * @brief Smoothed 2D input for the parallax and portal effects
 */

#include <glm/glm.hpp>

namespace layershift {

/// Default per-tick smoothing toward the input target
constexpr float DEFAULT_MOTION_LERP_FACTOR = 0.1f;

class ParallaxInput {
public:
    explicit ParallaxInput(float motionLerpFactor = DEFAULT_MOTION_LERP_FACTOR);

    /// @brief Cursor position in viewport pixels, mapped to [-1, 1]
    void pointerMove(float x, float y, float viewWidth, float viewHeight);

    /// @brief Cursor left the window; the target returns to center
    void pointerLeave();

    /**
     * @brief Device tilt in degrees
     *
     * Gamma drives x and beta drives y, each divided by 45 and clamped.
     * The first reading switches the input over from the pointer.
     */
    void orientation(float betaDeg, float gammaDeg);

    /// @brief Lerp the output toward the active target by one tick
    glm::vec2 update();

    /// @brief Zero the targets and the smoothed output
    void reset();

    glm::vec2 current() const { return m_output; }
    bool usingMotion() const { return m_usingMotion; }
    float lerpFactor() const { return m_lerp; }

private:
    float m_lerp;
    glm::vec2 m_pointerTarget{0.0f};
    glm::vec2 m_motionTarget{0.0f};
    glm::vec2 m_output{0.0f};
    bool m_usingMotion = false;
};

} // namespace layershift
