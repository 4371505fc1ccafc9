// Layershift - Parallax input smoothing

#include <layershift/parallax_input.h>
#include <algorithm>

namespace layershift {

ParallaxInput::ParallaxInput(float motionLerpFactor)
    : m_lerp(std::clamp(motionLerpFactor, 0.0f, 1.0f)) {
}

void ParallaxInput::pointerMove(float x, float y, float viewWidth, float viewHeight) {
    if (viewWidth <= 0.0f || viewHeight <= 0.0f) return;
    m_pointerTarget.x = std::clamp(x / viewWidth * 2.0f - 1.0f, -1.0f, 1.0f);
    m_pointerTarget.y = std::clamp(y / viewHeight * 2.0f - 1.0f, -1.0f, 1.0f);
}

void ParallaxInput::pointerLeave() {
    m_pointerTarget = glm::vec2(0.0f);
}

void ParallaxInput::orientation(float betaDeg, float gammaDeg) {
    const glm::vec2 raw(std::clamp(gammaDeg / 45.0f, -1.0f, 1.0f),
                        std::clamp(betaDeg / 45.0f, -1.0f, 1.0f));
    // Gyro readings are noisy, so the target itself is smoothed too
    m_motionTarget = glm::mix(m_motionTarget, raw, m_lerp);
    m_usingMotion = true;
}

glm::vec2 ParallaxInput::update() {
    const glm::vec2 target = m_usingMotion ? m_motionTarget : m_pointerTarget;
    m_output = glm::mix(m_output, target, m_lerp);
    return m_output;
}

void ParallaxInput::reset() {
    m_pointerTarget = glm::vec2(0.0f);
    m_motionTarget = glm::vec2(0.0f);
    m_output = glm::vec2(0.0f);
}

} // namespace layershift
