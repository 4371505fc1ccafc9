// Layershift - Rack focus spring and input state machine

#include <layershift/focus_controller.h>
#include <algorithm>
#include <cmath>

namespace layershift {

std::optional<FocusMode> parseFocusMode(const std::string& name) {
    if (name == "auto") return FocusMode::Auto;
    if (name == "pointer") return FocusMode::Pointer;
    if (name == "scroll") return FocusMode::Scroll;
    if (name == "programmatic") return FocusMode::Programmatic;
    return std::nullopt;
}

const char* focusModeName(FocusMode mode) {
    switch (mode) {
        case FocusMode::Auto: return "auto";
        case FocusMode::Pointer: return "pointer";
        case FocusMode::Scroll: return "scroll";
        case FocusMode::Programmatic: return "programmatic";
    }
    return "auto";
}

// -----------------------------------------------------------------------------
// CriticallyDampedSpring
// -----------------------------------------------------------------------------

CriticallyDampedSpring::CriticallyDampedSpring(float initial)
    : m_position(std::clamp(initial, 0.0f, 1.0f))
    , m_target(m_position) {
}

bool CriticallyDampedSpring::settled() const {
    return std::abs(m_position - m_target) < SETTLE_THRESHOLD &&
           std::abs(m_velocity) < SETTLE_THRESHOLD;
}

float CriticallyDampedSpring::progress() const {
    if (settled()) return 0.0f;
    return 1.0f - std::min(1.0f, std::abs(m_position - m_target) * 5.0f);
}

void CriticallyDampedSpring::setTarget(float target) {
    m_target = std::clamp(target, 0.0f, 1.0f);
}

void CriticallyDampedSpring::tick(float dtSeconds, float durationMs) {
    if (settled()) {
        m_position = m_target;
        m_velocity = 0.0f;
        return;
    }

    const float omega = 4000.0f / std::max(durationMs, 1.0f);
    const float dt = std::min(dtSeconds, MAX_STEP_SECONDS);

    // Closed-form step of x'' = -w^2 x - 2w x', stable for any dt
    const float x0 = m_position - m_target;
    const float c = m_velocity + omega * x0;
    const float decay = std::exp(-omega * dt);
    m_position = m_target + (x0 + c * dt) * decay;
    m_velocity = (m_velocity - omega * c * dt) * decay;

    if (settled()) {
        m_position = m_target;
        m_velocity = 0.0f;
    }
}

void CriticallyDampedSpring::snapTo(float value) {
    m_position = std::clamp(value, 0.0f, 1.0f);
    m_target = m_position;
    m_velocity = 0.0f;
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------

float computeTransitionDuration(float fromDepth, float toDepth, float baseMs) {
    const float scaled = baseMs * std::max(std::abs(toDepth - fromDepth), 0.2f);
    return std::clamp(scaled, 60.0f, 500.0f);
}

float sampleDepthAtUV(const uint8_t* depth, int width, int height, float u, float v) {
    if (!depth || width <= 0 || height <= 0) return 0.0f;

    u = std::clamp(u, 0.05f, 0.95f);
    v = std::clamp(v, 0.05f, 0.95f);
    const int px = static_cast<int>(std::lround(u * static_cast<float>(width - 1)));
    const int py = static_cast<int>(std::lround(v * static_cast<float>(height - 1)));

    int sum = 0;
    for (int dy = -1; dy <= 1; ++dy) {
        for (int dx = -1; dx <= 1; ++dx) {
            const int sx = std::clamp(px + dx, 0, width - 1);
            const int sy = std::clamp(py + dy, 0, height - 1);
            sum += depth[sy * width + sx];
        }
    }
    return (static_cast<float>(sum) / 9.0f) / 255.0f;
}

// -----------------------------------------------------------------------------
// FocusController
// -----------------------------------------------------------------------------

FocusController::FocusController(const FocusInputConfig& config)
    : m_config(config)
    , m_spring(config.autoFocusDepth)
    , m_transitionDuration(config.transitionSpeed) {
}

void FocusController::setDepthData(const uint8_t* data, int width, int height) {
    m_depth = data;
    m_depthWidth = width;
    m_depthHeight = height;
}

FocusState FocusController::update(double nowMs) {
    const float dt = m_lastTimeMs ? static_cast<float>((nowMs - *m_lastTimeMs) / 1000.0) : 0.016f;
    m_lastTimeMs = nowMs;

    m_spring.tick(dt, m_transitionDuration);

    FocusState state;
    state.focalDepth = m_spring.value();
    state.transitioning = !m_spring.settled();
    state.transitionProgress = m_spring.progress();

    // Peaks midway through a rack, zero at both ends
    const float p = state.transitionProgress;
    state.breathScale = 1.0f + p * (1.0f - p) * m_config.breathAmount * 4.0f;
    state.breathOffset = glm::vec2((state.breathScale - 1.0f) * 0.5f);

    if (!m_wasSettled && !state.transitioning && m_onSettled) {
        m_onSettled(state.focalDepth);
    }
    m_wasSettled = !state.transitioning;
    return state;
}

void FocusController::retarget(float depth, float durationMs, const char* source) {
    m_transitionDuration = durationMs;
    m_spring.setTarget(depth);
    if (!m_spring.settled()) m_wasSettled = false;

    if (m_onChange) {
        FocusChange change;
        change.targetDepth = m_spring.target();
        change.transitionDurationMs = durationMs;
        change.source = source;
        m_onChange(change);
    }
}

void FocusController::setFocusDepth(float depth, std::optional<float> durationMs) {
    const float to = std::clamp(depth, 0.0f, 1.0f);
    const float duration = durationMs.value_or(
        computeTransitionDuration(m_spring.value(), to, m_config.transitionSpeed));
    retarget(to, duration, "api");
}

void FocusController::setFocusDepthInstant(float depth) {
    m_spring.snapTo(depth);
}

void FocusController::resetFocus() {
    m_locked = false;
    m_lastPointerTarget = -1.0f;
    const float to = m_config.autoFocusDepth;
    retarget(to, computeTransitionDuration(m_spring.value(), to, m_config.transitionSpeed), "reset");
}

std::optional<float> FocusController::sampleAt(float x, float y, float viewWidth, float viewHeight) const {
    if (!m_depth || viewWidth <= 0.0f || viewHeight <= 0.0f) return std::nullopt;
    return sampleDepthAtUV(m_depth, m_depthWidth, m_depthHeight, x / viewWidth, y / viewHeight);
}

bool FocusController::acceptsPointer() const {
    return m_config.mode == FocusMode::Auto || m_config.mode == FocusMode::Pointer;
}

void FocusController::pointerMove(float x, float y, float viewWidth, float viewHeight) {
    if (!acceptsPointer() || m_locked) return;

    const std::optional<float> depth = sampleAt(x, y, viewWidth, viewHeight);
    if (!depth) return;

    if (m_lastPointerTarget >= 0.0f && std::abs(*depth - m_lastPointerTarget) < FOCUS_POINTER_HYSTERESIS) {
        return;
    }
    m_lastPointerTarget = *depth;
    retarget(*depth, computeTransitionDuration(m_spring.value(), *depth, m_config.transitionSpeed), "pointer");
}

void FocusController::pointerLeave() {
    if (!acceptsPointer() || m_locked) return;

    m_lastPointerTarget = -1.0f;
    if (m_config.mode == FocusMode::Auto) {
        const float to = m_config.autoFocusDepth;
        const float duration = std::max(
            computeTransitionDuration(m_spring.value(), to, m_config.transitionSpeed),
            FOCUS_EXIT_MIN_DURATION_MS);
        retarget(to, duration, "leave");
    }
}

void FocusController::click(float x, float y, float viewWidth, float viewHeight, double nowMs) {
    if (!acceptsPointer()) return;

    const std::optional<float> depth = sampleAt(x, y, viewWidth, viewHeight);
    if (!depth) return;

    if (m_locked) {
        if (nowMs - m_lockedAtMs < FOCUS_LOCK_MIN_DURATION_MS) return;

        if (std::abs(*depth - m_lastPointerTarget) < FOCUS_UNLOCK_TOLERANCE) {
            m_locked = false;
            m_lastPointerTarget = -1.0f;
            return;
        }
    }

    m_locked = true;
    m_lockedAtMs = nowMs;
    m_lastPointerTarget = *depth;
    retarget(*depth, computeTransitionDuration(m_spring.value(), *depth, m_config.transitionSpeed), "click");
}

void FocusController::touchStart(float x, float y, float viewWidth, float viewHeight) {
    if (!acceptsPointer()) return;

    const std::optional<float> depth = sampleAt(x, y, viewWidth, viewHeight);
    if (!depth) return;

    m_locked = true;
    retarget(*depth, computeTransitionDuration(m_spring.value(), *depth, m_config.transitionSpeed), "touch");
}

void FocusController::touchMove(float x, float y, float viewWidth, float viewHeight) {
    if (!acceptsPointer()) return;

    const std::optional<float> depth = sampleAt(x, y, viewWidth, viewHeight);
    if (!depth) return;

    retarget(*depth, computeTransitionDuration(m_spring.value(), *depth, m_config.transitionSpeed), "touch");
}

void FocusController::scroll(float elementCenterY, float viewportHeight) {
    if (m_config.mode != FocusMode::Scroll || viewportHeight <= 0.0f) return;

    // Center at the bottom of the viewport focuses far, at the top focuses near
    const float progress = std::clamp(1.0f - elementCenterY / viewportHeight, 0.0f, 1.0f);
    const float depth = 1.0f - progress;
    retarget(depth, computeTransitionDuration(m_spring.value(), depth, m_config.transitionSpeed), "scroll");
}

} // namespace layershift
