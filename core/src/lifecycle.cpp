// Layershift - Effect lifecycle

#include <layershift/lifecycle.h>
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace layershift {

const char* lifecycleStateName(LifecycleState state) {
    switch (state) {
        case LifecycleState::Uninitialized: return "uninitialized";
        case LifecycleState::Initializing: return "initializing";
        case LifecycleState::Ready: return "ready";
    }
    return "uninitialized";
}

bool ManagedEffect::canInit(const std::map<std::string, std::string>& attributes) const {
    for (const std::string& name : reinitAttributes()) {
        auto it = attributes.find(name);
        if (it == attributes.end() || it->second.empty()) return false;
    }
    return true;
}

LifecycleController::LifecycleController(ManagedEffect& effect)
    : m_effect(effect) {
}

void LifecycleController::onConnect() {
    m_connected = true;
    m_effect.setup();
    // Attributes set before connecting are picked up here
    if (m_state == LifecycleState::Uninitialized) {
        tryInit();
    }
}

void LifecycleController::onDisconnect() {
    m_connected = false;
    cancelInit();
    m_effect.doDispose();
    m_state = LifecycleState::Uninitialized;
}

void LifecycleController::onAttributeChange(const std::string& name,
                                            const std::optional<std::string>& oldValue,
                                            const std::optional<std::string>& newValue) {
    const std::vector<std::string> watched = m_effect.reinitAttributes();
    if (std::find(watched.begin(), watched.end(), name) == watched.end()) return;
    if (oldValue == newValue) return;

    switch (m_state) {
        case LifecycleState::Ready:
            cancelInit();
            m_effect.doDispose();
            m_state = LifecycleState::Uninitialized;
            m_effect.setup();
            tryInit();
            break;
        case LifecycleState::Uninitialized:
            tryInit();
            break;
        case LifecycleState::Initializing:
            // The running attempt reads the latest values when it completes
            break;
    }
}

void LifecycleController::setAttribute(const std::string& name, const std::string& value) {
    std::optional<std::string> old = attribute(name);
    m_attributes[name] = value;
    onAttributeChange(name, old, value);
}

void LifecycleController::removeAttribute(const std::string& name) {
    std::optional<std::string> old = attribute(name);
    m_attributes.erase(name);
    onAttributeChange(name, old, std::nullopt);
}

std::optional<std::string> LifecycleController::attribute(const std::string& name) const {
    auto it = m_attributes.find(name);
    if (it == m_attributes.end()) return std::nullopt;
    return it->second;
}

bool LifecycleController::isCurrent(const InitAttempt& attempt) const {
    return m_current && m_current->id == attempt.id && !attempt.token.cancelled();
}

bool LifecycleController::markInitialized(const InitAttempt& attempt) {
    if (!isCurrent(attempt)) return false;
    m_state = LifecycleState::Ready;
    return true;
}

void LifecycleController::markFailed(const InitAttempt& attempt, const std::string& message) {
    if (!isCurrent(attempt)) return;
    m_current.reset();
    m_state = LifecycleState::Uninitialized;
    std::cerr << "[Lifecycle] Initialization failed: " << message << std::endl;
    if (m_onError) m_onError(message);
}

void LifecycleController::tryInit() {
    if (m_state == LifecycleState::Initializing) return;
    if (!m_connected) return;

    if (!m_effect.canInit(m_attributes)) return;

    cancelInit();

    InitAttempt attempt;
    attempt.id = m_nextAttempt++;
    m_current = attempt;
    m_state = LifecycleState::Initializing;

    try {
        m_effect.doInit(attempt);
    } catch (const std::exception& e) {
        markFailed(attempt, e.what());
    }
}

void LifecycleController::cancelInit() {
    if (m_current) {
        m_current->token.cancel();
        m_current.reset();
    }
    if (m_state == LifecycleState::Initializing) {
        m_state = LifecycleState::Uninitialized;
    }
}

} // namespace layershift
