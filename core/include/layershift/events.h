#pragma once

/**
 * @file events.h
 * @brief Effect events delivered to the host
 *
 * Events carry a JSON detail object so hosts can log or forward them
 * without knowing each payload type. Names follow
 * "layershift-<effect>:<event>", e.g. "layershift-portal:ready".
 */

#include <layershift/effect_config.h>
#include <nlohmann/json.hpp>
#include <functional>
#include <string>

namespace layershift {

enum class EventType {
    Ready,
    Play,
    Pause,
    Loop,
    Frame,
    FocusChange,
    FocusSettled,
    ModelDownloadProgress,
    Error
};

const char* eventTypeName(EventType type);

struct Event {
    EffectKind effect = EffectKind::Parallax;
    EventType type = EventType::Ready;
    nlohmann::json detail = nlohmann::json::object();

    /// @brief Full event name, e.g. "layershift-rack-focus:focus-settled"
    std::string name() const;
};

using EventSink = std::function<void(const Event&)>;

/**
 * @brief Stamps events with their effect and hands them to the sink
 *
 * Errors are also written to stderr with the effect tag so failures are
 * visible even when no sink is attached.
 */
class EventEmitter {
public:
    explicit EventEmitter(EffectKind effect, EventSink sink = {});

    void setSink(EventSink sink) { m_sink = std::move(sink); }
    EffectKind effect() const { return m_effect; }

    void emit(EventType type, nlohmann::json detail = nlohmann::json::object()) const;
    void emitError(const std::string& message) const;

private:
    EffectKind m_effect;
    EventSink m_sink;
};

/// @name Event payload helpers
/// @{
nlohmann::json toJson(const DepthProfile& profile);
nlohmann::json toJson(const DerivedParallaxParams& params);
nlohmann::json toJson(const DerivedFocusParams& params);
/// @}

} // namespace layershift
