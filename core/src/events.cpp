// Layershift - Effect events

#include <layershift/events.h>
#include <iostream>

namespace layershift {

const char* eventTypeName(EventType type) {
    switch (type) {
        case EventType::Ready: return "ready";
        case EventType::Play: return "play";
        case EventType::Pause: return "pause";
        case EventType::Loop: return "loop";
        case EventType::Frame: return "frame";
        case EventType::FocusChange: return "focus-change";
        case EventType::FocusSettled: return "focus-settled";
        case EventType::ModelDownloadProgress: return "model-download-progress";
        case EventType::Error: return "error";
    }
    return "error";
}

std::string Event::name() const {
    return std::string("layershift-") + effectKindName(effect) + ":" + eventTypeName(type);
}

EventEmitter::EventEmitter(EffectKind effect, EventSink sink)
    : m_effect(effect)
    , m_sink(std::move(sink)) {
}

void EventEmitter::emit(EventType type, nlohmann::json detail) const {
    if (!m_sink) return;
    Event event;
    event.effect = m_effect;
    event.type = type;
    event.detail = std::move(detail);
    m_sink(event);
}

void EventEmitter::emitError(const std::string& message) const {
    std::cerr << "[layershift-" << effectKindName(m_effect) << "] " << message << std::endl;
    emit(EventType::Error, {{"message", message}});
}

nlohmann::json toJson(const DepthProfile& profile) {
    return {
        {"mean", profile.mean},
        {"stdDev", profile.stdDev},
        {"p5", profile.p5},
        {"p25", profile.p25},
        {"median", profile.median},
        {"p75", profile.p75},
        {"p95", profile.p95},
        {"effectiveRange", profile.effectiveRange},
        {"iqr", profile.iqr},
        {"bimodality", profile.bimodality},
        {"verticalBias", profile.verticalBias}
    };
}

nlohmann::json toJson(const DerivedParallaxParams& params) {
    return {
        {"parallaxStrength", params.parallaxStrength},
        {"contrastLow", params.contrastLow},
        {"contrastHigh", params.contrastHigh},
        {"verticalReduction", params.verticalReduction},
        {"dofStart", params.dofStart},
        {"dofStrength", params.dofStrength},
        {"pomSteps", params.pomSteps},
        {"overscanPadding", params.overscanPadding}
    };
}

nlohmann::json toJson(const DerivedFocusParams& params) {
    return {
        {"autoFocusDepth", params.autoFocusDepth},
        {"focusRange", params.focusRange},
        {"depthScale", params.depthScale}
    };
}

} // namespace layershift
