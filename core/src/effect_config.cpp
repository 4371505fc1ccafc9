// Layershift - Effect configuration

#include <layershift/effect_config.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace layershift {

using json = nlohmann::json;

namespace {

void readFloat(const json& obj, const char* key, std::optional<float>& out) {
    if (!obj.contains(key)) return;
    const json& v = obj[key];
    if (!v.is_number()) {
        throw std::invalid_argument(std::string("Config field '") + key + "' must be a number.");
    }
    out = v.get<float>();
}

void readFloat(const json& obj, const char* key, float& out) {
    std::optional<float> value;
    readFloat(obj, key, value);
    if (value) out = *value;
}

void readInt(const json& obj, const char* key, std::optional<int>& out) {
    if (!obj.contains(key)) return;
    const json& v = obj[key];
    if (!v.is_number()) {
        throw std::invalid_argument(std::string("Config field '") + key + "' must be a number.");
    }
    out = static_cast<int>(v.get<double>());
}

void readInt(const json& obj, const char* key, int& out) {
    std::optional<int> value;
    readInt(obj, key, value);
    if (value) out = *value;
}

void readBool(const json& obj, const char* key, std::optional<bool>& out) {
    if (!obj.contains(key)) return;
    const json& v = obj[key];
    if (!v.is_boolean()) {
        throw std::invalid_argument(std::string("Config field '") + key + "' must be true or false.");
    }
    out = v.get<bool>();
}

void readBool(const json& obj, const char* key, bool& out) {
    std::optional<bool> value;
    readBool(obj, key, value);
    if (value) out = *value;
}

std::string readString(const json& obj, const char* key) {
    const json& v = obj[key];
    if (!v.is_string()) {
        throw std::invalid_argument(std::string("Config field '") + key + "' must be a string.");
    }
    return v.get<std::string>();
}

void readColor(const json& obj, const char* key, glm::vec3& out) {
    if (!obj.contains(key)) return;
    out = parseHexColor(readString(obj, key));
}

// Accepts [x, y, z] or "x,y,z"; anything else keeps the current value
void readVec3(const json& obj, const char* key, glm::vec3& out) {
    if (!obj.contains(key)) return;
    const json& v = obj[key];

    if (v.is_array() && v.size() >= 3 && v[0].is_number() && v[1].is_number() && v[2].is_number()) {
        out = glm::vec3(v[0].get<float>(), v[1].get<float>(), v[2].get<float>());
        return;
    }
    if (v.is_string()) {
        std::stringstream ss(v.get<std::string>());
        std::string part;
        float parts[3];
        int count = 0;
        while (count < 3 && std::getline(ss, part, ',')) {
            try {
                parts[count] = std::stof(part);
            } catch (const std::exception&) {
                break;
            }
            ++count;
        }
        if (count == 3) {
            out = glm::vec3(parts[0], parts[1], parts[2]);
            return;
        }
    }
    throw std::invalid_argument(std::string("Config field '") + key + "' must be three numbers.");
}

const json& section(const json& root, const char* key) {
    static const json empty = json::object();
    if (!root.contains(key)) return empty;
    const json& v = root[key];
    if (!v.is_object()) {
        throw std::invalid_argument(std::string("Config section '") + key + "' must be an object.");
    }
    return v;
}

void parseParallax(const json& obj, ParallaxOptions& o) {
    readFloat(obj, "parallaxX", o.parallaxX);
    readFloat(obj, "parallaxY", o.parallaxY);
    readFloat(obj, "parallaxMax", o.parallaxMax);
    readFloat(obj, "overscan", o.overscan);
    readBool(obj, "pomEnabled", o.pomEnabled);
    readInt(obj, "pomSteps", o.pomSteps);
    readFloat(obj, "motionLerp", o.motionLerp);
}

void parseRackFocus(const json& obj, RackFocusOptions& o) {
    if (obj.contains("focusMode")) {
        const std::string name = readString(obj, "focusMode");
        o.focusMode = parseFocusMode(name);
        if (!o.focusMode) {
            throw std::invalid_argument("Unknown focus mode '" + name + "'.");
        }
    }
    readFloat(obj, "focusDepth", o.focusDepth);
    readFloat(obj, "focusRange", o.focusRange);
    readFloat(obj, "transitionSpeed", o.transitionSpeed);
    readFloat(obj, "aperture", o.aperture);
    readFloat(obj, "maxBlur", o.maxBlur);
    readFloat(obj, "depthScale", o.depthScale);
    readBool(obj, "highlightBloom", o.highlightBloom);
    readFloat(obj, "highlightThreshold", o.highlightThreshold);
    readFloat(obj, "highlightBoost", o.highlightBoost);
    readFloat(obj, "focusBreathing", o.focusBreathing);
    readFloat(obj, "vignette", o.vignette);
}

void parsePortal(const json& obj, PortalSettings& p) {
    readFloat(obj, "parallaxX", p.parallaxX);
    readFloat(obj, "parallaxY", p.parallaxY);
    readFloat(obj, "parallaxMax", p.parallaxMax);
    readFloat(obj, "overscan", p.overscan);
    readInt(obj, "pomSteps", p.pomSteps);

    readFloat(obj, "rimIntensity", p.rimIntensity);
    readColor(obj, "rimColor", p.rimColor);
    readFloat(obj, "rimWidth", p.rimWidth);
    readFloat(obj, "refractionStrength", p.refractionStrength);
    readFloat(obj, "chromaticStrength", p.chromaticStrength);
    readFloat(obj, "occlusionIntensity", p.occlusionIntensity);

    readFloat(obj, "depthPower", p.depthPower);
    readFloat(obj, "depthScale", p.depthScale);
    readFloat(obj, "depthBias", p.depthBias);

    readFloat(obj, "fogDensity", p.fogDensity);
    readColor(obj, "fogColor", p.fogColor);
    readFloat(obj, "colorShift", p.colorShift);
    readFloat(obj, "brightnessBias", p.brightnessBias);

    readFloat(obj, "contrastLow", p.contrastLow);
    readFloat(obj, "contrastHigh", p.contrastHigh);
    readFloat(obj, "verticalReduction", p.verticalReduction);
    readFloat(obj, "dofStart", p.dofStart);
    readFloat(obj, "dofStrength", p.dofStrength);

    readFloat(obj, "bevelIntensity", p.bevelIntensity);
    readFloat(obj, "bevelWidth", p.bevelWidth);
    readFloat(obj, "bevelDarkening", p.bevelDarkening);
    readFloat(obj, "bevelDesaturation", p.bevelDesaturation);
    readFloat(obj, "bevelLightAngle", p.bevelLightAngle);

    readFloat(obj, "edgeThickness", p.edgeThickness);
    readFloat(obj, "edgeSpecular", p.edgeSpecular);
    readColor(obj, "edgeColor", p.edgeColor);

    readFloat(obj, "chamferWidth", p.chamferWidth);
    readFloat(obj, "chamferAngle", p.chamferAngle);
    readColor(obj, "chamferColor", p.chamferColor);
    readFloat(obj, "chamferAmbient", p.chamferAmbient);
    readFloat(obj, "chamferSpecular", p.chamferSpecular);
    readFloat(obj, "chamferShininess", p.chamferShininess);

    readFloat(obj, "edgeOcclusionWidth", p.edgeOcclusionWidth);
    readFloat(obj, "edgeOcclusionStrength", p.edgeOcclusionStrength);
    readVec3(obj, "lightDirection", p.lightDirection);
    readFloat(obj, "motionLerp", p.motionLerp);
}

} // namespace

std::optional<EffectKind> parseEffectKind(const std::string& name) {
    if (name == "parallax") return EffectKind::Parallax;
    if (name == "rack-focus" || name == "rackFocus") return EffectKind::RackFocus;
    if (name == "portal") return EffectKind::Portal;
    return std::nullopt;
}

const char* effectKindName(EffectKind kind) {
    switch (kind) {
        case EffectKind::Parallax: return "parallax";
        case EffectKind::RackFocus: return "rack-focus";
        case EffectKind::Portal: return "portal";
    }
    return "parallax";
}

std::optional<BackendPreference> parseBackendPreference(const std::string& name) {
    if (name == "auto") return BackendPreference::Auto;
    if (name == "webgpu") return BackendPreference::WebGPU;
    if (name == "opengl" || name == "webgl2") return BackendPreference::OpenGL;
    return std::nullopt;
}

const char* backendPreferenceName(BackendPreference pref) {
    switch (pref) {
        case BackendPreference::Auto: return "auto";
        case BackendPreference::WebGPU: return "webgpu";
        case BackendPreference::OpenGL: return "opengl";
    }
    return "auto";
}

glm::vec3 parseHexColor(const std::string& text) {
    std::string hex = text;
    hex.erase(std::remove(hex.begin(), hex.end(), '#'), hex.end());

    auto isHex = [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; };
    if (!std::all_of(hex.begin(), hex.end(), isHex)) return glm::vec3(0.0f);

    auto channel = [](const std::string& s) {
        return static_cast<float>(std::stoi(s, nullptr, 16)) / 255.0f;
    };

    if (hex.size() == 3) {
        return glm::vec3(channel(std::string(2, hex[0])),
                         channel(std::string(2, hex[1])),
                         channel(std::string(2, hex[2])));
    }
    if (hex.size() == 6) {
        return glm::vec3(channel(hex.substr(0, 2)), channel(hex.substr(2, 2)), channel(hex.substr(4, 2)));
    }
    return glm::vec3(0.0f);
}

ParallaxSettings resolveParallaxSettings(const ParallaxOptions& options,
                                         const DerivedParallaxParams& derived,
                                         int sourceWidth) {
    ParallaxSettings s;
    s.parallaxX = resolveParam<float>(options.parallaxX, std::nullopt, s.parallaxX);
    s.parallaxY = resolveParam<float>(options.parallaxY, std::nullopt, s.parallaxY);

    std::optional<float> explicitStrength;
    if (options.parallaxMax) {
        explicitStrength = *options.parallaxMax / static_cast<float>(std::max(sourceWidth, 1));
    }
    s.strength = resolveParam<float>(explicitStrength, derived.parallaxStrength, s.strength);
    s.overscan = resolveParam<float>(options.overscan, derived.overscanPadding, s.overscan);
    s.pomEnabled = resolveParam<bool>(options.pomEnabled, std::nullopt, s.pomEnabled);
    s.pomSteps = resolveParam<int>(options.pomSteps, derived.pomSteps, s.pomSteps);
    s.motionLerp = resolveParam<float>(options.motionLerp, std::nullopt, s.motionLerp);

    s.contrastLow = derived.contrastLow;
    s.contrastHigh = derived.contrastHigh;
    s.verticalReduction = derived.verticalReduction;
    s.dofStart = derived.dofStart;
    s.dofStrength = derived.dofStrength;
    return s;
}

RackFocusSettings resolveRackFocusSettings(const RackFocusOptions& options,
                                           const DerivedFocusParams& derived) {
    RackFocusSettings s;
    s.focusMode = resolveParam<FocusMode>(options.focusMode, std::nullopt, s.focusMode);
    s.autoFocusDepth = std::clamp(resolveParam<float>(options.focusDepth, derived.autoFocusDepth, s.autoFocusDepth), 0.0f, 1.0f);
    s.focusRange = resolveParam<float>(options.focusRange, derived.focusRange, s.focusRange);
    s.depthScale = resolveParam<float>(options.depthScale, derived.depthScale, s.depthScale);
    s.transitionSpeed = resolveParam<float>(options.transitionSpeed, std::nullopt, s.transitionSpeed);
    s.aperture = resolveParam<float>(options.aperture, std::nullopt, s.aperture);
    s.maxBlur = resolveParam<float>(options.maxBlur, std::nullopt, s.maxBlur);
    s.highlightBloom = resolveParam<bool>(options.highlightBloom, std::nullopt, s.highlightBloom);
    s.highlightThreshold = resolveParam<float>(options.highlightThreshold, std::nullopt, s.highlightThreshold);
    s.highlightBoost = resolveParam<float>(options.highlightBoost, std::nullopt, s.highlightBoost);
    s.focusBreathing = resolveParam<float>(options.focusBreathing, std::nullopt, s.focusBreathing);
    s.vignette = resolveParam<float>(options.vignette, std::nullopt, s.vignette);
    return s;
}

FocusInputConfig focusInputConfig(const RackFocusSettings& settings) {
    FocusInputConfig c;
    c.mode = settings.focusMode;
    c.transitionSpeed = settings.transitionSpeed;
    c.breathAmount = settings.focusBreathing;
    c.autoFocusDepth = settings.autoFocusDepth;
    return c;
}

float PortalSettings::strengthFor(int sourceWidth) const {
    return parallaxMax / static_cast<float>(std::max(sourceWidth, 1));
}

float PortalSettings::distanceFieldRange() const {
    return std::max(bevelWidth, edgeOcclusionWidth);
}

EffectConfig parseEffectConfig(const std::string& jsonText) {
    json root;
    try {
        root = json::parse(jsonText);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument(std::string("Config is not valid JSON: ") + e.what());
    }
    if (!root.is_object()) {
        throw std::invalid_argument("Config root must be an object.");
    }

    EffectConfig config;

    if (root.contains("effect")) {
        const std::string name = readString(root, "effect");
        const auto kind = parseEffectKind(name);
        if (!kind) throw std::invalid_argument("Unknown effect '" + name + "'.");
        config.effect = *kind;
    }

    if (root.contains("quality")) {
        const std::string name = readString(root, "quality");
        if (name != "auto") {
            config.quality = parseQualityTier(name);
            if (!config.quality) throw std::invalid_argument("Unknown quality tier '" + name + "'.");
        }
    }

    if (root.contains("backend")) {
        const std::string name = readString(root, "backend");
        const auto pref = parseBackendPreference(name);
        if (!pref) throw std::invalid_argument("Unknown GPU backend '" + name + "'.");
        config.backend = *pref;
    }

    readBool(root, "autoplay", config.autoplay);
    readBool(root, "loop", config.loop);

    parseParallax(section(root, "parallax"), config.parallax);
    parseRackFocus(section(root, "rackFocus"), config.rackFocus);
    parsePortal(section(root, "portal"), config.portal);
    return config;
}

EffectConfig loadEffectConfigFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    EffectConfig config = parseEffectConfig(buffer.str());
    std::cout << "[EffectConfig] Loaded " << path.string() << " (" << effectKindName(config.effect) << ")" << std::endl;
    return config;
}

} // namespace layershift
