// Layershift - Quality tier detection

#include <layershift/quality.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace layershift {

namespace {

constexpr std::array<std::string_view, 12> LOW_END_PATTERNS = {
    "mali-4", "mali-t", "adreno 3", "adreno 4", "adreno 5", "powervr sgx",
    "intel hd graphics", "intel uhd graphics", "intel iris",
    "llvmpipe", "swiftshader", "software",
};

constexpr std::array<std::string_view, 10> HIGH_END_PATTERNS = {
    "nvidia", "geforce", "radeon rx", "radeon pro", "apple m", "apple gpu",
    "adreno 7", "adreno 6", "mali-g7", "mali-g6",
};

std::string toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

template<size_t N>
bool matchesAny(const std::string& haystack, const std::array<std::string_view, N>& patterns) {
    for (auto p : patterns) {
        if (haystack.find(p) != std::string::npos) return true;
    }
    return false;
}

} // namespace

QualityParams paramsForTier(QualityTier tier) {
    QualityParams p;
    p.tier = tier;
    switch (tier) {
        case QualityTier::High:
            p.dprCap = 2.0f;
            p.depthMaxDim = 512;
            p.pomSteps = 16;
            p.bilateralRadius = 2;
            p.jfaDivisor = 2;
            p.poissonSamples = 48;
            p.dofDivisor = 1;
            break;
        case QualityTier::Medium:
            p.dprCap = 1.5f;
            p.depthMaxDim = 512;
            p.pomSteps = 16;
            p.bilateralRadius = 2;
            p.jfaDivisor = 2;
            p.poissonSamples = 32;
            p.dofDivisor = 1;
            break;
        case QualityTier::Low:
            p.dprCap = 1.0f;
            p.depthMaxDim = 256;
            p.pomSteps = 8;
            p.bilateralRadius = 1;
            p.jfaDivisor = 4;
            p.poissonSamples = 16;
            p.dofDivisor = 2;
            break;
    }
    return p;
}

QualityTier classifyDevice(const DeviceCapabilities& caps) {
    int score = 0;
    const std::string renderer = toLower(caps.renderer);

    if (!renderer.empty()) {
        if (matchesAny(renderer, LOW_END_PATTERNS)) {
            score -= 30;
        } else if (matchesAny(renderer, HIGH_END_PATTERNS)) {
            score += 20;
        }
    }

    if (caps.maxTextureSize >= 16384) {
        score += 10;
    } else if (caps.maxTextureSize >= 8192) {
        score += 5;
    } else if (caps.maxTextureSize > 0 && caps.maxTextureSize <= 4096) {
        score -= 15;
    }

    if (caps.hardwareConcurrency >= 8) {
        score += 5;
    } else if (caps.hardwareConcurrency > 0 && caps.hardwareConcurrency < 4) {
        score -= 10;
    }

    if (caps.deviceMemoryGB >= 8.0f) {
        score += 5;
    } else if (caps.deviceMemoryGB > 0.0f && caps.deviceMemoryGB < 4.0f) {
        score -= 15;
    }

    if (caps.isMobile) score -= 10;

    if (score >= 0) return QualityTier::High;
    if (score >= -25) return QualityTier::Medium;
    return QualityTier::Low;
}

QualityParams resolveQuality(const std::optional<QualityTier>& explicitTier,
                             const DeviceCapabilities& caps) {
    if (explicitTier) {
        return paramsForTier(*explicitTier);
    }
    return paramsForTier(classifyDevice(caps));
}

std::optional<QualityTier> parseQualityTier(const std::string& name) {
    const std::string n = toLower(name);
    if (n == "high") return QualityTier::High;
    if (n == "medium") return QualityTier::Medium;
    if (n == "low") return QualityTier::Low;
    return std::nullopt;
}

const char* qualityTierName(QualityTier tier) {
    switch (tier) {
        case QualityTier::High: return "high";
        case QualityTier::Medium: return "medium";
        case QualityTier::Low: return "low";
    }
    return "high";
}

} // namespace layershift
