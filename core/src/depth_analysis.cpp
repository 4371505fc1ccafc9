// Layershift - Depth statistics

#include <layershift/depth_analysis.h>
#include <algorithm>
#include <cmath>
#include <limits>

namespace layershift {

namespace {

std::vector<int> selectSampleIndices(int frameCount) {
    if (frameCount <= 0) return {};
    if (frameCount == 1) return {0};

    const int candidates[] = {
        0,
        frameCount / 4,
        frameCount / 2,
        (3 * frameCount) / 4,
        frameCount - 1,
    };

    std::vector<int> result;
    for (int c : candidates) {
        if (std::find(result.begin(), result.end(), c) == result.end()) {
            result.push_back(c);
        }
    }
    return result;
}

float findPercentile(const std::array<float, 256>& cdf, float target) {
    for (int i = 0; i < 256; ++i) {
        if (cdf[static_cast<size_t>(i)] >= target) {
            return static_cast<float>(i) / 255.0f;
        }
    }
    return 1.0f;
}

DepthProfile profileFromCounts(const std::array<uint64_t, 256>& counts, uint64_t total,
                               double topSum, uint64_t topCount, double bottomSum, uint64_t bottomCount) {
    DepthProfile profile;
    if (total == 0) return profile;

    const double invTotal = 1.0 / static_cast<double>(total);
    for (size_t i = 0; i < 256; ++i) {
        profile.histogram[i] = static_cast<float>(counts[i] * invTotal);
    }

    std::array<float, 256> cdf{};
    cdf[0] = profile.histogram[0];
    for (size_t i = 1; i < 256; ++i) {
        cdf[i] = cdf[i - 1] + profile.histogram[i];
    }

    profile.p5 = findPercentile(cdf, 0.05f);
    profile.p25 = findPercentile(cdf, 0.25f);
    profile.median = findPercentile(cdf, 0.50f);
    profile.p75 = findPercentile(cdf, 0.75f);
    profile.p95 = findPercentile(cdf, 0.95f);

    double mean = 0.0;
    for (size_t i = 0; i < 256; ++i) {
        mean += (static_cast<double>(i) / 255.0) * profile.histogram[i];
    }
    double variance = 0.0;
    for (size_t i = 0; i < 256; ++i) {
        const double diff = static_cast<double>(i) / 255.0 - mean;
        variance += profile.histogram[i] * diff * diff;
    }

    profile.mean = static_cast<float>(mean);
    profile.stdDev = static_cast<float>(std::sqrt(variance));
    profile.effectiveRange = profile.p95 - profile.p5;
    profile.iqr = profile.p75 - profile.p25;
    profile.bimodality = computeBimodality(profile.histogram);

    if (topCount > 0 && bottomCount > 0) {
        profile.verticalBias = static_cast<float>(topSum / topCount - bottomSum / bottomCount) / 255.0f;
    }
    return profile;
}

} // namespace

float computeBimodality(const std::array<float, 256>& histogram) {
    std::array<float, 256> smoothed{};
    for (int i = 0; i < 256; ++i) {
        float sum = 0.0f;
        int count = 0;
        for (int j = i - 2; j <= i + 2; ++j) {
            if (j >= 0 && j < 256) {
                sum += histogram[static_cast<size_t>(j)];
                ++count;
            }
        }
        smoothed[static_cast<size_t>(i)] = sum / static_cast<float>(count);
    }

    float meanHeight = 0.0f;
    for (float v : smoothed) meanHeight += v;
    meanHeight /= 256.0f;

    const float prominence = meanHeight * 2.0f;
    constexpr int MIN_SEPARATION = 25;

    struct Peak {
        int bin;
        float height;
    };
    std::vector<Peak> peaks;

    for (int i = 1; i < 255; ++i) {
        const float h = smoothed[static_cast<size_t>(i)];
        if (h > smoothed[static_cast<size_t>(i - 1)] && h > smoothed[static_cast<size_t>(i + 1)] && h >= prominence) {
            peaks.push_back({i, h});
        }
    }
    if (smoothed[0] > smoothed[1] && smoothed[0] >= prominence) {
        peaks.push_back({0, smoothed[0]});
    }
    if (smoothed[255] > smoothed[254] && smoothed[255] >= prominence) {
        peaks.push_back({255, smoothed[255]});
    }

    std::stable_sort(peaks.begin(), peaks.end(),
                     [](const Peak& a, const Peak& b) { return a.height > b.height; });
    if (peaks.size() < 2) return 0.0f;

    const Peak& first = peaks[0];
    const Peak* second = nullptr;
    for (size_t i = 1; i < peaks.size(); ++i) {
        if (std::abs(peaks[i].bin - first.bin) >= MIN_SEPARATION) {
            second = &peaks[i];
            break;
        }
    }
    if (!second) return 0.0f;

    const int lo = std::min(first.bin, second->bin);
    const int hi = std::max(first.bin, second->bin);
    float valley = std::numeric_limits<float>::infinity();
    for (int i = lo; i <= hi; ++i) {
        valley = std::min(valley, smoothed[static_cast<size_t>(i)]);
    }

    const float shorter = std::min(first.height, second->height);
    if (shorter <= 0.0f) return 0.0f;
    return std::clamp(1.0f - valley / shorter, 0.0f, 1.0f);
}

DepthProfile analyzeDepthFrames(const std::vector<std::vector<uint8_t>>& frames, int width, int height) {
    if (frames.empty() || width <= 0 || height <= 0) {
        return DepthProfile{};
    }

    const size_t pixelsPerFrame = static_cast<size_t>(width) * static_cast<size_t>(height);
    const size_t halfRows = static_cast<size_t>(height / 2);

    std::array<uint64_t, 256> counts{};
    uint64_t total = 0;
    double topSum = 0.0, bottomSum = 0.0;
    uint64_t topCount = 0, bottomCount = 0;

    for (int idx : selectSampleIndices(static_cast<int>(frames.size()))) {
        const auto& frame = frames[static_cast<size_t>(idx)];
        const size_t len = std::min(frame.size(), pixelsPerFrame);
        for (size_t i = 0; i < len; ++i) {
            const uint8_t v = frame[i];
            ++counts[v];
            const size_t row = i / static_cast<size_t>(width);
            if (row < halfRows) {
                topSum += v;
                ++topCount;
            } else if (row >= static_cast<size_t>(height) - halfRows) {
                bottomSum += v;
                ++bottomCount;
            }
        }
        total += len;
    }

    return profileFromCounts(counts, total, topSum, topCount, bottomSum, bottomCount);
}

DepthProfile analyzeDepthFrame(const uint8_t* frame, int width, int height) {
    if (!frame || width <= 0 || height <= 0) return DepthProfile{};
    std::vector<std::vector<uint8_t>> frames;
    frames.emplace_back(frame, frame + static_cast<size_t>(width) * static_cast<size_t>(height));
    return analyzeDepthFrames(frames, width, height);
}

DerivedParallaxParams deriveParallaxParams(const DepthProfile& profile) {
    if (profile.effectiveRange < 0.05f || profile.stdDev < 0.02f) {
        return DerivedParallaxParams{};
    }

    DerivedParallaxParams p;
    const float tRange = profile.effectiveRange - 0.50f;
    const float tBimodal = profile.bimodality - 0.40f;

    p.parallaxStrength = std::clamp(0.05f - tRange * 0.03f + tBimodal * 0.01f, 0.035f, 0.065f);
    p.contrastLow = std::clamp(profile.p5 - 0.03f, 0.0f, 0.25f);
    p.contrastHigh = std::clamp(profile.p95 + 0.03f, 0.75f, 1.0f);

    const float strengthNorm = std::clamp((p.parallaxStrength - 0.03f) / 0.05f, 0.0f, 1.0f);
    p.verticalReduction = std::clamp(0.6f - strengthNorm * 0.25f, 0.35f, 0.6f);

    p.dofStart = std::clamp(0.6f - tRange * 0.2f, 0.5f, 0.7f);
    p.dofStrength = std::clamp(0.4f + tRange * 0.2f, 0.25f, 0.5f);
    p.pomSteps = 16;
    p.overscanPadding = std::clamp(p.parallaxStrength + 0.03f, 0.06f, 0.10f);
    return p;
}

DerivedFocusParams deriveFocusParams(const DepthProfile& profile) {
    if (profile.effectiveRange < 0.05f || profile.stdDev < 0.02f) {
        return DerivedFocusParams{};
    }

    DerivedFocusParams p;
    p.autoFocusDepth = profile.median;
    p.focusRange = std::clamp(profile.iqr * 0.25f, 0.03f, 0.10f);
    // Shallow scenes need a steeper CoC ramp to show any blur at all
    p.depthScale = std::clamp(50.0f * 0.5f / std::max(profile.effectiveRange, 0.05f), 30.0f, 80.0f);
    return p;
}

} // namespace layershift
