// Layershift - Jump-flood distance field (CPU)

#include <layershift/jump_flood.h>
#include <algorithm>
#include <cmath>

namespace layershift {

std::vector<int> jumpFloodSteps(int width, int height) {
    const int maxDim = std::max(width, height);
    int pow2 = 1;
    while (pow2 < maxDim) pow2 <<= 1;

    std::vector<int> steps;
    for (int step = pow2 / 2; step >= 1; step /= 2) {
        steps.push_back(step);
    }
    return steps;
}

int jumpFloodResolution(int canvasSize, int divisor) {
    return std::max(1, static_cast<int>(std::lround(static_cast<double>(canvasSize) / std::max(divisor, 1))));
}

std::vector<JumpFloodField::Seed> JumpFloodField::extractSeeds(const uint8_t* mask, int width, int height) {
    std::vector<Seed> seeds(static_cast<size_t>(width) * static_cast<size_t>(height));
    auto inside = [&](int x, int y) {
        // Clamp-to-edge addressing, matching the GPU sampler
        x = std::clamp(x, 0, width - 1);
        y = std::clamp(y, 0, height - 1);
        return mask[y * width + x] >= 128;
    };

    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            const bool c = inside(x, y);
            const bool edge = c != inside(x - 1, y) || c != inside(x + 1, y) ||
                              c != inside(x, y - 1) || c != inside(x, y + 1);
            if (edge) {
                seeds[static_cast<size_t>(y * width + x)] = {static_cast<float>(x), static_cast<float>(y)};
            }
        }
    }
    return seeds;
}

void JumpFloodField::floodPass(const std::vector<Seed>& src, std::vector<Seed>& dst,
                               int width, int height, int step) {
    dst.resize(src.size());
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            Seed best = src[static_cast<size_t>(y * width + x)];
            float bestDist2 = 1.0e20f;
            if (best.valid()) {
                const float dx = best.x - x;
                const float dy = best.y - y;
                bestDist2 = dx * dx + dy * dy;
            }

            for (int oy = -1; oy <= 1; ++oy) {
                for (int ox = -1; ox <= 1; ++ox) {
                    if (ox == 0 && oy == 0) continue;
                    const int sx = x + ox * step;
                    const int sy = y + oy * step;
                    if (sx < 0 || sx >= width || sy < 0 || sy >= height) continue;

                    const Seed& n = src[static_cast<size_t>(sy * width + sx)];
                    if (!n.valid()) continue;
                    const float dx = n.x - x;
                    const float dy = n.y - y;
                    const float d2 = dx * dx + dy * dy;
                    if (d2 < bestDist2) {
                        bestDist2 = d2;
                        best = n;
                    }
                }
            }
            dst[static_cast<size_t>(y * width + x)] = best;
        }
    }
}

void JumpFloodField::compute(const uint8_t* mask, int width, int height) {
    m_width = width;
    m_height = height;
    m_mask.assign(mask, mask + static_cast<size_t>(width) * static_cast<size_t>(height));
    m_seeds = extractSeeds(mask, width, height);

    std::vector<Seed> scratch;
    for (int step : jumpFloodSteps(width, height)) {
        floodPass(m_seeds, scratch, width, height, step);
        m_seeds.swap(scratch);
    }
}

float JumpFloodField::distanceAt(int x, int y) const {
    const Seed& s = m_seeds[static_cast<size_t>(y * m_width + x)];
    if (!s.valid()) return -1.0f;
    return std::hypot(s.x - static_cast<float>(x), s.y - static_cast<float>(y));
}

std::vector<float> JumpFloodField::normalizedDistance(float range) const {
    std::vector<float> out(m_seeds.size(), 0.0f);
    const float maxDim = static_cast<float>(std::max(m_width, m_height));
    const float denom = std::max(range, 0.001f);

    for (int y = 0; y < m_height; ++y) {
        for (int x = 0; x < m_width; ++x) {
            const size_t i = static_cast<size_t>(y * m_width + x);
            if (m_mask[i] < 128) {
                out[i] = 0.0f;
                continue;
            }
            const float d = distanceAt(x, y);
            out[i] = d < 0.0f ? 1.0f : std::clamp((d / maxDim) / denom, 0.0f, 1.0f);
        }
    }
    return out;
}

} // namespace layershift
