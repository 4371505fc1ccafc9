// Layershift - CPU depth kernels

#include <layershift/depth_filter.h>
#include <algorithm>
#include <cmath>

namespace layershift {

std::vector<uint8_t> bilateralFilterDepth(const uint8_t* depth, int width, int height, int radius) {
    std::vector<uint8_t> out(static_cast<size_t>(width) * static_cast<size_t>(height));
    const float spatial2 = bilateralSpatialSigma2(radius);

    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            const float center = depth[y * width + x] / 255.0f;
            float sum = 0.0f;
            float weightSum = 0.0f;

            for (int dy = -radius; dy <= radius; ++dy) {
                const int sy = y + dy;
                if (sy < 0 || sy >= height) continue;
                for (int dx = -radius; dx <= radius; ++dx) {
                    const int sx = x + dx;
                    if (sx < 0 || sx >= width) continue;

                    const float d = depth[sy * width + sx] / 255.0f;
                    const float dist2 = static_cast<float>(dx * dx + dy * dy);
                    const float delta = d - center;
                    const float w = std::exp(-dist2 / spatial2 - (delta * delta) / BILATERAL_DEPTH_SIGMA2);
                    sum += d * w;
                    weightSum += w;
                }
            }

            const float value = weightSum > 0.0f ? sum / weightSum : center;
            out[static_cast<size_t>(y * width + x)] =
                static_cast<uint8_t>(std::clamp(value * 255.0f + 0.5f, 0.0f, 255.0f));
        }
    }
    return out;
}

std::vector<float> resizeDepthBilinear(const float* src, int srcW, int srcH, int dstW, int dstH) {
    std::vector<float> out(static_cast<size_t>(dstW) * static_cast<size_t>(dstH));
    const float xRatio = static_cast<float>(srcW) / static_cast<float>(dstW);
    const float yRatio = static_cast<float>(srcH) / static_cast<float>(dstH);

    for (int y = 0; y < dstH; ++y) {
        const float sy = (y + 0.5f) * yRatio - 0.5f;
        const float fy = std::floor(sy);
        const int y0 = std::clamp(static_cast<int>(fy), 0, srcH - 1);
        const int y1 = std::clamp(static_cast<int>(fy) + 1, 0, srcH - 1);
        const float ty = sy - fy;

        for (int x = 0; x < dstW; ++x) {
            const float sx = (x + 0.5f) * xRatio - 0.5f;
            const float fx = std::floor(sx);
            const int x0 = std::clamp(static_cast<int>(fx), 0, srcW - 1);
            const int x1 = std::clamp(static_cast<int>(fx) + 1, 0, srcW - 1);
            const float tx = sx - fx;

            const float tl = src[y0 * srcW + x0];
            const float tr = src[y0 * srcW + x1];
            const float bl = src[y1 * srcW + x0];
            const float br = src[y1 * srcW + x1];
            const float top = tl + (tr - tl) * tx;
            const float bottom = bl + (br - bl) * tx;
            out[static_cast<size_t>(y * dstW + x)] = top + (bottom - top) * ty;
        }
    }
    return out;
}

DepthDimensions clampDepthDimensions(int width, int height, int maxDim) {
    if (width <= maxDim && height <= maxDim) {
        return {width, height};
    }
    const double scale = static_cast<double>(maxDim) / static_cast<double>(std::max(width, height));
    return {
        std::max(1, static_cast<int>(std::lround(width * scale))),
        std::max(1, static_cast<int>(std::lround(height * scale))),
    };
}

const uint8_t* DepthSubsampler::apply(const uint8_t* src, int srcW, int srcH, int maxDim) {
    const DepthDimensions dst = clampDepthDimensions(srcW, srcH, maxDim);
    if (dst.width == srcW && dst.height == srcH) {
        m_width = srcW;
        m_height = srcH;
        return src;
    }

    const size_t needed = static_cast<size_t>(dst.width) * static_cast<size_t>(dst.height);
    if (m_scratch.size() != needed) {
        m_scratch.assign(needed, 0);
        ++m_allocations;
    }
    m_width = dst.width;
    m_height = dst.height;

    for (int y = 0; y < dst.height; ++y) {
        const int sy = std::min(static_cast<int>(std::lround(static_cast<double>(y) * srcH / dst.height)), srcH - 1);
        for (int x = 0; x < dst.width; ++x) {
            const int sx = std::min(static_cast<int>(std::lround(static_cast<double>(x) * srcW / dst.width)), srcW - 1);
            m_scratch[static_cast<size_t>(y * dst.width + x)] = src[sy * srcW + sx];
        }
    }
    return m_scratch.data();
}

} // namespace layershift
