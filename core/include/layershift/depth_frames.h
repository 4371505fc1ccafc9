#pragma once

/**
 * @file depth_frames.h
 * @brief Precomputed depth: packed binary loading and per-time interpolation
 *
 * On-disk layout (written by `layershift precompute`):
 * - depth-meta.json: {frameCount, fps, width, height, sourceFps}
 * - depth-data.bin:  uint32 little-endian frame count, then frameCount*width*height bytes
 *
 * Depth bytes use 255 = nearest.
 */

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace layershift {

/// @brief Read-side contract shared by precomputed and estimated depth
class DepthProvider {
public:
    virtual ~DepthProvider() = default;

    /// @brief Depth bytes for the given source time; valid until the next call
    virtual const uint8_t* sample(double timeSeconds) = 0;

    virtual int width() const = 0;
    virtual int height() const = 0;
};

struct DepthMeta {
    int frameCount = 0;
    double fps = 0.0;
    int width = 0;
    int height = 0;
    double sourceFps = 0.0;
};

struct DepthFrameSet {
    DepthMeta meta;
    std::vector<std::vector<uint8_t>> frames;

    int width() const { return meta.width; }
    int height() const { return meta.height; }
    int frameCount() const { return static_cast<int>(frames.size()); }
};

struct LoadProgress {
    uint64_t receivedBytes = 0;
    std::optional<uint64_t> totalBytes;
    std::optional<double> fraction;
};

using LoadProgressCallback = std::function<void(const LoadProgress&)>;

/// @throws std::runtime_error on missing, non-numeric or non-positive fields
DepthMeta parseDepthMeta(const std::string& jsonText);

std::string serializeDepthMeta(const DepthMeta& meta);

/**
 * @brief Split a packed payload into frames
 * @throws std::runtime_error when the header or length disagrees with the metadata
 */
DepthFrameSet unpackDepthFrames(const std::vector<uint8_t>& packed, const DepthMeta& meta);

std::vector<uint8_t> packDepthFrames(const std::vector<std::vector<uint8_t>>& frames);

/// @brief Load metadata and payload from disk, reporting read progress
DepthFrameSet loadDepthFrameSet(const std::filesystem::path& dataPath,
                                const std::filesystem::path& metaPath,
                                const LoadProgressCallback& onProgress = {});

std::vector<uint8_t> createFlatDepth(int width, int height, uint8_t value = 128);

/**
 * @brief Time-indexed blend over a DepthFrameSet
 *
 * Maps t to a fractional frame index at the set's fps, clamps to the first
 * and last frames, and linearly blends the bracketing pair into an output
 * buffer that is reused between calls.
 */
class DepthFrameInterpolator : public DepthProvider {
public:
    explicit DepthFrameInterpolator(std::shared_ptr<const DepthFrameSet> frames);

    const uint8_t* sample(double timeSeconds) override;
    int width() const override { return m_frames->width(); }
    int height() const override { return m_frames->height(); }

    const DepthFrameSet& frameSet() const { return *m_frames; }

private:
    std::shared_ptr<const DepthFrameSet> m_frames;
    std::vector<uint8_t> m_output;
    int m_lastIndex = -1;
    int m_lastNext = -1;
    double m_lastLerp = -1.0;
};

} // namespace layershift
