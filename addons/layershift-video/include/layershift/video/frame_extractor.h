#pragma once

/**
 * @file frame_extractor.h
 * @brief Decode a video at a fixed sample rate (depth precompute input)
 */

#include <layershift/media_source.h>
#include <functional>
#include <string>

namespace layershift::video {

struct ExtractionSummary {
    int frameCount = 0;
    int width = 0;
    int height = 0;
    double sourceFps = 0.0;
    double duration = 0.0;
};

/// (frame, sample index, sample time in seconds)
using ExtractedFrameCallback = std::function<void(const MediaFrame& frame, int index, double time)>;

/**
 * @brief Deliver the frame showing at each t = k / fps
 *
 * Sample k takes the first decoded frame at or after k / fps, so the
 * frame count is about duration * fps.
 *
 * @throws std::runtime_error when the file cannot be opened or decoded
 * @throws std::invalid_argument for fps <= 0
 */
ExtractionSummary extractFrames(const std::string& path, double fps, const ExtractedFrameCallback& onFrame);

} // namespace layershift::video
