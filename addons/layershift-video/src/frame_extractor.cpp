// Layershift - Fixed-rate frame extraction

#include <layershift/video/frame_extractor.h>
#include <layershift/video/ffmpeg_decoder.h>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace layershift::video {

ExtractionSummary extractFrames(const std::string& path, double fps, const ExtractedFrameCallback& onFrame) {
    if (!(fps > 0.0) || !std::isfinite(fps)) {
        throw std::invalid_argument("Extraction fps must be positive");
    }

    FfmpegDecoder decoder;
    if (!decoder.open(path)) {
        throw std::runtime_error("Failed to open video: " + decoder.error());
    }

    ExtractionSummary summary;
    summary.sourceFps = decoder.info().frameRate;
    summary.duration = decoder.info().duration;

    MediaFrame frame;
    double pts = 0.0;
    double startPts = -1.0;
    double nextSample = 0.0;

    while (true) {
        FfmpegDecoder::ReadResult result = decoder.readFrame(frame.rgba, pts);
        if (result == FfmpegDecoder::ReadResult::EndOfStream) break;
        if (result != FfmpegDecoder::ReadResult::Frame) {
            throw std::runtime_error("Decoding failed in " + path);
        }
        if (startPts < 0.0) startPts = pts;

        const double t = pts - startPts;
        frame.width = decoder.info().width;
        frame.height = decoder.info().height;
        frame.serial++;

        // Sparse streams repeat a frame for every sample it covers
        while (nextSample <= t + 1e-6) {
            if (onFrame) onFrame(frame, summary.frameCount, nextSample);
            summary.frameCount++;
            nextSample = summary.frameCount / fps;
        }
    }

    if (summary.frameCount == 0) {
        throw std::runtime_error("No frames decoded from " + path);
    }
    summary.width = decoder.info().width;
    summary.height = decoder.info().height;
    std::cout << "[FrameExtractor] " << summary.frameCount << " frames at " << fps << "fps from "
              << path << std::endl;
    return summary;
}

} // namespace layershift::video
