#pragma once

/**
 * @file video_source.h
 * @brief FFmpeg-backed MediaSource implementations
 *
 * VideoSource plays a file against the host clock, looping by default.
 * CameraSource captures from a V4L2 device without blocking the render
 * loop. Both present at most one frame per update() call.
 */

#include <layershift/media_source.h>
#include <layershift/video/ffmpeg_decoder.h>
#include <memory>
#include <string>

namespace layershift::video {

class VideoSource : public PresentingMediaSource {
public:
    VideoSource();
    ~VideoSource() override;

    /// @return false with error() set
    bool open(const std::string& path, bool loop = true);

    MediaKind kind() const override { return MediaKind::Video; }
    int width() const override { return m_frame.width; }
    int height() const override { return m_frame.height; }
    double currentTime() const override { return m_currentTime; }
    double duration() const override { return m_decoder.info().duration; }

    void play() override;
    void pause() override;
    bool paused() const override { return !m_playing; }
    bool ended() const { return m_ended; }

    void update(double nowSeconds) override;
    void dispose() override;

    const std::string& error() const { return m_decoder.error(); }

private:
    /// Fill m_next; false at a non-looping end or on error
    bool decodeNext();

    FfmpegDecoder m_decoder;
    bool m_loop = true;
    bool m_playing = false;
    bool m_ended = false;

    double m_clock = 0.0;           ///< Media time driven by update()
    double m_lastNow = -1.0;
    double m_currentTime = 0.0;
    double m_startPts = 0.0;

    std::vector<uint8_t> m_next;
    double m_nextTime = 0.0;
    bool m_hasNext = false;
};

struct CameraOptions {
    std::string videoSize;          ///< e.g. "1280x720"; empty keeps the driver default
    std::string frameRate;
};

class CameraSource : public PresentingMediaSource {
public:
    CameraSource();
    ~CameraSource() override;

    /// @brief Open a V4L2 device such as /dev/video0
    bool open(const std::string& device, const CameraOptions& options = {});

    MediaKind kind() const override { return MediaKind::Camera; }
    int width() const override { return m_frame.width; }
    int height() const override { return m_frame.height; }
    double currentTime() const override { return m_currentTime; }

    void play() override { m_playing = true; }
    void pause() override { m_playing = false; }
    bool paused() const override { return !m_playing; }

    void update(double nowSeconds) override;
    void dispose() override;

    const std::string& error() const { return m_decoder.error(); }

private:
    FfmpegDecoder m_decoder;
    std::vector<uint8_t> m_scratch;
    bool m_playing = true;
    double m_startNow = -1.0;
    double m_currentTime = 0.0;
};

/**
 * @brief Open any source kind; images go through stb_image
 * @throws std::runtime_error when the source cannot be opened
 */
std::unique_ptr<MediaSource> openMediaSource(const std::string& src, MediaKind kind);

} // namespace layershift::video
