// Layershift - FFmpeg video and camera sources

#include <layershift/video/video_source.h>
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace layershift::video {

namespace {

// Larger host stalls (window drags, breakpoints) do not fast-forward playback
constexpr double MAX_CLOCK_STEP = 0.25;

} // namespace

// -----------------------------------------------------------------------------
// VideoSource
// -----------------------------------------------------------------------------

VideoSource::VideoSource() = default;

VideoSource::~VideoSource() {
    dispose();
}

bool VideoSource::open(const std::string& path, bool loop) {
    if (!m_decoder.open(path)) {
        return false;
    }
    m_loop = loop;
    m_playing = false;
    m_ended = false;
    m_clock = 0.0;
    m_lastNow = -1.0;
    m_hasNext = false;

    // First frame up front so renderers can size their textures
    double pts = 0.0;
    if (m_decoder.readFrame(m_frame.rgba, pts) != FfmpegDecoder::ReadResult::Frame) {
        m_decoder.close();
        std::cerr << "[VideoSource] No frames in " << path << std::endl;
        return false;
    }
    m_startPts = pts;
    m_frame.width = m_decoder.info().width;
    m_frame.height = m_decoder.info().height;
    m_currentTime = 0.0;
    presentFrame(0.0);
    return true;
}

void VideoSource::play() {
    if (!m_decoder.isOpen()) return;
    if (m_ended) {
        m_ended = false;
        m_clock = 0.0;
        m_hasNext = false;
        m_decoder.rewind();
    }
    m_playing = true;
    m_lastNow = -1.0;
}

void VideoSource::pause() {
    m_playing = false;
}

bool VideoSource::decodeNext() {
    bool rewound = false;
    while (true) {
        double pts = 0.0;
        switch (m_decoder.readFrame(m_next, pts)) {
            case FfmpegDecoder::ReadResult::Frame:
                m_nextTime = std::max(0.0, pts - m_startPts);
                m_hasNext = true;
                return true;
            case FfmpegDecoder::ReadResult::WouldBlock:
                return false;
            case FfmpegDecoder::ReadResult::EndOfStream:
                // A stream that ends right after a rewind has nothing to loop over
                if (!m_loop || rewound || !m_decoder.rewind()) {
                    m_ended = true;
                    m_playing = false;
                    return false;
                }
                rewound = true;
                m_clock = std::max(0.0, m_clock - std::max(m_currentTime, duration()));
                notifyLoop();
                break;
            case FfmpegDecoder::ReadResult::Error:
                m_playing = false;
                return false;
        }
    }
}

void VideoSource::update(double nowSeconds) {
    if (!m_playing) {
        m_lastNow = nowSeconds;
        return;
    }
    if (m_lastNow >= 0.0) {
        m_clock += std::clamp(nowSeconds - m_lastNow, 0.0, MAX_CLOCK_STEP);
    }
    m_lastNow = nowSeconds;

    // Skip to the newest frame that is due
    bool presented = false;
    while (m_playing) {
        if (!m_hasNext && !decodeNext()) break;
        if (m_nextTime > m_clock) break;
        m_frame.rgba.swap(m_next);
        m_frame.width = m_decoder.info().width;
        m_frame.height = m_decoder.info().height;
        m_currentTime = m_nextTime;
        m_hasNext = false;
        presented = true;
    }
    if (presented) {
        presentFrame(m_currentTime);
    }
}

void VideoSource::dispose() {
    m_playing = false;
    m_decoder.close();
    m_next.clear();
    m_hasNext = false;
}

// -----------------------------------------------------------------------------
// CameraSource
// -----------------------------------------------------------------------------

CameraSource::CameraSource() = default;

CameraSource::~CameraSource() {
    dispose();
}

bool CameraSource::open(const std::string& device, const CameraOptions& options) {
    DecoderOpenOptions opts;
    opts.inputFormat = "video4linux2";
    opts.videoSize = options.videoSize;
    opts.frameRate = options.frameRate;
    opts.nonBlocking = true;
    if (!m_decoder.open(device, opts)) {
        return false;
    }
    m_frame.width = m_decoder.info().width;
    m_frame.height = m_decoder.info().height;
    // Black until the first capture lands
    m_frame.rgba.assign(static_cast<size_t>(m_frame.width) * m_frame.height * 4, 0);
    m_startNow = -1.0;
    m_playing = true;
    std::cout << "[CameraSource] Capturing " << device << std::endl;
    return true;
}

void CameraSource::update(double nowSeconds) {
    if (!m_decoder.isOpen()) return;
    if (m_startNow < 0.0) m_startNow = nowSeconds;

    // Drain everything queued so the newest capture wins
    bool captured = false;
    double pts = 0.0;
    while (m_decoder.readFrame(m_scratch, pts) == FfmpegDecoder::ReadResult::Frame) {
        captured = true;
        if (!m_playing) continue;
        m_frame.rgba.swap(m_scratch);
        m_frame.width = m_decoder.info().width;
        m_frame.height = m_decoder.info().height;
    }
    if (captured && m_playing) {
        m_currentTime = nowSeconds - m_startNow;
        presentFrame(m_currentTime);
    }
}

void CameraSource::dispose() {
    m_decoder.close();
    m_scratch.clear();
}

// -----------------------------------------------------------------------------
// Factory
// -----------------------------------------------------------------------------

std::unique_ptr<MediaSource> openMediaSource(const std::string& src, MediaKind kind) {
    switch (kind) {
        case MediaKind::Image:
            return loadImageSource(src);
        case MediaKind::Video: {
            auto video = std::make_unique<VideoSource>();
            if (!video->open(src)) {
                throw std::runtime_error("Failed to open video: " + video->error());
            }
            return video;
        }
        case MediaKind::Camera: {
            auto camera = std::make_unique<CameraSource>();
            if (!camera->open(src)) {
                throw std::runtime_error("Failed to open camera: " + camera->error());
            }
            return camera;
        }
    }
    throw std::invalid_argument("Unknown media kind");
}

} // namespace layershift::video
