#pragma once

/**
 * @file ffmpeg_decoder.h
 * @brief libavformat/libavcodec demux + decode to RGBA8
 *
 * Shared by file playback, V4L2 capture and frame extraction. Opens the
 * first video stream of a URL, decodes with the default decoder and
 * converts every frame to tightly packed RGBA through swscale.
 */

#include <cstdint>
#include <string>
#include <vector>

struct AVFormatContext;
struct AVCodecContext;
struct AVPacket;
struct AVFrame;
struct SwsContext;

namespace layershift::video {

struct DecoderInfo {
    int width = 0;
    int height = 0;
    double duration = 0.0;      ///< Seconds, 0 when unknown (live)
    double frameRate = 30.0;
};

struct DecoderOpenOptions {
    std::string inputFormat;    ///< e.g. "video4linux2"; empty probes the URL
    std::string videoSize;      ///< Capture size hint, "1280x720"
    std::string frameRate;      ///< Capture rate hint
    bool nonBlocking = false;   ///< Reads return WouldBlock instead of waiting
};

class FfmpegDecoder {
public:
    enum class ReadResult {
        Frame,
        WouldBlock,
        EndOfStream,
        Error
    };

    FfmpegDecoder();
    ~FfmpegDecoder();

    FfmpegDecoder(const FfmpegDecoder&) = delete;
    FfmpegDecoder& operator=(const FfmpegDecoder&) = delete;

    /// @return false with error() set
    bool open(const std::string& url, const DecoderOpenOptions& options = {});
    void close();
    bool isOpen() const { return m_formatCtx != nullptr; }

    /**
     * @brief Decode the next frame into rgba (resized to width*height*4)
     * @param pts Presentation time in seconds, or the previous pts + 1/fps
     *            when the stream carries none
     */
    ReadResult readFrame(std::vector<uint8_t>& rgba, double& pts);

    /// @brief Seek to the stream start and flush the decoder
    bool rewind();

    const DecoderInfo& info() const { return m_info; }
    const std::string& error() const { return m_error; }

private:
    bool fail(const std::string& msg);
    bool convert(std::vector<uint8_t>& rgba);

    AVFormatContext* m_formatCtx = nullptr;
    AVCodecContext* m_codecCtx = nullptr;
    AVPacket* m_packet = nullptr;
    AVFrame* m_frame = nullptr;
    SwsContext* m_swsCtx = nullptr;
    int m_swsFormat = -1;
    int m_swsWidth = 0;
    int m_swsHeight = 0;

    int m_videoStream = -1;
    double m_timeBase = 0.0;
    double m_lastPts = -1.0;
    bool m_draining = false;

    DecoderInfo m_info;
    std::string m_error;
};

} // namespace layershift::video
