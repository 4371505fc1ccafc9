// Layershift - FFmpeg demux/decode to RGBA

#include <layershift/video/ffmpeg_decoder.h>
#include <iostream>
#include <mutex>

extern "C" {
#include <libavdevice/avdevice.h>
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}

namespace layershift::video {

namespace {

std::string avError(int code) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(code, buf, sizeof(buf));
    return buf;
}

void registerDevices() {
    static std::once_flag once;
    std::call_once(once, []() { avdevice_register_all(); });
}

} // namespace

FfmpegDecoder::FfmpegDecoder() = default;

FfmpegDecoder::~FfmpegDecoder() {
    close();
}

bool FfmpegDecoder::fail(const std::string& msg) {
    m_error = msg;
    std::cerr << "[FfmpegDecoder] " << msg << std::endl;
    close();
    return false;
}

bool FfmpegDecoder::open(const std::string& url, const DecoderOpenOptions& options) {
    close();
    m_error.clear();

    AVDictionary* dict = nullptr;
    if (!options.videoSize.empty()) av_dict_set(&dict, "video_size", options.videoSize.c_str(), 0);
    if (!options.frameRate.empty()) av_dict_set(&dict, "framerate", options.frameRate.c_str(), 0);

    int ret = 0;
    if (!options.inputFormat.empty()) {
        registerDevices();
        auto* inputFormat = av_find_input_format(options.inputFormat.c_str());
        if (!inputFormat) {
            av_dict_free(&dict);
            return fail("Unknown input format: " + options.inputFormat);
        }
        ret = avformat_open_input(&m_formatCtx, url.c_str(), inputFormat, &dict);
    } else {
        ret = avformat_open_input(&m_formatCtx, url.c_str(), nullptr, &dict);
    }
    av_dict_free(&dict);
    if (ret < 0) {
        m_formatCtx = nullptr;
        return fail("Failed to open " + url + ": " + avError(ret));
    }

    if (options.nonBlocking) {
        m_formatCtx->flags |= AVFMT_FLAG_NONBLOCK;
    }

    if (avformat_find_stream_info(m_formatCtx, nullptr) < 0) {
        return fail("Failed to find stream info: " + url);
    }

    const AVCodec* codec = nullptr;
    m_videoStream = av_find_best_stream(m_formatCtx, AVMEDIA_TYPE_VIDEO, -1, -1, &codec, 0);
    if (m_videoStream < 0 || !codec) {
        return fail("No decodable video stream in " + url);
    }

    AVStream* stream = m_formatCtx->streams[m_videoStream];
    m_codecCtx = avcodec_alloc_context3(codec);
    if (!m_codecCtx) {
        return fail("Failed to allocate codec context");
    }
    if (avcodec_parameters_to_context(m_codecCtx, stream->codecpar) < 0) {
        return fail("Failed to copy codec params");
    }
    if ((ret = avcodec_open2(m_codecCtx, codec, nullptr)) < 0) {
        return fail("Failed to open codec: " + avError(ret));
    }

    m_info.width = stream->codecpar->width;
    m_info.height = stream->codecpar->height;
    m_info.duration = m_formatCtx->duration > 0
        ? static_cast<double>(m_formatCtx->duration) / AV_TIME_BASE : 0.0;
    if (stream->avg_frame_rate.den > 0 && stream->avg_frame_rate.num > 0) {
        m_info.frameRate = av_q2d(stream->avg_frame_rate);
    } else if (stream->r_frame_rate.den > 0 && stream->r_frame_rate.num > 0) {
        m_info.frameRate = av_q2d(stream->r_frame_rate);
    } else {
        m_info.frameRate = 30.0;
    }
    m_timeBase = av_q2d(stream->time_base);

    m_packet = av_packet_alloc();
    m_frame = av_frame_alloc();
    if (!m_packet || !m_frame) {
        return fail("Failed to allocate packet/frame");
    }

    std::cout << "[FfmpegDecoder] Opened " << url << " (" << m_info.width << "x" << m_info.height
              << ", " << m_info.frameRate << "fps, " << codec->name << ")" << std::endl;
    return true;
}

void FfmpegDecoder::close() {
    if (m_swsCtx) {
        sws_freeContext(m_swsCtx);
        m_swsCtx = nullptr;
    }
    if (m_frame) av_frame_free(&m_frame);
    if (m_packet) av_packet_free(&m_packet);
    if (m_codecCtx) avcodec_free_context(&m_codecCtx);
    if (m_formatCtx) avformat_close_input(&m_formatCtx);

    m_swsFormat = -1;
    m_swsWidth = 0;
    m_swsHeight = 0;
    m_videoStream = -1;
    m_lastPts = -1.0;
    m_draining = false;
    m_info = {};
}

FfmpegDecoder::ReadResult FfmpegDecoder::readFrame(std::vector<uint8_t>& rgba, double& pts) {
    if (!m_formatCtx || !m_codecCtx) return ReadResult::Error;

    while (true) {
        int ret = avcodec_receive_frame(m_codecCtx, m_frame);
        if (ret == 0) break;
        if (ret == AVERROR_EOF) return ReadResult::EndOfStream;
        if (ret != AVERROR(EAGAIN)) {
            std::cerr << "[FfmpegDecoder] Error receiving frame: " << avError(ret) << std::endl;
            return ReadResult::Error;
        }
        if (m_draining) return ReadResult::EndOfStream;

        ret = av_read_frame(m_formatCtx, m_packet);
        if (ret == AVERROR(EAGAIN)) {
            return ReadResult::WouldBlock;
        }
        if (ret == AVERROR_EOF) {
            // Flush frames still buffered in the decoder
            avcodec_send_packet(m_codecCtx, nullptr);
            m_draining = true;
            continue;
        }
        if (ret < 0) {
            std::cerr << "[FfmpegDecoder] Error reading packet: " << avError(ret) << std::endl;
            return ReadResult::Error;
        }

        if (m_packet->stream_index != m_videoStream) {
            av_packet_unref(m_packet);
            continue;
        }
        ret = avcodec_send_packet(m_codecCtx, m_packet);
        av_packet_unref(m_packet);
        if (ret < 0 && ret != AVERROR(EAGAIN)) {
            std::cerr << "[FfmpegDecoder] Error sending packet: " << avError(ret) << std::endl;
        }
    }

    int64_t ts = m_frame->best_effort_timestamp;
    if (ts == AV_NOPTS_VALUE) ts = m_frame->pts;
    if (ts != AV_NOPTS_VALUE) {
        pts = static_cast<double>(ts) * m_timeBase;
    } else {
        pts = m_lastPts < 0.0 ? 0.0 : m_lastPts + 1.0 / m_info.frameRate;
    }
    m_lastPts = pts;

    bool ok = convert(rgba);
    av_frame_unref(m_frame);
    return ok ? ReadResult::Frame : ReadResult::Error;
}

bool FfmpegDecoder::convert(std::vector<uint8_t>& rgba) {
    const int width = m_frame->width;
    const int height = m_frame->height;

    if (!m_swsCtx || m_swsFormat != m_frame->format || m_swsWidth != width || m_swsHeight != height) {
        if (m_swsCtx) sws_freeContext(m_swsCtx);
        m_swsCtx = sws_getContext(width, height, static_cast<AVPixelFormat>(m_frame->format),
                                  width, height, AV_PIX_FMT_RGBA,
                                  SWS_BILINEAR, nullptr, nullptr, nullptr);
        if (!m_swsCtx) {
            const char* fmtName = av_get_pix_fmt_name(static_cast<AVPixelFormat>(m_frame->format));
            std::cerr << "[FfmpegDecoder] Cannot convert pixel format: "
                      << (fmtName ? fmtName : "unknown") << std::endl;
            return false;
        }
        m_swsFormat = m_frame->format;
        m_swsWidth = width;
        m_swsHeight = height;
    }

    rgba.resize(static_cast<size_t>(width) * height * 4);
    uint8_t* dstData[1] = {rgba.data()};
    int dstLinesize[1] = {width * 4};
    sws_scale(m_swsCtx, m_frame->data, m_frame->linesize, 0, height, dstData, dstLinesize);

    m_info.width = width;
    m_info.height = height;
    return true;
}

bool FfmpegDecoder::rewind() {
    if (!m_formatCtx) return false;

    int ret = av_seek_frame(m_formatCtx, m_videoStream, 0, AVSEEK_FLAG_BACKWARD);
    if (ret < 0) {
        std::cerr << "[FfmpegDecoder] Seek failed: " << avError(ret) << std::endl;
        return false;
    }
    avcodec_flush_buffers(m_codecCtx);
    m_draining = false;
    m_lastPts = -1.0;
    return true;
}

} // namespace layershift::video
