#pragma once

/**
 * @file media_source.h
 * @brief Uniform read interface over video, camera and still-image sources
 *
 * Renderers never branch on the source type. They read the current RGBA
 * frame, and for live sources they subscribe to frame presentation through
 * requestFrameCallback(), which fires once per newly presented frame.
 *
 * Video and camera sources live in the layershift-video addon; still images
 * are loaded here with stb_image.
 */

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace layershift {

enum class MediaKind {
    Video,
    Image,
    Camera
};

const char* mediaKindName(MediaKind kind);

/// One decoded RGBA8 frame. serial increases each time the pixels change.
struct MediaFrame {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> rgba;
    uint64_t serial = 0;

    bool empty() const { return rgba.empty(); }
};

class MediaSource {
public:
    using FrameCallbackId = uint64_t;
    /// (mediaTime seconds, presented frame count)
    using FrameCallback = std::function<void(double mediaTime, uint64_t presentedFrames)>;

    virtual ~MediaSource() = default;

    virtual MediaKind kind() const = 0;
    virtual int width() const = 0;
    virtual int height() const = 0;
    virtual double currentTime() const = 0;
    virtual double duration() const { return 0.0; }

    /// True for continuous frame streams (video and camera)
    bool isLive() const { return kind() != MediaKind::Image; }

    /// @brief The latest decoded frame; empty until the first decode
    virtual const MediaFrame& currentFrame() const = 0;

    /// @brief Whether requestFrameCallback() delivers presentation notifications
    virtual bool supportsFrameCallbacks() const { return false; }

    /**
     * @brief Run cb once, when the next frame is presented
     * @return Handle for cancelFrameCallback(), 0 when unsupported
     */
    virtual FrameCallbackId requestFrameCallback(FrameCallback cb) { (void)cb; return 0; }
    virtual void cancelFrameCallback(FrameCallbackId id) { (void)id; }

    virtual void play() {}
    virtual void pause() {}
    virtual bool paused() const { return true; }

    /**
     * @brief Advance playback to host time
     *
     * Called by the host once per loop iteration on the render thread.
     * Presentation callbacks fire from inside this call.
     */
    virtual void update(double nowSeconds) { (void)nowSeconds; }

    virtual void dispose() {}

    /// Fired when a looping source wraps back to its start
    void setLoopCallback(std::function<void()> cb) { m_onLoop = std::move(cb); }

protected:
    std::function<void()> m_onLoop;
};

/**
 * @brief Base for sources that present frames over time
 *
 * Keeps the one-shot callback registry. Subclasses decode into m_frame and
 * call presentFrame() once the new pixels are in place.
 */
class PresentingMediaSource : public MediaSource {
public:
    const MediaFrame& currentFrame() const override { return m_frame; }

    bool supportsFrameCallbacks() const override { return true; }
    FrameCallbackId requestFrameCallback(FrameCallback cb) override;
    void cancelFrameCallback(FrameCallbackId id) override;

    uint64_t presentedFrames() const { return m_presented; }
    size_t pendingFrameCallbacks() const { return m_callbacks.size(); }

protected:
    /// @brief Bump the frame serial and fire the callbacks registered so far
    void presentFrame(double mediaTime);
    void notifyLoop();

    MediaFrame m_frame;

private:
    std::map<FrameCallbackId, FrameCallback> m_callbacks;
    FrameCallbackId m_nextCallback = 1;
    uint64_t m_presented = 0;
};

/// @brief Static source; currentTime is always 0 and no frame callbacks exist
class ImageSource : public MediaSource {
public:
    /// @brief Wrap already-decoded RGBA8 pixels
    ImageSource(int width, int height, std::vector<uint8_t> rgba);

    MediaKind kind() const override { return MediaKind::Image; }
    int width() const override { return m_frame.width; }
    int height() const override { return m_frame.height; }
    double currentTime() const override { return 0.0; }
    const MediaFrame& currentFrame() const override { return m_frame; }
    void dispose() override;

private:
    MediaFrame m_frame;
};

/**
 * @brief Decode an image file (PNG, JPEG, BMP, TGA...) to RGBA8
 * @throws std::runtime_error when the file cannot be read or decoded
 */
std::unique_ptr<ImageSource> loadImageSource(const std::filesystem::path& path);

/// @brief Decode an in-memory encoded image
std::unique_ptr<ImageSource> decodeImageSource(const std::vector<uint8_t>& encoded);

} // namespace layershift
