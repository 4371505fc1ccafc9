// Layershift - Media sources

#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

#include <layershift/media_source.h>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace layershift {

const char* mediaKindName(MediaKind kind) {
    switch (kind) {
        case MediaKind::Video: return "video";
        case MediaKind::Image: return "image";
        case MediaKind::Camera: return "camera";
    }
    return "video";
}

// -----------------------------------------------------------------------------
// PresentingMediaSource
// -----------------------------------------------------------------------------

MediaSource::FrameCallbackId PresentingMediaSource::requestFrameCallback(FrameCallback cb) {
    const FrameCallbackId id = m_nextCallback++;
    m_callbacks.emplace(id, std::move(cb));
    return id;
}

void PresentingMediaSource::cancelFrameCallback(FrameCallbackId id) {
    m_callbacks.erase(id);
}

void PresentingMediaSource::presentFrame(double mediaTime) {
    m_frame.serial++;
    const uint64_t presented = ++m_presented;

    // Callbacks re-register from inside; those wait for the next frame.
    // A callback may destroy this source, so nothing below touches members.
    std::map<FrameCallbackId, FrameCallback> ready;
    ready.swap(m_callbacks);
    for (auto& entry : ready) {
        entry.second(mediaTime, presented);
    }
}

void PresentingMediaSource::notifyLoop() {
    if (m_onLoop) m_onLoop();
}

// -----------------------------------------------------------------------------
// ImageSource
// -----------------------------------------------------------------------------

ImageSource::ImageSource(int width, int height, std::vector<uint8_t> rgba) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Image dimensions must be positive");
    }
    if (rgba.size() != static_cast<size_t>(width) * height * 4) {
        throw std::invalid_argument("Image pixel buffer does not match its dimensions");
    }
    m_frame.width = width;
    m_frame.height = height;
    m_frame.rgba = std::move(rgba);
    m_frame.serial = 1;
}

void ImageSource::dispose() {
    m_frame.rgba.clear();
    m_frame.rgba.shrink_to_fit();
}

namespace {

std::unique_ptr<ImageSource> wrapDecoded(unsigned char* data, int width, int height) {
    std::vector<uint8_t> pixels(data, data + static_cast<size_t>(width) * height * 4);
    stbi_image_free(data);
    return std::make_unique<ImageSource>(width, height, std::move(pixels));
}

} // namespace

std::unique_ptr<ImageSource> loadImageSource(const std::filesystem::path& path) {
    int width = 0, height = 0, channels = 0;
    unsigned char* data = stbi_load(path.string().c_str(), &width, &height, &channels, 4);
    if (!data) {
        throw std::runtime_error("Failed to load image '" + path.string() + "': " +
                                 stbi_failure_reason());
    }
    std::cout << "[ImageSource] " << path.filename().string() << " "
              << width << "x" << height << " (" << channels << " channels)" << std::endl;
    return wrapDecoded(data, width, height);
}

std::unique_ptr<ImageSource> decodeImageSource(const std::vector<uint8_t>& encoded) {
    int width = 0, height = 0, channels = 0;
    unsigned char* data = stbi_load_from_memory(encoded.data(), static_cast<int>(encoded.size()),
                                                &width, &height, &channels, 4);
    if (!data) {
        throw std::runtime_error(std::string("Failed to decode image: ") + stbi_failure_reason());
    }
    return wrapDecoded(data, width, height);
}

} // namespace layershift
