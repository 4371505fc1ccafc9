// Layershift - Precomputed depth loading and interpolation

#include <layershift/depth_frames.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace layershift {

namespace {

constexpr size_t READ_CHUNK_BYTES = 1 << 20;

double requireNumber(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_number()) {
        throw std::runtime_error("Depth metadata is malformed.");
    }
    return j[key].get<double>();
}

} // namespace

DepthMeta parseDepthMeta(const std::string& jsonText) {
    json j;
    try {
        j = json::parse(jsonText);
    } catch (const json::parse_error&) {
        throw std::runtime_error("Depth metadata is malformed.");
    }
    if (!j.is_object()) {
        throw std::runtime_error("Depth metadata is malformed.");
    }

    const double frameCount = requireNumber(j, "frameCount");
    const double fps = requireNumber(j, "fps");
    const double width = requireNumber(j, "width");
    const double height = requireNumber(j, "height");
    const double sourceFps = requireNumber(j, "sourceFps");

    for (double v : {frameCount, fps, width, height, sourceFps}) {
        if (!std::isfinite(v) || v <= 0.0) {
            throw std::runtime_error("Depth metadata contains invalid numeric values.");
        }
    }

    DepthMeta meta;
    meta.frameCount = static_cast<int>(frameCount);
    meta.fps = fps;
    meta.width = static_cast<int>(width);
    meta.height = static_cast<int>(height);
    meta.sourceFps = sourceFps;
    return meta;
}

std::string serializeDepthMeta(const DepthMeta& meta) {
    json j = {
        {"frameCount", meta.frameCount},
        {"fps", meta.fps},
        {"width", meta.width},
        {"height", meta.height},
        {"sourceFps", meta.sourceFps},
    };
    return j.dump(2);
}

DepthFrameSet unpackDepthFrames(const std::vector<uint8_t>& packed, const DepthMeta& meta) {
    if (packed.size() < 4) {
        throw std::runtime_error("Depth data binary is missing the frame-count header.");
    }

    const uint32_t headerCount = static_cast<uint32_t>(packed[0]) |
                                 (static_cast<uint32_t>(packed[1]) << 8) |
                                 (static_cast<uint32_t>(packed[2]) << 16) |
                                 (static_cast<uint32_t>(packed[3]) << 24);
    const size_t frameSize = static_cast<size_t>(meta.width) * static_cast<size_t>(meta.height);
    const size_t expected = 4 + static_cast<size_t>(headerCount) * frameSize;

    if (packed.size() != expected) {
        throw std::runtime_error("Depth data byte length mismatch. Expected " +
                                 std::to_string(expected) + " bytes, received " +
                                 std::to_string(packed.size()) + ".");
    }
    if (headerCount != static_cast<uint32_t>(meta.frameCount)) {
        throw std::runtime_error("Depth frame count mismatch between metadata (" +
                                 std::to_string(meta.frameCount) + ") and binary header (" +
                                 std::to_string(headerCount) + ").");
    }

    DepthFrameSet set;
    set.meta = meta;
    set.frames.reserve(headerCount);
    auto payload = packed.begin() + 4;
    for (uint32_t i = 0; i < headerCount; ++i) {
        auto start = payload + static_cast<std::ptrdiff_t>(i * frameSize);
        set.frames.emplace_back(start, start + static_cast<std::ptrdiff_t>(frameSize));
    }
    return set;
}

std::vector<uint8_t> packDepthFrames(const std::vector<std::vector<uint8_t>>& frames) {
    size_t total = 4;
    for (const auto& f : frames) total += f.size();

    std::vector<uint8_t> out;
    out.reserve(total);
    const uint32_t count = static_cast<uint32_t>(frames.size());
    out.push_back(static_cast<uint8_t>(count & 0xff));
    out.push_back(static_cast<uint8_t>((count >> 8) & 0xff));
    out.push_back(static_cast<uint8_t>((count >> 16) & 0xff));
    out.push_back(static_cast<uint8_t>((count >> 24) & 0xff));
    for (const auto& f : frames) {
        out.insert(out.end(), f.begin(), f.end());
    }
    return out;
}

DepthFrameSet loadDepthFrameSet(const std::filesystem::path& dataPath,
                                const std::filesystem::path& metaPath,
                                const LoadProgressCallback& onProgress) {
    std::ifstream metaFile(metaPath);
    if (!metaFile.is_open()) {
        throw std::runtime_error("Failed to open depth metadata: " + metaPath.string());
    }
    std::string metaText((std::istreambuf_iterator<char>(metaFile)), std::istreambuf_iterator<char>());
    DepthMeta meta = parseDepthMeta(metaText);

    std::ifstream dataFile(dataPath, std::ios::binary);
    if (!dataFile.is_open()) {
        throw std::runtime_error("Failed to open depth data: " + dataPath.string());
    }

    std::optional<uint64_t> totalBytes;
    std::error_code ec;
    auto size = std::filesystem::file_size(dataPath, ec);
    if (!ec) totalBytes = size;

    std::vector<uint8_t> packed;
    if (totalBytes) packed.reserve(static_cast<size_t>(*totalBytes));

    std::vector<char> chunk(READ_CHUNK_BYTES);
    uint64_t received = 0;
    while (dataFile) {
        dataFile.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        std::streamsize n = dataFile.gcount();
        if (n <= 0) break;
        packed.insert(packed.end(), chunk.begin(), chunk.begin() + n);
        received += static_cast<uint64_t>(n);
        if (onProgress) {
            LoadProgress p;
            p.receivedBytes = received;
            p.totalBytes = totalBytes;
            p.fraction = totalBytes && *totalBytes > 0
                ? std::clamp(static_cast<double>(received) / static_cast<double>(*totalBytes), 0.0, 1.0)
                : 0.0;
            onProgress(p);
        }
    }

    if (onProgress) {
        onProgress({received, totalBytes, 1.0});
    }

    DepthFrameSet set = unpackDepthFrames(packed, meta);
    std::cout << "[DepthFrames] Loaded " << set.frameCount() << " frames ("
              << meta.width << "x" << meta.height << " @ " << meta.fps << " fps)" << std::endl;
    return set;
}

std::vector<uint8_t> createFlatDepth(int width, int height, uint8_t value) {
    return std::vector<uint8_t>(static_cast<size_t>(std::max(width, 0)) * static_cast<size_t>(std::max(height, 0)), value);
}

// -----------------------------------------------------------------------------
// DepthFrameInterpolator
// -----------------------------------------------------------------------------

DepthFrameInterpolator::DepthFrameInterpolator(std::shared_ptr<const DepthFrameSet> frames)
    : m_frames(std::move(frames)) {
    if (!m_frames || m_frames->frames.empty()) {
        throw std::invalid_argument("DepthFrameInterpolator requires at least one frame");
    }
    m_output.resize(static_cast<size_t>(m_frames->width()) * static_cast<size_t>(m_frames->height()));
}

const uint8_t* DepthFrameInterpolator::sample(double timeSeconds) {
    const int count = m_frames->frameCount();
    const double depthTime = std::clamp(timeSeconds * m_frames->meta.fps, 0.0, static_cast<double>(count - 1));
    const int index = static_cast<int>(std::floor(depthTime));
    const int next = std::min(index + 1, count - 1);
    const double lerp = depthTime - index;

    const bool framesChanged = index != m_lastIndex || next != m_lastNext;
    const bool lerpChanged = std::abs(lerp - m_lastLerp) > 0.001;
    if (!framesChanged && !lerpChanged) {
        return m_output.data();
    }
    m_lastIndex = index;
    m_lastNext = next;
    m_lastLerp = lerp;

    const double inverse = 1.0 - lerp;
    const auto& a = m_frames->frames[static_cast<size_t>(index)];
    const auto& b = m_frames->frames[static_cast<size_t>(next)];
    for (size_t i = 0; i < m_output.size(); ++i) {
        m_output[i] = static_cast<uint8_t>(a[i] * inverse + b[i] * lerp + 0.5);
    }
    return m_output.data();
}

} // namespace layershift
