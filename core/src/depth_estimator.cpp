// Layershift - Depth estimation bridge (double-buffered)

#include <layershift/depth_estimator.h>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace layershift {

namespace {

constexpr float IMAGENET_MEAN[3] = {0.485f, 0.456f, 0.406f};
constexpr float IMAGENET_STD[3] = {0.229f, 0.224f, 0.225f};
constexpr uint8_t FLAT_DEPTH = 128;

} // namespace

std::vector<float> preprocessFrame(const uint8_t* rgba, int width, int height, int size) {
    const size_t channel = static_cast<size_t>(size) * static_cast<size_t>(size);
    std::vector<float> tensor(3 * channel);

    const float xRatio = static_cast<float>(width) / static_cast<float>(size);
    const float yRatio = static_cast<float>(height) / static_cast<float>(size);

    for (int y = 0; y < size; ++y) {
        const float sy = std::clamp((y + 0.5f) * yRatio - 0.5f, 0.0f, static_cast<float>(height - 1));
        const int y0 = static_cast<int>(sy);
        const int y1 = std::min(y0 + 1, height - 1);
        const float ty = sy - static_cast<float>(y0);

        for (int x = 0; x < size; ++x) {
            const float sx = std::clamp((x + 0.5f) * xRatio - 0.5f, 0.0f, static_cast<float>(width - 1));
            const int x0 = static_cast<int>(sx);
            const int x1 = std::min(x0 + 1, width - 1);
            const float tx = sx - static_cast<float>(x0);

            const size_t dst = static_cast<size_t>(y) * size + x;
            for (int c = 0; c < 3; ++c) {
                const float v00 = rgba[(static_cast<size_t>(y0) * width + x0) * 4 + c];
                const float v01 = rgba[(static_cast<size_t>(y0) * width + x1) * 4 + c];
                const float v10 = rgba[(static_cast<size_t>(y1) * width + x0) * 4 + c];
                const float v11 = rgba[(static_cast<size_t>(y1) * width + x1) * 4 + c];
                const float top = v00 + (v01 - v00) * tx;
                const float bottom = v10 + (v11 - v10) * tx;
                const float v = (top + (bottom - top) * ty) / 255.0f;
                tensor[c * channel + dst] = (v - IMAGENET_MEAN[c]) / IMAGENET_STD[c];
            }
        }
    }
    return tensor;
}

void postprocessDepth(const DepthModelOutput& output, int dstW, int dstH, std::vector<uint8_t>& dst) {
    const int srcW = output.width;
    const int srcH = output.height;
    dst.resize(static_cast<size_t>(dstW) * static_cast<size_t>(dstH));

    float minV = std::numeric_limits<float>::infinity();
    float maxV = -std::numeric_limits<float>::infinity();
    for (float v : output.data) {
        minV = std::min(minV, v);
        maxV = std::max(maxV, v);
    }
    float range = maxV - minV;
    if (range == 0.0f || !std::isfinite(range)) range = 1.0f;

    const float xRatio = static_cast<float>(srcW) / static_cast<float>(dstW);
    const float yRatio = static_cast<float>(srcH) / static_cast<float>(dstH);
    const float* src = output.data.data();

    for (int y = 0; y < dstH; ++y) {
        const float sy = y * yRatio;
        const int y0 = static_cast<int>(sy);
        const int y1 = std::min(y0 + 1, srcH - 1);
        const float yf = sy - static_cast<float>(y0);

        for (int x = 0; x < dstW; ++x) {
            const float sx = x * xRatio;
            const int x0 = static_cast<int>(sx);
            const int x1 = std::min(x0 + 1, srcW - 1);
            const float xf = sx - static_cast<float>(x0);

            const float v = src[y0 * srcW + x0] * (1.0f - xf) * (1.0f - yf) +
                            src[y0 * srcW + x1] * xf * (1.0f - yf) +
                            src[y1 * srcW + x0] * (1.0f - xf) * yf +
                            src[y1 * srcW + x1] * xf * yf;
            const float norm = std::clamp((v - minV) / range, 0.0f, 1.0f);
            dst[static_cast<size_t>(y) * dstW + x] = static_cast<uint8_t>(norm * 255.0f + 0.5f);
        }
    }
}

// -----------------------------------------------------------------------------
// DepthEstimator
// -----------------------------------------------------------------------------

DepthEstimator::DepthEstimator(std::shared_ptr<DepthModel> model, int depthWidth, int depthHeight)
    : m_model(std::move(model))
    , m_width(depthWidth)
    , m_height(depthHeight)
    , m_front(createFlatDepth(depthWidth, depthHeight, FLAT_DEPTH))
    , m_back(createFlatDepth(depthWidth, depthHeight, FLAT_DEPTH))
    , m_read(createFlatDepth(depthWidth, depthHeight, FLAT_DEPTH)) {
    m_worker = std::thread([this] { workerLoop(); });
}

DepthEstimator::~DepthEstimator() {
    dispose();
}

bool DepthEstimator::submitFrame(const uint8_t* rgba, int width, int height) {
    if (m_disposed.load() || !m_model || !rgba || width <= 0 || height <= 0) {
        return false;
    }
    bool expected = false;
    if (!m_inFlight.compare_exchange_strong(expected, true)) {
        return false;
    }

    Job job;
    job.rgba.assign(rgba, rgba + static_cast<size_t>(width) * height * 4);
    job.width = width;
    job.height = height;
    {
        std::lock_guard<std::mutex> lock(m_jobMutex);
        m_pending = std::move(job);
    }
    m_jobCv.notify_one();
    return true;
}

const std::vector<uint8_t>& DepthEstimator::submitFrameAndWait(const uint8_t* rgba, int width, int height) {
    if (m_disposed.load() || !m_model || !rgba || width <= 0 || height <= 0) {
        return latestDepth();
    }

    {
        std::unique_lock<std::mutex> lock(m_jobMutex);
        m_doneCv.wait(lock, [this] {
            if (m_stopWorker) return true;
            bool expected = false;
            return m_inFlight.compare_exchange_strong(expected, true);
        });
        if (m_stopWorker) {
            lock.unlock();
            return latestDepth();
        }

        Job job;
        job.rgba.assign(rgba, rgba + static_cast<size_t>(width) * height * 4);
        job.width = width;
        job.height = height;
        job.waited = true;
        m_waitedDone = false;
        m_pending = std::move(job);
        m_jobCv.notify_one();

        m_doneCv.wait(lock, [this] { return m_waitedDone || m_stopWorker; });
    }
    return latestDepth();
}

const std::vector<uint8_t>& DepthEstimator::latestDepth() {
    std::lock_guard<std::mutex> lock(m_bufferMutex);
    const uint64_t generation = m_generation.load();
    if (generation != m_readGeneration) {
        m_read = m_front;
        m_readGeneration = generation;
    }
    return m_read;
}

void DepthEstimator::copyLatestDepth(std::vector<uint8_t>& out) const {
    std::lock_guard<std::mutex> lock(m_bufferMutex);
    out = m_front;
}

const uint8_t* DepthEstimator::sample(double /*timeSeconds*/) {
    return latestDepth().data();
}

void DepthEstimator::dispose() {
    if (m_disposed.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_jobMutex);
        m_stopWorker = true;
    }
    m_jobCv.notify_all();
    m_doneCv.notify_all();
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void DepthEstimator::workerLoop() {
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(m_jobMutex);
            m_jobCv.wait(lock, [this] { return m_stopWorker || m_pending.has_value(); });
            if (m_stopWorker) {
                m_inFlight = false;
                return;
            }
            job = std::move(*m_pending);
            m_pending.reset();
        }

        runInference(job);

        {
            std::lock_guard<std::mutex> lock(m_jobMutex);
            m_inFlight = false;
            if (job.waited) m_waitedDone = true;
        }
        m_doneCv.notify_all();
    }
}

void DepthEstimator::runInference(const Job& job) {
    try {
        const int size = m_model->inputSize();
        std::vector<float> tensor = preprocessFrame(job.rgba.data(), job.width, job.height, size);
        DepthModelOutput output = m_model->infer(tensor);
        if (output.width <= 0 || output.height <= 0 ||
            output.data.size() < static_cast<size_t>(output.width) * output.height) {
            std::cerr << "[DepthEstimator] Model returned an unexpected output shape" << std::endl;
            return;
        }

        postprocessDepth(output, m_width, m_height, m_back);

        {
            std::lock_guard<std::mutex> lock(m_bufferMutex);
            std::swap(m_front, m_back);
            ++m_generation;
        }
    } catch (const std::exception& e) {
        std::cerr << "[DepthEstimator] Inference failed: " << e.what() << std::endl;
    }
}

} // namespace layershift
