#pragma once

/**
 * @file depth_estimator.h
 * @brief Bridge between an asynchronous depth model and the synchronous renderer
 *
 * Inference runs on a worker thread at its own cadence (a few Hz) while the
 * renderer reads depth every display frame. A front/back buffer pair keeps
 * the read side complete at all times:
 *
 * - the worker writes only into the back buffer
 * - a finished result is published by swapping front/back under a mutex
 * - readers copy the front buffer under the same mutex
 *
 * New submissions are dropped while an inference is in flight, so slow
 * models throttle themselves instead of queuing a backlog.
 */

#include <layershift/depth_frames.h>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace layershift {

/// @brief Raw model output (inverse depth: larger = nearer)
struct DepthModelOutput {
    std::vector<float> data;
    int width = 0;
    int height = 0;
};

/**
 * @brief Depth estimation model contract
 *
 * Implementations receive a normalised NCHW float tensor of shape
 * [1, 3, inputSize, inputSize] and return a single-channel map at their
 * native resolution. infer() may throw; the estimator logs and drops the
 * frame.
 */
class DepthModel {
public:
    virtual ~DepthModel() = default;

    virtual int inputSize() const = 0;
    virtual DepthModelOutput infer(const std::vector<float>& tensor) = 0;
};

/// @brief Model download / initialisation progress
struct ModelProgress {
    uint64_t receivedBytes = 0;
    std::optional<uint64_t> totalBytes;
    double fraction = 0.0;
    std::string label;
};

using ModelProgressCallback = std::function<void(const ModelProgress&)>;

/// @brief Native input side of Depth Anything v2 models
constexpr int DEPTH_MODEL_INPUT_SIZE = 518;

/// @brief RGBA8 frame → ImageNet-normalised NCHW tensor at size x size (bilinear)
std::vector<float> preprocessFrame(const uint8_t* rgba, int width, int height, int size);

/**
 * @brief Model output → byte depth at the target size
 *
 * Normalises by the map's own min/max (a flat map counts as range 1) and
 * bilinearly resamples. 255 = nearest.
 */
void postprocessDepth(const DepthModelOutput& output, int dstW, int dstH, std::vector<uint8_t>& dst);

class DepthEstimator : public DepthProvider {
public:
    DepthEstimator(std::shared_ptr<DepthModel> model, int depthWidth, int depthHeight);
    ~DepthEstimator() override;

    DepthEstimator(const DepthEstimator&) = delete;
    DepthEstimator& operator=(const DepthEstimator&) = delete;

    /**
     * @brief Queue a frame for estimation without blocking
     * @return false when dropped (inference in flight, or disposed)
     */
    bool submitFrame(const uint8_t* rgba, int width, int height);

    /// @brief Run one estimation to completion (static sources)
    const std::vector<uint8_t>& submitFrameAndWait(const uint8_t* rgba, int width, int height);

    /**
     * @brief Most recent complete depth frame
     *
     * Flat 128 before the first result. Intended for the single render
     * thread; the returned buffer stays valid until the next call.
     */
    const std::vector<uint8_t>& latestDepth();

    /// @brief Thread-safe copy of the front buffer for any reader
    void copyLatestDepth(std::vector<uint8_t>& out) const;

    const uint8_t* sample(double timeSeconds) override;
    int width() const override { return m_width; }
    int height() const override { return m_height; }

    bool inferenceInFlight() const { return m_inFlight.load(); }
    uint64_t completedInferences() const { return m_generation.load(); }
    bool disposed() const { return m_disposed.load(); }

    /// @brief Stop the worker; later submissions are ignored
    void dispose();

private:
    struct Job {
        std::vector<uint8_t> rgba;
        int width = 0;
        int height = 0;
        bool waited = false;
    };

    void workerLoop();
    void runInference(const Job& job);

    std::shared_ptr<DepthModel> m_model;
    int m_width;
    int m_height;

    // Front is shared with readers (guarded by m_bufferMutex); back belongs to the worker
    mutable std::mutex m_bufferMutex;
    std::vector<uint8_t> m_front;
    std::vector<uint8_t> m_back;
    std::atomic<uint64_t> m_generation{0};

    std::vector<uint8_t> m_read;
    uint64_t m_readGeneration = 0;

    std::mutex m_jobMutex;
    std::condition_variable m_jobCv;
    std::condition_variable m_doneCv;
    std::optional<Job> m_pending;
    bool m_waitedDone = false;
    bool m_stopWorker = false;

    std::atomic<bool> m_inFlight{false};
    std::atomic<bool> m_disposed{false};
    std::thread m_worker;
};

} // namespace layershift
