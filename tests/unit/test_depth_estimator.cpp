/**
 * @file test_depth_estimator.cpp
 * @brief Live estimation bridge: preprocessing, normalisation and the double buffer
 *
 * Models are fakes; no runtime or GPU is needed.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <layershift/depth_estimator.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace layershift;
using Catch::Matchers::WithinAbs;

namespace {

class RampModel : public DepthModel {
public:
    int inputSize() const override { return 4; }
    DepthModelOutput infer(const std::vector<float>& tensor) override {
        ++calls;
        lastTensorSize = tensor.size();
        return {{0.0f, 1.0f}, 2, 1};
    }
    std::atomic<int> calls{0};
    size_t lastTensorSize = 0;
};

class ThrowingModel : public DepthModel {
public:
    int inputSize() const override { return 4; }
    DepthModelOutput infer(const std::vector<float>&) override {
        throw std::runtime_error("session exploded");
    }
};

// Blocks inside infer() until released
class GatedModel : public DepthModel {
public:
    int inputSize() const override { return 2; }
    DepthModelOutput infer(const std::vector<float>&) override {
        std::unique_lock<std::mutex> lock(mutex);
        entered = true;
        cv.notify_all();
        cv.wait(lock, [this] { return released; });
        return {{0.0f, 1.0f}, 2, 1};
    }
    void waitEntered() {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [this] { return entered; });
    }
    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            released = true;
        }
        cv.notify_all();
    }
    std::mutex mutex;
    std::condition_variable cv;
    bool entered = false;
    bool released = false;
};

// Alternates between two mirrored ramps, slowly
class AlternatingModel : public DepthModel {
public:
    int inputSize() const override { return 2; }
    DepthModelOutput infer(const std::vector<float>&) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        const bool flip = (count++ % 2) == 1;
        return {flip ? std::vector<float>{1.0f, 0.0f} : std::vector<float>{0.0f, 1.0f}, 2, 1};
    }
    int count = 0;
};

std::vector<uint8_t> rgbaFrame(int w, int h, uint8_t value) {
    return std::vector<uint8_t>(static_cast<size_t>(w) * h * 4, value);
}

} // namespace

TEST_CASE("Frame preprocessing", "[estimator][preprocess]") {
    std::vector<uint8_t> white = rgbaFrame(1, 1, 255);
    std::vector<float> tensor = preprocessFrame(white.data(), 1, 1, 2);

    REQUIRE(tensor.size() == 3 * 2 * 2);
    // NCHW: channel planes of size*size
    REQUIRE_THAT(tensor[0], WithinAbs((1.0 - 0.485) / 0.229, 1e-4));
    REQUIRE_THAT(tensor[4], WithinAbs((1.0 - 0.456) / 0.224, 1e-4));
    REQUIRE_THAT(tensor[11], WithinAbs((1.0 - 0.406) / 0.225, 1e-4));

    SECTION("black maps to -mean/std") {
        std::vector<uint8_t> black = rgbaFrame(3, 2, 0);
        std::vector<float> t = preprocessFrame(black.data(), 3, 2, 4);
        REQUIRE_THAT(t[5], WithinAbs(-0.485 / 0.229, 1e-4));
    }
}

TEST_CASE("Depth postprocessing", "[estimator][postprocess]") {
    std::vector<uint8_t> dst;

    SECTION("min/max normalisation to bytes") {
        postprocessDepth({{2.0f, 4.0f}, 2, 1}, 2, 1, dst);
        REQUIRE(dst == std::vector<uint8_t>{0, 255});
    }

    SECTION("bilinear upsampling clamps the right neighbour") {
        postprocessDepth({{0.0f, 1.0f}, 2, 1}, 4, 1, dst);
        REQUIRE(dst == std::vector<uint8_t>{0, 128, 255, 255});
    }

    SECTION("flat maps use a unit range") {
        postprocessDepth({{3.0f, 3.0f, 3.0f, 3.0f}, 2, 2}, 2, 2, dst);
        REQUIRE(dst == std::vector<uint8_t>{0, 0, 0, 0});
    }
}

TEST_CASE("DepthEstimator results", "[estimator]") {
    auto model = std::make_shared<RampModel>();
    DepthEstimator estimator(model, 4, 1);
    std::vector<uint8_t> frame = rgbaFrame(8, 8, 90);

    SECTION("flat 128 before the first result") {
        const std::vector<uint8_t>& depth = estimator.latestDepth();
        REQUIRE(depth == std::vector<uint8_t>(4, 128));
        REQUIRE(estimator.sample(0.0)[2] == 128);
    }

    SECTION("submitFrameAndWait returns the new map") {
        const std::vector<uint8_t>& depth = estimator.submitFrameAndWait(frame.data(), 8, 8);
        REQUIRE(depth == std::vector<uint8_t>{0, 128, 255, 255});
        REQUIRE(estimator.completedInferences() == 1);
        REQUIRE_FALSE(estimator.inferenceInFlight());
        REQUIRE(model->lastTensorSize == 3u * 4u * 4u);
    }

    SECTION("disposed estimator ignores submissions") {
        estimator.dispose();
        REQUIRE(estimator.disposed());
        REQUIRE_FALSE(estimator.submitFrame(frame.data(), 8, 8));
        REQUIRE(estimator.submitFrameAndWait(frame.data(), 8, 8) == std::vector<uint8_t>(4, 128));
        REQUIRE(model->calls == 0);
    }

    SECTION("invalid frames are rejected") {
        REQUIRE_FALSE(estimator.submitFrame(nullptr, 8, 8));
        REQUIRE_FALSE(estimator.submitFrame(frame.data(), 0, 8));
    }
}

TEST_CASE("DepthEstimator drops frames while busy", "[estimator][concurrency]") {
    auto model = std::make_shared<GatedModel>();
    DepthEstimator estimator(model, 2, 1);
    std::vector<uint8_t> frame = rgbaFrame(2, 2, 10);

    REQUIRE(estimator.submitFrame(frame.data(), 2, 2));
    model->waitEntered();
    REQUIRE(estimator.inferenceInFlight());
    REQUIRE_FALSE(estimator.submitFrame(frame.data(), 2, 2));

    // The renderer keeps reading the previous complete map meanwhile
    REQUIRE(estimator.latestDepth() == std::vector<uint8_t>(2, 128));

    model->release();
    for (int i = 0; i < 2000 && estimator.completedInferences() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    REQUIRE(estimator.completedInferences() == 1);
    REQUIRE(estimator.latestDepth() == std::vector<uint8_t>{0, 255});
}

TEST_CASE("DepthEstimator survives model errors", "[estimator]") {
    auto model = std::make_shared<ThrowingModel>();
    DepthEstimator estimator(model, 2, 2);
    std::vector<uint8_t> frame = rgbaFrame(2, 2, 10);

    const std::vector<uint8_t>& depth = estimator.submitFrameAndWait(frame.data(), 2, 2);
    REQUIRE(depth == std::vector<uint8_t>(4, 128));
    REQUIRE(estimator.completedInferences() == 0);
    REQUIRE_FALSE(estimator.inferenceInFlight());

    // The in-flight flag was cleared, so the next frame is accepted
    REQUIRE(estimator.submitFrame(frame.data(), 2, 2));
}

TEST_CASE("DepthEstimator readers never see a torn frame", "[estimator][concurrency]") {
    auto model = std::make_shared<AlternatingModel>();
    DepthEstimator estimator(model, 4, 1);
    std::vector<uint8_t> frame = rgbaFrame(2, 2, 10);

    const std::vector<uint8_t> flat(4, 128);
    const std::vector<uint8_t> forward{0, 128, 255, 255};
    const std::vector<uint8_t> backward{255, 128, 0, 0};

    std::atomic<bool> done{false};
    std::atomic<int> torn{0};
    std::atomic<int> reads{0};
    std::vector<std::thread> readers;
    for (int r = 0; r < 3; ++r) {
        readers.emplace_back([&] {
            std::vector<uint8_t> copy;
            while (!done.load()) {
                estimator.copyLatestDepth(copy);
                if (copy != flat && copy != forward && copy != backward) ++torn;
                ++reads;
            }
        });
    }

    for (int i = 0; i < 20; ++i) {
        estimator.submitFrameAndWait(frame.data(), 2, 2);
    }
    done = true;
    for (auto& t : readers) t.join();

    REQUIRE(torn == 0);
    REQUIRE(reads > 0);
    REQUIRE(estimator.completedInferences() == 20);
}
