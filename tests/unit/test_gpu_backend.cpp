/**
 * @file test_gpu_backend.cpp
 * @brief Backend preference resolution with a fake adapter probe
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <layershift/gpu_backend.h>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace layershift;
using Catch::Matchers::ContainsSubstring;

namespace {

WebGpuProbe probeReturning(bool available, int* calls = nullptr, int* timeout = nullptr) {
    return [=](int timeoutMs) {
        if (calls) ++*calls;
        if (timeout) *timeout = timeoutMs;
        BackendProbeResult result;
        result.available = available;
        if (available) {
            result.capabilities.renderer = "Test Adapter";
        } else {
            result.error = "no adapter";
        }
        return result;
    };
}

} // namespace

TEST_CASE("OpenGL preference never probes", "[backend]") {
    int calls = 0;
    BackendSelection sel = selectBackend(BackendPreference::OpenGL, probeReturning(true, &calls));
    REQUIRE(sel.backend == GpuBackend::OpenGL);
    REQUIRE(calls == 0);
}

TEST_CASE("Auto preference", "[backend]") {
    SECTION("uses WebGPU when an adapter answers") {
        int timeout = 0;
        BackendSelection sel = selectBackend(BackendPreference::Auto, probeReturning(true, nullptr, &timeout));
        REQUIRE(sel.backend == GpuBackend::WebGPU);
        REQUIRE(sel.probe.capabilities.renderer == "Test Adapter");
        REQUIRE(timeout == WEBGPU_ADAPTER_TIMEOUT_MS);
    }

    SECTION("falls back silently") {
        BackendSelection sel = selectBackend(BackendPreference::Auto, probeReturning(false));
        REQUIRE(sel.backend == GpuBackend::OpenGL);
        REQUIRE(sel.probe.error == "no adapter");
    }

    SECTION("a throwing probe counts as unavailable") {
        WebGpuProbe throwing = [](int) -> BackendProbeResult { throw std::runtime_error("instance failed"); };
        BackendSelection sel = selectBackend(BackendPreference::Auto, throwing);
        REQUIRE(sel.backend == GpuBackend::OpenGL);
        REQUIRE(sel.probe.error == "instance failed");
    }

    SECTION("no probe at all") {
        REQUIRE(selectBackend(BackendPreference::Auto, WebGpuProbe{}).backend == GpuBackend::OpenGL);
    }
}

TEST_CASE("Explicit WebGPU preference", "[backend]") {
    REQUIRE(selectBackend(BackendPreference::WebGPU, probeReturning(true), 200).backend == GpuBackend::WebGPU);
    REQUIRE_THROWS_WITH(selectBackend(BackendPreference::WebGPU, probeReturning(false)),
                        ContainsSubstring("no adapter"));
    REQUIRE_THROWS_AS(selectBackend(BackendPreference::WebGPU, WebGpuProbe{}), std::runtime_error);
    REQUIRE(std::string(gpuBackendName(GpuBackend::WebGPU)) == "webgpu");
}

TEST_CASE("Abandoned adapter requests are released once settled", "[backend]") {
    struct Request {
        bool done = false;
        int adapter = 0;
    };

    std::vector<int> released;
    AbandonedRequests<Request> abandoned([&](Request& r) { released.push_back(r.adapter); });

    auto first = std::make_shared<Request>();
    auto second = std::make_shared<Request>();
    abandoned.add(first);
    abandoned.add(second);
    REQUIRE(abandoned.pending() == 2);

    // Late callback on the first request
    first->done = true;
    first->adapter = 7;
    abandoned.prune();
    REQUIRE(abandoned.pending() == 1);
    REQUIRE(released == std::vector<int>{7});

    // Repeated timeouts don't accumulate settled entries
    second->done = true;
    for (int i = 0; i < 5; ++i) {
        auto timedOut = std::make_shared<Request>();
        timedOut->done = true;
        abandoned.add(timedOut);
    }
    REQUIRE(abandoned.pending() == 1);
    REQUIRE(released.size() == 6);

    abandoned.prune();
    REQUIRE(abandoned.pending() == 0);
    REQUIRE(released.size() == 7);
}
