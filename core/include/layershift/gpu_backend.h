#pragma once

/**
 * @file gpu_backend.h
 * @brief Choosing between the WebGPU and OpenGL renderers
 *
 * - "opengl" selects OpenGL without touching WebGPU.
 * - "webgpu" must get an adapter within the timeout or selection throws.
 * - "auto" tries WebGPU and silently falls back to OpenGL on any failure.
 */

#include <layershift/effect_config.h>
#include <layershift/quality.h>
#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace layershift {

enum class GpuBackend {
    WebGPU,
    OpenGL
};

const char* gpuBackendName(GpuBackend backend);

/// Upper bound on the WebGPU adapter request before "auto" gives up
constexpr int WEBGPU_ADAPTER_TIMEOUT_MS = 1500;

struct BackendProbeResult {
    bool available = false;
    std::string error;
    DeviceCapabilities capabilities;    ///< Filled when available
};

/// Requests a WebGPU adapter, waiting at most timeoutMs
using WebGpuProbe = std::function<BackendProbeResult(int timeoutMs)>;

struct BackendSelection {
    GpuBackend backend = GpuBackend::OpenGL;
    BackendProbeResult probe;           ///< Empty when WebGPU was not probed
};

/**
 * @brief Resolve a preference to a concrete backend
 * @throws std::runtime_error when WebGPU was requested explicitly and the probe fails
 */
BackendSelection selectBackend(BackendPreference preference,
                               const WebGpuProbe& probe,
                               int timeoutMs = WEBGPU_ADAPTER_TIMEOUT_MS);

/**
 * @brief Timed-out async requests kept alive until their callback lands
 *
 * The callback still writes through its userdata pointer after the waiter gives up.
 * Requests that have completed are handed to the settle function and dropped on the
 * next add() or prune().
 */
template<typename Request>
class AbandonedRequests {
public:
    using SettleFn = std::function<void(Request&)>;

    explicit AbandonedRequests(SettleFn settle = {}) : m_settle(std::move(settle)) {}

    void add(std::shared_ptr<Request> request) {
        prune();
        m_pending.push_back(std::move(request));
    }

    void prune() {
        auto done = std::stable_partition(m_pending.begin(), m_pending.end(),
                                          [](const std::shared_ptr<Request>& r) { return !r->done; });
        for (auto it = done; it != m_pending.end(); ++it) {
            if (m_settle) m_settle(**it);
        }
        m_pending.erase(done, m_pending.end());
    }

    size_t pending() const { return m_pending.size(); }

private:
    SettleFn m_settle;
    std::vector<std::shared_ptr<Request>> m_pending;
};

} // namespace layershift
