#pragma once

/**
 * @file wgpu_context.h
 * @brief WebGPU instance, adapter, device and window surface
 *
 * One context per window. Renderers borrow device() and queue() and draw
 * into the view returned by acquireFrame().
 */

#include <layershift/gpu_backend.h>
#include <webgpu/webgpu.h>
#include <functional>
#include <memory>
#include <string>

struct GLFWwindow;

namespace layershift::gpu {

/**
 * @brief Request a high-performance adapter without a surface
 *
 * Processes instance events until the adapter callback fires or timeoutMs
 * elapses. Fills capabilities from the adapter info and limits.
 */
BackendProbeResult probeWebGpuAdapter(int timeoutMs);

class WgpuContext {
public:
    using DeviceLostCallback = std::function<void(const std::string& reason)>;

    WgpuContext();
    ~WgpuContext();

    WgpuContext(const WgpuContext&) = delete;
    WgpuContext& operator=(const WgpuContext&) = delete;

    /**
     * @brief Create the surface, adapter and device for a GLFW window
     *
     * The window must have been created with GLFW_CLIENT_API = GLFW_NO_API.
     * @return false with error() set; everything created so far is released
     */
    bool create(GLFWwindow* window, int timeoutMs = WEBGPU_ADAPTER_TIMEOUT_MS);

    /// @brief Reconfigure the swap chain for a new framebuffer size
    void configure(uint32_t width, uint32_t height);

    /**
     * @brief Current swap chain view
     * @return nullptr when the surface is outdated or lost; the frame is skipped
     */
    WGPUTextureView acquireFrame();
    void present();

    void setDeviceLostCallback(DeviceLostCallback cb) { m_onDeviceLost = std::move(cb); }

    WGPUDevice device() const { return m_device; }
    WGPUQueue queue() const { return m_queue; }
    WGPUTextureFormat surfaceFormat() const { return m_surfaceFormat; }
    const DeviceCapabilities& capabilities() const { return m_capabilities; }
    bool deviceLost() const { return m_deviceLost; }
    const std::string& error() const { return m_error; }

    void destroy();

private:
    static void onDeviceLost(WGPUDevice const* device, WGPUDeviceLostReason reason,
                             WGPUStringView message, void* userdata1, void* userdata2);
    static void onDeviceError(WGPUDevice const* device, WGPUErrorType type,
                              WGPUStringView message, void* userdata1, void* userdata2);

    bool fail(const std::string& message);

    WGPUInstance m_instance = nullptr;
    WGPUSurface m_surface = nullptr;
    WGPUAdapter m_adapter = nullptr;
    WGPUDevice m_device = nullptr;
    WGPUQueue m_queue = nullptr;
    WGPUTextureFormat m_surfaceFormat = WGPUTextureFormat_BGRA8Unorm;
    WGPUPresentMode m_presentMode = WGPUPresentMode_Fifo;

    WGPUTexture m_frameTexture = nullptr;
    WGPUTextureView m_frameView = nullptr;

    DeviceCapabilities m_capabilities;
    bool m_deviceLost = false;
    DeviceLostCallback m_onDeviceLost;
    std::string m_error;
};

} // namespace layershift::gpu
