// Layershift - WebGPU context

#include <layershift/effects/wgpu_context.h>
#include <layershift/effects/gpu_common.h>
#include <webgpu/wgpu.h>
#include <glfw3webgpu.h>
#include <GLFW/glfw3.h>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

namespace layershift::gpu {

namespace {

struct AdapterRequest {
    WGPUAdapter adapter = nullptr;
    std::string message;
    bool done = false;
};

struct DeviceRequest {
    WGPUDevice device = nullptr;
    std::string message;
    bool done = false;
};

void onAdapterRequestEnded(WGPURequestAdapterStatus status, WGPUAdapter adapter,
                           WGPUStringView message, void* userdata1, void* /*userdata2*/) {
    auto* request = static_cast<AdapterRequest*>(userdata1);
    if (status == WGPURequestAdapterStatus_Success) {
        request->adapter = adapter;
    } else {
        request->message = fromStringView(message);
    }
    request->done = true;
}

void onDeviceRequestEnded(WGPURequestDeviceStatus status, WGPUDevice device,
                          WGPUStringView message, void* userdata1, void* /*userdata2*/) {
    auto* request = static_cast<DeviceRequest*>(userdata1);
    if (status == WGPURequestDeviceStatus_Success) {
        request->device = device;
    } else {
        request->message = fromStringView(message);
    }
    request->done = true;
}

/// Pump instance events until the request completes or the deadline passes
template<typename Request>
bool waitForRequest(WGPUInstance instance, const Request& request, int timeoutMs) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (!request.done) {
        wgpuInstanceProcessEvents(instance);
        if (request.done) break;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

AbandonedRequests<AdapterRequest>& abandonedAdapterRequests() {
    // An adapter that arrives after the timeout is released unused
    static AbandonedRequests<AdapterRequest> abandoned([](AdapterRequest& late) {
        if (late.adapter) wgpuAdapterRelease(late.adapter);
        late.adapter = nullptr;
    });
    return abandoned;
}

WGPUAdapter requestAdapter(WGPUInstance instance, WGPUSurface surface, int timeoutMs,
                           std::string& error) {
    abandonedAdapterRequests().prune();

    WGPURequestAdapterOptions options = {};
    options.compatibleSurface = surface;
    options.powerPreference = WGPUPowerPreference_HighPerformance;

    // Heap-allocated: a timed-out request may still complete later
    auto request = std::make_shared<AdapterRequest>();
    WGPURequestAdapterCallbackInfo callbackInfo = {};
    callbackInfo.mode = WGPUCallbackMode_AllowProcessEvents;
    callbackInfo.callback = onAdapterRequestEnded;
    callbackInfo.userdata1 = request.get();
    wgpuInstanceRequestAdapter(instance, &options, callbackInfo);

    if (!waitForRequest(instance, *request, timeoutMs)) {
        error = "adapter request timed out after " + std::to_string(timeoutMs) + " ms";
        // The callback may still fire later and write into the request
        abandonedAdapterRequests().add(request);
        return nullptr;
    }
    if (!request->adapter) {
        error = request->message.empty() ? "no suitable adapter" : request->message;
    }
    return request->adapter;
}

DeviceCapabilities describeAdapter(WGPUAdapter adapter) {
    DeviceCapabilities caps;

    WGPUAdapterInfo info = {};
    if (wgpuAdapterGetInfo(adapter, &info) == WGPUStatus_Success) {
        caps.renderer = fromStringView(info.vendor) + " " + fromStringView(info.device) + " " +
                        fromStringView(info.description);
        if (info.adapterType == WGPUAdapterType_CPU) caps.renderer += " software";
        wgpuAdapterInfoFreeMembers(info);
    }

    WGPULimits limits = {};
    if (wgpuAdapterGetLimits(adapter, &limits) == WGPUStatus_Success) {
        caps.maxTextureSize = static_cast<int>(limits.maxTextureDimension2D);
    }

    caps.hardwareConcurrency = static_cast<int>(std::thread::hardware_concurrency());
    return caps;
}

} // namespace

BackendProbeResult probeWebGpuAdapter(int timeoutMs) {
    BackendProbeResult result;

    WGPUInstanceDescriptor instanceDesc = {};
    WGPUInstance instance = wgpuCreateInstance(&instanceDesc);
    if (!instance) {
        result.error = "failed to create WebGPU instance";
        return result;
    }

    WGPUAdapter adapter = requestAdapter(instance, nullptr, timeoutMs, result.error);
    if (adapter) {
        result.available = true;
        result.capabilities = describeAdapter(adapter);
        wgpuAdapterRelease(adapter);
    }
    wgpuInstanceRelease(instance);
    return result;
}

// -----------------------------------------------------------------------------
// WgpuContext
// -----------------------------------------------------------------------------

WgpuContext::WgpuContext() = default;

WgpuContext::~WgpuContext() {
    destroy();
}

void WgpuContext::onDeviceLost(WGPUDevice const* /*device*/, WGPUDeviceLostReason reason,
                               WGPUStringView message, void* userdata1, void* /*userdata2*/) {
    auto* self = static_cast<WgpuContext*>(userdata1);
    if (reason == WGPUDeviceLostReason_Destroyed || !self) return;

    const std::string text = fromStringView(message);
    std::cerr << "[WebGPU] Device lost: " << (text.empty() ? "unknown" : text) << std::endl;
    self->m_deviceLost = true;
    if (self->m_onDeviceLost) self->m_onDeviceLost(text.empty() ? "unknown" : text);
}

void WgpuContext::onDeviceError(WGPUDevice const* /*device*/, WGPUErrorType /*type*/,
                                WGPUStringView message, void* /*userdata1*/, void* /*userdata2*/) {
    const std::string text = fromStringView(message);
    std::cerr << "[WebGPU Error] " << (text.empty() ? "unknown" : text) << std::endl;
}

bool WgpuContext::fail(const std::string& message) {
    m_error = message;
    std::cerr << "[WebGPU] " << message << std::endl;
    destroy();
    return false;
}

bool WgpuContext::create(GLFWwindow* window, int timeoutMs) {
    destroy();

    WGPUInstanceDescriptor instanceDesc = {};
    m_instance = wgpuCreateInstance(&instanceDesc);
    if (!m_instance) return fail("Failed to create WebGPU instance");

    m_surface = glfwCreateWindowWGPUSurface(m_instance, window);
    if (!m_surface) return fail("Failed to create surface");

    std::string adapterError;
    m_adapter = requestAdapter(m_instance, m_surface, timeoutMs, adapterError);
    if (!m_adapter) return fail("Failed to get adapter: " + adapterError);

    m_capabilities = describeAdapter(m_adapter);
    std::cout << "[WebGPU] Adapter: " << m_capabilities.renderer << std::endl;

    WGPUDeviceDescriptor deviceDesc = {};
    deviceDesc.label = toStringView("Layershift Device");
    deviceDesc.deviceLostCallbackInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    deviceDesc.deviceLostCallbackInfo.callback = onDeviceLost;
    deviceDesc.deviceLostCallbackInfo.userdata1 = this;
    deviceDesc.uncapturedErrorCallbackInfo.callback = onDeviceError;

    DeviceRequest request;
    WGPURequestDeviceCallbackInfo deviceCallback = {};
    deviceCallback.mode = WGPUCallbackMode_AllowProcessEvents;
    deviceCallback.callback = onDeviceRequestEnded;
    deviceCallback.userdata1 = &request;
    wgpuAdapterRequestDevice(m_adapter, &deviceDesc, deviceCallback);

    while (!request.done) {
        wgpuInstanceProcessEvents(m_instance);
    }
    if (!request.device) {
        return fail("Failed to get device: " + (request.message.empty() ? std::string("unknown") : request.message));
    }
    m_device = request.device;
    m_queue = wgpuDeviceGetQueue(m_device);

    WGPUSurfaceCapabilities capabilities = {};
    wgpuSurfaceGetCapabilities(m_surface, m_adapter, &capabilities);
    if (capabilities.formatCount > 0) {
        m_surfaceFormat = capabilities.formats[0];
    }
    m_presentMode = WGPUPresentMode_Fifo;
    wgpuSurfaceCapabilitiesFreeMembers(capabilities);

    int width = 0, height = 0;
    glfwGetFramebufferSize(window, &width, &height);
    configure(static_cast<uint32_t>(std::max(1, width)), static_cast<uint32_t>(std::max(1, height)));

    m_deviceLost = false;
    std::cout << "[WebGPU] Initialized " << width << "x" << height << std::endl;
    return true;
}

void WgpuContext::configure(uint32_t width, uint32_t height) {
    if (!m_surface || !m_device) return;

    WGPUSurfaceConfiguration config = {};
    config.device = m_device;
    config.format = m_surfaceFormat;
    config.width = std::max(1u, width);
    config.height = std::max(1u, height);
    config.presentMode = m_presentMode;
    config.alphaMode = WGPUCompositeAlphaMode_Auto;
    config.usage = WGPUTextureUsage_RenderAttachment;
    wgpuSurfaceConfigure(m_surface, &config);
}

WGPUTextureView WgpuContext::acquireFrame() {
    if (!m_surface || m_deviceLost) return nullptr;
    if (m_frameView) return m_frameView;

    WGPUSurfaceTexture surfaceTexture = {};
    wgpuSurfaceGetCurrentTexture(m_surface, &surfaceTexture);
    if (surfaceTexture.status != WGPUSurfaceGetCurrentTextureStatus_SuccessOptimal &&
        surfaceTexture.status != WGPUSurfaceGetCurrentTextureStatus_SuccessSuboptimal) {
        if (surfaceTexture.texture) wgpuTextureRelease(surfaceTexture.texture);
        return nullptr;
    }

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = m_surfaceFormat;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.mipLevelCount = 1;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_All;

    m_frameTexture = surfaceTexture.texture;
    m_frameView = wgpuTextureCreateView(m_frameTexture, &viewDesc);
    return m_frameView;
}

void WgpuContext::present() {
    if (!m_frameView) return;
    wgpuSurfacePresent(m_surface);
    wgpuTextureViewRelease(m_frameView);
    wgpuTextureRelease(m_frameTexture);
    m_frameView = nullptr;
    m_frameTexture = nullptr;
    wgpuDevicePoll(m_device, false, nullptr);
}

void WgpuContext::destroy() {
    if (m_frameView) { wgpuTextureViewRelease(m_frameView); m_frameView = nullptr; }
    if (m_frameTexture) { wgpuTextureRelease(m_frameTexture); m_frameTexture = nullptr; }
    if (m_queue) { wgpuQueueRelease(m_queue); m_queue = nullptr; }
    if (m_device) { wgpuDeviceRelease(m_device); m_device = nullptr; }
    if (m_adapter) { wgpuAdapterRelease(m_adapter); m_adapter = nullptr; }
    if (m_surface) {
        wgpuSurfaceUnconfigure(m_surface);
        wgpuSurfaceRelease(m_surface);
        m_surface = nullptr;
    }
    if (m_instance) { wgpuInstanceRelease(m_instance); m_instance = nullptr; }
}

} // namespace layershift::gpu
