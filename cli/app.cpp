// Layershift Viewer
// GLFW window host: input, device loss recovery and the render loop

#include "app.h"
#include <layershift/effects/wgpu_context.h>
#include <layershift/frame_scheduler.h>
#include <layershift/gpu_backend.h>
#include <layershift/graphics_device.h>
#include <layershift/ml/onnx_depth_model.h>
#include <layershift/video/video_source.h>
#include <GLFW/glfw3.h>
#include <algorithm>
#include <iostream>
#include <memory>

namespace layershift {

namespace {

// Virtual page scroll per wheel notch, in logical pixels
constexpr float SCROLL_STEP = 40.0f;

// Idle wait while nothing is initialized, so the loop does not spin
constexpr double IDLE_WAIT_SECONDS = 0.016;

class GlfwSurface : public RenderSurface {
public:
    GLFWwindow* window = nullptr;

    ViewportSize viewportSize() const override {
        int w = 1, h = 1;
        if (window) glfwGetWindowSize(window, &w, &h);
        return {std::max(w, 1), std::max(h, 1)};
    }

    float devicePixelRatio() const override {
        float xscale = 1.0f, yscale = 1.0f;
        if (window) glfwGetWindowContentScale(window, &xscale, &yscale);
        return xscale > 0.0f ? xscale : 1.0f;
    }
};

void logEvent(const Event& event, bool logFrames) {
    if (event.type == EventType::Frame && !logFrames) return;
    if (event.type == EventType::Error) return;     // already on stderr
    std::cout << "[Event] " << event.name() << " " << event.detail.dump() << std::endl;
}

} // namespace

struct ViewerApp::Impl {
    ViewerConfig config;
    GpuBackend backend = GpuBackend::OpenGL;

    GLFWwindow* window = nullptr;
    GlfwSurface surface;
    GraphicsDevice device;
    FrameScheduler scheduler;
    std::unique_ptr<EffectHost> host;

    float scrollOffset = 0.0f;
    bool lostPending = false;

    bool createWindow(int width, int height);
    void installCallbacks();
    bool recoverDevice();
};

bool ViewerApp::Impl::createWindow(int width, int height) {
    GraphicsDevice::applyWindowHints(backend);
    const std::string title = "Layershift - " + std::string(effectKindName(config.effect.effect));
    window = glfwCreateWindow(width, height, title.c_str(), nullptr, nullptr);
    if (!window) {
        std::cerr << "[Viewer] Failed to create window" << std::endl;
        return false;
    }
    surface.window = window;
    installCallbacks();
    return true;
}

void ViewerApp::Impl::installCallbacks() {
    glfwSetWindowUserPointer(window, this);

    glfwSetCursorPosCallback(window, [](GLFWwindow* w, double x, double y) {
        auto* self = static_cast<Impl*>(glfwGetWindowUserPointer(w));
        if (self->host) self->host->pointerMove(static_cast<float>(x), static_cast<float>(y));
    });

    glfwSetCursorEnterCallback(window, [](GLFWwindow* w, int entered) {
        auto* self = static_cast<Impl*>(glfwGetWindowUserPointer(w));
        if (self->host && !entered) self->host->pointerLeave();
    });

    glfwSetMouseButtonCallback(window, [](GLFWwindow* w, int button, int action, int) {
        auto* self = static_cast<Impl*>(glfwGetWindowUserPointer(w));
        if (!self->host || button != GLFW_MOUSE_BUTTON_LEFT || action != GLFW_PRESS) return;
        double x = 0.0, y = 0.0;
        glfwGetCursorPos(w, &x, &y);
        self->host->click(static_cast<float>(x), static_cast<float>(y));
    });

    // The window stands in for an element on a scrolling page
    glfwSetScrollCallback(window, [](GLFWwindow* w, double, double yoffset) {
        auto* self = static_cast<Impl*>(glfwGetWindowUserPointer(w));
        if (!self->host) return;
        self->scrollOffset += static_cast<float>(yoffset) * SCROLL_STEP;
        const float viewHeight = static_cast<float>(self->surface.viewportSize().height);
        self->scrollOffset = std::clamp(self->scrollOffset, -viewHeight * 0.5f, viewHeight * 0.5f);
        self->host->scroll(viewHeight * 0.5f + self->scrollOffset);
    });

    glfwSetWindowSizeCallback(window, [](GLFWwindow* w, int, int) {
        auto* self = static_cast<Impl*>(glfwGetWindowUserPointer(w));
        if (self->host) self->host->resized();
    });

    glfwSetKeyCallback(window, [](GLFWwindow* w, int key, int, int action, int) {
        auto* self = static_cast<Impl*>(glfwGetWindowUserPointer(w));
        if (action != GLFW_PRESS) return;
        if (key == GLFW_KEY_ESCAPE) {
            glfwSetWindowShouldClose(w, GLFW_TRUE);
        } else if (key == GLFW_KEY_SPACE && self->host && self->host->source()) {
            if (self->host->source()->paused()) {
                self->host->play();
            } else {
                self->host->pause();
            }
        }
    });
}

bool ViewerApp::Impl::recoverDevice() {
    lostPending = false;

    if (backend == GpuBackend::OpenGL) {
        // A reset context is gone for good; its window goes with it
        int width = config.windowWidth, height = config.windowHeight;
        int x = 0, y = 0;
        glfwGetWindowSize(window, &width, &height);
        glfwGetWindowPos(window, &x, &y);
        glfwDestroyWindow(window);
        window = nullptr;
        surface.window = nullptr;
        if (!createWindow(width, height)) return false;
        glfwSetWindowPos(window, x, y);
    }

    if (!device.restore(window)) {
        std::cerr << "[Viewer] Device recovery failed: " << device.error() << std::endl;
        return false;
    }
    host->deviceRestored();
    return true;
}

ViewerApp::~ViewerApp() {
    shutdown();
}

int ViewerApp::init(const ViewerConfig& config) {
    if (m_initialized) {
        return 0;
    }

    m_impl = new Impl();
    m_impl->config = config;

    if (!glfwInit()) {
        std::cerr << "[Viewer] Failed to initialize GLFW" << std::endl;
        return 1;
    }

    BackendSelection selection = selectBackend(config.effect.backend, gpu::probeWebGpuAdapter);
    m_impl->backend = selection.backend;
    if (!selection.probe.available && !selection.probe.error.empty()) {
        std::cout << "[Viewer] WebGPU unavailable: " << selection.probe.error << std::endl;
    }

    if (!m_impl->createWindow(config.windowWidth, config.windowHeight)) {
        glfwTerminate();
        return 1;
    }

    if (!m_impl->device.create(m_impl->window, m_impl->backend)) {
        std::cerr << "[Viewer] " << m_impl->device.error() << std::endl;
        glfwDestroyWindow(m_impl->window);
        glfwTerminate();
        return 1;
    }

    Impl* impl = m_impl;
    impl->device.setDeviceLostCallback([impl](const std::string& reason) {
        impl->lostPending = true;
        if (impl->host) impl->host->deviceLost(reason);
    });

    EffectServices services;
    services.scheduler = &impl->scheduler;
    services.surface = &impl->surface;
    services.openMedia = [](const std::string& src, MediaKind kind) {
        return video::openMediaSource(src, kind);
    };
    services.loadModel = [](const std::string& path, const ModelProgressCallback& progress) {
        return ml::loadOnnxDepthModel(path, progress);
    };
    services.createRenderer = [impl](RendererSpec spec) {
        return impl->device.createRenderer(std::move(spec), impl->scheduler, impl->surface);
    };
    services.capabilities = [impl]() { return impl->device.capabilities(); };

    const bool logFrames = config.logFrames;
    impl->host = std::make_unique<EffectHost>(config.effect, std::move(services),
                                              [logFrames](const Event& e) { logEvent(e, logFrames); });

    LifecycleController& lifecycle = impl->host->lifecycle();
    if (!config.source.empty()) lifecycle.setAttribute("src", config.source);
    if (config.sourceKind) lifecycle.setAttribute("source-type", mediaKindName(*config.sourceKind));
    if (!config.depthData.empty()) lifecycle.setAttribute("depth-src", config.depthData);
    if (!config.depthMeta.empty()) lifecycle.setAttribute("depth-meta", config.depthMeta);
    if (!config.model.empty()) lifecycle.setAttribute("depth-model", config.model);
    if (!config.logo.empty()) lifecycle.setAttribute("logo-src", config.logo);

    impl->scheduler.pump(glfwGetTime() * 1000.0);
    lifecycle.onConnect();

    m_initialized = true;
    return lifecycle.isInitialized() ? 0 : 1;
}

int ViewerApp::run() {
    if (!m_initialized) return 1;
    Impl& impl = *m_impl;

    while (!glfwWindowShouldClose(impl.window)) {
        if (impl.host->lifecycle().isInitialized()) {
            glfwPollEvents();
        } else {
            glfwWaitEventsTimeout(IDLE_WAIT_SECONDS);
        }

        const double now = glfwGetTime();
        impl.host->update(now);
        impl.scheduler.pump(now * 1000.0);
        impl.device.poll();

        if (impl.lostPending && !impl.recoverDevice()) {
            return 1;
        }
    }
    return 0;
}

void ViewerApp::shutdown() {
    if (!m_impl) return;

    if (m_impl->host) {
        m_impl->host->lifecycle().onDisconnect();
        m_impl->host.reset();
    }
    m_impl->device.destroy();
    if (m_impl->window) {
        glfwDestroyWindow(m_impl->window);
    }
    glfwTerminate();

    delete m_impl;
    m_impl = nullptr;
    m_initialized = false;
}

} // namespace layershift
