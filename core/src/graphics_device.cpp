// Layershift - Backend context ownership and renderer construction

#include <layershift/graphics_device.h>
#include <layershift/effects/parallax_renderer.h>
#include <layershift/effects/portal_renderer.h>
#include <layershift/effects/rack_focus_renderer.h>
#include <layershift/effects/wgpu_context.h>
#include <layershift/gl/gl_context.h>
#include <layershift/gl/gl_parallax_renderer.h>
#include <layershift/gl/gl_portal_renderer.h>
#include <layershift/gl/gl_rack_focus_renderer.h>
#include <GLFW/glfw3.h>
#include <iostream>
#include <stdexcept>

namespace layershift {

GraphicsDevice::GraphicsDevice() = default;

GraphicsDevice::~GraphicsDevice() {
    destroy();
}

void GraphicsDevice::applyWindowHints(GpuBackend backend) {
    glfwDefaultWindowHints();
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
    if (backend == GpuBackend::WebGPU) {
        glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
        return;
    }
    glfwWindowHint(GLFW_CLIENT_API, GLFW_OPENGL_API);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
    glfwWindowHint(GLFW_CONTEXT_ROBUSTNESS, GLFW_LOSE_CONTEXT_ON_RESET);
}

bool GraphicsDevice::create(GLFWwindow* window, GpuBackend backend) {
    destroy();
    m_backend = backend;
    m_lost = false;

    if (backend == GpuBackend::WebGPU) {
        m_wgpu = std::make_unique<gpu::WgpuContext>();
        m_wgpu->setDeviceLostCallback([this](const std::string& reason) { notifyLost(reason); });
        if (!m_wgpu->create(window)) {
            m_error = m_wgpu->error();
            m_wgpu.reset();
            return false;
        }
    } else {
        m_gl = std::make_unique<gl::GlContext>();
        if (!m_gl->create(window)) {
            m_error = m_gl->error();
            m_gl.reset();
            return false;
        }
    }

    std::cout << "[GraphicsDevice] Using " << gpuBackendName(backend) << std::endl;
    return true;
}

void GraphicsDevice::destroy() {
    if (m_wgpu) {
        m_wgpu->setDeviceLostCallback({});
        m_wgpu->destroy();
        m_wgpu.reset();
    }
    if (m_gl) {
        m_gl->destroy();
        m_gl.reset();
    }
}

bool GraphicsDevice::restore(GLFWwindow* window) {
    bool ok = false;
    if (m_wgpu) {
        ok = m_wgpu->create(window);
        if (!ok) m_error = m_wgpu->error();
    } else if (m_gl) {
        ok = m_gl->create(window);
        if (!ok) m_error = m_gl->error();
    } else {
        m_error = "No device to restore";
    }
    if (ok) {
        m_lost = false;
        std::cout << "[GraphicsDevice] " << gpuBackendName(m_backend) << " device restored" << std::endl;
    }
    return ok;
}

bool GraphicsDevice::valid() const {
    return m_backend == GpuBackend::WebGPU ? static_cast<bool>(m_wgpu) : (m_gl && m_gl->valid());
}

DeviceCapabilities GraphicsDevice::capabilities() const {
    if (m_wgpu) return m_wgpu->capabilities();
    if (m_gl) return m_gl->capabilities();
    return {};
}

std::unique_ptr<RendererCore> GraphicsDevice::createRenderer(RendererSpec spec, FrameScheduler& scheduler,
                                                             const RenderSurface& surface) {
    if (m_wgpu) {
        gpu::WgpuContext& ctx = *m_wgpu;
        switch (spec.effect) {
            case EffectKind::Parallax:
                return std::make_unique<gpu::ParallaxRenderer>(ctx, scheduler, surface, spec.quality, spec.parallax);
            case EffectKind::RackFocus:
                return std::make_unique<gpu::RackFocusRenderer>(ctx, scheduler, surface, spec.quality,
                                                                spec.rackFocus, std::move(spec.focus));
            case EffectKind::Portal:
                return std::make_unique<gpu::PortalRenderer>(ctx, scheduler, surface, spec.quality,
                                                             spec.portal, std::move(spec.mesh));
        }
    }
    if (m_gl) {
        gl::GlContext& ctx = *m_gl;
        switch (spec.effect) {
            case EffectKind::Parallax:
                return std::make_unique<gl::GlParallaxRenderer>(ctx, scheduler, surface, spec.quality, spec.parallax);
            case EffectKind::RackFocus:
                return std::make_unique<gl::GlRackFocusRenderer>(ctx, scheduler, surface, spec.quality,
                                                                 spec.rackFocus, std::move(spec.focus));
            case EffectKind::Portal:
                return std::make_unique<gl::GlPortalRenderer>(ctx, scheduler, surface, spec.quality,
                                                              spec.portal, std::move(spec.mesh));
        }
    }
    throw std::runtime_error("No graphics device to create a renderer on");
}

void GraphicsDevice::poll() {
    if (!m_gl || m_lost) return;
    if (std::optional<std::string> reason = m_gl->checkReset()) {
        notifyLost(*reason);
    }
}

void GraphicsDevice::notifyLost(const std::string& reason) {
    if (m_lost) return;
    m_lost = true;
    std::cerr << "[GraphicsDevice] " << gpuBackendName(m_backend) << " device lost: " << reason << std::endl;
    if (m_onLost) m_onLost(reason);
}

} // namespace layershift
