#pragma once

/**
 * @file graphics_device.h
 * @brief One window's rendering backend and the effect renderers built on it
 *
 * The backend is chosen before the window exists (WebGPU windows carry no
 * GL context), so the usual order is:
 *
 * @code
 * BackendSelection sel = selectBackend(pref, probeWebGpuAdapter);
 * GraphicsDevice::applyWindowHints(sel.backend);
 * GLFWwindow* window = glfwCreateWindow(...);
 * GraphicsDevice device;
 * device.create(window, sel.backend);
 * auto renderer = device.createRenderer(std::move(spec), scheduler, surface);
 * @endcode
 */

#include <layershift/effect_config.h>
#include <layershift/focus_controller.h>
#include <layershift/gpu_backend.h>
#include <layershift/renderer_core.h>
#include <layershift/shape_mesh.h>
#include <functional>
#include <memory>
#include <string>

struct GLFWwindow;

namespace layershift {

namespace gpu { class WgpuContext; }
namespace gl { class GlContext; }

/// Everything needed to construct one effect renderer
struct RendererSpec {
    EffectKind effect = EffectKind::Parallax;
    QualityParams quality;
    ParallaxSettings parallax;
    RackFocusSettings rackFocus;
    FocusStateProvider focus;       ///< Rack focus only
    PortalSettings portal;
    ShapeMesh mesh;                 ///< Portal only
};

class GraphicsDevice {
public:
    using DeviceLostCallback = std::function<void(const std::string& reason)>;

    GraphicsDevice();
    ~GraphicsDevice();

    GraphicsDevice(const GraphicsDevice&) = delete;
    GraphicsDevice& operator=(const GraphicsDevice&) = delete;

    /// @brief GLFW hints for a window that will host this backend
    static void applyWindowHints(GpuBackend backend);

    /// @return false with error() set
    bool create(GLFWwindow* window, GpuBackend backend);
    void destroy();

    /**
     * @brief Replace a lost device on the same backend
     *
     * The context objects are rebuilt in place, so renderers holding a
     * reference to them stay valid. OpenGL needs a fresh window because a
     * reset context cannot be recreated on the old one.
     */
    bool restore(GLFWwindow* window);

    /**
     * @brief Construct the renderer for an effect on this backend
     * @throws std::runtime_error when the device was never created
     */
    std::unique_ptr<RendererCore> createRenderer(RendererSpec spec, FrameScheduler& scheduler,
                                                 const RenderSurface& surface);

    /**
     * @brief Check for a lost device
     *
     * OpenGL resets are polled here; WebGPU loss arrives through the
     * device's callback. Either way the callback fires once per loss.
     */
    void poll();

    void setDeviceLostCallback(DeviceLostCallback cb) { m_onLost = std::move(cb); }

    GpuBackend backend() const { return m_backend; }
    bool valid() const;
    bool lost() const { return m_lost; }
    DeviceCapabilities capabilities() const;
    const std::string& error() const { return m_error; }

    gpu::WgpuContext* webgpu() const { return m_wgpu.get(); }
    gl::GlContext* opengl() const { return m_gl.get(); }

private:
    void notifyLost(const std::string& reason);

    GpuBackend m_backend = GpuBackend::OpenGL;
    std::unique_ptr<gpu::WgpuContext> m_wgpu;
    std::unique_ptr<gl::GlContext> m_gl;
    bool m_lost = false;
    DeviceLostCallback m_onLost;
    std::string m_error;
};

} // namespace layershift
