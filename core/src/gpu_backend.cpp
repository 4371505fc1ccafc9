// Layershift - GPU backend selection

#include <layershift/gpu_backend.h>
#include <iostream>
#include <stdexcept>

namespace layershift {

const char* gpuBackendName(GpuBackend backend) {
    return backend == GpuBackend::WebGPU ? "webgpu" : "opengl";
}

BackendSelection selectBackend(BackendPreference preference,
                               const WebGpuProbe& probe,
                               int timeoutMs) {
    BackendSelection selection;
    if (preference == BackendPreference::OpenGL) {
        selection.backend = GpuBackend::OpenGL;
        return selection;
    }

    const bool required = preference == BackendPreference::WebGPU;

    if (!probe) {
        if (required) throw std::runtime_error("WebGPU not available: no adapter probe");
        selection.backend = GpuBackend::OpenGL;
        return selection;
    }

    try {
        selection.probe = probe(timeoutMs);
    } catch (const std::exception& e) {
        selection.probe.available = false;
        selection.probe.error = e.what();
    }

    if (selection.probe.available) {
        selection.backend = GpuBackend::WebGPU;
        return selection;
    }

    if (required) {
        const std::string reason = selection.probe.error.empty()
            ? std::string("adapter request returned nothing")
            : selection.probe.error;
        throw std::runtime_error("WebGPU not available: " + reason);
    }

    std::cout << "[GpuBackend] WebGPU unavailable, using OpenGL";
    if (!selection.probe.error.empty()) std::cout << " (" << selection.probe.error << ")";
    std::cout << std::endl;
    selection.backend = GpuBackend::OpenGL;
    return selection;
}

} // namespace layershift
