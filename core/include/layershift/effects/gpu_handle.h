#pragma once

/**
 * @file gpu_handle.h
 * @brief Move-only ownership of WebGPU objects
 *
 * Every WebGPU object a renderer creates is held in a GpuHandle, so
 * disposing a renderer (or losing its device) is a matter of resetting
 * members. A partially initialized renderer releases cleanly.
 */

#include <webgpu/webgpu.h>
#include <cstdint>

namespace layershift::gpu {

inline void releaseHandle(WGPUTexture h) { wgpuTextureRelease(h); }
inline void releaseHandle(WGPUTextureView h) { wgpuTextureViewRelease(h); }
inline void releaseHandle(WGPUBuffer h) { wgpuBufferRelease(h); }
inline void releaseHandle(WGPURenderPipeline h) { wgpuRenderPipelineRelease(h); }
inline void releaseHandle(WGPUBindGroup h) { wgpuBindGroupRelease(h); }
inline void releaseHandle(WGPUBindGroupLayout h) { wgpuBindGroupLayoutRelease(h); }
inline void releaseHandle(WGPUSampler h) { wgpuSamplerRelease(h); }
inline void releaseHandle(WGPUShaderModule h) { wgpuShaderModuleRelease(h); }
inline void releaseHandle(WGPUPipelineLayout h) { wgpuPipelineLayoutRelease(h); }

template<typename T>
class GpuHandle {
public:
    GpuHandle() = default;
    explicit GpuHandle(T handle) : m_handle(handle) {}
    ~GpuHandle() { reset(); }

    GpuHandle(GpuHandle&& other) noexcept : m_handle(other.m_handle) {
        other.m_handle = nullptr;
    }

    GpuHandle& operator=(GpuHandle&& other) noexcept {
        if (this != &other) {
            reset(other.m_handle);
            other.m_handle = nullptr;
        }
        return *this;
    }

    GpuHandle(const GpuHandle&) = delete;
    GpuHandle& operator=(const GpuHandle&) = delete;

    T get() const { return m_handle; }
    operator T() const { return m_handle; }
    explicit operator bool() const { return m_handle != nullptr; }

    void reset(T handle = nullptr) {
        if (m_handle) releaseHandle(m_handle);
        m_handle = handle;
    }

private:
    T m_handle = nullptr;
};

using TextureHandle = GpuHandle<WGPUTexture>;
using TextureViewHandle = GpuHandle<WGPUTextureView>;
using BufferHandle = GpuHandle<WGPUBuffer>;
using RenderPipelineHandle = GpuHandle<WGPURenderPipeline>;
using BindGroupHandle = GpuHandle<WGPUBindGroup>;
using BindGroupLayoutHandle = GpuHandle<WGPUBindGroupLayout>;
using SamplerHandle = GpuHandle<WGPUSampler>;
using ShaderModuleHandle = GpuHandle<WGPUShaderModule>;
using PipelineLayoutHandle = GpuHandle<WGPUPipelineLayout>;

/// A 2D texture with its default view
struct RenderTarget {
    TextureHandle texture;
    TextureViewHandle view;
    WGPUTextureFormat format = WGPUTextureFormat_Undefined;
    uint32_t width = 0;
    uint32_t height = 0;

    explicit operator bool() const { return static_cast<bool>(view); }

    void reset() {
        view.reset();
        texture.reset();
        width = height = 0;
    }
};

} // namespace layershift::gpu
