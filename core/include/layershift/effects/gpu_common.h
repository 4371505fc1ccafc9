#pragma once

/**
 * @file gpu_common.h
 * @brief Shared WebGPU helpers for the effect renderers
 *
 * - the cover-fit full-screen vertex stage every effect pass starts from
 * - texture, buffer and sampler factories returning owned handles
 * - single-pass command submission
 */

#include <layershift/effects/gpu_handle.h>
#include <webgpu/webgpu.h>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>

namespace layershift::gpu {

inline WGPUStringView toStringView(const char* str) {
    WGPUStringView view;
    view.data = str;
    view.length = std::strlen(str);
    return view;
}

inline std::string fromStringView(WGPUStringView view) {
    if (!view.data) return {};
    const size_t len = view.length == WGPU_STRLEN ? std::strlen(view.data) : view.length;
    return std::string(view.data, len);
}

/**
 * @brief Full-screen triangle with a cover-fit UV transform
 *
 * Fragment stages receive screenUv (0..1, top-left origin) and uv (the
 * source image coordinate). The including shader declares binding 0 of
 * group 1 as a ViewUniforms buffer.
 */
inline constexpr const char* COVER_FIT_VERTEX_SHADER = R"(
struct ViewUniforms {
    uvOffset: vec2f,
    uvScale: vec2f,
};

@group(1) @binding(0) var<uniform> viewUniforms: ViewUniforms;

struct VertexOutput {
    @builtin(position) position: vec4f,
    @location(0) uv: vec2f,
    @location(1) screenUv: vec2f,
};

@vertex
fn vs_main(@builtin(vertex_index) vertexIndex: u32) -> VertexOutput {
    var positions = array<vec2f, 3>(
        vec2f(-1.0, -1.0),
        vec2f(3.0, -1.0),
        vec2f(-1.0, 3.0)
    );
    let p = positions[vertexIndex];
    var out: VertexOutput;
    out.position = vec4f(p, 0.0, 1.0);
    out.screenUv = vec2f((p.x + 1.0) * 0.5, 1.0 - (p.y + 1.0) * 0.5);
    out.uv = viewUniforms.uvOffset + out.screenUv * viewUniforms.uvScale;
    return out;
}
)";

/// @brief Plain full-screen triangle for grid passes (bilateral, jump flood)
inline constexpr const char* FULLSCREEN_VERTEX_SHADER = R"(
struct VertexOutput {
    @builtin(position) position: vec4f,
    @location(0) uv: vec2f,
};

@vertex
fn vs_main(@builtin(vertex_index) vertexIndex: u32) -> VertexOutput {
    var positions = array<vec2f, 3>(
        vec2f(-1.0, -1.0),
        vec2f(3.0, -1.0),
        vec2f(-1.0, 3.0)
    );
    var out: VertexOutput;
    out.position = vec4f(positions[vertexIndex], 0.0, 1.0);
    out.uv = (positions[vertexIndex] + 1.0) * 0.5;
    out.uv.y = 1.0 - out.uv.y;
    return out;
}
)";

struct ViewUniforms {
    float uvOffset[2];
    float uvScale[2];
};

// -----------------------------------------------------------------------------
// Factories
// -----------------------------------------------------------------------------

RenderTarget createTarget(WGPUDevice device, uint32_t width, uint32_t height,
                          WGPUTextureFormat format, WGPUTextureUsage usage, const char* label);

BufferHandle createBuffer(WGPUDevice device, uint64_t size, WGPUBufferUsage usage, const char* label);

inline BufferHandle createUniformBuffer(WGPUDevice device, uint64_t size, const char* label) {
    return createBuffer(device, size, WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst, label);
}

/// @brief Vertex buffer initialized from floats
BufferHandle createVertexBuffer(WGPUDevice device, WGPUQueue queue,
                                const float* data, size_t floatCount, const char* label);

/// @brief Index buffer initialized from uint16 indices (padded to 4 bytes)
BufferHandle createIndexBuffer(WGPUDevice device, WGPUQueue queue,
                               const uint16_t* data, size_t count, const char* label);

SamplerHandle createSampler(WGPUDevice device, WGPUFilterMode filter);

/// @brief Tightly packed upload of a whole 2D texture
void writeTexture(WGPUQueue queue, WGPUTexture texture, const void* data,
                  uint32_t bytesPerPixel, uint32_t width, uint32_t height);

template<typename T>
void writeUniforms(WGPUQueue queue, WGPUBuffer buffer, const T& value) {
    wgpuQueueWriteBuffer(queue, buffer, 0, &value, sizeof(T));
}

// -----------------------------------------------------------------------------
// Passes
// -----------------------------------------------------------------------------

struct ColorAttachment {
    WGPUTextureView view = nullptr;
    bool clear = true;
    WGPUColor clearValue{0.0, 0.0, 0.0, 1.0};
};

/**
 * @brief Begin a render pass on up to four color attachments
 * @param stencilView Optional Stencil8 attachment, cleared when clearStencil
 */
WGPURenderPassEncoder beginPass(WGPUCommandEncoder encoder,
                                const ColorAttachment* attachments, uint32_t count,
                                WGPUTextureView stencilView = nullptr,
                                bool clearStencil = true);

inline WGPURenderPassEncoder beginPass(WGPUCommandEncoder encoder, WGPUTextureView view,
                                       bool clear = true) {
    ColorAttachment attachment;
    attachment.view = view;
    attachment.clear = clear;
    return beginPass(encoder, &attachment, 1);
}

/// @brief End and release a pass encoder
void endPass(WGPURenderPassEncoder pass);

/// @brief Record into a fresh encoder and submit it
void submit(WGPUDevice device, WGPUQueue queue,
            const std::function<void(WGPUCommandEncoder)>& record);

} // namespace layershift::gpu
