// Layershift - WebGPU helpers

#include <layershift/effects/gpu_common.h>
#include <vector>

namespace layershift::gpu {

RenderTarget createTarget(WGPUDevice device, uint32_t width, uint32_t height,
                          WGPUTextureFormat format, WGPUTextureUsage usage, const char* label) {
    RenderTarget target;

    WGPUTextureDescriptor texDesc = {};
    texDesc.label = toStringView(label);
    texDesc.usage = usage;
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.size = {width, height, 1};
    texDesc.format = format;
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = 1;
    target.texture.reset(wgpuDeviceCreateTexture(device, &texDesc));
    if (!target.texture) return target;

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = format;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.mipLevelCount = 1;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_All;
    target.view.reset(wgpuTextureCreateView(target.texture, &viewDesc));

    target.format = format;
    target.width = width;
    target.height = height;
    return target;
}

BufferHandle createBuffer(WGPUDevice device, uint64_t size, WGPUBufferUsage usage, const char* label) {
    WGPUBufferDescriptor desc = {};
    desc.label = toStringView(label);
    desc.size = (size + 3) & ~uint64_t(3);
    desc.usage = usage;
    return BufferHandle(wgpuDeviceCreateBuffer(device, &desc));
}

BufferHandle createVertexBuffer(WGPUDevice device, WGPUQueue queue,
                                const float* data, size_t floatCount, const char* label) {
    const uint64_t size = floatCount * sizeof(float);
    BufferHandle buffer = createBuffer(device, size > 0 ? size : 4,
                                       WGPUBufferUsage_Vertex | WGPUBufferUsage_CopyDst, label);
    if (buffer && size > 0) wgpuQueueWriteBuffer(queue, buffer, 0, data, size);
    return buffer;
}

BufferHandle createIndexBuffer(WGPUDevice device, WGPUQueue queue,
                               const uint16_t* data, size_t count, const char* label) {
    // Buffer writes must be a multiple of 4 bytes
    std::vector<uint16_t> padded(data, data + count);
    if (padded.size() % 2 != 0) padded.push_back(0);
    const uint64_t size = padded.size() * sizeof(uint16_t);
    BufferHandle buffer = createBuffer(device, size > 0 ? size : 4,
                                       WGPUBufferUsage_Index | WGPUBufferUsage_CopyDst, label);
    if (buffer && size > 0) wgpuQueueWriteBuffer(queue, buffer, 0, padded.data(), size);
    return buffer;
}

SamplerHandle createSampler(WGPUDevice device, WGPUFilterMode filter) {
    WGPUSamplerDescriptor desc = {};
    desc.addressModeU = WGPUAddressMode_ClampToEdge;
    desc.addressModeV = WGPUAddressMode_ClampToEdge;
    desc.addressModeW = WGPUAddressMode_ClampToEdge;
    desc.magFilter = filter;
    desc.minFilter = filter;
    desc.mipmapFilter = WGPUMipmapFilterMode_Nearest;
    desc.lodMinClamp = 0.0f;
    desc.lodMaxClamp = 1.0f;
    desc.maxAnisotropy = 1;
    return SamplerHandle(wgpuDeviceCreateSampler(device, &desc));
}

void writeTexture(WGPUQueue queue, WGPUTexture texture, const void* data,
                  uint32_t bytesPerPixel, uint32_t width, uint32_t height) {
    WGPUTexelCopyTextureInfo destination = {};
    destination.texture = texture;
    destination.mipLevel = 0;
    destination.origin = {0, 0, 0};
    destination.aspect = WGPUTextureAspect_All;

    WGPUTexelCopyBufferLayout layout = {};
    layout.offset = 0;
    layout.bytesPerRow = width * bytesPerPixel;
    layout.rowsPerImage = height;

    WGPUExtent3D size = {width, height, 1};
    wgpuQueueWriteTexture(queue, &destination, data,
                          static_cast<size_t>(width) * height * bytesPerPixel, &layout, &size);
}

WGPURenderPassEncoder beginPass(WGPUCommandEncoder encoder,
                                const ColorAttachment* attachments, uint32_t count,
                                WGPUTextureView stencilView, bool clearStencil) {
    WGPURenderPassColorAttachment colors[4] = {};
    if (count > 4) count = 4;
    for (uint32_t i = 0; i < count; ++i) {
        colors[i].view = attachments[i].view;
        colors[i].depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
        colors[i].loadOp = attachments[i].clear ? WGPULoadOp_Clear : WGPULoadOp_Load;
        colors[i].storeOp = WGPUStoreOp_Store;
        colors[i].clearValue = attachments[i].clearValue;
    }

    WGPURenderPassDepthStencilAttachment stencil = {};
    stencil.view = stencilView;
    stencil.depthLoadOp = WGPULoadOp_Undefined;
    stencil.depthStoreOp = WGPUStoreOp_Undefined;
    stencil.stencilLoadOp = clearStencil ? WGPULoadOp_Clear : WGPULoadOp_Load;
    stencil.stencilStoreOp = WGPUStoreOp_Store;
    stencil.stencilClearValue = 0;

    WGPURenderPassDescriptor passDesc = {};
    passDesc.colorAttachmentCount = count;
    passDesc.colorAttachments = colors;
    passDesc.depthStencilAttachment = stencilView ? &stencil : nullptr;
    return wgpuCommandEncoderBeginRenderPass(encoder, &passDesc);
}

void endPass(WGPURenderPassEncoder pass) {
    wgpuRenderPassEncoderEnd(pass);
    wgpuRenderPassEncoderRelease(pass);
}

void submit(WGPUDevice device, WGPUQueue queue,
            const std::function<void(WGPUCommandEncoder)>& record) {
    WGPUCommandEncoderDescriptor encoderDesc = {};
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(device, &encoderDesc);
    record(encoder);

    WGPUCommandBufferDescriptor cmdDesc = {};
    WGPUCommandBuffer cmdBuffer = wgpuCommandEncoderFinish(encoder, &cmdDesc);
    wgpuQueueSubmit(queue, 1, &cmdBuffer);
    wgpuCommandBufferRelease(cmdBuffer);
    wgpuCommandEncoderRelease(encoder);
}

} // namespace layershift::gpu
