#pragma once

/**
 * @file gpu_handle.h
 * @brief Move-only owners for the WebGPU objects the sprite backend creates
 *
 * Only the object types WebGpuBackend creates have a release trait. Handles
 * passed in by the caller (device, queue, textures) are borrowed and never
 * wrapped.
 *
 * @code
 * GpuHandle<WGPUBuffer> buffer(wgpuDeviceCreateBuffer(device, &desc));
 * wgpuQueueWriteBuffer(queue, buffer, 0, data, size);
 * // released when `buffer` goes out of scope
 * @endcode
 */

#include <webgpu/webgpu.h>

namespace sprig::webgpu {

template<typename T>
struct WGPUReleaseTrait;

template<>
struct WGPUReleaseTrait<WGPUTextureView> {
    static void release(WGPUTextureView h) { if (h) wgpuTextureViewRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUBuffer> {
    static void release(WGPUBuffer h) { if (h) wgpuBufferRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUBindGroup> {
    static void release(WGPUBindGroup h) { if (h) wgpuBindGroupRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUBindGroupLayout> {
    static void release(WGPUBindGroupLayout h) { if (h) wgpuBindGroupLayoutRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUSampler> {
    static void release(WGPUSampler h) { if (h) wgpuSamplerRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPURenderPipeline> {
    static void release(WGPURenderPipeline h) { if (h) wgpuRenderPipelineRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUShaderModule> {
    static void release(WGPUShaderModule h) { if (h) wgpuShaderModuleRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUPipelineLayout> {
    static void release(WGPUPipelineLayout h) { if (h) wgpuPipelineLayoutRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUCommandEncoder> {
    static void release(WGPUCommandEncoder h) { if (h) wgpuCommandEncoderRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPURenderPassEncoder> {
    static void release(WGPURenderPassEncoder h) { if (h) wgpuRenderPassEncoderRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUCommandBuffer> {
    static void release(WGPUCommandBuffer h) { if (h) wgpuCommandBufferRelease(h); }
};

template<typename T>
class GpuHandle {
public:
    GpuHandle() = default;
    explicit GpuHandle(T handle) : m_handle(handle) {}
    ~GpuHandle() { reset(); }

    // Moved into the backend's id maps, never reassigned
    GpuHandle(GpuHandle&& other) noexcept : m_handle(other.m_handle) {
        other.m_handle = nullptr;
    }

    GpuHandle(const GpuHandle&) = delete;
    GpuHandle& operator=(const GpuHandle&) = delete;
    GpuHandle& operator=(GpuHandle&&) = delete;

    T get() const { return m_handle; }
    operator T() const { return m_handle; }
    explicit operator bool() const { return m_handle != nullptr; }

    void reset(T handle = nullptr) {
        WGPUReleaseTrait<T>::release(m_handle);
        m_handle = handle;
    }

private:
    T m_handle = nullptr;
};

} // namespace sprig::webgpu
