#pragma once

/**
 * @file webgpu_backend.h
 * @brief GpuBackend implementation on the WebGPU C API
 *
 * Owns the sprite pipeline (WGSL shader, two bind group layouts, alpha
 * blending) and every buffer and bind group the engine asks for. Device,
 * queue and surface stay with the caller.
 *
 * Draw primitives are recorded into the render pass set with beginPass().
 * Command buffers holding those draws go to the queue through submit(), so
 * the renderer knows when its buffers may be overwritten.
 *
 * @par Example
 * @code
 * WebGpuBackend backend(device, queue, WGPUTextureFormat_BGRA8Unorm);
 * SpriteRenderer renderer(backend);
 * renderer.textures().registerTexture(1, {512, 512}, TextureKind::Color, atlasTexture);
 *
 * renderer.beginFrame({width, height});
 * renderer.submit(sprite);
 * backend.renderToView(renderer, surfaceView, {0, 0, 0, 1});
 * @endcode
 */

#include <sprig/config.h>
#include <sprig/draw_executor.h>
#include <sprig/gpu_backend.h>
#include <sprig/webgpu/gpu_handle.h>
#include <webgpu/webgpu.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <unordered_map>

namespace sprig {
class SpriteRenderer;
}

namespace sprig::webgpu {

/// WGSL source of the sprite pipeline
extern const char* const SPRITE_SHADER;

class WebGpuBackend : public GpuBackend {
public:
    /// WebGPU default for minUniformBufferOffsetAlignment
    static constexpr uint32_t UNIFORM_ALIGNMENT = 256;

    WebGpuBackend(WGPUDevice device, WGPUQueue queue, WGPUTextureFormat targetFormat,
                  SamplerFilter filter = SamplerFilter::Nearest);
    ~WebGpuBackend() override;

    WebGpuBackend(const WebGpuBackend&) = delete;
    WebGpuBackend& operator=(const WebGpuBackend&) = delete;

    // GpuBackend
    BufferId createBuffer(BufferUsage usage, uint64_t size) override;
    void releaseBuffer(BufferId buffer) override;
    BindGroupId createTextureBindGroup(RawTexture texture, BufferId uniforms) override;
    BindGroupId createGroupBindGroup(BufferId uniforms) override;
    void releaseBindGroup(BindGroupId group) override;
    uint32_t uniformAlignment() const override { return UNIFORM_ALIGNMENT; }

    void writeBuffer(BufferId buffer, uint64_t offset, const void* data, uint64_t size) override;
    void setGeometry(BufferId vertices, BufferId indices) override;
    void setTextureBindGroup(BindGroupId group) override;
    void setGroupBindGroup(BindGroupId group, uint32_t dynamicOffset) override;
    void drawIndexed(uint32_t indexCount, uint32_t firstIndex,
                     int32_t baseVertex, uint32_t instanceCount) override;
    uint64_t submissionCount() const override { return m_submissions; }

    // -------------------------------------------------------------------------
    /// @name Render pass
    /// @{

    /// @brief Record subsequent draws into `pass` and bind the sprite pipeline
    void beginPass(WGPURenderPassEncoder pass);
    void endPass();
    bool inPass() const { return m_pass != nullptr; }

    /**
     * @brief Finish `encoder` and submit it to the queue
     *
     * Callers recording through beginPass() must submit here before the
     * renderer prepares its next frame.
     */
    void submit(WGPUCommandEncoder encoder);

    /**
     * @brief Prepare, record and submit the renderer's current frame
     *
     * Clears `view` to `clearColor`, draws the frame in one render pass and
     * submits it to the queue.
     */
    DrawStats renderToView(SpriteRenderer& renderer, WGPUTextureView view, const glm::vec4& clearColor);

    /// @}

    WGPUDevice device() const { return m_device; }
    WGPUQueue queue() const { return m_queue; }
    WGPURenderPipeline pipeline() const { return m_pipeline; }

    size_t bufferCount() const { return m_buffers.size(); }
    size_t bindGroupCount() const { return m_bindGroups.size(); }

private:
    struct Buffer {
        GpuHandle<WGPUBuffer> handle;
        uint64_t size = 0;
    };

    struct BindGroup {
        GpuHandle<WGPUBindGroup> handle;
        GpuHandle<WGPUTextureView> view;  // null for group uniforms
    };

    void createPipeline(WGPUTextureFormat targetFormat);
    void createSampler(SamplerFilter filter);

    Buffer& buffer(BufferId id);
    WGPUBindGroup bindGroup(BindGroupId id) const;
    WGPURenderPassEncoder requirePass(const char* operation) const;

    WGPUDevice m_device;
    WGPUQueue m_queue;

    GpuHandle<WGPUBindGroupLayout> m_textureLayout;
    GpuHandle<WGPUBindGroupLayout> m_groupLayout;
    GpuHandle<WGPURenderPipeline> m_pipeline;
    GpuHandle<WGPUSampler> m_sampler;

    std::unordered_map<BufferId, Buffer> m_buffers;
    std::unordered_map<BindGroupId, BindGroup> m_bindGroups;
    uint32_t m_nextId = 1;

    WGPURenderPassEncoder m_pass = nullptr;
    uint64_t m_submissions = 0;
};

} // namespace sprig::webgpu
