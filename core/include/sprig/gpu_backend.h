#pragma once

/**
 * @file gpu_backend.h
 * @brief Abstract GPU backend consumed by the batching engine
 *
 * The engine needs only four primitives from a GPU: upload a contiguous byte
 * buffer, bind a fixed-layout uniform block, bind a texture+sampler pair and
 * issue an indexed draw. Everything else (device, queue, surface, pipeline)
 * belongs to the concrete backend.
 *
 * Bind group slots:
 * - group 0: texture, sampler, TextureUniforms (built by TextureRegistry)
 * - group 1: GroupUniforms with a dynamic offset (built by FrameBufferManager)
 */

#include <sprig/types.h>
#include <cstdint>

namespace sprig {

enum class BufferUsage {
    Vertex,
    Index,
    Uniform
};

class GpuBackend {
public:
    virtual ~GpuBackend() = default;

    // -------------------------------------------------------------------------
    /// @name Resources
    /// @{

    /// @brief Create a buffer that can be written with writeBuffer()
    virtual BufferId createBuffer(BufferUsage usage, uint64_t size) = 0;
    virtual void releaseBuffer(BufferId buffer) = 0;

    /**
     * @brief Create the group 0 bind group for one texture
     * @param texture Backend texture
     * @param uniforms 16-byte TextureUniforms buffer
     */
    virtual BindGroupId createTextureBindGroup(RawTexture texture, BufferId uniforms) = 0;

    /**
     * @brief Create the group 1 bind group over a GroupUniforms slot array
     *
     * Bound with a dynamic offset that selects one slot.
     */
    virtual BindGroupId createGroupBindGroup(BufferId uniforms) = 0;

    virtual void releaseBindGroup(BindGroupId group) = 0;

    /// @brief Required alignment of dynamic uniform offsets, in bytes
    virtual uint32_t uniformAlignment() const = 0;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Primitives
    /// @{

    virtual void writeBuffer(BufferId buffer, uint64_t offset, const void* data, uint64_t size) = 0;

    virtual void setGeometry(BufferId vertices, BufferId indices) = 0;
    virtual void setTextureBindGroup(BindGroupId group) = 0;
    virtual void setGroupBindGroup(BindGroupId group, uint32_t dynamicOffset) = 0;

    virtual void drawIndexed(uint32_t indexCount, uint32_t firstIndex,
                             int32_t baseVertex, uint32_t instanceCount) = 0;

    /**
     * @brief Command buffers handed to the GPU queue so far
     *
     * Must increase with every submit. FrameBufferManager compares it to
     * tell whether recorded draws still wait on the current buffer contents.
     */
    virtual uint64_t submissionCount() const = 0;

    /// @}
};

} // namespace sprig
