#pragma once

/**
 * @file frame_buffers.h
 * @brief Persistent GPU buffers reused across frames
 *
 * One vertex buffer, one index buffer and one group-uniform buffer live for
 * the lifetime of the renderer. Each frame's contents are staged in CPU
 * memory and uploaded in a single write per buffer before any draw call is
 * recorded.
 *
 * Buffers grow by doubling when a frame needs more sprites than they hold,
 * up to RendererConfig::maxSpriteCapacity. They never shrink.
 *
 * Because the buffers are overwritten in place, a frame whose draws were
 * recorded (markInFlight()) holds them until the backend's submissionCount()
 * moves on. upload() throws InvalidStateError before that point.
 */

#include <sprig/config.h>
#include <sprig/gpu_backend.h>
#include <sprig/types.h>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace sprig {

class Frame;

class FrameBufferManager {
public:
    static constexpr uint32_t INITIAL_UNIFORM_SLOTS = 16;

    FrameBufferManager(GpuBackend& backend, const RendererConfig& config);
    ~FrameBufferManager();

    FrameBufferManager(const FrameBufferManager&) = delete;
    FrameBufferManager& operator=(const FrameBufferManager&) = delete;

    /**
     * @brief Stage and upload a finalized frame
     *
     * Grows the buffers if needed, then writes vertices and one GroupUniforms
     * slot per transform referenced by the frame's batches.
     *
     * @throws InvalidStateError unless the frame is Finalized, or while the
     *         previous frame's draws are recorded but not yet submitted
     * @throws BufferOverflowError if the frame exceeds maxSpriteCapacity
     */
    void upload(Frame& frame);

    /// @brief Mark the uploaded contents as read by recorded, unsubmitted draws
    void markInFlight();

    /// @brief True from markInFlight() until the backend submits again
    bool inFlight() const;

    /**
     * @brief Make sure the buffers hold at least `sprites` sprites
     * @throws BufferOverflowError above maxSpriteCapacity
     */
    void reserve(uint32_t sprites);

    /**
     * @brief Dynamic uniform offset of a transform's slot in the last upload
     * @throws InvalidStateError if the transform was not uploaded
     */
    uint32_t slotFor(TransformId transform) const;

    BufferId vertexBuffer() const { return m_vertexBuffer; }
    BufferId indexBuffer() const { return m_indexBuffer; }
    BindGroupId groupBindGroup() const { return m_groupBindGroup; }

    uint32_t spriteCapacity() const { return m_spriteCapacity; }
    uint32_t uniformSlotCapacity() const { return m_slotCapacity; }

    /// @brief Bytes written by the last upload()
    uint64_t uploadedBytes() const { return m_uploadedBytes; }

    /// @brief Times the sprite buffers were regrown after the first allocation
    uint32_t reallocations() const { return m_reallocations; }

    /// @brief Free every buffer (also done by the destructor)
    void release();

private:
    void growSpriteBuffers(uint32_t capacity);
    void growUniformBuffer(uint32_t slots);

    GpuBackend& m_backend;
    RendererConfig m_config;
    uint32_t m_slotStride;

    BufferId m_vertexBuffer = INVALID_BUFFER;
    BufferId m_indexBuffer = INVALID_BUFFER;
    BufferId m_uniformBuffer = INVALID_BUFFER;
    BindGroupId m_groupBindGroup = INVALID_BIND_GROUP;

    uint32_t m_spriteCapacity = 0;
    uint32_t m_slotCapacity = 0;
    uint32_t m_reallocations = 0;
    uint64_t m_uploadedBytes = 0;

    bool m_inFlight = false;
    uint64_t m_inFlightSubmission = 0;

    // CPU staging
    std::vector<uint32_t> m_indexStaging;
    std::vector<uint8_t> m_uniformStaging;
    std::unordered_map<TransformId, uint32_t> m_slots;
};

} // namespace sprig
