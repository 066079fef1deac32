#include <sprig/frame_buffers.h>
#include <sprig/errors.h>
#include <sprig/frame.h>
#include <sprig/geometry.h>
#include <algorithm>
#include <cstring>
#include <iostream>

namespace sprig {

namespace {

uint32_t alignUp(uint32_t value, uint32_t alignment) {
    if (alignment == 0) {
        return value;
    }
    return (value + alignment - 1) / alignment * alignment;
}

} // namespace

FrameBufferManager::FrameBufferManager(GpuBackend& backend, const RendererConfig& config)
    : m_backend(backend), m_config(config) {
    m_config.validate();
    m_slotStride = alignUp(static_cast<uint32_t>(sizeof(GroupUniforms)), m_backend.uniformAlignment());
}

FrameBufferManager::~FrameBufferManager() {
    release();
}

void FrameBufferManager::release() {
    if (m_groupBindGroup != INVALID_BIND_GROUP) {
        m_backend.releaseBindGroup(m_groupBindGroup);
        m_groupBindGroup = INVALID_BIND_GROUP;
    }
    for (BufferId* buffer : {&m_vertexBuffer, &m_indexBuffer, &m_uniformBuffer}) {
        if (*buffer != INVALID_BUFFER) {
            m_backend.releaseBuffer(*buffer);
            *buffer = INVALID_BUFFER;
        }
    }
    m_spriteCapacity = 0;
    m_slotCapacity = 0;
    m_slots.clear();
    m_inFlight = false;
}

void FrameBufferManager::reserve(uint32_t sprites) {
    if (sprites > m_config.maxSpriteCapacity) {
        throw BufferOverflowError(sprites, m_config.maxSpriteCapacity);
    }
    if (sprites <= m_spriteCapacity) {
        return;
    }

    uint32_t newCapacity = m_spriteCapacity == 0 ? m_config.initialSpriteCapacity
                                                 : m_spriteCapacity * 2;
    newCapacity = std::max(newCapacity, sprites);
    newCapacity = std::min(newCapacity, m_config.maxSpriteCapacity);
    growSpriteBuffers(newCapacity);
}

void FrameBufferManager::growSpriteBuffers(uint32_t capacity) {
    uint64_t vertexBytes = uint64_t(capacity) * GeometryBuilder::VERTICES_PER_SPRITE * sizeof(SpriteVertex);
    uint64_t indexBytes = uint64_t(capacity) * GeometryBuilder::INDICES_PER_SPRITE * sizeof(uint32_t);

    BufferId vertices = m_backend.createBuffer(BufferUsage::Vertex, vertexBytes);
    BufferId indices = INVALID_BUFFER;
    try {
        indices = m_backend.createBuffer(BufferUsage::Index, indexBytes);
        GeometryBuilder::fillIndices(capacity, m_indexStaging);
        m_backend.writeBuffer(indices, 0, m_indexStaging.data(), indexBytes);
    } catch (...) {
        if (indices != INVALID_BUFFER) {
            m_backend.releaseBuffer(indices);
        }
        m_backend.releaseBuffer(vertices);
        throw;
    }
    m_uploadedBytes += indexBytes;

    bool regrown = m_vertexBuffer != INVALID_BUFFER;
    if (regrown) {
        m_backend.releaseBuffer(m_vertexBuffer);
        m_backend.releaseBuffer(m_indexBuffer);
        m_reallocations++;
        std::cerr << "[FrameBuffers] Grew sprite buffers: " << m_spriteCapacity
                  << " -> " << capacity << " sprites\n";
    }

    m_vertexBuffer = vertices;
    m_indexBuffer = indices;
    m_spriteCapacity = capacity;
}

void FrameBufferManager::growUniformBuffer(uint32_t slots) {
    uint32_t newCapacity = m_slotCapacity == 0 ? INITIAL_UNIFORM_SLOTS : m_slotCapacity * 2;
    newCapacity = std::max(newCapacity, slots);

    BufferId buffer = m_backend.createBuffer(BufferUsage::Uniform, uint64_t(newCapacity) * m_slotStride);
    BindGroupId group = INVALID_BIND_GROUP;
    try {
        group = m_backend.createGroupBindGroup(buffer);
    } catch (...) {
        m_backend.releaseBuffer(buffer);
        throw;
    }

    if (m_groupBindGroup != INVALID_BIND_GROUP) {
        m_backend.releaseBindGroup(m_groupBindGroup);
    }
    if (m_uniformBuffer != INVALID_BUFFER) {
        m_backend.releaseBuffer(m_uniformBuffer);
    }
    m_uniformBuffer = buffer;
    m_groupBindGroup = group;
    m_slotCapacity = newCapacity;
}

void FrameBufferManager::upload(Frame& frame) {
    if (frame.state() != FrameState::Finalized) {
        throw InvalidStateError(std::string("upload: frame is ") + frameStateName(frame.state()) +
                                ", expected Finalized");
    }
    if (inFlight()) {
        throw InvalidStateError("upload: the previous frame's draws read these buffers and "
                                "have not been submitted yet");
    }
    m_inFlight = false;

    m_uploadedBytes = 0;
    m_slots.clear();
    if (frame.empty()) {
        frame.markUploaded();
        return;
    }

    reserve(frame.spriteCount());

    // Slot 0 is always the identity transform
    m_slots[NO_TRANSFORM] = 0;
    for (const Batch& batch : frame.batches()) {
        if (m_slots.find(batch.transform) == m_slots.end()) {
            uint32_t slot = static_cast<uint32_t>(m_slots.size());
            m_slots[batch.transform] = slot;
        }
    }
    uint32_t slotCount = static_cast<uint32_t>(m_slots.size());
    if (slotCount > m_slotCapacity) {
        growUniformBuffer(slotCount);
    }

    m_uniformStaging.assign(size_t(slotCount) * m_slotStride, 0);
    for (const auto& [id, slot] : m_slots) {
        GroupUniforms uniforms = {};
        uniforms.targetSize = glm::vec2(frame.targetSize());
        uniforms.transform = frame.transform(id);
        std::memcpy(m_uniformStaging.data() + size_t(slot) * m_slotStride, &uniforms, sizeof(uniforms));
    }

    const auto& vertices = frame.vertices();
    uint64_t vertexBytes = vertices.size() * sizeof(SpriteVertex);
    m_backend.writeBuffer(m_vertexBuffer, 0, vertices.data(), vertexBytes);
    m_backend.writeBuffer(m_uniformBuffer, 0, m_uniformStaging.data(), m_uniformStaging.size());
    m_uploadedBytes += vertexBytes + m_uniformStaging.size();

    frame.markUploaded();
}

void FrameBufferManager::markInFlight() {
    m_inFlight = true;
    m_inFlightSubmission = m_backend.submissionCount();
}

bool FrameBufferManager::inFlight() const {
    return m_inFlight && m_backend.submissionCount() == m_inFlightSubmission;
}

uint32_t FrameBufferManager::slotFor(TransformId transform) const {
    auto it = m_slots.find(transform);
    if (it == m_slots.end()) {
        throw InvalidStateError("slotFor: transform " + std::to_string(transform) +
                                " was not uploaded this frame");
    }
    return it->second * m_slotStride;
}

} // namespace sprig
