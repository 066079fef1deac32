#include <sprig/frame.h>
#include <sprig/errors.h>
#include <sprig/texture_registry.h>
#include <algorithm>
#include <cstddef>
#include <numeric>
#include <string>
#include <utility>

namespace sprig {

const char* frameStateName(FrameState state) {
    switch (state) {
        case FrameState::Building: return "Building";
        case FrameState::Finalized: return "Finalized";
        case FrameState::Executed: return "Executed";
        case FrameState::Discarded: return "Discarded";
    }
    return "Unknown";
}

Frame::Frame(glm::uvec2 targetSize, SubmitMode mode)
    : m_targetSize(targetSize), m_mode(mode) {}

TransformId Frame::addTransform(const glm::mat4& transform) {
    requireState(FrameState::Building, "addTransform");
    m_transforms.push_back(transform);
    return static_cast<TransformId>(m_transforms.size());
}

void Frame::submit(const SpriteRequest& sprite, const TextureRegistry& textures) {
    requireState(FrameState::Building, "submit");
    if (sprite.group > m_transforms.size()) {
        throw InvalidStateError("submit: group transform " + std::to_string(sprite.group) +
                                " was not added to this frame");
    }

    // Throws UnknownTextureError before anything is recorded
    textures.lookup(sprite.texture);

    BatchKey key{sprite.texture, sprite.group};
    m_keys.push_back(key);
    GeometryBuilder::append(sprite, m_vertices);
    if (m_mode == SubmitMode::Ordered) {
        m_batcher.add(key);
    }
}

const std::vector<Batch>& Frame::finalize() {
    requireState(FrameState::Building, "finalize");
    if (m_mode == SubmitMode::Reorderable) {
        reorderByKey();
        m_batches = buildBatches(m_keys);
    } else {
        m_batches = m_batcher.finish();
    }
    m_state = FrameState::Finalized;
    return m_batches;
}

void Frame::discard() {
    m_state = FrameState::Discarded;
    m_keys.clear();
    m_vertices.clear();
    m_transforms.clear();
    m_batches.clear();
    m_batcher.reset();
    m_uploaded = false;
}

const glm::mat4& Frame::transform(TransformId id) const {
    static const glm::mat4 identity(1.0f);
    if (id == NO_TRANSFORM) {
        return identity;
    }
    if (id > m_transforms.size()) {
        throw InvalidStateError("Unknown group transform " + std::to_string(id));
    }
    return m_transforms[id - 1];
}

void Frame::markUploaded() {
    requireState(FrameState::Finalized, "markUploaded");
    m_uploaded = true;
}

void Frame::markExecuted() {
    requireState(FrameState::Finalized, "markExecuted");
    m_state = FrameState::Executed;
}

void Frame::requireState(FrameState expected, const char* operation) const {
    if (m_state != expected) {
        throw InvalidStateError(std::string(operation) + ": frame is " + frameStateName(m_state) +
                                ", expected " + frameStateName(expected));
    }
}

void Frame::reorderByKey() {
    std::vector<uint32_t> order(m_keys.size());
    std::iota(order.begin(), order.end(), 0u);
    std::stable_sort(order.begin(), order.end(), [this](uint32_t a, uint32_t b) {
        return m_keys[a] < m_keys[b];
    });

    std::vector<BatchKey> keys;
    std::vector<SpriteVertex> vertices;
    keys.reserve(m_keys.size());
    vertices.reserve(m_vertices.size());
    for (uint32_t i : order) {
        keys.push_back(m_keys[i]);
        auto quad = m_vertices.begin() + static_cast<ptrdiff_t>(i) * GeometryBuilder::VERTICES_PER_SPRITE;
        vertices.insert(vertices.end(), quad, quad + GeometryBuilder::VERTICES_PER_SPRITE);
    }
    m_keys = std::move(keys);
    m_vertices = std::move(vertices);
}

} // namespace sprig
