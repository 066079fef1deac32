#pragma once

/**
 * @file frame.h
 * @brief One frame's worth of sprite submissions
 *
 * A Frame collects sprites in painter's order (back to front), expands them
 * into vertices as they arrive and batches them on finalize(). It never
 * touches the GPU itself: FrameBufferManager uploads it and DrawExecutor
 * draws it.
 *
 * Lifecycle:
 * @code
 *   Building --finalize()--> Finalized --(DrawExecutor)--> Executed
 *       \______________________|_____________________________|--discard()--> Discarded
 * @endcode
 */

#include <sprig/batcher.h>
#include <sprig/geometry.h>
#include <sprig/types.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <vector>

namespace sprig {

class TextureRegistry;

enum class FrameState {
    Building,
    Finalized,
    Executed,
    Discarded
};

const char* frameStateName(FrameState state);

enum class SubmitMode {
    Ordered,     ///< Draw order equals submission order (default)
    Reorderable  ///< Caller guarantees no overlap; sprites are grouped by key
};

class Frame {
public:
    Frame(glm::uvec2 targetSize, SubmitMode mode = SubmitMode::Ordered);

    // -------------------------------------------------------------------------
    /// @name Submission
    /// @{

    /**
     * @brief Register a group transform for this frame
     *
     * The matrix is applied to sprite positions (target pixels) in the vertex
     * shader. Ids start at 1 and are only valid for this frame.
     */
    TransformId addTransform(const glm::mat4& transform);

    /**
     * @brief Queue one sprite
     * @throws UnknownTextureError if the texture is not registered; the sprite
     *         is dropped and the frame stays usable
     * @throws InvalidStateError outside Building, or for an unknown group id
     */
    void submit(const SpriteRequest& sprite, const TextureRegistry& textures);

    /**
     * @brief Close submission and build the batches
     * @throws InvalidStateError unless Building
     */
    const std::vector<Batch>& finalize();

    /// @brief Abandon the frame; valid in any state
    void discard();

    /// @}
    // -------------------------------------------------------------------------
    /// @name State
    /// @{

    FrameState state() const { return m_state; }
    SubmitMode mode() const { return m_mode; }
    glm::uvec2 targetSize() const { return m_targetSize; }

    uint32_t spriteCount() const { return static_cast<uint32_t>(m_keys.size()); }
    bool empty() const { return m_keys.empty(); }

    const std::vector<BatchKey>& keys() const { return m_keys; }
    const std::vector<SpriteVertex>& vertices() const { return m_vertices; }
    const std::vector<Batch>& batches() const { return m_batches; }

    /// @brief Identity for NO_TRANSFORM
    const glm::mat4& transform(TransformId id) const;
    uint32_t transformCount() const { return static_cast<uint32_t>(m_transforms.size()); }

    /// @brief Set by FrameBufferManager::upload()
    bool uploaded() const { return m_uploaded; }
    void markUploaded();

    /// @brief Set by DrawExecutor::execute()
    void markExecuted();

    /// @}

private:
    void requireState(FrameState expected, const char* operation) const;
    void reorderByKey();

    glm::uvec2 m_targetSize;
    SubmitMode m_mode;
    FrameState m_state = FrameState::Building;
    bool m_uploaded = false;

    std::vector<BatchKey> m_keys;
    std::vector<SpriteVertex> m_vertices;
    std::vector<glm::mat4> m_transforms;  // index = id - 1
    std::vector<Batch> m_batches;
    Batcher m_batcher;
};

} // namespace sprig
