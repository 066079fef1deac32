#pragma once

/**
 * @file batcher.h
 * @brief Groups an ordered sprite stream into the fewest draw calls
 *
 * A batch is a maximal run of consecutive sprites sharing one texture and one
 * group transform. Runs are never merged across a key change, even when the
 * same key shows up again later: the sprites in between may overlap, and
 * blending depends on draw order.
 *
 * Interleaving textures sprite-by-sprite degrades to one batch per sprite.
 * Callers that know their sprites do not overlap should group submissions by
 * texture, or begin the frame in SubmitMode::Reorderable.
 */

#include <sprig/geometry.h>
#include <sprig/types.h>
#include <cstdint>
#include <vector>

namespace sprig {

/**
 * @brief What a sprite needs bound to be drawn
 */
struct BatchKey {
    TextureId texture = 0;
    TransformId transform = NO_TRANSFORM;

    bool operator==(const BatchKey& o) const {
        return texture == o.texture && transform == o.transform;
    }
    bool operator!=(const BatchKey& o) const { return !(*this == o); }
    bool operator<(const BatchKey& o) const {
        return texture != o.texture ? texture < o.texture : transform < o.transform;
    }
};

/**
 * @brief One draw call's worth of sprites
 *
 * `first` and `count` are in sprites; vertex and index ranges are derived.
 */
struct Batch {
    TextureId texture = 0;
    TransformId transform = NO_TRANSFORM;
    uint32_t first = 0;
    uint32_t count = 0;

    BatchKey key() const { return {texture, transform}; }

    uint32_t end() const { return first + count; }
    uint32_t vertexStart() const { return first * GeometryBuilder::VERTICES_PER_SPRITE; }
    uint32_t vertexCount() const { return count * GeometryBuilder::VERTICES_PER_SPRITE; }
    uint32_t indexStart() const { return first * GeometryBuilder::INDICES_PER_SPRITE; }
    uint32_t indexCount() const { return count * GeometryBuilder::INDICES_PER_SPRITE; }

    bool operator==(const Batch& o) const {
        return texture == o.texture && transform == o.transform &&
               first == o.first && count == o.count;
    }
};

/**
 * @brief Incremental single-pass batcher
 *
 * @code
 * Batcher batcher;
 * for (const auto& key : keys) batcher.add(key);
 * std::vector<Batch> batches = batcher.finish();
 * @endcode
 */
class Batcher {
public:
    /// @brief Extend the running batch or close it and start a new one
    void add(const BatchKey& key);

    /// @brief Close the final batch and hand over the result
    std::vector<Batch> finish();

    void reset();

    /// @brief Sprites seen since the last reset
    uint32_t spriteCount() const { return m_next; }

private:
    std::vector<Batch> m_batches;
    Batch m_current;
    bool m_open = false;
    uint32_t m_next = 0;
};

/**
 * @brief One-shot form of Batcher
 */
std::vector<Batch> buildBatches(const std::vector<BatchKey>& keys);

/**
 * @brief Number of maximal same-key runs in a key sequence
 */
size_t countRuns(const std::vector<BatchKey>& keys);

} // namespace sprig
