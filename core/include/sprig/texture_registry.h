#pragma once

/**
 * @file texture_registry.h
 * @brief Maps texture ids to GPU bind groups
 *
 * The registry builds one bind group per texture (texture, sampler and a
 * 16-byte TextureUniforms buffer) and keeps it until the texture is
 * unregistered. Bind groups are rebuilt only when the underlying GPU texture
 * changes, never per frame.
 *
 * @par Example
 * @code
 * TextureRegistry registry(backend);
 * TextureHandle atlas = registry.registerTexture(1, {512, 512}, TextureKind::Color, gpuTexture);
 * TextureInfo info = registry.lookup(1);
 * registry.unregisterTexture(atlas);
 * @endcode
 */

#include <sprig/gpu_backend.h>
#include <sprig/types.h>
#include <cstdint>
#include <mutex>
#include <unordered_map>

namespace sprig {

/**
 * @brief Resolved texture state
 */
struct TextureInfo {
    TextureId id = 0;
    glm::uvec2 size{0};
    TextureKind kind = TextureKind::Color;
    BindGroupId bindGroup = INVALID_BIND_GROUP;
    RawTexture texture = nullptr;

    bool isMask() const { return kind == TextureKind::Mask; }
};

/**
 * @brief Proof of registration
 *
 * The generation guards against unregistering a newer registration of the
 * same id with a stale handle.
 */
struct TextureHandle {
    TextureId id = 0;
    uint32_t generation = 0;
};

class TextureRegistry {
public:
    explicit TextureRegistry(GpuBackend& backend);
    ~TextureRegistry();

    TextureRegistry(const TextureRegistry&) = delete;
    TextureRegistry& operator=(const TextureRegistry&) = delete;

    /**
     * @brief Register a texture and build its bind group
     * @throws InvalidStateError if the id is already registered
     * @throws std::invalid_argument for a null texture or zero size
     */
    TextureHandle registerTexture(TextureId id, glm::uvec2 size, TextureKind kind, RawTexture texture);

    /**
     * @brief Release the texture's bind group and uniform buffer
     * @throws UnknownTextureError if the handle is not (or no longer) registered
     */
    void unregisterTexture(TextureHandle handle);

    /**
     * @brief Resolve an id
     * @throws UnknownTextureError if the id is not registered
     */
    TextureInfo lookup(TextureId id) const;

    bool contains(TextureId id) const;

    /**
     * @brief Point an id at a new GPU texture and/or size
     *
     * The bind group is rebuilt only when `texture` differs from the current
     * one; a size-only change just rewrites the uniform buffer.
     */
    void updateTexture(TextureId id, glm::uvec2 size, RawTexture texture);

    size_t size() const;

    /// @brief Number of bind groups built since construction
    uint64_t bindGroupBuilds() const;

    /// @brief Release everything (also done by the destructor)
    void clear();

private:
    struct Entry {
        TextureInfo info;
        BufferId uniforms = INVALID_BUFFER;
        uint32_t generation = 0;
    };

    void writeUniforms(const Entry& entry);
    void releaseEntry(Entry& entry);

    GpuBackend& m_backend;
    std::unordered_map<TextureId, Entry> m_entries;
    uint32_t m_nextGeneration = 1;
    uint64_t m_bindGroupBuilds = 0;
    mutable std::mutex m_mutex;
};

} // namespace sprig
