#pragma once

/**
 * @file types.h
 * @brief Core value types shared by the sprite batching engine
 *
 * Identifiers, source rectangles, vertex layout and the uniform blocks that
 * must match the sprite shader bit-for-bit.
 */

#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>

namespace sprig {

// =============================================================================
// Identifiers
// =============================================================================

/// Caller-chosen texture identifier
using TextureId = uint64_t;

/// Frame-scoped group transform identifier (NO_TRANSFORM = identity)
using TransformId = uint32_t;

/// Backend buffer identifier (0 = invalid)
using BufferId = uint32_t;

/// Backend bind group identifier (0 = invalid)
using BindGroupId = uint32_t;

/// Opaque backend texture (WGPUTexture for the WebGPU backend)
using RawTexture = void*;

inline constexpr TransformId NO_TRANSFORM = 0;
inline constexpr BufferId INVALID_BUFFER = 0;
inline constexpr BindGroupId INVALID_BIND_GROUP = 0;

// =============================================================================
// Rect
// =============================================================================

/**
 * @brief Source rectangle in texel pixels
 */
struct Rect {
    int32_t x = 0;       ///< Left edge
    int32_t y = 0;       ///< Top edge
    uint32_t width = 0;
    uint32_t height = 0;

    constexpr Rect() = default;
    constexpr Rect(int32_t x, int32_t y, uint32_t width, uint32_t height)
        : x(x), y(y), width(width), height(height) {}

    constexpr int32_t left() const { return x; }
    constexpr int32_t top() const { return y; }
    // Widened so x + width cannot overflow
    constexpr int64_t right() const { return int64_t(x) + width; }
    constexpr int64_t bottom() const { return int64_t(y) + height; }

    constexpr bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    constexpr bool operator!=(const Rect& o) const { return !(*this == o); }
};

// =============================================================================
// Texture kind
// =============================================================================

/**
 * @brief How the fragment stage interprets a texture
 */
enum class TextureKind {
    Color,  ///< RGBA color texture, multiplied by tint
    Mask    ///< Single channel: red is alpha, tint supplies RGB
};

/**
 * @brief Convert an 8-bit RGBA color to a float tint
 */
inline glm::vec4 tintFromRgba8(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) {
    return glm::vec4(r, g, b, a) / 255.0f;
}

// =============================================================================
// GPU layouts
// =============================================================================

/**
 * @brief One corner of a sprite quad
 *
 * Matches the vertex buffer layout Float32x3 / Float32x2 / Float32x4.
 */
struct SpriteVertex {
    glm::vec3 position;   ///< Target pixels, z = layer
    glm::vec2 texCoords;  ///< Texel pixels (normalized in the shader)
    glm::vec4 tint;       ///< Straight alpha unless the caller premultiplies
};

static_assert(sizeof(SpriteVertex) == 36, "SpriteVertex must be tightly packed");
static_assert(offsetof(SpriteVertex, texCoords) == 12, "texCoords offset");
static_assert(offsetof(SpriteVertex, tint) == 20, "tint offset");

/**
 * @brief Per-texture uniform block (std140)
 *
 * WGSL: struct TextureUniforms { size: vec2f, is_mask: u32, _pad: u32 }
 */
struct TextureUniforms {
    glm::vec2 size;
    uint32_t isMask;
    uint32_t padding;
};

static_assert(sizeof(TextureUniforms) == 16, "TextureUniforms must be 16 bytes");
static_assert(offsetof(TextureUniforms, isMask) == 8, "is_mask offset");

/**
 * @brief Per-group uniform block (std140)
 *
 * WGSL: struct GroupUniforms { target_size: vec2f, _pad: vec2f, transform: mat4x4f }
 */
struct GroupUniforms {
    glm::vec2 targetSize;
    glm::vec2 padding;
    glm::mat4 transform;
};

static_assert(sizeof(GroupUniforms) == 80, "GroupUniforms must be 80 bytes");
static_assert(offsetof(GroupUniforms, transform) == 16, "transform offset");

} // namespace sprig
