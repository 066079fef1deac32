#pragma once

/**
 * @file geometry.h
 * @brief Expands sprite requests into quad vertices
 */

#include <sprig/transform.h>
#include <sprig/types.h>
#include <array>
#include <cstdint>
#include <vector>

namespace sprig {

/**
 * @brief One sprite draw request
 *
 * The source rect is placed at the origin of sprite space, so `transform`
 * maps (0,0)..(src.width, src.height) into target pixels.
 */
struct SpriteRequest {
    TextureId texture = 0;
    Rect src;                      ///< Source rect in texel pixels
    Affine2 transform;             ///< Sprite space -> target pixels
    /// Stored as vertex z for pipelines with a depth attachment. Batching
    /// never reorders by it, and the bundled WebGPU pipeline has no depth
    /// buffer, so there sprites overlap in submission order.
    float layer = 0.0f;
    glm::vec4 tint{1.0f};
    TransformId group = NO_TRANSFORM;  ///< Frame-scoped group transform
};

class GeometryBuilder {
public:
    static constexpr uint32_t VERTICES_PER_SPRITE = 4;
    static constexpr uint32_t INDICES_PER_SPRITE = 6;

    /// Two triangles: 0-1-2, 1-2-3
    static constexpr std::array<uint32_t, INDICES_PER_SPRITE> QUAD_INDICES = {0, 1, 2, 1, 2, 3};

    /**
     * @brief Build the four corners of a sprite
     *
     * Order: top-left, bottom-left, top-right, bottom-right of the source rect.
     * Tex coords are left in texel pixels so the geometry does not depend on
     * the texture's size.
     */
    static std::array<SpriteVertex, VERTICES_PER_SPRITE> buildQuad(const SpriteRequest& sprite);

    /// @brief Append a sprite's corners to the frame's vertex array
    static void append(const SpriteRequest& sprite, std::vector<SpriteVertex>& vertices);

    /**
     * @brief Write the fixed quad index pattern for quadCount sprites
     *
     * Replaces the contents of `indices`.
     */
    static void fillIndices(uint32_t quadCount, std::vector<uint32_t>& indices);
};

} // namespace sprig
