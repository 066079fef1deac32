#include <sprig/geometry.h>

namespace sprig {

std::array<SpriteVertex, GeometryBuilder::VERTICES_PER_SPRITE>
GeometryBuilder::buildQuad(const SpriteRequest& sprite) {
    const Rect& src = sprite.src;
    float w = static_cast<float>(src.width);
    float h = static_cast<float>(src.height);

    glm::vec2 p0 = sprite.transform.apply(0.0f, 0.0f);
    glm::vec2 p1 = sprite.transform.apply(0.0f, h);
    glm::vec2 p2 = sprite.transform.apply(w, 0.0f);
    glm::vec2 p3 = sprite.transform.apply(w, h);

    float u0 = static_cast<float>(src.left());
    float v0 = static_cast<float>(src.top());
    float u1 = static_cast<float>(src.right());
    float v1 = static_cast<float>(src.bottom());

    float z = sprite.layer;
    return {{
        {{p0.x, p0.y, z}, {u0, v0}, sprite.tint},
        {{p1.x, p1.y, z}, {u0, v1}, sprite.tint},
        {{p2.x, p2.y, z}, {u1, v0}, sprite.tint},
        {{p3.x, p3.y, z}, {u1, v1}, sprite.tint},
    }};
}

void GeometryBuilder::append(const SpriteRequest& sprite, std::vector<SpriteVertex>& vertices) {
    auto quad = buildQuad(sprite);
    vertices.insert(vertices.end(), quad.begin(), quad.end());
}

void GeometryBuilder::fillIndices(uint32_t quadCount, std::vector<uint32_t>& indices) {
    indices.clear();
    indices.reserve(static_cast<size_t>(quadCount) * INDICES_PER_SPRITE);
    for (uint32_t q = 0; q < quadCount; q++) {
        uint32_t base = q * VERTICES_PER_SPRITE;
        for (uint32_t i : QUAD_INDICES) {
            indices.push_back(base + i);
        }
    }
}

} // namespace sprig
