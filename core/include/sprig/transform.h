#pragma once

/**
 * @file transform.h
 * @brief 2D affine transform used to place a sprite's source rect
 */

#include <glm/glm.hpp>
#include <optional>

namespace sprig {

/**
 * @brief 2x2 linear part plus translation
 *
 * Equivalent to the 3x3 homogeneous matrix
 * @code
 * | m[0][0] m[1][0] t.x |
 * | m[0][1] m[1][1] t.y |
 * |   0       0      1  |
 * @endcode
 *
 * Composition follows matrix order: `(a * b).apply(p) == a.apply(b.apply(p))`,
 * so `scaling(2, 2) * translation(10, 0)` translates first, then scales.
 */
class Affine2 {
public:
    /// @brief Identity transform
    Affine2() : m_linear(1.0f), m_translation(0.0f) {}

    Affine2(const glm::mat2& linear, const glm::vec2& translation)
        : m_linear(linear), m_translation(translation) {}

    /**
     * @brief Build from individual elements (column-major)
     */
    static Affine2 fromElements(float m00, float m01, float m10, float m11, float tx, float ty) {
        return Affine2(glm::mat2(m00, m01, m10, m11), glm::vec2(tx, ty));
    }

    static Affine2 identity() { return Affine2(); }
    static Affine2 translation(float tx, float ty);
    static Affine2 scaling(float sx, float sy);

    /// @brief Counter-clockwise rotation by theta radians (y down = clockwise on screen)
    static Affine2 rotation(float theta);

    const glm::mat2& linear() const { return m_linear; }
    const glm::vec2& translation() const { return m_translation; }

    float determinant() const { return glm::determinant(m_linear); }

    /**
     * @brief Inverse transform
     * @return nullopt when the linear part is degenerate
     */
    std::optional<Affine2> inverse() const;

    /// @brief Transform a point
    glm::vec2 apply(const glm::vec2& p) const { return m_linear * p + m_translation; }
    glm::vec2 apply(float x, float y) const { return apply(glm::vec2(x, y)); }

    /// @brief Expand to a 4x4 matrix for group uniforms
    glm::mat4 toMat4() const;

    Affine2 operator*(const Affine2& rhs) const {
        return Affine2(m_linear * rhs.m_linear, m_linear * rhs.m_translation + m_translation);
    }

    Affine2& operator*=(const Affine2& rhs) {
        *this = *this * rhs;
        return *this;
    }

    bool operator==(const Affine2& o) const {
        return m_linear == o.m_linear && m_translation == o.m_translation;
    }
    bool operator!=(const Affine2& o) const { return !(*this == o); }

private:
    glm::mat2 m_linear;
    glm::vec2 m_translation;
};

} // namespace sprig
