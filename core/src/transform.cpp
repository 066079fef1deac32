#include <sprig/transform.h>
#include <cmath>

namespace sprig {

Affine2 Affine2::translation(float tx, float ty) {
    return Affine2(glm::mat2(1.0f), glm::vec2(tx, ty));
}

Affine2 Affine2::scaling(float sx, float sy) {
    return Affine2(glm::mat2(sx, 0.0f, 0.0f, sy), glm::vec2(0.0f));
}

Affine2 Affine2::rotation(float theta) {
    float c = std::cos(theta);
    float s = std::sin(theta);
    return Affine2(glm::mat2(c, s, -s, c), glm::vec2(0.0f));
}

std::optional<Affine2> Affine2::inverse() const {
    float det = determinant();
    if (det == 0.0f) {
        return std::nullopt;
    }
    glm::mat2 inv = glm::inverse(m_linear);
    return Affine2(inv, -(inv * m_translation));
}

glm::mat4 Affine2::toMat4() const {
    glm::mat4 m(1.0f);
    m[0][0] = m_linear[0][0];
    m[0][1] = m_linear[0][1];
    m[1][0] = m_linear[1][0];
    m[1][1] = m_linear[1][1];
    m[3][0] = m_translation.x;
    m[3][1] = m_translation.y;
    return m;
}

} // namespace sprig
