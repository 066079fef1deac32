#include <sprig/errors.h>

namespace sprig {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnknownTexture: return "UnknownTexture";
        case ErrorKind::BufferOverflow: return "BufferOverflow";
        case ErrorKind::InvalidState: return "InvalidState";
    }
    return "Unknown";
}

UnknownTextureError::UnknownTextureError(TextureId id)
    : Error(ErrorKind::UnknownTexture, "Unknown texture id " + std::to_string(id))
    , m_id(id) {}

BufferOverflowError::BufferOverflowError(size_t requestedSprites, size_t maxSprites)
    : Error(ErrorKind::BufferOverflow,
            "Frame needs " + std::to_string(requestedSprites) +
            " sprites, cap is " + std::to_string(maxSprites))
    , m_requested(requestedSprites)
    , m_limit(maxSprites) {}

} // namespace sprig
