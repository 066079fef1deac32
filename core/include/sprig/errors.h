#pragma once

/**
 * @file errors.h
 * @brief Exceptions raised by the batching engine
 *
 * All failures are deterministic consequences of caller misuse or resource
 * limits. Nothing is retried internally; the caller decides whether to drop
 * the sprite or the frame.
 */

#include <sprig/types.h>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace sprig {

enum class ErrorKind {
    UnknownTexture,  ///< Lookup of an unregistered texture id
    BufferOverflow,  ///< Frame needs more sprites than the hard cap
    InvalidState     ///< Operation not allowed in the current state
};

const char* errorKindName(ErrorKind kind);

/**
 * @brief Base class for all sprig errors
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

/**
 * @brief Texture id was never registered, or has been unregistered
 *
 * Fatal to the offending submission only: the sprite is dropped and the
 * frame stays usable.
 */
class UnknownTextureError : public Error {
public:
    explicit UnknownTextureError(TextureId id);

    TextureId textureId() const { return m_id; }

private:
    TextureId m_id;
};

/**
 * @brief Growing the frame buffers would exceed the configured cap
 *
 * Fatal to the frame.
 */
class BufferOverflowError : public Error {
public:
    BufferOverflowError(size_t requestedSprites, size_t maxSprites);

    size_t requested() const { return m_requested; }
    size_t limit() const { return m_limit; }

private:
    size_t m_requested;
    size_t m_limit;
};

/**
 * @brief Programming error, e.g. submit() after finalize()
 */
class InvalidStateError : public Error {
public:
    explicit InvalidStateError(const std::string& message)
        : Error(ErrorKind::InvalidState, message) {}
};

} // namespace sprig
