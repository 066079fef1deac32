#include <sprig/sprite_renderer.h>
#include <sprig/errors.h>
#include <iostream>
#include <string>

namespace sprig {

SpriteRenderer::SpriteRenderer(GpuBackend& backend, const RendererConfig& config)
    : m_backend(backend)
    , m_config(config)
    , m_textures(backend)
    , m_buffers(backend, config) {}

SpriteRenderer::~SpriteRenderer() {
    if (m_frame) {
        m_frame->discard();
    }
}

Frame& SpriteRenderer::beginFrame(glm::uvec2 targetSize, SubmitMode mode) {
    if (targetSize.x == 0 || targetSize.y == 0) {
        throw std::invalid_argument("beginFrame: target size must be non-zero");
    }
    if (m_frame) {
        FrameState state = m_frame->state();
        if (state == FrameState::Building || state == FrameState::Finalized) {
            std::cerr << "[SpriteRenderer] Discarding unrendered frame ("
                      << m_frame->spriteCount() << " sprites, " << frameStateName(state) << ")\n";
        }
        m_frame->discard();
    }
    m_frame = std::make_unique<Frame>(targetSize, mode);
    return *m_frame;
}

TransformId SpriteRenderer::addTransform(const glm::mat4& transform) {
    return requireFrame("addTransform").addTransform(transform);
}

void SpriteRenderer::submit(const SpriteRequest& sprite) {
    requireFrame("submit").submit(sprite, m_textures);
}

void SpriteRenderer::prepare() {
    Frame& frame = requireFrame("prepare");
    if (frame.state() == FrameState::Building) {
        frame.finalize();
    }
    if (frame.uploaded()) {
        return;
    }
    try {
        m_buffers.upload(frame);
    } catch (const BufferOverflowError& e) {
        std::cerr << "[SpriteRenderer] Frame discarded: " << e.what() << "\n";
        frame.discard();
        throw;
    }
}

DrawStats SpriteRenderer::render() {
    Frame& frame = requireFrame("render");
    if (frame.state() == FrameState::Building || !frame.uploaded()) {
        prepare();
    }

    m_lastStats = m_executor.execute(frame, m_textures, m_buffers, m_backend);
    if (m_lastStats.drawCalls > 0) {
        m_buffers.markInFlight();
    }
    m_framesRendered++;

    if (m_config.logStats) {
        std::cout << "[SpriteRenderer] Frame " << m_framesRendered << ": " << m_lastStats << "\n";
    }
    if (!m_interleaveWarned && m_lastStats.sprites >= m_config.interleaveWarningThreshold &&
        m_lastStats.sprites > 0 && m_lastStats.batches == m_lastStats.sprites) {
        std::cerr << "[SpriteRenderer] Warning: every batch holds a single sprite ("
                  << m_lastStats.sprites << " draws). Group submissions by texture or use "
                  << "SubmitMode::Reorderable for non-overlapping sprites\n";
        m_interleaveWarned = true;
    }
    return m_lastStats;
}

void SpriteRenderer::discardFrame() {
    if (m_frame) {
        m_frame->discard();
    }
}

Frame& SpriteRenderer::requireFrame(const char* operation) {
    if (!m_frame) {
        throw InvalidStateError(std::string(operation) + ": no frame, call beginFrame() first");
    }
    return *m_frame;
}

} // namespace sprig
