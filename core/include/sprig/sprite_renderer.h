#pragma once

/**
 * @file sprite_renderer.h
 * @brief Frame loop facade over the batching engine
 *
 * Owns the texture registry, the persistent frame buffers and the current
 * frame. The GPU backend is borrowed and must outlive the renderer.
 *
 * One vertex, index and uniform buffer set is shared by every frame and
 * overwritten by prepare(). Once render() has recorded a frame's draws, the
 * command buffer holding them must be submitted (the backend's
 * submissionCount() must advance) before the next frame is prepared;
 * prepare() throws InvalidStateError until then. A frame that was prepared
 * but never rendered does not hold the buffers.
 *
 * @par Example
 * @code
 * SpriteRenderer renderer(backend);
 * renderer.textures().registerTexture(1, {256, 256}, TextureKind::Color, atlas);
 *
 * renderer.beginFrame({1280, 720});
 * SpriteRequest sprite;
 * sprite.texture = 1;
 * sprite.src = {0, 0, 32, 32};
 * sprite.transform = Affine2::translation(100.0f, 100.0f);
 * renderer.submit(sprite);
 * renderer.prepare();
 * // ... inside a render pass:
 * DrawStats stats = renderer.render();
 * // ... end the pass and submit before the next prepare()
 * @endcode
 */

#include <sprig/config.h>
#include <sprig/draw_executor.h>
#include <sprig/frame.h>
#include <sprig/frame_buffers.h>
#include <sprig/gpu_backend.h>
#include <sprig/texture_registry.h>
#include <cstdint>
#include <memory>

namespace sprig {

class SpriteRenderer {
public:
    explicit SpriteRenderer(GpuBackend& backend, const RendererConfig& config = {});
    ~SpriteRenderer();

    SpriteRenderer(const SpriteRenderer&) = delete;
    SpriteRenderer& operator=(const SpriteRenderer&) = delete;

    TextureRegistry& textures() { return m_textures; }
    const TextureRegistry& textures() const { return m_textures; }
    const FrameBufferManager& buffers() const { return m_buffers; }
    const RendererConfig& config() const { return m_config; }

    /**
     * @brief Start a new frame
     *
     * A frame that was begun but never rendered is discarded with a warning.
     */
    Frame& beginFrame(glm::uvec2 targetSize, SubmitMode mode = SubmitMode::Ordered);

    /// @brief Register a group transform for the current frame
    TransformId addTransform(const glm::mat4& transform);

    /**
     * @brief Queue a sprite on the current frame
     * @throws UnknownTextureError the sprite is dropped, the frame continues
     */
    void submit(const SpriteRequest& sprite);

    /**
     * @brief Finalize and upload the current frame
     *
     * Call before the render pass begins.
     * @throws BufferOverflowError the frame is discarded
     * @throws InvalidStateError the previous frame's draws are not submitted
     *         yet; the frame stays Finalized and can be prepared again later
     */
    void prepare();

    /**
     * @brief Record the current frame's draw calls into the backend
     *
     * Prepares the frame first if prepare() was not called.
     */
    DrawStats render();

    /// @brief Drop the current frame without drawing it
    void discardFrame();

    /// @brief Current frame, or nullptr before the first beginFrame()
    const Frame* currentFrame() const { return m_frame.get(); }

    const DrawStats& lastStats() const { return m_lastStats; }
    uint64_t framesRendered() const { return m_framesRendered; }

private:
    Frame& requireFrame(const char* operation);

    GpuBackend& m_backend;
    RendererConfig m_config;
    TextureRegistry m_textures;
    FrameBufferManager m_buffers;
    DrawExecutor m_executor;

    std::unique_ptr<Frame> m_frame;
    DrawStats m_lastStats;
    uint64_t m_framesRendered = 0;
    bool m_interleaveWarned = false;
};

} // namespace sprig
