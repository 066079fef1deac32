#pragma once

/**
 * @file draw_executor.h
 * @brief Turns a finalized, uploaded frame into GPU commands
 *
 * Geometry is bound once per frame. Per batch the executor binds the
 * texture's bind group and the transform's uniform slot, each only when it
 * differs from the previous batch, then issues one indexed draw over the
 * batch's index range.
 */

#include <sprig/frame.h>
#include <sprig/frame_buffers.h>
#include <sprig/gpu_backend.h>
#include <sprig/texture_registry.h>
#include <cstdint>
#include <ostream>

namespace sprig {

struct DrawStats {
    uint32_t sprites = 0;
    uint32_t batches = 0;
    uint32_t drawCalls = 0;
    uint32_t bindGroupSwitches = 0;  ///< Texture bind group binds
    uint32_t uniformBinds = 0;       ///< Group uniform binds
};

std::ostream& operator<<(std::ostream& os, const DrawStats& stats);

class DrawExecutor {
public:
    /**
     * @brief Record the frame's draw calls
     *
     * Every batch's bind group is resolved before the first command is
     * issued, so a failure leaves nothing half-drawn.
     *
     * @throws InvalidStateError unless the frame is Finalized and uploaded
     * @throws UnknownTextureError if a texture was unregistered since submit
     */
    DrawStats execute(Frame& frame, const TextureRegistry& textures,
                      const FrameBufferManager& buffers, GpuBackend& backend);
};

} // namespace sprig
