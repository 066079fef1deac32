#include <sprig/draw_executor.h>
#include <sprig/errors.h>
#include <string>
#include <vector>

namespace sprig {

std::ostream& operator<<(std::ostream& os, const DrawStats& stats) {
    os << stats.sprites << " sprites, " << stats.batches << " batches, "
       << stats.drawCalls << " draws, " << stats.bindGroupSwitches << " texture binds, "
       << stats.uniformBinds << " uniform binds";
    return os;
}

DrawStats DrawExecutor::execute(Frame& frame, const TextureRegistry& textures,
                                const FrameBufferManager& buffers, GpuBackend& backend) {
    if (frame.state() != FrameState::Finalized) {
        throw InvalidStateError(std::string("execute: frame is ") + frameStateName(frame.state()) +
                                ", expected Finalized");
    }
    if (!frame.uploaded()) {
        throw InvalidStateError("execute: frame buffers were not uploaded");
    }

    const std::vector<Batch>& batches = frame.batches();

    struct Resolved {
        BindGroupId texture;
        uint32_t uniformOffset;
    };
    std::vector<Resolved> resolved;
    resolved.reserve(batches.size());
    for (const Batch& batch : batches) {
        resolved.push_back({textures.lookup(batch.texture).bindGroup, buffers.slotFor(batch.transform)});
    }

    DrawStats stats;
    stats.sprites = frame.spriteCount();
    stats.batches = static_cast<uint32_t>(batches.size());

    if (!batches.empty()) {
        backend.setGeometry(buffers.vertexBuffer(), buffers.indexBuffer());

        BindGroupId boundTexture = INVALID_BIND_GROUP;
        bool uniformsBound = false;
        uint32_t boundOffset = 0;

        for (size_t i = 0; i < batches.size(); i++) {
            const Batch& batch = batches[i];
            const Resolved& r = resolved[i];

            if (r.texture != boundTexture) {
                backend.setTextureBindGroup(r.texture);
                boundTexture = r.texture;
                stats.bindGroupSwitches++;
            }
            if (!uniformsBound || r.uniformOffset != boundOffset) {
                backend.setGroupBindGroup(buffers.groupBindGroup(), r.uniformOffset);
                boundOffset = r.uniformOffset;
                uniformsBound = true;
                stats.uniformBinds++;
            }

            backend.drawIndexed(batch.indexCount(), batch.indexStart(), 0, 1);
            stats.drawCalls++;
        }
    }

    frame.markExecuted();
    return stats;
}

} // namespace sprig
