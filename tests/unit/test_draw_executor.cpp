/**
 * @file test_draw_executor.cpp
 * @brief Unit tests for draw call emission
 */

#include <catch2/catch_test_macros.hpp>

#include <sprig/draw_executor.h>
#include <sprig/errors.h>
#include "../fixtures/recording_backend.h"

#include <sstream>

using namespace sprig;
using sprig::testing::RecordedCommand;
using sprig::testing::RecordingBackend;
using sprig::testing::fakeTexture;

namespace {

struct Harness {
    RecordingBackend backend;
    TextureRegistry textures{backend};
    FrameBufferManager buffers{backend, RendererConfig{}};
    DrawExecutor executor;
    Frame frame{glm::uvec2(800, 600)};

    Harness() {
        textures.registerTexture(1, {8, 8}, TextureKind::Color, fakeTexture(1));
        textures.registerTexture(2, {8, 8}, TextureKind::Color, fakeTexture(2));
    }

    void submit(TextureId texture, int count = 1, TransformId group = NO_TRANSFORM) {
        for (int i = 0; i < count; i++) {
            SpriteRequest sprite;
            sprite.texture = texture;
            sprite.src = Rect(0, 0, 8, 8);
            sprite.group = group;
            frame.submit(sprite, textures);
        }
    }

    DrawStats run() {
        frame.finalize();
        buffers.upload(frame);
        return executor.execute(frame, textures, buffers, backend);
    }
};

} // namespace

TEST_CASE("DrawExecutor issues one draw per batch", "[unit][draw_executor]") {
    Harness h;

    SECTION("A3 B2 A1") {
        h.submit(1, 3);
        h.submit(2, 2);
        h.submit(1, 1);
        DrawStats stats = h.run();

        REQUIRE(stats.sprites == 6);
        REQUIRE(stats.batches == 3);
        REQUIRE(stats.drawCalls == 3);
        REQUIRE(stats.bindGroupSwitches == 3);

        auto draws = h.backend.commandsOfType(RecordedCommand::Type::DrawIndexed);
        REQUIRE(draws.size() == 3);
        // indexCount, firstIndex
        REQUIRE(draws[0].a == 18);
        REQUIRE(draws[0].b == 0);
        REQUIRE(draws[1].a == 12);
        REQUIRE(draws[1].b == 18);
        REQUIRE(draws[2].a == 6);
        REQUIRE(draws[2].b == 30);
        for (const auto& d : draws) {
            REQUIRE(d.baseVertex == 0);
            REQUIRE(d.instanceCount == 1);
        }
    }

    SECTION("texture bind precedes each draw and matches the batch") {
        h.submit(1, 2);
        h.submit(2, 1);
        h.run();

        BindGroupId a = h.textures.lookup(1).bindGroup;
        BindGroupId b = h.textures.lookup(2).bindGroup;
        auto binds = h.backend.commandsOfType(RecordedCommand::Type::SetTextureBindGroup);
        REQUIRE(binds.size() == 2);
        REQUIRE(binds[0].a == a);
        REQUIRE(binds[1].a == b);

        // SetGeometry first, then binds and draws
        REQUIRE(h.backend.commands.front().type == RecordedCommand::Type::SetGeometry);
        REQUIRE(h.backend.commands.back().type == RecordedCommand::Type::DrawIndexed);
    }

    SECTION("single texture gives a single draw") {
        h.submit(1, 500);
        DrawStats stats = h.run();
        REQUIRE(stats.drawCalls == 1);
        REQUIRE(h.backend.drawCount() == 1);
    }

    SECTION("empty frame issues nothing") {
        DrawStats stats = h.run();
        REQUIRE(stats.batches == 0);
        REQUIRE(stats.drawCalls == 0);
        REQUIRE(h.backend.commands.empty());
        REQUIRE(h.frame.state() == FrameState::Executed);
    }
}

TEST_CASE("DrawExecutor skips redundant binds", "[unit][draw_executor]") {
    Harness h;

    SECTION("transform-only change keeps the texture bind group") {
        TransformId shifted = h.frame.addTransform(glm::mat4(1.0f));
        h.submit(1, 2);
        h.submit(1, 2, shifted);
        DrawStats stats = h.run();

        REQUIRE(stats.batches == 2);
        REQUIRE(stats.bindGroupSwitches == 1);
        REQUIRE(stats.uniformBinds == 2);

        auto uniforms = h.backend.commandsOfType(RecordedCommand::Type::SetGroupBindGroup);
        REQUIRE(uniforms[0].b == 0);
        REQUIRE(uniforms[1].b == 256);
    }

    SECTION("texture-only change keeps the group uniforms") {
        h.submit(1);
        h.submit(2);
        h.submit(1);
        DrawStats stats = h.run();

        REQUIRE(stats.uniformBinds == 1);
        REQUIRE(stats.bindGroupSwitches == 3);
    }
}

TEST_CASE("DrawExecutor state checks", "[unit][draw_executor]") {
    Harness h;
    h.submit(1);

    SECTION("building frame is rejected") {
        REQUIRE_THROWS_AS(h.executor.execute(h.frame, h.textures, h.buffers, h.backend), InvalidStateError);
    }

    SECTION("frame without upload is rejected") {
        h.frame.finalize();
        REQUIRE_THROWS_AS(h.executor.execute(h.frame, h.textures, h.buffers, h.backend), InvalidStateError);
        REQUIRE(h.backend.commands.empty());
    }

    SECTION("a frame executes once") {
        h.run();
        REQUIRE_THROWS_AS(h.executor.execute(h.frame, h.textures, h.buffers, h.backend), InvalidStateError);
        REQUIRE(h.backend.drawCount() == 1);
    }

    SECTION("texture unregistered after submit draws nothing") {
        h.submit(2);
        h.frame.finalize();
        h.buffers.upload(h.frame);

        // Drop texture 2, keep 1
        h.textures.clear();
        h.textures.registerTexture(1, {8, 8}, TextureKind::Color, fakeTexture(1));

        REQUIRE_THROWS_AS(h.executor.execute(h.frame, h.textures, h.buffers, h.backend), UnknownTextureError);
        REQUIRE(h.backend.commands.empty());
        REQUIRE(h.frame.state() == FrameState::Finalized);
    }
}

TEST_CASE("DrawStats prints a summary", "[unit][draw_executor]") {
    DrawStats stats;
    stats.sprites = 6;
    stats.batches = 3;
    stats.drawCalls = 3;
    std::ostringstream os;
    os << stats;
    REQUIRE(os.str().find("6 sprites, 3 batches, 3 draws") == 0);
}
