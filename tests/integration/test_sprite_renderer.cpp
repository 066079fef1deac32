/**
 * @file test_sprite_renderer.cpp
 * @brief Integration tests for the full frame loop
 *
 * Drives SpriteRenderer end to end against the recording backend: register
 * textures, submit, prepare, render, and inspect the recorded commands.
 */

#include <catch2/catch_test_macros.hpp>

#include <sprig/sprig.h>
#include "../fixtures/recording_backend.h"

using namespace sprig;
using sprig::testing::RecordedCommand;
using sprig::testing::RecordingBackend;
using sprig::testing::fakeTexture;

namespace {

constexpr TextureId ATLAS = 1;
constexpr TextureId GLYPHS = 2;

SpriteRequest sprite(TextureId texture, float x, float y) {
    SpriteRequest s;
    s.texture = texture;
    s.src = Rect(0, 0, 16, 16);
    s.transform = Affine2::translation(x, y);
    return s;
}

} // namespace

TEST_CASE("SpriteRenderer frame loop", "[integration][renderer]") {
    RecordingBackend backend;
    SpriteRenderer renderer(backend);
    renderer.textures().registerTexture(ATLAS, {256, 256}, TextureKind::Color, fakeTexture(1));
    renderer.textures().registerTexture(GLYPHS, {128, 128}, TextureKind::Mask, fakeTexture(2));

    SECTION("A3 B2 A1 renders three draws in order") {
        renderer.beginFrame({640, 480});
        for (int i = 0; i < 3; i++) renderer.submit(sprite(ATLAS, i * 16.0f, 0));
        for (int i = 0; i < 2; i++) renderer.submit(sprite(GLYPHS, i * 16.0f, 32));
        renderer.submit(sprite(ATLAS, 0, 64));

        renderer.prepare();
        DrawStats stats = renderer.render();

        REQUIRE(stats.batches == 3);
        REQUIRE(stats.drawCalls == 3);

        // Replay the commands and check textures come in painter's order
        std::vector<BindGroupId> bound;
        for (const auto& c : backend.commands) {
            if (c.type == RecordedCommand::Type::SetTextureBindGroup) bound.push_back(c.a);
        }
        BindGroupId atlas = renderer.textures().lookup(ATLAS).bindGroup;
        BindGroupId glyphs = renderer.textures().lookup(GLYPHS).bindGroup;
        REQUIRE(bound == std::vector<BindGroupId>{atlas, glyphs, atlas});
    }

    SECTION("render prepares implicitly") {
        renderer.beginFrame({640, 480});
        renderer.submit(sprite(ATLAS, 0, 0));
        DrawStats stats = renderer.render();
        REQUIRE(stats.drawCalls == 1);
        REQUIRE(renderer.lastStats().sprites == 1);
        REQUIRE(renderer.framesRendered() == 1);
    }

    SECTION("empty frame") {
        renderer.beginFrame({640, 480});
        DrawStats stats = renderer.render();
        REQUIRE(stats.batches == 0);
        REQUIRE(backend.drawCount() == 0);
    }

    SECTION("unknown texture drops the sprite and the frame goes on") {
        renderer.beginFrame({640, 480});
        renderer.submit(sprite(ATLAS, 0, 0));
        REQUIRE_THROWS_AS(renderer.submit(sprite(99, 0, 0)), UnknownTextureError);
        renderer.submit(sprite(ATLAS, 16, 0));

        DrawStats stats = renderer.render();
        REQUIRE(stats.sprites == 2);
        REQUIRE(stats.drawCalls == 1);
    }

    SECTION("rendering twice is InvalidState") {
        renderer.beginFrame({640, 480});
        renderer.submit(sprite(ATLAS, 0, 0));
        renderer.render();
        REQUIRE_THROWS_AS(renderer.render(), InvalidStateError);
        REQUIRE_THROWS_AS(renderer.submit(sprite(ATLAS, 0, 0)), InvalidStateError);
    }

    SECTION("beginFrame discards an unrendered frame") {
        renderer.beginFrame({640, 480});
        renderer.submit(sprite(ATLAS, 0, 0));
        renderer.prepare();

        Frame& next = renderer.beginFrame({640, 480});
        REQUIRE(next.state() == FrameState::Building);
        REQUIRE(next.empty());
        REQUIRE(backend.drawCount() == 0);

        // Nothing drew from the discarded upload, so the buffers are free
        renderer.submit(sprite(ATLAS, 0, 0));
        REQUIRE_NOTHROW(renderer.prepare());
    }

    SECTION("discardFrame has no GPU side effects") {
        renderer.beginFrame({640, 480});
        renderer.submit(sprite(ATLAS, 0, 0));
        uint32_t writes = backend.writeCalls;
        renderer.discardFrame();

        REQUIRE(renderer.currentFrame()->state() == FrameState::Discarded);
        REQUIRE(backend.writeCalls == writes);
        REQUIRE(backend.commands.empty());
        REQUIRE_THROWS_AS(renderer.render(), InvalidStateError);
    }

    SECTION("calls before beginFrame are InvalidState") {
        REQUIRE(renderer.currentFrame() == nullptr);
        REQUIRE_THROWS_AS(renderer.submit(sprite(ATLAS, 0, 0)), InvalidStateError);
        REQUIRE_THROWS_AS(renderer.render(), InvalidStateError);
    }
}

TEST_CASE("SpriteRenderer steady state", "[integration][renderer]") {
    RecordingBackend backend;
    SpriteRenderer renderer(backend);
    renderer.textures().registerTexture(ATLAS, {256, 256}, TextureKind::Color, fakeTexture(1));

    uint32_t buffersAfterFirst = 0;
    for (int frame = 0; frame < 5; frame++) {
        renderer.beginFrame({800, 600});
        for (int i = 0; i < 100; i++) {
            renderer.submit(sprite(ATLAS, float(i), 0));
        }
        renderer.render();
        backend.submit();
        if (frame == 0) {
            buffersAfterFirst = backend.buffersCreated;
        }
    }

    // No per-frame buffer or bind group creation once warmed up
    REQUIRE(backend.buffersCreated == buffersAfterFirst);
    REQUIRE(backend.textureBindGroupsCreated == 1);
    REQUIRE(renderer.textures().bindGroupBuilds() == 1);
    REQUIRE(renderer.framesRendered() == 5);
}

TEST_CASE("SpriteRenderer waits for submission before reusing buffers", "[integration][renderer]") {
    RecordingBackend backend;
    SpriteRenderer renderer(backend);
    renderer.textures().registerTexture(ATLAS, {256, 256}, TextureKind::Color, fakeTexture(1));

    // Frame A is recorded but its command buffer is still open
    renderer.beginFrame({640, 480});
    renderer.submit(sprite(ATLAS, 10, 0));
    renderer.render();
    BufferId vertices = renderer.buffers().vertexBuffer();
    uint32_t writes = backend.buffers.at(vertices).writes;

    renderer.beginFrame({640, 480});
    renderer.submit(sprite(ATLAS, 300, 0));

    SECTION("preparing the next frame is refused") {
        REQUIRE(renderer.buffers().inFlight());
        REQUIRE_THROWS_AS(renderer.prepare(), InvalidStateError);
        REQUIRE_THROWS_AS(renderer.render(), InvalidStateError);

        // Frame A's vertices were not overwritten
        REQUIRE(backend.buffers.at(vertices).writes == writes);
        REQUIRE(backend.read<SpriteVertex>(vertices, 0).position.x == 10.0f);
        REQUIRE(renderer.currentFrame()->state() == FrameState::Finalized);
        REQUIRE(backend.drawCount() == 1);
    }

    SECTION("the next frame proceeds once the previous one is submitted") {
        backend.submit();
        REQUIRE_FALSE(renderer.buffers().inFlight());

        DrawStats stats = renderer.render();
        REQUIRE(stats.drawCalls == 1);
        REQUIRE(backend.read<SpriteVertex>(vertices, 0).position.x == 300.0f);
        REQUIRE(renderer.buffers().inFlight());
    }

    SECTION("an empty frame records nothing and does not hold the buffers") {
        backend.submit();
        renderer.discardFrame();
        renderer.beginFrame({640, 480});
        renderer.render();
        REQUIRE_FALSE(renderer.buffers().inFlight());
    }
}

TEST_CASE("SpriteRenderer buffer growth and overflow", "[integration][renderer]") {
    RecordingBackend backend;
    RendererConfig config;
    config.initialSpriteCapacity = 8;
    config.maxSpriteCapacity = 32;
    SpriteRenderer renderer(backend, config);
    renderer.textures().registerTexture(ATLAS, {64, 64}, TextureKind::Color, fakeTexture(1));

    SECTION("frames larger than the initial capacity grow the buffers") {
        renderer.beginFrame({100, 100});
        for (int i = 0; i < 20; i++) renderer.submit(sprite(ATLAS, 0, 0));
        renderer.render();
        REQUIRE(renderer.buffers().spriteCapacity() == 20);
        REQUIRE(renderer.lastStats().drawCalls == 1);
    }

    SECTION("overflow discards the frame") {
        renderer.beginFrame({100, 100});
        for (int i = 0; i < 33; i++) renderer.submit(sprite(ATLAS, 0, 0));
        REQUIRE_THROWS_AS(renderer.prepare(), BufferOverflowError);
        REQUIRE(renderer.currentFrame()->state() == FrameState::Discarded);
        REQUIRE(backend.drawCount() == 0);

        // The next frame is unaffected
        renderer.beginFrame({100, 100});
        renderer.submit(sprite(ATLAS, 0, 0));
        REQUIRE(renderer.render().drawCalls == 1);
    }
}

TEST_CASE("SpriteRenderer worst and best cases", "[integration][renderer]") {
    RecordingBackend backend;
    SpriteRenderer renderer(backend);
    renderer.textures().registerTexture(ATLAS, {64, 64}, TextureKind::Color, fakeTexture(1));
    renderer.textures().registerTexture(GLYPHS, {64, 64}, TextureKind::Color, fakeTexture(2));

    SECTION("alternating textures give one draw per sprite") {
        renderer.beginFrame({100, 100});
        for (int i = 0; i < 64; i++) {
            renderer.submit(sprite(i % 2 == 0 ? ATLAS : GLYPHS, 0, 0));
        }
        DrawStats stats = renderer.render();
        REQUIRE(stats.batches == 64);
        REQUIRE(stats.drawCalls == 64);
    }

    SECTION("reorderable mode collapses the same input to two draws") {
        renderer.beginFrame({100, 100}, SubmitMode::Reorderable);
        for (int i = 0; i < 64; i++) {
            renderer.submit(sprite(i % 2 == 0 ? ATLAS : GLYPHS, 0, 0));
        }
        DrawStats stats = renderer.render();
        REQUIRE(stats.batches == 2);
        REQUIRE(stats.sprites == 64);
    }

    SECTION("group transforms split batches but not texture binds") {
        renderer.beginFrame({100, 100});
        TransformId camera = renderer.addTransform(Affine2::scaling(2.0f, 2.0f).toMat4());
        SpriteRequest world = sprite(ATLAS, 0, 0);
        world.group = camera;

        renderer.submit(world);
        renderer.submit(world);
        renderer.submit(sprite(ATLAS, 0, 0));
        DrawStats stats = renderer.render();

        REQUIRE(stats.batches == 2);
        REQUIRE(stats.bindGroupSwitches == 1);
        REQUIRE(stats.uniformBinds == 2);
    }
}
