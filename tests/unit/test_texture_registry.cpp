/**
 * @file test_texture_registry.cpp
 * @brief Unit tests for TextureRegistry
 */

#include <catch2/catch_test_macros.hpp>

#include <sprig/errors.h>
#include <sprig/texture_registry.h>
#include "../fixtures/recording_backend.h"

using namespace sprig;
using sprig::testing::RecordingBackend;
using sprig::testing::fakeTexture;

TEST_CASE("TextureRegistry register and lookup", "[unit][texture_registry]") {
    RecordingBackend backend;
    TextureRegistry registry(backend);

    registry.registerTexture(1, {64, 32}, TextureKind::Color, fakeTexture(1));

    SECTION("lookup returns the registration") {
        TextureInfo info = registry.lookup(1);
        REQUIRE(info.id == 1);
        REQUIRE(info.size == glm::uvec2(64, 32));
        REQUIRE(info.kind == TextureKind::Color);
        REQUIRE_FALSE(info.isMask());
        REQUIRE(info.texture == fakeTexture(1));
        REQUIRE(info.bindGroup != INVALID_BIND_GROUP);
        REQUIRE(backend.bindGroups.at(info.bindGroup).texture == fakeTexture(1));
    }

    SECTION("uniform buffer holds size and mask flag") {
        registry.registerTexture(2, {8, 8}, TextureKind::Mask, fakeTexture(2));
        BufferId uniforms = backend.bindGroups.at(registry.lookup(2).bindGroup).uniforms;

        auto u = backend.read<TextureUniforms>(uniforms, 0);
        REQUIRE(u.size == glm::vec2(8.0f, 8.0f));
        REQUIRE(u.isMask == 1u);
    }

    SECTION("unknown id throws UnknownTextureError") {
        REQUIRE_THROWS_AS(registry.lookup(99), UnknownTextureError);
        try {
            registry.lookup(99);
        } catch (const UnknownTextureError& e) {
            REQUIRE(e.textureId() == 99);
            REQUIRE(e.kind() == ErrorKind::UnknownTexture);
        }
    }

    SECTION("duplicate id is rejected") {
        REQUIRE_THROWS_AS(registry.registerTexture(1, {4, 4}, TextureKind::Color, fakeTexture(3)),
                          InvalidStateError);
        REQUIRE(registry.lookup(1).texture == fakeTexture(1));
    }

    SECTION("invalid arguments are rejected") {
        REQUIRE_THROWS_AS(registry.registerTexture(5, {0, 4}, TextureKind::Color, fakeTexture(5)),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(registry.registerTexture(5, {4, 4}, TextureKind::Color, nullptr),
                          std::invalid_argument);
        REQUIRE_FALSE(registry.contains(5));
    }
}

TEST_CASE("TextureRegistry unregister", "[unit][texture_registry]") {
    RecordingBackend backend;
    TextureRegistry registry(backend);

    TextureHandle handle = registry.registerTexture(1, {16, 16}, TextureKind::Color, fakeTexture(1));
    REQUIRE(backend.bindGroups.size() == 1);
    REQUIRE(backend.buffers.size() == 1);

    registry.unregisterTexture(handle);

    SECTION("lookup after unregister throws") {
        REQUIRE_THROWS_AS(registry.lookup(1), UnknownTextureError);
        REQUIRE_FALSE(registry.contains(1));
        REQUIRE(registry.size() == 0);
    }

    SECTION("GPU resources are released") {
        REQUIRE(backend.bindGroups.empty());
        REQUIRE(backend.buffers.empty());
    }

    SECTION("a stale handle cannot unregister a newer registration") {
        registry.registerTexture(1, {16, 16}, TextureKind::Color, fakeTexture(2));
        REQUIRE_THROWS_AS(registry.unregisterTexture(handle), UnknownTextureError);
        REQUIRE(registry.contains(1));
    }

    SECTION("double unregister throws") {
        REQUIRE_THROWS_AS(registry.unregisterTexture(handle), UnknownTextureError);
    }
}

TEST_CASE("TextureRegistry update", "[unit][texture_registry]") {
    RecordingBackend backend;
    TextureRegistry registry(backend);
    registry.registerTexture(1, {16, 16}, TextureKind::Color, fakeTexture(1));
    REQUIRE(registry.bindGroupBuilds() == 1);

    SECTION("size-only change keeps the bind group") {
        BindGroupId before = registry.lookup(1).bindGroup;
        registry.updateTexture(1, {32, 32}, fakeTexture(1));

        TextureInfo info = registry.lookup(1);
        REQUIRE(info.bindGroup == before);
        REQUIRE(info.size == glm::uvec2(32, 32));
        REQUIRE(registry.bindGroupBuilds() == 1);

        BufferId uniforms = backend.bindGroups.at(before).uniforms;
        REQUIRE(backend.read<TextureUniforms>(uniforms, 0).size == glm::vec2(32.0f, 32.0f));
    }

    SECTION("new texture rebuilds the bind group once") {
        BindGroupId before = registry.lookup(1).bindGroup;
        registry.updateTexture(1, {16, 16}, fakeTexture(9));

        TextureInfo info = registry.lookup(1);
        REQUIRE(info.bindGroup != before);
        REQUIRE(info.texture == fakeTexture(9));
        REQUIRE(registry.bindGroupBuilds() == 2);
        REQUIRE(backend.bindGroups.size() == 1);
    }

    SECTION("lookups never rebuild") {
        for (int i = 0; i < 10; i++) {
            registry.lookup(1);
        }
        REQUIRE(backend.textureBindGroupsCreated == 1);
    }

    SECTION("unknown id throws") {
        REQUIRE_THROWS_AS(registry.updateTexture(2, {1, 1}, fakeTexture(2)), UnknownTextureError);
    }
}

TEST_CASE("TextureRegistry cleans up a failed registration", "[unit][texture_registry]") {
    RecordingBackend backend;
    TextureRegistry registry(backend);
    backend.failBindGroups = true;

    REQUIRE_THROWS_AS(registry.registerTexture(1, {4, 4}, TextureKind::Color, fakeTexture(1)),
                      std::runtime_error);
    REQUIRE_FALSE(registry.contains(1));
    REQUIRE(backend.buffers.empty());
}

TEST_CASE("TextureRegistry keeps the old texture when an update fails", "[unit][texture_registry]") {
    RecordingBackend backend;
    TextureRegistry registry(backend);
    registry.registerTexture(1, {4, 4}, TextureKind::Color, fakeTexture(1));
    TextureInfo before = registry.lookup(1);
    BufferId uniforms = backend.bindGroups.at(before.bindGroup).uniforms;

    backend.failBindGroups = true;
    REQUIRE_THROWS_AS(registry.updateTexture(1, {64, 64}, fakeTexture(2)), std::runtime_error);

    TextureInfo after = registry.lookup(1);
    REQUIRE(after.size == glm::uvec2(4, 4));
    REQUIRE(after.texture == fakeTexture(1));
    REQUIRE(after.bindGroup == before.bindGroup);
    REQUIRE(registry.bindGroupBuilds() == 1);
    REQUIRE(backend.bindGroups.size() == 1);
    REQUIRE(backend.read<TextureUniforms>(uniforms, 0).size == glm::vec2(4.0f, 4.0f));

    // The registry still accepts the update once the backend recovers
    backend.failBindGroups = false;
    registry.updateTexture(1, {64, 64}, fakeTexture(2));
    REQUIRE(registry.lookup(1).size == glm::uvec2(64, 64));
    REQUIRE(registry.lookup(1).texture == fakeTexture(2));
    REQUIRE(backend.read<TextureUniforms>(uniforms, 0).size == glm::vec2(64.0f, 64.0f));
}

TEST_CASE("TextureRegistry releases everything on destruction", "[unit][texture_registry]") {
    RecordingBackend backend;
    {
        TextureRegistry registry(backend);
        registry.registerTexture(1, {4, 4}, TextureKind::Color, fakeTexture(1));
        registry.registerTexture(2, {4, 4}, TextureKind::Mask, fakeTexture(2));
        REQUIRE(registry.size() == 2);
    }
    REQUIRE(backend.bindGroups.empty());
    REQUIRE(backend.buffers.empty());
}
