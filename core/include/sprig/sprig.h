#pragma once

/**
 * @file sprig.h
 * @brief Convenience header for the sprite batching engine
 */

#include <sprig/types.h>
#include <sprig/transform.h>
#include <sprig/errors.h>
#include <sprig/config.h>
#include <sprig/gpu_backend.h>
#include <sprig/geometry.h>
#include <sprig/texture_registry.h>
#include <sprig/batcher.h>
#include <sprig/frame.h>
#include <sprig/frame_buffers.h>
#include <sprig/draw_executor.h>
#include <sprig/sprite_renderer.h>
