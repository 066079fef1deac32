#pragma once

/**
 * @file config.h
 * @brief Renderer configuration and JSON loading
 *
 * @par Example renderer.json
 * @code
 * {
 *   "initialSpriteCapacity": 4096,
 *   "maxSpriteCapacity": 262144,
 *   "filter": "linear",
 *   "logStats": true,
 *   "interleaveWarningThreshold": 512
 * }
 * @endcode
 */

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace sprig {

enum class SamplerFilter {
    Nearest,
    Linear
};

const char* samplerFilterName(SamplerFilter filter);

struct RendererConfig {
    /// Largest maxSpriteCapacity whose 6 indices per sprite still fit in uint32
    static constexpr uint32_t SPRITE_CAPACITY_LIMIT = UINT32_MAX / 6;

    uint32_t initialSpriteCapacity = 1024;     ///< Sprites the first buffers hold
    uint32_t maxSpriteCapacity = 1u << 20;     ///< Hard cap per frame
    SamplerFilter filter = SamplerFilter::Nearest;
    bool logStats = false;                     ///< Print DrawStats after each render
    uint32_t interleaveWarningThreshold = 256; ///< Min sprites before warning about 1-sprite batches

    /// @throws std::invalid_argument for zero or inverted capacities, or a
    ///         cap above SPRITE_CAPACITY_LIMIT
    void validate() const;
};

/**
 * @brief Read known keys over the defaults
 *
 * Unknown keys are ignored.
 * @throws std::invalid_argument if a known key has the wrong type or value
 */
RendererConfig configFromJson(const nlohmann::json& j, const RendererConfig& defaults = {});

nlohmann::json configToJson(const RendererConfig& config);

/**
 * @brief Load a JSON config file into `config`
 * @return false if the file is missing or invalid; `config` is left untouched
 */
bool loadConfig(const std::string& path, RendererConfig& config);

} // namespace sprig
