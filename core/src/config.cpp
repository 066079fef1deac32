#include <sprig/config.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace sprig {

using json = nlohmann::json;

namespace {

uint32_t readCount(const json& j, const char* key, uint32_t fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    const json& value = j[key];
    if (!value.is_number_integer() || value.get<int64_t>() < 0 ||
        value.get<int64_t>() > static_cast<int64_t>(UINT32_MAX)) {
        throw std::invalid_argument(std::string("config: '") + key + "' must be a non-negative integer");
    }
    return value.get<uint32_t>();
}

} // namespace

const char* samplerFilterName(SamplerFilter filter) {
    switch (filter) {
        case SamplerFilter::Nearest: return "nearest";
        case SamplerFilter::Linear: return "linear";
    }
    return "nearest";
}

void RendererConfig::validate() const {
    if (initialSpriteCapacity == 0) {
        throw std::invalid_argument("config: initialSpriteCapacity must be > 0");
    }
    if (maxSpriteCapacity < initialSpriteCapacity) {
        throw std::invalid_argument("config: maxSpriteCapacity (" + std::to_string(maxSpriteCapacity) +
                                    ") is below initialSpriteCapacity (" +
                                    std::to_string(initialSpriteCapacity) + ")");
    }
    if (maxSpriteCapacity > SPRITE_CAPACITY_LIMIT) {
        throw std::invalid_argument("config: maxSpriteCapacity (" + std::to_string(maxSpriteCapacity) +
                                    ") exceeds the index range limit of " +
                                    std::to_string(SPRITE_CAPACITY_LIMIT));
    }
}

RendererConfig configFromJson(const json& j, const RendererConfig& defaults) {
    if (!j.is_object()) {
        throw std::invalid_argument("config: expected a JSON object");
    }

    RendererConfig config = defaults;
    config.initialSpriteCapacity = readCount(j, "initialSpriteCapacity", config.initialSpriteCapacity);
    config.maxSpriteCapacity = readCount(j, "maxSpriteCapacity", config.maxSpriteCapacity);
    config.interleaveWarningThreshold =
        readCount(j, "interleaveWarningThreshold", config.interleaveWarningThreshold);

    if (j.contains("filter")) {
        const json& filter = j["filter"];
        std::string name = filter.is_string() ? filter.get<std::string>() : "";
        if (name == "nearest") {
            config.filter = SamplerFilter::Nearest;
        } else if (name == "linear") {
            config.filter = SamplerFilter::Linear;
        } else {
            throw std::invalid_argument("config: 'filter' must be \"nearest\" or \"linear\"");
        }
    }

    if (j.contains("logStats")) {
        if (!j["logStats"].is_boolean()) {
            throw std::invalid_argument("config: 'logStats' must be a boolean");
        }
        config.logStats = j["logStats"].get<bool>();
    }

    return config;
}

json configToJson(const RendererConfig& config) {
    json j;
    j["initialSpriteCapacity"] = config.initialSpriteCapacity;
    j["maxSpriteCapacity"] = config.maxSpriteCapacity;
    j["filter"] = samplerFilterName(config.filter);
    j["logStats"] = config.logStats;
    j["interleaveWarningThreshold"] = config.interleaveWarningThreshold;
    return j;
}

bool loadConfig(const std::string& path, RendererConfig& config) {
    if (!std::filesystem::exists(path)) {
        std::cerr << "[sprig-config] Not found: " << path << "\n";
        return false;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[sprig-config] Failed to open: " << path << "\n";
        return false;
    }

    try {
        json j;
        file >> j;
        RendererConfig loaded = configFromJson(j, config);
        loaded.validate();
        config = loaded;
        std::cout << "[sprig-config] Loaded: " << path << "\n";
        return true;
    } catch (const json::parse_error& e) {
        std::cerr << "[sprig-config] Parse error in " << path << ": " << e.what() << "\n";
        return false;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[sprig-config] Invalid config in " << path << ": " << e.what() << "\n";
        return false;
    }
}

} // namespace sprig
