#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kreuzberg::config {

/**
 * @brief Named embedding setup with the chunk geometry it was tuned for
 */
struct EmbeddingPreset {
    std::string name;
    std::int64_t chunk_size;
    std::int64_t overlap;
    std::string model_name;
    std::int32_t dimensions;
    std::string description;
};

/**
 * @brief Built-in presets: fast, balanced, quality, multilingual
 */
const std::vector<EmbeddingPreset>& embeddingPresets();

/**
 * @brief Case-sensitive lookup; nullptr when unknown
 */
const EmbeddingPreset* findEmbeddingPreset(std::string_view name);

void to_json(nlohmann::json& j, const EmbeddingPreset& p);

} // namespace kreuzberg::config
