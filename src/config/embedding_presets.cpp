#include <kreuzberg/config/embedding_presets.h>

namespace kreuzberg::config {

const std::vector<EmbeddingPreset>& embeddingPresets() {
    static const std::vector<EmbeddingPreset> presets = {
        {"fast", 512, 50, "AllMiniLML6V2Q", 384, "Quick prototyping and low-latency retrieval"},
        {"balanced", 1024, 100, "BGEBaseENV15", 768, "General-purpose RAG"},
        {"quality", 2000, 200, "BGELargeENV15", 1024, "High-quality embeddings, slower"},
        {"multilingual", 1024, 100, "MultilingualE5Base", 768, "Multi-language documents"},
    };
    return presets;
}

const EmbeddingPreset* findEmbeddingPreset(std::string_view name) {
    for (const auto& preset : embeddingPresets()) {
        if (preset.name == name)
            return &preset;
    }
    return nullptr;
}

void to_json(nlohmann::json& j, const EmbeddingPreset& p) {
    j = nlohmann::json::object();
    j["name"] = p.name;
    j["chunk_size"] = p.chunk_size;
    j["overlap"] = p.overlap;
    j["model_name"] = p.model_name;
    j["dimensions"] = p.dimensions;
    j["description"] = p.description;
}

} // namespace kreuzberg::config
