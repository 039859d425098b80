#pragma once

#include <kreuzberg/core/types.h>
#include <kreuzberg/extraction/extraction_result.h>

#include <cstddef>
#include <list>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kreuzberg::engine {

struct ResultCacheConfig {
    std::size_t maxEntries = 256;
    std::size_t maxMemoryBytes = 64ull * 1024 * 1024;
};

/**
 * @brief LRU cache of extraction results before plugins ran
 *
 * Post-processors and validators are never baked into a cached entry; callers
 * re-run them against the current plugin snapshot on every hit.
 */
class ResultCache {
public:
    explicit ResultCache(ResultCacheConfig config = {});

    /**
     * @brief SHA-256 fingerprint of everything that shapes a pre-plugin result
     *
     * @param pluginNames Names of the document extractors and OCR backends in
     *        the snapshot, so registering one invalidates earlier entries
     */
    static std::string makeKey(ByteSpan data, std::string_view mimeType,
                               std::string_view canonicalConfigJson,
                               const std::vector<std::string>& pluginNames);

    /**
     * @brief Approximate heap footprint of a result, used for memory limits
     */
    static std::size_t estimateSize(const extraction::ExtractionResult& result);

    std::optional<extraction::ExtractionResult> get(const std::string& key);

    void put(const std::string& key, const extraction::ExtractionResult& result);

    void clear();

    struct Stats {
        std::size_t hits = 0;
        std::size_t misses = 0;
        std::size_t evictions = 0;
        std::size_t entries = 0;
        std::size_t memoryBytes = 0;
    };
    Stats stats() const;

private:
    struct Entry {
        extraction::ExtractionResult result;
        std::size_t memorySize = 0;
        std::list<std::string>::iterator lruPos;
    };

    void evictLRU();

    ResultCacheConfig config_;
    mutable std::shared_mutex mutex_;
    std::list<std::string> lruList_; ///< Most recently used first
    std::unordered_map<std::string, Entry> cache_;
    std::size_t memoryUsage_ = 0;
    Stats stats_;
};

} // namespace kreuzberg::engine
