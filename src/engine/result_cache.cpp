#include <kreuzberg/crypto/sha256_hasher.h>
#include <kreuzberg/engine/result_cache.h>

#include <spdlog/spdlog.h>

#include <mutex>

namespace kreuzberg::engine {

namespace {

std::span<const std::byte> asBytes(std::string_view s) {
    return std::as_bytes(std::span<const char>(s.data(), s.size()));
}

} // namespace

ResultCache::ResultCache(ResultCacheConfig config) : config_(config) {}

std::string ResultCache::makeKey(ByteSpan data, std::string_view mimeType,
                                 std::string_view canonicalConfigJson,
                                 const std::vector<std::string>& pluginNames) {
    crypto::SHA256Hasher hasher;
    hasher.updateField(std::as_bytes(data));
    hasher.updateField(asBytes(mimeType));
    hasher.updateField(asBytes(canonicalConfigJson));
    for (const auto& name : pluginNames)
        hasher.updateField(asBytes(name));
    return hasher.finalize();
}

std::size_t ResultCache::estimateSize(const extraction::ExtractionResult& result) {
    std::size_t size = sizeof(result) + result.content.size() + result.mime_type.size();
    for (const auto& table : result.tables)
        size += table.markdown.size() * 2;
    if (result.chunks) {
        for (const auto& chunk : *result.chunks)
            size += chunk.content.size() + sizeof(chunk);
    }
    if (result.pages) {
        for (const auto& page : *result.pages)
            size += page.content.size();
    }
    if (result.images) {
        for (const auto& image : *result.images)
            size += image.data.size();
    }
    return size;
}

std::optional<extraction::ExtractionResult> ResultCache::get(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        ++stats_.misses;
        return std::nullopt;
    }
    ++stats_.hits;
    lruList_.splice(lruList_.begin(), lruList_, it->second.lruPos);
    return it->second.result;
}

void ResultCache::put(const std::string& key, const extraction::ExtractionResult& result) {
    const std::size_t size = estimateSize(result);
    if (size > config_.maxMemoryBytes) {
        spdlog::debug("Result too large to cache ({} bytes)", size);
        return;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (auto it = cache_.find(key); it != cache_.end()) {
        memoryUsage_ -= it->second.memorySize;
        it->second.result = result;
        it->second.memorySize = size;
        memoryUsage_ += size;
        lruList_.splice(lruList_.begin(), lruList_, it->second.lruPos);
    } else {
        lruList_.push_front(key);
        cache_.emplace(key, Entry{result, size, lruList_.begin()});
        memoryUsage_ += size;
    }

    while (!lruList_.empty() &&
           (cache_.size() > config_.maxEntries || memoryUsage_ > config_.maxMemoryBytes))
        evictLRU();
}

void ResultCache::evictLRU() {
    const std::string victim = lruList_.back();
    lruList_.pop_back();
    if (auto it = cache_.find(victim); it != cache_.end()) {
        memoryUsage_ -= it->second.memorySize;
        cache_.erase(it);
        ++stats_.evictions;
    }
}

void ResultCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    cache_.clear();
    lruList_.clear();
    memoryUsage_ = 0;
}

ResultCache::Stats ResultCache::stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    Stats out = stats_;
    out.entries = cache_.size();
    out.memoryBytes = memoryUsage_;
    return out;
}

} // namespace kreuzberg::engine
