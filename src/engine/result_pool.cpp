#include <kreuzberg/engine/result_cache.h>
#include <kreuzberg/engine/result_pool.h>

#include <spdlog/spdlog.h>

namespace kreuzberg::engine {

ResultPool::ResultPool(std::size_t capacity) : capacity_(capacity) {}

const PooledResult& ResultPool::add(extraction::ExtractionResult result) {
    const std::size_t size = ResultCache::estimateSize(result);
    std::string title = result.metadataString("title");

    std::lock_guard<std::mutex> lock(mutex_);
    if (results_.size() >= capacity_) {
        const std::size_t grown = capacity_ == 0 ? 1 : capacity_ * 2;
        spdlog::debug("Result pool grew from {} to {} slots", capacity_, grown);
        capacity_ = grown;
        ++growthEvents_;
    }
    results_.push_back(PooledResult{std::move(result), std::move(title)});
    ++totalAllocations_;
    memoryBytes_ += size;
    return results_.back();
}

void ResultPool::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    results_.clear();
    memoryBytes_ = 0;
}

ResultPool::Stats ResultPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats stats;
    stats.currentCount = results_.size();
    stats.capacity = capacity_;
    stats.totalAllocations = totalAllocations_;
    stats.growthEvents = growthEvents_;
    stats.estimatedMemoryBytes = memoryBytes_;
    return stats;
}

} // namespace kreuzberg::engine
