#pragma once

#include <kreuzberg/extraction/extraction_result.h>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

namespace kreuzberg::engine {

/**
 * @brief A result owned by a ResultPool together with its cached title
 */
struct PooledResult {
    extraction::ExtractionResult result;
    std::string title; ///< metadata "title", empty when absent
};

/**
 * @brief Arena of extraction results with stable addresses
 *
 * Results stay valid until reset() or destruction, so callers may hand out
 * raw pointers into them. Capacity is a soft limit: exceeding it doubles the
 * capacity and counts a growth event.
 */
class ResultPool {
public:
    explicit ResultPool(std::size_t capacity);

    ResultPool(const ResultPool&) = delete;
    ResultPool& operator=(const ResultPool&) = delete;
    ResultPool(ResultPool&&) = delete;
    ResultPool& operator=(ResultPool&&) = delete;

    /**
     * @brief Move @p result into the pool
     * @return Reference valid until reset()
     */
    const PooledResult& add(extraction::ExtractionResult result);

    /**
     * @brief Drop every pooled result; capacity and lifetime counters survive
     */
    void reset();

    struct Stats {
        std::size_t currentCount = 0;
        std::size_t capacity = 0;
        std::uint64_t totalAllocations = 0;
        std::uint64_t growthEvents = 0;
        std::size_t estimatedMemoryBytes = 0;
    };

    [[nodiscard]] Stats getStats() const;

private:
    mutable std::mutex mutex_;
    std::deque<PooledResult> results_;
    std::size_t capacity_;
    std::uint64_t totalAllocations_ = 0;
    std::uint64_t growthEvents_ = 0;
    std::size_t memoryBytes_ = 0;
};

} // namespace kreuzberg::engine
