#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace kreuzberg::engine {

/**
 * @brief Process-wide table of reference-counted, NUL-terminated strings
 *
 * Equal strings share one allocation. Common MIME types are interned at
 * startup and never released.
 */
class StringInterner {
public:
    static StringInterner& instance();

    StringInterner(const StringInterner&) = delete;
    StringInterner& operator=(const StringInterner&) = delete;

    /**
     * @brief Pointer to the shared copy of @p value, taking one reference
     */
    const char* intern(std::string_view value);

    /**
     * @brief Drop one reference; the string is freed when none remain
     * @return false when @p ptr was not handed out by intern()
     */
    bool release(const char* ptr);

    /**
     * @brief Zero the request counters
     */
    void resetCounters();

    struct Stats {
        std::size_t uniqueCount = 0;
        std::uint64_t totalRequests = 0;
        std::uint64_t cacheHits = 0;
        std::uint64_t cacheMisses = 0;
        std::size_t totalMemoryBytes = 0;
    };

    [[nodiscard]] Stats getStats() const;

private:
    StringInterner();

    struct Entry {
        std::unique_ptr<char[]> data;
        std::size_t length = 0;
        std::size_t refs = 0;
        bool permanent = false;
    };

    Entry& insertLocked(std::string_view value, bool permanent);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::unordered_map<const char*, std::string> byPointer_;
    std::uint64_t totalRequests_ = 0;
    std::uint64_t cacheHits_ = 0;
    std::uint64_t cacheMisses_ = 0;
    std::size_t memoryBytes_ = 0;
};

} // namespace kreuzberg::engine
