#include <kreuzberg/engine/string_interner.h>

#include <spdlog/spdlog.h>

#include <array>
#include <cstring>

namespace kreuzberg::engine {

namespace {

constexpr std::array<const char*, 24> kCommonMimeTypes = {
    "text/plain",
    "text/html",
    "text/markdown",
    "text/csv",
    "text/xml",
    "application/json",
    "application/xml",
    "application/pdf",
    "application/zip",
    "application/octet-stream",
    "application/msword",
    "application/vnd.openxmlformats-officedocument.wordprocessingml.document",
    "application/vnd.ms-excel",
    "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet",
    "application/vnd.ms-powerpoint",
    "application/vnd.openxmlformats-officedocument.presentationml.presentation",
    "application/epub+zip",
    "application/rtf",
    "image/png",
    "image/jpeg",
    "image/gif",
    "image/tiff",
    "image/webp",
    "image/bmp",
};

} // namespace

StringInterner& StringInterner::instance() {
    static StringInterner interner;
    return interner;
}

StringInterner::StringInterner() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const char* mime : kCommonMimeTypes)
        insertLocked(mime, true);
}

StringInterner::Entry& StringInterner::insertLocked(std::string_view value, bool permanent) {
    Entry entry;
    entry.length = value.size();
    entry.data = std::make_unique<char[]>(value.size() + 1);
    std::memcpy(entry.data.get(), value.data(), value.size());
    entry.data[value.size()] = '\0';
    entry.permanent = permanent;

    memoryBytes_ += value.size() + 1;
    byPointer_.emplace(entry.data.get(), std::string(value));
    return entries_.emplace(std::string(value), std::move(entry)).first->second;
}

const char* StringInterner::intern(std::string_view value) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++totalRequests_;
    if (auto it = entries_.find(std::string(value)); it != entries_.end()) {
        ++cacheHits_;
        ++it->second.refs;
        return it->second.data.get();
    }
    ++cacheMisses_;
    auto& entry = insertLocked(value, false);
    entry.refs = 1;
    return entry.data.get();
}

bool StringInterner::release(const char* ptr) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto byPtr = byPointer_.find(ptr);
    if (byPtr == byPointer_.end()) {
        spdlog::debug("Ignoring release of a pointer that was not interned");
        return false;
    }
    auto it = entries_.find(byPtr->second);
    if (it == entries_.end())
        return false;

    auto& entry = it->second;
    if (entry.refs > 0)
        --entry.refs;
    if (entry.refs == 0 && !entry.permanent) {
        memoryBytes_ -= entry.length + 1;
        byPointer_.erase(byPtr);
        entries_.erase(it);
    }
    return true;
}

void StringInterner::resetCounters() {
    std::lock_guard<std::mutex> lock(mutex_);
    totalRequests_ = 0;
    cacheHits_ = 0;
    cacheMisses_ = 0;
}

StringInterner::Stats StringInterner::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats stats;
    stats.uniqueCount = entries_.size();
    stats.totalRequests = totalRequests_;
    stats.cacheHits = cacheHits_;
    stats.cacheMisses = cacheMisses_;
    stats.totalMemoryBytes = memoryBytes_;
    return stats;
}

} // namespace kreuzberg::engine
