#pragma once

#include <kreuzberg/config/config_builder.h>
#include <kreuzberg/config/extraction_config.h>
#include <kreuzberg/core/error_state.h>
#include <kreuzberg/core/types.h>
#include <kreuzberg/engine/result_pool.h>
#include <kreuzberg/extraction/extraction_result.h>
#include <kreuzberg/kreuzberg.h>

#include <deque>
#include <mutex>
#include <new>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

// Definitions of the opaque handles declared in kreuzberg.h

struct ExtractionConfig {
    kreuzberg::config::ExtractionConfig config;
};

struct ConfigBuilder {
    kreuzberg::config::ConfigBuilder builder;
};

struct ExtractionResult {
    kreuzberg::extraction::ExtractionResult result;
};

struct ResultPool {
    explicit ResultPool(std::size_t capacity) : pool(capacity) {}

    kreuzberg::engine::ResultPool pool;
    std::mutex viewsMutex;
    std::deque<CExtractionResultView> views; ///< Parallel to the pooled results
};

namespace kreuzberg::ffi {

/**
 * @brief Apply KREUZBERG_LOG_LEVEL to the default spdlog logger, once per process
 */
void initLogging();

/**
 * @brief malloc'd, NUL-terminated copy released with kreuzberg_free_string()
 */
char* toCString(std::string_view value);

inline char* toCString(const std::string& value) {
    return toCString(std::string_view(value));
}

inline char* toCString(const char* value) {
    return toCString(std::string_view(value));
}

inline char* toCString(const std::optional<std::string>& value) {
    return value ? toCString(*value) : nullptr;
}

/**
 * @brief Remember the C entry point running on this thread, for error reports
 *
 * Accepts a compiler-decorated signature and keeps only the bare function name.
 */
void setEntryPoint(std::string_view signature);

/**
 * @brief Record @p error for the calling thread
 * @param function Entry point name; defaults to the one set by guarded()
 */
void recordError(const Error& error, const char* function = nullptr);

/**
 * @brief Flatten a result into a heap CExtractionResult with success == true
 */
CExtractionResult* toCResult(const extraction::ExtractionResult& result);

/**
 * @brief Failed CExtractionResult used inside batches
 */
CExtractionResult* toCErrorResult(const Error& error);

/**
 * @brief Decode optional config JSON; NULL or empty means defaults
 */
Result<config::ExtractionConfig> configFromCString(const char* json);

/**
 * @brief JSON array text of @p values
 */
char* toJsonArray(const std::vector<std::string>& values);

/**
 * @brief Run @p body at the C boundary
 *
 * Clears the calling thread's error slot first. Exceptions never cross into
 * C: they are recorded as a Panic with the caller's location and @p onError
 * is returned instead.
 */
template <typename R, typename F>
R guarded(R onError, F&& body, std::source_location loc = std::source_location::current()) {
    initLogging();
    core::ErrorState::clear();
    try {
        setEntryPoint(loc.function_name());
        return body();
    } catch (const std::bad_alloc&) {
        core::ErrorState::setPanic("out of memory", loc.function_name(), loc.file_name(),
                                   loc.line());
    } catch (const std::exception& e) {
        core::ErrorState::setPanic(e.what(), loc.function_name(), loc.file_name(), loc.line());
    } catch (...) {
        core::ErrorState::setPanic("unknown exception", loc.function_name(), loc.file_name(),
                                   loc.line());
    }
    return onError;
}

template <typename F>
void guardedVoid(F&& body, std::source_location loc = std::source_location::current()) {
    guarded(
        0,
        [&]() {
            body();
            return 0;
        },
        loc);
}

} // namespace kreuzberg::ffi
