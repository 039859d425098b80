#include "ffi_internal.h"

#include <kreuzberg/detection/mime_detector.h>
#include <kreuzberg/engine/extraction_engine.h>
#include <kreuzberg/engine/string_interner.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>

namespace {

using namespace kreuzberg;
using json = nlohmann::json;

ByteSpan asSpan(const uint8_t* data, uintptr_t len) {
    return data ? ByteSpan(data, static_cast<std::size_t>(len)) : ByteSpan{};
}

bool checkBytes(const uint8_t* data, uintptr_t len) {
    if (!data && len > 0) {
        ffi::recordError({ErrorCode::InvalidArgument, "data cannot be NULL"});
        return false;
    }
    return true;
}

CExtractionResult* finish(Result<extraction::ExtractionResult> result) {
    if (!result) {
        ffi::recordError(result.error());
        return nullptr;
    }
    return ffi::toCResult(result.value());
}

CExtractionResult* extractFile(const char* path, const std::optional<std::string>& hint,
                               const config::ExtractionConfig& cfg) {
    if (!path) {
        ffi::recordError({ErrorCode::InvalidArgument, "path cannot be NULL"});
        return nullptr;
    }
    auto result = engine::ExtractionEngine::instance().extractFile(path, hint, cfg);
    if (!result) {
        ffi::recordError(result.error());
        core::ErrorState::setContextInfo(path);
        return nullptr;
    }
    return ffi::toCResult(result.value());
}

CExtractionResult* extractBytes(const uint8_t* data, uintptr_t len, const char* mime,
                                const config::ExtractionConfig& cfg) {
    if (!checkBytes(data, len))
        return nullptr;
    if (!mime) {
        ffi::recordError({ErrorCode::InvalidArgument, "mime_type cannot be NULL"});
        return nullptr;
    }
    return finish(engine::ExtractionEngine::instance().extractBytes(asSpan(data, len), mime, cfg));
}

CBatchResult* toCBatch(const std::vector<Result<extraction::ExtractionResult>>& results) {
    auto* batch = static_cast<CBatchResult*>(std::calloc(1, sizeof(CBatchResult)));
    if (!batch)
        throw std::bad_alloc();
    batch->success = true;
    if (results.empty())
        return batch;

    batch->results =
        static_cast<CExtractionResult**>(std::calloc(results.size(), sizeof(CExtractionResult*)));
    if (!batch->results) {
        std::free(batch);
        throw std::bad_alloc();
    }
    batch->count = results.size();
    try {
        for (std::size_t i = 0; i < results.size(); ++i) {
            batch->results[i] = results[i] ? ffi::toCResult(results[i].value())
                                            : ffi::toCErrorResult(results[i].error());
        }
    } catch (...) {
        kreuzberg_free_batch_result(batch);
        throw;
    }
    return batch;
}

CExtractionResultView makeView(const engine::PooledResult& pooled) {
    const auto& r = pooled.result;
    CExtractionResultView view{};
    view.content_ptr = reinterpret_cast<const uint8_t*>(r.content.data());
    view.content_len = r.content.size();
    view.mime_type_ptr = reinterpret_cast<const uint8_t*>(r.mime_type.data());
    view.mime_type_len = r.mime_type.size();
    if (r.detected_languages && !r.detected_languages->empty()) {
        const auto& lang = r.detected_languages->front();
        view.language_ptr = reinterpret_cast<const uint8_t*>(lang.data());
        view.language_len = lang.size();
    }
    if (!pooled.title.empty()) {
        view.title_ptr = reinterpret_cast<const uint8_t*>(pooled.title.data());
        view.title_len = pooled.title.size();
    }
    view.table_count = r.tables.size();
    view.chunk_count = r.chunks ? r.chunks->size() : 0;
    view.detected_language_count = r.detected_languages ? r.detected_languages->size() : 0;
    view.image_count = r.images ? r.images->size() : 0;
    view.page_count = r.pages ? r.pages->size() : 0;
    return view;
}

int32_t viewField(const CExtractionResultView* view, const uint8_t** outPtr, uintptr_t* outLen,
                  const uint8_t* CExtractionResultView::*ptr,
                  uintptr_t CExtractionResultView::*len) {
    if (!view || !outPtr || !outLen) {
        ffi::guardedVoid([] {
            ffi::recordError({ErrorCode::InvalidArgument, "view and output pointers are required"});
        });
        return -1;
    }
    *outPtr = view->*ptr;
    *outLen = view->*len;
    return 0;
}

} // namespace

extern "C" {

// ============================================================================
// MIME detection
// ============================================================================

char* kreuzberg_detect_mime_type(const char* path, bool check_exists) {
    return ffi::guarded<char*>(nullptr, [&]() -> char* {
        if (!path) {
            ffi::recordError({ErrorCode::InvalidArgument, "path cannot be NULL"});
            return nullptr;
        }
        auto mime = detection::detectMimeTypeFromExtension(path, check_exists);
        if (!mime) {
            ffi::recordError(mime.error());
            core::ErrorState::setContextInfo(path);
            return nullptr;
        }
        return ffi::toCString(mime.value());
    });
}

char* kreuzberg_detect_mime_type_from_bytes(const uint8_t* data, uintptr_t len) {
    return ffi::guarded<char*>(nullptr, [&]() -> char* {
        if (!data) {
            ffi::recordError({ErrorCode::InvalidArgument, "data cannot be NULL"});
            return nullptr;
        }
        return ffi::toCString(detection::detectMimeType(asSpan(data, len)));
    });
}

char* kreuzberg_detect_mime_type_from_path(const char* path) {
    return ffi::guarded<char*>(nullptr, [&]() -> char* {
        if (!path) {
            ffi::recordError({ErrorCode::InvalidArgument, "path cannot be NULL"});
            return nullptr;
        }
        return ffi::toCString(detection::detectMimeTypeFromPath(path));
    });
}

char* kreuzberg_validate_mime_type(const char* mime_type) {
    return ffi::guarded<char*>(nullptr, [&]() -> char* {
        if (!mime_type) {
            ffi::recordError({ErrorCode::InvalidArgument, "mime_type cannot be NULL"});
            return nullptr;
        }
        auto normalized = detection::MimeDetector::normalizeMime(mime_type);
        if (!normalized) {
            ffi::recordError({ErrorCode::UnsupportedFormat,
                              std::string("Unsupported MIME type: ") + mime_type});
            return nullptr;
        }
        return ffi::toCString(*normalized);
    });
}

char* kreuzberg_get_extensions_for_mime(const char* mime_type) {
    return ffi::guarded<char*>(nullptr, [&]() -> char* {
        if (!mime_type) {
            ffi::recordError({ErrorCode::InvalidArgument, "mime_type cannot be NULL"});
            return nullptr;
        }
        return ffi::toJsonArray(detection::MimeDetector::extensionsForMime(mime_type));
    });
}

// ============================================================================
// Extraction
// ============================================================================

CExtractionResult* kreuzberg_extract_file_sync(const char* path) {
    return ffi::guarded<CExtractionResult*>(nullptr, [&] {
        return extractFile(path, std::nullopt, config::ExtractionConfig{});
    });
}

CExtractionResult* kreuzberg_extract_file_sync_with_config(const char* path,
                                                           const char* config_json) {
    return ffi::guarded<CExtractionResult*>(nullptr, [&]() -> CExtractionResult* {
        auto cfg = ffi::configFromCString(config_json);
        if (!cfg) {
            ffi::recordError(cfg.error());
            return nullptr;
        }
        return extractFile(path, std::nullopt, cfg.value());
    });
}

CExtractionResult* kreuzberg_extract_file_with_hint(const char* path, const char* mime_hint,
                                                    const ExtractionConfig* config) {
    return ffi::guarded<CExtractionResult*>(nullptr, [&] {
        std::optional<std::string> hint;
        if (mime_hint && *mime_hint)
            hint = mime_hint;
        return extractFile(path, hint, config ? config->config : config::ExtractionConfig{});
    });
}

CExtractionResult* kreuzberg_extract_bytes_sync(const uint8_t* data, uintptr_t len,
                                                const char* mime_type) {
    return ffi::guarded<CExtractionResult*>(nullptr, [&] {
        return extractBytes(data, len, mime_type, config::ExtractionConfig{});
    });
}

CExtractionResult* kreuzberg_extract_bytes_sync_with_config(const uint8_t* data, uintptr_t len,
                                                            const char* mime_type,
                                                            const char* config_json) {
    return ffi::guarded<CExtractionResult*>(nullptr, [&]() -> CExtractionResult* {
        auto cfg = ffi::configFromCString(config_json);
        if (!cfg) {
            ffi::recordError(cfg.error());
            return nullptr;
        }
        return extractBytes(data, len, mime_type, cfg.value());
    });
}

CExtractionResult* kreuzberg_extract_bytes_with_config_handle(const uint8_t* data, uintptr_t len,
                                                              const char* mime_type,
                                                              const ExtractionConfig* config) {
    return ffi::guarded<CExtractionResult*>(nullptr, [&] {
        return extractBytes(data, len, mime_type,
                            config ? config->config : config::ExtractionConfig{});
    });
}

CBatchResult* kreuzberg_batch_extract_files_sync(const char* const* paths, uintptr_t count,
                                                 const char* config_json) {
    return ffi::guarded<CBatchResult*>(nullptr, [&]() -> CBatchResult* {
        if (!paths && count > 0) {
            ffi::recordError({ErrorCode::InvalidArgument, "paths cannot be NULL"});
            return nullptr;
        }
        auto cfg = ffi::configFromCString(config_json);
        if (!cfg) {
            ffi::recordError(cfg.error());
            return nullptr;
        }
        std::vector<std::filesystem::path> files;
        files.reserve(count);
        for (uintptr_t i = 0; i < count; ++i) {
            if (!paths[i]) {
                ffi::recordError({ErrorCode::InvalidArgument,
                                  "path at index " + std::to_string(i) + " is NULL"});
                return nullptr;
            }
            files.emplace_back(paths[i]);
        }
        return toCBatch(engine::ExtractionEngine::instance().batchExtractFiles(files, cfg.value()));
    });
}

CBatchResult* kreuzberg_batch_extract_bytes_sync(const CBytesWithMime* items, uintptr_t count,
                                                 const char* config_json) {
    return ffi::guarded<CBatchResult*>(nullptr, [&]() -> CBatchResult* {
        if (!items && count > 0) {
            ffi::recordError({ErrorCode::InvalidArgument, "items cannot be NULL"});
            return nullptr;
        }
        auto cfg = ffi::configFromCString(config_json);
        if (!cfg) {
            ffi::recordError(cfg.error());
            return nullptr;
        }
        std::vector<engine::BytesInput> inputs;
        inputs.reserve(count);
        for (uintptr_t i = 0; i < count; ++i) {
            const auto& item = items[i];
            if ((!item.data && item.data_len > 0) || !item.mime_type) {
                ffi::recordError({ErrorCode::InvalidArgument,
                                  "item " + std::to_string(i) + " has NULL data or mime_type"});
                return nullptr;
            }
            inputs.push_back({asSpan(item.data, item.data_len), item.mime_type});
        }
        return toCBatch(engine::ExtractionEngine::instance().batchExtractBytes(inputs, cfg.value()));
    });
}

// ============================================================================
// Result handles
// ============================================================================

ExtractionResult* kreuzberg_extract_bytes_handle(const uint8_t* data, uintptr_t len,
                                                 const char* mime_type, const char* config_json) {
    return ffi::guarded<ExtractionResult*>(nullptr, [&]() -> ExtractionResult* {
        if (!checkBytes(data, len))
            return nullptr;
        if (!mime_type) {
            ffi::recordError({ErrorCode::InvalidArgument, "mime_type cannot be NULL"});
            return nullptr;
        }
        auto cfg = ffi::configFromCString(config_json);
        if (!cfg) {
            ffi::recordError(cfg.error());
            return nullptr;
        }
        auto result = engine::ExtractionEngine::instance().extractBytes(asSpan(data, len),
                                                                         mime_type, cfg.value());
        if (!result) {
            ffi::recordError(result.error());
            return nullptr;
        }
        return new ExtractionResult{std::move(result).value()};
    });
}

ExtractionResult* kreuzberg_extract_file_handle(const char* path, const char* config_json) {
    return ffi::guarded<ExtractionResult*>(nullptr, [&]() -> ExtractionResult* {
        if (!path) {
            ffi::recordError({ErrorCode::InvalidArgument, "path cannot be NULL"});
            return nullptr;
        }
        auto cfg = ffi::configFromCString(config_json);
        if (!cfg) {
            ffi::recordError(cfg.error());
            return nullptr;
        }
        auto result =
            engine::ExtractionEngine::instance().extractFile(path, std::nullopt, cfg.value());
        if (!result) {
            ffi::recordError(result.error());
            core::ErrorState::setContextInfo(path);
            return nullptr;
        }
        return new ExtractionResult{std::move(result).value()};
    });
}

void kreuzberg_result_handle_free(ExtractionResult* result) {
    delete result;
}

const char* kreuzberg_result_get_content(const ExtractionResult* result) {
    return result ? result->result.content.c_str() : nullptr;
}

const char* kreuzberg_result_get_mime_type(const ExtractionResult* result) {
    return result ? result->result.mime_type.c_str() : nullptr;
}

uintptr_t kreuzberg_result_get_chunk_count(const ExtractionResult* result) {
    if (!result || !result->result.chunks)
        return 0;
    return result->result.chunks->size();
}

CMetadataField kreuzberg_result_get_metadata_field(const ExtractionResult* result,
                                                   const char* field_name) {
    CMetadataField field{nullptr, nullptr, 1};
    return ffi::guarded<CMetadataField>(field, [&]() -> CMetadataField {
        if (!result || !field_name) {
            ffi::recordError({ErrorCode::InvalidArgument, "result and field name are required"});
            return field;
        }
        field.name = ffi::toCString(field_name);

        const json* node = &result->result.metadata;
        std::string_view path(field_name);
        while (node && !path.empty()) {
            auto dot = path.find('.');
            std::string key(path.substr(0, dot));
            path = dot == std::string_view::npos ? std::string_view{} : path.substr(dot + 1);
            if (!node->is_object()) {
                node = nullptr;
                break;
            }
            auto it = node->find(key);
            node = it == node->end() ? nullptr : &*it;
        }

        if (node && !node->is_null()) {
            field.json_value = ffi::toCString(node->dump());
            field.is_null = 0;
        }
        return field;
    });
}

CExtractionResult* kreuzberg_result_to_c(const ExtractionResult* result) {
    return ffi::guarded<CExtractionResult*>(nullptr, [&]() -> CExtractionResult* {
        if (!result) {
            ffi::recordError({ErrorCode::InvalidArgument, "result cannot be NULL"});
            return nullptr;
        }
        return ffi::toCResult(result->result);
    });
}

// ============================================================================
// Result pool
// ============================================================================

ResultPool* kreuzberg_result_pool_new(uintptr_t capacity) {
    return ffi::guarded<ResultPool*>(nullptr, [&] { return new ResultPool(capacity); });
}

CResultPoolStats kreuzberg_result_pool_stats(const ResultPool* pool) {
    CResultPoolStats out{};
    if (!pool)
        return out;
    auto stats = pool->pool.getStats();
    out.current_count = stats.currentCount;
    out.capacity = stats.capacity;
    out.total_allocations = static_cast<uintptr_t>(stats.totalAllocations);
    out.growth_events = static_cast<uintptr_t>(stats.growthEvents);
    out.estimated_memory_bytes = stats.estimatedMemoryBytes;
    return out;
}

void kreuzberg_result_pool_reset(ResultPool* pool) {
    if (!pool)
        return;
    std::lock_guard<std::mutex> lock(pool->viewsMutex);
    pool->views.clear();
    pool->pool.reset();
}

void kreuzberg_result_pool_free(ResultPool* pool) {
    delete pool;
}

const CExtractionResultView* kreuzberg_extract_file_into_pool(const char* path,
                                                              const char* config_json,
                                                              ResultPool* pool) {
    return ffi::guarded<const CExtractionResultView*>(
        nullptr, [&]() -> const CExtractionResultView* {
            if (!path || !pool) {
                ffi::recordError({ErrorCode::InvalidArgument, "path and pool are required"});
                return nullptr;
            }
            auto cfg = ffi::configFromCString(config_json);
            if (!cfg) {
                ffi::recordError(cfg.error());
                return nullptr;
            }
            auto result =
                engine::ExtractionEngine::instance().extractFile(path, std::nullopt, cfg.value());
            if (!result) {
                ffi::recordError(result.error());
                core::ErrorState::setContextInfo(path);
                return nullptr;
            }

            std::lock_guard<std::mutex> lock(pool->viewsMutex);
            const auto& pooled = pool->pool.add(std::move(result).value());
            pool->views.push_back(makeView(pooled));
            return &pool->views.back();
        });
}

CExtractionResultView kreuzberg_extract_file_into_pool_view(const char* path,
                                                            const char* config_json,
                                                            ResultPool* pool) {
    const auto* view = kreuzberg_extract_file_into_pool(path, config_json, pool);
    return view ? *view : CExtractionResultView{};
}

int32_t kreuzberg_view_get_content(const CExtractionResultView* view, const uint8_t** out_ptr,
                                   uintptr_t* out_len) {
    return viewField(view, out_ptr, out_len, &CExtractionResultView::content_ptr,
                     &CExtractionResultView::content_len);
}

int32_t kreuzberg_view_get_mime_type(const CExtractionResultView* view, const uint8_t** out_ptr,
                                     uintptr_t* out_len) {
    return viewField(view, out_ptr, out_len, &CExtractionResultView::mime_type_ptr,
                     &CExtractionResultView::mime_type_len);
}

// ============================================================================
// String interning
// ============================================================================

const char* kreuzberg_intern_string(const char* s) {
    return ffi::guarded<const char*>(nullptr, [&]() -> const char* {
        if (!s) {
            ffi::recordError({ErrorCode::InvalidArgument, "string cannot be NULL"});
            return nullptr;
        }
        return engine::StringInterner::instance().intern(s);
    });
}

void kreuzberg_free_interned_string(const char* s) {
    if (!s)
        return;
    if (!engine::StringInterner::instance().release(s))
        spdlog::warn("kreuzberg_free_interned_string called with a pointer it did not hand out");
}

CStringInternStats kreuzberg_string_intern_stats(void) {
    auto stats = engine::StringInterner::instance().getStats();
    CStringInternStats out{};
    out.unique_count = stats.uniqueCount;
    out.total_requests = static_cast<uintptr_t>(stats.totalRequests);
    out.cache_hits = static_cast<uintptr_t>(stats.cacheHits);
    out.cache_misses = static_cast<uintptr_t>(stats.cacheMisses);
    out.total_memory_bytes = stats.totalMemoryBytes;
    return out;
}

void kreuzberg_string_intern_reset(void) {
    engine::StringInterner::instance().resetCounters();
}

} // extern "C"
