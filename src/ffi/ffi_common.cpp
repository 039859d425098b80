#include "ffi_internal.h"

#include <kreuzberg/config/config_helpers.h>
#include <kreuzberg/config/config_loader.h>
#include <kreuzberg/core/error_classifier.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <cstring>

namespace kreuzberg::ffi {

using json = nlohmann::json;

void initLogging() {
    static std::once_flag once;
    std::call_once(once, [] {
        auto level = config::env_value("KREUZBERG_LOG_LEVEL");
        if (!level || level->empty())
            return;
        auto parsed = spdlog::level::from_str(*level);
        // from_str maps unknown names to off; only "off" itself may mean that
        if (parsed == spdlog::level::off && *level != "off") {
            spdlog::warn("Ignoring unknown KREUZBERG_LOG_LEVEL '{}'", *level);
            return;
        }
        spdlog::set_level(parsed);
    });
}

char* toCString(std::string_view value) {
    auto* out = static_cast<char*>(std::malloc(value.size() + 1));
    if (!out)
        throw std::bad_alloc();
    std::memcpy(out, value.data(), value.size());
    out[value.size()] = '\0';
    return out;
}

namespace {
thread_local std::string t_entryPoint;
} // namespace

void setEntryPoint(std::string_view signature) {
    // "CExtractionResult* kreuzberg_extract_file_sync(const char*)" -> "kreuzberg_extract_file_sync"
    auto end = signature.find('(');
    if (end == std::string_view::npos)
        end = signature.size();
    auto name = signature.substr(0, end);
    if (auto start = name.find_last_of(" *&"); start != std::string_view::npos)
        name.remove_prefix(start + 1);
    t_entryPoint.assign(name);
}

void recordError(const Error& error, const char* function) {
    core::ErrorState::set(error, function ? function : t_entryPoint.c_str());
}

char* toJsonArray(const std::vector<std::string>& values) {
    return toCString(json(values).dump());
}

Result<config::ExtractionConfig> configFromCString(const char* text) {
    if (!text || *text == '\0')
        return config::ExtractionConfig{};
    return config::ConfigLoader::fromJsonString(text);
}

namespace {

char* metadataText(const json& metadata, std::initializer_list<const char*> keys) {
    if (!metadata.is_object())
        return nullptr;
    for (const char* key : keys) {
        auto it = metadata.find(key);
        if (it == metadata.end() || it->is_null())
            continue;
        return toCString(it->is_string() ? it->get<std::string>() : it->dump());
    }
    return nullptr;
}

template <typename T> char* optionalJson(const std::optional<T>& value) {
    return value ? toCString(json(*value).dump()) : nullptr;
}

const char* errorTypeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::ValidationError: return "validation";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::ParsingError: return "parsing";
        case ErrorCode::OcrError: return "ocr";
        case ErrorCode::MissingDependency: return "missing_dependency";
        case ErrorCode::IoError:
        case ErrorCode::NotFound: return "io";
        case ErrorCode::PluginError: return "plugin";
        case ErrorCode::UnsupportedFormat: return "unsupported_format";
        case ErrorCode::Panic: return "panic";
        default: return "internal";
    }
}

} // namespace

CExtractionResult* toCResult(const extraction::ExtractionResult& result) {
    auto* out = static_cast<CExtractionResult*>(std::calloc(1, sizeof(CExtractionResult)));
    if (!out)
        throw std::bad_alloc();
    try {
        out->content = toCString(result.content);
        out->mime_type = toCString(result.mime_type);
        out->language = metadataText(result.metadata, {"language"});
        out->date = metadataText(result.metadata, {"date", "created_at"});
        out->subject = metadataText(result.metadata, {"subject"});
        out->tables_json = toCString(json(result.tables).dump());
        out->detected_languages_json = optionalJson(result.detected_languages);
        out->metadata_json = toCString(
            (result.metadata.is_object() ? result.metadata : json::object()).dump());
        out->chunks_json = optionalJson(result.chunks);
        out->images_json = optionalJson(result.images);
        out->page_structure_json = optionalJson(result.page_structure);
        out->pages_json = optionalJson(result.pages);
        out->elements_json = metadataText(result.metadata, {"elements"});
        out->ocr_elements_json = metadataText(result.metadata, {"ocr_elements"});
        out->document_json = optionalJson(result.document);
        out->extracted_keywords_json = optionalJson(result.keywords);
        out->quality_score_json = optionalJson(result.quality_score);
        out->processing_warnings_json =
            result.processing_warnings.empty()
                ? nullptr
                : toCString(json(result.processing_warnings).dump());
        out->annotations_json = metadataText(result.metadata, {"annotations"});
        out->success = true;
    } catch (...) {
        kreuzberg_free_result(out);
        throw;
    }
    return out;
}

CExtractionResult* toCErrorResult(const Error& error) {
    auto* out = static_cast<CExtractionResult*>(std::calloc(1, sizeof(CExtractionResult)));
    if (!out)
        throw std::bad_alloc();
    json metadata = {{"error",
                      {{"error_type", errorTypeName(error.code)}, {"message", error.message}}}};
    try {
        out->metadata_json = toCString(metadata.dump());
    } catch (...) {
        std::free(out);
        throw;
    }
    out->success = false;
    return out;
}

} // namespace kreuzberg::ffi

using namespace kreuzberg;

extern "C" {

// ============================================================================
// Version
// ============================================================================

const char* kreuzberg_version(void) {
    return KREUZBERG_VERSION;
}

// ============================================================================
// Error state
// ============================================================================

const char* kreuzberg_last_error(void) {
    return core::ErrorState::message();
}

int32_t kreuzberg_last_error_code(void) {
    return static_cast<int32_t>(core::ErrorState::code());
}

char* kreuzberg_last_panic_context(void) {
    auto ctx = core::ErrorState::panicContext();
    if (!ctx)
        return nullptr;
    try {
        return ffi::toCString(ctx->toJson());
    } catch (const std::exception& e) {
        spdlog::error("kreuzberg_last_panic_context: {}", e.what());
        return nullptr;
    }
}

CErrorDetails kreuzberg_get_error_details(void) {
    CErrorDetails out{};
    try {
        auto d = core::ErrorState::details();
        out.error_code = static_cast<int32_t>(d.code);
        out.message = d.message.empty() ? nullptr : ffi::toCString(d.message);
        out.error_type = d.errorType.empty() ? nullptr : ffi::toCString(d.errorType);
        out.source_file = d.sourceFile.empty() ? nullptr : ffi::toCString(d.sourceFile);
        out.source_function = d.sourceFunction.empty() ? nullptr : ffi::toCString(d.sourceFunction);
        out.line_number = d.lineNumber;
        out.context_info = d.contextInfo.empty() ? nullptr : ffi::toCString(d.contextInfo);
        out.is_panic = d.isPanic ? 1 : 0;
    } catch (const std::exception& e) {
        spdlog::error("kreuzberg_get_error_details: {}", e.what());
    }
    return out;
}

CErrorDetails* kreuzberg_get_error_details_ptr(void) {
    auto* out = static_cast<CErrorDetails*>(std::malloc(sizeof(CErrorDetails)));
    if (!out)
        return nullptr;
    *out = kreuzberg_get_error_details();
    return out;
}

void kreuzberg_free_error_details(CErrorDetails* details) {
    if (!details)
        return;
    std::free(details->message);
    std::free(details->error_type);
    std::free(details->source_file);
    std::free(details->source_function);
    std::free(details->context_info);
    std::free(details);
}

uint32_t kreuzberg_classify_error(const char* message) {
    if (!message)
        return static_cast<uint32_t>(core::ErrorCategory::Internal);
    return static_cast<uint32_t>(core::classifyMessage(message));
}

uint32_t kreuzberg_error_code_validation(void) {
    return static_cast<uint32_t>(core::ErrorCategory::Validation);
}

uint32_t kreuzberg_error_code_parsing(void) {
    return static_cast<uint32_t>(core::ErrorCategory::Parsing);
}

uint32_t kreuzberg_error_code_ocr(void) {
    return static_cast<uint32_t>(core::ErrorCategory::Ocr);
}

uint32_t kreuzberg_error_code_missing_dependency(void) {
    return static_cast<uint32_t>(core::ErrorCategory::MissingDependency);
}

uint32_t kreuzberg_error_code_io(void) {
    return static_cast<uint32_t>(core::ErrorCategory::Io);
}

uint32_t kreuzberg_error_code_plugin(void) {
    return static_cast<uint32_t>(core::ErrorCategory::Plugin);
}

uint32_t kreuzberg_error_code_unsupported_format(void) {
    return static_cast<uint32_t>(core::ErrorCategory::UnsupportedFormat);
}

uint32_t kreuzberg_error_code_internal(void) {
    return static_cast<uint32_t>(core::ErrorCategory::Internal);
}

uint32_t kreuzberg_error_code_count(void) {
    return core::kErrorCategoryCount;
}

const char* kreuzberg_error_code_name(uint32_t code) {
    return core::categoryName(code);
}

const char* kreuzberg_error_code_description(uint32_t code) {
    return core::categoryDescription(code);
}

// ============================================================================
// Memory
// ============================================================================

void kreuzberg_free_string(char* s) {
    std::free(s);
}

char* kreuzberg_clone_string(const char* s) {
    if (!s)
        return nullptr;
    return ffi::guarded<char*>(nullptr, [&] { return ffi::toCString(s); });
}

void kreuzberg_free_result(CExtractionResult* result) {
    if (!result)
        return;
    for (char* field :
         {result->content, result->mime_type, result->language, result->date, result->subject,
          result->tables_json, result->detected_languages_json, result->metadata_json,
          result->chunks_json, result->images_json, result->page_structure_json,
          result->pages_json, result->elements_json, result->ocr_elements_json,
          result->document_json, result->extracted_keywords_json, result->quality_score_json,
          result->processing_warnings_json, result->annotations_json})
        std::free(field);
    std::free(result);
}

void kreuzberg_free_batch_result(CBatchResult* batch) {
    if (!batch)
        return;
    for (uintptr_t i = 0; i < batch->count; ++i)
        kreuzberg_free_result(batch->results ? batch->results[i] : nullptr);
    std::free(batch->results);
    std::free(batch);
}

} // extern "C"
