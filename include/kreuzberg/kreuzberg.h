#pragma once

/*
 * C interface of the Kreuzberg extraction core.
 *
 * Ownership rules:
 *  - Every `char*` returned by a kreuzberg_* function is heap allocated and must
 *    be released with kreuzberg_free_string(). `const char*` returns are owned by
 *    the library.
 *  - Handles (ExtractionConfig, ConfigBuilder, ExtractionResult, ResultPool) are
 *    released with their matching free function. All free functions accept NULL.
 *  - Error state is per thread. kreuzberg_last_error() stays valid until the
 *    next kreuzberg_* call on the same thread.
 *  - Strings returned by plugin callbacks must be allocated with malloc(); the
 *    library copies them and releases them with free().
 */

#include <kreuzberg/version.hpp>

#ifdef __cplusplus
#include <cstddef>
#include <cstdint>
extern "C" {
#else
#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>
#endif

#ifndef KREUZBERG_API
#if defined(_WIN32) && !defined(KREUZBERG_STATIC)
#ifdef kreuzberg_EXPORTS
#define KREUZBERG_API __declspec(dllexport)
#else
#define KREUZBERG_API __declspec(dllimport)
#endif
#else
#define KREUZBERG_API __attribute__((visibility("default")))
#endif
#endif

/**
 * Codes reported by kreuzberg_last_error_code().
 */
typedef enum KreuzbergErrorCode {
    KREUZBERG_OK = 0,
    KREUZBERG_ERROR_GENERIC = 1,
    KREUZBERG_ERROR_PANIC = 2,
    KREUZBERG_ERROR_INVALID_ARGUMENT = 3,
    KREUZBERG_ERROR_IO = 4,
    KREUZBERG_ERROR_PARSING = 5,
    KREUZBERG_ERROR_OCR = 6,
    KREUZBERG_ERROR_MISSING_DEPENDENCY = 7
} KreuzbergErrorCode;

/* Opaque handles */
typedef struct ExtractionConfig ExtractionConfig;
typedef struct ConfigBuilder ConfigBuilder;
typedef struct ExtractionResult ExtractionResult;
typedef struct ResultPool ResultPool;

/**
 * Flat extraction result. Every string is nullable and owned by the struct;
 * release the whole struct with kreuzberg_free_result(). JSON fields use the
 * same snake_case schema as the configuration JSON.
 */
typedef struct CExtractionResult {
    char* content;
    char* mime_type;
    char* language;
    char* date;
    char* subject;
    char* tables_json;
    char* detected_languages_json;
    char* metadata_json;
    char* chunks_json;
    char* images_json;
    char* page_structure_json;
    char* pages_json;
    char* elements_json;
    char* ocr_elements_json;
    char* document_json;
    char* extracted_keywords_json;
    char* quality_score_json;
    char* processing_warnings_json;
    char* annotations_json;
    bool success;
} CExtractionResult;

/**
 * Batch results in input order. A failed item has success == false and its
 * metadata_json carries {"error": {"error_type": ..., "message": ...}}.
 */
typedef struct CBatchResult {
    CExtractionResult** results;
    uintptr_t count;
    bool success;
} CBatchResult;

typedef struct CBytesWithMime {
    const uint8_t* data;
    uintptr_t data_len;
    const char* mime_type;
} CBytesWithMime;

typedef struct CErrorDetails {
    char* message;
    int32_t error_code;
    char* error_type;
    char* source_file;
    char* source_function;
    uint32_t line_number;
    char* context_info;
    int32_t is_panic;
} CErrorDetails;

/**
 * One metadata value as JSON text. Release both strings with kreuzberg_free_string().
 */
typedef struct CMetadataField {
    char* name;
    char* json_value;
    int32_t is_null;
} CMetadataField;

/**
 * Borrowed view of a result stored in a ResultPool. Pointers stay valid until
 * the pool is reset or freed. Strings are not NUL terminated.
 */
typedef struct CExtractionResultView {
    const uint8_t* content_ptr;
    uintptr_t content_len;
    const uint8_t* mime_type_ptr;
    uintptr_t mime_type_len;
    const uint8_t* language_ptr;
    uintptr_t language_len;
    const uint8_t* title_ptr;
    uintptr_t title_len;
    uintptr_t table_count;
    uintptr_t chunk_count;
    uintptr_t detected_language_count;
    uintptr_t image_count;
    uintptr_t page_count;
} CExtractionResultView;

typedef struct CResultPoolStats {
    uintptr_t current_count;
    uintptr_t capacity;
    uintptr_t total_allocations;
    uintptr_t growth_events;
    uintptr_t estimated_memory_bytes;
} CResultPoolStats;

typedef struct CStringInternStats {
    uintptr_t unique_count;
    uintptr_t total_requests;
    uintptr_t cache_hits;
    uintptr_t cache_misses;
    uintptr_t total_memory_bytes;
} CStringInternStats;

/* ---- Plugin callbacks ---- */

/**
 * Returns a JSON object with at least "content" (a partial ExtractionResult).
 * NULL or text that is not a JSON object fails the extraction; non-JSON text
 * is used as the error message.
 */
typedef char* (*KreuzbergDocumentExtractorCallback)(const uint8_t* content, uintptr_t content_len,
                                                    const char* mime_type,
                                                    const char* config_json);

/**
 * Returns the recognised text. NULL reports an OCR failure.
 */
typedef char* (*KreuzbergOcrBackendCallback)(const uint8_t* image_bytes, uintptr_t image_length,
                                             const char* config_json);

/**
 * Returns NULL to keep the result, a JSON object with the fields to replace,
 * or any other text as an error message.
 */
typedef char* (*KreuzbergPostProcessorCallback)(const char* result_json);

/**
 * Returns NULL when the result is accepted, otherwise the rejection reason.
 */
typedef char* (*KreuzbergValidatorCallback)(const char* result_json);

/* ---- Version ---- */

KREUZBERG_API const char* kreuzberg_version(void);

/* ---- Errors ---- */

KREUZBERG_API const char* kreuzberg_last_error(void);
KREUZBERG_API int32_t kreuzberg_last_error_code(void);
KREUZBERG_API char* kreuzberg_last_panic_context(void);
KREUZBERG_API CErrorDetails kreuzberg_get_error_details(void);
KREUZBERG_API CErrorDetails* kreuzberg_get_error_details_ptr(void);
KREUZBERG_API void kreuzberg_free_error_details(CErrorDetails* details);

KREUZBERG_API uint32_t kreuzberg_classify_error(const char* message);
KREUZBERG_API uint32_t kreuzberg_error_code_validation(void);
KREUZBERG_API uint32_t kreuzberg_error_code_parsing(void);
KREUZBERG_API uint32_t kreuzberg_error_code_ocr(void);
KREUZBERG_API uint32_t kreuzberg_error_code_missing_dependency(void);
KREUZBERG_API uint32_t kreuzberg_error_code_io(void);
KREUZBERG_API uint32_t kreuzberg_error_code_plugin(void);
KREUZBERG_API uint32_t kreuzberg_error_code_unsupported_format(void);
KREUZBERG_API uint32_t kreuzberg_error_code_internal(void);
KREUZBERG_API uint32_t kreuzberg_error_code_count(void);
KREUZBERG_API const char* kreuzberg_error_code_name(uint32_t code);
KREUZBERG_API const char* kreuzberg_error_code_description(uint32_t code);

/* ---- Memory ---- */

KREUZBERG_API void kreuzberg_free_string(char* s);
KREUZBERG_API char* kreuzberg_clone_string(const char* s);
KREUZBERG_API void kreuzberg_free_result(CExtractionResult* result);
KREUZBERG_API void kreuzberg_free_batch_result(CBatchResult* batch);

/* ---- Configuration ---- */

KREUZBERG_API ExtractionConfig* kreuzberg_config_from_json(const char* json);
KREUZBERG_API ExtractionConfig* kreuzberg_config_from_file(const char* path);
KREUZBERG_API char* kreuzberg_config_discover(void);
KREUZBERG_API void kreuzberg_config_free(ExtractionConfig* config);
KREUZBERG_API int32_t kreuzberg_config_is_valid(const char* json);
KREUZBERG_API char* kreuzberg_config_to_json(const ExtractionConfig* config);
KREUZBERG_API char* kreuzberg_config_get_field(const ExtractionConfig* config,
                                               const char* field_path);
KREUZBERG_API int32_t kreuzberg_config_merge(ExtractionConfig* base,
                                             const ExtractionConfig* overlay);

KREUZBERG_API char* kreuzberg_list_embedding_presets(void);
KREUZBERG_API char* kreuzberg_get_embedding_preset(const char* name);

/**
 * Server settings from a config file (NULL for none) with KREUZBERG_* environment
 * overrides applied, as JSON.
 */
KREUZBERG_API char* kreuzberg_load_server_config(const char* path);

/* Builder setters return 0 on success and -1 on failure. */
KREUZBERG_API ConfigBuilder* kreuzberg_config_builder_new(void);
KREUZBERG_API int32_t kreuzberg_config_builder_set_use_cache(ConfigBuilder* builder, bool value);
KREUZBERG_API int32_t kreuzberg_config_builder_set_enable_quality_processing(ConfigBuilder* builder,
                                                                             bool value);
KREUZBERG_API int32_t kreuzberg_config_builder_set_force_ocr(ConfigBuilder* builder, bool value);
KREUZBERG_API int32_t kreuzberg_config_builder_set_include_document_structure(
    ConfigBuilder* builder, bool value);
KREUZBERG_API int32_t kreuzberg_config_builder_set_max_concurrent_extractions(
    ConfigBuilder* builder, uint32_t value);
KREUZBERG_API int32_t kreuzberg_config_builder_set_output_format(ConfigBuilder* builder,
                                                                 const char* format);
KREUZBERG_API int32_t kreuzberg_config_builder_set_ocr(ConfigBuilder* builder, const char* json);
KREUZBERG_API int32_t kreuzberg_config_builder_set_pdf(ConfigBuilder* builder, const char* json);
KREUZBERG_API int32_t kreuzberg_config_builder_set_chunking(ConfigBuilder* builder,
                                                            const char* json);
KREUZBERG_API int32_t kreuzberg_config_builder_set_image_extraction(ConfigBuilder* builder,
                                                                    const char* json);
KREUZBERG_API int32_t kreuzberg_config_builder_set_pages(ConfigBuilder* builder, const char* json);
KREUZBERG_API int32_t kreuzberg_config_builder_set_token_reduction(ConfigBuilder* builder,
                                                                   const char* json);
KREUZBERG_API int32_t kreuzberg_config_builder_set_language_detection(ConfigBuilder* builder,
                                                                      const char* json);
KREUZBERG_API int32_t kreuzberg_config_builder_set_post_processor(ConfigBuilder* builder,
                                                                  const char* json);
KREUZBERG_API int32_t kreuzberg_config_builder_set_keywords(ConfigBuilder* builder,
                                                            const char* json);
KREUZBERG_API int32_t kreuzberg_config_builder_set_html_options(ConfigBuilder* builder,
                                                                const char* json);
/**
 * Consumes and releases the builder whether or not the build succeeds.
 */
KREUZBERG_API ExtractionConfig* kreuzberg_config_builder_build(ConfigBuilder* builder);
KREUZBERG_API void kreuzberg_config_builder_free(ConfigBuilder* builder);

/* ---- Validation (1 valid, 0 invalid) ---- */

KREUZBERG_API int32_t kreuzberg_validate_binarization_method(const char* method);
KREUZBERG_API int32_t kreuzberg_validate_ocr_backend(const char* backend);
KREUZBERG_API int32_t kreuzberg_validate_language_code(const char* code);
KREUZBERG_API int32_t kreuzberg_validate_token_reduction_level(const char* level);
KREUZBERG_API int32_t kreuzberg_validate_tesseract_psm(int32_t psm);
KREUZBERG_API int32_t kreuzberg_validate_tesseract_oem(int32_t oem);
KREUZBERG_API int32_t kreuzberg_validate_output_format(const char* format);
KREUZBERG_API int32_t kreuzberg_validate_confidence(double confidence);
KREUZBERG_API int32_t kreuzberg_validate_dpi(int32_t dpi);
KREUZBERG_API int32_t kreuzberg_validate_chunking_params(uintptr_t max_chars,
                                                         uintptr_t max_overlap);

KREUZBERG_API char* kreuzberg_get_valid_binarization_methods(void);
KREUZBERG_API char* kreuzberg_get_valid_language_codes(void);
KREUZBERG_API char* kreuzberg_get_valid_ocr_backends(void);
KREUZBERG_API char* kreuzberg_get_valid_token_reduction_levels(void);

/* ---- HTML conversion option enums (parse returns -1 when unknown) ---- */

KREUZBERG_API int32_t kreuzberg_parse_heading_style(const char* value);
KREUZBERG_API const char* kreuzberg_heading_style_to_string(int32_t value);
KREUZBERG_API int32_t kreuzberg_parse_code_block_style(const char* value);
KREUZBERG_API const char* kreuzberg_code_block_style_to_string(int32_t value);
KREUZBERG_API int32_t kreuzberg_parse_highlight_style(const char* value);
KREUZBERG_API const char* kreuzberg_highlight_style_to_string(int32_t value);
KREUZBERG_API int32_t kreuzberg_parse_list_indent_type(const char* value);
KREUZBERG_API const char* kreuzberg_list_indent_type_to_string(int32_t value);
KREUZBERG_API int32_t kreuzberg_parse_whitespace_mode(const char* value);
KREUZBERG_API const char* kreuzberg_whitespace_mode_to_string(int32_t value);
KREUZBERG_API int32_t kreuzberg_parse_newline_style(const char* value);
KREUZBERG_API const char* kreuzberg_newline_style_to_string(int32_t value);
KREUZBERG_API int32_t kreuzberg_parse_preprocessing_preset(const char* value);
KREUZBERG_API const char* kreuzberg_preprocessing_preset_to_string(int32_t value);

/* ---- MIME detection ---- */

KREUZBERG_API char* kreuzberg_detect_mime_type(const char* path, bool check_exists);
KREUZBERG_API char* kreuzberg_detect_mime_type_from_bytes(const uint8_t* data, uintptr_t len);
KREUZBERG_API char* kreuzberg_detect_mime_type_from_path(const char* path);
KREUZBERG_API char* kreuzberg_validate_mime_type(const char* mime_type);
KREUZBERG_API char* kreuzberg_get_extensions_for_mime(const char* mime_type);

/* ---- Extraction ---- */

KREUZBERG_API CExtractionResult* kreuzberg_extract_file_sync(const char* path);
KREUZBERG_API CExtractionResult* kreuzberg_extract_file_sync_with_config(const char* path,
                                                                         const char* config_json);
/**
 * @param mime_hint Used when it names a supported MIME type; may be NULL
 * @param config Config handle; NULL for defaults
 */
KREUZBERG_API CExtractionResult* kreuzberg_extract_file_with_hint(const char* path,
                                                                  const char* mime_hint,
                                                                  const ExtractionConfig* config);
KREUZBERG_API CExtractionResult* kreuzberg_extract_bytes_sync(const uint8_t* data, uintptr_t len,
                                                              const char* mime_type);
KREUZBERG_API CExtractionResult* kreuzberg_extract_bytes_sync_with_config(
    const uint8_t* data, uintptr_t len, const char* mime_type, const char* config_json);
KREUZBERG_API CExtractionResult* kreuzberg_extract_bytes_with_config_handle(
    const uint8_t* data, uintptr_t len, const char* mime_type, const ExtractionConfig* config);

KREUZBERG_API CBatchResult* kreuzberg_batch_extract_files_sync(const char* const* paths,
                                                               uintptr_t count,
                                                               const char* config_json);
KREUZBERG_API CBatchResult* kreuzberg_batch_extract_bytes_sync(const CBytesWithMime* items,
                                                               uintptr_t count,
                                                               const char* config_json);

/* Opaque result handles */
KREUZBERG_API ExtractionResult* kreuzberg_extract_bytes_handle(const uint8_t* data, uintptr_t len,
                                                               const char* mime_type,
                                                               const char* config_json);
KREUZBERG_API ExtractionResult* kreuzberg_extract_file_handle(const char* path,
                                                              const char* config_json);
KREUZBERG_API void kreuzberg_result_handle_free(ExtractionResult* result);
KREUZBERG_API const char* kreuzberg_result_get_content(const ExtractionResult* result);
KREUZBERG_API const char* kreuzberg_result_get_mime_type(const ExtractionResult* result);
KREUZBERG_API uintptr_t kreuzberg_result_get_chunk_count(const ExtractionResult* result);
/**
 * Metadata lookup by key or dotted path ("open_graph.title"). A missing key
 * yields is_null == 1 and a NULL json_value.
 */
KREUZBERG_API CMetadataField kreuzberg_result_get_metadata_field(const ExtractionResult* result,
                                                                 const char* field_name);
KREUZBERG_API CExtractionResult* kreuzberg_result_to_c(const ExtractionResult* result);

/* ---- Result pool ---- */

KREUZBERG_API ResultPool* kreuzberg_result_pool_new(uintptr_t capacity);
KREUZBERG_API CResultPoolStats kreuzberg_result_pool_stats(const ResultPool* pool);
KREUZBERG_API void kreuzberg_result_pool_reset(ResultPool* pool);
KREUZBERG_API void kreuzberg_result_pool_free(ResultPool* pool);
KREUZBERG_API const CExtractionResultView* kreuzberg_extract_file_into_pool(const char* path,
                                                                            const char* config_json,
                                                                            ResultPool* pool);
/**
 * Same as kreuzberg_extract_file_into_pool() but returns the view by value; a
 * zeroed view signals failure.
 */
KREUZBERG_API CExtractionResultView kreuzberg_extract_file_into_pool_view(const char* path,
                                                                          const char* config_json,
                                                                          ResultPool* pool);
KREUZBERG_API int32_t kreuzberg_view_get_content(const CExtractionResultView* view,
                                                 const uint8_t** out_ptr, uintptr_t* out_len);
KREUZBERG_API int32_t kreuzberg_view_get_mime_type(const CExtractionResultView* view,
                                                   const uint8_t** out_ptr, uintptr_t* out_len);

/* ---- String interning ---- */

KREUZBERG_API const char* kreuzberg_intern_string(const char* s);
KREUZBERG_API void kreuzberg_free_interned_string(const char* s);
KREUZBERG_API CStringInternStats kreuzberg_string_intern_stats(void);
KREUZBERG_API void kreuzberg_string_intern_reset(void);

/* ---- Plugins (register/unregister/clear return true on success) ---- */

KREUZBERG_API bool kreuzberg_register_ocr_backend(const char* name,
                                                  KreuzbergOcrBackendCallback callback);
/**
 * @param languages_json JSON array of language codes, e.g. ["eng", "deu"]
 */
KREUZBERG_API bool kreuzberg_register_ocr_backend_with_languages(
    const char* name, KreuzbergOcrBackendCallback callback, const char* languages_json);
KREUZBERG_API bool kreuzberg_unregister_ocr_backend(const char* name);
KREUZBERG_API bool kreuzberg_clear_ocr_backends(void);
KREUZBERG_API char* kreuzberg_list_ocr_backends(void);
KREUZBERG_API char* kreuzberg_get_ocr_languages(const char* backend);
KREUZBERG_API int32_t kreuzberg_is_language_supported(const char* backend, const char* language);
KREUZBERG_API char* kreuzberg_list_ocr_backends_with_languages(void);

KREUZBERG_API bool kreuzberg_register_post_processor(const char* name,
                                                     KreuzbergPostProcessorCallback callback,
                                                     int32_t priority);
/**
 * @param stage "early", "middle" or "late"; NULL means "middle"
 */
KREUZBERG_API bool kreuzberg_register_post_processor_with_stage(
    const char* name, KreuzbergPostProcessorCallback callback, int32_t priority, const char* stage);
KREUZBERG_API bool kreuzberg_unregister_post_processor(const char* name);
KREUZBERG_API bool kreuzberg_clear_post_processors(void);
KREUZBERG_API char* kreuzberg_list_post_processors(void);

KREUZBERG_API bool kreuzberg_register_validator(const char* name,
                                                KreuzbergValidatorCallback callback,
                                                int32_t priority);
KREUZBERG_API bool kreuzberg_unregister_validator(const char* name);
KREUZBERG_API bool kreuzberg_clear_validators(void);
KREUZBERG_API char* kreuzberg_list_validators(void);

/**
 * @param mime_types Comma separated list or JSON array; "type/*" matches a family
 */
KREUZBERG_API bool kreuzberg_register_document_extractor(
    const char* name, KreuzbergDocumentExtractorCallback callback, const char* mime_types,
    int32_t priority);
KREUZBERG_API bool kreuzberg_unregister_document_extractor(const char* name);
KREUZBERG_API bool kreuzberg_clear_document_extractors(void);
KREUZBERG_API char* kreuzberg_list_document_extractors(void);

#ifdef __cplusplus
}
#endif
