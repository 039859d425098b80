#include "ffi_internal.h"

#include <kreuzberg/config/config_loader.h>
#include <kreuzberg/config/embedding_presets.h>
#include <kreuzberg/config/html_options.h>
#include <kreuzberg/config/server_config.h>
#include <kreuzberg/config/validation.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {

using namespace kreuzberg;
using json = nlohmann::json;

constexpr int32_t kOk = 0;
constexpr int32_t kFailed = -1;

int32_t builderStatus(const Result<void>& r, const char* function) {
    if (!r) {
        ffi::recordError(r.error(), function);
        return kFailed;
    }
    return kOk;
}

template <typename Setter>
int32_t setOnBuilder(::ConfigBuilder* builder, const char* function, Setter&& setter) {
    return ffi::guarded<int32_t>(kFailed, [&]() -> int32_t {
        if (!builder) {
            ffi::recordError({ErrorCode::InvalidArgument, "builder cannot be NULL"}, function);
            return kFailed;
        }
        return builderStatus(setter(builder->builder), function);
    });
}

template <typename Setter>
int32_t setJsonOnBuilder(::ConfigBuilder* builder, const char* text, const char* function,
                         Setter&& setter) {
    if (!text) {
        ffi::guardedVoid([&] {
            ffi::recordError({ErrorCode::InvalidArgument, "value cannot be NULL"}, function);
        });
        return kFailed;
    }
    return setOnBuilder(builder, function, [&](config::ConfigBuilder& b) {
        return setter(b, std::string_view(text));
    });
}

int32_t asFlag(const Result<void>& r) {
    return r ? 1 : 0;
}

// Shared shape of the kreuzberg_parse_* helpers: -1 for NULL or unknown names
template <typename Enum, typename Parser> int32_t parseEnum(const char* value, Parser&& parser) {
    if (!value)
        return -1;
    auto parsed = parser(std::string_view(value));
    return parsed ? static_cast<int32_t>(*parsed) : -1;
}

template <typename Enum> const char* enumName(int32_t value, int32_t count) {
    if (value < 0 || value >= count)
        return nullptr;
    return config::toString(static_cast<Enum>(value));
}

} // namespace

extern "C" {

// ============================================================================
// Config handles
// ============================================================================

ExtractionConfig* kreuzberg_config_from_json(const char* text) {
    return ffi::guarded<ExtractionConfig*>(nullptr, [&]() -> ExtractionConfig* {
        if (!text) {
            ffi::recordError({ErrorCode::InvalidArgument, "config JSON cannot be NULL"});
            return nullptr;
        }
        auto cfg = config::ConfigLoader::fromJsonString(text);
        if (!cfg) {
            ffi::recordError(cfg.error());
            return nullptr;
        }
        return new ExtractionConfig{std::move(cfg).value()};
    });
}

ExtractionConfig* kreuzberg_config_from_file(const char* path) {
    return ffi::guarded<ExtractionConfig*>(nullptr, [&]() -> ExtractionConfig* {
        if (!path || *path == '\0') {
            ffi::recordError({ErrorCode::InvalidArgument, "config path cannot be empty"});
            return nullptr;
        }
        auto cfg = config::ConfigLoader::fromFile(path);
        if (!cfg) {
            ffi::recordError(cfg.error());
            core::ErrorState::setContextInfo(path);
            return nullptr;
        }
        return new ExtractionConfig{std::move(cfg).value()};
    });
}

char* kreuzberg_config_discover(void) {
    return ffi::guarded<char*>(nullptr, [&]() -> char* {
        auto found = config::ConfigLoader::discover();
        if (!found) {
            spdlog::debug("No kreuzberg config file found from {}",
                          std::filesystem::current_path().string());
            return nullptr;
        }
        auto cfg = config::ConfigLoader::fromFile(found.value());
        if (!cfg) {
            ffi::recordError(cfg.error());
            core::ErrorState::setContextInfo(found.value().string());
            return nullptr;
        }
        return ffi::toCString(config::ConfigLoader::toJsonString(cfg.value()));
    });
}

void kreuzberg_config_free(ExtractionConfig* config) {
    delete config;
}

int32_t kreuzberg_config_is_valid(const char* text) {
    return ffi::guarded<int32_t>(0, [&]() -> int32_t {
        if (!text)
            return 0;
        auto cfg = config::ConfigLoader::fromJsonString(text);
        if (!cfg) {
            ffi::recordError(cfg.error());
            return 0;
        }
        return 1;
    });
}

char* kreuzberg_config_to_json(const ExtractionConfig* config) {
    return ffi::guarded<char*>(nullptr, [&]() -> char* {
        if (!config) {
            ffi::recordError({ErrorCode::InvalidArgument, "config cannot be NULL"});
            return nullptr;
        }
        return ffi::toCString(config::ConfigLoader::toJsonString(config->config));
    });
}

char* kreuzberg_config_get_field(const ExtractionConfig* config, const char* field_path) {
    return ffi::guarded<char*>(nullptr, [&]() -> char* {
        if (!config || !field_path) {
            ffi::recordError({ErrorCode::InvalidArgument, "config and field path are required"});
            return nullptr;
        }
        auto value = config::ConfigLoader::getField(config->config, field_path);
        if (!value) {
            ffi::recordError(value.error());
            return nullptr;
        }
        return ffi::toCString(value.value().dump());
    });
}

int32_t kreuzberg_config_merge(ExtractionConfig* base, const ExtractionConfig* overlay) {
    return ffi::guarded<int32_t>(0, [&]() -> int32_t {
        if (!base || !overlay) {
            ffi::recordError({ErrorCode::InvalidArgument, "base and overlay are required"});
            return 0;
        }
        auto merged = config::ConfigLoader::merge(base->config, overlay->config);
        if (!merged) {
            ffi::recordError(merged.error());
            return 0;
        }
        base->config = std::move(merged).value();
        return 1;
    });
}

char* kreuzberg_list_embedding_presets(void) {
    return ffi::guarded<char*>(nullptr, [] {
        std::vector<std::string> names;
        for (const auto& preset : config::embeddingPresets())
            names.push_back(preset.name);
        return ffi::toJsonArray(names);
    });
}

char* kreuzberg_get_embedding_preset(const char* name) {
    return ffi::guarded<char*>(nullptr, [&]() -> char* {
        const auto* preset = name ? config::findEmbeddingPreset(name) : nullptr;
        if (!preset) {
            ffi::recordError({ErrorCode::InvalidArgument,
                              std::string("Unknown embedding preset: ") + (name ? name : "NULL")});
            return nullptr;
        }
        return ffi::toCString(json(*preset).dump());
    });
}

char* kreuzberg_load_server_config(const char* path) {
    return ffi::guarded<char*>(nullptr, [&]() -> char* {
        auto cfg = config::ServerConfig::load(path ? std::filesystem::path(path)
                                                   : std::filesystem::path{});
        if (!cfg) {
            ffi::recordError(cfg.error());
            return nullptr;
        }
        return ffi::toCString(json(cfg.value()).dump());
    });
}

// ============================================================================
// Builder
// ============================================================================

ConfigBuilder* kreuzberg_config_builder_new(void) {
    return ffi::guarded<ConfigBuilder*>(nullptr, [] { return new ConfigBuilder{}; });
}

int32_t kreuzberg_config_builder_set_use_cache(ConfigBuilder* builder, bool value) {
    return setOnBuilder(builder, __func__,
                        [&](config::ConfigBuilder& b) { return b.setUseCache(value); });
}

int32_t kreuzberg_config_builder_set_enable_quality_processing(ConfigBuilder* builder,
                                                               bool value) {
    return setOnBuilder(builder, __func__, [&](config::ConfigBuilder& b) {
        return b.setEnableQualityProcessing(value);
    });
}

int32_t kreuzberg_config_builder_set_force_ocr(ConfigBuilder* builder, bool value) {
    return setOnBuilder(builder, __func__,
                        [&](config::ConfigBuilder& b) { return b.setForceOcr(value); });
}

int32_t kreuzberg_config_builder_set_include_document_structure(ConfigBuilder* builder,
                                                                bool value) {
    return setOnBuilder(builder, __func__, [&](config::ConfigBuilder& b) {
        return b.setIncludeDocumentStructure(value);
    });
}

int32_t kreuzberg_config_builder_set_max_concurrent_extractions(ConfigBuilder* builder,
                                                                uint32_t value) {
    return setOnBuilder(builder, __func__, [&](config::ConfigBuilder& b) {
        return b.setMaxConcurrentExtractions(value);
    });
}

int32_t kreuzberg_config_builder_set_output_format(ConfigBuilder* builder, const char* format) {
    return setJsonOnBuilder(builder, format, __func__,
                            [](config::ConfigBuilder& b, std::string_view v) {
                                return b.setOutputFormat(v);
                            });
}

int32_t kreuzberg_config_builder_set_ocr(ConfigBuilder* builder, const char* text) {
    return setJsonOnBuilder(builder, text, __func__,
                            [](config::ConfigBuilder& b, std::string_view v) {
                                return b.setOcr(v);
                            });
}

int32_t kreuzberg_config_builder_set_pdf(ConfigBuilder* builder, const char* text) {
    return setJsonOnBuilder(builder, text, __func__,
                            [](config::ConfigBuilder& b, std::string_view v) {
                                return b.setPdf(v);
                            });
}

int32_t kreuzberg_config_builder_set_chunking(ConfigBuilder* builder, const char* text) {
    return setJsonOnBuilder(builder, text, __func__,
                            [](config::ConfigBuilder& b, std::string_view v) {
                                return b.setChunking(v);
                            });
}

int32_t kreuzberg_config_builder_set_image_extraction(ConfigBuilder* builder, const char* text) {
    return setJsonOnBuilder(builder, text, __func__,
                            [](config::ConfigBuilder& b, std::string_view v) {
                                return b.setImageExtraction(v);
                            });
}

int32_t kreuzberg_config_builder_set_pages(ConfigBuilder* builder, const char* text) {
    return setJsonOnBuilder(builder, text, __func__,
                            [](config::ConfigBuilder& b, std::string_view v) {
                                return b.setPages(v);
                            });
}

int32_t kreuzberg_config_builder_set_token_reduction(ConfigBuilder* builder, const char* text) {
    return setJsonOnBuilder(builder, text, __func__,
                            [](config::ConfigBuilder& b, std::string_view v) {
                                return b.setTokenReduction(v);
                            });
}

int32_t kreuzberg_config_builder_set_language_detection(ConfigBuilder* builder,
                                                        const char* text) {
    return setJsonOnBuilder(builder, text, __func__,
                            [](config::ConfigBuilder& b, std::string_view v) {
                                return b.setLanguageDetection(v);
                            });
}

int32_t kreuzberg_config_builder_set_post_processor(ConfigBuilder* builder, const char* text) {
    return setJsonOnBuilder(builder, text, __func__,
                            [](config::ConfigBuilder& b, std::string_view v) {
                                return b.setPostProcessor(v);
                            });
}

int32_t kreuzberg_config_builder_set_keywords(ConfigBuilder* builder, const char* text) {
    return setJsonOnBuilder(builder, text, __func__,
                            [](config::ConfigBuilder& b, std::string_view v) {
                                return b.setKeywords(v);
                            });
}

int32_t kreuzberg_config_builder_set_html_options(ConfigBuilder* builder, const char* text) {
    return setJsonOnBuilder(builder, text, __func__,
                            [](config::ConfigBuilder& b, std::string_view v) {
                                return b.setHtmlOptions(v);
                            });
}

ExtractionConfig* kreuzberg_config_builder_build(ConfigBuilder* builder) {
    return ffi::guarded<ExtractionConfig*>(nullptr, [&]() -> ExtractionConfig* {
        if (!builder) {
            ffi::recordError({ErrorCode::InvalidArgument, "builder cannot be NULL"});
            return nullptr;
        }
        std::unique_ptr<ConfigBuilder> owned(builder);
        auto cfg = owned->builder.build();
        if (!cfg) {
            ffi::recordError(cfg.error());
            return nullptr;
        }
        return new ExtractionConfig{std::move(cfg).value()};
    });
}

void kreuzberg_config_builder_free(ConfigBuilder* builder) {
    delete builder;
}

// ============================================================================
// Standalone validators (1 valid, 0 invalid)
// ============================================================================

int32_t kreuzberg_validate_binarization_method(const char* method) {
    return method ? asFlag(config::validateBinarizationMethod(method)) : 0;
}

int32_t kreuzberg_validate_ocr_backend(const char* backend) {
    return backend ? asFlag(config::validateOcrBackend(backend)) : 0;
}

int32_t kreuzberg_validate_language_code(const char* code) {
    return code ? asFlag(config::validateLanguageCode(code)) : 0;
}

int32_t kreuzberg_validate_token_reduction_level(const char* level) {
    return level ? asFlag(config::validateTokenReductionLevel(level)) : 0;
}

int32_t kreuzberg_validate_tesseract_psm(int32_t psm) {
    return asFlag(config::validateTesseractPsm(psm));
}

int32_t kreuzberg_validate_tesseract_oem(int32_t oem) {
    return asFlag(config::validateTesseractOem(oem));
}

int32_t kreuzberg_validate_output_format(const char* format) {
    return format ? asFlag(config::validateTesseractOutputFormat(format)) : 0;
}

int32_t kreuzberg_validate_confidence(double confidence) {
    return asFlag(config::validateConfidence(confidence));
}

int32_t kreuzberg_validate_dpi(int32_t dpi) {
    return asFlag(config::validateDpi(dpi));
}

int32_t kreuzberg_validate_chunking_params(uintptr_t max_chars, uintptr_t max_overlap) {
    return asFlag(config::validateChunkingParams(static_cast<std::int64_t>(max_chars),
                                                 static_cast<std::int64_t>(max_overlap)));
}

char* kreuzberg_get_valid_binarization_methods(void) {
    return ffi::guarded<char*>(nullptr,
                               [] { return ffi::toJsonArray(config::validBinarizationMethods()); });
}

char* kreuzberg_get_valid_language_codes(void) {
    return ffi::guarded<char*>(nullptr,
                               [] { return ffi::toJsonArray(config::validLanguageCodes()); });
}

char* kreuzberg_get_valid_ocr_backends(void) {
    return ffi::guarded<char*>(nullptr,
                               [] { return ffi::toJsonArray(config::validOcrBackends()); });
}

char* kreuzberg_get_valid_token_reduction_levels(void) {
    return ffi::guarded<char*>(
        nullptr, [] { return ffi::toJsonArray(config::validTokenReductionLevels()); });
}

// ============================================================================
// HTML option enums
// ============================================================================

int32_t kreuzberg_parse_heading_style(const char* value) {
    return parseEnum<config::HeadingStyle>(value, config::parseHeadingStyle);
}

const char* kreuzberg_heading_style_to_string(int32_t value) {
    return enumName<config::HeadingStyle>(value, 3);
}

int32_t kreuzberg_parse_code_block_style(const char* value) {
    return parseEnum<config::CodeBlockStyle>(value, config::parseCodeBlockStyle);
}

const char* kreuzberg_code_block_style_to_string(int32_t value) {
    return enumName<config::CodeBlockStyle>(value, 3);
}

int32_t kreuzberg_parse_highlight_style(const char* value) {
    return parseEnum<config::HighlightStyle>(value, config::parseHighlightStyle);
}

const char* kreuzberg_highlight_style_to_string(int32_t value) {
    return enumName<config::HighlightStyle>(value, 4);
}

int32_t kreuzberg_parse_list_indent_type(const char* value) {
    return parseEnum<config::ListIndentType>(value, config::parseListIndentType);
}

const char* kreuzberg_list_indent_type_to_string(int32_t value) {
    return enumName<config::ListIndentType>(value, 2);
}

int32_t kreuzberg_parse_whitespace_mode(const char* value) {
    return parseEnum<config::WhitespaceMode>(value, config::parseWhitespaceMode);
}

const char* kreuzberg_whitespace_mode_to_string(int32_t value) {
    return enumName<config::WhitespaceMode>(value, 4);
}

int32_t kreuzberg_parse_newline_style(const char* value) {
    return parseEnum<config::NewlineStyle>(value, config::parseNewlineStyle);
}

const char* kreuzberg_newline_style_to_string(int32_t value) {
    return enumName<config::NewlineStyle>(value, 2);
}

int32_t kreuzberg_parse_preprocessing_preset(const char* value) {
    return parseEnum<config::PreprocessingPreset>(value, config::parsePreprocessingPreset);
}

const char* kreuzberg_preprocessing_preset_to_string(int32_t value) {
    return enumName<config::PreprocessingPreset>(value, 3);
}

} // extern "C"
