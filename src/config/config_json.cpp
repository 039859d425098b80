#include <kreuzberg/config/config_json.h>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace kreuzberg::config {

namespace {

using nlohmann::json;

// Carries the dotted path of the offending key up through nested from_json calls.
class FieldError : public std::runtime_error {
public:
    FieldError(std::string path, std::string reason)
        : std::runtime_error(reason), path_(std::move(path)), reason_(std::move(reason)) {}

    const std::string& path() const noexcept { return path_; }
    const std::string& reason() const noexcept { return reason_; }

private:
    std::string path_;
    std::string reason_;
};

void requireObject(const json& j) {
    if (!j.is_object())
        throw FieldError("", std::string("expected an object, got ") + j.type_name());
}

// nlohmann's get<> narrows integers silently, so range-check before converting
template <typename T> T getChecked(const json& v) {
    if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
        if (!v.is_number_integer())
            throw FieldError("", std::string("expected an integer, got ") +
                                     (v.is_number_float() ? v.dump() : v.type_name()));
        if (v.is_number_unsigned()) {
            if (v.get<std::uint64_t>() >
                static_cast<std::uint64_t>(std::numeric_limits<T>::max()))
                throw FieldError("", "out of range (got " + v.dump() + ")");
        } else {
            auto value = v.get<std::int64_t>();
            if constexpr (std::is_unsigned_v<T>) {
                if (value < 0)
                    throw FieldError("", "out of range (got " + v.dump() + ")");
            } else {
                if (value < std::numeric_limits<T>::min() || value > std::numeric_limits<T>::max())
                    throw FieldError("", "out of range (got " + v.dump() + ")");
            }
        }
    }
    return v.template get<T>();
}

template <typename T> void read(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return;
    try {
        out = getChecked<T>(*it);
    } catch (const FieldError& e) {
        throw FieldError(e.path().empty() ? key : std::string(key) + "." + e.path(), e.reason());
    } catch (const json::exception& e) {
        throw FieldError(key, e.what());
    }
}

template <typename T> void read(const json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return;
    // Start from the existing value (or defaults) so partial objects keep other fields.
    T value = out.value_or(T{});
    try {
        if constexpr (std::is_class_v<T> && !std::is_same_v<T, std::string> &&
                      !std::is_same_v<T, std::vector<std::string>>) {
            from_json(*it, value);
        } else {
            value = getChecked<T>(*it);
        }
    } catch (const FieldError& e) {
        throw FieldError(e.path().empty() ? key : std::string(key) + "." + e.path(), e.reason());
    } catch (const json::exception& e) {
        throw FieldError(key, e.what());
    }
    out = std::move(value);
}

template <typename E, typename Parse>
void readEnum(const json& j, const char* key, E& out, Parse parse) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return;
    if (!it->is_string())
        throw FieldError(key, std::string("expected a string, got ") + it->type_name());
    auto parsed = parse(it->template get<std::string>());
    if (!parsed)
        throw FieldError(key, "unknown value '" + it->template get<std::string>() + "'");
    out = *parsed;
}

template <typename T> void write(json& j, const char* key, const std::optional<T>& v) {
    if (v)
        j[key] = *v;
}

} // namespace

void to_json(json& j, const ImagePreprocessingConfig& c) {
    j = json::object();
    j["target_dpi"] = c.target_dpi;
    j["auto_rotate"] = c.auto_rotate;
    j["deskew"] = c.deskew;
    j["denoise"] = c.denoise;
    j["contrast_enhance"] = c.contrast_enhance;
    j["binarization_method"] = c.binarization_method;
    j["invert_colors"] = c.invert_colors;
}

void from_json(const json& j, ImagePreprocessingConfig& c) {
    requireObject(j);
    read(j, "target_dpi", c.target_dpi);
    read(j, "auto_rotate", c.auto_rotate);
    read(j, "deskew", c.deskew);
    read(j, "denoise", c.denoise);
    read(j, "contrast_enhance", c.contrast_enhance);
    read(j, "binarization_method", c.binarization_method);
    read(j, "invert_colors", c.invert_colors);
}

void to_json(json& j, const TesseractConfig& c) {
    j = json::object();
    j["language"] = c.language;
    j["psm"] = c.psm;
    j["oem"] = c.oem;
    j["output_format"] = c.output_format;
    j["min_confidence"] = c.min_confidence;
    write(j, "preprocessing", c.preprocessing);
    j["enable_table_detection"] = c.enable_table_detection;
    j["table_min_confidence"] = c.table_min_confidence;
    j["table_column_threshold"] = c.table_column_threshold;
    j["table_row_threshold_ratio"] = c.table_row_threshold_ratio;
    j["use_cache"] = c.use_cache;
    j["classify_use_pre_adapted_templates"] = c.classify_use_pre_adapted_templates;
    j["language_model_ngram_on"] = c.language_model_ngram_on;
    j["tessedit_dont_blkrej_good_wds"] = c.tessedit_dont_blkrej_good_wds;
    j["tessedit_dont_rowrej_good_wds"] = c.tessedit_dont_rowrej_good_wds;
    j["tessedit_enable_dict_correction"] = c.tessedit_enable_dict_correction;
    j["tessedit_char_whitelist"] = c.tessedit_char_whitelist;
    j["tessedit_char_blacklist"] = c.tessedit_char_blacklist;
    j["tessedit_use_primary_params_model"] = c.tessedit_use_primary_params_model;
    j["textord_space_size_is_variable"] = c.textord_space_size_is_variable;
    j["thresholding_method"] = c.thresholding_method;
}

void from_json(const json& j, TesseractConfig& c) {
    requireObject(j);
    read(j, "language", c.language);
    read(j, "psm", c.psm);
    read(j, "oem", c.oem);
    read(j, "output_format", c.output_format);
    read(j, "min_confidence", c.min_confidence);
    read(j, "preprocessing", c.preprocessing);
    read(j, "enable_table_detection", c.enable_table_detection);
    read(j, "table_min_confidence", c.table_min_confidence);
    read(j, "table_column_threshold", c.table_column_threshold);
    read(j, "table_row_threshold_ratio", c.table_row_threshold_ratio);
    read(j, "use_cache", c.use_cache);
    read(j, "classify_use_pre_adapted_templates", c.classify_use_pre_adapted_templates);
    read(j, "language_model_ngram_on", c.language_model_ngram_on);
    read(j, "tessedit_dont_blkrej_good_wds", c.tessedit_dont_blkrej_good_wds);
    read(j, "tessedit_dont_rowrej_good_wds", c.tessedit_dont_rowrej_good_wds);
    read(j, "tessedit_enable_dict_correction", c.tessedit_enable_dict_correction);
    read(j, "tessedit_char_whitelist", c.tessedit_char_whitelist);
    read(j, "tessedit_char_blacklist", c.tessedit_char_blacklist);
    read(j, "tessedit_use_primary_params_model", c.tessedit_use_primary_params_model);
    read(j, "textord_space_size_is_variable", c.textord_space_size_is_variable);
    read(j, "thresholding_method", c.thresholding_method);
}

void to_json(json& j, const OcrConfig& c) {
    j = json::object();
    j["backend"] = c.backend;
    j["language"] = c.language;
    write(j, "tesseract_config", c.tesseract_config);
}

void from_json(const json& j, OcrConfig& c) {
    requireObject(j);
    read(j, "backend", c.backend);
    read(j, "language", c.language);
    read(j, "tesseract_config", c.tesseract_config);
}

void to_json(json& j, const HierarchyConfig& c) {
    j = json::object();
    j["enabled"] = c.enabled;
    j["k_clusters"] = c.k_clusters;
    j["include_bbox"] = c.include_bbox;
    write(j, "ocr_coverage_threshold", c.ocr_coverage_threshold);
}

void from_json(const json& j, HierarchyConfig& c) {
    requireObject(j);
    read(j, "enabled", c.enabled);
    read(j, "k_clusters", c.k_clusters);
    read(j, "include_bbox", c.include_bbox);
    read(j, "ocr_coverage_threshold", c.ocr_coverage_threshold);
}

void to_json(json& j, const PdfConfig& c) {
    j = json::object();
    j["extract_images"] = c.extract_images;
    write(j, "passwords", c.passwords);
    j["extract_metadata"] = c.extract_metadata;
    write(j, "hierarchy", c.hierarchy);
}

void from_json(const json& j, PdfConfig& c) {
    requireObject(j);
    read(j, "extract_images", c.extract_images);
    read(j, "passwords", c.passwords);
    read(j, "extract_metadata", c.extract_metadata);
    read(j, "hierarchy", c.hierarchy);
}

void to_json(json& j, const EmbeddingModel& m) {
    j = json::object();
    j["type"] = toString(m.type);
    switch (m.type) {
        case EmbeddingModelType::Preset: j["name"] = m.name; break;
        case EmbeddingModelType::FastEmbed: j["model"] = m.name; break;
        case EmbeddingModelType::Custom: j["model_id"] = m.name; break;
    }
    write(j, "dimensions", m.dimensions);
}

void from_json(const json& j, EmbeddingModel& m) {
    requireObject(j);
    readEnum(j, "type", m.type, parseEmbeddingModelType);
    switch (m.type) {
        case EmbeddingModelType::Preset: read(j, "name", m.name); break;
        case EmbeddingModelType::FastEmbed: read(j, "model", m.name); break;
        case EmbeddingModelType::Custom: read(j, "model_id", m.name); break;
    }
    read(j, "dimensions", m.dimensions);
}

void to_json(json& j, const EmbeddingConfig& c) {
    j = json::object();
    j["model"] = c.model;
    j["normalize"] = c.normalize;
    j["batch_size"] = c.batch_size;
    j["show_download_progress"] = c.show_download_progress;
    write(j, "cache_dir", c.cache_dir);
}

void from_json(const json& j, EmbeddingConfig& c) {
    requireObject(j);
    read(j, "model", c.model);
    read(j, "normalize", c.normalize);
    read(j, "batch_size", c.batch_size);
    read(j, "show_download_progress", c.show_download_progress);
    read(j, "cache_dir", c.cache_dir);
}

void to_json(json& j, const ChunkingConfig& c) {
    j = json::object();
    j["max_chars"] = c.max_chars;
    j["max_overlap"] = c.max_overlap;
    write(j, "preset", c.preset);
    write(j, "embedding", c.embedding);
}

void from_json(const json& j, ChunkingConfig& c) {
    requireObject(j);
    read(j, "max_chars", c.max_chars);
    read(j, "max_overlap", c.max_overlap);
    read(j, "preset", c.preset);
    read(j, "embedding", c.embedding);
}

void to_json(json& j, const ImageExtractionConfig& c) {
    j = json::object();
    j["extract_images"] = c.extract_images;
    j["target_dpi"] = c.target_dpi;
    j["max_image_dimension"] = c.max_image_dimension;
    j["auto_adjust_dpi"] = c.auto_adjust_dpi;
    j["min_dpi"] = c.min_dpi;
    j["max_dpi"] = c.max_dpi;
}

void from_json(const json& j, ImageExtractionConfig& c) {
    requireObject(j);
    read(j, "extract_images", c.extract_images);
    read(j, "target_dpi", c.target_dpi);
    read(j, "max_image_dimension", c.max_image_dimension);
    read(j, "auto_adjust_dpi", c.auto_adjust_dpi);
    read(j, "min_dpi", c.min_dpi);
    read(j, "max_dpi", c.max_dpi);
}

void to_json(json& j, const PageConfig& c) {
    j = json::object();
    j["extract_pages"] = c.extract_pages;
    j["insert_page_markers"] = c.insert_page_markers;
    j["marker_format"] = c.marker_format;
}

void from_json(const json& j, PageConfig& c) {
    requireObject(j);
    read(j, "extract_pages", c.extract_pages);
    read(j, "insert_page_markers", c.insert_page_markers);
    read(j, "marker_format", c.marker_format);
}

void to_json(json& j, const TokenReductionConfig& c) {
    j = json::object();
    j["mode"] = toString(c.mode);
    j["preserve_important_words"] = c.preserve_important_words;
}

void from_json(const json& j, TokenReductionConfig& c) {
    requireObject(j);
    readEnum(j, "mode", c.mode, parseTokenReductionMode);
    read(j, "preserve_important_words", c.preserve_important_words);
}

void to_json(json& j, const LanguageDetectionConfig& c) {
    j = json::object();
    j["enabled"] = c.enabled;
    j["min_confidence"] = c.min_confidence;
    j["detect_multiple"] = c.detect_multiple;
}

void from_json(const json& j, LanguageDetectionConfig& c) {
    requireObject(j);
    read(j, "enabled", c.enabled);
    read(j, "min_confidence", c.min_confidence);
    read(j, "detect_multiple", c.detect_multiple);
}

void to_json(json& j, const PostProcessorConfig& c) {
    j = json::object();
    j["enabled"] = c.enabled;
    write(j, "enabled_processors", c.enabled_processors);
    write(j, "disabled_processors", c.disabled_processors);
}

void from_json(const json& j, PostProcessorConfig& c) {
    requireObject(j);
    read(j, "enabled", c.enabled);
    read(j, "enabled_processors", c.enabled_processors);
    read(j, "disabled_processors", c.disabled_processors);
}

void to_json(json& j, const KeywordConfig& c) {
    j = json::object();
    j["algorithm"] = toString(c.algorithm);
    j["max_keywords"] = c.max_keywords;
    j["min_score"] = c.min_score;
    j["ngram_range"] = json::array({c.ngram_min, c.ngram_max});
    write(j, "language", c.language);
    if (c.yake_params)
        j["yake_params"] = {{"window_size", c.yake_params->window_size}};
    if (c.rake_params)
        j["rake_params"] = {{"min_word_length", c.rake_params->min_word_length},
                            {"max_words_per_phrase", c.rake_params->max_words_per_phrase}};
}

void from_json(const json& j, KeywordConfig& c) {
    requireObject(j);
    readEnum(j, "algorithm", c.algorithm, parseKeywordAlgorithm);
    read(j, "max_keywords", c.max_keywords);
    read(j, "min_score", c.min_score);
    if (auto it = j.find("ngram_range"); it != j.end() && !it->is_null()) {
        if (!it->is_array() || it->size() != 2 || !(*it)[0].is_number_integer() ||
            !(*it)[1].is_number_integer())
            throw FieldError("ngram_range", "expected an array of two integers");
        try {
            c.ngram_min = getChecked<std::int32_t>((*it)[0]);
            c.ngram_max = getChecked<std::int32_t>((*it)[1]);
        } catch (const FieldError& e) {
            throw FieldError("ngram_range", e.reason());
        }
    }
    read(j, "language", c.language);
    if (auto it = j.find("yake_params"); it != j.end() && !it->is_null()) {
        YakeParams p = c.yake_params.value_or(YakeParams{});
        read(*it, "window_size", p.window_size);
        c.yake_params = p;
    }
    if (auto it = j.find("rake_params"); it != j.end() && !it->is_null()) {
        RakeParams p = c.rake_params.value_or(RakeParams{});
        read(*it, "min_word_length", p.min_word_length);
        read(*it, "max_words_per_phrase", p.max_words_per_phrase);
        c.rake_params = p;
    }
}

void to_json(json& j, const HtmlConversionOptions& o) {
    j = json::object();
    j["heading_style"] = toString(o.heading_style);
    j["code_block_style"] = toString(o.code_block_style);
    j["highlight_style"] = toString(o.highlight_style);
    j["list_indent_type"] = toString(o.list_indent_type);
    j["list_indent_width"] = o.list_indent_width;
    j["whitespace_mode"] = toString(o.whitespace_mode);
    j["newline_style"] = toString(o.newline_style);
    j["preprocessing"] = toString(o.preprocessing);
}

void from_json(const json& j, HtmlConversionOptions& o) {
    requireObject(j);
    readEnum(j, "heading_style", o.heading_style, parseHeadingStyle);
    readEnum(j, "code_block_style", o.code_block_style, parseCodeBlockStyle);
    readEnum(j, "highlight_style", o.highlight_style, parseHighlightStyle);
    readEnum(j, "list_indent_type", o.list_indent_type, parseListIndentType);
    read(j, "list_indent_width", o.list_indent_width);
    readEnum(j, "whitespace_mode", o.whitespace_mode, parseWhitespaceMode);
    readEnum(j, "newline_style", o.newline_style, parseNewlineStyle);
    readEnum(j, "preprocessing", o.preprocessing, parsePreprocessingPreset);
}

void to_json(json& j, const ExtractionConfig& c) {
    j = json::object();
    j["use_cache"] = c.use_cache;
    j["enable_quality_processing"] = c.enable_quality_processing;
    j["force_ocr"] = c.force_ocr;
    j["include_document_structure"] = c.include_document_structure;
    j["output_format"] = toString(c.output_format);
    write(j, "max_concurrent_extractions", c.max_concurrent_extractions);
    write(j, "ocr", c.ocr);
    write(j, "pdf_options", c.pdf_options);
    write(j, "chunking", c.chunking);
    write(j, "images", c.images);
    write(j, "pages", c.pages);
    write(j, "token_reduction", c.token_reduction);
    write(j, "language_detection", c.language_detection);
    write(j, "postprocessor", c.postprocessor);
    write(j, "keywords", c.keywords);
    write(j, "html_options", c.html_options);
}

void from_json(const json& j, ExtractionConfig& c) {
    requireObject(j);
    read(j, "use_cache", c.use_cache);
    read(j, "enable_quality_processing", c.enable_quality_processing);
    read(j, "force_ocr", c.force_ocr);
    read(j, "include_document_structure", c.include_document_structure);
    readEnum(j, "output_format", c.output_format, parseOutputFormat);
    read(j, "max_concurrent_extractions", c.max_concurrent_extractions);
    read(j, "ocr", c.ocr);
    read(j, "pdf_options", c.pdf_options);
    read(j, "chunking", c.chunking);
    read(j, "images", c.images);
    read(j, "pages", c.pages);
    read(j, "token_reduction", c.token_reduction);
    read(j, "language_detection", c.language_detection);
    read(j, "postprocessor", c.postprocessor);
    read(j, "keywords", c.keywords);
    read(j, "html_options", c.html_options);
}

Result<ExtractionConfig> configFromJson(const json& j) {
    ExtractionConfig config;
    try {
        from_json(j, config);
    } catch (const FieldError& e) {
        std::string field = e.path().empty() ? "config" : e.path();
        spdlog::debug("Rejected config field {}: {}", field, e.reason());
        return Error{ErrorCode::ValidationError, field + ": " + e.reason()};
    } catch (const json::exception& e) {
        return Error{ErrorCode::ValidationError, std::string("config: ") + e.what()};
    }
    return config;
}

} // namespace kreuzberg::config
