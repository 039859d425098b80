#include <kreuzberg/config/extraction_config.h>
#include <kreuzberg/config/validation.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

namespace kreuzberg::config {

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

Result<void> validateRange(double value, double lo, double hi, const std::string& field) {
    if (std::isnan(value) || value < lo || value > hi) {
        return Error{ErrorCode::ValidationError,
                     field + ": must be between " + std::to_string(lo) + " and " +
                         std::to_string(hi) + " (got " + std::to_string(value) + ")"};
    }
    return {};
}

Result<void> validatePreprocessing(const ImagePreprocessingConfig& cfg, const std::string& path) {
    if (auto r = validateDpi(cfg.target_dpi, path + ".target_dpi"); !r)
        return r;
    return validateBinarizationMethod(cfg.binarization_method, path + ".binarization_method");
}

Result<void> validateTesseract(const TesseractConfig& cfg, const std::string& path) {
    if (auto r = validateLanguageCode(cfg.language, path + ".language"); !r)
        return r;
    if (auto r = validateTesseractPsm(cfg.psm, path + ".psm"); !r)
        return r;
    if (auto r = validateTesseractOem(cfg.oem, path + ".oem"); !r)
        return r;
    if (auto r = validateTesseractOutputFormat(cfg.output_format, path + ".output_format"); !r)
        return r;
    if (auto r = validateRange(cfg.min_confidence, 0.0, 100.0, path + ".min_confidence"); !r)
        return r;
    if (auto r = validateConfidence(cfg.table_min_confidence, path + ".table_min_confidence"); !r)
        return r;
    if (auto r = validatePositive(cfg.table_column_threshold, path + ".table_column_threshold");
        !r)
        return r;
    if (auto r = validateConfidence(cfg.table_row_threshold_ratio,
                                    path + ".table_row_threshold_ratio");
        !r)
        return r;
    if (cfg.preprocessing)
        return validatePreprocessing(*cfg.preprocessing, path + ".preprocessing");
    return {};
}

Result<void> validateOcr(const OcrConfig& cfg) {
    if (cfg.backend.empty())
        return Error{ErrorCode::ValidationError, "ocr.backend: must not be empty"};
    if (auto r = validateLanguageCode(cfg.language, "ocr.language"); !r)
        return r;
    if (cfg.tesseract_config)
        return validateTesseract(*cfg.tesseract_config, "ocr.tesseract_config");
    return {};
}

Result<void> validatePdf(const PdfConfig& cfg) {
    if (!cfg.hierarchy)
        return {};
    const auto& h = *cfg.hierarchy;
    if (h.k_clusters < 1 || h.k_clusters > 7) {
        return Error{ErrorCode::ValidationError,
                     "pdf_options.hierarchy.k_clusters: must be between 1 and 7 (got " +
                         std::to_string(h.k_clusters) + ")"};
    }
    if (h.ocr_coverage_threshold)
        return validateConfidence(*h.ocr_coverage_threshold,
                                  "pdf_options.hierarchy.ocr_coverage_threshold");
    return {};
}

Result<void> validateChunking(const ChunkingConfig& cfg) {
    if (auto r = validateChunkingParams(cfg.max_chars, cfg.max_overlap, "chunking"); !r)
        return r;
    if (cfg.preset && cfg.preset->empty())
        return Error{ErrorCode::ValidationError, "chunking.preset: must not be empty"};
    if (cfg.embedding) {
        const auto& e = *cfg.embedding;
        if (auto r = validatePositive(e.batch_size, "chunking.embedding.batch_size"); !r)
            return r;
        if (e.model.name.empty())
            return Error{ErrorCode::ValidationError,
                         "chunking.embedding.model: model name must not be empty"};
        if (e.model.dimensions)
            return validatePositive(*e.model.dimensions, "chunking.embedding.model.dimensions");
    }
    return {};
}

Result<void> validateImages(const ImageExtractionConfig& cfg) {
    if (auto r = validateDpi(cfg.target_dpi, "images.target_dpi"); !r)
        return r;
    if (auto r = validateDpi(cfg.min_dpi, "images.min_dpi"); !r)
        return r;
    if (auto r = validateDpi(cfg.max_dpi, "images.max_dpi"); !r)
        return r;
    if (cfg.min_dpi > cfg.max_dpi) {
        return Error{ErrorCode::ValidationError,
                     "images.min_dpi: must be less than or equal to max_dpi (got " +
                         std::to_string(cfg.min_dpi) + " > " + std::to_string(cfg.max_dpi) +
                         ")"};
    }
    return validatePositive(cfg.max_image_dimension, "images.max_image_dimension");
}

Result<void> validatePages(const PageConfig& cfg) {
    if (cfg.insert_page_markers && cfg.marker_format.empty())
        return Error{ErrorCode::ValidationError,
                     "pages.marker_format: must not be empty when insert_page_markers is set"};
    return {};
}

Result<void> validateKeywords(const KeywordConfig& cfg) {
    if (auto r = validatePositive(cfg.max_keywords, "keywords.max_keywords"); !r)
        return r;
    if (auto r = validateConfidence(cfg.min_score, "keywords.min_score"); !r)
        return r;
    if (cfg.ngram_min < 1 || cfg.ngram_min > cfg.ngram_max) {
        return Error{ErrorCode::ValidationError,
                     "keywords.ngram_range: must satisfy 1 <= min <= max (got [" +
                         std::to_string(cfg.ngram_min) + ", " + std::to_string(cfg.ngram_max) +
                         "])"};
    }
    if (cfg.yake_params) {
        if (auto r = validatePositive(cfg.yake_params->window_size,
                                      "keywords.yake_params.window_size");
            !r)
            return r;
    }
    if (cfg.rake_params) {
        if (auto r = validatePositive(cfg.rake_params->min_word_length,
                                      "keywords.rake_params.min_word_length");
            !r)
            return r;
        if (auto r = validatePositive(cfg.rake_params->max_words_per_phrase,
                                      "keywords.rake_params.max_words_per_phrase");
            !r)
            return r;
    }
    return {};
}

Result<void> validateHtml(const HtmlConversionOptions& opts) {
    if (opts.list_indent_width < 1 || opts.list_indent_width > 16) {
        return Error{ErrorCode::ValidationError,
                     "html_options.list_indent_width: must be between 1 and 16 (got " +
                         std::to_string(opts.list_indent_width) + ")"};
    }
    return {};
}

} // namespace

Result<void> ExtractionConfig::validate() const {
    if (max_concurrent_extractions && *max_concurrent_extractions == 0)
        return Error{ErrorCode::ValidationError,
                     "max_concurrent_extractions: must be greater than 0 (got 0)"};
    if (ocr) {
        if (auto r = validateOcr(*ocr); !r)
            return r;
    }
    if (pdf_options) {
        if (auto r = validatePdf(*pdf_options); !r)
            return r;
    }
    if (chunking) {
        if (auto r = validateChunking(*chunking); !r)
            return r;
    }
    if (images) {
        if (auto r = validateImages(*images); !r)
            return r;
    }
    if (pages) {
        if (auto r = validatePages(*pages); !r)
            return r;
    }
    if (language_detection) {
        if (auto r = validateConfidence(language_detection->min_confidence,
                                        "language_detection.min_confidence");
            !r)
            return r;
    }
    if (keywords) {
        if (auto r = validateKeywords(*keywords); !r)
            return r;
    }
    if (html_options) {
        if (auto r = validateHtml(*html_options); !r)
            return r;
    }
    return {};
}

const char* toString(TokenReductionMode mode) {
    switch (mode) {
        case TokenReductionMode::Off: return "off";
        case TokenReductionMode::Light: return "light";
        case TokenReductionMode::Moderate: return "moderate";
        case TokenReductionMode::Aggressive: return "aggressive";
        case TokenReductionMode::Maximum: return "maximum";
    }
    return "off";
}

std::optional<TokenReductionMode> parseTokenReductionMode(std::string_view s) {
    const auto v = lower(s);
    if (v == "off" || v == "none")
        return TokenReductionMode::Off;
    if (v == "light")
        return TokenReductionMode::Light;
    if (v == "moderate")
        return TokenReductionMode::Moderate;
    if (v == "aggressive")
        return TokenReductionMode::Aggressive;
    if (v == "maximum")
        return TokenReductionMode::Maximum;
    return std::nullopt;
}

const char* toString(KeywordAlgorithm algorithm) {
    return algorithm == KeywordAlgorithm::Rake ? "rake" : "yake";
}

std::optional<KeywordAlgorithm> parseKeywordAlgorithm(std::string_view s) {
    const auto v = lower(s);
    if (v == "yake")
        return KeywordAlgorithm::Yake;
    if (v == "rake")
        return KeywordAlgorithm::Rake;
    return std::nullopt;
}

const char* toString(OutputFormat format) {
    switch (format) {
        case OutputFormat::Plain: return "plain";
        case OutputFormat::Markdown: return "markdown";
        case OutputFormat::Djot: return "djot";
        case OutputFormat::Html: return "html";
    }
    return "plain";
}

std::optional<OutputFormat> parseOutputFormat(std::string_view s) {
    const auto v = lower(s);
    if (v == "plain" || v == "text")
        return OutputFormat::Plain;
    if (v == "markdown" || v == "md")
        return OutputFormat::Markdown;
    if (v == "djot")
        return OutputFormat::Djot;
    if (v == "html")
        return OutputFormat::Html;
    return std::nullopt;
}

const char* toString(EmbeddingModelType type) {
    switch (type) {
        case EmbeddingModelType::Preset: return "preset";
        case EmbeddingModelType::FastEmbed: return "fastembed";
        case EmbeddingModelType::Custom: return "custom";
    }
    return "preset";
}

std::optional<EmbeddingModelType> parseEmbeddingModelType(std::string_view s) {
    const auto v = lower(s);
    if (v == "preset")
        return EmbeddingModelType::Preset;
    if (v == "fastembed")
        return EmbeddingModelType::FastEmbed;
    if (v == "custom")
        return EmbeddingModelType::Custom;
    return std::nullopt;
}

} // namespace kreuzberg::config
