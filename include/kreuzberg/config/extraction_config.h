#pragma once

#include <kreuzberg/config/html_options.h>
#include <kreuzberg/core/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kreuzberg::config {

/**
 * @brief Image preprocessing applied before OCR
 */
struct ImagePreprocessingConfig {
    std::int32_t target_dpi = 300;
    bool auto_rotate = true;
    bool deskew = true;
    bool denoise = false;
    bool contrast_enhance = false;
    std::string binarization_method = "otsu";
    bool invert_colors = false;

    bool operator==(const ImagePreprocessingConfig&) const = default;
};

/**
 * @brief Tesseract tuning parameters forwarded verbatim to the OCR backend
 */
struct TesseractConfig {
    std::string language = "eng";
    std::int32_t psm = 3;
    std::int32_t oem = 3;
    std::string output_format = "markdown";
    double min_confidence = 0.0;
    std::optional<ImagePreprocessingConfig> preprocessing;
    bool enable_table_detection = true;
    double table_min_confidence = 0.0;
    std::int32_t table_column_threshold = 50;
    double table_row_threshold_ratio = 0.5;
    bool use_cache = true;
    bool classify_use_pre_adapted_templates = true;
    bool language_model_ngram_on = false;
    bool tessedit_dont_blkrej_good_wds = true;
    bool tessedit_dont_rowrej_good_wds = true;
    bool tessedit_enable_dict_correction = true;
    std::string tessedit_char_whitelist;
    std::string tessedit_char_blacklist;
    bool tessedit_use_primary_params_model = true;
    bool textord_space_size_is_variable = true;
    bool thresholding_method = false;

    bool operator==(const TesseractConfig&) const = default;
};

struct OcrConfig {
    std::string backend = "tesseract";
    std::string language = "eng";
    std::optional<TesseractConfig> tesseract_config;

    bool operator==(const OcrConfig&) const = default;
};

struct HierarchyConfig {
    bool enabled = true;
    std::int32_t k_clusters = 6;
    bool include_bbox = true;
    std::optional<double> ocr_coverage_threshold;

    bool operator==(const HierarchyConfig&) const = default;
};

struct PdfConfig {
    bool extract_images = false;
    std::optional<std::vector<std::string>> passwords;
    bool extract_metadata = true;
    std::optional<HierarchyConfig> hierarchy;

    bool operator==(const PdfConfig&) const = default;
};

enum class EmbeddingModelType { Preset, FastEmbed, Custom };

/**
 * @brief Embedding model selector (tagged by "type" in JSON)
 */
struct EmbeddingModel {
    EmbeddingModelType type = EmbeddingModelType::Preset;
    std::string name = "balanced"; ///< preset name, fastembed model or custom model id
    std::optional<std::int32_t> dimensions;

    bool operator==(const EmbeddingModel&) const = default;
};

struct EmbeddingConfig {
    EmbeddingModel model;
    bool normalize = true;
    std::int32_t batch_size = 32;
    bool show_download_progress = false;
    std::optional<std::string> cache_dir;

    bool operator==(const EmbeddingConfig&) const = default;
};

struct ChunkingConfig {
    std::int64_t max_chars = 1000;
    std::int64_t max_overlap = 200;
    std::optional<std::string> preset;
    std::optional<EmbeddingConfig> embedding;

    bool operator==(const ChunkingConfig&) const = default;
};

struct ImageExtractionConfig {
    bool extract_images = true;
    std::int32_t target_dpi = 300;
    std::int32_t max_image_dimension = 4096;
    bool auto_adjust_dpi = true;
    std::int32_t min_dpi = 72;
    std::int32_t max_dpi = 600;

    bool operator==(const ImageExtractionConfig&) const = default;
};

inline constexpr const char* kDefaultPageMarkerFormat = "\n\n<!-- PAGE {page_num} -->\n\n";

struct PageConfig {
    bool extract_pages = false;
    bool insert_page_markers = false;
    std::string marker_format = kDefaultPageMarkerFormat;

    bool operator==(const PageConfig&) const = default;
};

enum class TokenReductionMode { Off, Light, Moderate, Aggressive, Maximum };

struct TokenReductionConfig {
    TokenReductionMode mode = TokenReductionMode::Off;
    bool preserve_important_words = true;

    bool operator==(const TokenReductionConfig&) const = default;
};

struct LanguageDetectionConfig {
    bool enabled = true;
    double min_confidence = 0.8;
    bool detect_multiple = false;

    bool operator==(const LanguageDetectionConfig&) const = default;
};

struct PostProcessorConfig {
    bool enabled = true;
    std::optional<std::vector<std::string>> enabled_processors;
    std::optional<std::vector<std::string>> disabled_processors;

    bool operator==(const PostProcessorConfig&) const = default;
};

enum class KeywordAlgorithm { Yake, Rake };

struct YakeParams {
    std::int32_t window_size = 2;

    bool operator==(const YakeParams&) const = default;
};

struct RakeParams {
    std::int32_t min_word_length = 1;
    std::int32_t max_words_per_phrase = 3;

    bool operator==(const RakeParams&) const = default;
};

struct KeywordConfig {
    KeywordAlgorithm algorithm = KeywordAlgorithm::Yake;
    std::int32_t max_keywords = 10;
    double min_score = 0.0;
    std::int32_t ngram_min = 1;
    std::int32_t ngram_max = 3;
    std::optional<std::string> language = std::string("en");
    std::optional<YakeParams> yake_params;
    std::optional<RakeParams> rake_params;

    bool operator==(const KeywordConfig&) const = default;
};

enum class OutputFormat { Plain, Markdown, Djot, Html };

/**
 * @brief Immutable snapshot of all extraction options
 *
 * Every nested section is optional: an absent section means "use the engine
 * default", never "disabled". Sections carrying their own `enabled` flag are
 * the only way to switch a stage off.
 */
struct ExtractionConfig {
    bool use_cache = true;
    bool enable_quality_processing = true;
    bool force_ocr = false;
    bool include_document_structure = false;
    OutputFormat output_format = OutputFormat::Plain;
    std::optional<std::uint32_t> max_concurrent_extractions;

    std::optional<OcrConfig> ocr;
    std::optional<PdfConfig> pdf_options;
    std::optional<ChunkingConfig> chunking;
    std::optional<ImageExtractionConfig> images;
    std::optional<PageConfig> pages;
    std::optional<TokenReductionConfig> token_reduction;
    std::optional<LanguageDetectionConfig> language_detection;
    std::optional<PostProcessorConfig> postprocessor;
    std::optional<KeywordConfig> keywords;
    std::optional<HtmlConversionOptions> html_options;

    bool operator==(const ExtractionConfig&) const = default;

    /**
     * @brief Validate every present section
     * @return First violation, naming the field path and the constraint
     */
    Result<void> validate() const;
};

// Enum <-> canonical string helpers. Parsing is case-insensitive.
const char* toString(TokenReductionMode mode);
std::optional<TokenReductionMode> parseTokenReductionMode(std::string_view s);

const char* toString(KeywordAlgorithm algorithm);
std::optional<KeywordAlgorithm> parseKeywordAlgorithm(std::string_view s);

const char* toString(OutputFormat format);
std::optional<OutputFormat> parseOutputFormat(std::string_view s);

const char* toString(EmbeddingModelType type);
std::optional<EmbeddingModelType> parseEmbeddingModelType(std::string_view s);

} // namespace kreuzberg::config
