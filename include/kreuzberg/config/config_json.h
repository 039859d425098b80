#pragma once

#include <kreuzberg/config/extraction_config.h>

#include <nlohmann/json.hpp>

namespace kreuzberg::config {

// nlohmann::json ADL hooks. Serialisation omits absent optional sections;
// deserialisation only assigns keys that are present and treats null as absent.

void to_json(nlohmann::json& j, const ImagePreprocessingConfig& c);
void from_json(const nlohmann::json& j, ImagePreprocessingConfig& c);

void to_json(nlohmann::json& j, const TesseractConfig& c);
void from_json(const nlohmann::json& j, TesseractConfig& c);

void to_json(nlohmann::json& j, const OcrConfig& c);
void from_json(const nlohmann::json& j, OcrConfig& c);

void to_json(nlohmann::json& j, const HierarchyConfig& c);
void from_json(const nlohmann::json& j, HierarchyConfig& c);

void to_json(nlohmann::json& j, const PdfConfig& c);
void from_json(const nlohmann::json& j, PdfConfig& c);

void to_json(nlohmann::json& j, const EmbeddingModel& m);
void from_json(const nlohmann::json& j, EmbeddingModel& m);

void to_json(nlohmann::json& j, const EmbeddingConfig& c);
void from_json(const nlohmann::json& j, EmbeddingConfig& c);

void to_json(nlohmann::json& j, const ChunkingConfig& c);
void from_json(const nlohmann::json& j, ChunkingConfig& c);

void to_json(nlohmann::json& j, const ImageExtractionConfig& c);
void from_json(const nlohmann::json& j, ImageExtractionConfig& c);

void to_json(nlohmann::json& j, const PageConfig& c);
void from_json(const nlohmann::json& j, PageConfig& c);

void to_json(nlohmann::json& j, const TokenReductionConfig& c);
void from_json(const nlohmann::json& j, TokenReductionConfig& c);

void to_json(nlohmann::json& j, const LanguageDetectionConfig& c);
void from_json(const nlohmann::json& j, LanguageDetectionConfig& c);

void to_json(nlohmann::json& j, const PostProcessorConfig& c);
void from_json(const nlohmann::json& j, PostProcessorConfig& c);

void to_json(nlohmann::json& j, const KeywordConfig& c);
void from_json(const nlohmann::json& j, KeywordConfig& c);

void to_json(nlohmann::json& j, const HtmlConversionOptions& o);
void from_json(const nlohmann::json& j, HtmlConversionOptions& o);

void to_json(nlohmann::json& j, const ExtractionConfig& c);
void from_json(const nlohmann::json& j, ExtractionConfig& c);

/**
 * @brief Decode a JSON tree into a config without throwing
 *
 * Type mismatches and unknown enum names become ErrorCode::ValidationError
 * naming the offending field. The result is not validated; call validate().
 */
Result<ExtractionConfig> configFromJson(const nlohmann::json& j);

} // namespace kreuzberg::config
