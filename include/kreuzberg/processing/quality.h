#pragma once

#include <kreuzberg/extraction/extraction_result.h>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace kreuzberg::processing {

/**
 * @brief Heuristic text quality in [0, 1]
 *
 * Penalises OCR debris (isolated characters, replacement characters,
 * control bytes), symbol-heavy text, script residue and broken whitespace.
 * Well formed sentences and a known title raise the score slightly.
 */
double calculateQualityScore(std::string_view text, const nlohmann::json& metadata = {});

/**
 * @brief Remove control characters and trailing spaces, collapse blank-line runs
 */
std::string cleanExtractedText(std::string_view text);

/**
 * @brief Store the quality score of the result content
 *
 * Content is left untouched; cleanExtractedText runs before chunking so that
 * chunk offsets stay valid.
 */
void applyQualityProcessing(extraction::ExtractionResult& result);

} // namespace kreuzberg::processing
