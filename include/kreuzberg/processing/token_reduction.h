#pragma once

#include <kreuzberg/config/extraction_config.h>
#include <kreuzberg/extraction/extraction_result.h>

#include <string>
#include <string_view>

namespace kreuzberg::processing {

/**
 * @brief Shrink text for LLM consumption
 *
 * Levels are cumulative:
 * - light: normalise whitespace, squeeze repeated punctuation, drop HTML comments
 * - moderate: also remove stop words
 * - aggressive: also drop bracketed asides and duplicate sentences
 * - maximum: also drop one-character words that are not digits
 *
 * With preserve_important_words, capitalised words, acronyms, numbers and
 * words containing digits survive stop-word removal.
 */
std::string reduceTokens(std::string_view text, const config::TokenReductionConfig& config,
                         std::string_view language = "eng");

/**
 * @brief Apply reduceTokens to the result content, recording the savings in metadata
 */
void reduceResultTokens(extraction::ExtractionResult& result,
                        const config::TokenReductionConfig& config, std::string_view language);

} // namespace kreuzberg::processing
