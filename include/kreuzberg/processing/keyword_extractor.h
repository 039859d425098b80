#pragma once

#include <kreuzberg/config/extraction_config.h>
#include <kreuzberg/extraction/extraction_result.h>

#include <string_view>
#include <vector>

namespace kreuzberg::processing {

/**
 * @brief Unsupervised keyword extraction
 *
 * Scores are normalised to (0, 1], higher meaning more relevant, so that
 * KeywordConfig::min_score means the same for both algorithms. Results are
 * ordered by descending score and capped at max_keywords.
 */
class KeywordExtractor {
public:
    explicit KeywordExtractor(config::KeywordConfig config = {});

    std::vector<extraction::Keyword> extract(std::string_view text) const;

private:
    std::vector<extraction::Keyword> extractYake(std::string_view text) const;
    std::vector<extraction::Keyword> extractRake(std::string_view text) const;

    std::vector<extraction::Keyword> finalize(std::vector<extraction::Keyword> keywords) const;

    config::KeywordConfig config_;
};

} // namespace kreuzberg::processing
