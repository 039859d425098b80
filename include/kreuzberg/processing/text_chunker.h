#pragma once

#include <kreuzberg/config/extraction_config.h>
#include <kreuzberg/core/types.h>
#include <kreuzberg/extraction/extraction_result.h>

#include <string>
#include <string_view>
#include <vector>

namespace kreuzberg::processing {

/**
 * Splitting strategies for extracted content
 */
enum class ChunkerType {
    Text,    // Paragraph, line, sentence, then word boundaries
    Markdown // Prefers breaking before headings and fenced blocks
};

struct TextChunkerConfig {
    std::size_t max_chars = 1000;  // Chunk size in code points
    std::size_t max_overlap = 200; // Overlap between neighbours, in code points
    ChunkerType type = ChunkerType::Text;
};

/**
 * @brief Recursive boundary-aware text splitter
 *
 * Chunks never exceed max_chars code points. A window is cut at the strongest
 * separator that keeps the chunk at least half full; without one the cut
 * backs off to the last whitespace, and only a single unbroken word longer
 * than the window is split mid-word (always on a code point boundary).
 */
class TextChunker {
public:
    explicit TextChunker(const TextChunkerConfig& config = {});

    /**
     * @brief Split @p content
     * @param pages Page boundaries of @p content; when given, first_page and
     *        last_page are filled in for every chunk
     * @return ValidationError for a zero size or an overlap not below max_chars
     */
    Result<std::vector<extraction::Chunk>>
    chunkText(std::string_view content,
              const std::vector<extraction::PageBoundary>* pages = nullptr) const;

    const TextChunkerConfig& getConfig() const { return config_; }

    /**
     * @brief Rough token estimate, four bytes per token and at least one
     */
    static std::size_t estimateTokenCount(std::string_view text);

private:
    struct Separator {
        std::string_view text;
        std::size_t keep; // bytes of the separator that stay in the left chunk
    };

    const std::vector<Separator>& separators() const;

    std::size_t findBreak(std::string_view content, const std::vector<std::size_t>& charStarts,
                          std::size_t startChar, std::size_t limitChar) const;

    TextChunkerConfig config_;
};

/**
 * @brief Chunk @p result.content according to @p config
 *
 * A preset name replaces max_chars and max_overlap with the preset geometry.
 * Embedding generation is not available in this build, so a config that asks
 * for embeddings fails with MissingDependency.
 */
Result<void> chunkResult(extraction::ExtractionResult& result, const config::ChunkingConfig& config);

} // namespace kreuzberg::processing
