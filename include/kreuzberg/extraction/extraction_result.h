#pragma once

#include <kreuzberg/core/types.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kreuzberg::extraction {

struct Table {
    std::vector<std::vector<std::string>> cells;
    std::string markdown;
    std::size_t page_number = 1;

    bool operator==(const Table&) const = default;
};

/**
 * @brief Position of a chunk inside the extracted content
 *
 * Byte offsets index the UTF-8 content; char offsets count code points.
 */
struct ChunkMetadata {
    std::size_t byte_start = 0;
    std::size_t byte_end = 0;
    std::size_t char_start = 0;
    std::size_t char_end = 0;
    std::optional<std::size_t> token_count;
    std::size_t chunk_index = 0;
    std::size_t total_chunks = 0;
    std::optional<std::size_t> first_page;
    std::optional<std::size_t> last_page;

    bool operator==(const ChunkMetadata&) const = default;
};

struct Chunk {
    std::string content;
    std::optional<std::vector<float>> embedding;
    ChunkMetadata metadata;

    bool operator==(const Chunk&) const = default;
};

struct ExtractionResult;

struct ExtractedImage {
    ByteVector data;
    std::string format;
    std::size_t image_index = 0;
    std::optional<std::size_t> page_number;
    std::optional<std::uint32_t> width;
    std::optional<std::uint32_t> height;
    std::optional<std::string> colorspace;
    std::optional<std::uint32_t> bits_per_component;
    bool is_mask = false;
    std::optional<std::string> description;
    std::shared_ptr<ExtractionResult> ocr_result; ///< Set when OCR ran over the image
};

struct PageContent {
    std::size_t page_number = 1;
    std::string content;
    std::vector<Table> tables;

    bool operator==(const PageContent&) const = default;
};

/**
 * @brief Byte range of one page inside the joined content
 */
struct PageBoundary {
    std::size_t byte_start = 0;
    std::size_t byte_end = 0;
    std::size_t page_number = 1;

    bool operator==(const PageBoundary&) const = default;
};

struct PageStructure {
    std::size_t total_count = 0;
    std::string unit_type = "page";
    std::vector<PageBoundary> boundaries;

    bool operator==(const PageStructure&) const = default;
};

struct Keyword {
    std::string text;
    double score = 0.0;
    std::string algorithm;

    bool operator==(const Keyword&) const = default;
};

struct ProcessingWarning {
    std::string source;
    std::string message;

    bool operator==(const ProcessingWarning&) const = default;
};

/**
 * @brief One block of the document structure tree
 *
 * node_type is one of heading, paragraph, list, list_item, code_block,
 * block_quote or table. Headings carry their level; sections nest under the
 * heading that opens them.
 */
struct DocumentNode {
    std::string node_type;
    std::string content;
    std::optional<std::int32_t> level;
    std::vector<DocumentNode> children;

    bool operator==(const DocumentNode&) const = default;
};

struct DocumentStructure {
    std::vector<DocumentNode> nodes;

    bool operator==(const DocumentStructure&) const = default;
};

/**
 * @brief Everything an extraction produced
 *
 * metadata is a JSON object and always carries "format_type".
 */
struct ExtractionResult {
    std::string content;
    std::string mime_type;
    nlohmann::json metadata = nlohmann::json::object();
    std::vector<Table> tables;
    std::optional<std::vector<std::string>> detected_languages;
    std::optional<std::vector<Chunk>> chunks;
    std::optional<std::vector<ExtractedImage>> images;
    std::optional<std::vector<PageContent>> pages;
    std::optional<std::vector<Keyword>> keywords;
    std::optional<double> quality_score;
    std::vector<ProcessingWarning> processing_warnings;
    std::optional<DocumentStructure> document;
    std::optional<PageStructure> page_structure;

    void addWarning(std::string source, std::string message) {
        processing_warnings.push_back({std::move(source), std::move(message)});
    }

    /**
     * @brief Metadata string value, empty when absent or not a string
     */
    std::string metadataString(const std::string& key) const;
};

void to_json(nlohmann::json& j, const Table& t);
void from_json(const nlohmann::json& j, Table& t);
void to_json(nlohmann::json& j, const ChunkMetadata& m);
void from_json(const nlohmann::json& j, ChunkMetadata& m);
void to_json(nlohmann::json& j, const Chunk& c);
void from_json(const nlohmann::json& j, Chunk& c);
void to_json(nlohmann::json& j, const ExtractedImage& i);
void from_json(const nlohmann::json& j, ExtractedImage& i);
void to_json(nlohmann::json& j, const PageContent& p);
void from_json(const nlohmann::json& j, PageContent& p);
void to_json(nlohmann::json& j, const PageBoundary& b);
void from_json(const nlohmann::json& j, PageBoundary& b);
void to_json(nlohmann::json& j, const PageStructure& s);
void from_json(const nlohmann::json& j, PageStructure& s);
void to_json(nlohmann::json& j, const Keyword& k);
void from_json(const nlohmann::json& j, Keyword& k);
void to_json(nlohmann::json& j, const ProcessingWarning& w);
void from_json(const nlohmann::json& j, ProcessingWarning& w);
void to_json(nlohmann::json& j, const DocumentNode& n);
void from_json(const nlohmann::json& j, DocumentNode& n);
void to_json(nlohmann::json& j, const DocumentStructure& d);
void from_json(const nlohmann::json& j, DocumentStructure& d);
void to_json(nlohmann::json& j, const ExtractionResult& r);

/**
 * @brief Overwrite the fields present in @p patch
 *
 * Keys that are absent leave the result untouched; null clears optional
 * fields. Used for plugin replies, which may return partial results.
 * @return ParsingError naming the offending key when a value has the wrong shape
 */
Result<void> applyResultPatch(ExtractionResult& result, const nlohmann::json& patch);

/**
 * @brief Decode a complete result; "content" is required
 */
Result<ExtractionResult> resultFromJson(const nlohmann::json& j);

} // namespace kreuzberg::extraction
