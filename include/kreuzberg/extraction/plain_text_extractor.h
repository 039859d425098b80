#pragma once

#include <kreuzberg/extraction/text_extractor.h>

namespace kreuzberg::extraction {

/**
 * @brief Extractor for the plain text family
 *
 * Supports:
 * - Plain text and lightweight markup (text/plain, Markdown, reStructuredText, Org, Djot)
 * - Delimited tables (CSV, TSV), surfaced as a table as well as text
 * - Structured text (JSON, YAML, TOML, XML), checked for well-formedness
 */
class PlainTextExtractor : public ITextExtractor {
public:
    PlainTextExtractor() = default;
    ~PlainTextExtractor() override = default;

    Result<ExtractionResult> extractFromBuffer(ByteSpan data, std::string_view mimeType,
                                               const config::ExtractionConfig& config) override;

    std::vector<std::string> supportedMimeTypes() const override { return mimeTypes(); }

    std::string name() const override { return "Plain Text Extractor"; }

    static std::vector<std::string> mimeTypes();

private:
    /**
     * @brief Add counts and format specific metadata
     */
    void processTextByType(ExtractionResult& result, std::string_view format);

    /**
     * @brief Reject malformed structured text
     */
    Result<void> checkStructuredText(const std::string& text, std::string_view format);

    /**
     * @brief Parse CSV or TSV into a table
     */
    void extractDelimitedTable(ExtractionResult& result, char delimiter);

    static void extractMarkdownMetadata(ExtractionResult& result);
};

/**
 * @brief Canonical format name for a text MIME type ("markdown", "csv", "json", ...)
 */
std::string textFormatForMime(std::string_view mimeType);

} // namespace kreuzberg::extraction
