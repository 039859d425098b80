#pragma once

#include <kreuzberg/config/html_options.h>
#include <kreuzberg/extraction/text_extractor.h>

#include <map>
#include <string>
#include <vector>

namespace kreuzberg::extraction {

/**
 * @brief HTML extractor producing plain text or Markdown
 *
 * Plain output mirrors a browser "reader mode": scripts, styles and comments
 * are dropped, block tags become line breaks and entities are decoded.
 * Markdown and Djot output go through HtmlToMarkdown. Tables are always
 * collected into the result regardless of the output format.
 */
class HtmlTextExtractor : public ITextExtractor {
public:
    HtmlTextExtractor() = default;
    ~HtmlTextExtractor() override = default;

    std::string name() const override { return "HtmlTextExtractor"; }

    Result<ExtractionResult> extractFromBuffer(ByteSpan data, std::string_view mimeType,
                                               const config::ExtractionConfig& config) override;

    std::vector<std::string> supportedMimeTypes() const override { return mimeTypes(); }

    static std::vector<std::string> mimeTypes() { return {"text/html", "application/xhtml+xml"}; }

    /**
     * @brief Extract text from HTML string
     */
    static std::string extractTextFromHtml(const std::string& html);

    /**
     * @brief Remove script, style blocks and comments
     */
    static std::string removeScriptAndStyle(const std::string& html);

    /**
     * @brief Decode named and numeric HTML entities
     */
    static std::string decodeHtmlEntities(const std::string& text);

    /**
     * @brief Extract title from HTML
     */
    static std::string extractTitle(const std::string& html);

    /**
     * @brief Content of <meta name=...> or <meta property=...>, empty when absent
     */
    static std::string extractMetaContent(const std::string& html, const std::string& name);

private:
    static std::string convertBlockTagsToNewlines(const std::string& html);

    static std::string stripHtmlTags(const std::string& html);

    static std::string cleanWhitespace(const std::string& text);

    static void extractMetadata(const std::string& html, ExtractionResult& result);
};

/**
 * @brief Streaming HTML to Markdown (or Djot) renderer
 */
class HtmlToMarkdown {
public:
    explicit HtmlToMarkdown(config::HtmlConversionOptions options = {}, bool djot = false)
        : options_(options), djot_(djot) {}

    /**
     * @brief Render @p html; tables found on the way are appended to @p tables when non-null
     */
    std::string convert(const std::string& html, std::vector<Table>* tables = nullptr) const;

private:
    config::HtmlConversionOptions options_;
    bool djot_;
};

/**
 * @brief Token of the lenient HTML tokenizer shared by the extractor and renderer
 */
struct HtmlToken {
    enum class Kind { Text, StartTag, EndTag };
    Kind kind = Kind::Text;
    std::string name; ///< Lowercase tag name for tags
    std::string text; ///< Raw text for Text tokens
    std::map<std::string, std::string> attributes;
    bool selfClosing = false;
};

std::vector<HtmlToken> tokenizeHtml(const std::string& html);

} // namespace kreuzberg::extraction
