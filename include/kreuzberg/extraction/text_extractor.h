#pragma once

#include <kreuzberg/config/extraction_config.h>
#include <kreuzberg/core/types.h>
#include <kreuzberg/extraction/extraction_result.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kreuzberg::extraction {

/**
 * @brief Base interface for the built-in text extractors
 *
 * Built-in extractors only handle formats that need no external parser
 * (the plain text family and HTML). Everything else is served by plugins.
 */
class ITextExtractor {
public:
    virtual ~ITextExtractor() = default;

    /**
     * @brief Extract text from a memory buffer
     * @param data Raw document bytes
     * @param mimeType Resolved MIME type of @p data
     * @param config Extraction configuration
     * @return Extraction result, ParsingError when the bytes cannot be decoded
     */
    virtual Result<ExtractionResult> extractFromBuffer(ByteSpan data, std::string_view mimeType,
                                                       const config::ExtractionConfig& config) = 0;

    /**
     * @brief MIME types this extractor accepts
     */
    virtual std::vector<std::string> supportedMimeTypes() const = 0;

    virtual std::string name() const = 0;

    virtual bool canExtract(std::string_view mimeType) const;
};

/**
 * @brief Factory for built-in extractors keyed by MIME type
 */
class TextExtractorFactory {
public:
    using ExtractorCreator = std::function<std::unique_ptr<ITextExtractor>()>;

    static TextExtractorFactory& instance();

    /**
     * @brief Create an extractor for a MIME type
     * @return Extractor instance or nullptr if no built-in extractor handles it
     */
    std::unique_ptr<ITextExtractor> create(std::string_view mimeType) const;

    void registerExtractor(const std::vector<std::string>& mimeTypes, ExtractorCreator creator);

    /**
     * @brief All registered MIME types, sorted
     */
    std::vector<std::string> supportedMimeTypes() const;

    bool isSupported(std::string_view mimeType) const;

private:
    TextExtractorFactory();

    std::unordered_map<std::string, ExtractorCreator> extractors_;
    mutable std::mutex mutex_;
};

/**
 * @brief Encoding detection utilities
 */
class EncodingDetector {
public:
    /**
     * @brief Detect text encoding from a buffer
     * @param data Data buffer to analyze
     * @param confidence Confidence level (0.0-1.0)
     * @return Detected encoding name ("UTF-8", "UTF-16LE", "UTF-16BE" or "ISO-8859-1")
     */
    static std::string detectEncoding(ByteSpan data, double* confidence = nullptr);

    /**
     * @brief Convert text from one encoding to UTF-8
     * @return InvalidArgument for an encoding this converter does not know
     */
    static Result<std::string> convertToUtf8(std::string_view text,
                                             const std::string& fromEncoding);

    /**
     * @brief Decode arbitrary bytes into UTF-8 text
     *
     * A UTF-8 byte order mark is stripped. Bytes that are neither UTF-8 nor
     * UTF-16 with a BOM are read as ISO-8859-1 unless they look binary, in
     * which case ParsingError is returned.
     * @param encodingOut Receives the detected encoding name when non-null
     */
    static Result<std::string> decodeToUtf8(ByteSpan data, std::string* encodingOut = nullptr);
};

/**
 * @brief Append the UTF-8 encoding of a code point
 */
void appendUtf8FromCodepoint(std::uint32_t cp, std::string& out);

/**
 * @brief A detected language with its stop-word confidence
 */
struct LanguageScore {
    std::string code; ///< ISO 639-3 code (e.g., "eng", "deu")
    double confidence = 0.0;
};

/**
 * @brief Stop-word based language detection
 */
class LanguageDetector {
public:
    /**
     * @brief Most likely language of @p text
     * @param confidence Confidence level (0.0-1.0)
     * @return ISO 639-3 code, "eng" when nothing scores
     */
    static std::string detectLanguage(std::string_view text, double* confidence = nullptr);

    /**
     * @brief Every language whose confidence reaches @p minConfidence, best first
     *
     * Without @p detectMultiple only the best language is considered.
     */
    static std::vector<LanguageScore> detectLanguages(std::string_view text, double minConfidence,
                                                      bool detectMultiple);
};

} // namespace kreuzberg::extraction
