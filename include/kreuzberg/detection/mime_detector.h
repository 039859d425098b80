#pragma once

#include <kreuzberg/core/types.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kreuzberg::detection {

inline constexpr const char* kOctetStream = "application/octet-stream";

/**
 * @brief Result of sniffing a buffer or a file
 */
struct MimeSignature {
    std::string mimeType;    ///< MIME type (e.g., "image/jpeg")
    std::string category;    ///< Category (e.g., "image", "document", "text")
    std::string description; ///< Human-readable description
    std::string magicNumber; ///< Hex representation of the leading bytes
    bool isBinary = true;    ///< Whether content is binary or text
    float confidence = 1.0f; ///< 1.0 for exact signatures, below 0.5 for guesses
};

/**
 * @brief Byte signature at a fixed offset
 */
struct MagicPattern {
    ByteVector pattern;      ///< Bytes to match
    std::string patternHex;  ///< Hex representation
    size_t offset = 0;       ///< Offset where the pattern must appear
    std::string category;    ///< Category this pattern indicates
    std::string mimeType;    ///< Associated MIME type
    std::string description; ///< Human-readable description
    float confidence = 1.0f; ///< Confidence level for this pattern
};

struct MimeDetectorConfig {
    bool useLibMagic = true;        ///< Consult libmagic when compiled in
    bool useBuiltinPatterns = true; ///< Use the built-in signature table
    size_t maxBytesToRead = 8192;   ///< Bytes read from a file for sniffing
    bool cacheResults = true;       ///< Cache detections keyed by a digest of the buffer
    size_t cacheSize = 1000;        ///< Maximum cache entries
};

/**
 * @brief MIME type detection using magic numbers, extensions and text heuristics
 *
 * Detection order for buffers:
 * 1. libmagic (if compiled in), unless it only reports a generic type
 * 2. Built-in signature table, with ZIP containers refined to Office Open XML
 * 3. Text heuristics (JSON, HTML, XML, plain text) for valid UTF-8
 * 4. application/octet-stream
 *
 * For paths, a conclusive signature (confidence >= 0.8) wins over the
 * extension; otherwise the extension wins over the text heuristics.
 */
class MimeDetector {
public:
    static MimeDetector& instance();

    /**
     * @brief Reset patterns and cache for a new configuration
     */
    Result<void> initialize(const MimeDetectorConfig& config = {});

    /**
     * @brief Sniff a buffer; never fails, falls back to application/octet-stream
     */
    MimeSignature detectFromBuffer(ByteSpan data);

    /**
     * @brief Sniff a file's leading bytes and combine with its extension
     * @return IoError when the file does not exist or cannot be opened
     */
    Result<MimeSignature> detectFromFile(const std::filesystem::path& path);

    Result<void> addPattern(const MagicPattern& pattern);

    std::vector<MagicPattern> getPatterns() const;

    void clearCache();

    struct CacheStats {
        size_t hits = 0;
        size_t misses = 0;
        size_t entries = 0;
        size_t maxSize = 0;
    };
    CacheStats getCacheStats() const;

    bool hasLibMagic() const;

    /**
     * @brief MIME type for a file extension (with or without dot)
     * @return MIME type or std::nullopt when the extension is unknown
     */
    static std::optional<std::string> mimeFromExtension(std::string_view extension);

    /**
     * @brief All known extensions (without dot, sorted) for a MIME type
     */
    static std::vector<std::string> extensionsForMime(std::string_view mimeType);

    /**
     * @brief Canonical spelling of a supported MIME type
     *
     * Matching is case-insensitive and ignores parameters such as "; charset=utf-8".
     * Any image/* type is accepted. Returns std::nullopt for unsupported types.
     */
    static std::optional<std::string> normalizeMime(std::string_view mimeType);

    static bool isSupportedMime(std::string_view mimeType);

    static bool isTextMime(std::string_view mimeType);

    /**
     * @brief Category for a MIME type (image, document, text, code, archive, ...)
     */
    static std::string category(std::string_view mimeType);

    static std::string bytesToHex(ByteSpan data, size_t maxLength = 16);

    static Result<ByteVector> hexToBytes(const std::string& hex);

    ~MimeDetector();

    MimeDetector(const MimeDetector&) = delete;
    MimeDetector& operator=(const MimeDetector&) = delete;
    MimeDetector(MimeDetector&&) = delete;
    MimeDetector& operator=(MimeDetector&&) = delete;

private:
    MimeDetector();

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

/**
 * @brief Built-in signature table
 */
std::vector<MagicPattern> getDefaultPatterns();

/**
 * @brief Heuristic binary check over the first 512 bytes
 */
bool isBinaryData(ByteSpan data);

/**
 * @brief Whether the buffer is well-formed UTF-8
 */
bool isValidUtf8(ByteSpan data);

/**
 * @brief MIME type of a buffer; application/octet-stream when inconclusive
 */
std::string detectMimeType(ByteSpan data);

/**
 * @brief MIME type of a path, sniffing the content when the file exists
 *
 * Never fails; application/octet-stream when inconclusive.
 */
std::string detectMimeTypeFromPath(const std::filesystem::path& path);

/**
 * @brief Extension based detection
 * @param checkExists Fail with IoError when the path does not exist
 * @return UnsupportedFormat for an unknown extension, ValidationError when there is none
 */
Result<std::string> detectMimeTypeFromExtension(const std::filesystem::path& path,
                                                bool checkExists);

} // namespace kreuzberg::detection
