#pragma once

#include <kreuzberg/config/extraction_config.h>
#include <kreuzberg/core/types.h>
#include <kreuzberg/extraction/extraction_result.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kreuzberg::plugins {

/**
 * @brief Common lifecycle of every plugin capability
 *
 * initialize() runs when the plugin is registered; a failure rejects the
 * registration. shutdown() runs once it is unregistered, cleared or replaced and no
 * running extraction still holds it.
 */
class Plugin {
public:
    virtual ~Plugin() = default;

    virtual std::string name() const = 0;

    virtual Result<void> initialize() { return {}; }

    virtual void shutdown() {}
};

/**
 * @brief Turns image bytes into text
 */
class OcrBackend : public Plugin {
public:
    /**
     * @param image Encoded image bytes
     * @param config Serialized OcrConfig (with language and backend options)
     * @return Recognised text, OcrError when recognition fails
     */
    virtual Result<std::string> processImage(ByteSpan image, const std::string& configJson) = 0;

    /**
     * @brief Declared languages; empty means "not declared"
     */
    virtual std::vector<std::string> supportedLanguages() const { return {}; }

    bool supportsLanguage(std::string_view language) const;
};

/**
 * @brief Execution phase of a post-processor
 */
enum class ProcessingStage { Early = 0, Middle = 1, Late = 2 };

const char* toString(ProcessingStage stage);
std::optional<ProcessingStage> parseProcessingStage(std::string_view s);

/**
 * @brief Rewrites an extraction result in place
 */
class PostProcessor : public Plugin {
public:
    virtual Result<void> process(extraction::ExtractionResult& result,
                                 const config::ExtractionConfig& config) = 0;
};

/**
 * @brief Accepts or rejects a finished extraction result
 */
class Validator : public Plugin {
public:
    /**
     * @return ValidationError with the rejection reason
     */
    virtual Result<void> validate(const extraction::ExtractionResult& result,
                                  const config::ExtractionConfig& config) = 0;
};

/**
 * @brief Extracts documents of the MIME types it was registered for
 */
class DocumentExtractor : public Plugin {
public:
    virtual Result<extraction::ExtractionResult> extract(ByteSpan data, std::string_view mimeType,
                                                         const config::ExtractionConfig& config) = 0;
};

} // namespace kreuzberg::plugins
