#pragma once

#include <kreuzberg/kreuzberg.h>
#include <kreuzberg/plugins/plugin_interfaces.h>

#include <string>
#include <vector>

namespace kreuzberg::plugins {

/**
 * @brief Take ownership of a malloc'd callback reply
 *
 * Copies the text and frees the original with free(). Returns std::nullopt for
 * a NULL reply.
 */
std::optional<std::string> takeCallbackString(char* reply);

/**
 * @brief OCR backend implemented by a foreign function pointer
 */
class CallbackOcrBackend : public OcrBackend {
public:
    CallbackOcrBackend(std::string name, KreuzbergOcrBackendCallback callback,
                       std::vector<std::string> languages = {});

    std::string name() const override { return name_; }
    Result<std::string> processImage(ByteSpan image, const std::string& configJson) override;
    std::vector<std::string> supportedLanguages() const override { return languages_; }

private:
    std::string name_;
    KreuzbergOcrBackendCallback callback_;
    std::vector<std::string> languages_;
};

/**
 * @brief Post-processor that round-trips the result through JSON
 *
 * The callback sees the serialized result. A NULL reply keeps the result, a
 * JSON object is applied as a patch, anything else is an error message.
 */
class CallbackPostProcessor : public PostProcessor {
public:
    CallbackPostProcessor(std::string name, KreuzbergPostProcessorCallback callback);

    std::string name() const override { return name_; }
    Result<void> process(extraction::ExtractionResult& result,
                         const config::ExtractionConfig& config) override;

private:
    std::string name_;
    KreuzbergPostProcessorCallback callback_;
};

class CallbackValidator : public Validator {
public:
    CallbackValidator(std::string name, KreuzbergValidatorCallback callback);

    std::string name() const override { return name_; }
    Result<void> validate(const extraction::ExtractionResult& result,
                          const config::ExtractionConfig& config) override;

private:
    std::string name_;
    KreuzbergValidatorCallback callback_;
};

class CallbackDocumentExtractor : public DocumentExtractor {
public:
    CallbackDocumentExtractor(std::string name, KreuzbergDocumentExtractorCallback callback);

    std::string name() const override { return name_; }
    Result<extraction::ExtractionResult> extract(ByteSpan data, std::string_view mimeType,
                                                 const config::ExtractionConfig& config) override;

private:
    std::string name_;
    KreuzbergDocumentExtractorCallback callback_;
};

} // namespace kreuzberg::plugins
