#include <kreuzberg/plugins/callback_adapters.h>

#include <kreuzberg/config/config_loader.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>

namespace kreuzberg::plugins {

using json = nlohmann::json;

std::optional<std::string> takeCallbackString(char* reply) {
    if (!reply)
        return std::nullopt;
    std::string copy(reply);
    std::free(reply);
    return copy;
}

// ============================================================================
// OCR backend
// ============================================================================

CallbackOcrBackend::CallbackOcrBackend(std::string name, KreuzbergOcrBackendCallback callback,
                                       std::vector<std::string> languages)
    : name_(std::move(name)), callback_(callback), languages_(std::move(languages)) {}

Result<std::string> CallbackOcrBackend::processImage(ByteSpan image,
                                                     const std::string& configJson) {
    if (!callback_)
        return Error{ErrorCode::PluginError, "OCR backend '" + name_ + "' has no callback"};

    auto reply = takeCallbackString(
        callback_(image.data(), static_cast<uintptr_t>(image.size()), configJson.c_str()));
    if (!reply) {
        spdlog::warn("OCR backend '{}' returned no text for {} bytes", name_, image.size());
        return Error{ErrorCode::OcrError, "OCR backend '" + name_ + "' failed to process image"};
    }
    return std::move(*reply);
}

// ============================================================================
// Post-processor
// ============================================================================

CallbackPostProcessor::CallbackPostProcessor(std::string name,
                                             KreuzbergPostProcessorCallback callback)
    : name_(std::move(name)), callback_(callback) {}

Result<void> CallbackPostProcessor::process(extraction::ExtractionResult& result,
                                            const config::ExtractionConfig&) {
    if (!callback_)
        return Error{ErrorCode::PluginError, "Post-processor '" + name_ + "' has no callback"};

    const std::string payload = json(result).dump();
    auto reply = takeCallbackString(callback_(payload.c_str()));
    if (!reply)
        return {};

    auto patch = json::parse(*reply, nullptr, false);
    if (patch.is_discarded() || !patch.is_object())
        return Error{ErrorCode::PluginError, "Post-processor '" + name_ + "' failed: " + *reply};

    if (auto r = extraction::applyResultPatch(result, patch); !r) {
        return Error{ErrorCode::PluginError,
                     "Post-processor '" + name_ + "' returned an invalid result: " +
                         r.error().message};
    }
    spdlog::debug("Post-processor '{}' patched {} field(s)", name_, patch.size());
    return {};
}

// ============================================================================
// Validator
// ============================================================================

CallbackValidator::CallbackValidator(std::string name, KreuzbergValidatorCallback callback)
    : name_(std::move(name)), callback_(callback) {}

Result<void> CallbackValidator::validate(const extraction::ExtractionResult& result,
                                         const config::ExtractionConfig&) {
    if (!callback_)
        return Error{ErrorCode::PluginError, "Validator '" + name_ + "' has no callback"};

    const std::string payload = json(result).dump();
    auto reply = takeCallbackString(callback_(payload.c_str()));
    if (!reply)
        return {};
    return Error{ErrorCode::ValidationError, "Validator '" + name_ + "' rejected result: " + *reply};
}

// ============================================================================
// Document extractor
// ============================================================================

CallbackDocumentExtractor::CallbackDocumentExtractor(std::string name,
                                                     KreuzbergDocumentExtractorCallback callback)
    : name_(std::move(name)), callback_(callback) {}

Result<extraction::ExtractionResult>
CallbackDocumentExtractor::extract(ByteSpan data, std::string_view mimeType,
                                   const config::ExtractionConfig& config) {
    if (!callback_)
        return Error{ErrorCode::PluginError, "Document extractor '" + name_ + "' has no callback"};

    const std::string mime(mimeType);
    const std::string configJson = config::ConfigLoader::toJsonString(config);
    auto reply = takeCallbackString(callback_(data.data(), static_cast<uintptr_t>(data.size()),
                                              mime.c_str(), configJson.c_str()));
    if (!reply)
        return Error{ErrorCode::PluginError,
                     "Document extractor '" + name_ + "' returned no result for " + mime};

    auto parsed = json::parse(*reply, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object())
        return Error{ErrorCode::PluginError,
                     "Document extractor '" + name_ + "' failed: " + *reply};

    auto result = extraction::resultFromJson(parsed);
    if (!result) {
        return Error{ErrorCode::PluginError, "Document extractor '" + name_ +
                                                 "' returned an invalid result: " +
                                                 result.error().message};
    }

    auto out = std::move(result).value();
    if (out.mime_type.empty())
        out.mime_type = mime;
    if (!out.metadata.contains("format_type"))
        out.metadata["format_type"] = name_;
    return out;
}

} // namespace kreuzberg::plugins
