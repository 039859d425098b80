#include <kreuzberg/config/config_builder.h>
#include <kreuzberg/config/config_json.h>

#include <spdlog/spdlog.h>

namespace kreuzberg::config {

Result<void> ConfigBuilder::ensureUsable() const {
    if (consumed_)
        return Error{ErrorCode::InvalidArgument, "builder already consumed"};
    return {};
}

template <typename T>
Result<void> ConfigBuilder::setSection(std::string_view json, const char* field,
                                       std::optional<T> ExtractionConfig::*member) {
    if (auto r = ensureUsable(); !r)
        return r;

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(json.begin(), json.end());
    } catch (const nlohmann::json::parse_error& e) {
        return Error{ErrorCode::ValidationError,
                     std::string(field) + ": invalid JSON (" + e.what() + ")"};
    }
    if (doc.is_null()) {
        (config_.*member).reset();
        return {};
    }

    // Decode through a full config so field paths in errors are rooted at the section.
    auto decoded = configFromJson(nlohmann::json{{field, doc}});
    if (!decoded)
        return decoded.error();
    config_.*member = decoded.value().*member;
    return {};
}

Result<void> ConfigBuilder::setUseCache(bool value) {
    if (auto r = ensureUsable(); !r)
        return r;
    config_.use_cache = value;
    return {};
}

Result<void> ConfigBuilder::setEnableQualityProcessing(bool value) {
    if (auto r = ensureUsable(); !r)
        return r;
    config_.enable_quality_processing = value;
    return {};
}

Result<void> ConfigBuilder::setForceOcr(bool value) {
    if (auto r = ensureUsable(); !r)
        return r;
    config_.force_ocr = value;
    return {};
}

Result<void> ConfigBuilder::setIncludeDocumentStructure(bool value) {
    if (auto r = ensureUsable(); !r)
        return r;
    config_.include_document_structure = value;
    return {};
}

Result<void> ConfigBuilder::setMaxConcurrentExtractions(std::uint32_t value) {
    if (auto r = ensureUsable(); !r)
        return r;
    if (value == 0)
        return Error{ErrorCode::ValidationError,
                     "max_concurrent_extractions: must be greater than 0 (got 0)"};
    config_.max_concurrent_extractions = value;
    return {};
}

Result<void> ConfigBuilder::setOutputFormat(std::string_view format) {
    if (auto r = ensureUsable(); !r)
        return r;
    auto parsed = parseOutputFormat(format);
    if (!parsed)
        return Error{ErrorCode::ValidationError,
                     "output_format: must be one of plain, markdown, djot, html (got '" +
                         std::string(format) + "')"};
    config_.output_format = *parsed;
    return {};
}

Result<void> ConfigBuilder::setOcr(std::string_view json) {
    return setSection(json, "ocr", &ExtractionConfig::ocr);
}

Result<void> ConfigBuilder::setPdf(std::string_view json) {
    return setSection(json, "pdf_options", &ExtractionConfig::pdf_options);
}

Result<void> ConfigBuilder::setChunking(std::string_view json) {
    return setSection(json, "chunking", &ExtractionConfig::chunking);
}

Result<void> ConfigBuilder::setImageExtraction(std::string_view json) {
    return setSection(json, "images", &ExtractionConfig::images);
}

Result<void> ConfigBuilder::setPages(std::string_view json) {
    return setSection(json, "pages", &ExtractionConfig::pages);
}

Result<void> ConfigBuilder::setTokenReduction(std::string_view json) {
    return setSection(json, "token_reduction", &ExtractionConfig::token_reduction);
}

Result<void> ConfigBuilder::setLanguageDetection(std::string_view json) {
    return setSection(json, "language_detection", &ExtractionConfig::language_detection);
}

Result<void> ConfigBuilder::setPostProcessor(std::string_view json) {
    return setSection(json, "postprocessor", &ExtractionConfig::postprocessor);
}

Result<void> ConfigBuilder::setKeywords(std::string_view json) {
    return setSection(json, "keywords", &ExtractionConfig::keywords);
}

Result<void> ConfigBuilder::setHtmlOptions(std::string_view json) {
    return setSection(json, "html_options", &ExtractionConfig::html_options);
}

Result<void> ConfigBuilder::setOcr(OcrConfig value) {
    if (auto r = ensureUsable(); !r)
        return r;
    config_.ocr = std::move(value);
    return {};
}

Result<void> ConfigBuilder::setChunking(ChunkingConfig value) {
    if (auto r = ensureUsable(); !r)
        return r;
    config_.chunking = std::move(value);
    return {};
}

Result<ExtractionConfig> ConfigBuilder::build() {
    if (auto r = ensureUsable(); !r)
        return r.error();
    consumed_ = true;

    if (auto r = config_.validate(); !r) {
        spdlog::debug("ConfigBuilder::build rejected config: {}", r.error().message);
        return r.error();
    }
    return std::move(config_);
}

} // namespace kreuzberg::config
