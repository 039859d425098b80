#pragma once

#include <kreuzberg/config/extraction_config.h>

#include <cstdint>
#include <string_view>

namespace kreuzberg::config {

/**
 * @brief Incremental, single-use construction of an ExtractionConfig
 *
 * Setters taking JSON text decode one nested section and fail immediately on
 * malformed input; cross-field rules are checked by build(). Once build() has
 * run, every further call fails with InvalidArgument.
 */
class ConfigBuilder {
public:
    ConfigBuilder() = default;

    Result<void> setUseCache(bool value);
    Result<void> setEnableQualityProcessing(bool value);
    Result<void> setForceOcr(bool value);
    Result<void> setIncludeDocumentStructure(bool value);
    Result<void> setMaxConcurrentExtractions(std::uint32_t value);
    Result<void> setOutputFormat(std::string_view format);

    Result<void> setOcr(std::string_view json);
    Result<void> setPdf(std::string_view json);
    Result<void> setChunking(std::string_view json);
    Result<void> setImageExtraction(std::string_view json);
    Result<void> setPages(std::string_view json);
    Result<void> setTokenReduction(std::string_view json);
    Result<void> setLanguageDetection(std::string_view json);
    Result<void> setPostProcessor(std::string_view json);
    Result<void> setKeywords(std::string_view json);
    Result<void> setHtmlOptions(std::string_view json);

    Result<void> setOcr(OcrConfig value);
    Result<void> setChunking(ChunkingConfig value);

    /**
     * @brief Validate and hand over the accumulated config
     *
     * The builder is consumed whether or not validation succeeds.
     */
    Result<ExtractionConfig> build();

    bool consumed() const noexcept { return consumed_; }

private:
    Result<void> ensureUsable() const;

    template <typename T>
    Result<void> setSection(std::string_view json, const char* field,
                            std::optional<T> ExtractionConfig::*member);

    ExtractionConfig config_;
    bool consumed_ = false;
};

} // namespace kreuzberg::config
