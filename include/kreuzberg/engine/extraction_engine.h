#pragma once

#include <kreuzberg/config/extraction_config.h>
#include <kreuzberg/core/types.h>
#include <kreuzberg/engine/result_cache.h>
#include <kreuzberg/extraction/extraction_result.h>
#include <kreuzberg/plugins/plugin_registry.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kreuzberg::engine {

/**
 * @brief One in-memory document of a batch
 */
struct BytesInput {
    ByteSpan data;
    std::string mimeType;
};

/**
 * @brief Blocking extraction entry points shared by the C ABI
 *
 * Each call captures a plugin snapshot when it starts, so registry changes
 * made while it runs do not affect it. Processing order after the format
 * extractor: text cleanup, page splitting, token reduction, chunking,
 * language detection, keywords, quality score, document structure,
 * post-processors, validators.
 */
class ExtractionEngine {
public:
    static ExtractionEngine& instance();

    ExtractionEngine(const ExtractionEngine&) = delete;
    ExtractionEngine& operator=(const ExtractionEngine&) = delete;

    /**
     * @param mimeHint Trusted when it names a supported MIME type or one a
     *        registered document extractor accepts; otherwise ignored
     * @return IoError for missing, unreadable or directory paths
     */
    Result<extraction::ExtractionResult> extractFile(const std::filesystem::path& path,
                                                     const std::optional<std::string>& mimeHint,
                                                     const config::ExtractionConfig& config);

    /**
     * @return InvalidArgument when @p mimeType is empty
     */
    Result<extraction::ExtractionResult> extractBytes(ByteSpan data, std::string_view mimeType,
                                                      const config::ExtractionConfig& config);

    /**
     * @brief Extract every path on a bounded worker pool
     *
     * Slot i of the output always corresponds to input i; one failure never
     * aborts the others.
     */
    std::vector<Result<extraction::ExtractionResult>>
    batchExtractFiles(const std::vector<std::filesystem::path>& paths,
                      const config::ExtractionConfig& config);

    std::vector<Result<extraction::ExtractionResult>>
    batchExtractBytes(const std::vector<BytesInput>& items, const config::ExtractionConfig& config);

    /**
     * @brief MIME type used for a file: trusted hint, then content sniffing and extension
     */
    Result<std::string> resolveMimeType(const std::filesystem::path& path,
                                        const std::optional<std::string>& mimeHint,
                                        const plugins::PluginSnapshot& snapshot) const;

    ResultCache& cache() { return cache_; }

private:
    ExtractionEngine();

    Result<extraction::ExtractionResult> extractWithSnapshot(
        ByteSpan data, const std::string& mimeType, const config::ExtractionConfig& config,
        const plugins::PluginSnapshot& snapshot);

    Result<extraction::ExtractionResult> dispatch(ByteSpan data, const std::string& mimeType,
                                                  const config::ExtractionConfig& config,
                                                  const plugins::PluginSnapshot& snapshot);

    Result<extraction::ExtractionResult> runOcr(ByteSpan data, const std::string& mimeType,
                                                const config::ExtractionConfig& config,
                                                const plugins::PluginSnapshot& snapshot);

    Result<void> runPipeline(extraction::ExtractionResult& result,
                             const config::ExtractionConfig& config,
                             const plugins::PluginSnapshot& snapshot);

    Result<void> runPlugins(extraction::ExtractionResult& result,
                            const config::ExtractionConfig& config,
                            const plugins::PluginSnapshot& snapshot);

    std::size_t workerCount(std::size_t items, const config::ExtractionConfig& config) const;

    ResultCache cache_;
};

/**
 * @brief Whether the post-processor named @p name may run under @p config
 *
 * An explicit enabled list wins over the disabled list.
 */
bool postProcessorAllowed(const config::ExtractionConfig& config, std::string_view name);

} // namespace kreuzberg::engine
