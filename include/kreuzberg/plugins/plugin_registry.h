#pragma once

#include <kreuzberg/core/types.h>
#include <kreuzberg/plugins/plugin_interfaces.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace kreuzberg::plugins {

struct OcrBackendEntry {
    std::string name;
    std::shared_ptr<OcrBackend> plugin;
    std::vector<std::string> languages; ///< Declared at registration, may be empty
};

struct PostProcessorEntry {
    std::string name;
    std::shared_ptr<PostProcessor> plugin;
    std::int32_t priority = 0;
    ProcessingStage stage = ProcessingStage::Middle;
};

struct ValidatorEntry {
    std::string name;
    std::shared_ptr<Validator> plugin;
    std::int32_t priority = 0;
};

struct DocumentExtractorEntry {
    std::string name;
    std::shared_ptr<DocumentExtractor> plugin;
    std::vector<std::string> mime_types; ///< Lowercase; "*" or "type/*" act as wildcards
    std::int32_t priority = 0;

    bool handles(std::string_view mimeType) const;
};

/**
 * @brief Immutable view of all registries taken when an extraction starts
 *
 * Entries are in execution order: post-processors by stage then registration,
 * validators and document extractors by descending priority (ties keep
 * registration order), OCR backends by registration.
 */
struct PluginSnapshot {
    std::vector<OcrBackendEntry> ocrBackends;
    std::vector<PostProcessorEntry> postProcessors;
    std::vector<ValidatorEntry> validators;
    std::vector<DocumentExtractorEntry> documentExtractors;

    std::shared_ptr<OcrBackend> findOcrBackend(std::string_view name) const;

    /**
     * @brief Extractors accepting @p mimeType, best first
     */
    std::vector<const DocumentExtractorEntry*> extractorsFor(std::string_view mimeType) const;
};

/**
 * @brief Process-wide plugin registry
 *
 * Registering an existing name replaces that entry in place and keeps its
 * registration slot. A replaced or removed plugin is shut down once the
 * registry and every snapshot still holding it have released it.
 * Unregistering an unknown name is a no-op.
 */
class PluginRegistry {
public:
    static PluginRegistry& instance();

    PluginRegistry(const PluginRegistry&) = delete;
    PluginRegistry& operator=(const PluginRegistry&) = delete;

    // OCR backends
    Result<void> registerOcrBackend(std::shared_ptr<OcrBackend> backend,
                                    std::vector<std::string> languages = {});
    bool unregisterOcrBackend(std::string_view name);
    void clearOcrBackends();
    std::vector<std::string> listOcrBackends() const;
    std::vector<OcrBackendEntry> ocrBackendEntries() const;

    // Post-processors
    Result<void> registerPostProcessor(std::shared_ptr<PostProcessor> processor,
                                       std::int32_t priority,
                                       ProcessingStage stage = ProcessingStage::Middle);
    bool unregisterPostProcessor(std::string_view name);
    void clearPostProcessors();
    std::vector<std::string> listPostProcessors() const;

    // Validators
    Result<void> registerValidator(std::shared_ptr<Validator> validator, std::int32_t priority);
    bool unregisterValidator(std::string_view name);
    void clearValidators();
    std::vector<std::string> listValidators() const;

    // Document extractors
    Result<void> registerDocumentExtractor(std::shared_ptr<DocumentExtractor> extractor,
                                           std::vector<std::string> mimeTypes,
                                           std::int32_t priority);
    bool unregisterDocumentExtractor(std::string_view name);
    void clearDocumentExtractors();
    std::vector<std::string> listDocumentExtractors() const;

    /**
     * @brief Consistent copy of every category in execution order
     */
    std::shared_ptr<const PluginSnapshot> snapshot() const;

private:
    PluginRegistry();
    ~PluginRegistry();

    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

/**
 * @brief Reject empty names and names containing whitespace
 */
Result<void> validatePluginName(std::string_view name);

} // namespace kreuzberg::plugins
