#include <kreuzberg/config/config_json.h>
#include <kreuzberg/config/config_loader.h>
#include <kreuzberg/detection/mime_detector.h>
#include <kreuzberg/engine/extraction_engine.h>
#include <kreuzberg/extraction/text_extractor.h>
#include <kreuzberg/processing/document_structure.h>
#include <kreuzberg/processing/keyword_extractor.h>
#include <kreuzberg/processing/page_splitter.h>
#include <kreuzberg/processing/quality.h>
#include <kreuzberg/processing/text_chunker.h>
#include <kreuzberg/processing/token_reduction.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <thread>

namespace kreuzberg::engine {

namespace fs = std::filesystem;
using extraction::ExtractionResult;
using json = nlohmann::json;

namespace {

constexpr const char* kDefaultOcrBackend = "tesseract";

std::string lowercaseMime(std::string_view mime) {
    if (auto semi = mime.find(';'); semi != std::string_view::npos)
        mime = mime.substr(0, semi);
    while (!mime.empty() && std::isspace(static_cast<unsigned char>(mime.front())))
        mime.remove_prefix(1);
    while (!mime.empty() && std::isspace(static_cast<unsigned char>(mime.back())))
        mime.remove_suffix(1);
    std::string out(mime);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool isImageMime(std::string_view mime) {
    return mime.rfind("image/", 0) == 0;
}

Result<ByteVector> readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return Error{ErrorCode::IoError, "Failed to open file: " + path.string()};
    ByteVector bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad())
        return Error{ErrorCode::IoError, "Failed to read file: " + path.string()};
    return bytes;
}

std::vector<std::string> cacheRelevantPlugins(const plugins::PluginSnapshot& snapshot) {
    std::vector<std::string> names;
    for (const auto& e : snapshot.documentExtractors)
        names.push_back("extractor:" + e.name);
    for (const auto& e : snapshot.ocrBackends)
        names.push_back("ocr:" + e.name);
    return names;
}

std::string ocrBackendName(const config::ExtractionConfig& config) {
    return config.ocr ? config.ocr->backend : std::string(kDefaultOcrBackend);
}

std::string ocrConfigJson(const config::ExtractionConfig& config) {
    json j = config.ocr ? json(*config.ocr) : json(config::OcrConfig{});
    return j.dump();
}

// Stop-word language for token reduction, ISO 639-3
std::string reductionLanguage(const ExtractionResult& result) {
    if (result.detected_languages && !result.detected_languages->empty())
        return result.detected_languages->front();
    return extraction::LanguageDetector::detectLanguage(result.content);
}

} // namespace

bool postProcessorAllowed(const config::ExtractionConfig& config, std::string_view name) {
    if (!config.postprocessor)
        return true;
    const auto& pp = *config.postprocessor;
    if (!pp.enabled)
        return false;
    if (pp.enabled_processors) {
        const auto& allow = *pp.enabled_processors;
        return std::find(allow.begin(), allow.end(), name) != allow.end();
    }
    if (pp.disabled_processors) {
        const auto& deny = *pp.disabled_processors;
        return std::find(deny.begin(), deny.end(), name) == deny.end();
    }
    return true;
}

ExtractionEngine& ExtractionEngine::instance() {
    static ExtractionEngine engine;
    return engine;
}

ExtractionEngine::ExtractionEngine() = default;

// ============================================================================
// Entry points
// ============================================================================

Result<std::string> ExtractionEngine::resolveMimeType(const fs::path& path,
                                                      const std::optional<std::string>& mimeHint,
                                                      const plugins::PluginSnapshot& snapshot) const {
    if (mimeHint && !mimeHint->empty()) {
        if (auto normalized = detection::MimeDetector::normalizeMime(*mimeHint))
            return *normalized;
        auto lowered = lowercaseMime(*mimeHint);
        if (!snapshot.extractorsFor(lowered).empty())
            return lowered;
        spdlog::debug("Ignoring unknown MIME hint '{}' for {}", *mimeHint, path.string());
    }

    auto detected = detection::MimeDetector::instance().detectFromFile(path);
    if (!detected)
        return detected.error();
    return detected.value().mimeType;
}

Result<ExtractionResult> ExtractionEngine::extractFile(const fs::path& path,
                                                       const std::optional<std::string>& mimeHint,
                                                       const config::ExtractionConfig& config) {
    if (path.empty())
        return Error{ErrorCode::InvalidArgument, "File path cannot be empty"};

    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec || !fs::exists(status))
        return Error{ErrorCode::IoError, "File not found: " + path.string()};
    if (fs::is_directory(status))
        return Error{ErrorCode::IoError, "Path is a directory, not a file: " + path.string()};

    if (auto valid = config.validate(); !valid)
        return valid.error();

    auto snapshot = plugins::PluginRegistry::instance().snapshot();
    auto mime = resolveMimeType(path, mimeHint, *snapshot);
    if (!mime)
        return mime.error();

    auto bytes = readFile(path);
    if (!bytes)
        return bytes.error();

    spdlog::debug("Extracting {} ({} bytes, {})", path.string(), bytes.value().size(),
                  mime.value());
    return extractWithSnapshot(ByteSpan(bytes.value()), mime.value(), config, *snapshot);
}

Result<ExtractionResult> ExtractionEngine::extractBytes(ByteSpan data, std::string_view mimeType,
                                                        const config::ExtractionConfig& config) {
    const auto lowered = lowercaseMime(mimeType);
    if (lowered.empty())
        return Error{ErrorCode::InvalidArgument, "MIME type cannot be empty"};
    if (auto valid = config.validate(); !valid)
        return valid.error();

    auto snapshot = plugins::PluginRegistry::instance().snapshot();
    const std::string mime = detection::MimeDetector::normalizeMime(lowered).value_or(lowered);
    return extractWithSnapshot(data, mime, config, *snapshot);
}

Result<ExtractionResult> ExtractionEngine::extractWithSnapshot(
    ByteSpan data, const std::string& mimeType, const config::ExtractionConfig& config,
    const plugins::PluginSnapshot& snapshot) {
    std::string cacheKey;
    std::optional<ExtractionResult> cached;
    if (config.use_cache) {
        cacheKey = ResultCache::makeKey(data, mimeType, config::ConfigLoader::toJsonString(config),
                                        cacheRelevantPlugins(snapshot));
        cached = cache_.get(cacheKey);
    }

    ExtractionResult result;
    if (cached) {
        spdlog::debug("Cache hit for {} ({})", mimeType, cacheKey.substr(0, 12));
        result = std::move(*cached);
    } else {
        auto extracted = dispatch(data, mimeType, config, snapshot);
        if (!extracted)
            return extracted.error();
        result = std::move(extracted).value();
        if (auto r = runPipeline(result, config, snapshot); !r)
            return r.error();
        if (config.use_cache)
            cache_.put(cacheKey, result);
    }

    if (auto r = runPlugins(result, config, snapshot); !r)
        return r.error();
    return result;
}

// ============================================================================
// Dispatch
// ============================================================================

Result<ExtractionResult> ExtractionEngine::dispatch(ByteSpan data, const std::string& mimeType,
                                                    const config::ExtractionConfig& config,
                                                    const plugins::PluginSnapshot& snapshot) {
    // Registered extractors first, best priority wins
    auto candidates = snapshot.extractorsFor(mimeType);
    if (!candidates.empty()) {
        const auto* entry = candidates.front();
        spdlog::debug("Dispatching {} to document extractor '{}'", mimeType, entry->name);
        try {
            return entry->plugin->extract(data, mimeType, config);
        } catch (const std::exception& e) {
            return Error{ErrorCode::PluginError,
                         "Document extractor '" + entry->name + "' threw: " + e.what()};
        }
    }

    const bool textual = detection::MimeDetector::isTextMime(mimeType);
    if (config.force_ocr && !textual)
        return runOcr(data, mimeType, config, snapshot);

    if (auto extractor = extraction::TextExtractorFactory::instance().create(mimeType)) {
        spdlog::debug("Dispatching {} to built-in {}", mimeType, extractor->name());
        return extractor->extractFromBuffer(data, mimeType, config);
    }

    if (isImageMime(mimeType))
        return runOcr(data, mimeType, config, snapshot);

    if (detection::MimeDetector::isSupportedMime(mimeType))
        return Error{ErrorCode::MissingDependency,
                     "No extractor available for " + mimeType +
                         "; register a document extractor for this format"};
    return Error{ErrorCode::UnsupportedFormat, "Unsupported format: " + mimeType};
}

Result<ExtractionResult> ExtractionEngine::runOcr(ByteSpan data, const std::string& mimeType,
                                                  const config::ExtractionConfig& config,
                                                  const plugins::PluginSnapshot& snapshot) {
    const auto backendName = ocrBackendName(config);
    auto backend = snapshot.findOcrBackend(backendName);
    if (!backend)
        return Error{ErrorCode::MissingDependency,
                     "OCR backend '" + backendName + "' is required for " + mimeType +
                         " but is not registered"};

    Result<std::string> text = Error{ErrorCode::OcrError};
    try {
        text = backend->processImage(data, ocrConfigJson(config));
    } catch (const std::exception& e) {
        return Error{ErrorCode::OcrError, "OCR backend '" + backendName + "' threw: " + e.what()};
    }
    if (!text)
        return text.error();

    ExtractionResult result;
    result.content = std::move(text).value();
    result.mime_type = mimeType;
    result.metadata["format_type"] = isImageMime(mimeType) ? "image" : "ocr";
    result.metadata["ocr_backend"] = backendName;
    result.metadata["ocr_language"] = config.ocr ? config.ocr->language : std::string("eng");
    return result;
}

// ============================================================================
// Pipeline
// ============================================================================

Result<void> ExtractionEngine::runPipeline(ExtractionResult& result,
                                           const config::ExtractionConfig& config,
                                           const plugins::PluginSnapshot& snapshot) {
    if (!result.metadata.is_object())
        result.metadata = json::object();
    if (!result.metadata.contains("format_type"))
        result.metadata["format_type"] = detection::MimeDetector::category(result.mime_type);

    if (config.enable_quality_processing)
        result.content = processing::cleanExtractedText(result.content);

    // OCR of images returned by a document extractor
    if (result.images && config.ocr) {
        auto backend = snapshot.findOcrBackend(config.ocr->backend);
        for (auto& image : *result.images) {
            if (image.data.empty())
                continue;
            if (!backend) {
                result.addWarning("ocr", "OCR backend '" + config.ocr->backend +
                                             "' not registered; image " +
                                             std::to_string(image.image_index) + " skipped");
                continue;
            }
            Result<std::string> text = Error{ErrorCode::OcrError};
            try {
                text = backend->processImage(ByteSpan(image.data), ocrConfigJson(config));
            } catch (const std::exception& e) {
                text = Error{ErrorCode::OcrError,
                             "OCR backend '" + config.ocr->backend + "' threw on image " +
                                 std::to_string(image.image_index) + ": " + e.what()};
            }
            if (!text) {
                result.addWarning("ocr", text.error().message);
                continue;
            }
            auto nested = std::make_shared<ExtractionResult>();
            nested->content = std::move(text).value();
            nested->mime_type = "image/" + (image.format.empty() ? "unknown" : image.format);
            nested->metadata["format_type"] = "image";
            image.ocr_result = std::move(nested);
        }
    }

    if (config.pages || (result.pages && !result.pages->empty()))
        processing::applyPageConfig(result, config.pages.value_or(config::PageConfig{}));

    if (config.token_reduction && config.token_reduction->mode != config::TokenReductionMode::Off)
        processing::reduceResultTokens(result, *config.token_reduction, reductionLanguage(result));

    if (config.chunking) {
        if (auto r = processing::chunkResult(result, *config.chunking); !r)
            return r;
    }

    if (config.language_detection && config.language_detection->enabled) {
        auto scores = extraction::LanguageDetector::detectLanguages(
            result.content, config.language_detection->min_confidence,
            config.language_detection->detect_multiple);
        std::vector<std::string> codes;
        for (const auto& s : scores)
            codes.push_back(s.code);
        if (!codes.empty())
            result.detected_languages = std::move(codes);
    }

    if (config.keywords) {
        processing::KeywordExtractor extractor(*config.keywords);
        result.keywords = extractor.extract(result.content);
    }

    if (config.enable_quality_processing)
        processing::applyQualityProcessing(result);

    if (config.include_document_structure)
        result.document = processing::buildDocumentStructure(result.content);

    return {};
}

Result<void> ExtractionEngine::runPlugins(ExtractionResult& result,
                                          const config::ExtractionConfig& config,
                                          const plugins::PluginSnapshot& snapshot) {
    for (const auto& entry : snapshot.postProcessors) {
        if (!postProcessorAllowed(config, entry.name))
            continue;
        try {
            if (auto r = entry.plugin->process(result, config); !r) {
                spdlog::warn("Post-processor '{}' failed: {}", entry.name, r.error().message);
                return Error{r.error().code == ErrorCode::ValidationError ? ErrorCode::PluginError
                                                                          : r.error().code,
                             r.error().message};
            }
        } catch (const std::exception& e) {
            return Error{ErrorCode::PluginError,
                         "Post-processor '" + entry.name + "' threw: " + e.what()};
        }
    }

    for (const auto& entry : snapshot.validators) {
        try {
            if (auto r = entry.plugin->validate(result, config); !r) {
                spdlog::debug("Validator '{}' rejected result: {}", entry.name,
                              r.error().message);
                return r;
            }
        } catch (const std::exception& e) {
            return Error{ErrorCode::PluginError,
                         "Validator '" + entry.name + "' threw: " + e.what()};
        }
    }
    return {};
}

// ============================================================================
// Batch
// ============================================================================

std::size_t ExtractionEngine::workerCount(std::size_t items,
                                          const config::ExtractionConfig& config) const {
    std::size_t workers = 0;
    if (config.max_concurrent_extractions && *config.max_concurrent_extractions > 0) {
        workers = *config.max_concurrent_extractions;
    } else {
        workers = std::max(1u, std::thread::hardware_concurrency()) * 2;
    }
    return std::max<std::size_t>(1, std::min(workers, items));
}

namespace {

template <typename Fn>
std::vector<Result<ExtractionResult>> runBatch(std::size_t count, std::size_t workers, Fn&& fn) {
    std::vector<Result<ExtractionResult>> results(count, Result<ExtractionResult>(
                                                             Error{ErrorCode::InternalError,
                                                                   "Batch item was not processed"}));
    if (count == 0)
        return results;

    boost::asio::thread_pool pool(workers);
    for (std::size_t i = 0; i < count; ++i) {
        boost::asio::post(pool, [&results, &fn, i]() {
            try {
                results[i] = fn(i);
            } catch (const std::exception& e) {
                results[i] = Error{ErrorCode::InternalError,
                                   std::string("Batch item failed: ") + e.what()};
            }
        });
    }
    pool.join();
    return results;
}

} // namespace

std::vector<Result<ExtractionResult>>
ExtractionEngine::batchExtractFiles(const std::vector<fs::path>& paths,
                                    const config::ExtractionConfig& config) {
    const auto workers = workerCount(paths.size(), config);
    spdlog::debug("Batch extracting {} files on {} workers", paths.size(), workers);
    return runBatch(paths.size(), workers,
                    [&](std::size_t i) { return extractFile(paths[i], std::nullopt, config); });
}

std::vector<Result<ExtractionResult>>
ExtractionEngine::batchExtractBytes(const std::vector<BytesInput>& items,
                                    const config::ExtractionConfig& config) {
    const auto workers = workerCount(items.size(), config);
    spdlog::debug("Batch extracting {} buffers on {} workers", items.size(), workers);
    return runBatch(items.size(), workers, [&](std::size_t i) {
        return extractBytes(items[i].data, items[i].mimeType, config);
    });
}

} // namespace kreuzberg::engine
