#include <kreuzberg/plugins/plugin_registry.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <optional>

namespace kreuzberg::plugins {

namespace {

std::string lowercase(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

void shutdownQuietly(const std::shared_ptr<Plugin>& plugin, std::string_view category) {
    if (!plugin)
        return;
    try {
        plugin->shutdown();
    } catch (const std::exception& e) {
        spdlog::warn("{} '{}' shutdown failed: {}", category, plugin->name(), e.what());
    }
}

// Wraps a registered plugin so shutdown() runs when the last copy is released.
// Snapshots held by running extractions keep a removed plugin alive until they finish.
template <typename P>
std::shared_ptr<P> shutdownOnRelease(std::shared_ptr<P> plugin, const char* category) {
    P* raw = plugin.get();
    return std::shared_ptr<P>(raw, [owner = std::move(plugin), category](P*) mutable {
        shutdownQuietly(owner, category);
        owner.reset();
    });
}

/**
 * @brief Named entries of one plugin category kept in registration order
 */
template <typename Entry> class Category {
public:
    explicit Category(const char* label) : label_(label) {}

    // Caller holds the registry mutex. Returns the replaced entry, if any, so
    // the caller's reference is dropped after the lock is released.
    std::optional<Entry> put(Entry entry) {
        for (auto& existing : entries_) {
            if (existing.name == entry.name) {
                Entry old = std::move(existing);
                existing = std::move(entry);
                return old;
            }
        }
        entries_.push_back(std::move(entry));
        return std::nullopt;
    }

    std::optional<Entry> take(std::string_view name) {
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&](const Entry& e) { return e.name == name; });
        if (it == entries_.end())
            return std::nullopt;
        Entry removed = std::move(*it);
        entries_.erase(it);
        return removed;
    }

    std::vector<Entry> takeAll() {
        std::vector<Entry> out;
        out.swap(entries_);
        return out;
    }

    std::vector<std::string> names() const {
        std::vector<std::string> out;
        out.reserve(entries_.size());
        for (const auto& e : entries_)
            out.push_back(e.name);
        return out;
    }

    const std::vector<Entry>& entries() const { return entries_; }
    const char* label() const { return label_; }

private:
    const char* label_;
    std::vector<Entry> entries_;
};

template <typename Entry> void sortByPriority(std::vector<Entry>& entries) {
    std::stable_sort(entries.begin(), entries.end(),
                     [](const Entry& a, const Entry& b) { return a.priority > b.priority; });
}

} // namespace

Result<void> validatePluginName(std::string_view name) {
    if (name.empty())
        return Error{ErrorCode::InvalidArgument, "Plugin name cannot be empty"};
    for (char c : name) {
        if (std::isspace(static_cast<unsigned char>(c)))
            return Error{ErrorCode::InvalidArgument,
                         "Plugin name cannot contain whitespace: '" + std::string(name) + "'"};
    }
    return {};
}

bool OcrBackend::supportsLanguage(std::string_view language) const {
    const auto wanted = lowercase(language);
    for (const auto& lang : supportedLanguages()) {
        if (lowercase(lang) == wanted)
            return true;
    }
    return false;
}

const char* toString(ProcessingStage stage) {
    switch (stage) {
        case ProcessingStage::Early: return "early";
        case ProcessingStage::Middle: return "middle";
        case ProcessingStage::Late: return "late";
    }
    return "middle";
}

std::optional<ProcessingStage> parseProcessingStage(std::string_view s) {
    const auto v = lowercase(s);
    if (v == "early")
        return ProcessingStage::Early;
    if (v == "middle")
        return ProcessingStage::Middle;
    if (v == "late")
        return ProcessingStage::Late;
    return std::nullopt;
}

bool DocumentExtractorEntry::handles(std::string_view mimeType) const {
    const auto mime = lowercase(mimeType);
    for (const auto& pattern : mime_types) {
        if (pattern == "*" || pattern == "*/*" || pattern == mime)
            return true;
        if (pattern.size() > 2 && pattern.compare(pattern.size() - 2, 2, "/*") == 0 &&
            mime.compare(0, pattern.size() - 1, pattern, 0, pattern.size() - 1) == 0)
            return true;
    }
    return false;
}

std::shared_ptr<OcrBackend> PluginSnapshot::findOcrBackend(std::string_view name) const {
    for (const auto& entry : ocrBackends) {
        if (entry.name == name)
            return entry.plugin;
    }
    return nullptr;
}

std::vector<const DocumentExtractorEntry*>
PluginSnapshot::extractorsFor(std::string_view mimeType) const {
    std::vector<const DocumentExtractorEntry*> out;
    for (const auto& entry : documentExtractors) {
        if (entry.handles(mimeType))
            out.push_back(&entry);
    }
    return out;
}

struct PluginRegistry::Impl {
    mutable std::mutex mutex;
    Category<OcrBackendEntry> ocr{"OCR backend"};
    Category<PostProcessorEntry> post{"Post-processor"};
    Category<ValidatorEntry> validators{"Validator"};
    Category<DocumentExtractorEntry> extractors{"Document extractor"};
    mutable std::shared_ptr<const PluginSnapshot> cached;

    void invalidate() { cached.reset(); }

    // Runs initialize() outside the lock, then inserts.
    template <typename Entry>
    Result<void> add(Category<Entry>& category, Entry entry) {
        if (!entry.plugin)
            return Error{ErrorCode::InvalidArgument,
                         std::string(category.label()) + " cannot be null"};
        if (auto r = validatePluginName(entry.name); !r)
            return r;
        try {
            if (auto r = entry.plugin->initialize(); !r) {
                return Error{ErrorCode::PluginError, std::string(category.label()) + " '" +
                                                         entry.name + "' failed to initialize: " +
                                                         r.error().message};
            }
        } catch (const std::exception& e) {
            return Error{ErrorCode::PluginError, std::string(category.label()) + " '" + entry.name +
                                                     "' failed to initialize: " + e.what()};
        }

        entry.plugin = shutdownOnRelease(std::move(entry.plugin), category.label());
        const std::string name = entry.name;
        std::optional<Entry> replaced;
        {
            std::lock_guard<std::mutex> lock(mutex);
            replaced = category.put(std::move(entry));
            invalidate();
        }
        if (replaced) {
            spdlog::info("{} '{}' replaced", category.label(), name);
            replaced.reset();
        } else {
            spdlog::debug("{} '{}' registered", category.label(), name);
        }
        return {};
    }

    template <typename Entry> bool remove(Category<Entry>& category, std::string_view name) {
        std::optional<Entry> removed;
        {
            std::lock_guard<std::mutex> lock(mutex);
            removed = category.take(name);
            if (removed)
                invalidate();
        }
        if (!removed)
            return false;
        spdlog::debug("{} '{}' unregistered", category.label(), name);
        return true;
    }

    template <typename Entry> void clear(Category<Entry>& category) {
        std::vector<Entry> removed;
        {
            std::lock_guard<std::mutex> lock(mutex);
            removed = category.takeAll();
            invalidate();
        }
        if (!removed.empty())
            spdlog::debug("Cleared {} {} entries", removed.size(), category.label());
    }

    template <typename Entry> std::vector<std::string> names(const Category<Entry>& category) const {
        std::lock_guard<std::mutex> lock(mutex);
        return category.names();
    }
};

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

PluginRegistry::PluginRegistry() : pImpl(std::make_unique<Impl>()) {}

PluginRegistry::~PluginRegistry() = default;

Result<void> PluginRegistry::registerOcrBackend(std::shared_ptr<OcrBackend> backend,
                                                std::vector<std::string> languages) {
    OcrBackendEntry entry;
    entry.name = backend ? backend->name() : std::string();
    if (languages.empty() && backend)
        languages = backend->supportedLanguages();
    entry.languages = std::move(languages);
    entry.plugin = std::move(backend);
    return pImpl->add(pImpl->ocr, std::move(entry));
}

bool PluginRegistry::unregisterOcrBackend(std::string_view name) {
    return pImpl->remove(pImpl->ocr, name);
}

void PluginRegistry::clearOcrBackends() {
    pImpl->clear(pImpl->ocr);
}

std::vector<std::string> PluginRegistry::listOcrBackends() const {
    return pImpl->names(pImpl->ocr);
}

std::vector<OcrBackendEntry> PluginRegistry::ocrBackendEntries() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->ocr.entries();
}

Result<void> PluginRegistry::registerPostProcessor(std::shared_ptr<PostProcessor> processor,
                                                   std::int32_t priority, ProcessingStage stage) {
    PostProcessorEntry entry;
    entry.name = processor ? processor->name() : std::string();
    entry.plugin = std::move(processor);
    entry.priority = priority;
    entry.stage = stage;
    return pImpl->add(pImpl->post, std::move(entry));
}

bool PluginRegistry::unregisterPostProcessor(std::string_view name) {
    return pImpl->remove(pImpl->post, name);
}

void PluginRegistry::clearPostProcessors() {
    pImpl->clear(pImpl->post);
}

std::vector<std::string> PluginRegistry::listPostProcessors() const {
    return pImpl->names(pImpl->post);
}

Result<void> PluginRegistry::registerValidator(std::shared_ptr<Validator> validator,
                                               std::int32_t priority) {
    ValidatorEntry entry;
    entry.name = validator ? validator->name() : std::string();
    entry.plugin = std::move(validator);
    entry.priority = priority;
    return pImpl->add(pImpl->validators, std::move(entry));
}

bool PluginRegistry::unregisterValidator(std::string_view name) {
    return pImpl->remove(pImpl->validators, name);
}

void PluginRegistry::clearValidators() {
    pImpl->clear(pImpl->validators);
}

std::vector<std::string> PluginRegistry::listValidators() const {
    return pImpl->names(pImpl->validators);
}

Result<void> PluginRegistry::registerDocumentExtractor(std::shared_ptr<DocumentExtractor> extractor,
                                                       std::vector<std::string> mimeTypes,
                                                       std::int32_t priority) {
    if (mimeTypes.empty())
        return Error{ErrorCode::InvalidArgument,
                     "Document extractor must declare at least one MIME type"};
    DocumentExtractorEntry entry;
    entry.name = extractor ? extractor->name() : std::string();
    entry.plugin = std::move(extractor);
    for (auto& mime : mimeTypes)
        entry.mime_types.push_back(lowercase(mime));
    entry.priority = priority;
    return pImpl->add(pImpl->extractors, std::move(entry));
}

bool PluginRegistry::unregisterDocumentExtractor(std::string_view name) {
    return pImpl->remove(pImpl->extractors, name);
}

void PluginRegistry::clearDocumentExtractors() {
    pImpl->clear(pImpl->extractors);
}

std::vector<std::string> PluginRegistry::listDocumentExtractors() const {
    return pImpl->names(pImpl->extractors);
}

std::shared_ptr<const PluginSnapshot> PluginRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->cached)
        return pImpl->cached;

    auto snap = std::make_shared<PluginSnapshot>();
    snap->ocrBackends = pImpl->ocr.entries();
    snap->postProcessors = pImpl->post.entries();
    std::stable_sort(snap->postProcessors.begin(), snap->postProcessors.end(),
                     [](const PostProcessorEntry& a, const PostProcessorEntry& b) {
                         return static_cast<int>(a.stage) < static_cast<int>(b.stage);
                     });
    snap->validators = pImpl->validators.entries();
    sortByPriority(snap->validators);
    snap->documentExtractors = pImpl->extractors.entries();
    sortByPriority(snap->documentExtractors);

    pImpl->cached = snap;
    return snap;
}

} // namespace kreuzberg::plugins
