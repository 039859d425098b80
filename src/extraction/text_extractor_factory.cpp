#include <kreuzberg/extraction/html_text_extractor.h>
#include <kreuzberg/extraction/plain_text_extractor.h>
#include <kreuzberg/extraction/text_extractor.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace kreuzberg::extraction {

namespace {

std::string normalizeKey(std::string_view mimeType) {
    if (auto semi = mimeType.find(';'); semi != std::string_view::npos)
        mimeType = mimeType.substr(0, semi);
    std::string key(mimeType);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    while (!key.empty() && std::isspace(static_cast<unsigned char>(key.back())))
        key.pop_back();
    return key;
}

} // namespace

bool ITextExtractor::canExtract(std::string_view mimeType) const {
    auto wanted = normalizeKey(mimeType);
    auto supported = supportedMimeTypes();
    return std::any_of(supported.begin(), supported.end(),
                       [&](const std::string& m) { return normalizeKey(m) == wanted; });
}

// Built-in extractors are registered here rather than through static registrars,
// which a static library link would drop.
TextExtractorFactory::TextExtractorFactory() {
    registerExtractor(PlainTextExtractor::mimeTypes(),
                      []() { return std::make_unique<PlainTextExtractor>(); });
    registerExtractor(HtmlTextExtractor::mimeTypes(),
                      []() { return std::make_unique<HtmlTextExtractor>(); });

    spdlog::debug("TextExtractorFactory initialized with {} MIME types", extractors_.size());
}

TextExtractorFactory& TextExtractorFactory::instance() {
    static TextExtractorFactory instance;
    return instance;
}

std::unique_ptr<ITextExtractor> TextExtractorFactory::create(std::string_view mimeType) const {
    auto key = normalizeKey(mimeType);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = extractors_.find(key);
    if (it != extractors_.end())
        return it->second();
    return nullptr;
}

void TextExtractorFactory::registerExtractor(const std::vector<std::string>& mimeTypes,
                                             ExtractorCreator creator) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& mime : mimeTypes)
        extractors_[normalizeKey(mime)] = creator;
}

std::vector<std::string> TextExtractorFactory::supportedMimeTypes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> mimeTypes;
    mimeTypes.reserve(extractors_.size());
    for (const auto& [mime, _] : extractors_)
        mimeTypes.push_back(mime);
    std::sort(mimeTypes.begin(), mimeTypes.end());
    return mimeTypes;
}

bool TextExtractorFactory::isSupported(std::string_view mimeType) const {
    auto key = normalizeKey(mimeType);
    std::lock_guard<std::mutex> lock(mutex_);
    return extractors_.find(key) != extractors_.end();
}

} // namespace kreuzberg::extraction
