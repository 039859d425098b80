#include <kreuzberg/crypto/sha256_hasher.h>
#include <kreuzberg/detection/mime_detector.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <unordered_map>

#ifdef KREUZBERG_HAS_LIBMAGIC
#include <magic.h>
#endif

namespace kreuzberg::detection {

namespace {

constexpr const char* kDocxMime =
    "application/vnd.openxmlformats-officedocument.wordprocessingml.document";
constexpr const char* kXlsxMime =
    "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet";
constexpr const char* kPptxMime =
    "application/vnd.openxmlformats-officedocument.presentationml.presentation";

// Extension (lowercase, no dot) to MIME type
const std::map<std::string, std::string, std::less<>> EXTENSION_MIME_MAP = {
    // Text formats
    {"txt", "text/plain"},
    {"md", "text/markdown"},
    {"markdown", "text/markdown"},
    {"commonmark", "text/x-commonmark"},
    {"djot", "text/x-djot"},
    {"rst", "text/x-rst"},
    {"org", "text/x-org"},
    {"html", "text/html"},
    {"htm", "text/html"},
    {"csv", "text/csv"},
    {"tsv", "text/tab-separated-values"},
    {"json", "application/json"},
    {"yaml", "application/x-yaml"},
    {"yml", "application/x-yaml"},
    {"toml", "application/toml"},
    {"xml", "application/xml"},
    {"svg", "image/svg+xml"},

    // Documents
    {"pdf", "application/pdf"},
    {"doc", "application/msword"},
    {"docx", kDocxMime},
    {"odt", "application/vnd.oasis.opendocument.text"},
    {"xls", "application/vnd.ms-excel"},
    {"xlsx", kXlsxMime},
    {"xlsm", "application/vnd.ms-excel.sheet.macroEnabled.12"},
    {"xlsb", "application/vnd.ms-excel.sheet.binary.macroEnabled.12"},
    {"xlam", "application/vnd.ms-excel.addin.macroEnabled.12"},
    {"xla", "application/vnd.ms-excel.template.macroEnabled.12"},
    {"ods", "application/vnd.oasis.opendocument.spreadsheet"},
    {"ppt", "application/vnd.ms-powerpoint"},
    {"pptx", kPptxMime},
    {"ppsx", "application/vnd.openxmlformats-officedocument.presentationml.slideshow"},
    {"pptm", "application/vnd.ms-powerpoint.presentation.macroEnabled.12"},
    {"rtf", "application/rtf"},
    {"epub", "application/epub+zip"},
    {"eml", "message/rfc822"},
    {"msg", "application/vnd.ms-outlook"},
    {"bib", "application/x-bibtex"},
    {"ris", "application/x-research-info-systems"},
    {"nbib", "application/x-pubmed"},
    {"enw", "application/x-endnote+xml"},
    {"fb2", "application/x-fictionbook+xml"},
    {"opml", "application/xml+opml"},
    {"dbk", "application/docbook+xml"},
    {"docbook", "application/docbook+xml"},
    {"jats", "application/x-jats+xml"},
    {"ipynb", "application/x-ipynb+json"},
    {"tex", "application/x-latex"},
    {"latex", "application/x-latex"},
    {"typst", "application/x-typst"},
    {"typ", "application/x-typst"},

    // Images
    {"bmp", "image/bmp"},
    {"gif", "image/gif"},
    {"jpg", "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"png", "image/png"},
    {"tiff", "image/tiff"},
    {"tif", "image/tiff"},
    {"webp", "image/webp"},
    {"jp2", "image/jp2"},
    {"j2k", "image/jp2"},
    {"j2c", "image/jp2"},
    {"jpx", "image/jpx"},
    {"jpm", "image/jpm"},
    {"mj2", "image/mj2"},
    {"jbig2", "image/x-jbig2"},
    {"jb2", "image/x-jbig2"},
    {"pnm", "image/x-portable-anymap"},
    {"pbm", "image/x-portable-bitmap"},
    {"pgm", "image/x-portable-graymap"},
    {"ppm", "image/x-portable-pixmap"},

    // Archives
    {"zip", "application/zip"},
    {"tar", "application/x-tar"},
    {"gz", "application/gzip"},
    {"tgz", "application/gzip"},
    {"7z", "application/x-7z-compressed"},
};

// MIME types accepted as extraction input, in canonical spelling
const std::set<std::string, std::less<>>& supportedMimeTypes() {
    static const std::set<std::string, std::less<>> supported = [] {
        std::set<std::string, std::less<>> s;
        for (const auto& [ext, mime] : EXTENSION_MIME_MAP)
            s.insert(mime);
        for (const char* extra : {
                 "text/x-markdown", "text/x-gfm", "text/x-markdown-extra",
                 "text/x-multimarkdown", "text/x-dokuwiki", "text/x-mdoc", "text/x-pod",
                 "text/x-opml", "text/troff", "text/djot", "text/org", "application/x-org",
                 "text/prs.fallenstein.rst", "text/x-tex", "text/x-typst", "text/jats",
                 "text/json", "text/yaml", "text/x-yaml", "application/yaml", "text/toml",
                 "text/xml", "application/xhtml+xml", "text/rtf", "text/docbook",
                 "application/csl+json", "application/x-biblatex", "text/x-bibtex",
                 "application/x-fictionbook", "text/x-fictionbook", "application/x-opml+xml",
                 "application/x-epub+zip", "application/vnd.epub+zip",
                 "application/x-zip-compressed", "application/tar", "application/x-gtar",
                 "application/x-ustar", "application/x-gzip", "image/jpg", "image/pjpeg",
                 "image/x-bmp", "image/x-ms-bmp", "image/x-tiff"})
            s.insert(extra);
        return s;
    }();
    return supported;
}

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// "Text/HTML; charset=utf-8" -> "Text/HTML"
std::string_view stripParameters(std::string_view mime) {
    if (auto semi = mime.find(';'); semi != std::string_view::npos)
        mime = mime.substr(0, semi);
    while (!mime.empty() && std::isspace(static_cast<unsigned char>(mime.back())))
        mime.remove_suffix(1);
    while (!mime.empty() && std::isspace(static_cast<unsigned char>(mime.front())))
        mime.remove_prefix(1);
    return mime;
}

bool containsAscii(ByteSpan data, std::string_view needle) {
    if (needle.empty() || data.size() < needle.size())
        return false;
    auto it = std::search(data.begin(), data.end(), needle.begin(), needle.end(),
                          [](std::uint8_t a, char b) { return a == static_cast<std::uint8_t>(b); });
    return it != data.end();
}

std::string_view skipLeadingWhitespace(std::string_view text) {
    if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
        static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF)
        text.remove_prefix(3);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    return text;
}

bool startsWithNoCase(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size())
        return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i])))
            return false;
    }
    return true;
}

// ZIP containers are refined by the part names recorded in their local headers
std::optional<std::string> refineZipContainer(ByteSpan data) {
    if (containsAscii(data, "word/document.xml"))
        return std::string(kDocxMime);
    if (containsAscii(data, "xl/workbook.xml"))
        return std::string(kXlsxMime);
    if (containsAscii(data, "ppt/presentation.xml"))
        return std::string(kPptxMime);
    if (containsAscii(data, "mimetypeapplication/epub+zip"))
        return std::string("application/epub+zip");
    if (containsAscii(data, "mimetypeapplication/vnd.oasis.opendocument.text"))
        return std::string("application/vnd.oasis.opendocument.text");
    if (containsAscii(data, "mimetypeapplication/vnd.oasis.opendocument.spreadsheet"))
        return std::string("application/vnd.oasis.opendocument.spreadsheet");
    return std::nullopt;
}

// Container families whose members share one signature
int containerFamily(std::string_view mime) {
    static const std::set<std::string, std::less<>> zipFamily = {
        "application/zip",
        kDocxMime,
        kXlsxMime,
        kPptxMime,
        "application/vnd.ms-excel.sheet.macroEnabled.12",
        "application/vnd.ms-excel.sheet.binary.macroEnabled.12",
        "application/vnd.ms-excel.addin.macroEnabled.12",
        "application/vnd.ms-excel.template.macroEnabled.12",
        "application/vnd.openxmlformats-officedocument.presentationml.slideshow",
        "application/vnd.ms-powerpoint.presentation.macroEnabled.12",
        "application/epub+zip",
        "application/vnd.oasis.opendocument.text",
        "application/vnd.oasis.opendocument.spreadsheet"};
    static const std::set<std::string, std::less<>> oleFamily = {
        "application/msword", "application/vnd.ms-excel", "application/vnd.ms-powerpoint",
        "application/vnd.ms-outlook"};
    if (zipFamily.contains(mime))
        return 1;
    if (oleFamily.contains(mime))
        return 2;
    return 0;
}

// Text heuristics for valid UTF-8 content; ordered so HTML wins over generic markup
MimeSignature sniffText(ByteSpan data) {
    MimeSignature sig;
    sig.isBinary = false;
    sig.category = "text";
    sig.magicNumber = MimeDetector::bytesToHex(data, 16);

    std::string_view text(reinterpret_cast<const char*>(data.data()), data.size());
    auto trimmed = skipLeadingWhitespace(text);

    if (!trimmed.empty() && (trimmed.front() == '{' || trimmed.front() == '[')) {
        if (nlohmann::json::accept(trimmed)) {
            sig.mimeType = "application/json";
            sig.description = "JSON document";
            sig.confidence = 0.5f;
            return sig;
        }
    }
    if (startsWithNoCase(trimmed, "<!doctype html") || startsWithNoCase(trimmed, "<html")) {
        sig.mimeType = "text/html";
        sig.description = "HTML document";
        sig.confidence = 0.5f;
        return sig;
    }
    if (startsWithNoCase(trimmed, "<?xml")) {
        auto head = toLower(trimmed.substr(0, std::min<size_t>(trimmed.size(), 512)));
        if (head.find("<svg") != std::string::npos) {
            sig.mimeType = "image/svg+xml";
            sig.category = "image";
            sig.description = "SVG image";
        } else if (head.find("<html") != std::string::npos) {
            sig.mimeType = "text/html";
            sig.description = "XHTML document";
        } else {
            sig.mimeType = "application/xml";
            sig.description = "XML document";
        }
        sig.confidence = 0.5f;
        return sig;
    }
    if (startsWithNoCase(trimmed, "<svg")) {
        sig.mimeType = "image/svg+xml";
        sig.category = "image";
        sig.description = "SVG image";
        sig.confidence = 0.5f;
        return sig;
    }
    if (!trimmed.empty() && trimmed.front() == '<') {
        sig.mimeType = "application/xml";
        sig.description = "Markup document";
        sig.confidence = 0.4f;
        return sig;
    }

    sig.mimeType = "text/plain";
    sig.description = "Text file";
    sig.confidence = 0.4f;
    return sig;
}

} // namespace

class MimeDetector::Impl {
public:
    MimeDetectorConfig config;
    std::vector<MagicPattern> patterns;
    mutable std::mutex patternsMutex;

    mutable std::unordered_map<std::string, MimeSignature> cache;
    mutable std::mutex cacheMutex;
    mutable CacheStats cacheStats;

#ifdef KREUZBERG_HAS_LIBMAGIC
    magic_t magicCookie = nullptr;
    mutable std::mutex magicMutex; // libmagic handles are not thread-safe
#endif

    Impl() = default;

    ~Impl() {
#ifdef KREUZBERG_HAS_LIBMAGIC
        if (magicCookie) {
            std::lock_guard<std::mutex> lock(magicMutex);
            magic_close(magicCookie);
        }
#endif
    }

    Result<void> initializeLibMagic() {
#ifdef KREUZBERG_HAS_LIBMAGIC
        std::lock_guard<std::mutex> lock(magicMutex);
        if (magicCookie)
            return {};

        magicCookie = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
        if (!magicCookie)
            return Error{ErrorCode::InternalError, "Failed to initialize libmagic"};

        if (magic_load(magicCookie, nullptr) != 0) {
            std::string error = magic_error(magicCookie);
            magic_close(magicCookie);
            magicCookie = nullptr;
            return Error{ErrorCode::MissingDependency, "Failed to load magic database: " + error};
        }
        return {};
#else
        return Error{ErrorCode::MissingDependency, "libmagic support not compiled in"};
#endif
    }

    std::optional<MimeSignature> detectWithLibMagic(ByteSpan data [[maybe_unused]]) {
#ifdef KREUZBERG_HAS_LIBMAGIC
        std::lock_guard<std::mutex> lock(magicMutex);
        if (!magicCookie)
            return std::nullopt;

        const char* mimeType = magic_buffer(magicCookie, data.data(), data.size());
        if (!mimeType) {
            spdlog::debug("libmagic detection failed: {}", magic_error(magicCookie));
            return std::nullopt;
        }

        MimeSignature sig;
        sig.mimeType = mimeType;
        sig.magicNumber = MimeDetector::bytesToHex(data, 16);
        sig.category = MimeDetector::category(sig.mimeType);
        sig.isBinary = !MimeDetector::isTextMime(sig.mimeType);
        sig.confidence = 0.95f;
        sig.description = sig.category + " file";
        return sig;
#else
        return std::nullopt;
#endif
    }

    std::optional<MimeSignature> detectWithPatterns(ByteSpan data) const {
        std::lock_guard<std::mutex> lock(patternsMutex);

        auto matchPass = [&](bool excludeGeneric) -> std::optional<MimeSignature> {
            const MagicPattern* best = nullptr;
            for (const auto& pattern : patterns) {
                if (excludeGeneric && (pattern.mimeType == kOctetStream ||
                                       pattern.category == "binary"))
                    continue;
                if (data.size() < pattern.offset + pattern.pattern.size())
                    continue;
                if (!std::equal(pattern.pattern.begin(), pattern.pattern.end(),
                                data.begin() + pattern.offset))
                    continue;
                if (!best || pattern.confidence > best->confidence)
                    best = &pattern;
            }
            if (!best)
                return std::nullopt;

            MimeSignature sig;
            sig.mimeType = best->mimeType;
            sig.category = best->category;
            sig.description = best->description;
            sig.magicNumber = best->patternHex;
            sig.confidence = best->confidence;
            sig.isBinary = best->category != "text";
            return sig;
        };

        if (auto res = matchPass(true))
            return res;
        return matchPass(false);
    }
};

MimeDetector::MimeDetector() : pImpl(std::make_unique<Impl>()) {
    if (auto r = initialize(); !r)
        spdlog::warn("MIME detector initialization incomplete: {}", r.error().message);
}

MimeDetector::~MimeDetector() = default;

MimeDetector& MimeDetector::instance() {
    static MimeDetector instance;
    return instance;
}

Result<void> MimeDetector::initialize(const MimeDetectorConfig& config) {
    {
        std::lock_guard<std::mutex> lock(pImpl->patternsMutex);
        pImpl->config = config;
        pImpl->patterns.clear();
        if (config.useBuiltinPatterns)
            pImpl->patterns = getDefaultPatterns();
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->cacheMutex);
        pImpl->cache.clear();
        pImpl->cacheStats = {};
        pImpl->cacheStats.maxSize = config.cacheSize;
    }

    if (config.useLibMagic) {
        auto result = pImpl->initializeLibMagic();
        if (!result && result.error().code != ErrorCode::MissingDependency)
            return result;
        if (!result)
            spdlog::debug("MIME detection without libmagic: {}", result.error().message);
    }
    return {};
}

MimeSignature MimeDetector::detectFromBuffer(ByteSpan data) {
    if (data.empty()) {
        MimeSignature sig;
        sig.mimeType = kOctetStream;
        sig.category = "binary";
        sig.description = "Empty buffer";
        sig.confidence = 0.0f;
        return sig;
    }

    MimeDetectorConfig config;
    {
        std::lock_guard<std::mutex> lock(pImpl->patternsMutex);
        config = pImpl->config;
    }

    // JSON and ZIP sniffing read the whole buffer, so the key digests all of it
    std::string cacheKey;
    if (config.cacheResults) {
        cacheKey = crypto::SHA256Hasher::hash(std::as_bytes(data));
        std::lock_guard<std::mutex> lock(pImpl->cacheMutex);
        auto it = pImpl->cache.find(cacheKey);
        if (it != pImpl->cache.end()) {
            pImpl->cacheStats.hits++;
            return it->second;
        }
        pImpl->cacheStats.misses++;
    }

    std::optional<MimeSignature> result;

#ifdef KREUZBERG_HAS_LIBMAGIC
    if (config.useLibMagic) {
        if (auto magicResult = pImpl->detectWithLibMagic(data)) {
            // Generic answers are provisional; the patterns and text sniffing refine them
            const auto& m = magicResult->mimeType;
            if (m != kOctetStream && m != "text/plain" && m != "application/zip")
                result = std::move(magicResult);
        }
    }
#endif

    if (!result && config.useBuiltinPatterns)
        result = pImpl->detectWithPatterns(data);

    if (result && result->mimeType == "application/zip") {
        if (auto refined = refineZipContainer(data)) {
            result->mimeType = *refined;
            result->category = category(*refined);
            result->description = "Office Open XML container";
        }
    }

    if (!result && isValidUtf8(data) && !isBinaryData(data))
        result = sniffText(data);

    if (!result) {
        MimeSignature sig;
        sig.mimeType = kOctetStream;
        sig.category = "binary";
        sig.description = "Binary file";
        sig.magicNumber = bytesToHex(data, 16);
        sig.isBinary = true;
        sig.confidence = 0.1f;
        result = std::move(sig);
    }

    if (config.cacheResults) {
        std::lock_guard<std::mutex> lock(pImpl->cacheMutex);
        if (pImpl->cache.size() >= config.cacheSize && !pImpl->cache.empty())
            pImpl->cache.erase(pImpl->cache.begin());
        pImpl->cache[cacheKey] = *result;
        pImpl->cacheStats.entries = pImpl->cache.size();
    }

    return *result;
}

Result<MimeSignature> MimeDetector::detectFromFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return Error{ErrorCode::NotFound, "File not found: " + path.string()};
    if (std::filesystem::is_directory(path, ec))
        return Error{ErrorCode::IoError, "Path is a directory: " + path.string()};

    std::ifstream file(path, std::ios::binary);
    if (!file)
        return Error{ErrorCode::IoError, "Cannot open file: " + path.string()};

    size_t maxBytes = 0;
    {
        std::lock_guard<std::mutex> lock(pImpl->patternsMutex);
        maxBytes = pImpl->config.maxBytesToRead;
    }
    ByteVector buffer(maxBytes);
    file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    buffer.resize(static_cast<size_t>(file.gcount()));

    auto sig = detectFromBuffer(buffer);
    auto byExt = mimeFromExtension(path.extension().string());
    if (sig.confidence >= 0.8f) {
        // A container signature only narrows the family; the extension names the member
        int family = containerFamily(sig.mimeType);
        if (!byExt || family == 0 || containerFamily(*byExt) != family)
            return sig;
        sig.mimeType = *byExt;
        sig.category = category(*byExt);
        return sig;
    }

    if (byExt) {
        MimeSignature extSig;
        extSig.mimeType = *byExt;
        extSig.category = category(*byExt);
        extSig.isBinary = !isTextMime(*byExt);
        extSig.magicNumber = bytesToHex(buffer, 16);
        extSig.description = "Detected by extension";
        extSig.confidence = 0.6f;
        return extSig;
    }
    return sig;
}

Result<void> MimeDetector::addPattern(const MagicPattern& pattern) {
    MagicPattern p = pattern;
    if (p.pattern.empty()) {
        auto bytes = hexToBytes(p.patternHex);
        if (!bytes)
            return bytes.error();
        p.pattern = std::move(bytes).value();
    }
    if (p.pattern.empty())
        return Error{ErrorCode::InvalidArgument, "Pattern must not be empty"};
    if (p.mimeType.empty())
        return Error{ErrorCode::InvalidArgument, "Pattern needs a MIME type"};
    if (p.patternHex.empty())
        p.patternHex = bytesToHex(p.pattern, p.pattern.size());
    if (p.category.empty())
        p.category = category(p.mimeType);

    {
        std::lock_guard<std::mutex> lock(pImpl->patternsMutex);
        pImpl->patterns.push_back(std::move(p));
    }
    clearCache();
    return {};
}

std::vector<MagicPattern> MimeDetector::getPatterns() const {
    std::lock_guard<std::mutex> lock(pImpl->patternsMutex);
    return pImpl->patterns;
}

void MimeDetector::clearCache() {
    std::lock_guard<std::mutex> lock(pImpl->cacheMutex);
    pImpl->cache.clear();
    pImpl->cacheStats.entries = 0;
}

MimeDetector::CacheStats MimeDetector::getCacheStats() const {
    std::lock_guard<std::mutex> lock(pImpl->cacheMutex);
    return pImpl->cacheStats;
}

bool MimeDetector::hasLibMagic() const {
#ifdef KREUZBERG_HAS_LIBMAGIC
    std::lock_guard<std::mutex> lock(pImpl->magicMutex);
    return pImpl->magicCookie != nullptr;
#else
    return false;
#endif
}

std::optional<std::string> MimeDetector::mimeFromExtension(std::string_view extension) {
    if (!extension.empty() && extension.front() == '.')
        extension.remove_prefix(1);
    if (extension.empty())
        return std::nullopt;
    auto it = EXTENSION_MIME_MAP.find(toLower(extension));
    if (it == EXTENSION_MIME_MAP.end())
        return std::nullopt;
    return it->second;
}

std::vector<std::string> MimeDetector::extensionsForMime(std::string_view mimeType) {
    std::vector<std::string> extensions;
    auto wanted = toLower(stripParameters(mimeType));
    for (const auto& [ext, mime] : EXTENSION_MIME_MAP) {
        if (toLower(mime) == wanted)
            extensions.push_back(ext);
    }
    return extensions; // map order is already sorted
}

std::optional<std::string> MimeDetector::normalizeMime(std::string_view mimeType) {
    auto bare = stripParameters(mimeType);
    if (bare.empty())
        return std::nullopt;

    const auto& supported = supportedMimeTypes();
    if (auto it = supported.find(bare); it != supported.end())
        return *it;

    auto lower = toLower(bare);
    for (const auto& candidate : supported) {
        if (toLower(candidate) == lower)
            return candidate;
    }
    if (lower.rfind("image/", 0) == 0 && lower.size() > 6)
        return lower;
    return std::nullopt;
}

bool MimeDetector::isSupportedMime(std::string_view mimeType) {
    return normalizeMime(mimeType).has_value();
}

bool MimeDetector::isTextMime(std::string_view mimeType) {
    auto m = toLower(stripParameters(mimeType));
    if (m.rfind("text/", 0) == 0)
        return true;
    static const std::set<std::string, std::less<>> textual = {
        "application/json",      "application/xml",         "application/x-yaml",
        "application/yaml",      "application/toml",        "application/javascript",
        "application/x-sh",      "image/svg+xml",           "application/xhtml+xml",
        "application/x-latex",   "application/x-typst",     "application/x-bibtex",
        "application/rtf",       "application/x-ipynb+json", "application/csl+json",
        "application/x-research-info-systems", "application/x-pubmed",
        "application/docbook+xml", "application/x-jats+xml", "application/x-fictionbook+xml",
        "application/xml+opml",  "application/x-endnote+xml", "message/rfc822"};
    return textual.contains(m);
}

std::string MimeDetector::category(std::string_view mimeType) {
    auto mime = toLower(stripParameters(mimeType));
    if (mime == "image/svg+xml")
        return "image";
    if (mime.rfind("text/x-c", 0) == 0 || mime == "text/x-python" || mime == "text/x-java" ||
        mime == "text/x-rust" || mime == "text/x-go" || mime == "application/javascript" ||
        mime == "application/x-sh")
        return "code";
    if (mime.rfind("image/", 0) == 0)
        return "image";
    if (mime.rfind("video/", 0) == 0)
        return "video";
    if (mime.rfind("audio/", 0) == 0)
        return "audio";
    if (mime == "application/pdf" || mime == "application/msword" ||
        mime.rfind("application/vnd.", 0) == 0 || mime == "application/rtf" ||
        mime == "application/epub+zip" || mime == "message/rfc822")
        return "document";
    if (mime == "application/zip" || mime == "application/x-tar" || mime == "application/gzip" ||
        mime == "application/x-7z-compressed" || mime == "application/x-bzip2" ||
        mime == "application/x-xz" || mime == "application/x-rar-compressed")
        return "archive";
    if (isTextMime(mime))
        return "text";
    return "binary";
}

std::string MimeDetector::bytesToHex(ByteSpan data, size_t maxLength) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    size_t len = std::min(data.size(), maxLength);
    for (size_t i = 0; i < len; ++i)
        oss << std::setw(2) << static_cast<int>(data[i]);
    return oss.str();
}

Result<ByteVector> MimeDetector::hexToBytes(const std::string& hex) {
    if (hex.length() % 2 != 0)
        return Error{ErrorCode::InvalidArgument, "Hex string must have even length"};

    ByteVector bytes;
    bytes.reserve(hex.length() / 2);
    for (size_t i = 0; i < hex.length(); i += 2) {
        auto nibble = [](char c) -> int {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        };
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0)
            return Error{ErrorCode::InvalidArgument, "Invalid hex character in: " + hex};
        bytes.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

std::vector<MagicPattern> getDefaultPatterns() {
    struct PatternDef {
        const char* hex;
        size_t offset;
        const char* category;
        const char* mime;
        const char* desc;
        float confidence;
    };

    static constexpr std::array<PatternDef, 26> defs = {{
        // Images
        {"FFD8FF", 0, "image", "image/jpeg", "JPEG image", 1.0f},
        {"89504E470D0A1A0A", 0, "image", "image/png", "PNG image", 1.0f},
        {"474946383761", 0, "image", "image/gif", "GIF87a image", 1.0f},
        {"474946383961", 0, "image", "image/gif", "GIF89a image", 1.0f},
        {"424D", 0, "image", "image/bmp", "BMP image", 0.8f},
        {"57454250", 8, "image", "image/webp", "WebP image", 1.0f},
        {"49492A00", 0, "image", "image/tiff", "TIFF image (little-endian)", 1.0f},
        {"4D4D002A", 0, "image", "image/tiff", "TIFF image (big-endian)", 1.0f},
        {"0000000C6A5020200D0A870A", 0, "image", "image/jp2", "JPEG 2000 image", 1.0f},

        // Documents
        {"255044462D", 0, "document", "application/pdf", "PDF document", 1.0f},
        {"D0CF11E0A1B11AE1", 0, "document", "application/msword",
         "Microsoft Office compound document", 0.9f},
        {"7B5C72746631", 0, "document", "application/rtf", "Rich Text Format", 1.0f},

        // Archives
        {"504B0304", 0, "archive", "application/zip", "ZIP archive", 0.9f},
        {"504B0506", 0, "archive", "application/zip", "ZIP archive (empty)", 0.9f},
        {"1F8B", 0, "archive", "application/gzip", "GZIP archive", 1.0f},
        {"425A68", 0, "archive", "application/x-bzip2", "BZIP2 archive", 1.0f},
        {"377ABCAF271C", 0, "archive", "application/x-7z-compressed", "7-Zip archive", 1.0f},
        {"FD377A585A00", 0, "archive", "application/x-xz", "XZ archive", 1.0f},
        {"7573746172", 257, "archive", "application/x-tar", "TAR archive", 1.0f},

        // Audio and video
        {"57415645", 8, "audio", "audio/wav", "WAV audio", 1.0f},
        {"494433", 0, "audio", "audio/mpeg", "MP3 audio with ID3", 1.0f},
        {"4F676753", 0, "audio", "audio/ogg", "OGG container", 1.0f},
        {"66747970", 4, "video", "video/mp4", "MP4 container", 0.8f},

        // Executables
        {"7F454C46", 0, "binary", "application/x-executable", "ELF executable", 1.0f},
        {"4D5A", 0, "binary", "application/x-msdownload", "Windows executable", 0.7f},
        {"CAFEBABE", 0, "binary", "application/java-vm", "Java class file", 0.9f},
    }};

    std::vector<MagicPattern> patterns;
    patterns.reserve(defs.size());
    for (const auto& def : defs) {
        auto bytes = MimeDetector::hexToBytes(def.hex);
        if (!bytes) {
            spdlog::warn("Skipping malformed built-in signature {}", def.hex);
            continue;
        }
        MagicPattern pattern;
        pattern.pattern = std::move(bytes).value();
        pattern.patternHex = def.hex;
        pattern.offset = def.offset;
        pattern.category = def.category;
        pattern.mimeType = def.mime;
        pattern.description = def.desc;
        pattern.confidence = def.confidence;
        patterns.push_back(std::move(pattern));
    }
    return patterns;
}

bool isBinaryData(ByteSpan data) {
    if (data.empty())
        return false;

    size_t checkSize = std::min(data.size(), size_t(512));
    size_t controlChars = 0;
    size_t highBytes = 0;

    for (size_t i = 0; i < checkSize; ++i) {
        std::uint8_t byte = data[i];
        if (byte == 0)
            return true;
        if (byte < 32 && byte != '\t' && byte != '\n' && byte != '\r' && byte != '\f')
            controlChars++;
        if (byte >= 128)
            highBytes++;
    }

    // High bytes are fine as long as they form UTF-8; only control noise counts here
    if (controlChars > checkSize / 10)
        return true;
    return highBytes > checkSize * 3 / 10 && !isValidUtf8(data.first(checkSize));
}

bool isValidUtf8(ByteSpan data) {
    size_t i = 0;
    const size_t n = data.size();
    while (i < n) {
        std::uint8_t c = data[i];
        size_t extra = 0;
        std::uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + extra >= n) {
            // A sequence cut off by the sniff window is still acceptable
            for (size_t k = i + 1; k < n; ++k) {
                if ((data[k] & 0xC0) != 0x80)
                    return false;
            }
            return true;
        }
        for (size_t k = 1; k <= extra; ++k) {
            std::uint8_t cc = data[i + k];
            if ((cc & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) ||
            (extra == 3 && (cp < 0x10000 || cp > 0x10FFFF)) || (cp >= 0xD800 && cp <= 0xDFFF))
            return false;
        i += extra + 1;
    }
    return true;
}

std::string detectMimeType(ByteSpan data) {
    return MimeDetector::instance().detectFromBuffer(data).mimeType;
}

std::string detectMimeTypeFromPath(const std::filesystem::path& path) {
    auto sig = MimeDetector::instance().detectFromFile(path);
    if (sig)
        return sig.value().mimeType;
    if (auto byExt = MimeDetector::mimeFromExtension(path.extension().string()))
        return *byExt;
    return kOctetStream;
}

Result<std::string> detectMimeTypeFromExtension(const std::filesystem::path& path,
                                                bool checkExists) {
    if (checkExists) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
            return Error{ErrorCode::NotFound, "File does not exist: " + path.string()};
    }
    auto ext = path.extension().string();
    if (ext.empty())
        return Error{ErrorCode::ValidationError,
                     "Could not determine file extension: " + path.string()};
    if (auto mime = MimeDetector::mimeFromExtension(ext))
        return *mime;
    return Error{ErrorCode::UnsupportedFormat, "Unknown extension: " + ext};
}

} // namespace kreuzberg::detection
