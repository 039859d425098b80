#include <kreuzberg/config/validation.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace kreuzberg::config {

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool contains(const std::vector<std::string>& list, std::string_view value) {
    return std::find(list.begin(), list.end(), lower(value)) != list.end();
}

std::string joined(const std::vector<std::string>& list) {
    std::ostringstream oss;
    for (size_t i = 0; i < list.size(); ++i) {
        if (i)
            oss << ", ";
        oss << list[i];
    }
    return oss.str();
}

Error invalid(std::string_view field, const std::string& constraint, const std::string& got) {
    std::string msg(field);
    msg += ": ";
    msg += constraint;
    msg += " (got ";
    msg += got;
    msg += ")";
    return Error{ErrorCode::ValidationError, std::move(msg)};
}

} // namespace

const std::vector<std::string>& validBinarizationMethods() {
    static const std::vector<std::string> methods = {"otsu", "adaptive", "sauvola"};
    return methods;
}

const std::vector<std::string>& validOcrBackends() {
    static const std::vector<std::string> backends = {"tesseract", "easyocr", "paddleocr"};
    return backends;
}

const std::vector<std::string>& validLanguageCodes() {
    // ISO 639-1 codes followed by the ISO 639-3 / Tesseract codes in common use.
    static const std::vector<std::string> codes = {
        "af",  "ar",  "az",  "be",  "bg",  "bn",  "bs",  "ca",  "cs",  "cy",  "da",  "de",
        "el",  "en",  "eo",  "es",  "et",  "eu",  "fa",  "fi",  "fr",  "ga",  "gl",  "gu",
        "he",  "hi",  "hr",  "hu",  "hy",  "id",  "is",  "it",  "ja",  "ka",  "kk",  "km",
        "kn",  "ko",  "la",  "lt",  "lv",  "mk",  "ml",  "mn",  "mr",  "ms",  "mt",  "my",
        "ne",  "nl",  "no",  "pa",  "pl",  "pt",  "ro",  "ru",  "sk",  "sl",  "sq",  "sr",
        "sv",  "sw",  "ta",  "te",  "th",  "tl",  "tr",  "uk",  "ur",  "uz",  "vi",  "yi",
        "zh",  "afr", "ara", "aze", "bel", "ben", "bos", "bul", "cat", "ces", "chi_sim",
        "chi_tra", "cym", "dan", "deu", "ell", "eng", "epo", "est", "eus", "fas", "fin",
        "fra", "gle", "glg", "guj", "heb", "hin", "hrv", "hun", "hye", "ind", "isl", "ita",
        "jpn", "kan", "kat", "kaz", "khm", "kor", "lat", "lav", "lit", "mal", "mar", "mkd",
        "mlt", "mon", "msa", "mya", "nep", "nld", "nor", "osd", "pan", "pol", "por", "ron",
        "rus", "slk", "slv", "spa", "sqi", "srp", "swa", "swe", "tam", "tel", "tgl", "tha",
        "tur", "ukr", "urd", "uzb", "vie", "yid", "zho"};
    return codes;
}

const std::vector<std::string>& validTokenReductionLevels() {
    static const std::vector<std::string> levels = {"off", "light", "moderate", "aggressive",
                                                    "maximum"};
    return levels;
}

const std::vector<std::string>& validTesseractOutputFormats() {
    static const std::vector<std::string> formats = {"text", "markdown", "hocr", "tsv"};
    return formats;
}

Result<void> validateBinarizationMethod(std::string_view method, std::string_view field) {
    if (!contains(validBinarizationMethods(), method))
        return invalid(field, "must be one of " + joined(validBinarizationMethods()),
                       "'" + std::string(method) + "'");
    return {};
}

Result<void> validateOcrBackend(std::string_view backend, std::string_view field) {
    if (!contains(validOcrBackends(), backend))
        return invalid(field, "must be one of " + joined(validOcrBackends()),
                       "'" + std::string(backend) + "'");
    return {};
}

Result<void> validateLanguageCode(std::string_view code, std::string_view field) {
    if (code.empty())
        return invalid(field, "must not be empty", "''");

    size_t start = 0;
    while (start <= code.size()) {
        size_t plus = code.find('+', start);
        auto part = code.substr(start, plus == std::string_view::npos ? std::string_view::npos
                                                                      : plus - start);
        if (!contains(validLanguageCodes(), part))
            return invalid(field, "must be an ISO 639-1 or ISO 639-3 language code",
                           "'" + std::string(code) + "'");
        if (plus == std::string_view::npos)
            break;
        start = plus + 1;
    }
    return {};
}

Result<void> validateTokenReductionLevel(std::string_view level, std::string_view field) {
    if (!contains(validTokenReductionLevels(), level))
        return invalid(field, "must be one of " + joined(validTokenReductionLevels()),
                       "'" + std::string(level) + "'");
    return {};
}

Result<void> validateTesseractPsm(std::int64_t psm, std::string_view field) {
    if (psm < 0 || psm > 13)
        return invalid(field, "must be between 0 and 13", std::to_string(psm));
    return {};
}

Result<void> validateTesseractOem(std::int64_t oem, std::string_view field) {
    if (oem < 0 || oem > 3)
        return invalid(field, "must be between 0 and 3", std::to_string(oem));
    return {};
}

Result<void> validateTesseractOutputFormat(std::string_view format, std::string_view field) {
    if (!contains(validTesseractOutputFormats(), format))
        return invalid(field, "must be one of " + joined(validTesseractOutputFormats()),
                       "'" + std::string(format) + "'");
    return {};
}

Result<void> validateConfidence(double value, std::string_view field) {
    if (std::isnan(value) || value < 0.0 || value > 1.0)
        return invalid(field, "must be between 0.0 and 1.0", std::to_string(value));
    return {};
}

Result<void> validateDpi(std::int64_t dpi, std::string_view field) {
    if (dpi < kMinDpi || dpi > kMaxDpi)
        return invalid(field,
                       "must be between " + std::to_string(kMinDpi) + " and " +
                           std::to_string(kMaxDpi),
                       std::to_string(dpi));
    return {};
}

Result<void> validatePositive(std::int64_t value, std::string_view field) {
    if (value <= 0)
        return invalid(field, "must be greater than 0", std::to_string(value));
    return {};
}

Result<void> validateChunkingParams(std::int64_t maxChars, std::int64_t maxOverlap,
                                    std::string_view field) {
    std::string prefix(field);
    if (auto r = validatePositive(maxChars, prefix + ".max_chars"); !r)
        return r;
    if (maxOverlap < 0)
        return invalid(prefix + ".max_overlap", "must not be negative",
                       std::to_string(maxOverlap));
    if (maxOverlap >= maxChars)
        return invalid(prefix + ".max_overlap",
                       "must be less than max_chars (" + std::to_string(maxChars) + ")",
                       std::to_string(maxOverlap));
    return {};
}

} // namespace kreuzberg::config
