#include <kreuzberg/detection/mime_detector.h>
#include <kreuzberg/extraction/text_extractor.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_set>
#include <vector>

namespace kreuzberg::extraction {

std::string EncodingDetector::detectEncoding(ByteSpan data, double* confidence) {
    auto report = [confidence](double c) {
        if (confidence)
            *confidence = c;
    };

    if (data.size() >= 3 && data[0] == 0xEF && data[1] == 0xBB && data[2] == 0xBF) {
        report(1.0);
        return "UTF-8";
    }
    if (data.size() >= 2) {
        if (data[0] == 0xFF && data[1] == 0xFE) {
            report(1.0);
            return "UTF-16LE";
        }
        if (data[0] == 0xFE && data[1] == 0xFF) {
            report(1.0);
            return "UTF-16BE";
        }
    }

    if (detection::isValidUtf8(data)) {
        report(0.9);
        return "UTF-8";
    }

    report(0.5);
    return "ISO-8859-1";
}

void appendUtf8FromCodepoint(std::uint32_t cp, std::string& out) {
    if (cp <= 0x7F) {
        out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

namespace {

std::string utf16ToUtf8(std::string_view text, bool littleEndian) {
    auto byteAt = [&](size_t i) { return static_cast<std::uint8_t>(text[i]); };
    auto wordAt = [&](size_t i) -> std::uint16_t {
        return littleEndian ? static_cast<std::uint16_t>(byteAt(i + 1) << 8 | byteAt(i))
                            : static_cast<std::uint16_t>(byteAt(i) << 8 | byteAt(i + 1));
    };

    size_t i = 0;
    if (text.size() >= 2 && wordAt(0) == 0xFEFF)
        i = 2;

    std::string out;
    out.reserve(text.size());
    while (i + 1 < text.size()) {
        std::uint16_t w = wordAt(i);
        i += 2;
        if (w >= 0xD800 && w <= 0xDBFF) {
            if (i + 1 >= text.size()) {
                appendUtf8FromCodepoint(0xFFFD, out);
                break;
            }
            std::uint16_t w2 = wordAt(i);
            if (w2 < 0xDC00 || w2 > 0xDFFF) {
                appendUtf8FromCodepoint(0xFFFD, out);
                continue;
            }
            i += 2;
            appendUtf8FromCodepoint(0x10000 + (((w - 0xD800) << 10) | (w2 - 0xDC00)), out);
        } else if (w >= 0xDC00 && w <= 0xDFFF) {
            appendUtf8FromCodepoint(0xFFFD, out);
        } else {
            appendUtf8FromCodepoint(w, out);
        }
    }
    return out;
}

} // namespace

Result<std::string> EncodingDetector::convertToUtf8(std::string_view text,
                                                    const std::string& fromEncoding) {
    std::string enc = fromEncoding;
    std::transform(enc.begin(), enc.end(), enc.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (enc == "UTF-8" || enc == "UTF8" || enc == "ASCII" || enc == "US-ASCII")
        return std::string(text);

    if (enc == "ISO-8859-1" || enc == "LATIN1" || enc == "LATIN-1") {
        std::string out;
        out.reserve(text.size());
        for (unsigned char b : text)
            appendUtf8FromCodepoint(b, out);
        return out;
    }

    if (enc == "UTF-16LE" || enc == "UTF-16BE")
        return utf16ToUtf8(text, enc == "UTF-16LE");

    return Error{ErrorCode::InvalidArgument, "Unsupported encoding conversion: " + fromEncoding};
}

Result<std::string> EncodingDetector::decodeToUtf8(ByteSpan data, std::string* encodingOut) {
    double confidence = 0.0;
    auto encoding = detectEncoding(data, &confidence);
    if (encodingOut)
        *encodingOut = encoding;

    std::string_view raw(reinterpret_cast<const char*>(data.data()), data.size());
    if (encoding == "UTF-8") {
        if (raw.size() >= 3 && data[0] == 0xEF && data[1] == 0xBB && data[2] == 0xBF)
            raw.remove_prefix(3);
        return std::string(raw);
    }
    if (encoding == "ISO-8859-1" && detection::isBinaryData(data))
        return Error{ErrorCode::ParsingError,
                     "Content is neither valid UTF-8 nor a recognised text encoding"};
    return convertToUtf8(raw, encoding);
}

namespace {

struct StopWords {
    const char* code;
    std::vector<std::string_view> words;
};

const std::vector<StopWords>& stopWordTable() {
    static const std::vector<StopWords> table = {
        {"eng", {"the", "is", "are", "and", "or", "but", "in", "on", "at", "to", "for", "of",
                 "with", "this", "that", "was", "were", "be", "it", "from"}},
        {"spa", {"el", "la", "los", "las", "de", "que", "y", "en", "un", "una", "es", "por",
                 "con", "para", "del", "se", "no", "como"}},
        {"fra", {"le", "les", "de", "des", "un", "une", "et", "est", "pour", "dans", "que",
                 "avec", "sur", "pas", "ce", "qui", "du"}},
        {"deu", {"der", "die", "das", "und", "ist", "nicht", "mit", "ein", "eine", "zu", "von",
                 "auf", "den", "dem", "sich", "auch", "wird"}},
        {"ita", {"il", "lo", "gli", "di", "che", "e", "un", "una", "per", "con", "non", "sono",
                 "della", "nel", "anche", "come"}},
        {"por", {"o", "os", "as", "de", "que", "e", "um", "uma", "para", "com", "não", "em",
                 "do", "da", "se", "mais"}},
        {"nld", {"de", "het", "een", "en", "van", "is", "dat", "niet", "met", "op", "voor",
                 "zijn", "ook", "maar", "wordt"}},
    };
    return table;
}

// Lowercased ASCII words; bytes >= 0x80 are kept so UTF-8 words stay intact
std::unordered_set<std::string> distinctWords(std::string_view text) {
    std::unordered_set<std::string> words;
    std::string current;
    for (unsigned char c : text) {
        if (std::isalpha(c) || c >= 0x80) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            words.insert(std::move(current));
            current.clear();
        }
    }
    if (!current.empty())
        words.insert(std::move(current));
    return words;
}

double confidenceForScore(int score) {
    if (score > 5)
        return 0.9;
    if (score > 2)
        return 0.7;
    return 0.3;
}

std::vector<std::pair<std::string, int>> scoreLanguages(std::string_view text) {
    auto words = distinctWords(text);
    std::vector<std::pair<std::string, int>> scores;
    for (const auto& entry : stopWordTable()) {
        int score = 0;
        for (auto w : entry.words) {
            if (words.contains(std::string(w)))
                ++score;
        }
        if (score > 0)
            scores.emplace_back(entry.code, score);
    }
    std::stable_sort(scores.begin(), scores.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    return scores;
}

} // namespace

std::string LanguageDetector::detectLanguage(std::string_view text, double* confidence) {
    auto scores = scoreLanguages(text);
    if (scores.empty()) {
        if (confidence)
            *confidence = 0.3;
        return "eng";
    }
    if (confidence)
        *confidence = confidenceForScore(scores.front().second);
    return scores.front().first;
}

std::vector<LanguageScore> LanguageDetector::detectLanguages(std::string_view text,
                                                             double minConfidence,
                                                             bool detectMultiple) {
    std::vector<LanguageScore> detected;
    auto scores = scoreLanguages(text);
    if (scores.empty())
        return detected;

    const int best = scores.front().second;
    for (const auto& [code, score] : scores) {
        // Shared stop words ("de", "que") lift neighbours; only count close runners-up
        if (score * 2 < best)
            break;
        double conf = confidenceForScore(score);
        if (conf >= minConfidence)
            detected.push_back({code, conf});
        if (!detectMultiple)
            break;
    }
    return detected;
}

} // namespace kreuzberg::extraction
