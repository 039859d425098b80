#include <kreuzberg/processing/quality.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>

namespace kreuzberg::processing {

namespace {

struct TextStats {
    std::size_t chars = 0;
    std::size_t alnum = 0;
    std::size_t symbols = 0;
    std::size_t control = 0;
    std::size_t replacement = 0;
    std::size_t words = 0;
    std::size_t singleCharWords = 0;
    std::size_t sentences = 0;
    std::size_t longSpaceRuns = 0;
    std::size_t punctuationRuns = 0;
};

TextStats collect(std::string_view text) {
    TextStats s;
    std::size_t wordLen = 0;
    std::size_t spaceRun = 0;
    std::size_t punctRun = 0;

    auto endWord = [&]() {
        if (wordLen > 0) {
            ++s.words;
            if (wordLen == 1)
                ++s.singleCharWords;
        }
        wordLen = 0;
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        auto c = static_cast<unsigned char>(text[i]);
        if ((c & 0xC0) == 0x80)
            continue; // continuation byte, counted with its lead byte
        ++s.chars;

        // U+FFFD REPLACEMENT CHARACTER
        if (c == 0xEF && i + 2 < text.size() && static_cast<unsigned char>(text[i + 1]) == 0xBF &&
            static_cast<unsigned char>(text[i + 2]) == 0xBD)
            ++s.replacement;

        if (c == ' ' || c == '\t') {
            endWord();
            if (++spaceRun == 4)
                ++s.longSpaceRuns;
            punctRun = 0;
            continue;
        }
        spaceRun = 0;

        if (c == '\n' || c == '\r' || c == '\f') {
            endWord();
            punctRun = 0;
            continue;
        }
        if (c < 0x20 || c == 0x7F) {
            ++s.control;
            endWord();
            continue;
        }
        if (std::isalnum(c) || c >= 0x80) {
            ++s.alnum;
            ++wordLen;
            punctRun = 0;
            continue;
        }

        endWord();
        ++s.symbols;
        if (c == '.' || c == '!' || c == '?')
            ++s.sentences;
        if (++punctRun == 4)
            ++s.punctuationRuns;
    }
    endWord();
    return s;
}

double scriptResidue(std::string_view text) {
    static constexpr std::array<std::string_view, 8> markers = {
        "function(", "function (", "var ", "};", "=>", "document.", "window.", "<script"};
    std::size_t hits = 0;
    for (auto m : markers) {
        std::size_t pos = 0;
        while ((pos = text.find(m, pos)) != std::string_view::npos) {
            ++hits;
            pos += m.size();
        }
    }
    return static_cast<double>(hits);
}

} // namespace

double calculateQualityScore(std::string_view text, const nlohmann::json& metadata) {
    if (text.empty())
        return 0.0;

    const auto s = collect(text);
    if (s.chars == 0)
        return 0.0;

    double score = 1.0;
    const double chars = static_cast<double>(s.chars);

    // OCR debris
    score -= std::min(0.3, 10.0 * static_cast<double>(s.replacement + s.control) / chars);
    if (s.words >= 10) {
        double fragmentRatio =
            static_cast<double>(s.singleCharWords) / static_cast<double>(s.words);
        if (fragmentRatio > 0.3)
            score -= std::min(0.3, fragmentRatio - 0.3);
    }

    // Symbol heavy content
    double symbolRatio = static_cast<double>(s.symbols) / chars;
    if (symbolRatio > 0.25)
        score -= std::min(0.3, symbolRatio - 0.25);
    score -= std::min(0.1, 0.02 * static_cast<double>(s.punctuationRuns));

    // Script residue and broken layout
    score -= std::min(0.2, 0.02 * scriptResidue(text));
    score -= std::min(0.1, 0.01 * static_cast<double>(s.longSpaceRuns));

    if (s.alnum == 0)
        score -= 0.5;

    // Readable prose: 5 to 40 words per sentence
    if (s.sentences > 0) {
        double wordsPerSentence =
            static_cast<double>(s.words) / static_cast<double>(s.sentences);
        if (wordsPerSentence >= 5.0 && wordsPerSentence <= 40.0)
            score += 0.05;
    }
    if (metadata.is_object() && metadata.contains("title") && metadata["title"].is_string() &&
        !metadata["title"].get<std::string>().empty())
        score += 0.05;

    return std::clamp(score, 0.0, 1.0);
}

std::string cleanExtractedText(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    std::string line;
    int blank = 0;

    auto flushLine = [&](bool newline) {
        while (!line.empty() && (line.back() == ' ' || line.back() == '\t'))
            line.pop_back();
        if (line.empty()) {
            if (++blank > 1 && newline)
                return;
        } else {
            blank = 0;
        }
        out += line;
        if (newline)
            out += '\n';
        line.clear();
    };

    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (c == '\n') {
            flushLine(true);
        } else if (c == '\r') {
            continue;
        } else if ((c < 0x20 && c != '\t' && c != '\f') || c == 0x7F) {
            continue;
        } else {
            line += ch;
        }
    }
    flushLine(false);

    auto start = out.find_first_not_of("\n");
    if (start == std::string::npos)
        return "";
    auto end = out.find_last_not_of("\n ");
    return out.substr(start, end - start + 1);
}

void applyQualityProcessing(extraction::ExtractionResult& result) {
    double score = calculateQualityScore(result.content, result.metadata);
    // Two decimals keep scores stable across platforms
    score = std::round(score * 100.0) / 100.0;
    result.quality_score = score;
    result.metadata["quality_score"] = score;
    spdlog::debug("Quality score {:.2f} for {} bytes", score, result.content.size());
}

} // namespace kreuzberg::processing
