#include <kreuzberg/processing/stop_words.h>
#include <kreuzberg/processing/token_reduction.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_set>
#include <vector>

namespace kreuzberg::processing {

namespace {

using config::TokenReductionMode;

int levelOf(TokenReductionMode mode) {
    switch (mode) {
        case TokenReductionMode::Off: return 0;
        case TokenReductionMode::Light: return 1;
        case TokenReductionMode::Moderate: return 2;
        case TokenReductionMode::Aggressive: return 3;
        case TokenReductionMode::Maximum: return 4;
    }
    return 0;
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string stripHtmlComments(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        auto open = text.find("<!--", pos);
        if (open == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }
        out.append(text.substr(pos, open - pos));
        auto close = text.find("-->", open + 4);
        if (close == std::string_view::npos)
            break;
        pos = close + 3;
    }
    return out;
}

// Whitespace runs become one space, blank-line runs one blank line
std::string normalizeWhitespace(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    int newlines = 0;
    bool space = false;
    for (char c : text) {
        if (c == '\n') {
            ++newlines;
            space = false;
            continue;
        }
        if (c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v') {
            space = true;
            continue;
        }
        if (!out.empty()) {
            if (newlines > 0)
                out.append(std::min(newlines, 2), '\n');
            else if (space)
                out += ' ';
        }
        newlines = 0;
        space = false;
        out += c;
    }
    return out;
}

std::string squeezePunctuation(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (!out.empty() && c == out.back() &&
            (c == '!' || c == '?' || c == ',' || c == ';' || c == ':' || c == '-' || c == '*' ||
             c == '=' || c == '_'))
            continue;
        out += c;
    }
    // Ellipses and dot leaders collapse to a single period
    std::string result;
    result.reserve(out.size());
    for (char c : out) {
        if (c == '.' && result.size() >= 1 && result.back() == '.')
            continue;
        result += c;
    }
    return result;
}

bool isImportant(std::string_view word) {
    bool digit = std::any_of(word.begin(), word.end(),
                             [](unsigned char c) { return std::isdigit(c) != 0; });
    if (digit)
        return true;
    auto first = static_cast<unsigned char>(word.front());
    if (std::isupper(first))
        return true;
    return false;
}

// Word core without leading or trailing punctuation
std::string_view wordCore(std::string_view token) {
    std::size_t b = 0;
    std::size_t e = token.size();
    while (b < e && std::ispunct(static_cast<unsigned char>(token[b])))
        ++b;
    while (e > b && std::ispunct(static_cast<unsigned char>(token[e - 1])))
        --e;
    return token.substr(b, e - b);
}

template <typename Keep> std::string filterWords(std::string_view text, Keep keep) {
    std::string out;
    out.reserve(text.size());
    std::istringstream lines{std::string(text)};
    std::string line;
    bool firstLine = true;
    while (std::getline(lines, line)) {
        if (!firstLine)
            out += '\n';
        firstLine = false;
        std::istringstream words(line);
        std::string token;
        bool firstWord = true;
        while (words >> token) {
            if (!keep(token))
                continue;
            if (!firstWord)
                out += ' ';
            firstWord = false;
            out += token;
        }
    }
    return out;
}

std::string removeStopWords(std::string_view text, std::string_view language, bool preserve) {
    const auto& stops = stopWords(language);
    return filterWords(text, [&](const std::string& token) {
        auto core = wordCore(token);
        if (core.empty())
            return true;
        if (preserve && isImportant(core))
            return true;
        // Keep trailing sentence punctuation attached to a dropped word
        return !stops.contains(lower(core)) || token.back() == '.' || token.back() == '?' ||
               token.back() == '!';
    });
}

std::string removeBracketed(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    int depth = 0;
    for (char c : text) {
        if (c == '(' || c == '[') {
            ++depth;
            continue;
        }
        if ((c == ')' || c == ']') && depth > 0) {
            --depth;
            continue;
        }
        if (depth == 0)
            out += c;
    }
    return out;
}

std::string removeDuplicateSentences(std::string_view text) {
    auto endsSentence = [&](std::size_t i) {
        return (text[i] == '.' || text[i] == '!' || text[i] == '?') &&
               (i + 1 == text.size() || text[i + 1] == ' ' || text[i + 1] == '\n');
    };

    std::unordered_set<std::string> seen;
    std::string out;
    out.reserve(text.size());
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t i = start;
        while (i < text.size() && text[i] != '\n' && !endsSentence(i))
            ++i;
        std::size_t end = i < text.size() && text[i] != '\n' ? i + 1 : i;

        std::string_view sentence = text.substr(start, end - start);
        std::string key = lower(wordCore(sentence));
        key.erase(0, key.find_first_not_of(' '));
        if (key.empty() || seen.insert(key).second)
            out.append(sentence);

        if (end < text.size() && text[end] == '\n') {
            out += '\n';
            ++end;
        }
        start = end;
    }
    return out;
}

} // namespace

std::string reduceTokens(std::string_view text, const config::TokenReductionConfig& config,
                         std::string_view language) {
    const int level = levelOf(config.mode);
    if (level == 0 || text.empty())
        return std::string(text);

    std::string out = stripHtmlComments(text);
    out = squeezePunctuation(out);
    out = normalizeWhitespace(out);

    if (level >= 2)
        out = removeStopWords(out, language, config.preserve_important_words);

    if (level >= 3) {
        out = removeBracketed(out);
        out = removeDuplicateSentences(out);
    }

    if (level >= 4) {
        out = filterWords(out, [&](const std::string& token) {
            auto core = wordCore(token);
            if (core.size() != 1)
                return true;
            return std::isdigit(static_cast<unsigned char>(core.front())) != 0 ||
                   (config.preserve_important_words && isImportant(core));
        });
    }

    return normalizeWhitespace(out);
}

void reduceResultTokens(extraction::ExtractionResult& result,
                        const config::TokenReductionConfig& config, std::string_view language) {
    if (config.mode == TokenReductionMode::Off)
        return;

    const auto before = result.content.size();
    if (result.page_structure && !result.page_structure->boundaries.empty()) {
        // Reduce page by page so boundaries and markers stay aligned
        std::string rebuilt;
        std::size_t cursor = 0;
        for (auto& boundary : result.page_structure->boundaries) {
            rebuilt.append(result.content, cursor, boundary.byte_start - cursor);
            auto page = reduceTokens(std::string_view(result.content)
                                         .substr(boundary.byte_start,
                                                 boundary.byte_end - boundary.byte_start),
                                     config, language);
            cursor = boundary.byte_end;
            boundary.byte_start = rebuilt.size();
            rebuilt += page;
            boundary.byte_end = rebuilt.size();
            if (result.pages) {
                for (auto& p : *result.pages) {
                    if (p.page_number == boundary.page_number)
                        p.content = page;
                }
            }
        }
        rebuilt.append(result.content, cursor, std::string::npos);
        result.content = std::move(rebuilt);
    } else {
        result.content = reduceTokens(result.content, config, language);
    }
    const auto after = result.content.size();

    nlohmann::json stats;
    stats["mode"] = config::toString(config.mode);
    stats["original_length"] = before;
    stats["reduced_length"] = after;
    stats["reduction_ratio"] =
        before == 0 ? 0.0 : 1.0 - static_cast<double>(after) / static_cast<double>(before);
    result.metadata["token_reduction"] = std::move(stats);

    spdlog::debug("Token reduction ({}): {} -> {} bytes", config::toString(config.mode), before,
                  after);
}

} // namespace kreuzberg::processing
