#include <kreuzberg/processing/keyword_extractor.h>
#include <kreuzberg/processing/stop_words.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <map>
#include <numeric>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace kreuzberg::processing {

namespace {

struct Token {
    std::string text;  // as written
    std::string lower; // lowercase form used as key
    std::size_t sentence = 0;
    bool boundary = false; // punctuation follows the token
};

bool isWordByte(unsigned char c) {
    return std::isalnum(c) || c >= 0x80 || c == '-' || c == '\'';
}

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Words with their sentence index; sentences end at . ! ? or a blank line
std::vector<Token> tokenize(std::string_view text) {
    std::vector<Token> tokens;
    std::size_t sentence = 0;
    std::string current;
    int newlines = 0;

    auto flush = [&]() {
        while (!current.empty() && (current.back() == '-' || current.back() == '\''))
            current.pop_back();
        while (!current.empty() && (current.front() == '-' || current.front() == '\''))
            current.erase(0, 1);
        if (!current.empty())
            tokens.push_back({current, toLower(current), sentence, false});
        current.clear();
    };

    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (isWordByte(c)) {
            current += ch;
            newlines = 0;
            continue;
        }
        flush();
        if (c == '\n') {
            if (++newlines >= 2 && !tokens.empty() && tokens.back().sentence == sentence) {
                tokens.back().boundary = true;
                ++sentence;
            }
            continue;
        }
        if (std::isspace(c))
            continue;
        newlines = 0;
        if (!tokens.empty())
            tokens.back().boundary = true;
        if ((c == '.' || c == '!' || c == '?') && !tokens.empty() &&
            tokens.back().sentence == sentence)
            ++sentence;
    }
    flush();
    return tokens;
}

bool isNumeric(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c) || c == '.' || c == ',';
    });
}

} // namespace

KeywordExtractor::KeywordExtractor(config::KeywordConfig config) : config_(std::move(config)) {
    config_.ngram_min = std::max(1, config_.ngram_min);
    config_.ngram_max = std::max(config_.ngram_min, config_.ngram_max);
}

std::vector<extraction::Keyword> KeywordExtractor::extract(std::string_view text) const {
    if (text.empty() || config_.max_keywords <= 0)
        return {};
    if (config_.algorithm == config::KeywordAlgorithm::Rake)
        return finalize(extractRake(text));
    return finalize(extractYake(text));
}

std::vector<extraction::Keyword>
KeywordExtractor::finalize(std::vector<extraction::Keyword> keywords) const {
    std::stable_sort(keywords.begin(), keywords.end(),
                     [](const auto& a, const auto& b) { return a.score > b.score; });
    std::vector<extraction::Keyword> out;
    for (auto& kw : keywords) {
        if (kw.score < config_.min_score)
            continue;
        out.push_back(std::move(kw));
        if (out.size() >= static_cast<std::size_t>(config_.max_keywords))
            break;
    }
    return out;
}

// YAKE: term statistics (casing, position, frequency, context spread and
// sentence spread) combined per candidate n-gram; lower raw scores are better.
std::vector<extraction::Keyword> KeywordExtractor::extractYake(std::string_view text) const {
    const std::string language = config_.language.value_or("en");
    const auto tokens = tokenize(text);
    if (tokens.empty())
        return {};

    const std::size_t window =
        static_cast<std::size_t>(std::max(1, config_.yake_params ? config_.yake_params->window_size : 2));

    struct TermStats {
        std::size_t tf = 0;
        std::size_t upper = 0;
        std::size_t acronym = 0;
        std::vector<std::size_t> sentences;
        std::set<std::string> left;
        std::set<std::string> right;
    };
    std::unordered_map<std::string, TermStats> terms;
    std::size_t sentenceCount = tokens.back().sentence + 1;

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];
        auto& st = terms[tok.lower];
        st.tf++;
        st.sentences.push_back(tok.sentence);
        const auto first = static_cast<unsigned char>(tok.text.front());
        const bool allUpper =
            tok.text.size() > 1 && std::all_of(tok.text.begin(), tok.text.end(), [](unsigned char c) {
                return !std::isalpha(c) || std::isupper(c);
            });
        if (allUpper)
            st.acronym++;
        else if (std::isupper(first) && i > 0 && tokens[i - 1].sentence == tok.sentence)
            st.upper++;

        for (std::size_t w = 1; w <= window; ++w) {
            if (i >= w && tokens[i - w].sentence == tok.sentence)
                st.left.insert(tokens[i - w].lower);
            if (i + w < tokens.size() && tokens[i + w].sentence == tok.sentence)
                st.right.insert(tokens[i + w].lower);
        }
    }

    // Frequency normalisation over non-stop terms
    std::vector<double> freqs;
    std::size_t maxTf = 1;
    for (const auto& [term, st] : terms) {
        if (isStopWord(term, language))
            continue;
        freqs.push_back(static_cast<double>(st.tf));
        maxTf = std::max(maxTf, st.tf);
    }
    double mean = freqs.empty() ? 1.0
                                : std::accumulate(freqs.begin(), freqs.end(), 0.0) /
                                      static_cast<double>(freqs.size());
    double variance = 0.0;
    for (double f : freqs)
        variance += (f - mean) * (f - mean);
    double stddev = freqs.empty() ? 0.0 : std::sqrt(variance / static_cast<double>(freqs.size()));

    std::unordered_map<std::string, double> termScore;
    for (const auto& [term, st] : terms) {
        const double tf = static_cast<double>(st.tf);
        const double tCase = static_cast<double>(std::max(st.upper, st.acronym)) / (1.0 + std::log(tf));
        auto sentences = st.sentences;
        std::nth_element(sentences.begin(), sentences.begin() + sentences.size() / 2,
                         sentences.end());
        const double median = static_cast<double>(sentences[sentences.size() / 2]);
        const double tPos = std::log(std::log(3.0 + median));
        const double tFreq = tf / (mean + stddev);
        const double dl = st.left.empty() ? 0.0 : static_cast<double>(st.left.size()) / tf;
        const double dr = st.right.empty() ? 0.0 : static_cast<double>(st.right.size()) / tf;
        const double tRel = 1.0 + (dl + dr) * (tf / static_cast<double>(maxTf));
        std::set<std::size_t> distinct(st.sentences.begin(), st.sentences.end());
        const double tSent = static_cast<double>(distinct.size()) / static_cast<double>(sentenceCount);
        termScore[term] = (tPos * tRel) / (tCase + (tFreq / tRel) + (tSent / tRel));
    }

    struct Candidate {
        std::string surface;
        std::vector<std::string> words;
        std::size_t tf = 0;
    };
    std::map<std::string, Candidate> candidates;
    const auto nMin = static_cast<std::size_t>(config_.ngram_min);
    const auto nMax = static_cast<std::size_t>(config_.ngram_max);

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        for (std::size_t n = nMin; n <= nMax && i + n <= tokens.size(); ++n) {
            const auto& first = tokens[i];
            const auto& last = tokens[i + n - 1];
            if (last.sentence != first.sentence)
                break;
            // A punctuation mark inside the span breaks the phrase
            bool crosses = false;
            for (std::size_t k = i; k + 1 < i + n; ++k)
                crosses = crosses || tokens[k].boundary;
            if (crosses)
                break;
            if (isStopWord(first.lower, language) || isStopWord(last.lower, language) ||
                isNumeric(first.lower) || isNumeric(last.lower) || first.lower.size() < 2)
                continue;

            std::string key;
            std::vector<std::string> words;
            for (std::size_t k = i; k < i + n; ++k) {
                if (k > i)
                    key += ' ';
                key += tokens[k].lower;
                words.push_back(tokens[k].lower);
            }
            auto& cand = candidates[key];
            if (cand.tf == 0) {
                cand.surface = key;
                cand.words = std::move(words);
            }
            cand.tf++;
        }
    }

    std::vector<std::pair<std::string, double>> raw;
    for (const auto& [key, cand] : candidates) {
        double prod = 1.0;
        double sum = 0.0;
        for (const auto& w : cand.words) {
            double s = termScore[w];
            if (isStopWord(w, language))
                continue;
            prod *= s;
            sum += s;
        }
        double score = prod / (static_cast<double>(cand.tf) * (1.0 + sum));
        raw.emplace_back(cand.surface, score);
    }
    if (raw.empty())
        return {};

    double best = std::numeric_limits<double>::max();
    for (const auto& [_, s] : raw)
        best = std::min(best, s);

    std::vector<extraction::Keyword> keywords;
    keywords.reserve(raw.size());
    for (const auto& [surface, s] : raw) {
        // Every term score is positive, so the ratio lies in (0, 1]
        keywords.push_back({surface, std::min(1.0, best / s), "yake"});
    }
    return keywords;
}

// RAKE: phrases are runs of content words between stop words and punctuation,
// scored by the sum of word degree over word frequency.
std::vector<extraction::Keyword> KeywordExtractor::extractRake(std::string_view text) const {
    const std::string language = config_.language.value_or("en");
    const auto tokens = tokenize(text);

    const std::size_t minLen =
        static_cast<std::size_t>(config_.rake_params ? config_.rake_params->min_word_length : 1);
    std::size_t maxWords =
        static_cast<std::size_t>(config_.rake_params ? config_.rake_params->max_words_per_phrase : 3);
    maxWords = std::min(maxWords, static_cast<std::size_t>(config_.ngram_max));
    const auto nMin = static_cast<std::size_t>(config_.ngram_min);

    std::vector<std::vector<std::string>> phrases;
    std::vector<std::string> current;
    auto close = [&]() {
        if (!current.empty() && current.size() >= nMin && current.size() <= maxWords)
            phrases.push_back(current);
        current.clear();
    };

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];
        if (i > 0 && tokens[i - 1].sentence != tok.sentence)
            close();
        if (isStopWord(tok.lower, language) || isNumeric(tok.lower) || tok.lower.size() < minLen) {
            close();
            continue;
        }
        current.push_back(tok.lower);
        if (tok.boundary)
            close();
    }
    close();

    std::unordered_map<std::string, double> freq;
    std::unordered_map<std::string, double> degree;
    for (const auto& phrase : phrases) {
        for (const auto& w : phrase) {
            freq[w] += 1.0;
            degree[w] += static_cast<double>(phrase.size());
        }
    }

    std::map<std::string, double> scored;
    for (const auto& phrase : phrases) {
        std::string key;
        double score = 0.0;
        for (const auto& w : phrase) {
            if (!key.empty())
                key += ' ';
            key += w;
            score += degree[w] / freq[w];
        }
        scored[key] = score;
    }
    if (scored.empty())
        return {};

    double best = 0.0;
    for (const auto& [_, s] : scored)
        best = std::max(best, s);

    std::vector<extraction::Keyword> keywords;
    for (const auto& [phrase, s] : scored)
        keywords.push_back({phrase, best > 0.0 ? s / best : 0.0, "rake"});
    return keywords;
}

} // namespace kreuzberg::processing
