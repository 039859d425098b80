#include <kreuzberg/processing/stop_words.h>

#include <algorithm>
#include <cctype>
#include <map>

namespace kreuzberg::processing {

namespace {

std::string normalizeLanguage(std::string_view language) {
    std::string code(language.substr(0, language.find_first_of("-_+")));
    std::transform(code.begin(), code.end(), code.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    static const std::map<std::string, std::string, std::less<>> twoToThree = {
        {"en", "eng"}, {"de", "deu"}, {"ger", "deu"}, {"fr", "fra"}, {"fre", "fra"},
        {"es", "spa"}, {"it", "ita"}, {"pt", "por"},  {"nl", "nld"}, {"dut", "nld"}};
    if (auto it = twoToThree.find(code); it != twoToThree.end())
        return it->second;
    return code;
}

const std::map<std::string, std::unordered_set<std::string>, std::less<>>& tables() {
    static const std::map<std::string, std::unordered_set<std::string>, std::less<>> t = {
        {"eng",
         {"a",       "about",  "above",   "after",  "again",   "against", "all",    "am",
          "an",      "and",    "any",     "are",    "as",      "at",      "be",     "because",
          "been",    "before", "being",   "below",  "between", "both",    "but",    "by",
          "can",     "could",  "did",     "do",     "does",    "doing",   "down",   "during",
          "each",    "few",    "for",     "from",   "further", "had",     "has",    "have",
          "having",  "he",     "her",     "here",   "hers",    "herself", "him",    "himself",
          "his",     "how",    "i",       "if",     "in",      "into",    "is",     "it",
          "its",     "itself", "just",    "me",     "more",    "most",    "my",     "myself",
          "no",      "nor",    "not",     "now",    "of",      "off",     "on",     "once",
          "only",    "or",     "other",   "our",    "ours",    "out",     "over",   "own",
          "same",    "she",    "should",  "so",     "some",    "such",    "than",   "that",
          "the",     "their",  "theirs",  "them",   "then",    "there",   "these",  "they",
          "this",    "those",  "through", "to",     "too",     "under",   "until",  "up",
          "very",    "was",    "we",      "were",   "what",    "when",    "where",  "which",
          "while",   "who",    "whom",    "why",    "will",    "with",    "would",  "you",
          "your",    "yours",  "also",    "may",    "might",   "must",    "shall",  "upon",
          "yet",     "however"}},
        {"deu",
         {"der",   "die",   "das",   "und",   "ist",   "nicht", "mit",   "ein",  "eine",
          "einer", "eines", "zu",    "von",   "auf",   "den",   "dem",   "des",  "sich",
          "auch",  "wird",  "im",    "in",    "für",   "es",    "an",    "als",  "sie",
          "er",    "wir",   "ich",   "aber",  "oder",  "wie",   "bei",   "nach", "noch",
          "nur",   "so",    "zum",   "zur",   "um",    "aus",   "dass",  "sind", "war"}},
        {"fra",
         {"le",   "la",   "les",  "de",   "des",  "du",   "un",   "une",  "et",   "est",
          "pour", "dans", "que",  "qui",  "avec", "sur",  "pas",  "ce",   "cette", "il",
          "elle", "nous", "vous", "ils",  "en",   "au",   "aux",  "par",  "plus", "ou",
          "mais", "se",   "sont", "son",  "sa",   "ses",  "leur"}},
        {"spa",
         {"el",   "la",   "los",  "las",  "de",   "del",  "que",  "y",    "en",   "un",
          "una",  "es",   "por",  "con",  "para", "se",   "no",   "como", "al",   "lo",
          "su",   "sus",  "pero", "más",  "o",    "este", "esta", "son",  "fue"}},
        {"ita",
         {"il",  "lo",   "la",   "gli", "le",  "di",  "che",   "e",    "un",  "una",
          "per", "con",  "non",  "sono", "della", "nel", "anche", "come", "del", "da",
          "in",  "ma",   "si",   "al",  "dei"}},
        {"por",
         {"o",  "a",  "os",  "as",  "de",  "que", "e",   "um",   "uma",  "para", "com",
          "não", "em", "do", "da",  "se",  "mais", "por", "dos", "das",  "no",   "na"}},
        {"nld",
         {"de",  "het", "een", "en",   "van", "is",   "dat",  "niet", "met", "op",
          "voor", "zijn", "ook", "maar", "wordt", "die", "in",  "te",   "aan", "als"}},
    };
    return t;
}

} // namespace

const std::unordered_set<std::string>& stopWords(std::string_view language) {
    const auto& all = tables();
    if (auto it = all.find(normalizeLanguage(language)); it != all.end())
        return it->second;
    return all.find("eng")->second;
}

bool isStopWord(std::string_view lowercaseWord, std::string_view language) {
    return stopWords(language).contains(std::string(lowercaseWord));
}

} // namespace kreuzberg::processing
