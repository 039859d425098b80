#include <gtest/gtest.h>
#include <kreuzberg/processing/keyword_extractor.h>
#include <kreuzberg/processing/stop_words.h>

#include <algorithm>

using namespace kreuzberg;
using namespace kreuzberg::processing;

namespace {

const std::string kSample =
    "Machine learning improves search. Machine learning models rank documents. "
    "Search engines use machine learning to rank results.";

bool containsKeyword(const std::vector<extraction::Keyword>& keywords, const std::string& text) {
    return std::any_of(keywords.begin(), keywords.end(),
                       [&](const auto& kw) { return kw.text == text; });
}

} // namespace

TEST(KeywordExtractorTest, EmptyInputYieldsNothing) {
    EXPECT_TRUE(KeywordExtractor().extract("").empty());

    config::KeywordConfig none;
    none.max_keywords = 0;
    EXPECT_TRUE(KeywordExtractor(none).extract(kSample).empty());
}

TEST(KeywordExtractorTest, YakeScoresAreNormalisedAndSorted) {
    config::KeywordConfig cfg;
    cfg.max_keywords = 100;
    auto keywords = KeywordExtractor(cfg).extract(kSample);
    ASSERT_FALSE(keywords.empty());

    EXPECT_DOUBLE_EQ(keywords.front().score, 1.0);
    for (std::size_t i = 0; i < keywords.size(); ++i) {
        EXPECT_GT(keywords[i].score, 0.0);
        EXPECT_LE(keywords[i].score, 1.0);
        EXPECT_EQ(keywords[i].algorithm, "yake");
        if (i > 0)
            EXPECT_GE(keywords[i - 1].score, keywords[i].score);

        auto firstWord = keywords[i].text.substr(0, keywords[i].text.find(' '));
        EXPECT_FALSE(isStopWord(firstWord, "en")) << keywords[i].text;
    }
    EXPECT_TRUE(containsKeyword(keywords, "machine learning"));
    EXPECT_FALSE(containsKeyword(keywords, "learning to"));
}

TEST(KeywordExtractorTest, PhrasesDoNotCrossSentences) {
    config::KeywordConfig cfg;
    cfg.max_keywords = 100;
    auto keywords = KeywordExtractor(cfg).extract(kSample);
    EXPECT_FALSE(containsKeyword(keywords, "search machine"));
    EXPECT_FALSE(containsKeyword(keywords, "documents search"));
}

TEST(KeywordExtractorTest, RespectsMaxKeywords) {
    config::KeywordConfig cfg;
    cfg.max_keywords = 3;
    EXPECT_EQ(KeywordExtractor(cfg).extract(kSample).size(), 3u);
}

TEST(KeywordExtractorTest, RakeScoresByDegree) {
    config::KeywordConfig cfg;
    cfg.algorithm = config::KeywordAlgorithm::Rake;
    auto keywords = KeywordExtractor(cfg).extract(
        "Compatibility of systems of linear constraints over the set of natural numbers.");
    ASSERT_GE(keywords.size(), 4u);

    EXPECT_EQ(keywords[0].text, "linear constraints");
    EXPECT_DOUBLE_EQ(keywords[0].score, 1.0);
    EXPECT_EQ(keywords[1].text, "natural numbers");
    EXPECT_DOUBLE_EQ(keywords[1].score, 1.0);
    EXPECT_EQ(keywords[0].algorithm, "rake");

    auto it = std::find_if(keywords.begin(), keywords.end(),
                           [](const auto& kw) { return kw.text == "compatibility"; });
    ASSERT_NE(it, keywords.end());
    EXPECT_DOUBLE_EQ(it->score, 0.25);
}

TEST(KeywordExtractorTest, MinScoreFilters) {
    config::KeywordConfig cfg;
    cfg.algorithm = config::KeywordAlgorithm::Rake;
    cfg.min_score = 0.5;
    auto keywords = KeywordExtractor(cfg).extract(
        "Compatibility of systems of linear constraints over the set of natural numbers.");
    ASSERT_EQ(keywords.size(), 2u);
    for (const auto& kw : keywords)
        EXPECT_GE(kw.score, 0.5);
}

TEST(KeywordExtractorTest, RakeHonoursNgramMax) {
    config::KeywordConfig cfg;
    cfg.algorithm = config::KeywordAlgorithm::Rake;
    cfg.ngram_max = 1;
    auto keywords = KeywordExtractor(cfg).extract(
        "Compatibility of systems of linear constraints over the set of natural numbers.");
    for (const auto& kw : keywords)
        EXPECT_EQ(kw.text.find(' '), std::string::npos) << kw.text;
}
