#include <gtest/gtest.h>
#include <kreuzberg/processing/stop_words.h>
#include <kreuzberg/processing/token_reduction.h>

using namespace kreuzberg;
using namespace kreuzberg::processing;
using config::TokenReductionConfig;
using config::TokenReductionMode;

namespace {

TokenReductionConfig mode(TokenReductionMode m, bool preserve = true) {
    TokenReductionConfig cfg;
    cfg.mode = m;
    cfg.preserve_important_words = preserve;
    return cfg;
}

} // namespace

TEST(TokenReductionTest, OffLeavesTextAlone) {
    const std::string text = "the   cat!!!  <!-- note -->";
    EXPECT_EQ(reduceTokens(text, mode(TokenReductionMode::Off)), text);
}

TEST(TokenReductionTest, LightNormalisesWhitespaceAndPunctuation) {
    EXPECT_EQ(reduceTokens("Hello    world!!!  Wait...", mode(TokenReductionMode::Light)),
              "Hello world! Wait.");
    EXPECT_EQ(reduceTokens("keep <!-- drop this --> text", mode(TokenReductionMode::Light)),
              "keep text");
    EXPECT_EQ(reduceTokens("one\n\n\n\ntwo", mode(TokenReductionMode::Light)), "one\n\ntwo");
}

TEST(TokenReductionTest, ModerateRemovesStopWords) {
    EXPECT_EQ(reduceTokens("the cat sat on the mat", mode(TokenReductionMode::Moderate)),
              "cat sat mat");
}

TEST(TokenReductionTest, ModeratePreservesImportantWords) {
    EXPECT_EQ(reduceTokens("The report is in NASA files", mode(TokenReductionMode::Moderate)),
              "The report NASA files");
    EXPECT_EQ(reduceTokens("The report is in NASA files",
                           mode(TokenReductionMode::Moderate, false)),
              "report NASA files");
}

TEST(TokenReductionTest, ModerateUsesLanguageStopWords) {
    EXPECT_EQ(reduceTokens("der hund und die katze", mode(TokenReductionMode::Moderate), "deu"),
              "hund katze");
}

TEST(TokenReductionTest, AggressiveDropsAsidesAndDuplicates) {
    EXPECT_EQ(reduceTokens("Alpha beta gamma. Alpha beta gamma. Delta (aside) epsilon.",
                           mode(TokenReductionMode::Aggressive)),
              "Alpha beta gamma. Delta epsilon.");
}

TEST(TokenReductionTest, MaximumDropsSingleLetters) {
    EXPECT_EQ(reduceTokens("x marks 5 spots b", mode(TokenReductionMode::Maximum, false)),
              "marks 5 spots");
}

TEST(TokenReductionTest, ResultRecordsStatistics) {
    extraction::ExtractionResult result;
    result.content = "the cat sat on the mat";

    reduceResultTokens(result, mode(TokenReductionMode::Moderate), "eng");
    EXPECT_EQ(result.content, "cat sat mat");
    ASSERT_TRUE(result.metadata.contains("token_reduction"));
    const auto& stats = result.metadata["token_reduction"];
    EXPECT_EQ(stats["mode"], "moderate");
    EXPECT_EQ(stats["original_length"], 22);
    EXPECT_EQ(stats["reduced_length"], 11);
    EXPECT_NEAR(stats["reduction_ratio"].get<double>(), 0.5, 1e-9);
}

TEST(TokenReductionTest, ResultOffRecordsNothing) {
    extraction::ExtractionResult result;
    result.content = "the cat";
    reduceResultTokens(result, mode(TokenReductionMode::Off), "eng");
    EXPECT_EQ(result.content, "the cat");
    EXPECT_FALSE(result.metadata.contains("token_reduction"));
}

TEST(TokenReductionTest, ResultKeepsPageBoundariesAligned) {
    extraction::ExtractionResult result;
    result.content = "the cat\n\nthe dog";
    extraction::PageStructure structure;
    structure.total_count = 2;
    structure.boundaries = {{0, 7, 1}, {9, 16, 2}};
    result.page_structure = structure;

    reduceResultTokens(result, mode(TokenReductionMode::Moderate), "eng");
    EXPECT_EQ(result.content, "cat\n\ndog");
    const auto& b = result.page_structure->boundaries;
    EXPECT_EQ(result.content.substr(b[0].byte_start, b[0].byte_end - b[0].byte_start), "cat");
    EXPECT_EQ(result.content.substr(b[1].byte_start, b[1].byte_end - b[1].byte_start), "dog");
}

TEST(StopWordsTest, LookupAndFallback) {
    EXPECT_TRUE(isStopWord("the", "en"));
    EXPECT_TRUE(isStopWord("the", "eng"));
    EXPECT_TRUE(isStopWord("und", "de"));
    EXPECT_FALSE(isStopWord("katze", "deu"));
    EXPECT_TRUE(isStopWord("the", "zz"));
    EXPECT_EQ(&stopWords("en-US"), &stopWords("eng"));
}
