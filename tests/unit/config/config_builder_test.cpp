#include "test_helpers.h"
#include <gtest/gtest.h>
#include <kreuzberg/config/config_builder.h>

using namespace kreuzberg;
using namespace kreuzberg::config;
using namespace kreuzberg::test;

TEST(ConfigBuilderTest, EmptyBuilderYieldsDefaults) {
    ConfigBuilder builder;
    auto built = builder.build();
    ASSERT_TRUE(built) << built.error().message;
    EXPECT_EQ(built.value(), ExtractionConfig{});
}

TEST(ConfigBuilderTest, ScalarSetters) {
    ConfigBuilder builder;
    ASSERT_TRUE(builder.setUseCache(false));
    ASSERT_TRUE(builder.setForceOcr(true));
    ASSERT_TRUE(builder.setIncludeDocumentStructure(true));
    ASSERT_TRUE(builder.setMaxConcurrentExtractions(4));
    ASSERT_TRUE(builder.setOutputFormat("Markdown"));

    auto built = builder.build();
    ASSERT_TRUE(built);
    const auto& cfg = built.value();
    EXPECT_FALSE(cfg.use_cache);
    EXPECT_TRUE(cfg.force_ocr);
    EXPECT_TRUE(cfg.include_document_structure);
    ASSERT_TRUE(cfg.max_concurrent_extractions.has_value());
    EXPECT_EQ(*cfg.max_concurrent_extractions, 4u);
    EXPECT_EQ(cfg.output_format, OutputFormat::Markdown);
}

TEST(ConfigBuilderTest, ZeroConcurrencyIsRejected) {
    ConfigBuilder builder;
    EXPECT_THAT(builder.setMaxConcurrentExtractions(0), HasErrorCode(ErrorCode::ValidationError));
}

TEST(ConfigBuilderTest, UnknownOutputFormatIsRejected) {
    ConfigBuilder builder;
    EXPECT_THAT(builder.setOutputFormat("pdf"), HasErrorCode(ErrorCode::ValidationError));
}

TEST(ConfigBuilderTest, SectionSettersDecodeJson) {
    ConfigBuilder builder;
    ASSERT_TRUE(builder.setOcr(R"({"backend":"tesseract","language":"deu"})"));
    ASSERT_TRUE(builder.setChunking(R"({"max_chars":500,"max_overlap":50})"));
    ASSERT_TRUE(builder.setTokenReduction(R"({"mode":"moderate"})"));

    auto built = builder.build();
    ASSERT_TRUE(built) << built.error().message;
    const auto& cfg = built.value();
    ASSERT_TRUE(cfg.ocr.has_value());
    EXPECT_EQ(cfg.ocr->language, "deu");
    ASSERT_TRUE(cfg.chunking.has_value());
    EXPECT_EQ(cfg.chunking->max_chars, 500);
    EXPECT_EQ(cfg.chunking->max_overlap, 50);
    ASSERT_TRUE(cfg.token_reduction.has_value());
    EXPECT_EQ(cfg.token_reduction->mode, TokenReductionMode::Moderate);
}

TEST(ConfigBuilderTest, NullJsonClearsSection) {
    ConfigBuilder builder;
    ASSERT_TRUE(builder.setOcr(R"({"backend":"tesseract"})"));
    ASSERT_TRUE(builder.setOcr("null"));
    auto built = builder.build();
    ASSERT_TRUE(built);
    EXPECT_FALSE(built.value().ocr.has_value());
}

TEST(ConfigBuilderTest, MalformedJsonFailsImmediately) {
    ConfigBuilder builder;
    auto r = builder.setOcr("{not json");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ValidationError);
    EXPECT_NE(r.error().message.find("ocr"), std::string::npos);
}

TEST(ConfigBuilderTest, CrossFieldRulesCheckedAtBuild) {
    ConfigBuilder builder;
    ASSERT_TRUE(builder.setChunking(R"({"max_chars":100,"max_overlap":200})"));
    auto built = builder.build();
    ASSERT_FALSE(built);
    EXPECT_EQ(built.error().code, ErrorCode::ValidationError);
    EXPECT_NE(built.error().message.find("chunking.max_overlap"), std::string::npos);
}

TEST(ConfigBuilderTest, BuilderIsSingleUse) {
    ConfigBuilder builder;
    ASSERT_TRUE(builder.build());
    EXPECT_TRUE(builder.consumed());
    EXPECT_THAT(builder.setUseCache(true), HasErrorCode(ErrorCode::InvalidArgument));
    EXPECT_THAT(builder.build(), HasErrorCode(ErrorCode::InvalidArgument));
}

TEST(ConfigBuilderTest, FailedBuildStillConsumes) {
    ConfigBuilder builder;
    ASSERT_TRUE(builder.setChunking(R"({"max_chars":10,"max_overlap":10})"));
    EXPECT_FALSE(builder.build());
    EXPECT_TRUE(builder.consumed());
}
