#include "test_helpers.h"
#include <gtest/gtest.h>
#include <kreuzberg/extraction/plain_text_extractor.h>
#include <kreuzberg/extraction/text_extractor.h>

#include <algorithm>

using namespace kreuzberg;
using namespace kreuzberg::extraction;
using namespace kreuzberg::test;
using ::testing::HasSubstr;

class TextExtractionTest : public ::testing::Test {
protected:
    config::ExtractionConfig config;
    PlainTextExtractor extractor;
};

TEST_F(TextExtractionTest, FactoryRegistration) {
    auto& factory = TextExtractorFactory::instance();

    EXPECT_TRUE(factory.isSupported("text/plain"));
    EXPECT_TRUE(factory.isSupported("text/markdown"));
    EXPECT_TRUE(factory.isSupported("application/json"));
    EXPECT_TRUE(factory.isSupported("text/html"));

    EXPECT_FALSE(factory.isSupported("application/pdf"));
    EXPECT_FALSE(factory.isSupported("image/png"));

    EXPECT_NE(factory.create("text/csv"), nullptr);
    EXPECT_EQ(factory.create("application/msword"), nullptr);
}

TEST_F(TextExtractionTest, FactoryListIsSorted) {
    auto mimes = TextExtractorFactory::instance().supportedMimeTypes();
    ASSERT_FALSE(mimes.empty());
    EXPECT_TRUE(std::is_sorted(mimes.begin(), mimes.end()));
}

TEST_F(TextExtractionTest, PlainTextExtraction) {
    const std::string content = "Hello, World!\nThis is a test file.\nWith multiple lines.";
    auto result = extractor.extractFromBuffer(asBytes(content), "text/plain", config);

    ASSERT_TRUE(result.has_value()) << result.error().message;
    const auto& r = result.value();
    EXPECT_EQ(r.content, content);
    EXPECT_EQ(r.mime_type, "text/plain");
    EXPECT_EQ(r.metadata["format_type"], "text");
    EXPECT_EQ(r.metadata["line_count"], 3);
    EXPECT_EQ(r.metadata["word_count"], 10);
    EXPECT_EQ(r.metadata["encoding"], "UTF-8");
    EXPECT_TRUE(r.processing_warnings.empty());
}

TEST_F(TextExtractionTest, Utf8BomIsStripped) {
    auto result = extractor.extractFromBuffer(asBytes("\xEF\xBB\xBFhello"), "text/plain", config);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().content, "hello");
}

TEST_F(TextExtractionTest, Latin1IsDecodedWithWarning) {
    auto result = extractor.extractFromBuffer(asBytes("caf\xE9 au lait"), "text/plain", config);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().content, "caf\xC3\xA9 au lait");
    EXPECT_EQ(result.value().metadata["encoding"], "ISO-8859-1");
    ASSERT_EQ(result.value().processing_warnings.size(), 1u);
    EXPECT_EQ(result.value().processing_warnings[0].source, "encoding");
}

TEST_F(TextExtractionTest, BinaryContentIsParsingError) {
    std::string binary("\x01\x02\x00\x03\x04\xFF", 6);
    EXPECT_THAT(extractor.extractFromBuffer(asBytes(binary), "text/plain", config),
                HasErrorCode(ErrorCode::ParsingError));
}

TEST_F(TextExtractionTest, MarkdownMetadata) {
    const std::string md = "# Project Title\n\nSome text with a [link](https://example.com).\n\n"
                           "## Usage\n\n```\ncode here\n# not a heading\n```\n";
    auto result = extractor.extractFromBuffer(asBytes(md), "text/markdown", config);
    ASSERT_TRUE(result);
    const auto& meta = result.value().metadata;
    EXPECT_EQ(meta["title"], "Project Title");
    ASSERT_TRUE(meta.contains("headers"));
    EXPECT_EQ(meta["headers"].size(), 2u);
    EXPECT_EQ(meta["links"][0][1], "https://example.com");
    EXPECT_EQ(meta["code_blocks"], 1);
}

TEST_F(TextExtractionTest, CsvBecomesTable) {
    const std::string csv = "name,age\n\"Smith, J\",42\nDoe,7\n";
    auto result = extractor.extractFromBuffer(asBytes(csv), "text/csv", config);
    ASSERT_TRUE(result);
    const auto& r = result.value();
    ASSERT_EQ(r.tables.size(), 1u);
    ASSERT_EQ(r.tables[0].cells.size(), 3u);
    EXPECT_EQ(r.tables[0].cells[1][0], "Smith, J");
    EXPECT_THAT(r.tables[0].markdown, HasSubstr("| name | age |"));
    EXPECT_EQ(r.metadata["row_count"], 3);
    EXPECT_EQ(r.metadata["column_count"], 2);
}

TEST_F(TextExtractionTest, TsvBecomesTable) {
    auto result = extractor.extractFromBuffer(asBytes("a\tb\n1\t2\n"), "text/tab-separated-values",
                                              config);
    ASSERT_TRUE(result);
    ASSERT_EQ(result.value().tables.size(), 1u);
    EXPECT_EQ(result.value().tables[0].cells[1][1], "2");
}

TEST_F(TextExtractionTest, StructuredTextIsChecked) {
    EXPECT_TRUE(extractor.extractFromBuffer(asBytes(R"({"ok": true})"), "application/json",
                                            config));
    EXPECT_THAT(extractor.extractFromBuffer(asBytes("{broken"), "application/json", config),
                HasErrorCode(ErrorCode::ParsingError));
    EXPECT_THAT(extractor.extractFromBuffer(asBytes("key: [1, 2"), "application/x-yaml", config),
                HasErrorCode(ErrorCode::ParsingError));
    EXPECT_THAT(extractor.extractFromBuffer(asBytes("x = "), "application/toml", config),
                HasErrorCode(ErrorCode::ParsingError));
    EXPECT_THAT(extractor.extractFromBuffer(asBytes("<a><b></a>"), "application/xml", config),
                HasErrorCode(ErrorCode::ParsingError));
}

TEST_F(TextExtractionTest, FormatForMime) {
    EXPECT_EQ(textFormatForMime("text/markdown"), "markdown");
    EXPECT_EQ(textFormatForMime("TEXT/CSV; charset=utf-8"), "csv");
    EXPECT_EQ(textFormatForMime("application/x-unknown"), "text");
}

TEST(EncodingDetectorTest, DetectsByteOrderMarks) {
    EXPECT_EQ(EncodingDetector::detectEncoding(asBytes("\xFF\xFEh\0")), "UTF-16LE");
    EXPECT_EQ(EncodingDetector::detectEncoding(asBytes("\xFE\xFF\0h")), "UTF-16BE");
    double confidence = 0.0;
    EXPECT_EQ(EncodingDetector::detectEncoding(asBytes("plain"), &confidence), "UTF-8");
    EXPECT_GT(confidence, 0.5);
}

TEST(EncodingDetectorTest, Utf16Decoding) {
    std::string utf16le("\xFF\xFEh\0i\0", 6);
    auto decoded = EncodingDetector::decodeToUtf8(asBytes(utf16le));
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value(), "hi");
}

TEST(EncodingDetectorTest, UnknownEncodingIsRejected) {
    EXPECT_THAT(EncodingDetector::convertToUtf8("abc", "EBCDIC"),
                HasErrorCode(ErrorCode::InvalidArgument));
}

TEST(EncodingDetectorTest, AppendUtf8) {
    std::string out;
    appendUtf8FromCodepoint(0x41, out);
    appendUtf8FromCodepoint(0xE9, out);
    appendUtf8FromCodepoint(0x20AC, out);
    appendUtf8FromCodepoint(0x1F600, out);
    EXPECT_EQ(out, "A\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80");
}

TEST(LanguageDetectorTest, DetectsCommonLanguages) {
    EXPECT_EQ(LanguageDetector::detectLanguage(
                  "The quick brown fox jumps over the lazy dog and this is the end of it."),
              "eng");
    EXPECT_EQ(LanguageDetector::detectLanguage(
                  "Der Hund ist nicht mit der Katze auf dem Dach, und die Maus auch nicht."),
              "deu");
}

TEST(LanguageDetectorTest, EmptyTextDefaultsToEnglishWithLowConfidence) {
    double confidence = 1.0;
    EXPECT_EQ(LanguageDetector::detectLanguage("", &confidence), "eng");
    EXPECT_LT(confidence, 0.5);
}

TEST(LanguageDetectorTest, DetectLanguagesHonoursThreshold) {
    const std::string text = "The cat is on the mat and it is happy with the sun.";
    auto single = LanguageDetector::detectLanguages(text, 0.0, false);
    ASSERT_EQ(single.size(), 1u);
    EXPECT_EQ(single[0].code, "eng");

    EXPECT_TRUE(LanguageDetector::detectLanguages(text, 1.01, true).empty());
}
