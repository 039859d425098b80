#include "test_helpers.h"
#include <gtest/gtest.h>
#include <kreuzberg/extraction/html_text_extractor.h>

using namespace kreuzberg;
using namespace kreuzberg::extraction;
using namespace kreuzberg::test;
using ::testing::HasSubstr;
using ::testing::Not;

namespace {

const std::string kPage = R"(<!DOCTYPE html>
<html lang="en">
<head>
  <title>Quarterly Report</title>
  <meta name="author" content="Ada Lovelace">
  <meta name="keywords" content="finance, q3 , report">
  <meta property="og:description" content="Numbers for Q3">
  <style>body { color: red; }</style>
  <script>var hidden = "should not appear";</script>
</head>
<body>
  <h1>Summary</h1>
  <p>Revenue grew &amp; costs fell by &#37;5.</p>
  <!-- internal note -->
  <ul><li>First</li><li>Second</li></ul>
  <table>
    <tr><th>Region</th><th>Sales</th></tr>
    <tr><td>North</td><td>10</td></tr>
  </table>
</body>
</html>)";

} // namespace

class HtmlExtractorTest : public ::testing::Test {
protected:
    HtmlTextExtractor extractor;
    config::ExtractionConfig config;
};

TEST_F(HtmlExtractorTest, PlainOutputDropsMarkupAndScripts) {
    auto result = extractor.extractFromBuffer(asBytes(kPage), "text/html", config);
    ASSERT_TRUE(result) << result.error().message;
    const auto& content = result.value().content;

    EXPECT_THAT(content, HasSubstr("Summary"));
    EXPECT_THAT(content, HasSubstr("Revenue grew & costs fell by %5."));
    EXPECT_THAT(content, Not(HasSubstr("should not appear")));
    EXPECT_THAT(content, Not(HasSubstr("color: red")));
    EXPECT_THAT(content, Not(HasSubstr("internal note")));
    EXPECT_THAT(content, Not(HasSubstr("<p>")));
}

TEST_F(HtmlExtractorTest, MetadataIsCollected) {
    auto result = extractor.extractFromBuffer(asBytes(kPage), "text/html", config);
    ASSERT_TRUE(result);
    const auto& meta = result.value().metadata;

    EXPECT_EQ(meta["format_type"], "html");
    EXPECT_EQ(meta["title"], "Quarterly Report");
    EXPECT_EQ(meta["author"], "Ada Lovelace");
    EXPECT_EQ(meta["language"], "en");
    ASSERT_TRUE(meta.contains("keywords"));
    EXPECT_EQ(meta["keywords"].size(), 3u);
    EXPECT_EQ(meta["keywords"][1], "q3");
    EXPECT_EQ(meta["description"], "Numbers for Q3");
    EXPECT_EQ(meta["open_graph"]["description"], "Numbers for Q3");
}

TEST_F(HtmlExtractorTest, TablesAreAlwaysCollected) {
    auto result = extractor.extractFromBuffer(asBytes(kPage), "text/html", config);
    ASSERT_TRUE(result);
    ASSERT_EQ(result.value().tables.size(), 1u);
    const auto& table = result.value().tables[0];
    ASSERT_EQ(table.cells.size(), 2u);
    EXPECT_EQ(table.cells[0][0], "Region");
    EXPECT_EQ(table.cells[1][1], "10");
    EXPECT_THAT(table.markdown, HasSubstr("Region"));
}

TEST_F(HtmlExtractorTest, MarkdownOutput) {
    config.output_format = config::OutputFormat::Markdown;
    auto result = extractor.extractFromBuffer(asBytes(kPage), "text/html", config);
    ASSERT_TRUE(result);
    const auto& content = result.value().content;

    EXPECT_THAT(content, HasSubstr("# Summary"));
    EXPECT_THAT(content, HasSubstr("- First"));
    EXPECT_EQ(result.value().metadata["output_format"], "markdown");
}

TEST_F(HtmlExtractorTest, HtmlOutputKeepsSource) {
    config.output_format = config::OutputFormat::Html;
    auto result = extractor.extractFromBuffer(asBytes(kPage), "text/html", config);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().content, kPage);
}

TEST(HtmlToMarkdownTest, HeadingStyles) {
    config::HtmlConversionOptions options;
    options.heading_style = config::HeadingStyle::AtxClosed;
    auto md = HtmlToMarkdown(options).convert("<h2>Title</h2>");
    EXPECT_THAT(md, HasSubstr("## Title ##"));

    options.heading_style = config::HeadingStyle::Underlined;
    md = HtmlToMarkdown(options).convert("<h1>Title</h1>");
    EXPECT_THAT(md, HasSubstr("Title\n====="));
}

TEST(HtmlToMarkdownTest, InlineFormatting) {
    auto md = HtmlToMarkdown().convert("<p>Some <strong>bold</strong> and <mark>hot</mark></p>");
    EXPECT_THAT(md, HasSubstr("**bold**"));
    EXPECT_THAT(md, HasSubstr("==hot=="));

    auto djot = HtmlToMarkdown({}, true).convert("<p><strong>bold</strong></p>");
    EXPECT_THAT(djot, HasSubstr("*bold*"));
    EXPECT_THAT(djot, Not(HasSubstr("**bold**")));
}

TEST(HtmlToMarkdownTest, CodeBlocks) {
    auto md = HtmlToMarkdown().convert("<pre><code>int x = 1;</code></pre>");
    EXPECT_THAT(md, HasSubstr("```"));
    EXPECT_THAT(md, HasSubstr("int x = 1;"));
}

TEST(HtmlHelpersTest, DecodeEntities) {
    EXPECT_EQ(HtmlTextExtractor::decodeHtmlEntities("a &lt; b &gt; c"), "a < b > c");
    EXPECT_EQ(HtmlTextExtractor::decodeHtmlEntities("&#x41;&#66;"), "AB");
    EXPECT_EQ(HtmlTextExtractor::decodeHtmlEntities("fish &chips"), "fish &chips");
    EXPECT_EQ(HtmlTextExtractor::decodeHtmlEntities("&#xD800;"), "&#xD800;");
}

TEST(HtmlHelpersTest, TitleAndMeta) {
    const std::string html =
        R"(<head><title> Hello &amp; bye </title><meta name="Description" content="d"></head>)";
    EXPECT_EQ(HtmlTextExtractor::extractTitle(html), "Hello & bye");
    EXPECT_EQ(HtmlTextExtractor::extractMetaContent(html, "description"), "d");
    EXPECT_EQ(HtmlTextExtractor::extractMetaContent(html, "author"), "");
}

TEST(HtmlHelpersTest, TokenizerIsLenient) {
    auto tokens = tokenizeHtml("<p class=x>text<br/><img src='a.png'></P>");
    ASSERT_GE(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].kind, HtmlToken::Kind::StartTag);
    EXPECT_EQ(tokens[0].name, "p");
    EXPECT_EQ(tokens[0].attributes.at("class"), "x");
    EXPECT_EQ(tokens[1].kind, HtmlToken::Kind::Text);
    EXPECT_EQ(tokens[1].text, "text");
    EXPECT_TRUE(tokens[2].selfClosing);
    EXPECT_EQ(tokens.back().kind, HtmlToken::Kind::EndTag);
    EXPECT_EQ(tokens.back().name, "p");
}
