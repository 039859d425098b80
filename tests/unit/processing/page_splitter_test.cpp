#include <gtest/gtest.h>
#include <kreuzberg/processing/page_splitter.h>

using namespace kreuzberg;
using namespace kreuzberg::processing;

TEST(PageSplitterTest, FormatsMarkers) {
    EXPECT_EQ(formatPageMarker("--- {page_num} ---", 3), "--- 3 ---");
    EXPECT_EQ(formatPageMarker("{page_num}/{page_num}", 12), "12/12");
    EXPECT_EQ(formatPageMarker("no placeholder", 1), "no placeholder");
    EXPECT_EQ(formatPageMarker(config::kDefaultPageMarkerFormat, 2), "\n\n<!-- PAGE 2 -->\n\n");
}

TEST(PageSplitterTest, SplitsOnFormFeed) {
    auto pages = splitPages("one\ftwo\fthree");
    ASSERT_EQ(pages.size(), 3u);
    EXPECT_EQ(pages[0].content, "one");
    EXPECT_EQ(pages[1].page_number, 2u);
    EXPECT_EQ(pages[2].content, "three");

    auto single = splitPages("no breaks");
    ASSERT_EQ(single.size(), 1u);
    EXPECT_EQ(single[0].page_number, 1u);
}

TEST(PageSplitterTest, SinglePageKeepsContent) {
    extraction::ExtractionResult result;
    result.content = "just one page";

    applyPageConfig(result, config::PageConfig{});
    EXPECT_EQ(result.content, "just one page");
    EXPECT_EQ(result.metadata["page_count"], 1);
    ASSERT_TRUE(result.page_structure.has_value());
    EXPECT_EQ(result.page_structure->total_count, 1u);
    EXPECT_EQ(result.page_structure->boundaries[0].byte_end, result.content.size());
    EXPECT_FALSE(result.pages.has_value());
}

TEST(PageSplitterTest, JoinsPagesAndRecordsBoundaries) {
    extraction::ExtractionResult result;
    result.content = "alpha\fbeta";

    config::PageConfig cfg;
    cfg.extract_pages = true;
    applyPageConfig(result, cfg);

    EXPECT_EQ(result.content, "alpha\n\nbeta");
    ASSERT_TRUE(result.page_structure.has_value());
    const auto& b = result.page_structure->boundaries;
    ASSERT_EQ(b.size(), 2u);
    EXPECT_EQ(result.content.substr(b[0].byte_start, b[0].byte_end - b[0].byte_start), "alpha");
    EXPECT_EQ(result.content.substr(b[1].byte_start, b[1].byte_end - b[1].byte_start), "beta");
    ASSERT_TRUE(result.pages.has_value());
    EXPECT_EQ(result.pages->size(), 2u);
}

TEST(PageSplitterTest, InsertsMarkers) {
    extraction::ExtractionResult result;
    result.content = "alpha\fbeta";

    config::PageConfig cfg;
    cfg.insert_page_markers = true;
    cfg.marker_format = "[{page_num}]";
    applyPageConfig(result, cfg);

    EXPECT_EQ(result.content, "[1]alpha[2]beta");
    const auto& b = result.page_structure->boundaries;
    EXPECT_EQ(b[1].byte_start, 11u);
    EXPECT_EQ(b[1].byte_end, 15u);
}

TEST(PageSplitterTest, UsesPluginPagesAndAssignsTables) {
    extraction::ExtractionResult result;
    result.content = "ignored";
    result.pages = std::vector<extraction::PageContent>{{1, "first", {}}, {2, "second", {}}};
    extraction::Table table;
    table.cells = {{"a", "b"}};
    table.page_number = 2;
    result.tables.push_back(table);

    config::PageConfig cfg;
    cfg.extract_pages = true;
    applyPageConfig(result, cfg);

    EXPECT_EQ(result.content, "first\n\nsecond");
    ASSERT_TRUE(result.pages.has_value());
    EXPECT_TRUE((*result.pages)[0].tables.empty());
    ASSERT_EQ((*result.pages)[1].tables.size(), 1u);
    EXPECT_EQ((*result.pages)[1].tables[0].cells[0][1], "b");
}
