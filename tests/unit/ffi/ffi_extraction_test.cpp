#include "test_helpers.h"

#include <kreuzberg/kreuzberg.h>
#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

using json = nlohmann::json;
using ::testing::HasSubstr;

namespace {

const uint8_t* bytes(std::string_view s) {
    return reinterpret_cast<const uint8_t*>(s.data());
}

std::string take(char* s) {
    if (!s)
        return {};
    std::string out(s);
    kreuzberg_free_string(s);
    return out;
}

constexpr const char* kNoCache = R"({"use_cache": false})";

class FfiExtractionTest : public kreuzberg::test::KreuzbergTest {};

} // namespace

TEST(FfiMimeTest, DetectsFromExtension) {
    EXPECT_EQ(take(kreuzberg_detect_mime_type("report.pdf", false)), "application/pdf");
    EXPECT_EQ(take(kreuzberg_detect_mime_type("notes.MD", false)), "text/markdown");

    EXPECT_EQ(kreuzberg_detect_mime_type("/no/such/report.pdf", true), nullptr);
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_IO);
    EXPECT_EQ(kreuzberg_detect_mime_type("noextension", false), nullptr);
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(kreuzberg_detect_mime_type(nullptr, false), nullptr);
}

TEST(FfiMimeTest, DetectsFromBytes) {
    const std::string_view pdf = "%PDF-1.7\n%\xE2\xE3\xCF\xD3\n";
    EXPECT_EQ(take(kreuzberg_detect_mime_type_from_bytes(bytes(pdf), pdf.size())),
              "application/pdf");
    EXPECT_EQ(kreuzberg_detect_mime_type_from_bytes(nullptr, 0), nullptr);
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_INVALID_ARGUMENT);
}

TEST(FfiMimeTest, UnknownBinaryIsOctetStream) {
    const std::string_view binary("\x00\x01\x02\x03\x04\x05\x06\x07", 8);
    EXPECT_EQ(take(kreuzberg_detect_mime_type_from_bytes(bytes(binary), binary.size())),
              "application/octet-stream");
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_OK);
}

TEST(FfiMimeTest, DetectionDependsOnWholeBuffer) {
    const std::string prefix = "<?xml version=\"1.0\"?><!-- padding shared by both -->";
    const std::string svg = prefix + "<svg xmlns=\"http://www.w3.org/2000/svg\"/>";
    const std::string doc = prefix + "<doc>a plain xml document body text</doc>";
    ASSERT_EQ(svg.size(), doc.size());

    EXPECT_EQ(take(kreuzberg_detect_mime_type_from_bytes(bytes(svg), svg.size())),
              "image/svg+xml");
    const std::string docMime = take(kreuzberg_detect_mime_type_from_bytes(bytes(doc), doc.size()));
    EXPECT_NE(docMime, "image/svg+xml");
    EXPECT_THAT(docMime, HasSubstr("xml"));
}

TEST(FfiMimeTest, ValidatesAndListsExtensions) {
    EXPECT_EQ(take(kreuzberg_validate_mime_type("Text/Plain; charset=utf-8")), "text/plain");
    EXPECT_EQ(kreuzberg_validate_mime_type("application/x-unheard-of"), nullptr);
    EXPECT_NE(kreuzberg_last_error(), nullptr);

    auto extensions = json::parse(take(kreuzberg_get_extensions_for_mime("text/markdown")));
    ASSERT_TRUE(extensions.is_array());
    EXPECT_NE(std::find(extensions.begin(), extensions.end(), "md"), extensions.end());
}

TEST_F(FfiExtractionTest, DetectsFromPath) {
    auto path = writeFile("sample.txt", "plain words");
    EXPECT_EQ(take(kreuzberg_detect_mime_type_from_path(path.c_str())), "text/plain");
}

TEST_F(FfiExtractionTest, ExtractsBytes) {
    const std::string_view text = "hello world from kreuzberg";
    CExtractionResult* result = kreuzberg_extract_bytes_sync(bytes(text), text.size(), "text/plain");
    ASSERT_NE(result, nullptr) << kreuzberg_last_error();

    EXPECT_TRUE(result->success);
    EXPECT_STREQ(result->content, "hello world from kreuzberg");
    EXPECT_STREQ(result->mime_type, "text/plain");
    ASSERT_NE(result->metadata_json, nullptr);
    auto metadata = json::parse(result->metadata_json);
    EXPECT_EQ(metadata["word_count"], 4);
    ASSERT_NE(result->tables_json, nullptr);
    EXPECT_EQ(json::parse(result->tables_json), json::array());
    EXPECT_EQ(result->chunks_json, nullptr);
    kreuzberg_free_result(result);
}

TEST_F(FfiExtractionTest, ExtractsBytesWithConfigJson) {
    std::string text;
    for (int i = 0; i < 40; ++i)
        text += "sentence number " + std::to_string(i) + ". ";

    CExtractionResult* result = kreuzberg_extract_bytes_sync_with_config(
        bytes(text), text.size(), "text/plain",
        R"({"use_cache": false, "chunking": {"max_chars": 100, "max_overlap": 10}})");
    ASSERT_NE(result, nullptr) << kreuzberg_last_error();
    ASSERT_NE(result->chunks_json, nullptr);
    auto chunks = json::parse(result->chunks_json);
    ASSERT_TRUE(chunks.is_array());
    EXPECT_GT(chunks.size(), 3u);
    EXPECT_TRUE(chunks[0].contains("content"));
    kreuzberg_free_result(result);

    EXPECT_EQ(kreuzberg_extract_bytes_sync_with_config(bytes(text), text.size(), "text/plain",
                                                       R"({"chunking": {"max_chars": 0}})"),
              nullptr);
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_INVALID_ARGUMENT);
}

TEST_F(FfiExtractionTest, ExtractsBytesWithConfigHandle) {
    ExtractionConfig* config = kreuzberg_config_from_json(R"({"use_cache": false})");
    ASSERT_NE(config, nullptr);
    const std::string_view text = "handle based config";
    CExtractionResult* result =
        kreuzberg_extract_bytes_with_config_handle(bytes(text), text.size(), "text/plain", config);
    ASSERT_NE(result, nullptr) << kreuzberg_last_error();
    EXPECT_STREQ(result->content, "handle based config");
    kreuzberg_free_result(result);
    kreuzberg_config_free(config);
}

TEST_F(FfiExtractionTest, RejectsMissingArguments) {
    const std::string_view text = "x";
    EXPECT_EQ(kreuzberg_extract_bytes_sync(bytes(text), text.size(), nullptr), nullptr);
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(kreuzberg_extract_file_sync(nullptr), nullptr);
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(kreuzberg_extract_bytes_sync_with_config(bytes(text), text.size(), "text/plain",
                                                       "{broken"),
              nullptr);
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_INVALID_ARGUMENT);
}

TEST_F(FfiExtractionTest, ExtractsFiles) {
    auto path = writeFile("doc.txt", "file based content");
    CExtractionResult* result = kreuzberg_extract_file_sync(path.c_str());
    ASSERT_NE(result, nullptr) << kreuzberg_last_error();
    EXPECT_STREQ(result->content, "file based content");
    EXPECT_STREQ(result->mime_type, "text/plain");
    kreuzberg_free_result(result);

    result = kreuzberg_extract_file_sync_with_config(path.c_str(), kNoCache);
    ASSERT_NE(result, nullptr) << kreuzberg_last_error();
    EXPECT_STREQ(result->content, "file based content");
    kreuzberg_free_result(result);
}

TEST_F(FfiExtractionTest, HintOverridesDetection) {
    auto path = writeFile("payload.bin", "hinted text");
    CExtractionResult* result = kreuzberg_extract_file_with_hint(path.c_str(), "text/plain", nullptr);
    ASSERT_NE(result, nullptr) << kreuzberg_last_error();
    EXPECT_STREQ(result->content, "hinted text");
    EXPECT_STREQ(result->mime_type, "text/plain");
    kreuzberg_free_result(result);
}

TEST_F(FfiExtractionTest, BatchFilesKeepOrderAndIsolateFailures) {
    auto first = writeFile("one.txt", "first file");
    auto second = writeFile("two.txt", "second file");
    const std::string missing = (testDir / "missing.txt").string();
    const char* paths[] = {first.c_str(), missing.c_str(), second.c_str()};

    CBatchResult* batch = kreuzberg_batch_extract_files_sync(paths, 3, kNoCache);
    ASSERT_NE(batch, nullptr) << kreuzberg_last_error();
    ASSERT_EQ(batch->count, 3u);
    EXPECT_TRUE(batch->success);

    EXPECT_TRUE(batch->results[0]->success);
    EXPECT_STREQ(batch->results[0]->content, "first file");
    EXPECT_TRUE(batch->results[2]->success);
    EXPECT_STREQ(batch->results[2]->content, "second file");

    const CExtractionResult* failed = batch->results[1];
    EXPECT_FALSE(failed->success);
    EXPECT_EQ(failed->content, nullptr);
    ASSERT_NE(failed->metadata_json, nullptr);
    auto error = json::parse(failed->metadata_json)["error"];
    EXPECT_EQ(error["error_type"], "io");
    EXPECT_THAT(error["message"].get<std::string>(), HasSubstr("missing.txt"));
    kreuzberg_free_batch_result(batch);
}

TEST_F(FfiExtractionTest, BatchBytes) {
    const std::string_view a = "alpha bytes";
    const std::string_view b = "beta bytes";
    CBytesWithMime items[] = {
        {bytes(a), a.size(), "text/plain"},
        {bytes(b), b.size(), "application/x-unheard-of"},
    };

    CBatchResult* batch = kreuzberg_batch_extract_bytes_sync(items, 2, nullptr);
    ASSERT_NE(batch, nullptr) << kreuzberg_last_error();
    ASSERT_EQ(batch->count, 2u);
    EXPECT_TRUE(batch->results[0]->success);
    EXPECT_STREQ(batch->results[0]->content, "alpha bytes");
    EXPECT_FALSE(batch->results[1]->success);
    auto error = json::parse(batch->results[1]->metadata_json)["error"];
    EXPECT_EQ(error["error_type"], "unsupported_format");
    kreuzberg_free_batch_result(batch);

    CBytesWithMime bad[] = {{bytes(a), a.size(), nullptr}};
    EXPECT_EQ(kreuzberg_batch_extract_bytes_sync(bad, 1, nullptr), nullptr);
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_INVALID_ARGUMENT);
}

TEST_F(FfiExtractionTest, EmptyBatchIsSuccessful) {
    CBatchResult* batch = kreuzberg_batch_extract_bytes_sync(nullptr, 0, nullptr);
    ASSERT_NE(batch, nullptr);
    EXPECT_EQ(batch->count, 0u);
    EXPECT_TRUE(batch->success);
    kreuzberg_free_batch_result(batch);
}

TEST_F(FfiExtractionTest, ResultHandles) {
    std::string text;
    for (int i = 0; i < 30; ++i)
        text += "token" + std::to_string(i) + " ";

    ExtractionResult* handle = kreuzberg_extract_bytes_handle(
        bytes(text), text.size(), "text/plain",
        R"({"use_cache": false, "chunking": {"max_chars": 40, "max_overlap": 0}})");
    ASSERT_NE(handle, nullptr) << kreuzberg_last_error();

    EXPECT_STREQ(kreuzberg_result_get_mime_type(handle), "text/plain");
    EXPECT_THAT(kreuzberg_result_get_content(handle), HasSubstr("token29"));
    EXPECT_GT(kreuzberg_result_get_chunk_count(handle), 1u);

    CMetadataField words = kreuzberg_result_get_metadata_field(handle, "word_count");
    EXPECT_STREQ(words.name, "word_count");
    EXPECT_STREQ(words.json_value, "30");
    EXPECT_EQ(words.is_null, 0);
    kreuzberg_free_string(words.name);
    kreuzberg_free_string(words.json_value);

    CMetadataField missing = kreuzberg_result_get_metadata_field(handle, "no.such.field");
    EXPECT_STREQ(missing.name, "no.such.field");
    EXPECT_EQ(missing.json_value, nullptr);
    EXPECT_EQ(missing.is_null, 1);
    kreuzberg_free_string(missing.name);

    CExtractionResult* flat = kreuzberg_result_to_c(handle);
    ASSERT_NE(flat, nullptr);
    EXPECT_STREQ(flat->content, kreuzberg_result_get_content(handle));
    ASSERT_NE(flat->chunks_json, nullptr);
    kreuzberg_free_result(flat);

    kreuzberg_result_handle_free(handle);
    EXPECT_EQ(kreuzberg_result_get_content(nullptr), nullptr);
    EXPECT_EQ(kreuzberg_result_get_chunk_count(nullptr), 0u);
}

TEST_F(FfiExtractionTest, FileHandle) {
    auto path = writeFile("handle.txt", "via file handle");
    ExtractionResult* handle = kreuzberg_extract_file_handle(path.c_str(), kNoCache);
    ASSERT_NE(handle, nullptr) << kreuzberg_last_error();
    EXPECT_STREQ(kreuzberg_result_get_content(handle), "via file handle");
    kreuzberg_result_handle_free(handle);

    EXPECT_EQ(kreuzberg_extract_file_handle((testDir / "gone.txt").c_str(), nullptr), nullptr);
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_IO);
}

TEST_F(FfiExtractionTest, ResultPoolViews) {
    auto notes = writeFile("notes.md", "# Pool Title\n\nBody text here.\n");
    auto plain = writeFile("plain.txt", "second pooled document");

    ResultPool* pool = kreuzberg_result_pool_new(1);
    ASSERT_NE(pool, nullptr);

    const CExtractionResultView* view = kreuzberg_extract_file_into_pool(notes.c_str(), kNoCache, pool);
    ASSERT_NE(view, nullptr) << kreuzberg_last_error();
    EXPECT_EQ(std::string_view(reinterpret_cast<const char*>(view->mime_type_ptr),
                               view->mime_type_len),
              "text/markdown");
    ASSERT_NE(view->title_ptr, nullptr);
    EXPECT_EQ(std::string_view(reinterpret_cast<const char*>(view->title_ptr), view->title_len),
              "Pool Title");

    const uint8_t* ptr = nullptr;
    uintptr_t len = 0;
    ASSERT_EQ(kreuzberg_view_get_content(view, &ptr, &len), 0);
    EXPECT_EQ(std::string_view(reinterpret_cast<const char*>(ptr), len).substr(0, 12),
              "# Pool Title");
    ASSERT_EQ(kreuzberg_view_get_mime_type(view, &ptr, &len), 0);
    EXPECT_EQ(len, std::string_view("text/markdown").size());
    EXPECT_EQ(kreuzberg_view_get_content(nullptr, &ptr, &len), -1);
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_INVALID_ARGUMENT);

    CExtractionResultView copy = kreuzberg_extract_file_into_pool_view(plain.c_str(), kNoCache, pool);
    EXPECT_EQ(copy.content_len, std::string_view("second pooled document").size());
    EXPECT_EQ(copy.title_ptr, nullptr);

    // The first view survives the pool growing to hold the second result
    EXPECT_EQ(std::string_view(reinterpret_cast<const char*>(view->title_ptr), view->title_len),
              "Pool Title");

    CResultPoolStats stats = kreuzberg_result_pool_stats(pool);
    EXPECT_EQ(stats.current_count, 2u);
    EXPECT_GE(stats.capacity, 2u);
    EXPECT_EQ(stats.total_allocations, 2u);
    EXPECT_EQ(stats.growth_events, 1u);
    EXPECT_GT(stats.estimated_memory_bytes, 0u);

    kreuzberg_result_pool_reset(pool);
    stats = kreuzberg_result_pool_stats(pool);
    EXPECT_EQ(stats.current_count, 0u);

    EXPECT_EQ(kreuzberg_extract_file_into_pool((testDir / "gone.txt").c_str(), nullptr, pool),
              nullptr);
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_IO);
    kreuzberg_result_pool_free(pool);

    CResultPoolStats none = kreuzberg_result_pool_stats(nullptr);
    EXPECT_EQ(none.capacity, 0u);
}

TEST(FfiInternTest, InternsAndCounts) {
    kreuzberg_string_intern_reset();

    const char* a = kreuzberg_intern_string("x-ffi-test/interned");
    const char* b = kreuzberg_intern_string("x-ffi-test/interned");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a, b);
    EXPECT_STREQ(a, "x-ffi-test/interned");

    const char* pdf = kreuzberg_intern_string("application/pdf");
    ASSERT_NE(pdf, nullptr);

    CStringInternStats stats = kreuzberg_string_intern_stats();
    EXPECT_EQ(stats.total_requests, 3u);
    EXPECT_EQ(stats.cache_misses, 1u);
    EXPECT_EQ(stats.cache_hits, 2u);
    EXPECT_GT(stats.unique_count, 0u);
    EXPECT_GT(stats.total_memory_bytes, 0u);

    kreuzberg_free_interned_string(a);
    kreuzberg_free_interned_string(b);
    kreuzberg_free_interned_string(pdf);
    kreuzberg_free_interned_string(nullptr);

    EXPECT_EQ(kreuzberg_intern_string(nullptr), nullptr);
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_INVALID_ARGUMENT);

    kreuzberg_string_intern_reset();
    stats = kreuzberg_string_intern_stats();
    EXPECT_EQ(stats.total_requests, 0u);
}
