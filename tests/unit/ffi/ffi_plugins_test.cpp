#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <kreuzberg/kreuzberg.h>
#include <nlohmann/json.hpp>

#include <cstring>
#include <string>
#include <string_view>

using json = nlohmann::json;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace {

constexpr const char* kNoCache = R"({"use_cache": false})";

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

char* ocrCallback(const uint8_t*, uintptr_t length, const char* config_json) {
    auto cfg = json::parse(config_json);
    std::string text = "recognised " + std::to_string(length) + " bytes in " +
                       cfg.value("language", std::string("?"));
    return strdup(text.c_str());
}

char* appendMarker(const char* result_json) {
    auto result = json::parse(result_json);
    json patch = {{"content", result["content"].get<std::string>() + " [pp]"}};
    return strdup(patch.dump().c_str());
}

char* keepResult(const char*) {
    return nullptr;
}

char* rejectForbidden(const char* result_json) {
    auto result = json::parse(result_json);
    if (result["content"].get<std::string>().find("forbidden") != std::string::npos)
        return strdup("content contains a forbidden word");
    return nullptr;
}

char* demoExtractor(const uint8_t* content, uintptr_t content_len, const char* mime_type,
                    const char*) {
    std::string body(reinterpret_cast<const char*>(content), content_len);
    json result = {{"content", "demo(" + std::string(mime_type) + "): " + body}};
    return strdup(result.dump().c_str());
}

class FfiPluginTest : public ::testing::Test {
protected:
    void SetUp() override { clearAll(); }
    void TearDown() override { clearAll(); }

    static void clearAll() {
        ASSERT_TRUE(kreuzberg_clear_ocr_backends());
        ASSERT_TRUE(kreuzberg_clear_post_processors());
        ASSERT_TRUE(kreuzberg_clear_validators());
        ASSERT_TRUE(kreuzberg_clear_document_extractors());
    }

    static CExtractionResult* extractText(std::string_view text) {
        return kreuzberg_extract_bytes_sync_with_config(bytes(text), text.size(), "text/plain",
                                                        kNoCache);
    }
};

} // namespace

TEST_F(FfiPluginTest, OcrBackendWithLanguages) {
    ASSERT_TRUE(kreuzberg_register_ocr_backend_with_languages("tesseract", ocrCallback,
                                                              R"(["eng", "deu"])"));

    auto backends = json::parse(take(kreuzberg_list_ocr_backends()));
    EXPECT_EQ(backends, json::array({"tesseract"}));
    auto languages = json::parse(take(kreuzberg_get_ocr_languages("tesseract")));
    EXPECT_EQ(languages, json::array({"eng", "deu"}));

    EXPECT_EQ(kreuzberg_is_language_supported("tesseract", "DEU"), 1);
    EXPECT_EQ(kreuzberg_is_language_supported("tesseract", "fra"), 0);
    EXPECT_EQ(kreuzberg_is_language_supported("missing", "eng"), 0);
    EXPECT_EQ(kreuzberg_is_language_supported(nullptr, "eng"), 0);

    auto all = json::parse(take(kreuzberg_list_ocr_backends_with_languages()));
    ASSERT_TRUE(all.is_object());
    EXPECT_EQ(all["tesseract"], json::array({"eng", "deu"}));

    EXPECT_EQ(kreuzberg_get_ocr_languages("missing"), nullptr);
    EXPECT_NE(kreuzberg_last_error(), nullptr);
}

TEST_F(FfiPluginTest, OcrLanguagesAcceptCommaList) {
    ASSERT_TRUE(kreuzberg_register_ocr_backend_with_languages("tesseract", ocrCallback,
                                                              "eng, fra"));
    auto languages = json::parse(take(kreuzberg_get_ocr_languages("tesseract")));
    EXPECT_EQ(languages, json::array({"eng", "fra"}));

    EXPECT_FALSE(
        kreuzberg_register_ocr_backend_with_languages("tesseract", ocrCallback, "[1, 2]"));
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_INVALID_ARGUMENT);
}

TEST_F(FfiPluginTest, OcrBackendHandlesImages) {
    ASSERT_TRUE(kreuzberg_register_ocr_backend("tesseract", ocrCallback));

    const std::string_view png("\x89PNG\r\n\x1a\n\0\0\0\rIHDR", 16);
    CExtractionResult* result = kreuzberg_extract_bytes_sync_with_config(
        bytes(png), png.size(), "image/png",
        R"({"use_cache": false, "ocr": {"backend": "tesseract", "language": "deu"}})");
    ASSERT_NE(result, nullptr) << kreuzberg_last_error();
    EXPECT_STREQ(result->content, "recognised 16 bytes in deu");
    kreuzberg_free_result(result);

    ASSERT_TRUE(kreuzberg_unregister_ocr_backend("tesseract"));
    EXPECT_EQ(kreuzberg_extract_bytes_sync_with_config(bytes(png), png.size(), "image/png",
                                                       kNoCache),
              nullptr);
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_MISSING_DEPENDENCY);
}

TEST_F(FfiPluginTest, RegistrationRejectsBadArguments) {
    EXPECT_FALSE(kreuzberg_register_ocr_backend("tesseract", nullptr));
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_INVALID_ARGUMENT);
    EXPECT_THAT(kreuzberg_last_error(), HasSubstr("tesseract"));

    EXPECT_FALSE(kreuzberg_register_validator(nullptr, rejectForbidden, 0));
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_INVALID_ARGUMENT);

    EXPECT_FALSE(kreuzberg_register_post_processor("has space", keepResult, 0));
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_INVALID_ARGUMENT);

    EXPECT_FALSE(kreuzberg_register_document_extractor("demo", demoExtractor, nullptr, 0));
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_INVALID_ARGUMENT);

    EXPECT_FALSE(kreuzberg_unregister_validator(nullptr));
    EXPECT_EQ(json::parse(take(kreuzberg_list_post_processors())), json::array());
}

TEST_F(FfiPluginTest, PostProcessorPatchesResult) {
    ASSERT_TRUE(kreuzberg_register_post_processor_with_stage("marker", appendMarker, 10, "late"));
    ASSERT_TRUE(kreuzberg_register_post_processor("keeper", keepResult, 0));

    auto names = json::parse(take(kreuzberg_list_post_processors()));
    EXPECT_THAT(names.get<std::vector<std::string>>(), ElementsAre("marker", "keeper"));

    CExtractionResult* result = extractText("body text");
    ASSERT_NE(result, nullptr) << kreuzberg_last_error();
    EXPECT_STREQ(result->content, "body text [pp]");
    kreuzberg_free_result(result);

    ASSERT_TRUE(kreuzberg_unregister_post_processor("marker"));
    result = extractText("body text");
    ASSERT_NE(result, nullptr);
    EXPECT_STREQ(result->content, "body text");
    kreuzberg_free_result(result);
}

TEST_F(FfiPluginTest, PostProcessorRejectsUnknownStage) {
    EXPECT_FALSE(
        kreuzberg_register_post_processor_with_stage("marker", appendMarker, 0, "sideways"));
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_INVALID_ARGUMENT);
    EXPECT_THAT(kreuzberg_last_error(), HasSubstr("sideways"));
}

TEST_F(FfiPluginTest, ValidatorRejectsResult) {
    ASSERT_TRUE(kreuzberg_register_validator("no_forbidden", rejectForbidden, 5));
    EXPECT_EQ(json::parse(take(kreuzberg_list_validators())), json::array({"no_forbidden"}));

    CExtractionResult* ok = extractText("perfectly fine");
    ASSERT_NE(ok, nullptr) << kreuzberg_last_error();
    kreuzberg_free_result(ok);

    EXPECT_EQ(extractText("this is forbidden text"), nullptr);
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_INVALID_ARGUMENT);
    EXPECT_THAT(kreuzberg_last_error(), HasSubstr("forbidden word"));
}

TEST_F(FfiPluginTest, DocumentExtractorFromCommaList) {
    ASSERT_TRUE(kreuzberg_register_document_extractor("demo", demoExtractor,
                                                      "application/x-demo, application/x-demo2",
                                                      50));
    EXPECT_EQ(json::parse(take(kreuzberg_list_document_extractors())), json::array({"demo"}));

    const std::string_view payload = "payload";
    for (const char* mime : {"application/x-demo", "application/x-demo2"}) {
        CExtractionResult* result = kreuzberg_extract_bytes_sync_with_config(
            bytes(payload), payload.size(), mime, kNoCache);
        ASSERT_NE(result, nullptr) << kreuzberg_last_error();
        EXPECT_EQ(std::string(result->content), "demo(" + std::string(mime) + "): payload");
        EXPECT_STREQ(result->mime_type, mime);
        kreuzberg_free_result(result);
    }

    ASSERT_TRUE(kreuzberg_unregister_document_extractor("demo"));
    EXPECT_EQ(kreuzberg_extract_bytes_sync_with_config(bytes(payload), payload.size(),
                                                       "application/x-demo", kNoCache),
              nullptr);
}

TEST_F(FfiPluginTest, DocumentExtractorFromJsonArrayOverridesBuiltIn) {
    ASSERT_TRUE(kreuzberg_register_document_extractor("demo", demoExtractor,
                                                      R"(["text/plain"])", 100));

    CExtractionResult* result = extractText("plain");
    ASSERT_NE(result, nullptr) << kreuzberg_last_error();
    EXPECT_STREQ(result->content, "demo(text/plain): plain");
    kreuzberg_free_result(result);

    EXPECT_FALSE(kreuzberg_register_document_extractor("other", demoExtractor, "[\"x\", 3]", 0));
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_INVALID_ARGUMENT);
}

TEST_F(FfiPluginTest, ClearEmptiesEveryCategory) {
    ASSERT_TRUE(kreuzberg_register_ocr_backend("tesseract", ocrCallback));
    ASSERT_TRUE(kreuzberg_register_validator("no_forbidden", rejectForbidden, 0));
    ASSERT_TRUE(kreuzberg_clear_ocr_backends());
    ASSERT_TRUE(kreuzberg_clear_validators());
    EXPECT_EQ(json::parse(take(kreuzberg_list_ocr_backends())), json::array());
    EXPECT_EQ(json::parse(take(kreuzberg_list_validators())), json::array());

    EXPECT_TRUE(kreuzberg_clear_validators());
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_OK);
    EXPECT_TRUE(kreuzberg_clear_validators());
    EXPECT_EQ(kreuzberg_last_error(), nullptr);
}

TEST_F(FfiPluginTest, UnregisteringUnknownNameSucceeds) {
    EXPECT_TRUE(kreuzberg_unregister_ocr_backend("nonexistent-xyz"));
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_OK);
    EXPECT_EQ(kreuzberg_last_error(), nullptr);

    EXPECT_TRUE(kreuzberg_unregister_post_processor("nonexistent-xyz"));
    EXPECT_TRUE(kreuzberg_unregister_validator("nonexistent-xyz"));
    EXPECT_TRUE(kreuzberg_unregister_document_extractor("nonexistent-xyz"));
    EXPECT_EQ(kreuzberg_last_error(), nullptr);
}
