#include <gtest/gtest.h>
#include <kreuzberg/kreuzberg.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <string>

using json = nlohmann::json;

namespace {

// Takes ownership of a string returned by the library
std::string take(char* s) {
    if (!s)
        return {};
    std::string out(s);
    kreuzberg_free_string(s);
    return out;
}

} // namespace

TEST(FfiConfigTest, BuilderProducesConfig) {
    ConfigBuilder* builder = kreuzberg_config_builder_new();
    ASSERT_NE(builder, nullptr);
    EXPECT_EQ(kreuzberg_config_builder_set_use_cache(builder, false), 0);
    EXPECT_EQ(kreuzberg_config_builder_set_force_ocr(builder, true), 0);
    EXPECT_EQ(kreuzberg_config_builder_set_output_format(builder, "markdown"), 0);
    EXPECT_EQ(kreuzberg_config_builder_set_chunking(builder,
                                                    R"({"max_chars": 300, "max_overlap": 30})"),
              0);

    ExtractionConfig* config = kreuzberg_config_builder_build(builder);
    ASSERT_NE(config, nullptr);

    auto doc = json::parse(take(kreuzberg_config_to_json(config)));
    EXPECT_EQ(doc["use_cache"], false);
    EXPECT_EQ(doc["force_ocr"], true);
    EXPECT_EQ(doc["output_format"], "markdown");
    EXPECT_EQ(doc["chunking"]["max_chars"], 300);
    kreuzberg_config_free(config);
}

TEST(FfiConfigTest, BuilderSetterFailuresReportErrors) {
    ConfigBuilder* builder = kreuzberg_config_builder_new();
    EXPECT_EQ(kreuzberg_config_builder_set_output_format(builder, "docx"), -1);
    EXPECT_NE(kreuzberg_last_error(), nullptr);
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_INVALID_ARGUMENT);

    EXPECT_EQ(kreuzberg_config_builder_set_chunking(builder, "{not json"), -1);
    EXPECT_EQ(kreuzberg_config_builder_set_use_cache(nullptr, true), -1);
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_INVALID_ARGUMENT);

    // The builder stays usable after a rejected setter
    EXPECT_EQ(kreuzberg_config_builder_set_use_cache(builder, true), 0);
    kreuzberg_config_builder_free(builder);
}

TEST(FfiConfigTest, FailedBuildStillConsumesBuilder) {
    ConfigBuilder* builder = kreuzberg_config_builder_new();
    ASSERT_EQ(kreuzberg_config_builder_set_chunking(builder,
                                                    R"({"max_chars": 10, "max_overlap": 20})"),
              0);
    EXPECT_EQ(kreuzberg_config_builder_build(builder), nullptr);
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_INVALID_ARGUMENT);
    EXPECT_NE(std::string(kreuzberg_last_error()).find("max_overlap"), std::string::npos);
    // builder was released by build(); freeing it again would be a double free

    EXPECT_EQ(kreuzberg_config_builder_build(nullptr), nullptr);
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_INVALID_ARGUMENT);
}

TEST(FfiConfigTest, FromJsonAndFieldLookup) {
    ExtractionConfig* config = kreuzberg_config_from_json(
        R"({"use_cache": false, "ocr": {"backend": "tesseract", "language": "deu"}})");
    ASSERT_NE(config, nullptr);

    EXPECT_EQ(take(kreuzberg_config_get_field(config, "use_cache")), "false");
    EXPECT_EQ(take(kreuzberg_config_get_field(config, "ocr.language")), "\"deu\"");

    EXPECT_EQ(kreuzberg_config_get_field(config, "ocr.nope"), nullptr);
    EXPECT_NE(kreuzberg_last_error(), nullptr);
    EXPECT_EQ(kreuzberg_config_get_field(nullptr, "use_cache"), nullptr);
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_INVALID_ARGUMENT);
    kreuzberg_config_free(config);
}

TEST(FfiConfigTest, FromJsonRejectsInvalidDocuments) {
    EXPECT_EQ(kreuzberg_config_from_json("[1, 2]"), nullptr);
    EXPECT_NE(kreuzberg_last_error(), nullptr);
    EXPECT_EQ(kreuzberg_config_from_json(nullptr), nullptr);
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_INVALID_ARGUMENT);
}

TEST(FfiConfigTest, IsValid) {
    EXPECT_EQ(kreuzberg_config_is_valid(R"({"use_cache": true})"), 1);
    EXPECT_EQ(kreuzberg_config_is_valid("{}"), 1);
    EXPECT_EQ(kreuzberg_config_is_valid(R"({"chunking": {"max_chars": 0}})"), 0);
    EXPECT_EQ(kreuzberg_config_is_valid("not json"), 0);
    EXPECT_EQ(kreuzberg_config_is_valid(nullptr), 0);

    EXPECT_EQ(kreuzberg_config_is_valid(R"({"max_concurrent_extractions": -1})"), 0);
    EXPECT_EQ(kreuzberg_config_is_valid(R"({"ocr": {"tesseract_config": {"psm": 4294967299}}})"),
              0);
    EXPECT_EQ(kreuzberg_config_from_json(R"({"max_concurrent_extractions": 4294967296})"),
              nullptr);
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_INVALID_ARGUMENT);
}

TEST(FfiConfigTest, MergeAppliesOverlayFields) {
    ExtractionConfig* base = kreuzberg_config_from_json(R"({"force_ocr": true})");
    ExtractionConfig* overlay = kreuzberg_config_from_json(R"({"use_cache": false})");
    ASSERT_NE(base, nullptr);
    ASSERT_NE(overlay, nullptr);

    EXPECT_EQ(kreuzberg_config_merge(base, overlay), 1);
    auto doc = json::parse(take(kreuzberg_config_to_json(base)));
    EXPECT_EQ(doc["use_cache"], false);
    EXPECT_EQ(doc["force_ocr"], true);

    EXPECT_EQ(kreuzberg_config_merge(base, nullptr), 0);
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_INVALID_ARGUMENT);
    kreuzberg_config_free(base);
    kreuzberg_config_free(overlay);
}

TEST(FfiConfigTest, DiscoverLeavesNoErrorWhenNothingFound) {
    char* found = kreuzberg_config_discover();
    if (found) {
        EXPECT_TRUE(json::accept(found));
        kreuzberg_free_string(found);
    } else {
        EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_OK);
    }
}

TEST(FfiConfigTest, EmbeddingPresets) {
    auto names = json::parse(take(kreuzberg_list_embedding_presets()));
    ASSERT_TRUE(names.is_array());
    EXPECT_EQ(names.size(), 4u);
    EXPECT_NE(std::find(names.begin(), names.end(), "balanced"), names.end());

    auto balanced = json::parse(take(kreuzberg_get_embedding_preset("balanced")));
    EXPECT_EQ(balanced["chunk_size"], 1024);
    EXPECT_EQ(balanced["overlap"], 100);
    EXPECT_EQ(balanced["dimensions"], 768);

    EXPECT_EQ(kreuzberg_get_embedding_preset("enormous"), nullptr);
    EXPECT_EQ(kreuzberg_last_error_code(), KREUZBERG_ERROR_INVALID_ARGUMENT);
}

TEST(FfiValidationTest, FieldValidators) {
    EXPECT_EQ(kreuzberg_validate_binarization_method("otsu"), 1);
    EXPECT_EQ(kreuzberg_validate_binarization_method("magic"), 0);
    EXPECT_EQ(kreuzberg_validate_binarization_method(nullptr), 0);

    EXPECT_EQ(kreuzberg_validate_ocr_backend("tesseract"), 1);
    EXPECT_EQ(kreuzberg_validate_ocr_backend("abbyy"), 0);

    EXPECT_EQ(kreuzberg_validate_language_code("eng"), 1);
    EXPECT_EQ(kreuzberg_validate_language_code("de"), 1);
    EXPECT_EQ(kreuzberg_validate_language_code("eng+deu"), 1);
    EXPECT_EQ(kreuzberg_validate_language_code("klingon"), 0);

    EXPECT_EQ(kreuzberg_validate_token_reduction_level("moderate"), 1);
    EXPECT_EQ(kreuzberg_validate_token_reduction_level("extreme"), 0);

    EXPECT_EQ(kreuzberg_validate_tesseract_psm(3), 1);
    EXPECT_EQ(kreuzberg_validate_tesseract_psm(14), 0);
    EXPECT_EQ(kreuzberg_validate_tesseract_oem(3), 1);
    EXPECT_EQ(kreuzberg_validate_tesseract_oem(-1), 0);

    EXPECT_EQ(kreuzberg_validate_output_format("hocr"), 1);
    EXPECT_EQ(kreuzberg_validate_output_format("pdf"), 0);

    EXPECT_EQ(kreuzberg_validate_confidence(0.5), 1);
    EXPECT_EQ(kreuzberg_validate_confidence(1.5), 0);

    EXPECT_EQ(kreuzberg_validate_dpi(300), 1);
    EXPECT_EQ(kreuzberg_validate_dpi(0), 0);
    EXPECT_EQ(kreuzberg_validate_dpi(5000), 0);
}

TEST(FfiValidationTest, ChunkingParams) {
    EXPECT_EQ(kreuzberg_validate_chunking_params(1000, 200), 1);
    EXPECT_EQ(kreuzberg_validate_chunking_params(0, 0), 0);
    EXPECT_EQ(kreuzberg_validate_chunking_params(100, 100), 0);
}

TEST(FfiValidationTest, ValidValueLists) {
    auto methods = json::parse(take(kreuzberg_get_valid_binarization_methods()));
    EXPECT_EQ(methods, json::array({"otsu", "adaptive", "sauvola"}));

    auto backends = json::parse(take(kreuzberg_get_valid_ocr_backends()));
    EXPECT_EQ(backends, json::array({"tesseract", "easyocr", "paddleocr"}));

    auto levels = json::parse(take(kreuzberg_get_valid_token_reduction_levels()));
    EXPECT_EQ(levels.size(), 5u);

    auto languages = json::parse(take(kreuzberg_get_valid_language_codes()));
    EXPECT_NE(std::find(languages.begin(), languages.end(), "eng"), languages.end());
}

TEST(FfiEnumTest, ParseAndFormat) {
    EXPECT_EQ(kreuzberg_parse_heading_style("atx_closed"), 2);
    EXPECT_EQ(kreuzberg_parse_heading_style("ATX"), 0);
    EXPECT_EQ(kreuzberg_parse_heading_style("setext"), 1);
    EXPECT_EQ(kreuzberg_parse_heading_style("fancy"), -1);
    EXPECT_EQ(kreuzberg_parse_heading_style(nullptr), -1);
    EXPECT_STREQ(kreuzberg_heading_style_to_string(1), "underlined");
    EXPECT_EQ(kreuzberg_heading_style_to_string(3), nullptr);

    EXPECT_EQ(kreuzberg_parse_code_block_style("tildes"), 2);
    EXPECT_STREQ(kreuzberg_code_block_style_to_string(1), "backticks");
    EXPECT_EQ(kreuzberg_code_block_style_to_string(-1), nullptr);

    EXPECT_EQ(kreuzberg_parse_highlight_style("bold"), 2);
    EXPECT_STREQ(kreuzberg_highlight_style_to_string(3), "none");
    EXPECT_EQ(kreuzberg_highlight_style_to_string(4), nullptr);

    EXPECT_EQ(kreuzberg_parse_list_indent_type("tabs"), 1);
    EXPECT_EQ(kreuzberg_list_indent_type_to_string(2), nullptr);

    EXPECT_EQ(kreuzberg_parse_whitespace_mode("preserve-inner"), 2);
    EXPECT_EQ(kreuzberg_whitespace_mode_to_string(4), nullptr);

    EXPECT_EQ(kreuzberg_parse_newline_style("backslash"), 1);
    EXPECT_STREQ(kreuzberg_newline_style_to_string(0), "spaces");

    EXPECT_EQ(kreuzberg_parse_preprocessing_preset("aggressive"), 2);
    EXPECT_EQ(kreuzberg_preprocessing_preset_to_string(3), nullptr);
}
