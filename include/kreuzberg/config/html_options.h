#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace kreuzberg::config {

// Discriminant values are exposed through the C ABI (kreuzberg_parse_*), keep them stable.

enum class HeadingStyle : std::int32_t { Atx = 0, Underlined = 1, AtxClosed = 2 };

enum class CodeBlockStyle : std::int32_t { Indented = 0, Backticks = 1, Tildes = 2 };

enum class HighlightStyle : std::int32_t { DoubleEqual = 0, Html = 1, Bold = 2, None = 3 };

enum class ListIndentType : std::int32_t { Spaces = 0, Tabs = 1 };

enum class WhitespaceMode : std::int32_t { Default = 0, Preserve = 1, PreserveInner = 2, Collapse = 3 };

enum class NewlineStyle : std::int32_t { Spaces = 0, Backslash = 1 };

enum class PreprocessingPreset : std::int32_t { None = 0, Conservative = 1, Aggressive = 2 };

/**
 * @brief Options controlling HTML to Markdown conversion
 */
struct HtmlConversionOptions {
    HeadingStyle heading_style = HeadingStyle::Atx;
    CodeBlockStyle code_block_style = CodeBlockStyle::Backticks;
    HighlightStyle highlight_style = HighlightStyle::DoubleEqual;
    ListIndentType list_indent_type = ListIndentType::Spaces;
    std::int32_t list_indent_width = 2;
    WhitespaceMode whitespace_mode = WhitespaceMode::Default;
    NewlineStyle newline_style = NewlineStyle::Spaces;
    PreprocessingPreset preprocessing = PreprocessingPreset::Conservative;

    bool operator==(const HtmlConversionOptions&) const = default;
};

std::optional<HeadingStyle> parseHeadingStyle(std::string_view s);
const char* toString(HeadingStyle v);

std::optional<CodeBlockStyle> parseCodeBlockStyle(std::string_view s);
const char* toString(CodeBlockStyle v);

std::optional<HighlightStyle> parseHighlightStyle(std::string_view s);
const char* toString(HighlightStyle v);

std::optional<ListIndentType> parseListIndentType(std::string_view s);
const char* toString(ListIndentType v);

std::optional<WhitespaceMode> parseWhitespaceMode(std::string_view s);
const char* toString(WhitespaceMode v);

std::optional<NewlineStyle> parseNewlineStyle(std::string_view s);
const char* toString(NewlineStyle v);

std::optional<PreprocessingPreset> parsePreprocessingPreset(std::string_view s);
const char* toString(PreprocessingPreset v);

} // namespace kreuzberg::config
