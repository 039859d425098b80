#include <kreuzberg/config/html_options.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace kreuzberg::config {

namespace {

std::string normalize(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return c == '-' ? '_' : static_cast<char>(std::tolower(c));
    });
    return out;
}

template <typename E, std::size_t N>
std::optional<E> lookup(std::string_view s, const std::pair<const char*, E> (&table)[N]) {
    const auto key = normalize(s);
    for (const auto& [name, value] : table) {
        if (key == name)
            return value;
    }
    return std::nullopt;
}

const std::pair<const char*, HeadingStyle> kHeadingStyles[] = {
    {"atx", HeadingStyle::Atx},
    {"underlined", HeadingStyle::Underlined},
    {"setext", HeadingStyle::Underlined},
    {"atx_closed", HeadingStyle::AtxClosed},
};

const std::pair<const char*, CodeBlockStyle> kCodeBlockStyles[] = {
    {"indented", CodeBlockStyle::Indented},
    {"backticks", CodeBlockStyle::Backticks},
    {"tildes", CodeBlockStyle::Tildes},
};

const std::pair<const char*, HighlightStyle> kHighlightStyles[] = {
    {"double_equal", HighlightStyle::DoubleEqual},
    {"==", HighlightStyle::DoubleEqual},
    {"html", HighlightStyle::Html},
    {"bold", HighlightStyle::Bold},
    {"none", HighlightStyle::None},
};

const std::pair<const char*, ListIndentType> kListIndentTypes[] = {
    {"spaces", ListIndentType::Spaces},
    {"tabs", ListIndentType::Tabs},
};

const std::pair<const char*, WhitespaceMode> kWhitespaceModes[] = {
    {"default", WhitespaceMode::Default},
    {"normalized", WhitespaceMode::Default},
    {"preserve", WhitespaceMode::Preserve},
    {"strict", WhitespaceMode::Preserve},
    {"preserve_inner", WhitespaceMode::PreserveInner},
    {"collapse", WhitespaceMode::Collapse},
};

const std::pair<const char*, NewlineStyle> kNewlineStyles[] = {
    {"default", NewlineStyle::Spaces},
    {"spaces", NewlineStyle::Spaces},
    {"backslash", NewlineStyle::Backslash},
};

const std::pair<const char*, PreprocessingPreset> kPreprocessingPresets[] = {
    {"none", PreprocessingPreset::None},
    {"minimal", PreprocessingPreset::Conservative},
    {"conservative", PreprocessingPreset::Conservative},
    {"standard", PreprocessingPreset::Conservative},
    {"aggressive", PreprocessingPreset::Aggressive},
};

} // namespace

std::optional<HeadingStyle> parseHeadingStyle(std::string_view s) {
    return lookup(s, kHeadingStyles);
}

const char* toString(HeadingStyle v) {
    switch (v) {
        case HeadingStyle::Atx: return "atx";
        case HeadingStyle::Underlined: return "underlined";
        case HeadingStyle::AtxClosed: return "atx_closed";
    }
    return nullptr;
}

std::optional<CodeBlockStyle> parseCodeBlockStyle(std::string_view s) {
    return lookup(s, kCodeBlockStyles);
}

const char* toString(CodeBlockStyle v) {
    switch (v) {
        case CodeBlockStyle::Indented: return "indented";
        case CodeBlockStyle::Backticks: return "backticks";
        case CodeBlockStyle::Tildes: return "tildes";
    }
    return nullptr;
}

std::optional<HighlightStyle> parseHighlightStyle(std::string_view s) {
    return lookup(s, kHighlightStyles);
}

const char* toString(HighlightStyle v) {
    switch (v) {
        case HighlightStyle::DoubleEqual: return "double_equal";
        case HighlightStyle::Html: return "html";
        case HighlightStyle::Bold: return "bold";
        case HighlightStyle::None: return "none";
    }
    return nullptr;
}

std::optional<ListIndentType> parseListIndentType(std::string_view s) {
    return lookup(s, kListIndentTypes);
}

const char* toString(ListIndentType v) {
    switch (v) {
        case ListIndentType::Spaces: return "spaces";
        case ListIndentType::Tabs: return "tabs";
    }
    return nullptr;
}

std::optional<WhitespaceMode> parseWhitespaceMode(std::string_view s) {
    return lookup(s, kWhitespaceModes);
}

const char* toString(WhitespaceMode v) {
    switch (v) {
        case WhitespaceMode::Default: return "default";
        case WhitespaceMode::Preserve: return "preserve";
        case WhitespaceMode::PreserveInner: return "preserve_inner";
        case WhitespaceMode::Collapse: return "collapse";
    }
    return nullptr;
}

std::optional<NewlineStyle> parseNewlineStyle(std::string_view s) {
    return lookup(s, kNewlineStyles);
}

const char* toString(NewlineStyle v) {
    switch (v) {
        case NewlineStyle::Spaces: return "spaces";
        case NewlineStyle::Backslash: return "backslash";
    }
    return nullptr;
}

std::optional<PreprocessingPreset> parsePreprocessingPreset(std::string_view s) {
    return lookup(s, kPreprocessingPresets);
}

const char* toString(PreprocessingPreset v) {
    switch (v) {
        case PreprocessingPreset::None: return "none";
        case PreprocessingPreset::Conservative: return "conservative";
        case PreprocessingPreset::Aggressive: return "aggressive";
    }
    return nullptr;
}

} // namespace kreuzberg::config
