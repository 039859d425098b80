#include <kreuzberg/core/error_classifier.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace kreuzberg::core {

namespace {

struct CategoryRule {
    ErrorCategory category;
    std::array<const char*, 8> keywords;
};

// Rules are checked in order; the first keyword hit wins. Validation comes
// before I/O because "validation" must not be mistaken for an I/O message.
const CategoryRule kRules[] = {
    {ErrorCategory::Validation,
     {"validation", "invalid", "must be", "out of range", "not allowed", nullptr}},
    {ErrorCategory::Parsing,
     {"parse", "parsing", "corrupt", "malformed", "unexpected token", "syntax", "decode",
      nullptr}},
    {ErrorCategory::Ocr, {"ocr", "tesseract", "recogni", nullptr}},
    {ErrorCategory::MissingDependency,
     {"missing dependency", "not installed", "dependency", "not available", "not registered",
      nullptr}},
    {ErrorCategory::Io,
     {"i/o", "io error", "permission", "file", "directory", "no such", "disk", "read"}},
    {ErrorCategory::Plugin, {"plugin", "callback", "post-processor", "post processor", nullptr}},
    {ErrorCategory::UnsupportedFormat,
     {"unsupported", "not supported", "unknown format", "unknown mime", nullptr}},
};

struct CategoryInfo {
    const char* name;
    const char* description;
};

constexpr CategoryInfo kCategoryInfo[kErrorCategoryCount] = {
    {"validation", "Input or configuration failed validation"},
    {"parsing", "Document content could not be parsed"},
    {"ocr", "OCR processing failed"},
    {"missing_dependency", "A required external dependency is missing"},
    {"io", "File system or I/O failure"},
    {"plugin", "A registered plugin failed"},
    {"unsupported_format", "The document format is not supported"},
    {"internal", "Internal library error"},
};

std::string toLower(std::string_view in) {
    std::string out(in);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

ErrorCategory classifyMessage(std::string_view message) {
    if (message.empty())
        return ErrorCategory::Internal;

    const std::string lower = toLower(message);
    for (const auto& rule : kRules) {
        for (const char* kw : rule.keywords) {
            if (kw && lower.find(kw) != std::string::npos)
                return rule.category;
        }
    }
    return ErrorCategory::Internal;
}

const char* categoryName(std::uint32_t code) {
    if (code >= kErrorCategoryCount)
        return "unknown";
    return kCategoryInfo[code].name;
}

const char* categoryDescription(std::uint32_t code) {
    if (code >= kErrorCategoryCount)
        return "Unknown error code";
    return kCategoryInfo[code].description;
}

ErrorCode categoryToErrorCode(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Validation: return ErrorCode::InvalidArgument;
        case ErrorCategory::Parsing: return ErrorCode::ParsingError;
        case ErrorCategory::Ocr: return ErrorCode::OcrError;
        case ErrorCategory::MissingDependency: return ErrorCode::MissingDependency;
        case ErrorCategory::Io: return ErrorCode::IoError;
        case ErrorCategory::Plugin: return ErrorCode::GenericError;
        case ErrorCategory::UnsupportedFormat: return ErrorCode::MissingDependency;
        case ErrorCategory::Internal: return ErrorCode::GenericError;
    }
    return ErrorCode::GenericError;
}

} // namespace kreuzberg::core
