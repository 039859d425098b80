#pragma once

#include <kreuzberg/core/types.h>

#include <cstdint>
#include <string_view>

namespace kreuzberg::core {

/**
 * @brief Coarse error taxonomy exposed through kreuzberg_classify_error()
 *
 * Values are part of the C ABI and must not be renumbered.
 */
enum class ErrorCategory : std::uint32_t {
    Validation = 0,
    Parsing = 1,
    Ocr = 2,
    MissingDependency = 3,
    Io = 4,
    Plugin = 5,
    UnsupportedFormat = 6,
    Internal = 7
};

inline constexpr std::uint32_t kErrorCategoryCount = 8;

/**
 * @brief Classify a free-form error message by keyword
 * @return Matching category, Internal when nothing matches
 */
ErrorCategory classifyMessage(std::string_view message);

/**
 * @brief Stable snake_case name for a category code, "unknown" when out of range
 */
const char* categoryName(std::uint32_t code);

/**
 * @brief One-line human readable description, "Unknown error code" when out of range
 */
const char* categoryDescription(std::uint32_t code);

/**
 * @brief Map a category onto the error code recorded in the error state
 */
ErrorCode categoryToErrorCode(ErrorCategory category);

} // namespace kreuzberg::core
