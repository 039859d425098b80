#pragma once

#include <kreuzberg/core/types.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kreuzberg::config {

/**
 * @brief Field-level validators shared by ExtractionConfig::validate() and the C ABI
 *
 * Each validator returns ErrorCode::ValidationError with a message of the form
 * "<field>: <constraint> (got <value>)" on failure.
 */

inline constexpr std::int32_t kMinDpi = 1;
inline constexpr std::int32_t kMaxDpi = 2400;

Result<void> validateBinarizationMethod(std::string_view method,
                                        std::string_view field = "binarization_method");

Result<void> validateOcrBackend(std::string_view backend, std::string_view field = "ocr.backend");

/**
 * @brief Accept ISO 639-1 / 639-3 codes and Tesseract style combinations ("eng+deu")
 */
Result<void> validateLanguageCode(std::string_view code, std::string_view field = "language");

Result<void> validateTokenReductionLevel(std::string_view level,
                                         std::string_view field = "token_reduction.mode");

Result<void> validateTesseractPsm(std::int64_t psm, std::string_view field = "psm");

Result<void> validateTesseractOem(std::int64_t oem, std::string_view field = "oem");

Result<void> validateTesseractOutputFormat(std::string_view format,
                                           std::string_view field = "output_format");

Result<void> validateConfidence(double value, std::string_view field = "confidence");

Result<void> validateDpi(std::int64_t dpi, std::string_view field = "dpi");

Result<void> validatePositive(std::int64_t value, std::string_view field);

/**
 * @brief max_chars must be positive and the overlap strictly smaller than it
 */
Result<void> validateChunkingParams(std::int64_t maxChars, std::int64_t maxOverlap,
                                    std::string_view field = "chunking");

const std::vector<std::string>& validBinarizationMethods();
const std::vector<std::string>& validOcrBackends();
const std::vector<std::string>& validLanguageCodes();
const std::vector<std::string>& validTokenReductionLevels();
const std::vector<std::string>& validTesseractOutputFormats();

} // namespace kreuzberg::config
