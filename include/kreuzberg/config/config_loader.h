#pragma once

#include <kreuzberg/config/extraction_config.h>

#include <nlohmann/json.hpp>

#include <array>
#include <filesystem>
#include <string>
#include <string_view>

namespace kreuzberg::config {

/**
 * @brief File names probed by discover(), in priority order
 */
inline constexpr std::array<const char*, 4> kDiscoveryFileNames = {
    "kreuzberg.toml", "kreuzberg.yaml", "kreuzberg.yml", "kreuzberg.json"};

/**
 * @brief Loading, serialising and combining ExtractionConfig values
 *
 * All entry points validate the decoded config before returning it, so a
 * successful Result always holds a config that passes validate().
 */
class ConfigLoader {
public:
    /**
     * @brief Parse canonical snake_case JSON text
     * @return ValidationError for malformed JSON, type mismatches or rule violations
     */
    static Result<ExtractionConfig> fromJsonString(std::string_view text);

    static Result<ExtractionConfig> fromJson(const nlohmann::json& j);

    static nlohmann::json toJson(const ExtractionConfig& config);

    static std::string toJsonString(const ExtractionConfig& config);

    /**
     * @brief Load a TOML, YAML or JSON file chosen by extension
     *
     * IoError when the file is missing or unreadable, ParsingError when its
     * syntax is broken, ValidationError when the decoded config is invalid.
     */
    static Result<ExtractionConfig> fromFile(const std::filesystem::path& path);

    /**
     * @brief Read any supported config file into a JSON tree without decoding it
     */
    static Result<nlohmann::json> readDocument(const std::filesystem::path& path);

    /**
     * @brief Walk from @p start up to the filesystem root looking for kreuzberg.{toml,yaml,yml,json}
     * @return Path of the first match, or NotFound
     */
    static Result<std::filesystem::path> discover(
        const std::filesystem::path& start = std::filesystem::current_path());

    /**
     * @brief Overlay every field of @p overlay that differs from the defaults onto @p base
     *
     * Nested sections merge field by field; a section absent from the overlay
     * leaves the base untouched.
     */
    static Result<ExtractionConfig> merge(const ExtractionConfig& base,
                                          const ExtractionConfig& overlay);

    /**
     * @brief Fetch a value by dotted path ("ocr.tesseract_config.psm")
     * @return NotFound when the path does not exist in the serialised config
     */
    static Result<nlohmann::json> getField(const ExtractionConfig& config, std::string_view path);
};

/**
 * @brief Convert YAML text into the equivalent JSON tree
 */
Result<nlohmann::json> yamlToJson(std::string_view text);

} // namespace kreuzberg::config
