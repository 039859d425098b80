#pragma once

#include <kreuzberg/core/types.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kreuzberg::config {

/**
 * @brief Settings for an HTTP front end hosting the library
 *
 * Read from the `server` section of a config file. The environment variables
 * KREUZBERG_HOST, KREUZBERG_PORT, KREUZBERG_CORS_ORIGINS (comma separated),
 * KREUZBERG_MAX_REQUEST_BODY_BYTES and KREUZBERG_MAX_MULTIPART_FIELD_BYTES
 * override file values.
 */
struct ServerConfig {
    std::string host = "127.0.0.1";
    std::uint16_t port = 8000;
    std::vector<std::string> cors_origins;
    std::uint64_t max_request_body_bytes = 100ull * 1024 * 1024;
    std::uint64_t max_multipart_field_bytes = 100ull * 1024 * 1024;

    bool operator==(const ServerConfig&) const = default;

    /**
     * @brief Decode the `server` section of a config tree (or the tree itself if it has none)
     */
    static Result<ServerConfig> fromJson(const nlohmann::json& root);

    /**
     * @brief Load from a TOML/YAML/JSON file, then apply environment overrides
     *
     * An empty path skips the file and yields defaults plus overrides.
     */
    static Result<ServerConfig> load(const std::filesystem::path& path = {});

    /**
     * @brief Apply KREUZBERG_* environment overrides in place
     * @return ValidationError when a numeric variable cannot be parsed
     */
    Result<void> applyEnvOverrides();

    Result<void> validate() const;

    std::string listenAddress() const;
};

void to_json(nlohmann::json& j, const ServerConfig& c);

} // namespace kreuzberg::config
