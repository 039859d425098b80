#pragma once

#include <kreuzberg/core/types.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kreuzberg::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}

// Environment lookups; empty values count as unset.
inline std::optional<std::string> env_value(const char* name) {
    if (const char* v = std::getenv(name); v && *v)
        return std::string(v);
    return std::nullopt;
}

inline bool env_truthy(const char* name) {
    auto v = env_value(name);
    if (!v)
        return false;
    std::string s = *v;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s == "1" || s == "true" || s == "yes" || s == "on";
}

// Split "a,b , c" into trimmed, non-empty items
std::vector<std::string> split_list(std::string_view raw, char sep = ',');

/**
 * @brief Parse a TOML document into a JSON tree
 *
 * Supports the subset used by configuration files: [table] and [a.b] headers,
 * dotted keys, basic and literal strings, integers, floats, booleans, arrays
 * (including ones spanning several lines) and inline tables. Comments start
 * with '#'.
 */
Result<nlohmann::json> parse_toml(std::string_view text);

/**
 * @brief Read and parse a TOML file
 */
Result<nlohmann::json> parse_toml_file(const std::filesystem::path& path);

/**
 * @brief Look up a single value by section and key, returned as text
 *
 * Returns an empty string when the file or the key does not exist.
 */
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

} // namespace kreuzberg::config
