#include <kreuzberg/config/config_helpers.h>
#include <kreuzberg/config/config_loader.h>
#include <kreuzberg/config/server_config.h>

#include <spdlog/spdlog.h>

#include <limits>

namespace kreuzberg::config {

namespace {

Result<std::uint64_t> parseUnsigned(const std::string& raw, const char* name,
                                    std::uint64_t max = std::numeric_limits<std::uint64_t>::max()) {
    std::string s = raw;
    trim(s);
    if (s.empty() || s[0] == '-' || s[0] == '+')
        return Error{ErrorCode::ValidationError,
                     std::string(name) + ": expected an unsigned integer (got '" + raw + "')"};
    try {
        size_t used = 0;
        unsigned long long v = std::stoull(s, &used);
        if (used != s.size() || v > max)
            throw std::out_of_range(name);
        return static_cast<std::uint64_t>(v);
    } catch (const std::exception&) {
        return Error{ErrorCode::ValidationError,
                     std::string(name) + ": expected an unsigned integer up to " +
                         std::to_string(max) + " (got '" + raw + "')"};
    }
}

} // namespace

Result<ServerConfig> ServerConfig::fromJson(const nlohmann::json& root) {
    ServerConfig cfg;
    const nlohmann::json* section = &root;
    if (root.is_object() && root.contains("server"))
        section = &root["server"];
    if (!section->is_object())
        return Error{ErrorCode::ValidationError, "server: expected an object"};

    try {
        if (auto it = section->find("host"); it != section->end() && !it->is_null())
            cfg.host = it->get<std::string>();
        if (auto it = section->find("port"); it != section->end() && !it->is_null()) {
            if (!it->is_number_integer())
                return Error{ErrorCode::ValidationError,
                             "server.port: expected an integer (got " + it->dump() + ")"};
            auto port = it->get<std::int64_t>();
            if (port < 1 || port > 65535)
                return Error{ErrorCode::ValidationError,
                             "server.port: must be between 1 and 65535 (got " +
                                 std::to_string(port) + ")"};
            cfg.port = static_cast<std::uint16_t>(port);
        }
        if (auto it = section->find("cors_origins"); it != section->end() && !it->is_null()) {
            if (it->is_string())
                cfg.cors_origins = split_list(it->get<std::string>());
            else
                cfg.cors_origins = it->get<std::vector<std::string>>();
        }
        if (auto it = section->find("max_request_body_bytes");
            it != section->end() && !it->is_null()) {
            if (!it->is_number_unsigned())
                return Error{ErrorCode::ValidationError,
                             "server.max_request_body_bytes: expected a non-negative integer (got " +
                                 it->dump() + ")"};
            cfg.max_request_body_bytes = it->get<std::uint64_t>();
        }
        if (auto it = section->find("max_multipart_field_bytes");
            it != section->end() && !it->is_null()) {
            if (!it->is_number_unsigned())
                return Error{ErrorCode::ValidationError,
                             "server.max_multipart_field_bytes: expected a non-negative integer (got " +
                                 it->dump() + ")"};
            cfg.max_multipart_field_bytes = it->get<std::uint64_t>();
        }
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::ValidationError, std::string("server: ") + e.what()};
    }
    return cfg;
}

Result<void> ServerConfig::applyEnvOverrides() {
    if (auto v = env_value("KREUZBERG_HOST")) {
        spdlog::debug("KREUZBERG_HOST overrides server.host");
        host = *v;
    }
    if (auto v = env_value("KREUZBERG_PORT")) {
        auto port = parseUnsigned(*v, "KREUZBERG_PORT", 65535);
        if (!port)
            return port.error();
        this->port = static_cast<std::uint16_t>(port.value());
    }
    if (auto v = env_value("KREUZBERG_CORS_ORIGINS"))
        cors_origins = split_list(*v);
    if (auto v = env_value("KREUZBERG_MAX_REQUEST_BODY_BYTES")) {
        auto n = parseUnsigned(*v, "KREUZBERG_MAX_REQUEST_BODY_BYTES");
        if (!n)
            return n.error();
        max_request_body_bytes = n.value();
    }
    if (auto v = env_value("KREUZBERG_MAX_MULTIPART_FIELD_BYTES")) {
        auto n = parseUnsigned(*v, "KREUZBERG_MAX_MULTIPART_FIELD_BYTES");
        if (!n)
            return n.error();
        max_multipart_field_bytes = n.value();
    }
    return {};
}

Result<void> ServerConfig::validate() const {
    if (host.empty())
        return Error{ErrorCode::ValidationError, "server.host: must not be empty"};
    if (port == 0)
        return Error{ErrorCode::ValidationError, "server.port: must be between 1 and 65535 (got 0)"};
    if (max_request_body_bytes == 0)
        return Error{ErrorCode::ValidationError,
                     "server.max_request_body_bytes: must be greater than 0 (got 0)"};
    if (max_multipart_field_bytes == 0)
        return Error{ErrorCode::ValidationError,
                     "server.max_multipart_field_bytes: must be greater than 0 (got 0)"};
    return {};
}

Result<ServerConfig> ServerConfig::load(const std::filesystem::path& path) {
    ServerConfig cfg;
    if (!path.empty()) {
        auto doc = ConfigLoader::readDocument(path);
        if (!doc)
            return doc.error();
        auto decoded = fromJson(doc.value());
        if (!decoded)
            return decoded.error();
        cfg = std::move(decoded).value();
    }
    if (auto r = cfg.applyEnvOverrides(); !r)
        return r.error();
    if (auto r = cfg.validate(); !r)
        return r.error();
    return cfg;
}

std::string ServerConfig::listenAddress() const {
    return host + ":" + std::to_string(port);
}

void to_json(nlohmann::json& j, const ServerConfig& c) {
    j = nlohmann::json::object();
    j["host"] = c.host;
    j["port"] = c.port;
    j["cors_origins"] = c.cors_origins;
    j["max_request_body_bytes"] = c.max_request_body_bytes;
    j["max_multipart_field_bytes"] = c.max_multipart_field_bytes;
}

} // namespace kreuzberg::config
