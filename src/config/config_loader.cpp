#include <kreuzberg/config/config_helpers.h>
#include <kreuzberg/config/config_json.h>
#include <kreuzberg/config/config_loader.h>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace kreuzberg::config {

namespace fs = std::filesystem;

namespace {

nlohmann::json yamlNodeToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined: return nullptr;
        case YAML::NodeType::Sequence: {
            auto arr = nlohmann::json::array();
            for (const auto& child : node)
                arr.push_back(yamlNodeToJson(child));
            return arr;
        }
        case YAML::NodeType::Map: {
            auto obj = nlohmann::json::object();
            for (auto it = node.begin(); it != node.end(); ++it)
                obj[it->first.as<std::string>()] = yamlNodeToJson(it->second);
            return obj;
        }
        case YAML::NodeType::Scalar: break;
    }

    // Quoted scalars carry the non-specific tag "!" and always stay strings.
    if (node.Tag() == "!")
        return node.Scalar();

    long long i = 0;
    if (YAML::convert<long long>::decode(node, i))
        return i;
    double d = 0.0;
    if (YAML::convert<double>::decode(node, d))
        return d;
    bool b = false;
    if (YAML::convert<bool>::decode(node, b))
        return b;
    return node.Scalar();
}

std::string lowerExtension(const fs::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

Result<std::string> readText(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec))
        return Error{ErrorCode::IoError, "Config file not found: " + path.string()};
    if (fs::is_directory(path, ec))
        return Error{ErrorCode::IoError, "Config path is a directory: " + path.string()};

    std::ifstream file(path, std::ios::binary);
    if (!file)
        return Error{ErrorCode::IoError, "Cannot open config file: " + path.string()};
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

// Keep only the parts of `overlay` that differ from `defaults`, recursing into objects.
nlohmann::json explicitFields(const nlohmann::json& overlay, const nlohmann::json& defaults) {
    auto out = nlohmann::json::object();
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        auto d = defaults.find(it.key());
        if (d == defaults.end()) {
            out[it.key()] = it.value();
        } else if (it.value().is_object() && d->is_object()) {
            auto nested = explicitFields(it.value(), *d);
            if (!nested.empty())
                out[it.key()] = std::move(nested);
        } else if (it.value() != *d) {
            out[it.key()] = it.value();
        }
    }
    return out;
}

} // namespace

Result<nlohmann::json> yamlToJson(std::string_view text) {
    try {
        YAML::Node root = YAML::Load(std::string(text));
        auto j = yamlNodeToJson(root);
        if (j.is_null())
            j = nlohmann::json::object();
        return j;
    } catch (const YAML::Exception& e) {
        return Error{ErrorCode::ParsingError, std::string("YAML parse error: ") + e.what()};
    }
}

Result<ExtractionConfig> ConfigLoader::fromJson(const nlohmann::json& j) {
    auto decoded = configFromJson(j);
    if (!decoded)
        return decoded.error();
    if (auto valid = decoded.value().validate(); !valid)
        return valid.error();
    return decoded;
}

Result<ExtractionConfig> ConfigLoader::fromJsonString(std::string_view text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& e) {
        return Error{ErrorCode::ValidationError,
                     std::string("Invalid configuration JSON: ") + e.what()};
    }
    return fromJson(j);
}

nlohmann::json ConfigLoader::toJson(const ExtractionConfig& config) {
    nlohmann::json j = config;
    return j;
}

std::string ConfigLoader::toJsonString(const ExtractionConfig& config) {
    return toJson(config).dump();
}

Result<nlohmann::json> ConfigLoader::readDocument(const fs::path& path) {
    const auto ext = lowerExtension(path);
    if (ext != ".toml" && ext != ".yaml" && ext != ".yml" && ext != ".json") {
        return Error{ErrorCode::InvalidArgument,
                     "Unsupported config file extension '" + ext + "': " + path.string()};
    }

    auto text = readText(path);
    if (!text)
        return text.error();

    if (ext == ".toml") {
        auto doc = parse_toml(text.value());
        if (!doc)
            return Error{doc.error().code, path.string() + ": " + doc.error().message};
        return doc;
    }
    if (ext == ".json") {
        try {
            return nlohmann::json::parse(text.value());
        } catch (const nlohmann::json::parse_error& e) {
            return Error{ErrorCode::ParsingError, path.string() + ": " + e.what()};
        }
    }
    auto doc = yamlToJson(text.value());
    if (!doc)
        return Error{doc.error().code, path.string() + ": " + doc.error().message};
    return doc;
}

Result<ExtractionConfig> ConfigLoader::fromFile(const fs::path& path) {
    auto doc = readDocument(path);
    if (!doc) {
        spdlog::warn("Failed to load config {}: {}", path.string(), doc.error().message);
        return doc.error();
    }
    auto config = fromJson(doc.value());
    if (config)
        spdlog::debug("Loaded config from {}", path.string());
    return config;
}

Result<fs::path> ConfigLoader::discover(const fs::path& start) {
    std::error_code ec;
    fs::path dir = fs::absolute(start, ec);
    if (ec)
        dir = start;

    while (true) {
        for (const char* name : kDiscoveryFileNames) {
            auto candidate = dir / name;
            if (fs::is_regular_file(candidate, ec)) {
                spdlog::debug("Discovered config file {}", candidate.string());
                return candidate;
            }
        }
        auto parent = dir.parent_path();
        if (parent.empty() || parent == dir)
            break;
        dir = std::move(parent);
    }
    return Error{ErrorCode::NotFound, "No kreuzberg config file found from " + start.string()};
}

Result<ExtractionConfig> ConfigLoader::merge(const ExtractionConfig& base,
                                             const ExtractionConfig& overlay) {
    auto merged = toJson(base);
    auto patch = explicitFields(toJson(overlay), toJson(ExtractionConfig{}));
    merged.merge_patch(patch);
    return fromJson(merged);
}

Result<nlohmann::json> ConfigLoader::getField(const ExtractionConfig& config,
                                              std::string_view path) {
    if (path.empty())
        return Error{ErrorCode::InvalidArgument, "Field path must not be empty"};

    auto j = toJson(config);
    const nlohmann::json* node = &j;
    for (const auto& part : split_list(path, '.')) {
        if (!node->is_object() || !node->contains(part))
            return Error{ErrorCode::NotFound, "Config field not found: " + std::string(path)};
        node = &(*node)[part];
    }
    return *node;
}

} // namespace kreuzberg::config
