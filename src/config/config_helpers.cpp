#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <kreuzberg/config/config_helpers.h>

namespace kreuzberg::config {

namespace {

class TomlReader {
public:
    explicit TomlReader(std::string_view text) : text_(text) {}

    Result<nlohmann::json> parse() {
        nlohmann::json root = nlohmann::json::object();
        nlohmann::json* current = &root;

        while (true) {
            skipBlank();
            if (eof())
                break;

            if (peek() == '[') {
                bool arrayTable = peekAt(1) == '[';
                pos_ += arrayTable ? 2 : 1;
                auto keys = parseKeyPath();
                if (!keys)
                    return keys.error();
                skipInline();
                if (!consume(']') || (arrayTable && !consume(']')))
                    return fail("expected ']' to close table header");

                auto target = openTable(root, keys.value(), arrayTable);
                if (!target)
                    return target.error();
                current = target.value();
            } else {
                auto keys = parseKeyPath();
                if (!keys)
                    return keys.error();
                skipInline();
                if (!consume('='))
                    return fail("expected '=' after key");
                skipInline();
                auto value = parseValue();
                if (!value)
                    return value.error();
                if (auto r = assign(*current, keys.value(), std::move(value).value()); !r)
                    return r.error();
            }

            skipInline();
            if (!eof() && peek() == '#')
                skipComment();
            if (!eof() && peek() != '\n' && peek() != '\r')
                return fail("unexpected trailing characters");
        }
        return root;
    }

private:
    bool eof() const { return pos_ >= text_.size(); }
    char peek() const { return text_[pos_]; }
    char peekAt(size_t offset) const {
        return pos_ + offset < text_.size() ? text_[pos_ + offset] : '\0';
    }

    bool consume(char c) {
        if (!eof() && peek() == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    void skipComment() {
        while (!eof() && peek() != '\n')
            ++pos_;
    }

    void skipInline() {
        while (!eof() && (peek() == ' ' || peek() == '\t'))
            ++pos_;
    }

    void skipBlank() {
        while (!eof()) {
            char c = peek();
            if (c == '\n') {
                ++line_;
                ++pos_;
            } else if (c == ' ' || c == '\t' || c == '\r') {
                ++pos_;
            } else if (c == '#') {
                skipComment();
            } else {
                break;
            }
        }
    }

    Error fail(const std::string& what) const {
        return Error{ErrorCode::ParsingError,
                     "TOML parse error at line " + std::to_string(line_) + ": " + what};
    }

    static bool isBareKeyChar(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
    }

    Result<std::vector<std::string>> parseKeyPath() {
        std::vector<std::string> keys;
        while (true) {
            skipInline();
            if (eof())
                return fail("unexpected end of input in key");
            if (peek() == '"' || peek() == '\'') {
                auto s = parseString();
                if (!s)
                    return s.error();
                keys.push_back(std::move(s).value());
            } else {
                size_t start = pos_;
                while (!eof() && isBareKeyChar(peek()))
                    ++pos_;
                if (start == pos_)
                    return fail("invalid key");
                keys.emplace_back(text_.substr(start, pos_ - start));
            }
            skipInline();
            if (!consume('.'))
                break;
        }
        return keys;
    }

    Result<nlohmann::json*> openTable(nlohmann::json& root, const std::vector<std::string>& keys,
                                      bool arrayTable) {
        nlohmann::json* node = &root;
        for (size_t i = 0; i < keys.size(); ++i) {
            auto& child = (*node)[keys[i]];
            bool last = i + 1 == keys.size();
            if (last && arrayTable) {
                if (child.is_null())
                    child = nlohmann::json::array();
                if (!child.is_array())
                    return fail("key '" + keys[i] + "' is not an array of tables");
                child.push_back(nlohmann::json::object());
                node = &child.back();
            } else if (child.is_array() && !child.empty() && child.back().is_object()) {
                node = &child.back();
            } else {
                if (child.is_null())
                    child = nlohmann::json::object();
                if (!child.is_object())
                    return fail("key '" + keys[i] + "' is already defined as a value");
                node = &child;
            }
        }
        return node;
    }

    Result<void> assign(nlohmann::json& table, const std::vector<std::string>& keys,
                        nlohmann::json value) {
        nlohmann::json* node = &table;
        for (size_t i = 0; i + 1 < keys.size(); ++i) {
            auto& child = (*node)[keys[i]];
            if (child.is_null())
                child = nlohmann::json::object();
            if (!child.is_object())
                return fail("key '" + keys[i] + "' is already defined as a value");
            node = &child;
        }
        if (node->contains(keys.back()))
            return fail("duplicate key '" + keys.back() + "'");
        (*node)[keys.back()] = std::move(value);
        return {};
    }

    Result<std::string> parseString() {
        char quote = peek();
        bool multiline = peekAt(1) == quote && peekAt(2) == quote;
        pos_ += multiline ? 3 : 1;
        if (multiline) {
            consume('\r');
            if (consume('\n'))
                ++line_;
        }

        std::string out;
        while (true) {
            if (eof())
                return fail("unterminated string");
            char c = peek();
            if (c == quote) {
                if (!multiline) {
                    ++pos_;
                    return out;
                }
                if (peekAt(1) == quote && peekAt(2) == quote) {
                    pos_ += 3;
                    return out;
                }
            }
            if (c == '\n') {
                if (!multiline)
                    return fail("newline in single-line string");
                ++line_;
            }
            if (c == '\\' && quote == '"') {
                ++pos_;
                if (eof())
                    return fail("unterminated escape");
                char e = peek();
                ++pos_;
                switch (e) {
                    case 'n': out += '\n'; break;
                    case 't': out += '\t'; break;
                    case 'r': out += '\r'; break;
                    case 'b': out += '\b'; break;
                    case 'f': out += '\f'; break;
                    case '"': out += '"'; break;
                    case '\\': out += '\\'; break;
                    case 'u':
                    case 'U': {
                        size_t len = e == 'u' ? 4 : 8;
                        if (pos_ + len > text_.size())
                            return fail("truncated unicode escape");
                        unsigned long cp = 0;
                        try {
                            cp = std::stoul(std::string(text_.substr(pos_, len)), nullptr, 16);
                        } catch (const std::exception&) {
                            return fail("invalid unicode escape");
                        }
                        pos_ += len;
                        appendUtf8(out, static_cast<uint32_t>(cp));
                        break;
                    }
                    case '\n':
                        // line-ending backslash in multi-line strings trims following whitespace
                        ++line_;
                        while (!eof() && std::isspace(static_cast<unsigned char>(peek()))) {
                            if (peek() == '\n')
                                ++line_;
                            ++pos_;
                        }
                        break;
                    default: return fail(std::string("invalid escape '\\") + e + "'");
                }
                continue;
            }
            out += c;
            ++pos_;
        }
    }

    static void appendUtf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    Result<nlohmann::json> parseArray() {
        ++pos_; // '['
        nlohmann::json arr = nlohmann::json::array();
        while (true) {
            skipBlank();
            if (eof())
                return fail("unterminated array");
            if (consume(']'))
                return arr;
            auto v = parseValue();
            if (!v)
                return v.error();
            arr.push_back(std::move(v).value());
            skipBlank();
            if (consume(','))
                continue;
            if (consume(']'))
                return arr;
            return fail("expected ',' or ']' in array");
        }
    }

    Result<nlohmann::json> parseInlineTable() {
        ++pos_; // '{'
        nlohmann::json obj = nlohmann::json::object();
        skipInline();
        if (consume('}'))
            return obj;
        while (true) {
            auto keys = parseKeyPath();
            if (!keys)
                return keys.error();
            skipInline();
            if (!consume('='))
                return fail("expected '=' in inline table");
            skipInline();
            auto v = parseValue();
            if (!v)
                return v.error();
            if (auto r = assign(obj, keys.value(), std::move(v).value()); !r)
                return r.error();
            skipInline();
            if (consume(','))
                continue;
            if (consume('}'))
                return obj;
            return fail("expected ',' or '}' in inline table");
        }
    }

    Result<nlohmann::json> parseScalar() {
        size_t start = pos_;
        while (!eof()) {
            char c = peek();
            if (c == ',' || c == ']' || c == '}' || c == '#' || c == '\n' || c == '\r')
                break;
            ++pos_;
        }
        std::string token(text_.substr(start, pos_ - start));
        rtrim(token);
        if (token.empty())
            return fail("missing value");

        if (token == "true")
            return nlohmann::json(true);
        if (token == "false")
            return nlohmann::json(false);

        std::string digits;
        digits.reserve(token.size());
        for (char c : token) {
            if (c != '_')
                digits += c;
        }

        bool isFloat = digits.find_first_of(".eE") != std::string::npos &&
                       digits.rfind("0x", 0) != 0;
        bool looksNumeric =
            !digits.empty() && (std::isdigit(static_cast<unsigned char>(digits[0])) ||
                                digits[0] == '+' || digits[0] == '-');
        // dates and times stay strings
        bool looksTemporal = token.find(':') != std::string::npos ||
                             (token.size() >= 10 && token[4] == '-' && token[7] == '-');

        if (looksNumeric && !looksTemporal) {
            try {
                size_t used = 0;
                if (isFloat) {
                    double d = std::stod(digits, &used);
                    if (used == digits.size())
                        return nlohmann::json(d);
                } else {
                    int base = 10;
                    std::string body = digits;
                    bool negative = false;
                    if (!body.empty() && (body[0] == '+' || body[0] == '-')) {
                        negative = body[0] == '-';
                        body.erase(0, 1);
                    }
                    if (body.rfind("0x", 0) == 0) {
                        base = 16;
                        body.erase(0, 2);
                    } else if (body.rfind("0o", 0) == 0) {
                        base = 8;
                        body.erase(0, 2);
                    } else if (body.rfind("0b", 0) == 0) {
                        base = 2;
                        body.erase(0, 2);
                    }
                    long long n = std::stoll(body, &used, base);
                    if (used == body.size())
                        return nlohmann::json(negative ? -n : n);
                }
            } catch (const std::exception&) {
                return fail("invalid number '" + token + "'");
            }
            return fail("invalid number '" + token + "'");
        }
        if (token == "inf" || token == "+inf" || token == "-inf" || token == "nan")
            return fail("non-finite floats are not supported");
        if (looksTemporal)
            return nlohmann::json(token);
        return fail("invalid value '" + token + "'");
    }

    Result<nlohmann::json> parseValue() {
        if (eof())
            return fail("missing value");
        switch (peek()) {
            case '"':
            case '\'': {
                auto s = parseString();
                if (!s)
                    return s.error();
                return nlohmann::json(std::move(s).value());
            }
            case '[': return parseArray();
            case '{': return parseInlineTable();
            default: return parseScalar();
        }
    }

    std::string_view text_;
    size_t pos_ = 0;
    size_t line_ = 1;
};

} // namespace

std::vector<std::string> split_list(std::string_view raw, char sep) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= raw.size()) {
        size_t end = raw.find(sep, start);
        std::string item(raw.substr(start, end == std::string_view::npos ? raw.size() - start
                                                                         : end - start));
        trim(item);
        if (!item.empty())
            out.push_back(std::move(item));
        if (end == std::string_view::npos)
            break;
        start = end + 1;
    }
    return out;
}

Result<nlohmann::json> parse_toml(std::string_view text) {
    return TomlReader(text).parse();
}

Result<nlohmann::json> parse_toml_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error{ErrorCode::IoError, "Cannot open config file: " + path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto parsed = parse_toml(ss.str());
    if (!parsed) {
        spdlog::warn("Failed to parse {}: {}", path.string(), parsed.error().message);
        return Error{parsed.error().code, path.string() + ": " + parsed.error().message};
    }
    return parsed;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto doc = parse_toml_file(config_path);
    if (!doc)
        return "";

    const nlohmann::json* node = &doc.value();
    if (!section.empty()) {
        for (const auto& part : split_list(section, '.')) {
            if (!node->is_object() || !node->contains(part))
                return "";
            node = &(*node)[part];
        }
    }
    if (!node->is_object() || !node->contains(key))
        return "";
    const auto& v = (*node)[key];
    return v.is_string() ? v.get<std::string>() : v.dump();
}

} // namespace kreuzberg::config
