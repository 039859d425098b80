#include <kreuzberg/config/config_helpers.h>
#include <kreuzberg/config/config_loader.h>
#include <kreuzberg/extraction/plain_text_extractor.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>
#include <vector>

namespace kreuzberg::extraction {

namespace {

const std::map<std::string, std::string, std::less<>>& mimeFormats() {
    static const std::map<std::string, std::string, std::less<>> formats = {
        {"text/plain", "text"},
        {"text/markdown", "markdown"},
        {"text/x-markdown", "markdown"},
        {"text/x-gfm", "markdown"},
        {"text/x-commonmark", "markdown"},
        {"text/x-djot", "djot"},
        {"text/djot", "djot"},
        {"text/x-rst", "rst"},
        {"text/x-org", "org"},
        {"text/csv", "csv"},
        {"text/tab-separated-values", "tsv"},
        {"application/json", "json"},
        {"text/json", "json"},
        {"application/x-yaml", "yaml"},
        {"application/yaml", "yaml"},
        {"text/yaml", "yaml"},
        {"text/x-yaml", "yaml"},
        {"application/toml", "toml"},
        {"text/toml", "toml"},
        {"application/xml", "xml"},
        {"text/xml", "xml"},
    };
    return formats;
}

size_t countWords(std::string_view text) {
    size_t words = 0;
    bool inWord = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            inWord = false;
        } else if (!inWord) {
            inWord = true;
            ++words;
        }
    }
    return words;
}

size_t countCodePoints(std::string_view text) {
    return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

// Balanced-tag scan; enough to reject truncated or mismatched documents
Result<size_t> scanXml(std::string_view xml) {
    std::vector<std::string> open;
    size_t elements = 0;
    size_t pos = 0;
    bool sawRoot = false;

    auto fail = [](const std::string& why) {
        return Error{ErrorCode::ParsingError, "Malformed XML: " + why};
    };

    while ((pos = xml.find('<', pos)) != std::string_view::npos) {
        if (xml.compare(pos, 4, "<!--") == 0) {
            auto end = xml.find("-->", pos + 4);
            if (end == std::string_view::npos)
                return fail("unterminated comment");
            pos = end + 3;
            continue;
        }
        if (xml.compare(pos, 9, "<![CDATA[") == 0) {
            auto end = xml.find("]]>", pos + 9);
            if (end == std::string_view::npos)
                return fail("unterminated CDATA section");
            pos = end + 3;
            continue;
        }
        if (xml.compare(pos, 2, "<?") == 0) {
            auto end = xml.find("?>", pos + 2);
            if (end == std::string_view::npos)
                return fail("unterminated processing instruction");
            pos = end + 2;
            continue;
        }
        if (xml.compare(pos, 2, "<!") == 0) {
            auto end = xml.find('>', pos + 2);
            if (end == std::string_view::npos)
                return fail("unterminated declaration");
            pos = end + 1;
            continue;
        }

        // Find the tag end, skipping '>' inside quoted attribute values
        size_t end = pos + 1;
        char quote = 0;
        for (; end < xml.size(); ++end) {
            char c = xml[end];
            if (quote) {
                if (c == quote)
                    quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '>') {
                break;
            }
        }
        if (end >= xml.size())
            return fail("unterminated tag");

        std::string_view tag = xml.substr(pos + 1, end - pos - 1);
        bool closing = !tag.empty() && tag.front() == '/';
        bool selfClosing = !tag.empty() && tag.back() == '/';
        if (closing)
            tag.remove_prefix(1);
        auto nameEnd = tag.find_first_of(" \t\r\n/");
        std::string name(tag.substr(0, nameEnd));
        if (name.empty())
            return fail("empty tag name");

        if (closing) {
            if (open.empty() || open.back() != name)
                return fail("unexpected closing tag </" + name + ">");
            open.pop_back();
        } else {
            if (open.empty() && sawRoot)
                return fail("more than one root element");
            sawRoot = true;
            ++elements;
            if (!selfClosing)
                open.push_back(std::move(name));
        }
        pos = end + 1;
    }

    if (!open.empty())
        return fail("unclosed element <" + open.back() + ">");
    if (!sawRoot)
        return fail("no root element");
    return elements;
}

std::vector<std::vector<std::string>> parseDelimited(std::string_view text, char delimiter) {
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> row;
    std::string field;
    bool inQuotes = false;
    bool rowHasData = false;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }
        if (c == '"' && field.empty()) {
            inQuotes = true;
            rowHasData = true;
        } else if (c == delimiter) {
            row.push_back(std::move(field));
            field.clear();
            rowHasData = true;
        } else if (c == '\n' || c == '\r') {
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
            if (rowHasData || !field.empty()) {
                row.push_back(std::move(field));
                rows.push_back(std::move(row));
            }
            row.clear();
            field.clear();
            rowHasData = false;
        } else {
            field.push_back(c);
            rowHasData = true;
        }
    }
    if (rowHasData || !field.empty()) {
        row.push_back(std::move(field));
        rows.push_back(std::move(row));
    }
    return rows;
}

std::string escapeCell(const std::string& cell) {
    std::string out;
    out.reserve(cell.size());
    for (char c : cell) {
        if (c == '|')
            out += "\\|";
        else if (c == '\n' || c == '\r')
            out += ' ';
        else
            out += c;
    }
    return out;
}

} // namespace

std::string textFormatForMime(std::string_view mimeType) {
    const auto& formats = mimeFormats();
    std::string key(mimeType.substr(0, mimeType.find(';')));
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (auto it = formats.find(key); it != formats.end())
        return it->second;
    return "text";
}

std::vector<std::string> PlainTextExtractor::mimeTypes() {
    std::vector<std::string> out;
    for (const auto& [mime, _] : mimeFormats())
        out.push_back(mime);
    return out;
}

Result<ExtractionResult> PlainTextExtractor::extractFromBuffer(
    ByteSpan data, std::string_view mimeType, const config::ExtractionConfig& /*config*/) {
    ExtractionResult result;
    result.mime_type = std::string(mimeType);

    std::string encoding;
    auto text = EncodingDetector::decodeToUtf8(data, &encoding);
    if (!text)
        return text.error();
    result.content = std::move(text).value();
    result.metadata["encoding"] = encoding;
    if (encoding != "UTF-8") {
        spdlog::debug("PlainTextExtractor: decoded {} bytes from {}", data.size(), encoding);
        result.addWarning("encoding", "Content decoded from " + encoding);
    }

    auto format = textFormatForMime(mimeType);
    if (auto r = checkStructuredText(result.content, format); !r)
        return r.error();

    processTextByType(result, format);
    return result;
}

Result<void> PlainTextExtractor::checkStructuredText(const std::string& text,
                                                     std::string_view format) {
    if (format == "json") {
        try {
            (void)nlohmann::json::parse(text);
        } catch (const nlohmann::json::parse_error& e) {
            return Error{ErrorCode::ParsingError, std::string("Malformed JSON: ") + e.what()};
        }
    } else if (format == "yaml") {
        auto doc = config::yamlToJson(text);
        if (!doc)
            return Error{ErrorCode::ParsingError, "Malformed YAML: " + doc.error().message};
    } else if (format == "toml") {
        auto doc = config::parse_toml(text);
        if (!doc)
            return Error{ErrorCode::ParsingError, "Malformed TOML: " + doc.error().message};
    } else if (format == "xml") {
        auto scanned = scanXml(text);
        if (!scanned)
            return scanned.error();
    }
    return {};
}

void PlainTextExtractor::processTextByType(ExtractionResult& result, std::string_view format) {
    const auto& text = result.content;

    result.metadata["format_type"] = "text";
    result.metadata["format"] = std::string(format);

    size_t lineCount = static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
    if (!text.empty() && text.back() != '\n')
        lineCount++;
    result.metadata["line_count"] = lineCount;
    result.metadata["word_count"] = countWords(text);
    result.metadata["character_count"] = countCodePoints(text);

    if (format == "markdown" || format == "djot") {
        extractMarkdownMetadata(result);
    } else if (format == "csv") {
        extractDelimitedTable(result, ',');
    } else if (format == "tsv") {
        extractDelimitedTable(result, '\t');
    } else if (format == "xml") {
        auto scanned = scanXml(text);
        if (scanned)
            result.metadata["element_count"] = scanned.value();
    }
}

void PlainTextExtractor::extractDelimitedTable(ExtractionResult& result, char delimiter) {
    auto rows = parseDelimited(result.content, delimiter);
    if (rows.empty())
        return;

    size_t columns = 0;
    for (const auto& row : rows)
        columns = std::max(columns, row.size());
    for (auto& row : rows)
        row.resize(columns);

    std::ostringstream md;
    auto writeRow = [&](const std::vector<std::string>& row) {
        md << '|';
        for (const auto& cell : row)
            md << ' ' << escapeCell(cell) << " |";
        md << '\n';
    };
    writeRow(rows.front());
    md << '|';
    for (size_t i = 0; i < columns; ++i)
        md << " --- |";
    md << '\n';
    for (size_t r = 1; r < rows.size(); ++r)
        writeRow(rows[r]);

    result.metadata["row_count"] = rows.size();
    result.metadata["column_count"] = columns;

    Table table;
    table.cells = std::move(rows);
    table.markdown = md.str();
    table.page_number = 1;
    result.tables.push_back(std::move(table));
}

void PlainTextExtractor::extractMarkdownMetadata(ExtractionResult& result) {
    nlohmann::json headers = nlohmann::json::array();
    nlohmann::json links = nlohmann::json::array();
    size_t codeBlocks = 0;
    bool inFence = false;

    std::istringstream lines(result.content);
    std::string line;
    while (std::getline(lines, line)) {
        std::string_view view(line);
        while (!view.empty() && (view.front() == ' ' || view.front() == '\t'))
            view.remove_prefix(1);

        if (view.rfind("```", 0) == 0 || view.rfind("~~~", 0) == 0) {
            if (!inFence)
                ++codeBlocks;
            inFence = !inFence;
            continue;
        }
        if (inFence)
            continue;

        if (!view.empty() && view.front() == '#') {
            size_t level = view.find_first_not_of('#');
            if (level != std::string_view::npos && level <= 6 && view[level] == ' ') {
                std::string heading(view.substr(level + 1));
                config::trim(heading);
                if (!heading.empty()) {
                    if (!result.metadata.contains("title") && level == 1)
                        result.metadata["title"] = heading;
                    headers.push_back(heading);
                }
            }
        }

        // [text](url)
        size_t pos = 0;
        while ((pos = view.find('[', pos)) != std::string_view::npos) {
            auto close = view.find("](", pos);
            if (close == std::string_view::npos)
                break;
            auto end = view.find(')', close + 2);
            if (end == std::string_view::npos)
                break;
            links.push_back(nlohmann::json::array(
                {std::string(view.substr(pos + 1, close - pos - 1)),
                 std::string(view.substr(close + 2, end - close - 2))}));
            pos = end + 1;
        }
    }

    if (!headers.empty())
        result.metadata["headers"] = std::move(headers);
    if (!links.empty())
        result.metadata["links"] = std::move(links);
    if (codeBlocks > 0)
        result.metadata["code_blocks"] = codeBlocks;
}

} // namespace kreuzberg::extraction
