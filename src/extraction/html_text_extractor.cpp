#include <kreuzberg/extraction/html_text_extractor.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace kreuzberg::extraction {

namespace {

// Helper for case-insensitive find
size_t find_caseless(const std::string& haystack, const std::string& needle, size_t offset = 0) {
    if (offset >= haystack.size())
        return std::string::npos;
    auto it = std::search(
        haystack.begin() + static_cast<std::ptrdiff_t>(offset), haystack.end(), needle.begin(),
        needle.end(),
        [](unsigned char c1, unsigned char c2) { return std::tolower(c1) == std::tolower(c2); });
    if (it == haystack.end()) {
        return std::string::npos;
    }
    return static_cast<size_t>(std::distance(haystack.begin(), it));
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

std::string trimCopy(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && isSpace(s[b]))
        ++b;
    while (e > b && isSpace(s[e - 1]))
        --e;
    return std::string(s.substr(b, e - b));
}

std::string collapseWhitespace(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    bool space = false;
    for (char c : s) {
        if (isSpace(c)) {
            space = true;
            continue;
        }
        if (space && !out.empty())
            out += ' ';
        space = false;
        out += c;
    }
    return out;
}

size_t codePointLength(std::string_view s) {
    return static_cast<size_t>(std::count_if(
        s.begin(), s.end(), [](char c) { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; }));
}

const std::unordered_map<std::string_view, std::uint32_t>& namedEntities() {
    static const std::unordered_map<std::string_view, std::uint32_t> entities = {
        {"amp", '&'},       {"lt", '<'},        {"gt", '>'},        {"quot", '"'},
        {"apos", '\''},     {"nbsp", 0xA0},     {"ndash", 0x2013},  {"mdash", 0x2014},
        {"copy", 0xA9},     {"reg", 0xAE},      {"trade", 0x2122},  {"hellip", 0x2026},
        {"bull", 0x2022},   {"ldquo", 0x201C},  {"rdquo", 0x201D},  {"lsquo", 0x2018},
        {"rsquo", 0x2019},  {"laquo", 0xAB},    {"raquo", 0xBB},    {"middot", 0xB7},
        {"euro", 0x20AC},   {"pound", 0xA3},    {"yen", 0xA5},      {"cent", 0xA2},
        {"sect", 0xA7},     {"para", 0xB6},     {"deg", 0xB0},      {"plusmn", 0xB1},
        {"times", 0xD7},    {"divide", 0xF7},   {"frac12", 0xBD},   {"frac14", 0xBC},
        {"frac34", 0xBE},   {"larr", 0x2190},   {"rarr", 0x2192},   {"uarr", 0x2191},
        {"darr", 0x2193},   {"auml", 0xE4},     {"ouml", 0xF6},     {"uuml", 0xFC},
        {"Auml", 0xC4},     {"Ouml", 0xD6},     {"Uuml", 0xDC},     {"szlig", 0xDF},
        {"eacute", 0xE9},   {"egrave", 0xE8},   {"ecirc", 0xEA},    {"aacute", 0xE1},
        {"agrave", 0xE0},   {"acirc", 0xE2},    {"iacute", 0xED},   {"oacute", 0xF3},
        {"uacute", 0xFA},   {"ntilde", 0xF1},   {"ccedil", 0xE7},   {"Eacute", 0xC9},
        {"shy", 0xAD},      {"zwj", 0x200D},    {"zwnj", 0x200C},   {"thinsp", 0x2009},
        {"ensp", 0x2002},   {"emsp", 0x2003},
    };
    return entities;
}

const std::unordered_set<std::string>& voidElements() {
    static const std::unordered_set<std::string> tags = {
        "area", "base", "br",    "col",   "embed",  "hr",    "img",
        "input", "link", "meta", "param", "source", "track", "wbr"};
    return tags;
}

bool isRawTextElement(const std::string& name) {
    return name == "script" || name == "style" || name == "textarea" || name == "title";
}

} // namespace

std::vector<HtmlToken> tokenizeHtml(const std::string& html) {
    std::vector<HtmlToken> tokens;
    std::string text;
    const size_t n = html.size();
    size_t pos = 0;

    auto flushText = [&]() {
        if (text.empty())
            return;
        HtmlToken t;
        t.kind = HtmlToken::Kind::Text;
        t.text = std::move(text);
        tokens.push_back(std::move(t));
        text.clear();
    };

    while (pos < n) {
        if (html[pos] != '<') {
            text += html[pos++];
            continue;
        }

        if (html.compare(pos, 4, "<!--") == 0) {
            auto end = html.find("-->", pos + 4);
            pos = end == std::string::npos ? n : end + 3;
            continue;
        }
        if (html.compare(pos, 9, "<![CDATA[") == 0) {
            auto end = html.find("]]>", pos + 9);
            auto stop = end == std::string::npos ? n : end;
            text.append(html, pos + 9, stop - pos - 9);
            pos = end == std::string::npos ? n : end + 3;
            continue;
        }
        if (pos + 1 < n && (html[pos + 1] == '!' || html[pos + 1] == '?')) {
            auto end = html.find('>', pos);
            pos = end == std::string::npos ? n : end + 1;
            continue;
        }

        const bool closing = pos + 1 < n && html[pos + 1] == '/';
        size_t p = pos + 1 + (closing ? 1 : 0);
        if (p >= n || !std::isalpha(static_cast<unsigned char>(html[p]))) {
            text += html[pos++];
            continue;
        }

        size_t nameStart = p;
        while (p < n && (std::isalnum(static_cast<unsigned char>(html[p])) || html[p] == '-' ||
                         html[p] == ':'))
            ++p;
        std::string name = toLower(html.substr(nameStart, p - nameStart));

        if (closing) {
            auto end = html.find('>', p);
            pos = end == std::string::npos ? n : end + 1;
            flushText();
            HtmlToken t;
            t.kind = HtmlToken::Kind::EndTag;
            t.name = std::move(name);
            tokens.push_back(std::move(t));
            continue;
        }

        HtmlToken tag;
        tag.kind = HtmlToken::Kind::StartTag;
        tag.name = name;
        while (p < n) {
            while (p < n && isSpace(html[p]))
                ++p;
            if (p >= n)
                break;
            if (html[p] == '>') {
                ++p;
                break;
            }
            if (html[p] == '/') {
                if (p + 1 < n && html[p + 1] == '>') {
                    tag.selfClosing = true;
                    p += 2;
                    break;
                }
                ++p;
                continue;
            }

            size_t attrStart = p;
            while (p < n && !isSpace(html[p]) && html[p] != '=' && html[p] != '>' &&
                   html[p] != '/')
                ++p;
            std::string attrName = toLower(html.substr(attrStart, p - attrStart));
            while (p < n && isSpace(html[p]))
                ++p;

            std::string value;
            if (p < n && html[p] == '=') {
                ++p;
                while (p < n && isSpace(html[p]))
                    ++p;
                if (p < n && (html[p] == '"' || html[p] == '\'')) {
                    char quote = html[p++];
                    auto end = html.find(quote, p);
                    if (end == std::string::npos)
                        end = n;
                    value = html.substr(p, end - p);
                    p = end < n ? end + 1 : n;
                } else {
                    size_t valueStart = p;
                    while (p < n && !isSpace(html[p]) && html[p] != '>')
                        ++p;
                    value = html.substr(valueStart, p - valueStart);
                }
            }
            if (!attrName.empty())
                tag.attributes.emplace(std::move(attrName),
                                       HtmlTextExtractor::decodeHtmlEntities(value));
        }

        flushText();
        tokens.push_back(std::move(tag));
        pos = p;

        if (isRawTextElement(name) && !tokens.back().selfClosing) {
            auto end = find_caseless(html, "</" + name, pos);
            auto stop = end == std::string::npos ? n : end;
            if (stop > pos) {
                HtmlToken raw;
                raw.kind = HtmlToken::Kind::Text;
                raw.text = html.substr(pos, stop - pos);
                tokens.push_back(std::move(raw));
            }
            pos = stop;
        }
    }
    flushText();
    return tokens;
}

Result<ExtractionResult> HtmlTextExtractor::extractFromBuffer(
    ByteSpan data, std::string_view mimeType, const config::ExtractionConfig& config) {
    ExtractionResult result;
    result.mime_type = std::string(mimeType);

    std::string encoding;
    auto decoded = EncodingDetector::decodeToUtf8(data, &encoding);
    if (!decoded)
        return decoded.error();
    std::string html = std::move(decoded).value();
    if (encoding != "UTF-8")
        result.addWarning("encoding", "Content decoded from " + encoding);

    try {
        extractMetadata(html, result);

        const auto options = config.html_options.value_or(config::HtmlConversionOptions{});
        const bool djot = config.output_format == config::OutputFormat::Djot;
        std::vector<Table> tables;
        auto rendered = HtmlToMarkdown(options, djot).convert(html, &tables);

        switch (config.output_format) {
            case config::OutputFormat::Plain:
                result.content = extractTextFromHtml(html);
                break;
            case config::OutputFormat::Markdown:
            case config::OutputFormat::Djot:
                result.content = std::move(rendered);
                break;
            case config::OutputFormat::Html:
                result.content = html;
                break;
        }
        result.tables = std::move(tables);
        result.metadata["output_format"] = config::toString(config.output_format);
    } catch (const std::exception& e) {
        return Error{ErrorCode::ParsingError, "HTML extraction failed: " + std::string(e.what())};
    }

    spdlog::debug("HtmlTextExtractor: {} bytes -> {} chars, {} tables", data.size(),
                  result.content.size(), result.tables.size());
    return result;
}

void HtmlTextExtractor::extractMetadata(const std::string& html, ExtractionResult& result) {
    result.metadata["format_type"] = "html";

    std::string title = extractTitle(html);
    if (!title.empty())
        result.metadata["title"] = title;

    nlohmann::json openGraph = nlohmann::json::object();
    for (const auto& token : tokenizeHtml(html)) {
        if (token.kind != HtmlToken::Kind::StartTag)
            continue;

        if (token.name == "html") {
            auto lang = token.attributes.find("lang");
            if (lang != token.attributes.end() && !lang->second.empty())
                result.metadata["language"] = lang->second;
            continue;
        }
        if (token.name != "meta")
            continue;

        auto contentIt = token.attributes.find("content");
        if (contentIt == token.attributes.end())
            continue;
        std::string key;
        if (auto it = token.attributes.find("name"); it != token.attributes.end())
            key = toLower(it->second);
        else if (auto prop = token.attributes.find("property"); prop != token.attributes.end())
            key = toLower(prop->second);
        const std::string value = trimCopy(contentIt->second);
        if (key.empty() || value.empty())
            continue;

        if (key == "description") {
            result.metadata["description"] = value;
        } else if (key == "author") {
            result.metadata["author"] = value;
        } else if (key == "keywords") {
            nlohmann::json keywords = nlohmann::json::array();
            std::stringstream ss(value);
            std::string item;
            while (std::getline(ss, item, ',')) {
                item = trimCopy(item);
                if (!item.empty())
                    keywords.push_back(item);
            }
            result.metadata["keywords"] = std::move(keywords);
        } else if (key.rfind("og:", 0) == 0) {
            openGraph[key.substr(3)] = value;
        }
    }

    if (!openGraph.empty()) {
        if (!result.metadata.contains("description") && openGraph.contains("description"))
            result.metadata["description"] = openGraph["description"];
        if (!result.metadata.contains("title") && openGraph.contains("title"))
            result.metadata["title"] = openGraph["title"];
        result.metadata["open_graph"] = std::move(openGraph);
    }
}

std::string HtmlTextExtractor::extractTextFromHtml(const std::string& html) {
    if (html.empty()) {
        return "";
    }

    std::string text = html;

    // 1. Remove script and style blocks
    text = removeScriptAndStyle(text);

    // 2. Convert block tags to newlines
    text = convertBlockTagsToNewlines(text);

    // 3. Strip remaining HTML tags
    text = stripHtmlTags(text);

    // 4. Decode HTML entities
    text = decodeHtmlEntities(text);

    // 5. Clean up whitespace
    text = cleanWhitespace(text);

    return text;
}

std::string HtmlTextExtractor::removeScriptAndStyle(const std::string& html) {
    std::string result;
    result.reserve(html.size());
    size_t last_pos = 0;

    // The <title> text lives in metadata, keep it out of the body
    static const std::vector<std::pair<std::string, std::string>> blocks = {
        {"<script", "</script>"}, {"<style", "</style>"}, {"<title", "</title>"}};

    while (last_pos < html.size()) {
        size_t next_block = std::string::npos;
        std::string close;
        for (const auto& [open, end] : blocks) {
            size_t at = find_caseless(html, open, last_pos);
            if (at < next_block) {
                next_block = at;
                close = end;
            }
        }
        size_t comment_start = html.find("<!--", last_pos);
        if (comment_start < next_block) {
            next_block = comment_start;
            close = "-->";
        }

        if (next_block == std::string::npos) {
            result.append(html, last_pos, std::string::npos);
            break;
        }

        result.append(html, last_pos, next_block - last_pos);

        size_t end_tag = close == "-->" ? html.find(close, next_block)
                                        : find_caseless(html, close, next_block);
        if (end_tag == std::string::npos) {
            last_pos = next_block + 1; // Malformed, skip '<'
        } else {
            last_pos = end_tag + close.size();
        }
    }
    return result;
}

std::string HtmlTextExtractor::convertBlockTagsToNewlines(const std::string& html) {
    std::string result;
    result.reserve(html.size() + html.size() / 10);

    static const std::unordered_set<std::string> blockTags = {
        "p",       "div",     "h1",         "h2",     "h3",  "h4",    "h5",   "h6", "ul",
        "ol",      "li",      "blockquote", "pre",    "hr",  "table", "tr",   "td", "th",
        "section", "article", "header",     "footer", "nav", "aside", "main", "br", "dt",
        "dd",      "figure",  "figcaption"};

    size_t pos = 0;
    while (pos < html.size()) {
        if (html[pos] != '<') {
            result += html[pos];
            pos++;
            continue;
        }

        size_t tag_end = html.find('>', pos);
        if (tag_end == std::string::npos) {
            result += html[pos];
            pos++;
            continue;
        }

        std::string tag_content = html.substr(pos + 1, tag_end - pos - 1);
        if (!tag_content.empty() && tag_content[0] == '/') {
            tag_content = tag_content.substr(1);
        }

        size_t space_pos = tag_content.find_first_of(" \t\n\r/");
        std::string tag_lower = toLower(tag_content.substr(0, space_pos));

        if (blockTags.contains(tag_lower)) {
            result += '\n';
        }

        // Keep the tag so stripHtmlTags still sees balanced brackets
        result.append(html, pos, tag_end - pos + 1);
        pos = tag_end + 1;
    }

    return result;
}

std::string HtmlTextExtractor::stripHtmlTags(const std::string& html) {
    std::string result;
    result.reserve(html.length());
    bool in_tag = false;
    for (char c : html) {
        if (c == '<') {
            in_tag = true;
        } else if (c == '>') {
            in_tag = false;
        } else if (!in_tag) {
            result += c;
        }
    }
    return result;
}

std::string HtmlTextExtractor::decodeHtmlEntities(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        if (text[pos] != '&') {
            result += text[pos];
            pos++;
            continue;
        }

        size_t end = text.find(';', pos + 1);
        if (end == std::string::npos || end - pos > 12) {
            result += text[pos++];
            continue;
        }
        std::string_view body(text.data() + pos + 1, end - pos - 1);

        if (!body.empty() && body.front() == '#') {
            body.remove_prefix(1);
            int base = 10;
            if (!body.empty() && (body.front() == 'x' || body.front() == 'X')) {
                body.remove_prefix(1);
                base = 16;
            }
            std::uint32_t code = 0;
            auto [ptr, ec] = std::from_chars(body.data(), body.data() + body.size(), code, base);
            if (!body.empty() && ec == std::errc() && ptr == body.data() + body.size() &&
                code > 0 && code <= 0x10FFFF && !(code >= 0xD800 && code <= 0xDFFF)) {
                appendUtf8FromCodepoint(code, result);
                pos = end + 1;
                continue;
            }
        } else if (auto it = namedEntities().find(body); it != namedEntities().end()) {
            // Non-breaking space reads as a plain space in extracted text
            appendUtf8FromCodepoint(it->second == 0xA0 ? ' ' : it->second, result);
            pos = end + 1;
            continue;
        }

        // Not a recognized entity, keep the '&'
        result += text[pos];
        pos++;
    }

    return result;
}

std::string HtmlTextExtractor::cleanWhitespace(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    bool lastWasSpace = false;
    bool lastWasNewline = false;
    int consecutiveNewlines = 0;

    for (char c : text) {
        if (c == '\n' || c == '\r') {
            if (!lastWasNewline) {
                consecutiveNewlines = 1;
                lastWasNewline = true;
                lastWasSpace = false;
                // Drop the space that preceded the line break
                if (!result.empty() && result.back() == ' ')
                    result.pop_back();
            } else {
                consecutiveNewlines++;
            }

            // Limit to maximum 2 consecutive newlines
            if (consecutiveNewlines <= 2) {
                result += '\n';
            }
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (!lastWasSpace && !lastWasNewline) {
                result += ' ';
                lastWasSpace = true;
            }
        } else {
            result += c;
            lastWasSpace = false;
            lastWasNewline = false;
            consecutiveNewlines = 0;
        }
    }

    return trimCopy(result);
}

std::string HtmlTextExtractor::extractTitle(const std::string& html) {
    size_t title_start = find_caseless(html, "<title");
    if (title_start == std::string::npos) {
        return "";
    }

    size_t content_start = html.find('>', title_start);
    if (content_start == std::string::npos) {
        return "";
    }
    content_start++;

    size_t content_end = find_caseless(html, "</title>", content_start);
    if (content_end == std::string::npos) {
        return "";
    }

    std::string title = html.substr(content_start, content_end - content_start);
    title = stripHtmlTags(title);
    title = decodeHtmlEntities(title);
    return collapseWhitespace(title);
}

std::string HtmlTextExtractor::extractMetaContent(const std::string& html, const std::string& name) {
    const std::string wanted = toLower(name);
    for (const auto& token : tokenizeHtml(html)) {
        if (token.kind != HtmlToken::Kind::StartTag || token.name != "meta")
            continue;
        auto key = token.attributes.find("name");
        if (key == token.attributes.end())
            key = token.attributes.find("property");
        if (key == token.attributes.end() || toLower(key->second) != wanted)
            continue;
        auto content = token.attributes.find("content");
        if (content != token.attributes.end())
            return trimCopy(content->second);
    }
    return "";
}

// ---------------------------------------------------------------------------
// HtmlToMarkdown
// ---------------------------------------------------------------------------

namespace {

struct Frame {
    std::string tag;
    std::string buf;
    std::string href;
    std::string title;
    std::string lang;
    std::vector<std::vector<std::string>> rows;
    bool headerRow = false;
};

struct ListState {
    bool ordered = false;
    long counter = 1;
};

void trimTrailingSpaces(std::string& b) {
    while (!b.empty() && (b.back() == ' ' || b.back() == '\t'))
        b.pop_back();
}

void ensureNewlines(std::string& b, size_t count) {
    trimTrailingSpaces(b);
    if (b.empty())
        return;
    size_t have = 0;
    for (auto it = b.rbegin(); it != b.rend() && *it == '\n'; ++it)
        ++have;
    if (have < count)
        b.append(count - have, '\n');
}

std::string escapeCell(const std::string& cell) {
    std::string out;
    for (char c : collapseWhitespace(cell)) {
        if (c == '|')
            out += "\\|";
        else
            out += c;
    }
    return out;
}

std::string renderTable(std::vector<std::vector<std::string>>& rows) {
    size_t columns = 0;
    for (const auto& row : rows)
        columns = std::max(columns, row.size());
    for (auto& row : rows)
        row.resize(columns);

    std::string md;
    auto writeRow = [&](const std::vector<std::string>& row) {
        md += '|';
        for (const auto& cell : row)
            md += " " + escapeCell(cell) + " |";
        md += '\n';
    };
    writeRow(rows.front());
    md += '|';
    for (size_t i = 0; i < columns; ++i)
        md += " --- |";
    md += '\n';
    for (size_t r = 1; r < rows.size(); ++r)
        writeRow(rows[r]);
    md.pop_back();
    return md;
}

std::string languageFromClass(const std::map<std::string, std::string>& attributes) {
    auto it = attributes.find("class");
    if (it == attributes.end())
        return "";
    std::stringstream ss(it->second);
    std::string cls;
    while (ss >> cls) {
        if (cls.rfind("language-", 0) == 0)
            return cls.substr(9);
        if (cls.rfind("lang-", 0) == 0)
            return cls.substr(5);
    }
    return "";
}

class MarkdownRenderer {
public:
    MarkdownRenderer(const config::HtmlConversionOptions& options, bool djot,
                     std::vector<Table>* tables)
        : options_(options), djot_(djot), tables_(tables) {
        frames_.push_back(Frame{});
        skipTags_ = {"script", "style", "head", "title", "textarea"};
        if (options_.preprocessing != config::PreprocessingPreset::None) {
            skipTags_.insert({"noscript", "iframe", "template", "svg", "object", "canvas"});
        }
        if (options_.preprocessing == config::PreprocessingPreset::Aggressive) {
            skipTags_.insert({"nav", "header", "footer", "aside", "form", "button", "select"});
        }
    }

    std::string render(const std::vector<HtmlToken>& tokens) {
        for (const auto& token : tokens) {
            switch (token.kind) {
                case HtmlToken::Kind::Text:
                    onText(token.text);
                    break;
                case HtmlToken::Kind::StartTag:
                    onStart(token);
                    break;
                case HtmlToken::Kind::EndTag:
                    onEnd(token.name);
                    break;
            }
        }
        while (frames_.size() > 1)
            closeTop();
        return finish(frames_.front().buf);
    }

private:
    std::string& out() { return frames_.back().buf; }

    bool inPre() const {
        return std::any_of(frames_.begin(), frames_.end(),
                           [](const Frame& f) { return f.tag == "pre"; });
    }

    Frame* nearest(std::string_view tag) {
        for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
            if (it->tag == tag)
                return &*it;
        }
        return nullptr;
    }

    void push(const HtmlToken& token) {
        Frame f;
        f.tag = token.name;
        if (auto it = token.attributes.find("href"); it != token.attributes.end())
            f.href = it->second;
        if (auto it = token.attributes.find("title"); it != token.attributes.end())
            f.title = it->second;
        frames_.push_back(std::move(f));
    }

    void onText(const std::string& raw) {
        if (!skipStack_.empty())
            return;
        std::string text = HtmlTextExtractor::decodeHtmlEntities(raw);
        if (inPre() || options_.whitespace_mode == config::WhitespaceMode::Preserve) {
            out() += text;
            return;
        }

        std::string piece;
        if (options_.whitespace_mode == config::WhitespaceMode::PreserveInner) {
            bool lead = !text.empty() && isSpace(text.front());
            bool trail = !text.empty() && isSpace(text.back());
            std::string core = trimCopy(text);
            piece = (lead ? " " : "") + core + (trail && !core.empty() ? " " : "");
        } else {
            bool lead = !text.empty() && isSpace(text.front());
            bool trail = !text.empty() && isSpace(text.back());
            std::string core = collapseWhitespace(text);
            piece = (lead ? " " : "") + core + (trail && !core.empty() ? " " : "");
        }

        auto& b = out();
        if (!piece.empty() && piece.front() == ' ' &&
            (b.empty() || b.back() == ' ' || b.back() == '\n'))
            piece.erase(0, 1);
        b += piece;
    }

    void onStart(const HtmlToken& token) {
        const std::string& name = token.name;
        if (!skipStack_.empty()) {
            if (name == skipStack_.back() && !token.selfClosing)
                skipStack_.push_back(name);
            return;
        }
        if (skipTags_.contains(name)) {
            if (!token.selfClosing && !voidElements().contains(name))
                skipStack_.push_back(name);
            return;
        }

        if (name.size() == 2 && name[0] == 'h' && name[1] >= '1' && name[1] <= '6') {
            push(token);
            return;
        }

        if (name == "p") {
            if (lists_.empty())
                ensureNewlines(out(), 2);
        } else if (name == "div" || name == "section" || name == "article" || name == "main" ||
                   name == "header" || name == "footer" || name == "nav" || name == "aside" ||
                   name == "figure" || name == "figcaption" || name == "dl" || name == "dt" ||
                   name == "address" || name == "details" || name == "summary" ||
                   name == "form" || name == "fieldset") {
            ensureNewlines(out(), 1);
        } else if (name == "dd") {
            ensureNewlines(out(), 1);
            out() += djot_ ? ": " : "  ";
        } else if (name == "br") {
            if (inPre()) {
                out() += '\n';
            } else if (djot_ || options_.newline_style == config::NewlineStyle::Backslash) {
                trimTrailingSpaces(out());
                out() += "\\\n";
            } else {
                trimTrailingSpaces(out());
                out() += "  \n";
            }
        } else if (name == "hr") {
            ensureNewlines(out(), 2);
            out() += djot_ ? "* * *" : "---";
            ensureNewlines(out(), 2);
        } else if (name == "img") {
            auto attr = [&](const char* key) {
                auto it = token.attributes.find(key);
                return it == token.attributes.end() ? std::string() : it->second;
            };
            auto src = attr("src");
            if (!src.empty()) {
                out() += "![" + attr("alt") + "](" + src;
                if (auto title = attr("title"); !title.empty())
                    out() += " \"" + title + "\"";
                out() += ")";
            }
        } else if (name == "ul" || name == "ol") {
            ensureNewlines(out(), lists_.empty() ? 2 : 1);
            ListState state;
            state.ordered = name == "ol";
            if (auto it = token.attributes.find("start"); it != token.attributes.end()) {
                long start = 1;
                auto [ptr, ec] = std::from_chars(it->second.data(),
                                                 it->second.data() + it->second.size(), start);
                if (ec == std::errc())
                    state.counter = start;
            }
            lists_.push_back(state);
        } else if (name == "li") {
            ensureNewlines(out(), 1);
            if (lists_.empty())
                lists_.push_back(ListState{});
            const size_t depth = lists_.size() - 1;
            if (options_.list_indent_type == config::ListIndentType::Tabs)
                out().append(depth, '\t');
            else
                out().append(depth * static_cast<size_t>(options_.list_indent_width), ' ');
            auto& list = lists_.back();
            if (list.ordered)
                out() += std::to_string(list.counter++) + ". ";
            else
                out() += "- ";
        } else if (name == "pre") {
            push(token);
            frames_.back().lang = languageFromClass(token.attributes);
        } else if (name == "code") {
            if (inPre()) {
                Frame* pre = nearest("pre");
                if (pre && pre->lang.empty())
                    pre->lang = languageFromClass(token.attributes);
            } else {
                push(token);
            }
        } else if (name == "a" || name == "blockquote" || name == "em" || name == "i" ||
                   name == "strong" || name == "b" || name == "del" || name == "s" ||
                   name == "strike" || name == "mark" || name == "sub" || name == "sup" ||
                   name == "ins" || name == "u") {
            push(token);
        } else if (name == "table") {
            push(token);
        } else if (name == "tr") {
            if (Frame* table = nearest("table"))
                table->rows.emplace_back();
        } else if (name == "td" || name == "th") {
            if (Frame* table = nearest("table")) {
                if (table->rows.empty())
                    table->rows.emplace_back();
                push(token);
            }
        }
    }

    void onEnd(const std::string& name) {
        if (!skipStack_.empty()) {
            if (name == skipStack_.back())
                skipStack_.pop_back();
            return;
        }

        if (name == "ul" || name == "ol") {
            if (!lists_.empty())
                lists_.pop_back();
            ensureNewlines(out(), lists_.empty() ? 2 : 1);
            return;
        }
        if (name == "li" || name == "div" || name == "dt" || name == "dd" || name == "section" ||
            name == "article" || name == "figure" || name == "figcaption") {
            ensureNewlines(out(), 1);
            return;
        }
        if (name == "p") {
            ensureNewlines(out(), lists_.empty() ? 2 : 1);
            return;
        }

        // Close every frame opened after the matching one
        for (size_t i = frames_.size(); i-- > 1;) {
            if (frames_[i].tag == name) {
                while (frames_.size() > i)
                    closeTop();
                return;
            }
        }
    }

    std::string wrapInline(const std::string& content, const std::string& open,
                           const std::string& close) {
        std::string core = trimCopy(content);
        if (core.empty())
            return content.empty() ? "" : " ";
        std::string lead = isSpace(content.front()) ? " " : "";
        std::string trail = isSpace(content.back()) ? " " : "";
        return lead + open + core + close + trail;
    }

    void appendInline(std::string piece) {
        auto& b = out();
        if (!piece.empty() && piece.front() == ' ' &&
            (b.empty() || b.back() == ' ' || b.back() == '\n'))
            piece.erase(0, 1);
        b += piece;
    }

    std::string heading(const std::string& text, int level) const {
        if (!djot_ && options_.heading_style == config::HeadingStyle::Underlined && level <= 2) {
            size_t width = std::max<size_t>(3, codePointLength(text));
            return text + "\n" + std::string(width, level == 1 ? '=' : '-');
        }
        std::string hashes(static_cast<size_t>(level), '#');
        if (!djot_ && options_.heading_style == config::HeadingStyle::AtxClosed)
            return hashes + " " + text + " " + hashes;
        return hashes + " " + text;
    }

    void closeTop() {
        Frame f = std::move(frames_.back());
        frames_.pop_back();
        const std::string& tag = f.tag;

        if (tag.size() == 2 && tag[0] == 'h' && tag[1] >= '1' && tag[1] <= '6') {
            std::string text = collapseWhitespace(f.buf);
            if (text.empty())
                return;
            ensureNewlines(out(), 2);
            out() += heading(text, tag[1] - '0');
            ensureNewlines(out(), 2);
        } else if (tag == "a") {
            std::string text = collapseWhitespace(f.buf);
            if (f.href.empty()) {
                appendInline(wrapInline(f.buf, "", ""));
                return;
            }
            std::string link = "[" + (text.empty() ? f.href : text) + "](" + f.href;
            if (!f.title.empty())
                link += " \"" + f.title + "\"";
            link += ")";
            appendInline((!f.buf.empty() && isSpace(f.buf.front()) ? " " : "") + link +
                         (!f.buf.empty() && isSpace(f.buf.back()) ? " " : ""));
        } else if (tag == "em" || tag == "i") {
            appendInline(wrapInline(f.buf, djot_ ? "_" : "*", djot_ ? "_" : "*"));
        } else if (tag == "strong" || tag == "b") {
            appendInline(wrapInline(f.buf, djot_ ? "*" : "**", djot_ ? "*" : "**"));
        } else if (tag == "del" || tag == "s" || tag == "strike") {
            appendInline(wrapInline(f.buf, djot_ ? "{-" : "~~", djot_ ? "-}" : "~~"));
        } else if (tag == "ins") {
            appendInline(wrapInline(f.buf, djot_ ? "{+" : "", djot_ ? "+}" : ""));
        } else if (tag == "sub") {
            appendInline(wrapInline(f.buf, djot_ ? "~" : "<sub>", djot_ ? "~" : "</sub>"));
        } else if (tag == "sup") {
            appendInline(wrapInline(f.buf, djot_ ? "^" : "<sup>", djot_ ? "^" : "</sup>"));
        } else if (tag == "u") {
            appendInline(wrapInline(f.buf, "", ""));
        } else if (tag == "mark") {
            closeMark(f);
        } else if (tag == "code") {
            std::string code = collapseWhitespace(f.buf);
            if (code.empty())
                return;
            std::string fence = code.find('`') == std::string::npos ? "`" : "``";
            std::string pad = fence.size() > 1 ? " " : "";
            appendInline(fence + pad + code + pad + fence);
        } else if (tag == "pre") {
            closePre(f);
        } else if (tag == "blockquote") {
            std::string body = trimCopy(f.buf);
            if (body.empty())
                return;
            ensureNewlines(out(), 2);
            std::istringstream lines(body);
            std::string line;
            bool first = true;
            while (std::getline(lines, line)) {
                if (!first)
                    out() += '\n';
                first = false;
                out() += line.empty() ? ">" : "> " + line;
            }
            ensureNewlines(out(), 2);
        } else if (tag == "td" || tag == "th") {
            if (Frame* table = nearest("table")) {
                if (table->rows.empty())
                    table->rows.emplace_back();
                table->rows.back().push_back(trimCopy(collapseWhitespace(f.buf)));
            }
        } else if (tag == "table") {
            closeTable(f);
        } else {
            out() += f.buf;
        }
    }

    void closeMark(const Frame& f) {
        switch (options_.highlight_style) {
            case config::HighlightStyle::DoubleEqual:
                appendInline(wrapInline(f.buf, djot_ ? "{=" : "==", djot_ ? "=}" : "=="));
                break;
            case config::HighlightStyle::Html:
                appendInline(wrapInline(f.buf, "<mark>", "</mark>"));
                break;
            case config::HighlightStyle::Bold:
                appendInline(wrapInline(f.buf, djot_ ? "*" : "**", djot_ ? "*" : "**"));
                break;
            case config::HighlightStyle::None:
                appendInline(wrapInline(f.buf, "", ""));
                break;
        }
    }

    void closePre(const Frame& f) {
        std::string code = f.buf;
        if (!code.empty() && code.front() == '\n')
            code.erase(0, 1);
        while (!code.empty() && (code.back() == '\n' || code.back() == ' ' || code.back() == '\t'))
            code.pop_back();

        ensureNewlines(out(), 2);
        if (!djot_ && options_.code_block_style == config::CodeBlockStyle::Indented) {
            std::istringstream lines(code);
            std::string line;
            bool first = true;
            while (std::getline(lines, line)) {
                if (!first)
                    out() += '\n';
                first = false;
                out() += "    " + line;
            }
        } else {
            const std::string fence =
                !djot_ && options_.code_block_style == config::CodeBlockStyle::Tildes ? "~~~"
                                                                                      : "```";
            out() += fence + f.lang + "\n" + code + "\n" + fence;
        }
        ensureNewlines(out(), 2);
    }

    void closeTable(Frame& f) {
        auto& rows = f.rows;
        rows.erase(std::remove_if(rows.begin(), rows.end(),
                                  [](const auto& row) { return row.empty(); }),
                   rows.end());
        if (rows.empty())
            return;

        Table table;
        table.markdown = renderTable(rows);
        table.cells = rows;
        table.page_number = 1;

        ensureNewlines(out(), 2);
        out() += table.markdown;
        ensureNewlines(out(), 2);
        if (tables_)
            tables_->push_back(std::move(table));
    }

    std::string finish(const std::string& raw) const {
        if (options_.whitespace_mode == config::WhitespaceMode::Preserve)
            return trimCopy(raw);

        std::string result;
        result.reserve(raw.size());
        std::istringstream lines(raw);
        std::string line;
        int blank = 0;
        while (std::getline(lines, line)) {
            bool hardBreak = line.size() >= 2 && line.compare(line.size() - 2, 2, "  ") == 0 &&
                             line.find_first_not_of(" \t") != std::string::npos;
            if (line.find_first_not_of(" \t") == std::string::npos) {
                if (++blank > 1)
                    continue;
                line.clear();
            } else {
                blank = 0;
                if (!hardBreak)
                    trimTrailingSpaces(line);
            }
            result += line;
            result += '\n';
        }
        return trimCopy(result);
    }

    const config::HtmlConversionOptions& options_;
    bool djot_;
    std::vector<Table>* tables_;
    std::vector<Frame> frames_;
    std::vector<ListState> lists_;
    std::vector<std::string> skipStack_;
    std::unordered_set<std::string> skipTags_;
};

} // namespace

std::string HtmlToMarkdown::convert(const std::string& html, std::vector<Table>* tables) const {
    if (html.empty())
        return "";
    MarkdownRenderer renderer(options_, djot_, tables);
    return renderer.render(tokenizeHtml(html));
}

} // namespace kreuzberg::extraction
