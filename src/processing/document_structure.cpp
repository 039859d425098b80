#include <kreuzberg/processing/document_structure.h>

#include <cctype>
#include <sstream>
#include <string>
#include <vector>

namespace kreuzberg::processing {

namespace {

using extraction::DocumentNode;

std::string_view trimView(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r'))
        s.remove_suffix(1);
    return s;
}

bool isUnderline(std::string_view line, char c) {
    line = trimView(line);
    if (line.size() < 3)
        return false;
    for (char ch : line) {
        if (ch != c)
            return false;
    }
    return true;
}

// "- ", "* ", "+ " or "12. " / "3) "; returns the item text start or npos
std::size_t listItemStart(std::string_view line) {
    if (line.size() >= 2 && (line[0] == '-' || line[0] == '*' || line[0] == '+') && line[1] == ' ')
        return 2;
    std::size_t i = 0;
    while (i < line.size() && std::isdigit(static_cast<unsigned char>(line[i])))
        ++i;
    if (i > 0 && i + 1 < line.size() && (line[i] == '.' || line[i] == ')') && line[i + 1] == ' ')
        return i + 2;
    return std::string_view::npos;
}

int atxLevel(std::string_view line) {
    std::size_t level = 0;
    while (level < line.size() && line[level] == '#')
        ++level;
    if (level == 0 || level > 6 || level >= line.size() || line[level] != ' ')
        return 0;
    return static_cast<int>(level);
}

std::string atxText(std::string_view line, int level) {
    auto text = trimView(line.substr(static_cast<std::size_t>(level)));
    // Closing hashes of atx_closed headings
    while (!text.empty() && text.back() == '#')
        text.remove_suffix(1);
    return std::string(trimView(text));
}

class StructureBuilder {
public:
    void addHeading(std::string text, int level) {
        DocumentNode node;
        node.node_type = "heading";
        node.content = std::move(text);
        node.level = level;
        while (!open_.empty() && open_.back().level.value_or(0) >= level)
            closeSection();
        open_.push_back(std::move(node));
    }

    void addBlock(DocumentNode node) {
        if (open_.empty())
            root_.nodes.push_back(std::move(node));
        else
            open_.back().children.push_back(std::move(node));
    }

    extraction::DocumentStructure finish() {
        while (!open_.empty())
            closeSection();
        return std::move(root_);
    }

private:
    void closeSection() {
        DocumentNode done = std::move(open_.back());
        open_.pop_back();
        addBlock(std::move(done));
    }

    extraction::DocumentStructure root_;
    std::vector<DocumentNode> open_;
};

DocumentNode makeNode(const char* type, std::string content) {
    DocumentNode node;
    node.node_type = type;
    node.content = std::move(content);
    return node;
}

} // namespace

extraction::DocumentStructure buildDocumentStructure(std::string_view content) {
    std::vector<std::string> lines;
    {
        std::istringstream in{std::string(content)};
        std::string line;
        while (std::getline(in, line)) {
            // Form feeds separate pages; treat them as blank lines
            for (auto& c : line) {
                if (c == '\f')
                    c = ' ';
            }
            lines.push_back(std::move(line));
        }
    }

    StructureBuilder builder;
    std::string paragraph;
    auto flushParagraph = [&]() {
        if (!paragraph.empty())
            builder.addBlock(makeNode("paragraph", std::move(paragraph)));
        paragraph.clear();
    };

    std::size_t i = 0;
    while (i < lines.size()) {
        std::string_view raw = lines[i];
        std::string_view line = trimView(raw);

        if (line.empty() || (line.rfind("<!--", 0) == 0 && line.find("-->") != std::string_view::npos)) {
            flushParagraph();
            ++i;
            continue;
        }

        if (line.rfind("```", 0) == 0 || line.rfind("~~~", 0) == 0) {
            flushParagraph();
            const std::string fence(line.substr(0, 3));
            std::string code;
            ++i;
            while (i < lines.size() && trimView(lines[i]).rfind(fence, 0) != 0) {
                if (!code.empty())
                    code += '\n';
                code += lines[i];
                ++i;
            }
            ++i; // closing fence
            builder.addBlock(makeNode("code_block", std::move(code)));
            continue;
        }

        // Thematic break
        if (isUnderline(line, '-') || isUnderline(line, '*') || line == "* * *") {
            flushParagraph();
            ++i;
            continue;
        }

        if (int level = atxLevel(line); level > 0) {
            flushParagraph();
            builder.addHeading(atxText(line, level), level);
            ++i;
            continue;
        }

        // Setext heading: a paragraph line followed by === or ---
        if (paragraph.empty() && i + 1 < lines.size() &&
            (isUnderline(lines[i + 1], '=') || isUnderline(lines[i + 1], '-')) &&
            listItemStart(line) == std::string_view::npos) {
            builder.addHeading(std::string(line), isUnderline(lines[i + 1], '=') ? 1 : 2);
            i += 2;
            continue;
        }

        if (line.front() == '>') {
            flushParagraph();
            std::string quote;
            while (i < lines.size() && !trimView(lines[i]).empty() &&
                   trimView(lines[i]).front() == '>') {
                auto body = trimView(trimView(lines[i]).substr(1));
                if (!quote.empty())
                    quote += '\n';
                quote += body;
                ++i;
            }
            builder.addBlock(makeNode("block_quote", std::move(quote)));
            continue;
        }

        if (line.front() == '|') {
            flushParagraph();
            std::string table;
            while (i < lines.size() && !trimView(lines[i]).empty() &&
                   trimView(lines[i]).front() == '|') {
                if (!table.empty())
                    table += '\n';
                table += trimView(lines[i]);
                ++i;
            }
            builder.addBlock(makeNode("table", std::move(table)));
            continue;
        }

        if (listItemStart(line) != std::string_view::npos) {
            flushParagraph();
            DocumentNode list = makeNode("list", "");
            while (i < lines.size()) {
                auto item = trimView(lines[i]);
                auto start = listItemStart(item);
                if (start == std::string_view::npos) {
                    // Continuation lines join the previous item
                    if (item.empty() || list.children.empty() ||
                        (lines[i].front() != ' ' && lines[i].front() != '\t'))
                        break;
                    list.children.back().content += " ";
                    list.children.back().content += item;
                    ++i;
                    continue;
                }
                list.children.push_back(makeNode("list_item", std::string(item.substr(start))));
                ++i;
            }
            builder.addBlock(std::move(list));
            continue;
        }

        if (!paragraph.empty())
            paragraph += ' ';
        paragraph += line;
        ++i;
    }
    flushParagraph();
    return builder.finish();
}

} // namespace kreuzberg::processing
