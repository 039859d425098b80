#include <kreuzberg/config/embedding_presets.h>
#include <kreuzberg/config/validation.h>
#include <kreuzberg/processing/text_chunker.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace kreuzberg::processing {

namespace {

std::vector<std::size_t> codePointStarts(std::string_view text) {
    std::vector<std::size_t> starts;
    starts.reserve(text.size() + 1);
    for (std::size_t i = 0; i < text.size(); ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80)
            starts.push_back(i);
    }
    starts.push_back(text.size());
    return starts;
}

bool isSpaceByte(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::size_t charIndexForByte(const std::vector<std::size_t>& starts, std::size_t byte) {
    auto it = std::lower_bound(starts.begin(), starts.end(), byte);
    return static_cast<std::size_t>(std::distance(starts.begin(), it));
}

std::optional<std::size_t> pageForByte(const std::vector<extraction::PageBoundary>& pages,
                                       std::size_t byte) {
    for (const auto& page : pages) {
        if (byte >= page.byte_start && byte < page.byte_end)
            return page.page_number;
    }
    if (!pages.empty() && byte >= pages.back().byte_end)
        return pages.back().page_number;
    return std::nullopt;
}

} // namespace

TextChunker::TextChunker(const TextChunkerConfig& config) : config_(config) {}

std::size_t TextChunker::estimateTokenCount(std::string_view text) {
    // Simple estimation: average 4 characters per token
    return std::max(std::size_t(1), text.size() / 4);
}

const std::vector<TextChunker::Separator>& TextChunker::separators() const {
    static const std::vector<Separator> text = {
        {"\n\n", 2}, {"\n", 1}, {". ", 2}, {"! ", 2}, {"? ", 2}, {"; ", 2}, {", ", 2}, {" ", 1}};
    static const std::vector<Separator> markdown = {
        {"\n# ", 1}, {"\n## ", 1}, {"\n### ", 1}, {"\n```", 1}, {"\n\n", 2}, {"\n", 1},
        {". ", 2},   {"! ", 2},    {"? ", 2},     {", ", 2},    {" ", 1}};
    return config_.type == ChunkerType::Markdown ? markdown : text;
}

std::size_t TextChunker::findBreak(std::string_view content,
                                   const std::vector<std::size_t>& charStarts,
                                   std::size_t startChar, std::size_t limitChar) const {
    const std::size_t startByte = charStarts[startChar];
    const std::size_t limitByte = charStarts[limitChar];
    const std::size_t minByte = charStarts[startChar + (limitChar - startChar) / 2];
    std::string_view window = content.substr(startByte, limitByte - startByte);

    const auto& seps = separators();
    for (std::size_t i = 0; i < seps.size(); ++i) {
        const auto& sep = seps[i];
        // The word separator is the last resort and may leave a short chunk
        const bool lastResort = i + 1 == seps.size();
        auto found = window.rfind(sep.text);
        while (found != std::string_view::npos) {
            std::size_t cut = startByte + found + sep.keep;
            if (cut > startByte && cut <= limitByte && (lastResort || cut >= minByte))
                return charIndexForByte(charStarts, cut);
            if (found == 0 || (!lastResort && startByte + found < minByte))
                break;
            found = window.rfind(sep.text, found - 1);
        }
    }

    // No whitespace at all: hard cut on a code point boundary
    return limitChar;
}

Result<std::vector<extraction::Chunk>>
TextChunker::chunkText(std::string_view content,
                       const std::vector<extraction::PageBoundary>* pages) const {
    if (auto r = config::validateChunkingParams(static_cast<std::int64_t>(config_.max_chars),
                                                static_cast<std::int64_t>(config_.max_overlap));
        !r)
        return r.error();

    std::vector<extraction::Chunk> chunks;
    if (content.empty())
        return chunks;

    const auto charStarts = codePointStarts(content);
    const std::size_t totalChars = charStarts.size() - 1;

    std::size_t start = 0;
    while (start < totalChars) {
        std::size_t limit = std::min(start + config_.max_chars, totalChars);
        std::size_t end = limit < totalChars ? findBreak(content, charStarts, start, limit) : limit;

        // Trim surrounding whitespace while keeping offsets exact
        std::size_t chunkStart = start;
        std::size_t chunkEnd = end;
        while (chunkStart < chunkEnd && isSpaceByte(content[charStarts[chunkStart]]))
            ++chunkStart;
        while (chunkEnd > chunkStart && isSpaceByte(content[charStarts[chunkEnd - 1]]))
            --chunkEnd;

        if (chunkEnd > chunkStart) {
            extraction::Chunk chunk;
            const std::size_t byteStart = charStarts[chunkStart];
            const std::size_t byteEnd = charStarts[chunkEnd];
            chunk.content = std::string(content.substr(byteStart, byteEnd - byteStart));
            chunk.metadata.byte_start = byteStart;
            chunk.metadata.byte_end = byteEnd;
            chunk.metadata.char_start = chunkStart;
            chunk.metadata.char_end = chunkEnd;
            chunk.metadata.token_count = estimateTokenCount(chunk.content);
            if (pages && !pages->empty()) {
                chunk.metadata.first_page = pageForByte(*pages, byteStart);
                chunk.metadata.last_page = pageForByte(*pages, byteEnd - 1);
            }
            chunks.push_back(std::move(chunk));
        }

        if (end >= totalChars)
            break;

        std::size_t next = end > config_.max_overlap ? end - config_.max_overlap : 0;
        if (config_.max_overlap > 0) {
            // Start the overlap on a word boundary
            while (next < end && next > start && !isSpaceByte(content[charStarts[next - 1]]))
                ++next;
        }
        start = next > start ? next : end;
    }

    for (std::size_t i = 0; i < chunks.size(); ++i) {
        chunks[i].metadata.chunk_index = i;
        chunks[i].metadata.total_chunks = chunks.size();
    }
    return chunks;
}

Result<void> chunkResult(extraction::ExtractionResult& result,
                         const config::ChunkingConfig& config) {
    if (config.embedding) {
        return Error{ErrorCode::MissingDependency,
                     "Embedding generation requires an embedding backend, which this build "
                     "does not provide"};
    }

    TextChunkerConfig chunkerConfig;
    chunkerConfig.max_chars = static_cast<std::size_t>(std::max<std::int64_t>(0, config.max_chars));
    chunkerConfig.max_overlap =
        static_cast<std::size_t>(std::max<std::int64_t>(0, config.max_overlap));
    if (config.preset) {
        const auto* preset = config::findEmbeddingPreset(*config.preset);
        if (!preset)
            return Error{ErrorCode::ValidationError,
                         "chunking.preset: unknown embedding preset '" + *config.preset + "'"};
        chunkerConfig.max_chars = static_cast<std::size_t>(preset->chunk_size);
        chunkerConfig.max_overlap = static_cast<std::size_t>(preset->overlap);
    }

    const auto format = result.metadataString("format");
    if (format == "markdown" || format == "djot" ||
        result.metadataString("output_format") == "markdown")
        chunkerConfig.type = ChunkerType::Markdown;

    const std::vector<extraction::PageBoundary>* pages = nullptr;
    if (result.page_structure)
        pages = &result.page_structure->boundaries;

    auto chunks = TextChunker(chunkerConfig).chunkText(result.content, pages);
    if (!chunks)
        return chunks.error();

    spdlog::debug("Chunked {} bytes into {} chunks (max_chars={}, overlap={})",
                  result.content.size(), chunks.value().size(), chunkerConfig.max_chars,
                  chunkerConfig.max_overlap);
    result.chunks = std::move(chunks).value();
    return {};
}

} // namespace kreuzberg::processing
