#include <kreuzberg/extraction/extraction_result.h>

#include <stdexcept>

namespace kreuzberg::extraction {

using nlohmann::json;

namespace {

template <typename T> void readIfPresent(const json& j, const char* key, T& out) {
    if (auto it = j.find(key); it != j.end() && !it->is_null())
        out = it->get<T>();
}

template <typename T> void readOptional(const json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it == j.end())
        return;
    if (it->is_null())
        out.reset();
    else
        out = it->get<T>();
}

template <typename T> void writeOptional(json& j, const char* key, const std::optional<T>& v) {
    if (v)
        j[key] = *v;
}

} // namespace

std::string ExtractionResult::metadataString(const std::string& key) const {
    if (!metadata.is_object())
        return {};
    auto it = metadata.find(key);
    if (it == metadata.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

void to_json(json& j, const Table& t) {
    j = json{{"cells", t.cells}, {"markdown", t.markdown}, {"page_number", t.page_number}};
}

void from_json(const json& j, Table& t) {
    readIfPresent(j, "cells", t.cells);
    readIfPresent(j, "markdown", t.markdown);
    readIfPresent(j, "page_number", t.page_number);
}

void to_json(json& j, const ChunkMetadata& m) {
    j = json{{"byte_start", m.byte_start},   {"byte_end", m.byte_end},
             {"char_start", m.char_start},   {"char_end", m.char_end},
             {"chunk_index", m.chunk_index}, {"total_chunks", m.total_chunks}};
    writeOptional(j, "token_count", m.token_count);
    writeOptional(j, "first_page", m.first_page);
    writeOptional(j, "last_page", m.last_page);
}

void from_json(const json& j, ChunkMetadata& m) {
    readIfPresent(j, "byte_start", m.byte_start);
    readIfPresent(j, "byte_end", m.byte_end);
    readIfPresent(j, "char_start", m.char_start);
    readIfPresent(j, "char_end", m.char_end);
    readOptional(j, "token_count", m.token_count);
    readIfPresent(j, "chunk_index", m.chunk_index);
    readIfPresent(j, "total_chunks", m.total_chunks);
    readOptional(j, "first_page", m.first_page);
    readOptional(j, "last_page", m.last_page);
}

void to_json(json& j, const Chunk& c) {
    j = json{{"content", c.content}, {"metadata", c.metadata}};
    writeOptional(j, "embedding", c.embedding);
}

void from_json(const json& j, Chunk& c) {
    readIfPresent(j, "content", c.content);
    readOptional(j, "embedding", c.embedding);
    readIfPresent(j, "metadata", c.metadata);
}

void to_json(json& j, const ExtractedImage& i) {
    j = json{{"data", i.data},
             {"format", i.format},
             {"image_index", i.image_index},
             {"is_mask", i.is_mask}};
    writeOptional(j, "page_number", i.page_number);
    writeOptional(j, "width", i.width);
    writeOptional(j, "height", i.height);
    writeOptional(j, "colorspace", i.colorspace);
    writeOptional(j, "bits_per_component", i.bits_per_component);
    writeOptional(j, "description", i.description);
    if (i.ocr_result)
        j["ocr_result"] = *i.ocr_result;
}

void from_json(const json& j, ExtractedImage& i) {
    readIfPresent(j, "data", i.data);
    readIfPresent(j, "format", i.format);
    readIfPresent(j, "image_index", i.image_index);
    readOptional(j, "page_number", i.page_number);
    readOptional(j, "width", i.width);
    readOptional(j, "height", i.height);
    readOptional(j, "colorspace", i.colorspace);
    readOptional(j, "bits_per_component", i.bits_per_component);
    readIfPresent(j, "is_mask", i.is_mask);
    readOptional(j, "description", i.description);
    if (auto it = j.find("ocr_result"); it != j.end()) {
        if (it->is_null()) {
            i.ocr_result.reset();
        } else {
            auto nested = resultFromJson(*it);
            if (!nested)
                throw std::invalid_argument("ocr_result: " + nested.error().message);
            i.ocr_result = std::make_shared<ExtractionResult>(std::move(nested).value());
        }
    }
}

void to_json(json& j, const PageContent& p) {
    j = json{{"page_number", p.page_number}, {"content", p.content}, {"tables", p.tables}};
}

void from_json(const json& j, PageContent& p) {
    readIfPresent(j, "page_number", p.page_number);
    readIfPresent(j, "content", p.content);
    readIfPresent(j, "tables", p.tables);
}

void to_json(json& j, const PageBoundary& b) {
    j = json{{"byte_start", b.byte_start}, {"byte_end", b.byte_end}, {"page_number", b.page_number}};
}

void from_json(const json& j, PageBoundary& b) {
    readIfPresent(j, "byte_start", b.byte_start);
    readIfPresent(j, "byte_end", b.byte_end);
    readIfPresent(j, "page_number", b.page_number);
}

void to_json(json& j, const PageStructure& s) {
    j = json{{"total_count", s.total_count}, {"unit_type", s.unit_type}, {"boundaries", s.boundaries}};
}

void from_json(const json& j, PageStructure& s) {
    readIfPresent(j, "total_count", s.total_count);
    readIfPresent(j, "unit_type", s.unit_type);
    readIfPresent(j, "boundaries", s.boundaries);
}

void to_json(json& j, const Keyword& k) {
    j = json{{"text", k.text}, {"score", k.score}, {"algorithm", k.algorithm}};
}

void from_json(const json& j, Keyword& k) {
    readIfPresent(j, "text", k.text);
    readIfPresent(j, "score", k.score);
    readIfPresent(j, "algorithm", k.algorithm);
}

void to_json(json& j, const ProcessingWarning& w) {
    j = json{{"source", w.source}, {"message", w.message}};
}

void from_json(const json& j, ProcessingWarning& w) {
    readIfPresent(j, "source", w.source);
    readIfPresent(j, "message", w.message);
}

void to_json(json& j, const DocumentNode& n) {
    j = json{{"node_type", n.node_type}, {"content", n.content}};
    writeOptional(j, "level", n.level);
    if (!n.children.empty())
        j["children"] = n.children;
}

void from_json(const json& j, DocumentNode& n) {
    readIfPresent(j, "node_type", n.node_type);
    readIfPresent(j, "content", n.content);
    readOptional(j, "level", n.level);
    readIfPresent(j, "children", n.children);
}

void to_json(json& j, const DocumentStructure& d) {
    j = json{{"nodes", d.nodes}};
}

void from_json(const json& j, DocumentStructure& d) {
    readIfPresent(j, "nodes", d.nodes);
}

void to_json(json& j, const ExtractionResult& r) {
    j = json::object();
    j["content"] = r.content;
    j["mime_type"] = r.mime_type;
    j["metadata"] = r.metadata.is_object() ? r.metadata : json::object();
    j["tables"] = r.tables;
    writeOptional(j, "detected_languages", r.detected_languages);
    writeOptional(j, "chunks", r.chunks);
    writeOptional(j, "images", r.images);
    writeOptional(j, "pages", r.pages);
    writeOptional(j, "keywords", r.keywords);
    writeOptional(j, "quality_score", r.quality_score);
    j["processing_warnings"] = r.processing_warnings;
    writeOptional(j, "document", r.document);
    writeOptional(j, "page_structure", r.page_structure);
}

Result<void> applyResultPatch(ExtractionResult& result, const json& patch) {
    if (!patch.is_object())
        return Error{ErrorCode::ParsingError, "result patch must be a JSON object"};

    // Work on a copy so a half-applied patch never leaks out
    ExtractionResult updated = result;
    const char* key = "";
    try {
        key = "content";
        readIfPresent(patch, key, updated.content);
        key = "mime_type";
        readIfPresent(patch, key, updated.mime_type);
        key = "metadata";
        if (auto it = patch.find(key); it != patch.end() && !it->is_null()) {
            if (!it->is_object())
                return Error{ErrorCode::ParsingError, "metadata: expected an object"};
            updated.metadata = *it;
        }
        key = "tables";
        readIfPresent(patch, key, updated.tables);
        key = "detected_languages";
        readOptional(patch, key, updated.detected_languages);
        key = "chunks";
        readOptional(patch, key, updated.chunks);
        key = "images";
        readOptional(patch, key, updated.images);
        key = "pages";
        readOptional(patch, key, updated.pages);
        key = "keywords";
        readOptional(patch, key, updated.keywords);
        key = "quality_score";
        readOptional(patch, key, updated.quality_score);
        key = "processing_warnings";
        readIfPresent(patch, key, updated.processing_warnings);
        key = "document";
        readOptional(patch, key, updated.document);
        key = "page_structure";
        readOptional(patch, key, updated.page_structure);
    } catch (const json::exception& e) {
        return Error{ErrorCode::ParsingError, std::string(key) + ": " + e.what()};
    } catch (const std::invalid_argument& e) {
        return Error{ErrorCode::ParsingError, std::string(key) + ": " + e.what()};
    }

    result = std::move(updated);
    return {};
}

Result<ExtractionResult> resultFromJson(const json& j) {
    if (!j.is_object())
        return Error{ErrorCode::ParsingError, "extraction result must be a JSON object"};
    auto content = j.find("content");
    if (content == j.end() || !content->is_string())
        return Error{ErrorCode::ParsingError, "extraction result needs a string \"content\""};

    ExtractionResult result;
    if (auto r = applyResultPatch(result, j); !r)
        return r.error();
    return result;
}

} // namespace kreuzberg::extraction
