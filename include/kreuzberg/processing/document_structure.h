#pragma once

#include <kreuzberg/extraction/extraction_result.h>

#include <string_view>

namespace kreuzberg::processing {

/**
 * @brief Block tree of Markdown-like text
 *
 * Recognises ATX and underlined headings, fenced code, block quotes, bullet
 * and ordered lists, pipe tables and paragraphs. Blocks following a heading
 * become its children until a heading of the same or a higher level.
 * Page markers are skipped.
 */
extraction::DocumentStructure buildDocumentStructure(std::string_view content);

} // namespace kreuzberg::processing
