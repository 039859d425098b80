#pragma once

#include <kreuzberg/config/extraction_config.h>
#include <kreuzberg/extraction/extraction_result.h>

#include <string>
#include <string_view>
#include <vector>

namespace kreuzberg::processing {

/**
 * @brief Marker text for @p pageNumber, "{page_num}" substituted
 */
std::string formatPageMarker(std::string_view markerFormat, std::size_t pageNumber);

/**
 * @brief Pages of @p content, split on form feeds
 *
 * Content without a form feed is a single page.
 */
std::vector<extraction::PageContent> splitPages(std::string_view content);

/**
 * @brief Derive pages, page boundaries and optional markers for a result
 *
 * Pages returned by a document extractor plugin are used as they are;
 * otherwise the content is split on form feeds. The content is rebuilt from
 * the pages (with markers when requested) so that page_structure byte ranges
 * index the final content. Tables are assigned to pages by page_number.
 * result.pages is kept only when extract_pages is set.
 */
void applyPageConfig(extraction::ExtractionResult& result, const config::PageConfig& config);

} // namespace kreuzberg::processing
